#include "motionmux/muxer.h"

#include "test_media.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

namespace motionmux {

using test::make_jpeg;
using test::make_video;
using test::read_file;
using test::ScratchDir;
using test::write_file;

TEST(Muxer, ConcatenatesPhotoAndVideo)
{
    ScratchDir dir;
    const std::vector<std::byte> photo = make_jpeg(2048);
    const std::vector<std::byte> video = make_video(300000);
    ASSERT_TRUE(write_file(dir / "p.jpg", photo));
    ASSERT_TRUE(write_file(dir / "p.mov", video));

    // A small buffer forces several copy rounds.
    MuxOptions options;
    options.copy_buffer_bytes = 4096;
    const MuxResult r = mux_motion_photo(dir / "p.jpg", dir / "p.mov",
                                         dir / "out" / "nested", options);
    ASSERT_EQ(r.status, MuxStatus::Ok);
    EXPECT_EQ(r.output_path.string(),
              (dir / "out" / "nested" / "p.jpg").string());
    EXPECT_EQ(r.photo_bytes, photo.size());
    EXPECT_EQ(r.video_bytes, video.size());
    EXPECT_EQ(r.total_bytes, photo.size() + video.size());
    EXPECT_EQ(r.video_offset(), video.size());

    std::vector<std::byte> expected(photo);
    expected.insert(expected.end(), video.begin(), video.end());
    EXPECT_EQ(read_file(r.output_path), expected);
}


TEST(Muxer, ReplacesExistingOutput)
{
    ScratchDir dir;
    const std::vector<std::byte> photo = make_jpeg(256);
    const std::vector<std::byte> video = make_video(256);
    ASSERT_TRUE(write_file(dir / "p.jpg", photo));
    ASSERT_TRUE(write_file(dir / "p.mp4", video));
    std::filesystem::create_directories(dir / "out");
    ASSERT_TRUE(write_file(dir / "out" / "p.jpg", make_video(9000)));

    const MuxResult r = mux_motion_photo(dir / "p.jpg", dir / "p.mp4",
                                         dir / "out");
    ASSERT_EQ(r.status, MuxStatus::Ok);
    EXPECT_EQ(std::filesystem::file_size(r.output_path), 512U);
}


TEST(Muxer, RefusesToOverwriteAnInput)
{
    ScratchDir dir;
    const std::vector<std::byte> photo = make_jpeg(256);
    ASSERT_TRUE(write_file(dir / "p.jpg", photo));
    ASSERT_TRUE(write_file(dir / "p.mov", make_video(256)));

    const MuxResult r = mux_motion_photo(dir / "p.jpg", dir / "p.mov",
                                         dir.path());
    EXPECT_EQ(r.status, MuxStatus::OutputIsInput);
    EXPECT_EQ(read_file(dir / "p.jpg"), photo);
}


TEST(Muxer, ReportsMissingInputs)
{
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir / "p.jpg", make_jpeg(256)));

    EXPECT_EQ(mux_motion_photo(dir / "x.jpg", dir / "p.mov", dir / "out")
                  .status,
              MuxStatus::PhotoOpenFailed);
    EXPECT_EQ(mux_motion_photo(dir / "p.jpg", dir / "p.mov", dir / "out")
                  .status,
              MuxStatus::VideoOpenFailed);
    EXPECT_FALSE(std::filesystem::exists(dir / "out" / "p.jpg"));
}


TEST(Muxer, ReportsUnusableOutputDirectory)
{
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir / "p.jpg", make_jpeg(256)));
    ASSERT_TRUE(write_file(dir / "p.mov", make_video(256)));
    ASSERT_TRUE(write_file(dir / "blocker", make_video(16)));

    EXPECT_EQ(mux_motion_photo(dir / "p.jpg", dir / "p.mov", dir / "blocker")
                  .status,
              MuxStatus::OutputDirFailed);
}

}  // namespace motionmux
