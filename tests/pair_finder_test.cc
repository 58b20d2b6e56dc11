#include "motionmux/pair_finder.h"

#include "motionmux/media_kind.h"
#include "test_media.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace motionmux {

using test::ScratchDir;

static void
touch(const std::filesystem::path& path)
{
    std::filesystem::create_directories(path.parent_path());
    const std::byte b[1] = { std::byte { 0x00 } };
    ASSERT_TRUE(test::write_file(path, b));
}


static std::vector<std::string>
photo_names(const PairScanResult& r)
{
    std::vector<std::string> names;
    for (const MediaPair& p : r.pairs) {
        names.push_back(p.photo.filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}


TEST(PairFinder, PairsPhotosWithSameNamedVideos)
{
    ScratchDir dir;
    touch(dir / "img1.jpg");
    touch(dir / "img1.mov");
    touch(dir / "img2.JPG");
    touch(dir / "img2.mp4");
    touch(dir / "img3.jpg");
    touch(dir / "notes.txt");

    const PairScanResult r = find_media_pairs(dir.path(), false);
    ASSERT_EQ(r.status, PairScanStatus::Ok);
    EXPECT_EQ(photo_names(r),
              (std::vector<std::string> { "img1.jpg", "img2.JPG" }));
    EXPECT_EQ(r.photos_seen, 3U);
    EXPECT_EQ(r.files.size(), 6U);

    for (const MediaPair& p : r.pairs) {
        EXPECT_EQ(p.video.parent_path().string(),
                  p.photo.parent_path().string());
        EXPECT_EQ(p.video.stem().string(), p.photo.stem().string());
    }
}


TEST(PairFinder, PrefersMovOverMp4)
{
    ScratchDir dir;
    touch(dir / "a.jpg");
    touch(dir / "a.mp4");
    touch(dir / "a.mov");

    EXPECT_EQ(matching_video(dir / "a.jpg").filename().string(), "a.mov");

    const PairScanResult r = find_media_pairs(dir.path(), false);
    ASSERT_EQ(r.pairs.size(), 1U);
    EXPECT_EQ(r.pairs[0].video.filename().string(), "a.mov");
}


TEST(PairFinder, FindsUppercaseVideoExtension)
{
    ScratchDir dir;
    touch(dir / "b.jpeg");
    touch(dir / "b.MP4");

    EXPECT_EQ(matching_video(dir / "b.jpeg").filename().string(), "b.MP4");
    EXPECT_TRUE(matching_video(dir / "none.jpg").empty());
}


TEST(PairFinder, PairsHeicPhotos)
{
    ScratchDir dir;
    touch(dir / "c.heic");
    touch(dir / "c.mov");

    const PairScanResult r = find_media_pairs(dir.path(), false);
    ASSERT_EQ(r.pairs.size(), 1U);
    EXPECT_EQ(media_kind_of(r.pairs[0].photo), MediaKind::Heic);
}


TEST(PairFinder, RecursionIsOptIn)
{
    ScratchDir dir;
    touch(dir / "top.jpg");
    touch(dir / "top.mov");
    touch(dir / "sub" / "deep.jpg");
    touch(dir / "sub" / "deep.mov");

    const PairScanResult flat = find_media_pairs(dir.path(), false);
    ASSERT_EQ(flat.status, PairScanStatus::Ok);
    EXPECT_EQ(photo_names(flat), (std::vector<std::string> { "top.jpg" }));

    const PairScanResult deep = find_media_pairs(dir.path(), true);
    ASSERT_EQ(deep.status, PairScanStatus::Ok);
    EXPECT_EQ(photo_names(deep),
              (std::vector<std::string> { "deep.jpg", "top.jpg" }));
    EXPECT_EQ(deep.files.size(), 4U);
}


TEST(PairFinder, ReportsInvalidRoot)
{
    ScratchDir dir;
    const PairScanResult missing = find_media_pairs(dir / "nope", true);
    EXPECT_EQ(missing.status, PairScanStatus::RootNotFound);
    EXPECT_EQ(missing.error_path.string(), (dir / "nope").string());
    EXPECT_TRUE(missing.pairs.empty());

    touch(dir / "file.jpg");
    EXPECT_EQ(find_media_pairs(dir / "file.jpg", false).status,
              PairScanStatus::RootNotDirectory);
}

}  // namespace motionmux
