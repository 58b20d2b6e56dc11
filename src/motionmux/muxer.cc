#include "motionmux/muxer.h"

#include "file_io_internal.h"

#include <new>
#include <system_error>
#include <vector>

namespace motionmux {
namespace {

    using file_io_internal::FilePtr;

    static bool same_file(const std::filesystem::path& a,
                          const std::filesystem::path& b) noexcept
    {
        std::error_code ec;
        return std::filesystem::equivalent(a, b, ec) && !ec;
    }

}  // namespace

std::filesystem::path
mux_output_path(const std::filesystem::path& photo,
                const std::filesystem::path& output_dir)
{
    return output_dir / photo.filename();
}


MuxResult
mux_motion_photo(const std::filesystem::path& photo,
                 const std::filesystem::path& video,
                 const std::filesystem::path& output_dir,
                 const MuxOptions& options) noexcept
{
    MuxResult r;
    try {
        r.output_path = mux_output_path(photo, output_dir);

        FilePtr in_photo = file_io_internal::open_file(photo, "rb");
        if (!in_photo) {
            r.status = MuxStatus::PhotoOpenFailed;
            return r;
        }
        FilePtr in_video = file_io_internal::open_file(video, "rb");
        if (!in_video) {
            r.status = MuxStatus::VideoOpenFailed;
            return r;
        }

        std::error_code ec;
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            r.status = MuxStatus::OutputDirFailed;
            return r;
        }
        // Opening the output for writing would truncate an input.
        if (same_file(r.output_path, photo) || same_file(r.output_path, video)) {
            r.status = MuxStatus::OutputIsInput;
            return r;
        }

        file_io_internal::PendingFile pending(r.output_path);
        FilePtr out = file_io_internal::open_file(r.output_path, "wb");
        if (!out) {
            r.status = MuxStatus::OutputOpenFailed;
            return r;
        }

        std::vector<std::byte> buffer(options.copy_buffer_bytes != 0U
                                          ? options.copy_buffer_bytes
                                          : kDefaultCopyBufferBytes);
        if (!file_io_internal::copy_stream(in_photo.get(), out.get(), buffer,
                                           &r.photo_bytes)) {
            r.status = std::ferror(in_photo.get()) ? MuxStatus::ReadFailed
                                                   : MuxStatus::WriteFailed;
            return r;
        }
        if (!file_io_internal::copy_stream(in_video.get(), out.get(), buffer,
                                           &r.video_bytes)) {
            r.status = std::ferror(in_video.get()) ? MuxStatus::ReadFailed
                                                   : MuxStatus::WriteFailed;
            return r;
        }
        if (!file_io_internal::close_file(&out)) {
            r.status = MuxStatus::WriteFailed;
            return r;
        }

        r.total_bytes = r.photo_bytes + r.video_bytes;
        pending.keep();
    } catch (const std::bad_alloc&) {
        r.status = MuxStatus::WriteFailed;
    }
    return r;
}


const char*
mux_status_name(MuxStatus status) noexcept
{
    switch (status) {
    case MuxStatus::Ok: return "ok";
    case MuxStatus::PhotoOpenFailed: return "photo_open_failed";
    case MuxStatus::VideoOpenFailed: return "video_open_failed";
    case MuxStatus::OutputDirFailed: return "output_dir_failed";
    case MuxStatus::OutputOpenFailed: return "output_open_failed";
    case MuxStatus::OutputIsInput: return "output_is_input";
    case MuxStatus::ReadFailed: return "read_failed";
    case MuxStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}

}  // namespace motionmux
