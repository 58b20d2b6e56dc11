#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

/**
 * \file muxer.h
 * \brief Concatenates a still image and a video into one motion photo file.
 */

namespace motionmux {

/// Streaming copy buffer size.
inline constexpr size_t kDefaultCopyBufferBytes = 1024U * 1024U;

enum class MuxStatus : uint8_t {
    Ok,
    PhotoOpenFailed,
    VideoOpenFailed,
    OutputDirFailed,
    OutputOpenFailed,
    /// The output path resolves to one of the inputs.
    OutputIsInput,
    ReadFailed,
    WriteFailed,
};

struct MuxOptions final {
    size_t copy_buffer_bytes = kDefaultCopyBufferBytes;
};

struct MuxResult final {
    MuxStatus status = MuxStatus::Ok;
    std::filesystem::path output_path;
    uint64_t photo_bytes = 0;
    uint64_t video_bytes = 0;
    uint64_t total_bytes = 0;

    /// Bytes from the start of the video to EOF (`total_bytes - photo_bytes`).
    uint64_t video_offset() const noexcept { return total_bytes - photo_bytes; }
};

/// `output_dir / photo.filename()`.
std::filesystem::path
mux_output_path(const std::filesystem::path& photo,
                const std::filesystem::path& output_dir);

/**
 * \brief Writes `photo bytes || video bytes` to \ref mux_output_path.
 *
 * \p output_dir is created if needed. An existing output file is replaced.
 * Both inputs are streamed through a buffer of
 * \ref MuxOptions::copy_buffer_bytes, so memory use does not depend on input
 * size. On failure no partial output is left behind.
 */
MuxResult
mux_motion_photo(const std::filesystem::path& photo,
                 const std::filesystem::path& video,
                 const std::filesystem::path& output_dir,
                 const MuxOptions& options = MuxOptions {}) noexcept;

const char*
mux_status_name(MuxStatus status) noexcept;

}  // namespace motionmux
