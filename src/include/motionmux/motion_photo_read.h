#pragma once

#include "motionmux/motion_photo.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

/**
 * \file motion_photo_read.h
 * \brief Reads back the MicroVideo fields of a motion photo and locates its video.
 */

namespace motionmux {

enum class MotionPhotoReadStatus : uint8_t {
    Ok,
    OpenFailed,
    NotJpeg,
    Malformed,
    /// The file has no standard XMP packet.
    NoXmp,
    /// XMP is present but `GCamera:MicroVideo` is missing or not 1.
    NotMotionPhoto,
    /// `GCamera:MicroVideoOffset` is missing, unparsable, or points into the JPEG header.
    BadOffset,
    /// Writing the extracted video failed.
    WriteFailed,
};

struct MotionPhotoInfo final {
    MotionPhotoFields fields;

    uint64_t file_bytes   = 0;
    /// Size of the still image part (everything before the video).
    uint64_t photo_bytes  = 0;
    uint64_t video_offset = 0;
    uint64_t video_bytes  = 0;
    /// File offset of the APP1 segment the offset field was read from.
    uint64_t xmp_segment_offset = 0;

    /// True if the video starts with an ISO-BMFF `ftyp` box.
    bool video_has_ftyp = false;
    /// `ftyp` major brand (e.g. "isom", "qt  "), empty when absent.
    std::string video_brand;
};

struct MotionPhotoReadResult final {
    MotionPhotoReadStatus status = MotionPhotoReadStatus::Ok;
    MotionPhotoInfo info;
};

/// Parses motion photo fields from the bytes of a whole file.
MotionPhotoReadResult
read_motion_photo(std::span<const std::byte> file_bytes) noexcept;

/// Maps \p path and calls \ref read_motion_photo.
MotionPhotoReadResult
read_motion_photo_file(const std::filesystem::path& path) noexcept;

/// Writes the embedded video of motion photo \p path to \p video_out.
MotionPhotoReadResult
extract_motion_photo_video(const std::filesystem::path& path,
                           const std::filesystem::path& video_out) noexcept;

const char*
motion_photo_read_status_name(MotionPhotoReadStatus status) noexcept;

}  // namespace motionmux
