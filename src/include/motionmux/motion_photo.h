#pragma once

#include "motionmux/jpeg_scan.h"

#include <cstdint>
#include <string_view>

/**
 * \file motion_photo.h
 * \brief Google Motion Photo (MicroVideo) XMP fields.
 *
 * A motion photo is `[JPEG with XMP APP1][video]`. The XMP packet carries
 * `GCamera:MicroVideoOffset`, the number of bytes between the start of the
 * video and the end of the file. Counting from EOF keeps the value valid when
 * the JPEG header grows or shrinks.
 */

namespace motionmux {

/// Still frame position inside the clip (1.5 s, matching Apple Live Photos).
inline constexpr uint64_t kDefaultPresentationTimestampUs = 1500000U;

/// Largest XMP packet that fits a single APP1 segment after its signature.
inline constexpr uint32_t kMaxXmpPacketBytes
    = kJpegMaxSegmentPayload - static_cast<uint32_t>(kXmpApp1Signature.size());

inline constexpr std::string_view kMicroVideoName = "MicroVideo";
inline constexpr std::string_view kMicroVideoVersionName = "MicroVideoVersion";
inline constexpr std::string_view kMicroVideoOffsetName = "MicroVideoOffset";
inline constexpr std::string_view kMicroVideoTimestampName
    = "MicroVideoPresentationTimestampUs";

/// GCamera MicroVideo field values.
struct MotionPhotoFields final {
    uint32_t micro_video         = 1;
    uint32_t micro_video_version = 1;
    /// Bytes from the start of the video to EOF.
    uint64_t micro_video_offset        = 0;
    uint64_t presentation_timestamp_us = kDefaultPresentationTimestampUs;
};

/// Fields for a muxed file of \p total_bytes whose photo part was \p photo_bytes.
MotionPhotoFields
make_motion_photo_fields(uint64_t total_bytes, uint64_t photo_bytes,
                         uint64_t presentation_timestamp_us
                         = kDefaultPresentationTimestampUs) noexcept;

}  // namespace motionmux
