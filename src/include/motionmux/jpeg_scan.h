#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file jpeg_scan.h
 * \brief Shallow JPEG header scanner that locates marker segments.
 */

namespace motionmux {

/// Scanner result status.
enum class ScanStatus : uint8_t {
    Ok,
    /// Output buffer was too small; \ref JpegScanResult::needed reports required size.
    OutputTruncated,
    /// The bytes do not start with a JPEG SOI marker.
    Unsupported,
    /// The marker structure is malformed or inconsistent.
    Malformed,
};

/// Logical kind of a header segment.
enum class JpegSegmentKind : uint8_t {
    /// Any segment without metadata meaning here (DQT, DHT, SOFn, APPn, ...).
    Other,
    /// APP0 `JFIF\0`.
    Jfif,
    /// APP1 `Exif\0\0`.
    Exif,
    /// APP1 standard XMP packet (`http://ns.adobe.com/xap/1.0/\0`).
    Xmp,
    /// APP1 Extended XMP chunk (`http://ns.adobe.com/xmp/extension/\0`).
    XmpExtended,
    /// APP2 `ICC_PROFILE\0`.
    Icc,
    /// APP2 `MPF\0` (multi-picture format index).
    Mpf,
    /// COM segment.
    Comment,
};

/// APP1 signature that prefixes a standard XMP packet (including the nul).
inline constexpr std::string_view kXmpApp1Signature {
    "http://ns.adobe.com/xap/1.0/\0", 29
};

/// Largest payload a single marker segment can carry (length field is u16).
inline constexpr uint32_t kJpegMaxSegmentPayload = 65533U;

/**
 * \brief Reference to a marker segment within JPEG bytes.
 *
 * All offsets are relative to the start of the byte buffer passed to
 * \ref scan_jpeg. `outer_*` covers the marker and length field; `data_*`
 * covers the payload after any recognized signature.
 */
struct JpegSegmentRef final {
    JpegSegmentKind kind = JpegSegmentKind::Other;
    uint16_t marker      = 0;

    uint64_t outer_offset = 0;
    uint64_t outer_size   = 0;

    uint64_t data_offset = 0;
    uint64_t data_size   = 0;
};

struct JpegScanResult final {
    ScanStatus status = ScanStatus::Ok;
    uint32_t written  = 0;
    uint32_t needed   = 0;
    /// Offset of the first SOS marker (start of entropy-coded data), or 0.
    uint64_t scan_offset = 0;
};

/**
 * \brief Scans the JPEG header and emits every marker segment up to SOS/EOI.
 *
 * \note The scan never reads past the first SOS marker, so trailing data
 * (such as an appended video) is never touched.
 */
JpegScanResult
scan_jpeg(std::span<const std::byte> bytes,
          std::span<JpegSegmentRef> out) noexcept;

/// Like \ref scan_jpeg, growing \p out until every segment fits.
JpegScanResult
scan_jpeg_all(std::span<const std::byte> bytes,
              std::vector<JpegSegmentRef>* out);

/// Returns the first standard XMP segment in \p segments, or nullptr.
const JpegSegmentRef*
find_xmp_segment(std::span<const JpegSegmentRef> segments) noexcept;

/**
 * \brief Offset where a new XMP APP1 segment should be inserted.
 *
 * The segment goes after the contiguous run of leading APP0 (JFIF) and
 * APP1 Exif segments that directly follow SOI, so both keep their
 * required position at the start of the file.
 */
uint64_t
xmp_insert_offset(std::span<const JpegSegmentRef> segments) noexcept;

const char*
scan_status_name(ScanStatus status) noexcept;
const char*
segment_kind_name(JpegSegmentKind kind) noexcept;

}  // namespace motionmux
