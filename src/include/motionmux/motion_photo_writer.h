#pragma once

#include "motionmux/motion_photo.h"
#include "motionmux/xmp_decode.h"
#include "motionmux/xmp_namespace.h"
#include "motionmux/xmp_packet.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * \file motion_photo_writer.h
 * \brief Writes motion photo XMP fields into a muxed JPEG file.
 */

namespace motionmux {

enum class XmpWriteStatus : uint8_t {
    Ok,
    OpenFailed,
    /// The file does not start with a JPEG SOI marker.
    NotJpeg,
    /// JPEG header structure is broken, or the offset points outside the file.
    Malformed,
    /// The existing XMP packet could not be parsed or rewritten.
    XmpDecodeFailed,
    /// The GCamera prefix is bound to another namespace in the registry.
    NamespaceConflict,
    /// The rewritten packet does not fit a single APP1 segment.
    PacketTooLarge,
    /// Writing or committing the new file failed; the original is untouched.
    WriteFailed,
};

struct XmpWriteOptions final {
    /// Padding reserved in the packet; dropped automatically if it would not fit.
    uint32_t padding_bytes = kDefaultXmpPaddingBytes;
    XmpDecodeOptions decode;
};

struct XmpWriteResult final {
    XmpWriteStatus status = XmpWriteStatus::Ok;
    /// Name of the underlying mapping, scan, namespace, decode or packet
    /// status when \ref status is not `Ok`.
    const char* detail = "";

    /// The GCamera namespace was already known to the registry.
    bool namespace_already_registered = false;
    /// An existing standard XMP segment was rewritten (vs. a new one inserted).
    bool replaced_existing_packet = false;
    /// Previous MicroVideo fields dropped from the existing packet.
    uint32_t removed_properties = 0;

    uint64_t packet_bytes = 0;
    uint64_t file_bytes   = 0;

    /// Keys found in the existing packet, as `prefix:path` (or `{uri}path`).
    std::vector<std::string> existing_keys;
};

/**
 * \brief Sets the GCamera MicroVideo fields in the XMP packet of \p path.
 *
 * Existing XMP properties are kept, including other GCamera properties.
 * Earlier MicroVideo fields are replaced, so writing twice leaves exactly
 * one set of fields. If the file has no
 * standard XMP segment, one is inserted after the leading APP0/Exif
 * segments. Bytes outside the XMP segment (scan data, trailing video) are
 * copied unchanged.
 *
 * The new file is written next to \p path and renamed over it only when
 * complete. On any failure the original file is left as it was.
 */
XmpWriteResult
write_motion_photo_xmp(const std::filesystem::path& path,
                       const MotionPhotoFields& fields,
                       XmpNamespaceRegistry& registry,
                       const XmpWriteOptions& options
                       = XmpWriteOptions {}) noexcept;

const char*
xmp_write_status_name(XmpWriteStatus status) noexcept;

}  // namespace motionmux
