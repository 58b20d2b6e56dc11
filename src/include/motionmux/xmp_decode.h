#pragma once

#include "motionmux/meta_store.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file xmp_decode.h
 * \brief Decoder for XMP packets (RDF/XML) into a \ref MetaStore.
 */

namespace motionmux {

/// XMP decode result status.
enum class XmpDecodeStatus : uint8_t {
    Ok,
    /// A value was longer than \ref XmpDecodeLimits::max_value_bytes and was cut.
    OutputTruncated,
    /// The bytes are not XML at all.
    Unsupported,
    Malformed,
    LimitExceeded,
};

/// Resource limits applied during XMP decode to bound hostile inputs.
struct XmpDecodeLimits final {
    uint32_t max_depth      = 128;
    uint32_t max_properties = 200000;

    /// Caps the input XMP packet size (0 = unlimited).
    uint64_t max_input_bytes = 64ULL * 1024ULL * 1024ULL;

    /// Max bytes per decoded property path string.
    uint32_t max_path_bytes = 1024;

    /// Max text bytes per decoded value (element/attribute).
    uint32_t max_value_bytes = 8U * 1024U * 1024U;

    /// Max total text bytes accumulated across values (0 = unlimited).
    uint64_t max_total_value_bytes = 64ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_xmp_packet.
struct XmpDecodeOptions final {
    /// If true, decodes attributes on `rdf:Description` as XMP properties.
    bool decode_description_attributes = true;
    XmpDecodeLimits limits;
};

struct XmpDecodeResult final {
    XmpDecodeStatus status   = XmpDecodeStatus::Ok;
    uint32_t entries_decoded = 0;
    /// Block the packet was recorded as.
    BlockId block = kInvalidBlockId;
};

/**
 * \brief Decodes an XMP packet and appends its properties into \p store.
 *
 * One \ref Entry is emitted per leaf value, keyed by schema namespace URI and
 * property path. Attribute-form properties carry \ref EntryFlags::Attribute.
 * Duplicate properties are preserved. The packet is recorded as a new block
 * described by \p block.
 */
XmpDecodeResult
decode_xmp_packet(std::span<const std::byte> xmp_bytes, MetaStore& store,
                  const BlockInfo& block = BlockInfo {},
                  EntryFlags flags = EntryFlags::None,
                  const XmpDecodeOptions& options = XmpDecodeOptions {}) noexcept;

const char*
xmp_decode_status_name(XmpDecodeStatus status) noexcept;

}  // namespace motionmux
