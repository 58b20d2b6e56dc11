#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file xmp_packet.h
 * \brief XMP packet builder and in-place property rewriter.
 */

namespace motionmux {

/// Trailing whitespace reserved inside a packet for later in-place edits.
inline constexpr uint32_t kDefaultXmpPaddingBytes = 2048U;

/// `id` attribute of the `<?xpacket begin=...?>` processing instruction.
inline constexpr std::string_view kXpacketId = "W5M0MpCehiHzreSzNTczkc9d";

/// One simple property (local name + text value) in the target schema.
struct XmpProperty final {
    std::string_view name;
    std::string_view value;
};

/**
 * \brief Properties written into one schema namespace.
 *
 * The properties are serialized as attributes of a dedicated
 * `rdf:Description` element that declares `xmlns:<prefix>="<ns_uri>"`.
 */
struct XmpPropertySet final {
    std::string_view ns_uri;
    std::string_view prefix;
    std::span<const XmpProperty> properties;
};

enum class XmpPacketStatus : uint8_t {
    Ok,
    /// Output buffer was too small; \ref XmpPacketResult::needed reports required size.
    OutputTruncated,
    /// The existing packet is not well-formed XML or has no `rdf:RDF` element.
    Malformed,
    LimitExceeded,
};

struct XmpPacketOptions final {
    /// Spaces appended before the `<?xpacket end="w"?>` trailer.
    uint32_t padding_bytes = kDefaultXmpPaddingBytes;
    /// Element nesting limit for rewriting existing packets.
    uint32_t max_depth = 128;
    /// Caps the input packet size (0 = unlimited).
    uint64_t max_input_bytes = 16ULL * 1024ULL * 1024ULL;
};

struct XmpPacketResult final {
    XmpPacketStatus status = XmpPacketStatus::Ok;
    uint64_t written       = 0;
    uint64_t needed        = 0;
    /// Elements and attributes matching a property of the set that were dropped.
    uint32_t removed_properties = 0;
};

/// Builds a new standalone XMP packet holding only \p props.
XmpPacketResult
build_xmp_packet(const XmpPropertySet& props, std::span<std::byte> out,
                 const XmpPacketOptions& options) noexcept;

/**
 * \brief Rewrites \p packet so that it holds exactly one copy of \p props.
 *
 * Elements and attributes in `props.ns_uri` whose local name matches one of
 * `props.properties` are dropped from the existing packet, and a fresh
 * `rdf:Description` carrying \p props is appended as the last child of
 * `rdf:RDF`. Other properties of the same schema are kept, together with
 * the namespace declarations they still need. All other content is
 * preserved. Any `xpacket` wrapper is
 * replaced by a new one, so rewriting the output again yields the same
 * result.
 */
XmpPacketResult
rewrite_xmp_packet(std::span<const std::byte> packet,
                   const XmpPropertySet& props, std::span<std::byte> out,
                   const XmpPacketOptions& options) noexcept;

const char*
xmp_packet_status_name(XmpPacketStatus status) noexcept;

}  // namespace motionmux
