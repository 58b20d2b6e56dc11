#pragma once

#include "motionmux/byte_arena.h"

#include <cstdint>
#include <string_view>

/**
 * \file meta_value.h
 * \brief Metadata value representation for decoded XMP properties.
 */

namespace motionmux {

/// Top-level value storage kind.
enum class MetaValueKind : uint8_t {
    Empty,
    /// Text bytes in a \ref ByteArena span with an associated encoding.
    Text,
};

/// Encoding hint for text values.
enum class TextEncoding : uint8_t {
    Unknown,
    Ascii,
    Utf8,
};

/**
 * \brief A metadata value.
 *
 * XMP values are always text; numbers such as `GCamera:MicroVideoOffset` are
 * kept as their decimal lexical form and converted on demand with
 * \ref text_to_u64. Text payload is not nul-terminated.
 */
struct MetaValue final {
    MetaValueKind kind         = MetaValueKind::Empty;
    TextEncoding text_encoding = TextEncoding::Unknown;
    uint32_t count             = 0;
    ByteSpan span;
};

MetaValue
make_text(ByteArena& arena, std::string_view text, TextEncoding encoding);

/// Returns the text of \p value, or an empty view for non-text values.
std::string_view
value_text(const ByteArena& arena, const MetaValue& value) noexcept;

/**
 * \brief Parses an unsigned decimal XMP integer (`xmp:Integer` lexical form).
 *
 * Leading/trailing ASCII whitespace and a single leading `+` are accepted.
 * Returns false on empty input, non-digits, or overflow.
 */
bool
text_to_u64(std::string_view text, uint64_t* out) noexcept;

}  // namespace motionmux
