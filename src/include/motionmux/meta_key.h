#pragma once

#include "motionmux/byte_arena.h"

#include <string_view>

/**
 * \file meta_key.h
 * \brief Normalized XMP property keys (schema namespace URI + property path).
 */

namespace motionmux {

/**
 * \brief An owned XMP property key.
 *
 * Both components live in a \ref ByteArena. `property_path` is the local
 * property name, extended with `/child` and `[n]` segments for nested
 * structures and array items (e.g. `subject[2]`).
 */
struct MetaKey final {
    ByteSpan schema_ns;
    ByteSpan property_path;
};

/// A borrowed key view for lookups without copying strings.
struct MetaKeyView final {
    std::string_view schema_ns;
    std::string_view property_path;
};

MetaKey
make_xmp_property_key(ByteArena& arena, std::string_view schema_ns,
                      std::string_view property_path);

/// Orders keys for deterministic storage/indexing.
int
compare_key(const ByteArena& arena, const MetaKey& a,
            const MetaKey& b) noexcept;
/// Orders a borrowed key against an owned key using the same ordering as \ref compare_key.
int
compare_key_view(const ByteArena& arena, const MetaKeyView& a,
                 const MetaKey& b) noexcept;

}  // namespace motionmux
