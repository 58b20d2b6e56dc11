#pragma once

#include <cstdint>

/**
 * \file meta_flags.h
 * \brief Flags attached to decoded XMP entries.
 */

namespace motionmux {

/// Per-entry flags used for provenance tracking.
enum class EntryFlags : uint8_t {
    None = 0,
    /// Entry came from an `rdf:Description` attribute rather than an element.
    Attribute = 1U << 0U,
};

constexpr EntryFlags
operator|(EntryFlags a, EntryFlags b) noexcept
{
    return static_cast<EntryFlags>(static_cast<uint8_t>(a)
                                   | static_cast<uint8_t>(b));
}

constexpr EntryFlags
operator&(EntryFlags a, EntryFlags b) noexcept
{
    return static_cast<EntryFlags>(static_cast<uint8_t>(a)
                                   & static_cast<uint8_t>(b));
}

constexpr EntryFlags&
operator|=(EntryFlags& a, EntryFlags b) noexcept
{
    a = a | b;
    return a;
}

/// Returns true if any bits in \p test are present in \p flags.
constexpr bool
any(EntryFlags flags, EntryFlags test) noexcept
{
    return static_cast<uint8_t>(flags & test) != 0;
}

}  // namespace motionmux
