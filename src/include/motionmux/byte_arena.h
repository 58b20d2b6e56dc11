#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file byte_arena.h
 * \brief Append-only byte arena backing decoded XMP keys and values.
 */

namespace motionmux {

/// A span (offset,size) into a \ref ByteArena buffer.
struct ByteSpan final {
    uint32_t offset = 0;
    uint32_t size   = 0;
};

/**
 * \brief Append-only storage for bytes and strings.
 *
 * \note \ref ByteSpan values stay valid until \ref clear. Views returned by
 * \ref span and \ref text are invalidated by the next append.
 */
class ByteArena final {
public:
    ByteArena() = default;

    /// Discards all stored bytes.
    void clear() noexcept;
    /// Reserves at least \p size_bytes capacity (may allocate).
    void reserve(size_t size_bytes);

    /// Appends raw bytes and returns a \ref ByteSpan to the stored copy.
    ByteSpan append(std::span<const std::byte> bytes);
    /// Appends the raw bytes of \p text (no terminator) and returns a span.
    ByteSpan append_string(std::string_view text);

    /// Returns a view of the full buffer.
    std::span<const std::byte> bytes() const noexcept;
    /// Returns a view for \p view, or an empty span if out of range.
    std::span<const std::byte> span(ByteSpan view) const noexcept;
    /// Same as \ref span, viewed as characters.
    std::string_view text(ByteSpan view) const noexcept;

private:
    std::vector<std::byte> buffer_;
};

}  // namespace motionmux
