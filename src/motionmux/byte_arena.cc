#include "motionmux/byte_arena.h"

#include <cstring>

namespace motionmux {

void ByteArena::clear() noexcept
{
  buffer_.clear();
}

void ByteArena::reserve(size_t size_bytes)
{
  buffer_.reserve(size_bytes);
}

ByteSpan ByteArena::append(std::span<const std::byte> bytes)
{
  const uint32_t offset = static_cast<uint32_t>(buffer_.size());
  buffer_.resize(buffer_.size() + bytes.size());
  if (!bytes.empty()) {
    std::memcpy(buffer_.data() + offset, bytes.data(), bytes.size());
  }
  return ByteSpan{offset, static_cast<uint32_t>(bytes.size())};
}

ByteSpan ByteArena::append_string(std::string_view text)
{
  const std::span<const std::byte> bytes(
    reinterpret_cast<const std::byte*>(text.data()),
    text.size());
  return append(bytes);
}

std::span<const std::byte> ByteArena::bytes() const noexcept
{
  return std::span<const std::byte>(buffer_.data(), buffer_.size());
}

std::span<const std::byte> ByteArena::span(ByteSpan view) const noexcept
{
  const std::span<const std::byte> all = bytes();
  if (view.offset > all.size()) {
    return std::span<const std::byte>();
  }
  const size_t end = static_cast<size_t>(view.offset) + view.size;
  if (end > all.size()) {
    return std::span<const std::byte>();
  }
  return all.subspan(view.offset, view.size);
}

std::string_view ByteArena::text(ByteSpan view) const noexcept
{
  const std::span<const std::byte> b = span(view);
  return std::string_view(reinterpret_cast<const char*>(b.data()), b.size());
}

} // namespace motionmux
