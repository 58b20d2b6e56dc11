#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

/**
 * \file mapped_file.h
 * \brief Read-only file mapping helper.
 */

namespace motionmux {

/// Status code for \ref MappedFile operations.
enum class MappedFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    TooLarge,
    MapFailed,
};

/// Access pattern hint passed to the kernel after mapping.
enum class MappedFileAccess : uint8_t {
    Normal,
    /// The caller streams the mapping front to back once (copy/rewrite).
    Sequential,
};

/**
 * \brief Read-only, whole-file memory mapping.
 *
 * Muxed motion photos carry the full video, so they can be multiple GB.
 * Mapping lets the JPEG scanner and the XMP commit step work on a
 * `std::span<const std::byte>` without copying the file into memory.
 */
class MappedFile final {
public:
    MappedFile() noexcept;
    ~MappedFile() noexcept;

    MappedFile(const MappedFile&)            = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Opens and maps \p path (read-only). \p max_file_bytes is a hard cap (0 = unlimited).
    MappedFileStatus open(const std::filesystem::path& path,
                          uint64_t max_file_bytes = 0,
                          MappedFileAccess access
                          = MappedFileAccess::Normal) noexcept;

    /// Unmaps/closes the file (idempotent).
    void close() noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept;
    std::span<const std::byte> bytes() const noexcept;

private:
#if defined(_WIN32)
    void* file_handle_ = nullptr;
    void* map_handle_  = nullptr;
#else
    int fd_ = -1;
#endif
    const std::byte* data_ = nullptr;
    uint64_t size_         = 0;
};

/// Returns a stable lowercase name for \p status (used in CLI/test output).
const char*
mapped_file_status_name(MappedFileStatus status) noexcept;

}  // namespace motionmux
