#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>

namespace motionmux::file_io_internal {

struct FileCloser final {
    void operator()(std::FILE* f) const noexcept
    {
        if (f) {
            (void)std::fclose(f);
        }
    }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

/// Opens \p path with a C stdio \p mode ("rb", "wb", ...).
FilePtr
open_file(const std::filesystem::path& path, const char* mode) noexcept;

bool
write_all(std::FILE* f, std::span<const std::byte> bytes) noexcept;

/**
 * \brief Copies \p in to \p out until EOF through \p buffer.
 *
 * \p copied receives the number of bytes written, also on failure.
 */
bool
copy_stream(std::FILE* in, std::FILE* out, std::span<std::byte> buffer,
            uint64_t* copied) noexcept;

/// Flushes and closes \p f; returns false if any buffered write failed.
bool
close_file(FilePtr* f) noexcept;

/// Sibling path used to stage a rewrite of \p target in the same directory.
std::filesystem::path
staging_path(const std::filesystem::path& target);

/**
 * \brief Owns a file that is being produced.
 *
 * The file is removed on destruction unless \ref keep was called, so every
 * early return leaves no partial output behind.
 */
class PendingFile final {
public:
    explicit PendingFile(std::filesystem::path path) noexcept;
    ~PendingFile() noexcept;

    PendingFile(const PendingFile&)            = delete;
    PendingFile& operator=(const PendingFile&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    void keep() noexcept { armed_ = false; }

private:
    std::filesystem::path path_;
    bool armed_ = true;
};

}  // namespace motionmux::file_io_internal
