#include "file_io_internal.h"

#include <system_error>
#include <utility>

namespace motionmux::file_io_internal {

FilePtr
open_file(const std::filesystem::path& path, const char* mode) noexcept
{
#if defined(_WIN32)
    wchar_t wmode[8] = {};
    for (size_t i = 0; mode[i] != '\0' && i < 7; ++i) {
        wmode[i] = static_cast<wchar_t>(mode[i]);
    }
    return FilePtr(::_wfopen(path.c_str(), wmode));
#else
    return FilePtr(std::fopen(path.c_str(), mode));
#endif
}


bool
write_all(std::FILE* f, std::span<const std::byte> bytes) noexcept
{
    if (bytes.empty()) {
        return true;
    }
    return std::fwrite(bytes.data(), 1, bytes.size(), f) == bytes.size();
}


bool
copy_stream(std::FILE* in, std::FILE* out, std::span<std::byte> buffer,
            uint64_t* copied) noexcept
{
    uint64_t total = 0;
    for (;;) {
        const size_t n = std::fread(buffer.data(), 1, buffer.size(), in);
        if (n != 0U) {
            if (std::fwrite(buffer.data(), 1, n, out) != n) {
                *copied = total;
                return false;
            }
            total += n;
        }
        if (n < buffer.size()) {
            break;
        }
    }
    *copied = total;
    return std::ferror(in) == 0;
}


bool
close_file(FilePtr* f) noexcept
{
    std::FILE* raw = f->release();
    if (!raw) {
        return false;
    }
    return std::fclose(raw) == 0;
}


std::filesystem::path
staging_path(const std::filesystem::path& target)
{
    std::filesystem::path p = target;
    p.replace_filename("." + target.filename().string() + ".motionmux-tmp");
    return p;
}


PendingFile::PendingFile(std::filesystem::path path) noexcept
    : path_(std::move(path))
{
}


PendingFile::~PendingFile() noexcept
{
    if (armed_) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
}

}  // namespace motionmux::file_io_internal
