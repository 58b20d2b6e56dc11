#include "motionmux/media_kind.h"

#include <string_view>

namespace motionmux {
namespace {

    // Compares a native path string against a lowercase ASCII literal.
    static bool iequals(const std::filesystem::path::string_type& a,
                        std::string_view b) noexcept
    {
        using Char = std::filesystem::path::value_type;
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            Char c = a[i];
            if (c >= Char('A') && c <= Char('Z')) {
                c = static_cast<Char>(c - Char('A') + Char('a'));
            }
            if (c != static_cast<Char>(b[i])) {
                return false;
            }
        }
        return true;
    }

}  // namespace

MediaKind
media_kind_of(const std::filesystem::path& path) noexcept
{
    const std::filesystem::path::string_type ext = path.extension().native();
    if (iequals(ext, ".jpg") || iequals(ext, ".jpeg")) {
        return MediaKind::Jpeg;
    }
    if (iequals(ext, ".heic")) {
        return MediaKind::Heic;
    }
    if (iequals(ext, ".mov")) {
        return MediaKind::Mov;
    }
    if (iequals(ext, ".mp4")) {
        return MediaKind::Mp4;
    }
    return MediaKind::Other;
}


const char*
media_kind_name(MediaKind kind) noexcept
{
    switch (kind) {
    case MediaKind::Other: return "other";
    case MediaKind::Jpeg: return "jpeg";
    case MediaKind::Heic: return "heic";
    case MediaKind::Mov: return "mov";
    case MediaKind::Mp4: return "mp4";
    }
    return "unknown";
}

}  // namespace motionmux
