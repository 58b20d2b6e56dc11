#pragma once

#include <cstdint>
#include <filesystem>

/**
 * \file media_kind.h
 * \brief File classification by extension (case-insensitive).
 */

namespace motionmux {

enum class MediaKind : uint8_t {
    Other,
    /// `.jpg` / `.jpeg`
    Jpeg,
    /// `.heic`
    Heic,
    /// `.mov`
    Mov,
    /// `.mp4`
    Mp4,
};

MediaKind
media_kind_of(const std::filesystem::path& path) noexcept;

/// True for still images that can start a pair (JPEG or HEIC).
inline bool
is_photo_kind(MediaKind kind) noexcept
{
    return kind == MediaKind::Jpeg || kind == MediaKind::Heic;
}

inline bool
is_video_kind(MediaKind kind) noexcept
{
    return kind == MediaKind::Mov || kind == MediaKind::Mp4;
}

const char*
media_kind_name(MediaKind kind) noexcept;

}  // namespace motionmux
