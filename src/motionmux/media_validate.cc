#include "motionmux/media_validate.h"

#include "motionmux/media_kind.h"

#include <system_error>

namespace motionmux {
namespace {

    static bool path_exists(const std::filesystem::path& p) noexcept
    {
        std::error_code ec;
        return std::filesystem::exists(p, ec) && !ec;
    }


    static ValidationResult fail(ValidationStatus status,
                                 const std::filesystem::path& path)
    {
        ValidationResult r;
        r.status = status;
        r.path   = path;
        return r;
    }

}  // namespace

ValidationResult
validate_media(const MediaPair& pair, const ValidateOptions& options) noexcept
{
    if (!path_exists(pair.photo)) {
        return fail(ValidationStatus::PhotoNotFound, pair.photo);
    }
    if (!path_exists(pair.video)) {
        return fail(ValidationStatus::VideoNotFound, pair.video);
    }

    const MediaKind photo = media_kind_of(pair.photo);
    const bool photo_ok   = photo == MediaKind::Jpeg
                          || (options.accept_heic_photo
                              && photo == MediaKind::Heic);
    if (!photo_ok) {
        return fail(ValidationStatus::PhotoNotJpeg, pair.photo);
    }
    if (!is_video_kind(media_kind_of(pair.video))) {
        return fail(ValidationStatus::VideoNotMp4OrMov, pair.video);
    }
    return ValidationResult {};
}


const char*
validation_status_name(ValidationStatus status) noexcept
{
    switch (status) {
    case ValidationStatus::Ok: return "ok";
    case ValidationStatus::PhotoNotFound: return "photo_not_found";
    case ValidationStatus::VideoNotFound: return "video_not_found";
    case ValidationStatus::PhotoNotJpeg: return "photo_not_jpeg";
    case ValidationStatus::VideoNotMp4OrMov: return "video_not_mp4_or_mov";
    }
    return "unknown";
}

}  // namespace motionmux
