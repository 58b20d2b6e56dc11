#pragma once

#include "motionmux/pair_finder.h"

#include <cstdint>
#include <filesystem>

/**
 * \file media_validate.h
 * \brief Pre-mux checks for a \ref MediaPair.
 */

namespace motionmux {

enum class ValidationStatus : uint8_t {
    Ok,
    PhotoNotFound,
    VideoNotFound,
    PhotoNotJpeg,
    VideoNotMp4OrMov,
};

struct ValidateOptions final {
    /// Also accept a `.heic` photo (it is converted to JPEG before muxing).
    bool accept_heic_photo = false;
};

struct ValidationResult final {
    ValidationStatus status = ValidationStatus::Ok;
    /// The offending file for a non-Ok status.
    std::filesystem::path path;
};

/**
 * \brief Validates \p pair; the first failing check wins.
 *
 * Checks, in order: photo exists, video exists, photo is JPEG, video is
 * MOV/MP4. Only file names are inspected, not file contents.
 */
ValidationResult
validate_media(const MediaPair& pair,
               const ValidateOptions& options = ValidateOptions {}) noexcept;

const char*
validation_status_name(ValidationStatus status) noexcept;

}  // namespace motionmux
