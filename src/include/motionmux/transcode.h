#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * \file transcode.h
 * \brief HEIC to JPEG conversion collaborator.
 */

namespace motionmux {

enum class TranscodeStatus : uint8_t {
    Ok,
    InputNotFound,
    /// The destination already exists and is never overwritten.
    OutputExists,
    /// The converter could not be started or exited with an error.
    CommandFailed,
    /// The converter reported success but produced no file.
    OutputMissing,
};

/**
 * \brief Converts a still image to a maximum-quality JPEG.
 *
 * Implementations carry the source metadata (Exif) over to the JPEG and must
 * not touch the source file.
 */
class PhotoTranscoder {
public:
    virtual ~PhotoTranscoder() = default;

    virtual TranscodeStatus to_jpeg(const std::filesystem::path& source,
                                    const std::filesystem::path& jpeg) noexcept
        = 0;
};

/// Default external converter and its arguments (`<program> -q 100 in out`).
inline constexpr const char* kDefaultHeicCommand = "heif-convert";

/**
 * \brief \ref PhotoTranscoder backed by an external converter process.
 *
 * Runs `<program> <args...> <source> <jpeg>` without a shell and waits for
 * it. The program is looked up on `PATH`.
 */
class CommandTranscoder final : public PhotoTranscoder {
public:
    explicit CommandTranscoder(std::string program = kDefaultHeicCommand,
                               std::vector<std::string> args = { "-q",
                                                                 "100" });

    TranscodeStatus to_jpeg(const std::filesystem::path& source,
                            const std::filesystem::path& jpeg) noexcept override;

    const std::string& program() const noexcept { return program_; }

private:
    std::string program_;
    std::vector<std::string> args_;
};

/// Sibling `.jpg` path a converted \p heic is written to.
std::filesystem::path
converted_jpeg_path(const std::filesystem::path& heic);

const char*
transcode_status_name(TranscodeStatus status) noexcept;

}  // namespace motionmux
