#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

/**
 * \file pair_finder.h
 * \brief Discovers still image / video pairs that share a base file name.
 */

namespace motionmux {

/// A still image and the video recorded with it.
struct MediaPair final {
    std::filesystem::path photo;
    std::filesystem::path video;
};

enum class PairScanStatus : uint8_t {
    Ok,
    RootNotFound,
    RootNotDirectory,
    /// A directory below the root could not be listed.
    Unreadable,
};

struct PairScanResult final {
    PairScanStatus status = PairScanStatus::Ok;
    /// Matched pairs in directory traversal order.
    std::vector<MediaPair> pairs;
    /// Every regular file visited (the scanned scope).
    std::vector<std::filesystem::path> files;
    /// Number of JPEG/HEIC files seen, matched or not.
    uint32_t photos_seen = 0;
    /// Path that caused a non-Ok status.
    std::filesystem::path error_path;
};

/**
 * \brief Returns the sibling video for \p photo, or an empty path.
 *
 * Candidates are `<base>.mov`, `<base>.mp4`, `<base>.MOV`, `<base>.MP4`,
 * probed in that order; the first that exists wins.
 */
std::filesystem::path
matching_video(const std::filesystem::path& photo) noexcept;

/**
 * \brief Scans \p root for JPEG/HEIC files that have a matching video.
 *
 * Only the top level is scanned unless \p recursive is set. Photos with no
 * matching video are left out of \ref PairScanResult::pairs.
 */
PairScanResult
find_media_pairs(const std::filesystem::path& root, bool recursive) noexcept;

const char*
pair_scan_status_name(PairScanStatus status) noexcept;

}  // namespace motionmux
