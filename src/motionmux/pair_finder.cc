#include "motionmux/pair_finder.h"

#include "motionmux/media_kind.h"

#include <system_error>

namespace motionmux {
namespace {

    static constexpr const char* kVideoExtensions[] = {
        ".mov",
        ".mp4",
        ".MOV",
        ".MP4",
    };

    static void visit_file(const std::filesystem::path& file,
                           PairScanResult* out)
    {
        out->files.push_back(file);
        if (!is_photo_kind(media_kind_of(file))) {
            return;
        }
        out->photos_seen += 1;
        std::filesystem::path video = matching_video(file);
        if (!video.empty()) {
            out->pairs.push_back(MediaPair { file, std::move(video) });
        }
    }


    template<typename Iterator>
    static void walk(Iterator it, PairScanResult* out)
    {
        std::error_code ec;
        const Iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            if (it->is_regular_file(ec) && !ec) {
                visit_file(it->path(), out);
            }
            ec.clear();
        }
        if (ec) {
            out->status = PairScanStatus::Unreadable;
        }
    }

}  // namespace

std::filesystem::path
matching_video(const std::filesystem::path& photo) noexcept
{
    std::error_code ec;
    for (const char* ext : kVideoExtensions) {
        std::filesystem::path candidate = photo;
        candidate.replace_extension(ext);
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return {};
}


PairScanResult
find_media_pairs(const std::filesystem::path& root, bool recursive) noexcept
{
    PairScanResult result;
    std::error_code ec;

    const std::filesystem::file_status st = std::filesystem::status(root, ec);
    if (ec || !std::filesystem::exists(st)) {
        result.status     = PairScanStatus::RootNotFound;
        result.error_path = root;
        return result;
    }
    if (!std::filesystem::is_directory(st)) {
        result.status     = PairScanStatus::RootNotDirectory;
        result.error_path = root;
        return result;
    }

    if (recursive) {
        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied,
            ec);
        if (ec) {
            result.status     = PairScanStatus::Unreadable;
            result.error_path = root;
            return result;
        }
        walk(std::move(it), &result);
    } else {
        std::filesystem::directory_iterator it(root, ec);
        if (ec) {
            result.status     = PairScanStatus::Unreadable;
            result.error_path = root;
            return result;
        }
        walk(std::move(it), &result);
    }
    if (result.status == PairScanStatus::Unreadable) {
        result.error_path = root;
    }
    return result;
}


const char*
pair_scan_status_name(PairScanStatus status) noexcept
{
    switch (status) {
    case PairScanStatus::Ok: return "ok";
    case PairScanStatus::RootNotFound: return "root_not_found";
    case PairScanStatus::RootNotDirectory: return "root_not_directory";
    case PairScanStatus::Unreadable: return "unreadable";
    }
    return "unknown";
}

}  // namespace motionmux
