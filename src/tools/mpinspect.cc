#include "motionmux/build_info.h"
#include "motionmux/jpeg_scan.h"
#include "motionmux/mapped_file.h"
#include "motionmux/motion_photo_read.h"

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace motionmux {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Prints the Motion Photo fields of JPEG files and the split\n"
            "between the still image and the embedded video.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print MotionMux build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --segments             List JPEG header segments\n"
            "  --extract-video <path> Write the embedded video to <path>\n"
            "                         (single input only)\n",
            argv0 ? argv0 : "mpinspect");
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(build_info(), &line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static void print_info(const char* path, const MotionPhotoInfo& info)
    {
        std::printf("== %s\n", path);
        std::printf("  GCamera:MicroVideo=%u\n", info.fields.micro_video);
        std::printf("  GCamera:MicroVideoVersion=%u\n",
                    info.fields.micro_video_version);
        std::printf("  GCamera:MicroVideoOffset=%llu\n",
                    static_cast<unsigned long long>(
                        info.fields.micro_video_offset));
        std::printf("  GCamera:MicroVideoPresentationTimestampUs=%llu\n",
                    static_cast<unsigned long long>(
                        info.fields.presentation_timestamp_us));
        std::printf("  file_bytes=%llu photo_bytes=%llu video_bytes=%llu\n",
                    static_cast<unsigned long long>(info.file_bytes),
                    static_cast<unsigned long long>(info.photo_bytes),
                    static_cast<unsigned long long>(info.video_bytes));
        std::printf("  xmp_segment_offset=%llu\n",
                    static_cast<unsigned long long>(info.xmp_segment_offset));
        if (info.video_has_ftyp) {
            std::printf("  video_brand=%s\n", info.video_brand.c_str());
        } else {
            std::printf("  video_brand=none (no ftyp)\n");
        }
    }


    static bool print_segments(const char* path)
    {
        MappedFile file;
        const MappedFileStatus opened = file.open(path);
        if (opened != MappedFileStatus::Ok) {
            std::fprintf(stderr, "mpinspect: %s: %s\n", path,
                         mapped_file_status_name(opened));
            return false;
        }

        std::vector<JpegSegmentRef> segments;
        const JpegScanResult scan = scan_jpeg_all(file.bytes(), &segments);
        if (scan.status != ScanStatus::Ok) {
            std::fprintf(stderr, "mpinspect: %s: jpeg scan %s\n", path,
                         scan_status_name(scan.status));
            return false;
        }

        std::printf("  segments=%zu scan_offset=%llu\n", segments.size(),
                    static_cast<unsigned long long>(scan.scan_offset));
        for (size_t i = 0; i < segments.size(); ++i) {
            const JpegSegmentRef& seg = segments[i];
            std::printf("    [%zu] marker=0x%04X kind=%s offset=%llu "
                        "size=%llu\n",
                        i, static_cast<unsigned>(seg.marker),
                        segment_kind_name(seg.kind),
                        static_cast<unsigned long long>(seg.outer_offset),
                        static_cast<unsigned long long>(seg.outer_size));
        }
        return true;
    }

}  // namespace
}  // namespace motionmux


int
main(int argc, char** argv)
{
    using namespace motionmux;

    bool show_build_info = true;
    bool show_segments   = false;
    std::string extract_path;
    std::vector<std::string> input_paths;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            continue;
        }
        if (std::strcmp(arg, "--segments") == 0) {
            show_segments = true;
            continue;
        }
        if (std::strcmp(arg, "--extract-video") == 0 && i + 1 < argc) {
            extract_path = argv[i + 1];
            i += 1;
            continue;
        }
        if (arg[0] != '\0') {
            input_paths.emplace_back(arg);
        }
    }

    if (input_paths.empty()) {
        usage(argv[0]);
        return 2;
    }
    if (!extract_path.empty() && input_paths.size() != 1U) {
        std::fprintf(stderr,
                     "mpinspect: --extract-video requires exactly one input "
                     "file\n");
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    bool any_failed = false;
    for (const std::string& input : input_paths) {
        const char* path = input.c_str();
        const MotionPhotoReadResult r = extract_path.empty()
                                            ? read_motion_photo_file(input)
                                            : extract_motion_photo_video(
                                                  input, extract_path);
        if (r.status == MotionPhotoReadStatus::NoXmp
            || r.status == MotionPhotoReadStatus::NotMotionPhoto) {
            std::printf("== %s\n  motion_photo=no (%s)\n", path,
                        motion_photo_read_status_name(r.status));
            if (show_segments && !print_segments(path)) {
                any_failed = true;
            }
            if (!extract_path.empty()) {
                any_failed = true;
            }
            continue;
        }
        if (r.status != MotionPhotoReadStatus::Ok) {
            std::fprintf(stderr, "mpinspect: %s: %s\n", path,
                         motion_photo_read_status_name(r.status));
            any_failed = true;
            continue;
        }
        print_info(path, r.info);
        if (show_segments && !print_segments(path)) {
            any_failed = true;
        }
        if (!extract_path.empty()) {
            std::printf("  extracted=%s\n", extract_path.c_str());
        }
    }

    return any_failed ? 1 : 0;
}
