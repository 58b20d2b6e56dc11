#include "motionmux/build_info.h"
#include "motionmux/media_kind.h"
#include "motionmux/pipeline.h"
#include "motionmux/transcode.h"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace motionmux {
namespace {

    enum class Verbosity : uint8_t {
        Quiet,
        Normal,
        Verbose,
    };

    // Read from the SIGINT handler.
    static std::atomic<ConversionPipeline*> g_pipeline { nullptr };


    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <source-dir> <output-dir>\n"
            "\n"
            "Pairs photos (JPEG/HEIC) with the video of the same name\n"
            "(.mov/.mp4) and writes Google Motion Photo files.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print MotionMux build info\n"
            "  -r, --recursive        Scan sub-directories too\n"
            "  --convert-all          Ignore the video size limit\n"
            "  --max-video-bytes N    Skip pairs whose video is larger than N\n"
            "                         bytes (default: 10485760)\n"
            "  --copy-unmatched       Copy files not used by any pair into\n"
            "                         the output directory\n"
            "  --delete-after-mux     Delete the inputs of converted pairs\n"
            "  --heic-command <prog>  HEIC to JPEG converter (default: %s)\n"
            "  --pts-us N             MicroVideoPresentationTimestampUs\n"
            "                         (default: 1500000)\n"
            "  -q, --quiet            Only print errors and the summary\n"
            "  -v, --verbose          Also print pairs, XMP keys and\n"
            "                         cleanup events\n",
            argv0 ? argv0 : "motionmux", kDefaultHeicCommand);
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(build_info(), &line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static void on_interrupt(int /*sig*/)
    {
        ConversionPipeline* pipeline = g_pipeline.load();
        if (pipeline) {
            pipeline->request_cancel();
        }
    }


    class StdioObserver final : public PipelineObserver {
    public:
        explicit StdioObserver(Verbosity verbosity) noexcept
            : verbosity_(verbosity)
        {
        }

        void on_pairs_discovered(const PairScanResult& scan) override
        {
            if (verbosity_ == Verbosity::Quiet) {
                return;
            }
            std::printf("scan status=%s files=%zu photos=%u pairs=%zu\n",
                        pair_scan_status_name(scan.status), scan.files.size(),
                        scan.photos_seen, scan.pairs.size());
            if (verbosity_ != Verbosity::Verbose) {
                return;
            }
            for (const MediaPair& pair : scan.pairs) {
                std::printf("  pair %s kind=%s video=%s\n",
                            pair.photo.string().c_str(),
                            media_kind_name(media_kind_of(pair.photo)),
                            pair.video.filename().string().c_str());
            }
        }

        void on_pair_outcome(const PairReport& report) override
        {
            const std::string photo = report.pair.photo.string();
            const std::string path  = report.path.string();
            switch (report.state) {
            case PairState::Done:
                if (verbosity_ == Verbosity::Quiet) {
                    return;
                }
                std::printf("== %s\n", photo.c_str());
                std::printf("  outcome=%s\n", pair_outcome_name(report.outcome));
                std::printf("  output=%s\n", path.c_str());
                std::printf("  micro_video_offset=%llu\n",
                            static_cast<unsigned long long>(
                                report.video_offset));
                return;
            case PairState::Skipped:
                if (verbosity_ == Verbosity::Quiet) {
                    return;
                }
                std::fprintf(stderr, "motionmux: warning: %s\n",
                             format_pair_report(report).c_str());
                return;
            default:
                std::fprintf(stderr, "motionmux: %s\n",
                             format_pair_report(report).c_str());
                return;
            }
        }

        void on_existing_xmp(const std::filesystem::path& file,
                             std::span<const std::string> keys) override
        {
            if (verbosity_ != Verbosity::Verbose) {
                return;
            }
            std::printf("== %s\n  existing_xmp=%zu\n", file.string().c_str(),
                        keys.size());
            for (const std::string& key : keys) {
                std::printf("    %s\n", key.c_str());
            }
        }

        void on_namespace_already_registered(
            const std::filesystem::path& file) override
        {
            if (verbosity_ != Verbosity::Verbose) {
                return;
            }
            std::printf("  namespace=already_registered file=%s\n",
                        file.string().c_str());
        }

        void on_file_copied(const std::filesystem::path& from,
                            const std::filesystem::path& to) override
        {
            if (verbosity_ != Verbosity::Verbose) {
                return;
            }
            std::printf("copied %s -> %s\n", from.string().c_str(),
                        to.string().c_str());
        }

        void on_file_deleted(const std::filesystem::path& file) override
        {
            if (verbosity_ != Verbosity::Verbose) {
                return;
            }
            std::printf("deleted %s\n", file.string().c_str());
        }

        void on_cleanup_error(const std::filesystem::path& file,
                              const char* reason) override
        {
            std::fprintf(stderr, "motionmux: %s: %s\n", file.string().c_str(),
                         reason);
        }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
    };

}  // namespace
}  // namespace motionmux


int
main(int argc, char** argv)
{
    using namespace motionmux;

    PipelineOptions options;
    Verbosity verbosity = Verbosity::Normal;
    std::string heic_command(kDefaultHeicCommand);
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "-r") == 0
            || std::strcmp(arg, "--recursive") == 0) {
            options.recursive = true;
            continue;
        }
        if (std::strcmp(arg, "--convert-all") == 0) {
            options.convert_all = true;
            continue;
        }
        if (std::strcmp(arg, "--copy-unmatched") == 0) {
            options.copy_unmatched = true;
            continue;
        }
        if (std::strcmp(arg, "--delete-after-mux") == 0) {
            options.delete_after_mux = true;
            continue;
        }
        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            verbosity = Verbosity::Quiet;
            continue;
        }
        if (std::strcmp(arg, "-v") == 0
            || std::strcmp(arg, "--verbose") == 0) {
            verbosity = Verbosity::Verbose;
            continue;
        }
        if (std::strcmp(arg, "--max-video-bytes") == 0) {
            if (i + 1 >= argc
                || !parse_u64_arg(argv[i + 1], &options.max_video_bytes)) {
                std::fprintf(stderr, "invalid --max-video-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--pts-us") == 0) {
            if (i + 1 >= argc
                || !parse_u64_arg(argv[i + 1],
                                  &options.presentation_timestamp_us)) {
                std::fprintf(stderr, "invalid --pts-us value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--heic-command") == 0) {
            if (i + 1 >= argc || !argv[i + 1][0]) {
                std::fprintf(stderr, "invalid --heic-command value\n");
                return 2;
            }
            heic_command = argv[i + 1];
            i += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "motionmux: unknown option %s\n", arg);
            return 2;
        }
        positional.emplace_back(arg);
    }

    if (positional.size() != 2U) {
        usage(argv[0]);
        return 2;
    }

    if (verbosity == Verbosity::Verbose) {
        print_build_info_header();
    }

    CommandTranscoder transcoder(heic_command);
    StdioObserver observer(verbosity);
    ConversionPipeline pipeline(options, &transcoder, &observer);
    g_pipeline.store(&pipeline);
    std::signal(SIGINT, on_interrupt);

    const RunSummary summary = pipeline.run(positional[0], positional[1]);

    std::signal(SIGINT, SIG_DFL);
    g_pipeline.store(nullptr);

    if (summary.status != RunStatus::Ok
        && summary.status != RunStatus::Cancelled) {
        std::fprintf(stderr, "motionmux: %s: %s\n", positional[0].c_str(),
                     run_status_name(summary.status));
        return 2;
    }

    std::printf("summary status=%s discovered=%u converted=%u rejected=%u "
                "skipped=%u failed=%u copied=%u deleted=%u "
                "cleanup_errors=%u\n",
                run_status_name(summary.status), summary.discovered,
                summary.processed, summary.rejected, summary.skipped,
                summary.failed, summary.copied, summary.deleted,
                summary.cleanup_errors);

    if (summary.status == RunStatus::Cancelled) {
        return 2;
    }
    return (summary.failed != 0U || summary.rejected != 0U) ? 1 : 0;
}
