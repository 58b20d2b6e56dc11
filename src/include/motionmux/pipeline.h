#pragma once

#include "motionmux/motion_photo.h"
#include "motionmux/muxer.h"
#include "motionmux/pair_finder.h"
#include "motionmux/transcode.h"
#include "motionmux/xmp_namespace.h"
#include "motionmux/xmp_packet.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <span>
#include <string>
#include <vector>

/**
 * \file pipeline.h
 * \brief Batch conversion of photo/video pairs into motion photos.
 */

namespace motionmux {

/// Videos larger than this are skipped unless \ref PipelineOptions::convert_all is set.
inline constexpr uint64_t kDefaultVideoSizeLimitBytes = 10ULL * 1024ULL
                                                        * 1024ULL;

struct PipelineOptions final {
    bool recursive = false;
    /// Bypass the video size gate (and the missing-video check it implies).
    bool convert_all = false;
    /// After the run, copy every scanned file that was not consumed into the output directory.
    bool copy_unmatched = false;
    /// After the run, delete every consumed input file.
    bool delete_after_mux = false;

    uint64_t max_video_bytes           = kDefaultVideoSizeLimitBytes;
    size_t copy_buffer_bytes           = kDefaultCopyBufferBytes;
    uint64_t presentation_timestamp_us = kDefaultPresentationTimestampUs;
    uint32_t xmp_padding               = kDefaultXmpPaddingBytes;
};

/// Where a pair ended up.
enum class PairState : uint8_t {
    Discovered,
    Validated,
    CodecConverted,
    Muxed,
    MetadataWritten,
    Done,
    /// Failed validation.
    Rejected,
    /// Left out by the size gate.
    Skipped,
    Failed,
};

enum class PairOutcome : uint8_t {
    Converted,
    InputNotFound,
    InvalidExtension,
    SizeGateSkip,
    CodecConversionFailure,
    OutputCollision,
    MuxFailure,
    MetadataWriteFailure,
};

struct PairReport final {
    MediaPair pair;
    PairState state     = PairState::Discovered;
    PairOutcome outcome = PairOutcome::Converted;
    /// Output file on success, otherwise the offending path.
    std::filesystem::path path;
    /// Lower-level status name for failures (e.g. "write_failed"), or "".
    const char* detail = "";
    /// MicroVideoOffset written on success.
    uint64_t video_offset = 0;
};

/**
 * \brief Receives pipeline events.
 *
 * The library never prints; tools implement this to report progress. All
 * callbacks have empty default implementations.
 */
class PipelineObserver {
public:
    virtual ~PipelineObserver() = default;

    virtual void on_pairs_discovered(const PairScanResult& scan);
    virtual void on_pair_outcome(const PairReport& report);
    virtual void on_existing_xmp(const std::filesystem::path& file,
                                 std::span<const std::string> keys);
    virtual void on_namespace_already_registered(
        const std::filesystem::path& file);
    virtual void on_file_copied(const std::filesystem::path& from,
                                const std::filesystem::path& to);
    virtual void on_file_deleted(const std::filesystem::path& file);
    virtual void on_cleanup_error(const std::filesystem::path& file,
                                  const char* reason);
};

enum class RunStatus : uint8_t {
    Ok,
    /// Source root is missing or not a directory; nothing was scanned.
    SourceNotFound,
    SourceUnreadable,
    OutputDirFailed,
    Cancelled,
};

struct RunSummary final {
    RunStatus status    = RunStatus::Ok;
    uint32_t discovered = 0;
    uint32_t processed  = 0;
    uint32_t rejected   = 0;
    uint32_t skipped    = 0;
    uint32_t failed     = 0;
    uint32_t copied     = 0;
    uint32_t deleted    = 0;
    uint32_t cleanup_errors = 0;
};

/**
 * \brief Runs pair discovery, validation, conversion, muxing and metadata
 * writing over a directory.
 *
 * Pairs are processed one by one in discovery order; a failure only affects
 * its own pair. Input files of successful pairs form the processed set used
 * by the optional copy and delete steps.
 *
 * \note \ref request_cancel may be called from another thread; it takes
 * effect before the next pair.
 */
class ConversionPipeline final {
public:
    ConversionPipeline(const PipelineOptions& options,
                       PhotoTranscoder* transcoder,
                       PipelineObserver* observer) noexcept;

    RunSummary run(const std::filesystem::path& source_dir,
                   const std::filesystem::path& output_dir) noexcept;

    void request_cancel() noexcept;

    /// Inputs consumed by the last \ref run.
    const std::set<std::filesystem::path>& processed() const noexcept;

    const PipelineOptions& options() const noexcept { return options_; }

private:
    PairReport process_pair(const MediaPair& pair,
                            const std::filesystem::path& output_dir);
    void copy_unmatched(const PairScanResult& scan,
                        const std::filesystem::path& output_dir,
                        RunSummary* summary);
    void delete_processed(RunSummary* summary);

    PipelineOptions options_;
    PhotoTranscoder* transcoder_ = nullptr;
    PipelineObserver* observer_  = nullptr;

    std::atomic<bool> cancel_ { false };
    XmpNamespaceRegistry registry_;
    std::set<std::filesystem::path> processed_;
    std::set<std::filesystem::path> outputs_;
};

const char*
pair_state_name(PairState state) noexcept;
const char*
pair_outcome_name(PairOutcome outcome) noexcept;
const char*
run_status_name(RunStatus status) noexcept;

/**
 * \brief Formats a skipped, rejected or failed pair as one line.
 *
 * The line reads `<photo>: <outcome> state=<state> reason=<detail>
 * path=<offending path>`; `reason` and `path` are left out when empty.
 */
std::string
format_pair_report(const PairReport& report);

}  // namespace motionmux
