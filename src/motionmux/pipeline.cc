#include "motionmux/pipeline.h"

#include "motionmux/media_kind.h"
#include "motionmux/media_validate.h"
#include "motionmux/motion_photo_writer.h"

#include <system_error>
#include <utility>

namespace motionmux {
namespace {

    static PipelineObserver& null_observer() noexcept
    {
        static PipelineObserver observer;
        return observer;
    }


    static PairReport finish(PairReport report, PairState state,
                             PairOutcome outcome, std::filesystem::path path,
                             const char* detail = "")
    {
        report.state   = state;
        report.outcome = outcome;
        report.path    = std::move(path);
        report.detail  = detail;
        return report;
    }


    static PairReport reject(PairReport report, const ValidationResult& v)
    {
        const bool missing = v.status == ValidationStatus::PhotoNotFound
                             || v.status == ValidationStatus::VideoNotFound;
        return finish(std::move(report), PairState::Rejected,
                      missing ? PairOutcome::InputNotFound
                              : PairOutcome::InvalidExtension,
                      v.path, validation_status_name(v.status));
    }

}  // namespace

void
PipelineObserver::on_pairs_discovered(const PairScanResult& /*scan*/)
{
}


void
PipelineObserver::on_pair_outcome(const PairReport& /*report*/)
{
}


void
PipelineObserver::on_existing_xmp(const std::filesystem::path& /*file*/,
                                  std::span<const std::string> /*keys*/)
{
}


void
PipelineObserver::on_namespace_already_registered(
    const std::filesystem::path& /*file*/)
{
}


void
PipelineObserver::on_file_copied(const std::filesystem::path& /*from*/,
                                 const std::filesystem::path& /*to*/)
{
}


void
PipelineObserver::on_file_deleted(const std::filesystem::path& /*file*/)
{
}


void
PipelineObserver::on_cleanup_error(const std::filesystem::path& /*file*/,
                                   const char* /*reason*/)
{
}


ConversionPipeline::ConversionPipeline(const PipelineOptions& options,
                                       PhotoTranscoder* transcoder,
                                       PipelineObserver* observer) noexcept
    : options_(options)
    , transcoder_(transcoder)
    , observer_(observer ? observer : &null_observer())
{
}


void
ConversionPipeline::request_cancel() noexcept
{
    cancel_.store(true, std::memory_order_relaxed);
}


const std::set<std::filesystem::path>&
ConversionPipeline::processed() const noexcept
{
    return processed_;
}


RunSummary
ConversionPipeline::run(const std::filesystem::path& source_dir,
                        const std::filesystem::path& output_dir) noexcept
{
    RunSummary summary;
    processed_.clear();
    outputs_.clear();

    const PairScanResult scan = find_media_pairs(source_dir,
                                                 options_.recursive);
    switch (scan.status) {
    case PairScanStatus::Ok: break;
    case PairScanStatus::RootNotFound:
    case PairScanStatus::RootNotDirectory:
        summary.status = RunStatus::SourceNotFound;
        return summary;
    case PairScanStatus::Unreadable:
        summary.status = RunStatus::SourceUnreadable;
        return summary;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec || !std::filesystem::is_directory(output_dir, ec)) {
        summary.status = RunStatus::OutputDirFailed;
        return summary;
    }

    summary.discovered = static_cast<uint32_t>(scan.pairs.size());
    observer_->on_pairs_discovered(scan);

    for (const MediaPair& pair : scan.pairs) {
        if (cancel_.load(std::memory_order_relaxed)) {
            summary.status = RunStatus::Cancelled;
            return summary;
        }
        const PairReport report = process_pair(pair, output_dir);
        switch (report.state) {
        case PairState::Done: summary.processed += 1; break;
        case PairState::Rejected: summary.rejected += 1; break;
        case PairState::Skipped: summary.skipped += 1; break;
        default: summary.failed += 1; break;
        }
        observer_->on_pair_outcome(report);
    }

    if (options_.copy_unmatched) {
        copy_unmatched(scan, output_dir, &summary);
    }
    if (options_.delete_after_mux) {
        delete_processed(&summary);
    }
    return summary;
}


PairReport
ConversionPipeline::process_pair(const MediaPair& pair,
                                 const std::filesystem::path& output_dir)
{
    PairReport report;
    report.pair = pair;

    ValidateOptions lenient;
    lenient.accept_heic_photo = true;
    const ValidationResult v = validate_media(pair, lenient);
    if (v.status != ValidationStatus::Ok) {
        return reject(std::move(report), v);
    }
    report.state = PairState::Validated;

    if (!options_.convert_all) {
        std::error_code ec;
        const uintmax_t size = std::filesystem::file_size(pair.video, ec);
        if (ec || size > options_.max_video_bytes) {
            return finish(std::move(report), PairState::Skipped,
                          PairOutcome::SizeGateSkip, pair.video,
                          ec ? "video_missing" : "video_too_large");
        }
    }

    MediaPair work = pair;
    std::filesystem::path converted;
    if (media_kind_of(pair.photo) == MediaKind::Heic) {
        if (!transcoder_) {
            return finish(std::move(report), PairState::Failed,
                          PairOutcome::CodecConversionFailure, pair.photo,
                          "no_transcoder");
        }
        converted                 = converted_jpeg_path(pair.photo);
        const TranscodeStatus tst = transcoder_->to_jpeg(pair.photo,
                                                         converted);
        if (tst != TranscodeStatus::Ok) {
            return finish(std::move(report), PairState::Failed,
                          PairOutcome::CodecConversionFailure, pair.photo,
                          transcode_status_name(tst));
        }
        report.state = PairState::CodecConverted;
        work.photo   = converted;

        const ValidationResult strict = validate_media(work);
        if (strict.status != ValidationStatus::Ok) {
            return reject(std::move(report), strict);
        }
    }

    const std::filesystem::path out
        = mux_output_path(work.photo, output_dir).lexically_normal();
    if (outputs_.count(out) != 0U) {
        return finish(std::move(report), PairState::Failed,
                      PairOutcome::OutputCollision, out, "output_exists");
    }

    MuxOptions mux_options;
    mux_options.copy_buffer_bytes = options_.copy_buffer_bytes;
    const MuxResult mux = mux_motion_photo(work.photo, work.video, output_dir,
                                           mux_options);
    if (mux.status != MuxStatus::Ok) {
        return finish(std::move(report), PairState::Failed,
                      PairOutcome::MuxFailure, mux.output_path,
                      mux_status_name(mux.status));
    }
    outputs_.insert(out);
    report.state = PairState::Muxed;

    const MotionPhotoFields fields = make_motion_photo_fields(
        mux.total_bytes, mux.photo_bytes, options_.presentation_timestamp_us);
    XmpWriteOptions xmp_options;
    xmp_options.padding_bytes = options_.xmp_padding;
    const XmpWriteResult xmp = write_motion_photo_xmp(mux.output_path, fields,
                                                      registry_, xmp_options);
    if (!xmp.existing_keys.empty()) {
        observer_->on_existing_xmp(mux.output_path, xmp.existing_keys);
    }
    if (xmp.namespace_already_registered) {
        observer_->on_namespace_already_registered(mux.output_path);
    }
    if (xmp.status != XmpWriteStatus::Ok) {
        // A muxed file without offset metadata is not a motion photo.
        std::error_code ec;
        if (!std::filesystem::remove(mux.output_path, ec) && ec) {
            observer_->on_cleanup_error(mux.output_path, "remove_failed");
        }
        return finish(std::move(report), PairState::Failed,
                      PairOutcome::MetadataWriteFailure, mux.output_path,
                      xmp_write_status_name(xmp.status));
    }
    report.state        = PairState::MetadataWritten;
    report.video_offset = fields.micro_video_offset;

    processed_.insert(pair.photo);
    processed_.insert(pair.video);
    if (!converted.empty()) {
        processed_.insert(converted);
    }
    return finish(std::move(report), PairState::Done, PairOutcome::Converted,
                  mux.output_path);
}


void
ConversionPipeline::copy_unmatched(const PairScanResult& scan,
                                   const std::filesystem::path& output_dir,
                                   RunSummary* summary)
{
    for (const std::filesystem::path& file : scan.files) {
        if (processed_.count(file) != 0U) {
            continue;
        }
        const std::filesystem::path dest = output_dir / file.filename();

        std::error_code ec;
        if (std::filesystem::exists(dest, ec) || ec) {
            summary->cleanup_errors += 1;
            observer_->on_cleanup_error(file, "destination_exists");
            continue;
        }
        if (!std::filesystem::copy_file(file, dest,
                                        std::filesystem::copy_options::none,
                                        ec)) {
            summary->cleanup_errors += 1;
            observer_->on_cleanup_error(file, "copy_failed");
            continue;
        }
        const std::filesystem::file_time_type mtime
            = std::filesystem::last_write_time(file, ec);
        if (!ec) {
            std::filesystem::last_write_time(dest, mtime, ec);
        }
        if (ec) {
            summary->cleanup_errors += 1;
            observer_->on_cleanup_error(dest, "mtime_not_preserved");
        }
        summary->copied += 1;
        observer_->on_file_copied(file, dest);
    }
}


void
ConversionPipeline::delete_processed(RunSummary* summary)
{
    for (const std::filesystem::path& file : processed_) {
        std::error_code ec;
        if (!std::filesystem::remove(file, ec)) {
            summary->cleanup_errors += 1;
            observer_->on_cleanup_error(file, ec ? "remove_failed"
                                                 : "not_found");
            continue;
        }
        summary->deleted += 1;
        observer_->on_file_deleted(file);
    }
}


const char*
pair_state_name(PairState state) noexcept
{
    switch (state) {
    case PairState::Discovered: return "discovered";
    case PairState::Validated: return "validated";
    case PairState::CodecConverted: return "codec_converted";
    case PairState::Muxed: return "muxed";
    case PairState::MetadataWritten: return "metadata_written";
    case PairState::Done: return "done";
    case PairState::Rejected: return "rejected";
    case PairState::Skipped: return "skipped";
    case PairState::Failed: return "failed";
    }
    return "unknown";
}


const char*
pair_outcome_name(PairOutcome outcome) noexcept
{
    switch (outcome) {
    case PairOutcome::Converted: return "converted";
    case PairOutcome::InputNotFound: return "input_not_found";
    case PairOutcome::InvalidExtension: return "invalid_extension";
    case PairOutcome::SizeGateSkip: return "size_gate_skip";
    case PairOutcome::CodecConversionFailure:
        return "codec_conversion_failure";
    case PairOutcome::OutputCollision: return "output_collision";
    case PairOutcome::MuxFailure: return "mux_failure";
    case PairOutcome::MetadataWriteFailure: return "metadata_write_failure";
    }
    return "unknown";
}


std::string
format_pair_report(const PairReport& report)
{
    std::string line = report.pair.photo.string();
    line.append(": ");
    line.append(pair_outcome_name(report.outcome));
    line.append(" state=");
    line.append(pair_state_name(report.state));
    if (report.detail && report.detail[0] != '\0') {
        line.append(" reason=");
        line.append(report.detail);
    }
    if (!report.path.empty()) {
        line.append(" path=");
        line.append(report.path.string());
    }
    return line;
}


const char*
run_status_name(RunStatus status) noexcept
{
    switch (status) {
    case RunStatus::Ok: return "ok";
    case RunStatus::SourceNotFound: return "source_not_found";
    case RunStatus::SourceUnreadable: return "source_unreadable";
    case RunStatus::OutputDirFailed: return "output_dir_failed";
    case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

}  // namespace motionmux
