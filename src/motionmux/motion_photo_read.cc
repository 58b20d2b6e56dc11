#include "motionmux/motion_photo_read.h"

#include "file_io_internal.h"
#include "motionmux/jpeg_scan.h"
#include "motionmux/mapped_file.h"
#include "motionmux/meta_store.h"
#include "motionmux/xmp_decode.h"
#include "motionmux/xmp_namespace.h"

#include <cstring>
#include <new>
#include <vector>

namespace motionmux {
namespace {

    static bool read_field(const MetaStore& store, std::string_view name,
                           uint64_t* out) noexcept
    {
        const std::string_view text = store.find_text(
            MetaKeyView { kGCameraNamespaceUri, name });
        return !text.empty() && text_to_u64(text, out);
    }


    static void probe_video(std::span<const std::byte> video,
                            MotionPhotoInfo* info)
    {
        if (video.size() < 12) {
            return;
        }
        const char* p = reinterpret_cast<const char*>(video.data());
        if (std::memcmp(p + 4, "ftyp", 4) != 0) {
            return;
        }
        info->video_has_ftyp = true;
        info->video_brand.assign(p + 8, 4);
    }

}  // namespace

MotionPhotoReadResult
read_motion_photo(std::span<const std::byte> file_bytes) noexcept
{
    MotionPhotoReadResult r;
    try {
        r.info.file_bytes = file_bytes.size();

        std::vector<JpegSegmentRef> segments;
        const JpegScanResult scan = scan_jpeg_all(file_bytes, &segments);
        if (scan.status == ScanStatus::Unsupported) {
            r.status = MotionPhotoReadStatus::NotJpeg;
            return r;
        }
        if (scan.status != ScanStatus::Ok) {
            r.status = MotionPhotoReadStatus::Malformed;
            return r;
        }

        const JpegSegmentRef* xmp = find_xmp_segment(segments);
        if (!xmp) {
            r.status = MotionPhotoReadStatus::NoXmp;
            return r;
        }

        MetaStore store;
        BlockInfo block;
        block.outer_offset = xmp->outer_offset;
        const XmpDecodeResult dec = decode_xmp_packet(
            file_bytes.subspan(static_cast<size_t>(xmp->data_offset),
                               static_cast<size_t>(xmp->data_size)),
            store, block);
        if (dec.status != XmpDecodeStatus::Ok
            && dec.status != XmpDecodeStatus::OutputTruncated) {
            r.status = MotionPhotoReadStatus::Malformed;
            return r;
        }
        store.finalize();

        uint64_t flag = 0;
        if (!read_field(store, kMicroVideoName, &flag) || flag != 1U) {
            r.status = MotionPhotoReadStatus::NotMotionPhoto;
            return r;
        }
        r.info.fields.micro_video = 1;

        uint64_t version = 0;
        if (read_field(store, kMicroVideoVersionName, &version)) {
            r.info.fields.micro_video_version = static_cast<uint32_t>(version);
        }
        uint64_t pts = 0;
        if (read_field(store, kMicroVideoTimestampName, &pts)) {
            r.info.fields.presentation_timestamp_us = pts;
        }

        uint64_t offset = 0;
        const uint64_t header_end = scan.scan_offset != 0U ? scan.scan_offset
                                                           : 2U;
        if (!read_field(store, kMicroVideoOffsetName, &offset) || offset == 0U
            || offset > file_bytes.size() - header_end) {
            r.status = MotionPhotoReadStatus::BadOffset;
            return r;
        }
        r.info.fields.micro_video_offset = offset;
        const std::span<const EntryId> ids = store.find_all(
            MetaKeyView { kGCameraNamespaceUri, kMicroVideoOffsetName });
        const BlockId source = store.entry(ids[0]).origin.block;
        if (source < store.block_count()) {
            r.info.xmp_segment_offset = store.block_info(source).outer_offset;
        }
        r.info.video_bytes               = offset;
        r.info.video_offset              = file_bytes.size() - offset;
        r.info.photo_bytes               = r.info.video_offset;

        probe_video(file_bytes.subspan(static_cast<size_t>(r.info.video_offset)),
                    &r.info);
    } catch (const std::bad_alloc&) {
        r.status = MotionPhotoReadStatus::Malformed;
    }
    return r;
}


MotionPhotoReadResult
read_motion_photo_file(const std::filesystem::path& path) noexcept
{
    MappedFile file;
    if (file.open(path) != MappedFileStatus::Ok) {
        MotionPhotoReadResult r;
        r.status = MotionPhotoReadStatus::OpenFailed;
        return r;
    }
    return read_motion_photo(file.bytes());
}


MotionPhotoReadResult
extract_motion_photo_video(const std::filesystem::path& path,
                           const std::filesystem::path& video_out) noexcept
{
    MappedFile file;
    if (file.open(path, 0, MappedFileAccess::Sequential)
        != MappedFileStatus::Ok) {
        MotionPhotoReadResult r;
        r.status = MotionPhotoReadStatus::OpenFailed;
        return r;
    }

    MotionPhotoReadResult r = read_motion_photo(file.bytes());
    if (r.status != MotionPhotoReadStatus::Ok) {
        return r;
    }

    file_io_internal::PendingFile pending(video_out);
    file_io_internal::FilePtr out = file_io_internal::open_file(video_out,
                                                                "wb");
    if (!out
        || !file_io_internal::write_all(
            out.get(), file.bytes().subspan(
                           static_cast<size_t>(r.info.video_offset)))
        || !file_io_internal::close_file(&out)) {
        r.status = MotionPhotoReadStatus::WriteFailed;
        return r;
    }
    pending.keep();
    return r;
}


const char*
motion_photo_read_status_name(MotionPhotoReadStatus status) noexcept
{
    switch (status) {
    case MotionPhotoReadStatus::Ok: return "ok";
    case MotionPhotoReadStatus::OpenFailed: return "open_failed";
    case MotionPhotoReadStatus::NotJpeg: return "not_jpeg";
    case MotionPhotoReadStatus::Malformed: return "malformed";
    case MotionPhotoReadStatus::NoXmp: return "no_xmp";
    case MotionPhotoReadStatus::NotMotionPhoto: return "not_motion_photo";
    case MotionPhotoReadStatus::BadOffset: return "bad_offset";
    case MotionPhotoReadStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}

}  // namespace motionmux
