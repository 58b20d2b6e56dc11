#include "motionmux/motion_photo_writer.h"

#include "file_io_internal.h"
#include "motionmux/jpeg_scan.h"
#include "motionmux/mapped_file.h"
#include "motionmux/meta_store.h"

#include <array>
#include <new>
#include <string>
#include <system_error>
#include <vector>

namespace motionmux {
namespace {

    using file_io_internal::FilePtr;
    using file_io_internal::PendingFile;

    /// Lists the keys of \p block in packet order.
    static void collect_existing_keys(const MetaStore& store, BlockId block,
                                      const XmpNamespaceRegistry& registry,
                                      std::vector<std::string>* out)
    {
        const ByteArena& arena = store.arena();
        for (const EntryId id : store.entries_in_block(block)) {
            const Entry& e              = store.entry(id);
            const std::string_view ns   = arena.text(e.key.schema_ns);
            const std::string_view path = arena.text(e.key.property_path);
            const std::string_view pfx  = registry.prefix_for(ns);
            std::string key;
            if (!pfx.empty()) {
                key.append(pfx);
                key.push_back(':');
            } else {
                key.push_back('{');
                key.append(ns);
                key.push_back('}');
            }
            key.append(path);
            out->push_back(std::move(key));
        }
    }


    /// Encodes an APP1 marker segment holding a standard XMP packet.
    static std::vector<std::byte> make_xmp_app1(std::span<const std::byte> packet)
    {
        const size_t payload = kXmpApp1Signature.size() + packet.size();
        const size_t seg_len = payload + 2U;

        std::vector<std::byte> seg;
        seg.reserve(payload + 4U);
        seg.push_back(std::byte { 0xFF });
        seg.push_back(std::byte { 0xE1 });
        seg.push_back(static_cast<std::byte>((seg_len >> 8) & 0xFFU));
        seg.push_back(static_cast<std::byte>(seg_len & 0xFFU));
        for (char c : kXmpApp1Signature) {
            seg.push_back(static_cast<std::byte>(c));
        }
        seg.insert(seg.end(), packet.begin(), packet.end());
        return seg;
    }


    static XmpPacketResult render_packet(const JpegSegmentRef* existing,
                                         std::span<const std::byte> file,
                                         const XmpPropertySet& props,
                                         uint32_t padding,
                                         std::span<std::byte> out) noexcept
    {
        XmpPacketOptions popts;
        popts.padding_bytes = padding;
        if (!existing) {
            return build_xmp_packet(props, out, popts);
        }
        const std::span<const std::byte> old
            = file.subspan(static_cast<size_t>(existing->data_offset),
                           static_cast<size_t>(existing->data_size));
        return rewrite_xmp_packet(old, props, out, popts);
    }


    static XmpWriteStatus commit(const std::filesystem::path& path,
                                 std::span<const std::byte> head,
                                 std::span<const std::byte> app1,
                                 std::span<const std::byte> tail,
                                 MappedFile* source) noexcept
    {
        std::error_code ec;
        const std::filesystem::path tmp = file_io_internal::staging_path(path);
        PendingFile pending(tmp);

        FilePtr out = file_io_internal::open_file(tmp, "wb");
        if (!out) {
            return XmpWriteStatus::WriteFailed;
        }
        if (!file_io_internal::write_all(out.get(), head)
            || !file_io_internal::write_all(out.get(), app1)
            || !file_io_internal::write_all(out.get(), tail)) {
            return XmpWriteStatus::WriteFailed;
        }
        if (!file_io_internal::close_file(&out)) {
            return XmpWriteStatus::WriteFailed;
        }

        const std::filesystem::perms perms
            = std::filesystem::status(path, ec).permissions();
        if (!ec) {
            std::filesystem::permissions(tmp, perms, ec);
        }
        if (ec) {
            return XmpWriteStatus::WriteFailed;
        }

        // The mapping must be gone before the target is replaced.
        source->close();
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            return XmpWriteStatus::WriteFailed;
        }
        pending.keep();
        return XmpWriteStatus::Ok;
    }

}  // namespace

XmpWriteResult
write_motion_photo_xmp(const std::filesystem::path& path,
                       const MotionPhotoFields& fields,
                       XmpNamespaceRegistry& registry,
                       const XmpWriteOptions& options) noexcept
{
    XmpWriteResult result;
    try {
        MappedFile file;
        const MappedFileStatus opened
            = file.open(path, 0, MappedFileAccess::Sequential);
        if (opened != MappedFileStatus::Ok) {
            result.status = XmpWriteStatus::OpenFailed;
            result.detail = mapped_file_status_name(opened);
            return result;
        }
        const std::span<const std::byte> bytes = file.bytes();

        std::vector<JpegSegmentRef> segments;
        const JpegScanResult scan = scan_jpeg_all(bytes, &segments);
        if (scan.status != ScanStatus::Ok) {
            result.status = scan.status == ScanStatus::Unsupported
                                ? XmpWriteStatus::NotJpeg
                                : XmpWriteStatus::Malformed;
            result.detail = scan_status_name(scan.status);
            return result;
        }

        const uint64_t header_end = scan.scan_offset != 0U ? scan.scan_offset
                                                           : 2U;
        if (fields.micro_video_offset > bytes.size() - header_end) {
            result.status = XmpWriteStatus::Malformed;
            result.detail = "offset_out_of_range";
            return result;
        }

        const NamespaceRegisterStatus ns
            = registry.register_namespace(kGCameraNamespaceUri,
                                          kGCameraPrefix);
        switch (ns) {
        case NamespaceRegisterStatus::Ok: break;
        case NamespaceRegisterStatus::AlreadyRegistered:
            result.namespace_already_registered = true;
            break;
        case NamespaceRegisterStatus::Conflict:
        case NamespaceRegisterStatus::Invalid:
            result.status = XmpWriteStatus::NamespaceConflict;
            result.detail = namespace_register_status_name(ns);
            return result;
        }

        const JpegSegmentRef* existing = find_xmp_segment(segments);
        if (existing) {
            MetaStore store;
            BlockInfo block;
            block.outer_offset = existing->outer_offset;
            const XmpDecodeResult dec = decode_xmp_packet(
                bytes.subspan(static_cast<size_t>(existing->data_offset),
                              static_cast<size_t>(existing->data_size)),
                store, block, EntryFlags::None, options.decode);
            if (dec.status != XmpDecodeStatus::Ok
                && dec.status != XmpDecodeStatus::OutputTruncated) {
                result.status = XmpWriteStatus::XmpDecodeFailed;
                result.detail = xmp_decode_status_name(dec.status);
                return result;
            }
            store.finalize();
            collect_existing_keys(store, dec.block, registry,
                                  &result.existing_keys);
            result.replaced_existing_packet = true;
        }

        const std::string v_flag    = std::to_string(fields.micro_video);
        const std::string v_version = std::to_string(
            fields.micro_video_version);
        const std::string v_offset = std::to_string(fields.micro_video_offset);
        const std::string v_pts    = std::to_string(
            fields.presentation_timestamp_us);
        const std::array<XmpProperty, 4> items = {
            XmpProperty { kMicroVideoName, v_flag },
            XmpProperty { kMicroVideoVersionName, v_version },
            XmpProperty { kMicroVideoOffsetName, v_offset },
            XmpProperty { kMicroVideoTimestampName, v_pts },
        };
        XmpPropertySet props;
        props.ns_uri     = kGCameraNamespaceUri;
        props.prefix     = registry.prefix_for(kGCameraNamespaceUri);
        props.properties = items;

        std::vector<std::byte> packet(kMaxXmpPacketBytes);
        XmpPacketResult pr = render_packet(existing, bytes, props,
                                           options.padding_bytes, packet);
        if (pr.status == XmpPacketStatus::OutputTruncated
            && options.padding_bytes != 0U) {
            pr = render_packet(existing, bytes, props, 0U, packet);
        }
        if (pr.status != XmpPacketStatus::Ok) {
            result.status = pr.status == XmpPacketStatus::OutputTruncated
                                ? XmpWriteStatus::PacketTooLarge
                                : XmpWriteStatus::XmpDecodeFailed;
            result.detail = xmp_packet_status_name(pr.status);
            return result;
        }
        packet.resize(static_cast<size_t>(pr.written));
        result.removed_properties = pr.removed_properties;
        result.packet_bytes       = pr.written;

        const std::vector<std::byte> app1 = make_xmp_app1(packet);
        const uint64_t cut_begin = existing ? existing->outer_offset
                                            : xmp_insert_offset(segments);
        const uint64_t cut_end   = existing ? existing->outer_offset
                                                + existing->outer_size
                                            : cut_begin;

        const uint64_t new_size = bytes.size() - (cut_end - cut_begin)
                                  + app1.size();
        result.status = commit(path,
                               bytes.first(static_cast<size_t>(cut_begin)),
                               app1,
                               bytes.subspan(static_cast<size_t>(cut_end)),
                               &file);
        if (result.status == XmpWriteStatus::Ok) {
            result.file_bytes = new_size;
        }
    } catch (const std::bad_alloc&) {
        result.status = XmpWriteStatus::WriteFailed;
    }
    return result;
}


const char*
xmp_write_status_name(XmpWriteStatus status) noexcept
{
    switch (status) {
    case XmpWriteStatus::Ok: return "ok";
    case XmpWriteStatus::OpenFailed: return "open_failed";
    case XmpWriteStatus::NotJpeg: return "not_jpeg";
    case XmpWriteStatus::Malformed: return "malformed";
    case XmpWriteStatus::XmpDecodeFailed: return "xmp_decode_failed";
    case XmpWriteStatus::NamespaceConflict: return "namespace_conflict";
    case XmpWriteStatus::PacketTooLarge: return "packet_too_large";
    case XmpWriteStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}

}  // namespace motionmux
