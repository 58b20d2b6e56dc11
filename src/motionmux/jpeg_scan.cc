#include "motionmux/jpeg_scan.h"

#include <cstring>

namespace motionmux {
namespace {

    struct SegmentSink final {
        JpegSegmentRef* out = nullptr;
        uint32_t cap        = 0;
        JpegScanResult result;
    };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool match(std::span<const std::byte> bytes, uint64_t offset,
                      const char* s, uint32_t s_len) noexcept
    {
        const uint64_t size = static_cast<uint64_t>(bytes.size());
        if (offset + s_len > size) {
            return false;
        }
        return std::memcmp(bytes.data() + static_cast<size_t>(offset), s,
                           static_cast<size_t>(s_len))
               == 0;
    }


    static void sink_emit(SegmentSink* sink,
                          const JpegSegmentRef& segment) noexcept
    {
        sink->result.needed += 1;
        if (sink->result.written < sink->cap) {
            sink->out[sink->result.written] = segment;
            sink->result.written += 1;
        } else if (sink->result.status == ScanStatus::Ok) {
            sink->result.status = ScanStatus::OutputTruncated;
        }
    }


    static bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        *out = static_cast<uint16_t>(
            (static_cast<uint16_t>(u8(bytes[offset + 0])) << 8)
            | static_cast<uint16_t>(u8(bytes[offset + 1])));
        return true;
    }


    static void classify(std::span<const std::byte> bytes,
                         JpegSegmentRef* seg) noexcept
    {
        const uint64_t off  = seg->data_offset;
        const uint64_t size = seg->data_size;

        if (seg->marker == 0xFFE0) {
            if (size >= 5 && match(bytes, off, "JFIF\0", 5)) {
                seg->kind = JpegSegmentKind::Jfif;
            }
            return;
        }
        if (seg->marker == 0xFFE1) {
            if (size >= 6 && match(bytes, off, "Exif\0\0", 6)) {
                seg->kind = JpegSegmentKind::Exif;
                seg->data_offset += 6;
                seg->data_size -= 6;
            } else if (size >= kXmpApp1Signature.size()
                       && match(bytes, off, kXmpApp1Signature.data(),
                                static_cast<uint32_t>(
                                    kXmpApp1Signature.size()))) {
                seg->kind = JpegSegmentKind::Xmp;
                seg->data_offset += kXmpApp1Signature.size();
                seg->data_size -= kXmpApp1Signature.size();
            } else if (size >= 35
                       && match(bytes, off,
                                "http://ns.adobe.com/xmp/extension/\0", 35)) {
                seg->kind = JpegSegmentKind::XmpExtended;
                seg->data_offset += 35;
                seg->data_size -= 35;
            }
            return;
        }
        if (seg->marker == 0xFFE2) {
            if (size >= 14 && match(bytes, off, "ICC_PROFILE\0", 12)) {
                seg->kind = JpegSegmentKind::Icc;
                seg->data_offset += 14;
                seg->data_size -= 14;
            } else if (size >= 4 && match(bytes, off, "MPF\0", 4)) {
                seg->kind = JpegSegmentKind::Mpf;
                seg->data_offset += 4;
                seg->data_size -= 4;
            }
            return;
        }
        if (seg->marker == 0xFFFE) {
            seg->kind = JpegSegmentKind::Comment;
        }
    }

}  // namespace

JpegScanResult
scan_jpeg(std::span<const std::byte> bytes,
          std::span<JpegSegmentRef> out) noexcept
{
    SegmentSink sink;
    sink.out = out.data();
    sink.cap = static_cast<uint32_t>(out.size());

    if (bytes.size() < 2) {
        sink.result.status = ScanStatus::Malformed;
        return sink.result;
    }
    if (u8(bytes[0]) != 0xFF || u8(bytes[1]) != 0xD8) {
        sink.result.status = ScanStatus::Unsupported;
        return sink.result;
    }

    uint64_t offset = 2;
    while (offset + 2 <= bytes.size()) {
        if (u8(bytes[offset]) != 0xFF) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        // Any number of 0xFF fill bytes may precede a marker.
        while (offset < bytes.size() && u8(bytes[offset]) == 0xFF) {
            offset += 1;
        }
        if (offset >= bytes.size()) {
            break;
        }
        const uint64_t marker_off = offset - 1;
        const uint16_t marker     = static_cast<uint16_t>(
            0xFF00U | static_cast<uint16_t>(u8(bytes[offset])));
        offset += 1;

        if (marker == 0xFFD9) {
            break;
        }
        if (marker == 0xFFDA) {
            sink.result.scan_offset = marker_off;
            break;
        }
        if ((marker >= 0xFFD0 && marker <= 0xFFD7) || marker == 0xFF01) {
            continue;
        }

        uint16_t seg_len = 0;
        if (!read_u16be(bytes, offset, &seg_len) || seg_len < 2) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        const uint64_t payload_off  = offset + 2;
        const uint64_t payload_size = static_cast<uint64_t>(seg_len - 2);
        if (payload_off + payload_size > bytes.size()) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }

        JpegSegmentRef seg;
        seg.marker       = marker;
        seg.outer_offset = marker_off;
        seg.outer_size   = (payload_off + payload_size) - marker_off;
        seg.data_offset  = payload_off;
        seg.data_size    = payload_size;
        classify(bytes, &seg);
        sink_emit(&sink, seg);

        offset = payload_off + payload_size;
    }

    return sink.result;
}


JpegScanResult
scan_jpeg_all(std::span<const std::byte> bytes,
              std::vector<JpegSegmentRef>* out)
{
    if (out->empty()) {
        out->resize(32);
    }
    JpegScanResult r = scan_jpeg(bytes, *out);
    if (r.status == ScanStatus::OutputTruncated) {
        out->resize(r.needed);
        r = scan_jpeg(bytes, *out);
    }
    out->resize(r.written);
    return r;
}


const JpegSegmentRef*
find_xmp_segment(std::span<const JpegSegmentRef> segments) noexcept
{
    for (const JpegSegmentRef& seg : segments) {
        if (seg.kind == JpegSegmentKind::Xmp) {
            return &seg;
        }
    }
    return nullptr;
}


uint64_t
xmp_insert_offset(std::span<const JpegSegmentRef> segments) noexcept
{
    uint64_t cursor = 2;
    for (const JpegSegmentRef& seg : segments) {
        if (seg.outer_offset != cursor) {
            break;
        }
        const bool leading = seg.kind == JpegSegmentKind::Jfif
                             || seg.kind == JpegSegmentKind::Exif
                             || seg.marker == 0xFFE0;
        if (!leading) {
            break;
        }
        cursor = seg.outer_offset + seg.outer_size;
    }
    return cursor;
}


const char*
scan_status_name(ScanStatus status) noexcept
{
    switch (status) {
    case ScanStatus::Ok: return "ok";
    case ScanStatus::OutputTruncated: return "output_truncated";
    case ScanStatus::Unsupported: return "unsupported";
    case ScanStatus::Malformed: return "malformed";
    }
    return "unknown";
}


const char*
segment_kind_name(JpegSegmentKind kind) noexcept
{
    switch (kind) {
    case JpegSegmentKind::Other: return "other";
    case JpegSegmentKind::Jfif: return "jfif";
    case JpegSegmentKind::Exif: return "exif";
    case JpegSegmentKind::Xmp: return "xmp";
    case JpegSegmentKind::XmpExtended: return "xmp_extended";
    case JpegSegmentKind::Icc: return "icc";
    case JpegSegmentKind::Mpf: return "mpf";
    case JpegSegmentKind::Comment: return "comment";
    }
    return "unknown";
}

}  // namespace motionmux
