#include "motionmux/xmp_namespace.h"
#include "motionmux/xmp_packet.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace motionmux;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    const std::array<XmpProperty, 2> items = {
        XmpProperty { "MicroVideo", "1" },
        XmpProperty { "MicroVideoOffset", "1234" },
    };
    XmpPropertySet props;
    props.ns_uri     = kGCameraNamespaceUri;
    props.prefix     = kGCameraPrefix;
    props.properties = items;

    XmpPacketOptions options;
    options.padding_bytes   = 64;
    options.max_input_bytes = 1ULL * 1024ULL * 1024ULL;

    std::vector<std::byte> out(256U * 1024U);
    const XmpPacketResult first = rewrite_xmp_packet(bytes, props, out,
                                                     options);
    if (first.status != XmpPacketStatus::Ok) {
        return 0;
    }

    // A rewritten packet must be accepted again and reach a fixed point.
    out.resize(static_cast<size_t>(first.written));
    std::vector<std::byte> again(out.size() + 1024U);
    const XmpPacketResult second = rewrite_xmp_packet(out, props, again,
                                                      options);
    if (second.status != XmpPacketStatus::Ok) {
        std::abort();
    }
    return 0;
}
