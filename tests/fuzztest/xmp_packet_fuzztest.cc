#include "motionmux/meta_store.h"
#include "motionmux/xmp_decode.h"
#include "motionmux/xmp_namespace.h"
#include "motionmux/xmp_packet.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace motionmux {

static constexpr std::string_view kXmpBasicUri = "http://ns.adobe.com/xap/1.0/";


static std::vector<std::byte>
build_packet(const XmpPropertySet& props, const XmpPacketOptions& options)
{
    std::vector<std::byte> out(64U * 1024U);
    const XmpPacketResult r = build_xmp_packet(props, out, options);
    EXPECT_EQ(r.status, XmpPacketStatus::Ok);
    out.resize(static_cast<size_t>(r.written));
    return out;
}


static std::vector<std::byte>
rewrite_packet(std::span<const std::byte> packet, const XmpPropertySet& props,
               const XmpPacketOptions& options)
{
    std::vector<std::byte> out(packet.size() + 64U * 1024U);
    const XmpPacketResult r = rewrite_xmp_packet(packet, props, out, options);
    EXPECT_EQ(r.status, XmpPacketStatus::Ok);
    out.resize(static_cast<size_t>(r.written));
    return out;
}


static void
rewrite_keeps_foreign_properties(const std::string& creator_tool,
                                 uint64_t offset)
{
    XmpPacketOptions options;
    options.padding_bytes = 32;

    const std::array<XmpProperty, 1> basic = {
        XmpProperty { "CreatorTool", creator_tool },
    };
    XmpPropertySet basic_set;
    basic_set.ns_uri     = kXmpBasicUri;
    basic_set.prefix     = "xmp";
    basic_set.properties = basic;
    const std::vector<std::byte> existing = build_packet(basic_set, options);

    const std::string offset_text = std::to_string(offset);
    const std::array<XmpProperty, 2> camera = {
        XmpProperty { "MicroVideo", "1" },
        XmpProperty { "MicroVideoOffset", offset_text },
    };
    XmpPropertySet camera_set;
    camera_set.ns_uri     = kGCameraNamespaceUri;
    camera_set.prefix     = kGCameraPrefix;
    camera_set.properties = camera;

    const std::vector<std::byte> once = rewrite_packet(existing, camera_set,
                                                       options);
    const std::vector<std::byte> twice = rewrite_packet(once, camera_set,
                                                        options);
    EXPECT_EQ(once, twice);

    MetaStore store;
    const XmpDecodeResult decoded = decode_xmp_packet(twice, store);
    ASSERT_EQ(decoded.status, XmpDecodeStatus::Ok);
    store.finalize();

    EXPECT_EQ(store.find_text(MetaKeyView { kXmpBasicUri, "CreatorTool" }),
              creator_tool);
    const MetaKeyView offset_key { kGCameraNamespaceUri, "MicroVideoOffset" };
    EXPECT_EQ(store.find_all(offset_key).size(), 1U);
    EXPECT_EQ(store.find_text(offset_key), offset_text);
}


FUZZ_TEST(XmpPacketFuzz, rewrite_keeps_foreign_properties)
    .WithDomains(fuzztest::StringOf(fuzztest::InRange<char>(0x21, 0x7e))
                     .WithMinSize(1)
                     .WithMaxSize(256),
                 fuzztest::Arbitrary<uint64_t>());

}  // namespace motionmux
