#include "motionmux/xmp_packet.h"

#include "motionmux/meta_store.h"
#include "motionmux/xmp_decode.h"
#include "motionmux/xmp_namespace.h"
#include "test_media.h"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace motionmux {

using test::as_text;
using test::count_occurrences;

static constexpr std::string_view kDcNs = "http://purl.org/dc/elements/1.1/";

static std::span<const std::byte>
as_bytes(std::string_view s)
{
    return std::span<const std::byte>(reinterpret_cast<const std::byte*>(
                                          s.data()),
                                      s.size());
}


static XmpPropertySet
camera_props(std::span<const XmpProperty> items)
{
    XmpPropertySet props;
    props.ns_uri     = kGCameraNamespaceUri;
    props.prefix     = kGCameraPrefix;
    props.properties = items;
    return props;
}


static std::string
build(const XmpPropertySet& props, uint32_t padding = 0)
{
    XmpPacketOptions options;
    options.padding_bytes = padding;
    std::vector<std::byte> out(64 * 1024);
    const XmpPacketResult r = build_xmp_packet(props, out, options);
    EXPECT_EQ(r.status, XmpPacketStatus::Ok);
    return std::string(as_text(std::span<const std::byte>(out).first(
        static_cast<size_t>(r.written))));
}


static std::string
rewrite(std::string_view packet, const XmpPropertySet& props,
        XmpPacketResult* result = nullptr, uint32_t padding = 0)
{
    XmpPacketOptions options;
    options.padding_bytes = padding;
    std::vector<std::byte> out(64 * 1024);
    const XmpPacketResult r = rewrite_xmp_packet(as_bytes(packet), props, out,
                                                 options);
    if (result) {
        *result = r;
    }
    if (r.status != XmpPacketStatus::Ok) {
        return std::string();
    }
    return std::string(as_text(std::span<const std::byte>(out).first(
        static_cast<size_t>(r.written))));
}


static std::string_view
decoded(const MetaStore& store, std::string_view ns, std::string_view path)
{
    return store.find_text(MetaKeyView { ns, path });
}


TEST(XmpPacket, BuildsDecodablePacket)
{
    const std::array<XmpProperty, 2> items = {
        XmpProperty { "MicroVideo", "1" },
        XmpProperty { "MicroVideoOffset", "5242880" },
    };
    const std::string packet = build(camera_props(items), 200);

    EXPECT_EQ(packet.rfind("<?xpacket begin=", 0), 0U);
    EXPECT_NE(packet.find(kXpacketId), std::string::npos);
    EXPECT_EQ(packet.substr(packet.size() - 19), "<?xpacket end=\"w\"?>");
    EXPECT_NE(packet.find("xmlns:GCamera=\"http://ns.google.com/photos/1.0/"
                          "camera/\""),
              std::string::npos);

    MetaStore store;
    const XmpDecodeResult r = decode_xmp_packet(as_bytes(packet), store);
    ASSERT_EQ(r.status, XmpDecodeStatus::Ok);
    EXPECT_EQ(r.entries_decoded, 2U);
    store.finalize();
    EXPECT_EQ(decoded(store, kGCameraNamespaceUri, "MicroVideo"), "1");
    EXPECT_EQ(decoded(store, kGCameraNamespaceUri, "MicroVideoOffset"),
              "5242880");
}


TEST(XmpPacket, PaddingAddsExactBytes)
{
    const std::array<XmpProperty, 1> items = {
        XmpProperty { "MicroVideo", "1" },
    };
    const std::string bare   = build(camera_props(items), 0);
    const std::string padded = build(camera_props(items), 2048);
    EXPECT_EQ(padded.size(), bare.size() + 2048U);
}


TEST(XmpPacket, ReportsNeededSizeWhenTruncated)
{
    const std::array<XmpProperty, 1> items = {
        XmpProperty { "MicroVideo", "1" },
    };
    std::vector<std::byte> small(16);
    XmpPacketOptions options;
    const XmpPacketResult r = build_xmp_packet(camera_props(items), small,
                                               options);
    EXPECT_EQ(r.status, XmpPacketStatus::OutputTruncated);
    EXPECT_EQ(r.written, 16U);
    EXPECT_GT(r.needed, 16U);
}


TEST(XmpPacket, RewriteOfBuiltPacketIsStable)
{
    const std::array<XmpProperty, 2> items = {
        XmpProperty { "MicroVideo", "1" },
        XmpProperty { "MicroVideoOffset", "100" },
    };
    const XmpPropertySet props = camera_props(items);
    const std::string built    = build(props);

    XmpPacketResult r;
    const std::string once = rewrite(built, props, &r);
    ASSERT_EQ(r.status, XmpPacketStatus::Ok);
    EXPECT_EQ(r.removed_properties, 2U);
    EXPECT_EQ(once, built);

    const std::string twice = rewrite(once, props);
    EXPECT_EQ(twice, once);
}


TEST(XmpPacket, RewriteReplacesValuesAndKeepsOtherSchemas)
{
    const std::string existing
        = "<?xpacket begin='\xEF\xBB\xBF' id='W5M0MpCehiHzreSzNTczkc9d'?>\n"
          "<x:xmpmeta xmlns:x='adobe:ns:meta/'>\n"
          " <rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>\n"
          "  <rdf:Description rdf:about='' "
          "xmlns:dc='http://purl.org/dc/elements/1.1/' "
          "xmlns:GCamera='http://ns.google.com/photos/1.0/camera/' "
          "GCamera:MicroVideo='1' GCamera:MicroVideoOffset='999'>\n"
          "   <dc:title><rdf:Alt>"
          "<rdf:li xml:lang='x-default'>Beach &amp; sun</rdf:li>"
          "</rdf:Alt></dc:title>\n"
          "   <GCamera:MicroVideoVersion>1</GCamera:MicroVideoVersion>\n"
          "  </rdf:Description>\n"
          " </rdf:RDF>\n"
          "</x:xmpmeta>\n"
          "<?xpacket end='w'?>";

    const std::array<XmpProperty, 3> items = {
        XmpProperty { "MicroVideo", "1" },
        XmpProperty { "MicroVideoVersion", "1" },
        XmpProperty { "MicroVideoOffset", "4096" },
    };
    XmpPacketResult r;
    const std::string out = rewrite(existing, camera_props(items), &r);
    ASSERT_EQ(r.status, XmpPacketStatus::Ok);
    EXPECT_EQ(r.removed_properties, 3U);
    EXPECT_EQ(count_occurrences(out, "MicroVideoOffset"), 1U);
    EXPECT_EQ(count_occurrences(out, "MicroVideoVersion"), 1U);
    EXPECT_EQ(count_occurrences(out, "<GCamera:MicroVideoVersion>"), 0U);
    // The old declaration goes once nothing left in its scope uses it.
    EXPECT_EQ(count_occurrences(out, "xmlns:GCamera="), 1U);
    EXPECT_EQ(count_occurrences(out, "<?xpacket"), 2U);

    MetaStore store;
    ASSERT_EQ(decode_xmp_packet(as_bytes(out), store).status,
              XmpDecodeStatus::Ok);
    store.finalize();
    EXPECT_EQ(decoded(store, kDcNs, "title[1]"), "Beach & sun");
    EXPECT_EQ(decoded(store, kGCameraNamespaceUri, "MicroVideoOffset"),
              "4096");
    EXPECT_EQ(store.count_in_namespace(kGCameraNamespaceUri), 3U);

    EXPECT_EQ(rewrite(out, camera_props(items)), out);
}


TEST(XmpPacket, RewriteKeepsOtherPropertiesOfTargetSchema)
{
    const std::string existing
        = "<x:xmpmeta xmlns:x='adobe:ns:meta/'>"
          "<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
          "<rdf:Description rdf:about='' "
          "xmlns:GCamera='http://ns.google.com/photos/1.0/camera/' "
          "GCamera:BurstID='burst-42' GCamera:MicroVideoOffset='7'>"
          "<GCamera:SpecialTypeID>portrait</GCamera:SpecialTypeID>"
          "<GCamera:MicroVideo>1</GCamera:MicroVideo>"
          "</rdf:Description>"
          "</rdf:RDF>"
          "</x:xmpmeta>";

    const std::array<XmpProperty, 2> items = {
        XmpProperty { "MicroVideo", "1" },
        XmpProperty { "MicroVideoOffset", "4096" },
    };
    XmpPacketResult r;
    const std::string out = rewrite(existing, camera_props(items), &r);
    ASSERT_EQ(r.status, XmpPacketStatus::Ok);
    EXPECT_EQ(r.removed_properties, 2U);
    EXPECT_EQ(count_occurrences(out, "burst-42"), 1U);
    EXPECT_EQ(count_occurrences(out, "xmlns:GCamera="), 2U);

    MetaStore store;
    ASSERT_EQ(decode_xmp_packet(as_bytes(out), store).status,
              XmpDecodeStatus::Ok);
    store.finalize();
    EXPECT_EQ(decoded(store, kGCameraNamespaceUri, "BurstID"), "burst-42");
    EXPECT_EQ(decoded(store, kGCameraNamespaceUri, "SpecialTypeID"),
              "portrait");
    EXPECT_EQ(store.find_all(MetaKeyView { kGCameraNamespaceUri,
                                           "MicroVideoOffset" })
                  .size(),
              1U);
    EXPECT_EQ(decoded(store, kGCameraNamespaceUri, "MicroVideoOffset"),
              "4096");

    EXPECT_EQ(rewrite(out, camera_props(items)), out);
}


TEST(XmpPacket, RewriteDropsDescriptionThatOnlyHeldTargetSchema)
{
    const std::string existing
        = "<x:xmpmeta xmlns:x='adobe:ns:meta/'>"
          "<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
          "<rdf:Description rdf:about='' "
          "xmlns:xmp='http://ns.adobe.com/xap/1.0/' xmp:Rating='4'/>"
          "<rdf:Description rdf:about='' "
          "xmlns:GCamera='http://ns.google.com/photos/1.0/camera/' "
          "GCamera:MicroVideo='1'/>"
          "</rdf:RDF>"
          "</x:xmpmeta>";

    const std::array<XmpProperty, 1> items = {
        XmpProperty { "MicroVideo", "1" },
    };
    const std::string out = rewrite(existing, camera_props(items));
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(count_occurrences(out, "<rdf:Description"), 2U);
    EXPECT_EQ(count_occurrences(out, "xmp:Rating=\"4\""), 1U);
}


TEST(XmpPacket, RewriteRejectsPacketWithoutRdf)
{
    const std::array<XmpProperty, 1> items = {
        XmpProperty { "MicroVideo", "1" },
    };
    XmpPacketResult r;
    (void)rewrite("<x:xmpmeta xmlns:x='adobe:ns:meta/'/>", camera_props(items),
                  &r);
    EXPECT_EQ(r.status, XmpPacketStatus::Malformed);

    (void)rewrite("<x:xmpmeta xmlns:x='adobe:ns:meta/'>", camera_props(items),
                  &r);
    EXPECT_EQ(r.status, XmpPacketStatus::Malformed);
}


TEST(XmpPacket, EscapesAttributeValues)
{
    const std::array<XmpProperty, 1> items = {
        XmpProperty { "Note", "a\"b<c>&d" },
    };
    const std::string packet = build(camera_props(items));
    EXPECT_NE(packet.find("GCamera:Note=\"a&quot;b&lt;c&gt;&amp;d\""),
              std::string::npos);

    MetaStore store;
    ASSERT_EQ(decode_xmp_packet(as_bytes(packet), store).status,
              XmpDecodeStatus::Ok);
    store.finalize();
    EXPECT_EQ(decoded(store, kGCameraNamespaceUri, "Note"), "a\"b<c>&d");
}

}  // namespace motionmux
