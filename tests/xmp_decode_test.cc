#include "motionmux/xmp_decode.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace motionmux {

static std::span<const std::byte>
as_bytes(const std::string& s)
{
    return std::span<const std::byte>(reinterpret_cast<const std::byte*>(
                                          s.data()),
                                      s.size());
}


TEST(XmpDecodeTest, DecodesAttributesArraysAndRdfResource)
{
    const std::string xmp
        = "<?xpacket begin='\xEF\xBB\xBF' id='W5M0MpCehiHzreSzNTczkc9d'?>"
          "<x:xmpmeta xmlns:x='adobe:ns:meta/'>"
          "<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
          "<rdf:Description "
          "xmlns:dc='http://purl.org/dc/elements/1.1/' "
          "xmlns:xmp='http://ns.adobe.com/xap/1.0/' "
          "xmlns:xmpMM='http://ns.adobe.com/xap/1.0/mm/' "
          "xmp:CreatorTool='MotionMux'>"
          "<dc:creator><rdf:Seq>"
          "<rdf:li>John</rdf:li><rdf:li>Jane</rdf:li>"
          "</rdf:Seq></dc:creator>"
          "<xmp:Rating> 5 </xmp:Rating>"
          "<xmpMM:InstanceID rdf:resource='uuid:123'/>"
          "</rdf:Description>"
          "</rdf:RDF>"
          "</x:xmpmeta>"
          "<?xpacket end='w'?>";

    MetaStore store;
    const XmpDecodeResult r = decode_xmp_packet(as_bytes(xmp), store);
    EXPECT_EQ(r.status, XmpDecodeStatus::Ok);
    EXPECT_EQ(r.entries_decoded, 5U);

    store.finalize();

    auto expect_text = [&](std::string_view schema_ns, std::string_view path,
                           std::string_view expected) {
        const MetaKeyView key { schema_ns, path };
        const std::span<const EntryId> ids = store.find_all(key);
        ASSERT_EQ(ids.size(), 1U);
        const Entry& e = store.entry(ids[0]);
        ASSERT_EQ(e.value.kind, MetaValueKind::Text);
        EXPECT_EQ(value_text(store.arena(), e.value), expected);
    };

    expect_text("http://ns.adobe.com/xap/1.0/", "CreatorTool", "MotionMux");
    expect_text("http://purl.org/dc/elements/1.1/", "creator[1]", "John");
    expect_text("http://purl.org/dc/elements/1.1/", "creator[2]", "Jane");
    expect_text("http://ns.adobe.com/xap/1.0/", "Rating", "5");
    expect_text("http://ns.adobe.com/xap/1.0/mm/", "InstanceID", "uuid:123");

    const std::span<const EntryId> tool = store.find_all(
        MetaKeyView { "http://ns.adobe.com/xap/1.0/", "CreatorTool" });
    ASSERT_EQ(tool.size(), 1U);
    EXPECT_TRUE(any(store.entry(tool[0]).flags, EntryFlags::Attribute));
}


TEST(XmpDecodeTest, TrimsTrailingNulPadding)
{
    const std::string xmp
        = "<x:xmpmeta xmlns:x='adobe:ns:meta/'>"
          "<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
          "<rdf:Description "
          "xmlns:xmp='http://ns.adobe.com/xap/1.0/' "
          "xmp:CreatorTool='MotionMux'/>"
          "</rdf:RDF>"
          "</x:xmpmeta>";

    std::string padded = xmp;
    padded.append(16, '\0');

    MetaStore store;
    const XmpDecodeResult r = decode_xmp_packet(as_bytes(padded), store);
    EXPECT_EQ(r.status, XmpDecodeStatus::Ok);
    EXPECT_EQ(r.entries_decoded, 1U);
}


TEST(XmpDecodeTest, DecodesNestedStructFields)
{
    const std::string xmp
        = "<x:xmpmeta xmlns:x='adobe:ns:meta/'>"
          "<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
          "<rdf:Description "
          "xmlns:Container='http://ns.google.com/photos/1.0/container/' "
          "xmlns:Item='http://ns.google.com/photos/1.0/container/item/'>"
          "<Container:Directory><rdf:Seq>"
          "<rdf:li rdf:parseType='Resource'>"
          "<Container:Item><rdf:Description Item:Mime='image/jpeg'/>"
          "</Container:Item>"
          "</rdf:li>"
          "</rdf:Seq></Container:Directory>"
          "</rdf:Description>"
          "</rdf:RDF>"
          "</x:xmpmeta>";

    MetaStore store;
    const XmpDecodeResult r = decode_xmp_packet(as_bytes(xmp), store);
    EXPECT_EQ(r.status, XmpDecodeStatus::Ok);
    EXPECT_EQ(r.entries_decoded, 1U);
    store.finalize();

    EXPECT_EQ(store.find_text(MetaKeyView {
                  "http://ns.google.com/photos/1.0/container/item/", "Mime" }),
              "image/jpeg");
}


TEST(XmpDecodeTest, RespectsDescriptionAttributeOption)
{
    const std::string xmp
        = "<x:xmpmeta xmlns:x='adobe:ns:meta/'>"
          "<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
          "<rdf:Description rdf:about='' "
          "xmlns:GCamera='http://ns.google.com/photos/1.0/camera/' "
          "GCamera:MicroVideo='1' GCamera:MicroVideoOffset='42'/>"
          "</rdf:RDF>"
          "</x:xmpmeta>";

    XmpDecodeOptions options;
    options.decode_description_attributes = false;

    MetaStore store;
    const XmpDecodeResult r = decode_xmp_packet(as_bytes(xmp), store,
                                                BlockInfo {},
                                                EntryFlags::None, options);
    EXPECT_EQ(r.status, XmpDecodeStatus::Ok);
    EXPECT_EQ(r.entries_decoded, 0U);

    MetaStore store2;
    const XmpDecodeResult r2 = decode_xmp_packet(as_bytes(xmp), store2);
    EXPECT_EQ(r2.status, XmpDecodeStatus::Ok);
    EXPECT_EQ(r2.entries_decoded, 2U);
    EXPECT_EQ(store2.count_in_namespace(
                  "http://ns.google.com/photos/1.0/camera/"),
              2U);
}


TEST(XmpDecodeTest, ReportsUnsupportedForNonXml)
{
    const std::string text = "not xml at all";
    MetaStore store;
    EXPECT_EQ(decode_xmp_packet(as_bytes(text), store).status,
              XmpDecodeStatus::Unsupported);
}


TEST(XmpDecodeTest, ReportsMalformedForBrokenXml)
{
    const std::string xmp
        = "<x:xmpmeta xmlns:x='adobe:ns:meta/'>"
          "<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
          "<rdf:Description></rdf:RDF>";
    MetaStore store;
    EXPECT_EQ(decode_xmp_packet(as_bytes(xmp), store).status,
              XmpDecodeStatus::Malformed);
}


TEST(XmpDecodeTest, EnforcesDepthLimit)
{
    std::string xmp = "<x:xmpmeta xmlns:x='adobe:ns:meta/'>";
    for (int i = 0; i < 16; ++i) {
        xmp.append("<x:a>");
    }
    for (int i = 0; i < 16; ++i) {
        xmp.append("</x:a>");
    }
    xmp.append("</x:xmpmeta>");

    XmpDecodeOptions options;
    options.limits.max_depth = 8;

    MetaStore store;
    EXPECT_EQ(decode_xmp_packet(as_bytes(xmp), store, BlockInfo {},
                                EntryFlags::None, options)
                  .status,
              XmpDecodeStatus::LimitExceeded);
}


TEST(XmpDecodeTest, EnforcesPropertyLimit)
{
    const std::string xmp
        = "<x:xmpmeta xmlns:x='adobe:ns:meta/'>"
          "<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
          "<rdf:Description xmlns:dc='http://purl.org/dc/elements/1.1/' "
          "dc:a='1' dc:b='2' dc:c='3'/>"
          "</rdf:RDF>"
          "</x:xmpmeta>";

    XmpDecodeOptions options;
    options.limits.max_properties = 2;

    MetaStore store;
    const XmpDecodeResult r = decode_xmp_packet(as_bytes(xmp), store,
                                                BlockInfo {},
                                                EntryFlags::None, options);
    EXPECT_EQ(r.status, XmpDecodeStatus::LimitExceeded);
    EXPECT_EQ(r.entries_decoded, 2U);
}

}  // namespace motionmux
