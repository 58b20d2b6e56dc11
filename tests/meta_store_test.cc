#include "motionmux/meta_store.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>

namespace motionmux {

static constexpr std::string_view kDcNs  = "http://purl.org/dc/elements/1.1/";
static constexpr std::string_view kXmpNs = "http://ns.adobe.com/xap/1.0/";

static Entry
make_entry(MetaStore& store, BlockId block, std::string_view ns,
           std::string_view path, std::string_view text, uint32_t order)
{
    Entry e;
    e.key   = make_xmp_property_key(store.arena(), ns, path);
    e.value = make_text(store.arena(), text, TextEncoding::Utf8);
    e.origin.block          = block;
    e.origin.order_in_block = order;
    return e;
}


TEST(MetaStoreTest, SupportsDuplicateKeys)
{
    MetaStore store;
    const BlockId block = store.add_block(BlockInfo {});

    store.add_entry(make_entry(store, block, kXmpNs, "Rating", "3", 0));
    store.add_entry(make_entry(store, block, kXmpNs, "Rating", "5", 1));
    store.finalize();

    const std::span<const EntryId> ids = store.find_all(
        MetaKeyView { kXmpNs, "Rating" });
    ASSERT_EQ(ids.size(), 2U);
    EXPECT_EQ(ids[0], 0U);
    EXPECT_EQ(ids[1], 1U);
    EXPECT_EQ(store.find_text(MetaKeyView { kXmpNs, "Rating" }), "3");
}


TEST(MetaStoreTest, LookupSeparatesNamespaces)
{
    MetaStore store;
    const BlockId block = store.add_block(BlockInfo {});

    store.add_entry(make_entry(store, block, kDcNs, "title", "dc", 0));
    store.add_entry(make_entry(store, block, kXmpNs, "title", "xmp", 1));
    store.finalize();

    EXPECT_EQ(store.find_text(MetaKeyView { kDcNs, "title" }), "dc");
    EXPECT_EQ(store.find_text(MetaKeyView { kXmpNs, "title" }), "xmp");
    EXPECT_TRUE(store.find_all(MetaKeyView { kXmpNs, "missing" }).empty());
    EXPECT_EQ(store.count_in_namespace(kDcNs), 1U);
}


TEST(MetaStoreTest, BlocksKeepTheirSourceOffsets)
{
    MetaStore store;
    BlockInfo first;
    first.outer_offset = 20;
    BlockInfo second;
    second.outer_offset = 4096;
    const BlockId a = store.add_block(first);
    const BlockId b = store.add_block(second);

    store.add_entry(make_entry(store, b, kXmpNs, "Label", "Red", 0));
    store.finalize();

    EXPECT_EQ(store.block_count(), 2U);
    EXPECT_EQ(store.block_info(a).outer_offset, 20U);
    EXPECT_EQ(store.block_info(b).outer_offset, 4096U);
    EXPECT_TRUE(store.entries_in_block(a).empty());
    ASSERT_EQ(store.entries_in_block(b).size(), 1U);
    EXPECT_EQ(store.count_in_namespace(kXmpNs), 1U);
}


TEST(MetaStoreTest, BlockEntriesAreOrderedByOrigin)
{
    MetaStore store;
    const BlockId block = store.add_block(BlockInfo {});

    store.add_entry(make_entry(store, block, kXmpNs, "A", "a", 10));
    store.add_entry(make_entry(store, block, kXmpNs, "B", "b", 0));
    store.add_entry(make_entry(store, block, kXmpNs, "C", "c", 5));
    store.finalize();

    const std::span<const EntryId> ids = store.entries_in_block(block);
    ASSERT_EQ(ids.size(), 3U);
    EXPECT_EQ(ids[0], 1U);
    EXPECT_EQ(ids[1], 2U);
    EXPECT_EQ(ids[2], 0U);
}


TEST(MetaStoreTest, NothingIsAddedAfterFinalize)
{
    MetaStore store;
    const BlockId block = store.add_block(BlockInfo {});
    store.finalize();

    EXPECT_EQ(store.add_block(BlockInfo {}), kInvalidBlockId);
    EXPECT_EQ(store.add_entry(make_entry(store, block, kXmpNs, "A", "a", 0)),
              kInvalidEntryId);
}


TEST(MetaStoreTest, ParsesUnsignedText)
{
    uint64_t v = 0;
    EXPECT_TRUE(text_to_u64("5242880", &v));
    EXPECT_EQ(v, 5242880U);
    EXPECT_TRUE(text_to_u64("18446744073709551615", &v));
    EXPECT_EQ(v, UINT64_MAX);
    EXPECT_FALSE(text_to_u64("18446744073709551616", &v));
    EXPECT_FALSE(text_to_u64("", &v));
    EXPECT_FALSE(text_to_u64("-1", &v));
    EXPECT_FALSE(text_to_u64("12a", &v));
}

}  // namespace motionmux
