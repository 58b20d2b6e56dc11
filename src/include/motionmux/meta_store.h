#pragma once

#include "motionmux/byte_arena.h"
#include "motionmux/meta_flags.h"
#include "motionmux/meta_key.h"
#include "motionmux/meta_value.h"

#include <cstdint>
#include <span>
#include <vector>

/**
 * \file meta_store.h
 * \brief In-memory representation of decoded XMP properties (keys/values + provenance).
 */

namespace motionmux {

using BlockId = uint32_t;
using EntryId = uint32_t;

static constexpr BlockId kInvalidBlockId = 0xffffffffU;
static constexpr EntryId kInvalidEntryId = 0xffffffffU;

/// Where an \ref Entry came from inside the original packet.
struct Origin final {
    BlockId block           = kInvalidBlockId;
    uint32_t order_in_block = 0;
};

/**
 * \brief A single metadata entry (key/value) with provenance.
 *
 * \note Duplicate keys are allowed and preserved.
 */
struct Entry final {
    MetaKey key;
    MetaValue value;
    Origin origin;
    EntryFlags flags = EntryFlags::None;
};

/// Source block identity: the JPEG segment an XMP packet was read from.
struct BlockInfo final {
    uint64_t outer_offset = 0;
    uint32_t id           = 0;
};

struct KeySpan final {
    uint32_t start = 0;
    uint32_t count = 0;
    EntryId repr   = kInvalidEntryId;
};

struct BlockSpan final {
    uint32_t start = 0;
    uint32_t count = 0;
};

/**
 * \brief Stores decoded entries grouped into blocks.
 *
 * Lifecycle:
 * - Build phase: call \ref add_block and \ref add_entry (not thread-safe).
 * - Finalize: call \ref finalize to build lookup indices; treat as read-only.
 */
class MetaStore final {
public:
    MetaStore() = default;

    /// Adds a new block and returns its id.
    BlockId add_block(const BlockInfo& info);
    /// Appends an entry and returns its id.
    EntryId add_entry(const Entry& entry);

    ByteArena& arena() noexcept;
    const ByteArena& arena() const noexcept;

    /// Builds lookup indices and marks the store as finalized.
    void finalize();

    uint32_t block_count() const noexcept;
    const BlockInfo& block_info(BlockId id) const noexcept;

    std::span<const Entry> entries() const noexcept;
    const Entry& entry(EntryId id) const noexcept;

    /// Returns all entries in \p block, ordered by \ref Origin::order_in_block.
    std::span<const EntryId> entries_in_block(BlockId block) const noexcept;
    /// Returns all entry ids matching \p key, in insertion order.
    std::span<const EntryId> find_all(const MetaKeyView& key) const noexcept;
    /// Returns the text of the first entry matching \p key, or an empty view.
    std::string_view find_text(const MetaKeyView& key) const noexcept;
    /// Counts live entries whose schema namespace equals \p schema_ns.
    uint32_t count_in_namespace(std::string_view schema_ns) const noexcept;

private:
    void rebuild_block_index();
    void rebuild_key_index();
    void clear_indices() noexcept;

    ByteArena arena_;
    std::vector<Entry> entries_;
    std::vector<BlockInfo> blocks_;

    std::vector<EntryId> entries_by_block_;
    std::vector<BlockSpan> block_spans_;

    std::vector<EntryId> entries_by_key_;
    std::vector<KeySpan> key_spans_;

    bool finalized_ = false;
};

}  // namespace motionmux
