#include "motionmux/meta_store.h"

#include <algorithm>

namespace motionmux {

ByteArena&
MetaStore::arena() noexcept
{
    return arena_;
}


const ByteArena&
MetaStore::arena() const noexcept
{
    return arena_;
}


BlockId
MetaStore::add_block(const BlockInfo& info)
{
    if (finalized_) {
        return kInvalidBlockId;
    }
    const BlockId id = static_cast<BlockId>(blocks_.size());
    blocks_.push_back(info);
    return id;
}


EntryId
MetaStore::add_entry(const Entry& entry)
{
    if (finalized_) {
        return kInvalidEntryId;
    }
    const EntryId id = static_cast<EntryId>(entries_.size());
    entries_.push_back(entry);
    return id;
}


void
MetaStore::clear_indices() noexcept
{
    entries_by_block_.clear();
    block_spans_.clear();
    entries_by_key_.clear();
    key_spans_.clear();
}


void
MetaStore::finalize()
{
    clear_indices();
    rebuild_block_index();
    rebuild_key_index();
    finalized_ = true;
}


uint32_t
MetaStore::block_count() const noexcept
{
    return static_cast<uint32_t>(blocks_.size());
}


const BlockInfo&
MetaStore::block_info(BlockId id) const noexcept
{
    return blocks_[id];
}


std::span<const Entry>
MetaStore::entries() const noexcept
{
    return std::span<const Entry>(entries_.data(), entries_.size());
}


const Entry&
MetaStore::entry(EntryId id) const noexcept
{
    return entries_[id];
}


std::span<const EntryId>
MetaStore::entries_in_block(BlockId block) const noexcept
{
    if (block >= block_spans_.size()) {
        return std::span<const EntryId>();
    }
    const BlockSpan span = block_spans_[block];
    return std::span<const EntryId>(entries_by_block_.data() + span.start,
                                    span.count);
}


std::span<const EntryId>
MetaStore::find_all(const MetaKeyView& key) const noexcept
{
    if (!finalized_ || key_spans_.empty()) {
        return std::span<const EntryId>();
    }

    size_t lo = 0;
    size_t hi = key_spans_.size();
    while (lo < hi) {
        const size_t mid   = lo + ((hi - lo) / 2U);
        const KeySpan span = key_spans_[mid];
        const int cmp = compare_key_view(arena_, key, entries_[span.repr].key);
        if (cmp == 0) {
            return std::span<const EntryId>(entries_by_key_.data() + span.start,
                                            span.count);
        }
        if (cmp < 0) {
            hi = mid;
        } else {
            lo = mid + 1U;
        }
    }

    return std::span<const EntryId>();
}


std::string_view
MetaStore::find_text(const MetaKeyView& key) const noexcept
{
    const std::span<const EntryId> ids = find_all(key);
    if (ids.empty()) {
        return std::string_view();
    }
    return value_text(arena_, entries_[ids[0]].value);
}


uint32_t
MetaStore::count_in_namespace(std::string_view schema_ns) const noexcept
{
    uint32_t count = 0;
    for (const Entry& e : entries_) {
        if (arena_.text(e.key.schema_ns) == schema_ns) {
            count += 1U;
        }
    }
    return count;
}


void
MetaStore::rebuild_block_index()
{
    const BlockId block_count = static_cast<BlockId>(blocks_.size());
    block_spans_.assign(block_count, BlockSpan { 0, 0 });

    entries_by_block_.reserve(entries_.size());
    for (EntryId id = 0; id < static_cast<EntryId>(entries_.size()); ++id) {
        entries_by_block_.push_back(id);
    }

    std::stable_sort(entries_by_block_.begin(), entries_by_block_.end(),
                     [this](EntryId a, EntryId b) {
                         const Origin& oa = entries_[a].origin;
                         const Origin& ob = entries_[b].origin;
                         if (oa.block != ob.block) {
                             return oa.block < ob.block;
                         }
                         return oa.order_in_block < ob.order_in_block;
                     });

    uint32_t next_start = static_cast<uint32_t>(entries_by_block_.size());
    for (uint32_t i = 0; i < static_cast<uint32_t>(entries_by_block_.size());
         ++i) {
        const BlockId block = entries_[entries_by_block_[i]].origin.block;
        if (block >= block_count) {
            continue;
        }
        BlockSpan& span = block_spans_[block];
        if (span.count == 0) {
            span.start = i;
        }
        ++span.count;
    }

    // Empty blocks point at the start of the next populated block.
    for (size_t b = block_spans_.size(); b-- > 0;) {
        BlockSpan& span = block_spans_[b];
        if (span.count == 0) {
            span.start = next_start;
            continue;
        }
        next_start = span.start;
    }
}


void
MetaStore::rebuild_key_index()
{
    entries_by_key_.reserve(entries_.size());
    for (EntryId id = 0; id < static_cast<EntryId>(entries_.size()); ++id) {
        entries_by_key_.push_back(id);
    }

    std::stable_sort(entries_by_key_.begin(), entries_by_key_.end(),
                     [this](EntryId a, EntryId b) {
                         return compare_key(arena_, entries_[a].key,
                                            entries_[b].key)
                                < 0;
                     });

    key_spans_.clear();
    if (entries_by_key_.empty()) {
        return;
    }

    uint32_t run_start = 0;
    EntryId run_repr   = entries_by_key_[0];
    for (uint32_t i = 1; i < static_cast<uint32_t>(entries_by_key_.size());
         ++i) {
        const EntryId current = entries_by_key_[i];
        if (compare_key(arena_, entries_[run_repr].key, entries_[current].key)
            != 0) {
            key_spans_.push_back(
                KeySpan { run_start, i - run_start, run_repr });
            run_start = i;
            run_repr  = current;
        }
    }
    const uint32_t end = static_cast<uint32_t>(entries_by_key_.size());
    key_spans_.push_back(KeySpan { run_start, end - run_start, run_repr });
}

}  // namespace motionmux
