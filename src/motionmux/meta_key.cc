#include "motionmux/meta_key.h"

#include <algorithm>
#include <cstring>

namespace motionmux {

static int
compare_bytes(std::string_view a, std::string_view b) noexcept
{
    const size_t min_size = std::min(a.size(), b.size());
    if (min_size > 0U) {
        const int cmp = std::memcmp(a.data(), b.data(), min_size);
        if (cmp != 0) {
            return cmp;
        }
    }
    if (a.size() < b.size()) {
        return -1;
    }
    if (a.size() > b.size()) {
        return 1;
    }
    return 0;
}

MetaKey
make_xmp_property_key(ByteArena& arena, std::string_view schema_ns,
                      std::string_view property_path)
{
    MetaKey key;
    key.schema_ns     = arena.append_string(schema_ns);
    key.property_path = arena.append_string(property_path);
    return key;
}


int
compare_key(const ByteArena& arena, const MetaKey& a,
            const MetaKey& b) noexcept
{
    const int ns_cmp = compare_bytes(arena.text(a.schema_ns),
                                     arena.text(b.schema_ns));
    if (ns_cmp != 0) {
        return ns_cmp;
    }
    return compare_bytes(arena.text(a.property_path),
                         arena.text(b.property_path));
}


int
compare_key_view(const ByteArena& arena, const MetaKeyView& a,
                 const MetaKey& b) noexcept
{
    const int ns_cmp = compare_bytes(a.schema_ns, arena.text(b.schema_ns));
    if (ns_cmp != 0) {
        return ns_cmp;
    }
    return compare_bytes(a.property_path, arena.text(b.property_path));
}

}  // namespace motionmux
