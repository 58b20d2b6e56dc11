#include "motionmux/meta_value.h"

#include <cstdint>

namespace motionmux {

MetaValue
make_text(ByteArena& arena, std::string_view text, TextEncoding encoding)
{
    MetaValue v;
    v.kind          = MetaValueKind::Text;
    v.text_encoding = encoding;
    v.count         = static_cast<uint32_t>(text.size());
    v.span          = arena.append_string(text);
    return v;
}


std::string_view
value_text(const ByteArena& arena, const MetaValue& value) noexcept
{
    if (value.kind != MetaValueKind::Text) {
        return std::string_view();
    }
    return arena.text(value.span);
}


bool
text_to_u64(std::string_view text, uint64_t* out) noexcept
{
    if (!out) {
        return false;
    }

    size_t b = 0;
    size_t e = text.size();
    while (b < e
           && (text[b] == ' ' || text[b] == '\t' || text[b] == '\r'
               || text[b] == '\n')) {
        b += 1;
    }
    while (e > b
           && (text[e - 1] == ' ' || text[e - 1] == '\t'
               || text[e - 1] == '\r' || text[e - 1] == '\n')) {
        e -= 1;
    }
    if (b < e && text[b] == '+') {
        b += 1;
    }
    if (b == e) {
        return false;
    }

    uint64_t v = 0;
    for (size_t i = b; i < e; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - digit) / 10U) {
            return false;
        }
        v = v * 10U + digit;
    }
    *out = v;
    return true;
}

}  // namespace motionmux
