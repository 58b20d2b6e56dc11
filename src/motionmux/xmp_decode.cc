#include "motionmux/xmp_decode.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <string>
#include <string_view>
#include <vector>

#include <expat.h>

namespace motionmux {
namespace {

    static constexpr std::string_view kRdfNs
        = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    static constexpr std::string_view kXmlNs
        = "http://www.w3.org/XML/1998/namespace";

    // Expat is created with '|' as the namespace separator, so names arrive
    // as "uri|local".
    static constexpr char kNsSep = '|';

    /// Role an element plays in the RDF tree.
    enum class Role : uint8_t {
        Rdf,          // rdf:RDF and other rdf:* syntax elements
        Description,  // rdf:Description
        Container,    // rdf:Seq / rdf:Bag / rdf:Alt
        Item,         // rdf:li
        Property,     // any non-rdf element
        Ignored,      // xml:* elements
    };

    struct QName final {
        std::string_view uri;
        std::string_view local;
    };

    static QName qname(const XML_Char* raw) noexcept
    {
        const std::string_view name(raw, std::strlen(raw));
        const size_t sep = name.find(kNsSep);
        if (sep == std::string_view::npos) {
            return QName { {}, name };
        }
        return QName { name.substr(0, sep), name.substr(sep + 1) };
    }


    static Role classify(const QName& q) noexcept
    {
        if (q.uri == kXmlNs) {
            return Role::Ignored;
        }
        if (q.uri != kRdfNs) {
            return Role::Property;
        }
        if (q.local == "Description") {
            return Role::Description;
        }
        if (q.local == "Seq" || q.local == "Bag" || q.local == "Alt") {
            return Role::Container;
        }
        if (q.local == "li") {
            return Role::Item;
        }
        return Role::Rdf;
    }


    static std::string_view trim(std::string_view s) noexcept
    {
        const char* ws = " \t\r\n";
        const size_t b = s.find_first_not_of(ws);
        if (b == std::string_view::npos) {
            return {};
        }
        const size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }


    // Higher rank wins when two statuses are merged.
    static int rank(XmpDecodeStatus s) noexcept
    {
        switch (s) {
        case XmpDecodeStatus::Ok: return 0;
        case XmpDecodeStatus::Unsupported: return 1;
        case XmpDecodeStatus::OutputTruncated: return 2;
        case XmpDecodeStatus::Malformed: return 3;
        case XmpDecodeStatus::LimitExceeded: return 4;
        }
        return 0;
    }


    struct Frame final {
        Role role                = Role::Rdf;
        bool pushed_path         = false;
        bool has_children        = false;
        bool value_from_resource = false;
        uint32_t path_mark       = 0;
        uint32_t next_item       = 0;
        std::string text;
    };

    struct Ctx final {
        MetaStore* store = nullptr;
        BlockId block    = kInvalidBlockId;
        EntryFlags flags = EntryFlags::None;
        XmpDecodeOptions options;
        XmpDecodeResult result;
        XML_Parser parser = nullptr;

        uint32_t in_description = 0;
        uint32_t next_order     = 0;
        uint64_t value_bytes    = 0;

        std::string path;
        std::string path_ns;
        std::vector<Frame> frames;

        void merge(XmpDecodeStatus s) noexcept
        {
            if (rank(s) > rank(result.status)) {
                result.status = s;
            }
        }

        void fail(XmpDecodeStatus s) noexcept
        {
            merge(s);
            XML_StopParser(parser, XML_FALSE);
        }

        bool halted() const noexcept
        {
            return result.status == XmpDecodeStatus::LimitExceeded
                   || result.status == XmpDecodeStatus::Malformed;
        }

        bool charge_value_bytes(uint64_t n) noexcept
        {
            const uint64_t cap = options.limits.max_total_value_bytes;
            if (cap != 0U && (n > cap || value_bytes > cap - n)) {
                fail(XmpDecodeStatus::LimitExceeded);
                return false;
            }
            return true;
        }
    };


    static bool push_path(Ctx* ctx, std::string_view piece, bool slash)
    {
        const bool sep     = slash && !ctx->path.empty();
        const size_t want  = ctx->path.size() + piece.size() + (sep ? 1U : 0U);
        const uint32_t cap = ctx->options.limits.max_path_bytes;
        if (cap != 0U && want > cap) {
            ctx->fail(XmpDecodeStatus::LimitExceeded);
            return false;
        }
        if (sep) {
            ctx->path.push_back('/');
        }
        ctx->path.append(piece);
        return true;
    }


    static Frame* innermost_container(Ctx* ctx) noexcept
    {
        for (auto it = ctx->frames.rbegin(); it != ctx->frames.rend(); ++it) {
            if (it->role == Role::Container) {
                return &*it;
            }
        }
        return nullptr;
    }


    static void emit(Ctx* ctx, std::string_view ns, std::string_view path,
                     std::string_view value, EntryFlags extra)
    {
        if (ns.empty() || path.empty()) {
            return;
        }
        if (ctx->result.entries_decoded >= ctx->options.limits.max_properties) {
            ctx->fail(XmpDecodeStatus::LimitExceeded);
            return;
        }
        if (!ctx->charge_value_bytes(value.size())) {
            return;
        }

        ByteArena& arena = ctx->store->arena();
        Entry e;
        e.key                   = make_xmp_property_key(arena, ns, path);
        e.value                 = make_text(arena, value, TextEncoding::Utf8);
        e.origin.block          = ctx->block;
        e.origin.order_in_block = ctx->next_order++;
        e.flags                 = ctx->flags | extra;
        (void)ctx->store->add_entry(e);

        ctx->result.entries_decoded += 1;
        ctx->value_bytes += value.size();
    }


    static void emit_description_attributes(Ctx* ctx, const XML_Char** atts)
    {
        for (int i = 0; atts[i] && atts[i + 1]; i += 2) {
            const QName an = qname(atts[i]);
            if (an.uri.empty() || an.local.empty() || an.uri == kRdfNs
                || an.uri == kXmlNs) {
                continue;
            }
            emit(ctx, an.uri, an.local,
                 trim(std::string_view(atts[i + 1], std::strlen(atts[i + 1]))),
                 EntryFlags::Attribute);
            if (ctx->halted()) {
                return;
            }
        }
    }


    static const XML_Char* rdf_resource(const XML_Char** atts) noexcept
    {
        for (int i = 0; atts && atts[i] && atts[i + 1]; i += 2) {
            const QName an = qname(atts[i]);
            if (an.uri == kRdfNs && an.local == "resource") {
                return atts[i + 1];
            }
        }
        return nullptr;
    }


    static void XMLCALL on_start(void* user, const XML_Char* name,
                                 const XML_Char** atts)
    {
        Ctx* ctx = static_cast<Ctx*>(user);
        if (ctx->halted()) {
            return;
        }
        if (ctx->frames.size() >= ctx->options.limits.max_depth) {
            ctx->fail(XmpDecodeStatus::LimitExceeded);
            return;
        }
        if (!ctx->frames.empty()) {
            ctx->frames.back().has_children = true;
        }

        const QName q = qname(name);
        Frame f;
        f.role      = classify(q);
        f.path_mark = static_cast<uint32_t>(ctx->path.size());

        if (f.role == Role::Description) {
            ctx->in_description += 1;
        }

        if (ctx->in_description > 0 && f.role == Role::Property) {
            if (ctx->path.empty()) {
                ctx->path_ns.assign(q.uri);
            }
            if (!push_path(ctx, q.local, true)) {
                return;
            }
            f.pushed_path = true;
            if (const XML_Char* res = rdf_resource(atts)) {
                emit(ctx, ctx->path_ns, ctx->path,
                     trim(std::string_view(res, std::strlen(res))),
                     EntryFlags::None);
                f.value_from_resource = true;
            }
        } else if (ctx->in_description > 0 && f.role == Role::Item
                   && !ctx->path.empty()) {
            if (Frame* c = innermost_container(ctx)) {
                c->next_item += 1;
                const std::string index = "[" + std::to_string(c->next_item)
                                          + "]";
                if (!push_path(ctx, index, false)) {
                    return;
                }
                f.pushed_path = true;
            }
        }

        const bool is_description = f.role == Role::Description;
        ctx->frames.push_back(std::move(f));

        if (is_description && atts
            && ctx->options.decode_description_attributes) {
            emit_description_attributes(ctx, atts);
        }
    }


    static void XMLCALL on_end(void* user, const XML_Char* /*name*/)
    {
        Ctx* ctx = static_cast<Ctx*>(user);
        if (ctx->halted()) {
            return;
        }
        if (ctx->frames.empty()) {
            ctx->fail(XmpDecodeStatus::Malformed);
            return;
        }

        Frame f = std::move(ctx->frames.back());
        ctx->frames.pop_back();

        const bool leaf = !f.has_children && !f.value_from_resource;
        const bool holds_value = f.role == Role::Property
                                 || f.role == Role::Item;
        if (ctx->in_description > 0 && leaf && holds_value
            && !ctx->path.empty()) {
            const std::string_view v = trim(f.text);
            if (!v.empty()) {
                emit(ctx, ctx->path_ns, ctx->path, v, EntryFlags::None);
            }
        }

        if (f.pushed_path) {
            ctx->path.resize(f.path_mark);
            if (ctx->path.empty()) {
                ctx->path_ns.clear();
            }
        }
        if (f.role == Role::Description) {
            ctx->in_description -= 1;
        }
    }


    static void XMLCALL on_text(void* user, const XML_Char* s, int len)
    {
        Ctx* ctx = static_cast<Ctx*>(user);
        if (ctx->halted() || len <= 0 || ctx->frames.empty()
            || ctx->in_description == 0 || ctx->path.empty()) {
            return;
        }
        Frame& f = ctx->frames.back();
        if ((f.role != Role::Property && f.role != Role::Item)
            || f.value_from_resource) {
            return;
        }

        size_t take        = static_cast<size_t>(len);
        const uint32_t cap = ctx->options.limits.max_value_bytes;
        if (cap != 0U) {
            const size_t room = f.text.size() < cap ? cap - f.text.size() : 0U;
            if (take > room) {
                take = room;
                ctx->merge(XmpDecodeStatus::OutputTruncated);
            }
        }
        if (take != 0U) {
            f.text.append(s, take);
        }
    }

}  // namespace

XmpDecodeResult
decode_xmp_packet(std::span<const std::byte> xmp_bytes, MetaStore& store,
                  const BlockInfo& block, EntryFlags flags,
                  const XmpDecodeOptions& options) noexcept
{
    XmpDecodeResult result;

    std::string_view text(reinterpret_cast<const char*>(xmp_bytes.data()),
                          xmp_bytes.size());
    // Some writers pad the APP1 payload with NULs after the packet.
    while (!text.empty() && text.back() == '\0') {
        text.remove_suffix(1);
    }
    if (text.find('<') == std::string_view::npos) {
        result.status = XmpDecodeStatus::Unsupported;
        return result;
    }
    const uint64_t max_in = options.limits.max_input_bytes;
    if ((max_in != 0U && xmp_bytes.size() > max_in)
        || xmp_bytes.size() > static_cast<size_t>(INT32_MAX)) {
        result.status = XmpDecodeStatus::LimitExceeded;
        return result;
    }

    XML_Parser parser = XML_ParserCreateNS(nullptr, kNsSep);
    if (!parser) {
        result.status = XmpDecodeStatus::Malformed;
        return result;
    }

    try {
        Ctx ctx;
        ctx.store   = &store;
        ctx.block   = store.add_block(block);
        ctx.flags   = flags;
        ctx.options = options;
        ctx.parser  = parser;

        XML_SetUserData(parser, &ctx);
        XML_SetElementHandler(parser, &on_start, &on_end);
        XML_SetCharacterDataHandler(parser, &on_text);

        if (XML_Parse(parser, text.data(), static_cast<int>(text.size()),
                      XML_TRUE)
            == XML_STATUS_ERROR) {
            const XML_Error err = XML_GetErrorCode(parser);
            if (err == XML_ERROR_ABORTED) {
                // Stopped by a handler; ctx already holds the reason.
            } else if (err == XML_ERROR_SYNTAX
                       || err == XML_ERROR_NO_ELEMENTS) {
                ctx.merge(XmpDecodeStatus::Unsupported);
            } else {
                ctx.merge(XmpDecodeStatus::Malformed);
            }
        }
        result       = ctx.result;
        result.block = ctx.block;
    } catch (const std::bad_alloc&) {
        result.status = XmpDecodeStatus::LimitExceeded;
    }

    XML_ParserFree(parser);
    return result;
}


const char*
xmp_decode_status_name(XmpDecodeStatus status) noexcept
{
    switch (status) {
    case XmpDecodeStatus::Ok: return "ok";
    case XmpDecodeStatus::OutputTruncated: return "output_truncated";
    case XmpDecodeStatus::Unsupported: return "unsupported";
    case XmpDecodeStatus::Malformed: return "malformed";
    case XmpDecodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace motionmux
