#include "motionmux/xmp_packet.h"

#include <cstring>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include <expat.h>

namespace motionmux {
namespace {

    static constexpr std::string_view kNsX   = "adobe:ns:meta/";
    static constexpr std::string_view kNsRdf
        = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";

    // Names arrive from expat as "uri|local|prefix" (triplet mode).
    static constexpr char kNsSep = '|';

    static constexpr uint32_t kPaddingLine = 100U;

    struct TripletName final {
        std::string_view uri;
        std::string_view local;
        std::string_view prefix;
    };

    static TripletName split_triplet(const XML_Char* raw) noexcept
    {
        std::string_view s(raw, std::strlen(raw));
        TripletName n;
        const size_t a = s.find(kNsSep);
        if (a == std::string_view::npos) {
            n.local = s;
            return n;
        }
        n.uri                = s.substr(0, a);
        std::string_view rem = s.substr(a + 1);
        const size_t b       = rem.find(kNsSep);
        if (b == std::string_view::npos) {
            n.local = rem;
        } else {
            n.local  = rem.substr(0, b);
            n.prefix = rem.substr(b + 1);
        }
        return n;
    }


    static void append_qname(std::string* out, const TripletName& n)
    {
        if (!n.prefix.empty()) {
            out->append(n.prefix);
            out->push_back(':');
        }
        out->append(n.local);
    }


    static void append_escaped(std::string* out, std::string_view s,
                               bool in_attribute)
    {
        for (char c : s) {
            switch (c) {
            case '&': out->append("&amp;"); break;
            case '<': out->append("&lt;"); break;
            case '>': out->append("&gt;"); break;
            case '\r': out->append("&#xD;"); break;
            case '"':
                if (in_attribute) {
                    out->append("&quot;");
                } else {
                    out->push_back(c);
                }
                break;
            case '\t':
            case '\n':
                // Attribute value normalization would turn these into spaces.
                if (in_attribute) {
                    out->append(c == '\t' ? "&#x9;" : "&#xA;");
                } else {
                    out->push_back(c);
                }
                break;
            default: out->push_back(c); break;
            }
        }
    }


    static void append_attribute(std::string* out, std::string_view name,
                                 std::string_view value)
    {
        out->push_back(' ');
        out->append(name);
        out->append("=\"");
        append_escaped(out, value, true);
        out->push_back('"');
    }


    static void trim_trailing_ws(std::string* out)
    {
        const size_t keep = out->find_last_not_of(" \t\r\n");
        out->resize(keep == std::string::npos ? 0U : keep + 1U);
    }


    /// Appends the self-closing `rdf:Description` that carries \p props.
    static void append_description(std::string* out, std::string_view rdf,
                                   bool declare_rdf,
                                   const XmpPropertySet& props)
    {
        std::string name(rdf);
        out->append("\n  <");
        out->append(name);
        out->append(":Description");
        append_attribute(out, name + ":about", "");
        if (declare_rdf) {
            append_attribute(out, "xmlns:" + name, kNsRdf);
        }
        append_attribute(out, "xmlns:" + std::string(props.prefix),
                         props.ns_uri);
        for (const XmpProperty& p : props.properties) {
            name.assign(props.prefix);
            name.push_back(':');
            name.append(p.name);
            out->append("\n   ");
            append_attribute(out, name, p.value);
        }
        out->append("/>");
    }


    static void append_padding(std::string* out, uint32_t padding)
    {
        while (padding > 0U) {
            const uint32_t line = padding < kPaddingLine ? padding
                                                         : kPaddingLine;
            out->append(line - 1U, ' ');
            out->push_back('\n');
            padding -= line;
        }
    }


    static void wrap_packet(std::string* out, std::string_view body,
                            uint32_t padding)
    {
        out->clear();
        out->reserve(body.size() + padding + 128U);
        out->append("<?xpacket begin=\"\xEF\xBB\xBF\" id=\"");
        out->append(kXpacketId);
        out->append("\"?>\n");
        out->append(body);
        if (!body.empty() && body.back() != '\n') {
            out->push_back('\n');
        }
        append_padding(out, padding);
        out->append("<?xpacket end=\"w\"?>");
    }


    static XmpPacketResult copy_out(std::string_view packet,
                                    std::span<std::byte> out) noexcept
    {
        XmpPacketResult r;
        r.needed           = packet.size();
        const size_t take  = packet.size() < out.size() ? packet.size()
                                                        : out.size();
        if (take != 0U) {
            std::memcpy(out.data(), packet.data(), take);
        }
        r.written = take;
        if (take < packet.size()) {
            r.status = XmpPacketStatus::OutputTruncated;
        }
        return r;
    }


    struct Element final {
        size_t mark         = 0;
        bool is_description = false;
        bool lost_content   = false;
        bool keeps_content  = false;
        /// Span of an `xmlns` declaration for the target schema, if any.
        size_t decl_pos = std::string::npos;
        size_t decl_len = 0;
        /// A retained name in the target schema needs that declaration.
        bool decl_used = false;
    };

    struct Rewriter final {
        const XmpPropertySet* props     = nullptr;
        const XmpPacketOptions* options = nullptr;
        XML_Parser parser               = nullptr;

        std::string body;
        std::vector<Element> stack;
        std::vector<std::pair<std::string, std::string>> pending_decls;

        XmpPacketStatus status = XmpPacketStatus::Ok;
        uint32_t removed       = 0;
        uint32_t skip_depth    = 0;
        bool open_tag          = false;
        bool inserted          = false;

        void fail(XmpPacketStatus s) noexcept
        {
            if (status == XmpPacketStatus::Ok) {
                status = s;
            }
            XML_StopParser(parser, XML_FALSE);
        }

        void close_open_tag()
        {
            if (open_tag) {
                body.push_back('>');
                open_tag = false;
            }
        }

        void mark_parent_kept() noexcept
        {
            if (!stack.empty()) {
                stack.back().keeps_content = true;
            }
        }

        void mark_parent_lost() noexcept
        {
            if (!stack.empty()) {
                stack.back().lost_content = true;
            }
        }

        bool replaces(const TripletName& n) const noexcept
        {
            if (n.uri != props->ns_uri) {
                return false;
            }
            for (const XmpProperty& p : props->properties) {
                if (p.name == n.local) {
                    return true;
                }
            }
            return false;
        }

        // Marks the nearest declaration of the target schema as in use.
        void use_declaration(Element* current) noexcept
        {
            if (current && current->decl_pos != std::string::npos) {
                current->decl_used = true;
                return;
            }
            for (size_t i = stack.size(); i > 0; --i) {
                if (stack[i - 1].decl_pos != std::string::npos) {
                    stack[i - 1].decl_used = true;
                    return;
                }
            }
        }
    };


    static void XMLCALL on_ns_start(void* user, const XML_Char* prefix,
                                    const XML_Char* uri)
    {
        Rewriter* rw = static_cast<Rewriter*>(user);
        rw->pending_decls.emplace_back(prefix ? prefix : "", uri ? uri : "");
    }


    static void XMLCALL on_start(void* user, const XML_Char* name,
                                 const XML_Char** atts)
    {
        Rewriter* rw = static_cast<Rewriter*>(user);
        std::vector<std::pair<std::string, std::string>> decls;
        decls.swap(rw->pending_decls);
        if (rw->status != XmpPacketStatus::Ok) {
            return;
        }
        if (rw->skip_depth > 0) {
            rw->skip_depth += 1;
            return;
        }
        if (rw->stack.size() >= rw->options->max_depth) {
            rw->fail(XmpPacketStatus::LimitExceeded);
            return;
        }

        const TripletName n = split_triplet(name);
        if (rw->replaces(n)) {
            rw->skip_depth = 1;
            rw->removed += 1;
            rw->mark_parent_lost();
            return;
        }

        rw->close_open_tag();
        rw->mark_parent_kept();

        Element e;
        e.mark           = rw->body.size();
        e.is_description = n.uri == kNsRdf && n.local == "Description";

        rw->body.push_back('<');
        append_qname(&rw->body, n);
        for (const auto& d : decls) {
            std::string attr_name = "xmlns";
            if (!d.first.empty()) {
                attr_name.push_back(':');
                attr_name.append(d.first);
            }
            const size_t pos = rw->body.size();
            append_attribute(&rw->body, attr_name, d.second);
            if (d.second == rw->props->ns_uri
                && e.decl_pos == std::string::npos) {
                e.decl_pos     = pos;
                e.decl_len     = rw->body.size() - pos;
                e.lost_content = true;
            }
        }
        if (n.uri == rw->props->ns_uri) {
            rw->use_declaration(&e);
        }
        for (int i = 0; atts && atts[i] && atts[i + 1]; i += 2) {
            const TripletName an = split_triplet(atts[i]);
            if (!an.uri.empty() && rw->replaces(an)) {
                rw->removed += 1;
                e.lost_content = true;
                continue;
            }
            if (!an.uri.empty() && an.uri == rw->props->ns_uri) {
                rw->use_declaration(&e);
            }
            const bool is_about = an.local == "about"
                                  && (an.uri.empty() || an.uri == kNsRdf);
            if (!is_about) {
                e.keeps_content = true;
            }
            std::string attr_name;
            append_qname(&attr_name, an);
            append_attribute(&rw->body, attr_name,
                             std::string_view(atts[i + 1],
                                              std::strlen(atts[i + 1])));
        }
        rw->open_tag = true;
        rw->stack.push_back(e);
    }


    static void XMLCALL on_end(void* user, const XML_Char* name)
    {
        Rewriter* rw = static_cast<Rewriter*>(user);
        if (rw->status != XmpPacketStatus::Ok) {
            return;
        }
        if (rw->skip_depth > 0) {
            rw->skip_depth -= 1;
            return;
        }
        if (rw->stack.empty()) {
            rw->fail(XmpPacketStatus::Malformed);
            return;
        }

        const TripletName n = split_triplet(name);
        const Element e     = rw->stack.back();
        rw->stack.pop_back();

        // A Description that only ever held our schema is removed entirely.
        if (e.is_description && e.lost_content && !e.keeps_content) {
            rw->body.resize(e.mark);
            trim_trailing_ws(&rw->body);
            rw->open_tag = false;
            return;
        }
        // The declaration is dropped once nothing kept below refers to it.
        // Everything after it in body belongs to this element.
        if (e.decl_pos != std::string::npos && !e.decl_used) {
            rw->body.erase(e.decl_pos, e.decl_len);
        }

        const bool is_rdf_root = n.uri == kNsRdf && n.local == "RDF";
        if (is_rdf_root && !rw->inserted) {
            rw->close_open_tag();
            trim_trailing_ws(&rw->body);
            const std::string_view rdf = n.prefix.empty() ? "rdf" : n.prefix;
            append_description(&rw->body, rdf, n.prefix.empty(), *rw->props);
            rw->body.append("\n ");
            rw->inserted = true;
        }

        if (rw->open_tag) {
            rw->body.append("/>");
            rw->open_tag = false;
            return;
        }
        rw->body.append("</");
        append_qname(&rw->body, n);
        rw->body.push_back('>');
    }


    static void XMLCALL on_text(void* user, const XML_Char* s, int len)
    {
        Rewriter* rw = static_cast<Rewriter*>(user);
        if (rw->status != XmpPacketStatus::Ok || rw->skip_depth > 0
            || rw->stack.empty() || len <= 0) {
            return;
        }
        const std::string_view text(s, static_cast<size_t>(len));
        if (text.find_first_not_of(" \t\r\n") != std::string_view::npos) {
            rw->mark_parent_kept();
        }
        rw->close_open_tag();
        append_escaped(&rw->body, text, false);
    }


    static void XMLCALL on_comment(void* user, const XML_Char* data)
    {
        Rewriter* rw = static_cast<Rewriter*>(user);
        if (rw->status != XmpPacketStatus::Ok || rw->skip_depth > 0
            || rw->stack.empty()) {
            return;
        }
        rw->close_open_tag();
        rw->mark_parent_kept();
        rw->body.append("<!--");
        rw->body.append(data);
        rw->body.append("-->");
    }


    static void XMLCALL on_pi(void* user, const XML_Char* target,
                              const XML_Char* data)
    {
        Rewriter* rw = static_cast<Rewriter*>(user);
        if (rw->status != XmpPacketStatus::Ok || rw->skip_depth > 0
            || rw->stack.empty()) {
            return;
        }
        // The xpacket wrapper is regenerated around the whole packet.
        if (std::strcmp(target, "xpacket") == 0) {
            return;
        }
        rw->close_open_tag();
        rw->mark_parent_kept();
        rw->body.append("<?");
        rw->body.append(target);
        if (data && data[0] != '\0') {
            rw->body.push_back(' ');
            rw->body.append(data);
        }
        rw->body.append("?>");
    }

}  // namespace

XmpPacketResult
build_xmp_packet(const XmpPropertySet& props, std::span<std::byte> out,
                 const XmpPacketOptions& options) noexcept
{
    XmpPacketResult result;
    try {
        std::string body;
        body.append("<x:xmpmeta xmlns:x=\"");
        body.append(kNsX);
        body.append("\" x:xmptk=\"MotionMux\">\n");
        body.append(" <rdf:RDF xmlns:rdf=\"");
        body.append(kNsRdf);
        body.append("\">");
        append_description(&body, "rdf", false, props);
        body.append("\n </rdf:RDF>\n");
        body.append("</x:xmpmeta>\n");

        std::string packet;
        wrap_packet(&packet, body, options.padding_bytes);
        result = copy_out(packet, out);
    } catch (const std::bad_alloc&) {
        result.status = XmpPacketStatus::LimitExceeded;
    }
    return result;
}


XmpPacketResult
rewrite_xmp_packet(std::span<const std::byte> packet,
                   const XmpPropertySet& props, std::span<std::byte> out,
                   const XmpPacketOptions& options) noexcept
{
    XmpPacketResult result;
    if ((options.max_input_bytes != 0U
         && packet.size() > options.max_input_bytes)
        || packet.size() > static_cast<size_t>(INT32_MAX)) {
        result.status = XmpPacketStatus::LimitExceeded;
        return result;
    }

    XML_Parser parser = XML_ParserCreateNS(nullptr, kNsSep);
    if (!parser) {
        result.status = XmpPacketStatus::LimitExceeded;
        return result;
    }

    try {
        Rewriter rw;
        rw.props   = &props;
        rw.options = &options;
        rw.parser  = parser;
        rw.body.reserve(packet.size() + 512U);

        XML_SetReturnNSTriplet(parser, XML_TRUE);
        XML_SetUserData(parser, &rw);
        XML_SetNamespaceDeclHandler(parser, &on_ns_start, nullptr);
        XML_SetElementHandler(parser, &on_start, &on_end);
        XML_SetCharacterDataHandler(parser, &on_text);
        XML_SetCommentHandler(parser, &on_comment);
        XML_SetProcessingInstructionHandler(parser, &on_pi);

        std::string_view text(reinterpret_cast<const char*>(packet.data()),
                              packet.size());
        while (!text.empty() && text.back() == '\0') {
            text.remove_suffix(1);
        }
        const XML_Status st = XML_Parse(parser, text.data(),
                                        static_cast<int>(text.size()),
                                        XML_TRUE);
        if (st == XML_STATUS_ERROR && rw.status == XmpPacketStatus::Ok) {
            rw.status = XmpPacketStatus::Malformed;
        }
        if (rw.status == XmpPacketStatus::Ok && !rw.inserted) {
            rw.status = XmpPacketStatus::Malformed;
        }

        if (rw.status != XmpPacketStatus::Ok) {
            result.status             = rw.status;
            result.removed_properties = rw.removed;
        } else {
            std::string wrapped;
            wrap_packet(&wrapped, rw.body, options.padding_bytes);
            result                    = copy_out(wrapped, out);
            result.removed_properties = rw.removed;
        }
    } catch (const std::bad_alloc&) {
        result.status = XmpPacketStatus::LimitExceeded;
    }

    XML_ParserFree(parser);
    return result;
}


const char*
xmp_packet_status_name(XmpPacketStatus status) noexcept
{
    switch (status) {
    case XmpPacketStatus::Ok: return "ok";
    case XmpPacketStatus::OutputTruncated: return "output_truncated";
    case XmpPacketStatus::Malformed: return "malformed";
    case XmpPacketStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace motionmux
