#include "motionmux/xmp_namespace.h"

namespace motionmux {
namespace {

    struct CoreNamespace final {
        std::string_view prefix;
        std::string_view uri;
    };

    static constexpr CoreNamespace kCoreNamespaces[] = {
        { "x", "adobe:ns:meta/" },
        { "rdf", "http://www.w3.org/1999/02/22-rdf-syntax-ns#" },
        { "xml", "http://www.w3.org/XML/1998/namespace" },
        { "xmp", "http://ns.adobe.com/xap/1.0/" },
        { "dc", "http://purl.org/dc/elements/1.1/" },
        { "tiff", "http://ns.adobe.com/tiff/1.0/" },
        { "exif", "http://ns.adobe.com/exif/1.0/" },
    };

    static bool is_name_start(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
    }


    static bool is_name_char(char c) noexcept
    {
        return is_name_start(c) || (c >= '0' && c <= '9') || c == '-'
               || c == '.';
    }

}  // namespace

XmpNamespaceRegistry::XmpNamespaceRegistry()
{
    bindings_.reserve(sizeof(kCoreNamespaces) / sizeof(kCoreNamespaces[0])
                      + 4);
    for (const CoreNamespace& ns : kCoreNamespaces) {
        bindings_.push_back(Binding { std::string(ns.prefix),
                                      std::string(ns.uri) });
    }
}


NamespaceRegisterStatus
XmpNamespaceRegistry::register_namespace(std::string_view uri,
                                         std::string_view prefix)
{
    if (uri.empty() || !is_valid_xmp_prefix(prefix)) {
        return NamespaceRegisterStatus::Invalid;
    }
    if (contains(uri)) {
        return NamespaceRegisterStatus::AlreadyRegistered;
    }
    if (!uri_for(prefix).empty()) {
        return NamespaceRegisterStatus::Conflict;
    }
    bindings_.push_back(Binding { std::string(prefix), std::string(uri) });
    return NamespaceRegisterStatus::Ok;
}


std::string_view
XmpNamespaceRegistry::prefix_for(std::string_view uri) const noexcept
{
    for (const Binding& b : bindings_) {
        if (b.uri == uri) {
            return b.prefix;
        }
    }
    return {};
}


std::string_view
XmpNamespaceRegistry::uri_for(std::string_view prefix) const noexcept
{
    for (const Binding& b : bindings_) {
        if (b.prefix == prefix) {
            return b.uri;
        }
    }
    return {};
}


bool
XmpNamespaceRegistry::contains(std::string_view uri) const noexcept
{
    return !prefix_for(uri).empty();
}


size_t
XmpNamespaceRegistry::size() const noexcept
{
    return bindings_.size();
}


bool
is_valid_xmp_prefix(std::string_view prefix) noexcept
{
    if (prefix.empty() || !is_name_start(prefix.front())) {
        return false;
    }
    for (char c : prefix) {
        if (!is_name_char(c)) {
            return false;
        }
    }
    // "xml..." prefixes are reserved by XML Namespaces 1.0.
    if (prefix.size() >= 3) {
        const char a = static_cast<char>(prefix[0] | 0x20);
        const char b = static_cast<char>(prefix[1] | 0x20);
        const char c = static_cast<char>(prefix[2] | 0x20);
        if (a == 'x' && b == 'm' && c == 'l') {
            return false;
        }
    }
    return true;
}


const char*
namespace_register_status_name(NamespaceRegisterStatus status) noexcept
{
    switch (status) {
    case NamespaceRegisterStatus::Ok: return "ok";
    case NamespaceRegisterStatus::AlreadyRegistered:
        return "already_registered";
    case NamespaceRegisterStatus::Conflict: return "conflict";
    case NamespaceRegisterStatus::Invalid: return "invalid";
    }
    return "unknown";
}

}  // namespace motionmux
