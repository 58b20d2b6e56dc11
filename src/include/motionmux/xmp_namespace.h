#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file xmp_namespace.h
 * \brief Prefix/URI registry for XMP schema namespaces.
 */

namespace motionmux {

/// Google Camera schema used by motion photos.
inline constexpr std::string_view kGCameraNamespaceUri
    = "http://ns.google.com/photos/1.0/camera/";
inline constexpr std::string_view kGCameraPrefix = "GCamera";

/// Result of \ref XmpNamespaceRegistry::register_namespace.
enum class NamespaceRegisterStatus : uint8_t {
    Ok,
    /// The URI was already registered; the existing binding is kept.
    AlreadyRegistered,
    /// The prefix is already bound to a different URI.
    Conflict,
    /// Empty URI or a prefix that is not an XML NCName.
    Invalid,
};

/**
 * \brief Maps XMP schema namespace URIs to serialization prefixes.
 *
 * A fresh registry knows the core namespaces (`x`, `rdf`, `xml`, `xmp`,
 * `dc`, `tiff`, `exif`). Registration is idempotent: registering a URI a
 * second time reports \ref NamespaceRegisterStatus::AlreadyRegistered and
 * leaves the first binding in place.
 *
 * \note Not thread-safe. One registry is normally shared by a whole run.
 */
class XmpNamespaceRegistry final {
public:
    XmpNamespaceRegistry();

    NamespaceRegisterStatus register_namespace(std::string_view uri,
                                               std::string_view prefix);

    /// Returns the prefix bound to \p uri, or an empty view.
    std::string_view prefix_for(std::string_view uri) const noexcept;
    /// Returns the URI bound to \p prefix, or an empty view.
    std::string_view uri_for(std::string_view prefix) const noexcept;

    bool contains(std::string_view uri) const noexcept;
    size_t size() const noexcept;

private:
    struct Binding final {
        std::string prefix;
        std::string uri;
    };

    std::vector<Binding> bindings_;
};

/// Returns true if \p prefix is usable as an XML namespace prefix.
bool
is_valid_xmp_prefix(std::string_view prefix) noexcept;

const char*
namespace_register_status_name(NamespaceRegisterStatus status) noexcept;

}  // namespace motionmux
