#pragma once
#include <string>
#include <optional>

namespace LinkScope {
namespace UrlUtil {

// RFC 3986 URI reference, split into its five components.
// Components are kept exactly as written (no percent-decoding), except the scheme,
// which is lowercased.
struct Url {
    std::string scheme;
    bool has_authority = false;
    std::string authority;
    std::string path;
    bool has_query = false;
    std::string query;
    bool has_fragment = false;
    std::string fragment;

    bool IsAbsolute() const { return !scheme.empty(); }

    // Host part of the authority, lowercased, without userinfo, port or IPv6 brackets.
    std::string Hostname() const;

    // Explicit port of the authority, empty when none is given.
    std::string Port() const;

    // Recompose per RFC 3986 5.3. Path, query and fragment bytes outside their
    // allowed character sets are percent-encoded; existing escapes are kept.
    // An empty fragment is dropped.
    std::string ToString() const;
};

// Parse a URI reference. Surrounding ASCII whitespace is ignored.
// Returns nullopt for control characters, malformed percent escapes,
// a colon in the first segment of a scheme-less reference, or a malformed authority.
std::optional<Url> Parse(const std::string& text);

// RFC 3986 5.2.2 reference resolution (strict).
Url Resolve(const Url& base, const Url& reference);

// RFC 3986 5.2.4.
std::string RemoveDotSegments(const std::string& path);

// Resolve possibly-relative or protocol-relative URL against a base URL (page URL).
// Absolute candidates are returned as parsed, without further resolution.
// Returns nullopt if the candidate fails to parse.
std::optional<Url> ResolveAgainst(const Url& base, const std::string& candidate);

// Trim the user-supplied target and prefix http:// unless it already carries http(s)://.
std::string NormalizeTarget(const std::string& input);

bool EndsWithIgnoreCase(const std::string& value, const std::string& suffix);
std::string ToLower(std::string value);
std::string Trim(const std::string& value);

}
}
