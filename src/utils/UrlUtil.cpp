#include "UrlUtil.hpp"
#include <algorithm>
#include <cstring>

namespace LinkScope {
namespace UrlUtil {

static inline bool starts_with(const std::string& s, const char* pfx) {
    size_t n = strlen(pfx);
    return s.size() >= n && memcmp(s.data(), pfx, n) == 0;
}

static inline bool is_alpha(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

static inline bool is_digit(unsigned char c) {
    return c >= '0' && c <= '9';
}

static inline bool is_hex(unsigned char c) {
    return is_digit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

static inline bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

static bool valid_scheme(const std::string& s) {
    if (s.empty() || !is_alpha(static_cast<unsigned char>(s[0]))) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return is_alpha(c) || is_digit(c) || c == '+' || c == '-' || c == '.';
    });
}

static bool valid_escapes(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') continue;
        if (i + 2 >= s.size()) return false;
        if (!is_hex(static_cast<unsigned char>(s[i + 1])) || !is_hex(static_cast<unsigned char>(s[i + 2]))) return false;
        i += 2;
    }
    return true;
}

// authority = [ userinfo "@" ] host [ ":" port ]
static bool valid_authority(const std::string& authority) {
    std::string hostport = authority;
    auto at = hostport.rfind('@');
    if (at != std::string::npos) hostport = hostport.substr(at + 1);

    std::string port;
    if (!hostport.empty() && hostport[0] == '[') {
        auto close = hostport.find(']');
        if (close == std::string::npos) return false;
        std::string rest = hostport.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') return false;
            port = rest.substr(1);
        }
    } else {
        auto colon = hostport.find(':');
        std::string host = hostport.substr(0, colon);
        static const char* forbidden = " <>\"{}|\\^`[]";
        if (host.find_first_of(forbidden) != std::string::npos) return false;
        if (colon != std::string::npos) port = hostport.substr(colon + 1);
    }
    return std::all_of(port.begin(), port.end(), [](unsigned char c) { return is_digit(c); });
}

// pchar and, for query and fragment, '/' and '?' (RFC 3986 3.3-3.5).
// '%' passes through since Parse only accepts well-formed escapes.
static bool allowed_in_component(unsigned char c, bool query_or_fragment) {
    if (is_alpha(c) || is_digit(c)) return true;
    switch (c) {
        case '-': case '.': case '_': case '~':
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
        case ':': case '@': case '/': case '%':
            return true;
        case '?':
            return query_or_fragment;
        default:
            return false;
    }
}

static std::string escape_component(const std::string& value, bool query_or_fragment) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (allowed_in_component(c, query_or_fragment)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0f]);
        }
    }
    return out;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return value;
}

std::string Trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && is_space(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && is_space(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(begin, end - begin);
}

bool EndsWithIgnoreCase(const std::string& value, const std::string& suffix) {
    if (suffix.size() > value.size()) return false;
    return ToLower(value.substr(value.size() - suffix.size())) == ToLower(suffix);
}

std::optional<Url> Parse(const std::string& text) {
    std::string s = Trim(text);
    for (unsigned char c : s) {
        if (c < 0x20 || c == 0x7f) return std::nullopt;
    }
    if (!valid_escapes(s)) return std::nullopt;

    Url url;
    std::string rest = s;

    auto delim = rest.find_first_of(":/?#");
    if (delim != std::string::npos && rest[delim] == ':') {
        std::string scheme = rest.substr(0, delim);
        // A colon before any '/', '?' or '#' must terminate a valid scheme.
        if (!valid_scheme(scheme)) return std::nullopt;
        url.scheme = ToLower(scheme);
        rest = rest.substr(delim + 1);
    }

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        url.has_fragment = true;
        url.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }

    auto question = rest.find('?');
    if (question != std::string::npos) {
        url.has_query = true;
        url.query = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }

    if (starts_with(rest, "//")) {
        auto slash = rest.find('/', 2);
        if (slash == std::string::npos) slash = rest.size();
        url.has_authority = true;
        url.authority = rest.substr(2, slash - 2);
        if (!valid_authority(url.authority)) return std::nullopt;
        rest = rest.substr(slash);
    }

    url.path = rest;
    return url;
}

std::string Url::Hostname() const {
    if (!has_authority) return {};
    std::string host = authority;
    auto at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);
    if (!host.empty() && host[0] == '[') {
        auto close = host.find(']');
        host = host.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    } else {
        auto colon = host.find(':');
        if (colon != std::string::npos) host = host.substr(0, colon);
    }
    return ToLower(host);
}

std::string Url::Port() const {
    if (!has_authority) return {};
    std::string hostport = authority;
    auto at = hostport.rfind('@');
    if (at != std::string::npos) hostport = hostport.substr(at + 1);
    auto close = hostport.rfind(']');
    auto colon = hostport.rfind(':');
    if (colon == std::string::npos || (close != std::string::npos && colon < close)) return {};
    return hostport.substr(colon + 1);
}

std::string Url::ToString() const {
    std::string out;
    if (!scheme.empty()) out += scheme + ":";
    if (has_authority) out += "//" + authority;
    out += escape_component(path, false);
    if (has_query) out += "?" + escape_component(query, true);
    if (has_fragment && !fragment.empty()) out += "#" + escape_component(fragment, true);
    return out;
}

std::string RemoveDotSegments(const std::string& path) {
    std::string input = path;
    std::string output;

    auto pop_segment = [&output]() {
        auto slash = output.rfind('/');
        if (slash == std::string::npos) output.clear();
        else output.erase(slash);
    };

    while (!input.empty()) {
        if (starts_with(input, "../")) {
            input.erase(0, 3);
        } else if (starts_with(input, "./")) {
            input.erase(0, 2);
        } else if (starts_with(input, "/./")) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (starts_with(input, "/../")) {
            input.replace(0, 4, "/");
            pop_segment();
        } else if (input == "/..") {
            input = "/";
            pop_segment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            size_t start = input[0] == '/' ? 1 : 0;
            auto next = input.find('/', start);
            if (next == std::string::npos) next = input.size();
            output += input.substr(0, next);
            input.erase(0, next);
        }
    }
    return output;
}

static std::string merge_paths(const Url& base, const std::string& reference_path) {
    if (base.has_authority && base.path.empty()) return "/" + reference_path;
    auto slash = base.path.rfind('/');
    if (slash == std::string::npos) return reference_path;
    return base.path.substr(0, slash + 1) + reference_path;
}

Url Resolve(const Url& base, const Url& reference) {
    Url target;
    if (!reference.scheme.empty()) {
        target = reference;
        target.path = RemoveDotSegments(reference.path);
        return target;
    }

    if (reference.has_authority) {
        target.has_authority = true;
        target.authority = reference.authority;
        target.path = RemoveDotSegments(reference.path);
        target.has_query = reference.has_query;
        target.query = reference.query;
    } else {
        if (reference.path.empty()) {
            target.path = base.path;
            target.has_query = reference.has_query ? true : base.has_query;
            target.query = reference.has_query ? reference.query : base.query;
        } else {
            if (reference.path[0] == '/') {
                target.path = RemoveDotSegments(reference.path);
            } else {
                target.path = RemoveDotSegments(merge_paths(base, reference.path));
            }
            target.has_query = reference.has_query;
            target.query = reference.query;
        }
        target.has_authority = base.has_authority;
        target.authority = base.authority;
    }
    target.scheme = base.scheme;
    target.has_fragment = reference.has_fragment;
    target.fragment = reference.fragment;
    return target;
}

std::optional<Url> ResolveAgainst(const Url& base, const std::string& candidate) {
    auto reference = Parse(candidate);
    if (!reference) return std::nullopt;
    if (reference->IsAbsolute()) return reference;
    return Resolve(base, *reference);
}

std::string NormalizeTarget(const std::string& input) {
    std::string target = Trim(input);
    std::string lower = ToLower(target);
    if (!starts_with(lower, "http://") && !starts_with(lower, "https://")) {
        target = "http://" + target;
    }
    return target;
}

}
}
