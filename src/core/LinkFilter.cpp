#include "LinkFilter.hpp"
#include <array>
#include <utility>

namespace LinkScope {

namespace {

const std::array<const char*, 26> kJunkExtensions = {
    ".css", ".jpeg", ".jpg", ".png", ".gif", ".svg", ".ico", ".webp",
    ".mp4", ".mov", ".avi", ".webm", ".mkv",
    ".woff", ".woff2", ".ttf", ".eot", ".otf",
    ".pdf", ".docx", ".xlsx", ".pptx", ".zip", ".rar", ".7z",
    ".xml",
};

bool starts_with_ci(const std::string& value, const char* prefix) {
    std::string lower = UrlUtil::ToLower(value);
    return lower.rfind(prefix, 0) == 0;
}

} // anonymous namespace

const char* VerdictName(LinkVerdict verdict) {
    switch (verdict) {
        case LinkVerdict::Kept:          return "kept";
        case LinkVerdict::Unparseable:   return "unparseable";
        case LinkVerdict::Scheme:        return "scheme";
        case LinkVerdict::OutOfScope:    return "out of scope";
        case LinkVerdict::JunkExtension: return "junk extension";
        case LinkVerdict::JsMode:        return "js mode";
        case LinkVerdict::SelfReference: return "self reference";
    }
    return "unknown";
}

bool IsJunkPath(const std::string& path) {
    for (const char* ext : kJunkExtensions) {
        if (UrlUtil::EndsWithIgnoreCase(path, ext)) return true;
    }
    return false;
}

bool IsInScope(const std::string& host, const std::string& target_host) {
    if (host.empty() || target_host.empty()) return false;
    if (host == target_host) return true;
    const std::string suffix = "." + target_host;
    return host.size() > suffix.size() && host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<LinkFilter> LinkFilter::Create(const std::string& target_url, bool js_only) {
    auto target = UrlUtil::Parse(target_url);
    if (!target || !target->IsAbsolute() || target->Hostname().empty()) {
        return std::nullopt;
    }
    return LinkFilter(target_url, *target, js_only);
}

LinkFilter::LinkFilter(std::string target_url, UrlUtil::Url target, bool js_only)
    : target_url_(std::move(target_url)), target_(std::move(target)), js_only_(js_only) {
    target_host_ = target_.Hostname();
}

ScopeDecision LinkFilter::Evaluate(const std::string& raw_link) const {
    ScopeDecision decision;

    // 1-2) parse, then resolve relative references against the target page
    auto link = UrlUtil::ResolveAgainst(target_, raw_link);
    if (!link) {
        decision.verdict = LinkVerdict::Unparseable;
        return decision;
    }
    const UrlUtil::Url& resolved = *link;
    decision.url = resolved.ToString();

    // 3) mailto:, tel: and friends
    if (starts_with_ci(resolved.scheme, "mail") || starts_with_ci(resolved.scheme, "tel")) {
        decision.verdict = LinkVerdict::Scheme;
        return decision;
    }

    // 4) same host or subdomain of the target
    if (!IsInScope(resolved.Hostname(), target_host_)) {
        decision.verdict = LinkVerdict::OutOfScope;
        return decision;
    }

    // 5) junk extensions win over the .js mode
    if (IsJunkPath(resolved.path)) {
        decision.verdict = LinkVerdict::JunkExtension;
        return decision;
    }

    // 6) .js-only keeps scripts only, the default mode drops them. Case-sensitive.
    const std::string& path = resolved.path;
    const bool is_js = path.size() >= 3 && path.compare(path.size() - 3, 3, ".js") == 0;
    if (js_only_ != is_js) {
        decision.verdict = LinkVerdict::JsMode;
        return decision;
    }

    // 7) the page itself
    if (decision.url == target_url_) {
        decision.verdict = LinkVerdict::SelfReference;
        return decision;
    }

    decision.verdict = LinkVerdict::Kept;
    return decision;
}

}
