#pragma once
#include <string>
#include <optional>
#include "../utils/UrlUtil.hpp"

namespace LinkScope {

enum class LinkVerdict {
    Kept,
    Unparseable,
    Scheme,
    OutOfScope,
    JunkExtension,
    JsMode,
    SelfReference
};

const char* VerdictName(LinkVerdict verdict);

struct ScopeDecision {
    LinkVerdict verdict = LinkVerdict::Unparseable;
    std::string url; // resolved link, empty if it could not be resolved

    bool Kept() const { return verdict == LinkVerdict::Kept; }
};

// True if the lowercased path ends with a media, font, archive, document or XML extension.
bool IsJunkPath(const std::string& path);

// Same host or a subdomain of it. "example.com.evil.com" is not in scope of "example.com".
bool IsInScope(const std::string& host, const std::string& target_host);

// Resolves raw links found on one target page and decides whether they are kept.
class LinkFilter {
public:
    // Returns nullopt if the target is not an absolute URL with a host.
    static std::optional<LinkFilter> Create(const std::string& target_url, bool js_only);

    ScopeDecision Evaluate(const std::string& raw_link) const;

    const std::string& TargetHost() const { return target_host_; }

private:
    LinkFilter(std::string target_url, UrlUtil::Url target, bool js_only);

    std::string target_url_;
    UrlUtil::Url target_;
    std::string target_host_;
    bool js_only_;
};

}
