#include <catch2/catch_all.hpp>
#include "utils/UrlUtil.hpp"

using namespace LinkScope;

namespace {

std::string ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    auto base = UrlUtil::Parse(base_url);
    REQUIRE(base.has_value());
    auto resolved = UrlUtil::ResolveAgainst(*base, candidate);
    return resolved ? resolved->ToString() : "<unparseable>";
}

} // anonymous namespace

TEST_CASE("ResolveAgainst handles protocol and relative URLs") {
    std::string base = "https://example.com/path/page.html";
    CHECK(ResolveAgainst(base, "https://cdn.example.com/a.jpg") == "https://cdn.example.com/a.jpg");
    CHECK(ResolveAgainst(base, "//cdn.example.com/a.jpg") == "https://cdn.example.com/a.jpg");
    CHECK(ResolveAgainst(base, "/img/a.png") == "https://example.com/img/a.png");
    CHECK(ResolveAgainst(base, "img/a.png") == "https://example.com/path/img/a.png");
    CHECK(ResolveAgainst("https://example.com", "img.png") == "https://example.com/img.png");
    CHECK(ResolveAgainst("http://example.com/a/b", "  /trimmed  ") == "http://example.com/trimmed");
    CHECK(ResolveAgainst(base, "/bad%zz") == "<unparseable>");
}

TEST_CASE("ResolveAgainst follows the RFC 3986 normal examples") {
    const std::string base = "http://a/b/c/d;p?q";

    CHECK(ResolveAgainst(base, "g:h") == "g:h");
    CHECK(ResolveAgainst(base, "g") == "http://a/b/c/g");
    CHECK(ResolveAgainst(base, "./g") == "http://a/b/c/g");
    CHECK(ResolveAgainst(base, "g/") == "http://a/b/c/g/");
    CHECK(ResolveAgainst(base, "/g") == "http://a/g");
    CHECK(ResolveAgainst(base, "//g") == "http://g");
    CHECK(ResolveAgainst(base, "?y") == "http://a/b/c/d;p?y");
    CHECK(ResolveAgainst(base, "g?y") == "http://a/b/c/g?y");
    CHECK(ResolveAgainst(base, "#s") == "http://a/b/c/d;p?q#s");
    CHECK(ResolveAgainst(base, "g#s") == "http://a/b/c/g#s");
    CHECK(ResolveAgainst(base, ";x") == "http://a/b/c/;x");
    CHECK(ResolveAgainst(base, "") == "http://a/b/c/d;p?q");
    CHECK(ResolveAgainst(base, ".") == "http://a/b/c/");
    CHECK(ResolveAgainst(base, "./") == "http://a/b/c/");
    CHECK(ResolveAgainst(base, "..") == "http://a/b/");
    CHECK(ResolveAgainst(base, "../g") == "http://a/b/g");
    CHECK(ResolveAgainst(base, "../..") == "http://a/");
    CHECK(ResolveAgainst(base, "../../g") == "http://a/g");
    CHECK(ResolveAgainst(base, "../../../g") == "http://a/g");
    CHECK(ResolveAgainst(base, "/./g") == "http://a/g");
    CHECK(ResolveAgainst(base, "g/../h") == "http://a/b/c/h");
}

TEST_CASE("Parse rejects malformed references") {
    CHECK_FALSE(UrlUtil::Parse("http://exa mple.com/").has_value());
    CHECK_FALSE(UrlUtil::Parse("/bad%zzescape").has_value());
    CHECK_FALSE(UrlUtil::Parse("/truncated%4").has_value());
    CHECK_FALSE(UrlUtil::Parse("1abc:path").has_value());
    CHECK_FALSE(UrlUtil::Parse(":nothing").has_value());
    CHECK_FALSE(UrlUtil::Parse("http://example.com:80x/").has_value());
    CHECK_FALSE(UrlUtil::Parse(std::string("/a\x01b")).has_value());

    CHECK(UrlUtil::Parse("/ok%20space").has_value());
    CHECK(UrlUtil::Parse("mailto:a@b.com").has_value());
}

TEST_CASE("Parse splits components and lowercases scheme and host") {
    auto url = UrlUtil::Parse("HTTPS://user@WWW.Example.com:8443/p/a?q=1#frag");
    REQUIRE(url.has_value());
    CHECK(url->scheme == "https");
    CHECK(url->authority == "user@WWW.Example.com:8443");
    CHECK(url->Hostname() == "www.example.com");
    CHECK(url->path == "/p/a");
    CHECK(url->query == "q=1");
    CHECK(url->fragment == "frag");
    CHECK(url->ToString() == "https://user@WWW.Example.com:8443/p/a?q=1#frag");

    auto v6 = UrlUtil::Parse("http://[::1]:8080/");
    REQUIRE(v6.has_value());
    CHECK(v6->Hostname() == "::1");

    CHECK(url->Port() == "8443");
    CHECK(v6->Port() == "8080");
    CHECK(UrlUtil::Parse("http://example.com/")->Port().empty());
    CHECK(UrlUtil::Parse("http://[::1]/")->Port().empty());

    CHECK_FALSE(UrlUtil::Parse("not a url with %%").has_value());
}

TEST_CASE("ToString percent-encodes what a component cannot hold") {
    const std::string base = "http://example.com/";
    CHECK(ResolveAgainst(base, "/a b") == "http://example.com/a%20b");
    CHECK(ResolveAgainst(base, "/a%20b") == "http://example.com/a%20b");
    CHECK(ResolveAgainst(base, "/caf\xC3\xA9") == "http://example.com/caf%C3%A9");
    CHECK(ResolveAgainst(base, "/p?q=a b&r=<x>") == "http://example.com/p?q=a%20b&r=%3Cx%3E");
    CHECK(ResolveAgainst(base, "/p#sec tion") == "http://example.com/p#sec%20tion");
    CHECK(ResolveAgainst(base, "/keep;a=1/b:c@d!$'()*+,~") == "http://example.com/keep;a=1/b:c@d!$'()*+,~");
    CHECK(ResolveAgainst(base, "/?a/b?c") == "http://example.com/?a/b?c");
}

TEST_CASE("NormalizeTarget adds a scheme only when missing") {
    CHECK(UrlUtil::NormalizeTarget("example.com") == "http://example.com");
    CHECK(UrlUtil::NormalizeTarget("  example.com/path \r") == "http://example.com/path");
    CHECK(UrlUtil::NormalizeTarget("https://example.com") == "https://example.com");
    CHECK(UrlUtil::NormalizeTarget("http://example.com") == "http://example.com");
    CHECK(UrlUtil::NormalizeTarget("HTTPS://example.com") == "HTTPS://example.com");
}

TEST_CASE("RemoveDotSegments") {
    CHECK(UrlUtil::RemoveDotSegments("/a/b/c/./../../g") == "/a/g");
    CHECK(UrlUtil::RemoveDotSegments("mid/content=5/../6") == "mid/6");
    CHECK(UrlUtil::RemoveDotSegments("/..") == "/");
}
