#pragma once
#include <string>
#include "../interfaces/IPageFetcher.hpp"
#include "DnsResolver.hpp"

// Forward declare cURL types
typedef void CURL;
struct curl_slist;

namespace LinkScope {

// Blocking HTTP GET over libcurl. Redirects are followed here rather than by libcurl so
// that every hop selects a DNS server and resolves its host before connecting.
// One easy handle per hop, released before the hop returns.
class PageFetcher : public IPageFetcher {
public:
    struct Options {
        std::string user_agent;
        std::string accept;
        bool send_accept = true;
        long connect_timeout_ms = 15000;
        long timeout_ms = 30000;
        long keepalive_seconds = 15;
        long max_redirects = 10;
    };

    PageFetcher(Options options, DnsResolver resolver);

    // Non-copyable
    PageFetcher(const PageFetcher&) = delete;
    PageFetcher& operator=(const PageFetcher&) = delete;

    FetchOutcome Fetch(const std::string& url, const BodySink& sink) override;

private:
    // One request without following redirects. On a redirect response the absolute
    // Location is stored in `redirect` and the body is discarded.
    FetchOutcome FetchHop(const std::string& url, curl_slist* headers, long timeout_ms,
                          const BodySink& sink, std::string& redirect);

    Options options_;
    DnsResolver resolver_;
};

}
