#include "PageFetcher.hpp"
#include <curl/curl.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>
#include "FetchError.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    CURL* handle = nullptr;
    const LinkScope::IPageFetcher::BodySink* sink = nullptr;
    bool status_checked = false;
    bool status_rejected = false;
    long status_code = 0;
    size_t bytes = 0;
    std::string redirect;
    std::string sink_error;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

bool IsRedirectStatus(long code) {
    return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
}

std::string RedirectTarget(CURL* handle, long code) {
    if (!IsRedirectStatus(code)) return {};
    char* location = nullptr;
    if (curl_easy_getinfo(handle, CURLINFO_REDIRECT_URL, &location) != CURLE_OK || location == nullptr) {
        return {};
    }
    return location;
}

size_t WriteCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    // Headers of the response are complete by the first body byte.
    if (!ctx->status_checked) {
        ctx->status_checked = true;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &ctx->status_code);
        ctx->redirect = RedirectTarget(ctx->handle, ctx->status_code);
        if (ctx->redirect.empty() && ctx->status_code != 200) {
            ctx->status_rejected = true;
            return 0; // Aborts the transfer
        }
    }
    if (!ctx->redirect.empty()) return chunk;

    ctx->bytes += chunk;
    if (ctx->sink && *ctx->sink) {
        try {
            (*ctx->sink)(contents, chunk);
        } catch (const std::exception& e) {
            ctx->sink_error = e.what();
            return 0;
        }
    }
    return chunk;
}

// "host:port:addr1,addr2" for CURLOPT_RESOLVE
std::string ResolveEntry(const std::string& host, const std::string& port, const std::vector<std::string>& addresses) {
    std::string entry = host + ":" + port + ":";
    for (size_t i = 0; i < addresses.size(); ++i) {
        if (i > 0) entry += ",";
        const bool v6 = addresses[i].find(':') != std::string::npos;
        entry += v6 ? "[" + addresses[i] + "]" : addresses[i];
    }
    return entry;
}

} // anonymous namespace

namespace LinkScope {

PageFetcher::PageFetcher(Options options, DnsResolver resolver)
    : options_(std::move(options)), resolver_(std::move(resolver)) {}

FetchOutcome PageFetcher::Fetch(const std::string& url, const BodySink& sink) {
    curl_slist* raw_headers = nullptr;
    if (options_.send_accept) {
        raw_headers = curl_slist_append(raw_headers, ("Accept: " + options_.accept).c_str());
    } else {
        // A bare "Accept:" removes the header libcurl would add on its own
        raw_headers = curl_slist_append(raw_headers, "Accept:");
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, &curl_slist_free_all);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.timeout_ms);
    std::string current = url;
    for (long hop = 0;; ++hop) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            FetchOutcome outcome;
            outcome.failure = FetchFailure::Timeout;
            outcome.error = "timed out after " + std::to_string(hop) + " redirects";
            return outcome;
        }

        std::string redirect;
        FetchOutcome outcome = FetchHop(current, headers.get(), static_cast<long>(left), sink, redirect);
        if (!outcome.Ok() || redirect.empty()) {
            return outcome;
        }
        if (hop >= options_.max_redirects) {
            outcome.failure = FetchFailure::Other;
            outcome.error = "stopped after " + std::to_string(options_.max_redirects) + " redirects";
            return outcome;
        }
        Logger::Log(LogLevel::Debug, "Redirect " + current + " -> " + redirect);
        current = redirect;
    }
}

FetchOutcome PageFetcher::FetchHop(const std::string& url, curl_slist* headers, long timeout_ms,
                                   const BodySink& sink, std::string& redirect) {
    FetchOutcome outcome;

    auto parsed = UrlUtil::Parse(url);
    if (!parsed || parsed->Hostname().empty()) {
        outcome.failure = FetchFailure::Input;
        outcome.error = "malformed URL: " + url;
        return outcome;
    }
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        outcome.failure = FetchFailure::Input;
        outcome.error = "unsupported protocol scheme \"" + parsed->scheme + "\"";
        return outcome;
    }

    auto server = resolver_.SelectServer();
    if (!server) {
        const auto& dns = resolver_.GetOptions();
        outcome.failure = FetchFailure::Connect;
        outcome.error = "no DNS server reachable (" + dns.primary + ", " + dns.fallback + ")";
        return outcome;
    }

    const std::string host = parsed->Hostname();
    Resolution resolution = resolver_.Lookup(host, *server);
    if (!resolution.Ok()) {
        outcome.failure = FetchFailure::Connect;
        outcome.error = resolution.error;
        return outcome;
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> pinned(nullptr, &curl_slist_free_all);
    if (!DnsResolver::IsIpLiteral(host)) {
        std::string port = parsed->Port();
        if (port.empty()) port = parsed->scheme == "https" ? "443" : "80";
        pinned.reset(curl_slist_append(nullptr, ResolveEntry(host, port, resolution.addresses).c_str()));
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        outcome.failure = FetchFailure::Other;
        outcome.error = "Failed to create cURL easy handle";
        return outcome;
    }

    TransferContext ctx;
    ctx.handle = curl.get();
    ctx.sink = &sink;

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPIDLE, options_.keepalive_seconds);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPINTVL, options_.keepalive_seconds);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, ctx.error_buffer);
    curl_easy_setopt(h, CURLOPT_DNS_CACHE_TIMEOUT, 0L);
    curl_easy_setopt(h, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    if (pinned) {
        curl_easy_setopt(h, CURLOPT_RESOLVE, pinned.get());
    }

    Logger::Log(LogLevel::Debug, "GET " + url + " (DNS " + *server + ", " + resolution.addresses.front() + ")");
    CURLcode rc = curl_easy_perform(h);
    outcome.body_bytes = ctx.bytes;

    if (ctx.status_rejected) {
        outcome.failure = FetchFailure::Status;
        outcome.status_code = ctx.status_code;
        outcome.error = "HTTP " + std::to_string(ctx.status_code);
        return outcome;
    }

    if (!ctx.sink_error.empty()) {
        outcome.failure = FetchFailure::Other;
        outcome.error = "Body handler failed: " + ctx.sink_error;
        return outcome;
    }

    if (rc != CURLE_OK) {
        outcome.error = ctx.error_buffer;
        if (outcome.error.empty()) {
            outcome.error = curl_easy_strerror(rc);
        }
        outcome.failure = ClassifyCurlError(rc, outcome.error);
        return outcome;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &outcome.status_code);
    redirect = ctx.redirect.empty() ? RedirectTarget(h, outcome.status_code) : ctx.redirect;
    if (!redirect.empty()) {
        return outcome;
    }
    if (outcome.status_code != 200) {
        outcome.failure = FetchFailure::Status;
        outcome.error = "HTTP " + std::to_string(outcome.status_code);
    }
    return outcome;
}

}
