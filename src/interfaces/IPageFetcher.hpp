#pragma once
#include <string>
#include <functional>

namespace LinkScope {

enum class FetchFailure {
    None,
    Input,
    Tls,
    Timeout,
    Connect,
    Status,
    Other
};

struct FetchOutcome {
    FetchFailure failure = FetchFailure::None;
    long status_code = 0;
    std::string error;
    size_t body_bytes = 0;

    bool Ok() const { return failure == FetchFailure::None; }
};

class IPageFetcher {
public:
    // Receives the response body of a 200 response, chunk by chunk.
    using BodySink = std::function<void(const char* data, size_t size)>;
    virtual ~IPageFetcher() = default;
    virtual FetchOutcome Fetch(const std::string& url, const BodySink& sink) = 0;
};

}
