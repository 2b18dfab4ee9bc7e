#pragma once
#include <string>
#include <optional>
#include <vector>

namespace LinkScope {

// Result of looking up one hostname against one DNS server.
struct Resolution {
    std::vector<std::string> addresses; // numeric, IPv6 without brackets
    std::string error;

    bool Ok() const { return error.empty() && !addresses.empty(); }
};

// Picks the DNS server used for one outbound connection: the primary if it can be
// dialed, otherwise the fallback. Nothing is cached between connections.
class DnsResolver {
public:
    struct Options {
        std::string primary = "1.1.1.1:53";
        std::string fallback = "8.8.8.8:53";
        long timeout_ms = 10000;
    };

    explicit DnsResolver(Options options);

    // nullopt when neither server can be dialed.
    std::optional<std::string> SelectServer() const;

    // Resolves host through the given server with c-ares. IP literals are returned as-is.
    Resolution Lookup(const std::string& host, const std::string& server) const;

    const Options& GetOptions() const { return options_; }

    // UDP dial of "host:port" ("[v6]:port" for IPv6 literals).
    static bool Dial(const std::string& address, long timeout_ms);

    static bool IsIpLiteral(const std::string& host);

private:
    Options options_;
};

}
