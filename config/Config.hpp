#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace LinkScope {
    struct Config {
        std::string http_user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/97.0.4692.99 Safari/537.36";
        std::string http_accept = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
        long http_connect_timeout_ms = 15000;
        long http_timeout_ms = 30000;
        long http_keepalive_seconds = 15;
        long http_max_redirects = 10;
        std::string dns_primary = "1.1.1.1:53";
        std::string dns_fallback = "8.8.8.8:53";
        long dns_timeout_ms = 10000;
        std::string log_level = "info";
        std::string log_dir; // empty: console only

        // Throws std::runtime_error if the file cannot be opened; nlohmann::json::exception if it is not JSON.
        void Load(const std::string& path);
        void CreateDefault(const std::string& path) const;
        nlohmann::json ToJson() const;
    };
}
