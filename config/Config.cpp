#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"

namespace LinkScope {

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["http_user_agent"] = http_user_agent;
    data["http_accept"] = http_accept;
    data["http_connect_timeout_ms"] = http_connect_timeout_ms;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_keepalive_seconds"] = http_keepalive_seconds;
    data["http_max_redirects"] = http_max_redirects;
    data["dns_primary"] = dns_primary;
    data["dns_fallback"] = dns_fallback;
    data["dns_timeout_ms"] = dns_timeout_ms;
    data["log_level"] = log_level;
    data["log_dir"] = log_dir;
    return data;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);
    if (!data.is_object()) {
        throw std::runtime_error("Config file is not a JSON object: " + path);
    }

    const Config defaults;
    http_user_agent = data.value("http_user_agent", defaults.http_user_agent);
    http_accept = data.value("http_accept", defaults.http_accept);
    http_connect_timeout_ms = data.value("http_connect_timeout_ms", defaults.http_connect_timeout_ms);
    http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
    http_keepalive_seconds = data.value("http_keepalive_seconds", defaults.http_keepalive_seconds);
    http_max_redirects = data.value("http_max_redirects", defaults.http_max_redirects);
    dns_primary = data.value("dns_primary", defaults.dns_primary);
    dns_fallback = data.value("dns_fallback", defaults.dns_fallback);
    dns_timeout_ms = data.value("dns_timeout_ms", defaults.dns_timeout_ms);
    log_level = data.value("log_level", defaults.log_level);
    log_dir = data.value("log_dir", defaults.log_dir);

    // Write back missing keys so existing config.json reflects newly added options.
    // Unknown keys are preserved.
    bool changed = false;
    const nlohmann::json current = ToJson();
    for (const auto& item : current.items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }
    if (!changed) return;

    std::filesystem::path p(path);
    std::filesystem::path bak = p;
    bak += ".bak";
    std::error_code ec;
    std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
        return;
    }

    std::ofstream o(path, std::ios::trunc);
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        Logger::Log(LogLevel::Warn, "Could not add missing keys to " + path);
    }
}

void Config::CreateDefault(const std::string& path_str) const {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
