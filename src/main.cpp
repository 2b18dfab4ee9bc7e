#include <iostream>
#include <cstdlib>
#include <curl/curl.h>
#include <cxxopts.hpp>
#include <filesystem>
#include <optional>
#include <vector>
#include "../config/Config.hpp"
#include "cache/LinkSet.hpp"
#include "core/ExtractionRunner.hpp"
#include "network/DnsResolver.hpp"
#include "network/PageFetcher.hpp"
#include "utils/Logger.hpp"
#include "utils/TargetFile.hpp"

namespace {

const char* kBanner = R"(
    ___       __   ____
   / (_)___  / /__/ __/______  ___  ___
  / / / __ \/ //_/\ \/ __/ _ \/ _ \/ -_)
 /_/_/_/ /_/_/\_\___/\__/\___/ .__/\__/
                            /_/   - Links Extractor
)";

// Loads the config file if there is one. An explicitly named file that does not exist
// is created with defaults. Returns false on a file that exists but cannot be used.
bool LoadConfig(LinkScope::Config& config, const std::string& path, bool explicit_path) {
    if (!std::filesystem::exists(path)) {
        if (!explicit_path) return true;
        try {
            config.CreateDefault(path);
            LinkScope::Logger::Log(LinkScope::LogLevel::Info, "Config not found. Created a default one at: " + path);
        } catch (const std::exception& e) {
            LinkScope::Logger::Log(LinkScope::LogLevel::Warn, "Failed to create default config: " + std::string(e.what()));
        }
        return true;
    }
    try {
        config.Load(path);
        LinkScope::Logger::Log(LinkScope::LogLevel::Debug, "Configuration loaded from: " + path);
    } catch (const std::exception& e) {
        LinkScope::Logger::Log(LinkScope::LogLevel::Error, "Failed to load config: " + std::string(e.what()));
        return false;
    }
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::cout << kBanner << std::endl;

    cxxopts::Options options("linkscope", "Extract in-scope links and script references from web pages");
    options.add_options()
        ("u,url", "Single URL to fetch", cxxopts::value<std::string>()->default_value(""))
        ("l,list", "Text file containing a list of URLs", cxxopts::value<std::string>()->default_value(""))
        ("o,output", "Output file to append extracted URLs to", cxxopts::value<std::string>()->default_value("extracted.txt"))
        ("d,same-domain", "Extract only links on the same domain as the target (always enforced)")
        ("j,js-only", "Extract only .js files")
        ("no-accept", "Do not send the Accept header")
        ("c,config", "JSON config file", cxxopts::value<std::string>())
        ("v,verbose", "Debug logging")
        ("h,help", "Print usage");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << options.help() << std::endl;
        return 1;
    }
    const cxxopts::ParseResult& args = *parsed;

    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    const std::string single_url = args["url"].as<std::string>();
    const std::string list_file = args["list"].as<std::string>();
    const std::string output_file = args["output"].as<std::string>();
    const bool js_only = args.count("js-only") > 0;
    const bool no_accept = args.count("no-accept") > 0;

    if (single_url.empty() && list_file.empty()) {
        std::cout << options.help() << std::endl;
        return 1;
    }

    // Load Config
    LinkScope::Config config;
    std::string config_path;
    const bool explicit_config = args.count("config") > 0;
    if (explicit_config) {
        config_path = args["config"].as<std::string>();
    } else if (argc > 0 && argv[0] != nullptr) {
        config_path = (std::filesystem::path(argv[0]).parent_path() / "config" / "config.json").string();
    }
    if (!config_path.empty() && !LoadConfig(config, config_path, explicit_config)) {
        return 1;
    }

    LinkScope::LogLevel level = args.count("verbose") ? LinkScope::LogLevel::Debug
                                                      : LinkScope::Logger::FromString(config.log_level);
    LinkScope::Logger::Init(config.log_dir, level);

    if (args.count("same-domain")) {
        LinkScope::Logger::Log(LinkScope::LogLevel::Debug, "Same-domain scope requested; it is always applied.");
    }

    std::vector<std::string> targets;
    if (!single_url.empty()) {
        targets.push_back(single_url);
    }
    if (!list_file.empty()) {
        try {
            auto from_file = LinkScope::TargetFile::ReadTargets(list_file);
            targets.insert(targets.end(), from_file.begin(), from_file.end());
        } catch (const std::runtime_error& e) {
            LinkScope::Logger::Log(LinkScope::LogLevel::Error, "Error reading URLs from file: " + std::string(e.what()));
        }
    }

    // Initialize global resources
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        LinkScope::Logger::Log(LinkScope::LogLevel::Error, "Failed to initialize libcurl");
        return 1;
    }

    LinkScope::DnsResolver::Options dns;
    dns.primary = config.dns_primary;
    dns.fallback = config.dns_fallback;
    dns.timeout_ms = config.dns_timeout_ms;

    LinkScope::PageFetcher::Options http;
    http.user_agent = config.http_user_agent;
    http.accept = config.http_accept;
    http.send_accept = !no_accept;
    http.connect_timeout_ms = config.http_connect_timeout_ms;
    http.timeout_ms = config.http_timeout_ms;
    http.keepalive_seconds = config.http_keepalive_seconds;
    http.max_redirects = config.http_max_redirects;

    LinkScope::LinkSet links;
    LinkScope::RunStats stats;
    try {
        LinkScope::PageFetcher fetcher(http, LinkScope::DnsResolver(dns));
        LinkScope::ExtractionRunner runner(fetcher, links, js_only);
        stats = runner.Run(targets);
    } catch (const std::exception& e) {
        LinkScope::Logger::Log(LinkScope::LogLevel::Error, "Run aborted: " + std::string(e.what()));
    }

    // Cleanup global resources
    curl_global_cleanup();

    LinkScope::Logger::Log(LinkScope::LogLevel::Debug, std::to_string(stats.targets_processed) + " of " +
        std::to_string(stats.targets_total) + " targets processed, " + std::to_string(stats.targets_skipped) + " skipped");

    std::vector<std::string> final_urls = links.Drain();
    if (final_urls.empty()) {
        LinkScope::Logger::Log(LinkScope::LogLevel::Warn, "No URLs extracted. Either no links were found or the filters were too restrictive.");
        return 0;
    }

    try {
        LinkScope::TargetFile::AppendLines(output_file, final_urls);
    } catch (const std::runtime_error& e) {
        LinkScope::Logger::Log(LinkScope::LogLevel::Error, "Error writing extracted URLs to file: " + std::string(e.what()));
        return 1;
    }
    LinkScope::Logger::Log(LinkScope::LogLevel::Info, "--- Extracted " + std::to_string(final_urls.size()) +
        " URLs written to " + output_file + " ---");
    return 0;
}
