#include "ExtractionRunner.hpp"
#include "LinkFilter.hpp"
#include <exception>
#include "../parser/LinkExtractor.hpp"
#include "../network/FetchError.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace LinkScope {

ExtractionRunner::ExtractionRunner(IPageFetcher& fetcher, LinkSet& links, bool js_only)
    : fetcher_(fetcher), links_(links), js_only_(js_only) {}

RunStats ExtractionRunner::Run(const std::vector<std::string>& targets) {
    RunStats stats;
    stats.targets_total = targets.size();
    for (const auto& target : targets) {
        if (ProcessTarget(target, stats)) {
            ++stats.targets_processed;
        } else {
            ++stats.targets_skipped;
        }
    }
    return stats;
}

bool ExtractionRunner::ProcessTarget(const std::string& target, RunStats& stats) {
    const std::string target_url = UrlUtil::NormalizeTarget(target);
    auto filter = LinkFilter::Create(target_url, js_only_);
    if (!filter) {
        Logger::Log(LogLevel::Warn, "Skipping malformed target: " + target);
        return false;
    }

    Logger::Log(LogLevel::Info, "--- Processing " + target_url + " ---");

    size_t seen = 0;
    size_t extracted = 0;
    FetchOutcome outcome;
    try {
        LinkExtractor extractor([&](const std::string& raw_link) {
            ++seen;
            ScopeDecision decision = filter->Evaluate(raw_link);
            if (!decision.Kept()) {
                Logger::Log(LogLevel::Debug, std::string("Rejected (") + VerdictName(decision.verdict) + "): " + raw_link);
                return;
            }
            if (links_.Insert(decision.url)) {
                ++extracted;
                Logger::Log(LogLevel::Info, "[EXTRACTED] " + decision.url);
            }
        });

        outcome = fetcher_.Fetch(target_url, [&extractor](const char* data, size_t size) {
            extractor.Feed(data, size);
        });
        extractor.Finish();
    } catch (const std::exception& e) {
        stats.links_seen += seen;
        stats.links_extracted += extracted;
        Logger::Log(LogLevel::Error, "Error processing " + target_url + ": " + e.what());
        return false;
    }

    stats.links_seen += seen;
    stats.links_extracted += extracted;

    if (!outcome.Ok()) {
        ReportFailure(target_url, outcome);
        return false;
    }

    Logger::Log(LogLevel::Info, "Done with " + target_url + ": " + std::to_string(seen) + " references, " +
        std::to_string(extracted) + " new links (" + std::to_string(outcome.body_bytes) + " bytes)");
    return true;
}

void ExtractionRunner::ReportFailure(const std::string& target_url, const FetchOutcome& outcome) {
    switch (outcome.failure) {
        case FetchFailure::Tls:
            Logger::Log(LogLevel::Warn, "Skipping SSL error for " + target_url + " - " + outcome.error);
            break;
        case FetchFailure::Timeout:
            Logger::Log(LogLevel::Warn, "Timeout during connection for " + target_url);
            break;
        case FetchFailure::Connect:
            Logger::Log(LogLevel::Warn, "DNS or connection error for " + target_url + " - " + outcome.error);
            break;
        case FetchFailure::Input:
            Logger::Log(LogLevel::Warn, "Skipping malformed target " + target_url + " - " + outcome.error);
            break;
        case FetchFailure::Status:
            Logger::Log(LogLevel::Error, "Error response for " + target_url + ": " + outcome.error);
            break;
        case FetchFailure::Other:
        case FetchFailure::None:
            Logger::Log(LogLevel::Error, std::string("Error fetching ") + target_url + " (" +
                FailureName(outcome.failure) + "): " + outcome.error);
            break;
    }
}

}
