#pragma once
#include <string>
#include <vector>
#include "../interfaces/IPageFetcher.hpp"
#include "../cache/LinkSet.hpp"

namespace LinkScope {
    struct RunStats {
        size_t targets_total = 0;
        size_t targets_processed = 0;
        size_t targets_skipped = 0;
        size_t links_seen = 0;
        size_t links_extracted = 0;
    };

    // Drives every target through fetch, extraction, filtering and the shared LinkSet.
    // A failing target is logged and skipped; it never stops the run.
    class ExtractionRunner {
    public:
        ExtractionRunner(IPageFetcher& fetcher, LinkSet& links, bool js_only);

        RunStats Run(const std::vector<std::string>& targets);

        // Returns false if the target was skipped.
        bool ProcessTarget(const std::string& target, RunStats& stats);

    private:
        void ReportFailure(const std::string& target_url, const FetchOutcome& outcome);

        IPageFetcher& fetcher_;
        LinkSet& links_;
        bool js_only_;
    };
}
