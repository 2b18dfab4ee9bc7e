#pragma once
#include <string>
#include <vector>
#include <unordered_set>
#include <mutex>

namespace LinkScope {
    // Run-wide set of extracted links, shared by every target.
    class LinkSet {
    public:
        // Returns true only when the link was not already present.
        bool Insert(const std::string& url);
        bool Contains(const std::string& url) const;
        size_t Size() const;

        // Hands over every member and leaves the set empty. Order is unspecified.
        std::vector<std::string> Drain();

    private:
        std::unordered_set<std::string> links_;
        mutable std::mutex links_mutex_;
    };
}
