#include "LinkSet.hpp"

namespace LinkScope {

bool LinkSet::Insert(const std::string& url) {
    std::lock_guard<std::mutex> lock(links_mutex_);
    return links_.insert(url).second;
}

bool LinkSet::Contains(const std::string& url) const {
    std::lock_guard<std::mutex> lock(links_mutex_);
    return links_.find(url) != links_.end();
}

size_t LinkSet::Size() const {
    std::lock_guard<std::mutex> lock(links_mutex_);
    return links_.size();
}

std::vector<std::string> LinkSet::Drain() {
    std::lock_guard<std::mutex> lock(links_mutex_);
    std::vector<std::string> out(links_.begin(), links_.end());
    links_.clear();
    return out;
}

}
