#include "TargetFile.hpp"
#include <fstream>
#include <stdexcept>
#include "UrlUtil.hpp"

namespace LinkScope {
namespace TargetFile {

std::vector<std::string> ReadTargets(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open target list: " + path);
    }

    std::vector<std::string> targets;
    std::string line;
    while (std::getline(in, line)) {
        std::string target = UrlUtil::Trim(line);
        if (target.empty() || target[0] == '#') continue;
        targets.push_back(std::move(target));
    }
    if (in.bad()) {
        throw std::runtime_error("Failed to read target list: " + path);
    }
    return targets;
}

void AppendLines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open output file: " + path);
    }
    for (const auto& line : lines) {
        out << line << '\n';
    }
    out.flush();
    if (!out.good()) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

}
}
