#pragma once
#include <string>
#include <vector>

namespace LinkScope {
namespace TargetFile {

// One target per line. Lines are trimmed; blank lines and '#' comments are skipped.
// Throws std::runtime_error if the file cannot be read.
std::vector<std::string> ReadTargets(const std::string& path);

// Appends one line per entry, creating the file if needed. Existing content is kept.
// Throws std::runtime_error on open or write failure.
void AppendLines(const std::string& path, const std::vector<std::string>& lines);

}
}
