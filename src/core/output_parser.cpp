#include "gitwip/output_parser.h"

#include <algorithm>

namespace gitwip {

std::vector<std::string> parse_status(const std::vector<std::string>& lines) {
    std::vector<std::string> findings;
    findings.reserve(lines.size());
    for (const auto& line : lines) {
        if (!line.empty()) {
            findings.push_back(line);
        }
    }
    return findings;
}

std::vector<std::string> parse_stash(const std::vector<std::string>& lines) {
    const bool has_stash = std::any_of(lines.begin(), lines.end(), [](const std::string& line) {
        return !line.empty();
    });
    if (!has_stash) {
        return {};
    }
    return {std::string{kStashFinding}};
}

} // namespace gitwip
