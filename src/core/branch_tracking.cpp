#include "gitwip/branch_tracking.h"

#include <charconv>
#include <format>
#include <regex>

#include "gitwip/logger.h"

namespace gitwip {
namespace {

// <marker> <name> <sha> [(<worktree>)] [<upstream>: <ahead/behind/gone>] <subject>
// The bracket only counts when it follows the sha (or the worktree path of a
// branch checked out elsewhere); brackets inside the subject are ignored.
const std::regex& branch_line_pattern() {
    static const std::regex pattern{R"(^([*+]?)\s*(\S+)\s+(\S+)(\s+\([^)]*\))?(?:\s+\[([^\]]*)\])?)"};
    return pattern;
}

const std::regex& ahead_pattern() {
    static const std::regex pattern{R"(\bahead (\d+))"};
    return pattern;
}

BranchTracking classify(const std::ssub_match& bracket) {
    if (!bracket.matched) {
        return BranchTracking::untracked();
    }
    const std::string info = bracket.str();
    std::smatch ahead;
    if (!std::regex_search(info, ahead, ahead_pattern())) {
        return BranchTracking::up_to_date();
    }
    const std::string digits = ahead[1].str();
    unsigned count = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), count);
    if (ec != std::errc{} || count == 0) {
        return BranchTracking::up_to_date();
    }
    return BranchTracking::ahead_by(count);
}

} // namespace

BranchTrackingMap analyze_branches(const std::vector<std::string>& lines) {
    BranchTrackingMap branches;
    for (const auto& line : lines) {
        std::smatch match;
        if (!std::regex_search(line, match, branch_line_pattern())) {
            continue;
        }
        std::string name = match[2].str();
        if (name.front() == '(') {
            Logger::instance().trace("skipping non-branch row: {}", line);
            continue;
        }
        // Only '+' rows carry a worktree path; elsewhere a parenthesis after
        // the sha starts the subject.
        const bool subject_parenthesis = match[4].matched && match[1].str() != "+";
        branches[std::move(name)] = subject_parenthesis ? BranchTracking::untracked() : classify(match[5]);
    }
    return branches;
}

std::vector<std::string> render_branch_findings(const BranchTrackingMap& branches) {
    std::vector<std::string> findings;
    for (const auto& [name, tracking] : branches) {
        switch (tracking.kind) {
            case BranchTracking::Kind::Untracked:
                findings.push_back(std::format("{} is not tracking a remote branch.", name));
                break;
            case BranchTracking::Kind::Ahead:
                findings.push_back(std::format("{} is ahead of its remote branch by {} commits.", name, tracking.ahead));
                break;
            case BranchTracking::Kind::UpToDate:
                break;
        }
    }
    return findings;
}

} // namespace gitwip
