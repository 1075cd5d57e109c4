#pragma once

#include <map>
#include <string>
#include <vector>

namespace gitwip {

struct BranchTracking {
    enum class Kind {
        Untracked,
        UpToDate,
        Ahead
    };

    Kind kind = Kind::Untracked;
    unsigned ahead = 0; // only meaningful for Kind::Ahead

    static BranchTracking untracked() { return {Kind::Untracked, 0}; }
    static BranchTracking up_to_date() { return {Kind::UpToDate, 0}; }
    static BranchTracking ahead_by(unsigned count) { return {Kind::Ahead, count}; }

    friend bool operator==(const BranchTracking&, const BranchTracking&) = default;
};

using BranchTrackingMap = std::map<std::string, BranchTracking>;

// Classifies every branch row of `git branch -vv`. Rows that do not name a
// branch (detached HEAD, blank lines) are skipped; a repeated name keeps the
// last classification.
[[nodiscard]] BranchTrackingMap analyze_branches(const std::vector<std::string>& lines);

// Findings in lexicographic branch order; up-to-date branches render nothing.
[[nodiscard]] std::vector<std::string> render_branch_findings(const BranchTrackingMap& branches);

} // namespace gitwip
