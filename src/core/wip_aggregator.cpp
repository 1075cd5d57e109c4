#include "gitwip/wip_aggregator.h"

#include <iterator>
#include <utility>

#include "gitwip/branch_tracking.h"
#include "gitwip/logger.h"
#include "gitwip/output_parser.h"
#include "gitwip/perf.h"

namespace gitwip {
namespace {
const std::vector<std::string> kStatusArgs{"status", "--porcelain", "--untracked-files=all"};
const std::vector<std::string> kStashArgs{"stash", "list"};

void append(std::vector<std::string>& out, std::vector<std::string> more) {
    out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}
} // namespace

WipAggregator::WipAggregator(CommandRunner& runner)
    : WipAggregator{runner, Options{}} {}

WipAggregator::WipAggregator(CommandRunner& runner, Options options)
    : runner_{runner}, options_{std::move(options)} {}

WipReport WipAggregator::collect(const std::filesystem::path& repository) const {
    perf::ScopedTimer timer{"wip:" + repository.string()};

    WipReport report;
    report.repository = repository;

    if (auto lines = query(repository, kStatusArgs, report)) {
        append(report.findings, parse_status(*lines));
    }
    if (auto lines = query(repository, branch_arguments(), report)) {
        append(report.findings, render_branch_findings(analyze_branches(*lines)));
    }
    if (auto lines = query(repository, kStashArgs, report)) {
        append(report.findings, parse_stash(*lines));
    }
    return report;
}

std::vector<std::string> WipAggregator::branch_arguments() const {
    // color.ui=always would otherwise wrap branch names in escape codes.
    std::vector<std::string> args{"branch", "-vv", "--no-color"};
    if (options_.unmerged_into) {
        args.emplace_back("--no-merged");
        args.push_back(*options_.unmerged_into);
    }
    return args;
}

std::optional<std::vector<std::string>> WipAggregator::query(const std::filesystem::path& repository,
                                                             const std::vector<std::string>& args,
                                                             WipReport& report) const {
    auto result = runner_.run(repository, args);
    if (!result.succeeded()) {
        Logger::instance().debug("{}: git {} exited with {}", repository.string(), args.front(), result.exit_code);
        report.failures.push_back({args.front(), result.exit_code});
        return std::nullopt;
    }
    return std::move(result.lines);
}

} // namespace gitwip
