#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gitwip/command_runner.h"

namespace gitwip {

struct QueryFailure {
    std::string query;
    int exit_code = -1;
};

struct WipReport {
    std::filesystem::path repository;
    // Status lines, then branch findings, then the stash summary.
    std::vector<std::string> findings;
    std::vector<QueryFailure> failures;

    [[nodiscard]] bool clean() const noexcept { return findings.empty(); }
};

class WipAggregator {
public:
    struct Options {
        // Restricts the branch query to branches not merged into this one.
        std::optional<std::string> unmerged_into;
    };

    explicit WipAggregator(CommandRunner& runner);
    WipAggregator(CommandRunner& runner, Options options);

    [[nodiscard]] WipReport collect(const std::filesystem::path& repository) const;

private:
    [[nodiscard]] std::vector<std::string> branch_arguments() const;
    [[nodiscard]] std::optional<std::vector<std::string>> query(const std::filesystem::path& repository,
                                                                const std::vector<std::string>& args,
                                                                WipReport& report) const;

    CommandRunner& runner_;
    Options options_;
};

} // namespace gitwip
