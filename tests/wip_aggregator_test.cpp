#include <gtest/gtest.h>

#include "gitwip/wip_aggregator.h"
#include "test_support.h"

namespace gitwip {
namespace {

using test::FakeRunner;

const std::filesystem::path kRepo{"/work/project"};

TEST(WipAggregator, SingleModifiedFile) {
    FakeRunner runner;
    runner.set("status", {" M README.md"});
    runner.set("branch", {"* main 1a2b3c4 [origin/main] Initial commit"});

    const auto report = WipAggregator{runner}.collect(kRepo);
    EXPECT_EQ(report.repository, kRepo);
    EXPECT_EQ(report.findings, std::vector<std::string>{" M README.md"});
    EXPECT_TRUE(report.failures.empty());
}

TEST(WipAggregator, BranchAheadOfRemote) {
    FakeRunner runner;
    runner.set("branch", {"* main 1a2b3c4 [origin/main: ahead 2] Second commit"});

    const auto report = WipAggregator{runner}.collect(kRepo);
    EXPECT_EQ(report.findings, std::vector<std::string>{"main is ahead of its remote branch by 2 commits."});
}

TEST(WipAggregator, StashOnly) {
    FakeRunner runner;
    runner.set("branch", {"* main 1a2b3c4 [origin/main] Initial commit"});
    runner.set("stash", {"stash@{0}: WIP on main: 1a2b3c4 Initial commit"});

    const auto report = WipAggregator{runner}.collect(kRepo);
    EXPECT_EQ(report.findings, std::vector<std::string>{"There are stashed changes."});
}

TEST(WipAggregator, CleanRepositoryHasNoFindings) {
    FakeRunner runner;
    runner.set("branch", {"* main 1a2b3c4 [origin/main] Initial commit"});

    const auto report = WipAggregator{runner}.collect(kRepo);
    EXPECT_TRUE(report.clean());
    EXPECT_TRUE(report.failures.empty());
}

TEST(WipAggregator, FindingsFollowStatusBranchStashOrder) {
    FakeRunner runner;
    runner.set("status", {"?? new.txt", " D old.txt"});
    runner.set("branch", {
        "* main    1a2b3c4 [origin/main: ahead 1] M",
        "  feature 2b3c4d5 F",
    });
    runner.set("stash", {"stash@{0}: On main: saved"});

    const std::vector<std::string> expected{
        "?? new.txt",
        " D old.txt",
        "feature is not tracking a remote branch.",
        "main is ahead of its remote branch by 1 commits.",
        "There are stashed changes.",
    };
    EXPECT_EQ(WipAggregator{runner}.collect(kRepo).findings, expected);
}

TEST(WipAggregator, RunsExpectedQueriesInRepository) {
    FakeRunner runner;
    (void)WipAggregator{runner}.collect(kRepo);

    ASSERT_EQ(runner.calls.size(), 3u);
    for (const auto& [dir, args] : runner.calls) {
        EXPECT_EQ(dir, kRepo);
    }
    EXPECT_EQ(runner.calls[0].second, (std::vector<std::string>{"status", "--porcelain", "--untracked-files=all"}));
    EXPECT_EQ(runner.calls[1].second, (std::vector<std::string>{"branch", "-vv", "--no-color"}));
    EXPECT_EQ(runner.calls[2].second, (std::vector<std::string>{"stash", "list"}));
}

TEST(WipAggregator, UnmergedIntoFiltersBranchQuery) {
    FakeRunner runner;
    WipAggregator aggregator{runner, WipAggregator::Options{std::string{"main"}}};
    (void)aggregator.collect(kRepo);

    ASSERT_EQ(runner.calls.size(), 3u);
    EXPECT_EQ(runner.calls[1].second, (std::vector<std::string>{"branch", "-vv", "--no-color", "--no-merged", "main"}));
}

TEST(WipAggregator, FailedQueryIsReportedAndOthersStillRun) {
    FakeRunner runner;
    runner.set("status", {}, 128);
    runner.set("branch", {"  topic 1a2b3c4 T"});
    runner.set("stash", {"stash@{0}: x"});

    const auto report = WipAggregator{runner}.collect(kRepo);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures.front().query, "status");
    EXPECT_EQ(report.failures.front().exit_code, 128);
    const std::vector<std::string> expected{
        "topic is not tracking a remote branch.",
        "There are stashed changes.",
    };
    EXPECT_EQ(report.findings, expected);
}

TEST(WipAggregator, OutputOfFailedQueryIsDiscarded) {
    FakeRunner runner;
    runner.set("stash", {"fatal: not a git repository"}, 128);

    const auto report = WipAggregator{runner}.collect(kRepo);
    EXPECT_TRUE(report.findings.empty());
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures.front().query, "stash");
}

TEST(WipAggregator, RepeatedCollectionIsIdempotent) {
    FakeRunner runner;
    runner.set("status", {" M a.cpp"});
    runner.set("branch", {"* main 1a2b3c4 [origin/main: ahead 5] M"});
    runner.set("stash", {"stash@{0}: x"});

    WipAggregator aggregator{runner};
    const auto first = aggregator.collect(kRepo);
    const auto second = aggregator.collect(kRepo);
    EXPECT_EQ(first.findings, second.findings);
}

} // namespace
} // namespace gitwip
