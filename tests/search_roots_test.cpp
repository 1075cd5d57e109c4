#include <gtest/gtest.h>

#include <fstream>

#include "gitwip/repository_locator.h"
#include "gitwip/search_roots.h"
#include "test_support.h"

namespace gitwip {
namespace {

using test::TempDir;
namespace fs = std::filesystem;

TEST(SearchPlan, ArgumentsWinAndMissingOnesAreDropped) {
    TempDir tmp;
    auto src = tmp.mkdir("src");
    auto repo = tmp.make_repo("src/app");

    const auto plan = resolve_search_plan({src.string(), (tmp.path() / "missing").string()},
                                          tmp.path().string(), repo, tmp.path());
    EXPECT_EQ(plan.mode, ScanMode::ExplicitRoots);
    EXPECT_EQ(plan.roots, std::vector<fs::path>{src});
    EXPECT_TRUE(plan.needs_search());
}

TEST(SearchPlan, ArgumentsThatAreFilesAreDropped) {
    TempDir tmp;
    std::ofstream(tmp.path() / "file.txt") << "x";

    const auto plan = resolve_search_plan({(tmp.path() / "file.txt").string()}, std::nullopt, tmp.path(), tmp.path());
    EXPECT_EQ(plan.mode, ScanMode::ExplicitRoots);
    EXPECT_TRUE(plan.roots.empty());
}

TEST(SearchPlan, EnvironmentListIsSplitOnWhitespace) {
    TempDir tmp;
    auto a = tmp.mkdir("a");
    auto b = tmp.mkdir("b");

    const std::string env = a.string() + "\n\t" + (tmp.path() / "gone").string() + "  " + b.string();
    const auto plan = resolve_search_plan({}, env, tmp.path(), tmp.path());
    EXPECT_EQ(plan.mode, ScanMode::EnvironmentRoots);
    const std::vector<fs::path> expected{a, b};
    EXPECT_EQ(plan.roots, expected);
}

TEST(SearchPlan, BlankEnvironmentFallsThrough) {
    TempDir tmp;
    auto repo = tmp.make_repo("work");
    auto inside = tmp.mkdir("work/src");

    const auto plan = resolve_search_plan({}, std::string{" \t "}, inside, tmp.path());
    EXPECT_EQ(plan.mode, ScanMode::EnclosingRepository);
    EXPECT_EQ(plan.roots, std::vector<fs::path>{repo});
    EXPECT_FALSE(plan.needs_search());
}

TEST(SearchPlan, EnclosingRepositoryBeatsHome) {
    TempDir tmp;
    auto repo = tmp.make_repo("home/me/project");
    auto inside = tmp.mkdir("home/me/project/a/b/c");

    const auto plan = resolve_search_plan({}, std::nullopt, inside, tmp.path() / "home" / "me");
    EXPECT_EQ(plan.mode, ScanMode::EnclosingRepository);
    EXPECT_EQ(plan.roots, std::vector<fs::path>{repo});
}

TEST(SearchPlan, FallsBackToHome) {
    TempDir tmp;
    auto home = tmp.mkdir("home/me");
    auto cwd = tmp.mkdir("elsewhere");
    if (RepositoryLocator::find_enclosing_repository(cwd)) {
        GTEST_SKIP() << "temporary directory lives inside a repository";
    }

    const auto plan = resolve_search_plan({}, std::nullopt, cwd, home);
    EXPECT_EQ(plan.mode, ScanMode::HomeDirectory);
    EXPECT_EQ(plan.roots, std::vector<fs::path>{home});
}

TEST(SearchPlan, UnknownHomeGivesEmptyPlan) {
    TempDir tmp;
    auto cwd = tmp.mkdir("elsewhere");
    if (RepositoryLocator::find_enclosing_repository(cwd)) {
        GTEST_SKIP() << "temporary directory lives inside a repository";
    }

    const auto plan = resolve_search_plan({}, std::nullopt, cwd, std::nullopt);
    EXPECT_EQ(plan.mode, ScanMode::HomeDirectory);
    EXPECT_TRUE(plan.roots.empty());
}

} // namespace
} // namespace gitwip
