#include <gtest/gtest.h>

#include "gitwip/output_parser.h"

namespace gitwip {
namespace {

TEST(OutputParser, StatusLinesAreKeptVerbatimInOrder) {
    const std::vector<std::string> lines{" M src/main.cpp", "?? notes/todo.txt", "A  include/new.h"};
    EXPECT_EQ(parse_status(lines), lines);
}

TEST(OutputParser, EmptyStatusMeansClean) {
    EXPECT_TRUE(parse_status({}).empty());
    EXPECT_TRUE(parse_status({""}).empty());
}

TEST(OutputParser, StashPresenceYieldsSingleFinding) {
    const auto findings = parse_stash({
        "stash@{0}: WIP on main: 1a2b3c4 Initial",
        "stash@{1}: On topic: experiment",
    });
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings.front(), "There are stashed changes.");
}

TEST(OutputParser, NoStashYieldsNothing) {
    EXPECT_TRUE(parse_stash({}).empty());
    EXPECT_TRUE(parse_stash({"", ""}).empty());
}

} // namespace
} // namespace gitwip
