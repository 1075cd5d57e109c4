#include <gtest/gtest.h>

#include "gitwip/utility.h"

namespace gitwip {
namespace {

TEST(SplitLines, AcceptsEveryLineEnding) {
    const std::vector<std::string> expected{"a", "b", "c", "d"};
    EXPECT_EQ(split_lines("a\nb\r\nc\rd"), expected);
}

TEST(SplitLines, TrailingTerminatorAddsNoEmptyLine) {
    EXPECT_EQ(split_lines("one\n"), std::vector<std::string>{"one"});
    EXPECT_EQ(split_lines("one\r\n"), std::vector<std::string>{"one"});
    EXPECT_TRUE(split_lines("").empty());
}

TEST(SplitLines, KeepsInteriorEmptyLines) {
    const std::vector<std::string> expected{"a", "", "b"};
    EXPECT_EQ(split_lines("a\n\nb\n"), expected);
}

TEST(SplitWhitespace, SplitsOnAnyWhitespace) {
    const std::vector<std::string> expected{"/src", "/work/repos", "~/x"};
    EXPECT_EQ(split_whitespace("  /src\t/work/repos\n ~/x  "), expected);
    EXPECT_TRUE(split_whitespace(" \t\n").empty());
}

TEST(WildcardMatch, StarAndQuestionMark) {
    EXPECT_TRUE(wildcard_match("node_*", "node_modules"));
    EXPECT_TRUE(wildcard_match("build-?", "build-x"));
    EXPECT_FALSE(wildcard_match("build-?", "build-xy"));
    EXPECT_TRUE(wildcard_match("*", ""));
    EXPECT_FALSE(wildcard_match("vendor", "vendors"));
}

#ifndef _WIN32
TEST(ShellQuote, EscapesSingleQuotes) {
    EXPECT_EQ(shell_quote(std::string_view{"it's"}), "'it'\\''s'");
    EXPECT_EQ(shell_quote(std::filesystem::path{"/tmp/a b"}), "'/tmp/a b'");
}
#endif

} // namespace
} // namespace gitwip
