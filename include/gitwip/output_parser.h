#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gitwip {

inline constexpr std::string_view kStashFinding = "There are stashed changes.";

// One finding per non-empty line of `status --porcelain`, verbatim.
[[nodiscard]] std::vector<std::string> parse_status(const std::vector<std::string>& lines);

// At most one finding; only the presence of a stash matters.
[[nodiscard]] std::vector<std::string> parse_stash(const std::vector<std::string>& lines);

} // namespace gitwip
