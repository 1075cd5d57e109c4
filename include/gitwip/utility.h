#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gitwip {

// '*' matches any run of characters, '?' matches exactly one.
[[nodiscard]] bool wildcard_match(std::string_view pattern, std::string_view text);

// Splits on "\r\n", "\r" or "\n". A terminator at the very end does not
// yield a trailing empty line.
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view text);

[[nodiscard]] std::string shell_quote(std::string_view value);
[[nodiscard]] std::string shell_quote(const std::filesystem::path& path);

} // namespace gitwip
