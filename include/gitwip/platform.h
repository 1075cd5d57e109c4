#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitwip::platform {

// Empty or unset variables yield std::nullopt.
[[nodiscard]] std::optional<std::string> environment_value(std::string_view name);

// $HOME first, then the passwd entry of the current user.
[[nodiscard]] std::optional<std::filesystem::path> home_directory();

// Well-known directories under `home` that never hold working trees worth
// reporting but are expensive to walk (trash, caches, media libraries).
[[nodiscard]] std::vector<std::filesystem::path> default_excluded_paths(const std::filesystem::path& home);

} // namespace gitwip::platform
