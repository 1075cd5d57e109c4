#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitwip {

inline constexpr std::string_view kRootsEnvironmentVariable = "GITWIP_ROOTS";

enum class ScanMode {
    ExplicitRoots,
    EnvironmentRoots,
    EnclosingRepository,
    HomeDirectory
};

struct SearchPlan {
    ScanMode mode = ScanMode::HomeDirectory;
    // Search roots, or the single repository for EnclosingRepository.
    std::vector<std::filesystem::path> roots;

    [[nodiscard]] bool needs_search() const noexcept { return mode != ScanMode::EnclosingRepository; }
};

// Positional arguments win over the environment list, which wins over the
// repository enclosing `cwd`, which wins over `home`. Arguments and
// environment entries that are not existing directories are dropped.
[[nodiscard]] SearchPlan resolve_search_plan(const std::vector<std::string>& args,
                                             const std::optional<std::string>& env_roots,
                                             const std::filesystem::path& cwd,
                                             const std::optional<std::filesystem::path>& home);

[[nodiscard]] std::string_view to_string(ScanMode mode) noexcept;

} // namespace gitwip
