#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gitwip {

// Depth-first directory walk driven by two predicates. A directory for which
// `is_excluded` holds is skipped entirely; one for which `is_match` holds is
// recorded and not descended into. Symlinked directories are never followed
// and unreadable directories are skipped with a warning.
class DirectoryWalker {
public:
    using Predicate = std::function<bool(const std::filesystem::path&)>;

    DirectoryWalker(Predicate is_match, Predicate is_excluded);

    [[nodiscard]] std::vector<std::filesystem::path> walk(const std::filesystem::path& root) const;

private:
    Predicate is_match_;
    Predicate is_excluded_;
};

struct ExclusionRules {
    std::vector<std::filesystem::path> paths;
    std::vector<std::string> name_patterns;

    [[nodiscard]] bool excludes(const std::filesystem::path& dir) const;
};

class RepositoryLocator {
public:
    explicit RepositoryLocator(ExclusionRules rules = {});

    // Sorted, deduplicated repository roots beneath every existing root.
    [[nodiscard]] std::vector<std::filesystem::path> find_repositories(
        const std::vector<std::filesystem::path>& roots) const;

    // Deepest directory at or above `dir` that holds version-control metadata.
    [[nodiscard]] static std::optional<std::filesystem::path> find_enclosing_repository(
        const std::filesystem::path& dir);

    [[nodiscard]] static bool is_repository_root(const std::filesystem::path& dir);

private:
    ExclusionRules rules_;
};

} // namespace gitwip
