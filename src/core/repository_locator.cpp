#include "gitwip/repository_locator.h"

#include <algorithm>
#include <system_error>

#include "gitwip/logger.h"
#include "gitwip/utility.h"

namespace gitwip {
namespace {
constexpr const char* kMetadataDir = ".git";

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    auto result = absolute.lexically_normal();
    if (result.has_relative_path() && !result.has_filename()) {
        result = result.parent_path();
    }
    return result;
}
} // namespace

DirectoryWalker::DirectoryWalker(Predicate is_match, Predicate is_excluded)
    : is_match_{std::move(is_match)}, is_excluded_{std::move(is_excluded)} {}

std::vector<std::filesystem::path> DirectoryWalker::walk(const std::filesystem::path& root) const {
    std::vector<std::filesystem::path> matches;
    std::vector<std::filesystem::path> pending{root};

    while (!pending.empty()) {
        std::filesystem::path dir = std::move(pending.back());
        pending.pop_back();

        if (is_excluded_ && is_excluded_(dir)) {
            Logger::instance().debug("excluded {}", dir.string());
            continue;
        }
        if (is_match_(dir)) {
            matches.push_back(dir);
            continue;
        }

        std::error_code ec;
        std::filesystem::directory_iterator it{dir, ec};
        if (ec) {
            Logger::instance().warn("cannot read {}: {}", dir.string(), ec.message());
            continue;
        }
        const std::filesystem::directory_iterator end{};
        while (it != end) {
            std::error_code entry_ec;
            const auto& entry = *it;
            if (!entry.is_symlink(entry_ec) && entry.is_directory(entry_ec)) {
                pending.push_back(entry.path());
            }
            it.increment(ec);
            if (ec) {
                Logger::instance().warn("stopped reading {}: {}", dir.string(), ec.message());
                break;
            }
        }
    }
    return matches;
}

bool ExclusionRules::excludes(const std::filesystem::path& dir) const {
    if (std::find(paths.begin(), paths.end(), dir) != paths.end()) {
        return true;
    }
    const std::string name = dir.filename().string();
    return std::any_of(name_patterns.begin(), name_patterns.end(), [&](const std::string& pattern) {
        return wildcard_match(pattern, name);
    });
}

RepositoryLocator::RepositoryLocator(ExclusionRules rules)
    : rules_{std::move(rules)} {
    for (auto& path : rules_.paths) {
        path = normalized(path);
    }
}

std::vector<std::filesystem::path> RepositoryLocator::find_repositories(
    const std::vector<std::filesystem::path>& roots) const {
    DirectoryWalker walker{
        [](const std::filesystem::path& dir) { return is_repository_root(dir); },
        [this](const std::filesystem::path& dir) { return rules_.excludes(dir); },
    };

    std::vector<std::filesystem::path> repositories;
    for (const auto& root : roots) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            Logger::instance().debug("skipping missing root {}", root.string());
            continue;
        }
        auto found = walker.walk(normalized(root));
        Logger::instance().info("{}: {} repositories", root.string(), found.size());
        repositories.insert(repositories.end(), found.begin(), found.end());
    }

    std::sort(repositories.begin(), repositories.end());
    repositories.erase(std::unique(repositories.begin(), repositories.end()), repositories.end());
    return repositories;
}

std::optional<std::filesystem::path> RepositoryLocator::find_enclosing_repository(const std::filesystem::path& dir) {
    std::filesystem::path current = normalized(dir);
    while (!current.empty()) {
        if (is_repository_root(current)) {
            return current;
        }
        auto parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = std::move(parent);
    }
    return std::nullopt;
}

bool RepositoryLocator::is_repository_root(const std::filesystem::path& dir) {
    std::error_code ec;
    const auto status = std::filesystem::status(dir / kMetadataDir, ec);
    if (ec) {
        return false;
    }
    // Linked worktrees and submodules carry a ".git" file instead of a directory.
    return std::filesystem::is_directory(status) || std::filesystem::is_regular_file(status);
}

} // namespace gitwip
