#include "gitwip/search_roots.h"

#include <system_error>

#include "gitwip/logger.h"
#include "gitwip/repository_locator.h"
#include "gitwip/utility.h"

namespace gitwip {
namespace {
std::vector<std::filesystem::path> existing_directories(const std::vector<std::string>& candidates) {
    std::vector<std::filesystem::path> dirs;
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_directory(candidate, ec)) {
            dirs.emplace_back(candidate);
        } else {
            Logger::instance().debug("ignoring {}: not a directory", candidate);
        }
    }
    return dirs;
}
} // namespace

SearchPlan resolve_search_plan(const std::vector<std::string>& args,
                               const std::optional<std::string>& env_roots,
                               const std::filesystem::path& cwd,
                               const std::optional<std::filesystem::path>& home) {
    if (!args.empty()) {
        return {ScanMode::ExplicitRoots, existing_directories(args)};
    }

    if (env_roots) {
        auto entries = split_whitespace(*env_roots);
        if (!entries.empty()) {
            return {ScanMode::EnvironmentRoots, existing_directories(entries)};
        }
    }

    if (auto enclosing = RepositoryLocator::find_enclosing_repository(cwd)) {
        return {ScanMode::EnclosingRepository, {*enclosing}};
    }

    if (!home) {
        Logger::instance().warn("cannot determine the home directory; nothing to scan");
        return {ScanMode::HomeDirectory, {}};
    }
    return {ScanMode::HomeDirectory, {*home}};
}

std::string_view to_string(ScanMode mode) noexcept {
    switch (mode) {
        case ScanMode::ExplicitRoots:
            return "arguments";
        case ScanMode::EnvironmentRoots:
            return "environment";
        case ScanMode::EnclosingRepository:
            return "enclosing repository";
        case ScanMode::HomeDirectory:
            return "home directory";
    }
    return "unknown";
}

} // namespace gitwip
