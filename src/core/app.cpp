#include "gitwip/app.h"

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "gitwip/cli.h"
#include "gitwip/command_runner.h"
#include "gitwip/config.h"
#include "gitwip/logger.h"
#include "gitwip/platform.h"
#include "gitwip/renderer.h"
#include "gitwip/repository_locator.h"
#include "gitwip/search_roots.h"
#include "gitwip/wip_aggregator.h"

namespace gitwip {

namespace {
constexpr int kExitQueryFailed = 1;
constexpr int kExitGitMissing = 3;

ExclusionRules make_exclusions(const Config::Options& options, const std::optional<std::filesystem::path>& home) {
    ExclusionRules rules;
    rules.name_patterns = options.exclude_patterns;
    if (options.use_default_excludes && home) {
        rules.paths = platform::default_excluded_paths(*home);
    }
    return rules;
}
} // namespace

class App::Impl {
public:
    int run(int argc, char** argv) {
        Cli cli;
        if (auto code = cli.parse(argc, argv)) {
            return *code;
        }
        Config::instance().set_program_name(argc > 0 && argv ? argv[0] : "gitwip");
        Config::instance().set_options(cli.options());
        const auto& options = Config::instance().options();
        Logger::instance().set_level(options.log_level);

        if (options.dump_markdown) {
            std::cout << cli.usage_markdown();
            return 0;
        }

        GitCommandRunner runner{options.git_executable};
        if (!options.list_only && !runner.available()) {
            std::cerr << "gitwip: cannot run '" << runner.executable() << "'; is git installed and on PATH?\n";
            return kExitGitMissing;
        }

        const auto home = platform::home_directory();
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (ec) {
            Logger::instance().warn("cannot determine the current directory: {}", ec.message());
            cwd.clear();
        }

        const SearchPlan plan = resolve_search_plan(options.paths, platform::environment_value(kRootsEnvironmentVariable),
                                                    cwd, home);
        Logger::instance().info("scan mode: {} ({} root(s))", to_string(plan.mode), plan.roots.size());

        std::vector<std::filesystem::path> repositories = plan.roots;
        if (plan.needs_search()) {
            RepositoryLocator locator{make_exclusions(options, home)};
            repositories = locator.find_repositories(plan.roots);
        }

        Renderer renderer{options, std::cout};
        if (options.list_only) {
            renderer.render_repositories(repositories);
            return 0;
        }

        WipAggregator aggregator{runner, WipAggregator::Options{options.unmerged_into}};
        bool any_failure = false;
        for (const auto& repository : repositories) {
            try {
                const WipReport report = aggregator.collect(repository);
                renderer.render(report);
                for (const auto& failure : report.failures) {
                    std::cerr << "gitwip: " << repository.string() << ": git " << failure.query
                              << " failed (exit " << failure.exit_code << ")\n";
                    any_failure = true;
                }
            } catch (const std::exception& e) {
                std::cerr << "gitwip: " << repository.string() << ": " << e.what() << '\n';
                any_failure = true;
            }
        }

        return any_failure ? kExitQueryFailed : 0;
    }
};

App::App()
    : impl_{std::make_unique<Impl>()} {}

App::~App() = default;

int App::run(int argc, char** argv) {
    return impl_->run(argc, argv);
}

} // namespace gitwip
