#include "gitwip/cli.h"

#include <map>
#include <sstream>

#include "gitwip/platform.h"
#include "gitwip/search_roots.h"
#include "gitwip/version.h"

namespace gitwip {

namespace {
constexpr std::string_view kDescription =
    "gitwip: list uncommitted changes, unpushed branches and stashes across git repositories";

constexpr std::string_view kGitEnvironmentVariable = "GITWIP_GIT";

std::optional<Logger::Level> parse_log_level(const std::string& value) {
    static const std::map<std::string, Logger::Level, std::less<>> table{
        {"error", Logger::Level::Error},
        {"warn", Logger::Level::Warning},
        {"warning", Logger::Level::Warning},
        {"info", Logger::Level::Info},
        {"debug", Logger::Level::Debug},
        {"trace", Logger::Level::Trace},
    };
    auto it = table.find(value);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}
} // namespace

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription}, "gitwip")} {
    app_->set_version_flag("--version", std::string{Version::String()});
    app_->footer(R"(Without DIR arguments the directories listed (whitespace separated) in
GITWIP_ROOTS are searched. If that is unset and the current directory is inside
a repository, only that repository is reported; otherwise the home directory
is searched.

Exit status:
 0  if OK, with or without findings,
 1  if a git query failed for at least one repository,
 2  if the command line is invalid,
 3  if git cannot be run.)");

    auto* paths = app_->add_option("dirs", options_.paths, "Directories to search for repositories")
                      ->type_name("DIR")
                      ->expected(0, -1);
    document_option(paths);

    add_search_options();
    add_query_options();
    add_output_options();

    auto* log_level = app_->add_option("-v,--log-level", log_level_, "Diagnostics verbosity (error, warn, info, debug, trace)")
                          ->type_name("LEVEL")
                          ->default_str("error")
                          ->check([](const std::string& value) -> std::string {
                              return parse_log_level(value) ? std::string{} : "invalid log level: " + value;
                          });
    document_option(log_level);

    auto* dump = app_->add_flag("--dump-markdown", options_.dump_markdown,
                                "Print CLI options as markdown and exit");
    dump->configurable(false);
    document_option(dump);
}

Cli::~Cli() = default;

void Cli::add_search_options() {
    auto search = app_->add_option_group("Search");

    auto* exclude = search->add_option("-x,--exclude", options_.exclude_patterns,
                                       "Skip directories whose name matches PATTERN (* and ? wildcards)");
    exclude->type_name("PATTERN")->expected(1)->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);
    document_option(exclude);

    document_option(search->add_flag_callback("--no-default-excludes", [&]() { options_.use_default_excludes = false; },
                                              "Also search trash, cache and media directories"));
}

void Cli::add_query_options() {
    auto query = app_->add_option_group("Query");

    auto* unmerged = query->add_option("--unmerged-into", unmerged_into_,
                                       "Only report branches not yet merged into BRANCH; a repository without "
                                       "BRANCH counts as a failed query (exit status 1)");
    unmerged->type_name("BRANCH");
    document_option(unmerged);

    auto* git = query->add_option("--git", git_executable_, "git executable to run (default: $GITWIP_GIT or git)");
    git->type_name("EXE");
    document_option(git);
}

void Cli::add_output_options() {
    auto output = app_->add_option_group("Output");

    document_option(output->add_flag_callback("-l,--list", [&]() { options_.list_only = true; },
                                              "Only list repository roots, without querying them"));

    document_option(output->add_flag_callback("--full-path", [&]() { options_.full_path = true; },
                                              "Label repositories with their full path"));
}

std::optional<int> Cli::parse(int argc, char** argv) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& ex) {
        const int code = app_->exit(ex);
        return code == 0 ? 0 : 2;
    }

    if (auto level = parse_log_level(log_level_)) {
        options_.log_level = *level;
    }
    if (!unmerged_into_.empty()) {
        options_.unmerged_into = unmerged_into_;
    }
    if (!git_executable_.empty()) {
        options_.git_executable = git_executable_;
    } else if (auto from_env = platform::environment_value(kGitEnvironmentVariable)) {
        options_.git_executable = *from_env;
    }
    return std::nullopt;
}

std::string Cli::usage_markdown() const {
    std::ostringstream out;
    out << "### Command line options\n\n";
    out << "| Option | Description | Default |\n";
    out << "| ------ | ----------- | ------- |\n";
    for (const auto& doc : docs_) {
        out << "| `" << doc.name << "` | " << doc.description << " | "
            << (doc.default_value.empty() ? "" : doc.default_value) << " |\n";
    }
    out << '\n';
    out << "Environment: `" << kRootsEnvironmentVariable << "`, `" << kGitEnvironmentVariable << "`.\n";
    return out.str();
}

} // namespace gitwip
