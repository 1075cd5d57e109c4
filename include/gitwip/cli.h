#pragma once

#include <CLI/CLI.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gitwip/config.h"

namespace gitwip {

class Cli {
public:
    Cli();
    ~Cli();

    // Returns an exit code when the process should stop right away (help,
    // version, or a command line error); otherwise options() is populated.
    std::optional<int> parse(int argc, char** argv);
    const Config::Options& options() const noexcept { return options_; }

    std::string usage_markdown() const;

private:
    struct OptionDoc {
        std::string name;
        std::string description;
        std::string default_value;
    };

    template <typename OptionPtr>
    void document_option(const OptionPtr& option);

    void add_search_options();
    void add_query_options();
    void add_output_options();

    std::unique_ptr<CLI::App> app_;
    Config::Options options_{};
    std::string log_level_{"error"};
    std::string git_executable_;
    std::string unmerged_into_;
    std::vector<OptionDoc> docs_;
};

} // namespace gitwip

#include "gitwip/cli.tpp"
