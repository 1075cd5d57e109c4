#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gitwip/logger.h"

namespace gitwip {

class Config {
public:
    struct Options {
        std::vector<std::string> paths;
        std::vector<std::string> exclude_patterns;
        std::optional<std::string> unmerged_into;
        std::string git_executable = "git";

        Logger::Level log_level = Logger::Level::Error;

        bool use_default_excludes = true;
        bool list_only = false;
        bool full_path = false;
        bool dump_markdown = false;
    };

    static Config& instance();

    void set_options(Options options);
    const Options& options() const noexcept;

    void set_program_name(std::string_view name);
    std::string_view program_name() const noexcept;

private:
    Config() = default;

    Options options_{};
    std::string program_name_;
};

} // namespace gitwip
