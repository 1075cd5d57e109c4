#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gitwip {

struct CommandResult {
    // -1 when the process could not be started at all.
    int exit_code = -1;
    std::vector<std::string> lines;

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs the version-control tool against `repo_dir` with `args` following
    // the tool name. Never throws on a failing command; inspect exit_code.
    virtual CommandResult run(const std::filesystem::path& repo_dir, const std::vector<std::string>& args) = 0;
};

class GitCommandRunner final : public CommandRunner {
public:
    explicit GitCommandRunner(std::string executable = "git");

    CommandResult run(const std::filesystem::path& repo_dir, const std::vector<std::string>& args) override;

    // True when `<executable> --version` runs successfully.
    [[nodiscard]] bool available();

    [[nodiscard]] const std::string& executable() const noexcept { return executable_; }

private:
    CommandResult execute(const std::string& command);

    std::string executable_;
};

} // namespace gitwip
