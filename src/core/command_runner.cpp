#include "gitwip/command_runner.h"

#include <array>
#include <cstdio>
#include <memory>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#include "gitwip/logger.h"
#include "gitwip/utility.h"

namespace gitwip {
namespace {
#ifndef _WIN32
using popen_handle = std::unique_ptr<FILE, decltype(&pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(::popen(command.c_str(), "r"), pclose);
}
constexpr const char* kDiscardStderr = " 2>/dev/null";
#else
using popen_handle = std::unique_ptr<FILE, decltype(&_pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(_popen(command.c_str(), "r"), _pclose);
}
constexpr const char* kDiscardStderr = " 2>NUL";
#endif

int close_pipe(popen_handle pipe) {
#ifndef _WIN32
    const int status = ::pclose(pipe.release());
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
#else
    return ::_pclose(pipe.release());
#endif
}

} // namespace

GitCommandRunner::GitCommandRunner(std::string executable)
    : executable_{std::move(executable)} {}

CommandResult GitCommandRunner::run(const std::filesystem::path& repo_dir, const std::vector<std::string>& args) {
    std::string command = shell_quote(std::string_view{executable_}) + " -C " + shell_quote(repo_dir);
    for (const auto& arg : args) {
        command += ' ';
        command += shell_quote(std::string_view{arg});
    }
    return execute(command);
}

bool GitCommandRunner::available() {
    auto result = execute(shell_quote(std::string_view{executable_}) + " --version");
    if (result.succeeded() && !result.lines.empty()) {
        Logger::instance().debug("using {}", result.lines.front());
        return true;
    }
    return false;
}

CommandResult GitCommandRunner::execute(const std::string& command) {
    Logger::instance().trace("exec: {}", command);

    CommandResult result;
    auto pipe = make_pipe(command + kDiscardStderr);
    if (!pipe) {
        Logger::instance().warn("failed to start: {}", command);
        return result;
    }

    std::array<char, 4096> buffer{};
    std::string output;
    while (true) {
        std::size_t bytes = std::fread(buffer.data(), 1, buffer.size(), pipe.get());
        if (bytes == 0) {
            break;
        }
        output.append(buffer.data(), bytes);
    }

    result.exit_code = close_pipe(std::move(pipe));
    result.lines = split_lines(output);
    Logger::instance().trace("exit {} with {} line(s)", result.exit_code, result.lines.size());
    return result;
}

} // namespace gitwip
