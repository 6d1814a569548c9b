/**
 * @file CommandRunner.cpp
 * @brief Implementation of CommandRunner.
 */

#include "infrastructure/CommandRunner.hpp"
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace dropkeeper::infrastructure {

namespace {

constexpr int kTimeoutExitCode = 124;

} // namespace

CommandResult CommandRunner::Run(const std::string& command) {
    CommandResult result;
    std::string cmd = command + " 2>&1";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.output = "popen failed to start command";
        return result;
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }
    int status = pclose(pipe);
    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

CommandResult CommandRunner::RunWithTimeout(const std::string& command, std::chrono::seconds timeout) {
    std::string wrapped = "timeout --kill-after=5 " + std::to_string(timeout.count()) + " /bin/sh -c " + Quote(command);
    auto started = std::chrono::steady_clock::now();
    CommandResult result = Run(wrapped);
    auto elapsed = std::chrono::steady_clock::now() - started;
    // A command may exit with 124 on its own; only count it once the limit has passed.
    result.timedOut = (result.exitCode == kTimeoutExitCode) && elapsed >= timeout;
    return result;
}

bool CommandRunner::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + Quote(tool) + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

std::string CommandRunner::Quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace dropkeeper::infrastructure
