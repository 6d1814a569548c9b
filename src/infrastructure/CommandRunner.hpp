/**
 * @file CommandRunner.hpp
 * @brief Thin wrapper around popen() for the external tools DropKeeper drives (zip, storage CLIs).
 */

#pragma once
#include <chrono>
#include <string>

namespace dropkeeper::infrastructure {

/**
 * @struct CommandResult
 * @brief Exit status and combined stdout/stderr of a finished command.
 */
struct CommandResult {
    int exitCode = -1;     ///< -1 when the process could not be started.
    std::string output;
    bool timedOut = false; ///< Killed by the timeout wrapper: exit status 124 after the limit elapsed.
};

class CommandRunner {
public:
    /** @brief Runs @p command through /bin/sh, capturing stdout and stderr. */
    static CommandResult Run(const std::string& command);

    /**
     * @brief Runs @p command under coreutils `timeout`.
     * @param timeout Wall-clock limit; the command is killed once it elapses.
     *
     * Exit status 124 returned before the limit is the command's own status
     * and is reported as a plain failure.
     */
    static CommandResult RunWithTimeout(const std::string& command, std::chrono::seconds timeout);

    /** @brief True if @p tool is found on PATH. */
    static bool HasTool(const std::string& tool);

    /** @brief Single-quotes @p arg for safe interpolation into a shell command. */
    static std::string Quote(const std::string& arg);
};

} // namespace dropkeeper::infrastructure
