/**
 * @file ZipArchiver.cpp
 * @brief Implementation of ZipArchiver.
 */

#include "infrastructure/ZipArchiver.hpp"
#include "infrastructure/CommandRunner.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace dropkeeper::infrastructure {

bool ZipArchiver::IsAvailable() {
    return CommandRunner::HasTool("zip");
}

ZipArchiver::ArchiveResult ZipArchiver::Create(const std::string& root,
                                               const std::vector<std::string>& members,
                                               const std::string& outputPath,
                                               const std::string& listPath) {
    ArchiveResult result;
    if (members.empty()) {
        result.message = "nothing to archive";
        return result;
    }
    if (!IsAvailable()) {
        result.message = "'zip' command not found";
        return result;
    }

    std::error_code ec;
    fs::remove(outputPath, ec); // zip would otherwise update an existing archive in place

    {
        std::ofstream list(listPath, std::ios::trunc);
        if (!list.is_open()) {
            result.message = "cannot write member list: " + listPath;
            return result;
        }
        for (const auto& member : members) {
            list << member << '\n';
        }
        if (list.fail()) {
            result.message = "cannot write member list: " + listPath;
            return result;
        }
    }

    // -X: no extra attributes, -D: no directory entries, -@: names from stdin
    std::string cmd = "cd " + CommandRunner::Quote(root) + " && zip -X -D -q " +
                      CommandRunner::Quote(outputPath) + " -@ < " + CommandRunner::Quote(listPath);
    CommandResult run = CommandRunner::Run(cmd);
    fs::remove(listPath, ec);

    if (run.exitCode != 0) {
        result.message = "zip exited with status " + std::to_string(run.exitCode) +
                         (run.output.empty() ? "" : ": " + run.output);
        fs::remove(outputPath, ec);
        return result;
    }
    if (!fs::exists(outputPath)) {
        result.message = "zip reported success but produced no archive";
        return result;
    }

    result.success = true;
    return result;
}

} // namespace dropkeeper::infrastructure
