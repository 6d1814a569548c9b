/**
 * @file ZipArchiver.hpp
 * @brief Packs a list of tree-relative paths into a zip archive using the `zip` tool.
 */

#pragma once
#include <string>
#include <vector>

namespace dropkeeper::infrastructure {

class ZipArchiver {
public:
    struct ArchiveResult {
        bool success = false;
        std::string message;
    };

    /** @brief True if the `zip` binary is reachable. */
    static bool IsAvailable();

    /**
     * @brief Creates @p outputPath from @p members, all relative to @p root.
     * @param listPath Scratch file receiving the member list (removed afterwards).
     */
    static ArchiveResult Create(const std::string& root,
                                const std::vector<std::string>& members,
                                const std::string& outputPath,
                                const std::string& listPath);
};

} // namespace dropkeeper::infrastructure
