/**
 * @file BackupBuilder.hpp
 * @brief Snapshots the document tree into a single zip artifact.
 */

#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "domain/BackupArtifact.hpp"
#include "domain/Configuration.hpp"

namespace dropkeeper::application {

/**
 * @class BackupBuilder
 * @brief Walks the tree, applies exclusions and packs the result into staging.
 *
 * The artifact lands in the staging directory and is not visible to rotation
 * until the Rotation Manager admits it.
 */
class BackupBuilder {
public:
    /**
     * @enum BuildStatus
     * @brief Outcome of one build.
     */
    enum class BuildStatus {
        Built,      ///< Artifact produced and at least the minimum size.
        Undersized, ///< Artifact produced but smaller than the configured minimum.
        PackError   ///< Nothing usable was produced.
    };

    struct BuildResult {
        BuildStatus status = BuildStatus::PackError;
        domain::BackupArtifact artifact; ///< Staged artifact; valid unless PackError.
        int memberCount = 0;
        std::string message;
    };

    /** @param config Deployment configuration; must outlive the builder. */
    explicit BackupBuilder(const domain::Configuration& config);

    /** @brief Builds a backup of @p kind stamped with the current time. */
    BuildResult build(domain::BackupKind kind, std::function<void(std::string)> statusCallback = nullptr);

    /** @brief Builds a backup stamped with @p createdAt (truncated to seconds). */
    BuildResult buildAt(domain::BackupKind kind, std::chrono::system_clock::time_point createdAt,
                        std::function<void(std::string)> statusCallback = nullptr);

    /**
     * @brief Tree-relative paths (generic separators) that go into the archive, sorted.
     * @throws std::filesystem::filesystem_error if the tree root cannot be listed.
     */
    std::vector<std::string> collectMembers() const;

    /** @brief True if the tree-relative @p relativePath must stay out of backups. */
    bool isExcluded(const std::string& relativePath) const;

    static std::string ToString(BuildStatus status);

private:
    const domain::Configuration& m_config;
    std::vector<std::string> m_skippedDirectories; ///< Absolute, normalized.

    bool isSkippedDirectory(const std::string& absolutePath) const;
};

} // namespace dropkeeper::application
