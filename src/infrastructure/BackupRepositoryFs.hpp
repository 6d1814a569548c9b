/**
 * @file BackupRepositoryFs.hpp
 * @brief Filesystem-based implementation of the BackupRepository.
 */

#pragma once
#include "domain/BackupRepository.hpp"
#include <string>

namespace dropkeeper::infrastructure {

/**
 * @class BackupRepositoryFs
 * @brief Keeps working backups in one directory and archive backups in another.
 *
 * Rotation state lives entirely in file names
 * (<prefix>_<kind>_<YYYYMMDD-HHMMSS>_<seq>.zip); files not following the
 * scheme are ignored.
 */
class BackupRepositoryFs : public domain::BackupRepository {
public:
    /**
     * @param prefix Backup file name prefix.
     * @param workingPath Directory of the working generation.
     * @param archivePath Directory of the archive generation.
     */
    BackupRepositoryFs(const std::string& prefix, const std::string& workingPath, const std::string& archivePath);

    /** @brief Parses both directories. @see domain::BackupRepository::listArtifacts */
    std::vector<domain::BackupArtifact> listArtifacts() override;

    /** @see domain::BackupRepository::stagingDirectory */
    std::string stagingDirectory() const override;

    /** @brief Renames the staged file into the working directory with the next sequence number. */
    domain::BackupArtifact admit(const domain::BackupArtifact& staged) override;

    /** @brief Renames a working file into the archive directory. */
    domain::BackupArtifact demote(const domain::BackupArtifact& artifact) override;

    /** @see domain::BackupRepository::removeLocal */
    void removeLocal(const domain::BackupArtifact& artifact) override;

    /** @see domain::BackupRepository::discardStaged */
    void discardStaged(const domain::BackupArtifact& staged) override;

private:
    std::string m_prefix;
    std::string m_workingPath;
    std::string m_archivePath;

    void scanDirectory(const std::string& dir, domain::GenerationClass generation,
                       std::vector<domain::BackupArtifact>& out) const;
    void ensureDirectories() const;
};

} // namespace dropkeeper::infrastructure
