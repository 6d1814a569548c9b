/**
 * @file BackupRepository.hpp
 * @brief Interface for the local store of backup artifacts.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/BackupArtifact.hpp"

namespace dropkeeper::domain {

/**
 * @class BackupRepository
 * @brief Local persistence of admitted backups.
 *
 * The store is the only record of rotation state: listArtifacts() rebuilds it
 * from scratch on every call. Mutating operations throw
 * std::filesystem::filesystem_error (or std::runtime_error) on failure.
 */
class BackupRepository {
public:
    virtual ~BackupRepository() = default;

    /** @brief All admitted artifacts of both generations, oldest first. */
    virtual std::vector<BackupArtifact> listArtifacts() = 0;

    /** @brief Directory where the Backup Builder drops new archives. */
    virtual std::string stagingDirectory() const = 0;

    /**
     * @brief Moves a staged artifact into the working generation.
     * @return The artifact with its final path and sequence number.
     */
    virtual BackupArtifact admit(const BackupArtifact& staged) = 0;

    /** @brief Moves a working artifact into the archive generation. */
    virtual BackupArtifact demote(const BackupArtifact& artifact) = 0;

    /** @brief Deletes the local file of an admitted artifact. */
    virtual void removeLocal(const BackupArtifact& artifact) = 0;

    /** @brief Deletes a staged artifact that was refused admission. */
    virtual void discardStaged(const BackupArtifact& staged) = 0;
};

} // namespace dropkeeper::domain
