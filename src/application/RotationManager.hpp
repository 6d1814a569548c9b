/**
 * @file RotationManager.hpp
 * @brief Admission of new backups and enforcement of the retention policy.
 */

#pragma once
#include <functional>
#include <string>
#include <vector>

#include "domain/BackupArtifact.hpp"
#include "domain/BackupRepository.hpp"
#include "domain/RetentionPolicy.hpp"
#include "domain/StoragePort.hpp"

namespace dropkeeper::application {

/**
 * @struct EvictionRecord
 * @brief Local and remote outcome of deleting one archive artifact.
 *
 * The two deletions are independent; one failing never prevents the other.
 */
struct EvictionRecord {
    domain::BackupArtifact artifact;
    bool localDeleted = false;
    std::string localError;
    bool remoteAttempted = false; ///< False when the key was not found remotely or storage is unavailable.
    bool remoteDeleted = false;
    domain::StorageError remoteError = domain::StorageError::None;
    std::string remoteMessage;
};

/**
 * @struct RotationReport
 * @brief Demotions, evictions and resulting counts of one enforcement pass.
 */
struct RotationReport {
    std::vector<domain::BackupArtifact> demoted;
    std::vector<EvictionRecord> evicted;
    std::vector<std::string> warnings;
    std::vector<std::string> errors; ///< Local moves that could not be performed.
    int workingCount = 0;
    int archiveCount = 0;

    /** @brief Local or remote deletions that failed, plus local move errors. */
    int failures() const {
        int count = static_cast<int>(errors.size());
        for (const auto& e : evicted) {
            if (!e.localDeleted) ++count;
            if (e.remoteAttempted && !e.remoteDeleted) ++count;
        }
        return count;
    }
};

enum class AdmissionStatus {
    Admitted,
    RejectedUndersized, ///< A valid working backup exists; the tiny one was discarded.
    Failed              ///< The staged file could not be moved into place.
};

struct AdmissionResult {
    AdmissionStatus status = AdmissionStatus::Failed;
    domain::BackupArtifact artifact; ///< Final artifact when admitted, staged one otherwise.
    std::string message;
    RotationReport rotation;
};

std::string ToString(AdmissionStatus status);

/**
 * @class RotationManager
 * @brief Keeps at most W working and A archive backups.
 *
 * State is rebuilt from the repository on every call. Ordering is by creation
 * time, then insertion sequence. The oldest valid backup is never evicted if it
 * is the only valid one left.
 */
class RotationManager {
public:
    /**
     * @param repository Local backup store.
     * @param storage Remote target used for evictions; may be null.
     * @param policy Retention limits.
     * @param prefix Backup name prefix, used to derive remote keys.
     */
    RotationManager(domain::BackupRepository& repository,
                    domain::StoragePort* storage,
                    const domain::RetentionPolicy& policy,
                    const std::string& prefix);

    /**
     * @brief Admits a staged artifact and re-applies retention.
     * @param statusCallback Optional progress callback.
     */
    AdmissionResult admit(const domain::BackupArtifact& staged,
                          std::function<void(std::string)> statusCallback = nullptr);

    /** @brief Applies demotion and eviction to the current state without admitting anything. */
    RotationReport enforce(std::function<void(std::string)> statusCallback = nullptr);

    /** @brief True if @p artifact meets the minimum size. */
    bool isValid(const domain::BackupArtifact& artifact) const;

private:
    domain::BackupRepository& m_repository;
    domain::StoragePort* m_storage;
    domain::RetentionPolicy m_policy;
    std::string m_prefix;

    EvictionRecord evict(const domain::BackupArtifact& artifact, std::function<void(std::string)>& statusCallback);
};

} // namespace dropkeeper::application
