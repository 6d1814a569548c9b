/**
 * @file UploadService.hpp
 * @brief Pushes admitted backups to the remote target.
 */

#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "domain/BackupRepository.hpp"
#include "domain/StoragePort.hpp"

namespace dropkeeper::application {

struct UploadFailure {
    std::string key;
    domain::StorageError error = domain::StorageError::UploadError;
    std::string message;
    int attempts = 0;
};

/**
 * @struct UploadReport
 * @brief What one upload pass did.
 */
struct UploadReport {
    std::vector<std::string> uploaded;     ///< Keys written during this pass.
    std::vector<std::string> alreadyRemote; ///< Keys found in the remote listing.
    std::vector<UploadFailure> failures;   ///< Includes authentication and listing errors (empty key).

    bool success() const { return failures.empty(); }
};

/**
 * @class UploadService
 * @brief At-least-once delivery of admitted backups, idempotent by remote key.
 *
 * Every surviving local artifact of the requested kind whose key is missing
 * remotely is uploaded. Failed uploads stay local and are picked up again by
 * the next pass; rotation state is never touched.
 */
class UploadService {
public:
    /**
     * @param repository Local backup store.
     * @param storage Remote target.
     * @param prefix Backup name prefix, used to derive remote keys.
     * @param maxAttempts Attempts per artifact for retryable errors (at least 1).
     * @param retryDelay Pause between attempts.
     */
    UploadService(domain::BackupRepository& repository,
                  domain::StoragePort& storage,
                  const std::string& prefix,
                  int maxAttempts,
                  std::chrono::seconds retryDelay);

    /** @brief Uploads every pending artifact of @p kind. */
    UploadReport uploadPending(domain::BackupKind kind, std::function<void(std::string)> statusCallback = nullptr);

private:
    domain::BackupRepository& m_repository;
    domain::StoragePort& m_storage;
    std::string m_prefix;
    int m_maxAttempts;
    std::chrono::seconds m_retryDelay;

    domain::PutResult putWithRetry(const domain::BackupArtifact& artifact, const std::string& key,
                                   int& attempts, std::function<void(std::string)>& statusCallback);
};

} // namespace dropkeeper::application
