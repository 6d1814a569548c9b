/**
 * @file UploadService.cpp
 * @brief Implementation of the UploadService class.
 */
#include "application/UploadService.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <thread>

namespace dropkeeper::application {

namespace {

void Report(const std::function<void(std::string)>& cb, const std::string& message) {
    if (cb) cb(message);
}

} // namespace

UploadService::UploadService(domain::BackupRepository& repository,
                             domain::StoragePort& storage,
                             const std::string& prefix,
                             int maxAttempts,
                             std::chrono::seconds retryDelay)
    : m_repository(repository), m_storage(storage), m_prefix(prefix),
      m_maxAttempts(std::max(1, maxAttempts)), m_retryDelay(retryDelay) {}

domain::PutResult UploadService::putWithRetry(const domain::BackupArtifact& artifact, const std::string& key,
                                              int& attempts, std::function<void(std::string)>& statusCallback) {
    domain::PutResult result;
    for (attempts = 1; attempts <= m_maxAttempts; ++attempts) {
        result = m_storage.put(artifact, key);
        if (result.ref) {
            return result;
        }
        if (!domain::IsRetryable(result.error) || attempts == m_maxAttempts) {
            return result;
        }
        Report(statusCallback, "[UploadService] " + key + ": " + domain::ToString(result.error) +
                               ", retrying (" + std::to_string(attempts) + "/" + std::to_string(m_maxAttempts) + ")");
        if (m_retryDelay.count() > 0) {
            std::this_thread::sleep_for(m_retryDelay);
        }
    }
    attempts = m_maxAttempts;
    return result;
}

UploadReport UploadService::uploadPending(domain::BackupKind kind, std::function<void(std::string)> statusCallback) {
    UploadReport report;

    if (!m_storage.isAuthenticated()) {
        domain::AuthResult auth = m_storage.authenticate();
        if (!auth.session) {
            report.failures.push_back(UploadFailure{"", auth.error, auth.message, 1});
            Report(statusCallback, "[UploadService] Authentication with " + m_storage.providerName() + " failed: " + auth.message);
            return report;
        }
    }

    const std::string remotePrefix = domain::RemotePrefixFor(m_prefix, kind);
    domain::ListResult listing = m_storage.list(remotePrefix);
    if (!listing.success) {
        report.failures.push_back(UploadFailure{"", listing.error, listing.message, 1});
        Report(statusCallback, "[UploadService] Cannot list " + remotePrefix + ": " + listing.message);
        return report;
    }
    std::set<std::string> remoteKeys;
    for (const auto& ref : listing.refs) {
        remoteKeys.insert(ref.key);
    }

    std::vector<domain::BackupArtifact> artifacts;
    try {
        artifacts = m_repository.listArtifacts();
    } catch (const std::exception& e) {
        report.failures.push_back(UploadFailure{"", domain::StorageError::UploadError,
                                                std::string("cannot list local backups: ") + e.what(), 0});
        return report;
    }

    for (const auto& artifact : artifacts) {
        if (artifact.kind != kind) continue;

        const std::string key = domain::RemoteKeyFor(m_prefix, artifact);
        if (remoteKeys.count(key) != 0) {
            report.alreadyRemote.push_back(key);
            continue;
        }

        int attempts = 0;
        domain::PutResult put = putWithRetry(artifact, key, attempts, statusCallback);
        if (put.ref) {
            report.uploaded.push_back(key);
            remoteKeys.insert(key);
            Report(statusCallback, "[UploadService] Uploaded " + key + " to " + m_storage.providerName());
        } else {
            report.failures.push_back(UploadFailure{key, put.error, put.message, attempts});
            Report(statusCallback, "[UploadService] Upload of " + key + " failed after " + std::to_string(attempts) +
                                   " attempt(s): " + put.message);
        }
    }
    return report;
}

} // namespace dropkeeper::application
