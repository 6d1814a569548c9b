/**
 * @file RotationManager.cpp
 * @brief Implementation of the RotationManager class.
 */
#include "application/RotationManager.hpp"

#include <algorithm>
#include <exception>

namespace dropkeeper::application {

namespace {

void Report(const std::function<void(std::string)>& cb, const std::string& message) {
    if (cb) cb(message);
}

} // namespace

std::string ToString(AdmissionStatus status) {
    switch (status) {
        case AdmissionStatus::Admitted: return "admitted";
        case AdmissionStatus::RejectedUndersized: return "rejected_undersized";
        case AdmissionStatus::Failed: return "failed";
    }
    return "failed";
}

RotationManager::RotationManager(domain::BackupRepository& repository,
                                 domain::StoragePort* storage,
                                 const domain::RetentionPolicy& policy,
                                 const std::string& prefix)
    : m_repository(repository), m_storage(storage), m_policy(policy), m_prefix(prefix) {}

bool RotationManager::isValid(const domain::BackupArtifact& artifact) const {
    return artifact.sizeBytes >= static_cast<long long>(m_policy.minSizeBytes);
}

AdmissionResult RotationManager::admit(const domain::BackupArtifact& staged,
                                       std::function<void(std::string)> statusCallback) {
    AdmissionResult result;
    result.artifact = staged;

    try {
        auto existing = m_repository.listArtifacts();
        bool hasValidWorking = std::any_of(existing.begin(), existing.end(), [this](const domain::BackupArtifact& a) {
            return a.generation == domain::GenerationClass::Working && isValid(a);
        });

        if (!isValid(staged) && hasValidWorking) {
            result.status = AdmissionStatus::RejectedUndersized;
            result.message = staged.fileName() + " is " + std::to_string(staged.sizeBytes) +
                             " bytes, below the " + std::to_string(m_policy.minSizeBytes) + " byte minimum";
            try {
                m_repository.discardStaged(staged);
            } catch (const std::exception& e) {
                result.message += "; staged file kept: " + std::string(e.what());
            }
            Report(statusCallback, "[RotationManager] Rejected " + result.message);
            result.rotation = enforce(statusCallback);
            return result;
        }

        result.artifact = m_repository.admit(staged);
        result.artifact.remoteKey = domain::RemoteKeyFor(m_prefix, result.artifact);
        result.status = AdmissionStatus::Admitted;
        result.message = isValid(result.artifact) ? "admitted" : "admitted undersized backup, no valid backup exists";
        Report(statusCallback, "[RotationManager] Admitted " + result.artifact.fileName() +
                               (isValid(result.artifact) ? "" : " (undersized)"));
    } catch (const std::exception& e) {
        result.status = AdmissionStatus::Failed;
        result.message = e.what();
        Report(statusCallback, "[RotationManager] Admission failed: " + result.message);
        return result;
    }

    result.rotation = enforce(statusCallback);
    return result;
}

RotationReport RotationManager::enforce(std::function<void(std::string)> statusCallback) {
    RotationReport report;

    std::vector<domain::BackupArtifact> all;
    try {
        all = m_repository.listArtifacts();
    } catch (const std::exception& e) {
        report.errors.push_back(std::string("cannot list backups: ") + e.what());
        Report(statusCallback, "[RotationManager] " + report.errors.back());
        return report;
    }

    std::vector<domain::BackupArtifact> working;
    std::vector<domain::BackupArtifact> archive;
    for (const auto& a : all) {
        (a.generation == domain::GenerationClass::Working ? working : archive).push_back(a);
    }

    // Demote oldest working backups beyond W.
    while (static_cast<int>(working.size()) > m_policy.maxWorking) {
        domain::BackupArtifact oldest = working.front();
        try {
            domain::BackupArtifact demoted = m_repository.demote(oldest);
            working.erase(working.begin());
            archive.push_back(demoted);
            std::sort(archive.begin(), archive.end(), domain::IsOlder);
            report.demoted.push_back(demoted);
            Report(statusCallback, "[RotationManager] Demoted " + demoted.fileName() + " to archive");
        } catch (const std::exception& e) {
            report.errors.push_back("cannot demote " + oldest.fileName() + ": " + e.what());
            Report(statusCallback, "[RotationManager] " + report.errors.back());
            break;
        }
    }

    // Evict oldest archive backups beyond A, never the last valid one.
    while (static_cast<int>(archive.size()) > m_policy.maxArchive) {
        int validCount = static_cast<int>(std::count_if(working.begin(), working.end(),
            [this](const domain::BackupArtifact& a) { return isValid(a); }));
        validCount += static_cast<int>(std::count_if(archive.begin(), archive.end(),
            [this](const domain::BackupArtifact& a) { return isValid(a); }));

        size_t victim = 0;
        if (isValid(archive[victim]) && validCount == 1) {
            if (archive.size() < 2) {
                report.warnings.push_back("keeping " + archive[victim].fileName() +
                                          ": it is the only valid backup");
                Report(statusCallback, "[RotationManager] Warning: " + report.warnings.back());
                break;
            }
            victim = 1;
        }

        EvictionRecord record = evict(archive[victim], statusCallback);
        bool localGone = record.localDeleted;
        report.evicted.push_back(record);
        if (!localGone) {
            break;
        }
        archive.erase(archive.begin() + static_cast<std::ptrdiff_t>(victim));
    }

    report.workingCount = static_cast<int>(working.size());
    report.archiveCount = static_cast<int>(archive.size());
    return report;
}

EvictionRecord RotationManager::evict(const domain::BackupArtifact& artifact, std::function<void(std::string)>& statusCallback) {
    EvictionRecord record;
    record.artifact = artifact;
    record.artifact.remoteKey = domain::RemoteKeyFor(m_prefix, artifact);

    try {
        m_repository.removeLocal(artifact);
        record.localDeleted = true;
    } catch (const std::exception& e) {
        record.localError = e.what();
    }

    if (m_storage == nullptr || !m_storage->isAuthenticated()) {
        record.remoteMessage = "storage not available, remote copy not checked";
    } else {
        domain::ListResult listing = m_storage->list(domain::RemotePrefixFor(m_prefix, artifact.kind));
        if (!listing.success) {
            record.remoteAttempted = true;
            record.remoteError = listing.error;
            record.remoteMessage = listing.message;
        } else {
            auto it = std::find_if(listing.refs.begin(), listing.refs.end(), [&record](const domain::RemoteRef& ref) {
                return ref.key == record.artifact.remoteKey;
            });
            if (it == listing.refs.end()) {
                record.remoteMessage = "not uploaded";
            } else {
                record.remoteAttempted = true;
                domain::DeleteResult deletion = m_storage->remove(*it);
                record.remoteDeleted = deletion.success;
                record.remoteError = deletion.error;
                record.remoteMessage = deletion.message;
            }
        }
    }

    std::string line = "[RotationManager] Evicted " + artifact.fileName() +
                       " local=" + (record.localDeleted ? "deleted" : "failed (" + record.localError + ")");
    if (record.remoteAttempted) {
        line += " remote=" + (record.remoteDeleted ? std::string("deleted") : "failed (" + domain::ToString(record.remoteError) + ")");
    } else {
        line += " remote=skipped";
    }
    Report(statusCallback, line);
    return record;
}

} // namespace dropkeeper::application
