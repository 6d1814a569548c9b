/**
 * @file BackupRepositoryFs.cpp
 * @brief Implementation of the BackupRepositoryFs class.
 */
#include "infrastructure/BackupRepositoryFs.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace dropkeeper::infrastructure {

BackupRepositoryFs::BackupRepositoryFs(const std::string& prefix, const std::string& workingPath, const std::string& archivePath)
    : m_prefix(prefix), m_workingPath(workingPath), m_archivePath(archivePath) {}

void BackupRepositoryFs::ensureDirectories() const {
    if (!fs::exists(m_workingPath)) fs::create_directories(m_workingPath);
    if (!fs::exists(m_archivePath)) fs::create_directories(m_archivePath);
}

void BackupRepositoryFs::scanDirectory(const std::string& dir, domain::GenerationClass generation,
                                       std::vector<domain::BackupArtifact>& out) const {
    if (!fs::exists(dir)) return;

    for (const auto& entry : fs::directory_iterator(dir)) {
        std::error_code ec;
        if (!entry.is_regular_file(ec)) continue;

        auto parsed = domain::ParseArtifactFileName(m_prefix, entry.path().filename().string());
        if (!parsed) continue;

        domain::BackupArtifact artifact;
        artifact.createdAt = parsed->createdAt;
        artifact.sequence = parsed->sequence;
        artifact.kind = parsed->kind;
        artifact.localPath = entry.path().string();
        artifact.generation = generation;
        auto size = entry.file_size(ec);
        artifact.sizeBytes = ec ? 0 : static_cast<long long>(size);
        out.push_back(artifact);
    }
}

std::vector<domain::BackupArtifact> BackupRepositoryFs::listArtifacts() {
    std::vector<domain::BackupArtifact> artifacts;
    scanDirectory(m_workingPath, domain::GenerationClass::Working, artifacts);
    // Archive may be configured as a subdirectory of working; directory_iterator is not recursive.
    if (fs::path(m_archivePath).lexically_normal() != fs::path(m_workingPath).lexically_normal()) {
        scanDirectory(m_archivePath, domain::GenerationClass::Archive, artifacts);
    }
    std::sort(artifacts.begin(), artifacts.end(), domain::IsOlder);
    return artifacts;
}

std::string BackupRepositoryFs::stagingDirectory() const {
    return (fs::path(m_workingPath) / ".staging").string();
}

domain::BackupArtifact BackupRepositoryFs::admit(const domain::BackupArtifact& staged) {
    ensureDirectories();

    long long nextSequence = 1;
    for (const auto& existing : listArtifacts()) {
        nextSequence = std::max(nextSequence, existing.sequence + 1);
    }

    domain::BackupArtifact admitted = staged;
    admitted.sequence = nextSequence;
    admitted.generation = domain::GenerationClass::Working;
    fs::path target = fs::path(m_workingPath) /
                      domain::ArtifactFileName(m_prefix, staged.kind, staged.createdAt, nextSequence);
    if (fs::exists(target)) {
        throw fs::filesystem_error("backup name already taken", staged.localPath, target,
                                   std::make_error_code(std::errc::file_exists));
    }
    fs::rename(staged.localPath, target);
    admitted.localPath = target.string();
    admitted.sizeBytes = static_cast<long long>(fs::file_size(target));
    return admitted;
}

domain::BackupArtifact BackupRepositoryFs::demote(const domain::BackupArtifact& artifact) {
    ensureDirectories();

    fs::path target = fs::path(m_archivePath) / artifact.fileName();
    if (fs::exists(target)) {
        throw fs::filesystem_error("archive already holds this backup", artifact.localPath, target,
                                   std::make_error_code(std::errc::file_exists));
    }
    fs::rename(artifact.localPath, target);

    domain::BackupArtifact demoted = artifact;
    demoted.localPath = target.string();
    demoted.generation = domain::GenerationClass::Archive;
    return demoted;
}

void BackupRepositoryFs::removeLocal(const domain::BackupArtifact& artifact) {
    if (!fs::remove(artifact.localPath)) {
        throw fs::filesystem_error("backup file not found", artifact.localPath,
                                   std::make_error_code(std::errc::no_such_file_or_directory));
    }
}

void BackupRepositoryFs::discardStaged(const domain::BackupArtifact& staged) {
    std::error_code ec;
    fs::remove(staged.localPath, ec);
    if (ec) {
        throw fs::filesystem_error("cannot discard staged backup", staged.localPath, ec);
    }
}

} // namespace dropkeeper::infrastructure
