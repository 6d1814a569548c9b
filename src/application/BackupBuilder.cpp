/**
 * @file BackupBuilder.cpp
 * @brief Implementation of the BackupBuilder class.
 */
#include "application/BackupBuilder.hpp"
#include "infrastructure/ZipArchiver.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fnmatch.h>
#include <set>

namespace fs = std::filesystem;

namespace dropkeeper::application {

namespace {

const std::set<std::string> kExcludedNames = {"__MACOSX", "Thumbs.db", "desktop.ini"};
const std::set<std::string> kExcludedExtensions = {".tmp", ".log"};

std::string Normalize(const std::string& path) {
    fs::path p = fs::path(path).lexically_normal();
    if (!p.has_filename() && p.has_parent_path()) {
        p = p.parent_path();
    }
    return p.string();
}

bool MatchesGlob(const std::string& pattern, const std::string& text) {
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

void Report(const std::function<void(std::string)>& cb, const std::string& message) {
    if (cb) cb(message);
}

} // namespace

BackupBuilder::BackupBuilder(const domain::Configuration& config)
    : m_config(config) {
    m_skippedDirectories.push_back(Normalize(config.backup.directory));
    m_skippedDirectories.push_back(Normalize(config.backup.archiveDirectory));
    m_skippedDirectories.push_back(Normalize(config.backup.stagingDirectory()));
    m_skippedDirectories.push_back(Normalize(config.dropZone));
    if (!config.storage.localStoragePath.empty()) {
        m_skippedDirectories.push_back(Normalize(config.storage.localStoragePath));
    }
}

std::string BackupBuilder::ToString(BuildStatus status) {
    switch (status) {
        case BuildStatus::Built: return "built";
        case BuildStatus::Undersized: return "undersized";
        case BuildStatus::PackError: return "pack_error";
    }
    return "pack_error";
}

bool BackupBuilder::isSkippedDirectory(const std::string& absolutePath) const {
    std::string normalized = Normalize(absolutePath);
    return std::find(m_skippedDirectories.begin(), m_skippedDirectories.end(), normalized) != m_skippedDirectories.end();
}

bool BackupBuilder::isExcluded(const std::string& relativePath) const {
    const fs::path rel(relativePath);
    for (const auto& part : rel) {
        const std::string name = part.string();
        if (name.empty() || name == ".") continue;
        if (name[0] == '.') return true; // hidden entries, .git, .svn, .hg, .staging
        if (kExcludedNames.count(name) != 0) return true;
    }

    const std::string filename = rel.filename().string();
    std::string ext = rel.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    if (kExcludedExtensions.count(ext) != 0) return true;
    if (std::find(m_config.ignoredNames.begin(), m_config.ignoredNames.end(), filename) != m_config.ignoredNames.end()) {
        return true;
    }
    if (domain::IsBackupFileName(m_config.backup.prefix, filename)) return true;

    for (const auto& pattern : m_config.backup.excludePatterns) {
        if (MatchesGlob(pattern, relativePath) || MatchesGlob(pattern, filename)) return true;
    }
    return false;
}

std::vector<std::string> BackupBuilder::collectMembers() const {
    std::vector<std::string> members;
    const fs::path root(m_config.baseDir);

    auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        const std::string rel = entry.path().lexically_relative(root).generic_string();

        std::error_code ec;
        if (entry.is_symlink(ec)) continue;

        if (entry.is_directory(ec)) {
            if (isSkippedDirectory(entry.path().string()) || isExcluded(rel)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;
        if (isExcluded(rel)) continue;
        members.push_back(rel);
    }

    std::sort(members.begin(), members.end());
    return members;
}

BackupBuilder::BuildResult BackupBuilder::build(domain::BackupKind kind, std::function<void(std::string)> statusCallback) {
    return buildAt(kind, std::chrono::system_clock::now(), std::move(statusCallback));
}

BackupBuilder::BuildResult BackupBuilder::buildAt(domain::BackupKind kind, std::chrono::system_clock::time_point createdAt,
                                                  std::function<void(std::string)> statusCallback) {
    BuildResult result;
    createdAt = std::chrono::time_point_cast<std::chrono::seconds>(createdAt);

    std::vector<std::string> members;
    try {
        members = collectMembers();
    } catch (const fs::filesystem_error& e) {
        result.message = std::string("cannot walk tree: ") + e.what();
        Report(statusCallback, "[BackupBuilder] " + result.message);
        return result;
    }
    result.memberCount = static_cast<int>(members.size());
    Report(statusCallback, "[BackupBuilder] " + std::to_string(members.size()) + " file(s) selected from " + m_config.baseDir);

    const fs::path staging(m_config.backup.stagingDirectory());
    std::error_code ec;
    fs::create_directories(staging, ec);
    if (ec) {
        result.message = "cannot create staging directory: " + ec.message();
        Report(statusCallback, "[BackupBuilder] " + result.message);
        return result;
    }

    const std::string fileName = domain::StagedFileName(m_config.backup.prefix, kind, createdAt);
    const fs::path output = staging / fileName;
    const fs::path listFile = staging / (".members-" + domain::FormatTimestamp(createdAt) + ".txt");

    auto archive = infrastructure::ZipArchiver::Create(m_config.baseDir, members, output.string(), listFile.string());
    if (!archive.success) {
        result.message = archive.message;
        Report(statusCallback, "[BackupBuilder] Packing failed: " + result.message);
        return result;
    }

    result.artifact.createdAt = createdAt;
    result.artifact.kind = kind;
    result.artifact.localPath = output.string();
    result.artifact.generation = domain::GenerationClass::Working;
    result.artifact.sizeBytes = static_cast<long long>(fs::file_size(output, ec));
    if (ec) {
        result.message = "cannot measure archive: " + ec.message();
        return result;
    }

    const auto minimum = static_cast<long long>(m_config.backup.retention.minSizeBytes);
    if (result.artifact.sizeBytes < minimum) {
        result.status = BuildStatus::Undersized;
        result.message = "archive is " + std::to_string(result.artifact.sizeBytes) +
                         " bytes, minimum is " + std::to_string(minimum);
    } else {
        result.status = BuildStatus::Built;
        result.message = "archive is " + std::to_string(result.artifact.sizeBytes) + " bytes";
    }
    Report(statusCallback, "[BackupBuilder] " + fileName + ": " + result.message);
    return result;
}

} // namespace dropkeeper::application
