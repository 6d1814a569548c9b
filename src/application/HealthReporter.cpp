/**
 * @file HealthReporter.cpp
 * @brief Implementation of the HealthReporter class.
 */
#include "application/HealthReporter.hpp"
#include "infrastructure/ZipArchiver.hpp"

#include <exception>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace dropkeeper::application {

namespace {

domain::HealthCheckResult Check(const std::string& name, bool ok, const std::string& reason) {
    return domain::HealthCheckResult{name, ok ? domain::HealthStatus::Pass : domain::HealthStatus::Fail, reason};
}

std::string Hours(std::chrono::system_clock::duration d) {
    return std::to_string(std::chrono::duration_cast<std::chrono::hours>(d).count()) + "h";
}

} // namespace

HealthReporter::HealthReporter(const domain::Configuration& config, domain::BackupRepository& repository,
                               const domain::StoragePort* storage)
    : m_config(config), m_repository(repository), m_storage(storage) {}

domain::HealthReport HealthReporter::run(std::chrono::system_clock::time_point now) const {
    domain::HealthReport report;

    std::vector<std::string> missing;
    for (const auto& folder : m_config.requiredFolders()) {
        std::error_code ec;
        if (!fs::is_directory(folder, ec)) missing.push_back(folder);
    }
    report.checks.push_back(Check("required_folders", missing.empty(),
        missing.empty() ? "all " + std::to_string(m_config.requiredFolders().size()) + " folders present"
                        : std::to_string(missing.size()) + " missing, first: " + missing.front()));

    std::vector<std::string> unmapped;
    for (const auto& [extension, category] : m_config.routing.extensionToCategory) {
        if (m_config.routing.categoryToFolder.count(category) == 0) unmapped.push_back(extension);
    }
    for (const auto& rule : m_config.routing.keywordRules) {
        if (m_config.routing.categoryToFolder.count(rule.category) == 0) unmapped.push_back("keyword rule " + rule.category);
    }
    if (m_config.routing.categoryToFolder.count(m_config.routing.fallbackCategory) == 0) {
        unmapped.push_back("fallback");
    }
    report.checks.push_back(Check("routing_table", unmapped.empty(),
        unmapped.empty() ? std::to_string(m_config.routing.extensionToCategory.size()) + " rules, all categories mapped"
                         : "no folder for " + unmapped.front()));

    std::vector<domain::BackupArtifact> artifacts;
    std::string listError;
    try {
        artifacts = m_repository.listArtifacts();
    } catch (const std::exception& e) {
        listError = e.what();
    }

    const auto& policy = m_config.backup.retention;
    if (!listError.empty()) {
        report.checks.push_back(Check("working_count", false, "cannot list backups: " + listError));
        report.checks.push_back(Check("archive_count", false, "cannot list backups: " + listError));
        report.checks.push_back(Check("latest_backup_age", false, "cannot list backups: " + listError));
        report.checks.push_back(Check("latest_backup_size", false, "cannot list backups: " + listError));
    } else {
        int working = 0;
        int archive = 0;
        const domain::BackupArtifact* newestWorking = nullptr;
        for (const auto& a : artifacts) {
            if (a.generation == domain::GenerationClass::Working) {
                ++working;
                newestWorking = &a; // listArtifacts() is oldest first
            } else {
                ++archive;
            }
        }

        report.checks.push_back(Check("working_count", working <= policy.maxWorking,
            std::to_string(working) + " of max " + std::to_string(policy.maxWorking)));
        report.checks.push_back(Check("archive_count", archive <= policy.maxArchive,
            std::to_string(archive) + " of max " + std::to_string(policy.maxArchive)));

        if (newestWorking == nullptr) {
            report.checks.push_back(Check("latest_backup_age", false, "no working backup"));
        } else {
            auto age = now - newestWorking->createdAt;
            bool fresh = age <= m_config.backup.expectedInterval;
            report.checks.push_back(Check("latest_backup_age", fresh,
                newestWorking->fileName() + " is " + Hours(age) + " old, limit " +
                std::to_string(m_config.backup.expectedInterval.count()) + "h"));
        }

        if (artifacts.empty()) {
            report.checks.push_back(Check("latest_backup_size", false, "no backup"));
        } else {
            const auto& newest = artifacts.back();
            bool bigEnough = newest.sizeBytes >= static_cast<long long>(policy.minSizeBytes);
            report.checks.push_back(Check("latest_backup_size", bigEnough,
                newest.fileName() + " is " + std::to_string(newest.sizeBytes) + " bytes, minimum " +
                std::to_string(policy.minSizeBytes)));
        }
    }

    if (m_storage == nullptr) {
        report.checks.push_back(Check("storage_session", false, "no storage configured"));
    } else {
        bool authenticated = m_storage->isAuthenticated();
        report.checks.push_back(Check("storage_session", authenticated,
            m_storage->providerName() + (authenticated ? " session established" : " not authenticated")));
    }

    bool zip = infrastructure::ZipArchiver::IsAvailable();
    report.checks.push_back(Check("archiver", zip, zip ? "zip found" : "zip not found on PATH"));

    return report;
}

} // namespace dropkeeper::application
