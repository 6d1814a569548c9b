/**
 * @file HealthReporter.hpp
 * @brief Read-only checklist over folders, rotation state and storage.
 */

#pragma once
#include <chrono>

#include "domain/BackupRepository.hpp"
#include "domain/Configuration.hpp"
#include "domain/HealthCheck.hpp"
#include "domain/StoragePort.hpp"

namespace dropkeeper::application {

/**
 * @class HealthReporter
 * @brief Runs the fixed health checklist. Never changes anything on disk or remotely.
 */
class HealthReporter {
public:
    /**
     * @param config Deployment configuration; must outlive the reporter.
     * @param repository Local backup store.
     * @param storage Remote target; null reports the storage check as failed.
     */
    HealthReporter(const domain::Configuration& config, domain::BackupRepository& repository,
                   const domain::StoragePort* storage);

    /** @brief Evaluates every check against @p now. */
    domain::HealthReport run(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

private:
    const domain::Configuration& m_config;
    domain::BackupRepository& m_repository;
    const domain::StoragePort* m_storage;
};

} // namespace dropkeeper::application
