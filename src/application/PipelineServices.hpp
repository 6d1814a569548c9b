/**
 * @file PipelineServices.hpp
 * @brief Container for the pipeline services, wired once per process.
 */

#pragma once

#include <memory>
#include "application/BackupBuilder.hpp"
#include "application/HealthReporter.hpp"
#include "application/RotationManager.hpp"
#include "application/RouterService.hpp"
#include "application/UploadService.hpp"
#include "domain/BackupRepository.hpp"
#include "domain/StoragePort.hpp"

namespace dropkeeper::application {

struct PipelineServices {
    std::unique_ptr<domain::StoragePort> storage;
    std::unique_ptr<domain::BackupRepository> repository;
    std::unique_ptr<RouterService> router;
    std::unique_ptr<BackupBuilder> builder;
    std::unique_ptr<RotationManager> rotation;
    std::unique_ptr<UploadService> upload;
    std::unique_ptr<HealthReporter> health;
};

} // namespace dropkeeper::application
