/**
 * @file StorageFactory.hpp
 * @brief Selects the StoragePort binding named in the configuration.
 */

#pragma once
#include <memory>
#include "domain/Configuration.hpp"
#include "domain/StoragePort.hpp"

namespace dropkeeper::infrastructure {

class StorageFactory {
public:
    /**
     * @brief Builds the one storage binding used for the lifetime of the process.
     * @throws domain::ConfigError for an unknown provider.
     */
    static std::unique_ptr<domain::StoragePort> Create(const domain::StorageSettings& settings);
};

} // namespace dropkeeper::infrastructure
