/**
 * @file StorageFactory.cpp
 * @brief Implementation of the StorageFactory class.
 */
#include "infrastructure/StorageFactory.hpp"
#include "infrastructure/ExternalCommandStorage.hpp"
#include "infrastructure/LocalMirrorStorage.hpp"

namespace dropkeeper::infrastructure {

std::unique_ptr<domain::StoragePort> StorageFactory::Create(const domain::StorageSettings& settings) {
    const std::string& provider = settings.provider;
    if (provider == "local" || provider == "local-mirror") {
        return std::make_unique<LocalMirrorStorage>(settings.localStoragePath);
    }
    if (provider == "cloud-object-store" || provider == "s3" ||
        provider == "cloud-drive" || provider == "google_drive" || provider == "dropbox") {
        return std::make_unique<ExternalCommandStorage>(provider, settings.commands, settings.timeout);
    }
    throw domain::ConfigError("unknown storage provider '" + provider + "'");
}

} // namespace dropkeeper::infrastructure
