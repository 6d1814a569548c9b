/**
 * @file ConfigLoader.hpp
 * @brief Loads and validates the JSON deployment configuration.
 *
 * Produces the immutable domain::Configuration consumed by every service.
 * Any malformed value raises domain::ConfigError before the caller gets a
 * chance to touch the filesystem.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/Configuration.hpp"

namespace dropkeeper::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a configuration file.
     * @param path Path to the JSON file.
     * @throws domain::ConfigError if the file is missing, unparsable or invalid.
     */
    static domain::Configuration LoadFromFile(const std::string& path);

    /**
     * @brief Validates configuration given as JSON text.
     * @param jsonText Document contents.
     * @param baseDirOverride When set, replaces the "base_dir" key.
     */
    static domain::Configuration Parse(const std::string& jsonText,
                                       const std::optional<std::string>& baseDirOverride = std::nullopt);

    /**
     * @brief Built-in folder taxonomy and extension table rooted at @p baseDir.
     */
    static domain::Configuration Defaults(const std::string& baseDir);

    /**
     * @brief Picks the configuration file: explicit path, $DROPKEEPER_CONFIG, then the XDG location.
     */
    static std::string ResolveConfigPath(const std::optional<std::string>& explicitPath);

    /** @brief Serializes the effective configuration (used by the "info" command). */
    static std::string ToJson(const domain::Configuration& config);
};

} // namespace dropkeeper::infrastructure
