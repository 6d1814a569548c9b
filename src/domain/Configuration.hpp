/**
 * @file Configuration.hpp
 * @brief Immutable deployment configuration shared by every component.
 *
 * Built once at startup by infrastructure::ConfigLoader and passed by const
 * reference. All paths are absolute once loading is done.
 */

#pragma once
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/BackupArtifact.hpp"
#include "domain/RetentionPolicy.hpp"

namespace dropkeeper::domain {

/**
 * @class ConfigError
 * @brief Malformed routing, retention or storage settings. Fatal at startup.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct KeywordRule
 * @brief Routes a file by words in its name, ahead of the extension table.
 *
 * Matches when at least minMatches of the keywords occur in the lower-cased
 * file name.
 */
struct KeywordRule {
    std::string category;
    std::vector<std::string> keywords; ///< Lower-case substrings.
    int minMatches = 1;
};

/**
 * @struct RoutingTable
 * @brief File name keywords / extension -> category -> destination folder.
 */
struct RoutingTable {
    std::vector<KeywordRule> keywordRules;                  ///< Checked in order; first match wins.
    std::map<std::string, std::string> extensionToCategory; ///< Keys are lower-case and start with '.'.
    std::map<std::string, std::string> categoryToFolder;    ///< Absolute destination directories.
    std::string fallbackCategory = "unclassified";          ///< Used for unmapped extensions.
};

/**
 * @struct BackupSettings
 * @brief Where backups live and how long they are kept.
 */
struct BackupSettings {
    std::string prefix = "DropKeeper_Backup";
    std::string directory;        ///< Working generation.
    std::string archiveDirectory; ///< Archive generation.
    RetentionPolicy retention;
    BackupKind schedule = BackupKind::Daily;
    std::chrono::hours expectedInterval{26};
    std::vector<std::string> excludePatterns; ///< Glob patterns matched against tree-relative paths.

    /** @brief Hidden directory holding artifacts that were built but not yet admitted. */
    std::string stagingDirectory() const { return directory + "/.staging"; }
};

/**
 * @struct CommandTemplates
 * @brief Shell command lines used by command-driven storage bindings.
 *
 * Placeholders: {file}, {key}, {prefix}.
 */
struct CommandTemplates {
    std::string authenticate;
    std::string put;
    std::string list;
    std::string remove;
};

/**
 * @struct StorageSettings
 * @brief Selection and tuning of the single Storage Port binding.
 */
struct StorageSettings {
    std::string provider = "local";
    std::string localStoragePath;
    CommandTemplates commands;
    std::chrono::seconds timeout{300};
    int maxAttempts = 3;
    std::chrono::seconds retryDelay{30};
};

/**
 * @struct Configuration
 * @brief Root configuration object.
 */
struct Configuration {
    std::string companyName;
    std::string baseDir;
    std::string dropZone;
    RoutingTable routing;
    std::vector<std::string> ignoredNames;
    bool sniffContent = true;
    BackupSettings backup;
    StorageSettings storage;

    /** @brief Every folder the Health Reporter expects to exist. */
    std::vector<std::string> requiredFolders() const {
        std::vector<std::string> folders;
        folders.push_back(dropZone);
        for (const auto& [category, folder] : routing.categoryToFolder) {
            folders.push_back(folder);
        }
        folders.push_back(backup.directory);
        folders.push_back(backup.archiveDirectory);
        return folders;
    }
};

} // namespace dropkeeper::domain
