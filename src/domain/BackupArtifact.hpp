/**
 * @file BackupArtifact.hpp
 * @brief Domain entity for a backup archive and the naming scheme that encodes its state on disk.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace dropkeeper::domain {

/**
 * @enum BackupKind
 * @brief Schedule slot a backup was taken for.
 */
enum class BackupKind {
    Daily,
    Weekly,
    Monthly
};

/**
 * @enum GenerationClass
 * @brief Retention tier of an admitted backup.
 */
enum class GenerationClass {
    Working, ///< Most recent backups, full priority.
    Archive  ///< Older backups kept for historical recovery.
};

std::string ToString(BackupKind kind);
std::optional<BackupKind> ParseBackupKind(const std::string& text);
std::string ToString(GenerationClass generation);

/**
 * @class BackupArtifact
 * @brief One zip archive produced by the Backup Builder.
 *
 * Generation and survival are decided by the Rotation Manager only.
 */
class BackupArtifact {
public:
    std::chrono::system_clock::time_point createdAt; ///< UTC, second resolution.
    long long sequence = 0;    ///< Insertion order; breaks timestamp ties.
    BackupKind kind = BackupKind::Daily;
    long long sizeBytes = 0;
    std::string localPath;
    std::string remoteKey;     ///< Empty until the key is known.
    GenerationClass generation = GenerationClass::Working;

    /** @brief Basename of the local file. */
    std::string fileName() const;
};

/**
 * @brief Strict ordering used everywhere backups are compared by age.
 * @return True if @p a is older than @p b (timestamp, then sequence).
 */
bool IsOlder(const BackupArtifact& a, const BackupArtifact& b);

/** @brief Formats a timestamp as YYYYMMDD-HHMMSS (UTC). */
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

/** @brief Parses the YYYYMMDD-HHMMSS form back into a UTC time point. */
std::optional<std::chrono::system_clock::time_point> ParseTimestamp(const std::string& text);

/**
 * @brief Name of an admitted artifact: <prefix>_<kind>_<timestamp>_<seq>.zip
 */
std::string ArtifactFileName(const std::string& prefix, BackupKind kind,
                             std::chrono::system_clock::time_point createdAt, long long sequence);

/**
 * @brief Name of a freshly built artifact waiting in staging: <prefix>_<kind>_<timestamp>.zip
 */
std::string StagedFileName(const std::string& prefix, BackupKind kind,
                           std::chrono::system_clock::time_point createdAt);

/**
 * @struct ParsedArtifactName
 * @brief Metadata recovered from an artifact file name.
 */
struct ParsedArtifactName {
    BackupKind kind;
    std::chrono::system_clock::time_point createdAt;
    long long sequence;
};

/**
 * @brief Recovers the metadata encoded by ArtifactFileName().
 * @return nullopt for files that do not follow the scheme.
 */
std::optional<ParsedArtifactName> ParseArtifactFileName(const std::string& prefix, const std::string& fileName);

/** @brief True for any zip carrying the backup prefix, admitted or staged. */
bool IsBackupFileName(const std::string& prefix, const std::string& fileName);

/** @brief Remote key of an artifact: <prefix>/<kind>/<file name>. */
std::string RemoteKeyFor(const std::string& prefix, const BackupArtifact& artifact);

/** @brief Remote folder holding all artifacts of one kind, with trailing slash. */
std::string RemotePrefixFor(const std::string& prefix, BackupKind kind);

} // namespace dropkeeper::domain
