/**
 * @file Deduplicator.hpp
 * @brief Detects drop-zone files whose content already exists at the destination.
 */

#pragma once
#include <map>
#include <optional>
#include <string>

namespace dropkeeper::application {

/**
 * @class Deduplicator
 * @brief Content-fingerprint index of destination folders.
 *
 * A folder is indexed the first time it is queried for a given extension and
 * the index is kept for the rest of the run. Files placed by the Router must
 * be reported through remember() so later duplicates in the same run are caught.
 */
class Deduplicator {
public:
    /**
     * @brief Looks for a file with the same fingerprint and extension in @p folder.
     * @return Path of the existing copy, or nullopt.
     */
    std::optional<std::string> findDuplicate(const std::string& folder,
                                             const std::string& extension,
                                             const std::string& fingerprint);

    /** @brief Records a file that now lives in @p folder. */
    void remember(const std::string& folder, const std::string& path, const std::string& fingerprint);

    /** @brief Number of files fingerprinted while building indexes. */
    int filesIndexed() const { return m_filesIndexed; }

private:
    // folder -> extension -> fingerprint -> path
    using FingerprintIndex = std::map<std::string, std::string>;
    std::map<std::string, std::map<std::string, FingerprintIndex>> m_index;
    int m_filesIndexed = 0;

    FingerprintIndex& indexFor(const std::string& folder, const std::string& extension);
};

} // namespace dropkeeper::application
