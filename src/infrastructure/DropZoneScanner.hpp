/**
 * @file DropZoneScanner.hpp
 * @brief Scanner for files waiting in the drop zone.
 */

#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace dropkeeper::infrastructure {

/**
 * @struct DropZoneEntry
 * @brief A regular file found directly inside the drop zone.
 */
struct DropZoneEntry {
    std::string path;
    std::string filename;
    std::uintmax_t sizeBytes = 0;
};

/**
 * @class DropZoneScanner
 * @brief Lists routable files; subdirectories are not descended into.
 */
class DropZoneScanner {
public:
    DropZoneScanner(const std::string& dropZonePath, const std::vector<std::string>& ignoredNames);
    virtual ~DropZoneScanner() = default;

    /**
     * @brief Regular, non-hidden files sorted by name.
     * @throws std::filesystem::filesystem_error if the drop zone cannot be listed.
     */
    virtual std::vector<DropZoneEntry> scan() const;

    const std::string& path() const { return m_dropZonePath; }

private:
    std::string m_dropZonePath;
    std::set<std::string> m_ignoredNames;
};

} // namespace dropkeeper::infrastructure
