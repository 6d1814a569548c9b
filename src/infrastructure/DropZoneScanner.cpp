/**
 * @file DropZoneScanner.cpp
 * @brief Implementation of the DropZoneScanner.
 */

#include "infrastructure/DropZoneScanner.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace dropkeeper::infrastructure {

DropZoneScanner::DropZoneScanner(const std::string& dropZonePath, const std::vector<std::string>& ignoredNames)
    : m_dropZonePath(dropZonePath), m_ignoredNames(ignoredNames.begin(), ignoredNames.end()) {}

std::vector<DropZoneEntry> DropZoneScanner::scan() const {
    std::vector<DropZoneEntry> entries;

    if (!fs::exists(m_dropZonePath)) {
        return entries;
    }

    for (const auto& entry : fs::directory_iterator(m_dropZonePath)) {
        std::string filename = entry.path().filename().string();
        if (PathUtils::IsHiddenName(filename) || m_ignoredNames.count(filename) != 0) {
            continue;
        }

        std::error_code ec;
        if (!entry.is_regular_file(ec) || entry.is_symlink(ec)) {
            continue;
        }

        DropZoneEntry item;
        item.path = entry.path().string();
        item.filename = filename;
        item.sizeBytes = entry.file_size(ec);
        if (ec) {
            item.sizeBytes = 0;
        }
        entries.push_back(item);
    }

    std::sort(entries.begin(), entries.end(), [](const DropZoneEntry& a, const DropZoneEntry& b) {
        return a.filename < b.filename;
    });
    return entries;
}

} // namespace dropkeeper::infrastructure
