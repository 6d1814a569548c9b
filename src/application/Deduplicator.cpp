/**
 * @file Deduplicator.cpp
 * @brief Implementation of the Deduplicator class.
 */
#include "application/Deduplicator.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/PathUtils.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace dropkeeper::application {

Deduplicator::FingerprintIndex& Deduplicator::indexFor(const std::string& folder, const std::string& extension) {
    auto& byExtension = m_index[folder];
    auto found = byExtension.find(extension);
    if (found != byExtension.end()) {
        return found->second;
    }

    FingerprintIndex& index = byExtension[extension];
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return index;
    }

    for (const auto& entry : fs::directory_iterator(folder, ec)) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) continue;
        const std::string name = entry.path().filename().string();
        if (infrastructure::PathUtils::IsHiddenName(name)) continue;
        if (infrastructure::PathUtils::LowerExtension(entry.path()) != extension) continue;

        try {
            auto fp = infrastructure::ContentHasher::FingerprintFile(entry.path().string());
            index.emplace(fp.hex, entry.path().string());
            ++m_filesIndexed;
        } catch (const std::exception& e) {
            std::cerr << "[Deduplicator] Cannot fingerprint " << entry.path() << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[Deduplicator] Cannot list " << folder << ": " << ec.message() << std::endl;
    }
    return index;
}

std::optional<std::string> Deduplicator::findDuplicate(const std::string& folder,
                                                       const std::string& extension,
                                                       const std::string& fingerprint) {
    const FingerprintIndex& index = indexFor(folder, extension);
    auto it = index.find(fingerprint);
    if (it == index.end()) return std::nullopt;
    return it->second;
}

void Deduplicator::remember(const std::string& folder, const std::string& path, const std::string& fingerprint) {
    std::string extension = infrastructure::PathUtils::LowerExtension(path);
    indexFor(folder, extension).emplace(fingerprint, path);
}

} // namespace dropkeeper::application
