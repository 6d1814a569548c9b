/**
 * @file Classifier.cpp
 * @brief Implementation of the Classifier class.
 */
#include "application/Classifier.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace dropkeeper::application {

namespace {

struct Signature {
    const char* magic;
    size_t length;
    const char* extension;
};

const Signature kSignatures[] = {
    {"%PDF-", 5, ".pdf"},
    {"PK\x03\x04", 4, ".zip"},
    {"\x89PNG\r\n\x1a\n", 8, ".png"},
    {"\xFF\xD8\xFF", 3, ".jpg"},
    {"II*\x00", 4, ".tif"},
    {"MM\x00*", 4, ".tif"},
    {"\x1f\x8b", 2, ".gz"},
};

constexpr size_t kHeaderBytes = 16;

std::string ReadHeader(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return "";
    std::string header(kHeaderBytes, '\0');
    file.read(&header[0], static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(file.gcount()));
    return header;
}

} // namespace

Classifier::Classifier(const domain::RoutingTable& table, bool sniffContent)
    : m_table(table), m_sniffContent(sniffContent) {}

std::optional<std::string> Classifier::lookup(const std::string& extension) const {
    auto it = m_table.extensionToCategory.find(extension);
    if (it == m_table.extensionToCategory.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> Classifier::matchKeywords(const std::string& filename) const {
    std::string name = filename;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return std::tolower(c); });
    for (const auto& rule : m_table.keywordRules) {
        int hits = 0;
        for (const auto& keyword : rule.keywords) {
            if (name.find(keyword) != std::string::npos) ++hits;
        }
        if (hits >= rule.minMatches) return rule.category;
    }
    return std::nullopt;
}

std::string Classifier::classify(const std::string& path) const {
    if (auto category = matchKeywords(std::filesystem::path(path).filename().string())) {
        return *category;
    }
    if (auto category = lookup(infrastructure::PathUtils::LowerExtension(path))) {
        return *category;
    }

    if (m_sniffContent) {
        if (auto sniffed = SniffExtension(ReadHeader(path))) {
            if (auto category = lookup(*sniffed)) {
                return *category;
            }
        }
    }
    return m_table.fallbackCategory;
}

std::string Classifier::destinationFor(const std::string& category) const {
    auto it = m_table.categoryToFolder.find(category);
    if (it != m_table.categoryToFolder.end()) return it->second;
    return m_table.categoryToFolder.at(m_table.fallbackCategory);
}

std::optional<std::string> Classifier::SniffExtension(const std::string& header) {
    for (const auto& sig : kSignatures) {
        if (header.size() >= sig.length && header.compare(0, sig.length, sig.magic, sig.length) == 0) {
            return std::string(sig.extension);
        }
    }
    return std::nullopt;
}

} // namespace dropkeeper::application
