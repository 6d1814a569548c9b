/**
 * @file BackupArtifact.cpp
 * @brief Naming and ordering helpers for BackupArtifact.
 */

#include "domain/BackupArtifact.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace dropkeeper::domain {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> Split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, sep)) {
        parts.push_back(part);
    }
    return parts;
}

bool AllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isdigit(c); });
}

} // namespace

std::string ToString(BackupKind kind) {
    switch (kind) {
        case BackupKind::Daily: return "daily";
        case BackupKind::Weekly: return "weekly";
        case BackupKind::Monthly: return "monthly";
    }
    return "daily";
}

std::optional<BackupKind> ParseBackupKind(const std::string& text) {
    std::string lower = ToLower(text);
    if (lower == "daily") return BackupKind::Daily;
    if (lower == "weekly") return BackupKind::Weekly;
    if (lower == "monthly") return BackupKind::Monthly;
    return std::nullopt;
}

std::string ToString(GenerationClass generation) {
    return generation == GenerationClass::Working ? "working" : "archive";
}

std::string BackupArtifact::fileName() const {
    return std::filesystem::path(localPath).filename().string();
}

bool IsOlder(const BackupArtifact& a, const BackupArtifact& b) {
    if (a.createdAt != b.createdAt) {
        return a.createdAt < b.createdAt;
    }
    return a.sequence < b.sequence;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &tm);
    return buffer;
}

std::optional<std::chrono::system_clock::time_point> ParseTimestamp(const std::string& text) {
    if (text.size() != 15 || text[8] != '-') {
        return std::nullopt;
    }
    if (!AllDigits(text.substr(0, 8)) || !AllDigits(text.substr(9))) {
        return std::nullopt;
    }
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y%m%d-%H%M%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    std::time_t tt = timegm(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

std::string ArtifactFileName(const std::string& prefix, BackupKind kind,
                             std::chrono::system_clock::time_point createdAt, long long sequence) {
    return prefix + "_" + ToString(kind) + "_" + FormatTimestamp(createdAt) + "_" + std::to_string(sequence) + ".zip";
}

std::string StagedFileName(const std::string& prefix, BackupKind kind,
                           std::chrono::system_clock::time_point createdAt) {
    return prefix + "_" + ToString(kind) + "_" + FormatTimestamp(createdAt) + ".zip";
}

std::optional<ParsedArtifactName> ParseArtifactFileName(const std::string& prefix, const std::string& fileName) {
    const std::string head = prefix + "_";
    const std::string tail = ".zip";
    if (fileName.rfind(head, 0) != 0 || !EndsWith(fileName, tail)) {
        return std::nullopt;
    }
    if (fileName.size() <= head.size() + tail.size()) {
        return std::nullopt;
    }

    std::string middle = fileName.substr(head.size(), fileName.size() - head.size() - tail.size());
    auto parts = Split(middle, '_');
    if (parts.size() != 3) {
        return std::nullopt;
    }

    auto kind = ParseBackupKind(parts[0]);
    auto createdAt = ParseTimestamp(parts[1]);
    if (!kind || !createdAt || !AllDigits(parts[2]) || parts[2].size() > 18) {
        return std::nullopt;
    }
    return ParsedArtifactName{*kind, *createdAt, std::stoll(parts[2])};
}

bool IsBackupFileName(const std::string& prefix, const std::string& fileName) {
    return fileName.rfind(prefix + "_", 0) == 0 && EndsWith(ToLower(fileName), ".zip");
}

std::string RemoteKeyFor(const std::string& prefix, const BackupArtifact& artifact) {
    return RemotePrefixFor(prefix, artifact.kind) + artifact.fileName();
}

std::string RemotePrefixFor(const std::string& prefix, BackupKind kind) {
    return prefix + "/" + ToString(kind) + "/";
}

} // namespace dropkeeper::domain
