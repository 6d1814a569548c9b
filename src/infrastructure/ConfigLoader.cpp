/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace dropkeeper::infrastructure {

namespace {

const std::set<std::string> kLocalProviders = {"local", "local-mirror"};
const std::set<std::string> kCommandProviders = {"cloud-object-store", "s3", "cloud-drive", "google_drive", "dropbox"};

struct DefaultFolder {
    const char* category;
    const char* folder;
};

// Folder taxonomy of the document tree.
const DefaultFolder kDefaultFolders[] = {
    {"admin", "00_Admin"},
    {"archives", "00_Admin/Archives"},
    {"branding", "01_Branding"},
    {"field_projects", "02_Field_Projects"},
    {"mapping", "03_Mapping_QGIS"},
    {"training", "04_Training"},
    {"scripts", "05_Automation/Scripts"},
    {"business", "06_Business_Strategy"},
    {"unclassified", "Z_Archive"},
};

struct DefaultRule {
    const char* extension;
    const char* category;
};

const DefaultRule kDefaultRules[] = {
    {".pdf", "admin"}, {".docx", "admin"}, {".doc", "admin"}, {".xlsx", "admin"}, {".xls", "admin"},
    {".csv", "admin"}, {".txt", "admin"}, {".rtf", "admin"}, {".odt", "admin"}, {".ods", "admin"},

    {".png", "branding"}, {".jpg", "branding"}, {".jpeg", "branding"}, {".gif", "branding"},
    {".bmp", "branding"}, {".tiff", "branding"}, {".svg", "branding"}, {".ai", "branding"},
    {".psd", "branding"}, {".eps", "branding"},

    {".tif", "field_projects"}, {".shp", "field_projects"}, {".dbf", "field_projects"},
    {".prj", "field_projects"}, {".shx", "field_projects"}, {".cpg", "field_projects"},
    {".geojson", "field_projects"}, {".kml", "field_projects"}, {".kmz", "field_projects"},
    {".las", "field_projects"}, {".laz", "field_projects"}, {".dem", "field_projects"},
    {".asc", "field_projects"}, {".img", "field_projects"}, {".ecw", "field_projects"},
    {".sid", "field_projects"},

    {".gpkg", "mapping"}, {".qgz", "mapping"}, {".qgs", "mapping"}, {".qgd", "mapping"},
    {".sqlite", "mapping"}, {".db", "mapping"},

    {".mp4", "training"}, {".avi", "training"}, {".mov", "training"}, {".wmv", "training"},
    {".flv", "training"}, {".webm", "training"}, {".mp3", "training"}, {".wav", "training"},
    {".aac", "training"}, {".flac", "training"},

    {".py", "scripts"}, {".sh", "scripts"}, {".command", "scripts"}, {".bat", "scripts"},
    {".ps1", "scripts"}, {".js", "scripts"}, {".html", "scripts"}, {".css", "scripts"},
    {".json", "scripts"}, {".xml", "scripts"}, {".yaml", "scripts"}, {".yml", "scripts"},

    {".zip", "archives"}, {".tar", "archives"}, {".gz", "archives"}, {".7z", "archives"},
    {".rar", "archives"}, {".iso", "archives"},

    {".pptx", "business"}, {".ppt", "business"}, {".key", "business"}, {".odp", "business"},
    {".md", "business"}, {".markdown", "business"},
};

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

long long RequireInteger(const json& node, const char* key, long long fallback, long long minimum,
                         long long maximum = std::numeric_limits<long long>::max()) {
    if (!node.contains(key)) {
        return fallback;
    }
    const json& value = node.at(key);
    if (!value.is_number_integer()) {
        throw domain::ConfigError(std::string("'") + key + "' must be an integer");
    }
    long long v = value.get<long long>();
    if (v < minimum) {
        throw domain::ConfigError(std::string("'") + key + "' must be >= " + std::to_string(minimum));
    }
    if (v > maximum) {
        throw domain::ConfigError(std::string("'") + key + "' must be <= " + std::to_string(maximum));
    }
    return v;
}

int RequireInt(const json& node, const char* key, int fallback, int minimum) {
    return static_cast<int>(RequireInteger(node, key, fallback, minimum, std::numeric_limits<int>::max()));
}

std::string OptionalString(const json& node, const char* key, const std::string& fallback) {
    if (!node.contains(key)) {
        return fallback;
    }
    if (!node.at(key).is_string()) {
        throw domain::ConfigError(std::string("'") + key + "' must be a string");
    }
    return node.at(key).get<std::string>();
}

std::vector<std::string> OptionalStringList(const json& node, const char* key, const std::vector<std::string>& fallback) {
    if (!node.contains(key)) {
        return fallback;
    }
    const json& value = node.at(key);
    if (!value.is_array()) {
        throw domain::ConfigError(std::string("'") + key + "' must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw domain::ConfigError(std::string("'") + key + "' must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

void Validate(const domain::Configuration& config) {
    const auto& routing = config.routing;
    if (routing.categoryToFolder.find(routing.fallbackCategory) == routing.categoryToFolder.end()) {
        throw domain::ConfigError("fallback category '" + routing.fallbackCategory + "' has no folder");
    }
    for (const auto& [ext, category] : routing.extensionToCategory) {
        if (ext.size() < 2 || ext.front() != '.') {
            throw domain::ConfigError("routing rule '" + ext + "' must start with '.'");
        }
        if (routing.categoryToFolder.find(category) == routing.categoryToFolder.end()) {
            throw domain::ConfigError("routing rule '" + ext + "' points to unknown category '" + category + "'");
        }
    }
    for (const auto& rule : routing.keywordRules) {
        if (rule.keywords.empty()) {
            throw domain::ConfigError("keyword rule for '" + rule.category + "' has no keywords");
        }
        if (routing.categoryToFolder.find(rule.category) == routing.categoryToFolder.end()) {
            throw domain::ConfigError("keyword rule points to unknown category '" + rule.category + "'");
        }
        if (rule.minMatches < 1 || rule.minMatches > static_cast<int>(rule.keywords.size())) {
            throw domain::ConfigError("keyword rule for '" + rule.category + "' needs min_matches between 1 and " +
                                      std::to_string(rule.keywords.size()));
        }
    }
    if (config.backup.prefix.empty() || config.backup.prefix.find('/') != std::string::npos) {
        throw domain::ConfigError("backup prefix must be a non-empty file name fragment");
    }
    if (config.backup.retention.maxWorking < 1) {
        throw domain::ConfigError("max_working must be at least 1");
    }
    if (config.backup.retention.maxArchive < 0) {
        throw domain::ConfigError("max_archive must not be negative");
    }
    // Demotion renames into the archive directory; it has to be a different directory.
    const fs::path working = PathUtils::Resolve(fs::path("/"), config.backup.directory);
    const fs::path archive = PathUtils::Resolve(fs::path("/"), config.backup.archiveDirectory);
    if (archive == working) {
        throw domain::ConfigError("backup archive_directory must differ from directory");
    }
    if (archive == PathUtils::Resolve(fs::path("/"), config.backup.stagingDirectory())) {
        throw domain::ConfigError("backup archive_directory must not be the staging directory");
    }

    const auto& storage = config.storage;
    if (kLocalProviders.count(storage.provider) == 0 && kCommandProviders.count(storage.provider) == 0) {
        throw domain::ConfigError("unknown storage provider '" + storage.provider + "'");
    }
    if (kCommandProviders.count(storage.provider) != 0) {
        if (storage.commands.put.empty() || storage.commands.list.empty() || storage.commands.remove.empty()) {
            throw domain::ConfigError("provider '" + storage.provider + "' needs put, list and delete command templates");
        }
    }
}

} // namespace

domain::Configuration ConfigLoader::Defaults(const std::string& baseDir) {
    if (baseDir.empty()) {
        throw domain::ConfigError("base_dir must not be empty");
    }
    fs::path base = PathUtils::Resolve(fs::current_path(), baseDir);

    domain::Configuration config;
    config.companyName = "DropKeeper";
    config.baseDir = base.string();
    config.dropZone = (base / (config.companyName + "DropZone")).string();
    for (const auto& folder : kDefaultFolders) {
        config.routing.categoryToFolder[folder.category] = (base / folder.folder).string();
    }
    for (const auto& rule : kDefaultRules) {
        config.routing.extensionToCategory[rule.extension] = rule.category;
    }
    config.routing.fallbackCategory = "unclassified";
    config.ignoredNames = {"Thumbs.db", "desktop.ini"};
    config.sniffContent = true;

    config.backup.prefix = "DropKeeper_Backup";
    config.backup.directory = (base / "00_Admin" / "Backups").string();
    config.backup.archiveDirectory = (base / "00_Admin" / "Backups" / "Archive").string();
    config.backup.retention = domain::RetentionPolicy{1, 4, 0};
    config.backup.schedule = domain::BackupKind::Daily;
    config.backup.expectedInterval = std::chrono::hours(26);
    config.backup.excludePatterns = {"*.DS_Store", "__MACOSX/*", "*.tmp", "*.log"};

    config.storage.provider = "local";
    config.storage.localStoragePath = (base / "00_Admin" / "Local_Backups").string();
    return config;
}

domain::Configuration ConfigLoader::Parse(const std::string& jsonText, const std::optional<std::string>& baseDirOverride) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw domain::ConfigError(std::string("configuration is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw domain::ConfigError("configuration root must be an object");
    }

    try {
        std::string baseDir = baseDirOverride ? *baseDirOverride : OptionalString(j, "base_dir", "");
        domain::Configuration config = Defaults(baseDir);
        fs::path base(config.baseDir);

        config.companyName = OptionalString(j, "company_name", config.companyName);
        config.backup.prefix = config.companyName + "_Backup";
        config.dropZone = PathUtils::Resolve(base, OptionalString(j, "drop_zone", config.companyName + "DropZone")).string();
        config.ignoredNames = OptionalStringList(j, "ignored_names", config.ignoredNames);
        if (j.contains("sniff_content")) {
            if (!j.at("sniff_content").is_boolean()) {
                throw domain::ConfigError("'sniff_content' must be a boolean");
            }
            config.sniffContent = j.at("sniff_content").get<bool>();
        }

        if (j.contains("folders")) {
            const json& folders = j.at("folders");
            if (!folders.is_object()) {
                throw domain::ConfigError("'folders' must map category names to directories");
            }
            config.routing.categoryToFolder.clear();
            for (auto it = folders.begin(); it != folders.end(); ++it) {
                if (!it.value().is_string()) {
                    throw domain::ConfigError("folder for category '" + it.key() + "' must be a string");
                }
                config.routing.categoryToFolder[it.key()] = PathUtils::Resolve(base, it.value().get<std::string>()).string();
            }
        }
        config.routing.fallbackCategory = OptionalString(j, "fallback_category", config.routing.fallbackCategory);

        if (j.contains("routing_rules")) {
            const json& rules = j.at("routing_rules");
            if (!rules.is_object()) {
                throw domain::ConfigError("'routing_rules' must map extensions to categories");
            }
            config.routing.extensionToCategory.clear();
            for (auto it = rules.begin(); it != rules.end(); ++it) {
                if (!it.value().is_string()) {
                    throw domain::ConfigError("category for extension '" + it.key() + "' must be a string");
                }
                config.routing.extensionToCategory[ToLower(it.key())] = it.value().get<std::string>();
            }
        }

        if (j.contains("keyword_rules")) {
            const json& rules = j.at("keyword_rules");
            if (!rules.is_array()) {
                throw domain::ConfigError("'keyword_rules' must be an array of {category, keywords} objects");
            }
            config.routing.keywordRules.clear();
            for (const auto& item : rules) {
                if (!item.is_object() || !item.contains("category")) {
                    throw domain::ConfigError("every keyword rule needs a 'category'");
                }
                domain::KeywordRule rule;
                rule.category = OptionalString(item, "category", "");
                for (const auto& keyword : OptionalStringList(item, "keywords", {})) {
                    if (!keyword.empty()) rule.keywords.push_back(ToLower(keyword));
                }
                rule.minMatches = RequireInt(item, "min_matches", 1, 1);
                config.routing.keywordRules.push_back(rule);
            }
        }

        if (j.contains("backup")) {
            const json& b = j.at("backup");
            if (!b.is_object()) {
                throw domain::ConfigError("'backup' must be an object");
            }
            config.backup.prefix = OptionalString(b, "prefix", config.backup.prefix);
            config.backup.directory = PathUtils::Resolve(base, OptionalString(b, "directory", config.backup.directory)).string();
            config.backup.archiveDirectory = PathUtils::Resolve(
                base, OptionalString(b, "archive_directory", config.backup.directory + "/Archive")).string();
            config.backup.retention.maxWorking = RequireInt(b, "max_working", 1, 1);
            config.backup.retention.maxArchive = RequireInt(b, "max_archive", 4, 0);
            config.backup.retention.minSizeBytes = static_cast<std::uintmax_t>(RequireInteger(b, "min_size_bytes", 0, 0));

            std::string schedule = OptionalString(b, "schedule", "daily");
            auto kind = domain::ParseBackupKind(schedule);
            if (!kind) {
                throw domain::ConfigError("unknown backup schedule '" + schedule + "'");
            }
            config.backup.schedule = *kind;

            long long defaultHours = 26;
            if (*kind == domain::BackupKind::Weekly) defaultHours = 7 * 24 + 2;
            if (*kind == domain::BackupKind::Monthly) defaultHours = 31 * 24 + 2;
            config.backup.expectedInterval = std::chrono::hours(RequireInteger(b, "expected_interval_hours", defaultHours, 1));
            config.backup.excludePatterns = OptionalStringList(b, "exclude_patterns", config.backup.excludePatterns);
        }

        if (j.contains("storage")) {
            const json& s = j.at("storage");
            if (!s.is_object()) {
                throw domain::ConfigError("'storage' must be an object");
            }
            config.storage.provider = ToLower(OptionalString(s, "provider", config.storage.provider));
            config.storage.timeout = std::chrono::seconds(RequireInteger(s, "timeout_seconds", 300, 1));
            config.storage.maxAttempts = RequireInt(s, "max_attempts", 3, 1);
            config.storage.retryDelay = std::chrono::seconds(RequireInteger(s, "retry_delay_seconds", 30, 0));
            if (s.contains("local")) {
                config.storage.localStoragePath = PathUtils::Resolve(
                    base, OptionalString(s.at("local"), "storage_path", config.storage.localStoragePath)).string();
            }
            if (s.contains("commands")) {
                const json& c = s.at("commands");
                config.storage.commands.authenticate = OptionalString(c, "authenticate", "");
                config.storage.commands.put = OptionalString(c, "put", "");
                config.storage.commands.list = OptionalString(c, "list", "");
                config.storage.commands.remove = OptionalString(c, "delete", "");
            }
        }

        Validate(config);
        return config;
    } catch (const json::exception& e) {
        throw domain::ConfigError(std::string("configuration has a wrong value type: ") + e.what());
    }
}

domain::Configuration ConfigLoader::LoadFromFile(const std::string& path) {
    if (!fs::exists(path)) {
        throw domain::ConfigError("configuration file not found: " + path);
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        throw domain::ConfigError("cannot open configuration file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return Parse(text);
}

std::string ConfigLoader::ResolveConfigPath(const std::optional<std::string>& explicitPath) {
    if (explicitPath && !explicitPath->empty()) {
        return *explicitPath;
    }
    return PathUtils::GetDefaultConfigPath().string();
}

std::string ConfigLoader::ToJson(const domain::Configuration& config) {
    json j;
    j["company_name"] = config.companyName;
    j["base_dir"] = config.baseDir;
    j["drop_zone"] = config.dropZone;
    j["fallback_category"] = config.routing.fallbackCategory;
    j["sniff_content"] = config.sniffContent;
    j["ignored_names"] = config.ignoredNames;
    j["folders"] = config.routing.categoryToFolder;
    j["routing_rules"] = config.routing.extensionToCategory;
    j["keyword_rules"] = json::array();
    for (const auto& rule : config.routing.keywordRules) {
        j["keyword_rules"].push_back({{"category", rule.category}, {"keywords", rule.keywords}, {"min_matches", rule.minMatches}});
    }
    j["backup"] = {
        {"prefix", config.backup.prefix},
        {"directory", config.backup.directory},
        {"archive_directory", config.backup.archiveDirectory},
        {"max_working", config.backup.retention.maxWorking},
        {"max_archive", config.backup.retention.maxArchive},
        {"min_size_bytes", config.backup.retention.minSizeBytes},
        {"schedule", domain::ToString(config.backup.schedule)},
        {"expected_interval_hours", config.backup.expectedInterval.count()},
        {"exclude_patterns", config.backup.excludePatterns}
    };
    // Command templates may carry credentials; report only whether they are set.
    j["storage"] = {
        {"provider", config.storage.provider},
        {"timeout_seconds", config.storage.timeout.count()},
        {"max_attempts", config.storage.maxAttempts},
        {"retry_delay_seconds", config.storage.retryDelay.count()},
        {"local", {{"storage_path", config.storage.localStoragePath}}},
        {"commands_configured", !config.storage.commands.put.empty()}
    };
    return j.dump(4);
}

} // namespace dropkeeper::infrastructure
