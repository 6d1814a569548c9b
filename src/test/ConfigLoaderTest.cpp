#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "infrastructure/ConfigLoader.hpp"
#include "test/TestSupport.hpp"

using namespace dropkeeper;
using infrastructure::ConfigLoader;

namespace {

bool Rejects(const std::string& jsonText) {
    try {
        ConfigLoader::Parse(jsonText);
    } catch (const domain::ConfigError& e) {
        std::cout << "[Test] Rejected as expected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;
    test::TempRoot root("config");
    const std::string base = root.str();
    const std::string baseJson = "\"base_dir\": \"" + base + "\"";

    // Defaults
    domain::Configuration defaults = ConfigLoader::Defaults(base);
    assert(defaults.routing.categoryToFolder.size() == 9);
    assert(defaults.routing.categoryToFolder.at("admin") == base + "/00_Admin");
    assert(defaults.routing.categoryToFolder.at("unclassified") == base + "/Z_Archive");
    assert(defaults.routing.extensionToCategory.at(".pdf") == "admin");
    assert(defaults.routing.extensionToCategory.at(".tif") == "field_projects");
    assert(defaults.backup.retention.maxWorking == 1);
    assert(defaults.backup.retention.maxArchive == 4);
    assert(defaults.backup.archiveDirectory == base + "/00_Admin/Backups/Archive");
    assert(defaults.requiredFolders().size() == 12);
    assert(defaults.dropZone == base + "/DropKeeperDropZone");
    assert(defaults.routing.keywordRules.empty());
    std::cout << "[PASS] Defaults." << std::endl;

    // Minimal document
    domain::Configuration minimal = ConfigLoader::Parse("{ \"company_name\": \"Acme\", " + baseJson + " }");
    assert(minimal.companyName == "Acme");
    assert(minimal.backup.prefix == "Acme_Backup");
    assert(minimal.dropZone == base + "/AcmeDropZone");
    assert(minimal.storage.provider == "local");
    assert(minimal.backup.expectedInterval == std::chrono::hours(26));
    std::cout << "[PASS] Minimal configuration." << std::endl;

    // Full document with relative paths
    domain::Configuration full = ConfigLoader::Parse(R"({
        "company_name": "Acme",
        "base_dir": ")" + base + R"(",
        "drop_zone": "Inbox/",
        "fallback_category": "misc",
        "sniff_content": false,
        "ignored_names": ["desktop.ini"],
        "folders": { "docs": "Docs", "misc": "/srv/misc" },
        "routing_rules": { ".PDF": "docs", ".txt": "docs" },
        "backup": {
            "prefix": "Nightly",
            "directory": "Backups",
            "max_working": 2,
            "max_archive": 0,
            "min_size_bytes": 2048,
            "schedule": "weekly",
            "exclude_patterns": ["*.bak"]
        },
        "storage": {
            "provider": "S3",
            "timeout_seconds": 60,
            "max_attempts": 5,
            "retry_delay_seconds": 0,
            "commands": { "put": "aws s3 cp {file} s3://bucket/{key}", "list": "ls", "delete": "rm {key}" }
        }
    })");
    assert(full.dropZone == base + "/Inbox");
    assert(full.routing.fallbackCategory == "misc");
    assert(full.routing.categoryToFolder.at("docs") == base + "/Docs");
    assert(full.routing.categoryToFolder.at("misc") == "/srv/misc");
    assert(full.routing.extensionToCategory.count(".pdf") == 1);
    assert(!full.sniffContent);
    assert(full.ignoredNames.size() == 1);
    assert(full.backup.prefix == "Nightly");
    assert(full.backup.directory == base + "/Backups");
    assert(full.backup.archiveDirectory == base + "/Backups/Archive");
    assert(full.backup.retention.maxWorking == 2);
    assert(full.backup.retention.maxArchive == 0);
    assert(full.backup.retention.minSizeBytes == 2048);
    assert(full.backup.schedule == domain::BackupKind::Weekly);
    assert(full.backup.expectedInterval == std::chrono::hours(170));
    assert(full.backup.excludePatterns.size() == 1);
    assert(full.storage.provider == "s3");
    assert(full.storage.timeout == std::chrono::seconds(60));
    assert(full.storage.maxAttempts == 5);
    assert(full.storage.commands.remove == "rm {key}");
    std::cout << "[PASS] Full configuration." << std::endl;

    // Validation
    assert(Rejects("{ not json"));
    assert(Rejects("[1, 2]"));
    assert(Rejects("{}"));
    assert(Rejects("{ " + baseJson + ", \"routing_rules\": { \"pdf\": \"admin\" } }"));
    assert(Rejects("{ " + baseJson + ", \"routing_rules\": { \".pdf\": \"nowhere\" } }"));
    assert(Rejects("{ " + baseJson + ", \"fallback_category\": \"nowhere\" }"));
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"max_working\": 0 } }"));
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"max_archive\": -1 } }"));
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"min_size_bytes\": -5 } }"));
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"max_working\": \"two\" } }"));
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"schedule\": \"hourly\" } }"));
    assert(Rejects("{ " + baseJson + ", \"storage\": { \"provider\": \"ftp\" } }"));
    assert(Rejects("{ " + baseJson + ", \"storage\": { \"provider\": \"dropbox\" } }"));
    assert(Rejects("{ " + baseJson + ", \"folders\": [\"a\"] }"));
    // Out of range for int must not wrap into a valid count.
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"max_working\": 4294967297 } }"));
    assert(Rejects("{ " + baseJson + ", \"storage\": { \"max_attempts\": 2147483648 } }"));
    // Archive generation needs its own directory.
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"directory\": \"B\", \"archive_directory\": \"B\" } }"));
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"directory\": \"B\", \"archive_directory\": \"./B/\" } }"));
    assert(Rejects("{ " + baseJson + ", \"backup\": { \"directory\": \"B\", \"archive_directory\": \"B/.staging\" } }"));
    assert(Rejects("{ " + baseJson + ", \"keyword_rules\": { \"admin\": [\"uei\"] } }"));
    assert(Rejects("{ " + baseJson + ", \"keyword_rules\": [ { \"category\": \"nowhere\", \"keywords\": [\"x\"] } ] }"));
    assert(Rejects("{ " + baseJson + ", \"keyword_rules\": [ { \"category\": \"admin\", \"keywords\": [] } ] }"));
    assert(Rejects("{ " + baseJson + ", \"keyword_rules\": [ { \"category\": \"admin\", \"keywords\": [\"a\"], \"min_matches\": 2 } ] }"));
    std::cout << "[PASS] Invalid configurations are rejected." << std::endl;

    // A sibling archive directory is accepted.
    domain::Configuration sibling = ConfigLoader::Parse(
        "{ " + baseJson + ", \"backup\": { \"directory\": \"B\", \"archive_directory\": \"B_old\" } }");
    assert(sibling.backup.archiveDirectory == base + "/B_old");

    // Keyword rules
    domain::Configuration keyed = ConfigLoader::Parse(R"({
        "base_dir": ")" + base + R"(",
        "folders": { "admin": "00_Admin", "invoices": "00_Admin/Invoices", "unclassified": "Z_Archive" },
        "routing_rules": { ".pdf": "admin" },
        "keyword_rules": [
            { "category": "invoices", "keywords": ["Invoice", "receipt", "payment"] },
            { "category": "admin", "keywords": ["uei", "sam.gov"], "min_matches": 2 }
        ]
    })");
    assert(keyed.routing.keywordRules.size() == 2);
    assert(keyed.routing.keywordRules[0].category == "invoices");
    assert(keyed.routing.keywordRules[0].keywords.front() == "invoice");
    assert(keyed.routing.keywordRules[0].minMatches == 1);
    assert(keyed.routing.keywordRules[1].minMatches == 2);
    assert(ConfigLoader::Parse(ConfigLoader::ToJson(keyed)).routing.keywordRules.size() == 2);
    std::cout << "[PASS] Keyword rules." << std::endl;

    // Files and lookup order
    bool missing = false;
    try {
        ConfigLoader::LoadFromFile(base + "/absent.json");
    } catch (const domain::ConfigError&) {
        missing = true;
    }
    assert(missing);

    test::WriteFile(root.path() / "config.json", "{ " + baseJson + " }");
    assert(ConfigLoader::LoadFromFile(base + "/config.json").baseDir == base);

    setenv("XDG_CONFIG_HOME", (base + "/xdg").c_str(), 1);
    unsetenv("DROPKEEPER_CONFIG");
    assert(ConfigLoader::ResolveConfigPath(std::nullopt) == base + "/xdg/dropkeeper/config.json");
    setenv("DROPKEEPER_CONFIG", (base + "/config.json").c_str(), 1);
    assert(ConfigLoader::ResolveConfigPath(std::nullopt) == base + "/config.json");
    assert(ConfigLoader::ResolveConfigPath(std::string("/etc/dk.json")) == "/etc/dk.json");
    std::cout << "[PASS] Configuration lookup." << std::endl;

    // The "info" output is itself a loadable configuration.
    domain::Configuration reloaded = ConfigLoader::Parse(ConfigLoader::ToJson(minimal));
    assert(reloaded.dropZone == minimal.dropZone);
    assert(reloaded.backup.prefix == minimal.backup.prefix);
    assert(reloaded.routing.extensionToCategory == minimal.routing.extensionToCategory);

    std::cout << "[PASS] Config Loader Test." << std::endl;
    return 0;
}
