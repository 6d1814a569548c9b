#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "application/BackupBuilder.hpp"
#include "application/RotationManager.hpp"
#include "infrastructure/BackupRepositoryFs.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ZipArchiver.hpp"
#include "test/TestSupport.hpp"

using namespace dropkeeper;
namespace fs = std::filesystem;
using Clock = std::chrono::system_clock;

namespace {

void PopulateTree(const domain::Configuration& config) {
    const fs::path base(config.baseDir);
    test::WriteFile(base / "00_Admin" / "contract.pdf", "%PDF contract");
    test::WriteFile(base / "01_Branding" / "logo.png", "png bytes");
    test::WriteFile(base / "02_Field_Projects" / "site" / "survey.shp", "shape");
    test::WriteFile(base / "README.md", "tree readme");

    // Everything below stays out of the archive.
    test::WriteFile(base / ".git" / "config", "[core]");
    test::WriteFile(base / "01_Branding" / ".DS_Store", "finder");
    test::WriteFile(base / "01_Branding" / "Thumbs.db", "thumbs");
    test::WriteFile(base / "02_Field_Projects" / "__MACOSX" / "._survey.shp", "resource fork");
    test::WriteFile(base / "scratch.tmp", "tmp");
    test::WriteFile(base / "sync.LOG", "log");
    test::WriteFile(base / "draft.bak", "backup copy");
    test::WriteFile(fs::path(config.backup.directory) / "foreign.zip", "old");
    test::WriteFile(fs::path(config.backup.archiveDirectory) / "older.zip", "older");
    test::WriteFile(fs::path(config.dropZone) / "incoming.pdf", "not routed yet");
    test::WriteFile(fs::path(config.storage.localStoragePath) / "mirror.zip", "mirror");
    test::WriteFile(base / (config.backup.prefix + "_daily_20240101-000000_1.zip"), "stray backup");
}

} // namespace

int main() {
    std::cout << "[Test] Starting Backup Builder Test..." << std::endl;

    test::TempRoot root("builder");
    domain::Configuration config = infrastructure::ConfigLoader::Defaults(root.str());
    config.backup.excludePatterns.push_back("*.bak");
    PopulateTree(config);

    application::BackupBuilder builder(config);
    std::vector<std::string> members = builder.collectMembers();
    const std::vector<std::string> expected = {
        "00_Admin/contract.pdf",
        "01_Branding/logo.png",
        "02_Field_Projects/site/survey.shp",
        "README.md",
    };
    assert(members == expected);
    assert(builder.isExcluded("a/b/.hidden"));
    assert(builder.isExcluded(".svn/entries"));
    assert(builder.isExcluded("x/__MACOSX/y"));
    assert(!builder.isExcluded("00_Admin/report.pdf"));
    std::cout << "[PASS] Member selection and exclusions." << std::endl;

    if (!infrastructure::ZipArchiver::IsAvailable()) {
        std::cout << "[Test] 'zip' not installed, skipping packing checks." << std::endl;
        std::cout << "[PASS] Backup Builder Test." << std::endl;
        return 0;
    }

    const auto when = Clock::time_point(std::chrono::seconds(1718000000)); // 2024-06-10 06:13:20 UTC
    auto built = builder.buildAt(domain::BackupKind::Weekly, when);
    assert(built.status == application::BackupBuilder::BuildStatus::Built);
    assert(built.memberCount == 4);
    assert(fs::path(built.artifact.localPath).filename() == config.backup.prefix + "_weekly_20240610-061320.zip");
    assert(fs::path(built.artifact.localPath).parent_path() == fs::path(config.backup.stagingDirectory()));
    assert(fs::exists(built.artifact.localPath));
    assert(built.artifact.sizeBytes == static_cast<long long>(fs::file_size(built.artifact.localPath)));
    assert(built.artifact.kind == domain::BackupKind::Weekly);
    // The member list scratch file is gone.
    assert(test::CountFiles(config.backup.stagingDirectory()) == 1);
    std::cout << "[PASS] Archive built into staging." << std::endl;

    // Admission moves it into the working generation.
    infrastructure::BackupRepositoryFs repo(config.backup.prefix, config.backup.directory, config.backup.archiveDirectory);
    application::RotationManager rotation(repo, nullptr, config.backup.retention, config.backup.prefix);
    auto admitted = rotation.admit(built.artifact);
    assert(admitted.status == application::AdmissionStatus::Admitted);
    assert(!fs::exists(built.artifact.localPath));
    assert(fs::path(admitted.artifact.localPath).parent_path() == fs::path(config.backup.directory));
    assert(repo.listArtifacts().size() == 1);

    // A second build does not pick up the first backup.
    auto second = builder.buildAt(domain::BackupKind::Daily, when + std::chrono::hours(24));
    assert(second.memberCount == 4);
    std::cout << "[PASS] Built archive is admitted and never re-packed." << std::endl;

    config.backup.retention.minSizeBytes = 1024 * 1024 * 1024;
    application::BackupBuilder strict(config);
    auto tiny = strict.buildAt(domain::BackupKind::Daily, when + std::chrono::hours(48));
    assert(tiny.status == application::BackupBuilder::BuildStatus::Undersized);
    assert(fs::exists(tiny.artifact.localPath));
    assert(!tiny.message.empty());
    std::cout << "[PASS] Undersized archive is flagged but produced." << std::endl;

    test::TempRoot emptyRoot("builder_empty");
    domain::Configuration emptyConfig = infrastructure::ConfigLoader::Defaults(emptyRoot.str());
    application::BackupBuilder emptyBuilder(emptyConfig);
    auto nothing = emptyBuilder.build(domain::BackupKind::Daily);
    assert(nothing.status == application::BackupBuilder::BuildStatus::PackError);
    assert(nothing.memberCount == 0);
    std::cout << "[PASS] Empty tree is a pack error." << std::endl;

    std::cout << "[PASS] Backup Builder Test." << std::endl;
    return 0;
}
