#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/Deduplicator.hpp"
#include "application/RouterService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/DropZoneScanner.hpp"
#include "test/TestSupport.hpp"

#include <unistd.h>

using namespace dropkeeper;
namespace fs = std::filesystem;

namespace {

application::RouterService MakeRouter(const domain::Configuration& config) {
    return application::RouterService(config,
        std::make_unique<infrastructure::DropZoneScanner>(config.dropZone, config.ignoredNames));
}

/// Lets a test change the drop zone after it was listed, as a concurrent writer would.
class StaleScanner : public infrastructure::DropZoneScanner {
public:
    using Mutator = std::function<void(std::vector<infrastructure::DropZoneEntry>&)>;

    StaleScanner(const domain::Configuration& config, Mutator afterScan)
        : DropZoneScanner(config.dropZone, config.ignoredNames), m_afterScan(std::move(afterScan)) {}

    std::vector<infrastructure::DropZoneEntry> scan() const override {
        auto entries = DropZoneScanner::scan();
        m_afterScan(entries);
        return entries;
    }

private:
    Mutator m_afterScan;
};

const domain::RoutingOutcome* FindOutcome(const domain::RoutingReport& report, const std::string& filename) {
    for (const auto& o : report.outcomes) {
        if (fs::path(o.record.sourcePath).filename() == filename) return &o;
    }
    return nullptr;
}

void TestTwoCategories() {
    test::TempRoot root("router_categories");
    domain::Configuration config = infrastructure::ConfigLoader::Defaults(root.str());
    const fs::path drop(config.dropZone);
    test::WriteFile(drop / "report.pdf", "%PDF-1.4 quarterly report");
    test::WriteFile(drop / "field.tif", "survey raster");

    auto router = MakeRouter(config);
    std::vector<std::string> log;
    domain::RoutingReport report = router.run([&log](std::string line) { log.push_back(line); });

    assert(report.outcomes.size() == 2);
    assert(report.moved == 2);
    assert(report.failed == 0);
    assert(test::CountFiles(drop) == 0);

    const fs::path admin = config.routing.categoryToFolder.at("admin");
    const fs::path field = config.routing.categoryToFolder.at("field_projects");
    assert(test::CountFiles(admin) == 1);
    assert(test::CountFiles(field) == 1);
    assert(fs::exists(admin / "report.pdf"));
    assert(test::ReadFile(field / "field.tif") == "survey raster");

    const auto* pdf = FindOutcome(report, "report.pdf");
    assert(pdf && pdf->status == domain::RoutingStatus::Moved);
    assert(pdf->record.category == "admin");
    assert(pdf->record.fingerprint.size() == 32);
    assert(pdf->destinationPath == (admin / "report.pdf").string());
    assert(!log.empty());
    std::cout << "[PASS] Files land in their category folders." << std::endl;
}

void TestDuplicatesInOneRun() {
    test::TempRoot root("router_dupes");
    domain::Configuration config = infrastructure::ConfigLoader::Defaults(root.str());
    const fs::path drop(config.dropZone);
    test::WriteFile(drop / "minutes.txt", "same words");
    test::WriteFile(drop / "minutes-copy.txt", "same words");

    auto router = MakeRouter(config);
    domain::RoutingReport report = router.run();

    assert(report.moved == 1);
    assert(report.duplicates == 1);
    assert(test::CountFiles(drop) == 0);
    assert(test::CountFiles(config.routing.categoryToFolder.at("admin")) == 1);

    // Sorted processing: "minutes-copy.txt" < "minutes.txt".
    const auto* dup = FindOutcome(report, "minutes.txt");
    assert(dup && dup->status == domain::RoutingStatus::SkippedDuplicate);
    assert(fs::path(dup->destinationPath).filename() == "minutes-copy.txt");
    std::cout << "[PASS] Identical content is stored once." << std::endl;
}

void TestDuplicateOfExistingFile() {
    test::TempRoot root("router_existing");
    domain::Configuration config = infrastructure::ConfigLoader::Defaults(root.str());
    const fs::path admin = config.routing.categoryToFolder.at("admin");
    test::WriteFile(admin / "invoice-2024.pdf", "%PDF invoice 42");
    test::WriteFile(fs::path(config.dropZone) / "invoice.pdf", "%PDF invoice 42");

    domain::RoutingReport report = MakeRouter(config).run();
    assert(report.duplicates == 1);
    assert(!fs::exists(fs::path(config.dropZone) / "invoice.pdf"));
    assert(test::CountFiles(admin) == 1);
    std::cout << "[PASS] Content already at destination is not copied again." << std::endl;
}

void TestCollisionNeverOverwrites() {
    test::TempRoot root("router_collision");
    domain::Configuration config = infrastructure::ConfigLoader::Defaults(root.str());
    const fs::path drop(config.dropZone);
    const fs::path admin = config.routing.categoryToFolder.at("admin");

    test::WriteFile(drop / "plan.docx", "first version");
    domain::RoutingReport first = MakeRouter(config).run();
    assert(first.moved == 1);

    test::WriteFile(drop / "plan.docx", "second version");
    domain::RoutingReport second = MakeRouter(config).run();
    assert(second.moved == 1);

    const auto& placed = second.outcomes.front();
    assert(placed.destinationPath != first.outcomes.front().destinationPath);
    assert(fs::path(placed.destinationPath).filename() ==
           "plan_" + placed.record.fingerprint.substr(0, 8) + ".docx");
    assert(test::ReadFile(admin / "plan.docx") == "first version");
    assert(test::ReadFile(placed.destinationPath) == "second version");
    assert(test::CountFiles(admin) == 2);

    // Suffixed name taken as well.
    const std::string fp = "abcdef0123456789abcdef0123456789";
    test::WriteFile(admin / "memo.txt", "a");
    test::WriteFile(admin / "memo_abcdef01.txt", "b");
    std::string resolved = application::RouterService::ResolveCollision(admin.string(), "memo.txt", fp);
    assert(fs::path(resolved).filename() == "memo_abcdef01_1.txt");
    test::WriteFile(resolved, "c");
    resolved = application::RouterService::ResolveCollision(admin.string(), "memo.txt", fp);
    assert(fs::path(resolved).filename() == "memo_abcdef01_2.txt");
    std::cout << "[PASS] Name collisions get distinct paths." << std::endl;
}

void TestInvalidAndIgnored() {
    test::TempRoot root("router_invalid");
    domain::Configuration config = infrastructure::ConfigLoader::Defaults(root.str());
    const fs::path drop(config.dropZone);
    test::WriteFile(drop / "empty.pdf", "");
    test::WriteFile(drop / ".hidden.pdf", "hidden");
    test::WriteFile(drop / "Thumbs.db", "cache");
    test::WriteFile(drop / "nested" / "deep.pdf", "not scanned");
    test::WriteFile(drop / "mystery.qqq", "unknown stuff");

    domain::RoutingReport report = MakeRouter(config).run();
    assert(report.outcomes.size() == 2);
    assert(report.invalid == 1);
    assert(report.moved == 1);
    assert(report.skipped() == 1);

    const auto* empty = FindOutcome(report, "empty.pdf");
    assert(empty && empty->status == domain::RoutingStatus::SkippedInvalid);
    assert(fs::exists(drop / "empty.pdf"));
    assert(fs::exists(drop / ".hidden.pdf"));
    assert(fs::exists(drop / "Thumbs.db"));
    assert(fs::exists(drop / "nested" / "deep.pdf"));

    const auto* mystery = FindOutcome(report, "mystery.qqq");
    assert(mystery && mystery->record.category == "unclassified");
    assert(fs::exists(fs::path(config.routing.categoryToFolder.at("unclassified")) / "mystery.qqq"));
    std::cout << "[PASS] Empty, hidden and ignored files stay put." << std::endl;
}

void TestPerFileFailuresDoNotStopTheRun() {
    test::TempRoot root("router_failures");
    domain::Configuration config = infrastructure::ConfigLoader::Defaults(root.str());
    const fs::path drop(config.dropZone);
    const fs::path admin = config.routing.categoryToFolder.at("admin");
    const fs::path branding = config.routing.categoryToFolder.at("branding");
    // Permission bits do not stop root.
    const bool enforcesPermissions = geteuid() != 0;

    test::WriteFile(drop / "a_report.pdf", "%PDF-1.4 report");
    test::WriteFile(drop / "b_vanished.pdf", "%PDF-1.4 gone before routing");
    test::WriteFile(drop / "c_growing.docx", "still being written");
    if (enforcesPermissions) {
        test::WriteFile(drop / "d_logo.png", "png bytes");
        fs::create_directories(branding);
        fs::permissions(branding, fs::perms::owner_read | fs::perms::owner_exec);
        test::WriteFile(drop / "e_locked.pdf", "%PDF-1.4 locked");
        fs::permissions(drop / "e_locked.pdf", fs::perms::none);
    }

    application::RouterService router(config, std::make_unique<StaleScanner>(config,
        [&drop](std::vector<infrastructure::DropZoneEntry>& entries) {
            fs::remove(drop / "b_vanished.pdf");
            for (auto& entry : entries) {
                if (entry.filename == "c_growing.docx") entry.sizeBytes += 10;
            }
        }));
    domain::RoutingReport report = router.run();

    const auto* moved = FindOutcome(report, "a_report.pdf");
    assert(moved && moved->status == domain::RoutingStatus::Moved);
    assert(fs::exists(admin / "a_report.pdf"));

    const auto* vanished = FindOutcome(report, "b_vanished.pdf");
    assert(vanished && vanished->status == domain::RoutingStatus::SkippedInvalid);
    assert(vanished->record.fingerprint.empty());
    assert(!fs::exists(admin / "b_vanished.pdf"));

    const auto* growing = FindOutcome(report, "c_growing.docx");
    assert(growing && growing->status == domain::RoutingStatus::Failed);
    assert(growing->reason == domain::FailureReason::InvalidContent);
    assert(fs::exists(drop / "c_growing.docx"));
    assert(!fs::exists(admin / "c_growing.docx"));

    if (enforcesPermissions) {
        const auto* logo = FindOutcome(report, "d_logo.png");
        assert(logo && logo->status == domain::RoutingStatus::Failed);
        assert(logo->reason == domain::FailureReason::PermissionDenied);
        assert(fs::exists(drop / "d_logo.png"));

        const auto* locked = FindOutcome(report, "e_locked.pdf");
        assert(locked && locked->status == domain::RoutingStatus::SkippedInvalid);
        assert(fs::exists(drop / "e_locked.pdf"));

        assert(report.outcomes.size() == 5);
        assert(report.invalid == 2);
        assert(report.failed == 2);
        fs::permissions(branding, fs::perms::owner_all);
        fs::permissions(drop / "e_locked.pdf", fs::perms::owner_read | fs::perms::owner_write);
    } else {
        std::cout << "[Test] Running as root; permission cases skipped." << std::endl;
        assert(report.outcomes.size() == 3);
        assert(report.invalid == 1);
        assert(report.failed == 1);
    }
    assert(report.moved == 1);
    std::cout << "[PASS] A failing file does not stop the others." << std::endl;
}

void TestSourceThatCannotBeRemoved() {
    assert(application::RouterService::ReasonFor(std::make_error_code(std::errc::permission_denied)) ==
           domain::FailureReason::PermissionDenied);
    assert(application::RouterService::ReasonFor(std::make_error_code(std::errc::operation_not_permitted)) ==
           domain::FailureReason::PermissionDenied);
    assert(application::RouterService::ReasonFor(std::make_error_code(std::errc::io_error)) ==
           domain::FailureReason::IOError);

    if (geteuid() == 0) {
        std::cout << "[Test] Running as root; read-only drop zone case skipped." << std::endl;
        return;
    }
    test::TempRoot root("router_readonly");
    domain::Configuration config = infrastructure::ConfigLoader::Defaults(root.str());
    const fs::path drop(config.dropZone);
    const fs::path admin = config.routing.categoryToFolder.at("admin");
    test::WriteFile(drop / "ledger.pdf", "%PDF-1.4 ledger");
    fs::permissions(drop, fs::perms::owner_read | fs::perms::owner_exec);

    domain::RoutingReport report = MakeRouter(config).run();
    fs::permissions(drop, fs::perms::owner_all);

    assert(report.failed == 1);
    assert(report.outcomes.front().reason == domain::FailureReason::PermissionDenied);
    // The placed copy is withdrawn so the file exists exactly once.
    assert(fs::exists(drop / "ledger.pdf"));
    assert(!fs::exists(admin / "ledger.pdf"));
    std::cout << "[PASS] Move is undone when the source cannot be removed." << std::endl;
}

void TestDeduplicatorIndex() {
    test::TempRoot root("dedup");
    test::WriteFile(root.path() / "a.pdf", "alpha");
    test::WriteFile(root.path() / "b.txt", "alpha");

    application::Deduplicator dedup;
    const std::string alpha = infrastructure::ContentHasher::FingerprintBytes("alpha");
    assert(alpha == "2c1743a391305fbf367df8e4f069f9f9");

    auto hit = dedup.findDuplicate(root.str(), ".pdf", alpha);
    assert(hit && fs::path(*hit).filename() == "a.pdf");
    // Only files with the same extension are compared.
    assert(!dedup.findDuplicate(root.str(), ".doc", alpha));

    dedup.remember(root.str(), (root.path() / "c.doc").string(), alpha);
    assert(dedup.findDuplicate(root.str(), ".doc", alpha));
    assert(!dedup.findDuplicate((root.path() / "missing").string(), ".pdf", alpha));
    std::cout << "[PASS] Deduplicator index." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Router Test..." << std::endl;
    TestTwoCategories();
    TestDuplicatesInOneRun();
    TestDuplicateOfExistingFile();
    TestCollisionNeverOverwrites();
    TestInvalidAndIgnored();
    TestPerFileFailuresDoNotStopTheRun();
    TestSourceThatCannotBeRemoved();
    TestDeduplicatorIndex();
    std::cout << "[PASS] Router Test." << std::endl;
    return 0;
}
