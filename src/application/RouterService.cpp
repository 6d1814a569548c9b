/**
 * @file RouterService.cpp
 * @brief Implementation of the RouterService class.
 */
#include "application/RouterService.hpp"
#include "application/Deduplicator.hpp"
#include "infrastructure/AtomicFileMover.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/PathUtils.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace dropkeeper::application {

namespace {

constexpr int kMaxPlacementAttempts = 3;

domain::RoutingOutcome Fail(domain::RoutingOutcome outcome, domain::FailureReason reason, const std::string& detail) {
    outcome.status = domain::RoutingStatus::Failed;
    outcome.reason = reason;
    outcome.detail = detail;
    return outcome;
}

void Report(const std::function<void(std::string)>& cb, const std::string& message) {
    if (cb) cb(message);
}

} // namespace

RouterService::RouterService(const domain::Configuration& config, std::unique_ptr<infrastructure::DropZoneScanner> scanner)
    : m_config(config), m_scanner(std::move(scanner)), m_classifier(config.routing, config.sniffContent) {}

domain::FailureReason RouterService::ReasonFor(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return domain::FailureReason::PermissionDenied;
    }
    return domain::FailureReason::IOError;
}

std::string RouterService::ResolveCollision(const std::string& folder, const std::string& filename,
                                            const std::string& fingerprint) {
    fs::path dir(folder);
    fs::path candidate = dir / filename;
    if (!fs::exists(candidate)) {
        return candidate.string();
    }

    const fs::path name(filename);
    const std::string stem = name.stem().string();
    const std::string ext = name.extension().string();
    const std::string tagged = stem + "_" + fingerprint.substr(0, 8);

    candidate = dir / (tagged + ext);
    for (int n = 1; fs::exists(candidate); ++n) {
        candidate = dir / (tagged + "_" + std::to_string(n) + ext);
    }
    return candidate.string();
}

domain::RoutingOutcome RouterService::routeOne(const infrastructure::DropZoneEntry& entry, Deduplicator& dedup) {
    domain::RoutingOutcome outcome;
    outcome.record.sourcePath = entry.path;
    outcome.record.sizeBytes = entry.sizeBytes;
    outcome.record.category = m_classifier.classify(entry.path);
    const std::string folder = m_classifier.destinationFor(outcome.record.category);

    if (entry.sizeBytes == 0) {
        outcome.status = domain::RoutingStatus::SkippedInvalid;
        outcome.detail = "empty file";
        return outcome;
    }
    if (!std::ifstream(entry.path, std::ios::binary)) {
        outcome.status = domain::RoutingStatus::SkippedInvalid;
        outcome.detail = "cannot open file";
        return outcome;
    }

    try {
        auto fp = infrastructure::ContentHasher::FingerprintFile(entry.path);
        if (fp.bytesRead != entry.sizeBytes) {
            return Fail(outcome, domain::FailureReason::InvalidContent,
                        "size changed while reading (" + std::to_string(entry.sizeBytes) + " -> " +
                        std::to_string(fp.bytesRead) + " bytes)");
        }
        outcome.record.fingerprint = fp.hex;
    } catch (const fs::filesystem_error& e) {
        return Fail(outcome, ReasonFor(e.code()), e.what());
    } catch (const std::exception& e) {
        return Fail(outcome, domain::FailureReason::IOError, e.what());
    }

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        return Fail(outcome, ReasonFor(ec), "cannot create " + folder + ": " + ec.message());
    }

    const std::string extension = infrastructure::PathUtils::LowerExtension(entry.path);
    if (auto existing = dedup.findDuplicate(folder, extension, outcome.record.fingerprint)) {
        fs::remove(entry.path, ec);
        if (ec) {
            return Fail(outcome, ReasonFor(ec), "duplicate of " + *existing + " but source not removed: " + ec.message());
        }
        outcome.status = domain::RoutingStatus::SkippedDuplicate;
        outcome.destinationPath = *existing;
        outcome.detail = "same content as " + fs::path(*existing).filename().string();
        return outcome;
    }

    // Another writer may claim the chosen name between resolution and placement.
    for (int attempt = 1; attempt <= kMaxPlacementAttempts; ++attempt) {
        std::string target;
        try {
            target = ResolveCollision(folder, entry.filename, outcome.record.fingerprint);
            infrastructure::AtomicFileMover::MoveNoClobber(entry.path, target);
        } catch (const fs::filesystem_error& e) {
            if (e.code() == std::errc::file_exists && attempt < kMaxPlacementAttempts) {
                continue;
            }
            return Fail(outcome, ReasonFor(e.code()), e.what());
        }

        dedup.remember(folder, target, outcome.record.fingerprint);
        outcome.status = domain::RoutingStatus::Moved;
        outcome.destinationPath = target;
        if (fs::path(target).filename().string() != entry.filename) {
            outcome.detail = "renamed to " + fs::path(target).filename().string();
        }
        return outcome;
    }
    return Fail(outcome, domain::FailureReason::IOError, "no free destination name");
}

domain::RoutingReport RouterService::run(std::function<void(std::string)> statusCallback) {
    domain::RoutingReport report;
    Deduplicator dedup;

    auto entries = m_scanner->scan();
    Report(statusCallback, "[Router] " + std::to_string(entries.size()) + " file(s) in " + m_scanner->path());

    for (const auto& entry : entries) {
        domain::RoutingOutcome outcome = routeOne(entry, dedup);
        switch (outcome.status) {
            case domain::RoutingStatus::Moved: ++report.moved; break;
            case domain::RoutingStatus::SkippedDuplicate: ++report.duplicates; break;
            case domain::RoutingStatus::SkippedInvalid: ++report.invalid; break;
            case domain::RoutingStatus::Failed: ++report.failed; break;
        }

        std::string line = "[Router] " + entry.filename + " -> " + domain::ToString(outcome.status);
        if (outcome.status == domain::RoutingStatus::Failed) {
            line += " (" + domain::ToString(outcome.reason) + ")";
        }
        if (!outcome.detail.empty()) {
            line += ": " + outcome.detail;
        }
        Report(statusCallback, line);
        report.outcomes.push_back(std::move(outcome));
    }

    Report(statusCallback, "[Router] moved=" + std::to_string(report.moved) +
                           " duplicates=" + std::to_string(report.duplicates) +
                           " invalid=" + std::to_string(report.invalid) +
                           " failed=" + std::to_string(report.failed));
    return report;
}

} // namespace dropkeeper::application
