/**
 * @file DropKeeperApp.cpp
 * @brief Implementation of the DropKeeperApp class.
 */
#include "app/DropKeeperApp.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "infrastructure/BackupRepositoryFs.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DropZoneScanner.hpp"
#include "infrastructure/StorageFactory.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace dropkeeper::app {

namespace {

void LogStatus(std::string message) {
    std::cerr << message << std::endl;
}

void Print(const json& result) {
    std::cout << result.dump(2) << std::endl;
}

json ToJson(const domain::RoutingReport& report) {
    json outcomes = json::array();
    for (const auto& o : report.outcomes) {
        json item = {
            {"source", o.record.sourcePath},
            {"category", o.record.category},
            {"size_bytes", o.record.sizeBytes},
            {"fingerprint", o.record.fingerprint},
            {"status", domain::ToString(o.status)},
            {"destination", o.destinationPath},
        };
        if (o.status == domain::RoutingStatus::Failed) {
            item["reason"] = domain::ToString(o.reason);
        }
        if (!o.detail.empty()) {
            item["detail"] = o.detail;
        }
        outcomes.push_back(item);
    }
    return {
        {"moved", report.moved},
        {"skipped_duplicate", report.duplicates},
        {"skipped_invalid", report.invalid},
        {"failed", report.failed},
        {"outcomes", outcomes},
    };
}

json ToJson(const application::BackupBuilder::BuildResult& build) {
    json out = {
        {"status", application::BackupBuilder::ToString(build.status)},
        {"members", build.memberCount},
        {"message", build.message},
    };
    if (build.status != application::BackupBuilder::BuildStatus::PackError) {
        out["file"] = build.artifact.fileName();
        out["size_bytes"] = build.artifact.sizeBytes;
    }
    return out;
}

json ToJson(const application::RotationReport& rotation) {
    json demoted = json::array();
    for (const auto& a : rotation.demoted) {
        demoted.push_back(a.fileName());
    }
    json evicted = json::array();
    for (const auto& e : rotation.evicted) {
        json item = {
            {"file", e.artifact.fileName()},
            {"remote_key", e.artifact.remoteKey},
            {"local_deleted", e.localDeleted},
            {"remote_attempted", e.remoteAttempted},
            {"remote_deleted", e.remoteDeleted},
        };
        if (!e.localError.empty()) item["local_error"] = e.localError;
        if (e.remoteError != domain::StorageError::None) item["remote_error"] = domain::ToString(e.remoteError);
        if (!e.remoteMessage.empty()) item["remote_message"] = e.remoteMessage;
        evicted.push_back(item);
    }
    return {
        {"working", rotation.workingCount},
        {"archive", rotation.archiveCount},
        {"demoted", demoted},
        {"evicted", evicted},
        {"warnings", rotation.warnings},
        {"errors", rotation.errors},
    };
}

json ToJson(const application::AdmissionResult& admission) {
    return {
        {"status", application::ToString(admission.status)},
        {"file", admission.artifact.fileName()},
        {"remote_key", admission.artifact.remoteKey},
        {"message", admission.message},
        {"rotation", ToJson(admission.rotation)},
    };
}

json ToJson(const application::UploadReport& upload) {
    json failures = json::array();
    for (const auto& f : upload.failures) {
        failures.push_back({
            {"key", f.key},
            {"error", domain::ToString(f.error)},
            {"message", f.message},
            {"attempts", f.attempts},
        });
    }
    return {
        {"uploaded", upload.uploaded},
        {"already_remote", upload.alreadyRemote.size()},
        {"failed", upload.failures.size()},
        {"failures", failures},
    };
}

json ToJson(const domain::HealthReport& health) {
    json checks = json::array();
    for (const auto& c : health.checks) {
        checks.push_back({
            {"name", c.name},
            {"status", c.status == domain::HealthStatus::Pass ? "pass" : "fail"},
            {"reason", c.reason},
        });
    }
    return {
        {"passed", health.passed()},
        {"failures", health.failures()},
        {"checks", checks},
    };
}

bool BuildFailed(const application::BackupBuilder::BuildResult& build) {
    return build.status != application::BackupBuilder::BuildStatus::Built;
}

} // namespace

int DropKeeperApp::Run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "[DropKeeper] --config needs a path" << std::endl;
                return kExitFatal;
            }
            m_configPath = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            m_configPath = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return kExitOk;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        PrintUsage();
        return kExitFatal;
    }

    const std::string command = args[0];
    std::optional<domain::BackupKind> kind;
    if (command == "backup" || command == "upload") {
        if (args.size() != 2 || !(kind = domain::ParseBackupKind(args[1]))) {
            std::cerr << "[DropKeeper] '" << command << "' needs a kind: daily, weekly or monthly" << std::endl;
            return kExitFatal;
        }
    } else if (command == "run") {
        if (args.size() > 2) {
            PrintUsage();
            return kExitFatal;
        }
        if (args.size() == 2 && !(kind = domain::ParseBackupKind(args[1]))) {
            std::cerr << "[DropKeeper] unknown backup kind '" << args[1] << "'" << std::endl;
            return kExitFatal;
        }
    } else if (command == "route" || command == "rotate" || command == "health" ||
               command == "init" || command == "info") {
        if (args.size() != 1) {
            PrintUsage();
            return kExitFatal;
        }
    } else {
        std::cerr << "[DropKeeper] unknown command '" << command << "'" << std::endl;
        PrintUsage();
        return kExitFatal;
    }

    const bool needsSession = command == "backup" || command == "rotate" || command == "upload" ||
                              command == "health" || command == "run";
    try {
        Init(needsSession);
    } catch (const domain::ConfigError& e) {
        std::cerr << "[DropKeeper] Configuration error: " << e.what() << std::endl;
        Print({{"command", command}, {"error", "config_error"}, {"message", e.what()}});
        return kExitFatal;
    }

    if (command == "route") return RunRoute();
    if (command == "backup") return RunBackup(*kind);
    if (command == "rotate") return RunRotate();
    if (command == "upload") return RunUpload(*kind);
    if (command == "health") return RunHealth();
    if (command == "init") return RunInit();
    if (command == "info") return RunInfo();
    return RunPipeline(kind.value_or(m_config.backup.schedule));
}

void DropKeeperApp::PrintUsage() const {
    std::cerr << "Usage: dropkeeper [--config <file>] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  route            Move drop-zone files into the folder taxonomy\n"
              << "  backup <kind>    Build and admit a daily, weekly or monthly backup\n"
              << "  rotate           Re-apply the retention policy\n"
              << "  upload <kind>    Upload backups of <kind> missing from remote storage\n"
              << "  health           Run the health checklist\n"
              << "  init             Create the folder taxonomy\n"
              << "  run [kind]       route, backup, upload and health in one go\n"
              << "  info             Print the effective configuration\n"
              << "\n"
              << "The configuration is read from --config, $DROPKEEPER_CONFIG or\n"
              << "$XDG_CONFIG_HOME/dropkeeper/config.json.\n";
}

void DropKeeperApp::Init(bool authenticate) {
    const std::string path = infrastructure::ConfigLoader::ResolveConfigPath(m_configPath);
    std::cerr << "[DropKeeper] Using configuration " << path << std::endl;
    m_config = infrastructure::ConfigLoader::LoadFromFile(path);

    m_services.storage = infrastructure::StorageFactory::Create(m_config.storage);
    m_services.repository = std::make_unique<infrastructure::BackupRepositoryFs>(
        m_config.backup.prefix, m_config.backup.directory, m_config.backup.archiveDirectory);

    auto scanner = std::make_unique<infrastructure::DropZoneScanner>(m_config.dropZone, m_config.ignoredNames);
    m_services.router = std::make_unique<application::RouterService>(m_config, std::move(scanner));
    m_services.builder = std::make_unique<application::BackupBuilder>(m_config);
    m_services.rotation = std::make_unique<application::RotationManager>(
        *m_services.repository, m_services.storage.get(), m_config.backup.retention, m_config.backup.prefix);
    m_services.upload = std::make_unique<application::UploadService>(
        *m_services.repository, *m_services.storage, m_config.backup.prefix,
        m_config.storage.maxAttempts, m_config.storage.retryDelay);
    m_services.health = std::make_unique<application::HealthReporter>(
        m_config, *m_services.repository, m_services.storage.get());

    if (authenticate) {
        domain::AuthResult auth = m_services.storage->authenticate();
        if (auth.session) {
            std::cerr << "[DropKeeper] Storage " << m_services.storage->providerName() << ": " << auth.message << std::endl;
        } else {
            std::cerr << "[DropKeeper] Storage " << m_services.storage->providerName() << " unavailable ("
                      << domain::ToString(auth.error) << "): " << auth.message << std::endl;
        }
    }
}

int DropKeeperApp::RunRoute() {
    try {
        domain::RoutingReport report = m_services.router->run(LogStatus);
        json out = ToJson(report);
        out["command"] = "route";
        Print(out);
        return report.failed == 0 ? kExitOk : kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "[DropKeeper] Routing aborted: " << e.what() << std::endl;
        Print({{"command", "route"}, {"error", "io_error"}, {"message", e.what()}});
        return kExitFailure;
    }
}

int DropKeeperApp::RunBackup(domain::BackupKind kind) {
    json out = {{"command", "backup"}, {"kind", domain::ToString(kind)}};

    auto build = m_services.builder->build(kind, LogStatus);
    out["build"] = ToJson(build);
    if (build.status == application::BackupBuilder::BuildStatus::PackError) {
        Print(out);
        return kExitFailure;
    }

    auto admission = m_services.rotation->admit(build.artifact, LogStatus);
    out["admission"] = ToJson(admission);
    Print(out);

    bool failed = BuildFailed(build) || admission.status == application::AdmissionStatus::Failed ||
                  admission.rotation.failures() > 0;
    return failed ? kExitFailure : kExitOk;
}

int DropKeeperApp::RunRotate() {
    auto rotation = m_services.rotation->enforce(LogStatus);
    json out = ToJson(rotation);
    out["command"] = "rotate";
    Print(out);
    return rotation.failures() == 0 ? kExitOk : kExitFailure;
}

int DropKeeperApp::RunUpload(domain::BackupKind kind) {
    auto upload = m_services.upload->uploadPending(kind, LogStatus);
    json out = ToJson(upload);
    out["command"] = "upload";
    out["kind"] = domain::ToString(kind);
    out["provider"] = m_services.storage->providerName();
    Print(out);
    return upload.success() ? kExitOk : kExitFailure;
}

int DropKeeperApp::RunHealth() {
    auto health = m_services.health->run();
    for (const auto& check : health.checks) {
        std::cerr << "[Health] " << (check.status == domain::HealthStatus::Pass ? "PASS " : "FAIL ")
                  << check.name << ": " << check.reason << std::endl;
    }
    json out = ToJson(health);
    out["command"] = "health";
    Print(out);
    return health.passed() ? kExitOk : kExitFailure;
}

int DropKeeperApp::RunInit() {
    json created = json::array();
    json failed = json::array();

    std::vector<std::string> folders = m_config.requiredFolders();
    folders.push_back(m_config.backup.stagingDirectory());
    for (const auto& folder : folders) {
        std::error_code ec;
        if (fs::is_directory(folder, ec)) continue;
        fs::create_directories(folder, ec);
        if (ec) {
            std::cerr << "[DropKeeper] Cannot create " << folder << ": " << ec.message() << std::endl;
            failed.push_back({{"folder", folder}, {"error", ec.message()}});
        } else {
            std::cerr << "[DropKeeper] Created " << folder << std::endl;
            created.push_back(folder);
        }
    }

    Print({{"command", "init"}, {"base_dir", m_config.baseDir}, {"created", created}, {"failed", failed}});
    return failed.empty() ? kExitOk : kExitFailure;
}

int DropKeeperApp::RunPipeline(domain::BackupKind kind) {
    json out = {{"command", "run"}, {"kind", domain::ToString(kind)}};
    int exitCode = kExitOk;

    try {
        domain::RoutingReport routing = m_services.router->run(LogStatus);
        out["route"] = ToJson(routing);
        if (routing.failed > 0) exitCode = kExitFailure;
    } catch (const std::exception& e) {
        // Routing problems never block the backup of what is already in place.
        std::cerr << "[DropKeeper] Routing aborted: " << e.what() << std::endl;
        out["route"] = {{"error", "io_error"}, {"message", e.what()}};
        exitCode = kExitFailure;
    }

    auto build = m_services.builder->build(kind, LogStatus);
    out["build"] = ToJson(build);
    if (build.status == application::BackupBuilder::BuildStatus::PackError) {
        exitCode = kExitFailure;
    } else {
        auto admission = m_services.rotation->admit(build.artifact, LogStatus);
        out["admission"] = ToJson(admission);
        if (admission.status == application::AdmissionStatus::Failed) exitCode = kExitFailure;
    }

    // Upload failures are retried next run; health decides whether they matter.
    auto upload = m_services.upload->uploadPending(kind, LogStatus);
    out["upload"] = ToJson(upload);

    auto health = m_services.health->run();
    out["health"] = ToJson(health);
    if (!health.passed()) exitCode = kExitFailure;

    Print(out);
    return exitCode;
}

int DropKeeperApp::RunInfo() {
    json out = json::parse(infrastructure::ConfigLoader::ToJson(m_config));
    Print({{"command", "info"}, {"config", out}});
    return kExitOk;
}

} // namespace dropkeeper::app
