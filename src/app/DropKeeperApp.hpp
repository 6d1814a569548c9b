/**
 * @file DropKeeperApp.hpp
 * @brief Command-line front end of the routing and backup pipeline.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/PipelineServices.hpp"
#include "domain/Configuration.hpp"

namespace dropkeeper::app {

/**
 * @class DropKeeperApp
 * @brief Parses the command line, wires the services once and dispatches one command.
 *
 * Every command prints a single JSON object on stdout. Progress goes to stderr.
 */
class DropKeeperApp {
public:
    /** @brief Exit codes shared by all commands. */
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitFatal = 2;

    /**
     * @brief Runs one command.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Loads the configuration and builds the pipeline services.
     * @param authenticate Establish the storage session up front.
     * @throws domain::ConfigError on invalid configuration.
     */
    void Init(bool authenticate);

    void PrintUsage() const;

    int RunRoute();
    int RunBackup(domain::BackupKind kind);
    int RunRotate();
    int RunUpload(domain::BackupKind kind);
    int RunHealth();
    int RunInit();
    int RunPipeline(domain::BackupKind kind);
    int RunInfo();

    std::optional<std::string> m_configPath; ///< Explicit --config value.
    domain::Configuration m_config;          ///< Loaded once, read-only afterwards.
    application::PipelineServices m_services;
};

} // namespace dropkeeper::app
