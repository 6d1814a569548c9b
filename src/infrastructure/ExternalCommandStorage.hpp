/**
 * @file ExternalCommandStorage.hpp
 * @brief StoragePort binding driving a provider CLI (aws, rclone, dropbox uploader...).
 */

#pragma once
#include "domain/Configuration.hpp"
#include "domain/StoragePort.hpp"
#include <chrono>
#include <map>
#include <string>

namespace dropkeeper::infrastructure {

/**
 * @class ExternalCommandStorage
 * @brief Runs configured command templates through the shell.
 *
 * Placeholders {file}, {key} and {prefix} are replaced by shell-quoted values.
 * Every command runs under a wall-clock limit; a killed command reports
 * StorageError::Timeout. The list command prints one object per line, either
 * "<key>" or "<key>\t<size>".
 */
class ExternalCommandStorage : public domain::StoragePort {
public:
    /**
     * @param provider Provider identifier reported by providerName().
     * @param commands Command templates; authenticate may be empty.
     * @param timeout Limit applied to each command.
     */
    ExternalCommandStorage(std::string provider, domain::CommandTemplates commands, std::chrono::seconds timeout);

    std::string providerName() const override { return m_provider; }
    domain::AuthResult authenticate() override;
    bool isAuthenticated() const override { return m_authenticated; }
    domain::PutResult put(const domain::BackupArtifact& artifact, const std::string& remoteKey) override;
    domain::ListResult list(const std::string& prefix) override;
    domain::DeleteResult remove(const domain::RemoteRef& ref) override;

    /** @brief Substitutes {name} placeholders with quoted values. */
    static std::string Expand(const std::string& commandTemplate, const std::map<std::string, std::string>& values);

private:
    std::string m_provider;
    domain::CommandTemplates m_commands;
    std::chrono::seconds m_timeout;
    bool m_authenticated = false;
};

} // namespace dropkeeper::infrastructure
