/**
 * @file LocalMirrorStorage.hpp
 * @brief StoragePort binding that mirrors backups into a local directory.
 */

#pragma once
#include "domain/StoragePort.hpp"
#include <string>

namespace dropkeeper::infrastructure {

/**
 * @class LocalMirrorStorage
 * @brief Stores each object at <root>/<remote key>.
 *
 * Useful for a second disk or a mounted share. Authentication only checks that
 * the root can be created and written.
 */
class LocalMirrorStorage : public domain::StoragePort {
public:
    explicit LocalMirrorStorage(const std::string& rootPath);

    std::string providerName() const override { return "local-mirror"; }
    domain::AuthResult authenticate() override;
    bool isAuthenticated() const override { return m_authenticated; }
    domain::PutResult put(const domain::BackupArtifact& artifact, const std::string& remoteKey) override;
    domain::ListResult list(const std::string& prefix) override;
    domain::DeleteResult remove(const domain::RemoteRef& ref) override;

    const std::string& rootPath() const { return m_rootPath; }

private:
    std::string m_rootPath;
    bool m_authenticated = false;
};

} // namespace dropkeeper::infrastructure
