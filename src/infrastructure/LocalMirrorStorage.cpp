/**
 * @file LocalMirrorStorage.cpp
 * @brief Implementation of the LocalMirrorStorage class.
 */
#include "infrastructure/LocalMirrorStorage.hpp"
#include "infrastructure/AtomicFileMover.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace dropkeeper::infrastructure {

LocalMirrorStorage::LocalMirrorStorage(const std::string& rootPath)
    : m_rootPath(rootPath) {}

domain::AuthResult LocalMirrorStorage::authenticate() {
    domain::AuthResult result;
    std::error_code ec;
    fs::create_directories(m_rootPath, ec);
    if (ec || !fs::is_directory(m_rootPath)) {
        result.error = domain::StorageError::AuthError;
        result.message = "Mirror root unavailable: " + m_rootPath + (ec ? " (" + ec.message() + ")" : "");
        m_authenticated = false;
        return result;
    }

    m_authenticated = true;
    result.session = domain::Session{providerName(), m_rootPath, std::chrono::system_clock::now()};
    result.message = "Mirror root ready";
    return result;
}

domain::PutResult LocalMirrorStorage::put(const domain::BackupArtifact& artifact, const std::string& remoteKey) {
    domain::PutResult result;
    if (!m_authenticated) {
        result.error = domain::StorageError::AuthError;
        result.message = "Not authenticated";
        return result;
    }

    fs::path target = fs::path(m_rootPath) / remoteKey;
    try {
        AtomicFileMover::CopyReplace(artifact.localPath, target);
        result.ref = domain::RemoteRef{remoteKey, static_cast<long long>(fs::file_size(target))};
        result.message = "Copied to " + target.string();
    } catch (const fs::filesystem_error& e) {
        result.error = domain::StorageError::UploadError;
        result.message = e.what();
    }
    return result;
}

domain::ListResult LocalMirrorStorage::list(const std::string& prefix) {
    domain::ListResult result;
    if (!m_authenticated) {
        result.error = domain::StorageError::AuthError;
        result.message = "Not authenticated";
        return result;
    }

    const fs::path root(m_rootPath);
    try {
        if (fs::exists(root)) {
            for (const auto& entry : fs::recursive_directory_iterator(root)) {
                if (!entry.is_regular_file()) continue;
                if (PathUtils::IsHiddenName(entry.path().filename().string())) continue;

                std::string key = entry.path().lexically_relative(root).generic_string();
                if (key.compare(0, prefix.size(), prefix) != 0) continue;
                result.refs.push_back(domain::RemoteRef{key, static_cast<long long>(entry.file_size())});
            }
        }
        std::sort(result.refs.begin(), result.refs.end(), [](const domain::RemoteRef& a, const domain::RemoteRef& b) {
            return a.key < b.key;
        });
        result.success = true;
    } catch (const fs::filesystem_error& e) {
        result.refs.clear();
        result.error = domain::StorageError::ListError;
        result.message = e.what();
    }
    return result;
}

domain::DeleteResult LocalMirrorStorage::remove(const domain::RemoteRef& ref) {
    domain::DeleteResult result;
    if (!m_authenticated) {
        result.error = domain::StorageError::AuthError;
        result.message = "Not authenticated";
        return result;
    }

    std::error_code ec;
    bool removed = fs::remove(fs::path(m_rootPath) / ref.key, ec);
    if (ec || !removed) {
        result.error = domain::StorageError::DeleteError;
        result.message = ec ? ec.message() : "No such object: " + ref.key;
        return result;
    }
    result.success = true;
    return result;
}

} // namespace dropkeeper::infrastructure
