/**
 * @file StoragePort.hpp
 * @brief Provider-blind interface to remote backup storage.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "domain/BackupArtifact.hpp"

namespace dropkeeper::domain {

/**
 * @enum StorageError
 * @brief Storage-level error taxonomy.
 */
enum class StorageError {
    None,
    AuthError,
    UploadError,
    DeleteError,
    ListError,
    Timeout
};

inline std::string ToString(StorageError error) {
    switch (error) {
        case StorageError::None: return "none";
        case StorageError::AuthError: return "auth_error";
        case StorageError::UploadError: return "upload_error";
        case StorageError::DeleteError: return "delete_error";
        case StorageError::ListError: return "list_error";
        case StorageError::Timeout: return "timeout";
    }
    return "upload_error";
}

/** @brief Timeouts and upload errors are retried; authentication problems are not. */
inline bool IsRetryable(StorageError error) {
    return error == StorageError::UploadError || error == StorageError::Timeout;
}

/**
 * @struct RemoteRef
 * @brief Handle to one object held by the remote target.
 */
struct RemoteRef {
    std::string key;
    long long sizeBytes = 0;
};

/**
 * @struct Session
 * @brief Proof of a successful authentication.
 */
struct Session {
    std::string provider;
    std::string account;
    std::chrono::system_clock::time_point establishedAt;
};

struct AuthResult {
    std::optional<Session> session;
    StorageError error = StorageError::None;
    std::string message;
};

struct PutResult {
    std::optional<RemoteRef> ref;
    StorageError error = StorageError::None;
    std::string message;
};

struct ListResult {
    bool success = false;
    std::vector<RemoteRef> refs;
    StorageError error = StorageError::None;
    std::string message;
};

struct DeleteResult {
    bool success = false;
    StorageError error = StorageError::None;
    std::string message;
};

/**
 * @class StoragePort
 * @brief Capability set every remote binding implements.
 *
 * Calls block until done or timed out. The core never asks which provider it
 * is talking to beyond providerName() for reporting.
 */
class StoragePort {
public:
    virtual ~StoragePort() = default;

    /** @brief Short provider identifier used in logs and reports. */
    virtual std::string providerName() const = 0;

    /** @brief Establishes a session. Safe to call more than once. */
    virtual AuthResult authenticate() = 0;

    /** @brief True once authenticate() has succeeded. */
    virtual bool isAuthenticated() const = 0;

    /**
     * @brief Uploads an artifact under @p remoteKey.
     *
     * Uploading the same key twice must leave a single remote object.
     */
    virtual PutResult put(const BackupArtifact& artifact, const std::string& remoteKey) = 0;

    /** @brief Lists remote objects whose key starts with @p prefix. */
    virtual ListResult list(const std::string& prefix) = 0;

    /** @brief Deletes one remote object. */
    virtual DeleteResult remove(const RemoteRef& ref) = 0;
};

} // namespace dropkeeper::domain
