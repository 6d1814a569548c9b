/**
 * @file FileRecord.hpp
 * @brief Domain entities describing a file picked up from the drop zone and the outcome of routing it.
 */

#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace dropkeeper::domain {

/**
 * @struct FileRecord
 * @brief Snapshot of a drop-zone file taken when the Router scans it.
 *
 * Built once per file and never modified afterwards. The fingerprint stays
 * empty when the file was rejected before it could be read.
 */
struct FileRecord {
    std::string sourcePath;  ///< Absolute path inside the drop zone.
    std::uintmax_t sizeBytes = 0;
    std::string fingerprint; ///< 32 hex chars (MD5 of the content).
    std::string category;    ///< Category resolved by the Classifier.
};

/**
 * @enum RoutingStatus
 * @brief What happened to a single drop-zone file.
 */
enum class RoutingStatus {
    Moved,            ///< File now lives at its destination.
    SkippedDuplicate, ///< Same content already at the destination; source removed.
    SkippedInvalid,   ///< Empty or unreadable; left in place.
    Failed            ///< Processing error; source left in place.
};

/**
 * @enum FailureReason
 * @brief Reason code attached to a Failed outcome.
 */
enum class FailureReason {
    None,
    IOError,
    PermissionDenied,
    InvalidContent
};

inline std::string ToString(RoutingStatus status) {
    switch (status) {
        case RoutingStatus::Moved: return "moved";
        case RoutingStatus::SkippedDuplicate: return "skipped_duplicate";
        case RoutingStatus::SkippedInvalid: return "skipped_invalid";
        case RoutingStatus::Failed: return "failed";
    }
    return "failed";
}

inline std::string ToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::None: return "none";
        case FailureReason::IOError: return "io_error";
        case FailureReason::PermissionDenied: return "permission_denied";
        case FailureReason::InvalidContent: return "invalid_content";
    }
    return "io_error";
}

/**
 * @struct RoutingOutcome
 * @brief Result of processing exactly one FileRecord.
 */
struct RoutingOutcome {
    FileRecord record;
    std::string destinationPath; ///< Final path (Moved) or the authoritative copy (SkippedDuplicate).
    RoutingStatus status = RoutingStatus::Failed;
    FailureReason reason = FailureReason::None;
    std::string detail;          ///< Human-readable explanation for skips and failures.
};

/**
 * @struct RoutingReport
 * @brief Everything a Router run produced, in processing order.
 */
struct RoutingReport {
    std::vector<RoutingOutcome> outcomes;
    int moved = 0;
    int duplicates = 0;
    int invalid = 0;
    int failed = 0;

    int skipped() const { return duplicates + invalid; }
};

} // namespace dropkeeper::domain
