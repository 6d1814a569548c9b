/**
 * @file RetentionPolicy.hpp
 * @brief Retention limits for working and archive backups.
 */

#pragma once
#include <cstdint>

namespace dropkeeper::domain {

/**
 * @struct RetentionPolicy
 * @brief Read-only limits enforced by the Rotation Manager.
 */
struct RetentionPolicy {
    int maxWorking = 1;             ///< W, at least 1.
    int maxArchive = 4;             ///< A, may be 0.
    std::uintmax_t minSizeBytes = 0; ///< Artifacts below this are "undersized".
};

} // namespace dropkeeper::domain
