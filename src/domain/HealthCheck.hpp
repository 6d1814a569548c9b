/**
 * @file HealthCheck.hpp
 * @brief Results produced by the Health Reporter.
 */

#pragma once
#include <algorithm>
#include <string>
#include <vector>

namespace dropkeeper::domain {

enum class HealthStatus {
    Pass,
    Fail
};

struct HealthCheckResult {
    std::string name;
    HealthStatus status = HealthStatus::Fail;
    std::string reason; ///< Human-readable explanation, set for passes too.
};

/**
 * @struct HealthReport
 * @brief Ordered checklist results of one health run.
 */
struct HealthReport {
    std::vector<HealthCheckResult> checks;

    int failures() const {
        return static_cast<int>(std::count_if(checks.begin(), checks.end(), [](const HealthCheckResult& c) {
            return c.status == HealthStatus::Fail;
        }));
    }

    bool passed() const { return failures() == 0; }
};

} // namespace dropkeeper::domain
