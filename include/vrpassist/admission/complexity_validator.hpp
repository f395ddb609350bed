#pragma once

#include "vrpassist/core/config.hpp"
#include "vrpassist/core/types.hpp"
#include "vrpassist/vrp/model.hpp"

#include <string>
#include <vector>

namespace vrpassist::admission {

using namespace vrpassist::core;

// Limits for VRP problem complexity
struct ComplexityLimits {
    int max_jobs;
    int max_resources;
    int max_time_windows_per_job;
    int max_breaks_per_resource;

    static ComplexityLimits from_config(const LimitsConfig& config) {
        return ComplexityLimits{
            config.max_jobs,
            config.max_resources,
            config.max_time_windows_per_job,
            config.max_breaks_per_resource
        };
    }
};

// Demo limits for anonymous/public users
inline constexpr ComplexityLimits kDemoComplexityLimits{250, 30, 5, 3};

// Measured complexity of a problem
struct ActualComplexity {
    int job_count = 0;
    int resource_count = 0;
    int max_time_windows = 0;
    int total_time_windows = 0;
};

struct ComplexityCheckResult {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    ActualComplexity actual_complexity;

    // camelCase keys, as sent in rejection bodies
    Json to_json() const;
};

// Validate a problem against limits. Pure: no I/O, no state.
ComplexityCheckResult validate_complexity(const vrp::Problem& problem,
                                          const ComplexityLimits& limits = kDemoComplexityLimits);

// User-facing rejection text; empty for a valid result
std::string complexity_error_message(const ComplexityCheckResult& result);

// Rough solve-time estimate in seconds
double estimate_solve_seconds(const vrp::Problem& problem);

}  // namespace vrpassist::admission
