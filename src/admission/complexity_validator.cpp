#include "vrpassist/admission/complexity_validator.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>

namespace vrpassist::admission {

namespace {

// 80% of a limit, rounded down
int warning_threshold(int limit) {
    return static_cast<int>((static_cast<int64_t>(limit) * 4) / 5);
}

}  // namespace

Json ComplexityCheckResult::to_json() const {
    return Json{
        {"valid", valid},
        {"errors", errors},
        {"warnings", warnings},
        {"actualComplexity", {
            {"jobCount", actual_complexity.job_count},
            {"resourceCount", actual_complexity.resource_count},
            {"maxTimeWindows", actual_complexity.max_time_windows},
            {"totalTimeWindows", actual_complexity.total_time_windows}
        }}
    };
}

ComplexityCheckResult validate_complexity(const vrp::Problem& problem,
                                          const ComplexityLimits& limits) {
    ComplexityCheckResult result;
    auto& errors = result.errors;

    const int job_count = static_cast<int>(problem.jobs.size());
    const int resource_count = static_cast<int>(problem.resources.size());

    if (job_count > limits.max_jobs) {
        errors.push_back("Too many jobs: " + std::to_string(job_count) +
                         " (maximum " + std::to_string(limits.max_jobs) +
                         " for demo). Sign up for higher limits!");
    }

    if (job_count == 0) {
        errors.push_back("At least 1 job is required");
    }

    if (resource_count > limits.max_resources) {
        errors.push_back("Too many vehicles: " + std::to_string(resource_count) +
                         " (maximum " + std::to_string(limits.max_resources) +
                         " for demo). Sign up for higher limits!");
    }

    if (resource_count == 0) {
        errors.push_back("At least 1 vehicle/resource is required");
    }

    int max_time_windows = 0;
    int total_time_windows = 0;

    for (size_t idx = 0; idx < problem.jobs.size(); ++idx) {
        const auto& job = problem.jobs[idx];
        const int window_count = static_cast<int>(job.windows.size());
        total_time_windows += window_count;
        max_time_windows = std::max(max_time_windows, window_count);

        if (window_count > limits.max_time_windows_per_job) {
            errors.push_back("Job \"" + job.label(idx) + "\" has " +
                             std::to_string(window_count) + " time windows (maximum " +
                             std::to_string(limits.max_time_windows_per_job) + " for demo)");
        }
    }

    for (size_t idx = 0; idx < problem.resources.size(); ++idx) {
        const auto& resource = problem.resources[idx];
        for (size_t shift_idx = 0; shift_idx < resource.shifts.size(); ++shift_idx) {
            const int break_count = static_cast<int>(resource.shifts[shift_idx].breaks.size());
            if (break_count > limits.max_breaks_per_resource) {
                errors.push_back("Resource \"" + resource.label(idx) + "\" shift " +
                                 std::to_string(shift_idx) + " has " +
                                 std::to_string(break_count) + " breaks (maximum " +
                                 std::to_string(limits.max_breaks_per_resource) + " for demo)");
            }
        }
    }

    // Warnings never affect validity
    if (job_count > 0 && job_count >= warning_threshold(limits.max_jobs)) {
        result.warnings.push_back("Approaching job limit (" + std::to_string(job_count) +
                                  "/" + std::to_string(limits.max_jobs) + ")");
    }

    if (resource_count > 0 && resource_count >= warning_threshold(limits.max_resources)) {
        result.warnings.push_back("Approaching resource limit (" + std::to_string(resource_count) +
                                  "/" + std::to_string(limits.max_resources) + ")");
    }

    result.valid = errors.empty();
    result.actual_complexity = ActualComplexity{
        .job_count = job_count,
        .resource_count = resource_count,
        .max_time_windows = max_time_windows,
        .total_time_windows = total_time_windows
    };

    return result;
}

std::string complexity_error_message(const ComplexityCheckResult& result) {
    if (result.valid) {
        return "";
    }

    std::ostringstream ss;
    ss << "VRP problem too complex for demo:\n\n";
    for (size_t i = 0; i < result.errors.size(); ++i) {
        ss << (i + 1) << ". " << result.errors[i];
        if (i + 1 < result.errors.size()) ss << "\n";
    }
    ss << "\n\nSign up for a free account to unlock:\n"
       << "• 100 jobs (5x more)\n"
       << "• 10 vehicles\n"
       << "• Advanced features";
    return ss.str();
}

double estimate_solve_seconds(const vrp::Problem& problem) {
    constexpr double base_seconds = 2.0;
    constexpr double per_job = 0.1;
    constexpr double per_resource = 0.5;

    return base_seconds +
           per_job * static_cast<double>(problem.jobs.size()) +
           per_resource * static_cast<double>(problem.resources.size());
}

}  // namespace vrpassist::admission
