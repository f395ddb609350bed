#pragma once

#include "vrpassist/analysis/analysis_engine.hpp"
#include "vrpassist/core/config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vrpassist::analysis {

enum class Severity {
    Low,
    Medium,
    High
};

std::string_view severity_to_string(Severity severity);

struct Suggestion {
    std::string category;   // coverage, constraints, efficiency, balance
    Severity severity = Severity::Low;
    std::string issue;
    std::string action;
    std::optional<Json> details;

    Json to_json() const;
};

struct SuggestionOptions {
    // Capacity utilization figure used by the efficiency rule when the
    // solution has trips. Not derived from loads.
    double assumed_capacity_utilization = 0.7;
    double low_utilization_threshold = 0.6;
    double balance_ratio = 2.0;
    size_t max_violation_details = 3;

    static SuggestionOptions from_config(const AnalysisConfig& config);
};

struct SuggestionList {
    bool no_solution = false;
    std::vector<Suggestion> suggestions;

    bool empty() const { return suggestions.empty(); }
    Json to_json() const;
};

// Rule-based recommendations, in fixed rule order
class SuggestionEngine {
public:
    SuggestionEngine() = default;
    explicit SuggestionEngine(SuggestionOptions options);

    SuggestionList suggest(const std::optional<vrp::Solution>& solution,
                           const vrp::Problem& problem) const;

    const SuggestionOptions& options() const { return options_; }

private:
    SuggestionOptions options_;
};

}  // namespace vrpassist::analysis
