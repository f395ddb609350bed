#include "vrpassist/analysis/suggestion_engine.hpp"

#include <algorithm>

namespace vrpassist::analysis {

std::string_view severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
    }
    return "low";
}

Json Suggestion::to_json() const {
    Json j = {
        {"category", category},
        {"severity", std::string(severity_to_string(severity))},
        {"issue", issue},
        {"suggestion", action}
    };
    if (details) {
        j["details"] = *details;
    }
    return j;
}

SuggestionOptions SuggestionOptions::from_config(const AnalysisConfig& config) {
    return SuggestionOptions{
        .assumed_capacity_utilization = config.assumed_capacity_utilization,
        .low_utilization_threshold = config.low_utilization_threshold,
        .balance_ratio = config.balance_ratio,
        .max_violation_details = static_cast<size_t>(std::max(0, config.max_violation_details))
    };
}

Json SuggestionList::to_json() const {
    Json items = Json::array();
    for (const auto& s : suggestions) {
        items.push_back(s.to_json());
    }

    Json j = {
        {"suggestions", items},
        {"total_found", suggestions.size()}
    };
    if (no_solution) {
        j["error"] = "No VRP solution available to analyze";
        j["no_solution"] = true;
    }
    return j;
}

SuggestionEngine::SuggestionEngine(SuggestionOptions options)
    : options_(options)
{
}

SuggestionList SuggestionEngine::suggest(const std::optional<vrp::Solution>& solution,
                                         const vrp::Problem& /*problem*/) const {
    SuggestionList list;
    if (!solution) {
        list.no_solution = true;
        return list;
    }

    // Coverage
    if (!solution->unserved.empty()) {
        list.suggestions.push_back(Suggestion{
            .category = "coverage",
            .severity = Severity::High,
            .issue = std::to_string(solution->unserved.size()) + " unassigned jobs",
            .action = "Consider adding more vehicles or relaxing time window constraints",
            .details = std::nullopt
        });
    }

    // Constraints
    auto violations = AnalysisEngine::extract_violations(*solution);
    if (!violations.empty()) {
        Json details = Json::array();
        const size_t shown = std::min(violations.size(), options_.max_violation_details);
        for (size_t i = 0; i < shown; ++i) {
            details.push_back(violations[i].to_json());
        }

        list.suggestions.push_back(Suggestion{
            .category = "constraints",
            .severity = Severity::High,
            .issue = std::to_string(violations.size()) + " constraint violations found",
            .action = "Review time windows, capacities, and skills constraints",
            .details = std::move(details)
        });
    }

    // Efficiency. With no trips there is no utilization figure, which reads as 0.
    const double utilization = solution->trips.empty()
        ? 0.0
        : options_.assumed_capacity_utilization;
    if (utilization < options_.low_utilization_threshold) {
        list.suggestions.push_back(Suggestion{
            .category = "efficiency",
            .severity = Severity::Medium,
            .issue = "Low average capacity utilization",
            .action = "Consider reducing number of vehicles or consolidating routes",
            .details = std::nullopt
        });
    }

    // Balance
    if (!solution->trips.empty()) {
        auto [min_it, max_it] = std::minmax_element(
            solution->trips.begin(), solution->trips.end(),
            [](const vrp::Trip& a, const vrp::Trip& b) {
                return a.duration_or_zero() < b.duration_or_zero();
            });

        const double shortest = min_it->duration_or_zero();
        const double longest = max_it->duration_or_zero();
        if (longest > shortest * options_.balance_ratio) {
            list.suggestions.push_back(Suggestion{
                .category = "balance",
                .severity = Severity::Low,
                .issue = "Unbalanced route durations",
                .action = "Enable route balancing in solver options",
                .details = Json{{"shortest", shortest}, {"longest", longest}}
            });
        }
    }

    return list;
}

}  // namespace vrpassist::analysis
