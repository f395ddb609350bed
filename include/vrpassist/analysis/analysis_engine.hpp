#pragma once

#include "vrpassist/core/types.hpp"
#include "vrpassist/vrp/model.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vrpassist::analysis {

using namespace vrpassist::core;

// Which view of a solution to compute
enum class AnalysisKind {
    Routes,
    Utilization,
    Constraints,
    Efficiency,
    Overview     // all four views
};

std::string_view analysis_kind_to_string(AnalysisKind kind);

// Map free-text aspect to a kind. Case-insensitive substring match, first hit
// wins: "route", then "utilization"/"capacity", then "constraint"/"violation",
// then "efficiency"/"performance"; anything else is Overview.
AnalysisKind analysis_kind_from_aspect(std::string_view aspect);

struct RouteStats {
    size_t route_id = 0;
    std::optional<std::string> resource;
    size_t stops = 0;
    std::optional<double> distance;
    std::optional<double> duration;
    std::vector<std::string> jobs;
};

struct RouteBreakdown {
    bool no_trips = false;
    std::vector<RouteStats> routes;

    Json to_json() const;
};

struct VehicleUtilization {
    std::optional<std::string> resource;
    std::vector<double> capacity_used;
    std::vector<double> capacity_total;  // empty when the resource is not declared
    size_t stops = 0;
};

struct UtilizationReport {
    bool no_trips = false;
    std::vector<VehicleUtilization> by_vehicle;
    size_t vehicles_used = 0;
    size_t total_vehicles_available = 0;

    Json to_json() const;
};

// A visit carrying a non-empty violated-constraints list
struct VisitViolation {
    std::optional<std::string> job;
    std::optional<std::string> resource;
    std::vector<std::string> violations;

    Json to_json() const;
};

struct UnservedJob {
    std::string job;
    std::vector<std::string> reasons;
};

struct ConstraintReport {
    std::vector<VisitViolation> violations;
    std::vector<UnservedJob> unserved;

    size_t total_violations() const { return violations.size(); }
    size_t unassigned_jobs() const { return unserved.size(); }
    bool feasible() const { return violations.empty(); }

    // "feasible" or "has_violations"
    std::string status() const { return feasible() ? "feasible" : "has_violations"; }

    Json to_json() const;
};

struct EfficiencyReport {
    bool no_trips = false;
    double total_distance = 0.0;
    double total_duration = 0.0;
    size_t total_stops = 0;
    double avg_distance_per_stop = 0.0;
    size_t vehicles_used = 0;

    Json to_json() const;
};

struct AnalysisResult {
    AnalysisKind kind = AnalysisKind::Overview;
    bool no_solution = false;

    std::optional<RouteBreakdown> routes;
    std::optional<UtilizationReport> utilization;
    std::optional<ConstraintReport> constraints;
    std::optional<EfficiencyReport> efficiency;

    Json to_json() const;
};

// Stateless derivation of structured insights from a solution
class AnalysisEngine {
public:
    AnalysisResult analyze(std::string_view aspect,
                           const std::optional<vrp::Solution>& solution,
                           const vrp::Problem& problem) const;

    AnalysisResult analyze(AnalysisKind kind,
                           const std::optional<vrp::Solution>& solution,
                           const vrp::Problem& problem) const;

    RouteBreakdown route_breakdown(const vrp::Solution& solution) const;
    UtilizationReport utilization(const vrp::Solution& solution, const vrp::Problem& problem) const;
    ConstraintReport constraints(const vrp::Solution& solution) const;
    EfficiencyReport efficiency(const vrp::Solution& solution) const;

    // Every visit with violations, in trip then visit order
    static std::vector<VisitViolation> extract_violations(const vrp::Solution& solution);
};

}  // namespace vrpassist::analysis
