#include "vrpassist/analysis/analysis_engine.hpp"

#include <algorithm>
#include <cctype>

namespace vrpassist::analysis {

namespace {

Json optional_json(const std::optional<std::string>& value) {
    return value ? Json(*value) : Json(nullptr);
}

Json optional_json(const std::optional<double>& value) {
    return value ? Json(*value) : Json(nullptr);
}

bool contains_any(const std::string& haystack, std::initializer_list<std::string_view> needles) {
    for (auto needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string_view analysis_kind_to_string(AnalysisKind kind) {
    switch (kind) {
        case AnalysisKind::Routes: return "routes";
        case AnalysisKind::Utilization: return "utilization";
        case AnalysisKind::Constraints: return "constraints";
        case AnalysisKind::Efficiency: return "efficiency";
        case AnalysisKind::Overview: return "overview";
    }
    return "overview";
}

AnalysisKind analysis_kind_from_aspect(std::string_view aspect) {
    std::string lower(aspect);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (contains_any(lower, {"route"})) return AnalysisKind::Routes;
    if (contains_any(lower, {"utilization", "capacity"})) return AnalysisKind::Utilization;
    if (contains_any(lower, {"constraint", "violation"})) return AnalysisKind::Constraints;
    if (contains_any(lower, {"efficiency", "performance"})) return AnalysisKind::Efficiency;
    return AnalysisKind::Overview;
}

// Serialization

Json RouteBreakdown::to_json() const {
    if (no_trips) {
        return Json{{"error", "No trips found in solution"}, {"no_trips", true}};
    }

    Json j_routes = Json::array();
    for (const auto& r : routes) {
        j_routes.push_back(Json{
            {"route_id", r.route_id},
            {"resource", optional_json(r.resource)},
            {"stops", r.stops},
            {"distance", optional_json(r.distance)},
            {"duration", optional_json(r.duration)},
            {"jobs", r.jobs}
        });
    }
    return Json{{"total_routes", routes.size()}, {"routes", j_routes}};
}

Json UtilizationReport::to_json() const {
    if (no_trips) {
        return Json{{"error", "No trips to analyze"}, {"no_trips", true}};
    }

    Json j_vehicles = Json::array();
    for (const auto& v : by_vehicle) {
        j_vehicles.push_back(Json{
            {"resource", optional_json(v.resource)},
            {"capacity_used", v.capacity_used},
            {"capacity_total", v.capacity_total},
            {"stops", v.stops}
        });
    }
    return Json{
        {"utilization_by_vehicle", j_vehicles},
        {"vehicles_used", vehicles_used},
        {"total_vehicles_available", total_vehicles_available}
    };
}

Json VisitViolation::to_json() const {
    return Json{
        {"job", optional_json(job)},
        {"resource", optional_json(resource)},
        {"violations", violations}
    };
}

Json ConstraintReport::to_json() const {
    Json j_violations = Json::array();
    for (const auto& v : violations) {
        j_violations.push_back(v.to_json());
    }

    Json j_unserved = Json::array();
    for (const auto& u : unserved) {
        j_unserved.push_back(Json{{"job", u.job}, {"reasons", u.reasons}});
    }

    return Json{
        {"total_violations", total_violations()},
        {"violations", j_violations},
        {"unassigned_jobs", unassigned_jobs()},
        {"unassigned_details", j_unserved},
        {"status", status()}
    };
}

Json EfficiencyReport::to_json() const {
    if (no_trips) {
        return Json{{"error", "No trips to analyze"}, {"no_trips", true}};
    }

    return Json{
        {"total_distance", total_distance},
        {"total_duration", total_duration},
        {"total_stops", total_stops},
        {"avg_distance_per_stop", avg_distance_per_stop},
        {"vehicles_used", vehicles_used}
    };
}

Json AnalysisResult::to_json() const {
    if (no_solution) {
        return Json{
            {"aspect", std::string(analysis_kind_to_string(kind))},
            {"error", "No solution data available"},
            {"no_solution", true}
        };
    }

    if (kind != AnalysisKind::Overview) {
        switch (kind) {
            case AnalysisKind::Routes: return routes->to_json();
            case AnalysisKind::Utilization: return utilization->to_json();
            case AnalysisKind::Constraints: return constraints->to_json();
            case AnalysisKind::Efficiency: return efficiency->to_json();
            case AnalysisKind::Overview: break;
        }
    }

    return Json{
        {"routes", routes->to_json()},
        {"utilization", utilization->to_json()},
        {"constraints", constraints->to_json()},
        {"efficiency", efficiency->to_json()}
    };
}

// AnalysisEngine

AnalysisResult AnalysisEngine::analyze(std::string_view aspect,
                                       const std::optional<vrp::Solution>& solution,
                                       const vrp::Problem& problem) const {
    return analyze(analysis_kind_from_aspect(aspect), solution, problem);
}

AnalysisResult AnalysisEngine::analyze(AnalysisKind kind,
                                       const std::optional<vrp::Solution>& solution,
                                       const vrp::Problem& problem) const {
    AnalysisResult result;
    result.kind = kind;

    if (!solution) {
        result.no_solution = true;
        return result;
    }

    const bool all = kind == AnalysisKind::Overview;
    if (all || kind == AnalysisKind::Routes) {
        result.routes = route_breakdown(*solution);
    }
    if (all || kind == AnalysisKind::Utilization) {
        result.utilization = utilization(*solution, problem);
    }
    if (all || kind == AnalysisKind::Constraints) {
        result.constraints = constraints(*solution);
    }
    if (all || kind == AnalysisKind::Efficiency) {
        result.efficiency = efficiency(*solution);
    }
    return result;
}

RouteBreakdown AnalysisEngine::route_breakdown(const vrp::Solution& solution) const {
    RouteBreakdown breakdown;
    if (solution.trips.empty()) {
        breakdown.no_trips = true;
        return breakdown;
    }

    for (size_t idx = 0; idx < solution.trips.size(); ++idx) {
        const auto& trip = solution.trips[idx];

        RouteStats stats;
        stats.route_id = idx;
        stats.resource = trip.resource;
        stats.stops = trip.visits.size();
        stats.distance = trip.distance;
        stats.duration = trip.duration;
        for (const auto& visit : trip.visits) {
            stats.jobs.push_back(visit.job.value_or(""));
        }
        breakdown.routes.push_back(std::move(stats));
    }
    return breakdown;
}

UtilizationReport AnalysisEngine::utilization(const vrp::Solution& solution,
                                              const vrp::Problem& problem) const {
    UtilizationReport report;
    if (solution.trips.empty()) {
        report.no_trips = true;
        return report;
    }

    for (const auto& trip : solution.trips) {
        VehicleUtilization vehicle;
        vehicle.resource = trip.resource;
        vehicle.capacity_used = trip.load;
        vehicle.stops = trip.visits.size();

        if (trip.resource) {
            if (const auto* resource = problem.find_resource(*trip.resource)) {
                vehicle.capacity_total = resource->capacity;
            }
        }
        report.by_vehicle.push_back(std::move(vehicle));
    }

    report.vehicles_used = solution.trips.size();
    report.total_vehicles_available = problem.resources.size();
    return report;
}

ConstraintReport AnalysisEngine::constraints(const vrp::Solution& solution) const {
    ConstraintReport report;
    report.violations = extract_violations(solution);

    for (const auto& job : solution.unserved) {
        UnservedJob entry;
        entry.job = job;
        auto it = solution.unserved_reasons.find(job);
        if (it != solution.unserved_reasons.end()) {
            entry.reasons = it->second;
        }
        report.unserved.push_back(std::move(entry));
    }
    return report;
}

EfficiencyReport AnalysisEngine::efficiency(const vrp::Solution& solution) const {
    EfficiencyReport report;
    if (solution.trips.empty()) {
        report.no_trips = true;
        return report;
    }

    for (const auto& trip : solution.trips) {
        report.total_distance += trip.distance_or_zero();
        report.total_duration += trip.duration_or_zero();
        report.total_stops += trip.visits.size();
    }

    report.avg_distance_per_stop = report.total_stops > 0
        ? report.total_distance / static_cast<double>(report.total_stops)
        : 0.0;
    report.vehicles_used = solution.trips.size();
    return report;
}

std::vector<VisitViolation> AnalysisEngine::extract_violations(const vrp::Solution& solution) {
    std::vector<VisitViolation> violations;

    for (const auto& trip : solution.trips) {
        for (const auto& visit : trip.visits) {
            if (!visit.violated_constraints.empty()) {
                violations.push_back(VisitViolation{
                    .job = visit.job,
                    .resource = trip.resource,
                    .violations = visit.violated_constraints
                });
            }
        }
    }
    return violations;
}

}  // namespace vrpassist::analysis
