#pragma once

#include "vrpassist/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vrpassist::vrp {

using namespace vrpassist::core;

// Problem side. Every field is optional on the wire; parsing never throws on a
// missing or mistyped member, it leaves the field empty instead.

struct Location {
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<std::string> address;

    bool operator==(const Location&) const = default;
};

struct TimeWindow {
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<bool> hard;

    bool operator==(const TimeWindow&) const = default;
};

struct Job {
    std::optional<std::string> name;  // "name", falling back to "id"
    std::optional<Location> location;
    std::optional<double> duration;   // seconds
    std::vector<TimeWindow> windows;

    // Declared name, else the position in the job list
    std::string label(size_t index) const;

    bool operator==(const Job&) const = default;
};

struct Shift {
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::vector<Json> breaks;

    bool operator==(const Shift&) const = default;
};

struct Resource {
    std::optional<std::string> name;  // "name", falling back to "id"
    std::vector<double> capacity;     // one entry per capacity dimension
    std::vector<Shift> shifts;

    std::string label(size_t index) const;

    bool operator==(const Resource&) const = default;
};

struct Problem {
    std::vector<Job> jobs;
    std::vector<Resource> resources;

    // Document as received; forwarded to the solver untouched
    Json document;

    const Resource* find_resource(const std::string& name) const;

    static Problem from_json(const Json& j);
    Json to_json() const;

    bool operator==(const Problem&) const = default;
};

// Solution side

struct Visit {
    std::optional<std::string> job;
    std::optional<std::string> arrival;
    std::vector<std::string> violated_constraints;

    bool operator==(const Visit&) const = default;
};

struct Trip {
    std::optional<std::string> resource;
    std::vector<Visit> visits;
    std::optional<double> distance;     // meters
    std::optional<double> duration;     // seconds, "duration" or "workTime"
    std::optional<double> travel_time;  // seconds
    std::vector<double> load;

    double distance_or_zero() const { return distance.value_or(0.0); }
    double duration_or_zero() const { return duration.value_or(0.0); }

    bool operator==(const Trip&) const = default;
};

// Solution-level constraint report ("violations" on the solution object)
struct ConstraintViolation {
    std::optional<std::string> name;
    std::optional<std::string> value;
    std::optional<std::string> level;

    bool operator==(const ConstraintViolation&) const = default;
};

struct Score {
    std::optional<bool> feasible;
    std::optional<double> hard_score;
    std::optional<double> soft_score;

    bool operator==(const Score&) const = default;
};

struct Solution {
    std::optional<std::string> id;
    std::optional<std::string> status;
    std::vector<Trip> trips;
    std::vector<std::string> unserved;
    std::map<std::string, std::vector<std::string>> unserved_reasons;
    std::vector<ConstraintViolation> violations;
    std::optional<Score> score;
    std::optional<double> occupancy;
    std::optional<double> total_travel_distance_m;
    std::optional<double> total_travel_time_s;

    Json document;

    static Solution from_json(const Json& j);
    Json to_json() const;

    bool operator==(const Solution&) const = default;
};

}  // namespace vrpassist::vrp
