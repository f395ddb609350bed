#pragma once

#include "vrpassist/vrp/model.hpp"

#include <string>
#include <vector>

namespace vrpassist::testing {

using vrpassist::core::Json;

// Problem document with n jobs named job-0.. and m resources named vehicle-0..
inline Json problem_json(size_t jobs, size_t resources) {
    Json j_jobs = Json::array();
    for (size_t i = 0; i < jobs; ++i) {
        j_jobs.push_back(Json{
            {"name", "job-" + std::to_string(i)},
            {"duration", 600},
            {"location", {{"latitude", 51.05 + 0.01 * static_cast<double>(i)}, {"longitude", 3.72}}}
        });
    }

    Json j_resources = Json::array();
    for (size_t i = 0; i < resources; ++i) {
        j_resources.push_back(Json{
            {"name", "vehicle-" + std::to_string(i)},
            {"capacity", Json::array({100})},
            {"shifts", Json::array({Json{{"from", "2024-01-01T08:00:00"}, {"to", "2024-01-01T17:00:00"}}})}
        });
    }

    return Json{{"jobs", j_jobs}, {"resources", j_resources}};
}

inline vrp::Problem make_problem(size_t jobs, size_t resources) {
    return vrp::Problem::from_json(problem_json(jobs, resources));
}

// Trip document visiting the given jobs
inline Json trip_json(const std::string& resource, const std::vector<std::string>& jobs,
                      double distance, double duration) {
    Json visits = Json::array();
    for (const auto& job : jobs) {
        visits.push_back(Json{{"job", job}, {"arrival", "2024-01-01T09:00:00"}});
    }
    return Json{
        {"resource", resource},
        {"visits", visits},
        {"distance", distance},
        {"duration", duration},
        {"load", Json::array({40})}
    };
}

inline vrp::Solution make_solution(const Json& trips, const Json& unserved = Json::array()) {
    return vrp::Solution::from_json(Json{
        {"id", "sol-1"},
        {"status", "SOLVED"},
        {"trips", trips},
        {"unserved", unserved}
    });
}

}  // namespace vrpassist::testing
