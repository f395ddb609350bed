#include "vrpassist/vrp/model.hpp"

namespace vrpassist::vrp {

namespace {

std::optional<std::string> opt_string(const Json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<double> opt_number(const Json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

std::optional<bool> opt_bool(const Json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return std::nullopt;
    return it->get<bool>();
}

// Array member, or an empty array when missing / not an array
const Json& array_or_empty(const Json& j, const char* key) {
    static const Json empty = Json::array();
    if (!j.is_object()) return empty;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return empty;
    return *it;
}

// Scalar number or array of numbers
std::vector<double> numbers_of(const Json& j, const char* key) {
    std::vector<double> out;
    if (!j.is_object()) return out;
    auto it = j.find(key);
    if (it == j.end()) return out;
    if (it->is_number()) {
        out.push_back(it->get<double>());
    } else if (it->is_array()) {
        for (const auto& v : *it) {
            if (v.is_number()) out.push_back(v.get<double>());
        }
    }
    return out;
}

// Strings are kept verbatim, anything else is stored as compact JSON
std::string to_text(const Json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

std::vector<std::string> text_list(const Json& v) {
    std::vector<std::string> out;
    if (v.is_array()) {
        for (const auto& item : v) {
            out.push_back(to_text(item));
        }
    } else if (!v.is_null()) {
        out.push_back(to_text(v));
    }
    return out;
}

std::optional<std::string> name_or_id(const Json& j) {
    if (auto name = opt_string(j, "name")) return name;
    return opt_string(j, "id");
}

}  // namespace

std::string Job::label(size_t index) const {
    return name ? *name : std::to_string(index);
}

std::string Resource::label(size_t index) const {
    return name ? *name : std::to_string(index);
}

const Resource* Problem::find_resource(const std::string& resource_name) const {
    for (const auto& resource : resources) {
        if (resource.name && *resource.name == resource_name) {
            return &resource;
        }
    }
    return nullptr;
}

Problem Problem::from_json(const Json& j) {
    Problem problem;
    problem.document = j;

    for (const auto& jj : array_or_empty(j, "jobs")) {
        Job job;
        job.name = name_or_id(jj);
        job.duration = opt_number(jj, "duration");

        if (jj.is_object() && jj.contains("location") && jj["location"].is_object()) {
            const auto& loc = jj["location"];
            job.location = Location{
                .latitude = opt_number(loc, "latitude"),
                .longitude = opt_number(loc, "longitude"),
                .address = opt_string(loc, "address")
            };
        }

        for (const auto& w : array_or_empty(jj, "windows")) {
            job.windows.push_back(TimeWindow{
                .from = opt_string(w, "from"),
                .to = opt_string(w, "to"),
                .hard = opt_bool(w, "hard")
            });
        }
        problem.jobs.push_back(std::move(job));
    }

    for (const auto& rj : array_or_empty(j, "resources")) {
        Resource resource;
        resource.name = name_or_id(rj);
        resource.capacity = numbers_of(rj, "capacity");

        for (const auto& sj : array_or_empty(rj, "shifts")) {
            Shift shift;
            shift.from = opt_string(sj, "from");
            shift.to = opt_string(sj, "to");
            for (const auto& b : array_or_empty(sj, "breaks")) {
                shift.breaks.push_back(b);
            }
            resource.shifts.push_back(std::move(shift));
        }
        problem.resources.push_back(std::move(resource));
    }

    return problem;
}

Json Problem::to_json() const {
    if (!document.is_null()) {
        return document;
    }

    Json j_jobs = Json::array();
    for (const auto& job : jobs) {
        Json jj = Json::object();
        if (job.name) jj["name"] = *job.name;
        if (job.duration) jj["duration"] = *job.duration;
        if (job.location) {
            Json loc = Json::object();
            if (job.location->latitude) loc["latitude"] = *job.location->latitude;
            if (job.location->longitude) loc["longitude"] = *job.location->longitude;
            if (job.location->address) loc["address"] = *job.location->address;
            jj["location"] = loc;
        }
        if (!job.windows.empty()) {
            jj["windows"] = Json::array();
            for (const auto& w : job.windows) {
                Json jw = Json::object();
                if (w.from) jw["from"] = *w.from;
                if (w.to) jw["to"] = *w.to;
                if (w.hard) jw["hard"] = *w.hard;
                jj["windows"].push_back(jw);
            }
        }
        j_jobs.push_back(jj);
    }

    Json j_resources = Json::array();
    for (const auto& resource : resources) {
        Json rj = Json::object();
        if (resource.name) rj["name"] = *resource.name;
        rj["capacity"] = resource.capacity;
        rj["shifts"] = Json::array();
        for (const auto& shift : resource.shifts) {
            Json sj = Json::object();
            if (shift.from) sj["from"] = *shift.from;
            if (shift.to) sj["to"] = *shift.to;
            sj["breaks"] = shift.breaks;
            rj["shifts"].push_back(sj);
        }
        j_resources.push_back(rj);
    }

    return Json{{"jobs", j_jobs}, {"resources", j_resources}};
}

Solution Solution::from_json(const Json& j) {
    Solution solution;
    solution.document = j;
    solution.id = opt_string(j, "id");
    solution.status = opt_string(j, "status");
    solution.occupancy = opt_number(j, "occupancy");
    solution.total_travel_distance_m = opt_number(j, "totalTravelDistanceInMeters");
    solution.total_travel_time_s = opt_number(j, "totalTravelTimeInSeconds");

    for (const auto& tj : array_or_empty(j, "trips")) {
        Trip trip;
        trip.resource = opt_string(tj, "resource");
        trip.distance = opt_number(tj, "distance");
        trip.duration = opt_number(tj, "duration");
        if (!trip.duration) {
            trip.duration = opt_number(tj, "workTime");
        }
        trip.travel_time = opt_number(tj, "travelTime");
        trip.load = numbers_of(tj, "load");

        for (const auto& vj : array_or_empty(tj, "visits")) {
            Visit visit;
            visit.job = opt_string(vj, "job");
            visit.arrival = opt_string(vj, "arrival");

            const Json& primary = array_or_empty(vj, "violatedConstraints");
            visit.violated_constraints = text_list(primary);
            if (visit.violated_constraints.empty()) {
                visit.violated_constraints = text_list(array_or_empty(vj, "violations"));
            }
            trip.visits.push_back(std::move(visit));
        }
        solution.trips.push_back(std::move(trip));
    }

    const Json& unserved = j.is_object() && j.contains("unserved")
        ? array_or_empty(j, "unserved")
        : array_or_empty(j, "unassigned");
    for (const auto& u : unserved) {
        solution.unserved.push_back(to_text(u));
    }

    if (j.is_object() && j.contains("unservedReasons") && j["unservedReasons"].is_object()) {
        for (const auto& [job, reasons] : j["unservedReasons"].items()) {
            solution.unserved_reasons[job] = text_list(reasons);
        }
    }

    for (const auto& vj : array_or_empty(j, "violations")) {
        ConstraintViolation violation;
        violation.name = opt_string(vj, "name");
        violation.level = opt_string(vj, "level");
        if (vj.is_object() && vj.contains("value") && !vj["value"].is_null()) {
            violation.value = to_text(vj["value"]);
        }
        solution.violations.push_back(std::move(violation));
    }

    if (j.is_object() && j.contains("score") && j["score"].is_object()) {
        const auto& sj = j["score"];
        solution.score = Score{
            .feasible = opt_bool(sj, "feasible"),
            .hard_score = opt_number(sj, "hardScore"),
            .soft_score = opt_number(sj, "softScore")
        };
    }

    return solution;
}

Json Solution::to_json() const {
    if (!document.is_null()) {
        return document;
    }

    Json j = Json::object();
    if (id) j["id"] = *id;
    if (status) j["status"] = *status;
    if (occupancy) j["occupancy"] = *occupancy;
    if (total_travel_distance_m) j["totalTravelDistanceInMeters"] = *total_travel_distance_m;
    if (total_travel_time_s) j["totalTravelTimeInSeconds"] = *total_travel_time_s;

    j["trips"] = Json::array();
    for (const auto& trip : trips) {
        Json tj = Json::object();
        if (trip.resource) tj["resource"] = *trip.resource;
        if (trip.distance) tj["distance"] = *trip.distance;
        if (trip.duration) tj["duration"] = *trip.duration;
        if (trip.travel_time) tj["travelTime"] = *trip.travel_time;
        if (!trip.load.empty()) tj["load"] = trip.load;
        tj["visits"] = Json::array();
        for (const auto& visit : trip.visits) {
            Json vj = Json::object();
            if (visit.job) vj["job"] = *visit.job;
            if (visit.arrival) vj["arrival"] = *visit.arrival;
            if (!visit.violated_constraints.empty()) {
                vj["violatedConstraints"] = visit.violated_constraints;
            }
            tj["visits"].push_back(vj);
        }
        j["trips"].push_back(tj);
    }

    j["unserved"] = unserved;
    if (!unserved_reasons.empty()) {
        j["unservedReasons"] = unserved_reasons;
    }

    if (!violations.empty()) {
        j["violations"] = Json::array();
        for (const auto& v : violations) {
            Json vj = Json::object();
            if (v.name) vj["name"] = *v.name;
            if (v.value) vj["value"] = *v.value;
            if (v.level) vj["level"] = *v.level;
            j["violations"].push_back(vj);
        }
    }

    if (score) {
        Json sj = Json::object();
        if (score->feasible) sj["feasible"] = *score->feasible;
        if (score->hard_score) sj["hardScore"] = *score->hard_score;
        if (score->soft_score) sj["softScore"] = *score->soft_score;
        j["score"] = sj;
    }

    return j;
}

}  // namespace vrpassist::vrp
