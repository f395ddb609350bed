#include "vrpassist/solver/solver_client.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace vrpassist::solver {

SolverClient::SolverClient(const SolverConfig& config, std::string api_key)
    : config_(config)
    , api_key_(std::move(api_key))
{
}

Error SolverClient::error_for_status(int status, const std::string& body) {
    // Prefer the solver's own message when it sends one
    std::string detail;
    Json j = Json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        if (j.contains("message") && j["message"].is_string()) {
            detail = j["message"].get<std::string>();
        } else if (j.contains("error") && j["error"].is_string()) {
            detail = j["error"].get<std::string>();
        }
    }

    auto with_detail = [&detail](const char* base) {
        return detail.empty() ? std::string(base) : std::string(base) + ": " + detail;
    };

    switch (status) {
        case 401:
        case 403:
            return Error{ErrorCode::SolverUnauthorized, "Invalid API key"};
        case 400:
        case 422:
            return Error{ErrorCode::SolverRejected, with_detail("Invalid request data")};
        case 404:
            return Error{ErrorCode::NotFound, with_detail("Solver endpoint not found")};
        case 408:
        case 504:
            return Error{ErrorCode::SolverTimeout, "Request timeout"};
        case 502:
        case 503:
            return Error{ErrorCode::SolverUnavailable, "Network error"};
        default:
            return Error{ErrorCode::InternalError,
                         with_detail(("Solver returned status " + std::to_string(status)).c_str())};
    }
}

Result<vrp::Solution, Error> SolverClient::solve(const vrp::Problem& problem) {
    if (!is_available()) {
        return Result<vrp::Solution, Error>::err(
            ErrorCode::SolverApiKeyMissing,
            "Solvice API key not configured"
        );
    }

    spdlog::info("Solving VRP problem with {} jobs and {} resources",
                 problem.jobs.size(), problem.resources.size());

    httplib::Client client(config_.base_url);
    client.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    client.set_connection_timeout(30);

    httplib::Headers headers = {
        {"Authorization", api_key_}
    };

    auto start = std::chrono::steady_clock::now();
    auto res = client.Post(config_.solve_path, headers, problem.to_json().dump(), "application/json");
    auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

    if (!res) {
        const auto err = res.error();
        spdlog::error("Solver request to {} failed: {}", config_.base_url, httplib::to_string(err));

        if (err == httplib::Error::Read || err == httplib::Error::Write) {
            return Result<vrp::Solution, Error>::err(
                ErrorCode::SolverTimeout, "Request timeout", config_.base_url);
        }
        return Result<vrp::Solution, Error>::err(
            ErrorCode::SolverUnavailable, "Network error", config_.base_url);
    }

    if (res->status < 200 || res->status >= 300) {
        auto error = error_for_status(res->status, res->body);
        error.context = config_.base_url + config_.solve_path;
        spdlog::warn("Solver rejected request with status {}: {}", res->status, error.message);
        return Result<vrp::Solution, Error>::err(std::move(error));
    }

    try {
        auto solution = vrp::Solution::from_json(Json::parse(res->body));
        spdlog::info("Solved in {}ms: {} trips, {} unserved",
                     elapsed.count(), solution.trips.size(), solution.unserved.size());
        return Result<vrp::Solution, Error>::ok(std::move(solution));
    } catch (const Json::exception& e) {
        spdlog::error("Solver returned malformed JSON: {}", e.what());
        return Result<vrp::Solution, Error>::err(
            ErrorCode::SolverInvalidResponse,
            std::string("JSON parse error: ") + e.what()
        );
    }
}

}  // namespace vrpassist::solver
