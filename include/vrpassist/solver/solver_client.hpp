#pragma once

#include "vrpassist/core/config.hpp"
#include "vrpassist/core/result.hpp"
#include "vrpassist/vrp/model.hpp"

#include <string>

namespace vrpassist::solver {

using namespace vrpassist::core;

// Anything that can turn a problem into a solution
class Solver {
public:
    virtual ~Solver() = default;

    virtual Result<vrp::Solution, Error> solve(const vrp::Problem& problem) = 0;
};

// Synchronous solve against the Solvice VRP API
class SolverClient : public Solver {
public:
    SolverClient(const SolverConfig& config, std::string api_key);

    bool is_available() const { return !api_key_.empty(); }

    Result<vrp::Solution, Error> solve(const vrp::Problem& problem) override;

    // Map a non-2xx response to an error
    static Error error_for_status(int status, const std::string& body);

private:
    SolverConfig config_;
    std::string api_key_;
};

}  // namespace vrpassist::solver
