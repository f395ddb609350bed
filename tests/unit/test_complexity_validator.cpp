#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "vrpassist/admission/complexity_validator.hpp"

#include "fixtures.hpp"

using namespace vrpassist;
using namespace vrpassist::admission;

namespace {

bool mentions(const std::vector<std::string>& messages, const std::string& needle) {
    for (const auto& m : messages) {
        if (m.find(needle) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

TEST_CASE("Empty problems are rejected", "[admission]") {
    auto result = validate_complexity(testing::make_problem(0, 0));

    REQUIRE_FALSE(result.valid);
    REQUIRE(mentions(result.errors, "At least 1 job is required"));
    REQUIRE(mentions(result.errors, "At least 1 vehicle/resource is required"));
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Job limit", "[admission]") {
    SECTION("Over the limit") {
        auto result = validate_complexity(testing::make_problem(251, 1));
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors.size() == 1);
        REQUIRE(mentions(result.errors, "Too many jobs: 251 (maximum 250"));
        REQUIRE(result.actual_complexity.job_count == 251);
    }

    SECTION("At the limit") {
        auto result = validate_complexity(testing::make_problem(250, 1));
        REQUIRE(result.valid);
    }

    SECTION("Near the limit warns but stays valid") {
        auto result = validate_complexity(testing::make_problem(200, 1));
        REQUIRE(result.valid);
        REQUIRE(result.errors.empty());
        REQUIRE(mentions(result.warnings, "Approaching job limit (200/250)"));
    }

    SECTION("Below the warning threshold") {
        auto result = validate_complexity(testing::make_problem(199, 1));
        REQUIRE(result.valid);
        REQUIRE(result.warnings.empty());
    }
}

TEST_CASE("Resource limit", "[admission]") {
    auto result = validate_complexity(testing::make_problem(5, 31));
    REQUIRE_FALSE(result.valid);
    REQUIRE(mentions(result.errors, "Too many vehicles: 31 (maximum 30"));

    auto near = validate_complexity(testing::make_problem(5, 24));
    REQUIRE(near.valid);
    REQUIRE(mentions(near.warnings, "Approaching resource limit (24/30)"));
}

TEST_CASE("Time windows per job", "[admission]") {
    auto doc = testing::problem_json(3, 1);
    Json windows = Json::array();
    for (int i = 0; i < 6; ++i) {
        windows.push_back(Json{{"from", "08:00"}, {"to", "09:00"}});
    }
    doc["jobs"][1]["windows"] = windows;
    doc["jobs"][2]["windows"] = Json::array({Json{{"from", "10:00"}, {"to", "11:00"}}});

    auto result = validate_complexity(vrp::Problem::from_json(doc));

    REQUIRE_FALSE(result.valid);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors[0].find("job-1") != std::string::npos);
    REQUIRE(result.errors[0].find("6 time windows") != std::string::npos);
    REQUIRE(result.actual_complexity.max_time_windows == 6);
    REQUIRE(result.actual_complexity.total_time_windows == 7);
}

TEST_CASE("Breaks per shift", "[admission]") {
    auto doc = testing::problem_json(2, 2);
    doc["resources"][1]["shifts"][0]["breaks"] = Json::array({
        Json::object(), Json::object(), Json::object(), Json::object()
    });

    auto result = validate_complexity(vrp::Problem::from_json(doc));

    REQUIRE_FALSE(result.valid);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors[0].find("vehicle-1") != std::string::npos);
    REQUIRE(result.errors[0].find("4 breaks") != std::string::npos);
}

TEST_CASE("Custom limits", "[admission]") {
    ComplexityLimits limits{10, 2, 1, 0};

    REQUIRE(validate_complexity(testing::make_problem(10, 2), limits).valid);
    REQUIRE_FALSE(validate_complexity(testing::make_problem(11, 2), limits).valid);
    REQUIRE_FALSE(validate_complexity(testing::make_problem(3, 3), limits).valid);
}

TEST_CASE("Very large limits do not warn on small problems", "[admission]") {
    ComplexityLimits limits{2'000'000'000, 2'000'000'000, 5, 3};

    auto result = validate_complexity(testing::make_problem(3, 1), limits);
    REQUIRE(result.valid);
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Warning threshold rounds down", "[admission]") {
    ComplexityLimits limits{7, 10, 5, 3};

    REQUIRE(validate_complexity(testing::make_problem(5, 1), limits).warnings.size() == 1);
    REQUIRE(validate_complexity(testing::make_problem(4, 1), limits).warnings.empty());
}

TEST_CASE("Rejection message", "[admission]") {
    auto valid = validate_complexity(testing::make_problem(3, 1));
    REQUIRE(complexity_error_message(valid).empty());

    auto invalid = validate_complexity(testing::make_problem(0, 0));
    auto message = complexity_error_message(invalid);
    REQUIRE(message.starts_with("VRP problem too complex for demo:"));
    REQUIRE(message.find("1. At least 1 job is required") != std::string::npos);
    REQUIRE(message.find("2. At least 1 vehicle/resource is required") != std::string::npos);
}

TEST_CASE("Check result serializes with camelCase keys", "[admission]") {
    auto j = validate_complexity(testing::make_problem(4, 2)).to_json();

    REQUIRE(j["valid"] == true);
    REQUIRE(j["actualComplexity"]["jobCount"] == 4);
    REQUIRE(j["actualComplexity"]["resourceCount"] == 2);
}

TEST_CASE("Solve time estimate", "[admission]") {
    REQUIRE(estimate_solve_seconds(testing::make_problem(10, 2)) == Catch::Approx(4.0));
    REQUIRE(estimate_solve_seconds(testing::make_problem(0, 0)) == Catch::Approx(2.0));
}
