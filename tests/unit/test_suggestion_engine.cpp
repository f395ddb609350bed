#include <catch2/catch_test_macros.hpp>
#include "vrpassist/analysis/suggestion_engine.hpp"

#include "fixtures.hpp"

using namespace vrpassist;
using namespace vrpassist::analysis;

namespace {

const Suggestion* find_category(const SuggestionList& list, const std::string& category) {
    for (const auto& s : list.suggestions) {
        if (s.category == category) return &s;
    }
    return nullptr;
}

}  // namespace

TEST_CASE("No solution", "[suggestions]") {
    SuggestionEngine engine;
    auto list = engine.suggest(std::nullopt, testing::make_problem(1, 1));

    REQUIRE(list.no_solution);
    REQUIRE(list.empty());
    auto j = list.to_json();
    REQUIRE(j["error"] == "No VRP solution available to analyze");
    REQUIRE(j["total_found"] == 0);
}

TEST_CASE("Balanced solution yields nothing", "[suggestions]") {
    SuggestionEngine engine;
    auto solution = testing::make_solution(Json::array({
        testing::trip_json("vehicle-0", {"job-0"}, 100, 100),
        testing::trip_json("vehicle-1", {"job-1"}, 100, 150)
    }));

    auto list = engine.suggest(solution, testing::make_problem(2, 2));
    REQUIRE(list.empty());
    REQUIRE(list.to_json()["total_found"] == 0);
}

TEST_CASE("Unbalanced durations", "[suggestions]") {
    SuggestionEngine engine;
    auto solution = testing::make_solution(Json::array({
        testing::trip_json("vehicle-0", {"job-0"}, 100, 100),
        testing::trip_json("vehicle-1", {"job-1"}, 100, 250)
    }));

    auto list = engine.suggest(solution, testing::make_problem(2, 2));

    REQUIRE(list.suggestions.size() == 1);
    const auto& s = list.suggestions[0];
    REQUIRE(s.category == "balance");
    REQUIRE(s.severity == Severity::Low);
    REQUIRE((*s.details)["shortest"] == 100.0);
    REQUIRE((*s.details)["longest"] == 250.0);
}

TEST_CASE("Unassigned jobs", "[suggestions]") {
    SuggestionEngine engine;
    auto solution = testing::make_solution(
        Json::array({testing::trip_json("vehicle-0", {"job-0"}, 100, 100)}),
        Json::array({"jobA", "jobB"}));

    auto list = engine.suggest(solution, testing::make_problem(3, 1));

    const auto* coverage = find_category(list, "coverage");
    REQUIRE(coverage != nullptr);
    REQUIRE(coverage->severity == Severity::High);
    REQUIRE(coverage->issue.find("2") != std::string::npos);
    REQUIRE(list.suggestions.front().category == "coverage");
}

TEST_CASE("Violation details are capped", "[suggestions]") {
    auto trip = testing::trip_json("vehicle-0", {"a", "b", "c", "d", "e"}, 100, 100);
    for (auto& visit : trip["visits"]) {
        visit["violatedConstraints"] = Json::array({"TIME_WINDOW"});
    }
    auto solution = testing::make_solution(Json::array({trip}));

    SuggestionEngine engine;
    const auto* constraints = find_category(engine.suggest(solution, testing::make_problem(5, 1)), "constraints");
    REQUIRE(constraints != nullptr);
    REQUIRE(constraints->issue == "5 constraint violations found");
    REQUIRE(constraints->details->size() == 3);

    SuggestionOptions options;
    options.max_violation_details = 1;
    auto list = SuggestionEngine(options).suggest(solution, testing::make_problem(5, 1));
    REQUIRE(find_category(list, "constraints")->details->size() == 1);
}

TEST_CASE("Utilization rule", "[suggestions]") {
    SECTION("No trips reads as zero utilization") {
        SuggestionEngine engine;
        auto list = engine.suggest(testing::make_solution(Json::array()), testing::make_problem(1, 1));

        const auto* efficiency = find_category(list, "efficiency");
        REQUIRE(efficiency != nullptr);
        REQUIRE(efficiency->severity == Severity::Medium);
    }

    SECTION("Assumed figure below the threshold") {
        SuggestionOptions options;
        options.assumed_capacity_utilization = 0.5;
        auto solution = testing::make_solution(Json::array({
            testing::trip_json("vehicle-0", {"job-0"}, 100, 100)
        }));

        auto list = SuggestionEngine(options).suggest(solution, testing::make_problem(1, 1));
        REQUIRE(find_category(list, "efficiency") != nullptr);
    }
}

TEST_CASE("Suggestion serializes its action", "[suggestions]") {
    Suggestion s{
        .category = "balance",
        .severity = Severity::Low,
        .issue = "Unbalanced route durations",
        .action = "Enable route balancing in solver options",
        .details = std::nullopt
    };

    auto j = s.to_json();
    REQUIRE(j["severity"] == "low");
    REQUIRE(j["suggestion"] == "Enable route balancing in solver options");
    REQUIRE_FALSE(j.contains("details"));
}
