#include <catch2/catch_test_macros.hpp>
#include "vrpassist/server/http_server.hpp"

#include "fixtures.hpp"

using namespace vrpassist;
using namespace vrpassist::server;

namespace {

class FakeSolver : public solver::Solver {
public:
    std::optional<Error> failure;
    int calls = 0;

    Result<vrp::Solution, Error> solve(const vrp::Problem& problem) override {
        ++calls;
        if (failure) {
            return Result<vrp::Solution, Error>::err(*failure);
        }

        std::vector<std::string> jobs;
        for (size_t i = 0; i < problem.jobs.size(); ++i) {
            jobs.push_back(problem.jobs[i].label(i));
        }
        return Result<vrp::Solution, Error>::ok(
            testing::make_solution(Json::array({testing::trip_json("vehicle-0", jobs, 1000, 600)})));
    }
};

httplib::Request json_request(const Json& body) {
    httplib::Request req;
    req.body = body.dump();
    req.set_header("Content-Type", "application/json");
    return req;
}

httplib::Request path_request(const std::string& session_id) {
    httplib::Request req;
    req.path_params["session_id"] = session_id;
    return req;
}

Json body_of(const httplib::Response& res) {
    return Json::parse(res.body);
}

struct Fixture {
    core::Config config;
    context::ContextStore store;
    FakeSolver solver;
    HttpServer server{config, store, solver, nullptr};
};

}  // namespace

TEST_CASE("Solve stores the session and returns the solution", "[server]") {
    Fixture f;

    auto req = json_request(testing::problem_json(3, 1));
    req.set_header("x-session-id", "user-7");
    httplib::Response res;
    f.server.handle_solve(req, res);

    REQUIRE(res.status == 200);
    REQUIRE(res.get_header_value("x-session-id") == "user-7");
    REQUIRE(body_of(res)["trips"][0]["visits"].size() == 3);

    auto ctx = f.store.get("user-7");
    REQUIRE(ctx.has_value());
    REQUIRE(ctx->problem.jobs.size() == 3);
    REQUIRE(ctx->has_solution());
}

TEST_CASE("Solve without a session header gets an anonymous id", "[server]") {
    Fixture f;

    httplib::Response res;
    f.server.handle_solve(json_request(testing::problem_json(1, 1)), res);

    REQUIRE(res.status == 200);
    const auto id = res.get_header_value("x-session-id");
    REQUIRE(id.starts_with("anon_"));
    REQUIRE(f.store.get(id).has_value());
}

TEST_CASE("Solve with an empty session header gets an anonymous id", "[server]") {
    Fixture f;

    auto req = json_request(testing::problem_json(1, 1));
    req.set_header("x-session-id", "");
    httplib::Response res;
    f.server.handle_solve(req, res);

    REQUIRE(res.status == 200);
    REQUIRE(res.get_header_value("x-session-id").starts_with("anon_"));
    REQUIRE_FALSE(f.store.get("").has_value());
    REQUIRE(f.store.size() == 1);
}

TEST_CASE("Solve rejects problems over the limits", "[server]") {
    Fixture f;

    httplib::Response res;
    f.server.handle_solve(json_request(testing::problem_json(251, 1)), res);

    REQUIRE(res.status == 400);
    auto body = body_of(res);
    REQUIRE(body["type"] == "complexity_limit");
    REQUIRE(body["details"]["actualComplexity"]["jobCount"] == 251);
    REQUIRE_FALSE(body["details"].contains("valid"));
    REQUIRE(f.solver.calls == 0);
    REQUIRE(f.store.size() == 0);
}

TEST_CASE("Solver errors map to HTTP statuses", "[server]") {
    Fixture f;
    f.solver.failure = Error{ErrorCode::SolverUnauthorized, "Invalid API key"};

    httplib::Response res;
    f.server.handle_solve(json_request(testing::problem_json(2, 1)), res);

    REQUIRE(res.status == 401);
    REQUIRE(body_of(res)["type"] == "authentication");
    REQUIRE(f.store.size() == 0);
}

TEST_CASE("Malformed bodies are rejected", "[server]") {
    Fixture f;

    httplib::Request req;
    req.body = "{not json";
    httplib::Response res;
    f.server.handle_solve(req, res);

    REQUIRE(res.status == 400);
    REQUIRE(body_of(res)["type"] == "validation");
}

TEST_CASE("Context lifecycle", "[server]") {
    Fixture f;

    httplib::Response stored;
    f.server.handle_store_context(json_request(Json{
        {"sessionId", "s1"},
        {"request", testing::problem_json(2, 1)}
    }), stored);
    REQUIRE(stored.status == 200);
    REQUIRE(body_of(stored)["status"] == "ok");

    httplib::Response fetched;
    f.server.handle_get_context(path_request("s1"), fetched);
    REQUIRE(fetched.status == 200);
    REQUIRE(body_of(fetched)["solution"].is_null());

    auto update = json_request(testing::make_solution(Json::array()).to_json());
    update.path_params["session_id"] = "s1";
    httplib::Response updated;
    f.server.handle_update_solution(update, updated);
    REQUIRE(body_of(updated)["updated"] == true);
    REQUIRE(f.store.get("s1")->has_solution());

    httplib::Response listed;
    f.server.handle_list_sessions(httplib::Request{}, listed);
    REQUIRE(body_of(listed)["sessions"] == Json::array({"s1"}));
    REQUIRE(body_of(listed)["count"] == 1);

    httplib::Response deleted;
    f.server.handle_delete_context(path_request("s1"), deleted);
    REQUIRE(body_of(deleted)["deleted"] == true);

    httplib::Response missing;
    f.server.handle_get_context(path_request("s1"), missing);
    REQUIRE(missing.status == 404);
    REQUIRE(body_of(missing)["type"] == "not_found");
}

TEST_CASE("Store context requires its fields", "[server]") {
    Fixture f;

    httplib::Response no_id;
    f.server.handle_store_context(json_request(Json{{"request", Json::object()}}), no_id);
    REQUIRE(no_id.status == 400);

    httplib::Response no_request;
    f.server.handle_store_context(json_request(Json{{"sessionId", "s1"}}), no_request);
    REQUIRE(no_request.status == 400);
}

TEST_CASE("Updating an unknown session reports false", "[server]") {
    Fixture f;

    auto req = json_request(Json{{"trips", Json::array()}});
    req.path_params["session_id"] = "ghost";
    httplib::Response res;
    f.server.handle_update_solution(req, res);

    REQUIRE(res.status == 200);
    REQUIRE(body_of(res)["updated"] == false);
    REQUIRE(f.store.size() == 0);
}

TEST_CASE("Evict", "[server]") {
    Fixture f;
    f.store.save("s1", testing::make_problem(1, 1));

    httplib::Response kept;
    f.server.handle_evict(json_request(Json{{"maxAgeHours", 1}}), kept);
    REQUIRE(body_of(kept)["removed"] == 0);

    httplib::Response invalid;
    f.server.handle_evict(json_request(Json{{"maxAgeHours", -1}}), invalid);
    REQUIRE(invalid.status == 400);

    httplib::Response defaulted;
    f.server.handle_evict(httplib::Request{}, defaulted);
    REQUIRE(defaulted.status == 200);
    REQUIRE(body_of(defaulted)["maxAgeHours"] == f.config.store.max_session_age_hours);
}

TEST_CASE("Evict rejects ages past a century", "[server]") {
    Fixture f;
    f.store.save("s1", testing::make_problem(1, 1));

    httplib::Response res;
    f.server.handle_evict(json_request(Json{{"maxAgeHours", 3000000}}), res);
    REQUIRE(res.status == 400);
    REQUIRE(f.store.size() == 1);

    httplib::Response bound;
    f.server.handle_evict(json_request(Json{{"maxAgeHours", 876000}}), bound);
    REQUIRE(bound.status == 200);
    REQUIRE(body_of(bound)["removed"] == 0);
    REQUIRE(f.store.size() == 1);
}

TEST_CASE("Analyze and suggest", "[server]") {
    Fixture f;
    f.store.save("solved", testing::make_problem(2, 1), testing::make_solution(
        Json::array({testing::trip_json("vehicle-0", {"job-0"}, 1000, 600)}),
        Json::array({"job-1"})));
    f.store.save("unsolved", testing::make_problem(2, 1));

    httplib::Response analyzed;
    f.server.handle_analyze(json_request(Json{{"sessionId", "solved"}, {"aspect", "constraints"}}), analyzed);
    REQUIRE(analyzed.status == 200);
    REQUIRE(body_of(analyzed)["aspect"] == "constraints");
    REQUIRE(body_of(analyzed)["analysis"]["unassigned_jobs"] == 1);

    httplib::Response no_solution;
    f.server.handle_analyze(json_request(Json{{"sessionId", "unsolved"}}), no_solution);
    REQUIRE(no_solution.status == 200);
    REQUIRE(body_of(no_solution)["analysis"]["no_solution"] == true);

    httplib::Response unknown;
    f.server.handle_analyze(json_request(Json{{"sessionId", "ghost"}}), unknown);
    REQUIRE(unknown.status == 404);

    httplib::Response bad_aspect;
    f.server.handle_analyze(json_request(Json{{"sessionId", "solved"}, {"aspect", 5}}), bad_aspect);
    REQUIRE(bad_aspect.status == 400);
    REQUIRE(body_of(bad_aspect)["type"] == "validation");

    httplib::Response suggested;
    f.server.handle_suggest(json_request(Json{{"sessionId", "solved"}}), suggested);
    REQUIRE(suggested.status == 200);
    REQUIRE(body_of(suggested)["sessionId"] == "solved");
    REQUIRE(body_of(suggested)["suggestions"][0]["category"] == "coverage");

    httplib::Response missing_id;
    f.server.handle_suggest(json_request(Json::object()), missing_id);
    REQUIRE(missing_id.status == 400);
}

TEST_CASE("Chat without an assistant", "[server]") {
    Fixture f;

    httplib::Response res;
    f.server.handle_chat(json_request(Json{{"sessionId", "s1"}, {"message", "hi"}}), res);

    REQUIRE(res.status == 503);
}

TEST_CASE("Health", "[server]") {
    Fixture f;
    f.store.save("s1", testing::make_problem(1, 1));

    httplib::Response res;
    f.server.handle_health(httplib::Request{}, res);

    auto body = body_of(res);
    REQUIRE(body["status"] == "healthy");
    REQUIRE(body["services"]["assistant"] == "unavailable");
    REQUIRE(body["sessions"] == 1);
}
