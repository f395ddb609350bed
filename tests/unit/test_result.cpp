#include <catch2/catch_test_macros.hpp>
#include "vrpassist/core/result.hpp"

#include <stdexcept>

using namespace vrpassist::core;

TEST_CASE("Result with value", "[result]") {
    auto result = Result<int, std::string>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.value() == 42);
}

TEST_CASE("Result with error", "[result]") {
    auto result = Result<int, std::string>::err("something went wrong");

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.error() == "something went wrong");
}

TEST_CASE("Result without a value", "[result]") {
    auto ok = Result<void, Error>::ok();
    REQUIRE(ok.is_ok());
    REQUIRE_THROWS_AS(ok.error(), std::logic_error);

    auto failed = Result<void, Error>::err(ErrorCode::ConfigValidationFailed, "bad port");
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().message == "bad port");
}

TEST_CASE("Result carries error code and context", "[result]") {
    auto result = Result<int>::err(ErrorCode::SessionNotFound, "Session not found", "s-1");

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::SessionNotFound);
    REQUIRE(result.error().full_message() == "Session not found [s-1]");
    REQUIRE(result.value_or(7) == 7);
    REQUIRE_THROWS_AS(result.value(), std::logic_error);
}

TEST_CASE("Error codes map to HTTP status and type", "[result]") {
    REQUIRE(http_status(ErrorCode::SolverUnauthorized) == 401);
    REQUIRE(error_type(ErrorCode::SolverUnauthorized) == "authentication");

    REQUIRE(http_status(ErrorCode::SolverRejected) == 400);
    REQUIRE(error_type(ErrorCode::SolverRejected) == "validation");

    REQUIRE(http_status(ErrorCode::SolverTimeout) == 408);
    REQUIRE(error_type(ErrorCode::SolverTimeout) == "timeout");

    REQUIRE(http_status(ErrorCode::SolverUnavailable) == 503);
    REQUIRE(error_type(ErrorCode::SolverUnavailable) == "network");

    REQUIRE(http_status(ErrorCode::InternalError) == 500);
    REQUIRE(error_type(ErrorCode::InternalError) == "server");

    REQUIRE(error_type(ErrorCode::ComplexityLimitExceeded) == "complexity_limit");
}

TEST_CASE("Transient errors are retriable", "[result]") {
    REQUIRE(Error{ErrorCode::LLMRateLimited}.is_retriable());
    REQUIRE(Error{ErrorCode::SolverTimeout}.is_retriable());
    REQUIRE_FALSE(Error{ErrorCode::SolverUnauthorized}.is_retriable());
    REQUIRE_FALSE(Error{ErrorCode::ConfigParseFailed}.is_retriable());
}
