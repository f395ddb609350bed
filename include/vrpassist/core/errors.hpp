#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vrpassist::core {

// Error codes organized by category
enum class ErrorCode {
    Ok = 0,

    // General (1-99)
    Unknown = 1,
    NotFound = 3,
    AlreadyExists = 4,
    InternalError = 9,

    // Sessions (100-199)
    SessionNotFound = 100,

    // Assistant runtime (200-299)
    LLMConnectionFailed = 200,
    LLMRateLimited = 201,
    LLMInvalidResponse = 203,
    LLMApiKeyMissing = 204,
    LLMProviderUnavailable = 205,
    LLMTurnLimitExceeded = 206,

    // Tools (300-399)
    ToolNotFound = 300,
    ToolExecutionFailed = 301,
    ToolValidationFailed = 302,
    ToolDisabled = 307,

    // Solver and admission (400-499)
    SolverApiKeyMissing = 400,
    SolverUnauthorized = 401,
    SolverRejected = 402,
    SolverTimeout = 403,
    SolverUnavailable = 404,
    SolverInvalidResponse = 405,
    ComplexityLimitExceeded = 406,

    // Configuration (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,
    FileWriteFailed = 702,
};

// Default message for an error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::InternalError: return "Internal error";

        case ErrorCode::SessionNotFound: return "Session not found";

        case ErrorCode::LLMConnectionFailed: return "Failed to connect to LLM provider";
        case ErrorCode::LLMRateLimited: return "LLM rate limit exceeded";
        case ErrorCode::LLMInvalidResponse: return "Invalid response from LLM";
        case ErrorCode::LLMApiKeyMissing: return "API key not configured";
        case ErrorCode::LLMProviderUnavailable: return "LLM provider unavailable";
        case ErrorCode::LLMTurnLimitExceeded: return "Tool-call turn limit exceeded";

        case ErrorCode::ToolNotFound: return "Tool not found";
        case ErrorCode::ToolExecutionFailed: return "Tool execution failed";
        case ErrorCode::ToolValidationFailed: return "Tool parameter validation failed";
        case ErrorCode::ToolDisabled: return "Tool is disabled";

        case ErrorCode::SolverApiKeyMissing: return "Solver API key not configured";
        case ErrorCode::SolverUnauthorized: return "Invalid API key";
        case ErrorCode::SolverRejected: return "Invalid request data";
        case ErrorCode::SolverTimeout: return "Request timeout";
        case ErrorCode::SolverUnavailable: return "Network error";
        case ErrorCode::SolverInvalidResponse: return "Invalid response from solver";
        case ErrorCode::ComplexityLimitExceeded: return "VRP problem too complex";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Transient failures a caller may retry
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::LLMRateLimited:
        case ErrorCode::LLMConnectionFailed:
        case ErrorCode::SolverTimeout:
        case ErrorCode::SolverUnavailable:
            return true;
        default:
            return false;
    }
}

// HTTP status the routing layer reports for an error
inline int http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::SolverRejected:
        case ErrorCode::ComplexityLimitExceeded:
        case ErrorCode::ToolValidationFailed:
            return 400;
        case ErrorCode::SolverUnauthorized:
            return 401;
        case ErrorCode::NotFound:
        case ErrorCode::SessionNotFound:
            return 404;
        case ErrorCode::SolverTimeout:
            return 408;
        case ErrorCode::SolverUnavailable:
        case ErrorCode::LLMProviderUnavailable:
            return 503;
        default:
            return 500;
    }
}

// Machine-readable category for the "type" field of error bodies
inline std::string_view error_type(ErrorCode code) {
    switch (code) {
        case ErrorCode::SolverApiKeyMissing:
        case ErrorCode::SolverUnauthorized:
            return "authentication";
        case ErrorCode::SolverRejected:
        case ErrorCode::ToolValidationFailed:
            return "validation";
        case ErrorCode::ComplexityLimitExceeded:
            return "complexity_limit";
        case ErrorCode::SolverTimeout:
            return "timeout";
        case ErrorCode::SolverUnavailable:
            return "network";
        case ErrorCode::NotFound:
        case ErrorCode::SessionNotFound:
            return "not_found";
        default:
            return "server";
    }
}

struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Session id, tool name, URL, ...

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool is_retriable() const { return vrpassist::core::is_retriable(code); }

    std::string full_message() const {
        return context ? message + " [" + *context + "]" : message;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace vrpassist::core
