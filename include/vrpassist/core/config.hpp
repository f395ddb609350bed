#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>

namespace vrpassist::core {

namespace fs = std::filesystem;

// HTTP listener configuration
struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
};

// External VRP solver configuration
struct SolverConfig {
    std::string base_url = "https://api.solvice.io";
    std::string solve_path = "/v2/vrp/solve/sync";
    int timeout_ms = 120000;
};

// Agent runtime (chat-completions endpoint) configuration
struct LLMConfig {
    std::string provider = "openai";
    std::string model = "gpt-4.1-mini";
    std::string base_url = "https://api.openai.com";
    double temperature = 0.3;
    int max_tokens = 2048;
    int max_tool_turns = 4;
    int timeout_ms = 120000;
};

// API keys configuration
struct ApiKeysConfig {
    std::string openai;   // From env: OPENAI_API_KEY
    std::string solvice;  // From env: SOLVICE_API_KEY
};

// Admission limits applied before a problem is forwarded to the solver
struct LimitsConfig {
    int max_jobs = 250;
    int max_resources = 30;
    int max_time_windows_per_job = 5;
    int max_breaks_per_resource = 3;
};

// Session context store configuration
struct StoreConfig {
    int max_session_age_hours = 24;
    int eviction_interval_minutes = 60;
};

// Suggestion rule tuning
struct AnalysisConfig {
    double assumed_capacity_utilization = 0.7;
    double low_utilization_threshold = 0.6;
    double balance_ratio = 2.0;
    int max_violation_details = 3;
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error
    fs::path log_path = "~/.vrpassist/logs";
    bool log_to_file = false;
};

// Main configuration
struct Config {
    ServerConfig server;
    SolverConfig solver;
    LLMConfig llm;
    ApiKeysConfig api_keys;
    LimitsConfig limits;
    StoreConfig store;
    AnalysisConfig analysis;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Expand ~ and environment variables in paths
    void expand_paths();

    // Pick up API keys from the environment
    void apply_env_overrides();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);

}  // namespace vrpassist::core
