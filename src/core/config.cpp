#include "vrpassist/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace vrpassist::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.vrpassist/config.yaml")));
}

void Config::expand_paths() {
    observability.log_path = fs::path(expand_path(observability.log_path.string()));
}

void Config::apply_env_overrides() {
    if (const char* key = std::getenv("OPENAI_API_KEY")) {
        api_keys.openai = key;
    }
    if (const char* key = std::getenv("SOLVICE_API_KEY")) {
        api_keys.solvice = key;
    }
}

Result<void, Error> Config::validate() const {
    if (server.port <= 0 || server.port > 65535) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "server.port must be between 1 and 65535"
        );
    }

    if (limits.max_jobs <= 0 || limits.max_resources <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "limits.max_jobs and limits.max_resources must be positive"
        );
    }

    if (limits.max_time_windows_per_job < 0 || limits.max_breaks_per_resource < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "limits.max_time_windows_per_job and limits.max_breaks_per_resource must not be negative"
        );
    }

    if (store.max_session_age_hours <= 0 || store.eviction_interval_minutes <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "store.max_session_age_hours and store.eviction_interval_minutes must be positive"
        );
    }

    if (llm.max_tool_turns < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "llm.max_tool_turns must be at least 1"
        );
    }

    if (analysis.balance_ratio <= 0.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "analysis.balance_ratio must be positive"
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = fs::path(expand_path(path.string()));

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto server_node = root["server"]) {
            config.server.host = server_node["host"].as<std::string>(config.server.host);
            config.server.port = server_node["port"].as<int>(config.server.port);
        }

        if (auto solver_node = root["solver"]) {
            config.solver.base_url = solver_node["base_url"].as<std::string>(config.solver.base_url);
            config.solver.solve_path = solver_node["solve_path"].as<std::string>(config.solver.solve_path);
            config.solver.timeout_ms = solver_node["timeout_ms"].as<int>(config.solver.timeout_ms);
        }

        if (auto llm_node = root["llm"]) {
            config.llm.provider = llm_node["provider"].as<std::string>(config.llm.provider);
            config.llm.model = llm_node["model"].as<std::string>(config.llm.model);
            config.llm.base_url = llm_node["base_url"].as<std::string>(config.llm.base_url);
            config.llm.temperature = llm_node["temperature"].as<double>(config.llm.temperature);
            config.llm.max_tokens = llm_node["max_tokens"].as<int>(config.llm.max_tokens);
            config.llm.max_tool_turns = llm_node["max_tool_turns"].as<int>(config.llm.max_tool_turns);
            config.llm.timeout_ms = llm_node["timeout_ms"].as<int>(config.llm.timeout_ms);
        }

        // Keys may reference the environment, e.g. "${OPENAI_API_KEY}"
        if (auto keys_node = root["api_keys"]) {
            config.api_keys.openai = expand_path(keys_node["openai"].as<std::string>(""));
            config.api_keys.solvice = expand_path(keys_node["solvice"].as<std::string>(""));
        }
        config.apply_env_overrides();

        if (auto limits_node = root["limits"]) {
            config.limits.max_jobs = limits_node["max_jobs"].as<int>(config.limits.max_jobs);
            config.limits.max_resources = limits_node["max_resources"].as<int>(config.limits.max_resources);
            config.limits.max_time_windows_per_job =
                limits_node["max_time_windows_per_job"].as<int>(config.limits.max_time_windows_per_job);
            config.limits.max_breaks_per_resource =
                limits_node["max_breaks_per_resource"].as<int>(config.limits.max_breaks_per_resource);
        }

        if (auto store_node = root["store"]) {
            config.store.max_session_age_hours =
                store_node["max_session_age_hours"].as<int>(config.store.max_session_age_hours);
            config.store.eviction_interval_minutes =
                store_node["eviction_interval_minutes"].as<int>(config.store.eviction_interval_minutes);
        }

        if (auto analysis_node = root["analysis"]) {
            config.analysis.assumed_capacity_utilization =
                analysis_node["assumed_capacity_utilization"].as<double>(config.analysis.assumed_capacity_utilization);
            config.analysis.low_utilization_threshold =
                analysis_node["low_utilization_threshold"].as<double>(config.analysis.low_utilization_threshold);
            config.analysis.balance_ratio =
                analysis_node["balance_ratio"].as<double>(config.analysis.balance_ratio);
            config.analysis.max_violation_details =
                analysis_node["max_violation_details"].as<int>(config.analysis.max_violation_details);
        }

        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = obs_node["log_path"].as<std::string>(config.observability.log_path.string());
            config.observability.log_to_file = obs_node["log_to_file"].as<bool>(config.observability.log_to_file);
        }

        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(validation.error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_env_overrides();
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = fs::path(expand_path(path.string()));

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "server" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << server.host;
        out << YAML::Key << "port" << YAML::Value << server.port;
        out << YAML::EndMap;

        out << YAML::Key << "solver" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "base_url" << YAML::Value << solver.base_url;
        out << YAML::Key << "solve_path" << YAML::Value << solver.solve_path;
        out << YAML::Key << "timeout_ms" << YAML::Value << solver.timeout_ms;
        out << YAML::EndMap;

        out << YAML::Key << "llm" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "provider" << YAML::Value << llm.provider;
        out << YAML::Key << "model" << YAML::Value << llm.model;
        out << YAML::Key << "base_url" << YAML::Value << llm.base_url;
        out << YAML::Key << "temperature" << YAML::Value << llm.temperature;
        out << YAML::Key << "max_tokens" << YAML::Value << llm.max_tokens;
        out << YAML::Key << "max_tool_turns" << YAML::Value << llm.max_tool_turns;
        out << YAML::Key << "timeout_ms" << YAML::Value << llm.timeout_ms;
        out << YAML::EndMap;

        // Keys are written as environment references, never in clear text
        out << YAML::Key << "api_keys" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "openai" << YAML::Value << "${OPENAI_API_KEY}";
        out << YAML::Key << "solvice" << YAML::Value << "${SOLVICE_API_KEY}";
        out << YAML::EndMap;

        out << YAML::Key << "limits" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_jobs" << YAML::Value << limits.max_jobs;
        out << YAML::Key << "max_resources" << YAML::Value << limits.max_resources;
        out << YAML::Key << "max_time_windows_per_job" << YAML::Value << limits.max_time_windows_per_job;
        out << YAML::Key << "max_breaks_per_resource" << YAML::Value << limits.max_breaks_per_resource;
        out << YAML::EndMap;

        out << YAML::Key << "store" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_session_age_hours" << YAML::Value << store.max_session_age_hours;
        out << YAML::Key << "eviction_interval_minutes" << YAML::Value << store.eviction_interval_minutes;
        out << YAML::EndMap;

        out << YAML::Key << "analysis" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "assumed_capacity_utilization" << YAML::Value << analysis.assumed_capacity_utilization;
        out << YAML::Key << "low_utilization_threshold" << YAML::Value << analysis.low_utilization_threshold;
        out << YAML::Key << "balance_ratio" << YAML::Value << analysis.balance_ratio;
        out << YAML::Key << "max_violation_details" << YAML::Value << analysis.max_violation_details;
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::Key << "log_to_file" << YAML::Value << observability.log_to_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace vrpassist::core
