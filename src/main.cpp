#include "vrpassist/agent/orchestrator.hpp"
#include "vrpassist/context/context_store.hpp"
#include "vrpassist/context/session_janitor.hpp"
#include "vrpassist/core/config.hpp"
#include "vrpassist/llm/llm_gateway.hpp"
#include "vrpassist/server/http_server.hpp"
#include "vrpassist/solver/solver_client.hpp"
#include "vrpassist/tools/tool_registry.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

using namespace vrpassist;

namespace {

server::HttpServer* g_server = nullptr;
volatile std::sig_atomic_t g_signal = 0;

// Only async-signal-safe work here; logging happens after listen() returns
void signal_handler(int signum) {
    g_signal = signum;
    if (g_server) {
        g_server->stop();
    }
}

void setup_logging(const core::ObservabilityConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_to_file) {
        try {
            std::filesystem::create_directories(config.log_path);
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (config.log_path / "vrpassist.log").string(), 10 * 1024 * 1024, 3);
            sinks.push_back(file);
        } catch (const std::exception& e) {
            std::cerr << "Could not open log file under " << config.log_path << ": " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("vrpassist", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <path>] [--port <port>]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path config_path = core::Config::default_path();
    std::optional<int> port_override;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            try {
                port_override = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    core::Config config;
    auto loaded = core::Config::load(config_path);
    if (loaded.is_ok()) {
        config = std::move(loaded).value();
    } else if (loaded.error().code == core::ErrorCode::ConfigNotFound) {
        config.apply_env_overrides();
        config.expand_paths();
    } else {
        std::cerr << "Failed to load config: " << loaded.error().to_string() << "\n";
        return 1;
    }

    if (port_override) {
        config.server.port = *port_override;
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        std::cerr << "Invalid config: " << valid.error().to_string() << "\n";
        return 1;
    }

    setup_logging(config.observability);
    if (!loaded.is_ok()) {
        spdlog::info("No config at {}, using defaults", config_path.string());
    }

    context::ContextStore store;

    solver::SolverClient solver(config.solver, config.api_keys.solvice);
    if (!solver.is_available()) {
        spdlog::warn("SOLVICE_API_KEY not set; /vrp/solve will fail");
    }

    tools::ToolRegistry tools;
    tools.register_builtins();

    llm::LLMGateway llm(config.llm, config.api_keys);
    std::unique_ptr<agent::AssistantOrchestrator> assistant;

    auto llm_ready = llm.initialize();
    if (llm_ready.is_ok()) {
        assistant = std::make_unique<agent::AssistantOrchestrator>(
            agent::AssistantOrchestrator::Config::from_app_config(config),
            llm, tools, store);
    } else {
        spdlog::warn("Assistant disabled: {}", llm_ready.error().to_string());
    }

    context::SessionJanitor janitor(
        store,
        std::chrono::minutes(config.store.eviction_interval_minutes),
        std::chrono::hours(config.store.max_session_age_hours));
    janitor.start();

    server::HttpServer http(config, store, solver, assistant.get());
    g_server = &http;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const bool clean = http.listen();
    g_server = nullptr;
    if (g_signal != 0) {
        spdlog::info("Signal {} received, shutting down", static_cast<int>(g_signal));
    }

    janitor.stop();
    spdlog::info("Server stopped ({} session(s) evicted while running)", janitor.total_evicted());

    if (!clean) {
        spdlog::error("Could not listen on {}:{}", config.server.host, config.server.port);
        return 1;
    }
    return 0;
}
