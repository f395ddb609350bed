#pragma once

#include "vrpassist/admission/complexity_validator.hpp"
#include "vrpassist/agent/orchestrator.hpp"
#include "vrpassist/analysis/analysis_engine.hpp"
#include "vrpassist/analysis/suggestion_engine.hpp"
#include "vrpassist/context/context_store.hpp"
#include "vrpassist/core/config.hpp"
#include "vrpassist/solver/solver_client.hpp"

#include <httplib.h>

#include <string>

namespace vrpassist::server {

using namespace vrpassist::core;

// REST surface over the store, the engines, the solver and the assistant
class HttpServer {
public:
    // assistant may be null when no LLM provider is configured; /chat then
    // answers 503
    HttpServer(const core::Config& config,
               context::ContextStore& store,
               solver::Solver& solver,
               agent::AssistantOrchestrator* assistant);

    // Blocks until stop()
    bool listen();
    void stop();

    void handle_solve(const httplib::Request& req, httplib::Response& res);
    void handle_store_context(const httplib::Request& req, httplib::Response& res);
    void handle_get_context(const httplib::Request& req, httplib::Response& res);
    void handle_update_solution(const httplib::Request& req, httplib::Response& res);
    void handle_delete_context(const httplib::Request& req, httplib::Response& res);
    void handle_list_sessions(const httplib::Request& req, httplib::Response& res);
    void handle_evict(const httplib::Request& req, httplib::Response& res);
    void handle_analyze(const httplib::Request& req, httplib::Response& res);
    void handle_suggest(const httplib::Request& req, httplib::Response& res);
    void handle_chat(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

private:
    ServerConfig server_config_;
    StoreConfig store_config_;
    admission::ComplexityLimits limits_;
    analysis::SuggestionOptions suggestion_options_;

    context::ContextStore& store_;
    solver::Solver& solver_;
    agent::AssistantOrchestrator* assistant_;

    analysis::AnalysisEngine analysis_engine_;
    httplib::Server server_;

    void setup_routes();
};

}  // namespace vrpassist::server
