#include "vrpassist/server/http_server.hpp"
#include "vrpassist/core/uuid.hpp"

#include <spdlog/spdlog.h>

namespace vrpassist::server {

namespace {

constexpr const char* kVersion = "0.1.0";

// Upper bound accepted for maxAgeHours on /vrp/sessions/evict (100 years)
constexpr double kMaxEvictAgeHours = 876000.0;

void send_json(httplib::Response& res, int status, const Json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message,
                std::string_view type) {
    send_json(res, status, Json{{"error", message}, {"type", std::string(type)}});
}

void send_error(httplib::Response& res, const Error& error) {
    send_error(res, http_status(error.code), error.message, error_type(error.code));
}

// Parses the body as a JSON object; answers 400 and returns nullopt otherwise
std::optional<Json> parse_body(const httplib::Request& req, httplib::Response& res) {
    Json body = Json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        send_error(res, 400, "Request body must be a JSON object", "validation");
        return std::nullopt;
    }
    return body;
}

std::optional<std::string> string_field(const Json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

HttpServer::HttpServer(const core::Config& config,
                       context::ContextStore& store,
                       solver::Solver& solver,
                       agent::AssistantOrchestrator* assistant)
    : server_config_(config.server)
    , store_config_(config.store)
    , limits_(admission::ComplexityLimits::from_config(config.limits))
    , suggestion_options_(analysis::SuggestionOptions::from_config(config.analysis))
    , store_(store)
    , solver_(solver)
    , assistant_(assistant)
{
    setup_routes();
}

bool HttpServer::listen() {
    spdlog::info("Starting VRP assistant server on {}:{}", server_config_.host, server_config_.port);
    return server_.listen(server_config_.host, server_config_.port);
}

void HttpServer::stop() {
    server_.stop();
}

void HttpServer::setup_routes() {
    server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, X-Session-Id");
        res.status = 204;
    });

    server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("Unhandled error on {} {}: {}", req.method, req.path, e.what());
        }
        send_error(res, 500, "Internal server error", "server");
    });

    server_.Post("/vrp/solve", [this](const httplib::Request& req, httplib::Response& res) {
        handle_solve(req, res);
    });
    server_.Post("/vrp/context", [this](const httplib::Request& req, httplib::Response& res) {
        handle_store_context(req, res);
    });
    server_.Get("/vrp/context/:session_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_context(req, res);
    });
    server_.Put("/vrp/context/:session_id/solution", [this](const httplib::Request& req, httplib::Response& res) {
        handle_update_solution(req, res);
    });
    server_.Delete("/vrp/context/:session_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete_context(req, res);
    });
    server_.Get("/vrp/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        handle_list_sessions(req, res);
    });
    server_.Post("/vrp/sessions/evict", [this](const httplib::Request& req, httplib::Response& res) {
        handle_evict(req, res);
    });
    server_.Post("/vrp/analyze", [this](const httplib::Request& req, httplib::Response& res) {
        handle_analyze(req, res);
    });
    server_.Post("/vrp/suggest", [this](const httplib::Request& req, httplib::Response& res) {
        handle_suggest(req, res);
    });
    server_.Post("/chat", [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat(req, res);
    });
    server_.Get("/vrp/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
}

void HttpServer::handle_solve(const httplib::Request& req, httplib::Response& res) {
    auto body = parse_body(req, res);
    if (!body) return;

    auto problem = vrp::Problem::from_json(*body);

    auto check = admission::validate_complexity(problem, limits_);
    if (!check.valid) {
        spdlog::warn("Rejected VRP problem: {} complexity error(s)", check.errors.size());
        Json details = check.to_json();
        details.erase("valid");
        send_json(res, 400, Json{
            {"error", admission::complexity_error_message(check)},
            {"type", "complexity_limit"},
            {"details", details}
        });
        return;
    }

    for (const auto& warning : check.warnings) {
        spdlog::warn("VRP complexity warning: {}", warning);
    }

    SessionId session_id = req.get_header_value("x-session-id");
    if (session_id.empty()) {
        session_id = generate_anonymous_session_id();
    }

    spdlog::info("Solving for session {} (estimated {:.1f}s)",
                 session_id, admission::estimate_solve_seconds(problem));

    auto result = solver_.solve(problem);
    if (result.is_err()) {
        spdlog::error("VRP solve failed for session {}: {}", session_id, result.error().to_string());
        send_error(res, result.error());
        return;
    }

    Json solution_json = result.value().to_json();
    store_.save(session_id, std::move(problem), std::move(result).value());

    res.set_header("x-session-id", session_id);
    send_json(res, 200, solution_json);
}

void HttpServer::handle_store_context(const httplib::Request& req, httplib::Response& res) {
    auto body = parse_body(req, res);
    if (!body) return;

    auto session_id = string_field(*body, "sessionId");
    if (!session_id) {
        send_error(res, 400, "sessionId is required", "validation");
        return;
    }

    auto request_it = body->find("request");
    if (request_it == body->end() || !request_it->is_object()) {
        send_error(res, 400, "request is required", "validation");
        return;
    }

    std::optional<vrp::Solution> solution;
    auto solution_it = body->find("solution");
    if (solution_it != body->end() && solution_it->is_object()) {
        solution = vrp::Solution::from_json(*solution_it);
    }

    store_.save(*session_id, vrp::Problem::from_json(*request_it), std::move(solution));
    send_json(res, 200, Json{{"status", "ok"}, {"sessionId", *session_id}});
}

void HttpServer::handle_get_context(const httplib::Request& req, httplib::Response& res) {
    const std::string session_id = req.path_params.at("session_id");

    auto ctx = store_.get(session_id);
    if (!ctx) {
        send_error(res, 404, "Session not found", "not_found");
        return;
    }
    send_json(res, 200, ctx->to_json());
}

void HttpServer::handle_update_solution(const httplib::Request& req, httplib::Response& res) {
    const std::string session_id = req.path_params.at("session_id");

    auto body = parse_body(req, res);
    if (!body) return;

    const bool updated = store_.update_solution(session_id, vrp::Solution::from_json(*body));
    send_json(res, 200, Json{{"sessionId", session_id}, {"updated", updated}});
}

void HttpServer::handle_delete_context(const httplib::Request& req, httplib::Response& res) {
    const std::string session_id = req.path_params.at("session_id");

    const bool deleted = store_.remove(session_id);
    send_json(res, 200, Json{{"sessionId", session_id}, {"deleted", deleted}});
}

void HttpServer::handle_list_sessions(const httplib::Request&, httplib::Response& res) {
    auto sessions = store_.list_sessions();
    send_json(res, 200, Json{{"sessions", sessions}, {"count", sessions.size()}});
}

void HttpServer::handle_evict(const httplib::Request& req, httplib::Response& res) {
    double hours = store_config_.max_session_age_hours;

    if (!req.body.empty()) {
        auto body = parse_body(req, res);
        if (!body) return;

        auto it = body->find("maxAgeHours");
        if (it != body->end()) {
            if (!it->is_number() || it->get<double>() < 0 || it->get<double>() > kMaxEvictAgeHours) {
                send_error(res, 400, "maxAgeHours must be a number between 0 and 876000", "validation");
                return;
            }
            hours = it->get<double>();
        }
    }

    const auto max_age = std::chrono::seconds(static_cast<int64_t>(hours * 3600.0));
    const size_t removed = store_.evict_older_than(max_age);
    send_json(res, 200, Json{{"removed", removed}, {"maxAgeHours", hours}});
}

void HttpServer::handle_analyze(const httplib::Request& req, httplib::Response& res) {
    auto body = parse_body(req, res);
    if (!body) return;

    auto session_id = string_field(*body, "sessionId");
    if (!session_id) {
        send_error(res, 400, "sessionId is required", "validation");
        return;
    }
    std::string aspect = "overview";
    if (auto it = body->find("aspect"); it != body->end()) {
        if (!it->is_string()) {
            send_error(res, 400, "aspect must be a string", "validation");
            return;
        }
        aspect = it->get<std::string>();
    }

    auto ctx = store_.get(*session_id);
    if (!ctx) {
        send_error(res, 404, "Session not found", "not_found");
        return;
    }

    auto result = analysis_engine_.analyze(aspect, ctx->solution, ctx->problem);
    send_json(res, 200, Json{
        {"sessionId", *session_id},
        {"aspect", std::string(analysis::analysis_kind_to_string(result.kind))},
        {"analysis", result.to_json()}
    });
}

void HttpServer::handle_suggest(const httplib::Request& req, httplib::Response& res) {
    auto body = parse_body(req, res);
    if (!body) return;

    auto session_id = string_field(*body, "sessionId");
    if (!session_id) {
        send_error(res, 400, "sessionId is required", "validation");
        return;
    }

    auto ctx = store_.get(*session_id);
    if (!ctx) {
        send_error(res, 404, "Session not found", "not_found");
        return;
    }

    analysis::SuggestionEngine engine(suggestion_options_);
    Json out = engine.suggest(ctx->solution, ctx->problem).to_json();
    out["sessionId"] = *session_id;
    send_json(res, 200, out);
}

void HttpServer::handle_chat(const httplib::Request& req, httplib::Response& res) {
    if (!assistant_) {
        send_error(res, 503, "Assistant is not configured", "server");
        return;
    }

    auto body = parse_body(req, res);
    if (!body) return;

    auto session_id = string_field(*body, "sessionId");
    auto message = string_field(*body, "message");
    if (!session_id || !message) {
        send_error(res, 400, "sessionId and message are required", "validation");
        return;
    }

    res.set_chunked_content_provider(
        "text/plain",
        [this, session_id = *session_id, message = *message](size_t, httplib::DataSink& sink) {
            auto result = assistant_->process(session_id, message, [&sink](const std::string& chunk) {
                sink.write(chunk.data(), chunk.size());
            });

            if (result.is_err()) {
                const std::string text = "\n[error] " + result.error().message;
                sink.write(text.data(), text.size());
            }

            sink.done();
            return true;
        });
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, Json{
        {"status", "healthy"},
        {"version", kVersion},
        {"services", {
            {"vrp", "operational"},
            {"assistant", assistant_ ? "operational" : "unavailable"}
        }},
        {"sessions", store_.size()}
    });
}

}  // namespace vrpassist::server
