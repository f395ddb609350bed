#include "vrpassist/agent/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace vrpassist::agent {

const char* const kInstructions =
    "You are a VRP (Vehicle Routing Problem) Analysis Assistant. You help users "
    "understand and optimize their vehicle routing solutions.\n\n"
    "## Your Capabilities:\n"
    "1. **Analyze VRP Solutions**: Examine route efficiency, resource utilization, "
    "and constraint compliance\n"
    "2. **Suggest Improvements**: Recommend optimization strategies based on solution metrics\n"
    "3. **Explain Routing Decisions**: Help users understand why certain routes were chosen\n"
    "4. **Identify Issues**: Detect constraint violations, unassigned jobs, and inefficiencies\n\n"
    "## Context Awareness:\n"
    "You have access to the current VRP problem and solution through hidden context. "
    "When analyzing, always refer to specific:\n"
    "- Job IDs and locations\n"
    "- Vehicle/resource assignments\n"
    "- Time windows and service times\n"
    "- Route distances and durations\n"
    "- Constraint violations\n\n"
    "## Response Guidelines:\n"
    "- **Be specific**: Reference actual job IDs, vehicle names, and metrics from the solution\n"
    "- **Be actionable**: Provide concrete suggestions users can implement\n"
    "- **Be concise**: Keep responses focused and easy to understand\n"
    "- **Be proactive**: Identify potential issues even if not explicitly asked\n\n"
    "## What You CANNOT Do:\n"
    "- Modify the VRP problem or solution directly (read-only access)\n"
    "- Answer questions unrelated to VRP, routing, or logistics\n"
    "- Provide legal, medical, or financial advice\n\n"
    "When users ask unrelated questions, politely redirect them to VRP-related topics. "
    "If no VRP context is available, let them know you need a solved VRP problem to analyze.";

namespace {

constexpr size_t kMaxJobsInContext = 10;
constexpr size_t kMaxViolationsInContext = 5;

std::string format_capacity(const std::vector<double>& capacity) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < capacity.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << capacity[i];
    }
    ss << "]";
    return ss.str();
}

}  // namespace

AssistantOrchestrator::Config AssistantOrchestrator::Config::from_app_config(const core::Config& config) {
    Config out;
    out.max_tool_turns = config.llm.max_tool_turns;
    out.max_tokens = config.llm.max_tokens;
    out.temperature = config.llm.temperature;
    out.suggestion_options = analysis::SuggestionOptions::from_config(config.analysis);
    return out;
}

AssistantOrchestrator::AssistantOrchestrator(
    const Config& config,
    llm::LLMGateway& llm,
    tools::ToolRegistry& tools,
    context::ContextStore& store)
    : config_(config)
    , llm_(llm)
    , tools_(tools)
    , store_(store)
{
}

std::string AssistantOrchestrator::format_context(const context::SessionContext& ctx) {
    const auto& problem = ctx.problem;

    std::ostringstream ss;
    ss << std::fixed;
    ss << "<VRP_CONTEXT>\n";

    // Problem overview
    ss << "\n## Problem Overview\n";
    ss << "- Total Jobs: " << problem.jobs.size() << "\n";
    ss << "- Total Resources/Vehicles: " << problem.resources.size() << "\n";

    if (!problem.jobs.empty()) {
        ss << "\n## Jobs\n";
        const size_t shown = std::min(problem.jobs.size(), kMaxJobsInContext);
        for (size_t idx = 0; idx < shown; ++idx) {
            const auto& job = problem.jobs[idx];
            ss << "- " << job.name.value_or("job_" + std::to_string(idx)) << ": ";

            if (job.location && job.location->latitude && job.location->longitude) {
                ss << std::setprecision(4) << "(" << *job.location->latitude << ", "
                   << *job.location->longitude << ")";
            } else if (job.location && job.location->address) {
                ss << *job.location->address;
            } else {
                ss << "Unknown location";
            }
            ss << std::setprecision(0) << ", duration=" << job.duration.value_or(0.0) << "s\n";
        }
        if (problem.jobs.size() > kMaxJobsInContext) {
            ss << "  ... and " << (problem.jobs.size() - kMaxJobsInContext) << " more jobs\n";
        }
    }

    if (!problem.resources.empty()) {
        ss << "\n## Resources\n";
        for (const auto& resource : problem.resources) {
            ss << "- " << resource.name.value_or("unknown")
               << ": capacity=" << format_capacity(resource.capacity) << "\n";
        }
    }

    if (ctx.solution) {
        const auto& solution = *ctx.solution;

        ss << "\n## Solution\n";
        ss << "- Solution ID: " << solution.id.value_or("N/A") << "\n";
        ss << "- Status: " << solution.status.value_or("SOLVED") << "\n";
        ss << "- Routes Generated: " << solution.trips.size() << "\n";
        ss << "- Unserved Jobs: " << solution.unserved.size() << "\n";

        if (solution.occupancy) {
            ss << std::setprecision(1) << "- Overall Occupancy: " << (*solution.occupancy * 100.0) << "%\n";
        }
        if (solution.total_travel_distance_m && *solution.total_travel_distance_m > 0) {
            ss << std::setprecision(1) << "- Total Distance: "
               << (*solution.total_travel_distance_m / 1000.0) << " km\n";
        }
        if (solution.total_travel_time_s && *solution.total_travel_time_s > 0) {
            ss << std::setprecision(1) << "- Total Travel Time: "
               << (*solution.total_travel_time_s / 3600.0) << " hours\n";
        }

        if (!solution.trips.empty()) {
            ss << "\n## Route Details\n";
            for (size_t idx = 0; idx < solution.trips.size(); ++idx) {
                const auto& trip = solution.trips[idx];
                ss << "- " << trip.resource.value_or("vehicle_" + std::to_string(idx)) << ": "
                   << trip.visits.size() << " stops, "
                   << std::setprecision(1) << (trip.distance.value_or(0.0) / 1000.0) << " km, "
                   << std::setprecision(0) << (trip.travel_time.value_or(0.0) / 60.0)
                   << " min travel time\n";
            }
        }

        if (solution.score) {
            const auto& score = *solution.score;
            ss << "\n## Solution Quality\n";
            ss << "- Feasible: " << (score.feasible ? (*score.feasible ? "True" : "False") : "None") << "\n";
            ss << std::setprecision(1);
            if (score.hard_score) {
                ss << "- Hard Score: " << *score.hard_score << "\n";
            }
            if (score.soft_score) {
                ss << "- Soft Score: " << *score.soft_score << "\n";
            }
        }

        if (!solution.violations.empty()) {
            ss << "\n## Constraint Violations\n";
            const size_t shown = std::min(solution.violations.size(), kMaxViolationsInContext);
            for (size_t i = 0; i < shown; ++i) {
                const auto& v = solution.violations[i];
                if (v.name && v.value) {
                    ss << "- " << *v.name << " (" << v.level.value_or("UNKNOWN") << "): "
                       << *v.value << "\n";
                }
            }
        }
    }

    ss << "\n</VRP_CONTEXT>";
    return ss.str();
}

Result<std::string, Error> AssistantOrchestrator::process(
    const SessionId& session_id,
    const std::string& user_text,
    StreamCallback stream_cb) {

    // Snapshot; the store is not consulted again during this message
    auto snapshot = store_.get(session_id);

    std::string input = user_text;
    if (snapshot) {
        const std::string context_block = format_context(*snapshot);
        spdlog::info("Injecting VRP context for session {} ({} chars)", session_id, context_block.size());
        input = context_block + "\n\nUser: " + user_text;
    } else {
        spdlog::warn("No VRP context for session {}", session_id);
        input = "<VRP_CONTEXT>\nNo VRP problem or solution has been stored for this session.\n"
                "</VRP_CONTEXT>\n\nUser: " + user_text;
    }

    tools::ToolContext tool_ctx;
    tool_ctx.session_id = session_id;
    tool_ctx.session = snapshot ? &*snapshot : nullptr;
    tool_ctx.suggestion_options = config_.suggestion_options;

    llm::LLMRequest request;
    request.system_prompt = config_.system_prompt;
    request.messages.push_back(Message::user(input));
    request.tools = tools_.to_openai_format();
    request.max_tokens = config_.max_tokens;
    request.temperature = config_.temperature;

    auto forward = [&stream_cb](const std::string& chunk, bool /*is_final*/) {
        if (stream_cb && !chunk.empty()) {
            stream_cb(chunk);
        }
    };

    int turn = 0;
    while (true) {
        // Out of tool rounds: ask for an answer without offering tools
        if (turn >= config_.max_tool_turns) {
            request.tools = Json::array();
        }

        auto llm_result = llm_.stream(request, forward);
        if (llm_result.is_err()) {
            spdlog::error("Assistant request failed for session {}: {}",
                          session_id, llm_result.error().to_string());
            return Result<std::string, Error>::err(std::move(llm_result).error());
        }

        auto response = std::move(llm_result).value();

        if (!response.has_tool_calls()) {
            spdlog::info("Assistant replied to session {} after {} tool round(s)", session_id, turn);
            return Result<std::string, Error>::ok(std::move(response.content));
        }

        if (turn >= config_.max_tool_turns) {
            return Result<std::string, Error>::err(
                ErrorCode::LLMTurnLimitExceeded,
                "Model kept requesting tools after " + std::to_string(turn) + " rounds",
                session_id
            );
        }
        ++turn;

        // The assistant message carrying tool_calls precedes its tool results
        Message assistant_msg = Message::assistant(response.content);
        assistant_msg.tool_calls = response.tool_calls;
        request.messages.push_back(std::move(assistant_msg));

        for (auto& msg : execute_tool_calls(response.tool_calls, tool_ctx)) {
            request.messages.push_back(std::move(msg));
        }
    }
}

std::vector<Message> AssistantOrchestrator::execute_tool_calls(
    const std::vector<ToolCall>& calls,
    const tools::ToolContext& tool_ctx) {

    std::vector<Message> results;
    results.reserve(calls.size());

    for (const auto& call : calls) {
        auto result = tools_.execute(call.tool_name, call.arguments, tool_ctx);

        std::string output;
        if (result.is_ok()) {
            const auto& tr = result.value();
            output = tr.content.is_string() ? tr.content.get<std::string>() : tr.content.dump();
        } else {
            spdlog::warn("Tool {} failed: {}", call.tool_name, result.error().to_string());
            output = Json{{"error", result.error().full_message()}}.dump();
        }

        results.push_back(Message::tool_result(call.id, output));
    }

    return results;
}

}  // namespace vrpassist::agent
