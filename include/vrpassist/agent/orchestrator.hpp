#pragma once

#include "vrpassist/analysis/suggestion_engine.hpp"
#include "vrpassist/context/context_store.hpp"
#include "vrpassist/core/config.hpp"
#include "vrpassist/core/result.hpp"
#include "vrpassist/core/types.hpp"
#include "vrpassist/llm/llm_gateway.hpp"
#include "vrpassist/tools/tool_registry.hpp"

#include <functional>
#include <string>
#include <vector>

namespace vrpassist::agent {

using namespace vrpassist::core;

// Streaming callback for the assistant's reply
using StreamCallback = std::function<void(const std::string& chunk)>;

// System instructions for the VRP analysis assistant
extern const char* const kInstructions;

// Answers questions about a session's VRP problem and solution.
// Injects the stored context into the user's message, lets the model call the
// analysis tools against that snapshot, and streams the final reply.
class AssistantOrchestrator {
public:
    struct Config {
        int max_tool_turns = 4;              // Tool-call rounds per message
        int max_tokens = 2048;
        double temperature = 0.3;
        std::string system_prompt = kInstructions;
        analysis::SuggestionOptions suggestion_options;

        static Config from_app_config(const core::Config& config);
    };

    AssistantOrchestrator(
        const Config& config,
        llm::LLMGateway& llm,
        tools::ToolRegistry& tools,
        context::ContextStore& store
    );

    // Handle one user message for a session and return the full reply
    Result<std::string, Error> process(
        const SessionId& session_id,
        const std::string& user_text,
        StreamCallback stream_cb = nullptr
    );

    // <VRP_CONTEXT> block describing the problem and, when solved, the solution
    static std::string format_context(const context::SessionContext& ctx);

private:
    Config config_;
    llm::LLMGateway& llm_;
    tools::ToolRegistry& tools_;
    context::ContextStore& store_;

    std::vector<Message> execute_tool_calls(
        const std::vector<ToolCall>& calls,
        const tools::ToolContext& tool_ctx
    );
};

}  // namespace vrpassist::agent
