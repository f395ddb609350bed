#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace vrpassist::core {

using Json = nlohmann::json;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

using SessionId = std::string;
using ToolId = std::string;

// Seconds since epoch, the wire format for timestamps
inline int64_t to_unix_seconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

// Outcome of one analysis tool invocation; content is handed back to the model
struct ToolResult {
    bool success = false;
    Json content;
    std::optional<std::string> error_message;
    Duration execution_time{0};
};

// Chat roles understood by the assistant runtime
enum class Role {
    System,
    User,
    Assistant,
    Tool
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

// Function call requested by the model
struct ToolCall {
    std::string id;
    ToolId tool_name;
    Json arguments;
};

struct Message {
    Role role = Role::User;
    std::string content;
    std::vector<ToolCall> tool_calls;         // assistant turns requesting tools
    std::optional<std::string> tool_call_id;  // tool turns answering a call

    static Message user(std::string text) {
        return Message{.role = Role::User, .content = std::move(text)};
    }

    static Message assistant(std::string text) {
        return Message{.role = Role::Assistant, .content = std::move(text)};
    }

    static Message tool_result(std::string call_id, std::string output) {
        return Message{
            .role = Role::Tool,
            .content = std::move(output),
            .tool_call_id = std::move(call_id)
        };
    }
};

enum class StopReason {
    EndTurn,
    MaxTokens,
    ToolUse,
    ContentFilter
};

struct TokenUsage {
    int input_tokens = 0;
    int output_tokens = 0;

    int total() const { return input_tokens + output_tokens; }
};

// One model turn: text, requested tool calls, or both
struct LLMResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    StopReason stop_reason = StopReason::EndTurn;
    TokenUsage usage;
    std::string model;
    Duration latency{0};

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

}  // namespace vrpassist::core
