#include <catch2/catch_test_macros.hpp>
#include "vrpassist/llm/providers/openai.hpp"

using namespace vrpassist;
using namespace vrpassist::llm;

TEST_CASE("Availability follows the API key", "[llm][openai]") {
    REQUIRE_FALSE(OpenAIProvider("", "gpt-4.1-mini").is_available());
    REQUIRE(OpenAIProvider("sk-test", "gpt-4.1-mini").is_available());
}

TEST_CASE("Missing key fails without a request", "[llm][openai]") {
    OpenAIProvider provider("", "gpt-4.1-mini");

    auto result = provider.complete(LLMRequest{});
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::LLMApiKeyMissing);
}

TEST_CASE("Parse a plain reply", "[llm][openai]") {
    OpenAIProvider provider("sk-test", "gpt-4.1-mini");

    auto result = provider.parse_response(R"({
        "model": "gpt-4.1-mini-2025",
        "choices": [{"message": {"role": "assistant", "content": "Route 1 is long."},
                     "finish_reason": "stop"}],
        "usage": {"prompt_tokens": 120, "completion_tokens": 8}
    })");

    REQUIRE(result.is_ok());
    const auto& response = result.value();
    REQUIRE(response.content == "Route 1 is long.");
    REQUIRE(response.model == "gpt-4.1-mini-2025");
    REQUIRE(response.stop_reason == StopReason::EndTurn);
    REQUIRE_FALSE(response.has_tool_calls());
    REQUIRE(response.usage.total() == 128);
}

TEST_CASE("Parse tool calls", "[llm][openai]") {
    OpenAIProvider provider("sk-test", "gpt-4.1-mini");

    auto result = provider.parse_response(R"({
        "choices": [{"message": {"role": "assistant", "content": null, "tool_calls": [
            {"id": "call_1", "type": "function",
             "function": {"name": "analyze_solution", "arguments": "{\"aspect\":\"routes\"}"}},
            {"type": "function",
             "function": {"name": "suggest_improvements", "arguments": "not json"}}
        ]}, "finish_reason": "tool_calls"}]
    })");

    REQUIRE(result.is_ok());
    const auto& response = result.value();
    REQUIRE(response.content.empty());
    REQUIRE(response.stop_reason == StopReason::ToolUse);
    REQUIRE(response.tool_calls.size() == 2);
    REQUIRE(response.tool_calls[0].id == "call_1");
    REQUIRE(response.tool_calls[0].arguments["aspect"] == "routes");

    // Missing id is generated, malformed arguments become an empty object
    REQUIRE_FALSE(response.tool_calls[1].id.empty());
    REQUIRE(response.tool_calls[1].arguments == Json::object());
}

TEST_CASE("Parse finish reasons", "[llm][openai]") {
    OpenAIProvider provider("sk-test", "gpt-4.1-mini");

    auto truncated = provider.parse_response(
        R"({"choices": [{"message": {"content": "part"}, "finish_reason": "length"}]})");
    REQUIRE(truncated.value().stop_reason == StopReason::MaxTokens);

    auto filtered = provider.parse_response(
        R"({"choices": [{"message": {"content": ""}, "finish_reason": "content_filter"}]})");
    REQUIRE(filtered.value().stop_reason == StopReason::ContentFilter);
}

TEST_CASE("Parse error bodies", "[llm][openai]") {
    OpenAIProvider provider("sk-test", "gpt-4.1-mini");

    auto limited = provider.parse_response(
        R"({"error": {"message": "Slow down", "type": "rate_limit_exceeded"}})");
    REQUIRE(limited.error().code == ErrorCode::LLMRateLimited);
    REQUIRE(limited.error().message == "Slow down");

    auto invalid = provider.parse_response(
        R"({"error": {"message": "Bad model", "type": "invalid_request_error"}})");
    REQUIRE(invalid.error().code == ErrorCode::LLMInvalidResponse);

    REQUIRE(provider.parse_response(R"({"choices": []})").error().code ==
            ErrorCode::LLMInvalidResponse);
    REQUIRE(provider.parse_response("<html>").error().code == ErrorCode::LLMInvalidResponse);
}

TEST_CASE("Format messages", "[llm][openai]") {
    OpenAIProvider provider("sk-test", "gpt-4.1-mini");

    Message assistant = Message::assistant("");
    assistant.tool_calls.push_back(ToolCall{
        .id = "call_1",
        .tool_name = "analyze_solution",
        .arguments = Json{{"aspect", "routes"}}
    });

    auto j = provider.format_messages({
        Message::user("How are my routes?"),
        assistant,
        Message::tool_result("call_1", R"({"total_routes":2})")
    }, "You are helpful.");

    REQUIRE(j.size() == 4);
    REQUIRE(j[0] == Json{{"role", "system"}, {"content", "You are helpful."}});
    REQUIRE(j[1]["role"] == "user");

    REQUIRE(j[2]["role"] == "assistant");
    REQUIRE(j[2]["content"].is_null());
    REQUIRE(j[2]["tool_calls"][0]["id"] == "call_1");
    REQUIRE(j[2]["tool_calls"][0]["type"] == "function");
    REQUIRE(j[2]["tool_calls"][0]["function"]["arguments"] == R"({"aspect":"routes"})");

    REQUIRE(j[3]["role"] == "tool");
    REQUIRE(j[3]["tool_call_id"] == "call_1");

    REQUIRE(provider.format_messages({Message::user("hi")}, "").size() == 1);
}
