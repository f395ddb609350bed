#include "vrpassist/llm/providers/openai.hpp"
#include "vrpassist/core/uuid.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace vrpassist::llm {

OpenAIProvider::OpenAIProvider(const std::string& api_key, const std::string& model,
                               const std::string& base_url, int timeout_ms)
    : api_key_(api_key)
    , model_(model)
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
{
}

bool OpenAIProvider::is_available() const {
    return !api_key_.empty();
}

Json OpenAIProvider::format_messages(const std::vector<Message>& messages,
                                     const std::string& system_prompt) const {
    Json out = Json::array();

    if (!system_prompt.empty()) {
        out.push_back(Json{{"role", "system"}, {"content", system_prompt}});
    }

    for (const auto& msg : messages) {
        Json m{
            {"role", std::string(role_to_string(msg.role))},
            {"content", msg.content}
        };

        if (msg.role == Role::Tool) {
            m["tool_call_id"] = msg.tool_call_id.value_or("");
        } else if (!msg.tool_calls.empty()) {
            Json calls = Json::array();
            for (const auto& tc : msg.tool_calls) {
                calls.push_back(Json{
                    {"id", tc.id},
                    {"type", "function"},
                    {"function", {
                        {"name", tc.tool_name},
                        {"arguments", tc.arguments.dump()}
                    }}
                });
            }
            m["tool_calls"] = calls;
            if (msg.content.empty()) {
                m["content"] = nullptr;
            }
        }

        out.push_back(std::move(m));
    }

    return out;
}

Result<LLMResponse, Error> OpenAIProvider::parse_response(const std::string& body) const {
    try {
        Json j = Json::parse(body);

        // Check for error
        if (j.contains("error") && j["error"].is_object()) {
            std::string error_msg = j["error"].value("message", "Unknown error");
            std::string type = j["error"].value("type", "");

            if (type == "rate_limit_exceeded" || type == "insufficient_quota") {
                return Result<LLMResponse, Error>::err(ErrorCode::LLMRateLimited, error_msg);
            }
            return Result<LLMResponse, Error>::err(ErrorCode::LLMInvalidResponse, error_msg);
        }

        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
            return Result<LLMResponse, Error>::err(
                ErrorCode::LLMInvalidResponse,
                "Response has no choices"
            );
        }

        LLMResponse response;
        response.model = j.value("model", model_);

        const auto& choice = j["choices"][0];
        const auto& message = choice.value("message", Json::object());

        if (message.contains("content") && message["content"].is_string()) {
            response.content = message["content"].get<std::string>();
        }

        if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
            for (const auto& call : message["tool_calls"]) {
                const auto& fn = call.value("function", Json::object());

                ToolCall tc;
                tc.id = call.value("id", generate_tool_call_id());
                tc.tool_name = fn.value("name", "");

                // Arguments arrive as a JSON-encoded string
                const std::string raw = fn.value("arguments", "{}");
                tc.arguments = Json::parse(raw.empty() ? "{}" : raw, nullptr, false);
                if (tc.arguments.is_discarded()) {
                    spdlog::warn("Malformed arguments for tool call {}: {}", tc.tool_name, raw);
                    tc.arguments = Json::object();
                }
                response.tool_calls.push_back(std::move(tc));
            }
        }

        // Parse finish reason
        const std::string finish_reason = choice.value("finish_reason", "stop");
        if (finish_reason == "tool_calls" || !response.tool_calls.empty()) {
            response.stop_reason = StopReason::ToolUse;
        } else if (finish_reason == "length") {
            response.stop_reason = StopReason::MaxTokens;
        } else if (finish_reason == "content_filter") {
            response.stop_reason = StopReason::ContentFilter;
        } else {
            response.stop_reason = StopReason::EndTurn;
        }

        // Parse usage
        if (j.contains("usage") && j["usage"].is_object()) {
            response.usage.input_tokens = j["usage"].value("prompt_tokens", 0);
            response.usage.output_tokens = j["usage"].value("completion_tokens", 0);
        }

        return Result<LLMResponse, Error>::ok(std::move(response));

    } catch (const Json::exception& e) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMInvalidResponse,
            std::string("JSON parse error: ") + e.what()
        );
    }
}

Result<LLMResponse, Error> OpenAIProvider::complete(const LLMRequest& request) {
    if (!is_available()) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMApiKeyMissing,
            "OpenAI API key not set"
        );
    }

    auto start = std::chrono::steady_clock::now();

    httplib::Client client(base_url_);
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_connection_timeout(30);

    // Build request body
    Json body;
    body["model"] = model_;
    body["messages"] = format_messages(request.messages, request.system_prompt);
    body["max_tokens"] = request.max_tokens;
    body["temperature"] = request.temperature;

    if (!request.tools.empty()) {
        body["tools"] = request.tools;
        body["tool_choice"] = "auto";
    }

    httplib::Headers headers = {
        {"Authorization", "Bearer " + api_key_}
    };

    auto res = client.Post("/v1/chat/completions", headers, body.dump(), "application/json");

    auto end = std::chrono::steady_clock::now();
    auto latency = std::chrono::duration_cast<Duration>(end - start);

    if (!res) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMConnectionFailed,
            "Failed to connect to OpenAI API: " + httplib::to_string(res.error()),
            base_url_
        );
    }

    if (res->status == 429) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMRateLimited,
            "Rate limited by OpenAI API"
        );
    }

    if (res->status >= 500) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMProviderUnavailable,
            "OpenAI API returned status " + std::to_string(res->status)
        );
    }

    if (res->status != 200) {
        auto result = parse_response(res->body);
        if (result.is_err()) {
            return result;
        }
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMInvalidResponse,
            "Unexpected status code: " + std::to_string(res->status)
        );
    }

    auto result = parse_response(res->body);
    if (result.is_ok()) {
        result.value().latency = latency;
    }

    return result;
}

Result<LLMResponse, Error> OpenAIProvider::stream(const LLMRequest& request,
                                                  StreamCallbackWithFinal callback) {
    // Complete, then hand the content out in chunks
    auto result = complete(request);
    if (result.is_err() || !callback) {
        return result;
    }

    auto& response = result.value();

    const size_t chunk_size = 50;
    for (size_t i = 0; i < response.content.size(); i += chunk_size) {
        std::string chunk = response.content.substr(i, chunk_size);
        bool is_final = (i + chunk_size >= response.content.size());
        callback(chunk, is_final);
    }

    if (response.content.empty()) {
        callback("", true);
    }

    return result;
}

}  // namespace vrpassist::llm
