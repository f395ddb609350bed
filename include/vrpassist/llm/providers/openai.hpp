#pragma once

#include "vrpassist/llm/llm_gateway.hpp"

#include <string>

namespace vrpassist::llm {

// Chat completions API with function tools
class OpenAIProvider : public LLMProvider {
public:
    OpenAIProvider(const std::string& api_key, const std::string& model,
                   const std::string& base_url = "https://api.openai.com",
                   int timeout_ms = 120000);

    std::string name() const override { return "openai"; }
    bool is_available() const override;

    Result<LLMResponse, Error> complete(const LLMRequest& request) override;
    Result<LLMResponse, Error> stream(const LLMRequest& request,
                                      StreamCallbackWithFinal callback) override;

    Json format_messages(const std::vector<Message>& messages,
                         const std::string& system_prompt) const override;

    // Parse a chat completions response body
    Result<LLMResponse, Error> parse_response(const std::string& body) const;

private:
    std::string api_key_;
    std::string model_;
    std::string base_url_;
    int timeout_ms_;
};

}  // namespace vrpassist::llm
