#pragma once

#include "vrpassist/core/config.hpp"
#include "vrpassist/core/result.hpp"
#include "vrpassist/core/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vrpassist::llm {

using namespace vrpassist::core;

// Streaming callback with final flag
using StreamCallbackWithFinal = std::function<void(const std::string& chunk, bool is_final)>;

// LLM request
struct LLMRequest {
    std::vector<Message> messages;
    std::string system_prompt;
    Json tools = Json::array();  // Tools in provider format
    int max_tokens = 2048;
    double temperature = 0.3;
};

// Base LLM provider interface
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    // Get provider name
    virtual std::string name() const = 0;

    // Check if provider is available (API key set, etc.)
    virtual bool is_available() const = 0;

    // Send a request and get response
    virtual Result<LLMResponse, Error> complete(const LLMRequest& request) = 0;

    // Send a streaming request
    virtual Result<LLMResponse, Error> stream(const LLMRequest& request,
                                              StreamCallbackWithFinal callback) = 0;

    // Convert messages to provider-specific format
    virtual Json format_messages(const std::vector<Message>& messages,
                                 const std::string& system_prompt) const = 0;
};

// LLM Gateway - owns the configured provider and tracks usage
class LLMGateway {
public:
    LLMGateway(const LLMConfig& config, const ApiKeysConfig& api_keys);

    // Use an already constructed provider
    LLMGateway(const LLMConfig& config, std::unique_ptr<LLMProvider> provider);

    // Fails when the provider is unknown or has no API key
    Result<void, Error> initialize() const;

    Result<LLMResponse, Error> complete(const LLMRequest& request);
    Result<LLMResponse, Error> stream(const LLMRequest& request, StreamCallbackWithFinal callback);

    bool is_available() const;

    const LLMConfig& config() const { return config_; }

    // Get token usage statistics
    struct UsageStats {
        int64_t total_input_tokens = 0;
        int64_t total_output_tokens = 0;
        int requests = 0;
        int failures = 0;
        Duration total_latency{0};
    };
    UsageStats get_stats() const;
    void reset_stats();

private:
    LLMConfig config_;
    std::unique_ptr<LLMProvider> provider_;

    mutable std::mutex stats_mutex_;
    UsageStats stats_;

    void record_request(const LLMResponse& response);
    void record_failure(const Error& error);

    static std::unique_ptr<LLMProvider> create_provider(const LLMConfig& config,
                                                        const ApiKeysConfig& api_keys);
};

}  // namespace vrpassist::llm
