#include "vrpassist/llm/llm_gateway.hpp"
#include "vrpassist/llm/providers/openai.hpp"

#include <spdlog/spdlog.h>

namespace vrpassist::llm {

LLMGateway::LLMGateway(const LLMConfig& config, const ApiKeysConfig& api_keys)
    : config_(config)
    , provider_(create_provider(config, api_keys))
{
}

LLMGateway::LLMGateway(const LLMConfig& config, std::unique_ptr<LLMProvider> provider)
    : config_(config)
    , provider_(std::move(provider))
{
}

std::unique_ptr<LLMProvider> LLMGateway::create_provider(const LLMConfig& config,
                                                         const ApiKeysConfig& api_keys) {
    if (config.provider == "openai") {
        return std::make_unique<OpenAIProvider>(api_keys.openai, config.model,
                                                config.base_url, config.timeout_ms);
    }

    spdlog::error("Unknown LLM provider: {}", config.provider);
    return nullptr;
}

Result<void, Error> LLMGateway::initialize() const {
    if (!provider_) {
        return Result<void, Error>::err(
            ErrorCode::LLMProviderUnavailable,
            "Failed to create LLM provider",
            config_.provider
        );
    }

    if (!provider_->is_available()) {
        return Result<void, Error>::err(
            ErrorCode::LLMApiKeyMissing,
            "LLM provider API key not set",
            provider_->name()
        );
    }

    return Result<void, Error>::ok();
}

bool LLMGateway::is_available() const {
    return provider_ && provider_->is_available();
}

Result<LLMResponse, Error> LLMGateway::complete(const LLMRequest& request) {
    if (!is_available()) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMProviderUnavailable,
            "No LLM provider available"
        );
    }

    auto result = provider_->complete(request);
    if (result.is_ok()) {
        record_request(result.value());
    } else {
        record_failure(result.error());
    }
    return result;
}

Result<LLMResponse, Error> LLMGateway::stream(const LLMRequest& request,
                                              StreamCallbackWithFinal callback) {
    if (!is_available()) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMProviderUnavailable,
            "No LLM provider available"
        );
    }

    auto result = provider_->stream(request, std::move(callback));
    if (result.is_ok()) {
        record_request(result.value());
    } else {
        record_failure(result.error());
    }
    return result;
}

LLMGateway::UsageStats LLMGateway::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void LLMGateway::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = UsageStats{};
}

void LLMGateway::record_request(const LLMResponse& response) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_input_tokens += response.usage.input_tokens;
    stats_.total_output_tokens += response.usage.output_tokens;
    stats_.total_latency += response.latency;
    stats_.requests++;
}

void LLMGateway::record_failure(const Error& error) {
    spdlog::warn("LLM request failed: {}", error.to_string());
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.failures++;
}

}  // namespace vrpassist::llm
