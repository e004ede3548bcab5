#pragma once

#include "core/llm_backend.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace promptshield {

/**
 * @brief HTTP adapter for the model-assisted check.
 *
 * Uses httplib::Client against an OpenAI-compatible or Anthropic endpoint.
 * No caching and no rate limiting: every call is a fresh verdict, and
 * request admission belongs to the surrounding service.
 */
class LlmClient : public ILlmBackend {
public:
    struct Config {
        bool enabled = false;
        std::string provider = "openai";    // "openai" | "anthropic"
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string default_model = "gpt-4o-mini";
        uint32_t timeout_ms = 5000;
        uint32_t max_retries = 0;
    };

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    [[nodiscard]] LlmResponse complete(const LlmRequest& request,
                                       std::chrono::milliseconds timeout,
                                       std::stop_token stop_token) override;

    /**
     * @brief Pull the assistant text out of a provider response envelope.
     * Returns the body unchanged when it does not have the expected shape.
     */
    [[nodiscard]] static std::string extract_content(const std::string& body,
                                                     const std::string& provider);

    /**
     * @brief Provider request body (exposed for testing)
     */
    [[nodiscard]] static std::string build_request_body(const std::string& provider,
                                                        const LlmRequest& request,
                                                        const std::string& model);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] LlmResponse call_api(const LlmRequest& request,
                                       const std::string& model,
                                       std::chrono::milliseconds timeout,
                                       const std::stop_token& stop_token);

    Config config_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
};

} // namespace promptshield
