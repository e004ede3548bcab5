#include "core/llm_client.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <format>
#include <thread>

namespace promptshield {

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Core API
// ============================================================================

LlmResponse LlmClient::complete(const LlmRequest& request,
                                std::chrono::milliseconds timeout,
                                std::stop_token stop_token) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled) {
        return {false, "", "LLM client is disabled", "", {}};
    }
    if (stop_token.stop_requested()) {
        return {false, "", "Cancelled before dispatch", "", {}};
    }

    const auto model = request.model.empty() ? config_.default_model : request.model;
    const auto bounded = std::min(timeout, std::chrono::milliseconds(config_.timeout_ms));
    return call_api(request, model, bounded, stop_token);
}

// ============================================================================
// LLM Response Parsing
// ============================================================================

std::string LlmClient::extract_content(const std::string& body, const std::string& provider) {
    JsonValue envelope;
    try {
        envelope = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return body;
    }

    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        const auto text = envelope["content"][0]["text"];
        if (text.is_string()) return text.get<std::string>();
    } else {
        // {"choices":[{"message":{"content":"..."}}]}
        const auto content = envelope["choices"][0]["message"]["content"];
        if (content.is_string()) return content.get<std::string>();
    }
    return body;
}

std::string LlmClient::build_request_body(const std::string& provider,
                                          const LlmRequest& request,
                                          const std::string& model) {
    if (provider == "anthropic") {
        return std::format(
            R"({{"model":"{}","max_tokens":{},"temperature":{},"system":"{}","messages":[{{"role":"user","content":"{}"}}]}})",
            utils::escape_json(model), request.max_tokens, request.temperature,
            utils::escape_json(request.system_prompt),
            utils::escape_json(request.prompt));
    }
    return std::format(
        R"({{"model":"{}","temperature":{},"max_tokens":{},"messages":[{{"role":"system","content":"{}"}},{{"role":"user","content":"{}"}}]}})",
        utils::escape_json(model), request.temperature, request.max_tokens,
        utils::escape_json(request.system_prompt),
        utils::escape_json(request.prompt));
}

// ============================================================================
// API Call
// ============================================================================

LlmResponse LlmClient::call_api(const LlmRequest& request,
                                const std::string& model,
                                std::chrono::milliseconds timeout,
                                const std::stop_token& stop_token) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    const auto start = std::chrono::steady_clock::now();
    const auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    if (config_.api_key.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No API key configured", model, {}};
    }

    if (config_.endpoint.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No endpoint configured", model, {}};
    }

    const std::string json_body = build_request_body(config_.provider, request, model);

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"},
            {"content-type", "application/json"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key},
            {"content-type", "application/json"}
        };
        path = "/v1/chat/completions";
    }

    // Retry loop (max_retries defaults to 0: one attempt)
    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (stop_token.stop_requested()) {
            return {false, "", "Cancelled", model, elapsed()};
        }

        const auto res = cli.Post(path, headers, json_body, "application/json");

        if (!res) {
            if (attempt < config_.max_retries) continue;
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", std::format("HTTP request failed: {}", httplib::to_string(res.error())),
                    model, elapsed()};
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429 &&
            attempt < config_.max_retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250 * (attempt + 1)));
            continue;
        }

        if (res->status != httplib::StatusCode::OK_200) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", std::format("API error: HTTP {} - {}", res->status,
                    res->body.substr(0, 200)), model, elapsed()};
        }

        return {true, extract_content(res->body, config_.provider), "", model, elapsed()};
    }

    api_errors_.fetch_add(1, std::memory_order_relaxed);
    return {false, "", "Max retries exceeded", model, elapsed()};
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace promptshield
