#pragma once

#include "core/llm_client.hpp"
#include "core/types.hpp"
#include "output/disclaimer_injector.hpp"
#include "security/scoring.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <string>
#include <unordered_map>
#include <vector>

namespace promptshield {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct SanitizerConfig {
    size_t max_length = 10000;
    bool normalize_unicode = true;
    bool collapse_whitespace = false;
};

struct PiiConfig {
    std::vector<std::string> custom_keywords;
    bool detect_generic_tokens = true;
    size_t min_generic_token_length = 32;
};

struct LlmConfig {
    LlmClient::Config client;
    double fallback_confidence = 0.75;
    int max_tokens = 256;
};

struct OutputConfig {
    ModerationMode moderation_mode = ModerationMode::MODERATE;
    RemediationAction remediation = RemediationAction::REWRITE;
    std::string rewrite_notice = "[Part of this response was withheld by the content policy.]";
    std::string default_tone;
    std::vector<std::string> suspicious_domains = {
        "example.com", "test.com", "localhost", "dummy.com"};
    DisclaimerInjector::Config disclaimers;
};

// ============================================================================
// ShieldConfig - Complete parsed configuration
// ============================================================================

/**
 * @brief Immutable process-wide configuration, loaded once at start.
 */
struct ShieldConfig {
    LoggingConfig logging;
    SanitizerConfig sanitizer;
    PiiConfig pii;
    ScoringConfig scoring;
    bool parallel_detectors = false;
    LlmConfig llm;
    OutputConfig output;

    FeatureConfig inbound_features;
    FeatureConfig outbound_features;

    std::unordered_map<std::string, ApplicationPolicy> applications;

    ShieldConfig();
};

[[nodiscard]] std::optional<ModerationMode> moderation_mode_from_string(std::string_view name);
[[nodiscard]] std::optional<RemediationAction> remediation_from_string(std::string_view name);

} // namespace promptshield
