#pragma once

#include "core/types.hpp"
#include <string_view>

namespace promptshield {

// ============================================================================
// Feature Names
// ============================================================================

namespace feature {
    inline constexpr std::string_view kSanitization = "sanitization";
    inline constexpr std::string_view kPiiRedaction = "pii_redaction";
    inline constexpr std::string_view kLlmCheck = "llm_check";

    // Inbound detectors
    inline constexpr std::string_view kSqlInjection = "sql_injection";
    inline constexpr std::string_view kXss = "xss";
    inline constexpr std::string_view kCommandInjection = "command_injection";
    inline constexpr std::string_view kPathTraversal = "path_traversal";
    inline constexpr std::string_view kPromptInjection = "prompt_injection";

    // Outbound checks
    inline constexpr std::string_view kOutputPiiScan = "output_pii_scan";
    inline constexpr std::string_view kToxicity = "toxicity";
    inline constexpr std::string_view kHallucination = "hallucination";
    inline constexpr std::string_view kCitation = "citation";
    inline constexpr std::string_view kTone = "tone";
    inline constexpr std::string_view kRefusal = "refusal";
    inline constexpr std::string_view kDisclaimer = "disclaimer";
}

/**
 * @brief Built-in defaults: every known feature of the direction, enabled.
 * Detector thresholds 0.1, toxicity 0.5, llm_check 0.5, others 0.
 */
[[nodiscard]] FeatureConfig default_features(Direction direction);

/**
 * @brief Layer defaults < application < per-call overrides.
 *
 * Names absent from defaults are ignored. A threshold outside [0,1] is
 * logged and replaced by the default's threshold.
 */
[[nodiscard]] FeatureConfig resolve_features(const FeatureConfig& defaults,
                                             const ApplicationPolicy* application,
                                             const FeatureConfig& overrides);

} // namespace promptshield
