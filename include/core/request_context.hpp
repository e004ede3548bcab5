#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "security/escalation_policy.hpp"
#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace promptshield {

/**
 * @brief Analysis context - carries state through the stages of one run
 *
 * Created by PipelineEngine::run() for a single request and discarded with
 * it. Holds input, intermediate results, and the final Verdict.
 */
struct AnalysisContext {
    // Input
    const AnalysisRequest& request;
    FeatureConfig features;             // resolved: defaults < application < call
    bool always_verify = false;
    std::stop_token stop_token;

    // Timestamps
    std::chrono::steady_clock::time_point started_at;

    // Stage results
    SanitizationResult sanitization;
    PiiReport pii;
    std::string decoded;                // sanitized text with encodings flattened
    std::vector<ThreatFinding> findings;
    size_t detectors_failed = 0;

    EscalationPolicy::Decision escalation;
    bool model_stage_ran = false;
    ErrorCategory model_error = ErrorCategory::NONE;

    // Outbound annotations
    std::optional<std::string> disclaimer;
    bool false_refusal = false;

    std::vector<std::string> warnings;

    // Timing breakdown (stage name, elapsed)
    std::vector<std::pair<std::string_view, std::chrono::microseconds>> stage_timings;

    std::optional<Verdict> verdict;

    AnalysisContext(const AnalysisRequest& req, FeatureConfig resolved, std::stop_token token)
        : request(req),
          features(std::move(resolved)),
          stop_token(std::move(token)),
          started_at(std::chrono::steady_clock::now()) {}

    [[nodiscard]] bool feature_enabled(std::string_view name) const {
        return feature_setting(features, name).enabled;
    }
};

} // namespace promptshield
