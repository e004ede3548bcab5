#pragma once

#include "core/error.hpp"
#include "core/llm_backend.hpp"
#include "core/types.hpp"
#include <chrono>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Outcome of one model-assisted check
 *
 * ran is true only when the backend answered in time; a malformed answer
 * still counts as ran (category UNVERIFIED, confidence 1.0).
 */
struct ModelAnalysis {
    ThreatCategory category = ThreatCategory::UNVERIFIED;
    double confidence = 0.0;
    std::string reasoning;
    bool ran = false;
    ErrorCategory error = ErrorCategory::NONE;
};

/**
 * @brief Wraps exactly one call to an external model with a fixed contract.
 *
 * The call runs on a detached worker so the caller can stop waiting at the
 * deadline or on cancellation; the worker owns shared state and the backend
 * by shared_ptr and finishes on its own. No retry.
 */
class ModelAssistedAnalyzer {
public:
    struct Config {
        std::chrono::milliseconds timeout{5000};
        double fallback_confidence = 0.75;
        std::string model;          // empty = backend default
        int max_tokens = 256;
    };

    ModelAssistedAnalyzer(std::shared_ptr<ILlmBackend> backend, Config config);

    [[nodiscard]] ModelAnalysis analyze(std::string_view text,
                                        const std::vector<ThreatFinding>& prior_findings,
                                        Direction direction,
                                        std::stop_token stop_token) const;

    /**
     * @brief Strict parser for {"confidence","category"} with an optional
     * string "reasoning". Markdown code fences are stripped; anything else
     * is a PARSE_ERROR.
     */
    [[nodiscard]] static Result<ModelAnalysis> parse_response(std::string_view content,
                                                              Direction direction);

    [[nodiscard]] static std::span<const ThreatCategory> labels_for(Direction direction);

    [[nodiscard]] static LlmRequest build_request(std::string_view text,
                                                  const std::vector<ThreatFinding>& prior_findings,
                                                  Direction direction,
                                                  const Config& config);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] ModelAnalysis fallback(ErrorCategory error) const;

    std::shared_ptr<ILlmBackend> backend_;
    Config config_;
};

} // namespace promptshield
