#pragma once

#include "core/types.hpp"
#include "core/request_context.hpp"
#include "core/pipeline_builder.hpp"
#include "core/pipeline_stage.hpp"
#include <atomic>
#include <memory>
#include <stop_token>
#include <vector>

namespace promptshield {

/**
 * @brief Pipeline coordinator - runs the ordered stages for one direction
 *
 * Stages:
 * 1. Sanitize
 * 2. PII detection / redaction
 * 3. Threat detection (detector set, optionally parallel)
 * 4. Escalation decision
 * 5. Model-assisted check (only when escalated; cancellable)
 * 6. Output annotation (outbound: refusal, disclaimer)
 * 7. Aggregate into the Verdict
 *
 * run() always returns a Verdict. Any exception escaping a stage yields a
 * fail-closed verdict (blocked, "verification-failed", score 1.0).
 */
class PipelineEngine {
public:
    explicit PipelineEngine(PipelineComponents components);

    PipelineEngine(const PipelineEngine&) = delete;
    PipelineEngine& operator=(const PipelineEngine&) = delete;

    /**
     * @brief Analyze one text
     * @param request Input (its direction is ignored; the engine's wins)
     * @param stop_token Cancels only the model call
     */
    [[nodiscard]] Verdict run(const AnalysisRequest& request,
                              std::stop_token stop_token = {}) const;

    [[nodiscard]] Direction direction() const { return c_.direction; }

    /**
     * @brief Effective features for a request (defaults < application < call)
     */
    [[nodiscard]] FeatureConfig features_for(const AnalysisRequest& request) const;

    [[nodiscard]] std::vector<std::string_view> stage_names() const;

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_blocked;
        uint64_t failed_closed;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .requests_blocked = requests_blocked_.load(std::memory_order_relaxed),
            .failed_closed = failed_closed_.load(std::memory_order_relaxed),
        };
    }

private:
    /**
     * @brief Build stage chain from components
     */
    void build_stage_chain();

    [[nodiscard]] const ApplicationPolicy* find_application(const std::string& id) const;

    void report(const AnalysisContext& ctx, const Verdict& verdict) const;

    PipelineComponents c_;

    /**
     * @brief Ordered stage chain, built once in the constructor
     */
    std::vector<std::unique_ptr<IPipelineStage>> stages_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> requests_blocked_{0};
    mutable std::atomic<uint64_t> failed_closed_{0};
};

} // namespace promptshield
