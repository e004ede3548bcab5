#pragma once

#include "security/scoring.hpp"
#include "core/types.hpp"
#include <vector>

namespace promptshield {

/**
 * @brief Decides whether the model-assisted check runs for a request.
 *
 * Rules, first match wins:
 *   1. llm_check disabled                                  -> no
 *   2. score >= auto_block_threshold or any hard block     -> no (already decided)
 *   3. every detector disabled, no PII, no warnings        -> no (nothing to verify)
 *   4. application always_verify                           -> yes
 *   5. suspicion_floor < score < auto_block_threshold      -> yes
 *   otherwise                                              -> no
 */
class EscalationPolicy {
public:
    enum class Rule : uint8_t {
        LLM_CHECK_DISABLED,
        ALREADY_DECIDED,
        NOTHING_TO_VERIFY,
        ALWAYS_VERIFY,
        SUSPICIOUS,
        BELOW_FLOOR
    };

    struct Context {
        bool llm_check_enabled = true;
        bool any_detector_enabled = true;
        bool always_verify = false;
    };

    struct Decision {
        bool escalate = false;
        Rule rule = Rule::BELOW_FLOOR;
        double score = 0.0;
    };

    EscalationPolicy() : EscalationPolicy(ScoringConfig{}) {}
    explicit EscalationPolicy(const ScoringConfig& config);

    [[nodiscard]] Decision decide(const SanitizationResult& sanitization,
                                  const PiiReport& pii,
                                  const std::vector<ThreatFinding>& findings,
                                  const Context& context) const;

    [[nodiscard]] bool should_escalate(const SanitizationResult& sanitization,
                                       const PiiReport& pii,
                                       const std::vector<ThreatFinding>& findings,
                                       const Context& context) const {
        return decide(sanitization, pii, findings, context).escalate;
    }

    [[nodiscard]] static const char* rule_to_string(Rule rule);

    [[nodiscard]] const ScoringConfig& config() const { return config_; }

private:
    ScoringConfig config_;
};

} // namespace promptshield
