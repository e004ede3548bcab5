#include "security/escalation_policy.hpp"

namespace promptshield {

EscalationPolicy::EscalationPolicy(const ScoringConfig& config)
    : config_(config) {}

EscalationPolicy::Decision EscalationPolicy::decide(
    const SanitizationResult& sanitization,
    const PiiReport& pii,
    const std::vector<ThreatFinding>& findings,
    const Context& context) const {

    Decision decision;
    decision.score = combined_score(findings, pii, config_);

    if (!context.llm_check_enabled) {
        decision.rule = Rule::LLM_CHECK_DISABLED;
        return decision;
    }

    if (decision.score >= config_.auto_block_threshold || has_hard_block(findings)) {
        decision.rule = Rule::ALREADY_DECIDED;
        return decision;
    }

    if (!context.any_detector_enabled && pii.findings.empty() &&
        sanitization.warnings.empty()) {
        decision.rule = Rule::NOTHING_TO_VERIFY;
        return decision;
    }

    if (context.always_verify) {
        decision.rule = Rule::ALWAYS_VERIFY;
        decision.escalate = true;
        return decision;
    }

    if (decision.score > config_.suspicion_floor) {
        decision.rule = Rule::SUSPICIOUS;
        decision.escalate = true;
        return decision;
    }

    decision.rule = Rule::BELOW_FLOOR;
    return decision;
}

const char* EscalationPolicy::rule_to_string(Rule rule) {
    switch (rule) {
        case Rule::LLM_CHECK_DISABLED: return "llm_check_disabled";
        case Rule::ALREADY_DECIDED: return "already_decided";
        case Rule::NOTHING_TO_VERIFY: return "nothing_to_verify";
        case Rule::ALWAYS_VERIFY: return "always_verify";
        case Rule::SUSPICIOUS: return "suspicious";
        case Rule::BELOW_FLOOR: return "below_floor";
        default: return "unknown";
    }
}

} // namespace promptshield
