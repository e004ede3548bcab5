#include "security/verdict_aggregator.hpp"

#include <algorithm>
#include <format>
#include <tuple>

namespace promptshield {

VerdictAggregator::VerdictAggregator(Config config)
    : config_(std::move(config)) {}

void VerdictAggregator::sort_findings(std::vector<ThreatFinding>& findings) {
    std::ranges::sort(findings, [](const ThreatFinding& a, const ThreatFinding& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        return std::tie(a.category, a.detector, a.pattern_id) <
               std::tie(b.category, b.detector, b.pattern_id);
    });
}

std::string VerdictAggregator::block_reason_for(const std::vector<ThreatFinding>& findings) {
    if (findings.empty()) {
        return std::string(block_reason::kSensitiveData);
    }
    const auto& top = findings.front();
    for (size_t i = 1; i < findings.size() && findings[i].confidence == top.confidence; ++i) {
        if (findings[i].category != top.category) {
            return std::string(block_reason::kMultipleIndicators);
        }
    }
    return threat_category_to_string(top.category);
}

Verdict VerdictAggregator::aggregate(Direction direction,
                                     const SanitizationResult& sanitization,
                                     const PiiReport& pii,
                                     std::vector<ThreatFinding> findings,
                                     Annotations annotations) const {
    sort_findings(findings);

    Verdict verdict;
    verdict.direction = direction;
    verdict.security_score = combined_score(findings, pii, config_.scoring);
    verdict.pii = pii.findings;
    verdict.sanitized_text = sanitization.text;
    verdict.redacted_text = annotations.pii_redaction ? pii.redacted_text : sanitization.text;
    verdict.escalated = annotations.escalated;
    verdict.model_stage_ran = annotations.model_stage_ran;
    verdict.false_refusal = annotations.false_refusal;
    verdict.warnings = sanitization.warnings;
    for (auto& w : annotations.warnings) {
        verdict.warnings.push_back(std::move(w));
    }

    const bool hard_block = has_hard_block(findings);
    const bool over_threshold = verdict.security_score >= config_.scoring.auto_block_threshold;

    if (!over_threshold && !hard_block) {
        verdict.final_text = verdict.redacted_text;
    } else if (direction == Direction::OUTBOUND && !hard_block &&
               config_.outbound_remediation == RemediationAction::REWRITE) {
        verdict.remediation = RemediationAction::REWRITE;
        verdict.final_text = std::format("{}\n\n{}", verdict.redacted_text, config_.rewrite_notice);
        verdict.warnings.push_back(std::format("Response rewritten ({})", block_reason_for(findings)));
    } else {
        verdict.is_blocked = true;
        verdict.remediation = RemediationAction::BLOCK;
        verdict.block_reason = block_reason_for(findings);
    }

    if (!verdict.is_blocked && annotations.disclaimer) {
        verdict.final_text += "\n\n";
        verdict.final_text += *annotations.disclaimer;
        verdict.disclaimer = std::move(annotations.disclaimer);
    }

    verdict.threats = std::move(findings);
    return verdict;
}

Verdict VerdictAggregator::fail_closed(Direction direction, std::string sanitized_text) {
    Verdict verdict;
    verdict.direction = direction;
    verdict.security_score = 1.0;
    verdict.is_blocked = true;
    verdict.block_reason = std::string(block_reason::kVerificationFailed);
    verdict.remediation = RemediationAction::BLOCK;
    verdict.sanitized_text = std::move(sanitized_text);
    verdict.warnings.emplace_back("Analysis did not complete");
    return verdict;
}

} // namespace promptshield
