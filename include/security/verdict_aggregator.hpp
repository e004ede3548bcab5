#pragma once

#include "security/scoring.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Merges all stage outputs into one Verdict
 *
 * Pure function of its inputs: identical inputs give an identical Verdict,
 * including finding order, which is what makes serialized verdicts
 * byte-comparable across runs.
 */
class VerdictAggregator {
public:
    struct Config {
        ScoringConfig scoring;
        RemediationAction outbound_remediation = RemediationAction::REWRITE;
        std::string rewrite_notice =
            "[Part of this response was withheld by the content policy.]";
    };

    /**
     * @brief Stage facts that are not findings
     */
    struct Annotations {
        bool pii_redaction = true;
        bool escalated = false;
        bool model_stage_ran = false;
        std::optional<std::string> disclaimer;
        bool false_refusal = false;
        std::vector<std::string> warnings;
    };

    VerdictAggregator() : VerdictAggregator(Config{}) {}
    explicit VerdictAggregator(Config config);

    [[nodiscard]] Verdict aggregate(Direction direction,
                                    const SanitizationResult& sanitization,
                                    const PiiReport& pii,
                                    std::vector<ThreatFinding> findings,
                                    Annotations annotations) const;

    /**
     * @brief Confidence desc, then category priority, detector, pattern id
     */
    static void sort_findings(std::vector<ThreatFinding>& findings);

    /**
     * @brief Category of the top finding, "multiple indicators" on a tie
     * between categories, "sensitive-data" when there are no findings.
     * Expects findings already sorted.
     */
    [[nodiscard]] static std::string block_reason_for(const std::vector<ThreatFinding>& findings);

    /**
     * @brief Verdict for a run that could not complete: blocked, score 1.0
     */
    [[nodiscard]] static Verdict fail_closed(Direction direction, std::string sanitized_text);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace promptshield
