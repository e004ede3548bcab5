#pragma once

#include "core/types.hpp"
#include <vector>

namespace promptshield {

/**
 * @brief Score arithmetic shared by the escalation policy and the aggregator
 */
struct ScoringConfig {
    double auto_block_threshold = 0.7;
    double suspicion_floor = 0.25;
    double pii_increment = 0.05;
};

/**
 * @brief max finding confidence + pii_increment x distinct PII categories,
 * clamped to [0,1]
 */
[[nodiscard]] double combined_score(const std::vector<ThreatFinding>& findings,
                                    const PiiReport& pii,
                                    const ScoringConfig& config);

[[nodiscard]] bool has_hard_block(const std::vector<ThreatFinding>& findings);

} // namespace promptshield
