#include "security/scoring.hpp"

#include <algorithm>

namespace promptshield {

double combined_score(const std::vector<ThreatFinding>& findings,
                      const PiiReport& pii,
                      const ScoringConfig& config) {
    double max_confidence = 0.0;
    for (const auto& f : findings) {
        max_confidence = std::max(max_confidence, f.confidence);
    }
    const double score = max_confidence +
        config.pii_increment * static_cast<double>(pii.distinct_categories());
    return std::clamp(score, 0.0, 1.0);
}

bool has_hard_block(const std::vector<ThreatFinding>& findings) {
    return std::ranges::any_of(findings, &ThreatFinding::hard_block);
}

} // namespace promptshield
