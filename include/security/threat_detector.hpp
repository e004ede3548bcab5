#pragma once

#include "core/types.hpp"
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace promptshield {

/**
 * @brief Everything a detector may look at. All views borrow from the
 * pipeline context and are valid only for the duration of detect().
 */
struct DetectionInput {
    std::string_view text;          // sanitized text
    std::string_view decoded;       // sanitized text with %XX / entity encodings flattened
    const SanitizationResult* sanitization = nullptr;
    const PiiReport* pii = nullptr;
    const AnalysisRequest* request = nullptr;
};

/**
 * @brief Abstract threat detector
 *
 * Detectors are stateless after construction and safe to call concurrently.
 * Each finding's confidence is in [0,1]; an empty result means no threat.
 * Thresholding and enable/disable happen in ThreatDetectorSet, not here.
 */
class IThreatDetector {
public:
    virtual ~IThreatDetector() = default;

    [[nodiscard]] virtual std::vector<ThreatFinding> detect(const DetectionInput& input) const = 0;

    /**
     * @brief Stable detector name recorded on each finding
     */
    [[nodiscard]] virtual std::string_view name() const = 0;

    /**
     * @brief Feature key used for enable/threshold lookup (e.g. "sql_injection")
     */
    [[nodiscard]] virtual std::string_view feature() const = 0;
};

// ============================================================================
// Pattern Tables
// ============================================================================

/**
 * @brief One entry of a detector's static pattern table
 */
struct PatternRule {
    std::string id;
    std::regex pattern;
    double weight = 0.0;

    PatternRule(std::string rule_id, const char* re, double w, bool icase = true)
        : id(std::move(rule_id)),
          pattern(re, icase ? std::regex::ECMAScript | std::regex::icase
                            : std::regex::ECMAScript),
          weight(w) {}
};

struct RuleMatch {
    const PatternRule* rule = nullptr;
    size_t offset = 0;
    size_t length = 0;
};

/**
 * @brief First match of every rule that matches, in table order
 */
[[nodiscard]] std::vector<RuleMatch> match_rules(std::string_view text,
                                                 const std::vector<PatternRule>& rules);

/**
 * @brief Bounded evidence excerpt around a match (at most 48 bytes)
 */
[[nodiscard]] std::string make_evidence(std::string_view text, size_t offset, size_t length);

inline constexpr size_t kMaxEvidenceBytes = 48;

} // namespace promptshield
