#pragma once

#include "security/threat_detector.hpp"
#include <regex>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Cross-checks concrete claims in model output against the source
 * facts supplied with the request.
 *
 * Claims are numbers (with optional decimals or percent) and double-quoted
 * phrases. A claim is supported when some source fact contains it
 * (case-insensitive). Skipped when the request carries no source facts.
 * Confidence = weight x unsupported / total claims.
 */
class HallucinationChecker : public IThreatDetector {
public:
    struct Config {
        double weight = 0.9;
        size_t min_claims = 1;
    };

    HallucinationChecker() : HallucinationChecker(Config{}) {}
    explicit HallucinationChecker(const Config& config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "hallucination_checker"; }
    [[nodiscard]] std::string_view feature() const override { return "hallucination"; }

    struct Claim {
        std::string value;
        size_t offset = 0;
    };

    [[nodiscard]] std::vector<Claim> extract_claims(std::string_view text) const;

private:
    Config config_;
    std::regex number_regex_;
    std::regex quote_regex_;
};

} // namespace promptshield
