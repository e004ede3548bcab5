#pragma once

#include "security/threat_detector.hpp"
#include <regex>
#include <vector>

namespace promptshield {

/**
 * @brief Data-leak check for model output
 *
 * Grades the PII report of the response by severity (SSN, card and
 * credential high; email, phone and keyword medium), adds IPv4 addresses
 * as low severity, and hard-blocks any protected phrase from the request.
 */
class LeakDetector : public IThreatDetector {
public:
    struct Config {
        double high_severity = 0.9;
        double medium_severity = 0.5;
        double low_severity = 0.3;
    };

    LeakDetector() : LeakDetector(Config{}) {}
    explicit LeakDetector(const Config& config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "leak_detector"; }
    [[nodiscard]] std::string_view feature() const override { return "output_pii_scan"; }

    [[nodiscard]] double severity_for(PiiCategory category) const;

private:
    Config config_;
    std::regex ipv4_regex_;
};

} // namespace promptshield
