#pragma once

#include "security/threat_detector.hpp"
#include <vector>

namespace promptshield {

/**
 * @brief Cross-site scripting detector
 *
 * Markers (script tags, event handlers, script-scheme URIs, embedding tags,
 * DOM sinks) combine by noisy-OR. When the sanitizer had to escape markup
 * and at least one marker matched, a co-occurrence signal is added.
 */
class XssDetector : public IThreatDetector {
public:
    struct Config {
        double markup_escaped_weight = 0.2;
    };

    XssDetector() : XssDetector(Config{}) {}
    explicit XssDetector(const Config& config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "xss_detector"; }
    [[nodiscard]] std::string_view feature() const override { return "xss"; }

private:
    Config config_;
    std::vector<PatternRule> rules_;
};

} // namespace promptshield
