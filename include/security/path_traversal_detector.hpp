#pragma once

#include "security/threat_detector.hpp"
#include <vector>

namespace promptshield {

/**
 * @brief Directory traversal detector
 *
 * Reuses the sanitizer's traversal flags; rescans the text when the
 * sanitizer produced none (e.g. sanitization disabled). Each sequence adds
 * base_confidence by noisy-OR. A sensitive target adds target_confidence
 * only when it sits in the path that follows a traversal sequence.
 */
class PathTraversalDetector : public IThreatDetector {
public:
    struct Config {
        double base_confidence = 0.4;
        double target_confidence = 0.9;
    };

    PathTraversalDetector() : PathTraversalDetector(Config{}) {}
    explicit PathTraversalDetector(const Config& config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "path_traversal_detector"; }
    [[nodiscard]] std::string_view feature() const override { return "path_traversal"; }

private:
    Config config_;
};

} // namespace promptshield
