#pragma once

#include "security/threat_detector.hpp"
#include "output/citation_verifier.hpp"
#include "output/content_filter.hpp"
#include "output/hallucination_checker.hpp"
#include "output/leak_detector.hpp"
#include "output/tone_checker.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Fixed collection of threat detectors for one direction
 *
 * Built once by inbound() / outbound() and read-only afterwards. detect()
 * applies the per-request feature switches and thresholds, isolates each
 * detector's failures, and returns findings in registration order
 * regardless of whether detectors ran concurrently.
 */
class ThreatDetectorSet {
public:
    struct Config {
        bool parallel = false;
        ContentFilter::Config content_filter;
        HallucinationChecker::Config hallucination;
        CitationVerifier::Config citation;
        ToneChecker::Config tone;
        LeakDetector::Config leak;
    };

    struct Outcome {
        std::vector<ThreatFinding> findings;
        size_t detectors_run = 0;
        size_t detectors_failed = 0;
    };

    ThreatDetectorSet(std::vector<std::unique_ptr<IThreatDetector>> detectors, bool parallel);

    [[nodiscard]] static ThreatDetectorSet inbound(const Config& config);
    [[nodiscard]] static ThreatDetectorSet outbound(const Config& config);

    [[nodiscard]] Outcome detect(const DetectionInput& input, const FeatureConfig& features) const;

    /**
     * @brief True when at least one detector's feature is enabled
     */
    [[nodiscard]] bool any_enabled(const FeatureConfig& features) const;

    [[nodiscard]] std::vector<std::string_view> features() const;
    [[nodiscard]] size_t size() const { return detectors_.size(); }
    [[nodiscard]] bool parallel() const { return parallel_; }

private:
    std::vector<std::unique_ptr<IThreatDetector>> detectors_;
    bool parallel_ = false;
};

} // namespace promptshield
