#include "security/detector_set.hpp"
#include "security/command_injection_detector.hpp"
#include "security/path_traversal_detector.hpp"
#include "security/prompt_injection_detector.hpp"
#include "security/sql_injection_detector.hpp"
#include "security/xss_detector.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>
#include <optional>
#include <stdexcept>
#include <utility>

namespace promptshield {

namespace {

/**
 * @brief Run one detector; nullopt when it threw
 */
std::optional<std::vector<ThreatFinding>> run_detector(const IThreatDetector& detector,
                                                       const DetectionInput& input) {
    try {
        return detector.detect(input);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Detector '{}' failed: {}", detector.name(), e.what()));
        return std::nullopt;
    }
}

} // anonymous namespace

ThreatDetectorSet::ThreatDetectorSet(std::vector<std::unique_ptr<IThreatDetector>> detectors,
                                     bool parallel)
    : detectors_(std::move(detectors)), parallel_(parallel) {}

ThreatDetectorSet ThreatDetectorSet::inbound(const Config& config) {
    std::vector<std::unique_ptr<IThreatDetector>> detectors;
    detectors.push_back(std::make_unique<SqlInjectionDetector>());
    detectors.push_back(std::make_unique<XssDetector>());
    detectors.push_back(std::make_unique<CommandInjectionDetector>());
    detectors.push_back(std::make_unique<PathTraversalDetector>());
    detectors.push_back(std::make_unique<PromptInjectionDetector>());
    return ThreatDetectorSet(std::move(detectors), config.parallel);
}

ThreatDetectorSet ThreatDetectorSet::outbound(const Config& config) {
    std::vector<std::unique_ptr<IThreatDetector>> detectors;
    detectors.push_back(std::make_unique<ContentFilter>(config.content_filter));
    detectors.push_back(std::make_unique<HallucinationChecker>(config.hallucination));
    detectors.push_back(std::make_unique<CitationVerifier>(config.citation));
    detectors.push_back(std::make_unique<ToneChecker>(config.tone));
    detectors.push_back(std::make_unique<LeakDetector>(config.leak));
    return ThreatDetectorSet(std::move(detectors), config.parallel);
}

ThreatDetectorSet::Outcome ThreatDetectorSet::detect(const DetectionInput& input,
                                                     const FeatureConfig& features) const {
    Outcome outcome;

    std::vector<const IThreatDetector*> active;
    for (const auto& detector : detectors_) {
        if (feature_setting(features, detector->feature()).enabled) {
            active.push_back(detector.get());
        }
    }
    outcome.detectors_run = active.size();

    std::vector<std::optional<std::vector<ThreatFinding>>> results;
    results.reserve(active.size());

    if (parallel_ && active.size() > 1) {
        std::vector<std::future<std::optional<std::vector<ThreatFinding>>>> futures;
        futures.reserve(active.size());
        for (const auto* detector : active) {
            futures.push_back(std::async(std::launch::async, [detector, &input] {
                return run_detector(*detector, input);
            }));
        }
        // Collected in registration order, so output does not depend on scheduling
        for (auto& f : futures) {
            results.push_back(f.get());
        }
    } else {
        for (const auto* detector : active) {
            results.push_back(run_detector(*detector, input));
        }
    }

    for (size_t i = 0; i < active.size(); ++i) {
        if (!results[i]) {
            ++outcome.detectors_failed;
            continue;
        }
        const double threshold = feature_setting(features, active[i]->feature()).threshold;
        for (auto& finding : *results[i]) {
            if (finding.confidence < threshold) continue;
            outcome.findings.push_back(std::move(finding));
        }
    }
    return outcome;
}

bool ThreatDetectorSet::any_enabled(const FeatureConfig& features) const {
    for (const auto& detector : detectors_) {
        if (feature_setting(features, detector->feature()).enabled) return true;
    }
    return false;
}

std::vector<std::string_view> ThreatDetectorSet::features() const {
    std::vector<std::string_view> names;
    names.reserve(detectors_.size());
    for (const auto& detector : detectors_) {
        names.push_back(detector->feature());
    }
    return names;
}

} // namespace promptshield
