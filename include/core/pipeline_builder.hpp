#pragma once

#include "core/types.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace promptshield {

// Forward declarations
class Sanitizer;
class PiiEngine;
class ThreatDetectorSet;
class EscalationPolicy;
class ModelAssistedAnalyzer;
class VerdictAggregator;
class RefusalDetector;
class DisclaimerInjector;
class ITelemetrySink;
class PipelineEngine;

/**
 * @brief All components a PipelineEngine needs, grouped in a single struct.
 *
 * Components are immutable after construction and shared between the
 * inbound and outbound engines where both use them.
 */
struct PipelineComponents {
    Direction direction = Direction::INBOUND;

    // Required
    std::shared_ptr<const Sanitizer> sanitizer;
    std::shared_ptr<const PiiEngine> pii_engine;
    std::shared_ptr<const ThreatDetectorSet> detectors;
    std::shared_ptr<const EscalationPolicy> escalation_policy;
    std::shared_ptr<const VerdictAggregator> aggregator;

    // Optional (nullptr = disabled)
    std::shared_ptr<const ModelAssistedAnalyzer> model_analyzer;
    std::shared_ptr<const RefusalDetector> refusal_detector;
    std::shared_ptr<const DisclaimerInjector> disclaimer_injector;
    std::shared_ptr<ITelemetrySink> telemetry;

    // Process-wide feature defaults (empty = built-in defaults for direction)
    FeatureConfig feature_defaults;
    std::unordered_map<std::string, ApplicationPolicy> applications;
};

/**
 * @brief Builder pattern for PipelineEngine construction.
 *
 * Usage:
 *   auto inbound = PipelineBuilder()
 *       .with_sanitizer(sanitizer)
 *       .with_pii_engine(pii)
 *       .with_detectors(detectors)
 *       .with_escalation_policy(policy)
 *       .with_aggregator(aggregator)
 *       .with_model_analyzer(analyzer)   // optional
 *       .build_inbound();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_sanitizer(std::shared_ptr<const Sanitizer> p)                  { c_.sanitizer = std::move(p); return *this; }
    PipelineBuilder& with_pii_engine(std::shared_ptr<const PiiEngine> p)                 { c_.pii_engine = std::move(p); return *this; }
    PipelineBuilder& with_detectors(std::shared_ptr<const ThreatDetectorSet> p)          { c_.detectors = std::move(p); return *this; }
    PipelineBuilder& with_escalation_policy(std::shared_ptr<const EscalationPolicy> p)   { c_.escalation_policy = std::move(p); return *this; }
    PipelineBuilder& with_aggregator(std::shared_ptr<const VerdictAggregator> p)         { c_.aggregator = std::move(p); return *this; }
    PipelineBuilder& with_model_analyzer(std::shared_ptr<const ModelAssistedAnalyzer> p) { c_.model_analyzer = std::move(p); return *this; }
    PipelineBuilder& with_refusal_detector(std::shared_ptr<const RefusalDetector> p)     { c_.refusal_detector = std::move(p); return *this; }
    PipelineBuilder& with_disclaimer_injector(std::shared_ptr<const DisclaimerInjector> p) { c_.disclaimer_injector = std::move(p); return *this; }
    PipelineBuilder& with_telemetry(std::shared_ptr<ITelemetrySink> p)                   { c_.telemetry = std::move(p); return *this; }
    PipelineBuilder& with_feature_defaults(FeatureConfig f)                              { c_.feature_defaults = std::move(f); return *this; }
    PipelineBuilder& with_application(std::string id, ApplicationPolicy policy)          { c_.applications[std::move(id)] = std::move(policy); return *this; }

    /**
     * @brief Build the inbound or outbound engine from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<PipelineEngine> build_inbound();
    [[nodiscard]] std::shared_ptr<PipelineEngine> build_outbound();

private:
    [[nodiscard]] std::shared_ptr<PipelineEngine> build(Direction direction);

    PipelineComponents c_;
};

} // namespace promptshield
