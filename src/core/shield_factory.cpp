#include "core/shield_factory.hpp"
#include "core/llm_client.hpp"
#include "core/utils.hpp"
#include "output/disclaimer_injector.hpp"
#include "output/refusal_detector.hpp"
#include "security/detector_set.hpp"
#include "security/escalation_policy.hpp"
#include "security/model_analyzer.hpp"
#include "security/pii_engine.hpp"
#include "security/sanitizer.hpp"
#include "security/verdict_aggregator.hpp"
#include "telemetry/telemetry_sink.hpp"

#include <format>

namespace promptshield {

namespace {

Sanitizer::Config sanitizer_config(const ShieldConfig& config, Sanitizer::MarkupMode markup) {
    Sanitizer::Config cfg;
    cfg.max_length = config.sanitizer.max_length;
    cfg.normalize_unicode = config.sanitizer.normalize_unicode;
    cfg.collapse_whitespace = config.sanitizer.collapse_whitespace;
    cfg.markup = markup;
    return cfg;
}

} // anonymous namespace

ShieldEngines build_engines(const ShieldConfig& config,
                            std::shared_ptr<ILlmBackend> backend,
                            std::shared_ptr<ITelemetrySink> telemetry) {
    if (!backend && config.llm.client.enabled) {
        backend = std::make_shared<LlmClient>(config.llm.client);
        utils::log::info(std::format("Model check via {} ({})",
                                     config.llm.client.provider, config.llm.client.default_model));
    }

    // Shared, direction-independent components
    PiiEngine::Config pii_cfg;
    pii_cfg.custom_keywords = config.pii.custom_keywords;
    pii_cfg.detect_generic_tokens = config.pii.detect_generic_tokens;
    pii_cfg.min_generic_token_length = config.pii.min_generic_token_length;
    const auto pii_engine = std::make_shared<const PiiEngine>(pii_cfg);
    const auto escalation = std::make_shared<const EscalationPolicy>(config.scoring);

    std::shared_ptr<const ModelAssistedAnalyzer> analyzer;
    if (backend) {
        ModelAssistedAnalyzer::Config model_cfg;
        model_cfg.timeout = std::chrono::milliseconds(config.llm.client.timeout_ms);
        model_cfg.fallback_confidence = config.llm.fallback_confidence;
        model_cfg.max_tokens = config.llm.max_tokens;
        analyzer = std::make_shared<const ModelAssistedAnalyzer>(std::move(backend), model_cfg);
    }

    ThreatDetectorSet::Config detector_cfg;
    detector_cfg.parallel = config.parallel_detectors;
    detector_cfg.content_filter.mode = config.output.moderation_mode;
    detector_cfg.citation.suspicious_domains = config.output.suspicious_domains;
    detector_cfg.tone.default_tone = config.output.default_tone;

    VerdictAggregator::Config aggregator_cfg;
    aggregator_cfg.scoring = config.scoring;
    aggregator_cfg.outbound_remediation = config.output.remediation;
    aggregator_cfg.rewrite_notice = config.output.rewrite_notice;
    const auto aggregator = std::make_shared<const VerdictAggregator>(aggregator_cfg);

    ShieldEngines engines;

    PipelineBuilder inbound;
    inbound.with_sanitizer(std::make_shared<const Sanitizer>(
                sanitizer_config(config, Sanitizer::MarkupMode::ESCAPE)))
           .with_pii_engine(pii_engine)
           .with_detectors(std::make_shared<const ThreatDetectorSet>(
                ThreatDetectorSet::inbound(detector_cfg)))
           .with_escalation_policy(escalation)
           .with_aggregator(aggregator)
           .with_model_analyzer(analyzer)
           .with_telemetry(telemetry)
           .with_feature_defaults(config.inbound_features);

    PipelineBuilder outbound;
    outbound.with_sanitizer(std::make_shared<const Sanitizer>(
                 sanitizer_config(config, Sanitizer::MarkupMode::STRIP_UNSAFE)))
            .with_pii_engine(pii_engine)
            .with_detectors(std::make_shared<const ThreatDetectorSet>(
                 ThreatDetectorSet::outbound(detector_cfg)))
            .with_escalation_policy(escalation)
            .with_aggregator(aggregator)
            .with_model_analyzer(analyzer)
            .with_refusal_detector(std::make_shared<const RefusalDetector>())
            .with_disclaimer_injector(std::make_shared<const DisclaimerInjector>(
                 config.output.disclaimers))
            .with_telemetry(telemetry)
            .with_feature_defaults(config.outbound_features);

    for (const auto& [id, policy] : config.applications) {
        inbound.with_application(id, policy);
        outbound.with_application(id, policy);
    }

    engines.inbound = inbound.build_inbound();
    engines.outbound = outbound.build_outbound();
    return engines;
}

} // namespace promptshield
