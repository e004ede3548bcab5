#include "core/pipeline_stages.hpp"
#include "core/features.hpp"
#include "core/text.hpp"
#include "core/utils.hpp"
#include "output/disclaimer_injector.hpp"
#include "output/refusal_detector.hpp"
#include "security/detector_set.hpp"
#include "security/escalation_policy.hpp"
#include "security/model_analyzer.hpp"
#include "security/pii_engine.hpp"
#include "security/sanitizer.hpp"
#include "security/verdict_aggregator.hpp"

#include <algorithm>
#include <format>

namespace promptshield {

namespace {

constexpr std::string_view kModelDetector = "model_analyzer";

/**
 * @brief PII-free, bounded evidence
 *
 * evidence is normally an excerpt of source. The excerpt is widened over
 * every PII span of source_pii it touches and those spans are replaced by
 * their masks, so a value cut by the excerpt edge is never stored in part.
 */
std::string scrub_evidence(std::string_view evidence, std::string_view source,
                           const PiiReport& source_pii, const PiiEngine& engine) {
    const size_t pos = source.find(evidence);
    if (pos == std::string_view::npos) {
        const auto scrubbed = engine.redact(evidence).redacted_text;
        return text::excerpt(scrubbed, 0, scrubbed.size(), kMaxEvidenceBytes);
    }

    size_t begin = pos;
    size_t end = pos + evidence.size();
    bool widened_front = false;
    for (const auto& f : source_pii.findings) {
        if (f.offset >= end || f.offset + f.length <= begin) continue;
        if (f.offset < begin) {
            begin = f.offset;
            widened_front = true;
        }
        end = std::max(end, f.offset + f.length);
    }

    std::string masked;
    size_t cursor = begin;
    for (const auto& f : source_pii.findings) {
        if (f.offset < begin || f.offset >= end) continue;
        masked.append(source.substr(cursor, f.offset - cursor));
        masked += f.mask;
        cursor = f.offset + f.length;
    }
    masked.append(source.substr(cursor, end - cursor));

    // Masks are opaque to a second pass
    const auto scrubbed = engine.redact(masked).redacted_text;
    if (scrubbed.size() <= kMaxEvidenceBytes) return scrubbed;

    // Keep the end that holds the match
    const size_t from = widened_front ? scrubbed.size() - kMaxEvidenceBytes : 0;
    return text::excerpt(scrubbed, from, kMaxEvidenceBytes, kMaxEvidenceBytes);
}

} // anonymous namespace

// ============================================================================
// SanitizeStage
// ============================================================================
void SanitizeStage::process(AnalysisContext& ctx) const {
    Sanitizer::Config config = c_.sanitizer->config();
    config.enabled = ctx.feature_enabled(feature::kSanitization);
    ctx.sanitization = Sanitizer::sanitize(ctx.request.text, config);
}

// ============================================================================
// PiiStage
// ============================================================================
void PiiStage::process(AnalysisContext& ctx) const {
    // Detection always runs; pii_redaction only controls the forwarded text
    ctx.pii = c_.pii_engine->redact(ctx.sanitization.text);
    if (!ctx.pii.findings.empty()) {
        utils::log::debug(std::format("PII: {} finding(s) in {} categories",
                                      ctx.pii.findings.size(), ctx.pii.distinct_categories()));
    }
}

// ============================================================================
// ThreatDetectionStage
// ============================================================================
void ThreatDetectionStage::process(AnalysisContext& ctx) const {
    ctx.decoded = text::decode_encodings(ctx.sanitization.text);

    DetectionInput input;
    input.text = ctx.sanitization.text;
    input.decoded = ctx.decoded;
    input.sanitization = &ctx.sanitization;
    input.pii = &ctx.pii;
    input.request = &ctx.request;

    auto outcome = c_.detectors->detect(input, ctx.features);
    ctx.detectors_failed = outcome.detectors_failed;

    // Evidence is cut from the decoded text; scrub it before it is stored
    const bool has_evidence = std::ranges::any_of(
        outcome.findings, [](const ThreatFinding& f) { return f.evidence.has_value(); });
    if (has_evidence) {
        const auto decoded_pii = c_.pii_engine->redact(ctx.decoded);
        for (auto& finding : outcome.findings) {
            if (!finding.evidence) continue;
            finding.evidence = scrub_evidence(*finding.evidence, ctx.decoded, decoded_pii,
                                              *c_.pii_engine);
        }
    }
    ctx.findings = std::move(outcome.findings);
}

// ============================================================================
// EscalationStage
// ============================================================================
void EscalationStage::process(AnalysisContext& ctx) const {
    EscalationPolicy::Context policy_ctx;
    policy_ctx.llm_check_enabled = c_.model_analyzer != nullptr &&
                                   ctx.feature_enabled(feature::kLlmCheck);
    policy_ctx.any_detector_enabled = c_.detectors->any_enabled(ctx.features);
    policy_ctx.always_verify = ctx.always_verify;

    ctx.escalation = c_.escalation_policy->decide(ctx.sanitization, ctx.pii, ctx.findings,
                                                  policy_ctx);
}

// ============================================================================
// ModelCheckStage
// ============================================================================
void ModelCheckStage::process(AnalysisContext& ctx) const {
    if (!ctx.escalation.escalate || !c_.model_analyzer) return;

    // The model only ever sees redacted text
    const auto analysis = c_.model_analyzer->analyze(
        ctx.pii.redacted_text, ctx.findings, c_.direction, ctx.stop_token);

    ctx.model_stage_ran = analysis.ran;
    ctx.model_error = analysis.error;

    if (analysis.category == ThreatCategory::BENIGN) return;

    // Fallback findings are never thresholded away
    const double threshold = feature_setting(ctx.features, feature::kLlmCheck).threshold;
    if (analysis.category != ThreatCategory::UNVERIFIED && analysis.confidence < threshold) {
        return;
    }

    ThreatFinding finding;
    finding.detector = std::string(kModelDetector);
    finding.category = analysis.category;
    finding.confidence = analysis.confidence;
    if (analysis.error == ErrorCategory::NONE) {
        finding.pattern_id = std::format("MODEL:{}", threat_category_to_string(analysis.category));
        if (!analysis.reasoning.empty()) {
            finding.evidence = scrub_evidence(analysis.reasoning, analysis.reasoning,
                                              c_.pii_engine->redact(analysis.reasoning),
                                              *c_.pii_engine);
        }
    } else {
        finding.pattern_id = std::format("MODEL_{}", error_category_to_string(analysis.error));
        ctx.warnings.push_back(std::format("Model check unavailable ({})",
                                           error_category_to_string(analysis.error)));
    }
    ctx.findings.push_back(std::move(finding));
}

// ============================================================================
// OutputAnnotationStage
// ============================================================================
void OutputAnnotationStage::process(AnalysisContext& ctx) const {
    if (c_.refusal_detector && ctx.feature_enabled(feature::kRefusal)) {
        ctx.false_refusal = c_.refusal_detector->is_refusal(ctx.sanitization.text);
        if (ctx.false_refusal) {
            utils::log::info("Potential false refusal detected");
        }
    }
    if (c_.disclaimer_injector && ctx.feature_enabled(feature::kDisclaimer)) {
        ctx.disclaimer = c_.disclaimer_injector->disclaimer(ctx.sanitization.text);
    }
}

// ============================================================================
// AggregateStage
// ============================================================================
void AggregateStage::process(AnalysisContext& ctx) const {
    VerdictAggregator::Annotations annotations;
    annotations.pii_redaction = ctx.feature_enabled(feature::kPiiRedaction);
    annotations.escalated = ctx.escalation.escalate;
    annotations.model_stage_ran = ctx.model_stage_ran;
    annotations.disclaimer = ctx.disclaimer;
    annotations.false_refusal = ctx.false_refusal;
    annotations.warnings = ctx.warnings;

    ctx.verdict = c_.aggregator->aggregate(c_.direction, ctx.sanitization, ctx.pii,
                                           ctx.findings, std::move(annotations));
}

} // namespace promptshield
