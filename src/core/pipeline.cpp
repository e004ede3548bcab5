#include "core/pipeline.hpp"
#include "core/features.hpp"
#include "core/pipeline_stages.hpp"
#include "core/utils.hpp"
#include "security/verdict_aggregator.hpp"
#include "telemetry/telemetry_sink.hpp"

#include <format>
#include <stdexcept>

namespace promptshield {

PipelineEngine::PipelineEngine(PipelineComponents components)
    : c_(std::move(components)) {
    build_stage_chain();
}

void PipelineEngine::build_stage_chain() {
    stages_.push_back(std::make_unique<SanitizeStage>(c_));
    stages_.push_back(std::make_unique<PiiStage>(c_));
    stages_.push_back(std::make_unique<ThreatDetectionStage>(c_));
    stages_.push_back(std::make_unique<EscalationStage>(c_));
    stages_.push_back(std::make_unique<ModelCheckStage>(c_));
    if (c_.direction == Direction::OUTBOUND) {
        stages_.push_back(std::make_unique<OutputAnnotationStage>(c_));
    }
    stages_.push_back(std::make_unique<AggregateStage>(c_));
}

std::vector<std::string_view> PipelineEngine::stage_names() const {
    std::vector<std::string_view> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) {
        names.push_back(stage->name());
    }
    return names;
}

const ApplicationPolicy* PipelineEngine::find_application(const std::string& id) const {
    if (id.empty()) return nullptr;
    const auto it = c_.applications.find(id);
    return it != c_.applications.end() ? &it->second : nullptr;
}

FeatureConfig PipelineEngine::features_for(const AnalysisRequest& request) const {
    return resolve_features(c_.feature_defaults, find_application(request.application_id),
                            request.feature_overrides);
}

Verdict PipelineEngine::run(const AnalysisRequest& request, std::stop_token stop_token) const {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    AnalysisContext ctx(request, {}, std::move(stop_token));
    std::string_view current_stage = "resolve_features";

    try {
        ctx.features = features_for(request);
        if (const auto* app = find_application(request.application_id)) {
            ctx.always_verify = app->always_verify;
        }

        for (const auto& stage : stages_) {
            current_stage = stage->name();
            utils::Timer timer;
            stage->process(ctx);
            ctx.stage_timings.emplace_back(stage->name(), timer.elapsed_us());
        }

        if (!ctx.verdict) {
            throw std::logic_error("no verdict produced");
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("{} pipeline failed in stage '{}': {}; failing closed",
                                      direction_to_string(c_.direction), current_stage, e.what()));
        failed_closed_.fetch_add(1, std::memory_order_relaxed);
        ctx.verdict = VerdictAggregator::fail_closed(c_.direction, ctx.sanitization.text);
    } catch (...) {
        utils::log::error(std::format("{} pipeline failed in stage '{}' (unknown error); failing closed",
                                      direction_to_string(c_.direction), current_stage));
        failed_closed_.fetch_add(1, std::memory_order_relaxed);
        ctx.verdict = VerdictAggregator::fail_closed(c_.direction, ctx.sanitization.text);
    }

    Verdict verdict = std::move(*ctx.verdict);
    if (verdict.is_blocked) {
        requests_blocked_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("{} blocked: {} (score {:.2f}, {} finding(s))",
                                     direction_to_string(c_.direction),
                                     verdict.block_reason.value_or(""),
                                     verdict.security_score, verdict.threats.size()));
    }
    report(ctx, verdict);
    return verdict;
}

void PipelineEngine::report(const AnalysisContext& ctx, const Verdict& verdict) const {
    if (!c_.telemetry) return;
    for (const auto& [stage, elapsed] : ctx.stage_timings) {
        c_.telemetry->record_stage_latency(c_.direction, stage, elapsed);
    }
    if (ctx.model_error != ErrorCategory::NONE) {
        c_.telemetry->record_model_failure(c_.direction, ctx.model_error);
    }
    c_.telemetry->record_verdict(verdict);
}

} // namespace promptshield
