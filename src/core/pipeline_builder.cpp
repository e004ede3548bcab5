#include "core/pipeline_builder.hpp"
#include "core/features.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include <format>
#include <stdexcept>

namespace promptshield {

std::shared_ptr<PipelineEngine> PipelineBuilder::build_inbound() {
    return build(Direction::INBOUND);
}

std::shared_ptr<PipelineEngine> PipelineBuilder::build_outbound() {
    return build(Direction::OUTBOUND);
}

std::shared_ptr<PipelineEngine> PipelineBuilder::build(Direction direction) {
    if (!c_.sanitizer) throw std::runtime_error("PipelineBuilder: sanitizer is required");
    if (!c_.pii_engine) throw std::runtime_error("PipelineBuilder: pii_engine is required");
    if (!c_.detectors) throw std::runtime_error("PipelineBuilder: detectors is required");
    if (!c_.escalation_policy) throw std::runtime_error("PipelineBuilder: escalation_policy is required");
    if (!c_.aggregator) throw std::runtime_error("PipelineBuilder: aggregator is required");

    c_.direction = direction;
    if (c_.feature_defaults.empty()) {
        c_.feature_defaults = default_features(direction);
    }
    if (!c_.model_analyzer) {
        utils::log::info(std::format("{} pipeline built without a model analyzer; llm_check is inert",
                                     direction_to_string(direction)));
    }

    return std::make_shared<PipelineEngine>(c_);
}

} // namespace promptshield
