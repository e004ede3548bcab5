#pragma once

#include "core/pipeline_stage.hpp"
#include "core/pipeline_builder.hpp"

namespace promptshield {

/**
 * @brief Base class providing access to pipeline components
 */
class ComponentStage : public IPipelineStage {
public:
    explicit ComponentStage(const PipelineComponents& c) : c_(c) {}
protected:
    const PipelineComponents& c_;
};

// ============================================================================
// Deterministic Stages (always run to completion)
// ============================================================================

class SanitizeStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(AnalysisContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "sanitize"; }
};

class PiiStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(AnalysisContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "pii"; }
};

class ThreatDetectionStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(AnalysisContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "threat_detection"; }
};

class EscalationStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(AnalysisContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "escalation"; }
};

// ============================================================================
// Model Stage (the only external call; cancellable)
// ============================================================================

class ModelCheckStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(AnalysisContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "model_check"; }
};

// ============================================================================
// Outbound Annotation + Aggregation
// ============================================================================

class OutputAnnotationStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(AnalysisContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "output_annotation"; }
};

class AggregateStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(AnalysisContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "aggregate"; }
};

} // namespace promptshield
