#pragma once

#include "core/request_context.hpp"
#include <string_view>

namespace promptshield {

/**
 * @brief Abstract pipeline stage interface
 *
 * Each stage of the inspection pipeline implements this interface. Stages
 * are composed into an ordered list and executed sequentially; every stage
 * always runs, and a stage that does not apply (feature disabled, nothing
 * escalated) returns without touching the context.
 *
 * Stages hold only read-only components and are safe to share between
 * concurrent runs. An exception escaping process() fails the whole run
 * closed in PipelineEngine.
 */
class IPipelineStage {
public:
    virtual ~IPipelineStage() = default;

    /**
     * @brief Process one run through this stage
     * @param ctx Mutable analysis context
     */
    virtual void process(AnalysisContext& ctx) const = 0;

    /**
     * @brief Stage name for timing and logging
     */
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace promptshield
