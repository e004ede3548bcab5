#pragma once

#include "config/config_types.hpp"
#include "core/pipeline.hpp"
#include <memory>

namespace promptshield {

class ILlmBackend;
class ITelemetrySink;

/**
 * @brief The inbound and outbound engines built from one ShieldConfig
 */
struct ShieldEngines {
    std::shared_ptr<PipelineEngine> inbound;
    std::shared_ptr<PipelineEngine> outbound;
};

/**
 * @brief Wire both pipelines from configuration
 *
 * When backend is null and llm.enabled is set, an LlmClient is created from
 * the [llm] section. With no backend at all the model stage never runs.
 * @throws std::runtime_error if a component cannot be constructed
 */
[[nodiscard]] ShieldEngines build_engines(const ShieldConfig& config,
                                          std::shared_ptr<ILlmBackend> backend,
                                          std::shared_ptr<ITelemetrySink> telemetry);

} // namespace promptshield
