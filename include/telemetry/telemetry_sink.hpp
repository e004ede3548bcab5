#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <chrono>
#include <string_view>

namespace promptshield {

/**
 * @brief Receives counters and stage timings from the pipeline engine
 *
 * Called concurrently from every request thread; implementations do their
 * own synchronization. Must not throw.
 */
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;

    /// One call per completed run: requests, blocks, threats, PII, escalations
    virtual void record_verdict(const Verdict& verdict) = 0;

    /// One call per stage per run
    virtual void record_stage_latency(Direction direction, std::string_view stage,
                                      std::chrono::microseconds elapsed) = 0;

    /// Model call timed out, was cancelled, failed, or answered unparsably
    virtual void record_model_failure(Direction direction, ErrorCategory reason) = 0;
};

} // namespace promptshield
