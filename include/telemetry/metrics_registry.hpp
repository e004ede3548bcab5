#pragma once

#include "telemetry/telemetry_sink.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>

namespace promptshield {

inline constexpr size_t kThreatCategoryCount = 14;

/**
 * @brief In-process telemetry sink with Prometheus text exposition
 *
 * Counters are lock-free atomics. Stage latency aggregates live in a map
 * keyed by direction and stage name, guarded by a shared_mutex.
 */
class MetricsRegistry : public ITelemetrySink {
public:
    MetricsRegistry() = default;

    void record_verdict(const Verdict& verdict) override;
    void record_stage_latency(Direction direction, std::string_view stage,
                              std::chrono::microseconds elapsed) override;
    void record_model_failure(Direction direction, ErrorCategory reason) override;

    struct StageLatency {
        uint64_t count = 0;
        uint64_t total_us = 0;
        uint64_t max_us = 0;
    };

    struct Stats {
        std::array<uint64_t, 2> requests_total{};
        std::array<uint64_t, 2> requests_blocked{};
        std::array<uint64_t, 2> requests_rewritten{};
        uint64_t escalations = 0;
        uint64_t model_failures = 0;
        std::array<uint64_t, kThreatCategoryCount> threats_by_category{};
        std::array<uint64_t, kPiiCategoryCount> pii_by_category{};
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] StageLatency stage_latency(Direction direction, std::string_view stage) const;

    /**
     * @brief Prometheus text format (version 0.0.4)
     */
    [[nodiscard]] std::string to_prometheus() const;

private:
    std::array<std::atomic<uint64_t>, 2> requests_total_{};
    std::array<std::atomic<uint64_t>, 2> requests_blocked_{};
    std::array<std::atomic<uint64_t>, 2> requests_rewritten_{};
    std::atomic<uint64_t> escalations_{0};
    std::array<std::atomic<uint64_t>, kThreatCategoryCount> threats_{};
    std::array<std::atomic<uint64_t>, kPiiCategoryCount> pii_{};

    // Model failures by reason
    std::array<std::atomic<uint64_t>, 8> model_failures_{};

    std::map<std::string, StageLatency, std::less<>> stage_latency_;
    mutable std::shared_mutex latency_mutex_;
};

} // namespace promptshield
