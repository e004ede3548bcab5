#include "telemetry/metrics_registry.hpp"

#include <format>
#include <mutex>
#include <utility>

namespace promptshield {

namespace {

size_t index_of(Direction direction) { return std::to_underlying(direction); }

std::string latency_key(Direction direction, std::string_view stage) {
    return std::format("{}/{}", direction_to_string(direction), stage);
}

} // anonymous namespace

// ============================================================================
// Recording
// ============================================================================

void MetricsRegistry::record_verdict(const Verdict& verdict) {
    const size_t dir = index_of(verdict.direction);
    requests_total_[dir].fetch_add(1, std::memory_order_relaxed);
    if (verdict.is_blocked) {
        requests_blocked_[dir].fetch_add(1, std::memory_order_relaxed);
    }
    if (verdict.remediation == RemediationAction::REWRITE) {
        requests_rewritten_[dir].fetch_add(1, std::memory_order_relaxed);
    }
    if (verdict.escalated) {
        escalations_.fetch_add(1, std::memory_order_relaxed);
    }
    for (const auto& t : verdict.threats) {
        threats_[std::to_underlying(t.category)].fetch_add(1, std::memory_order_relaxed);
    }
    for (const auto& p : verdict.pii) {
        pii_[std::to_underlying(p.category)].fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsRegistry::record_stage_latency(Direction direction, std::string_view stage,
                                           std::chrono::microseconds elapsed) {
    const auto us = static_cast<uint64_t>(elapsed.count());
    std::unique_lock lock(latency_mutex_);
    auto& entry = stage_latency_[latency_key(direction, stage)];
    ++entry.count;
    entry.total_us += us;
    if (us > entry.max_us) entry.max_us = us;
}

void MetricsRegistry::record_model_failure(Direction /*direction*/, ErrorCategory reason) {
    const auto idx = static_cast<size_t>(std::to_underlying(reason));
    if (idx < model_failures_.size()) {
        model_failures_[idx].fetch_add(1, std::memory_order_relaxed);
    }
}

// ============================================================================
// Snapshots
// ============================================================================

MetricsRegistry::Stats MetricsRegistry::get_stats() const {
    Stats stats;
    for (size_t i = 0; i < 2; ++i) {
        stats.requests_total[i] = requests_total_[i].load(std::memory_order_relaxed);
        stats.requests_blocked[i] = requests_blocked_[i].load(std::memory_order_relaxed);
        stats.requests_rewritten[i] = requests_rewritten_[i].load(std::memory_order_relaxed);
    }
    stats.escalations = escalations_.load(std::memory_order_relaxed);
    for (const auto& f : model_failures_) {
        stats.model_failures += f.load(std::memory_order_relaxed);
    }
    for (size_t i = 0; i < kThreatCategoryCount; ++i) {
        stats.threats_by_category[i] = threats_[i].load(std::memory_order_relaxed);
    }
    for (size_t i = 0; i < kPiiCategoryCount; ++i) {
        stats.pii_by_category[i] = pii_[i].load(std::memory_order_relaxed);
    }
    return stats;
}

MetricsRegistry::StageLatency MetricsRegistry::stage_latency(Direction direction,
                                                             std::string_view stage) const {
    std::shared_lock lock(latency_mutex_);
    const auto it = stage_latency_.find(latency_key(direction, stage));
    return it != stage_latency_.end() ? it->second : StageLatency{};
}

// ============================================================================
// Prometheus Exposition
// ============================================================================

std::string MetricsRegistry::to_prometheus() const {
    const auto stats = get_stats();
    std::string output;

    output += "# HELP prompt_shield_requests_total Total number of texts analyzed\n"
              "# TYPE prompt_shield_requests_total counter\n";
    for (const auto dir : {Direction::INBOUND, Direction::OUTBOUND}) {
        const size_t i = index_of(dir);
        const uint64_t blocked = stats.requests_blocked[i];
        const uint64_t rewritten = stats.requests_rewritten[i];
        const uint64_t total = stats.requests_total[i];
        const uint64_t passed = total > blocked + rewritten ? total - blocked - rewritten : 0;
        output += std::format(
            "prompt_shield_requests_total{{direction=\"{0}\",status=\"passed\"}} {1}\n"
            "prompt_shield_requests_total{{direction=\"{0}\",status=\"blocked\"}} {2}\n"
            "prompt_shield_requests_total{{direction=\"{0}\",status=\"rewritten\"}} {3}\n",
            direction_to_string(dir), passed, blocked, rewritten);
    }
    output += '\n';

    output += "# HELP prompt_shield_threats_total Threat findings by category\n"
              "# TYPE prompt_shield_threats_total counter\n";
    for (size_t i = 0; i < kThreatCategoryCount; ++i) {
        if (stats.threats_by_category[i] == 0) continue;
        output += std::format("prompt_shield_threats_total{{category=\"{}\"}} {}\n",
                              threat_category_to_string(static_cast<ThreatCategory>(i)),
                              stats.threats_by_category[i]);
    }
    output += '\n';

    output += "# HELP prompt_shield_pii_findings_total PII findings by category\n"
              "# TYPE prompt_shield_pii_findings_total counter\n";
    for (size_t i = 0; i < kPiiCategoryCount; ++i) {
        if (stats.pii_by_category[i] == 0) continue;
        output += std::format("prompt_shield_pii_findings_total{{category=\"{}\"}} {}\n",
                              pii_category_to_string(static_cast<PiiCategory>(i)),
                              stats.pii_by_category[i]);
    }
    output += '\n';

    output += std::format(
        "# HELP prompt_shield_escalations_total Runs escalated to the model check\n"
        "# TYPE prompt_shield_escalations_total counter\n"
        "prompt_shield_escalations_total {}\n\n",
        stats.escalations);

    output += "# HELP prompt_shield_model_failures_total Model check failures by reason\n"
              "# TYPE prompt_shield_model_failures_total counter\n";
    for (size_t i = 0; i < model_failures_.size(); ++i) {
        const uint64_t n = model_failures_[i].load(std::memory_order_relaxed);
        if (n == 0) continue;
        output += std::format("prompt_shield_model_failures_total{{reason=\"{}\"}} {}\n",
                              error_category_to_string(static_cast<ErrorCategory>(i)), n);
    }
    output += '\n';

    output += "# HELP prompt_shield_stage_latency_microseconds Stage latency\n"
              "# TYPE prompt_shield_stage_latency_microseconds summary\n";
    std::shared_lock lock(latency_mutex_);
    for (const auto& [key, entry] : stage_latency_) {
        const size_t slash = key.find('/');
        const std::string_view dir = std::string_view(key).substr(0, slash);
        const std::string_view stage = std::string_view(key).substr(slash + 1);
        output += std::format(
            "prompt_shield_stage_latency_microseconds_sum{{direction=\"{0}\",stage=\"{1}\"}} {2}\n"
            "prompt_shield_stage_latency_microseconds_count{{direction=\"{0}\",stage=\"{1}\"}} {3}\n"
            "prompt_shield_stage_latency_microseconds_max{{direction=\"{0}\",stage=\"{1}\"}} {4}\n",
            dir, stage, entry.total_us, entry.count, entry.max_us);
    }
    return output;
}

} // namespace promptshield
