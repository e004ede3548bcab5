#include "core/features.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptshield {

namespace {

constexpr double kDetectorThreshold = 0.1;
constexpr double kToxicityThreshold = 0.5;
constexpr double kLlmCheckThreshold = 0.5;

void apply_layer(FeatureConfig& resolved, const FeatureConfig& defaults,
                 const FeatureConfig& layer, std::string_view layer_name) {
    for (const auto& [name, setting] : layer) {
        const auto def = defaults.find(name);
        if (def == defaults.end()) {
            utils::log::debug(std::format("Ignoring unknown feature '{}' ({})", name, layer_name));
            continue;
        }
        FeatureSetting effective = setting;
        if (!(setting.threshold >= 0.0 && setting.threshold <= 1.0)) {
            utils::log::warn(std::format(
                "Feature '{}' threshold {} out of range ({}), using default {}",
                name, setting.threshold, layer_name, def->second.threshold));
            effective.threshold = def->second.threshold;
        }
        resolved[name] = effective;
    }
}

} // anonymous namespace

FeatureConfig default_features(Direction direction) {
    FeatureConfig features;
    const auto add = [&features](std::string_view name, double threshold) {
        features.emplace(std::string(name), FeatureSetting{true, threshold});
    };

    add(feature::kSanitization, 0.0);
    add(feature::kPiiRedaction, 0.0);
    add(feature::kLlmCheck, kLlmCheckThreshold);

    if (direction == Direction::INBOUND) {
        add(feature::kSqlInjection, kDetectorThreshold);
        add(feature::kXss, kDetectorThreshold);
        add(feature::kCommandInjection, kDetectorThreshold);
        add(feature::kPathTraversal, kDetectorThreshold);
        add(feature::kPromptInjection, kDetectorThreshold);
    } else {
        add(feature::kOutputPiiScan, kDetectorThreshold);
        add(feature::kToxicity, kToxicityThreshold);
        add(feature::kHallucination, kDetectorThreshold);
        add(feature::kCitation, kDetectorThreshold);
        add(feature::kTone, kDetectorThreshold);
        add(feature::kRefusal, 0.0);
        add(feature::kDisclaimer, 0.0);
    }
    return features;
}

FeatureConfig resolve_features(const FeatureConfig& defaults,
                               const ApplicationPolicy* application,
                               const FeatureConfig& overrides) {
    FeatureConfig resolved = defaults;
    if (application) {
        apply_layer(resolved, defaults, application->features, "application");
    }
    apply_layer(resolved, defaults, overrides, "request");
    return resolved;
}

} // namespace promptshield
