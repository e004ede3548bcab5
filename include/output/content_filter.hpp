#pragma once

#include "security/threat_detector.hpp"
#include <vector>

namespace promptshield {

/**
 * @brief Toxicity filter for model output
 *
 * Three pattern classes, each mapped to an action by the moderation mode:
 *
 *   mode       harmful  inappropriate  sensitive
 *   strict     block    block          block
 *   moderate   block    warn           allow
 *   relaxed    block    allow          allow
 *   raw        allow    allow          allow
 *
 * block -> finding with hard_block, warn -> finding, allow -> dropped.
 */
class ContentFilter : public IThreatDetector {
public:
    enum class ContentClass : uint8_t { HARMFUL, INAPPROPRIATE, SENSITIVE };
    enum class Action : uint8_t { ALLOW, WARN, BLOCK };

    struct Config {
        ModerationMode mode = ModerationMode::MODERATE;
        double harmful_confidence = 0.8;
        double inappropriate_confidence = 0.7;
        double sensitive_confidence = 0.6;
    };

    ContentFilter() : ContentFilter(Config{}) {}
    explicit ContentFilter(const Config& config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "content_filter"; }
    [[nodiscard]] std::string_view feature() const override { return "toxicity"; }

    [[nodiscard]] static Action action_for(ModerationMode mode, ContentClass content);

private:
    struct ClassRules {
        ContentClass content;
        const char* id;
        double confidence;
        std::vector<PatternRule> rules;
    };

    Config config_;
    std::vector<ClassRules> classes_;
};

} // namespace promptshield
