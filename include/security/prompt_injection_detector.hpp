#pragma once

#include "security/threat_detector.hpp"
#include <vector>

namespace promptshield {

/**
 * @brief Instruction-override and persona-jailbreak phrase detector
 *
 * Every matched phrase adds phrase_weight by noisy-OR, so a single phrase
 * lands between the suspicion floor and the block threshold while two or
 * more co-occurring phrases reach the block band. The finding is reported
 * as JAILBREAK when persona phrases outnumber override phrases.
 */
class PromptInjectionDetector : public IThreatDetector {
public:
    struct Config {
        double phrase_weight = 0.5;
    };

    PromptInjectionDetector() : PromptInjectionDetector(Config{}) {}
    explicit PromptInjectionDetector(const Config& config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "prompt_injection_detector"; }
    [[nodiscard]] std::string_view feature() const override { return "prompt_injection"; }

private:
    Config config_;
    std::vector<PatternRule> override_rules_;
    std::vector<PatternRule> persona_rules_;
};

} // namespace promptshield
