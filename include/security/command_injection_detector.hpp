#pragma once

#include "security/threat_detector.hpp"
#include <regex>
#include <vector>

namespace promptshield {

/**
 * @brief Shell command injection detector
 *
 * Levels (highest wins, one finding per input):
 *   METACHARACTER          ; | && || ` $( ${ on their own           0.3
 *   CHAINED_COMMAND        metacharacter directly before a command    0.85
 *   DESTRUCTIVE_COMMAND    rm -rf, mkfs, dd if=, shutdown, fork bomb
 *                          with a metacharacter: 0.95 + hard block,
 *                          without: 0.5
 */
class CommandInjectionDetector : public IThreatDetector {
public:
    struct Config {
        double metacharacter_confidence = 0.3;
        double chained_command_confidence = 0.85;
        double destructive_confidence = 0.95;
        double destructive_alone_confidence = 0.5;
    };

    CommandInjectionDetector() : CommandInjectionDetector(Config{}) {}
    explicit CommandInjectionDetector(const Config& config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "command_injection_detector"; }
    [[nodiscard]] std::string_view feature() const override { return "command_injection"; }

private:
    Config config_;
    std::regex metacharacter_regex_;
    std::regex chained_command_regex_;
    std::regex destructive_regex_;
};

} // namespace promptshield
