#pragma once

#include "security/threat_detector.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Lexical brand-tone check
 *
 * Counts tone markers for professional, casual, technical and friendly
 * registers. The dominant tone must have at least min_markers hits; when it
 * differs from the desired tone and the desired tone has no markers at all,
 * a tone-violation finding is reported. Skipped when no tone is requested.
 */
class ToneChecker : public IThreatDetector {
public:
    enum class Tone : uint8_t { PROFESSIONAL, CASUAL, TECHNICAL, FRIENDLY };

    struct Config {
        std::string default_tone;
        size_t min_markers = 2;
        double base_confidence = 0.3;
        double per_marker = 0.05;
        double max_confidence = 0.6;
    };

    ToneChecker() : ToneChecker(Config{}) {}
    explicit ToneChecker(Config config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "tone_checker"; }
    [[nodiscard]] std::string_view feature() const override { return "tone"; }

    [[nodiscard]] static std::optional<Tone> tone_from_string(std::string_view name);
    [[nodiscard]] static const char* tone_to_string(Tone tone);

    /**
     * @brief Marker hit counts indexed by Tone
     */
    [[nodiscard]] static std::array<size_t, 4> count_markers(std::string_view body);

private:
    Config config_;
};

} // namespace promptshield
