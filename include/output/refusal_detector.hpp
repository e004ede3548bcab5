#pragma once

#include "security/threat_detector.hpp"
#include <vector>

namespace promptshield {

/**
 * @brief Flags responses that refuse a request the inbound pipeline already
 * allowed. Informational only: never contributes to the score.
 */
class RefusalDetector {
public:
    RefusalDetector();

    [[nodiscard]] bool is_refusal(std::string_view text) const;

private:
    std::vector<PatternRule> rules_;
};

} // namespace promptshield
