#include "output/refusal_detector.hpp"

namespace promptshield {

RefusalDetector::RefusalDetector() {
    rules_.emplace_back("CANNOT", R"(\bI\s+(?:cannot|can't|am\s+unable\s+to|won't)\b)", 1.0);
    rules_.emplace_back("NO_ACCESS", R"(\bI\s+(?:don't|do\s+not)\s+have\s+(?:access|the\s+ability)\b)", 1.0);
    rules_.emplace_back("APOLOGY", R"(\b(?:sorry|apologies),?\s+(?:I|but\s+I)\s+(?:cannot|can't)\b)", 1.0);
    rules_.emplace_back("NOT_ALLOWED", R"(\bI'm\s+not\s+(?:able|allowed|permitted)\b)", 1.0);
    rules_.emplace_back("AS_AN_AI", R"(\bas\s+an\s+AI\b)", 1.0);
    rules_.emplace_back("DONT_ACTUALLY", R"(\bI\s+don't\s+actually\s+(?:have|know|provide)\b)", 1.0);
}

bool RefusalDetector::is_refusal(std::string_view text) const {
    return !match_rules(text, rules_).empty();
}

} // namespace promptshield
