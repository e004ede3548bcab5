#include "security/threat_detector.hpp"
#include "core/text.hpp"

namespace promptshield {

std::vector<RuleMatch> match_rules(std::string_view text, const std::vector<PatternRule>& rules) {
    std::vector<RuleMatch> matches;
    std::cmatch m;
    for (const auto& rule : rules) {
        if (std::regex_search(text.data(), text.data() + text.size(), m, rule.pattern)) {
            matches.push_back({&rule, static_cast<size_t>(m.position(0)),
                               static_cast<size_t>(m.length(0))});
        }
    }
    return matches;
}

std::string make_evidence(std::string_view text, size_t offset, size_t length) {
    return text::excerpt(text, offset, length, kMaxEvidenceBytes);
}

} // namespace promptshield
