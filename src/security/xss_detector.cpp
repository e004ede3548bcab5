#include "security/xss_detector.hpp"
#include "core/text.hpp"

#include <algorithm>
#include <utility>

namespace promptshield {

XssDetector::XssDetector(const Config& config)
    : config_(config) {
    rules_.emplace_back("SCRIPT_TAG", R"(<script\b)", 0.6);
    rules_.emplace_back("SCRIPT_CLOSE", R"(</script\s*>)", 0.3);
    rules_.emplace_back("SCRIPT_URI", R"(\b(?:javascript|vbscript)\s*:)", 0.5);
    rules_.emplace_back("DATA_URI", R"(\bdata:text/html)", 0.5);
    rules_.emplace_back("EVENT_HANDLER",
        R"(\bon(?:error|load|click|dblclick|mouseover|mouseout|mouseenter|focus|blur|submit|change|input|keydown|keyup|keypress|toggle|animationstart|pointerover)\s*=)",
        0.5);
    rules_.emplace_back("EMBED_TAG", R"(<(?:iframe|object|embed|svg|applet|base)\b)", 0.4);
    rules_.emplace_back("IMG_SRC", R"(<img\b[^>]*\bsrc\s*=)", 0.2);
    rules_.emplace_back("DOM_SINK",
        R"(\b(?:eval|settimeout|setinterval)\s*\(|\bdocument\.(?:cookie|write|domain)\b|\.innerhtml\s*=|\bexpression\s*\()",
        0.35);
}

std::vector<ThreatFinding> XssDetector::detect(const DetectionInput& input) const {
    const auto matches = match_rules(input.decoded, rules_);
    if (matches.empty()) {
        return {};
    }

    ThreatFinding finding;
    finding.detector = std::string(name());
    finding.category = ThreatCategory::XSS;
    for (const auto& m : matches) {
        finding.confidence = text::combine_confidence(finding.confidence, m.rule->weight);
        if (!finding.pattern_id.empty()) finding.pattern_id += ',';
        finding.pattern_id += m.rule->id;
    }
    if (input.sanitization != nullptr && input.sanitization->markup_escaped) {
        finding.confidence = text::combine_confidence(finding.confidence,
                                                      config_.markup_escaped_weight);
        finding.pattern_id += ",MARKUP_ESCAPED";
    }
    finding.confidence = std::clamp(finding.confidence, 0.0, 1.0);

    const auto first = std::ranges::min_element(matches, {}, &RuleMatch::offset);
    finding.evidence = make_evidence(input.decoded, first->offset, first->length);
    return {std::move(finding)};
}

} // namespace promptshield
