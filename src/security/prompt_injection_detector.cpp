#include "security/prompt_injection_detector.hpp"
#include "core/text.hpp"

#include <algorithm>
#include <utility>

namespace promptshield {

PromptInjectionDetector::PromptInjectionDetector(const Config& config)
    : config_(config) {
    const double w = config_.phrase_weight;

    // Instruction override
    override_rules_.emplace_back("IGNORE_INSTRUCTIONS",
        R"(\b(?:ignore|disregard|forget|override|bypass)\s+(?:(?:all|any|the|your|my|these|those)\s+)*(?:previous|prior|above|earlier|preceding|system|original)\s+(?:instructions?|prompts?|rules|directions|directives|guidelines|context)\b)",
        w);
    override_rules_.emplace_back("REVEAL_SYSTEM_PROMPT",
        R"(\b(?:reveal|show|print|repeat|output|display|leak)\s+(?:me\s+)?(?:(?:your|the)\s+)?(?:system\s+prompt|hidden\s+instructions|initial\s+instructions|original\s+prompt)\b)",
        w);
    override_rules_.emplace_back("NEW_INSTRUCTIONS",
        R"(\b(?:new|updated|real)\s+instructions\s*:)", w);
    override_rules_.emplace_back("ROLE_MARKER",
        R"(\[\s*(?:system|admin)\s*\]|<\|im_start\|>|###\s*(?:system|instruction)\b)", w);

    // Persona jailbreak
    persona_rules_.emplace_back("DAN", R"(\bDAN\b)", w, false);
    persona_rules_.emplace_back("DEVELOPER_MODE", R"(\bdeveloper\s+mode\b)", w);
    persona_rules_.emplace_back("JAILBREAK", R"(\bjailbr(?:eak|oken)(?:ed|ing)?\b)", w);
    persona_rules_.emplace_back("DO_ANYTHING_NOW", R"(\bdo\s+anything\s+now\b)", w);
    persona_rules_.emplace_back("NO_RESTRICTIONS",
        R"(\b(?:without|no|free\s+of)\s+(?:any\s+)?(?:restrictions|filters|limitations|guidelines|censorship)\b)",
        w);
    persona_rules_.emplace_back("PRETEND_TO_BE",
        R"(\b(?:pretend|imagine)\s+(?:to\s+be|you\s+are|that\s+you\s+are)\b)", w);
}

std::vector<ThreatFinding> PromptInjectionDetector::detect(const DetectionInput& input) const {
    const auto overrides = match_rules(input.decoded, override_rules_);
    const auto personas = match_rules(input.decoded, persona_rules_);
    if (overrides.empty() && personas.empty()) {
        return {};
    }

    std::vector<RuleMatch> all = overrides;
    all.insert(all.end(), personas.begin(), personas.end());

    ThreatFinding finding;
    finding.detector = std::string(name());
    finding.category = personas.size() > overrides.size()
        ? ThreatCategory::JAILBREAK
        : ThreatCategory::PROMPT_INJECTION;
    for (const auto& m : all) {
        finding.confidence = text::combine_confidence(finding.confidence, m.rule->weight);
        if (!finding.pattern_id.empty()) finding.pattern_id += ',';
        finding.pattern_id += m.rule->id;
    }
    finding.confidence = std::clamp(finding.confidence, 0.0, 1.0);

    const auto first = std::ranges::min_element(all, {}, &RuleMatch::offset);
    finding.evidence = make_evidence(input.decoded, first->offset, first->length);
    return {std::move(finding)};
}

} // namespace promptshield
