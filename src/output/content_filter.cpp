#include "output/content_filter.hpp"

#include <utility>

namespace promptshield {

ContentFilter::ContentFilter(const Config& config)
    : config_(config) {
    ClassRules harmful{ContentClass::HARMFUL, "HARMFUL", config_.harmful_confidence, {}};
    harmful.rules.emplace_back("HARM_PERSON",
        R"(\b(?:kill|murder|harm|hurt|poison)\s+(?:yourself|someone|people|him|her|them)\b)", 1.0);
    harmful.rules.emplace_back("BUILD_WEAPON",
        R"(\b(?:make|create|build|assemble)\s+(?:an?\s+)?(?:bomb|weapon|explosive|pipe\s+bomb)s?\b)", 1.0);
    harmful.rules.emplace_back("INTRUSION_HOWTO",
        R"(\b(?:how\s+to|instructions\s+for|steps\s+to)\s+(?:hack|steal|break\s+into)\b)", 1.0);

    ClassRules inappropriate{ContentClass::INAPPROPRIATE, "INAPPROPRIATE",
                             config_.inappropriate_confidence, {}};
    inappropriate.rules.emplace_back("ADULT", R"(\b(?:explicit|adult|nsfw)\b)", 1.0);
    inappropriate.rules.emplace_back("PROFANITY", R"(profanity|obscene|vulgar)", 1.0);

    ClassRules sensitive{ContentClass::SENSITIVE, "SENSITIVE", config_.sensitive_confidence, {}};
    sensitive.rules.emplace_back("CONTROVERSIAL", R"(\b(?:political|religious|controversial)\b)", 1.0);
    sensitive.rules.emplace_back("SELF_HARM", R"(\b(?:suicide|self-harm|depression)\b)", 1.0);

    classes_.push_back(std::move(harmful));
    classes_.push_back(std::move(inappropriate));
    classes_.push_back(std::move(sensitive));
}

ContentFilter::Action ContentFilter::action_for(ModerationMode mode, ContentClass content) {
    switch (mode) {
        case ModerationMode::STRICT:
            return Action::BLOCK;
        case ModerationMode::MODERATE:
            if (content == ContentClass::HARMFUL) return Action::BLOCK;
            return content == ContentClass::INAPPROPRIATE ? Action::WARN : Action::ALLOW;
        case ModerationMode::RELAXED:
            return content == ContentClass::HARMFUL ? Action::BLOCK : Action::ALLOW;
        case ModerationMode::RAW:
            return Action::ALLOW;
    }
    return Action::ALLOW;
}

std::vector<ThreatFinding> ContentFilter::detect(const DetectionInput& input) const {
    std::vector<ThreatFinding> findings;
    if (config_.mode == ModerationMode::RAW) {
        return findings;
    }

    for (const auto& cls : classes_) {
        const auto action = action_for(config_.mode, cls.content);
        if (action == Action::ALLOW) continue;

        const auto matches = match_rules(input.decoded, cls.rules);
        if (matches.empty()) continue;

        ThreatFinding finding;
        finding.detector = std::string(name());
        finding.category = ThreatCategory::TOXICITY;
        finding.confidence = cls.confidence;
        finding.pattern_id = std::string(cls.id) + ":" + matches.front().rule->id;
        finding.hard_block = action == Action::BLOCK;
        finding.evidence = make_evidence(input.decoded, matches.front().offset,
                                         matches.front().length);
        findings.push_back(std::move(finding));
    }
    return findings;
}

} // namespace promptshield
