#include "core/verdict_serializer.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptshield {

namespace {

std::string optional_string(const std::optional<std::string>& value) {
    if (!value) return "null";
    return std::format("\"{}\"", utils::escape_json(*value));
}

} // anonymous namespace

std::string verdict_to_json(const Verdict& verdict) {
    std::string json = std::format(
        R"({{"direction":"{}","security_score":{:.4f},"is_blocked":{},"block_reason":{},)",
        direction_to_string(verdict.direction),
        verdict.security_score,
        utils::booltostr(verdict.is_blocked),
        optional_string(verdict.block_reason));

    json += "\"threats\":[";
    for (size_t i = 0; i < verdict.threats.size(); ++i) {
        const auto& t = verdict.threats[i];
        if (i > 0) json += ',';
        json += std::format(
            R"({{"detector":"{}","category":"{}","confidence":{:.4f},"pattern_id":"{}","evidence":{},"hard_block":{}}})",
            utils::escape_json(t.detector),
            threat_category_to_string(t.category),
            t.confidence,
            utils::escape_json(t.pattern_id),
            optional_string(t.evidence),
            utils::booltostr(t.hard_block));
    }

    json += "],\"pii\":[";
    for (size_t i = 0; i < verdict.pii.size(); ++i) {
        const auto& p = verdict.pii[i];
        if (i > 0) json += ',';
        json += std::format(
            R"({{"category":"{}","offset":{},"length":{},"mask":"{}","fingerprint":"{}"}})",
            pii_category_to_string(p.category), p.offset, p.length,
            utils::escape_json(p.mask), utils::escape_json(p.fingerprint));
    }

    json += std::format(
        R"(],"sanitized_text":"{}","redacted_text":"{}","final_text":"{}","warnings":[)",
        utils::escape_json(verdict.sanitized_text),
        utils::escape_json(verdict.redacted_text),
        utils::escape_json(verdict.final_text));
    for (size_t i = 0; i < verdict.warnings.size(); ++i) {
        if (i > 0) json += ',';
        json += std::format("\"{}\"", utils::escape_json(verdict.warnings[i]));
    }

    json += std::format(
        R"(],"escalated":{},"model_stage_ran":{},"remediation":"{}","disclaimer":{},"false_refusal":{}}})",
        utils::booltostr(verdict.escalated),
        utils::booltostr(verdict.model_stage_ran),
        remediation_to_string(verdict.remediation),
        optional_string(verdict.disclaimer),
        utils::booltostr(verdict.false_refusal));
    return json;
}

} // namespace promptshield
