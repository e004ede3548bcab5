#include "output/hallucination_checker.hpp"
#include "core/text.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace promptshield {

HallucinationChecker::HallucinationChecker(const Config& config)
    : config_(config),
      number_regex_(R"(\b\d+(?:[.,]\d+)*%?)"),
      quote_regex_(R"re("([^"\n]{4,200})")re") {}

std::vector<HallucinationChecker::Claim>
HallucinationChecker::extract_claims(std::string_view text) const {
    std::vector<Claim> claims;
    const char* const begin = text.data();
    const char* const end = text.data() + text.size();

    for (auto it = std::cregex_iterator(begin, end, quote_regex_);
         it != std::cregex_iterator(); ++it) {
        claims.push_back({it->str(1), static_cast<size_t>(it->position(1))});
    }

    // Numbers already inside a quoted claim are covered by that claim
    for (auto it = std::cregex_iterator(begin, end, number_regex_);
         it != std::cregex_iterator(); ++it) {
        const auto offset = static_cast<size_t>(it->position(0));
        const bool inside_quote = std::ranges::any_of(claims, [&](const Claim& c) {
            return offset >= c.offset && offset < c.offset + c.value.size();
        });
        if (!inside_quote) {
            claims.push_back({it->str(0), offset});
        }
    }

    std::ranges::sort(claims, {}, &Claim::offset);
    return claims;
}

std::vector<ThreatFinding> HallucinationChecker::detect(const DetectionInput& input) const {
    if (input.request == nullptr || input.request->source_facts.empty()) {
        return {};
    }

    const auto claims = extract_claims(input.decoded);
    if (claims.size() < config_.min_claims) {
        return {};
    }

    std::vector<const Claim*> unsupported;
    for (const auto& claim : claims) {
        const bool supported = std::ranges::any_of(input.request->source_facts,
            [&](const std::string& fact) { return text::contains_ci(fact, claim.value); });
        if (!supported) unsupported.push_back(&claim);
    }
    if (unsupported.empty()) {
        return {};
    }

    const double ratio = static_cast<double>(unsupported.size()) /
                         static_cast<double>(claims.size());

    ThreatFinding finding;
    finding.detector = std::string(name());
    finding.category = ThreatCategory::HALLUCINATION;
    finding.confidence = std::clamp(config_.weight * ratio, 0.0, 1.0);
    finding.pattern_id = std::format("UNSUPPORTED_CLAIMS:{}/{}", unsupported.size(), claims.size());
    finding.evidence = make_evidence(input.decoded, unsupported.front()->offset,
                                     unsupported.front()->value.size());
    return {std::move(finding)};
}

} // namespace promptshield
