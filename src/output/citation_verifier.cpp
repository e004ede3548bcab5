#include "output/citation_verifier.hpp"
#include "core/text.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace promptshield {

CitationVerifier::CitationVerifier(Config config)
    : config_(std::move(config)),
      url_regex_(R"(https?://[^\s<>"')\]]+)", std::regex::ECMAScript | std::regex::icase),
      doi_regex_(R"(\b10\.\d{4,}/\S+)"),
      arxiv_regex_(R"(\barxiv:\d{4}\.\d{4,5})", std::regex::ECMAScript | std::regex::icase) {}

std::vector<ThreatFinding> CitationVerifier::detect(const DetectionInput& input) const {
    const std::string_view body = input.decoded;
    const char* const begin = body.data();
    const char* const end = body.data() + body.size();

    ThreatFinding finding;
    finding.detector = std::string(name());
    finding.category = ThreatCategory::UNVERIFIED_CITATION;

    std::optional<std::pair<size_t, size_t>> evidence_span;
    const auto add_signal = [&](const char* id, double weight, size_t offset, size_t length) {
        if (finding.pattern_id.find(id) != std::string::npos) return;
        finding.confidence = text::combine_confidence(finding.confidence, weight);
        if (!finding.pattern_id.empty()) finding.pattern_id += ',';
        finding.pattern_id += id;
        if (!evidence_span) evidence_span.emplace(offset, length);
    };

    const bool have_sources = input.request != nullptr && !input.request->source_facts.empty();
    bool has_citation = false;

    for (auto it = std::cregex_iterator(begin, end, url_regex_);
         it != std::cregex_iterator(); ++it) {
        has_citation = true;
        const std::string url = it->str(0);
        const auto offset = static_cast<size_t>(it->position(0));

        const bool suspicious = std::ranges::any_of(config_.suspicious_domains,
            [&](const std::string& domain) { return text::contains_ci(url, domain); });
        if (suspicious) {
            add_signal("SUSPICIOUS_DOMAIN", config_.suspicious_domain_weight, offset, url.size());
        }

        if (have_sources) {
            const bool sourced = std::ranges::any_of(input.request->source_facts,
                [&](const std::string& fact) { return text::contains_ci(fact, url); });
            if (!sourced) {
                add_signal("UNSOURCED_URL", config_.unsourced_url_weight, offset, url.size());
            }
        }
    }

    std::cmatch m;
    if (std::regex_search(begin, end, m, doi_regex_) ||
        std::regex_search(begin, end, m, arxiv_regex_)) {
        has_citation = true;
    }

    if (!has_citation) {
        for (const auto& phrase : config_.vague_phrases) {
            const size_t pos = text::find_ci(body, phrase);
            if (pos != std::string_view::npos) {
                add_signal("VAGUE_CLAIM", config_.vague_claim_weight, pos, phrase.size());
                break;
            }
        }
    }

    if (finding.pattern_id.empty()) {
        return {};
    }
    finding.evidence = make_evidence(body, evidence_span->first, evidence_span->second);
    return {std::move(finding)};
}

} // namespace promptshield
