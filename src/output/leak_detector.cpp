#include "output/leak_detector.hpp"
#include "core/masking.hpp"
#include "core/text.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace promptshield {

LeakDetector::LeakDetector(const Config& config)
    : config_(config),
      ipv4_regex_(R"(\b(?:(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\.){3}(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\b)") {}

double LeakDetector::severity_for(PiiCategory category) const {
    switch (category) {
        case PiiCategory::SSN:
        case PiiCategory::CREDIT_CARD:
        case PiiCategory::CREDENTIAL:
            return config_.high_severity;
        case PiiCategory::EMAIL:
        case PiiCategory::PHONE:
        case PiiCategory::KEYWORD:
            return config_.medium_severity;
    }
    return config_.medium_severity;
}

std::vector<ThreatFinding> LeakDetector::detect(const DetectionInput& input) const {
    std::vector<ThreatFinding> findings;

    const auto make_finding = [&](std::string pattern_id, double confidence) {
        ThreatFinding finding;
        finding.detector = std::string(name());
        finding.category = ThreatCategory::DATA_LEAK;
        finding.confidence = confidence;
        finding.pattern_id = std::move(pattern_id);
        return finding;
    };

    // Protected phrases: never echo the phrase itself as evidence
    if (input.request != nullptr) {
        for (const auto& phrase : input.request->protected_phrases) {
            if (phrase.empty() || !text::contains_ci(input.decoded, phrase)) continue;
            auto finding = make_finding("PROTECTED_PHRASE", 1.0);
            finding.hard_block = true;
            finding.evidence = MaskingEngine::hash_value(phrase);
            findings.push_back(std::move(finding));
            break;
        }
    }

    if (input.pii != nullptr) {
        for (size_t i = 0; i < kPiiCategoryCount; ++i) {
            const auto count = input.pii->category_counts[i];
            if (count == 0) continue;
            const auto category = static_cast<PiiCategory>(i);
            auto finding = make_finding(
                std::format("PII_{}", pii_category_to_string(category)), severity_for(category));
            finding.evidence = std::format("{} x{}", MaskingEngine::mask_for(category), count);
            findings.push_back(std::move(finding));
        }
    }

    std::cmatch m;
    const char* const begin = input.decoded.data();
    if (std::regex_search(begin, begin + input.decoded.size(), m, ipv4_regex_)) {
        auto finding = make_finding("IPV4_ADDRESS", config_.low_severity);
        finding.evidence = make_evidence(input.decoded, static_cast<size_t>(m.position(0)),
                                         static_cast<size_t>(m.length(0)));
        findings.push_back(std::move(finding));
    }

    if (!findings.empty()) {
        utils::log::debug(std::format("leak_detector: {} output leak finding(s)", findings.size()));
    }
    return findings;
}

} // namespace promptshield
