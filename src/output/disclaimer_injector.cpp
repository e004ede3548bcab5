#include "output/disclaimer_injector.hpp"
#include "core/text.hpp"

#include <array>
#include <utility>

namespace promptshield {

namespace {

// Stems, matched as case-insensitive substrings ("diagnos" covers diagnosis/diagnose)
constexpr std::array<std::string_view, 13> kMedicalKeywords = {
    "diagnos", "treatment", "medication", "symptom", "disease", "prescription",
    "medical", "health", "doctor", "therapy", "cure", "condition", "illness"
};

constexpr std::array<std::string_view, 13> kFinancialKeywords = {
    "invest", "stock", "trading", "financial advice", "portfolio", "tax",
    "return on investment", "roi", "dividend", "crypto", "bitcoin", "retirement", "savings"
};

constexpr std::array<std::string_view, 10> kLegalKeywords = {
    "legal", "lawsuit", "contract", "attorney", "law", "court", "regulation",
    "compliance", "liability", "rights"
};

template <size_t N>
size_t count_hits(std::string_view body, const std::array<std::string_view, N>& keywords) {
    size_t hits = 0;
    for (const auto kw : keywords) {
        if (text::contains_ci(body, kw)) ++hits;
    }
    return hits;
}

} // anonymous namespace

DisclaimerInjector::DisclaimerInjector(Config config)
    : config_(std::move(config)) {}

std::optional<DisclaimerInjector::AdviceType>
DisclaimerInjector::detect_advice_type(std::string_view body) const {
    if (count_hits(body, kMedicalKeywords) >= config_.min_keyword_hits) return AdviceType::MEDICAL;
    if (count_hits(body, kFinancialKeywords) >= config_.min_keyword_hits) return AdviceType::FINANCIAL;
    if (count_hits(body, kLegalKeywords) >= config_.min_keyword_hits) return AdviceType::LEGAL;
    return std::nullopt;
}

const std::string& DisclaimerInjector::disclaimer_for(AdviceType type) const {
    switch (type) {
        case AdviceType::MEDICAL: return config_.medical_disclaimer;
        case AdviceType::FINANCIAL: return config_.financial_disclaimer;
        case AdviceType::LEGAL: return config_.legal_disclaimer;
    }
    return config_.legal_disclaimer;
}

std::optional<std::string> DisclaimerInjector::disclaimer(std::string_view body) const {
    const auto type = detect_advice_type(body);
    if (!type) {
        return std::nullopt;
    }
    return disclaimer_for(*type);
}

const char* DisclaimerInjector::advice_type_to_string(AdviceType type) {
    switch (type) {
        case AdviceType::MEDICAL: return "medical";
        case AdviceType::FINANCIAL: return "financial";
        case AdviceType::LEGAL: return "legal";
        default: return "unknown";
    }
}

} // namespace promptshield
