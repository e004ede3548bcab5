#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Detects medical, financial or legal advice and supplies the
 * matching disclaimer. Two or more keyword hits in one domain trigger it;
 * domains are checked in that order.
 */
class DisclaimerInjector {
public:
    enum class AdviceType : uint8_t { MEDICAL, FINANCIAL, LEGAL };

    struct Config {
        size_t min_keyword_hits = 2;
        std::string medical_disclaimer =
            "Medical Disclaimer: This information is for educational purposes only and is "
            "not medical advice. Please consult a licensed healthcare professional for "
            "medical concerns.";
        std::string financial_disclaimer =
            "Financial Disclaimer: This is not financial advice. Consult a certified "
            "financial advisor before making investment decisions.";
        std::string legal_disclaimer =
            "Legal Disclaimer: This is not legal advice. Consult a qualified attorney for "
            "legal matters.";
    };

    DisclaimerInjector() : DisclaimerInjector(Config{}) {}
    explicit DisclaimerInjector(Config config);

    [[nodiscard]] std::optional<AdviceType> detect_advice_type(std::string_view text) const;

    [[nodiscard]] const std::string& disclaimer_for(AdviceType type) const;

    /**
     * @brief Disclaimer text to append, if any
     */
    [[nodiscard]] std::optional<std::string> disclaimer(std::string_view text) const;

    [[nodiscard]] static const char* advice_type_to_string(AdviceType type);

private:
    Config config_;
};

} // namespace promptshield
