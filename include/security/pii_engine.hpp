#pragma once

#include "core/types.hpp"
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Finds and redacts sensitive substrings while keeping an audit record
 *
 * Recognizers are format-validated (Luhn for cards, SSA rules for SSNs,
 * address grammar for emails, numbering-plan rules for phones). Overlapping
 * matches resolve longest-first, ties toward the earlier PiiCategory.
 * Text already inside a "[..._REDACTED]" mask is never matched, so
 * redact(redact(x).redacted_text) leaves the text unchanged.
 */
class PiiEngine {
public:
    struct Config {
        std::vector<std::string> custom_keywords;
        bool detect_generic_tokens = true;
        size_t min_generic_token_length = 32;
    };

    PiiEngine() : PiiEngine(Config{}) {}
    explicit PiiEngine(Config config);

    [[nodiscard]] PiiReport redact(std::string_view text) const;

    // Exposed for tests and for reuse by output checks
    [[nodiscard]] static bool luhn_validate(std::string_view digits);
    [[nodiscard]] static bool validate_ssn(std::string_view ssn);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Candidate {
        PiiCategory category;
        size_t offset;
        size_t length;
    };

    struct DigitGroup {
        size_t begin;
        size_t end;
    };

    void find_ssns(std::string_view text, std::vector<Candidate>& out) const;
    void find_credit_cards(std::string_view text, std::vector<Candidate>& out) const;
    static void find_cards_in_run(std::string_view text, const std::vector<DigitGroup>& groups,
                                  std::vector<Candidate>& out);
    void find_emails(std::string_view text, std::vector<Candidate>& out) const;
    void find_phones(std::string_view text, std::vector<Candidate>& out) const;
    void find_credentials(std::string_view text, std::vector<Candidate>& out) const;
    void find_keywords(std::string_view text, std::vector<Candidate>& out) const;

    Config config_;

    // Compiled once (std::regex is expensive to construct)
    std::regex ssn_regex_;
    std::regex email_regex_;
    std::regex phone_regex_;
    std::regex e164_regex_;
    std::regex credential_assignment_regex_;
    std::regex bearer_regex_;
    std::regex vendor_key_regex_;
    std::regex generic_token_regex_;
};

} // namespace promptshield
