#include "security/pii_engine.hpp"
#include "core/masking.hpp"
#include "core/text.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace promptshield {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_alnum(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Character before/after a match must not extend it
bool bounded(std::string_view text, size_t offset, size_t length, bool (*extends)(char)) {
    if (offset > 0 && extends(text[offset - 1])) return false;
    const size_t end = offset + length;
    return end >= text.size() || !extends(text[end]);
}

bool extends_ssn(char c) { return is_alnum(c) || c == '-'; }
bool extends_number(char c) { return is_digit(c); }

template <typename Fn>
void for_each_match(std::string_view text, const std::regex& re, Fn&& fn) {
    auto it = std::cregex_iterator(text.data(), text.data() + text.size(), re);
    for (const auto end = std::cregex_iterator(); it != end; ++it) {
        fn(*it);
    }
}

bool overlaps(size_t a_off, size_t a_len, size_t b_off, size_t b_len) {
    return a_off < b_off + b_len && b_off < a_off + a_len;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

PiiEngine::PiiEngine(Config config)
    : config_(std::move(config)) {

    // SSN: hyphenated form only; area/group/serial validated separately
    ssn_regex_ = std::regex(R"(\d{3}-\d{2}-\d{4})");

    // Email: alnum at both ends of local part and domain, alphabetic TLD
    email_regex_ = std::regex(
        R"([a-zA-Z0-9](?:[a-zA-Z0-9._%+-]*[a-zA-Z0-9])?@[a-zA-Z0-9](?:[a-zA-Z0-9.-]*[a-zA-Z0-9])?\.[a-zA-Z]{2,24})");

    // Phone: NANP with optional country code, area and exchange start 2-9
    phone_regex_ = std::regex(
        R"((?:\+?1[-. ]?)?(?:\([2-9]\d{2}\)[-. ]?|[2-9]\d{2}[-. ]?)[2-9]\d{2}[-. ]?\d{4})");

    // Phone: E.164 international
    e164_regex_ = std::regex(R"(\+[1-9]\d{7,14})");

    // Credentials: "password = value", "api_key: &quot;value&quot;"
    credential_assignment_regex_ = std::regex(
        R"(\b(?:password|passwd|pwd|secret|api[_-]?key|access[_-]key|access[_-]token|auth[_-]token|token|private[_-]key|client[_-]secret)\b\s*[:=]\s*(?:&quot;|&#x27;|["'])?([^\s"'&,;<>]{6,}))",
        std::regex::ECMAScript | std::regex::icase);

    bearer_regex_ = std::regex(
        R"(\bbearer\s+([A-Za-z0-9._~+/=-]{6,}))",
        std::regex::ECMAScript | std::regex::icase);

    // Well-known vendor key prefixes
    vendor_key_regex_ = std::regex(
        R"(\b(?:sk_live_|sk_test_|sk-|AKIA|ghp_|gho_|ghs_|xoxb-|xoxp-|AIza)[A-Za-z0-9_-]{12,})");

    generic_token_regex_ = std::regex(
        std::format(R"(\b[A-Za-z0-9_-]{{{},}}\b)", config_.min_generic_token_length));
}

// ============================================================================
// Validation
// ============================================================================

bool PiiEngine::luhn_validate(std::string_view number) {
    std::string digits;
    digits.reserve(number.size());
    for (const char c : number) {
        if (is_digit(c)) digits += c;
    }

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        double_digit = !double_digit;
    }
    return (sum % 10) == 0;
}

bool PiiEngine::validate_ssn(std::string_view value) {
    std::string digits;
    digits.reserve(9);
    for (const char c : value) {
        if (is_digit(c)) digits += c;
    }
    if (digits.size() != 9) {
        return false;
    }

    // Area cannot be 000, 666 or 900-999; group cannot be 00; serial cannot be 0000
    const std::string_view d = digits;
    if (d.substr(0, 3) == "000" || d.substr(0, 3) == "666" || d[0] == '9') {
        return false;
    }
    if (d.substr(3, 2) == "00") {
        return false;
    }
    return d.substr(5, 4) != "0000";
}

// ============================================================================
// Recognizers
// ============================================================================

void PiiEngine::find_ssns(std::string_view text, std::vector<Candidate>& out) const {
    for_each_match(text, ssn_regex_, [&](const std::cmatch& m) {
        const auto offset = static_cast<size_t>(m.position(0));
        const auto length = static_cast<size_t>(m.length(0));
        if (bounded(text, offset, length, extends_ssn) &&
            validate_ssn(text.substr(offset, length))) {
            out.push_back({PiiCategory::SSN, offset, length});
        }
    });
}

void PiiEngine::find_credit_cards(std::string_view text, std::vector<Candidate>& out) const {
    // A run is a maximal sequence of digit groups joined by one space or dash
    size_t pos = 0;
    while (pos < text.size()) {
        if (!is_digit(text[pos])) {
            ++pos;
            continue;
        }
        std::vector<DigitGroup> groups;
        size_t end = pos;
        while (true) {
            const size_t group_start = end;
            while (end < text.size() && is_digit(text[end])) ++end;
            groups.push_back({group_start, end});
            if (end + 1 < text.size() && (text[end] == ' ' || text[end] == '-') &&
                is_digit(text[end + 1])) {
                ++end;
                continue;
            }
            break;
        }
        find_cards_in_run(text, groups, out);
        pos = end;
    }
}

void PiiEngine::find_cards_in_run(std::string_view text, const std::vector<DigitGroup>& groups,
                                  std::vector<Candidate>& out) {
    struct Span {
        size_t first_group;
        size_t last_group;
        size_t digits;
        bool payment_prefix;
    };

    // Every group-aligned span of 13-19 digits that passes Luhn
    std::vector<Span> spans;
    for (size_t i = 0; i < groups.size(); ++i) {
        size_t digits = 0;
        for (size_t j = i; j < groups.size(); ++j) {
            digits += groups[j].end - groups[j].begin;
            if (digits > 19) break;
            if (digits < 13) continue;
            const size_t offset = groups[i].begin;
            if (luhn_validate(text.substr(offset, groups[j].end - offset))) {
                // Payment card numbers start with 2-6
                const char lead = text[offset];
                spans.push_back({i, j, digits, lead >= '2' && lead <= '6'});
            }
        }
    }

    // Most card-like spans first; picked spans never share a group
    std::ranges::stable_sort(spans, [](const Span& a, const Span& b) {
        if (a.payment_prefix != b.payment_prefix) return a.payment_prefix;
        return a.digits > b.digits;
    });
    std::vector<bool> taken(groups.size(), false);
    for (const auto& span : spans) {
        bool free = true;
        for (size_t g = span.first_group; g <= span.last_group; ++g) {
            if (taken[g]) free = false;
        }
        if (!free) continue;
        for (size_t g = span.first_group; g <= span.last_group; ++g) taken[g] = true;
        const size_t offset = groups[span.first_group].begin;
        out.push_back({PiiCategory::CREDIT_CARD, offset, groups[span.last_group].end - offset});
    }
}

void PiiEngine::find_emails(std::string_view text, std::vector<Candidate>& out) const {
    for_each_match(text, email_regex_, [&](const std::cmatch& m) {
        const auto offset = static_cast<size_t>(m.position(0));
        const auto length = static_cast<size_t>(m.length(0));
        const std::string_view email = text.substr(offset, length);
        if (email.find("..") != std::string_view::npos) return;
        if (email.find(".@") != std::string_view::npos) return;
        out.push_back({PiiCategory::EMAIL, offset, length});
    });
}

void PiiEngine::find_phones(std::string_view text, std::vector<Candidate>& out) const {
    for_each_match(text, phone_regex_, [&](const std::cmatch& m) {
        const auto offset = static_cast<size_t>(m.position(0));
        const auto length = static_cast<size_t>(m.length(0));
        if (bounded(text, offset, length, extends_number)) {
            out.push_back({PiiCategory::PHONE, offset, length});
        }
    });
    for_each_match(text, e164_regex_, [&](const std::cmatch& m) {
        const auto offset = static_cast<size_t>(m.position(0));
        const auto length = static_cast<size_t>(m.length(0));
        if (bounded(text, offset, length, extends_number)) {
            out.push_back({PiiCategory::PHONE, offset, length});
        }
    });
}

void PiiEngine::find_credentials(std::string_view text, std::vector<Candidate>& out) const {
    // Only the value is masked; the key name stays readable
    const auto push_value = [&](const std::cmatch& m) {
        out.push_back({PiiCategory::CREDENTIAL,
                       static_cast<size_t>(m.position(1)),
                       static_cast<size_t>(m.length(1))});
    };
    for_each_match(text, credential_assignment_regex_, push_value);
    for_each_match(text, bearer_regex_, push_value);

    for_each_match(text, vendor_key_regex_, [&](const std::cmatch& m) {
        out.push_back({PiiCategory::CREDENTIAL,
                       static_cast<size_t>(m.position(0)),
                       static_cast<size_t>(m.length(0))});
    });

    if (!config_.detect_generic_tokens) return;
    for_each_match(text, generic_token_regex_, [&](const std::cmatch& m) {
        const std::string_view token(m[0].first, static_cast<size_t>(m.length(0)));
        const bool has_digit = std::ranges::any_of(token, is_digit);
        const bool has_alpha = std::ranges::any_of(token, [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        });
        if (has_digit && has_alpha) {
            out.push_back({PiiCategory::CREDENTIAL,
                           static_cast<size_t>(m.position(0)), token.size()});
        }
    });
}

void PiiEngine::find_keywords(std::string_view text, std::vector<Candidate>& out) const {
    for (const auto& keyword : config_.custom_keywords) {
        if (keyword.empty()) continue;
        size_t pos = 0;
        while ((pos = text::find_keyword(text, keyword, pos)) != std::string_view::npos) {
            out.push_back({PiiCategory::KEYWORD, pos, keyword.size()});
            pos += keyword.size();
        }
    }
}

// ============================================================================
// Redaction
// ============================================================================

PiiReport PiiEngine::redact(std::string_view text) const {
    std::vector<Candidate> candidates;
    find_ssns(text, candidates);
    find_credit_cards(text, candidates);
    find_emails(text, candidates);
    find_phones(text, candidates);
    find_credentials(text, candidates);
    find_keywords(text, candidates);

    // Existing masks are opaque
    const auto masks = MaskingEngine::find_masks(text);
    std::erase_if(candidates, [&](const Candidate& c) {
        return std::ranges::any_of(masks, [&](const auto& span) {
            return overlaps(c.offset, c.length, span.first, span.second);
        });
    });

    // Longest first, then category priority, then leftmost
    std::ranges::sort(candidates, [](const Candidate& a, const Candidate& b) {
        if (a.length != b.length) return a.length > b.length;
        if (a.category != b.category) return a.category < b.category;
        return a.offset < b.offset;
    });

    std::vector<Candidate> accepted;
    for (const auto& c : candidates) {
        const bool conflict = std::ranges::any_of(accepted, [&](const Candidate& a) {
            return overlaps(c.offset, c.length, a.offset, a.length);
        });
        if (!conflict) accepted.push_back(c);
    }
    std::ranges::sort(accepted, {}, &Candidate::offset);

    PiiReport report;
    report.findings.reserve(accepted.size());
    for (const auto& c : accepted) {
        PiiFinding finding;
        finding.category = c.category;
        finding.offset = c.offset;
        finding.length = c.length;
        finding.mask = MaskingEngine::mask_for(c.category);
        finding.fingerprint = MaskingEngine::hash_value(text.substr(c.offset, c.length));
        ++report.category_counts[static_cast<size_t>(c.category)];
        report.findings.push_back(std::move(finding));
    }
    report.redacted_text = MaskingEngine::apply(text, report.findings);
    return report;
}

} // namespace promptshield
