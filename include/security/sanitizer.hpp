#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Normalizes and neutralizes raw text before any detector runs.
 *
 * Steps, in fixed order:
 *   (a) UTF-8 repair + Unicode compatibility folding, invisible-format removal
 *   (b) null byte and control character stripping
 *   (c) path traversal flagging (warning only)
 *   (d) markup escaping (inbound) or unsafe-tag stripping (outbound)
 *   (e) optional whitespace collapse
 *   (f) truncation to max_length bytes on a code point boundary
 *
 * Step (a) is a fixed compatibility subset (fullwidth ASCII, ligatures,
 * compatibility spaces and similar folds), not full NFKC: there is no
 * canonical decomposition or composition and no Unicode database is used.
 *
 * Never throws on input content. When disabled, only UTF-8 repair and
 * truncation run so the output is still valid and bounded.
 */
class Sanitizer {
public:
    enum class MarkupMode : uint8_t {
        ESCAPE,        // & < > " ' become entities
        STRIP_UNSAFE,  // drop tags outside the allow-list, drop script/style bodies
        NONE
    };

    struct Config {
        bool enabled = true;
        size_t max_length = 10000;
        bool normalize_unicode = true;
        bool flag_traversal = true;
        MarkupMode markup = MarkupMode::ESCAPE;
        bool collapse_whitespace = false;
    };

    Sanitizer() : Sanitizer(Config{}) {}
    explicit Sanitizer(const Config& config);

    [[nodiscard]] SanitizationResult sanitize(std::string_view text) const;
    [[nodiscard]] static SanitizationResult sanitize(std::string_view text, const Config& config);

    /**
     * @brief Locate parent-directory sequences, including percent-encoded and
     * double-encoded forms. Offsets refer to the scanned text.
     */
    [[nodiscard]] static std::vector<TraversalFlag> find_traversal_sequences(std::string_view text);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace promptshield
