#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace promptshield::text {

inline constexpr char32_t kReplacementChar = 0xFFFD;

/**
 * @brief Decode one code point starting at pos and advance pos past it.
 *
 * Overlong forms, surrogates, values above U+10FFFF and truncated sequences
 * decode to U+FFFD and consume exactly one byte, so decoding always makes
 * progress.
 */
[[nodiscard]] char32_t decode_utf8(std::string_view s, size_t& pos);

void append_utf8(std::string& out, char32_t cp);

/**
 * @brief Largest prefix length <= max_bytes that ends on a code point boundary.
 */
[[nodiscard]] size_t utf8_boundary(std::string_view s, size_t max_bytes);

[[nodiscard]] inline bool is_word_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return (u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') ||
           (u >= 'A' && u <= 'Z') || u == '_';
}

[[nodiscard]] inline char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Case-insensitive (ASCII) substring search
[[nodiscard]] size_t find_ci(std::string_view haystack, std::string_view needle,
                             size_t start = 0);

[[nodiscard]] inline bool contains_ci(std::string_view haystack, std::string_view needle) {
    return find_ci(haystack, needle) != std::string_view::npos;
}

/**
 * @brief Case-insensitive search requiring non-word characters on both sides.
 * Needle edges that are themselves non-word characters (e.g. "sleep(") skip
 * the boundary test on that side.
 */
[[nodiscard]] size_t find_keyword(std::string_view text, std::string_view keyword,
                                  size_t start = 0);

/**
 * @brief Decode percent-encoding (%XX) and HTML entities (&#NN; &#xHH; and
 * the five named XML entities). Two passes, so double-encoded payloads such
 * as %2527 or &amp;lt; are flattened.
 */
[[nodiscard]] std::string decode_encodings(std::string_view s);

/**
 * @brief Noisy-OR combination: 1 - (1 - a)(1 - b). Monotonic in both inputs.
 */
[[nodiscard]] inline double combine_confidence(double a, double b) {
    return 1.0 - (1.0 - a) * (1.0 - b);
}

/**
 * @brief Bounded excerpt around [offset, offset + length), cut on code point
 * boundaries. Never longer than max_bytes.
 */
[[nodiscard]] std::string excerpt(std::string_view s, size_t offset, size_t length,
                                  size_t max_bytes);

// Skip ASCII whitespace starting at pos; returns first non-space index
[[nodiscard]] size_t skip_spaces(std::string_view s, size_t pos);

} // namespace promptshield::text
