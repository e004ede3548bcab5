#include "core/text.hpp"

#include <algorithm>

namespace promptshield::text {

// ============================================================================
// UTF-8
// ============================================================================

char32_t decode_utf8(std::string_view s, size_t& pos) {
    const auto b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) {
        ++pos;
        return b0;
    }

    size_t len = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }
    else {
        ++pos;
        return kReplacementChar;
    }

    if (pos + len > s.size()) {
        ++pos;
        return kReplacementChar;
    }
    for (size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(s[pos + i]);
        if ((b & 0xC0) != 0x80) {
            ++pos;
            return kReplacementChar;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++pos;
        return kReplacementChar;
    }
    pos += len;
    return cp;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

size_t utf8_boundary(std::string_view s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s.size();
    size_t cut = max_bytes;
    // Step back over continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

// ============================================================================
// Search
// ============================================================================

size_t find_ci(std::string_view haystack, std::string_view needle, size_t start) {
    if (needle.empty()) return start <= haystack.size() ? start : std::string_view::npos;
    if (needle.size() > haystack.size()) return std::string_view::npos;

    for (size_t i = start; i + needle.size() <= haystack.size(); ++i) {
        bool match = true;
        for (size_t j = 0; j < needle.size(); ++j) {
            if (ascii_lower(haystack[i + j]) != ascii_lower(needle[j])) {
                match = false;
                break;
            }
        }
        if (match) return i;
    }
    return std::string_view::npos;
}

size_t find_keyword(std::string_view text, std::string_view keyword, size_t start) {
    if (keyword.empty()) return std::string_view::npos;
    const bool check_before = is_word_char(keyword.front());
    const bool check_after = is_word_char(keyword.back());

    size_t pos = start;
    while ((pos = find_ci(text, keyword, pos)) != std::string_view::npos) {
        const size_t after = pos + keyword.size();
        const bool ok_before = !check_before || pos == 0 || !is_word_char(text[pos - 1]);
        const bool ok_after = !check_after || after >= text.size() || !is_word_char(text[after]);
        if (ok_before && ok_after) return pos;
        ++pos;
    }
    return std::string_view::npos;
}

size_t skip_spaces(std::string_view s, size_t pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' ||
                              s[pos] == '\n' || s[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

// ============================================================================
// Encoding Decoder
// ============================================================================

namespace {

int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

std::string decode_once(std::string_view s) {
    std::string result;
    result.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        // URL decode: %XX
        if (s[i] == '%' && i + 2 < s.size()) {
            const int h = hex_val(s[i + 1]);
            const int l = hex_val(s[i + 2]);
            if (h >= 0 && l >= 0) {
                result += static_cast<char>((h << 4) | l);
                i += 2;
                continue;
            }
        }
        // HTML numeric entity: &#NN; or &#xHH;
        if (s[i] == '&' && i + 2 < s.size() && s[i + 1] == '#') {
            size_t j = i + 2;
            bool is_hex = false;
            if (s[j] == 'x' || s[j] == 'X') {
                is_hex = true;
                ++j;
            }
            const size_t start = j;
            char32_t val = 0;
            while (j < s.size() && j < start + 7) {
                if (is_hex) {
                    const int d = hex_val(s[j]);
                    if (d < 0) break;
                    val = val * 16 + static_cast<char32_t>(d);
                } else {
                    if (s[j] < '0' || s[j] > '9') break;
                    val = val * 10 + static_cast<char32_t>(s[j] - '0');
                }
                ++j;
            }
            if (j > start && j < s.size() && s[j] == ';' && val > 0 && val <= 0x10FFFF) {
                append_utf8(result, val);
                i = j;
                continue;
            }
        }
        // HTML named entities
        if (s[i] == '&') {
            struct Entity { std::string_view name; char ch; };
            static constexpr Entity entities[] = {
                {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'},
                {"&quot;", '"'}, {"&apos;", '\''},
            };
            bool matched = false;
            for (const auto& e : entities) {
                if (s.substr(i, e.name.size()) == e.name) {
                    result += e.ch;
                    i += e.name.size() - 1;
                    matched = true;
                    break;
                }
            }
            if (matched) continue;
        }
        result += s[i];
    }
    return result;
}

} // anonymous namespace

std::string decode_encodings(std::string_view s) {
    std::string first = decode_once(s);
    if (first == s) return first;
    return decode_once(first);
}

// ============================================================================
// Excerpts
// ============================================================================

std::string excerpt(std::string_view s, size_t offset, size_t length, size_t max_bytes) {
    if (offset >= s.size() || max_bytes == 0) return {};
    length = std::min(length, s.size() - offset);

    // Center the window on the match when the match itself is short
    size_t begin = offset;
    if (length < max_bytes) {
        const size_t slack = (max_bytes - length) / 2;
        begin = offset > slack ? offset - slack : 0;
    }
    while (begin > 0 && (static_cast<unsigned char>(s[begin]) & 0xC0) == 0x80) {
        --begin;
    }
    const std::string_view tail = s.substr(begin);
    return std::string(tail.substr(0, utf8_boundary(tail, max_bytes)));
}

} // namespace promptshield::text
