#include "security/sanitizer.hpp"
#include "core/text.hpp"

#include <array>
#include <format>

namespace promptshield {

namespace {

// ============================================================================
// Unicode folding (compatibility subset relevant to filter bypass)
// ============================================================================

bool is_invisible_format(char32_t cp) {
    return cp == 0x00AD || cp == 0x180E || cp == 0xFEFF ||
           (cp >= 0x200B && cp <= 0x200F) ||
           (cp >= 0x202A && cp <= 0x202E) ||
           (cp >= 0x2060 && cp <= 0x2064) ||
           (cp >= 0x2066 && cp <= 0x2069);
}

/**
 * @brief Append the folded form of cp. Returns false if cp was copied as-is.
 */
bool fold_code_point(char32_t cp, std::string& out) {
    // Fullwidth ASCII
    if (cp >= 0xFF01 && cp <= 0xFF5E) {
        out += static_cast<char>(cp - 0xFEE0);
        return true;
    }
    // Compatibility spaces
    if (cp == 0x00A0 || cp == 0x3000 || cp == 0x202F || cp == 0x205F ||
        (cp >= 0x2000 && cp <= 0x200A)) {
        out += ' ';
        return true;
    }
    // Mathematical alphanumeric letters: 52-letter blocks of A-Z a-z
    if (cp >= 0x1D400 && cp <= 0x1D6A3) {
        const auto idx = static_cast<int>((cp - 0x1D400) % 52);
        out += static_cast<char>(idx < 26 ? 'A' + idx : 'a' + (idx - 26));
        return true;
    }
    // Mathematical digits
    if (cp >= 0x1D7CE && cp <= 0x1D7FF) {
        out += static_cast<char>('0' + static_cast<int>((cp - 0x1D7CE) % 10));
        return true;
    }
    // Circled letters
    if (cp >= 0x24B6 && cp <= 0x24CF) {
        out += static_cast<char>('A' + static_cast<int>(cp - 0x24B6));
        return true;
    }
    if (cp >= 0x24D0 && cp <= 0x24E9) {
        out += static_cast<char>('a' + static_cast<int>(cp - 0x24D0));
        return true;
    }
    // Superscript and subscript digits
    if (cp == 0x2070 || cp == 0x2080) { out += '0'; return true; }
    if (cp == 0x00B9 || cp == 0x2081) { out += '1'; return true; }
    if (cp == 0x00B2 || cp == 0x2082) { out += '2'; return true; }
    if (cp == 0x00B3 || cp == 0x2083) { out += '3'; return true; }
    if (cp >= 0x2074 && cp <= 0x2079) {
        out += static_cast<char>('4' + static_cast<int>(cp - 0x2074));
        return true;
    }
    if (cp >= 0x2084 && cp <= 0x2089) {
        out += static_cast<char>('4' + static_cast<int>(cp - 0x2084));
        return true;
    }

    switch (cp) {
        case 0xFB00: out += "ff"; return true;
        case 0xFB01: out += "fi"; return true;
        case 0xFB02: out += "fl"; return true;
        case 0xFB03: out += "ffi"; return true;
        case 0xFB04: out += "ffl"; return true;
        case 0xFB05:
        case 0xFB06: out += "st"; return true;
        case 0x2024:
        case 0xFE52: out += '.'; return true;
        case 0x2025: out += ".."; return true;
        case 0x2026: out += "..."; return true;
        case 0xFE68: out += '\\'; return true;
        default: break;
    }
    return false;
}

// ============================================================================
// Markup handling
// ============================================================================

std::string escape_markup(std::string_view s, bool& changed) {
    std::string out;
    out.reserve(s.size() + s.size() / 8);
    for (const char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; changed = true; break;
            case '<':  out += "&lt;"; changed = true; break;
            case '>':  out += "&gt;"; changed = true; break;
            case '"':  out += "&quot;"; changed = true; break;
            case '\'': out += "&#x27;"; changed = true; break;
            default:   out += c;
        }
    }
    return out;
}

constexpr std::array<std::string_view, 5> kAllowedTags = {"p", "br", "strong", "em", "u"};
constexpr std::array<std::string_view, 2> kDroppedBodies = {"script", "style"};

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// "<x", "</x" and "<!" open a tag; a bare "<" followed by anything else is text
bool is_tag_start(std::string_view s, size_t i) {
    if (s[i] != '<' || i + 1 >= s.size()) return false;
    if (s[i + 1] == '!') return true;
    if (s[i + 1] == '/') return i + 2 < s.size() && is_alpha(s[i + 2]);
    return is_alpha(s[i + 1]);
}

std::string strip_unsafe_markup(std::string_view s, bool& changed) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (!is_tag_start(s, i)) {
            out += s[i++];
            continue;
        }

        const size_t close = s.find('>', i);
        if (close == std::string_view::npos) {
            // Unterminated tag: neutralize the opener
            out += "&lt;";
            changed = true;
            ++i;
            continue;
        }

        const bool closing = s[i + 1] == '/';
        std::string name;
        for (size_t k = i + (closing ? 2 : 1); k < close && text::is_word_char(s[k]); ++k) {
            name += text::ascii_lower(s[k]);
        }

        bool dropped_body = false;
        if (!closing) {
            for (const auto body_tag : kDroppedBodies) {
                if (name != body_tag) continue;
                const std::string end_tag = std::format("</{}", body_tag);
                const size_t end = text::find_ci(s, end_tag, close + 1);
                if (end == std::string_view::npos) {
                    i = s.size();
                } else {
                    const size_t end_close = s.find('>', end);
                    i = end_close == std::string_view::npos ? s.size() : end_close + 1;
                }
                dropped_body = true;
                break;
            }
        }
        if (dropped_body) {
            changed = true;
            continue;
        }

        bool allowed = false;
        for (const auto tag : kAllowedTags) {
            if (name == tag) {
                allowed = true;
                break;
            }
        }
        if (allowed) {
            // Attributes are never allowed: re-emit the bare tag
            const std::string bare = std::format("<{}{}>", closing ? "/" : "", name);
            if (bare != s.substr(i, close - i + 1)) changed = true;
            out += bare;
        } else {
            changed = true;
        }
        i = close + 1;
    }
    return out;
}

// Do not leave a partial entity (e.g. "&am") at the cut
size_t entity_safe_cut(std::string_view s, size_t cut) {
    const size_t window_start = cut > 8 ? cut - 8 : 0;
    const size_t amp = s.rfind('&', cut == 0 ? 0 : cut - 1);
    if (amp == std::string_view::npos || amp < window_start) return cut;
    const size_t semi = s.find(';', amp);
    if (semi != std::string_view::npos && semi < cut) return cut;
    return amp;
}

} // anonymous namespace

// ============================================================================
// Sanitizer
// ============================================================================

Sanitizer::Sanitizer(const Config& config)
    : config_(config) {}

SanitizationResult Sanitizer::sanitize(std::string_view text) const {
    return sanitize(text, config_);
}

SanitizationResult Sanitizer::sanitize(std::string_view input, const Config& config) {
    SanitizationResult result;

    // (a) UTF-8 repair, compatibility folding, invisible format removal
    // (b) null byte + control character stripping (same decode pass)
    std::string out;
    out.reserve(input.size());
    size_t invalid = 0;
    size_t folded = 0;
    size_t invisible = 0;
    size_t nulls = 0;
    size_t controls = 0;

    size_t pos = 0;
    while (pos < input.size()) {
        const size_t before = pos;
        const char32_t cp = text::decode_utf8(input, pos);
        if (cp == text::kReplacementChar &&
            !(pos - before == 3 && input.substr(before, 3) == "\xEF\xBF\xBD")) {
            ++invalid;
        }
        if (!config.enabled) {
            text::append_utf8(out, cp);
            continue;
        }
        if (cp == 0) {
            ++nulls;
            continue;
        }
        if ((cp < 0x20 && cp != '\t' && cp != '\n' && cp != '\r') ||
            cp == 0x7F || (cp >= 0x80 && cp <= 0x9F)) {
            ++controls;
            continue;
        }
        if (config.normalize_unicode) {
            if (is_invisible_format(cp)) {
                ++invisible;
                continue;
            }
            if (fold_code_point(cp, out)) {
                ++folded;
                continue;
            }
        }
        text::append_utf8(out, cp);
    }

    if (invalid > 0) {
        result.warnings.push_back(
            std::format("Invalid UTF-8 sequences replaced ({})", invalid));
    }

    if (config.enabled) {
        if (folded > 0) {
            result.warnings.push_back(
                std::format("Unicode compatibility characters normalized ({})", folded));
        }
        if (invisible > 0) {
            result.warnings.push_back(
                std::format("Invisible formatting characters removed ({})", invisible));
        }
        if (nulls > 0) {
            result.warnings.push_back("Null bytes detected and removed");
        }
        if (controls > 0) {
            result.warnings.push_back(
                std::format("Control characters removed ({})", controls));
        }

        // (c) Path traversal flagging
        if (config.flag_traversal) {
            result.traversal_flags = find_traversal_sequences(out);
            if (!result.traversal_flags.empty()) {
                result.warnings.push_back("Path traversal pattern detected");
            }
        }

        // (d) Markup
        bool changed = false;
        switch (config.markup) {
            case MarkupMode::ESCAPE:
                out = escape_markup(out, changed);
                if (changed) {
                    result.markup_escaped = true;
                    result.warnings.push_back("Markup characters escaped");
                }
                break;
            case MarkupMode::STRIP_UNSAFE:
                out = strip_unsafe_markup(out, changed);
                if (changed) {
                    result.markup_escaped = true;
                    result.warnings.push_back("Unsafe markup stripped");
                }
                break;
            case MarkupMode::NONE:
                break;
        }

        // (e) Whitespace collapse
        if (config.collapse_whitespace) {
            std::string collapsed;
            collapsed.reserve(out.size());
            bool in_space = false;
            for (const char c : out) {
                const bool space = c == ' ' || c == '\t' || c == '\n' || c == '\r';
                if (space) {
                    if (!in_space && !collapsed.empty()) collapsed += ' ';
                    in_space = true;
                } else {
                    collapsed += c;
                    in_space = false;
                }
            }
            if (!collapsed.empty() && collapsed.back() == ' ') collapsed.pop_back();
            if (collapsed != out) {
                result.warnings.push_back("Whitespace collapsed");
                out = std::move(collapsed);
            }
        }
    }

    // (f) Truncation
    if (out.size() > config.max_length) {
        const size_t original = out.size();
        size_t cut = text::utf8_boundary(out, config.max_length);
        if (config.enabled && config.markup == MarkupMode::ESCAPE) {
            cut = entity_safe_cut(out, cut);
        }
        out.resize(cut);
        result.truncated = true;
        result.warnings.push_back(
            std::format("Input truncated from {} to {} bytes", original, out.size()));
    }

    result.text = std::move(out);
    return result;
}

// ============================================================================
// Traversal Sequences
// ============================================================================

std::vector<TraversalFlag> Sanitizer::find_traversal_sequences(std::string_view input) {
    static constexpr std::string_view kTokens[] = {
        "%252e%252e%252f", "%252e%252e%255c",
        "%2e%2e%2f", "%2e%2e%5c", "%2e%2e/", "%2e%2e\\",
        "..%252f", "..%255c", "..%2f", "..%5c",
        "%c0%ae%c0%ae/",
        "../", "..\\",
    };

    std::vector<TraversalFlag> flags;
    size_t i = 0;
    while (i < input.size()) {
        bool matched = false;
        // Longest-first table, so encoded forms are reported as themselves
        for (const auto token : kTokens) {
            if (i + token.size() <= input.size() &&
                text::find_ci(input.substr(i, token.size()), token) == 0) {
                flags.push_back({i, std::string(token)});
                i += token.size();
                matched = true;
                break;
            }
        }
        if (!matched) ++i;
    }
    return flags;
}

} // namespace promptshield
