#include "security/sql_injection_detector.hpp"
#include "core/text.hpp"

#include <algorithm>
#include <utility>

namespace promptshield {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

std::optional<std::cmatch> search(std::string_view s, const std::regex& re) {
    std::cmatch m;
    if (std::regex_search(s.data(), s.data() + s.size(), m, re)) {
        return m;
    }
    return std::nullopt;
}

} // anonymous namespace

SqlInjectionDetector::SqlInjectionDetector(const Config& config)
    : config_(config),
      quote_break_regex_(R"('\s*\)?\s*(?:\b(?:or|and|union)\b|;|--|#))", kIcase),
      tautology_regex_(
          R"(\b(?:or|and|where)\s+(?:(\d+)\s*(=|<>|!=)\s*(\d+)|true\b|(['"])(\w*)\4\s*=\s*(['"])(\w*)\6))",
          kIcase),
      union_regex_(R"(\bunion\s+(?:all\s+)?select\b)", kIcase),
      stacked_regex_(
          R"(;\s*(?:drop|delete|insert|update|select|create|alter|truncate|exec|shutdown)\b)",
          kIcase),
      comment_regex_(
          R"((?:['"]|\b(?:select|from|where|or|and|union|drop)\b)[^\n]*?(--|/\*|#(?:\s|$)))",
          kIcase),
      time_based_regex_(R"(\b(?:sleep|pg_sleep|benchmark)\s*\(|\bwaitfor\s+delay\b)", kIcase),
      error_based_regex_(
          R"(\b(?:extractvalue|updatexml|xmltype|geometrycollection)\s*\(|\bexp\s*\(\s*~)",
          kIcase) {}

std::vector<ThreatFinding> SqlInjectionDetector::detect(const DetectionInput& input) const {
    const std::string_view sql = input.decoded;

    std::vector<Signal> signals;
    for (const auto& check : {&SqlInjectionDetector::check_quote_break,
                              &SqlInjectionDetector::check_tautologies,
                              &SqlInjectionDetector::check_union_injection,
                              &SqlInjectionDetector::check_stacked_queries,
                              &SqlInjectionDetector::check_comment_bypass,
                              &SqlInjectionDetector::check_time_based_blind,
                              &SqlInjectionDetector::check_error_based}) {
        if (auto signal = (this->*check)(sql)) {
            signals.push_back(*signal);
        }
    }
    if (signals.empty()) {
        return {};
    }

    ThreatFinding finding;
    finding.detector = std::string(name());
    finding.category = ThreatCategory::SQL_INJECTION;
    for (const auto& s : signals) {
        finding.confidence = text::combine_confidence(finding.confidence, s.weight);
        if (!finding.pattern_id.empty()) finding.pattern_id += ',';
        finding.pattern_id += s.id;
    }
    finding.confidence = std::clamp(finding.confidence, 0.0, 1.0);

    const auto first = std::ranges::min_element(signals, {}, &Signal::offset);
    finding.evidence = make_evidence(sql, first->offset, first->length);
    return {std::move(finding)};
}

std::optional<SqlInjectionDetector::Signal>
SqlInjectionDetector::check_quote_break(std::string_view sql) const {
    // Closing the surrounding literal and continuing with SQL: ' OR, '; , '--
    if (const auto m = search(sql, quote_break_regex_)) {
        return Signal{"QUOTE_BREAK", config_.quote_break_weight,
                      static_cast<size_t>(m->position(0)),
                      static_cast<size_t>(m->length(0))};
    }
    return std::nullopt;
}

std::optional<SqlInjectionDetector::Signal>
SqlInjectionDetector::check_tautologies(std::string_view sql) const {
    // OR 1=1, AND 2<>3, OR 'x'='x', OR true
    auto it = std::cregex_iterator(sql.data(), sql.data() + sql.size(), tautology_regex_);
    for (const auto end = std::cregex_iterator(); it != end; ++it) {
        const auto& m = *it;
        bool always_true = true;
        if (m[1].matched) {
            const bool equal = m.str(1) == m.str(3);
            always_true = (m.str(2) == "=") ? equal : !equal;
        } else if (m[5].matched) {
            always_true = m.str(5) == m.str(7);
        }
        if (always_true) {
            return Signal{"TAUTOLOGY", config_.tautology_weight,
                          static_cast<size_t>(m.position(0)),
                          static_cast<size_t>(m.length(0))};
        }
    }
    return std::nullopt;
}

std::optional<SqlInjectionDetector::Signal>
SqlInjectionDetector::check_union_injection(std::string_view sql) const {
    if (const auto m = search(sql, union_regex_)) {
        return Signal{"UNION_SELECT", config_.union_select_weight,
                      static_cast<size_t>(m->position(0)),
                      static_cast<size_t>(m->length(0))};
    }
    return std::nullopt;
}

std::optional<SqlInjectionDetector::Signal>
SqlInjectionDetector::check_stacked_queries(std::string_view sql) const {
    // "...; DROP TABLE users"
    if (const auto m = search(sql, stacked_regex_)) {
        return Signal{"STACKED_QUERIES", config_.stacked_weight,
                      static_cast<size_t>(m->position(0)),
                      static_cast<size_t>(m->length(0))};
    }
    return std::nullopt;
}

std::optional<SqlInjectionDetector::Signal>
SqlInjectionDetector::check_comment_bypass(std::string_view sql) const {
    // A comment marker only counts when something SQL-shaped precedes it
    if (const auto m = search(sql, comment_regex_)) {
        return Signal{"COMMENT", config_.comment_weight,
                      static_cast<size_t>(m->position(1)),
                      static_cast<size_t>(m->length(1))};
    }
    return std::nullopt;
}

std::optional<SqlInjectionDetector::Signal>
SqlInjectionDetector::check_time_based_blind(std::string_view sql) const {
    if (const auto m = search(sql, time_based_regex_)) {
        return Signal{"TIME_BASED_BLIND", config_.time_based_weight,
                      static_cast<size_t>(m->position(0)),
                      static_cast<size_t>(m->length(0))};
    }
    return std::nullopt;
}

std::optional<SqlInjectionDetector::Signal>
SqlInjectionDetector::check_error_based(std::string_view sql) const {
    // Functions used to extract data via error messages
    if (const auto m = search(sql, error_based_regex_)) {
        return Signal{"ERROR_BASED", config_.error_based_weight,
                      static_cast<size_t>(m->position(0)),
                      static_cast<size_t>(m->length(0))};
    }
    return std::nullopt;
}

} // namespace promptshield
