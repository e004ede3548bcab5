#pragma once

#include "security/threat_detector.hpp"
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief SQL injection detector
 *
 * Each signal contributes a weight; signals combine by noisy-OR so every
 * additional co-occurring signal raises confidence:
 *   QUOTE_BREAK    quote followed by OR/AND/UNION/;/--
 *   TAUTOLOGY      OR 1=1, OR 'a'='a', OR true
 *   UNION_SELECT   UNION [ALL] SELECT
 *   STACKED        ; followed by a statement keyword
 *   COMMENT        -- /* # after a quote or SQL keyword
 *   TIME_BASED     sleep(, pg_sleep, benchmark(, waitfor delay
 *   ERROR_BASED    extractvalue(, updatexml(, ...
 */
class SqlInjectionDetector : public IThreatDetector {
public:
    struct Config {
        double quote_break_weight = 0.35;
        double tautology_weight = 0.6;
        double union_select_weight = 0.7;
        double stacked_weight = 0.6;
        double comment_weight = 0.3;
        double time_based_weight = 0.5;
        double error_based_weight = 0.4;
    };

    SqlInjectionDetector() : SqlInjectionDetector(Config{}) {}
    explicit SqlInjectionDetector(const Config& config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "sql_injection_detector"; }
    [[nodiscard]] std::string_view feature() const override { return "sql_injection"; }

private:
    struct Signal {
        const char* id;
        double weight;
        size_t offset;
        size_t length;
    };

    [[nodiscard]] std::optional<Signal> check_quote_break(std::string_view sql) const;
    [[nodiscard]] std::optional<Signal> check_tautologies(std::string_view sql) const;
    [[nodiscard]] std::optional<Signal> check_union_injection(std::string_view sql) const;
    [[nodiscard]] std::optional<Signal> check_stacked_queries(std::string_view sql) const;
    [[nodiscard]] std::optional<Signal> check_comment_bypass(std::string_view sql) const;
    [[nodiscard]] std::optional<Signal> check_time_based_blind(std::string_view sql) const;
    [[nodiscard]] std::optional<Signal> check_error_based(std::string_view sql) const;

    Config config_;

    std::regex quote_break_regex_;
    std::regex tautology_regex_;
    std::regex union_regex_;
    std::regex stacked_regex_;
    std::regex comment_regex_;
    std::regex time_based_regex_;
    std::regex error_based_regex_;
};

} // namespace promptshield
