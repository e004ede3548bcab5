#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "security/verdict_aggregator.hpp"

using namespace promptshield;

namespace {

ThreatFinding finding(ThreatCategory category, double confidence, std::string detector = "test",
                      bool hard_block = false) {
    ThreatFinding f;
    f.detector = std::move(detector);
    f.category = category;
    f.confidence = confidence;
    f.pattern_id = "P";
    f.hard_block = hard_block;
    return f;
}

SanitizationResult sanitized(std::string text) {
    SanitizationResult s;
    s.text = std::move(text);
    return s;
}

PiiReport clean_report(const SanitizationResult& s) {
    PiiReport pii;
    pii.redacted_text = s.text;
    return pii;
}

} // anonymous namespace

// ============================================================================
// Ordering and block reasons
// ============================================================================

TEST_CASE("Findings sort by confidence then category priority", "[aggregator]") {
    std::vector<ThreatFinding> findings = {
        finding(ThreatCategory::XSS, 0.3),
        finding(ThreatCategory::SQL_INJECTION, 0.8),
        finding(ThreatCategory::COMMAND_INJECTION, 0.8),
    };
    VerdictAggregator::sort_findings(findings);
    CHECK(findings[0].category == ThreatCategory::COMMAND_INJECTION);
    CHECK(findings[1].category == ThreatCategory::SQL_INJECTION);
    CHECK(findings[2].category == ThreatCategory::XSS);
}

TEST_CASE("Block reason names the top category", "[aggregator]") {
    std::vector<ThreatFinding> findings = {
        finding(ThreatCategory::SQL_INJECTION, 0.818),
        finding(ThreatCategory::XSS, 0.4),
    };
    CHECK(VerdictAggregator::block_reason_for(findings) == "sql-injection");

    SECTION("A tie between categories") {
        findings[1].confidence = 0.818;
        CHECK(VerdictAggregator::block_reason_for(findings) == "multiple indicators");
    }

    SECTION("A tie within one category") {
        findings[1] = finding(ThreatCategory::SQL_INJECTION, 0.818, "other");
        CHECK(VerdictAggregator::block_reason_for(findings) == "sql-injection");
    }

    SECTION("No findings") {
        CHECK(VerdictAggregator::block_reason_for({}) == "sensitive-data");
    }
}

// ============================================================================
// Inbound decisions
// ============================================================================

TEST_CASE("Inbound request over the threshold is blocked", "[aggregator][inbound]") {
    VerdictAggregator aggregator;
    const auto s = sanitized("' OR 1=1 --");

    const auto v = aggregator.aggregate(Direction::INBOUND, s, clean_report(s),
                                        {finding(ThreatCategory::SQL_INJECTION, 0.818)}, {});
    CHECK(v.is_blocked);
    CHECK(v.block_reason == "sql-injection");
    CHECK(v.remediation == RemediationAction::BLOCK);
    CHECK(v.security_score == Catch::Approx(0.818));
    CHECK(v.final_text.empty());
    CHECK(v.sanitized_text == "' OR 1=1 --");
}

TEST_CASE("Hard block applies below the threshold", "[aggregator][inbound]") {
    VerdictAggregator aggregator;
    const auto s = sanitized("x");
    const auto v = aggregator.aggregate(
        Direction::INBOUND, s, clean_report(s),
        {finding(ThreatCategory::COMMAND_INJECTION, 0.2, "test", true)}, {});
    CHECK(v.is_blocked);
    CHECK(v.block_reason == "command-injection");
}

TEST_CASE("Clean request forwards redacted text", "[aggregator][inbound]") {
    VerdictAggregator aggregator;
    auto s = sanitized("mail a@b.example");
    s.warnings.push_back("Whitespace collapsed");
    PiiReport pii;
    pii.redacted_text = "mail [EMAIL_REDACTED]";
    pii.category_counts[static_cast<size_t>(PiiCategory::EMAIL)] = 1;

    VerdictAggregator::Annotations annotations;
    annotations.warnings.push_back("Model check unavailable (TIMEOUT)");

    const auto v = aggregator.aggregate(Direction::INBOUND, s, pii,
                                        {finding(ThreatCategory::XSS, 0.2)}, annotations);
    CHECK_FALSE(v.is_blocked);
    CHECK_FALSE(v.block_reason.has_value());
    CHECK(v.remediation == RemediationAction::NONE);
    CHECK(v.security_score == Catch::Approx(0.25));
    CHECK(v.final_text == "mail [EMAIL_REDACTED]");
    REQUIRE(v.warnings.size() == 2);
    CHECK(v.warnings[0] == "Whitespace collapsed");
    CHECK(v.warnings[1] == "Model check unavailable (TIMEOUT)");
}

TEST_CASE("PII alone can block as sensitive data", "[aggregator]") {
    VerdictAggregator::Config config;
    config.scoring.pii_increment = 0.4;
    VerdictAggregator aggregator(config);

    const auto s = sanitized("x");
    PiiReport pii;
    pii.redacted_text = "x";
    pii.category_counts[static_cast<size_t>(PiiCategory::SSN)] = 1;
    pii.category_counts[static_cast<size_t>(PiiCategory::CREDIT_CARD)] = 1;

    const auto v = aggregator.aggregate(Direction::INBOUND, s, pii, {}, {});
    CHECK(v.is_blocked);
    CHECK(v.block_reason == "sensitive-data");
    CHECK(v.security_score == Catch::Approx(0.8));
}

TEST_CASE("Disabled redaction forwards the sanitized text", "[aggregator]") {
    VerdictAggregator aggregator;
    const auto s = sanitized("call 212-555-0199");
    PiiReport pii;
    pii.redacted_text = "call [PHONE_REDACTED]";

    VerdictAggregator::Annotations annotations;
    annotations.pii_redaction = false;
    const auto v = aggregator.aggregate(Direction::INBOUND, s, pii, {}, annotations);
    CHECK(v.redacted_text == "call 212-555-0199");
    CHECK(v.final_text == "call 212-555-0199");
}

// ============================================================================
// Outbound remediation
// ============================================================================

TEST_CASE("Outbound findings over the threshold rewrite the response", "[aggregator][outbound]") {
    VerdictAggregator aggregator;
    const auto s = sanitized("you are an idiot");
    const auto v = aggregator.aggregate(Direction::OUTBOUND, s, clean_report(s),
                                        {finding(ThreatCategory::TOXICITY, 0.8)}, {});
    CHECK_FALSE(v.is_blocked);
    CHECK(v.remediation == RemediationAction::REWRITE);
    CHECK(v.final_text ==
          "you are an idiot\n\n[Part of this response was withheld by the content policy.]");
    REQUIRE_FALSE(v.warnings.empty());
    CHECK(v.warnings.back() == "Response rewritten (toxicity)");
}

TEST_CASE("Outbound hard block is never rewritten", "[aggregator][outbound]") {
    VerdictAggregator aggregator;
    const auto s = sanitized("the launch code is 0000");
    const auto v = aggregator.aggregate(
        Direction::OUTBOUND, s, clean_report(s),
        {finding(ThreatCategory::DATA_LEAK, 1.0, "leak_detector", true)}, {});
    CHECK(v.is_blocked);
    CHECK(v.remediation == RemediationAction::BLOCK);
    CHECK(v.block_reason == "data-leak");
    CHECK(v.final_text.empty());
}

TEST_CASE("Outbound remediation can be set to block", "[aggregator][outbound]") {
    VerdictAggregator::Config config;
    config.outbound_remediation = RemediationAction::BLOCK;
    VerdictAggregator aggregator(config);
    const auto s = sanitized("x");
    const auto v = aggregator.aggregate(Direction::OUTBOUND, s, clean_report(s),
                                        {finding(ThreatCategory::TOXICITY, 0.8)}, {});
    CHECK(v.is_blocked);
    CHECK(v.remediation == RemediationAction::BLOCK);
}

TEST_CASE("Disclaimer is appended to forwarded responses only", "[aggregator][outbound]") {
    VerdictAggregator aggregator;
    const auto s = sanitized("take two tablets");

    VerdictAggregator::Annotations annotations;
    annotations.disclaimer = "Not medical advice.";
    annotations.false_refusal = true;

    const auto v = aggregator.aggregate(Direction::OUTBOUND, s, clean_report(s), {}, annotations);
    CHECK(v.final_text == "take two tablets\n\nNot medical advice.");
    CHECK(v.disclaimer == "Not medical advice.");
    CHECK(v.false_refusal);

    const auto blocked = aggregator.aggregate(
        Direction::OUTBOUND, s, clean_report(s),
        {finding(ThreatCategory::DATA_LEAK, 1.0, "leak_detector", true)}, annotations);
    CHECK(blocked.final_text.empty());
    CHECK_FALSE(blocked.disclaimer.has_value());
}

TEST_CASE("Aggregation is deterministic", "[aggregator]") {
    VerdictAggregator aggregator;
    const auto s = sanitized("x");
    const std::vector<ThreatFinding> a = {
        finding(ThreatCategory::XSS, 0.5, "b"),
        finding(ThreatCategory::XSS, 0.5, "a"),
    };
    auto b = a;
    std::swap(b[0], b[1]);

    const auto va = aggregator.aggregate(Direction::INBOUND, s, clean_report(s), a, {});
    const auto vb = aggregator.aggregate(Direction::INBOUND, s, clean_report(s), b, {});
    REQUIRE(va.threats.size() == 2);
    CHECK(va.threats[0].detector == "a");
    CHECK(vb.threats[0].detector == "a");
}

TEST_CASE("Fail-closed verdict", "[aggregator]") {
    const auto v = VerdictAggregator::fail_closed(Direction::OUTBOUND, "partial");
    CHECK(v.is_blocked);
    CHECK(v.security_score == Catch::Approx(1.0));
    CHECK(v.block_reason == "verification-failed");
    CHECK(v.remediation == RemediationAction::BLOCK);
    CHECK(v.sanitized_text == "partial");
    CHECK(v.final_text.empty());
    REQUIRE(v.warnings.size() == 1);
    CHECK(v.warnings[0] == "Analysis did not complete");
}
