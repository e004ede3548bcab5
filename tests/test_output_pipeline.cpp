#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/pipeline.hpp"
#include "output/disclaimer_injector.hpp"
#include "output/refusal_detector.hpp"
#include "security/detector_set.hpp"
#include "security/escalation_policy.hpp"
#include "security/pii_engine.hpp"
#include "security/sanitizer.hpp"
#include "security/verdict_aggregator.hpp"
#include "mocks/mock_telemetry_sink.hpp"

#include <algorithm>

using namespace promptshield;
using namespace promptshield::testing;

namespace {

std::shared_ptr<PipelineEngine> outbound_engine(std::shared_ptr<ITelemetrySink> telemetry = nullptr) {
    Sanitizer::Config sanitizer;
    sanitizer.markup = Sanitizer::MarkupMode::STRIP_UNSAFE;

    return PipelineBuilder()
        .with_sanitizer(std::make_shared<const Sanitizer>(sanitizer))
        .with_pii_engine(std::make_shared<const PiiEngine>())
        .with_detectors(std::make_shared<const ThreatDetectorSet>(ThreatDetectorSet::outbound({})))
        .with_escalation_policy(std::make_shared<const EscalationPolicy>())
        .with_aggregator(std::make_shared<const VerdictAggregator>())
        .with_refusal_detector(std::make_shared<const RefusalDetector>())
        .with_disclaimer_injector(std::make_shared<const DisclaimerInjector>())
        .with_telemetry(std::move(telemetry))
        .build_outbound();
}

AnalysisRequest response(std::string text) {
    AnalysisRequest r;
    r.text = std::move(text);
    r.direction = Direction::OUTBOUND;
    r.original_prompt = "question";
    return r;
}

} // anonymous namespace

TEST_CASE("Outbound stage chain includes annotations", "[pipeline][outbound]") {
    const auto engine = outbound_engine();
    const std::vector<std::string_view> expected = {
        "sanitize", "pii", "threat_detection", "escalation", "model_check",
        "output_annotation", "aggregate"};
    CHECK(engine->stage_names() == expected);
    CHECK(engine->direction() == Direction::OUTBOUND);
}

TEST_CASE("Leaked PII is redacted and the response rewritten", "[pipeline][outbound][leak]") {
    const auto engine = outbound_engine();
    const auto v = engine->run(response(
        "Contact John at john@example.org or 212-555-0199, SSN 123-45-6789."));

    CHECK(v.direction == Direction::OUTBOUND);
    CHECK_FALSE(v.is_blocked);
    CHECK(v.remediation == RemediationAction::REWRITE);
    CHECK(v.security_score == Catch::Approx(1.0));
    CHECK(v.pii.size() == 3);
    CHECK(v.final_text.find("123-45-6789") == std::string::npos);
    CHECK(v.final_text.find("[SSN_REDACTED]") != std::string::npos);
    CHECK(v.final_text.ends_with("[Part of this response was withheld by the content policy.]"));
    CHECK(std::ranges::find(v.warnings, "Response rewritten (data-leak)") != v.warnings.end());

    REQUIRE_FALSE(v.threats.empty());
    CHECK(v.threats[0].pattern_id == "PII_ssn");
}

TEST_CASE("Protected phrase blocks the response", "[pipeline][outbound][leak]") {
    const auto engine = outbound_engine();
    auto r = response("Project Nightingale ships in May.");
    r.protected_phrases = {"project nightingale"};

    const auto v = engine->run(r);
    CHECK(v.is_blocked);
    CHECK(v.block_reason == "data-leak");
    CHECK(v.remediation == RemediationAction::BLOCK);
    CHECK(v.final_text.empty());
    REQUIRE_FALSE(v.threats.empty());
    CHECK(v.threats[0].evidence->find("ightingale") == std::string::npos);
}

TEST_CASE("Advice gets a disclaimer", "[pipeline][outbound][disclaimer]") {
    const auto engine = outbound_engine();
    const auto v = engine->run(response("Your symptoms suggest a condition; see a doctor."));
    CHECK_FALSE(v.is_blocked);
    REQUIRE(v.disclaimer.has_value());
    CHECK(v.disclaimer->starts_with("Medical Disclaimer:"));
    CHECK(v.final_text == "Your symptoms suggest a condition; see a doctor.\n\n" + *v.disclaimer);

    SECTION("Disclaimer feature off") {
        auto r = response("Your symptoms suggest a condition; see a doctor.");
        r.feature_overrides["disclaimer"] = {false, 0.0};
        const auto plain = engine->run(r);
        CHECK_FALSE(plain.disclaimer.has_value());
        CHECK(plain.final_text == "Your symptoms suggest a condition; see a doctor.");
    }
}

TEST_CASE("Refusals are flagged but not scored", "[pipeline][outbound][refusal]") {
    const auto engine = outbound_engine();
    const auto v = engine->run(response("I cannot help with that."));
    CHECK(v.false_refusal);
    CHECK_FALSE(v.is_blocked);
    CHECK(v.security_score == Catch::Approx(0.0));

    auto r = response("I cannot help with that.");
    r.feature_overrides["refusal"] = {false, 0.0};
    CHECK_FALSE(engine->run(r).false_refusal);
}

TEST_CASE("Unsafe markup is stripped from responses", "[pipeline][outbound][markup]") {
    const auto engine = outbound_engine();
    const auto v = engine->run(response("<p>Hello</p><script>steal()</script>"));
    CHECK(v.sanitized_text == "<p>Hello</p>");
    CHECK(v.final_text == "<p>Hello</p>");
}

TEST_CASE("Harmful output is a hard block", "[pipeline][outbound][toxicity]") {
    const auto engine = outbound_engine();
    const auto v = engine->run(response("Step one: how to hack the router."));
    CHECK(v.is_blocked);
    CHECK(v.block_reason == "toxicity");
}

TEST_CASE("Toxicity threshold filters warnings", "[pipeline][outbound][toxicity]") {
    const auto engine = outbound_engine();

    const auto warned = engine->run(response("That site has explicit material."));
    CHECK(warned.remediation == RemediationAction::REWRITE);

    auto r = response("That site has explicit material.");
    r.feature_overrides["toxicity"] = {true, 0.75};
    const auto quiet = engine->run(r);
    CHECK(quiet.threats.empty());
    CHECK(quiet.remediation == RemediationAction::NONE);
}

TEST_CASE("Hallucinated figures are reported", "[pipeline][outbound][hallucination]") {
    const auto engine = outbound_engine();
    auto r = response("Revenue grew 12% in 2023 and 40% in 2024.");
    r.source_facts = {"Revenue grew 12% in 2023."};

    const auto v = engine->run(r);
    REQUIRE(v.threats.size() == 1);
    CHECK(v.threats[0].category == ThreatCategory::HALLUCINATION);
    CHECK_FALSE(v.is_blocked);
}

TEST_CASE("Outbound telemetry", "[pipeline][outbound][telemetry]") {
    auto telemetry = std::make_shared<MockTelemetrySink>();
    const auto engine = outbound_engine(telemetry);
    (void)engine->run(response("All good here."));

    const auto stages = telemetry->stages();
    CHECK(stages.size() == 7);
    CHECK(std::ranges::find(stages, "output_annotation") != stages.end());
    REQUIRE(telemetry->verdicts().size() == 1);
    CHECK(telemetry->verdicts()[0].direction == Direction::OUTBOUND);
}
