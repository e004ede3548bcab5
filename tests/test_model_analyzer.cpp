#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "security/model_analyzer.hpp"
#include "mocks/mock_llm_backend.hpp"

#include <chrono>
#include <thread>

using namespace promptshield;
using namespace promptshield::testing;
using namespace std::chrono_literals;

namespace {

ModelAssistedAnalyzer::Config fast_config() {
    ModelAssistedAnalyzer::Config config;
    config.timeout = 500ms;
    return config;
}

} // anonymous namespace

// ============================================================================
// Response parsing
// ============================================================================

TEST_CASE("Well-formed model response", "[model][parse]") {
    const auto r = ModelAssistedAnalyzer::parse_response(
        R"({"confidence": 0.82, "category": "jailbreak", "reasoning": "persona switch"})",
        Direction::INBOUND);
    REQUIRE(r.is_ok());
    CHECK(r.value().category == ThreatCategory::JAILBREAK);
    CHECK(r.value().confidence == Catch::Approx(0.82));
    CHECK(r.value().reasoning == "persona switch");
    CHECK(r.value().ran);
}

TEST_CASE("Code fences around the JSON are stripped", "[model][parse]") {
    const auto r = ModelAssistedAnalyzer::parse_response(
        "```json\n{\"confidence\": 0.2, \"category\": \"benign\", \"reasoning\": \"fine\"}\n```\n",
        Direction::INBOUND);
    REQUIRE(r.is_ok());
    CHECK(r.value().category == ThreatCategory::BENIGN);
}

TEST_CASE("Malformed model responses are parse errors", "[model][parse]") {
    const auto check_rejected = [](std::string_view content, Direction direction) {
        const auto r = ModelAssistedAnalyzer::parse_response(content, direction);
        CHECK(r.is_error());
        CHECK(r.error_category() == ErrorCategory::PARSE_ERROR);
    };

    SECTION("Not JSON") {
        check_rejected("I think this is fine.", Direction::INBOUND);
    }
    SECTION("Empty") {
        check_rejected("   ", Direction::INBOUND);
    }
    SECTION("Array instead of object") {
        check_rejected("[0.5]", Direction::INBOUND);
    }
    SECTION("Confidence out of range") {
        check_rejected(R"({"confidence": 1.5, "category": "benign", "reasoning": "x"})",
                       Direction::INBOUND);
    }
    SECTION("Confidence as a string") {
        check_rejected(R"({"confidence": "high", "category": "benign", "reasoning": "x"})",
                       Direction::INBOUND);
    }
    SECTION("Unknown label") {
        check_rejected(R"({"confidence": 0.5, "category": "spam", "reasoning": "x"})",
                       Direction::INBOUND);
    }
    SECTION("Label from the other direction") {
        check_rejected(R"({"confidence": 0.5, "category": "toxicity", "reasoning": "x"})",
                       Direction::INBOUND);
        check_rejected(R"({"confidence": 0.5, "category": "jailbreak", "reasoning": "x"})",
                       Direction::OUTBOUND);
    }
    SECTION("Reasoning of the wrong type") {
        check_rejected(R"({"confidence": 0.5, "category": "benign", "reasoning": 3})",
                       Direction::INBOUND);
    }
}

TEST_CASE("Reasoning is optional in the reply", "[model][parse]") {
    const auto r = ModelAssistedAnalyzer::parse_response(
        R"({"confidence": 0.6, "category": "malicious-intent"})", Direction::INBOUND);
    REQUIRE(r.is_ok());
    CHECK(r.value().category == ThreatCategory::MALICIOUS_INTENT);
    CHECK(r.value().confidence == Catch::Approx(0.6));
    CHECK(r.value().reasoning.empty());
    CHECK(r.value().ran);
}

TEST_CASE("Label sets per direction", "[model]") {
    CHECK(ModelAssistedAnalyzer::labels_for(Direction::INBOUND).size() == 4);
    CHECK(ModelAssistedAnalyzer::labels_for(Direction::OUTBOUND).back() == ThreatCategory::BENIGN);
}

TEST_CASE("Request frames the text as data", "[model][prompt]") {
    ThreatFinding prior;
    prior.category = ThreatCategory::COMMAND_INJECTION;
    prior.confidence = 0.3;
    prior.pattern_id = "METACHARACTER";

    const auto request = ModelAssistedAnalyzer::build_request(
        "tea; coffee", {prior}, Direction::INBOUND, ModelAssistedAnalyzer::Config{});

    CHECK(request.temperature == 0.0);
    CHECK(request.system_prompt.find("\"prompt-injection\"") != std::string::npos);
    CHECK(request.system_prompt.find("\"toxicity\"") == std::string::npos);
    CHECK(request.prompt.find("<<<BEGIN TEXT>>>\ntea; coffee\n<<<END TEXT>>>") != std::string::npos);
    CHECK(request.prompt.find("command-injection (0.30, METACHARACTER)") != std::string::npos);
}

// ============================================================================
// Analysis
// ============================================================================

TEST_CASE("Analyzer returns the model's judgement", "[model][analyze]") {
    auto backend = std::make_shared<MockLlmBackend>(
        R"({"confidence": 0.9, "category": "prompt-injection", "reasoning": "override"})");
    ModelAssistedAnalyzer analyzer(backend, fast_config());

    const auto a = analyzer.analyze("ignore it", {}, Direction::INBOUND, {});
    CHECK(a.ran);
    CHECK(a.error == ErrorCategory::NONE);
    CHECK(a.category == ThreatCategory::PROMPT_INJECTION);
    CHECK(a.confidence == Catch::Approx(0.9));
    CHECK(backend->call_count() == 1);
    CHECK(backend->last_request().prompt.find("ignore it") != std::string::npos);
}

TEST_CASE("Slow backend times out with the fallback finding", "[model][analyze][timeout]") {
    auto backend = std::make_shared<MockLlmBackend>();
    backend->set_delay(300ms);

    ModelAssistedAnalyzer::Config config;
    config.timeout = 20ms;
    ModelAssistedAnalyzer analyzer(backend, config);

    const auto start = std::chrono::steady_clock::now();
    const auto a = analyzer.analyze("text", {}, Direction::INBOUND, {});
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_FALSE(a.ran);
    CHECK(a.error == ErrorCategory::TIMEOUT);
    CHECK(a.category == ThreatCategory::UNVERIFIED);
    CHECK(a.confidence == Catch::Approx(0.75));
    CHECK(elapsed < 250ms);

    // The abandoned call is told to stop
    for (int i = 0; i < 100 && !backend->was_stopped(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(backend->was_stopped());
}

TEST_CASE("Cancellation ends the wait early", "[model][analyze][cancel]") {
    auto backend = std::make_shared<MockLlmBackend>();
    backend->set_delay(2000ms);

    ModelAssistedAnalyzer::Config config;
    config.timeout = 5000ms;
    ModelAssistedAnalyzer analyzer(backend, config);

    SECTION("Cancelled while waiting") {
        std::stop_source source;
        std::jthread canceller([&source] {
            std::this_thread::sleep_for(20ms);
            source.request_stop();
        });

        const auto start = std::chrono::steady_clock::now();
        const auto a = analyzer.analyze("text", {}, Direction::INBOUND, source.get_token());
        CHECK(std::chrono::steady_clock::now() - start < 1000ms);
        CHECK_FALSE(a.ran);
        CHECK(a.error == ErrorCategory::CANCELLED);
        CHECK(a.category == ThreatCategory::UNVERIFIED);
    }

    SECTION("Cancelled before the call") {
        std::stop_source source;
        source.request_stop();
        const auto a = analyzer.analyze("text", {}, Direction::INBOUND, source.get_token());
        CHECK(a.error == ErrorCategory::CANCELLED);
        CHECK(backend->call_count() == 0);
    }
}

TEST_CASE("Backend failures fall back", "[model][analyze]") {
    auto backend = std::make_shared<MockLlmBackend>();
    ModelAssistedAnalyzer analyzer(backend, fast_config());

    SECTION("Unsuccessful response") {
        backend->set_should_succeed(false);
        const auto a = analyzer.analyze("text", {}, Direction::OUTBOUND, {});
        CHECK_FALSE(a.ran);
        CHECK(a.error == ErrorCategory::MODEL_ERROR);
        CHECK(a.confidence == Catch::Approx(0.75));
    }

    SECTION("Backend throws") {
        backend->set_should_throw(true);
        ModelAnalysis a;
        REQUIRE_NOTHROW(a = analyzer.analyze("text", {}, Direction::OUTBOUND, {}));
        CHECK_FALSE(a.ran);
        CHECK(a.error == ErrorCategory::MODEL_ERROR);
    }
}

TEST_CASE("Missing backend falls back without a call", "[model][analyze]") {
    ModelAssistedAnalyzer analyzer(nullptr, fast_config());
    const auto a = analyzer.analyze("text", {}, Direction::INBOUND, {});
    CHECK_FALSE(a.ran);
    CHECK(a.error == ErrorCategory::MODEL_ERROR);
    CHECK(a.category == ThreatCategory::UNVERIFIED);
}

TEST_CASE("Unparseable answer fails closed", "[model][analyze]") {
    auto backend = std::make_shared<MockLlmBackend>("Sure! This looks safe to me.");
    ModelAssistedAnalyzer analyzer(backend, fast_config());

    const auto a = analyzer.analyze("text", {}, Direction::INBOUND, {});
    CHECK(a.ran);
    CHECK(a.error == ErrorCategory::PARSE_ERROR);
    CHECK(a.category == ThreatCategory::UNVERIFIED);
    CHECK(a.confidence == Catch::Approx(1.0));
}

TEST_CASE("Fallback confidence is configurable", "[model][analyze]") {
    auto backend = std::make_shared<MockLlmBackend>();
    backend->set_should_succeed(false);
    auto config = fast_config();
    config.fallback_confidence = 0.4;
    ModelAssistedAnalyzer analyzer(backend, config);
    CHECK(analyzer.analyze("text", {}, Direction::INBOUND, {}).confidence == Catch::Approx(0.4));
}
