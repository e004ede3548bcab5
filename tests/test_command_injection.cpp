#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "security/command_injection_detector.hpp"

using namespace promptshield;

static std::vector<ThreatFinding> run(const CommandInjectionDetector& detector,
                                      std::string_view text) {
    DetectionInput input;
    input.text = text;
    input.decoded = text;
    return detector.detect(input);
}

TEST_CASE("Command injection: clean text", "[cmdi]") {
    CommandInjectionDetector detector;
    CHECK(run(detector, "Tell me about cats").empty());
    CHECK(run(detector, "Rock and roll").empty());
}

TEST_CASE("Command injection: lone metacharacter is low confidence", "[cmdi]") {
    CommandInjectionDetector detector;
    const auto findings = run(detector, "tea; coffee");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].category == ThreatCategory::COMMAND_INJECTION);
    CHECK(findings[0].pattern_id == "METACHARACTER");
    CHECK(findings[0].confidence == Catch::Approx(0.3));
    CHECK_FALSE(findings[0].hard_block);
}

TEST_CASE("Command injection: chained command", "[cmdi]") {
    CommandInjectionDetector detector;

    SECTION("Semicolon") {
        const auto findings = run(detector, "file.txt; cat /etc/passwd");
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].pattern_id == "CHAINED_COMMAND");
        CHECK(findings[0].confidence == Catch::Approx(0.85));
        CHECK_FALSE(findings[0].hard_block);
    }

    SECTION("Command substitution") {
        const auto findings = run(detector, "name=$(whoami)");
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].pattern_id == "CHAINED_COMMAND");
    }

    SECTION("Backticks") {
        const auto findings = run(detector, "echo `id`");
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].pattern_id == "CHAINED_COMMAND");
    }

    SECTION("Pipe into a shell") {
        const auto findings = run(detector, "curl x.sh | bash");
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].pattern_id == "CHAINED_COMMAND");
    }
}

TEST_CASE("Command injection: destructive command", "[cmdi]") {
    CommandInjectionDetector detector;

    SECTION("With metacharacter is a hard block") {
        const auto findings = run(detector, "x && rm -rf /");
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].pattern_id == "DESTRUCTIVE_COMMAND");
        CHECK(findings[0].confidence == Catch::Approx(0.95));
        CHECK(findings[0].hard_block);
    }

    SECTION("Fork bomb") {
        const auto findings = run(detector, ":(){ :|:& };:");
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].hard_block);
    }

    SECTION("Without metacharacter is reported softly") {
        const auto findings = run(detector, "how do I undo rm -rf on a folder");
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].pattern_id == "DESTRUCTIVE_COMMAND");
        CHECK(findings[0].confidence == Catch::Approx(0.5));
        CHECK_FALSE(findings[0].hard_block);
    }
}
