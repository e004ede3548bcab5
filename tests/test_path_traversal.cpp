#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "security/path_traversal_detector.hpp"
#include "security/sanitizer.hpp"
#include "core/text.hpp"

using namespace promptshield;

TEST_CASE("Path traversal: uses sanitizer flags", "[traversal]") {
    PathTraversalDetector detector;
    const auto sanitization = Sanitizer().sanitize("open ../../etc/passwd");
    REQUIRE(sanitization.traversal_flags.size() == 2);

    DetectionInput input;
    input.text = sanitization.text;
    input.decoded = sanitization.text;
    input.sanitization = &sanitization;

    const auto findings = detector.detect(input);
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].category == ThreatCategory::PATH_TRAVERSAL);
    CHECK(findings[0].pattern_id == "TRAVERSAL_SEQUENCE,SENSITIVE_TARGET");
    // two sequences at 0.4, then the sensitive target at 0.9
    CHECK(findings[0].confidence == Catch::Approx(0.964));
    REQUIRE(findings[0].evidence.has_value());
    CHECK(findings[0].evidence->find("etc/passwd") != std::string::npos);
}

TEST_CASE("Path traversal: rescans when sanitization was skipped", "[traversal]") {
    PathTraversalDetector detector;
    const std::string text = "..\\windows\\win.ini";

    DetectionInput input;
    input.text = text;
    input.decoded = text;

    const auto findings = detector.detect(input);
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].confidence == Catch::Approx(0.94));
}

TEST_CASE("Path traversal: sequence without a sensitive target", "[traversal]") {
    PathTraversalDetector detector;
    const std::string text = "see ../docs/readme";

    DetectionInput input;
    input.text = text;
    input.decoded = text;

    const auto findings = detector.detect(input);
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].pattern_id == "TRAVERSAL_SEQUENCE");
    CHECK(findings[0].confidence == Catch::Approx(0.4));
    CHECK(findings[0].evidence == "../");
}

TEST_CASE("Path traversal: unrelated target elsewhere in the text", "[traversal]") {
    PathTraversalDetector detector;
    const std::string text =
        "In a shell, cd ../ goes up one level. Separately, where should my .env file live?";

    DetectionInput input;
    input.text = text;
    input.decoded = text;

    const auto findings = detector.detect(input);
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].pattern_id == "TRAVERSAL_SEQUENCE");
    CHECK(findings[0].confidence == Catch::Approx(0.4));
    CHECK(findings[0].confidence < 0.7);
}

TEST_CASE("Path traversal: target must follow the sequence in the same path", "[traversal]") {
    PathTraversalDetector detector;
    const std::string text = "read etc/passwd then ../notes.txt";

    DetectionInput input;
    input.text = text;
    input.decoded = text;

    const auto findings = detector.detect(input);
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].pattern_id == "TRAVERSAL_SEQUENCE");
    CHECK(findings[0].evidence == "../");
}

TEST_CASE("Path traversal: encoded target resolves through decoding", "[traversal]") {
    PathTraversalDetector detector;
    const std::string text = "%2e%2e%2fetc%2fpasswd";
    const std::string decoded = text::decode_encodings(text);

    DetectionInput input;
    input.text = text;
    input.decoded = decoded;

    const auto findings = detector.detect(input);
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].pattern_id == "TRAVERSAL_SEQUENCE,SENSITIVE_TARGET");
}

TEST_CASE("Path traversal: clean text", "[traversal]") {
    PathTraversalDetector detector;
    const std::string text = "version 1.2.3 is out...";
    DetectionInput input;
    input.text = text;
    input.decoded = text;
    CHECK(detector.detect(input).empty());
}
