#include <catch2/catch_test_macros.hpp>
#include "core/verdict_serializer.hpp"

using namespace promptshield;

TEST_CASE("Empty verdict serializes with every key", "[serializer]") {
    const Verdict v;
    CHECK(verdict_to_json(v) ==
          R"({"direction":"inbound","security_score":0.0000,"is_blocked":false,"block_reason":null,)"
          R"("threats":[],"pii":[],"sanitized_text":"","redacted_text":"","final_text":"",)"
          R"("warnings":[],"escalated":false,"model_stage_ran":false,"remediation":"none",)"
          R"("disclaimer":null,"false_refusal":false})");
}

TEST_CASE("Blocked verdict with findings", "[serializer]") {
    Verdict v;
    v.security_score = 0.818;
    v.is_blocked = true;
    v.block_reason = "sql-injection";
    v.remediation = RemediationAction::BLOCK;
    v.sanitized_text = "&#x27; OR 1=1 --";

    ThreatFinding t;
    t.detector = "sql_injection_detector";
    t.category = ThreatCategory::SQL_INJECTION;
    t.confidence = 0.818;
    t.pattern_id = "QUOTE_BREAK,TAUTOLOGY,COMMENT";
    t.evidence = "' OR 1=1 --";
    v.threats.push_back(t);

    PiiFinding p;
    p.category = PiiCategory::EMAIL;
    p.offset = 5;
    p.length = 11;
    p.mask = "[EMAIL_REDACTED]";
    p.fingerprint = "0123456789abcdef";
    v.pii.push_back(p);

    const auto json = verdict_to_json(v);
    CHECK(json.find(R"("security_score":0.8180,"is_blocked":true,"block_reason":"sql-injection")")
          != std::string::npos);
    CHECK(json.find(R"({"detector":"sql_injection_detector","category":"sql-injection","confidence":0.8180,)"
                    R"("pattern_id":"QUOTE_BREAK,TAUTOLOGY,COMMENT","evidence":"' OR 1=1 --","hard_block":false})")
          != std::string::npos);
    CHECK(json.find(R"({"category":"email","offset":5,"length":11,"mask":"[EMAIL_REDACTED]","fingerprint":"0123456789abcdef"})")
          != std::string::npos);
    CHECK(json.find(R"("remediation":"block")") != std::string::npos);
}

TEST_CASE("Strings are escaped", "[serializer]") {
    Verdict v;
    v.final_text = "line one\n\"quoted\"\\";
    v.warnings = {"Input truncated from 12 to 10 bytes"};
    const auto json = verdict_to_json(v);
    CHECK(json.find(R"("final_text":"line one\n\"quoted\"\\")") != std::string::npos);
    CHECK(json.find(R"("warnings":["Input truncated from 12 to 10 bytes"])") != std::string::npos);
}

TEST_CASE("Equal verdicts serialize identically", "[serializer]") {
    Verdict v;
    v.direction = Direction::OUTBOUND;
    v.security_score = 1.0 / 3.0;
    v.disclaimer = "Consult a professional.";
    v.false_refusal = true;

    const Verdict copy = v;
    CHECK(verdict_to_json(v) == verdict_to_json(copy));
    CHECK(verdict_to_json(v).find(R"("security_score":0.3333)") != std::string::npos);
    CHECK(verdict_to_json(v).find(R"("disclaimer":"Consult a professional.","false_refusal":true})")
          != std::string::npos);
}
