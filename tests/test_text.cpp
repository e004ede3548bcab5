#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/text.hpp"

using namespace promptshield;

TEST_CASE("UTF-8 decoding", "[text][utf8]") {
    SECTION("Multi-byte code point") {
        const std::string s = "\xE2\x82\xAC";   // U+20AC
        size_t pos = 0;
        CHECK(text::decode_utf8(s, pos) == 0x20AC);
        CHECK(pos == 3);
    }

    SECTION("Overlong form consumes one byte") {
        const std::string s = "\xC0\xAF";
        size_t pos = 0;
        CHECK(text::decode_utf8(s, pos) == text::kReplacementChar);
        CHECK(pos == 1);
    }

    SECTION("Surrogate is rejected") {
        const std::string s = "\xED\xA0\x80";
        size_t pos = 0;
        CHECK(text::decode_utf8(s, pos) == text::kReplacementChar);
        CHECK(pos == 1);
    }

    SECTION("Truncated sequence") {
        const std::string s = "\xE2\x82";
        size_t pos = 0;
        CHECK(text::decode_utf8(s, pos) == text::kReplacementChar);
        CHECK(pos == 1);
    }
}

TEST_CASE("Code point boundary", "[text][utf8]") {
    const std::string s = "ab\xC3\xA9" "c";   // "abéc"
    CHECK(text::utf8_boundary(s, 10) == s.size());
    CHECK(text::utf8_boundary(s, 3) == 2);
    CHECK(text::utf8_boundary(s, 4) == 4);
}

TEST_CASE("Case-insensitive search", "[text]") {
    CHECK(text::find_ci("Hello World", "WORLD") == 6);
    CHECK(text::find_ci("Hello", "xyz") == std::string_view::npos);
    CHECK(text::contains_ci("UNION select", "union SELECT"));
}

TEST_CASE("Keyword search requires word boundaries", "[text]") {
    CHECK(text::find_keyword("the law says", "law") == 4);
    CHECK(text::find_keyword("a lawyer", "law") == std::string_view::npos);
    CHECK(text::find_keyword("call sleep(5)", "sleep(") == 5);
    CHECK(text::find_keyword("lawn law", "law") == 5);
}

TEST_CASE("Encoding decoder flattens nested encodings", "[text][decode]") {
    CHECK(text::decode_encodings("%3Cscript%3E") == "<script>");
    CHECK(text::decode_encodings("&lt;b&gt;") == "<b>");
    CHECK(text::decode_encodings("&#60;&#x3C;") == "<<");
    CHECK(text::decode_encodings("%2527") == "'");
    CHECK(text::decode_encodings("&amp;lt;") == "<");
    CHECK(text::decode_encodings("100% sure") == "100% sure");
    CHECK(text::decode_encodings("&unknown;") == "&unknown;");
}

TEST_CASE("Noisy-OR combination is monotonic", "[text]") {
    CHECK(text::combine_confidence(0.0, 0.5) == Catch::Approx(0.5));
    CHECK(text::combine_confidence(0.5, 0.5) == Catch::Approx(0.75));
    CHECK(text::combine_confidence(0.35, 0.6) > 0.6);
    CHECK(text::combine_confidence(1.0, 0.2) == Catch::Approx(1.0));
}

TEST_CASE("Excerpts are bounded and centered", "[text][excerpt]") {
    const std::string s(200, 'x');
    CHECK(text::excerpt(s, 100, 5, 48).size() == 48);
    CHECK(text::excerpt(s, 0, 200, 48).size() == 48);
    CHECK(text::excerpt("short", 1, 2, 48) == "short");
    CHECK(text::excerpt("short", 10, 2, 48).empty());

    // Never starts or ends inside a multi-byte character
    const std::string wide = "\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC";
    const auto e = text::excerpt(wide, 4, 1, 4);
    CHECK(e == "\xE2\x82\xAC");
}
