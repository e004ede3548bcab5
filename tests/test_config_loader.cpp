#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/config_loader.hpp"

#include <filesystem>
#include <fstream>
#include <unordered_map>

using namespace promptshield;

namespace {

// No overrides from the real environment
ConfigLoader::EnvLookup no_env() {
    return [](std::string_view) -> std::optional<std::string> { return std::nullopt; };
}

ConfigLoader::LoadResult load(const std::string& toml) {
    return ConfigLoader::load_from_string(toml, no_env());
}

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "prompt_shield_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // anonymous namespace

TEST_CASE("Empty config yields defaults", "[config]") {
    const auto result = load("");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.sanitizer.max_length == 10000);
    CHECK(cfg.scoring.auto_block_threshold == Catch::Approx(0.7));
    CHECK(cfg.scoring.suspicion_floor == Catch::Approx(0.25));
    CHECK_FALSE(cfg.llm.client.enabled);
    CHECK(cfg.output.moderation_mode == ModerationMode::MODERATE);
    CHECK(cfg.output.remediation == RemediationAction::REWRITE);
    CHECK(cfg.inbound_features.size() == 8);
    CHECK(cfg.outbound_features.size() == 10);
}

TEST_CASE("Sections are read", "[config]") {
    const auto result = load(R"(
[logging]
level = "debug"

[sanitizer]
max_length = 2048
normalize_unicode = false
collapse_whitespace = true

[pii]
custom_keywords = ["nightingale", "bluebird"]
detect_generic_tokens = false
min_generic_token_length = 40

[scoring]
auto_block_threshold = 0.8
suspicion_floor = 0.3
pii_increment = 0.1

[detectors]
parallel = true

[llm]
enabled = true
provider = "Anthropic"
endpoint = "https://api.anthropic.com"
api_key = "k"
model = "claude-test"
timeout_ms = 1500
fallback_confidence = 0.6
max_tokens = 128

[output]
moderation_mode = "strict"
remediation = "block"
rewrite_notice = "[withheld]"
default_tone = "professional"
suspicious_domains = ["fake.org"]
disclaimer_min_hits = 3
toxicity_threshold = 0.65
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.sanitizer.max_length == 2048);
    CHECK_FALSE(cfg.sanitizer.normalize_unicode);
    CHECK(cfg.sanitizer.collapse_whitespace);
    CHECK(cfg.pii.custom_keywords == std::vector<std::string>{"nightingale", "bluebird"});
    CHECK_FALSE(cfg.pii.detect_generic_tokens);
    CHECK(cfg.pii.min_generic_token_length == 40);
    CHECK(cfg.scoring.auto_block_threshold == Catch::Approx(0.8));
    CHECK(cfg.scoring.suspicion_floor == Catch::Approx(0.3));
    CHECK(cfg.scoring.pii_increment == Catch::Approx(0.1));
    CHECK(cfg.parallel_detectors);

    CHECK(cfg.llm.client.enabled);
    CHECK(cfg.llm.client.provider == "anthropic");
    CHECK(cfg.llm.client.default_model == "claude-test");
    CHECK(cfg.llm.client.timeout_ms == 1500);
    CHECK(cfg.llm.fallback_confidence == Catch::Approx(0.6));
    CHECK(cfg.llm.max_tokens == 128);

    CHECK(cfg.output.moderation_mode == ModerationMode::STRICT);
    CHECK(cfg.output.remediation == RemediationAction::BLOCK);
    CHECK(cfg.output.rewrite_notice == "[withheld]");
    CHECK(cfg.output.default_tone == "professional");
    CHECK(cfg.output.suspicious_domains == std::vector<std::string>{"fake.org"});
    CHECK(cfg.output.disclaimers.min_keyword_hits == 3);
    CHECK(feature_setting(cfg.outbound_features, "toxicity").threshold == Catch::Approx(0.65));
}

TEST_CASE("Feature tables accept booleans and inline tables", "[config][features]") {
    const auto result = load(R"(
[features.inbound]
xss = false
sql_injection = { enabled = true, threshold = 0.4 }
llm_check = { threshold = 0.6 }

[features.outbound]
tone = false
)");
    REQUIRE(result.success);
    const auto& in = result.config.inbound_features;
    CHECK_FALSE(feature_setting(in, "xss").enabled);
    CHECK(feature_setting(in, "sql_injection").threshold == Catch::Approx(0.4));
    CHECK(feature_setting(in, "llm_check").enabled);
    CHECK(feature_setting(in, "llm_check").threshold == Catch::Approx(0.6));
    CHECK_FALSE(feature_setting(result.config.outbound_features, "tone").enabled);
}

TEST_CASE("Applications are keyed by id", "[config][applications]") {
    const auto result = load(R"(
[[applications]]
id = "support-bot"
features = { xss = false }

[[applications]]
id = "finance"
always_verify = true

[[applications]]
always_verify = true
)");
    REQUIRE(result.success);
    const auto& apps = result.config.applications;
    REQUIRE(apps.size() == 2);
    CHECK_FALSE(apps.at("support-bot").always_verify);
    CHECK_FALSE(feature_setting(apps.at("support-bot").features, "xss").enabled);
    CHECK(apps.at("finance").always_verify);
}

TEST_CASE("Out-of-range values are reset to defaults", "[config][validation]") {
    const auto result = load(R"(
[logging]
level = "chatty"

[sanitizer]
max_length = 0

[scoring]
auto_block_threshold = 1.7
pii_increment = -1.0

[llm]
timeout_ms = 0
fallback_confidence = 2.0

[features.inbound]
xss = { threshold = 3.0 }
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.sanitizer.max_length == 10000);
    CHECK(cfg.scoring.auto_block_threshold == Catch::Approx(0.7));
    CHECK(cfg.scoring.pii_increment == Catch::Approx(0.05));
    CHECK(cfg.llm.client.timeout_ms == 5000);
    CHECK(cfg.llm.fallback_confidence == Catch::Approx(0.75));
    CHECK(feature_setting(cfg.inbound_features, "xss").threshold == Catch::Approx(0.1));
}

TEST_CASE("Inverted floor and threshold fall back together", "[config][validation]") {
    const auto result = load(R"(
[scoring]
auto_block_threshold = 0.3
suspicion_floor = 0.5
)");
    REQUIRE(result.success);
    CHECK(result.config.scoring.auto_block_threshold == Catch::Approx(0.7));
    CHECK(result.config.scoring.suspicion_floor == Catch::Approx(0.25));
}

TEST_CASE("Structural problems are load errors", "[config][validation]") {
    SECTION("Unknown provider") {
        const auto result = load("[llm]\nprovider = \"acme\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("llm.provider") != std::string::npos);
    }

    SECTION("Enabled without an endpoint") {
        const auto result = load("[llm]\nenabled = true\nendpoint = \"\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("llm.endpoint") != std::string::npos);
    }

    SECTION("Malformed TOML") {
        const auto result = load("[scoring\nauto_block_threshold = ");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
    }

    SECTION("Missing file") {
        const auto result = ConfigLoader::load_from_file("/nonexistent/prompt_shield.toml");
        CHECK_FALSE(result.success);
    }
}

TEST_CASE("Included files merge under the main file", "[config][include]") {
    TmpDir tmp;
    tmp.file("base.toml", R"(
[scoring]
auto_block_threshold = 0.9
suspicion_floor = 0.4

[pii]
custom_keywords = ["alpha"]
)");
    const auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[scoring]
suspicion_floor = 0.2

[pii]
custom_keywords = ["beta"]
)");

    const auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.scoring.auto_block_threshold == Catch::Approx(0.9));
    CHECK(result.config.scoring.suspicion_floor == Catch::Approx(0.2));
    CHECK(result.config.pii.custom_keywords == std::vector<std::string>{"alpha", "beta"});
}

TEST_CASE("Circular includes are rejected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");
    const auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}
