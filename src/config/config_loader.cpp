#include "config/config_loader.hpp"
#include "core/features.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace promptshield {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/**
 * @brief [features.<dir>] style table: name = bool, or name = {enabled, threshold}
 */
void read_feature_table(const toml::table& tbl, FeatureConfig& features) {
    for (const auto& [key, val] : tbl) {
        const std::string name(key.str());
        FeatureSetting setting = feature_setting(features, name);
        if (const auto* flag = val.as_boolean()) {
            setting.enabled = flag->get();
        } else if (const auto* entry = val.as_table()) {
            setting.enabled = (*entry)["enabled"].value_or(setting.enabled);
            setting.threshold = (*entry)["threshold"].value_or(setting.threshold);
        } else {
            utils::log::warn(std::format("Ignoring malformed feature entry '{}'", name));
            continue;
        }
        features[name] = setting;
    }
}

void validate_unit(double& value, double fallback, std::string_view key) {
    if (!(value >= 0.0 && value <= 1.0)) {
        utils::log::warn(std::format("{} = {} is outside [0,1], using {}", key, value, fallback));
        value = fallback;
    }
}

void validate_features(FeatureConfig& features, Direction direction, std::string_view scope) {
    const FeatureConfig defaults = default_features(direction);
    for (auto& [name, setting] : features) {
        const auto def = defaults.find(name);
        const double fallback = def != defaults.end() ? def->second.threshold : 0.0;
        validate_unit(setting.threshold, fallback,
                      std::format("{}.{}.threshold", scope, name));
    }
}

// ---- Environment override helpers ------------------------------------------

void env_bool(const ConfigLoader::EnvLookup& env, std::string_view key,
              const std::function<void(bool)>& apply) {
    const auto raw = env(key);
    if (!raw) return;
    if (const auto parsed = utils::try_parse_bool(utils::trim(*raw))) {
        apply(*parsed);
    } else {
        utils::log::warn(std::format("Ignoring {}: '{}' is not a boolean", key, *raw));
    }
}

void env_double(const ConfigLoader::EnvLookup& env, std::string_view key,
                const std::function<void(double)>& apply) {
    const auto raw = env(key);
    if (!raw) return;
    if (const auto parsed = utils::try_parse_double(utils::trim(*raw))) {
        apply(*parsed);
    } else {
        utils::log::warn(std::format("Ignoring {}: '{}' is not a number", key, *raw));
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

SanitizerConfig ConfigLoader::extract_sanitizer(const toml::table& root) {
    SanitizerConfig cfg;
    const auto* sanitizer = root["sanitizer"].as_table();
    if (!sanitizer) return cfg;
    const auto& s = *sanitizer;

    cfg.max_length = static_cast<size_t>(s["max_length"].value_or(int64_t{10000}));
    cfg.normalize_unicode = s["normalize_unicode"].value_or(true);
    cfg.collapse_whitespace = s["collapse_whitespace"].value_or(false);
    return cfg;
}

PiiConfig ConfigLoader::extract_pii(const toml::table& root) {
    PiiConfig cfg;
    const auto* pii = root["pii"].as_table();
    if (!pii) return cfg;
    const auto& p = *pii;

    cfg.custom_keywords = toml_string_array(p, "custom_keywords");
    cfg.detect_generic_tokens = p["detect_generic_tokens"].value_or(true);
    cfg.min_generic_token_length =
        static_cast<size_t>(p["min_generic_token_length"].value_or(int64_t{32}));
    return cfg;
}

ScoringConfig ConfigLoader::extract_scoring(const toml::table& root) {
    ScoringConfig cfg;
    const auto* scoring = root["scoring"].as_table();
    if (!scoring) return cfg;
    const auto& s = *scoring;

    cfg.auto_block_threshold = s["auto_block_threshold"].value_or(cfg.auto_block_threshold);
    cfg.suspicion_floor = s["suspicion_floor"].value_or(cfg.suspicion_floor);
    cfg.pii_increment = s["pii_increment"].value_or(cfg.pii_increment);
    return cfg;
}

bool ConfigLoader::extract_detectors(const toml::table& root) {
    const auto* detectors = root["detectors"].as_table();
    if (!detectors) return false;
    return (*detectors)["parallel"].value_or(false);
}

LlmConfig ConfigLoader::extract_llm(const toml::table& root) {
    LlmConfig cfg;
    const auto* llm = root["llm"].as_table();
    if (!llm) return cfg;
    const auto& l = *llm;

    cfg.client.enabled = l["enabled"].value_or(false);
    cfg.client.provider = utils::to_lower(l["provider"].value_or("openai"s));
    cfg.client.endpoint = l["endpoint"].value_or(cfg.client.endpoint);
    cfg.client.api_key = l["api_key"].value_or(""s);
    cfg.client.default_model = l["model"].value_or(cfg.client.default_model);
    cfg.client.timeout_ms = static_cast<uint32_t>(l["timeout_ms"].value_or(int64_t{5000}));
    cfg.client.max_retries = static_cast<uint32_t>(l["max_retries"].value_or(int64_t{0}));
    cfg.fallback_confidence = l["fallback_confidence"].value_or(cfg.fallback_confidence);
    cfg.max_tokens = static_cast<int>(l["max_tokens"].value_or(int64_t{256}));
    return cfg;
}

OutputConfig ConfigLoader::extract_output(const toml::table& root, FeatureConfig& outbound) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;
    const auto& o = *output;

    if (const auto mode = o["moderation_mode"].value<std::string>()) {
        if (const auto parsed = moderation_mode_from_string(*mode)) {
            cfg.moderation_mode = *parsed;
        } else {
            utils::log::warn(std::format("Unknown output.moderation_mode '{}', using moderate", *mode));
        }
    }
    if (const auto remediation = o["remediation"].value<std::string>()) {
        if (const auto parsed = remediation_from_string(*remediation)) {
            cfg.remediation = *parsed;
        } else {
            utils::log::warn(std::format("Unknown output.remediation '{}', using rewrite", *remediation));
        }
    }
    cfg.rewrite_notice = o["rewrite_notice"].value_or(cfg.rewrite_notice);
    cfg.default_tone = o["default_tone"].value_or(""s);
    if (o["suspicious_domains"].is_array()) {
        cfg.suspicious_domains = toml_string_array(o, "suspicious_domains");
    }
    cfg.disclaimers.min_keyword_hits = static_cast<size_t>(
        o["disclaimer_min_hits"].value_or(static_cast<int64_t>(cfg.disclaimers.min_keyword_hits)));

    if (const auto threshold = o["toxicity_threshold"].value<double>()) {
        outbound[std::string(feature::kToxicity)].threshold = *threshold;
    }
    return cfg;
}

void ConfigLoader::extract_features(const toml::table& root, std::string_view direction,
                                    FeatureConfig& features) {
    const auto* tbl = root["features"][direction].as_table();
    if (!tbl) return;
    read_feature_table(*tbl, features);
}

std::unordered_map<std::string, ApplicationPolicy> ConfigLoader::extract_applications(
    const toml::table& root) {
    std::unordered_map<std::string, ApplicationPolicy> apps;
    const auto* arr = root["applications"].as_array();
    if (!arr) return apps;

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        const auto id = (*tbl)["id"].value<std::string>();
        if (!id || id->empty()) {
            utils::log::warn("Skipping [[applications]] entry without an id");
            continue;
        }

        ApplicationPolicy policy;
        policy.always_verify = (*tbl)["always_verify"].value_or(false);
        if (const auto* features = (*tbl)["features"].as_table()) {
            read_feature_table(*features, policy.features);
        }
        apps[*id] = std::move(policy);
    }
    return apps;
}

// ---- Shared extraction + validation ----------------------------------------

ShieldConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ShieldConfig config;
    config.logging = extract_logging(tbl);
    config.sanitizer = extract_sanitizer(tbl);
    config.pii = extract_pii(tbl);
    config.scoring = extract_scoring(tbl);
    config.parallel_detectors = extract_detectors(tbl);
    config.llm = extract_llm(tbl);
    config.output = extract_output(tbl, config.outbound_features);
    extract_features(tbl, "inbound", config.inbound_features);
    extract_features(tbl, "outbound", config.outbound_features);
    config.applications = extract_applications(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ShieldConfig config,
                                                          const EnvLookup& env) {
    apply_env_overrides(config, env);
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Environment overrides -------------------------------------------------

ConfigLoader::EnvLookup ConfigLoader::process_env() {
    return [](std::string_view key) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(key).c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

void ConfigLoader::apply_env_overrides(ShieldConfig& config, const EnvLookup& env) {
    const auto inbound_switch = [&](std::string_view key, std::string_view name) {
        env_bool(env, key, [&](bool v) { config.inbound_features[std::string(name)].enabled = v; });
    };

    inbound_switch("SECURITY_SANITIZATION_ENABLED", feature::kSanitization);
    inbound_switch("SECURITY_PII_REDACTION_ENABLED", feature::kPiiRedaction);
    inbound_switch("SECURITY_XSS_PROTECTION_ENABLED", feature::kXss);
    inbound_switch("SECURITY_SQL_INJECTION_DETECTION_ENABLED", feature::kSqlInjection);
    inbound_switch("SECURITY_COMMAND_INJECTION_DETECTION_ENABLED", feature::kCommandInjection);
    inbound_switch("SECURITY_PATH_TRAVERSAL_DETECTION_ENABLED", feature::kPathTraversal);
    inbound_switch("SECURITY_PROMPT_INJECTION_DETECTION_ENABLED", feature::kPromptInjection);

    const std::string llm_check(feature::kLlmCheck);
    env_bool(env, "SECURITY_LLM_CHECK_ENABLED", [&](bool v) {
        config.inbound_features[llm_check].enabled = v;
        config.outbound_features[llm_check].enabled = v;
    });
    env_double(env, "SECURITY_LLM_CHECK_THRESHOLD", [&](double v) {
        config.inbound_features[llm_check].threshold = v;
        config.outbound_features[llm_check].threshold = v;
    });
    env_double(env, "SECURITY_AUTO_BLOCK_THRESHOLD", [&](double v) {
        config.scoring.auto_block_threshold = v;
    });
    env_double(env, "HARMFUL_CONTENT_THRESHOLD", [&](double v) {
        config.outbound_features[std::string(feature::kToxicity)].threshold = v;
    });
    env_bool(env, "OUTPUT_PII_DETECTION_ENABLED", [&](bool v) {
        config.outbound_features[std::string(feature::kOutputPiiScan)].enabled = v;
    });

    if (const auto mode = env("DEFAULT_MODERATION_MODE")) {
        if (const auto parsed = moderation_mode_from_string(utils::trim(*mode))) {
            config.output.moderation_mode = *parsed;
        } else {
            utils::log::warn(std::format("Ignoring DEFAULT_MODERATION_MODE: unknown mode '{}'", *mode));
        }
    }
    if (const auto model = env("LLM_MODEL_NAME"); model && !model->empty()) {
        config.llm.client.default_model = *model;
    }
    if (const auto key = env("LLM_API_KEY"); key && !key->empty()) {
        config.llm.client.api_key = *key;
    }
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl), process_env());
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    return load_from_string(toml_content, process_env());
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content,
                                                        const EnvLookup& env) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl), env);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_defaults(const EnvLookup& env) {
    return validate_and_return(ShieldConfig{}, env);
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(ShieldConfig& config) {
    std::vector<std::string> errors;
    const ShieldConfig defaults;

    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warn" && config.logging.level != "error") {
        utils::log::warn(std::format("Unknown logging.level '{}', using info", config.logging.level));
        config.logging.level = "info";
    }

    if (config.sanitizer.max_length == 0) {
        utils::log::warn("sanitizer.max_length must be > 0, using 10000");
        config.sanitizer.max_length = defaults.sanitizer.max_length;
    }

    if (config.pii.min_generic_token_length < 16) {
        utils::log::warn(std::format("pii.min_generic_token_length {} too short, using 32",
                                     config.pii.min_generic_token_length));
        config.pii.min_generic_token_length = defaults.pii.min_generic_token_length;
    }

    validate_unit(config.scoring.auto_block_threshold, defaults.scoring.auto_block_threshold,
                  "scoring.auto_block_threshold");
    validate_unit(config.scoring.suspicion_floor, defaults.scoring.suspicion_floor,
                  "scoring.suspicion_floor");
    validate_unit(config.scoring.pii_increment, defaults.scoring.pii_increment,
                  "scoring.pii_increment");
    if (config.scoring.suspicion_floor >= config.scoring.auto_block_threshold) {
        utils::log::warn(std::format(
            "scoring.suspicion_floor ({}) >= auto_block_threshold ({}), using defaults",
            config.scoring.suspicion_floor, config.scoring.auto_block_threshold));
        config.scoring.suspicion_floor = defaults.scoring.suspicion_floor;
        config.scoring.auto_block_threshold = defaults.scoring.auto_block_threshold;
    }

    validate_unit(config.llm.fallback_confidence, defaults.llm.fallback_confidence,
                  "llm.fallback_confidence");
    if (config.llm.client.timeout_ms == 0) {
        utils::log::warn("llm.timeout_ms must be > 0, using 5000");
        config.llm.client.timeout_ms = defaults.llm.client.timeout_ms;
    }
    if (config.llm.max_tokens <= 0) {
        utils::log::warn("llm.max_tokens must be > 0, using 256");
        config.llm.max_tokens = defaults.llm.max_tokens;
    }
    if (config.llm.client.provider != "openai" && config.llm.client.provider != "anthropic") {
        errors.push_back(std::format("llm.provider must be 'openai' or 'anthropic', got '{}'",
                                     config.llm.client.provider));
    }
    if (config.llm.client.enabled && config.llm.client.endpoint.empty()) {
        errors.push_back("llm.endpoint required when llm.enabled is true");
    }

    validate_features(config.inbound_features, Direction::INBOUND, "features.inbound");
    validate_features(config.outbound_features, Direction::OUTBOUND, "features.outbound");
    for (auto& [id, app] : config.applications) {
        // Application overrides may name features of either direction
        for (auto& [name, setting] : app.features) {
            validate_unit(setting.threshold, 0.1,
                          std::format("applications.{}.features.{}.threshold", id, name));
        }
    }

    return errors;
}

} // namespace promptshield
