#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads prompt_shield.toml into a ShieldConfig
 *
 * - ${VAR} values are expanded from the environment
 * - include = ["other.toml"] files are deep-merged (main file wins)
 * - environment-style override keys (SECURITY_*_ENABLED, ...) apply last
 *
 * Structural problems (bad TOML, unreadable include, unknown provider) are
 * LoadResult errors. Out-of-range numbers are logged and reset to defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ShieldConfig config;

        static LoadResult ok(ShieldConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to prompt_shield.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Same as load_from_string with an explicit override source
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content,
                                                     const EnvLookup& env);

    /**
     * @brief Defaults plus environment overrides, no file
     */
    [[nodiscard]] static LoadResult load_defaults(const EnvLookup& env);

    /**
     * @brief Apply SECURITY_* / OUTPUT_* / LLM_* override keys
     */
    static void apply_env_overrides(ShieldConfig& config, const EnvLookup& env);

    [[nodiscard]] static EnvLookup process_env();

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static SanitizerConfig extract_sanitizer(const toml::table& root);
    static PiiConfig extract_pii(const toml::table& root);
    static ScoringConfig extract_scoring(const toml::table& root);
    static bool extract_detectors(const toml::table& root);
    static LlmConfig extract_llm(const toml::table& root);
    static OutputConfig extract_output(const toml::table& root, FeatureConfig& outbound);
    static void extract_features(const toml::table& root, std::string_view direction,
                                 FeatureConfig& features);
    static std::unordered_map<std::string, ApplicationPolicy> extract_applications(
        const toml::table& root);

    static ShieldConfig extract_all_sections(const toml::table& tbl);

    /**
     * @brief Reset out-of-range values to defaults (warn); return hard errors
     */
    [[nodiscard]] static std::vector<std::string> validate_config(ShieldConfig& config);

    [[nodiscard]] static LoadResult validate_and_return(ShieldConfig config, const EnvLookup& env);
};

} // namespace promptshield
