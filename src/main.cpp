#include "config/config_loader.hpp"
#include "core/json.hpp"
#include "core/pipeline.hpp"
#include "core/shield_factory.hpp"
#include "core/utils.hpp"
#include "core/verdict_serializer.hpp"
#include "telemetry/metrics_registry.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

using namespace promptshield;

namespace {

constexpr int kExitAllowed = 0;
constexpr int kExitError = 1;
constexpr int kExitBlocked = 2;

// Cancels an in-flight model call on SIGINT/SIGTERM
std::stop_source g_stop;

void signal_handler(int /*signal*/) {
    g_stop.request_stop();
}

struct CliOptions {
    std::string config_file;
    Direction direction = Direction::INBOUND;
    std::string application_id;
    bool json_input = false;
    bool print_metrics = false;
    std::optional<std::string> text;
};

void print_usage(std::string_view program) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] [--direction inbound|outbound] [--app ID]\n"
        "       [--json] [--metrics] [TEXT]\n\n"
        "Analyzes TEXT (or stdin) and prints the verdict as JSON.\n"
        "Exit status: 0 allowed, 2 blocked, 1 usage or configuration error.\n",
        program);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.config_file = std::move(*v);
        } else if (arg == "--direction") {
            auto v = next();
            if (!v) return std::nullopt;
            if (*v == "inbound") {
                opts.direction = Direction::INBOUND;
            } else if (*v == "outbound") {
                opts.direction = Direction::OUTBOUND;
            } else {
                std::cerr << std::format("Unknown direction '{}'\n", *v);
                return std::nullopt;
            }
        } else if (arg == "--app") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.application_id = std::move(*v);
        } else if (arg == "--json") {
            opts.json_input = true;
        } else if (arg == "--metrics") {
            opts.print_metrics = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg.starts_with("--")) {
            std::cerr << std::format("Unknown option {}\n", arg);
            return std::nullopt;
        } else if (!opts.text) {
            opts.text = std::string(arg);
        } else {
            std::cerr << "Only one TEXT argument is accepted\n";
            return std::nullopt;
        }
    }
    return opts;
}

/**
 * @brief Request document: {"text", "application_id", "features",
 * "source_facts", "protected_phrases", "original_prompt", "desired_tone"}
 */
Result<AnalysisRequest> parse_request_document(const std::string& body) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error& e) {
        return Result<AnalysisRequest>::error(ErrorCategory::PARSE_ERROR, e.what());
    }
    if (!doc.is_object() || !doc["text"].is_string()) {
        return Result<AnalysisRequest>::error(ErrorCategory::PARSE_ERROR,
                                              "request document needs a string 'text'");
    }

    AnalysisRequest request;
    request.text = doc["text"].get<std::string>();
    request.application_id = doc.value<std::string>("application_id", "");
    request.original_prompt = doc.value<std::string>("original_prompt", "");
    request.desired_tone = doc.value<std::string>("desired_tone", "");
    request.source_facts = doc.string_array("source_facts");
    request.protected_phrases = doc.string_array("protected_phrases");

    for (const auto& [name, entry] : doc["features"].items()) {
        FeatureSetting setting;
        if (entry.is_boolean()) {
            setting.enabled = entry.get<bool>();
        } else if (entry.is_object()) {
            setting.enabled = entry.value<bool>("enabled", true);
            setting.threshold = entry.value<double>("threshold", 0.0);
        } else {
            continue;
        }
        request.feature_overrides[name] = setting;
    }
    return Result<AnalysisRequest>::ok(std::move(request));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argc > 0 ? argv[0] : "prompt_shield");
        return kExitError;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Configuration
        const auto config_result = opts->config_file.empty()
            ? ConfigLoader::load_defaults(ConfigLoader::process_env())
            : ConfigLoader::load_from_file(opts->config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitError;
        }
        const auto& cfg = config_result.config;
        if (!utils::log::set_level(cfg.logging.level)) {
            utils::log::warn(std::format("Unknown log level '{}'", cfg.logging.level));
        }

        // Input
        std::string input;
        if (opts->text) {
            input = *opts->text;
        } else {
            input.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }

        AnalysisRequest request;
        if (opts->json_input) {
            auto parsed = parse_request_document(input);
            if (parsed.is_error()) {
                utils::log::error(std::format("Invalid request document: {}", parsed.error_message()));
                return kExitError;
            }
            request = std::move(parsed.value());
        } else {
            request.text = std::move(input);
        }
        if (!opts->application_id.empty()) {
            request.application_id = opts->application_id;
        }
        request.direction = opts->direction;

        // Pipelines
        const auto metrics = std::make_shared<MetricsRegistry>();
        const auto engines = build_engines(cfg, nullptr, metrics);
        const auto& engine = opts->direction == Direction::INBOUND ? engines.inbound
                                                                   : engines.outbound;

        const Verdict verdict = engine->run(request, g_stop.get_token());
        std::cout << verdict_to_json(verdict) << '\n';
        if (opts->print_metrics) {
            std::cout << '\n' << metrics->to_prometheus();
        }
        return verdict.is_blocked ? kExitBlocked : kExitAllowed;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitError;
    }
}
