#include "security/command_injection_detector.hpp"

#include <utility>

namespace promptshield {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

// Shell metacharacters that start or chain a command
constexpr const char* kMetacharacters = R"((?:&&|\|\||[;|`]|\$\(|\$\{))";

constexpr const char* kCommands =
    R"((?:cat|ls|whoami|id|uname|pwd|ps|env|echo|curl|wget|nc|ncat|netcat|telnet|ssh|scp|)"
    R"(bash|sh|zsh|dash|python[23]?|perl|php|ruby|node|chmod|chown|chgrp|rm|mv|cp|kill|)"
    R"(killall|pkill|nohup|crontab|sudo|su|base64|xargs|find|tee|touch|mkdir))";

} // anonymous namespace

CommandInjectionDetector::CommandInjectionDetector(const Config& config)
    : config_(config),
      metacharacter_regex_(kMetacharacters),
      chained_command_regex_(std::string(kMetacharacters) + R"(\s*)" + kCommands + R"(\b)",
                             kIcase),
      destructive_regex_(
          R"(\brm\s+-[a-z]*(?:rf|fr)[a-z]*\b|\bmkfs(?:\.\w+)?\b|\bdd\s+if=|\bshutdown\b|\breboot\b|\bhalt\b|:\(\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)",
          kIcase) {}

std::vector<ThreatFinding> CommandInjectionDetector::detect(const DetectionInput& input) const {
    const std::string_view text = input.decoded;
    const char* const begin = text.data();
    const char* const end = text.data() + text.size();

    std::cmatch meta;
    if (!std::regex_search(begin, end, meta, metacharacter_regex_)) {
        // No metacharacter: only a bare destructive command can still be reported
        std::cmatch destructive;
        if (!std::regex_search(begin, end, destructive, destructive_regex_)) {
            return {};
        }
        ThreatFinding finding;
        finding.detector = std::string(name());
        finding.category = ThreatCategory::COMMAND_INJECTION;
        finding.confidence = config_.destructive_alone_confidence;
        finding.pattern_id = "DESTRUCTIVE_COMMAND";
        finding.evidence = make_evidence(text, static_cast<size_t>(destructive.position(0)),
                                         static_cast<size_t>(destructive.length(0)));
        return {std::move(finding)};
    }

    ThreatFinding finding;
    finding.detector = std::string(name());
    finding.category = ThreatCategory::COMMAND_INJECTION;
    finding.confidence = config_.metacharacter_confidence;
    finding.pattern_id = "METACHARACTER";
    size_t offset = static_cast<size_t>(meta.position(0));
    size_t length = static_cast<size_t>(meta.length(0));

    std::cmatch chained;
    if (std::regex_search(begin, end, chained, chained_command_regex_)) {
        finding.confidence = config_.chained_command_confidence;
        finding.pattern_id = "CHAINED_COMMAND";
        offset = static_cast<size_t>(chained.position(0));
        length = static_cast<size_t>(chained.length(0));
    }

    std::cmatch destructive;
    if (std::regex_search(begin, end, destructive, destructive_regex_)) {
        finding.confidence = config_.destructive_confidence;
        finding.pattern_id = "DESTRUCTIVE_COMMAND";
        finding.hard_block = true;
        offset = static_cast<size_t>(destructive.position(0));
        length = static_cast<size_t>(destructive.length(0));
    }

    finding.evidence = make_evidence(text, offset, length);
    return {std::move(finding)};
}

} // namespace promptshield
