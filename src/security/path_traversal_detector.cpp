#include "security/path_traversal_detector.hpp"
#include "security/sanitizer.hpp"
#include "core/text.hpp"

#include <array>
#include <optional>
#include <utility>

namespace promptshield {

namespace {

constexpr std::array<std::string_view, 14> kSensitiveTargets = {
    "etc/passwd", "etc/shadow", "etc/hosts", ".ssh/", "id_rsa", "authorized_keys",
    "win.ini", "boot.ini", "system32", "proc/self", ".env", "web.config",
    ".htaccess", ".git/"
};

bool ends_path(char c) {
    switch (c) {
        case ' ': case '\t': case '\n': case '\r':
        case '"': case '\'': case '`': case '<': case '>':
        case '|': case ';': case ',': case '(': case ')': case '&':
            return true;
        default:
            return false;
    }
}

struct TargetHit {
    size_t offset;
    size_t length;
};

/**
 * @brief First sensitive target inside the path that follows a traversal
 * sequence. Only the path run after each sequence is searched.
 */
std::optional<TargetHit> find_traversal_target(std::string_view decoded) {
    for (const auto& flag : Sanitizer::find_traversal_sequences(decoded)) {
        const size_t start = flag.offset + flag.token.size();
        size_t end = start;
        while (end < decoded.size() && !ends_path(decoded[end])) ++end;
        const std::string_view path = decoded.substr(start, end - start);

        for (const auto target : kSensitiveTargets) {
            const size_t pos = text::find_ci(path, target);
            if (pos != std::string_view::npos) {
                return TargetHit{start + pos, target.size()};
            }
        }
    }
    return std::nullopt;
}

} // anonymous namespace

PathTraversalDetector::PathTraversalDetector(const Config& config)
    : config_(config) {}

std::vector<ThreatFinding> PathTraversalDetector::detect(const DetectionInput& input) const {
    std::vector<TraversalFlag> flags;
    if (input.sanitization != nullptr) {
        flags = input.sanitization->traversal_flags;
    }
    if (flags.empty()) {
        flags = Sanitizer::find_traversal_sequences(input.text);
    }
    if (flags.empty()) {
        return {};
    }

    ThreatFinding finding;
    finding.detector = std::string(name());
    finding.category = ThreatCategory::PATH_TRAVERSAL;
    finding.pattern_id = "TRAVERSAL_SEQUENCE";
    for (size_t i = 0; i < flags.size(); ++i) {
        finding.confidence = text::combine_confidence(finding.confidence, config_.base_confidence);
    }

    // Targets are looked up in the decoded text so %2e%2e%2fetc%2fpasswd resolves
    if (const auto hit = find_traversal_target(input.decoded)) {
        finding.confidence = text::combine_confidence(finding.confidence, config_.target_confidence);
        finding.pattern_id += ",SENSITIVE_TARGET";
        finding.evidence = make_evidence(input.decoded, hit->offset, hit->length);
    } else {
        finding.evidence = flags.front().token;
    }
    return {std::move(finding)};
}

} // namespace promptshield
