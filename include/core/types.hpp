#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>
#include <array>
#include <string_view>

namespace promptshield {

// ============================================================================
// Basic Enums
// ============================================================================

enum class Direction : uint8_t {
    INBOUND,
    OUTBOUND
};

/**
 * @brief PII categories, declared in overlap-resolution priority order.
 * Lower underlying value wins ties between equal-length matches.
 */
enum class PiiCategory : uint8_t {
    SSN,
    CREDIT_CARD,
    EMAIL,
    PHONE,
    CREDENTIAL,
    KEYWORD
};

inline constexpr size_t kPiiCategoryCount = 6;

/**
 * @brief Threat categories, declared in aggregation priority order.
 */
enum class ThreatCategory : uint8_t {
    COMMAND_INJECTION,
    SQL_INJECTION,
    XSS,
    PATH_TRAVERSAL,
    PROMPT_INJECTION,
    JAILBREAK,
    MALICIOUS_INTENT,
    DATA_LEAK,
    TOXICITY,
    HALLUCINATION,
    UNVERIFIED_CITATION,
    TONE_VIOLATION,
    UNVERIFIED,
    BENIGN
};

enum class RemediationAction : uint8_t {
    NONE,
    BLOCK,
    REWRITE
};

enum class ModerationMode : uint8_t {
    STRICT,
    MODERATE,
    RELAXED,
    RAW
};

// ============================================================================
// Request
// ============================================================================

/**
 * @brief Per-feature switch: enabled flag plus a threshold in [0,1].
 */
struct FeatureSetting {
    bool enabled = true;
    double threshold = 0.0;
};

/**
 * @brief Feature name -> setting. Names are fixed per direction; unknown
 * names are carried but never consulted.
 */
using FeatureConfig = std::unordered_map<std::string, FeatureSetting>;

// Missing names are treated as enabled with a zero threshold
[[nodiscard]] inline FeatureSetting feature_setting(const FeatureConfig& features,
                                                    std::string_view name) {
    const auto it = features.find(std::string(name));
    return it != features.end() ? it->second : FeatureSetting{};
}

/**
 * @brief Per-application policy keyed by the authenticated application id
 */
struct ApplicationPolicy {
    FeatureConfig features;
    bool always_verify = false;
};

/**
 * @brief Client metadata forwarded by the orchestrator. Informational only.
 */
struct ClientMetadata {
    std::string origin_address;
    std::string user_agent;
};

/**
 * @brief Input to one pipeline run. Built by the orchestrator, never mutated.
 */
struct AnalysisRequest {
    std::string text;
    Direction direction = Direction::INBOUND;
    std::string application_id;
    FeatureConfig feature_overrides;
    ClientMetadata client;

    // Outbound only
    std::string original_prompt;
    std::vector<std::string> source_facts;
    std::vector<std::string> protected_phrases;
    std::string desired_tone;
};

// ============================================================================
// Stage Results
// ============================================================================

struct TraversalFlag {
    size_t offset = 0;
    std::string token;
};

struct SanitizationResult {
    std::string text;
    std::vector<std::string> warnings;
    std::vector<TraversalFlag> traversal_flags;
    bool markup_escaped = false;
    bool truncated = false;
};

struct PiiFinding {
    PiiCategory category = PiiCategory::KEYWORD;
    size_t offset = 0;
    size_t length = 0;
    std::string mask;
    std::string fingerprint;
};

struct PiiReport {
    std::vector<PiiFinding> findings;
    std::string redacted_text;
    std::array<uint32_t, kPiiCategoryCount> category_counts{};

    [[nodiscard]] size_t distinct_categories() const {
        size_t n = 0;
        for (const auto c : category_counts) {
            if (c > 0) ++n;
        }
        return n;
    }
};

struct ThreatFinding {
    std::string detector;
    ThreatCategory category = ThreatCategory::BENIGN;
    double confidence = 0.0;
    std::string pattern_id;
    std::optional<std::string> evidence;
    bool hard_block = false;
};

// ============================================================================
// Verdict
// ============================================================================

/**
 * @brief The decision record for one request or response.
 *
 * Produced once by VerdictAggregator and never modified afterwards.
 */
struct Verdict {
    Direction direction = Direction::INBOUND;
    double security_score = 0.0;
    bool is_blocked = false;
    std::optional<std::string> block_reason;
    std::vector<ThreatFinding> threats;
    std::vector<PiiFinding> pii;
    std::string sanitized_text;
    std::string redacted_text;
    std::string final_text;
    std::vector<std::string> warnings;
    bool escalated = false;
    bool model_stage_ran = false;
    RemediationAction remediation = RemediationAction::NONE;

    // Outbound annotations
    std::optional<std::string> disclaimer;
    bool false_refusal = false;
};

// ============================================================================
// Block Reasons (closed taxonomy beyond category names)
// ============================================================================

namespace block_reason {
    inline constexpr std::string_view kMultipleIndicators = "multiple indicators";
    inline constexpr std::string_view kSensitiveData = "sensitive-data";
    inline constexpr std::string_view kVerificationFailed = "verification-failed";
}

// ============================================================================
// Helper Functions
// ============================================================================

inline const char* direction_to_string(Direction direction) {
    switch (direction) {
        case Direction::INBOUND: return "inbound";
        case Direction::OUTBOUND: return "outbound";
        default: return "unknown";
    }
}

inline const char* pii_category_to_string(PiiCategory category) {
    switch (category) {
        case PiiCategory::SSN: return "ssn";
        case PiiCategory::CREDIT_CARD: return "credit-card";
        case PiiCategory::EMAIL: return "email";
        case PiiCategory::PHONE: return "phone";
        case PiiCategory::CREDENTIAL: return "credential";
        case PiiCategory::KEYWORD: return "keyword";
        default: return "unknown";
    }
}

inline const char* threat_category_to_string(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::COMMAND_INJECTION: return "command-injection";
        case ThreatCategory::SQL_INJECTION: return "sql-injection";
        case ThreatCategory::XSS: return "xss";
        case ThreatCategory::PATH_TRAVERSAL: return "path-traversal";
        case ThreatCategory::PROMPT_INJECTION: return "prompt-injection";
        case ThreatCategory::JAILBREAK: return "jailbreak";
        case ThreatCategory::MALICIOUS_INTENT: return "malicious-intent";
        case ThreatCategory::DATA_LEAK: return "data-leak";
        case ThreatCategory::TOXICITY: return "toxicity";
        case ThreatCategory::HALLUCINATION: return "hallucination";
        case ThreatCategory::UNVERIFIED_CITATION: return "unverified-citation";
        case ThreatCategory::TONE_VIOLATION: return "tone-violation";
        case ThreatCategory::UNVERIFIED: return "unverified";
        case ThreatCategory::BENIGN: return "benign";
        default: return "unknown";
    }
}

inline std::optional<ThreatCategory> threat_category_from_string(std::string_view name) {
    static constexpr std::array<ThreatCategory, 14> all = {
        ThreatCategory::COMMAND_INJECTION, ThreatCategory::SQL_INJECTION,
        ThreatCategory::XSS, ThreatCategory::PATH_TRAVERSAL,
        ThreatCategory::PROMPT_INJECTION, ThreatCategory::JAILBREAK,
        ThreatCategory::MALICIOUS_INTENT, ThreatCategory::DATA_LEAK,
        ThreatCategory::TOXICITY, ThreatCategory::HALLUCINATION,
        ThreatCategory::UNVERIFIED_CITATION, ThreatCategory::TONE_VIOLATION,
        ThreatCategory::UNVERIFIED, ThreatCategory::BENIGN
    };
    for (const auto c : all) {
        if (name == threat_category_to_string(c)) return c;
    }
    return std::nullopt;
}

inline const char* remediation_to_string(RemediationAction action) {
    switch (action) {
        case RemediationAction::NONE: return "none";
        case RemediationAction::BLOCK: return "block";
        case RemediationAction::REWRITE: return "rewrite";
        default: return "unknown";
    }
}

inline const char* moderation_mode_to_string(ModerationMode mode) {
    switch (mode) {
        case ModerationMode::STRICT: return "strict";
        case ModerationMode::MODERATE: return "moderate";
        case ModerationMode::RELAXED: return "relaxed";
        case ModerationMode::RAW: return "raw";
        default: return "unknown";
    }
}

} // namespace promptshield
