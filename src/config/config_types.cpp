#include "config/config_types.hpp"
#include "core/features.hpp"
#include "core/utils.hpp"

namespace promptshield {

ShieldConfig::ShieldConfig()
    : inbound_features(default_features(Direction::INBOUND)),
      outbound_features(default_features(Direction::OUTBOUND)) {}

std::optional<ModerationMode> moderation_mode_from_string(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "strict") return ModerationMode::STRICT;
    if (lower == "moderate") return ModerationMode::MODERATE;
    if (lower == "relaxed") return ModerationMode::RELAXED;
    if (lower == "raw") return ModerationMode::RAW;
    return std::nullopt;
}

std::optional<RemediationAction> remediation_from_string(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "block") return RemediationAction::BLOCK;
    if (lower == "rewrite") return RemediationAction::REWRITE;
    return std::nullopt;
}

} // namespace promptshield
