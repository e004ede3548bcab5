#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace promptshield {

/**
 * @brief Redaction primitives shared by the PII Engine and output checks
 *
 * - Mask:        fixed-shape category tag, e.g. "[EMAIL_REDACTED]"
 * - Fingerprint: SHA256 first 16 hex chars (deterministic, audit correlation)
 */
class MaskingEngine {
public:
    [[nodiscard]] static std::string mask_for(PiiCategory category);

    [[nodiscard]] static std::string hash_value(std::string_view value);

    /**
     * @brief Replace each finding's span with its mask.
     * @param findings Non-overlapping, sorted by offset
     */
    [[nodiscard]] static std::string apply(
        std::string_view text,
        const std::vector<PiiFinding>& findings);

    /**
     * @brief Spans of mask tokens already present in text ("[..._REDACTED]").
     * @return (offset, length) pairs in ascending order
     */
    [[nodiscard]] static std::vector<std::pair<size_t, size_t>> find_masks(std::string_view text);
};

} // namespace promptshield
