#pragma once

#include "core/types.hpp"
#include <string>

namespace promptshield {

/**
 * @brief Verdict as compact JSON with a fixed key order.
 *
 * Doubles are printed with four decimals so equal verdicts serialize to
 * identical bytes. Raw PII values never appear: findings carry only the
 * mask and fingerprint.
 */
[[nodiscard]] std::string verdict_to_json(const Verdict& verdict);

} // namespace promptshield
