#ifndef VALUE_FORMATTER_HPP
#define VALUE_FORMATTER_HPP

#include "VetCalc.hpp"
#include <optional>
#include <string>

namespace VetCalc {

/// Placeholder shown for values that could not be computed
constexpr const char* kValuePlaceholder = "\xE2\x80\x94";  // em dash

/// Magnitudes below this (and non-zero) switch to scientific notation
constexpr double kScientificThreshold = 1e-4;

/**
 * @brief Render a computed value for display and export
 *
 * - NaN renders as the placeholder.
 * - 0 < |value| < 1e-4 renders in scientific notation with @p decimals
 *   mantissa digits and an unpadded exponent (5.0000e-5).
 * - Everything else is rounded to @p decimals places (ties away from zero)
 *   and trailing zeros are dropped, so 1.2000 renders as 1.2.
 * - Infinities render as Infinity / -Infinity.
 */
std::string formatValue(double value, int decimals = kDefaultDecimals);

/**
 * @brief As above, std::nullopt renders as the placeholder
 */
std::string formatValue(const std::optional<double>& value,
                        int decimals = kDefaultDecimals);

} // namespace VetCalc

#endif // VALUE_FORMATTER_HPP
