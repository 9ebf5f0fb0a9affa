#ifndef NUMERIC_INPUT_HPP
#define NUMERIC_INPUT_HPP

#include "VetCalc.hpp"
#include <optional>
#include <string>

namespace VetCalc {
namespace NumericInput {

/**
 * @brief Keystroke filter for numeric text fields
 *
 * Keeps digits and the first decimal point only, so the buffer is always
 * parseable. filterKeystroke(filterKeystroke(s)) == filterKeystroke(s).
 */
std::string filterKeystroke(const std::string& text);

/**
 * @brief Parse free text as a real number
 *
 * Leading/trailing whitespace is ignored and the first ',' is read as a
 * decimal point. Accepts an optional sign, digits with at most one point
 * and an optional exponent. Empty, malformed or non-finite text gives
 * std::nullopt.
 */
std::optional<double> tryParseNumber(const std::string& text);

/**
 * @brief Boundary adapter: std::nullopt collapses to 0
 *
 * Calculators treat zero as an incomplete field, which keeps live previews
 * valid while the user is still typing.
 */
double parseNumber(const std::string& text);

/**
 * @brief Raw field value, or default_val when the field is absent
 */
std::string rawValue(const RawInputs& inputs, const std::string& key,
                     const std::string& default_val = "");

/**
 * @brief parseNumber() applied to a raw field (0 when absent)
 */
double parseField(const RawInputs& inputs, const std::string& key);

} // namespace NumericInput
} // namespace VetCalc

#endif // NUMERIC_INPUT_HPP
