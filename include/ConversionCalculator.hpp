#ifndef CONVERSION_CALCULATOR_HPP
#define CONVERSION_CALCULATOR_HPP

#include "CalculationResult.hpp"
#include "UnitSystem.hpp"
#include <optional>
#include <string>
#include <vector>

namespace VetCalc {

/**
 * @brief Generic unit conversion over the general families
 *
 * Mass, volume, molarity and temperature. Converting a unit to itself is
 * a no-op flagged as identity so no floating-point drift is introduced.
 */
class ConversionCalculator {
public:
    struct Input {
        double value = 0.0;
        std::string from_unit;
        std::string to_unit;
        std::string family = Families::MASS;
    };

    explicit ConversionCalculator(const UnitSystem& units);

    /**
     * @brief Parse raw fields value, fromUnit, toUnit, category
     *
     * Missing units default to the second unit of the family (from) and
     * the first unit of the family (to).
     */
    Input parseInputs(const RawInputs& raw) const;

    /**
     * @return std::nullopt for a zero value, a family outside the general
     *         ones or a unit that is not in the family
     */
    std::optional<ConversionResult> calculate(const Input& input) const;

    std::optional<ConversionResult> calculate(const RawInputs& raw) const {
        return calculate(parseInputs(raw));
    }

    /**
     * @brief Family keys offered by the conversion calculator
     */
    static const std::vector<std::string>& generalFamilies();

private:
    const UnitSystem& units_;
};

} // namespace VetCalc

#endif // CONVERSION_CALCULATOR_HPP
