#ifndef SOLUTION_CALCULATOR_HPP
#define SOLUTION_CALCULATOR_HPP

#include "CalculationResult.hpp"
#include "UnitSystem.hpp"
#include <optional>
#include <string>

namespace VetCalc {

/**
 * @brief Mass of solute needed for a target solution
 *
 * Molar:  grams = C (M) * V (L) * MW (g/mol)
 * % w/v:  grams = C * V (mL) / 100, molecular weight not used
 */
class SolutionCalculator {
public:
    struct Input {
        double molecular_weight = 0.0;          // g/mol
        double concentration = 0.0;
        std::string concentration_unit = "M";   // Molarity unit or "% w/v"
        double volume = 0.0;
        std::string volume_unit = "mL";
    };

    explicit SolutionCalculator(const UnitSystem& units);

    /**
     * @brief Parse raw fields mw, conc, concUnit, volume, volUnit
     */
    Input parseInputs(const RawInputs& raw) const;

    std::optional<SolutionResult> calculate(const Input& input) const;

    std::optional<SolutionResult> calculate(const RawInputs& raw) const {
        return calculate(parseInputs(raw));
    }

private:
    const UnitSystem& units_;
};

} // namespace VetCalc

#endif // SOLUTION_CALCULATOR_HPP
