#ifndef DILUTION_CALCULATOR_HPP
#define DILUTION_CALCULATOR_HPP

#include "CalculationResult.hpp"
#include <optional>
#include <string>

namespace VetCalc {

/**
 * @brief Serial dilution sequence
 *
 * Step 0 is the starting concentration, every further step divides the
 * previous one by the dilution factor. At most kMaxDilutionSteps steps.
 */
class DilutionCalculator {
public:
    struct Input {
        double start_concentration = 0.0;
        double dilution_factor = 0.0;       // Must exceed 1
        double steps = 0.0;                 // Fractional counts are truncated
        std::string concentration_unit = "M";
    };

    DilutionCalculator() = default;

    /**
     * @brief Parse raw fields startConc, dilutionFactor, steps, concUnit
     */
    Input parseInputs(const RawInputs& raw) const;

    std::optional<DilutionResult> calculate(const Input& input) const;

    std::optional<DilutionResult> calculate(const RawInputs& raw) const {
        return calculate(parseInputs(raw));
    }
};

} // namespace VetCalc

#endif // DILUTION_CALCULATOR_HPP
