#ifndef DOSE_CALCULATOR_HPP
#define DOSE_CALCULATOR_HPP

#include "CalculationResult.hpp"
#include "UnitSystem.hpp"
#include <optional>
#include <string>

namespace VetCalc {

/**
 * @brief Dose and infusion rate calculator
 *
 * Weight-based dosing from a stock solution:
 *
 *   total dose (mg)  = W (kg) * D (mg/kg)
 *   volume (mL)      = total dose / C (mg/mL)
 *   rate (mL/hr)     = volume / T (min) * 60
 *   rate (drops/min) = volume * 20 / T
 *
 * The dose unit is a mass unit per kg of body weight ("mg" or "mg/kg"),
 * the concentration unit belongs to the dose-concentration family.
 */
class DoseCalculator {
public:
    struct Input {
        double weight_kg = 0.0;
        double dose = 0.0;
        std::string dose_unit = "mg";
        double concentration = 0.0;
        std::string concentration_unit = "mg/mL";
        double infusion_minutes = 0.0;      // <= 0: no infusion rate
    };

    explicit DoseCalculator(const UnitSystem& units);

    /**
     * @brief Parse raw fields weight, dose, doseUnit, conc, concUnit, time
     */
    Input parseInputs(const RawInputs& raw) const;

    /**
     * @brief Compute dose, volume and optional infusion rate
     * @return std::nullopt when weight, dose or concentration is not
     *         positive, or a unit is not in the table
     */
    std::optional<DoseResult> calculate(const Input& input) const;

    std::optional<DoseResult> calculate(const RawInputs& raw) const {
        return calculate(parseInputs(raw));
    }

private:
    const UnitSystem& units_;
};

} // namespace VetCalc

#endif // DOSE_CALCULATOR_HPP
