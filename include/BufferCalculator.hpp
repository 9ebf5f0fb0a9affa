#ifndef BUFFER_CALCULATOR_HPP
#define BUFFER_CALCULATOR_HPP

#include "CalculationResult.hpp"
#include "UnitSystem.hpp"
#include <optional>

namespace VetCalc {

/**
 * @brief Buffer recipe from the Henderson-Hasselbalch equation
 *
 *   pH = pKa + log10([A-]/[HA])
 *
 * The total buffer concentration is split between the weak acid and its
 * conjugate salt by their molar fractions, then converted to grams with
 * each component's molecular weight.
 *
 * Extreme pH - pKa differences overflow the ratio to infinity; this is
 * not guarded.
 */
class BufferCalculator {
public:
    struct Input {
        double pH = 0.0;
        double pKa = 0.0;
        double mw_acid = 0.0;           // g/mol
        double mw_salt = 0.0;           // g/mol
        double volume_ml = 0.0;
        double concentration_m = 0.0;   // Total buffer molarity
    };

    explicit BufferCalculator(const UnitSystem& units);

    /**
     * @brief Parse raw fields pH, pKa, mwAcid, mwSalt, totalVol, totalConc
     */
    Input parseInputs(const RawInputs& raw) const;

    std::optional<BufferResult> calculate(const Input& input) const;

    std::optional<BufferResult> calculate(const RawInputs& raw) const {
        return calculate(parseInputs(raw));
    }

private:
    const UnitSystem& units_;
};

} // namespace VetCalc

#endif // BUFFER_CALCULATOR_HPP
