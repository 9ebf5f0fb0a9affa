#include "SolutionCalculator.hpp"
#include "NumericInput.hpp"
#include <cmath>

namespace VetCalc {

SolutionCalculator::SolutionCalculator(const UnitSystem& units) : units_(units) {}

SolutionCalculator::Input SolutionCalculator::parseInputs(const RawInputs& raw) const {
    Input input;
    input.molecular_weight = NumericInput::parseField(raw, "mw");
    input.concentration = NumericInput::parseField(raw, "conc");
    input.concentration_unit = NumericInput::rawValue(raw, "concUnit", input.concentration_unit);
    input.volume = NumericInput::parseField(raw, "volume");
    input.volume_unit = NumericInput::rawValue(raw, "volUnit", input.volume_unit);
    return input;
}

std::optional<SolutionResult> SolutionCalculator::calculate(const Input& input) const {
    if (input.volume <= 0 || input.concentration <= 0) {
        return std::nullopt;
    }

    SolutionResult result;

    if (input.concentration_unit == kPercentWeightVolume) {
        // % w/v is grams per 100 mL
        double volume_ml = units_.convert(input.volume, input.volume_unit, "mL", Families::VOLUME);
        result.grams = input.concentration * volume_ml / 100.0;
    } else {
        if (input.molecular_weight <= 0) {
            return std::nullopt;
        }
        double molar = units_.convert(input.concentration, input.concentration_unit,
                                      "M", Families::MOLARITY);
        double volume_l = units_.convert(input.volume, input.volume_unit, "L", Families::VOLUME);
        result.grams = molar * volume_l * input.molecular_weight;
    }

    if (!std::isfinite(result.grams)) {
        return std::nullopt;
    }
    return result;
}

} // namespace VetCalc
