#include "DilutionCalculator.hpp"
#include "NumericInput.hpp"
#include <cmath>

namespace VetCalc {

DilutionCalculator::Input DilutionCalculator::parseInputs(const RawInputs& raw) const {
    Input input;
    input.start_concentration = NumericInput::parseField(raw, "startConc");
    input.dilution_factor = NumericInput::parseField(raw, "dilutionFactor");
    input.steps = NumericInput::parseField(raw, "steps");
    input.concentration_unit = NumericInput::rawValue(raw, "concUnit", input.concentration_unit);
    return input;
}

std::optional<DilutionResult> DilutionCalculator::calculate(const Input& input) const {
    if (input.start_concentration <= 0 || input.dilution_factor <= 1 ||
        input.steps <= 0 || input.steps > kMaxDilutionSteps) {
        return std::nullopt;
    }

    int count = static_cast<int>(std::floor(input.steps));
    if (count < 1) {
        return std::nullopt;
    }

    DilutionResult result;
    result.unit = input.concentration_unit;
    result.steps.reserve(count + 1);

    double current = input.start_concentration;
    result.steps.push_back({0, current});
    for (int i = 1; i <= count; ++i) {
        current /= input.dilution_factor;
        result.steps.push_back({i, current});
    }

    result.final_concentration = result.steps.back().concentration;
    return result;
}

} // namespace VetCalc
