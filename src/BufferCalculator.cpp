#include "BufferCalculator.hpp"
#include "NumericInput.hpp"
#include <cmath>

namespace VetCalc {

BufferCalculator::BufferCalculator(const UnitSystem& units) : units_(units) {}

BufferCalculator::Input BufferCalculator::parseInputs(const RawInputs& raw) const {
    Input input;
    input.pH = NumericInput::parseField(raw, "pH");
    input.pKa = NumericInput::parseField(raw, "pKa");
    input.mw_acid = NumericInput::parseField(raw, "mwAcid");
    input.mw_salt = NumericInput::parseField(raw, "mwSalt");
    input.volume_ml = NumericInput::parseField(raw, "totalVol");
    input.concentration_m = NumericInput::parseField(raw, "totalConc");
    return input;
}

std::optional<BufferResult> BufferCalculator::calculate(const Input& input) const {
    if (input.pKa <= 0 || input.volume_ml <= 0 || input.concentration_m <= 0 ||
        input.mw_acid <= 0 || input.mw_salt <= 0) {
        return std::nullopt;
    }

    BufferResult result;
    result.ratio = std::pow(10.0, input.pH - input.pKa);
    result.fraction_salt = result.ratio / (1.0 + result.ratio);
    result.fraction_acid = 1.0 / (1.0 + result.ratio);

    // Mass (g) = X * C (mol/L) * V (L) * MW (g/mol)
    double volume_l = units_.convert(input.volume_ml, "mL", "L", Families::VOLUME);

    result.acid_mass_g = result.fraction_acid * input.concentration_m * volume_l * input.mw_acid;
    result.salt_mass_g = result.fraction_salt * input.concentration_m * volume_l * input.mw_salt;

    return result;
}

} // namespace VetCalc
