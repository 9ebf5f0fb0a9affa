#include "DoseCalculator.hpp"
#include "NumericInput.hpp"
#include <cmath>

namespace VetCalc {

namespace {

// Dose units are entered per kg of body weight; "mg/kg" and "mg" are the same
std::string massUnitOfDose(const std::string& unit) {
    const std::string per_kg = "/kg";
    if (unit.size() > per_kg.size() &&
        unit.compare(unit.size() - per_kg.size(), per_kg.size(), per_kg) == 0) {
        return unit.substr(0, unit.size() - per_kg.size());
    }
    return unit;
}

} // namespace

DoseCalculator::DoseCalculator(const UnitSystem& units) : units_(units) {}

DoseCalculator::Input DoseCalculator::parseInputs(const RawInputs& raw) const {
    Input input;
    input.weight_kg = NumericInput::parseField(raw, "weight");
    input.dose = NumericInput::parseField(raw, "dose");
    input.dose_unit = massUnitOfDose(NumericInput::rawValue(raw, "doseUnit", input.dose_unit));
    input.concentration = NumericInput::parseField(raw, "conc");
    input.concentration_unit = NumericInput::rawValue(raw, "concUnit", input.concentration_unit);
    input.infusion_minutes = NumericInput::parseField(raw, "time");
    return input;
}

std::optional<DoseResult> DoseCalculator::calculate(const Input& input) const {
    if (input.weight_kg <= 0 || input.dose <= 0 || input.concentration <= 0) {
        return std::nullopt;
    }

    double dose_mg_per_kg = units_.convert(input.dose, massUnitOfDose(input.dose_unit),
                                           "mg", Families::MASS);
    double conc_mg_per_ml = units_.convert(input.concentration, input.concentration_unit,
                                           "mg/mL", Families::CONC_DOSE);

    DoseResult result;
    result.total_dose_mg = input.weight_kg * dose_mg_per_kg;
    result.volume_ml = result.total_dose_mg / conc_mg_per_ml;

    // Unit miss propagates as NaN
    if (!std::isfinite(result.total_dose_mg) || !std::isfinite(result.volume_ml)) {
        return std::nullopt;
    }

    if (input.infusion_minutes > 0) {
        InfusionRate rate;
        rate.ml_per_hour = result.volume_ml / input.infusion_minutes * 60.0;
        rate.drops_per_minute = result.volume_ml * kDropFactor / input.infusion_minutes;
        result.rate = rate;
    }

    return result;
}

} // namespace VetCalc
