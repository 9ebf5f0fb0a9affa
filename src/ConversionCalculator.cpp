#include "ConversionCalculator.hpp"
#include "NumericInput.hpp"
#include <algorithm>

namespace VetCalc {

ConversionCalculator::ConversionCalculator(const UnitSystem& units) : units_(units) {}

const std::vector<std::string>& ConversionCalculator::generalFamilies() {
    static const std::vector<std::string> families = {
        Families::MASS, Families::VOLUME, Families::MOLARITY, Families::TEMPERATURE
    };
    return families;
}

ConversionCalculator::Input ConversionCalculator::parseInputs(const RawInputs& raw) const {
    Input input;
    input.value = NumericInput::parseField(raw, "value");
    input.family = NumericInput::rawValue(raw, "category", input.family);

    std::string default_from;
    std::string default_to;
    std::vector<const Unit*> units = units_.getUnitsInFamily(input.family);
    if (!units.empty()) {
        default_to = units[0]->symbol;
        default_from = units.size() > 1 ? units[1]->symbol : units[0]->symbol;
    }

    input.from_unit = NumericInput::rawValue(raw, "fromUnit", default_from);
    input.to_unit = NumericInput::rawValue(raw, "toUnit", default_to);
    return input;
}

std::optional<ConversionResult> ConversionCalculator::calculate(const Input& input) const {
    const UnitFamily* family = units_.getFamily(input.family);
    if (!family) {
        return std::nullopt;
    }

    const auto& general = generalFamilies();
    if (std::find(general.begin(), general.end(), family->key) == general.end()) {
        return std::nullopt;
    }

    if (input.value == 0) {
        return std::nullopt;
    }

    ConversionResult result;
    result.input_value = input.value;
    result.from_unit = input.from_unit;
    result.to_unit = input.to_unit;
    result.family = family->key;
    // Aliases of one unit ("mcg", "ug") are the same unit
    const Unit* from = units_.getUnit(family->key, input.from_unit);
    const Unit* to = units_.getUnit(family->key, input.to_unit);
    result.identity = (input.from_unit == input.to_unit) ||
                      (from && to && from->symbol == to->symbol);

    if (result.identity) {
        result.converted_value = input.value;
        return result;
    }

    ConversionOutcome outcome = units_.tryConvert(input.value, input.from_unit,
                                                  input.to_unit, family->key);
    if (!outcome.ok()) {
        return std::nullopt;
    }

    result.converted_value = outcome.value;
    return result;
}

} // namespace VetCalc
