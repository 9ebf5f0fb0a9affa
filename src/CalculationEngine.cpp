#include "CalculationEngine.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace VetCalc {

namespace {

std::string weightToString(double weight_kg) {
    std::ostringstream ss;
    ss << std::setprecision(15) << weight_kg;
    return ss.str();
}

} // namespace

CalculationEngine::CalculationEngine(const UnitSystem& units, HistoryStore& history,
                                     const AnimalDirectory* animals, int decimals)
    : units_(units), history_(history), animals_(animals),
      dose_(units), solution_(units), dilution_(), buffer_(units), conversion_(units),
      builder_(units, decimals),
      clock_([]() { return std::chrono::system_clock::now(); }) {}

// ============================================================================
// Input resolution
// ============================================================================

RawInputs CalculationEngine::resolveInputs(CalculationType type, const RawInputs& raw) const {
    RawInputs inputs = raw;
    if (type != CalculationType::DOSE) {
        return inputs;
    }

    const AnimalProfile* animal = nullptr;
    auto id = raw.find("animalId");
    if (animals_ && id != raw.end() && !id->second.empty()) {
        animal = animals_->find(id->second);
        if (!animal) {
            std::cerr << "Warning: Unknown animal '" << id->second << "'" << std::endl;
        }
    }

    if (animal) {
        inputs["animalName"] = animal->name;
        auto weight = inputs.find("weight");
        if (weight == inputs.end() || weight->second.empty()) {
            inputs["weight"] = weightToString(animal->weight_kg);
        }
    } else if (inputs.find("animalName") == inputs.end()) {
        inputs["animalName"] = "Unknown Animal";
    }
    return inputs;
}

// ============================================================================
// Calculation
// ============================================================================

std::optional<CalculationResult> CalculationEngine::calculate(CalculationType type,
                                                              const RawInputs& raw) const {
    switch (type) {
        case CalculationType::DOSE:
            if (auto r = dose_.calculate(raw)) return CalculationResult(*r);
            break;
        case CalculationType::SOLUTION:
            if (auto r = solution_.calculate(raw)) return CalculationResult(*r);
            break;
        case CalculationType::DILUTION:
            if (auto r = dilution_.calculate(raw)) return CalculationResult(*r);
            break;
        case CalculationType::BUFFER:
            if (auto r = buffer_.calculate(raw)) return CalculationResult(*r);
            break;
        case CalculationType::CONVERSION:
            if (auto r = conversion_.calculate(raw)) return CalculationResult(*r);
            break;
    }
    return std::nullopt;
}

std::optional<CalculationResult> CalculationEngine::preview(CalculationType type,
                                                            const RawInputs& raw) const {
    return calculate(type, resolveInputs(type, raw));
}

std::optional<CalculationResult> CalculationEngine::preview(const std::string& formula,
                                                            const RawInputs& raw) const {
    CalculationType type;
    if (!parseCalculationType(formula, type)) {
        std::cerr << "Warning: Unknown calculation type '" << formula << "'" << std::endl;
        return std::nullopt;
    }
    return preview(type, raw);
}

CalculationEngine::Submission CalculationEngine::submitCalculation(const std::string& formula,
                                                                   const RawInputs& raw) {
    CalculationType type;
    if (!parseCalculationType(formula, type)) {
        std::cerr << "Warning: Unknown calculation type '" << formula << "'" << std::endl;
        Submission submission;
        submission.message = "Unknown calculation type: " + formula;
        return submission;
    }
    return submitCalculation(type, raw);
}

CalculationEngine::Submission CalculationEngine::submitCalculation(CalculationType type,
                                                                   const RawInputs& raw) {
    Submission submission;

    RawInputs inputs = resolveInputs(type, raw);
    std::optional<CalculationResult> result = calculate(type, inputs);
    if (!result) {
        submission.message = calculationTypeName(type) + ": incomplete input";
        return submission;
    }

    // Converting a unit to itself is shown but never logged
    if (auto* conversion = std::get_if<ConversionResult>(&*result)) {
        if (conversion->identity) {
            submission.message = "Unit Conversion: source and target unit are the same";
            return submission;
        }
    }

    submission.record = builder_.build(inputs, *result, clock_());

    if (history_.append(*submission.record)) {
        submission.status = Status::SAVED;
        submission.message = submission.record->sentence;
    } else {
        std::cerr << "Warning: Could not save " << calculationTypeName(type)
                  << " to history" << std::endl;
        submission.status = Status::SAVE_FAILED;
        submission.message = "Failed to save calculation to history";
    }
    return submission;
}

} // namespace VetCalc
