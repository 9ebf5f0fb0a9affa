#include "SuggestionEngine.hpp"

namespace VetCalc {

Suggestion SuggestionEngine::suggestNext(const std::vector<CalculationRecord>& history) const {
    if (history.empty()) {
        return {"Start Calculating!",
                "Perform your first calculation to get smart suggestions.",
                SuggestionTarget::DOSE};
    }

    switch (history.front().type) {
        case CalculationType::DOSE:
            return {"Smart Suggestion: Serial Dilution",
                    "You calculated a dose. Need to prepare the solution from a higher "
                    "concentration stock?",
                    SuggestionTarget::DILUTION};
        case CalculationType::SOLUTION:
            return {"Smart Suggestion: Unit Conversion",
                    "You prepared a solution. Do you need to convert the final concentration "
                    "to a different unit (e.g., M to mM)?",
                    SuggestionTarget::CONVERSION};
        case CalculationType::BUFFER:
            return {"Smart Suggestion: Animal Profile",
                    "Buffer calculation is complete. Time to check patient vitals or add a new "
                    "animal profile?",
                    SuggestionTarget::ANIMAL_PROFILE};
        default:
            break;
    }

    return {"Suggestion: Dose Calculation",
            "Dose calculation is the most common task. Let's calculate a required drug amount.",
            SuggestionTarget::DOSE};
}

} // namespace VetCalc
