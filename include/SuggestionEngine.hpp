#ifndef SUGGESTION_ENGINE_HPP
#define SUGGESTION_ENGINE_HPP

#include "CalculationResult.hpp"
#include <string>
#include <vector>

namespace VetCalc {

/**
 * @brief Where a suggestion points the user
 */
enum class SuggestionTarget {
    DOSE,
    DILUTION,
    CONVERSION,
    ANIMAL_PROFILE
};

struct Suggestion {
    std::string title;
    std::string description;
    SuggestionTarget target;
};

/**
 * @brief Next-step suggestion from the most recent calculation
 *
 * Dose -> serial dilution, solution -> unit conversion, buffer -> animal
 * profile, anything else -> dose.
 */
class SuggestionEngine {
public:
    /**
     * @param history Records, newest first
     */
    Suggestion suggestNext(const std::vector<CalculationRecord>& history) const;
};

} // namespace VetCalc

#endif // SUGGESTION_ENGINE_HPP
