#ifndef CALCULATION_RESULT_HPP
#define CALCULATION_RESULT_HPP

#include "VetCalc.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace VetCalc {

/**
 * @brief Infusion rate at the fixed drop factor
 */
struct InfusionRate {
    double ml_per_hour;         // mL/hr
    double drops_per_minute;    // drops/min at kDropFactor drops/mL
};

struct DoseResult {
    double total_dose_mg;
    double volume_ml;                       // Stock volume to draw
    std::optional<InfusionRate> rate;       // Only with an infusion time
};

struct SolutionResult {
    double grams;
};

struct DilutionStep {
    int step;
    double concentration;
};

struct DilutionResult {
    std::vector<DilutionStep> steps;    // steps+1 entries, step 0 = C0
    double final_concentration;
    std::string unit;                   // Molarity unit label of every entry
};

/**
 * @brief Henderson-Hasselbalch buffer recipe
 */
struct BufferResult {
    double ratio;           // [A-]/[HA] = 10^(pH - pKa)
    double fraction_acid;   // 1 / (1 + ratio)
    double fraction_salt;   // ratio / (1 + ratio)
    double acid_mass_g;
    double salt_mass_g;
};

struct ConversionResult {
    double input_value;
    double converted_value;
    std::string from_unit;
    std::string to_unit;
    std::string family;     // Family key
    bool identity;          // from_unit == to_unit, nothing was converted
};

/**
 * @brief One result variant per formula
 */
using CalculationResult = std::variant<DoseResult, SolutionResult, DilutionResult,
                                       BufferResult, ConversionResult>;

/**
 * @brief Formula that produced a result
 */
CalculationType resultType(const CalculationResult& result);

/**
 * @brief A finished calculation as handed to the history store
 */
struct CalculationRecord {
    CalculationType type;
    std::chrono::system_clock::time_point timestamp;
    RawInputs inputs;           // Echoed raw strings, not parsed values
    CalculationResult result;
    std::string sentence;       // One-line human readable summary

    std::string typeName() const { return calculationTypeName(type); }
};

} // namespace VetCalc

#endif // CALCULATION_RESULT_HPP
