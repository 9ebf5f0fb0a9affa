#ifndef VETCALC_HPP
#define VETCALC_HPP

#include <cstddef>
#include <map>
#include <string>

#define VETCALC_VERSION_MAJOR 1
#define VETCALC_VERSION_MINOR 0
#define VETCALC_VERSION_PATCH 0
#define VETCALC_VERSION_STRING "1.0.0"

namespace VetCalc {

// Forward declarations
class UnitSystem;
class CalculationEngine;
class HistoryStore;
class AnimalDirectory;
class RecordBuilder;

/**
 * @brief Formula types handled by the calculation engine
 *
 * Each type owns one calculator, one result variant and one record type
 * name. The record type name is what the history log and the export rows
 * carry, so it must stay stable.
 */
enum class CalculationType {
    DOSE,           ///< Dose and infusion rate ("Dose Calculation")
    SOLUTION,       ///< Solution preparation mass ("Solution Calculation")
    DILUTION,       ///< Serial dilution sequence ("Serial Dilution")
    BUFFER,         ///< Henderson-Hasselbalch recipe ("Buffer Calculation")
    CONVERSION      ///< Generic unit conversion ("Unit Conversion")
};

/// Raw (unparsed) input strings keyed by field name
using RawInputs = std::map<std::string, std::string>;

// Fixed clinical constants
constexpr double kDropFactor = 20.0;              ///< drops/mL, macro-drip set
constexpr int kMaxDilutionSteps = 10;
constexpr std::size_t kDefaultHistoryCapacity = 300;
constexpr int kDefaultDecimals = 4;

/**
 * @brief Engine-wide settings read from the [ENGINE] and [HISTORY] sections
 */
struct EngineConfig {
    int decimals = kDefaultDecimals;                  ///< Formatter precision in summaries
    std::size_t history_capacity = kDefaultHistoryCapacity;
    std::string history_file;                         ///< Empty: keep history in memory
};

/**
 * @brief Record type name for a formula ("Dose Calculation", ...)
 */
std::string calculationTypeName(CalculationType type);

/**
 * @brief Resolve a formula name to its type
 *
 * Accepts the record type names as well as the short keys dose, solution,
 * dilution, buffer and conversion (case-insensitive).
 *
 * @return true if the name is known
 */
bool parseCalculationType(const std::string& name, CalculationType& type);

} // namespace VetCalc

#endif // VETCALC_HPP
