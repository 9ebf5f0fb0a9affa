#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace VetCalc {

/// Family keys of the fixed unit table
namespace Families {
constexpr const char* MASS = "MASS";            ///< base g
constexpr const char* VOLUME = "VOLUME";        ///< base L
constexpr const char* MOLARITY = "MOLARITY";    ///< base M
constexpr const char* TEMPERATURE = "TEMP";     ///< pivot C
constexpr const char* CONC_DOSE = "CONC_DOSE";  ///< base mg/mL
} // namespace Families

/// Weight-per-volume percentage (g per 100 mL); 1 % w/v = 10 mg/mL
constexpr const char* kPercentWeightVolume = "% w/v";

/**
 * @brief How the units of a family relate to each other
 */
enum class FamilyKind {
    LINEAR,         ///< One multiplicative factor per unit
    TEMPERATURE     ///< Named functions to and from the Celsius pivot
};

/**
 * @brief Unit definition
 *
 * Linear units carry a factor to the family base unit. Temperature units
 * carry a pair of functions mapping to and from degrees Celsius instead.
 */
struct Unit {
    std::string name;                           // Full name (e.g., "milligram")
    std::string symbol;                         // Short symbol (e.g., "mg")
    double to_base;                             // Factor to the family base unit
    std::function<double(double)> to_pivot;     // Temperature only: unit -> C
    std::function<double(double)> from_pivot;   // Temperature only: C -> unit
    std::vector<std::string> aliases;           // Alternative symbols

    Unit() : to_base(1.0) {}

    Unit(const std::string& n, const std::string& s, double factor)
        : name(n), symbol(s), to_base(factor) {}

    Unit(const std::string& n, const std::string& s,
         std::function<double(double)> to, std::function<double(double)> from)
        : name(n), symbol(s), to_base(1.0),
          to_pivot(std::move(to)), from_pivot(std::move(from)) {}

    // Convert value from this unit to the family base (or pivot)
    double convertToBase(double value) const {
        return to_pivot ? to_pivot(value) : value * to_base;
    }

    // Convert value from the family base (or pivot) to this unit
    double convertFromBase(double value) const {
        return from_pivot ? from_pivot(value) : value / to_base;
    }
};

/**
 * @brief Named group of commensurable units
 */
struct UnitFamily {
    std::string key;                    // e.g. "MASS"
    std::string display_name;           // e.g. "Mass (kg, g, mg, µg)"
    FamilyKind kind;
    std::string base_unit;              // Unit with factor 1 (or the pivot)
    std::vector<std::string> symbols;   // Registration order

    UnitFamily() : kind(FamilyKind::LINEAR) {}
};

/**
 * @brief A value tagged with its unit and family
 */
struct Quantity {
    double value;
    std::string unit;
    std::string family;
};

/**
 * @brief Conversion result with an explicit miss sentinel
 */
struct ConversionOutcome {
    enum class Status {
        OK,
        UNKNOWN_FAMILY,     ///< value passed through unchanged
        UNIT_NOT_FOUND      ///< value is NaN
    };

    Status status;
    double value;

    bool ok() const { return status == Status::OK; }
};

/**
 * @brief Unit conversion registry
 *
 * Holds the fixed unit table of the calculators (mass, volume, molarity,
 * temperature and dose concentration). Build one instance at start-up and
 * pass it by reference to everything that converts.
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get family by key (case-insensitive)
     * @return Pointer to UnitFamily, or nullptr if not found
     */
    const UnitFamily* getFamily(const std::string& key) const;

    /**
     * @brief Get unit of a family by symbol or alias (case-sensitive)
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& family, const std::string& symbol) const;

    bool hasUnit(const std::string& family, const std::string& symbol) const;

    /**
     * @brief Units of a family in registration order
     */
    std::vector<const Unit*> getUnitsInFamily(const std::string& family) const;

    /**
     * @brief Family keys in registration order
     */
    std::vector<std::string> getFamilies() const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units of a family
     *
     * Unknown family: the value is returned unchanged. Unknown unit in a
     * known family: quiet NaN. Identical units return the value untouched.
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit, const std::string& family) const;

    /**
     * @brief convert() with the miss reported as a status
     */
    ConversionOutcome tryConvert(double value, const std::string& from_unit,
                                 const std::string& to_unit,
                                 const std::string& family) const;

    /**
     * @brief Convert a quantity to another unit of its family
     */
    Quantity convert(const Quantity& quantity, const std::string& to_unit) const;

    // =========================================================================
    // Custom Unit Registration
    // =========================================================================

    /**
     * @brief Add a unit to a linear family
     * @throws std::invalid_argument for unknown or non-linear families and
     *         non-positive factors
     */
    void addUnit(const std::string& family, const Unit& unit);

    /**
     * @brief Add alias for an existing unit
     * @return false if the unit is unknown
     */
    bool addAlias(const std::string& family, const std::string& symbol,
                  const std::string& alias);

    // =========================================================================
    // Utility Functions
    // =========================================================================

    /**
     * @brief Format value with unit for display
     */
    std::string formatValue(double value, const std::string& unit,
                            int decimals = 4) const;

    /**
     * @brief Print unit database to stream
     */
    void printDatabase(std::ostream& os) const;

    /**
     * @brief Generate markdown documentation of all units
     */
    std::string generateDocumentation() const;

private:
    // Family key -> family
    std::map<std::string, UnitFamily> families_;

    // Family key -> (symbol or alias -> unit)
    std::map<std::string, std::map<std::string, Unit>> units_;

    std::vector<std::string> family_order_;

    void initializeDatabase();

    void addMassUnits();
    void addVolumeUnits();
    void addMolarityUnits();
    void addTemperatureUnits();
    void addDoseConcentrationUnits();

    void registerFamily(const std::string& key, const std::string& display_name,
                        FamilyKind kind, const std::string& base_unit);
    void registerUnit(const std::string& family, const Unit& unit);

    std::string toUpperCase(const std::string& str) const;
};

} // namespace VetCalc

#endif // UNIT_SYSTEM_HPP
