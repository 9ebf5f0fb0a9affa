#include "UnitSystem.hpp"
#include "ValueFormatter.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace VetCalc {

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addMassUnits();
    addVolumeUnits();
    addMolarityUnits();
    addTemperatureUnits();
    addDoseConcentrationUnits();
}

// =============================================================================
// Mass Units
// =============================================================================

void UnitSystem::addMassUnits() {
    registerFamily(Families::MASS, "Mass (kg, g, mg, \xC2\xB5g)", FamilyKind::LINEAR, "g");

    registerUnit(Families::MASS, Unit("kilogram", "kg", 1000.0));
    registerUnit(Families::MASS, Unit("gram", "g", 1.0));
    registerUnit(Families::MASS, Unit("milligram", "mg", 1e-3));

    Unit microgram("microgram", "ug", 1e-6);
    microgram.aliases = {"mcg", "\xC2\xB5g"};
    registerUnit(Families::MASS, microgram);
}

// =============================================================================
// Volume Units
// =============================================================================

void UnitSystem::addVolumeUnits() {
    registerFamily(Families::VOLUME, "Volume (L, mL, uL)", FamilyKind::LINEAR, "L");

    registerUnit(Families::VOLUME, Unit("liter", "L", 1.0));
    registerUnit(Families::VOLUME, Unit("milliliter", "mL", 1e-3));

    Unit microliter("microliter", "uL", 1e-6);
    microliter.aliases = {"\xC2\xB5L"};
    registerUnit(Families::VOLUME, microliter);
}

// =============================================================================
// Molarity Units
// =============================================================================

void UnitSystem::addMolarityUnits() {
    registerFamily(Families::MOLARITY, "Molarity (M, mM, \xC2\xB5M)", FamilyKind::LINEAR, "M");

    registerUnit(Families::MOLARITY, Unit("molar", "M", 1.0));
    registerUnit(Families::MOLARITY, Unit("millimolar", "mM", 1e-3));

    Unit micromolar("micromolar", "uM", 1e-6);
    micromolar.aliases = {"\xC2\xB5M"};
    registerUnit(Families::MOLARITY, micromolar);
}

// =============================================================================
// Temperature Units
// =============================================================================

void UnitSystem::addTemperatureUnits() {
    // Non-linear: every conversion pivots through degrees Celsius
    registerFamily(Families::TEMPERATURE, "Temperature (\xC2\xB0" "C, \xC2\xB0" "F, K)",
                   FamilyKind::TEMPERATURE, "C");

    registerUnit(Families::TEMPERATURE, Unit("celsius", "C",
        [](double c) { return c; },
        [](double c) { return c; }));

    registerUnit(Families::TEMPERATURE, Unit("fahrenheit", "F",
        [](double f) { return (f - 32.0) * 5.0 / 9.0; },
        [](double c) { return c * 9.0 / 5.0 + 32.0; }));

    registerUnit(Families::TEMPERATURE, Unit("kelvin", "K",
        [](double k) { return k - 273.15; },
        [](double c) { return c + 273.15; }));
}

// =============================================================================
// Dose Concentration Units
// =============================================================================

void UnitSystem::addDoseConcentrationUnits() {
    registerFamily(Families::CONC_DOSE, "Dose concentration (mg/mL, g/L, mcg/mL, % w/v)",
                   FamilyKind::LINEAR, "mg/mL");

    registerUnit(Families::CONC_DOSE, Unit("milligram per milliliter", "mg/mL", 1.0));
    registerUnit(Families::CONC_DOSE, Unit("gram per liter", "g/L", 1.0));
    registerUnit(Families::CONC_DOSE, Unit("microgram per milliliter", "mcg/mL", 1e-3));

    // 1 % w/v = 1 g / 100 mL = 10 mg/mL
    registerUnit(Families::CONC_DOSE, Unit("percent weight per volume", kPercentWeightVolume, 10.0));
}

// =============================================================================
// Registration helpers
// =============================================================================

void UnitSystem::registerFamily(const std::string& key, const std::string& display_name,
                                FamilyKind kind, const std::string& base_unit) {
    UnitFamily family;
    family.key = key;
    family.display_name = display_name;
    family.kind = kind;
    family.base_unit = base_unit;

    if (families_.find(key) == families_.end()) {
        family_order_.push_back(key);
    }
    families_[key] = family;
}

void UnitSystem::registerUnit(const std::string& family, const Unit& unit) {
    auto& table = units_[family];
    table[unit.symbol] = unit;

    for (const auto& alias : unit.aliases) {
        table[alias] = unit;
    }

    auto& symbols = families_[family].symbols;
    if (std::find(symbols.begin(), symbols.end(), unit.symbol) == symbols.end()) {
        symbols.push_back(unit.symbol);
    }
}

std::string UnitSystem::toUpperCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// =============================================================================
// Database Access
// =============================================================================

const UnitFamily* UnitSystem::getFamily(const std::string& key) const {
    auto it = families_.find(key);
    if (it != families_.end()) {
        return &(it->second);
    }

    it = families_.find(toUpperCase(key));
    if (it != families_.end()) {
        return &(it->second);
    }

    return nullptr;
}

const Unit* UnitSystem::getUnit(const std::string& family, const std::string& symbol) const {
    const UnitFamily* fam = getFamily(family);
    if (!fam) return nullptr;

    auto table_it = units_.find(fam->key);
    if (table_it == units_.end()) return nullptr;

    auto it = table_it->second.find(symbol);
    if (it != table_it->second.end()) {
        return &(it->second);
    }
    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& family, const std::string& symbol) const {
    return getUnit(family, symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInFamily(const std::string& family) const {
    std::vector<const Unit*> result;
    const UnitFamily* fam = getFamily(family);
    if (!fam) return result;

    for (const auto& symbol : fam->symbols) {
        const Unit* unit = getUnit(fam->key, symbol);
        if (unit) {
            result.push_back(unit);
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getFamilies() const {
    return family_order_;
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit, const std::string& family) const {
    return tryConvert(value, from_unit, to_unit, family).value;
}

ConversionOutcome UnitSystem::tryConvert(double value, const std::string& from_unit,
                                         const std::string& to_unit,
                                         const std::string& family) const {
    const UnitFamily* fam = getFamily(family);
    if (!fam) {
        return {ConversionOutcome::Status::UNKNOWN_FAMILY, value};
    }

    const Unit* from = getUnit(fam->key, from_unit);
    const Unit* to = getUnit(fam->key, to_unit);
    if (!from || !to) {
        return {ConversionOutcome::Status::UNIT_NOT_FOUND,
                std::numeric_limits<double>::quiet_NaN()};
    }

    if (from->symbol == to->symbol) {
        return {ConversionOutcome::Status::OK, value};
    }

    // Convert: from_unit -> base (or pivot) -> to_unit
    double base_value = from->convertToBase(value);
    return {ConversionOutcome::Status::OK, to->convertFromBase(base_value)};
}

Quantity UnitSystem::convert(const Quantity& quantity, const std::string& to_unit) const {
    Quantity result;
    result.value = convert(quantity.value, quantity.unit, to_unit, quantity.family);
    result.unit = to_unit;
    result.family = quantity.family;
    return result;
}

// =============================================================================
// Custom Units
// =============================================================================

void UnitSystem::addUnit(const std::string& family, const Unit& unit) {
    const UnitFamily* fam = getFamily(family);
    if (!fam) {
        throw std::invalid_argument("Unknown unit family: " + family);
    }
    if (fam->kind != FamilyKind::LINEAR) {
        throw std::invalid_argument("Cannot add units to non-linear family: " + fam->key);
    }
    if (!(unit.to_base > 0.0)) {
        throw std::invalid_argument("Conversion factor must be positive for unit: " + unit.symbol);
    }
    registerUnit(fam->key, unit);
}

bool UnitSystem::addAlias(const std::string& family, const std::string& symbol,
                          const std::string& alias) {
    const Unit* unit = getUnit(family, symbol);
    if (!unit) return false;

    Unit modified = *unit;
    modified.aliases.push_back(alias);
    registerUnit(getFamily(family)->key, modified);
    return true;
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string UnitSystem::formatValue(double value, const std::string& unit,
                                    int decimals) const {
    return VetCalc::formatValue(value, decimals) + " " + unit;
}

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& key : family_order_) {
        const UnitFamily& family = families_.at(key);
        os << "Family: " << family.key << " - " << family.display_name << "\n";
        os << std::string(40, '-') << "\n";

        for (const Unit* u : getUnitsInFamily(key)) {
            os << std::setw(28) << std::left << u->name
               << " [" << std::setw(8) << u->symbol << "] ";
            if (family.kind == FamilyKind::LINEAR) {
                os << " = " << u->to_base << " " << family.base_unit << "\n";
            } else {
                os << " via " << family.base_unit << " pivot\n";
            }
        }
        os << "\n";
    }
}

std::string UnitSystem::generateDocumentation() const {
    std::stringstream ss;

    ss << "# VetCalc Unit System\n\n";
    ss << "Linear families convert through a single factor to their base unit.\n";
    ss << "Temperature converts through degrees Celsius.\n\n";

    for (const auto& key : family_order_) {
        const UnitFamily& family = families_.at(key);
        ss << "## " << family.display_name << "\n\n";
        ss << "| Name | Symbol | Aliases | Conversion |\n";
        ss << "|------|--------|---------|------------|\n";

        for (const Unit* u : getUnitsInFamily(key)) {
            std::string aliases;
            for (const auto& alias : u->aliases) {
                if (!aliases.empty()) aliases += ", ";
                aliases += alias;
            }
            ss << "| " << u->name
               << " | " << u->symbol
               << " | " << aliases
               << " | ";
            if (family.kind == FamilyKind::LINEAR) {
                ss << u->to_base << " " << family.base_unit;
            } else {
                ss << "via " << family.base_unit;
            }
            ss << " |\n";
        }
        ss << "\n";
    }

    return ss.str();
}

} // namespace VetCalc
