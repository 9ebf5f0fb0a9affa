#include "ConfigReader.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace VetCalc {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    bool ok = loadStream(file);
    file.close();
    return ok;
}

bool ConfigReader::loadStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            if (!hasSection(current_section)) {
                section_order_.push_back(current_section);
                data[current_section];
            }
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        setValue(current_section, key, value);
    }

    return !input.bad();
}

void ConfigReader::setValue(const std::string& section, const std::string& key,
                            const std::string& value) {
    if (!hasSection(section)) {
        section_order_.push_back(section);
    }
    data[section][key] = value;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ConfigReader::sectionSuffix(const std::string& section) const {
    size_t dot = section.find('.');
    if (dot == std::string::npos) return "";
    return section.substr(dot + 1);
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

// =============================================================================
// Section/Key Queries
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    return section_order_;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& section : section_order_) {
        if (section.find(prefix) == 0) {
            result.push_back(section);
        }
    }
    return result;
}

// =============================================================================
// Parsing Methods
// =============================================================================

bool ConfigReader::parseEngineConfig(EngineConfig& config) const {
    config.decimals = getInt("ENGINE", "decimals", kDefaultDecimals);

    int max_items = getInt("HISTORY", "max_items", static_cast<int>(kDefaultHistoryCapacity));
    if (max_items <= 0) {
        std::cerr << "Warning: [HISTORY] max_items must be positive, using "
                  << kDefaultHistoryCapacity << std::endl;
        max_items = static_cast<int>(kDefaultHistoryCapacity);
    }
    config.history_capacity = static_cast<std::size_t>(max_items);
    config.history_file = getString("HISTORY", "file", "");

    return hasSection("ENGINE") || hasSection("HISTORY");
}

std::vector<AnimalProfile> ConfigReader::parseAnimalProfiles() const {
    std::vector<AnimalProfile> animals;

    for (const auto& section : getSectionsMatching("ANIMAL.")) {
        AnimalProfile animal;
        animal.id = sectionSuffix(section);
        animal.name = getString(section, "name", "");
        animal.species = getString(section, "species", "Dog");
        animal.weight_kg = getDouble(section, "weight", 0.0);
        animal.condition = getString(section, "condition", "");
        animals.push_back(animal);
    }

    return animals;
}

std::vector<ConfigReader::CalculationRequest> ConfigReader::parseCalculationRequests() const {
    std::vector<CalculationRequest> requests;

    for (const auto& section : getSectionsMatching("CALC.")) {
        CalculationRequest request;
        request.label = sectionSuffix(section);
        request.formula = getString(section, "type", "");
        for (const auto& key_val : getSectionData(section)) {
            if (key_val.first != "type") {
                request.inputs[key_val.first] = key_val.second;
            }
        }
        requests.push_back(request);
    }

    return requests;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.section_order_) {
        for (const auto& key_val : other.getSectionData(section)) {
            setValue(section, key_val.first, key_val.second);
        }
        if (!hasSection(section)) {
            section_order_.push_back(section);
            data[section];
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("ENGINE")) {
        result.warnings.push_back("No [ENGINE] section found - using defaults");
    }

    if (hasKey("ENGINE", "decimals")) {
        int decimals = getInt("ENGINE", "decimals", kDefaultDecimals);
        if (decimals < 0 || decimals > 20) {
            result.errors.push_back("Invalid decimals value (must be 0-20)");
            result.valid = false;
        }
    }

    if (hasKey("HISTORY", "max_items") && getInt("HISTORY", "max_items", 0) <= 0) {
        result.errors.push_back("Invalid [HISTORY] max_items (must be positive)");
        result.valid = false;
    }

    for (const auto& section : getSectionsMatching("ANIMAL.")) {
        if (sectionSuffix(section).empty()) {
            result.errors.push_back("Animal section without id: [" + section + "]");
            result.valid = false;
        }
        if (getString(section, "name", "").empty()) {
            result.warnings.push_back("[" + section + "] has no name - profile will be skipped");
        }
        if (getDouble(section, "weight", 0.0) <= 0.0) {
            result.warnings.push_back("[" + section + "] has no positive weight - profile will be skipped");
        }
    }

    auto calcs = getSectionsMatching("CALC.");
    if (calcs.empty()) {
        result.warnings.push_back("No calculations defined");
    }

    for (const auto& section : calcs) {
        CalculationType type;
        std::string formula = getString(section, "type", "");
        if (formula.empty()) {
            result.errors.push_back("[" + section + "] is missing 'type'");
            result.valid = false;
        } else if (!parseCalculationType(formula, type)) {
            result.errors.push_back("[" + section + "] has unknown type '" + formula + "'");
            result.valid = false;
        }
    }

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write template file: " << filename << std::endl;
        return;
    }

    file << "# VetCalc Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[ENGINE]\n";
    file << "decimals = 4                          # Precision of values in summaries\n\n";

    file << "[HISTORY]\n";
    file << "max_items = 300                       # Oldest records are dropped beyond this\n";
    file << "# file = history.json                 # Keep history in a JSON file\n\n";

    file << "# Patient profiles, id after the dot\n";
    file << "[ANIMAL.rex]\n";
    file << "name = Rex\n";
    file << "species = Dog                         # Dog, Cat, Horse, Cattle, Other\n";
    file << "weight = 10                           # kg\n";
    file << "condition = healthy\n\n";

    file << "# Calculations, run in file order\n";
    file << "# type = dose | solution | dilution | buffer | conversion\n";
    file << "[CALC.dose]\n";
    file << "type = dose\n";
    file << "animalId = rex                        # Fills weight when left empty\n";
    file << "weight =\n";
    file << "dose = 5                              # mg/kg\n";
    file << "conc = 50                             # mg/mL\n";
    file << "concUnit = mg/mL\n";
    file << "time = 30                             # minutes, optional\n\n";

    file << "[CALC.solution]\n";
    file << "type = solution\n";
    file << "mw = 58.44                            # g/mol\n";
    file << "conc = 0.9\n";
    file << "concUnit = % w/v                      # or M, mM, uM\n";
    file << "volume = 500\n";
    file << "volUnit = mL\n\n";

    file << "[CALC.dilution]\n";
    file << "type = dilution\n";
    file << "startConc = 1\n";
    file << "dilutionFactor = 10\n";
    file << "steps = 3                             # at most 10\n";
    file << "concUnit = M\n\n";

    file << "[CALC.buffer]\n";
    file << "type = buffer\n";
    file << "pH = 7.4\n";
    file << "pKa = 7.21\n";
    file << "mwAcid = 119.98\n";
    file << "mwSalt = 141.96\n";
    file << "totalVol = 1000                       # mL\n";
    file << "totalConc = 0.1                       # M\n\n";

    file << "[CALC.conversion]\n";
    file << "type = conversion\n";
    file << "category = TEMP                       # MASS, VOLUME, MOLARITY, TEMP\n";
    file << "value = 38.5\n";
    file << "fromUnit = C\n";
    file << "toUnit = F\n";

    file.close();
    std::cout << "Template configuration written to: " << filename << std::endl;
}

} // namespace VetCalc
