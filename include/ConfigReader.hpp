#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "AnimalRegistry.hpp"
#include "VetCalc.hpp"
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace VetCalc {

/**
 * @brief INI-style configuration reader
 *
 * Engine settings, patient profiles and batch calculation requests are all
 * described in one text file:
 *
 *   [ENGINE]          decimals
 *   [HISTORY]         max_items, file
 *   [ANIMAL.<id>]     name, species, weight, condition
 *   [CALC.<label>]    type plus the raw input fields of that formula
 */
class ConfigReader {
public:
    // =========================================================================
    // Nested Struct Definitions
    // =========================================================================

    /**
     * @brief One [CALC.<label>] section
     *
     * Inputs keep the text as written in the file so the summary sentence
     * echoes it unchanged.
     */
    struct CalculationRequest {
        std::string label;
        std::string formula;
        RawInputs inputs;
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    // =========================================================================
    // Constructor/Destructor
    // =========================================================================

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration text from any stream
    bool loadStream(std::istream& input);

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    bool parseEngineConfig(EngineConfig& config) const;

    /**
     * @brief Patient profiles, id taken from the section suffix
     */
    std::vector<AnimalProfile> parseAnimalProfiles() const;

    /**
     * @brief Calculation requests in file order
     */
    std::vector<CalculationRequest> parseCalculationRequests() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;

    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;

    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    // Sections in the order they first appear
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;

    bool mergeFile(const std::string& filename);

    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    std::vector<std::string> section_order_;

    void setValue(const std::string& section, const std::string& key,
                  const std::string& value);

    std::string trim(const std::string& str) const;

    // Part of a section name after the first '.'
    std::string sectionSuffix(const std::string& section) const;
};

} // namespace VetCalc

#endif // CONFIG_READER_HPP
