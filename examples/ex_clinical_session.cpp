/*
 * Example: Clinical Calculation Session
 *
 * Walks through a typical treatment-room session without a configuration
 * file: register a patient, dose it, prepare and dilute the stock, mix a
 * phosphate buffer and convert a body temperature. Every completed
 * calculation lands in the history, which is printed and exported as CSV
 * at the end.
 */

#include "AnimalRegistry.hpp"
#include "CalculationEngine.hpp"
#include "HistoryStore.hpp"
#include "RecordSerializer.hpp"
#include "SuggestionEngine.hpp"
#include "UnitSystem.hpp"
#include "ValueFormatter.hpp"
#include <fstream>
#include <iostream>
#include <string>

using namespace VetCalc;

static void report(const std::string& label, const CalculationEngine::Submission& submission) {
    std::cout << label << ": ";
    if (submission.record) {
        std::cout << submission.record->sentence << "\n";
    } else {
        std::cout << "(incomplete) " << submission.message << "\n";
    }
}

int main(int argc, char** argv) {
    std::string csv_file = "clinical_session.csv";
    if (argc > 1) {
        csv_file = argv[1];
    }

    std::cout << "================================================\n";
    std::cout << "  Clinical Calculation Session Example\n";
    std::cout << "================================================\n\n";

    UnitSystem units;
    InMemoryHistoryStore history;
    InMemoryAnimalRegistry animals;

    AnimalProfile bella;
    bella.id = "bella";
    bella.name = "Bella";
    bella.species = "Cat";
    bella.weight_kg = 4.2;
    bella.condition = "dehydrated";
    if (!animals.upsert(bella)) {
        std::cerr << "Error: Could not register patient" << std::endl;
        return 1;
    }

    CalculationEngine engine(units, history, &animals);

    // Live preview while fields are being typed: nothing is recorded
    auto preview = engine.preview("dose", {{"animalId", "bella"}, {"dose", "2"}});
    std::cout << "Preview without concentration: "
              << (preview ? "complete" : "incomplete") << "\n\n";

    report("Dose", engine.submitCalculation("dose", {
        {"animalId", "bella"},
        {"dose", "2"},
        {"conc", "10"},
        {"concUnit", "mg/mL"},
        {"time", "15"}
    }));

    report("Solution", engine.submitCalculation("solution", {
        {"conc", "0.9"},
        {"concUnit", "% w/v"},
        {"volume", "250"},
        {"volUnit", "mL"}
    }));

    report("Dilution", engine.submitCalculation("dilution", {
        {"startConc", "100"},
        {"dilutionFactor", "2"},
        {"steps", "4"},
        {"concUnit", "mM"}
    }));

    report("Buffer", engine.submitCalculation("buffer", {
        {"pH", "7.4"},
        {"pKa", "7.21"},
        {"mwAcid", "119.98"},
        {"mwSalt", "141.96"},
        {"totalVol", "500"},
        {"totalConc", "0.1"}
    }));

    report("Conversion", engine.submitCalculation("conversion", {
        {"category", "TEMP"},
        {"value", "39,2"},
        {"fromUnit", "C"},
        {"toUnit", "F"}
    }));

    // Standalone conversion utility
    double micrograms = engine.convert(0.25, "mg", "mcg", Families::MASS);
    std::cout << "\n0.25 mg = " << formatValue(micrograms) << " mcg\n";

    SuggestionEngine suggestions;
    auto next = suggestions.suggestNext(history.records());
    std::cout << "\n" << next.title << "\n  " << next.description << "\n";

    std::ofstream out(csv_file);
    if (!out.is_open()) {
        std::cerr << "Error: Cannot write " << csv_file << std::endl;
        return 1;
    }
    out << RecordSerializer::toCsv(history.records());
    out.close();

    std::cout << "\n================================================\n";
    std::cout << "  " << history.records().size() << " records exported to " << csv_file << "\n";
    std::cout << "================================================\n\n";

    return 0;
}
