#include "VetCalc.hpp"
#include "AnimalRegistry.hpp"
#include "CalculationEngine.hpp"
#include "ConfigReader.hpp"
#include "HistoryStore.hpp"
#include "RecordSerializer.hpp"
#include "SuggestionEngine.hpp"
#include "UnitSystem.hpp"
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

static const char help[] = "VetCalc - Veterinary Clinical Calculator\n"
                           "Usage: vetcalc [options]\n\n"
                           "Options:\n"
                           "  -c <file>                Configuration file (.config)\n"
                           "  -o <file>                Export the history as CSV\n"
                           "  -list_units              Print the unit tables\n"
                           "  -generate_config <file>  Write a template configuration\n"
                           "  -help                    Show this message\n\n"
                           "Examples:\n"
                           "  # Run the calculations of a configuration file\n"
                           "  vetcalc -c config/example_session.config -o session.csv\n\n"
                           "  # Generate template configuration\n"
                           "  vetcalc -generate_config my_session.config\n\n";

// Value following a flag, or false if the flag is absent
static bool getOption(int argc, char** argv, const char* name, std::string& value) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], name) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: Option " << name << " requires a value" << std::endl;
                return false;
            }
            value = argv[i + 1];
            return true;
        }
    }
    return false;
}

static bool hasFlag(int argc, char** argv, const char* name) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], name) == 0) return true;
    }
    return false;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "-help") || hasFlag(argc, argv, "-h")) {
        std::cout << help;
        return 0;
    }

    // Check for config file generation
    std::string generate_config;
    if (getOption(argc, argv, "-generate_config", generate_config)) {
        VetCalc::ConfigReader::generateTemplate(generate_config);
        std::cout << "Edit this file to describe your calculations." << std::endl;
        return 0;
    }

    VetCalc::UnitSystem units;

    if (hasFlag(argc, argv, "-list_units")) {
        units.printDatabase(std::cout);
        if (!hasFlag(argc, argv, "-c")) {
            return 0;
        }
    }

    std::string config_file;
    std::string output_file;
    if (!getOption(argc, argv, "-c", config_file)) {
        std::cerr << "Error: Configuration file (-c) required" << std::endl;
        std::cerr << "Run with -help for usage information" << std::endl;
        std::cerr << "Generate template: vetcalc -generate_config template.config" << std::endl;
        return 1;
    }
    bool export_csv = getOption(argc, argv, "-o", output_file);

    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "  VetCalc - Veterinary Clinical Calculator\n";
    std::cout << "  Version " << VETCALC_VERSION_STRING << "\n";
    std::cout << "============================================================\n";
    std::cout << "\n";
    std::cout << "Config file:   " << config_file << "\n";
    if (export_csv) {
        std::cout << "CSV export:    " << output_file << "\n";
    }
    std::cout << std::endl;

    // Load and check configuration
    VetCalc::ConfigReader config;
    if (!config.loadFile(config_file)) {
        return 1;
    }

    auto validation = config.validate();
    for (const auto& warning : validation.warnings) {
        std::cerr << "Warning: " << warning << std::endl;
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        return 1;
    }

    VetCalc::EngineConfig engine_config;
    config.parseEngineConfig(engine_config);

    try {
        // History store
        std::unique_ptr<VetCalc::HistoryStore> history;
        if (engine_config.history_file.empty()) {
            history = std::make_unique<VetCalc::InMemoryHistoryStore>(engine_config.history_capacity);
        } else {
            auto file_store = std::make_unique<VetCalc::JsonFileHistoryStore>(
                engine_config.history_file, engine_config.history_capacity);
            if (!file_store->load()) {
                std::cerr << "Error: Cannot read history file: "
                          << engine_config.history_file << std::endl;
                return 1;
            }
            std::cout << "History file:  " << engine_config.history_file << " ("
                      << file_store->records().size() << " records)" << std::endl;
            history = std::move(file_store);
        }

        // Patient profiles
        VetCalc::InMemoryAnimalRegistry animals;
        for (const auto& profile : config.parseAnimalProfiles()) {
            if (!animals.upsert(profile)) {
                std::cerr << "Warning: Skipping animal '" << profile.id
                          << "' (name and positive weight required)" << std::endl;
            }
        }
        std::cout << "Animals:       " << animals.size() << std::endl;

        VetCalc::CalculationEngine engine(units, *history, &animals, engine_config.decimals);

        std::cout << "\n";
        std::cout << "Running calculations...\n";
        std::cout << "------------------------------------------------------------\n";

        int saved = 0;
        int incomplete = 0;
        int failed = 0;
        for (const auto& request : config.parseCalculationRequests()) {
            auto submission = engine.submitCalculation(request.formula, request.inputs);

            std::cout << "[" << request.label << "] ";
            switch (submission.status) {
                case VetCalc::CalculationEngine::Status::SAVED:
                    std::cout << submission.record->sentence << std::endl;
                    saved++;
                    break;
                case VetCalc::CalculationEngine::Status::SAVE_FAILED:
                    std::cout << submission.record->sentence << " (not saved)" << std::endl;
                    failed++;
                    break;
                case VetCalc::CalculationEngine::Status::INCOMPLETE:
                    std::cout << "incomplete: " << submission.message << std::endl;
                    incomplete++;
                    break;
            }
        }

        std::cout << "------------------------------------------------------------\n";
        std::cout << "Saved: " << saved << "  Incomplete: " << incomplete
                  << "  Not saved: " << failed << "\n";

        auto records = history->records();
        VetCalc::SuggestionEngine suggestions;
        auto next = suggestions.suggestNext(records);
        std::cout << "\n" << next.title << "\n  " << next.description << "\n";

        if (export_csv) {
            std::ofstream out(output_file);
            if (!out.is_open()) {
                std::cerr << "Error: Cannot write CSV file: " << output_file << std::endl;
                return 1;
            }
            out << VetCalc::RecordSerializer::toCsv(records);
            out.close();
            std::cout << "\nHistory exported to: " << output_file
                      << " (" << records.size() << " records)" << std::endl;
        }

        std::cout << "\n";
        std::cout << "============================================================\n";

    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
