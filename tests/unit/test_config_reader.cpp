/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "VetCalc.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace VetCalc;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_config_unit.config";
        override_config_file = "test_config_override.config";

        std::ofstream config(test_config_file);
        config << "# Test session\n";
        config << "[ENGINE]\n";
        config << "decimals = 3\n";
        config << "\n[HISTORY]\n";
        config << "max_items = 50\n";
        config << "file = history_test.json   # inline comment\n";
        config << "\n[ANIMAL.rex]\n";
        config << "name = Rex\n";
        config << "species = Dog\n";
        config << "weight = 12.5\n";
        config << "condition = healthy\n";
        config << "\n[CALC.zeta_dose]\n";
        config << "type = dose\n";
        config << "animalId = rex\n";
        config << "weight =\n";
        config << "dose = 0,5\n";
        config << "conc = 10\n";
        config << "\n[CALC.alpha_solution]\n";
        config << "type = solution\n";
        config << "conc = 0.9\n";
        config << "concUnit = % w/v\n";
        config << "volume = 500\n";
        config << "\n[NOTES]\n";
        config << "clinic = North Street   # unrecognized sections are kept\n";
        config.close();

        std::ofstream override_config(override_config_file);
        override_config << "[ENGINE]\n";
        override_config << "decimals = 2\n";
        override_config << "[CALC.extra]\n";
        override_config << "type = conversion\n";
        override_config << "value = 1\n";
        override_config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
        std::remove(override_config_file.c_str());
    }

    std::string test_config_file;
    std::string override_config_file;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    bool loaded = reader.loadFile(test_config_file);
    EXPECT_TRUE(loaded) << "Should load config file successfully";
}

TEST_F(ConfigReaderTest, MissingFile) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, ReadValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getInt("ENGINE", "decimals", 0), 3);
    EXPECT_EQ(reader.getString("HISTORY", "file"), "history_test.json");
    EXPECT_DOUBLE_EQ(reader.getDouble("ANIMAL.rex", "weight", 0.0), 12.5);
    EXPECT_EQ(reader.getString("CALC.alpha_solution", "concUnit"), "% w/v");
    EXPECT_EQ(reader.getString("NOTES", "clinic"), "North Street");
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    // Non-existent key with default
    EXPECT_EQ(reader.getInt("nonexistent", "key", 42), 42);
    EXPECT_DOUBLE_EQ(reader.getDouble("nonexistent", "key", 3.14), 3.14);
    EXPECT_EQ(reader.getString("ENGINE", "missing", "x"), "x");

    // Unparseable numbers fall back to the default
    EXPECT_EQ(reader.getInt("CALC.alpha_solution", "concUnit", 7), 7);
}

TEST_F(ConfigReaderTest, HasSection) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.hasSection("ENGINE"));
    EXPECT_TRUE(reader.hasSection("ANIMAL.rex"));
    EXPECT_FALSE(reader.hasSection("nonexistent"));
}

TEST_F(ConfigReaderTest, HasKey) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.hasKey("HISTORY", "max_items"));
    EXPECT_TRUE(reader.hasKey("CALC.zeta_dose", "weight"));
    EXPECT_FALSE(reader.hasKey("HISTORY", "nonexistent"));
}

TEST_F(ConfigReaderTest, SectionsKeepFileOrder) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto sections = reader.getSections();
    ASSERT_EQ(sections.size(), 6u);
    EXPECT_EQ(sections[0], "ENGINE");
    EXPECT_EQ(sections[3], "CALC.zeta_dose");
    EXPECT_EQ(sections[4], "CALC.alpha_solution");

    auto calcs = reader.getSectionsMatching("CALC.");
    ASSERT_EQ(calcs.size(), 2u);
    EXPECT_EQ(calcs[0], "CALC.zeta_dose");
}

TEST_F(ConfigReaderTest, ParseEngineConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EngineConfig config;
    EXPECT_TRUE(reader.parseEngineConfig(config));
    EXPECT_EQ(config.decimals, 3);
    EXPECT_EQ(config.history_capacity, 50u);
    EXPECT_EQ(config.history_file, "history_test.json");
}

TEST_F(ConfigReaderTest, EngineConfigDefaults) {
    std::istringstream text("[CALC.one]\ntype = dose\n");
    ConfigReader reader;
    ASSERT_TRUE(reader.loadStream(text));

    EngineConfig config;
    EXPECT_FALSE(reader.parseEngineConfig(config));
    EXPECT_EQ(config.decimals, kDefaultDecimals);
    EXPECT_EQ(config.history_capacity, kDefaultHistoryCapacity);
    EXPECT_TRUE(config.history_file.empty());
}

TEST_F(ConfigReaderTest, ParseAnimalProfiles) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto animals = reader.parseAnimalProfiles();
    ASSERT_EQ(animals.size(), 1u);
    EXPECT_EQ(animals[0].id, "rex");
    EXPECT_EQ(animals[0].name, "Rex");
    EXPECT_EQ(animals[0].species, "Dog");
    EXPECT_DOUBLE_EQ(animals[0].weight_kg, 12.5);
    EXPECT_EQ(animals[0].condition, "healthy");
}

TEST_F(ConfigReaderTest, ParseCalculationRequests) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto requests = reader.parseCalculationRequests();
    ASSERT_EQ(requests.size(), 2u);

    EXPECT_EQ(requests[0].label, "zeta_dose");
    EXPECT_EQ(requests[0].formula, "dose");
    EXPECT_EQ(requests[0].inputs.count("type"), 0u);
    EXPECT_EQ(requests[0].inputs.at("dose"), "0,5");
    EXPECT_EQ(requests[0].inputs.at("weight"), "");
    EXPECT_EQ(requests[0].inputs.at("animalId"), "rex");

    EXPECT_EQ(requests[1].label, "alpha_solution");
    EXPECT_EQ(requests[1].inputs.size(), 3u);
}

TEST_F(ConfigReaderTest, MergeFileOverrides) {
    ConfigReader reader;
    reader.loadFile(test_config_file);
    ASSERT_TRUE(reader.mergeFile(override_config_file));

    EXPECT_EQ(reader.getInt("ENGINE", "decimals", 0), 2);
    EXPECT_EQ(reader.getInt("HISTORY", "max_items", 0), 50);

    auto requests = reader.parseCalculationRequests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[2].label, "extra");

    EXPECT_FALSE(reader.mergeFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, ValidateGoodConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, ValidateReportsErrors) {
    std::istringstream text(
        "[ENGINE]\n"
        "decimals = 25\n"
        "[HISTORY]\n"
        "max_items = 0\n"
        "[ANIMAL.]\n"
        "name = Nobody\n"
        "[CALC.bad]\n"
        "type = fluid_therapy\n"
        "[CALC.untyped]\n"
        "value = 1\n");
    ConfigReader reader;
    ASSERT_TRUE(reader.loadStream(text));

    auto result = reader.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.errors.size(), 5u);
    EXPECT_FALSE(result.warnings.empty());
}

TEST_F(ConfigReaderTest, ValidateWarnsWithoutCalculations) {
    std::istringstream text("[ENGINE]\ndecimals = 4\n");
    ConfigReader reader;
    ASSERT_TRUE(reader.loadStream(text));

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    const std::string template_file = "test_config_template.config";
    ConfigReader::generateTemplate(template_file);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(template_file));
    std::remove(template_file.c_str());

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(reader.parseCalculationRequests().size(), 5u);
    EXPECT_EQ(reader.parseAnimalProfiles().size(), 1u);
}
