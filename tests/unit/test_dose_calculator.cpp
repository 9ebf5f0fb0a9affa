/**
 * @file test_dose_calculator.cpp
 * @brief Unit tests for dose and infusion rate calculation
 */

#include <gtest/gtest.h>
#include "DoseCalculator.hpp"

using namespace VetCalc;

class DoseCalculatorTest : public ::testing::Test {
protected:
    UnitSystem units;
    DoseCalculator calc{units};
};

TEST_F(DoseCalculatorTest, DoseWithoutInfusionTime) {
    auto result = calc.calculate(RawInputs{
        {"weight", "10"}, {"dose", "5"}, {"conc", "50"}, {"time", "0"}
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->total_dose_mg, 50.0);
    EXPECT_DOUBLE_EQ(result->volume_ml, 1.0);
    EXPECT_FALSE(result->rate.has_value());
}

TEST_F(DoseCalculatorTest, InfusionRateAtTwentyDropsPerMl) {
    auto result = calc.calculate(RawInputs{
        {"weight", "10"}, {"dose", "5"}, {"conc", "50"}, {"time", "30"}
    });

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->rate.has_value());
    EXPECT_NEAR(result->rate->ml_per_hour, 2.0, 1e-12);
    EXPECT_NEAR(result->rate->drops_per_minute, 1.0 * 20.0 / 30.0, 1e-12);
}

TEST_F(DoseCalculatorTest, NegativeTimeOmitsRate) {
    auto result = calc.calculate(RawInputs{
        {"weight", "4"}, {"dose", "2"}, {"conc", "10"}, {"time", "-5"}
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->rate.has_value());
}

TEST_F(DoseCalculatorTest, IncompleteWhenRequiredFieldNotPositive) {
    EXPECT_FALSE(calc.calculate(RawInputs{{"dose", "5"}, {"conc", "50"}}).has_value());
    EXPECT_FALSE(calc.calculate(RawInputs{{"weight", "10"}, {"dose", "0"}, {"conc", "50"}}).has_value());
    EXPECT_FALSE(calc.calculate(RawInputs{{"weight", "10"}, {"dose", "5"}, {"conc", "-1"}}).has_value());
    EXPECT_FALSE(calc.calculate(RawInputs{{"weight", "abc"}, {"dose", "5"}, {"conc", "50"}}).has_value());
}

TEST_F(DoseCalculatorTest, DoseAndConcentrationUnitsConverted) {
    // 500 mcg/kg of a 0.5 % w/v (5 mg/mL) stock for a 20 kg dog
    auto result = calc.calculate(RawInputs{
        {"weight", "20"}, {"dose", "500"}, {"doseUnit", "mcg"},
        {"conc", "0.5"}, {"concUnit", "% w/v"}
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->total_dose_mg, 10.0, 1e-9);
    EXPECT_NEAR(result->volume_ml, 2.0, 1e-9);
}

TEST_F(DoseCalculatorTest, PerKilogramDoseUnitAccepted) {
    auto result = calc.calculate(RawInputs{
        {"weight", "10"}, {"dose", "5"}, {"doseUnit", "mg/kg"}, {"conc", "50"}
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->total_dose_mg, 50.0);
}

TEST_F(DoseCalculatorTest, UnknownUnitIsIncomplete) {
    EXPECT_FALSE(calc.calculate(RawInputs{
        {"weight", "10"}, {"dose", "5"}, {"doseUnit", "grain"}, {"conc", "50"}
    }).has_value());
    EXPECT_FALSE(calc.calculate(RawInputs{
        {"weight", "10"}, {"dose", "5"}, {"conc", "50"}, {"concUnit", "IU/mL"}
    }).has_value());
}

TEST_F(DoseCalculatorTest, CommaDecimalInput) {
    auto result = calc.calculate(RawInputs{
        {"weight", "4,2"}, {"dose", "2"}, {"conc", "10"}
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->total_dose_mg, 8.4, 1e-12);
    EXPECT_NEAR(result->volume_ml, 0.84, 1e-12);
}

TEST_F(DoseCalculatorTest, RepeatedCallsBitIdentical) {
    RawInputs raw = {{"weight", "13.7"}, {"dose", "0.3"}, {"conc", "7"}, {"time", "17"}};
    auto a = calc.calculate(raw);
    auto b = calc.calculate(raw);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->total_dose_mg, b->total_dose_mg);
    EXPECT_EQ(a->volume_ml, b->volume_ml);
    EXPECT_EQ(a->rate->ml_per_hour, b->rate->ml_per_hour);
}
