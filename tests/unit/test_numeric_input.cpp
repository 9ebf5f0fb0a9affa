/**
 * @file test_numeric_input.cpp
 * @brief Unit tests for the numeric field sanitizer
 */

#include <gtest/gtest.h>
#include "NumericInput.hpp"
#include <string>
#include <vector>

using namespace VetCalc;

// ============================================================================
// Keystroke Filter Tests
// ============================================================================

TEST(NumericInputTest, FilterKeepsDigitsAndFirstPoint) {
    EXPECT_EQ(NumericInput::filterKeystroke("12.5"), "12.5");
    EXPECT_EQ(NumericInput::filterKeystroke("1.2.3"), "1.23");
    EXPECT_EQ(NumericInput::filterKeystroke("abc"), "");
    EXPECT_EQ(NumericInput::filterKeystroke("-4,5 kg"), "45");
    EXPECT_EQ(NumericInput::filterKeystroke(".5."), ".5");
}

TEST(NumericInputTest, FilterIsIdempotent) {
    std::vector<std::string> samples = {
        "", "0", "12.5", "1..2", "..", "a1b2.c3.d4", "  7 . 8 ", "1e-5", "\xC2\xB5g 3.2"
    };
    for (const auto& s : samples) {
        std::string once = NumericInput::filterKeystroke(s);
        EXPECT_EQ(NumericInput::filterKeystroke(once), once) << "input: " << s;
    }
}

// ============================================================================
// Parse Tests
// ============================================================================

TEST(NumericInputTest, ParsePlainNumbers) {
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("10"), 10.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("0.25"), 0.25);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber(" 7.5 "), 7.5);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("-3"), -3.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("1e-3"), 1e-3);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber(".5"), 0.5);
}

TEST(NumericInputTest, ParseCommaDecimalSeparator) {
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("12,5"), 12.5);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("0,9"), 0.9);
}

TEST(NumericInputTest, ParseFailsToZero) {
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber(""), 0.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("   "), 0.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("abc"), 0.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("12kg"), 0.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("1e999"), 0.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("inf"), 0.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseNumber("nan"), 0.0);
}

TEST(NumericInputTest, TryParseReportsMissingValue) {
    EXPECT_FALSE(NumericInput::tryParseNumber("").has_value());
    EXPECT_FALSE(NumericInput::tryParseNumber("x").has_value());
    EXPECT_FALSE(NumericInput::tryParseNumber("1,2,3").has_value());

    auto zero = NumericInput::tryParseNumber("0");
    ASSERT_TRUE(zero.has_value());
    EXPECT_DOUBLE_EQ(*zero, 0.0);
}

TEST(NumericInputTest, RawFieldAccess) {
    RawInputs inputs = {{"weight", "10,5"}, {"dose", ""}};

    EXPECT_EQ(NumericInput::rawValue(inputs, "weight"), "10,5");
    EXPECT_EQ(NumericInput::rawValue(inputs, "missing", "mg"), "mg");
    EXPECT_DOUBLE_EQ(NumericInput::parseField(inputs, "weight"), 10.5);
    EXPECT_DOUBLE_EQ(NumericInput::parseField(inputs, "dose"), 0.0);
    EXPECT_DOUBLE_EQ(NumericInput::parseField(inputs, "missing"), 0.0);
}
