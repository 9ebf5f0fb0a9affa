#include "NumericInput.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace VetCalc {
namespace NumericInput {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Plain decimal literal: [+-] digits [. digits] [(e|E) [+-] digits]
bool isDecimalLiteral(const std::string& s) {
    size_t i = 0;
    if (i < s.length() && (s[i] == '+' || s[i] == '-')) i++;

    bool has_digits = false;
    bool has_decimal = false;
    while (i < s.length()) {
        if (isDigit(s[i])) {
            has_digits = true;
            i++;
        } else if (s[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else {
            break;
        }
    }
    if (!has_digits) return false;

    if (i < s.length() && (s[i] == 'e' || s[i] == 'E')) {
        i++;
        if (i < s.length() && (s[i] == '+' || s[i] == '-')) i++;
        bool has_exp_digits = false;
        while (i < s.length() && isDigit(s[i])) {
            has_exp_digits = true;
            i++;
        }
        if (!has_exp_digits) return false;
    }

    return i == s.length();
}

} // namespace

std::string filterKeystroke(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool seen_point = false;

    for (char c : text) {
        if (isDigit(c)) {
            result.push_back(c);
        } else if (c == '.' && !seen_point) {
            seen_point = true;
            result.push_back(c);
        }
    }
    return result;
}

std::optional<double> tryParseNumber(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    size_t comma = s.find(',');
    if (comma != std::string::npos) {
        s[comma] = '.';
    }

    if (!isDecimalLiteral(s)) return std::nullopt;

    double value = std::strtod(s.c_str(), nullptr);
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

double parseNumber(const std::string& text) {
    return tryParseNumber(text).value_or(0.0);
}

std::string rawValue(const RawInputs& inputs, const std::string& key,
                     const std::string& default_val) {
    auto it = inputs.find(key);
    if (it == inputs.end()) return default_val;
    return it->second;
}

double parseField(const RawInputs& inputs, const std::string& key) {
    return parseNumber(rawValue(inputs, key));
}

} // namespace NumericInput
} // namespace VetCalc
