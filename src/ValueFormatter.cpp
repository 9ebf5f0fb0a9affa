#include "ValueFormatter.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace VetCalc {

namespace {

constexpr int kMaxDecimals = 20;

// Extra digits printed beyond the rounding position. printf emits the exact
// binary value, so the digit after the kept ones decides the rounding.
constexpr int kGuardDigits = 30;

std::string roundFixed(double magnitude, int decimals) {
    // Largest double has 309 integer digits
    char buf[400];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals + kGuardDigits, magnitude);
    std::string digits(buf);

    size_t point = digits.find('.');
    std::string kept = digits.substr(0, point + 1 + decimals);
    bool round_up = digits[point + 1 + decimals] >= '5';

    if (round_up) {
        int i = static_cast<int>(kept.size()) - 1;
        bool carry = true;
        while (carry && i >= 0) {
            if (kept[i] == '.') {
                i--;
                continue;
            }
            if (kept[i] == '9') {
                kept[i] = '0';
                i--;
            } else {
                kept[i]++;
                carry = false;
            }
        }
        if (carry) kept.insert(kept.begin(), '1');
    }
    return kept;
}

void stripTrailingZeros(std::string& s) {
    if (s.find('.') == std::string::npos) return;
    size_t last = s.find_last_not_of('0');
    s.erase(last + 1);
    if (!s.empty() && s.back() == '.') s.pop_back();
}

std::string formatScientific(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*e", decimals, value);
    std::string s(buf);

    // printf pads the exponent to two digits (e-05); display it unpadded
    size_t e = s.find('e');
    std::string mantissa = s.substr(0, e);
    char sign = s[e + 1];
    std::string exponent = s.substr(e + 2);
    size_t nz = exponent.find_first_not_of('0');
    exponent = (nz == std::string::npos) ? "0" : exponent.substr(nz);

    return mantissa + "e" + sign + exponent;
}

} // namespace

std::string formatValue(double value, int decimals) {
    if (std::isnan(value)) return kValuePlaceholder;
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";

    decimals = std::max(0, std::min(decimals, kMaxDecimals));

    if (value != 0.0 && std::abs(value) < kScientificThreshold) {
        return formatScientific(value, decimals);
    }

    std::string s = roundFixed(std::abs(value), decimals);
    stripTrailingZeros(s);
    if (value < 0 && s != "0") {
        s.insert(s.begin(), '-');
    }
    return s;
}

std::string formatValue(const std::optional<double>& value, int decimals) {
    if (!value) return kValuePlaceholder;
    return formatValue(*value, decimals);
}

} // namespace VetCalc
