#include "VetCalc.hpp"
#include <algorithm>
#include <cctype>

namespace VetCalc {

std::string calculationTypeName(CalculationType type) {
    switch (type) {
        case CalculationType::DOSE:       return "Dose Calculation";
        case CalculationType::SOLUTION:   return "Solution Calculation";
        case CalculationType::DILUTION:   return "Serial Dilution";
        case CalculationType::BUFFER:     return "Buffer Calculation";
        case CalculationType::CONVERSION: return "Unit Conversion";
    }
    return "Unknown";
}

bool parseCalculationType(const std::string& name, CalculationType& type) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "dose" || key == "dose calculation") {
        type = CalculationType::DOSE;
    } else if (key == "solution" || key == "solution calculation") {
        type = CalculationType::SOLUTION;
    } else if (key == "dilution" || key == "serial dilution") {
        type = CalculationType::DILUTION;
    } else if (key == "buffer" || key == "buffer calculation") {
        type = CalculationType::BUFFER;
    } else if (key == "conversion" || key == "unit conversion") {
        type = CalculationType::CONVERSION;
    } else {
        return false;
    }
    return true;
}

} // namespace VetCalc
