#include "RecordBuilder.hpp"
#include "NumericInput.hpp"
#include "ValueFormatter.hpp"
#include <sstream>

namespace VetCalc {

namespace {

/**
 * @brief Summary sentence per result variant
 */
class SentenceVisitor {
public:
    SentenceVisitor(const RawInputs& inputs, const UnitSystem& units, int decimals)
        : inputs_(inputs), units_(units), decimals_(decimals) {}

    std::string operator()(const DoseResult& r) const {
        std::ostringstream ss;
        ss << "Dose for " << raw("animalName", "Unknown Animal")
           << " (" << raw("weight") << "kg): "
           << fmt(r.total_dose_mg) << " mg required, volume "
           << fmt(r.volume_ml) << " mL from "
           << raw("conc") << " " << raw("concUnit", "mg/mL") << " stock.";
        if (r.rate) {
            ss << " Infusion rate: " << fmt(r.rate->ml_per_hour) << " mL/hr ("
               << fmt(r.rate->drops_per_minute) << " drops/min).";
        } else {
            ss << " No infusion time given.";
        }
        return ss.str();
    }

    std::string operator()(const SolutionResult& r) const {
        std::ostringstream ss;
        ss << "To make a solution of " << raw("conc") << " " << raw("concUnit", "M")
           << " in " << raw("volume") << " " << raw("volUnit", "mL")
           << " (MW: " << raw("mw") << "), "
           << fmt(r.grams) << " grams are needed.";
        return ss.str();
    }

    std::string operator()(const DilutionResult& r) const {
        std::ostringstream ss;
        ss << "Serial dilution of " << raw("startConc") << " " << r.unit
           << " with factor " << raw("dilutionFactor")
           << " for " << raw("steps") << " steps. Final concentration: "
           << fmt(r.final_concentration) << " " << r.unit << ".";
        return ss.str();
    }

    std::string operator()(const BufferResult& r) const {
        std::ostringstream ss;
        ss << "Buffer calculated: Ratio [A-]/[HA] = " << fmt(r.ratio)
           << ". Required: " << fmt(r.acid_mass_g) << " g Acid, "
           << fmt(r.salt_mass_g) << " g Salt for "
           << raw("totalVol") << " mL of " << raw("totalConc") << " M solution.";
        return ss.str();
    }

    std::string operator()(const ConversionResult& r) const {
        const UnitFamily* family = units_.getFamily(r.family);
        std::ostringstream ss;
        ss << "Converted " << raw("value") << " " << r.from_unit
           << " to " << fmt(r.converted_value) << " " << r.to_unit
           << " (" << (family ? family->display_name : r.family) << ").";
        return ss.str();
    }

private:
    const RawInputs& inputs_;
    const UnitSystem& units_;
    int decimals_;

    std::string raw(const std::string& key, const std::string& default_val = "") const {
        return NumericInput::rawValue(inputs_, key, default_val);
    }

    std::string fmt(double value) const {
        return formatValue(value, decimals_);
    }
};

} // namespace

RecordBuilder::RecordBuilder(const UnitSystem& units, int decimals)
    : units_(units), decimals_(decimals) {}

std::string RecordBuilder::buildSentence(const RawInputs& inputs,
                                         const CalculationResult& result) const {
    return std::visit(SentenceVisitor(inputs, units_, decimals_), result);
}

CalculationRecord RecordBuilder::build(const RawInputs& inputs, const CalculationResult& result,
                                       std::chrono::system_clock::time_point timestamp) const {
    CalculationRecord record;
    record.type = resultType(result);
    record.timestamp = timestamp;
    record.inputs = inputs;
    record.result = result;
    record.sentence = buildSentence(inputs, result);
    return record;
}

} // namespace VetCalc
