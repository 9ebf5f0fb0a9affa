#include "RecordSerializer.hpp"
#include "NumericInput.hpp"
#include "UnitSystem.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <limits>
#include <sstream>

namespace VetCalc {

using json = nlohmann::json;

namespace {

std::string dumpJson(const json& j) {
    // Raw inputs may carry arbitrary bytes; never let a bad sequence throw
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string singleQuoted(std::string text) {
    std::replace(text.begin(), text.end(), '"', '\'');
    return text;
}

std::string csvEscaped(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '"') result.push_back('"');
        result.push_back(c);
    }
    return result;
}

// Present and null reads as NaN (non-finite values are stored as null)
bool readNumber(const json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end()) return false;
    if (it->is_null()) {
        out = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    if (!it->is_number()) return false;
    out = it->get<double>();
    return true;
}

struct ResultJsonVisitor {
    json operator()(const DoseResult& r) const {
        json j;
        j["totalDoseMg"] = r.total_dose_mg;
        j["volNeeded"] = r.volume_ml;
        if (r.rate) {
            j["mlHrRate"] = r.rate->ml_per_hour;
            j["dropRate"] = r.rate->drops_per_minute;
        }
        return j;
    }

    json operator()(const SolutionResult& r) const {
        json j;
        j["gramsNeeded"] = r.grams;
        return j;
    }

    json operator()(const DilutionResult& r) const {
        json j;
        j["finalConc"] = r.final_concentration;
        j["data"] = json::array();
        for (const auto& step : r.steps) {
            json point;
            point["step"] = step.step;
            point["conc"] = step.concentration;
            j["data"].push_back(point);
        }
        return j;
    }

    json operator()(const BufferResult& r) const {
        json j;
        j["ratio"] = r.ratio;
        j["fractionAcid"] = r.fraction_acid;
        j["fractionSalt"] = r.fraction_salt;
        j["acidMass"] = r.acid_mass_g;
        j["saltMass"] = r.salt_mass_g;
        return j;
    }

    json operator()(const ConversionResult& r) const {
        json j;
        j["convertedValue"] = r.converted_value;
        return j;
    }
};

} // namespace

// =============================================================================
// Timestamps
// =============================================================================

std::string RecordSerializer::formatTimestamp(std::chrono::system_clock::time_point tp) {
    long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    long long secs = ms / 1000;
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s.%03dZ", date, millis);
    return buf;
}

bool RecordSerializer::parseTimestamp(const std::string& text,
                                      std::chrono::system_clock::time_point& tp) {
    std::tm utc{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                    &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed) != 6) {
        return false;
    }

    int millis = 0;
    std::string rest = text.substr(consumed);
    if (!rest.empty() && rest[0] == '.') {
        int ms_consumed = 0;
        if (std::sscanf(rest.c_str(), ".%3d%n", &millis, &ms_consumed) != 1) {
            return false;
        }
        rest = rest.substr(ms_consumed);
    }
    if (rest != "Z") {
        return false;
    }

    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    std::time_t t = timegm(&utc);

    tp = std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
    return true;
}

// =============================================================================
// JSON
// =============================================================================

json RecordSerializer::inputsToJson(const RawInputs& inputs) {
    json j = json::object();
    for (const auto& kv : inputs) {
        j[kv.first] = kv.second;
    }
    return j;
}

json RecordSerializer::resultToJson(const CalculationResult& result) {
    return std::visit(ResultJsonVisitor{}, result);
}

bool RecordSerializer::resultFromJson(CalculationType type, const json& j,
                                      const RawInputs& inputs, CalculationResult& result) {
    if (!j.is_object()) return false;

    switch (type) {
        case CalculationType::DOSE: {
            DoseResult r;
            if (!readNumber(j, "totalDoseMg", r.total_dose_mg) ||
                !readNumber(j, "volNeeded", r.volume_ml)) {
                return false;
            }
            InfusionRate rate;
            if (readNumber(j, "mlHrRate", rate.ml_per_hour) &&
                readNumber(j, "dropRate", rate.drops_per_minute)) {
                r.rate = rate;
            }
            result = r;
            return true;
        }
        case CalculationType::SOLUTION: {
            SolutionResult r;
            if (!readNumber(j, "gramsNeeded", r.grams)) return false;
            result = r;
            return true;
        }
        case CalculationType::DILUTION: {
            DilutionResult r;
            if (!readNumber(j, "finalConc", r.final_concentration)) return false;
            auto data = j.find("data");
            if (data == j.end() || !data->is_array()) return false;
            for (const auto& point : *data) {
                DilutionStep step;
                double conc = 0.0;
                auto index = point.find("step");
                if (index == point.end() || !index->is_number_integer() ||
                    !readNumber(point, "conc", conc)) {
                    return false;
                }
                step.step = index->get<int>();
                step.concentration = conc;
                r.steps.push_back(step);
            }
            r.unit = NumericInput::rawValue(inputs, "concUnit", "M");
            result = r;
            return true;
        }
        case CalculationType::BUFFER: {
            BufferResult r;
            if (!readNumber(j, "ratio", r.ratio) ||
                !readNumber(j, "fractionAcid", r.fraction_acid) ||
                !readNumber(j, "fractionSalt", r.fraction_salt) ||
                !readNumber(j, "acidMass", r.acid_mass_g) ||
                !readNumber(j, "saltMass", r.salt_mass_g)) {
                return false;
            }
            result = r;
            return true;
        }
        case CalculationType::CONVERSION: {
            ConversionResult r;
            if (!readNumber(j, "convertedValue", r.converted_value)) return false;
            r.input_value = NumericInput::parseField(inputs, "value");
            r.from_unit = NumericInput::rawValue(inputs, "fromUnit");
            r.to_unit = NumericInput::rawValue(inputs, "toUnit");
            r.family = NumericInput::rawValue(inputs, "category", Families::MASS);
            r.identity = (r.from_unit == r.to_unit);
            result = r;
            return true;
        }
    }
    return false;
}

json RecordSerializer::recordToJson(const CalculationRecord& record) {
    json j;
    j["type"] = record.typeName();
    j["time"] = formatTimestamp(record.timestamp);
    j["inputs"] = inputsToJson(record.inputs);
    j["result"] = resultToJson(record.result);
    j["sentence"] = record.sentence;
    return j;
}

bool RecordSerializer::recordFromJson(const json& j, CalculationRecord& record) {
    try {
        CalculationRecord parsed;

        std::string type_name = j.at("type").get<std::string>();
        if (!parseCalculationType(type_name, parsed.type)) {
            std::cerr << "Warning: Unknown calculation type in history: " << type_name << std::endl;
            return false;
        }

        std::string time = j.at("time").get<std::string>();
        if (!parseTimestamp(time, parsed.timestamp)) {
            std::cerr << "Warning: Invalid timestamp in history: " << time << std::endl;
            return false;
        }

        for (const auto& item : j.at("inputs").items()) {
            parsed.inputs[item.key()] = item.value().is_string()
                ? item.value().get<std::string>()
                : dumpJson(item.value());
        }

        if (!resultFromJson(parsed.type, j.at("result"), parsed.inputs, parsed.result)) {
            std::cerr << "Warning: Invalid result for " << type_name << " in history" << std::endl;
            return false;
        }

        parsed.sentence = j.value("sentence", std::string());
        record = parsed;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "Warning: Invalid history record: " << e.what() << std::endl;
        return false;
    }
}

// =============================================================================
// CSV
// =============================================================================

const char* RecordSerializer::csvHeader() {
    return "Type,Time,Input Values,Result Values,Summary";
}

std::string RecordSerializer::toCsvRow(const CalculationRecord& record) {
    std::string inputs = singleQuoted(dumpJson(inputsToJson(record.inputs)));
    std::string results = singleQuoted(dumpJson(resultToJson(record.result)));
    std::string summary = record.sentence.empty() ? "N/A" : record.sentence;

    std::ostringstream ss;
    ss << record.typeName() << ","
       << formatTimestamp(record.timestamp) << ","
       << "\"" << inputs << "\","
       << "\"" << results << "\","
       << "\"" << csvEscaped(summary) << "\"";
    return ss.str();
}

std::string RecordSerializer::toCsv(const std::vector<CalculationRecord>& records) {
    std::ostringstream ss;
    ss << csvHeader() << "\n";
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0) ss << "\n";
        ss << toCsvRow(records[i]);
    }
    return ss.str();
}

} // namespace VetCalc
