#ifndef RECORD_SERIALIZER_HPP
#define RECORD_SERIALIZER_HPP

#include "CalculationResult.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace VetCalc {

/**
 * @brief JSON and CSV representation of calculation records
 *
 * Export rows have the columns
 *
 *   Type,Time,Input Values,Result Values,Summary
 *
 * where the two value columns hold JSON with its double quotes replaced by
 * single quotes so the row stays a valid quoted CSV field.
 */
class RecordSerializer {
public:
    /**
     * @brief UTC ISO-8601 with milliseconds, e.g. 2024-03-01T08:15:30.250Z
     */
    static std::string formatTimestamp(std::chrono::system_clock::time_point tp);

    /**
     * @brief Parse formatTimestamp() output (milliseconds optional)
     */
    static bool parseTimestamp(const std::string& text,
                               std::chrono::system_clock::time_point& tp);

    static nlohmann::json inputsToJson(const RawInputs& inputs);
    static nlohmann::json resultToJson(const CalculationResult& result);

    /**
     * @brief Rebuild a result of the given type from resultToJson() output
     *
     * Fields that the result JSON does not carry (units, conversion input)
     * are recovered from the record inputs.
     */
    static bool resultFromJson(CalculationType type, const nlohmann::json& j,
                               const RawInputs& inputs, CalculationResult& result);

    static nlohmann::json recordToJson(const CalculationRecord& record);
    static bool recordFromJson(const nlohmann::json& j, CalculationRecord& record);

    static const char* csvHeader();
    static std::string toCsvRow(const CalculationRecord& record);

    /**
     * @brief Header line plus one row per record, newline separated
     */
    static std::string toCsv(const std::vector<CalculationRecord>& records);
};

} // namespace VetCalc

#endif // RECORD_SERIALIZER_HPP
