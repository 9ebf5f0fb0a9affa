#ifndef RECORD_BUILDER_HPP
#define RECORD_BUILDER_HPP

#include "CalculationResult.hpp"
#include "UnitSystem.hpp"
#include <chrono>
#include <string>

namespace VetCalc {

/**
 * @brief Packages a finished calculation into a history record
 *
 * The summary sentence interpolates the raw input strings as the user typed
 * them together with formatted result values. Only valid results are
 * handed to the builder.
 */
class RecordBuilder {
public:
    explicit RecordBuilder(const UnitSystem& units, int decimals = kDefaultDecimals);

    /**
     * @brief One-line human readable summary of a result
     */
    std::string buildSentence(const RawInputs& inputs, const CalculationResult& result) const;

    /**
     * @brief Build the record; the type follows the result variant
     */
    CalculationRecord build(const RawInputs& inputs, const CalculationResult& result,
                            std::chrono::system_clock::time_point timestamp) const;

    int decimals() const { return decimals_; }

private:
    const UnitSystem& units_;
    int decimals_;
};

} // namespace VetCalc

#endif // RECORD_BUILDER_HPP
