#ifndef CALCULATION_ENGINE_HPP
#define CALCULATION_ENGINE_HPP

#include "AnimalRegistry.hpp"
#include "BufferCalculator.hpp"
#include "CalculationResult.hpp"
#include "ConversionCalculator.hpp"
#include "DilutionCalculator.hpp"
#include "DoseCalculator.hpp"
#include "HistoryStore.hpp"
#include "RecordBuilder.hpp"
#include "SolutionCalculator.hpp"
#include "UnitSystem.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace VetCalc {

/**
 * @brief Entry point for the presentation layer
 *
 * Routes a formula name and the raw field strings through the calculators,
 * builds the record of a complete calculation and hands it to the history
 * store. Previews never touch the store.
 *
 * The engine borrows the unit registry, the history store and the optional
 * animal directory; all three must outlive it.
 */
class CalculationEngine {
public:
    enum class Status {
        INCOMPLETE,     ///< Missing or invalid input, nothing recorded
        SAVED,          ///< Record appended to the history store
        SAVE_FAILED     ///< Record built but the store rejected it
    };

    struct Submission {
        Status status = Status::INCOMPLETE;
        std::optional<CalculationRecord> record;    // Set unless INCOMPLETE
        std::string message;

        bool complete() const { return status != Status::INCOMPLETE; }
    };

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    CalculationEngine(const UnitSystem& units, HistoryStore& history,
                      const AnimalDirectory* animals = nullptr,
                      int decimals = kDefaultDecimals);

    /**
     * @brief Calculate, record and store
     * @param formula Record type name or short key (see parseCalculationType)
     */
    Submission submitCalculation(const std::string& formula, const RawInputs& raw);
    Submission submitCalculation(CalculationType type, const RawInputs& raw);

    /**
     * @brief Live result for the current field contents, never recorded
     */
    std::optional<CalculationResult> preview(const std::string& formula,
                                             const RawInputs& raw) const;
    std::optional<CalculationResult> preview(CalculationType type, const RawInputs& raw) const;

    /**
     * @brief Standalone conversion utility
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit, const std::string& family) const {
        return units_.convert(value, from_unit, to_unit, family);
    }

    /**
     * @brief Raw inputs as they will be echoed into the record
     *
     * For doses, an animalId naming a known profile fills an empty weight
     * and sets animalName; otherwise animalName is "Unknown Animal".
     */
    RawInputs resolveInputs(CalculationType type, const RawInputs& raw) const;

    // Override the timestamp source (deterministic records in tests)
    void setClock(Clock clock) { clock_ = std::move(clock); }

    const UnitSystem& units() const { return units_; }
    HistoryStore& history() { return history_; }
    const RecordBuilder& recordBuilder() const { return builder_; }

private:
    const UnitSystem& units_;
    HistoryStore& history_;
    const AnimalDirectory* animals_;

    DoseCalculator dose_;
    SolutionCalculator solution_;
    DilutionCalculator dilution_;
    BufferCalculator buffer_;
    ConversionCalculator conversion_;
    RecordBuilder builder_;

    Clock clock_;

    std::optional<CalculationResult> calculate(CalculationType type, const RawInputs& raw) const;
};

} // namespace VetCalc

#endif // CALCULATION_ENGINE_HPP
