#ifndef HISTORY_STORE_HPP
#define HISTORY_STORE_HPP

#include "CalculationResult.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace VetCalc {

/**
 * @brief Log of past calculations, newest first
 *
 * The store owns records once they are appended. It caps the log at
 * capacity() entries and drops the oldest ones beyond it.
 */
class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    /**
     * @brief Prepend a record
     * @return false if the record could not be persisted; the store
     *         contents are then unchanged
     */
    virtual bool append(const CalculationRecord& record) = 0;

    /**
     * @brief Current records, newest first
     */
    virtual std::vector<CalculationRecord> records() const = 0;

    virtual bool clear() = 0;

    virtual std::size_t capacity() const = 0;
};

/**
 * @brief Volatile history kept in process memory
 */
class InMemoryHistoryStore : public HistoryStore {
public:
    /**
     * @throws std::invalid_argument if capacity is zero
     */
    explicit InMemoryHistoryStore(std::size_t capacity = kDefaultHistoryCapacity);

    bool append(const CalculationRecord& record) override;
    std::vector<CalculationRecord> records() const override;
    bool clear() override;
    std::size_t capacity() const override { return capacity_; }

private:
    std::deque<CalculationRecord> records_;
    std::size_t capacity_;
};

/**
 * @brief History persisted as a JSON array in a file
 *
 * Every change writes the whole list to "<path>.tmp" and renames it over
 * the file. A failed write leaves the previous contents in place.
 */
class JsonFileHistoryStore : public HistoryStore {
public:
    /**
     * @throws std::invalid_argument if capacity is zero
     */
    JsonFileHistoryStore(const std::string& path,
                         std::size_t capacity = kDefaultHistoryCapacity);

    /**
     * @brief Read the file; a missing file is an empty history
     * @return false if the file exists but cannot be parsed
     */
    bool load();

    bool append(const CalculationRecord& record) override;
    std::vector<CalculationRecord> records() const override;
    bool clear() override;
    std::size_t capacity() const override { return capacity_; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::size_t capacity_;
    std::vector<CalculationRecord> records_;

    bool write(const std::vector<CalculationRecord>& records) const;
};

/**
 * @brief Case-insensitive search over type, summary and raw inputs
 *
 * An empty query returns every record.
 */
std::vector<CalculationRecord> filterRecords(const std::vector<CalculationRecord>& records,
                                             const std::string& query);

} // namespace VetCalc

#endif // HISTORY_STORE_HPP
