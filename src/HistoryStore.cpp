#include "HistoryStore.hpp"
#include "RecordSerializer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace VetCalc {

namespace {

std::string toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

// =============================================================================
// InMemoryHistoryStore
// =============================================================================

InMemoryHistoryStore::InMemoryHistoryStore(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("History capacity must be positive");
    }
}

bool InMemoryHistoryStore::append(const CalculationRecord& record) {
    records_.push_front(record);
    while (records_.size() > capacity_) {
        records_.pop_back();
    }
    return true;
}

std::vector<CalculationRecord> InMemoryHistoryStore::records() const {
    return std::vector<CalculationRecord>(records_.begin(), records_.end());
}

bool InMemoryHistoryStore::clear() {
    records_.clear();
    return true;
}

// =============================================================================
// JsonFileHistoryStore
// =============================================================================

JsonFileHistoryStore::JsonFileHistoryStore(const std::string& path, std::size_t capacity)
    : path_(path), capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("History capacity must be positive");
    }
}

bool JsonFileHistoryStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        // Nothing saved yet
        records_.clear();
        return true;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Error: Cannot parse history file " << path_ << ": " << e.what() << std::endl;
        return false;
    }

    if (!j.is_array()) {
        std::cerr << "Error: History file " << path_ << " does not hold a record list" << std::endl;
        return false;
    }

    std::vector<CalculationRecord> loaded;
    for (const auto& item : j) {
        CalculationRecord record;
        if (RecordSerializer::recordFromJson(item, record)) {
            loaded.push_back(record);
        }
        if (loaded.size() == capacity_) break;
    }

    records_ = loaded;
    return true;
}

bool JsonFileHistoryStore::write(const std::vector<CalculationRecord>& records) const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& record : records) {
        j.push_back(RecordSerializer::recordToJson(record));
    }

    // Written beside the live file and renamed over it once complete
    const std::string temp_path = path_ + ".tmp";
    std::ofstream file(temp_path, std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "Warning: Cannot open history file for writing: " << temp_path << std::endl;
        return false;
    }

    file << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    file.flush();
    bool written = file.good();
    file.close();
    if (!written || file.fail()) {
        std::cerr << "Warning: Failed to write history file: " << temp_path << std::endl;
        std::remove(temp_path.c_str());
        return false;
    }

    if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
        std::cerr << "Warning: Cannot replace history file: " << path_ << std::endl;
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

bool JsonFileHistoryStore::append(const CalculationRecord& record) {
    std::vector<CalculationRecord> updated;
    updated.reserve(std::min(records_.size() + 1, capacity_));
    updated.push_back(record);
    for (const auto& existing : records_) {
        if (updated.size() == capacity_) break;
        updated.push_back(existing);
    }

    if (!write(updated)) {
        return false;
    }
    records_ = updated;
    return true;
}

std::vector<CalculationRecord> JsonFileHistoryStore::records() const {
    return records_;
}

bool JsonFileHistoryStore::clear() {
    if (!write({})) {
        return false;
    }
    records_.clear();
    return true;
}

// =============================================================================
// Search
// =============================================================================

std::vector<CalculationRecord> filterRecords(const std::vector<CalculationRecord>& records,
                                             const std::string& query) {
    if (query.empty()) return records;

    std::string needle = toLowerCase(query);
    std::vector<CalculationRecord> result;

    for (const auto& record : records) {
        std::string inputs = RecordSerializer::inputsToJson(record.inputs)
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        if (toLowerCase(record.typeName()).find(needle) != std::string::npos ||
            toLowerCase(record.sentence).find(needle) != std::string::npos ||
            toLowerCase(inputs).find(needle) != std::string::npos) {
            result.push_back(record);
        }
    }
    return result;
}

} // namespace VetCalc
