/**
 * @file test_history_store.cpp
 * @brief Unit tests for the in-memory and JSON file history stores
 */

#include <gtest/gtest.h>
#include "HistoryStore.hpp"
#include "RecordSerializer.hpp"
#include <csignal>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <sys/resource.h>

using namespace VetCalc;

namespace {

CalculationRecord makeRecord(int index, CalculationType type = CalculationType::SOLUTION) {
    CalculationRecord record;
    record.type = type;
    record.timestamp = std::chrono::system_clock::from_time_t(1700000000 + index);
    record.inputs = {{"index", std::to_string(index)}};
    if (type == CalculationType::SOLUTION) {
        record.result = SolutionResult{static_cast<double>(index)};
    } else {
        record.result = ConversionResult{1.0, 1000.0, "g", "mg", "MASS", false};
    }
    record.sentence = "record " + std::to_string(index);
    return record;
}

} // namespace

// ============================================================================
// InMemoryHistoryStore Tests
// ============================================================================

TEST(InMemoryHistoryStoreTest, NewestFirst) {
    InMemoryHistoryStore store;
    EXPECT_EQ(store.capacity(), 300u);

    store.append(makeRecord(1));
    store.append(makeRecord(2));
    store.append(makeRecord(3));

    auto records = store.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].sentence, "record 3");
    EXPECT_EQ(records[2].sentence, "record 1");
}

TEST(InMemoryHistoryStoreTest, OldestDroppedBeyondCapacity) {
    InMemoryHistoryStore store(3);
    for (int i = 1; i <= 5; ++i) {
        EXPECT_TRUE(store.append(makeRecord(i)));
    }

    auto records = store.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].sentence, "record 5");
    EXPECT_EQ(records[2].sentence, "record 3");
}

TEST(InMemoryHistoryStoreTest, DefaultCapacityHolds) {
    InMemoryHistoryStore store;
    for (int i = 0; i < 305; ++i) {
        store.append(makeRecord(i));
    }
    EXPECT_EQ(store.records().size(), kDefaultHistoryCapacity);
    EXPECT_EQ(store.records().back().sentence, "record 5");
}

TEST(InMemoryHistoryStoreTest, Clear) {
    InMemoryHistoryStore store;
    store.append(makeRecord(1));
    EXPECT_TRUE(store.clear());
    EXPECT_TRUE(store.records().empty());
}

TEST(InMemoryHistoryStoreTest, ZeroCapacityRejected) {
    EXPECT_THROW(InMemoryHistoryStore(0), std::invalid_argument);
}

// ============================================================================
// JsonFileHistoryStore Tests
// ============================================================================

class JsonFileHistoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_history_file = "test_history_unit.json";
        std::remove(test_history_file.c_str());
    }

    void TearDown() override {
        std::remove(test_history_file.c_str());
        std::remove((test_history_file + ".tmp").c_str());
    }

    long fileSize() const {
        std::ifstream in(test_history_file, std::ios::binary | std::ios::ate);
        return in.is_open() ? static_cast<long>(in.tellg()) : -1;
    }

    std::string test_history_file;
};

TEST_F(JsonFileHistoryStoreTest, MissingFileIsEmptyHistory) {
    JsonFileHistoryStore store(test_history_file);
    EXPECT_TRUE(store.load());
    EXPECT_TRUE(store.records().empty());
    EXPECT_EQ(store.path(), test_history_file);
}

TEST_F(JsonFileHistoryStoreTest, PersistsAcrossInstances) {
    {
        JsonFileHistoryStore store(test_history_file);
        ASSERT_TRUE(store.load());
        ASSERT_TRUE(store.append(makeRecord(1)));
        ASSERT_TRUE(store.append(makeRecord(2, CalculationType::CONVERSION)));
    }

    JsonFileHistoryStore reopened(test_history_file);
    ASSERT_TRUE(reopened.load());
    auto records = reopened.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].type, CalculationType::CONVERSION);
    EXPECT_EQ(records[0].sentence, "record 2");
    EXPECT_EQ(records[1].type, CalculationType::SOLUTION);
    EXPECT_DOUBLE_EQ(std::get<SolutionResult>(records[1].result).grams, 1.0);
    EXPECT_EQ(records[1].timestamp, std::chrono::system_clock::from_time_t(1700000001));
}

TEST_F(JsonFileHistoryStoreTest, CapacityAppliedOnAppendAndLoad) {
    {
        JsonFileHistoryStore store(test_history_file, 5);
        for (int i = 1; i <= 5; ++i) {
            ASSERT_TRUE(store.append(makeRecord(i)));
        }
    }

    JsonFileHistoryStore smaller(test_history_file, 2);
    ASSERT_TRUE(smaller.load());
    ASSERT_EQ(smaller.records().size(), 2u);
    EXPECT_EQ(smaller.records()[0].sentence, "record 5");

    ASSERT_TRUE(smaller.append(makeRecord(6)));
    ASSERT_EQ(smaller.records().size(), 2u);
    EXPECT_EQ(smaller.records()[1].sentence, "record 5");
}

TEST_F(JsonFileHistoryStoreTest, ClearWritesEmptyList) {
    JsonFileHistoryStore store(test_history_file);
    ASSERT_TRUE(store.append(makeRecord(1)));
    ASSERT_TRUE(store.clear());

    JsonFileHistoryStore reopened(test_history_file);
    ASSERT_TRUE(reopened.load());
    EXPECT_TRUE(reopened.records().empty());
}

TEST_F(JsonFileHistoryStoreTest, CorruptFileReported) {
    std::ofstream out(test_history_file);
    out << "{ not json";
    out.close();

    JsonFileHistoryStore store(test_history_file);
    EXPECT_FALSE(store.load());

    std::ofstream object(test_history_file);
    object << "{\"type\": \"Unit Conversion\"}";
    object.close();
    EXPECT_FALSE(store.load());
}

TEST_F(JsonFileHistoryStoreTest, InvalidEntriesSkipped) {
    std::ofstream out(test_history_file);
    out << "[{\"type\": \"Unknown\"}, "
        << RecordSerializer::recordToJson(makeRecord(7)).dump() << "]";
    out.close();

    JsonFileHistoryStore store(test_history_file);
    ASSERT_TRUE(store.load());
    ASSERT_EQ(store.records().size(), 1u);
    EXPECT_EQ(store.records()[0].sentence, "record 7");
}

TEST_F(JsonFileHistoryStoreTest, FailedWriteKeepsPreviousState) {
    JsonFileHistoryStore store("nonexistent_dir_for_history/history.json");
    ASSERT_TRUE(store.load());
    EXPECT_FALSE(store.append(makeRecord(1)));
    EXPECT_TRUE(store.records().empty());
    EXPECT_FALSE(store.clear());
}

TEST_F(JsonFileHistoryStoreTest, FailedAppendLeavesPreviousFile) {
    {
        JsonFileHistoryStore store(test_history_file);
        ASSERT_TRUE(store.load());
        for (int i = 1; i <= 20; ++i) {
            ASSERT_TRUE(store.append(makeRecord(i)));
        }
    }
    long size = fileSize();
    ASSERT_GT(size, 0);

    JsonFileHistoryStore store(test_history_file);
    ASSERT_TRUE(store.load());

    struct rlimit saved;
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &saved), 0);
    struct rlimit capped = saved;
    capped.rlim_cur = static_cast<rlim_t>(size / 2);
    auto previous_handler = std::signal(SIGXFSZ, SIG_IGN);
    ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &capped), 0);

    bool appended = store.append(makeRecord(21));

    setrlimit(RLIMIT_FSIZE, &saved);
    std::signal(SIGXFSZ, previous_handler);

    EXPECT_FALSE(appended);
    EXPECT_EQ(store.records().size(), 20u);
    EXPECT_EQ(fileSize(), size);
    EXPECT_FALSE(std::ifstream(test_history_file + ".tmp").is_open());

    JsonFileHistoryStore reopened(test_history_file);
    ASSERT_TRUE(reopened.load());
    ASSERT_EQ(reopened.records().size(), 20u);
    EXPECT_EQ(reopened.records()[0].sentence, "record 20");
    EXPECT_EQ(reopened.records()[19].sentence, "record 1");
}

// ============================================================================
// Search Tests
// ============================================================================

TEST(FilterRecordsTest, MatchesTypeSentenceAndInputs) {
    std::vector<CalculationRecord> records = {
        makeRecord(1),
        makeRecord(2, CalculationType::CONVERSION),
        makeRecord(3)
    };

    EXPECT_EQ(filterRecords(records, "").size(), 3u);
    EXPECT_EQ(filterRecords(records, "unit conv").size(), 1u);
    EXPECT_EQ(filterRecords(records, "SOLUTION").size(), 2u);
    EXPECT_EQ(filterRecords(records, "record 3").size(), 1u);
    EXPECT_EQ(filterRecords(records, "\"index\":\"2\"").size(), 1u);
    EXPECT_TRUE(filterRecords(records, "buffer").empty());
}

TEST(FilterRecordsTest, NonAsciiTextMatches) {
    CalculationRecord record = makeRecord(1, CalculationType::CONVERSION);
    record.sentence = "Converted 250 mcg to 0.25 mg (Mass (g, mg, \xC2\xB5g, kg)).";
    std::vector<CalculationRecord> records = {record, makeRecord(2)};

    auto found = filterRecords(records, "MASS (G, MG, \xC2\xB5G");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].sentence, record.sentence);
    EXPECT_TRUE(filterRecords(records, "\xC2\xB0" "C").empty());
}
