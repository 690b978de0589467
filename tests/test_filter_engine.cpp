#include <gtest/gtest.h>
#include "analytics/FilterEngine.hpp"
#include "utils/Logger.hpp"
#include "TestRecords.hpp"
#include <numeric>

using namespace prodintel;
using prodintel::testing::day;
using prodintel::testing::machine;
using prodintel::testing::worker;

class FilterEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        records_ = {
            machine("2023-12-30", 1LL, 80, 100, 10),
            machine("2024-01-02", 1LL, 90, 100, 20),
            machine("2024-01-20", 2LL, 70, 100, 30),
            machine("2024-02-03", 2LL, 60, 100, 40),
            machine("2024-03-15", 3LL, 50, 100, 50),
            machine("2025-01-05", 3LL, 95, 100, 60)
        };
    }

    static long long totalProduction(const std::vector<MachineRecord>& records) {
        return std::accumulate(records.begin(), records.end(), 0LL,
            [](long long sum, const MachineRecord& r) { return sum + r.production; });
    }

    FilterEngine engine_;
    std::vector<MachineRecord> records_;
};

TEST_F(FilterEngineTest, EmptyCriteriaKeepsEverything) {
    EXPECT_EQ(engine_.filterMachines(records_, FilterCriteria{}).size(), records_.size());
}

TEST_F(FilterEngineTest, DateRangeIsInclusive) {
    FilterCriteria criteria;
    criteria.start_date = day("2024-01-02");
    criteria.end_date = day("2024-02-03");

    const auto selected = engine_.filterMachines(records_, criteria);
    ASSERT_EQ(selected.size(), 3u);
    EXPECT_EQ(totalProduction(selected), 90);
}

TEST_F(FilterEngineTest, DateRangeOverridesYearsAndMonths) {
    FilterCriteria range_only;
    range_only.start_date = day("2023-12-01");
    range_only.end_date = day("2024-01-31");

    FilterCriteria combined = range_only;
    combined.years = {2025};
    combined.months = {"March"};

    const auto expected = engine_.filterMachines(records_, range_only);
    const auto actual = engine_.filterMachines(records_, combined);
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < actual.size(); ++i) {
        EXPECT_EQ(actual[i].date, expected[i].date);
        EXPECT_TRUE(actual[i].machine_id == expected[i].machine_id);
    }
}

TEST_F(FilterEngineTest, HalfOpenRangeFallsBackToYearAndMonth) {
    FilterCriteria criteria;
    criteria.start_date = day("2025-01-01");
    criteria.years = {2024};

    const auto selected = engine_.filterMachines(records_, criteria);
    EXPECT_EQ(selected.size(), 4u);
}

TEST_F(FilterEngineTest, YearsAndMonthsCombineWithAnd) {
    FilterCriteria criteria;
    criteria.years = {2024, 2025};
    criteria.months = {"January"};

    const auto selected = engine_.filterMachines(records_, criteria);
    ASSERT_EQ(selected.size(), 3u);
    EXPECT_EQ(totalProduction(selected), 110);
}

TEST_F(FilterEngineTest, YearPartitionsSumToTotal) {
    long long partitioned = 0;
    for (int year : {2023, 2024, 2025}) {
        FilterCriteria criteria;
        criteria.years = {year};
        partitioned += totalProduction(engine_.filterMachines(records_, criteria));
    }
    EXPECT_EQ(partitioned, totalProduction(records_));
}

TEST_F(FilterEngineTest, FilterNeverGrowsTheCollection) {
    std::vector<FilterCriteria> all(4);
    all[1].years = {2024};
    all[2].months = {"February", "March"};
    all[3].start_date = day("2020-01-01");
    all[3].end_date = day("2030-01-01");

    for (const auto& criteria : all) {
        EXPECT_LE(engine_.filterMachines(records_, criteria).size(), records_.size());
    }
}

TEST_F(FilterEngineTest, NoMatchYieldsEmptyCollection) {
    FilterCriteria criteria;
    criteria.years = {1999};
    EXPECT_TRUE(engine_.filterMachines(records_, criteria).empty());
}

TEST_F(FilterEngineTest, InvertedRangeYieldsEmptyCollection) {
    FilterCriteria criteria;
    criteria.start_date = day("2024-12-31");
    criteria.end_date = day("2024-01-01");
    EXPECT_TRUE(engine_.filterMachines(records_, criteria).empty());
}

TEST_F(FilterEngineTest, OperatorRecordsUseTheSameCriteria) {
    const std::vector<OperatorRecord> operators = {
        worker("2024-01-02", "Ana", 1LL, 10),
        worker("2024-02-03", "Ben", 2LL, 20),
        worker("2025-01-05", "Ana", 3LL, 30)
    };
    FilterCriteria criteria;
    criteria.months = {"January"};

    const auto selected = engine_.filterOperators(operators, criteria);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].operator_name, "Ana");
    EXPECT_EQ(selected[1].production, 30);
}
