#include <gtest/gtest.h>
#include "analytics/EfficiencyCalculator.hpp"
#include "analytics/FilterEngine.hpp"
#include "analytics/ProductionAggregator.hpp"
#include "utils/Logger.hpp"
#include "TestRecords.hpp"

using namespace prodintel;
using prodintel::testing::day;
using prodintel::testing::machine;
using prodintel::testing::worker;

class ProductionAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        aggregator_ = std::make_unique<ProductionAggregator>(std::make_shared<EfficiencyCalculator>());

        records_ = {
            machine("2023-12-29", 1LL, 90, 100, 3, 110),
            machine("2024-03-01", 1LL, 80, 100, 10, 100),
            machine("2024-03-01", 2LL, 50, 100, 4, 90),
            machine("2024-03-04", 1LL, 60, 50, 12, 120),
            machine("2024-03-31", 2LL, 40, 0, 6, 80),
            machine("2024-04-02", 10LL, 99, 100, 20, 150)
        };
    }

    std::vector<MachineRecord> filter(const FilterCriteria& criteria) const {
        return FilterEngine().filterMachines(records_, criteria);
    }

    std::unique_ptr<ProductionAggregator> aggregator_;
    std::vector<MachineRecord> records_;
};

TEST_F(ProductionAggregatorTest, RejectsNullCalculator) {
    EXPECT_THROW({ ProductionAggregator aggregator(nullptr); }, std::invalid_argument);
}

TEST_F(ProductionAggregatorTest, GranularitySelection) {
    FilterCriteria criteria;
    EXPECT_EQ(selectPeriodGranularity(criteria), PeriodGranularity::Month);

    criteria.months = {"March"};
    EXPECT_EQ(selectPeriodGranularity(criteria), PeriodGranularity::Week);

    criteria.months = {"March", "April"};
    EXPECT_EQ(selectPeriodGranularity(criteria), PeriodGranularity::Month);

    criteria.start_date = day("2024-03-01");
    criteria.end_date = day("2024-03-31");
    EXPECT_EQ(selectPeriodGranularity(criteria), PeriodGranularity::Day);
}

TEST_F(ProductionAggregatorTest, RollsByMachineAscendingById) {
    const auto rows = aggregator_->productionByMachine(records_);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_TRUE(rows[0].machine_id == Identifier(1LL));
    EXPECT_EQ(rows[0].total_production, 25);
    EXPECT_TRUE(rows[1].machine_id == Identifier(2LL));
    EXPECT_EQ(rows[1].total_production, 10);
    EXPECT_TRUE(rows[2].machine_id == Identifier(10LL));
}

TEST_F(ProductionAggregatorTest, MachineEfficiencyRankingUsesMeanOfRatios) {
    const auto rows = aggregator_->machineEfficiencyRanking(records_);
    ASSERT_EQ(rows.size(), 3u);

    // Machine 10: 99%; machine 1: mean(90, 80, 120) = 96.67%; machine 2 has a zero rated counter
    EXPECT_TRUE(rows[0].machine_id == Identifier(10LL));
    ASSERT_TRUE(rows[1].avg_efficiency_pct.has_value());
    EXPECT_NEAR(*rows[1].avg_efficiency_pct, 290.0 / 3.0, 1e-9);
    EXPECT_TRUE(rows[2].machine_id == Identifier(2LL));
    EXPECT_FALSE(rows[2].avg_efficiency_pct.has_value());
    EXPECT_EQ(rows[2].total_production, 10);
}

TEST_F(ProductionAggregatorTest, MachineSummaryUsesRatioOfSums) {
    const auto rows = aggregator_->machineSummary(records_);
    ASSERT_EQ(rows.size(), 3u);

    const MachineSummaryRow& m1 = rows[0];
    EXPECT_NEAR(m1.avg_rpm, 110.0, 1e-9);
    EXPECT_DOUBLE_EQ(m1.total_actual, 230.0);
    EXPECT_DOUBLE_EQ(m1.total_rated, 250.0);
    ASSERT_TRUE(m1.efficiency_pct.has_value());
    EXPECT_NEAR(*m1.efficiency_pct, 92.0, 1e-9);

    // Machine 2 keeps a defined ratio because only one of its rated counters is zero
    ASSERT_TRUE(rows[1].efficiency_pct.has_value());
    EXPECT_NEAR(*rows[1].efficiency_pct, 90.0, 1e-9);
}

TEST_F(ProductionAggregatorTest, DailyTrendAndOverview) {
    const auto trend = aggregator_->productionByDate(records_);
    ASSERT_EQ(trend.size(), 5u);
    EXPECT_EQ(trend[1].date, day("2024-03-01"));
    EXPECT_EQ(trend[1].total_production, 14);

    const ProductionOverview overview = aggregator_->productionOverview(records_);
    EXPECT_EQ(overview.total_production, 55);
    EXPECT_EQ(overview.production_days, 5u);
    EXPECT_DOUBLE_EQ(overview.average_daily_production, 11.0);
}

TEST_F(ProductionAggregatorTest, OverviewOfNothingIsZero) {
    const ProductionOverview overview = aggregator_->productionOverview({});
    EXPECT_EQ(overview.total_production, 0);
    EXPECT_EQ(overview.production_days, 0u);
    EXPECT_DOUBLE_EQ(overview.average_daily_production, 0.0);
}

TEST_F(ProductionAggregatorTest, MonthlyLabelsInChronologicalOrder) {
    const auto breakdown = aggregator_->productionByPeriod(records_, FilterCriteria{});
    EXPECT_EQ(breakdown.granularity, PeriodGranularity::Month);
    EXPECT_EQ(breakdown.categoryOrder(),
              (std::vector<std::string>{"December 2023", "March 2024", "April 2024"}));
    EXPECT_EQ(breakdown.rows[1].total_production, 32);
    EXPECT_EQ(breakdown.totalProduction(), 55);
}

TEST_F(ProductionAggregatorTest, WeeklyTotalsSumToSelectedMonth) {
    FilterCriteria criteria;
    criteria.years = {2024};
    criteria.months = {"March"};
    const auto march = filter(criteria);

    const auto breakdown = aggregator_->productionByPeriod(march, criteria);
    EXPECT_EQ(breakdown.granularity, PeriodGranularity::Week);
    // 2024-03-01 is in ISO week 9, 03-04 in week 10, 03-31 in week 13
    EXPECT_EQ(breakdown.categoryOrder(), (std::vector<std::string>{"Week 9", "Week 10", "Week 13"}));
    EXPECT_EQ(breakdown.totalProduction(), 32);
}

TEST_F(ProductionAggregatorTest, DailyBreakdownForDateRange) {
    FilterCriteria criteria;
    criteria.start_date = day("2024-03-01");
    criteria.end_date = day("2024-03-04");

    const auto breakdown = aggregator_->productionByPeriod(filter(criteria), criteria);
    EXPECT_EQ(breakdown.granularity, PeriodGranularity::Day);
    EXPECT_EQ(breakdown.categoryOrder(), (std::vector<std::string>{"2024-03-01", "2024-03-04"}));
    EXPECT_EQ(breakdown.totalProduction(), 26);
}

TEST_F(ProductionAggregatorTest, ProductionTableFollowsViewMode) {
    const auto by_machine = aggregator_->productionTable(records_, ProductionTableView::ByMachine);
    ASSERT_EQ(by_machine.size(), 3u);
    EXPECT_EQ(by_machine[2].group_key, "10");

    const auto by_date = aggregator_->productionTable(records_, ProductionTableView::ByDate);
    ASSERT_EQ(by_date.size(), 5u);
    EXPECT_EQ(by_date[0].group_key, "2023-12-29");
    EXPECT_EQ(by_date[0].total_production, 3);
}

TEST_F(ProductionAggregatorTest, OperatorRankingAndShiftSplit) {
    const std::vector<OperatorRecord> operators = {
        worker("2024-03-01", "Ben", 1LL, 10, Shift::Day),
        worker("2024-03-01", "Ana", 2LL, 4, Shift::Night),
        worker("2024-03-04", "Ana", 1LL, 12, Shift::Day),
        worker("2024-03-04", "Cal", 2LL, 16, Shift::Night)
    };

    const auto ranking = aggregator_->operatorProductionRanking(operators);
    ASSERT_EQ(ranking.size(), 3u);
    // Ana and Cal tie on 16; name ascending breaks the tie
    EXPECT_EQ(ranking[0].operator_name, "Ana");
    EXPECT_EQ(ranking[1].operator_name, "Cal");
    EXPECT_EQ(ranking[2].operator_name, "Ben");

    const auto shifts = aggregator_->productionByShift(operators);
    ASSERT_EQ(shifts.size(), 2u);
    EXPECT_EQ(shifts[0].shift, Shift::Day);
    EXPECT_EQ(shifts[0].total_production, 22);
    EXPECT_EQ(shifts[1].total_production, 20);
}
