#include <gtest/gtest.h>
#include "analytics/EfficiencyCalculator.hpp"
#include "analytics/OperatorJoiner.hpp"
#include "utils/Logger.hpp"
#include "TestRecords.hpp"

using namespace prodintel;
using prodintel::testing::machine;
using prodintel::testing::worker;

class OperatorJoinerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        joiner_ = std::make_unique<OperatorJoiner>(std::make_shared<EfficiencyCalculator>());
    }

    std::unique_ptr<OperatorJoiner> joiner_;
};

TEST_F(OperatorJoinerTest, RejectsNullCalculator) {
    EXPECT_THROW({ OperatorJoiner joiner(nullptr); }, std::invalid_argument);
}

TEST_F(OperatorJoinerTest, PartialMatchKeepsFullProductionAndMachineList) {
    const std::vector<OperatorRecord> operators = {
        worker("2024-05-01", "X", 1LL, 10),
        worker("2024-05-02", "X", 2LL, 5)
    };
    const std::vector<MachineRecord> machines = {
        machine("2024-05-01", 1LL, 90, 100, 10)
    };

    const auto summary = joiner_->operatorSummary(operators, machines);
    ASSERT_EQ(summary.size(), 1u);
    EXPECT_EQ(summary[0].operator_name, "X");
    EXPECT_EQ(summary[0].total_production, 15);
    EXPECT_EQ(summary[0].machines_handled_display, "1, 2");
    ASSERT_TRUE(summary[0].efficiency_pct.has_value());
    EXPECT_NEAR(*summary[0].efficiency_pct, 90.0, 1e-9);

    const auto joined = joiner_->joinOperatorEfficiency(operators, machines);
    EXPECT_EQ(joined.at("X").matched_rows, 1u);
    EXPECT_DOUBLE_EQ(joined.at("X").total_rated, 100.0);
}

TEST_F(OperatorJoinerTest, OperatorWithoutMatchesHasUndefinedEfficiency) {
    const std::vector<OperatorRecord> operators = {
        worker("2024-05-01", "Y", 7LL, 8),
        worker("2024-05-01", "Z", 1LL, 3)
    };
    const std::vector<MachineRecord> machines = {
        machine("2024-05-01", 1LL, 45, 50, 3)
    };

    const auto summary = joiner_->operatorSummary(operators, machines);
    ASSERT_EQ(summary.size(), 2u);
    EXPECT_EQ(summary[0].operator_name, "Y");
    EXPECT_EQ(summary[0].total_production, 8);
    EXPECT_FALSE(summary[0].efficiency_pct.has_value());
    EXPECT_EQ(summary[1].operator_name, "Z");
    ASSERT_TRUE(summary[1].efficiency_pct.has_value());
    EXPECT_NEAR(*summary[1].efficiency_pct, 90.0, 1e-9);
}

TEST_F(OperatorJoinerTest, JoinRequiresSameDateAndMachine) {
    const std::vector<OperatorRecord> operators = {worker("2024-05-02", "X", 1LL, 4)};
    const std::vector<MachineRecord> machines = {
        machine("2024-05-01", 1LL, 90, 100, 10),
        machine("2024-05-02", 2LL, 90, 100, 10)
    };

    const auto joined = joiner_->joinOperatorEfficiency(operators, machines);
    EXPECT_EQ(joined.at("X").matched_rows, 0u);
    EXPECT_FALSE(joined.at("X").efficiency_pct.has_value());
}

TEST_F(OperatorJoinerTest, MachinesHandledAreSortedAndDistinct) {
    const std::vector<OperatorRecord> operators = {
        worker("2024-05-01", "X", 10LL, 1),
        worker("2024-05-02", "X", 2LL, 1),
        worker("2024-05-03", "X", 10LL, 1),
        worker("2024-05-04", "X", std::string("B7"), 1)
    };

    const auto joined = joiner_->joinOperatorEfficiency(operators, {});
    const auto& handled = joined.at("X").machines_handled;
    ASSERT_EQ(handled.size(), 3u);
    EXPECT_EQ(formatMachineList(handled), "2, 10, B7");
}

TEST_F(OperatorJoinerTest, DuplicateMachineReadingsEachContribute) {
    const std::vector<OperatorRecord> operators = {worker("2024-05-01", "X", 1LL, 4)};
    const std::vector<MachineRecord> machines = {
        machine("2024-05-01", 1LL, 40, 50, 2),
        machine("2024-05-01", 1LL, 60, 50, 2)
    };

    const auto joined = joiner_->joinOperatorEfficiency(operators, machines);
    EXPECT_EQ(joined.at("X").matched_rows, 2u);
    ASSERT_TRUE(joined.at("X").efficiency_pct.has_value());
    EXPECT_NEAR(*joined.at("X").efficiency_pct, 100.0, 1e-9);
}

TEST_F(OperatorJoinerTest, SummaryOrderedByProductionDescending) {
    const std::vector<OperatorRecord> operators = {
        worker("2024-05-01", "Low", 1LL, 2),
        worker("2024-05-01", "High", 2LL, 20),
        worker("2024-05-02", "Mid", 1LL, 9)
    };

    const auto summary = joiner_->operatorSummary(operators, {});
    ASSERT_EQ(summary.size(), 3u);
    EXPECT_EQ(summary[0].operator_name, "High");
    EXPECT_EQ(summary[1].operator_name, "Mid");
    EXPECT_EQ(summary[2].operator_name, "Low");
}
