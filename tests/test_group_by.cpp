#include <gtest/gtest.h>
#include "analytics/GroupBy.hpp"
#include "TestRecords.hpp"

using namespace prodintel;
using prodintel::testing::worker;

namespace {

struct Sample {
    std::string key;
    std::optional<double> value;
    Identifier tag;
};

} // namespace

class GroupByTest : public ::testing::Test {
protected:
    void SetUp() override {
        samples_ = {
            {"b", 4.0, Identifier(3LL)},
            {"a", 1.0, Identifier(2LL)},
            {"a", 3.0, Identifier(10LL)},
            {"b", std::nullopt, Identifier(3LL)},
            {"a", 5.0, Identifier(2LL)}
        };
    }

    std::vector<Sample> samples_;
};

TEST_F(GroupByTest, GroupsAreOrderedByKey) {
    const auto groups = groupBy<std::string>(samples_, [](const Sample& s) { return s.key; },
        {Reducer<Sample>::count("n")});

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups.begin()->first, "a");
    EXPECT_DOUBLE_EQ(groups.at("a").value("n"), 3.0);
    EXPECT_EQ(groups.at("b").record_count, 2u);
}

TEST_F(GroupByTest, SumAndMeanOverDefinedValues) {
    const auto groups = groupBy<std::string>(samples_, [](const Sample& s) { return s.key; }, {
        Reducer<Sample>::sum("total", [](const Sample& s) { return s.value; }),
        Reducer<Sample>::mean("avg", [](const Sample& s) { return s.value; })
    });

    EXPECT_DOUBLE_EQ(groups.at("a").value("total"), 9.0);
    EXPECT_DOUBLE_EQ(groups.at("a").value("avg"), 3.0);
}

TEST_F(GroupByTest, UndefinedSampleMakesTheGroupUndefined) {
    const auto groups = groupBy<std::string>(samples_, [](const Sample& s) { return s.key; }, {
        Reducer<Sample>::sum("total", [](const Sample& s) { return s.value; }),
        Reducer<Sample>::mean("avg", [](const Sample& s) { return s.value; })
    });

    EXPECT_FALSE(groups.at("b").metric("total").has_value());
    EXPECT_FALSE(groups.at("b").metric("avg").has_value());
}

TEST_F(GroupByTest, UniqueSortedDeduplicatesAndOrders) {
    const auto groups = groupBy<std::string>(samples_, [](const Sample& s) { return s.key; },
        {Reducer<Sample>::uniqueSorted("tags", [](const Sample& s) { return s.tag; })});

    const auto& tags = groups.at("a").unique("tags");
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_TRUE(tags[0] == Identifier(2LL));
    EXPECT_TRUE(tags[1] == Identifier(10LL));
    EXPECT_EQ(groups.at("b").unique("tags").size(), 1u);
}

TEST_F(GroupByTest, UnknownReducerNameThrows) {
    const auto groups = groupBy<std::string>(samples_, [](const Sample& s) { return s.key; },
        {Reducer<Sample>::count("n")});
    EXPECT_THROW(groups.at("a").metric("missing"), std::out_of_range);
    EXPECT_THROW(groups.at("a").unique("n"), std::out_of_range);
}

TEST_F(GroupByTest, EmptyInputGivesNoGroups) {
    const std::vector<OperatorRecord> none;
    const auto groups = groupBy<std::string>(none, [](const OperatorRecord& r) { return r.operator_name; },
        {Reducer<OperatorRecord>::count("n")});
    EXPECT_TRUE(groups.empty());
}

TEST_F(GroupByTest, CompositeKeys) {
    const std::vector<OperatorRecord> records = {
        worker("2024-01-01", "Ana", 1LL, 5, Shift::Day),
        worker("2024-01-01", "Ana", 2LL, 7, Shift::Night),
        worker("2024-01-02", "Ana", 1LL, 11, Shift::Day)
    };
    const auto groups = groupBy<std::pair<std::string, Shift>>(records,
        [](const OperatorRecord& r) { return std::make_pair(r.operator_name, r.shift); },
        {Reducer<OperatorRecord>::sum("production", [](const OperatorRecord& r) {
            return static_cast<double>(r.production);
        })});

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_DOUBLE_EQ(groups.at({"Ana", Shift::Day}).value("production"), 16.0);
    EXPECT_DOUBLE_EQ(groups.at({"Ana", Shift::Night}).value("production"), 7.0);
}
