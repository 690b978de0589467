#include <gtest/gtest.h>
#include "analytics/Records.hpp"
#include "TestRecords.hpp"

using namespace prodintel;
using prodintel::testing::day;

TEST(IdentifierTest, ParsesIntegersAndSpreadsheetFloats) {
    EXPECT_TRUE(parseIdentifier("7") == Identifier(7LL));
    EXPECT_TRUE(parseIdentifier(" 12.0 ") == Identifier(12LL));
    EXPECT_TRUE(parseIdentifier("12.5") == Identifier(std::string("12.5")));
    EXPECT_TRUE(parseIdentifier("M-3") == Identifier(std::string("M-3")));
}

TEST(IdentifierTest, NumericIdsOrderNumericallyAndBeforeText) {
    EXPECT_LT(parseIdentifier("2"), parseIdentifier("10"));
    EXPECT_LT(parseIdentifier("99"), parseIdentifier("A1"));
    EXPECT_EQ(toString(parseIdentifier("10")), "10");
    EXPECT_EQ(toString(parseIdentifier("A1")), "A1");
}

TEST(ShiftTest, ParsesCaseInsensitively) {
    ASSERT_TRUE(parseShift(" night ").has_value());
    EXPECT_EQ(*parseShift(" night "), Shift::Night);
    EXPECT_EQ(*parseShift("DAY"), Shift::Day);
    EXPECT_FALSE(parseShift("evening").has_value());
    EXPECT_EQ(toString(Shift::Night), "Night");
}

TEST(CalendarFieldsTest, DerivesYearMonthAndIsoWeek) {
    const CalendarFields fields = CalendarFields::fromDate(day("2024-03-15"));
    EXPECT_EQ(fields.year, 2024);
    EXPECT_EQ(fields.month, 3);
    EXPECT_EQ(fields.month_name, "March");
    EXPECT_EQ(fields.iso_week, 11);
}

TEST(CalendarFieldsTest, EarlyJanuaryCanBelongToPreviousIsoYearWeek) {
    // 2021-01-01 is a Friday, part of ISO week 53 of 2020
    const CalendarFields fields = CalendarFields::fromDate(day("2021-01-01"));
    EXPECT_EQ(fields.year, 2021);
    EXPECT_EQ(fields.iso_week, 53);
}

TEST(RecordTest, ConstructorFillsCalendar) {
    const MachineRecord record = prodintel::testing::machine("2025-07-04", 3LL, 80.0, 100.0, 12);
    EXPECT_EQ(record.calendar.month_name, "July");
    EXPECT_EQ(record.calendar.year, 2025);

    const OperatorRecord op = prodintel::testing::worker("2025-07-04", "Ana", 3LL, 5, Shift::Night);
    EXPECT_EQ(op.calendar.month, 7);
    EXPECT_EQ(op.shift, Shift::Night);
}
