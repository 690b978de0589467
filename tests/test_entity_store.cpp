#include <gtest/gtest.h>
#include "analytics/EntityStore.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "TestRecords.hpp"

using namespace prodintel;
using prodintel::testing::machine;
using prodintel::testing::worker;

class EntityStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
    }
};

TEST_F(EntityStoreTest, ExposesFilterOptions) {
    const EntityStore store(
        {
            machine("2024-11-05", 1LL, 1, 1, 1),
            machine("2024-02-01", 1LL, 1, 1, 1),
            machine("2023-11-20", 2LL, 1, 1, 1)
        },
        {
            worker("2024-02-01", "Ben", 1LL, 1),
            worker("2024-02-01", "Ana", 1LL, 1),
            worker("2024-02-02", "Ben", 1LL, 1)
        });

    EXPECT_EQ(store.getMachineRecordCount(), 3u);
    EXPECT_EQ(store.getOperatorRecordCount(), 3u);
    EXPECT_EQ(store.getAvailableYears(), (std::vector<int>{2023, 2024}));
    EXPECT_EQ(store.getAvailableMonths(), (std::vector<std::string>{"February", "November"}));
    EXPECT_EQ(store.getOperatorNames(), (std::vector<std::string>{"Ana", "Ben"}));
}

TEST_F(EntityStoreTest, CopiesShareTheSameRecords) {
    const EntityStore store({machine("2024-01-01", 1LL, 1, 1, 1)}, {});
    const EntityStore copy = store;
    EXPECT_EQ(&store.getMachineRecords(), &copy.getMachineRecords());
}

TEST_F(EntityStoreTest, RejectsNegativeCounters) {
    EXPECT_THROW(EntityStore({machine("2024-01-01", 1LL, -5, 10, 1)}, {}), InvalidRecordException);
    EXPECT_THROW(EntityStore({machine("2024-01-01", 1LL, 5, 10, -1)}, {}), InvalidRecordException);
}

TEST_F(EntityStoreTest, RejectsEmptyOperatorName) {
    EXPECT_THROW(EntityStore({}, {worker("2024-01-01", "", 1LL, 1)}), InvalidRecordException);
}

TEST_F(EntityStoreTest, RejectsSpecialDates) {
    std::vector<MachineRecord> machines;
    machines.emplace_back(Date(boost::date_time::not_a_date_time), 1LL, 1.0, 1.0, 1.0, 1);
    EXPECT_THROW(EntityStore(std::move(machines), {}), InvalidRecordException);
}
