#ifndef FILTER_ENGINE_HPP
#define FILTER_ENGINE_HPP

#include "analytics/interfaces/IFilterEngine.hpp"

namespace prodintel {

/**
 * @brief Concrete implementation of IFilterEngine
 *
 * Policy, in priority order: a complete date range (inclusive) wins and the
 * year/month selections are ignored; otherwise the year set and then the
 * month-name set restrict the records; with no criteria everything passes.
 */
class FilterEngine : public IFilterEngine {
public:
    FilterEngine() = default;

    std::vector<MachineRecord> filterMachines(
        const std::vector<MachineRecord>& records,
        const FilterCriteria& criteria
    ) const override;

    std::vector<OperatorRecord> filterOperators(
        const std::vector<OperatorRecord>& records,
        const FilterCriteria& criteria
    ) const override;

    /**
     * @brief Test a single record date against the criteria
     */
    static bool matches(const Date& date, const CalendarFields& calendar, const FilterCriteria& criteria);

private:
    template <typename Record>
    std::vector<Record> apply(const std::vector<Record>& records, const FilterCriteria& criteria) const;
};

} // namespace prodintel

#endif // FILTER_ENGINE_HPP
