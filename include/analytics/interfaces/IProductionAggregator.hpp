#ifndef I_PRODUCTION_AGGREGATOR_HPP
#define I_PRODUCTION_AGGREGATOR_HPP

#include "analytics/AnalysisTypes.hpp"
#include "analytics/FilterCriteria.hpp"
#include "analytics/Records.hpp"
#include <vector>

namespace prodintel {

/**
 * @brief Interface for the grouped production and efficiency views
 *
 * All methods are pure functions over already-filtered collections.
 */
class IProductionAggregator {
public:
    virtual ~IProductionAggregator() = default;

    /**
     * @brief Machines ranked by mean per-record efficiency
     * @param records Filtered machine records
     * @return One row per machine, descending by average efficiency
     *         (undefined last, ties by machine id)
     */
    virtual std::vector<MachineEfficiencyRow> machineEfficiencyRanking(
        const std::vector<MachineRecord>& records
    ) const = 0;

    /**
     * @brief Total production per machine, ascending by machine id
     */
    virtual std::vector<MachineProductionRow> productionByMachine(
        const std::vector<MachineRecord>& records
    ) const = 0;

    /**
     * @brief Machine summary table with aggregate (summed counter) efficiency
     * @param records Filtered machine records
     * @return One row per machine, ascending by machine id
     */
    virtual std::vector<MachineSummaryRow> machineSummary(
        const std::vector<MachineRecord>& records
    ) const = 0;

    /**
     * @brief Total production per calendar date, ascending
     */
    virtual std::vector<DailyProductionRow> productionByDate(
        const std::vector<MachineRecord>& records
    ) const = 0;

    /**
     * @brief Total production and mean of the per-date totals
     */
    virtual ProductionOverview productionOverview(
        const std::vector<MachineRecord>& records
    ) const = 0;

    /**
     * @brief Production per period at the granularity implied by the criteria
     * @param records Filtered machine records
     * @param criteria Criteria the records were filtered with
     * @return Rows ascending by (year, subperiod) with display labels
     */
    virtual PeriodBreakdown productionByPeriod(
        const std::vector<MachineRecord>& records,
        const FilterCriteria& criteria
    ) const = 0;

    /**
     * @brief Production table grouped by machine or by date
     */
    virtual std::vector<ProductionTableRow> productionTable(
        const std::vector<MachineRecord>& records,
        ProductionTableView view
    ) const = 0;

    /**
     * @brief Total production per operator, descending (ties by name)
     */
    virtual std::vector<OperatorProductionRow> operatorProductionRanking(
        const std::vector<OperatorRecord>& records
    ) const = 0;

    /**
     * @brief Total production per shift
     */
    virtual std::vector<ShiftProductionRow> productionByShift(
        const std::vector<OperatorRecord>& records
    ) const = 0;
};

} // namespace prodintel

#endif // I_PRODUCTION_AGGREGATOR_HPP
