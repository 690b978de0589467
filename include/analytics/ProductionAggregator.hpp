#ifndef PRODUCTION_AGGREGATOR_HPP
#define PRODUCTION_AGGREGATOR_HPP

#include "analytics/interfaces/IEfficiencyCalculator.hpp"
#include "analytics/interfaces/IProductionAggregator.hpp"
#include <memory>

namespace prodintel {

/**
 * @brief Select the period granularity for a request
 *
 * Date range active -> per day; exactly one month selected -> per ISO week;
 * anything else -> per month.
 */
PeriodGranularity selectPeriodGranularity(const FilterCriteria& criteria);

/**
 * @brief Concrete implementation of IProductionAggregator
 *
 * Built on the generic groupBy engine with Boost.Accumulators reducers.
 */
class ProductionAggregator : public IProductionAggregator {
public:
    /**
     * @param calculator Efficiency formulas used by the machine views
     */
    explicit ProductionAggregator(std::shared_ptr<const IEfficiencyCalculator> calculator);

    std::vector<MachineEfficiencyRow> machineEfficiencyRanking(
        const std::vector<MachineRecord>& records
    ) const override;

    std::vector<MachineProductionRow> productionByMachine(
        const std::vector<MachineRecord>& records
    ) const override;

    std::vector<MachineSummaryRow> machineSummary(
        const std::vector<MachineRecord>& records
    ) const override;

    std::vector<DailyProductionRow> productionByDate(
        const std::vector<MachineRecord>& records
    ) const override;

    ProductionOverview productionOverview(
        const std::vector<MachineRecord>& records
    ) const override;

    PeriodBreakdown productionByPeriod(
        const std::vector<MachineRecord>& records,
        const FilterCriteria& criteria
    ) const override;

    std::vector<ProductionTableRow> productionTable(
        const std::vector<MachineRecord>& records,
        ProductionTableView view
    ) const override;

    std::vector<OperatorProductionRow> operatorProductionRanking(
        const std::vector<OperatorRecord>& records
    ) const override;

    std::vector<ShiftProductionRow> productionByShift(
        const std::vector<OperatorRecord>& records
    ) const override;

private:
    std::shared_ptr<const IEfficiencyCalculator> calculator_;
};

} // namespace prodintel

#endif // PRODUCTION_AGGREGATOR_HPP
