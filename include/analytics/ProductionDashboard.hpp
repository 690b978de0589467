#ifndef PRODUCTION_DASHBOARD_HPP
#define PRODUCTION_DASHBOARD_HPP

#include "analytics/AnalysisTypes.hpp"
#include "analytics/EntityStore.hpp"
#include "analytics/interfaces/IFilterEngine.hpp"
#include "analytics/interfaces/IOperatorJoiner.hpp"
#include "analytics/interfaces/IProductionAggregator.hpp"
#include "analytics/interfaces/IReportWriter.hpp"
#include <memory>
#include <string>

namespace prodintel {

/**
 * @brief High-level orchestrator for one dashboard recomputation
 *
 * Every request filters both collections with the same criteria value and
 * recomputes all result sets from scratch. Work is delegated to injected
 * components:
 * - IFilterEngine: time-criteria selection
 * - IProductionAggregator: grouped production and machine efficiency views
 * - IOperatorJoiner: operator/machine join and operator summary
 * - IReportWriter: asynchronous output of the result sets
 */
class ProductionDashboard {
public:
    /**
     * @brief Constructor with dependency injection
     * @param filter_engine Unique pointer to the filter engine
     * @param aggregator Unique pointer to the production aggregator
     * @param joiner Unique pointer to the operator joiner
     * @param writer Unique pointer to the report writer
     */
    ProductionDashboard(
        std::unique_ptr<IFilterEngine> filter_engine,
        std::unique_ptr<IProductionAggregator> aggregator,
        std::unique_ptr<IOperatorJoiner> joiner,
        std::unique_ptr<IReportWriter> writer
    );

    /**
     * @brief Build every result set for a request
     * @param store Session data
     * @param request Filter criteria and view parameters
     * @return Report; status is NoDataAvailable when no machine record matches
     */
    DashboardReport buildReport(const EntityStore& store, const DashboardRequest& request) const;

    /**
     * @brief Queue all result sets of a report for output and wait for the writes
     * @param report Report produced by buildReport
     * @param output_directory Directory receiving the CSV files
     */
    void writeReport(const DashboardReport& report, const std::string& output_directory);

private:
    std::unique_ptr<IFilterEngine> filter_engine_;
    std::unique_ptr<IProductionAggregator> aggregator_;
    std::unique_ptr<IOperatorJoiner> joiner_;
    std::unique_ptr<IReportWriter> writer_;

    MachineView buildMachineView(const std::vector<MachineRecord>& machines, const DashboardRequest& request) const;
    ProductionView buildProductionView(const std::vector<MachineRecord>& machines, const DashboardRequest& request) const;
    OperatorView buildOperatorView(const std::vector<OperatorRecord>& operators,
                                   const std::vector<MachineRecord>& machines,
                                   const DashboardRequest& request) const;
};

} // namespace prodintel

#endif // PRODUCTION_DASHBOARD_HPP
