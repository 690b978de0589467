#ifndef I_REPORT_WRITER_HPP
#define I_REPORT_WRITER_HPP

#include "analytics/AnalysisTypes.hpp"
#include <cstddef>
#include <string>

namespace prodintel {

/**
 * @brief Interface for asynchronous result-set output
 *
 * All save operations return immediately after queueing the work.
 * Use waitForCompletion() to block until everything has been written.
 */
class IReportWriter {
public:
    virtual ~IReportWriter() = default;

    /**
     * @brief Save TopMachinesByEfficiency, RollsByMachine and MachineSummary (async)
     * @param output_dir Directory receiving one CSV file per result set
     * @param view Machine views of a report
     */
    virtual void saveMachineView(
        const std::string& output_dir,
        const MachineView& view
    ) = 0;

    /**
     * @brief Save ProductionOverview, ProductionTrend, ProductionByPeriod and ProductionTable (async)
     */
    virtual void saveProductionView(
        const std::string& output_dir,
        const ProductionView& view
    ) = 0;

    /**
     * @brief Save TopOperators, BottomOperators, ShiftSplit and OperatorSummary (async)
     */
    virtual void saveOperatorView(
        const std::string& output_dir,
        const OperatorView& view
    ) = 0;

    /**
     * @brief Save the report status and record counts (async)
     * @param filepath Output file path
     * @param report Report whose status is written
     */
    virtual void saveReportStatus(
        const std::string& filepath,
        const DashboardReport& report
    ) = 0;

    /**
     * @brief Block until all pending writes complete
     */
    virtual void waitForCompletion() = 0;

    /**
     * @brief Number of queued or running write tasks
     */
    virtual size_t getPendingTaskCount() const = 0;
};

} // namespace prodintel

#endif // I_REPORT_WRITER_HPP
