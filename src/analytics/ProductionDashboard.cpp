#include "analytics/ProductionDashboard.hpp"
#include "analytics/Ranking.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace prodintel {

ProductionDashboard::ProductionDashboard(
    std::unique_ptr<IFilterEngine> filter_engine,
    std::unique_ptr<IProductionAggregator> aggregator,
    std::unique_ptr<IOperatorJoiner> joiner,
    std::unique_ptr<IReportWriter> writer)
    : filter_engine_(std::move(filter_engine)),
      aggregator_(std::move(aggregator)),
      joiner_(std::move(joiner)),
      writer_(std::move(writer)) {

    if (!filter_engine_) throw std::invalid_argument("ProductionDashboard: FilterEngine cannot be null");
    if (!aggregator_) throw std::invalid_argument("ProductionDashboard: ProductionAggregator cannot be null");
    if (!joiner_) throw std::invalid_argument("ProductionDashboard: OperatorJoiner cannot be null");
    if (!writer_) throw std::invalid_argument("ProductionDashboard: ReportWriter cannot be null");
}

DashboardReport ProductionDashboard::buildReport(const EntityStore& store, const DashboardRequest& request) const {
    Logger& logger = Logger::getInstance();

    DashboardReport report;
    report.criteria = request.criteria;

    const std::vector<MachineRecord> machines =
        filter_engine_->filterMachines(store.getMachineRecords(), request.criteria);
    const std::vector<OperatorRecord> operators =
        filter_engine_->filterOperators(store.getOperatorRecords(), request.criteria);

    report.machine_records = machines.size();
    report.operator_records = operators.size();

    if (machines.empty()) {
        logger.warning("ProductionDashboard", "No data available for selected filters (" + request.criteria.describe() + ")");
        report.status = ReportStatus::NoDataAvailable;
        return report;
    }

    report.status = ReportStatus::Ok;
    report.machine = buildMachineView(machines, request);
    report.production = buildProductionView(machines, request);
    report.operators = buildOperatorView(operators, machines, request);

    logger.info("ProductionDashboard",
        "Report built from " + std::to_string(machines.size()) + " machine and " +
        std::to_string(operators.size()) + " operator records (" + request.criteria.describe() + ")");
    return report;
}

MachineView ProductionDashboard::buildMachineView(
    const std::vector<MachineRecord>& machines,
    const DashboardRequest& request) const {

    MachineView view;
    view.top_machines = topN(aggregator_->machineEfficiencyRanking(machines), request.top_machines);
    view.rolls_by_machine = aggregator_->productionByMachine(machines);
    view.machine_summary = aggregator_->machineSummary(machines);

    if (request.machine_lookup) {
        const MachineId& wanted = *request.machine_lookup;
        view.machine_summary.erase(
            std::remove_if(view.machine_summary.begin(), view.machine_summary.end(),
                           [&wanted](const MachineSummaryRow& row) { return row.machine_id != wanted; }),
            view.machine_summary.end());
        if (view.machine_summary.empty()) {
            Logger::getInstance().warning("ProductionDashboard",
                "Machine " + toString(wanted) + " has no records for the selected filters");
        }
    }
    return view;
}

ProductionView ProductionDashboard::buildProductionView(
    const std::vector<MachineRecord>& machines,
    const DashboardRequest& request) const {

    ProductionView view;
    view.overview = aggregator_->productionOverview(machines);
    view.trend = aggregator_->productionByDate(machines);
    view.by_period = aggregator_->productionByPeriod(machines, request.criteria);
    view.table_view = request.table_view;
    view.table = aggregator_->productionTable(machines, request.table_view);
    return view;
}

OperatorView ProductionDashboard::buildOperatorView(
    const std::vector<OperatorRecord>& operators,
    const std::vector<MachineRecord>& machines,
    const DashboardRequest& request) const {

    OperatorView view;
    if (operators.empty()) {
        Logger::getInstance().warning("ProductionDashboard", "No operator data available for selected filters");
        view.status = ReportStatus::NoDataAvailable;
        return view;
    }

    view.status = ReportStatus::Ok;
    const std::vector<OperatorProductionRow> ranking = aggregator_->operatorProductionRanking(operators);
    view.top_operators = topN(ranking, request.top_operators);
    view.bottom_operators = bottomN(ranking, request.bottom_operators);
    view.shift_split = aggregator_->productionByShift(operators);
    view.operator_summary = joiner_->operatorSummary(operators, machines);

    if (request.operator_selection) {
        const std::string& wanted = *request.operator_selection;
        view.operator_summary.erase(
            std::remove_if(view.operator_summary.begin(), view.operator_summary.end(),
                           [&wanted](const OperatorSummaryRow& row) { return row.operator_name != wanted; }),
            view.operator_summary.end());
        if (view.operator_summary.empty()) {
            Logger::getInstance().warning("ProductionDashboard",
                "Operator '" + wanted + "' has no records for the selected filters");
        }
    }
    return view;
}

void ProductionDashboard::writeReport(const DashboardReport& report, const std::string& output_directory) {
    Logger& logger = Logger::getInstance();
    FileUtils::ensureDirectoryExists(output_directory);

    writer_->saveReportStatus(FileUtils::joinPaths(output_directory, "status.csv"), report);
    if (report.status == ReportStatus::Ok) {
        writer_->saveMachineView(output_directory, report.machine);
        writer_->saveProductionView(output_directory, report.production);
        writer_->saveOperatorView(output_directory, report.operators);
    }

    writer_->waitForCompletion();
    logger.info("ProductionDashboard", "Report written to " + output_directory);
}

} // namespace prodintel
