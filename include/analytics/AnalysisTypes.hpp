#ifndef ANALYSIS_TYPES_HPP
#define ANALYSIS_TYPES_HPP

#include "analytics/FilterCriteria.hpp"
#include "analytics/Records.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prodintel {

/**
 * @brief Efficiency percentage; std::nullopt is the UndefinedMetric marker
 *        produced when the rated counter (or its group sum) is zero.
 */
using EfficiencyPct = std::optional<double>;

/**
 * @brief Named scalar results of one group, e.g. "total_production", "avg_rpm"
 */
using AggregatedStats = std::map<std::string, double>;

enum class ReportStatus {
    Ok,
    NoDataAvailable
};

enum class PeriodGranularity {
    Day,
    Week,
    Month
};

enum class ProductionTableView {
    ByMachine,
    ByDate
};

std::string toString(ReportStatus status);
std::string toString(PeriodGranularity granularity);
std::string toString(ProductionTableView view);

// ---------------------------------------------------------------------------
// Result set rows
// ---------------------------------------------------------------------------

struct MachineEfficiencyRow {
    MachineId machine_id;
    EfficiencyPct avg_efficiency_pct;  // mean of per-record efficiencies
    long long total_production = 0;
};

struct MachineProductionRow {
    MachineId machine_id;
    long long total_production = 0;
};

struct MachineSummaryRow {
    MachineId machine_id;
    double avg_rpm = 0.0;
    double total_rated = 0.0;
    double total_actual = 0.0;
    long long total_production = 0;
    EfficiencyPct efficiency_pct;  // sum(actual) / sum(rated)
};

struct DailyProductionRow {
    Date date;
    long long total_production = 0;
};

/**
 * @brief One bar of the period breakdown
 *
 * (year, subperiod) is the sort key: day-of-year, ISO week or month number
 * depending on the granularity.
 */
struct PeriodProductionRow {
    std::string label;
    int year = 0;
    int subperiod = 0;
    long long total_production = 0;
};

struct PeriodBreakdown {
    PeriodGranularity granularity = PeriodGranularity::Month;
    std::vector<PeriodProductionRow> rows;

    /// Labels in declared (chronological) order, for categorical axes
    std::vector<std::string> categoryOrder() const;
    long long totalProduction() const;
};

struct ProductionTableRow {
    std::string group_key;
    long long total_production = 0;
};

struct ProductionOverview {
    long long total_production = 0;
    double average_daily_production = 0.0;  // mean of the per-date sums
    std::size_t production_days = 0;
};

struct OperatorProductionRow {
    std::string operator_name;
    long long total_production = 0;
};

struct ShiftProductionRow {
    Shift shift = Shift::Day;
    long long total_production = 0;
};

/**
 * @brief Result of joining one operator's records against machine records
 */
struct OperatorEfficiency {
    double total_actual = 0.0;
    double total_rated = 0.0;
    EfficiencyPct efficiency_pct;
    std::vector<MachineId> machines_handled;
    std::size_t matched_rows = 0;
};

struct OperatorSummaryRow {
    std::string operator_name;
    long long total_production = 0;
    std::vector<MachineId> machines_handled;
    std::string machines_handled_display;  // "1, 4, 7"
    EfficiencyPct efficiency_pct;
};

// ---------------------------------------------------------------------------
// Request / report
// ---------------------------------------------------------------------------

/**
 * @brief Everything one dashboard recomputation needs besides the data
 */
struct DashboardRequest {
    FilterCriteria criteria;
    long long top_machines = 5;
    long long top_operators = 5;
    long long bottom_operators = 5;
    ProductionTableView table_view = ProductionTableView::ByMachine;
    std::optional<MachineId> machine_lookup;
    std::optional<std::string> operator_selection;
};

struct MachineView {
    std::vector<MachineEfficiencyRow> top_machines;
    std::vector<MachineProductionRow> rolls_by_machine;
    std::vector<MachineSummaryRow> machine_summary;
};

struct ProductionView {
    ProductionOverview overview;
    std::vector<DailyProductionRow> trend;
    PeriodBreakdown by_period;
    ProductionTableView table_view = ProductionTableView::ByMachine;
    std::vector<ProductionTableRow> table;
};

struct OperatorView {
    ReportStatus status = ReportStatus::NoDataAvailable;
    std::vector<OperatorProductionRow> top_operators;
    std::vector<OperatorProductionRow> bottom_operators;
    std::vector<ShiftProductionRow> shift_split;
    std::vector<OperatorSummaryRow> operator_summary;
};

struct DashboardReport {
    ReportStatus status = ReportStatus::NoDataAvailable;
    FilterCriteria criteria;
    std::size_t machine_records = 0;
    std::size_t operator_records = 0;
    MachineView machine;
    ProductionView production;
    OperatorView operators;
};

} // namespace prodintel

#endif // ANALYSIS_TYPES_HPP
