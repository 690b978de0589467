#include "analytics/ProductionAggregator.hpp"
#include "analytics/GroupBy.hpp"
#include "analytics/Ranking.hpp"
#include "utils/Logger.hpp"
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace ba = boost::accumulators;

namespace prodintel {

namespace {

const std::string TOTAL_PRODUCTION = "total_production";

long long toCount(double value) {
    return static_cast<long long>(std::llround(value));
}

template <typename Record>
Reducer<Record> productionSum() {
    return Reducer<Record>::sum(TOTAL_PRODUCTION, [](const Record& r) {
        return static_cast<double>(r.production);
    });
}

/**
 * @brief Machine record paired with its precomputed per-record efficiency
 */
struct ScoredRecord {
    const MachineRecord* record;
    EfficiencyPct efficiency;
    long long production;
};

std::string monthName(int month) {
    return boost::gregorian::greg_month(static_cast<unsigned short>(month)).as_long_string();
}

} // namespace

PeriodGranularity selectPeriodGranularity(const FilterCriteria& criteria) {
    if (criteria.hasDateRange()) {
        return PeriodGranularity::Day;
    }
    if (criteria.isSingleMonthSelection()) {
        return PeriodGranularity::Week;
    }
    return PeriodGranularity::Month;
}

ProductionAggregator::ProductionAggregator(std::shared_ptr<const IEfficiencyCalculator> calculator)
    : calculator_(std::move(calculator)) {
    if (!calculator_) {
        throw std::invalid_argument("ProductionAggregator: Efficiency calculator cannot be null");
    }
}

std::vector<MachineEfficiencyRow> ProductionAggregator::machineEfficiencyRanking(
    const std::vector<MachineRecord>& records) const {

    const std::vector<EfficiencyPct> efficiencies = calculator_->recordEfficiencies(records);

    std::vector<ScoredRecord> scored;
    scored.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        scored.push_back({&records[i], efficiencies[i], records[i].production});
    }

    const auto groups = groupBy<MachineId>(
        scored,
        [](const ScoredRecord& s) { return s.record->machine_id; },
        {
            Reducer<ScoredRecord>::mean("avg_efficiency", [](const ScoredRecord& s) { return s.efficiency; }),
            productionSum<ScoredRecord>()
        });

    std::vector<MachineEfficiencyRow> rows;
    rows.reserve(groups.size());
    for (const auto& [machine_id, aggregates] : groups) {
        rows.push_back({machine_id, aggregates.metric("avg_efficiency"), toCount(aggregates.value(TOTAL_PRODUCTION))});
    }

    sortByMetricDescending(rows,
        [](const MachineEfficiencyRow& row) { return row.avg_efficiency_pct; },
        [](const MachineEfficiencyRow& row) { return row.machine_id; });
    return rows;
}

std::vector<MachineProductionRow> ProductionAggregator::productionByMachine(
    const std::vector<MachineRecord>& records) const {

    const auto groups = groupBy<MachineId>(
        records,
        [](const MachineRecord& r) { return r.machine_id; },
        {productionSum<MachineRecord>()});

    std::vector<MachineProductionRow> rows;
    rows.reserve(groups.size());
    for (const auto& [machine_id, aggregates] : groups) {
        rows.push_back({machine_id, toCount(aggregates.value(TOTAL_PRODUCTION))});
    }
    return rows;
}

std::vector<MachineSummaryRow> ProductionAggregator::machineSummary(
    const std::vector<MachineRecord>& records) const {

    const auto groups = groupBy<MachineId>(
        records,
        [](const MachineRecord& r) { return r.machine_id; },
        {
            Reducer<MachineRecord>::mean("avg_rpm", [](const MachineRecord& r) { return r.rpm; }),
            Reducer<MachineRecord>::sum("total_rated", [](const MachineRecord& r) { return r.rated_counter; }),
            Reducer<MachineRecord>::sum("total_actual", [](const MachineRecord& r) { return r.actual_counter; }),
            productionSum<MachineRecord>()
        });

    std::vector<MachineSummaryRow> rows;
    rows.reserve(groups.size());
    for (const auto& [machine_id, aggregates] : groups) {
        MachineSummaryRow row;
        row.machine_id = machine_id;
        row.avg_rpm = aggregates.value("avg_rpm");
        row.total_rated = aggregates.value("total_rated");
        row.total_actual = aggregates.value("total_actual");
        row.total_production = toCount(aggregates.value(TOTAL_PRODUCTION));
        // Efficiency from the summed counters, not from averaging per-record ratios
        row.efficiency_pct = calculator_->aggregateEfficiency(row.total_actual, row.total_rated);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<DailyProductionRow> ProductionAggregator::productionByDate(
    const std::vector<MachineRecord>& records) const {

    const auto groups = groupBy<Date>(
        records,
        [](const MachineRecord& r) { return r.date; },
        {productionSum<MachineRecord>()});

    std::vector<DailyProductionRow> rows;
    rows.reserve(groups.size());
    for (const auto& [date, aggregates] : groups) {
        rows.push_back({date, toCount(aggregates.value(TOTAL_PRODUCTION))});
    }
    return rows;
}

ProductionOverview ProductionAggregator::productionOverview(
    const std::vector<MachineRecord>& records) const {

    ProductionOverview overview;
    ba::accumulator_set<double, ba::stats<ba::tag::mean, ba::tag::count>> daily;

    for (const auto& day : productionByDate(records)) {
        overview.total_production += day.total_production;
        daily(static_cast<double>(day.total_production));
    }

    overview.production_days = ba::count(daily);
    if (overview.production_days > 0) {
        overview.average_daily_production = ba::mean(daily);
    }
    return overview;
}

PeriodBreakdown ProductionAggregator::productionByPeriod(
    const std::vector<MachineRecord>& records,
    const FilterCriteria& criteria) const {

    PeriodBreakdown breakdown;
    breakdown.granularity = selectPeriodGranularity(criteria);

    Logger::getInstance().debug("ProductionAggregator",
        "Period granularity '" + toString(breakdown.granularity) + "' for " + criteria.describe());

    const std::vector<Reducer<MachineRecord>> reducers = {productionSum<MachineRecord>()};

    switch (breakdown.granularity) {
        case PeriodGranularity::Day: {
            const auto groups = groupBy<Date>(
                records, [](const MachineRecord& r) { return r.date; }, reducers);
            for (const auto& [date, aggregates] : groups) {
                breakdown.rows.push_back({
                    boost::gregorian::to_iso_extended_string(date),
                    static_cast<int>(date.year()),
                    static_cast<int>(date.day_of_year()),
                    toCount(aggregates.value(TOTAL_PRODUCTION))});
            }
            break;
        }
        case PeriodGranularity::Week: {
            const auto groups = groupBy<std::pair<int, int>>(
                records,
                [](const MachineRecord& r) { return std::make_pair(r.calendar.year, r.calendar.iso_week); },
                reducers);
            for (const auto& [key, aggregates] : groups) {
                breakdown.rows.push_back({
                    "Week " + std::to_string(key.second),
                    key.first,
                    key.second,
                    toCount(aggregates.value(TOTAL_PRODUCTION))});
            }
            break;
        }
        case PeriodGranularity::Month: {
            const auto groups = groupBy<std::pair<int, int>>(
                records,
                [](const MachineRecord& r) { return std::make_pair(r.calendar.year, r.calendar.month); },
                reducers);
            for (const auto& [key, aggregates] : groups) {
                breakdown.rows.push_back({
                    monthName(key.second) + " " + std::to_string(key.first),
                    key.first,
                    key.second,
                    toCount(aggregates.value(TOTAL_PRODUCTION))});
            }
            break;
        }
    }

    return breakdown;
}

std::vector<ProductionTableRow> ProductionAggregator::productionTable(
    const std::vector<MachineRecord>& records,
    ProductionTableView view) const {

    std::vector<ProductionTableRow> rows;
    if (view == ProductionTableView::ByMachine) {
        for (const auto& row : productionByMachine(records)) {
            rows.push_back({toString(row.machine_id), row.total_production});
        }
    } else {
        for (const auto& row : productionByDate(records)) {
            rows.push_back({boost::gregorian::to_iso_extended_string(row.date), row.total_production});
        }
    }
    return rows;
}

std::vector<OperatorProductionRow> ProductionAggregator::operatorProductionRanking(
    const std::vector<OperatorRecord>& records) const {

    const auto groups = groupBy<std::string>(
        records,
        [](const OperatorRecord& r) { return r.operator_name; },
        {productionSum<OperatorRecord>()});

    std::vector<OperatorProductionRow> rows;
    rows.reserve(groups.size());
    for (const auto& [name, aggregates] : groups) {
        rows.push_back({name, toCount(aggregates.value(TOTAL_PRODUCTION))});
    }

    sortByMetricDescending(rows,
        [](const OperatorProductionRow& row) { return std::optional<double>(static_cast<double>(row.total_production)); },
        [](const OperatorProductionRow& row) { return row.operator_name; });
    return rows;
}

std::vector<ShiftProductionRow> ProductionAggregator::productionByShift(
    const std::vector<OperatorRecord>& records) const {

    const auto groups = groupBy<Shift>(
        records,
        [](const OperatorRecord& r) { return r.shift; },
        {productionSum<OperatorRecord>()});

    std::vector<ShiftProductionRow> rows;
    rows.reserve(groups.size());
    for (const auto& [shift, aggregates] : groups) {
        rows.push_back({shift, toCount(aggregates.value(TOTAL_PRODUCTION))});
    }
    return rows;
}

} // namespace prodintel
