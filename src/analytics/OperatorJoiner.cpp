#include "analytics/OperatorJoiner.hpp"
#include "analytics/GroupBy.hpp"
#include "analytics/Ranking.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace prodintel {

namespace {

using JoinKey = std::pair<Date, MachineId>;

/**
 * @brief One row of the left join; counters are zero when nothing matched
 */
struct JoinedRow {
    const OperatorRecord* left;
    double actual_counter;
    double rated_counter;
    bool matched;
};

std::map<std::string, std::vector<MachineId>> machinesHandledByOperator(
    const std::vector<OperatorRecord>& operators) {

    const auto groups = groupBy<std::string>(
        operators,
        [](const OperatorRecord& r) { return r.operator_name; },
        {Reducer<OperatorRecord>::uniqueSorted("machines", [](const OperatorRecord& r) { return r.machine_id; })});

    std::map<std::string, std::vector<MachineId>> result;
    for (const auto& [name, aggregates] : groups) {
        result.emplace(name, aggregates.unique("machines"));
    }
    return result;
}

} // namespace

std::string formatMachineList(const std::vector<MachineId>& machines, const std::string& delimiter) {
    std::string text;
    for (size_t i = 0; i < machines.size(); ++i) {
        if (i > 0) text += delimiter;
        text += toString(machines[i]);
    }
    return text;
}

OperatorJoiner::OperatorJoiner(std::shared_ptr<const IEfficiencyCalculator> calculator)
    : calculator_(std::move(calculator)) {
    if (!calculator_) {
        throw std::invalid_argument("OperatorJoiner: Efficiency calculator cannot be null");
    }
}

std::map<std::string, OperatorEfficiency> OperatorJoiner::joinOperatorEfficiency(
    const std::vector<OperatorRecord>& operators,
    const std::vector<MachineRecord>& machines) const {

    std::map<JoinKey, std::vector<const MachineRecord*>> machine_index;
    for (const auto& machine : machines) {
        machine_index[JoinKey(machine.date, machine.machine_id)].push_back(&machine);
    }

    std::vector<JoinedRow> joined;
    joined.reserve(operators.size());
    size_t unmatched = 0;
    for (const auto& op : operators) {
        auto it = machine_index.find(JoinKey(op.date, op.machine_id));
        if (it == machine_index.end()) {
            joined.push_back({&op, 0.0, 0.0, false});
            ++unmatched;
            continue;
        }
        // Several readings for the same (date, machine) each produce a joined row
        for (const MachineRecord* machine : it->second) {
            joined.push_back({&op, machine->actual_counter, machine->rated_counter, true});
        }
    }

    if (unmatched > 0) {
        Logger::getInstance().debug("OperatorJoiner",
            std::to_string(unmatched) + " of " + std::to_string(operators.size()) +
            " operator records have no machine reading for the same date and machine");
    }

    const auto groups = groupBy<std::string>(
        joined,
        [](const JoinedRow& row) { return row.left->operator_name; },
        {
            Reducer<JoinedRow>::sum("total_actual", [](const JoinedRow& row) { return row.actual_counter; }),
            Reducer<JoinedRow>::sum("total_rated", [](const JoinedRow& row) { return row.rated_counter; }),
            Reducer<JoinedRow>::sum("matched_rows", [](const JoinedRow& row) { return row.matched ? 1.0 : 0.0; })
        });

    const auto machines_handled = machinesHandledByOperator(operators);

    std::map<std::string, OperatorEfficiency> result;
    for (const auto& [name, aggregates] : groups) {
        OperatorEfficiency efficiency;
        efficiency.total_actual = aggregates.value("total_actual");
        efficiency.total_rated = aggregates.value("total_rated");
        efficiency.efficiency_pct = calculator_->aggregateEfficiency(efficiency.total_actual, efficiency.total_rated);
        efficiency.matched_rows = static_cast<size_t>(aggregates.value("matched_rows"));
        efficiency.machines_handled = machines_handled.at(name);
        result.emplace(name, std::move(efficiency));
    }
    return result;
}

std::vector<OperatorSummaryRow> OperatorJoiner::operatorSummary(
    const std::vector<OperatorRecord>& operators,
    const std::vector<MachineRecord>& machines) const {

    // Three independent computations merged on operator name
    const auto production = groupBy<std::string>(
        operators,
        [](const OperatorRecord& r) { return r.operator_name; },
        {Reducer<OperatorRecord>::sum("total_production", [](const OperatorRecord& r) {
            return static_cast<double>(r.production);
        })});
    const auto machines_handled = machinesHandledByOperator(operators);
    const auto efficiency = joinOperatorEfficiency(operators, machines);

    std::vector<OperatorSummaryRow> rows;
    rows.reserve(production.size());
    for (const auto& [name, aggregates] : production) {
        auto machines_it = machines_handled.find(name);
        auto efficiency_it = efficiency.find(name);
        if (machines_it == machines_handled.end() || efficiency_it == efficiency.end()) {
            Logger::getInstance().warning("OperatorJoiner", "Operator '" + name + "' missing from a summary component");
            continue;
        }

        OperatorSummaryRow row;
        row.operator_name = name;
        row.total_production = std::llround(aggregates.value("total_production"));
        row.machines_handled = machines_it->second;
        row.machines_handled_display = formatMachineList(row.machines_handled);
        row.efficiency_pct = efficiency_it->second.efficiency_pct;
        rows.push_back(std::move(row));
    }

    sortByMetricDescending(rows,
        [](const OperatorSummaryRow& row) { return std::optional<double>(static_cast<double>(row.total_production)); },
        [](const OperatorSummaryRow& row) { return row.operator_name; });
    return rows;
}

} // namespace prodintel
