#include "analytics/EfficiencyCalculator.hpp"
#include <Eigen/Dense>

namespace prodintel {

namespace {

constexpr double PERCENT = 100.0;

struct CounterColumns {
    Eigen::ArrayXd actual;
    Eigen::ArrayXd rated;
};

CounterColumns extractCounters(const std::vector<MachineRecord>& records) {
    const Eigen::Index n = static_cast<Eigen::Index>(records.size());
    CounterColumns columns{Eigen::ArrayXd(n), Eigen::ArrayXd(n)};
    for (Eigen::Index i = 0; i < n; ++i) {
        columns.actual(i) = records[static_cast<size_t>(i)].actual_counter;
        columns.rated(i) = records[static_cast<size_t>(i)].rated_counter;
    }
    return columns;
}

} // namespace

EfficiencyPct EfficiencyCalculator::recordEfficiency(const MachineRecord& record) const {
    if (record.rated_counter == 0.0) {
        return std::nullopt;
    }
    return record.actual_counter / record.rated_counter * PERCENT;
}

std::vector<EfficiencyPct> EfficiencyCalculator::recordEfficiencies(
    const std::vector<MachineRecord>& records) const {

    std::vector<EfficiencyPct> result;
    result.reserve(records.size());
    if (records.empty()) {
        return result;
    }

    const CounterColumns columns = extractCounters(records);
    const Eigen::Array<bool, Eigen::Dynamic, 1> defined = columns.rated != 0.0;

    // Substitute 1 for zero denominators so the division stays finite; those
    // entries are reported as undefined below.
    const Eigen::ArrayXd ratios =
        columns.actual / defined.select(columns.rated, Eigen::ArrayXd::Ones(columns.rated.size())) * PERCENT;

    for (Eigen::Index i = 0; i < ratios.size(); ++i) {
        if (defined(i)) {
            result.emplace_back(ratios(i));
        } else {
            result.emplace_back(std::nullopt);
        }
    }
    return result;
}

EfficiencyPct EfficiencyCalculator::averageRecordEfficiency(
    const std::vector<MachineRecord>& records) const {

    if (records.empty()) {
        return std::nullopt;
    }

    const std::vector<EfficiencyPct> per_record = recordEfficiencies(records);
    double sum = 0.0;
    for (const auto& efficiency : per_record) {
        if (!efficiency) {
            return std::nullopt;
        }
        sum += *efficiency;
    }
    return sum / static_cast<double>(per_record.size());
}

EfficiencyPct EfficiencyCalculator::aggregateEfficiency(double total_actual, double total_rated) const {
    if (total_rated == 0.0) {
        return std::nullopt;
    }
    return total_actual / total_rated * PERCENT;
}

EfficiencyPct EfficiencyCalculator::aggregateEfficiency(const std::vector<MachineRecord>& records) const {
    if (records.empty()) {
        return std::nullopt;
    }
    const CounterColumns columns = extractCounters(records);
    return aggregateEfficiency(columns.actual.sum(), columns.rated.sum());
}

} // namespace prodintel
