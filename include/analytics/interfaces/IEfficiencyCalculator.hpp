#ifndef I_EFFICIENCY_CALCULATOR_HPP
#define I_EFFICIENCY_CALCULATOR_HPP

#include "analytics/AnalysisTypes.hpp"
#include "analytics/Records.hpp"
#include <vector>

namespace prodintel {

/**
 * @brief Interface for the two efficiency formulas
 *
 * Per-record efficiency (actual / rated * 100 for each record, averaged
 * arithmetically across a group) and aggregate efficiency
 * (sum(actual) / sum(rated) * 100 over a group's totals) are kept as separate
 * operations. A zero rated counter yields std::nullopt (UndefinedMetric).
 */
class IEfficiencyCalculator {
public:
    virtual ~IEfficiencyCalculator() = default;

    /**
     * @brief Efficiency of a single record
     * @param record Machine reading
     * @return actual / rated * 100, or std::nullopt when rated is zero
     */
    virtual EfficiencyPct recordEfficiency(const MachineRecord& record) const = 0;

    /**
     * @brief Per-record efficiency for a whole collection
     * @param records Machine readings
     * @return One entry per input record, in input order
     */
    virtual std::vector<EfficiencyPct> recordEfficiencies(
        const std::vector<MachineRecord>& records
    ) const = 0;

    /**
     * @brief Arithmetic mean of per-record efficiencies
     * @param records Machine readings of one group
     * @return Mean percentage; std::nullopt when empty or any record is undefined
     */
    virtual EfficiencyPct averageRecordEfficiency(
        const std::vector<MachineRecord>& records
    ) const = 0;

    /**
     * @brief Aggregate (volume-weighted) efficiency from group totals
     * @param total_actual Sum of actual counters
     * @param total_rated Sum of rated counters
     * @return total_actual / total_rated * 100, or std::nullopt when total_rated is zero
     */
    virtual EfficiencyPct aggregateEfficiency(double total_actual, double total_rated) const = 0;

    /**
     * @brief Aggregate efficiency computed over a collection's counter sums
     */
    virtual EfficiencyPct aggregateEfficiency(const std::vector<MachineRecord>& records) const = 0;
};

} // namespace prodintel

#endif // I_EFFICIENCY_CALCULATOR_HPP
