#ifndef EFFICIENCY_CALCULATOR_HPP
#define EFFICIENCY_CALCULATOR_HPP

#include "analytics/interfaces/IEfficiencyCalculator.hpp"

namespace prodintel {

/**
 * @brief Concrete implementation of IEfficiencyCalculator
 *
 * Stateless; collection-wide ratios are evaluated as Eigen array expressions.
 * Results are not clamped, so readings above the rated counter exceed 100%.
 */
class EfficiencyCalculator : public IEfficiencyCalculator {
public:
    EfficiencyCalculator() = default;

    EfficiencyPct recordEfficiency(const MachineRecord& record) const override;

    std::vector<EfficiencyPct> recordEfficiencies(
        const std::vector<MachineRecord>& records
    ) const override;

    EfficiencyPct averageRecordEfficiency(
        const std::vector<MachineRecord>& records
    ) const override;

    EfficiencyPct aggregateEfficiency(double total_actual, double total_rated) const override;

    EfficiencyPct aggregateEfficiency(const std::vector<MachineRecord>& records) const override;
};

} // namespace prodintel

#endif // EFFICIENCY_CALCULATOR_HPP
