#ifndef OPERATOR_JOINER_HPP
#define OPERATOR_JOINER_HPP

#include "analytics/interfaces/IEfficiencyCalculator.hpp"
#include "analytics/interfaces/IOperatorJoiner.hpp"
#include <memory>

namespace prodintel {

/**
 * @brief Render machine identifiers as a display list, e.g. "1, 4, 7"
 */
std::string formatMachineList(const std::vector<MachineId>& machines, const std::string& delimiter = ", ");

/**
 * @brief Concrete implementation of IOperatorJoiner
 *
 * Unmatched operator rows contribute zero to both counter sums, so an operator
 * without any matching machine reading ends up with an undefined efficiency
 * while keeping its production and machine list.
 */
class OperatorJoiner : public IOperatorJoiner {
public:
    explicit OperatorJoiner(std::shared_ptr<const IEfficiencyCalculator> calculator);

    std::map<std::string, OperatorEfficiency> joinOperatorEfficiency(
        const std::vector<OperatorRecord>& operators,
        const std::vector<MachineRecord>& machines
    ) const override;

    std::vector<OperatorSummaryRow> operatorSummary(
        const std::vector<OperatorRecord>& operators,
        const std::vector<MachineRecord>& machines
    ) const override;

private:
    std::shared_ptr<const IEfficiencyCalculator> calculator_;
};

} // namespace prodintel

#endif // OPERATOR_JOINER_HPP
