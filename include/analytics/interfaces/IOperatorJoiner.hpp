#ifndef I_OPERATOR_JOINER_HPP
#define I_OPERATOR_JOINER_HPP

#include "analytics/AnalysisTypes.hpp"
#include "analytics/Records.hpp"
#include <map>
#include <string>
#include <vector>

namespace prodintel {

/**
 * @brief Interface for attributing machine efficiency to operators
 */
class IOperatorJoiner {
public:
    virtual ~IOperatorJoiner() = default;

    /**
     * @brief Left-join operator records to machine records on (date, machine id)
     * @param operators Filtered operator records (left side)
     * @param machines Filtered machine records (right side)
     * @return Per operator: summed counters of the matched machine rows, their
     *         aggregate efficiency and the sorted distinct machines handled
     */
    virtual std::map<std::string, OperatorEfficiency> joinOperatorEfficiency(
        const std::vector<OperatorRecord>& operators,
        const std::vector<MachineRecord>& machines
    ) const = 0;

    /**
     * @brief Operator summary table
     *
     * Merges production totals and machines handled (from operator records
     * alone) with the joined efficiency, keyed on operator name.
     * @return Rows descending by total production, ties by operator name
     */
    virtual std::vector<OperatorSummaryRow> operatorSummary(
        const std::vector<OperatorRecord>& operators,
        const std::vector<MachineRecord>& machines
    ) const = 0;
};

} // namespace prodintel

#endif // I_OPERATOR_JOINER_HPP
