#ifndef I_FILTER_ENGINE_HPP
#define I_FILTER_ENGINE_HPP

#include "analytics/FilterCriteria.hpp"
#include "analytics/Records.hpp"
#include <vector>

namespace prodintel {

/**
 * @brief Interface for reducing record collections by time criteria
 *
 * Implementations return filtered copies and never modify their input.
 * An empty result is a valid no-data outcome, not an error.
 */
class IFilterEngine {
public:
    virtual ~IFilterEngine() = default;

    /**
     * @brief Select the machine records matching the criteria
     * @param records Full machine collection
     * @param criteria Active time selection
     * @return Matching records in input order
     */
    virtual std::vector<MachineRecord> filterMachines(
        const std::vector<MachineRecord>& records,
        const FilterCriteria& criteria
    ) const = 0;

    /**
     * @brief Select the operator records matching the criteria
     * @param records Full operator collection
     * @param criteria Active time selection
     * @return Matching records in input order
     */
    virtual std::vector<OperatorRecord> filterOperators(
        const std::vector<OperatorRecord>& records,
        const FilterCriteria& criteria
    ) const = 0;
};

} // namespace prodintel

#endif // I_FILTER_ENGINE_HPP
