#ifndef ENTITY_STORE_HPP
#define ENTITY_STORE_HPP

#include "analytics/Records.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace prodintel {

/**
 * @brief Immutable session-wide collections of machine and operator records
 *
 * Records are validated once on construction and never modified afterwards;
 * copies of the store share the same underlying collections.
 */
class EntityStore {
public:
    /**
     * @brief Take ownership of the loaded records
     * @throws InvalidRecordException if a record violates a data-model invariant
     *         (negative counter or production, empty operator name, special date)
     */
    EntityStore(std::vector<MachineRecord> machines, std::vector<OperatorRecord> operators);

    const std::vector<MachineRecord>& getMachineRecords() const { return *machines_; }
    const std::vector<OperatorRecord>& getOperatorRecords() const { return *operators_; }

    std::size_t getMachineRecordCount() const { return machines_->size(); }
    std::size_t getOperatorRecordCount() const { return operators_->size(); }

    /// Distinct years of the machine records, ascending
    std::vector<int> getAvailableYears() const;

    /// Distinct month names of the machine records, in calendar order
    std::vector<std::string> getAvailableMonths() const;

    /// Distinct operator names, ascending
    std::vector<std::string> getOperatorNames() const;

private:
    std::shared_ptr<const std::vector<MachineRecord>> machines_;
    std::shared_ptr<const std::vector<OperatorRecord>> operators_;

    static void validate(const std::vector<MachineRecord>& machines);
    static void validate(const std::vector<OperatorRecord>& operators);
};

} // namespace prodintel

#endif // ENTITY_STORE_HPP
