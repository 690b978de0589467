#include "analytics/EntityStore.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <map>
#include <set>

namespace prodintel {

namespace {

std::string describeRecord(const char* kind, std::size_t index) {
    return std::string(kind) + " record #" + std::to_string(index);
}

} // namespace

EntityStore::EntityStore(std::vector<MachineRecord> machines, std::vector<OperatorRecord> operators) {
    validate(machines);
    validate(operators);

    machines_ = std::make_shared<const std::vector<MachineRecord>>(std::move(machines));
    operators_ = std::make_shared<const std::vector<OperatorRecord>>(std::move(operators));

    Logger::getInstance().info("EntityStore",
        "Loaded " + std::to_string(machines_->size()) + " machine records and " +
        std::to_string(operators_->size()) + " operator records");
}

void EntityStore::validate(const std::vector<MachineRecord>& machines) {
    for (std::size_t i = 0; i < machines.size(); ++i) {
        const auto& record = machines[i];
        if (record.date.is_special()) {
            throw InvalidRecordException("EntityStore", describeRecord("Machine", i) + " has no valid date");
        }
        if (record.rpm < 0.0 || record.actual_counter < 0.0 || record.rated_counter < 0.0) {
            throw InvalidRecordException("EntityStore",
                describeRecord("Machine", i) + " (machine " + toString(record.machine_id) +
                ") has a negative rpm or counter value");
        }
        if (record.production < 0) {
            throw InvalidRecordException("EntityStore",
                describeRecord("Machine", i) + " has negative production");
        }
    }
}

void EntityStore::validate(const std::vector<OperatorRecord>& operators) {
    for (std::size_t i = 0; i < operators.size(); ++i) {
        const auto& record = operators[i];
        if (record.date.is_special()) {
            throw InvalidRecordException("EntityStore", describeRecord("Operator", i) + " has no valid date");
        }
        if (record.operator_name.empty()) {
            throw InvalidRecordException("EntityStore", describeRecord("Operator", i) + " has an empty operator name");
        }
        if (record.production < 0) {
            throw InvalidRecordException("EntityStore",
                describeRecord("Operator", i) + " (" + record.operator_name + ") has negative production");
        }
    }
}

std::vector<int> EntityStore::getAvailableYears() const {
    std::set<int> years;
    for (const auto& record : *machines_) {
        years.insert(record.calendar.year);
    }
    return std::vector<int>(years.begin(), years.end());
}

std::vector<std::string> EntityStore::getAvailableMonths() const {
    std::map<int, std::string> months;
    for (const auto& record : *machines_) {
        months.emplace(record.calendar.month, record.calendar.month_name);
    }

    std::vector<std::string> names;
    names.reserve(months.size());
    for (const auto& [number, name] : months) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> EntityStore::getOperatorNames() const {
    std::set<std::string> names;
    for (const auto& record : *operators_) {
        names.insert(record.operator_name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

} // namespace prodintel
