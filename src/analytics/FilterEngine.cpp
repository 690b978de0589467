#include "analytics/FilterEngine.hpp"
#include "utils/Logger.hpp"

namespace prodintel {

bool FilterEngine::matches(const Date& date, const CalendarFields& calendar, const FilterCriteria& criteria) {
    if (criteria.hasDateRange()) {
        return date >= *criteria.start_date && date <= *criteria.end_date;
    }
    if (!criteria.years.empty() && criteria.years.count(calendar.year) == 0) {
        return false;
    }
    if (!criteria.months.empty() && criteria.months.count(calendar.month_name) == 0) {
        return false;
    }
    return true;
}

template <typename Record>
std::vector<Record> FilterEngine::apply(const std::vector<Record>& records, const FilterCriteria& criteria) const {
    if (criteria.isEmpty()) {
        return records;
    }

    if (criteria.hasDateRange() && *criteria.start_date > *criteria.end_date) {
        Logger::getInstance().warning("FilterEngine",
            "Date range start is after its end; no record can match (" + criteria.describe() + ")");
    }

    std::vector<Record> selected;
    selected.reserve(records.size());
    for (const auto& record : records) {
        if (matches(record.date, record.calendar, criteria)) {
            selected.push_back(record);
        }
    }
    return selected;
}

std::vector<MachineRecord> FilterEngine::filterMachines(
    const std::vector<MachineRecord>& records,
    const FilterCriteria& criteria) const {

    std::vector<MachineRecord> selected = apply(records, criteria);
    Logger::getInstance().debug("FilterEngine",
        "Machine records: " + std::to_string(selected.size()) + "/" +
        std::to_string(records.size()) + " match " + criteria.describe());
    return selected;
}

std::vector<OperatorRecord> FilterEngine::filterOperators(
    const std::vector<OperatorRecord>& records,
    const FilterCriteria& criteria) const {

    std::vector<OperatorRecord> selected = apply(records, criteria);
    Logger::getInstance().debug("FilterEngine",
        "Operator records: " + std::to_string(selected.size()) + "/" +
        std::to_string(records.size()) + " match " + criteria.describe());
    return selected;
}

} // namespace prodintel
