#include "analytics/FilterCriteria.hpp"
#include <sstream>

namespace prodintel {

std::string FilterCriteria::describe() const {
    if (hasDateRange()) {
        return "date range " + boost::gregorian::to_iso_extended_string(*start_date) +
               " .. " + boost::gregorian::to_iso_extended_string(*end_date);
    }
    if (isEmpty()) {
        return "all records";
    }

    std::ostringstream oss;
    oss << "years [";
    bool first = true;
    for (int year : years) {
        oss << (first ? "" : ", ") << year;
        first = false;
    }
    oss << "] months [";
    first = true;
    for (const auto& month : months) {
        oss << (first ? "" : ", ") << month;
        first = false;
    }
    oss << "]";
    return oss.str();
}

} // namespace prodintel
