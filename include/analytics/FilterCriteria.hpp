#ifndef FILTER_CRITERIA_HPP
#define FILTER_CRITERIA_HPP

#include "analytics/Records.hpp"
#include <optional>
#include <set>
#include <string>

namespace prodintel {

/**
 * @brief Immutable time-selection criteria shared by every view of one request
 *
 * A date range only takes effect when both endpoints are set; it then overrides
 * the year and month selections entirely.
 */
struct FilterCriteria {
    std::optional<Date> start_date;
    std::optional<Date> end_date;
    std::set<int> years;
    std::set<std::string> months;  // full English month names, e.g. "March"

    bool hasDateRange() const { return start_date.has_value() && end_date.has_value(); }

    /// True when no date range is active and exactly one month is selected
    bool isSingleMonthSelection() const { return !hasDateRange() && months.size() == 1; }

    bool isEmpty() const { return !hasDateRange() && years.empty() && months.empty(); }

    std::string describe() const;
};

} // namespace prodintel

#endif // FILTER_CRITERIA_HPP
