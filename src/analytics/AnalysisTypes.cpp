#include "analytics/AnalysisTypes.hpp"

namespace prodintel {

std::string toString(ReportStatus status) {
    return status == ReportStatus::Ok ? "Ok" : "NoDataAvailable";
}

std::string toString(PeriodGranularity granularity) {
    switch (granularity) {
        case PeriodGranularity::Day: return "day";
        case PeriodGranularity::Week: return "week";
        case PeriodGranularity::Month: return "month";
    }
    return "unknown";
}

std::string toString(ProductionTableView view) {
    return view == ProductionTableView::ByMachine ? "machine" : "date";
}

std::vector<std::string> PeriodBreakdown::categoryOrder() const {
    std::vector<std::string> labels;
    labels.reserve(rows.size());
    for (const auto& row : rows) {
        labels.push_back(row.label);
    }
    return labels;
}

long long PeriodBreakdown::totalProduction() const {
    long long total = 0;
    for (const auto& row : rows) {
        total += row.total_production;
    }
    return total;
}

} // namespace prodintel
