#include "utils/ReportSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace prodintel {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

long long parseRankCount(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const long long n = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        // Out-of-range counts are clamped by the ranking, not rejected here
        return n;
    } catch (const std::exception&) {
        PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "'" + key + "' expects an integer, got '" + value + "'");
    }
}

int parseYear(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int year = std::stoi(value, &consumed);
        if (consumed != value.size() || year < 1400 || year > 9999) {
            throw std::out_of_range(value);
        }
        return year;
    } catch (const std::exception&) {
        PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "Invalid year '" + value + "'");
    }
}

Date parseSettingDate(const std::string& key, const std::string& value) {
    try {
        const Date date = boost::gregorian::from_simple_string(value);
        if (date.is_special()) {
            throw std::out_of_range(value);
        }
        return date;
    } catch (const std::exception&) {
        PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "'" + key + "' expects YYYY-MM-DD, got '" + value + "'");
    }
}

} // namespace

std::map<std::string, std::string> readSettingsFile(const std::string& path) {
    std::map<std::string, std::string> settings;

    for (const std::string& raw : FileUtils::readLines(path)) {
        std::string line = raw;
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = trim(line);
        if (line.empty()) continue;

        const auto split = line.find_first_of(" \t");
        if (split == std::string::npos) {
            Logger::getInstance().warning("ReportSettings", "Setting '" + line + "' in " + path + " has no value");
            continue;
        }
        settings[line.substr(0, split)] = trim(line.substr(split));
    }

    Logger::getInstance().debug("ReportSettings",
        "Read " + std::to_string(settings.size()) + " settings from " + path);
    return settings;
}

std::string canonicalMonthName(const std::string& name) {
    const std::string wanted = lowercase(trim(name));
    for (unsigned short m = 1; m <= 12; ++m) {
        const boost::gregorian::greg_month month(m);
        if (wanted == lowercase(month.as_long_string()) || wanted == lowercase(month.as_short_string())) {
            return month.as_long_string();
        }
    }
    PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "Unknown month '" + name + "'");
}

void ReportSettings::configure(const std::map<std::string, std::string>& settings) {
    for (const auto& [key, value] : settings) {
        apply(key, value);
    }

    Logger::getInstance().info("ReportSettings",
        "Configured: top_machines=" + std::to_string(top_machines) +
        ", top_operators=" + std::to_string(top_operators) +
        ", bottom_operators=" + std::to_string(bottom_operators) +
        ", view=" + toString(table_view) +
        ", output_dir=" + output_dir);
}

void ReportSettings::apply(const std::string& key, const std::string& raw_value) {
    const std::string value = trim(raw_value);

    if (key == "machines") {
        machines_path = value;
    } else if (key == "operators") {
        operators_path = value;
    } else if (key == "output") {
        if (value.empty()) {
            PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "'output' cannot be empty");
        }
        output_dir = value;
    } else if (key == "log_file") {
        log_file = value;
    } else if (key == "log_level") {
        log_level = Logger::parseLevel(value);
    } else if (key == "top_machines") {
        top_machines = parseRankCount(key, value);
    } else if (key == "top_operators") {
        top_operators = parseRankCount(key, value);
    } else if (key == "bottom_operators") {
        bottom_operators = parseRankCount(key, value);
    } else if (key == "view") {
        const std::string mode = lowercase(value);
        if (mode == "machine") {
            table_view = ProductionTableView::ByMachine;
        } else if (mode == "date") {
            table_view = ProductionTableView::ByDate;
        } else {
            PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "'view' must be 'machine' or 'date', got '" + value + "'");
        }
    } else if (key == "start") {
        start_date = parseSettingDate(key, value);
    } else if (key == "end") {
        end_date = parseSettingDate(key, value);
    } else if (key == "years") {
        years.clear();
        for (const auto& item : splitList(value)) {
            years.insert(parseYear(item));
        }
    } else if (key == "months") {
        months.clear();
        for (const auto& item : splitList(value)) {
            months.insert(canonicalMonthName(item));
        }
    } else if (key == "machine") {
        if (value.empty()) {
            PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "'machine' cannot be empty");
        }
        machine = parseIdentifier(value);
    } else if (key == "operator") {
        if (value.empty()) {
            PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "'operator' cannot be empty");
        }
        operator_name = value;
    } else {
        Logger::getInstance().warning("ReportSettings", "Ignoring unknown setting '" + key + "'");
    }
}

void ReportSettings::validate() const {
    if (machines_path.empty()) {
        PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "Machine data path is required (--machines)");
    }
    if (operators_path.empty()) {
        PRODINTEL_THROW_INVALID_PARAM("ReportSettings", "Operator data path is required (--operators)");
    }
    if (start_date.has_value() != end_date.has_value()) {
        Logger::getInstance().warning("ReportSettings",
            "Only one end of the date range is set; the range is ignored");
    }
}

DashboardRequest ReportSettings::toRequest() const {
    DashboardRequest request;
    request.criteria.start_date = start_date;
    request.criteria.end_date = end_date;
    request.criteria.years = years;
    request.criteria.months = months;
    request.top_machines = top_machines;
    request.top_operators = top_operators;
    request.bottom_operators = bottom_operators;
    request.table_view = table_view;
    request.machine_lookup = machine;
    request.operator_selection = operator_name;
    return request;
}

} // namespace prodintel
