#ifndef REPORT_SETTINGS_HPP
#define REPORT_SETTINGS_HPP

#include "analytics/AnalysisTypes.hpp"
#include "utils/Logger.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>

namespace prodintel {

/**
 * @brief Read a whitespace-separated "key value" settings file
 *
 * Everything after '#' is a comment; blank lines are skipped. The value is the
 * rest of the line after the key, trimmed, so it may contain spaces.
 * @throws FileIOException if the file cannot be opened
 */
std::map<std::string, std::string> readSettingsFile(const std::string& path);

/**
 * @brief Canonical English month name for a case-insensitive full or three-letter name
 * @throws InvalidParameterException for anything else
 */
std::string canonicalMonthName(const std::string& name);

/**
 * @brief Run configuration of the production report
 */
struct ReportSettings {
    std::string machines_path;
    std::string operators_path;
    std::string output_dir = "output";
    std::string log_file;
    LogLevel log_level = LogLevel::INFO;

    long long top_machines = 5;
    long long top_operators = 5;
    long long bottom_operators = 5;
    ProductionTableView table_view = ProductionTableView::ByMachine;

    std::optional<Date> start_date;
    std::optional<Date> end_date;
    std::set<int> years;
    std::set<std::string> months;

    std::optional<MachineId> machine;
    std::optional<std::string> operator_name;

    /**
     * @brief Apply every recognised key of a settings map
     *
     * Unknown keys are logged and ignored.
     * @throws InvalidParameterException if a value is out of its domain
     */
    void configure(const std::map<std::string, std::string>& settings);

    /**
     * @brief Apply one setting (the CLI routes its flags through here as well)
     */
    void apply(const std::string& key, const std::string& value);

    /**
     * @throws InvalidParameterException if an input path is missing
     */
    void validate() const;

    DashboardRequest toRequest() const;
};

} // namespace prodintel

#endif // REPORT_SETTINGS_HPP
