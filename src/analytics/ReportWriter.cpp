#include "analytics/ReportWriter.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace prodintel {

namespace {

std::string isoDate(const Date& date) {
    return boost::gregorian::to_iso_extended_string(date);
}

std::vector<std::vector<std::string>> operatorProductionRows(const std::vector<OperatorProductionRow>& rows) {
    std::vector<std::vector<std::string>> table;
    table.reserve(rows.size());
    for (const auto& row : rows) {
        table.push_back({row.operator_name, std::to_string(row.total_production)});
    }
    return table;
}

} // namespace

std::string formatEfficiency(const EfficiencyPct& efficiency, int precision) {
    if (!efficiency) {
        return "n/a";
    }
    return formatDecimal(*efficiency, precision);
}

std::string formatDecimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string escapeCsvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

ReportWriter::ReportWriter() {
    try {
        worker_thread_ = std::thread(&ReportWriter::workerLoop, this);
        Logger::getInstance().debug("ReportWriter", "Async writer initialized with worker thread");
    } catch (const std::exception& e) {
        Logger::getInstance().error("ReportWriter",
            std::string("Failed to start worker thread: ") + e.what());
        throw;
    }
}

ReportWriter::~ReportWriter() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_flag_ = true;
    }
    queue_cv_.notify_one();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void ReportWriter::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return stop_flag_ || !task_queue_.empty();
            });

            if (stop_flag_ && task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            ++running_tasks_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            Logger::getInstance().error("ReportWriter",
                std::string("Error in async task: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --running_tasks_;
        }
        idle_cv_.notify_all();
    }
}

void ReportWriter::enqueueTask(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

void ReportWriter::waitForCompletion() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return task_queue_.empty() && running_tasks_ == 0;
    });
    Logger::getInstance().debug("ReportWriter", "All queued writes completed");
}

size_t ReportWriter::getPendingTaskCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + running_tasks_;
}

// Public async methods (enqueue copies)

void ReportWriter::saveMachineView(const std::string& output_dir, const MachineView& view) {
    enqueueTask([this, output_dir, view]() {
        writeMachineView(output_dir, view);
    });
}

void ReportWriter::saveProductionView(const std::string& output_dir, const ProductionView& view) {
    enqueueTask([this, output_dir, view]() {
        writeProductionView(output_dir, view);
    });
}

void ReportWriter::saveOperatorView(const std::string& output_dir, const OperatorView& view) {
    enqueueTask([this, output_dir, view]() {
        writeOperatorView(output_dir, view);
    });
}

void ReportWriter::saveReportStatus(const std::string& filepath, const DashboardReport& report) {
    enqueueTask([this, filepath, report]() {
        writeReportStatus(filepath, report);
    });
}

// Private write methods (executed by worker thread)

void ReportWriter::writeTable(
    const std::string& filepath,
    const std::vector<std::string>& header,
    const std::vector<std::vector<std::string>>& rows) {

    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::getInstance().error("ReportWriter", "Failed to open file: " + filepath);
        return;
    }

    for (size_t i = 0; i < header.size(); ++i) {
        file << (i > 0 ? "," : "") << escapeCsvField(header[i]);
    }
    file << "\n";

    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            file << (i > 0 ? "," : "") << escapeCsvField(row[i]);
        }
        file << "\n";
    }

    if (!file) {
        Logger::getInstance().error("ReportWriter", "Write failed for: " + filepath);
        return;
    }
    Logger::getInstance().debug("ReportWriter",
        "Wrote " + std::to_string(rows.size()) + " rows to " + filepath);
}

void ReportWriter::writeMachineView(const std::string& output_dir, const MachineView& view) {
    FileUtils::ensureDirectoryExists(output_dir);

    std::vector<std::vector<std::string>> top;
    for (const auto& row : view.top_machines) {
        top.push_back({toString(row.machine_id),
                       formatEfficiency(row.avg_efficiency_pct),
                       std::to_string(row.total_production)});
    }
    writeTable(FileUtils::joinPaths(output_dir, "TopMachinesByEfficiency.csv"),
               {"machine_id", "avg_efficiency_pct", "total_production"}, top);

    std::vector<std::vector<std::string>> rolls;
    for (const auto& row : view.rolls_by_machine) {
        rolls.push_back({toString(row.machine_id), std::to_string(row.total_production)});
    }
    writeTable(FileUtils::joinPaths(output_dir, "RollsByMachine.csv"),
               {"machine_id", "total_production"}, rolls);

    std::vector<std::vector<std::string>> summary;
    for (const auto& row : view.machine_summary) {
        summary.push_back({toString(row.machine_id),
                           formatDecimal(row.avg_rpm, 1),
                           formatDecimal(row.total_rated, 2),
                           formatDecimal(row.total_actual, 2),
                           std::to_string(row.total_production),
                           formatEfficiency(row.efficiency_pct)});
    }
    writeTable(FileUtils::joinPaths(output_dir, "MachineSummary.csv"),
               {"machine_id", "avg_rpm", "total_rated", "total_actual", "total_production", "efficiency_pct"},
               summary);
}

void ReportWriter::writeProductionView(const std::string& output_dir, const ProductionView& view) {
    FileUtils::ensureDirectoryExists(output_dir);

    writeTable(FileUtils::joinPaths(output_dir, "ProductionOverview.csv"),
               {"total_production", "average_daily_production"},
               {{std::to_string(view.overview.total_production),
                 formatDecimal(view.overview.average_daily_production, 1)}});

    std::vector<std::vector<std::string>> trend;
    for (const auto& row : view.trend) {
        trend.push_back({isoDate(row.date), std::to_string(row.total_production)});
    }
    writeTable(FileUtils::joinPaths(output_dir, "ProductionTrend.csv"),
               {"date", "total_production"}, trend);

    // Row order is the categorical axis order
    std::vector<std::vector<std::string>> periods;
    for (const auto& row : view.by_period.rows) {
        periods.push_back({row.label, std::to_string(row.total_production)});
    }
    writeTable(FileUtils::joinPaths(output_dir, "ProductionByPeriod.csv"),
               {"label", "total_production"}, periods);

    std::vector<std::vector<std::string>> table;
    for (const auto& row : view.table) {
        table.push_back({row.group_key, std::to_string(row.total_production)});
    }
    const std::string key_column = view.table_view == ProductionTableView::ByMachine ? "machine_id" : "date";
    writeTable(FileUtils::joinPaths(output_dir, "ProductionTable.csv"),
               {key_column, "total_production"}, table);
}

void ReportWriter::writeOperatorView(const std::string& output_dir, const OperatorView& view) {
    FileUtils::ensureDirectoryExists(output_dir);

    if (view.status == ReportStatus::NoDataAvailable) {
        Logger::getInstance().warning("ReportWriter", "No operator data available; operator result sets skipped");
        return;
    }

    writeTable(FileUtils::joinPaths(output_dir, "TopOperators.csv"),
               {"operator_name", "total_production"}, operatorProductionRows(view.top_operators));
    writeTable(FileUtils::joinPaths(output_dir, "BottomOperators.csv"),
               {"operator_name", "total_production"}, operatorProductionRows(view.bottom_operators));

    std::vector<std::vector<std::string>> shifts;
    for (const auto& row : view.shift_split) {
        shifts.push_back({toString(row.shift), std::to_string(row.total_production)});
    }
    writeTable(FileUtils::joinPaths(output_dir, "ShiftSplit.csv"),
               {"shift", "total_production"}, shifts);

    std::vector<std::vector<std::string>> summary;
    for (const auto& row : view.operator_summary) {
        summary.push_back({row.operator_name,
                           std::to_string(row.total_production),
                           row.machines_handled_display,
                           formatEfficiency(row.efficiency_pct)});
    }
    writeTable(FileUtils::joinPaths(output_dir, "OperatorSummary.csv"),
               {"operator_name", "total_production", "machines_handled", "efficiency_pct"}, summary);
}

void ReportWriter::writeReportStatus(const std::string& filepath, const DashboardReport& report) {
    FileUtils::ensureDirectoryExists(std::filesystem::path(filepath).parent_path().string());

    writeTable(filepath,
               {"status", "operator_status", "criteria", "machine_records", "operator_records"},
               {{toString(report.status),
                 toString(report.operators.status),
                 report.criteria.describe(),
                 std::to_string(report.machine_records),
                 std::to_string(report.operator_records)}});
}

} // namespace prodintel
