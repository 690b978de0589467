#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "analytics/interfaces/IReportWriter.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace prodintel {

/**
 * @brief Display text for an efficiency value ("n/a" when undefined)
 */
std::string formatEfficiency(const EfficiencyPct& efficiency, int precision = 2);

std::string formatDecimal(double value, int precision);

/**
 * @brief Quote a CSV field when it contains a delimiter, quote or line break
 */
std::string escapeCsvField(const std::string& field);

/**
 * @brief Asynchronous CSV writer
 *
 * A single worker thread performs the file I/O; every save method copies its
 * input and returns immediately. Failures are logged, not thrown.
 */
class ReportWriter : public IReportWriter {
public:
    /**
     * @brief Construct and start the worker thread
     */
    ReportWriter();

    /**
     * @brief Destructor - drains the queue and joins the worker
     */
    ~ReportWriter();

    ReportWriter(const ReportWriter&) = delete;
    ReportWriter& operator=(const ReportWriter&) = delete;
    ReportWriter(ReportWriter&&) = delete;
    ReportWriter& operator=(ReportWriter&&) = delete;

    void saveMachineView(const std::string& output_dir, const MachineView& view) override;
    void saveProductionView(const std::string& output_dir, const ProductionView& view) override;
    void saveOperatorView(const std::string& output_dir, const OperatorView& view) override;
    void saveReportStatus(const std::string& filepath, const DashboardReport& report) override;

    void waitForCompletion() override;
    size_t getPendingTaskCount() const override;

private:
    std::thread worker_thread_;
    std::queue<std::function<void()>> task_queue_;
    size_t running_tasks_ = 0;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::atomic<bool> stop_flag_{false};

    void workerLoop();
    void enqueueTask(std::function<void()> task);

    // Executed by the worker thread
    void writeTable(const std::string& filepath,
                    const std::vector<std::string>& header,
                    const std::vector<std::vector<std::string>>& rows);
    void writeMachineView(const std::string& output_dir, const MachineView& view);
    void writeProductionView(const std::string& output_dir, const ProductionView& view);
    void writeOperatorView(const std::string& output_dir, const OperatorView& view);
    void writeReportStatus(const std::string& filepath, const DashboardReport& report);
};

} // namespace prodintel

#endif // REPORT_WRITER_HPP
