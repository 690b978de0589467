#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "analytics/EfficiencyCalculator.hpp"
#include "analytics/FilterEngine.hpp"
#include "analytics/OperatorJoiner.hpp"
#include "analytics/ProductionAggregator.hpp"
#include "analytics/ProductionDashboard.hpp"
#include "analytics/ReportWriter.hpp"
#include "exceptions/Exceptions.hpp"
#include "ingest/DatasetLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/ReportSettings.hpp"

using prodintel::DashboardReport;
using prodintel::DashboardRequest;
using prodintel::DatasetLoader;
using prodintel::EfficiencyCalculator;
using prodintel::EntityStore;
using prodintel::FilterEngine;
using prodintel::Logger;
using prodintel::LogLevel;
using prodintel::OperatorJoiner;
using prodintel::ProductionAggregator;
using prodintel::ProductionDashboard;
using prodintel::ReportSettings;
using prodintel::ReportStatus;
using prodintel::ReportWriter;

namespace {

struct Args {
    std::string settingsPath;

    // Flag values in command-line order, applied after the settings file
    std::vector<std::pair<std::string, std::string>> overrides;
};

void printUsage(const char* programName) {
    std::cout
        << "Usage: " << programName
        << " --machines PATH --operators PATH [--settings PATH] [--output DIR]\n";
    std::cout
        << "       " << programName
        << " [--start YYYY-MM-DD --end YYYY-MM-DD] [--years 2024,2025] [--months January,February]\n";
    std::cout
        << "       " << programName
        << " [--top-machines N] [--top-operators N] [--bottom-operators N] [--view machine|date]"
        << " [--machine ID] [--operator NAME] [--log-level debug|info|warning|error] [--log-file PATH]\n";
}

Args parseArgs(int argc, char** argv) {
    // flag -> settings key
    static const std::vector<std::pair<std::string, std::string>> flags = {
        {"--machines", "machines"},
        {"--operators", "operators"},
        {"--output", "output"},
        {"--start", "start"},
        {"--end", "end"},
        {"--years", "years"},
        {"--months", "months"},
        {"--top-machines", "top_machines"},
        {"--top-operators", "top_operators"},
        {"--bottom-operators", "bottom_operators"},
        {"--view", "view"},
        {"--machine", "machine"},
        {"--operator", "operator"},
        {"--log-level", "log_level"},
        {"--log-file", "log_file"}
    };

    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto requireValue = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value after " + flag);
            }
            return std::string(argv[++i]);
        };

        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        }
        if (a == "--settings") {
            args.settingsPath = requireValue("--settings");
            continue;
        }

        bool known = false;
        for (const auto& [flag, key] : flags) {
            if (a == flag) {
                args.overrides.emplace_back(key, requireValue(flag));
                known = true;
                break;
            }
        }
        if (!known) {
            throw std::runtime_error("Unknown argument: " + a);
        }
    }
    return args;
}

void printSummary(const DashboardReport& report, const std::string& outputDir) {
    std::cout << "Status: " << prodintel::toString(report.status)
              << " (" << report.criteria.describe() << ")\n";
    std::cout << "Machine records: " << report.machine_records
              << ", operator records: " << report.operator_records << "\n";

    if (report.status == ReportStatus::Ok) {
        const auto& overview = report.production.overview;
        std::cout << "Total production: " << overview.total_production
                  << ", average daily production: "
                  << prodintel::formatDecimal(overview.average_daily_production, 1)
                  << " over " << overview.production_days << " days\n";
        if (!report.machine.top_machines.empty()) {
            const auto& best = report.machine.top_machines.front();
            std::cout << "Most efficient machine: " << prodintel::toString(best.machine_id)
                      << " (" << prodintel::formatEfficiency(best.avg_efficiency_pct) << "%)\n";
        }
        if (report.operators.status == ReportStatus::Ok && !report.operators.top_operators.empty()) {
            const auto& top = report.operators.top_operators.front();
            std::cout << "Top operator: " << top.operator_name
                      << " (" << top.total_production << " rolls)\n";
        }
    }
    std::cout << "Results written to " << outputDir << "\n";
}

} // namespace

int main(int argc, char** argv) {
    Logger::getInstance().setLogLevel(LogLevel::INFO);

    try {
        const Args args = parseArgs(argc, argv);

        ReportSettings settings;
        if (!args.settingsPath.empty()) {
            settings.configure(prodintel::readSettingsFile(args.settingsPath));
        }
        for (const auto& [key, value] : args.overrides) {
            settings.apply(key, value);
        }
        settings.validate();

        Logger& logger = Logger::getInstance();
        logger.setLogLevel(settings.log_level);
        if (!settings.log_file.empty()) {
            if (!logger.setLogFile(settings.log_file)) {
                logger.warning("main", "Could not open log file " + settings.log_file + "; logging to stderr only");
            }
        }

        const EntityStore store = DatasetLoader::loadStore(settings.machines_path, settings.operators_path);

        auto calculator = std::make_shared<EfficiencyCalculator>();
        ProductionDashboard dashboard(
            std::make_unique<FilterEngine>(),
            std::make_unique<ProductionAggregator>(calculator),
            std::make_unique<OperatorJoiner>(calculator),
            std::make_unique<ReportWriter>());

        const DashboardRequest request = settings.toRequest();
        const DashboardReport report = dashboard.buildReport(store, request);
        dashboard.writeReport(report, settings.output_dir);

        printSummary(report, settings.output_dir);
        logger.closeLogFile();
        return 0;
    } catch (const prodintel::ProdIntelException& e) {
        Logger::getInstance().error(e.getComponent(), e.getMessage());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }
}
