// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <exception>
#include <memory>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "config_factory.hpp"
#include "data_loader.hpp"
#include "backtester.hpp"
#include "report_writer.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " [config.json]\n"
                  << "  BT_* environment variables override the configuration file.\n";
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc > 2) {
        printUsage(argv[0]);
        return 2;
    }
    if (argc == 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    try {
        // --- Initialize Logging ---
        core::logging::initialize("poos_backtest", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("POOS backtest starting...");

        // --- 1. Configuration ---
        core::BacktestConfig config;
        if (argc == 2) {
            logger->info("Loading config from: {}", argv[1]);
            config = strategy_engine::ConfigFactory::loadFile(argv[1]);
        } else {
            logger->info("No config file given, using defaults.");
        }
        strategy_engine::ConfigFactory::applyEnvironmentOverrides(config);
        config.validate();
        core::logging::setLevels(*core::logging::parseLevel(config.logging.console_level),
                                 *core::logging::parseLevel(config.logging.file_level));

        const auto window = data::DataLoader::resolveWindow(config);
        const std::string end_date = core::utils::dateToString(window.second);
        logger->info("Backtest Parameters: Capital={:.2f}, Days={}, End={}, Index={}",
                     config.start_cash, config.days, end_date, config.index_symbol);

        // --- 2. Data ---
        data::DataLoader loader(config);
        data::PriceStore store = loader.load();
        if (store.universe().empty()) {
            logger->warn("No stocks loaded. The run will only track cash.");
        }

        // --- 3. Simulation ---
        backtester::Backtester the_backtester(store, config);
        backtester::BacktestResult result = the_backtester.run();
        result.metrics.logMetrics();
        if (!result.skip_log.empty()) {
            logger->info("Skipped actions: {} (data gaps {}, warm-up {}, sizing {}, heat cap {})",
                         result.skip_log.size(),
                         result.skip_log.count(core::SkipReason::DataGap),
                         result.skip_log.count(core::SkipReason::InsufficientHistory),
                         result.skip_log.count(core::SkipReason::InvalidSizing),
                         result.skip_log.count(core::SkipReason::RiskLimit));
        }

        // --- 4. Reports ---
        if (config.output.write_reports) {
            backtester::ReportWriter writer(config.output.output_dir);
            writer.write(result, config, end_date);
        }

        logger->info("POOS backtest finished.");

    // --- Exception Handling ---
    } catch (const core::ConfigException& ex) {
        std::cerr << "Configuration Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Configuration Error: {}", ex.what());
        return 1;
    } catch (const core::PoosException& ex) {
        std::cerr << "Backtest Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtest Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
