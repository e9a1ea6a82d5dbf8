#pragma once

#include "backtester.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace backtester {

    using json = nlohmann::json;

    // Writes trades.csv, equity.csv, skipped.csv and metrics.json for one run
    class ReportWriter {
    public:
        explicit ReportWriter(std::string output_dir);

        // <output_dir>/run_<end_date>_<days>d
        std::string runDirectory(const std::string& end_date, int days) const;

        // Returns the run directory. Throws BacktestException on I/O failure.
        std::string write(const BacktestResult& result,
                          const core::BacktestConfig& config,
                          const std::string& end_date) const;

        // Non-finite values (profit factor without losses) become null
        static json metricsToJson(const BacktestMetrics& metrics);
        static json skipSummaryToJson(const core::SkipLog& skip_log);

    private:
        std::string output_dir_;
    };

} // namespace backtester
