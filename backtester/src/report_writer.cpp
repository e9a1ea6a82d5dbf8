#include "report_writer.hpp"
#include "config_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <filesystem>
#include <fstream>
#include <cmath>
#include <utility>

namespace backtester {

    namespace {

        json finiteOrNull(double value) {
            if (std::isfinite(value)) {
                return value;
            }
            return nullptr;
        }

        std::ofstream openOutput(const std::filesystem::path& path) {
            std::ofstream out(path);
            if (!out.is_open()) {
                throw core::BacktestException(fmt::format("Cannot open '{}' for writing.", path.string()));
            }
            return out;
        }

        void closeOutput(std::ofstream& out, const std::filesystem::path& path) {
            out.close();
            if (out.fail()) {
                throw core::BacktestException(fmt::format("Failed writing '{}'.", path.string()));
            }
        }

        // Quote fields that could break the CSV (skip details are free text)
        std::string csvField(const std::string& value) {
            if (value.find_first_of(",\"\n") == std::string::npos) {
                return value;
            }
            std::string quoted = "\"";
            for (char c : value) {
                if (c == '"') {
                    quoted += '"';
                }
                quoted += c;
            }
            quoted += '"';
            return quoted;
        }

        void writeTrades(const std::filesystem::path& path, const std::vector<core::Trade>& trades) {
            std::ofstream out = openOutput(path);
            out << "ticker,entry_date,entry_price,exit_date,exit_price,shares,pnl,return_pct,commission,reason\n";
            for (const auto& t : trades) {
                out << fmt::format("{},{},{:.4f},{},{:.4f},{},{:.2f},{:.6f},{:.2f},{}\n",
                                   t.ticker,
                                   core::utils::dateToString(t.entry_time), t.entry_price,
                                   core::utils::dateToString(t.exit_time), t.exit_price,
                                   t.shares, t.pnl, t.return_pct, t.commission,
                                   core::exitReasonToString(t.reason));
            }
            closeOutput(out, path);
        }

        void writeEquity(const std::filesystem::path& path, const std::vector<PortfolioState>& curve) {
            std::ofstream out = openOutput(path);
            out << "date,equity,cash,positions_value,allocated_risk,open_positions,risk_on\n";
            for (const auto& s : curve) {
                out << fmt::format("{},{:.2f},{:.2f},{:.2f},{:.2f},{},{}\n",
                                   core::utils::dateToString(s.timestamp), s.total_equity, s.cash,
                                   s.positions_value, s.allocated_risk, s.open_positions, s.risk_on ? 1 : 0);
            }
            closeOutput(out, path);
        }

        void writeSkipped(const std::filesystem::path& path, const core::SkipLog& skip_log) {
            std::ofstream out = openOutput(path);
            out << "date,ticker,reason,detail\n";
            for (const auto& r : skip_log.entries()) {
                out << core::utils::dateToString(r.timestamp) << ',' << r.ticker << ','
                    << core::skipReasonToString(r.reason) << ',' << csvField(r.detail) << '\n';
            }
            closeOutput(out, path);
        }

    } // namespace

    ReportWriter::ReportWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

    std::string ReportWriter::runDirectory(const std::string& end_date, int days) const {
        std::filesystem::path dir(output_dir_);
        dir /= fmt::format("run_{}_{}d", end_date, days);
        return dir.string();
    }

    json ReportWriter::metricsToJson(const BacktestMetrics& m) {
        json j;
        j["start_equity"] = m.start_equity;
        j["end_equity"] = m.end_equity;
        j["total_pnl"] = m.total_pnl;
        j["total_return"] = m.total_return_pct;
        j["cagr"] = finiteOrNull(m.cagr);
        j["max_drawdown"] = m.max_drawdown_pct;
        j["trading_days"] = m.trading_days;
        j["trade_count"] = m.trade_count;
        j["winning_trades"] = m.winning_trades;
        j["losing_trades"] = m.losing_trades;
        j["win_rate"] = m.win_rate;
        j["profit_factor"] = finiteOrNull(m.profit_factor);
        j["avg_win"] = m.avg_win_pnl;
        j["avg_loss"] = m.avg_loss_pnl;
        j["expectancy"] = m.expectancy;
        j["daily_volatility"] = m.daily_volatility;
        j["total_commission"] = m.total_commission;
        return j;
    }

    json ReportWriter::skipSummaryToJson(const core::SkipLog& skip_log) {
        json by_reason = json::object();
        for (auto reason : {core::SkipReason::DataGap, core::SkipReason::InsufficientHistory,
                            core::SkipReason::InvalidSizing, core::SkipReason::RiskLimit}) {
            by_reason[core::skipReasonToString(reason)] = skip_log.count(reason);
        }
        json by_ticker = json::object();
        for (const auto& pair : skip_log.countsByTicker()) {
            by_ticker[pair.first] = pair.second;
        }
        json j;
        j["total"] = skip_log.size();
        j["by_reason"] = by_reason;
        j["by_ticker"] = by_ticker;
        return j;
    }

    std::string ReportWriter::write(const BacktestResult& result,
                                    const core::BacktestConfig& config,
                                    const std::string& end_date) const {
        auto logger = core::logging::getLogger();
        std::filesystem::path dir(runDirectory(end_date, config.days));

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw core::BacktestException(fmt::format("Cannot create output directory '{}': {}",
                                                      dir.string(), ec.message()));
        }

        writeTrades(dir / "trades.csv", result.trades);
        writeEquity(dir / "equity.csv", result.equity_curve);
        writeSkipped(dir / "skipped.csv", result.skip_log);

        json report;
        report["metrics"] = metricsToJson(result.metrics);
        report["skipped"] = skipSummaryToJson(result.skip_log);
        report["config"] = strategy_engine::ConfigFactory::toJson(config);

        std::filesystem::path metrics_path = dir / "metrics.json";
        std::ofstream out = openOutput(metrics_path);
        out << report.dump(2) << '\n';
        closeOutput(out, metrics_path);

        logger->info("Reports written to {}", dir.string());
        return dir.string();
    }

} // namespace backtester
