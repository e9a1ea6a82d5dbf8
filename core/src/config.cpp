#include "config.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace core {

    namespace {

        void requireFinite(double value, const char* name) {
            if (!std::isfinite(value)) {
                throw ConfigException(fmt::format("{} must be a finite number", name));
            }
        }

        void requireFraction(double value, const char* name, bool allow_zero) {
            requireFinite(value, name);
            if (value > 1.0 || value < 0.0 || (!allow_zero && value == 0.0)) {
                throw ConfigException(fmt::format("{} must be in {}0, 1] (got {})",
                                                  name, allow_zero ? "[" : "(", value));
            }
        }

        void requireNonNegative(double value, const char* name) {
            requireFinite(value, name);
            if (value < 0.0) {
                throw ConfigException(fmt::format("{} must not be negative (got {})", name, value));
            }
        }

        // TA-Lib rejects EMA/SMA periods below 2
        void requirePeriod(int value, const char* name, int minimum = 2) {
            if (value < minimum) {
                throw ConfigException(fmt::format("{} must be >= {} (got {})", name, minimum, value));
            }
        }

    } // end anonymous namespace

    CommissionType commissionTypeFromString(const std::string& name) {
        std::string lower = utils::toLower(utils::trim(name));
        if (lower == "fixed") return CommissionType::Fixed;
        if (lower == "per_share" || lower == "per-share" || lower == "pershare") return CommissionType::PerShare;
        if (lower == "percentage" || lower == "percent") return CommissionType::Percentage;
        throw ConfigException("Unknown commission model '" + name + "' (expected fixed, per_share or percentage)");
    }

    std::string commissionTypeToString(CommissionType type) {
        switch (type) {
            case CommissionType::Fixed:      return "fixed";
            case CommissionType::PerShare:   return "per_share";
            case CommissionType::Percentage: return "percentage";
        }
        return "unknown";
    }

    void BacktestConfig::validate() const {
        requireFinite(start_cash, "backtest.start_cash");
        if (start_cash <= 0.0) {
            throw ConfigException(fmt::format("backtest.start_cash must be positive (got {})", start_cash));
        }
        if (days <= 0) {
            throw ConfigException(fmt::format("backtest.days must be positive (got {})", days));
        }
        if (!end_date.empty()) {
            try {
                utils::stringToDate(end_date);
            } catch (const std::runtime_error& e) {
                throw ConfigException(fmt::format("backtest.end_date is invalid: {}", e.what()));
            }
        }
        if (utils::trim(index_symbol).empty()) {
            throw ConfigException("backtest.index_symbol must not be empty");
        }

        // --- Indicators ---
        requirePeriod(indicators.ema_fast_period, "indicators.ema_fast_period");
        requirePeriod(indicators.ema_slow_period, "indicators.ema_slow_period");
        requirePeriod(indicators.ema_trigger_period, "indicators.ema_trigger_period");
        requirePeriod(indicators.atr_period, "indicators.atr_period", 1);
        requirePeriod(indicators.performance_lookback, "indicators.performance_lookback", 1);
        requirePeriod(indicators.liquidity_window, "indicators.liquidity_window");
        if (indicators.ema_fast_period >= indicators.ema_slow_period) {
            throw ConfigException("indicators.ema_fast_period must be shorter than indicators.ema_slow_period");
        }

        requirePeriod(filters.sector_rs_ema_period, "filters.sector_rs_ema_period");
        requirePeriod(filters.sector_trend_window, "filters.sector_trend_window", 1);

        // --- Screen ---
        requireFinite(screen.price_max, "screen.price_max");
        if (screen.price_max <= 0.0) {
            throw ConfigException("screen.price_max must be positive");
        }
        requireFinite(screen.perf_min, "screen.perf_min");
        requireNonNegative(screen.min_dollar_volume, "screen.min_dollar_volume");
        requirePeriod(screen.rs_window, "screen.rs_window", 1);
        requirePeriod(screen.max_new_orders_per_day, "screen.max_new_orders_per_day", 1);

        // --- Risk ---
        requireFraction(risk.risk_per_trade, "risk.risk_per_trade", false);
        requireFraction(risk.heat_cap, "risk.heat_cap", false);
        if (risk.heat_cap < risk.risk_per_trade) {
            throw ConfigException(fmt::format("risk.heat_cap ({}) must be >= risk.risk_per_trade ({})",
                                              risk.heat_cap, risk.risk_per_trade));
        }
        requireFinite(risk.max_position_pct, "risk.max_position_pct");
        if (risk.max_position_pct > 1.0) {
            throw ConfigException("risk.max_position_pct must be <= 1");
        }
        requireNonNegative(risk.breakeven_trigger, "risk.breakeven_trigger");
        requireFinite(risk.stop_atr_multiple, "risk.stop_atr_multiple");
        if (risk.stop_atr_multiple <= 0.0) {
            throw ConfigException("risk.stop_atr_multiple must be positive");
        }
        requireFraction(risk.fallback_stop_pct, "risk.fallback_stop_pct", false);
        requireFinite(risk.target_r_multiple, "risk.target_r_multiple");

        requireFraction(execution.gap_threshold_pct, "execution.gap_threshold_pct", true);

        // --- Costs ---
        requireNonNegative(costs.commission_fixed, "costs.commission_fixed");
        requireNonNegative(costs.commission_per_share, "costs.commission_per_share");
        requireFraction(costs.commission_pct, "costs.commission_pct", true);
        requireNonNegative(costs.commission_min, "costs.commission_min");
        requireNonNegative(costs.slippage_bps, "costs.slippage_bps");
        if (costs.slippage_bps >= 10000.0) {
            throw ConfigException("costs.slippage_bps must be below 10000");
        }

        if (data.tickers_file.empty() || data.sector_etfs_file.empty() || data.ticker_sector_file.empty()) {
            throw ConfigException("data.tickers_file, data.sector_etfs_file and data.ticker_sector_file are required");
        }

        if (!core::logging::parseLevel(logging.console_level)) {
            throw ConfigException("logging.console_level is not a log level: '" + logging.console_level + "'");
        }
        if (!core::logging::parseLevel(logging.file_level)) {
            throw ConfigException("logging.file_level is not a log level: '" + logging.file_level + "'");
        }
    }

} // namespace core
