#pragma once

#include <string>

namespace core {

    enum class CommissionType {
        Fixed,      // Flat fee per leg
        PerShare,   // Fee per share, subject to a minimum
        Percentage  // Fraction of notional, subject to a minimum
    };

    CommissionType commissionTypeFromString(const std::string& name);
    std::string commissionTypeToString(CommissionType type);

    struct IndicatorSettings {
        int ema_fast_period = 5;
        int ema_slow_period = 10;
        int ema_trigger_period = 20;
        int atr_period = 14;
        int performance_lookback = 63;  // ~3 months of trading days
        int liquidity_window = 20;      // Average dollar volume window
    };

    struct FilterConfig {
        int sector_rs_ema_period = 20;
        int sector_trend_window = 1;
    };

    struct ScreenConfig {
        double price_max = 70.0;
        double perf_min = 0.60;
        double min_dollar_volume = 5000000.0;
        int rs_window = 1;
        int max_new_orders_per_day = 3;
    };

    struct RiskConfig {
        double risk_per_trade = 0.02;
        double max_position_pct = 0.10;   // <= 0 disables the cap
        double heat_cap = 0.06;           // "Green garden" limit on total allocated risk
        double breakeven_trigger = 0.01;
        double stop_atr_multiple = 1.0;
        double fallback_stop_pct = 0.10;  // Used when the ATR stop would be <= 0
        double target_r_multiple = 0.0;   // <= 0 disables the profit target
    };

    struct ExecutionConfig {
        double gap_threshold_pct = 0.02;
    };

    struct CostConfig {
        CommissionType commission_type = CommissionType::PerShare;
        double commission_fixed = 1.0;
        double commission_per_share = 0.005;
        double commission_pct = 0.0005;
        double commission_min = 1.0;
        double slippage_bps = 2.0;
    };

    struct DataConfig {
        std::string tickers_file = "data/tickers.csv";
        std::string ticker_sector_file = "data/ticker_sector_etf.csv";
        std::string sector_etfs_file = "data/sector_etfs.csv";
        std::string data_dir = "data/prices";       // <TICKER>.csv files, empty to disable
        std::string cache_db_path = "data/price_cache.db"; // Empty to disable the SQLite cache
        bool use_remote = false;                     // Fetch missing series from Stooq
    };

    struct OutputConfig {
        std::string output_dir = "out";
        bool write_reports = true;
    };

    // spdlog level names, see core::logging::parseLevel
    struct LoggingConfig {
        std::string console_level = "info";
        std::string file_level = "debug";
    };

    struct BacktestConfig {
        double start_cash = 100000.0;
        int days = 1095;
        std::string end_date;            // YYYY-MM-DD, empty means today (UTC)
        std::string index_symbol = "SPY";

        IndicatorSettings indicators;
        FilterConfig filters;
        ScreenConfig screen;
        RiskConfig risk;
        ExecutionConfig execution;
        CostConfig costs;
        DataConfig data;
        OutputConfig output;
        LoggingConfig logging;

        // Throws ConfigException describing the first invalid parameter
        void validate() const;
    };

} // namespace core
