#pragma once

#include "datatypes.hpp"
#include "portfolio.hpp" // PortfolioState
#include <vector>
#include <optional>

namespace backtester {

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        double start_equity = 0.0;
        double end_equity = 0.0;
        double total_pnl = 0.0;
        double total_return_pct = 0.0;  // Fraction (0.10 == 10%)
        double cagr = 0.0;
        double max_drawdown_pct = 0.0;  // Positive fraction, peak-to-trough over snapshots
        int trading_days = 0;
        int trade_count = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double profit_factor = 0.0;     // Gross profit / gross loss, infinity without losses
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;      // Negative
        double expectancy = 0.0;        // Average net PnL per trade
        double daily_volatility = 0.0;  // Sample std of daily equity returns
        double total_commission = 0.0;

        // Helper method to log calculated metrics
        void logMetrics() const;
    };

    // Consumes the equity curve and closed trades one at a time
    class MetricsBuilder {
    public:
        explicit MetricsBuilder(double start_equity);

        void onSnapshot(const PortfolioState& state);
        void onTrade(const core::Trade& trade);

        BacktestMetrics build() const;

        // Batch form over a finished run, same results as the incremental path
        static BacktestMetrics compute(double start_equity,
                                       const std::vector<PortfolioState>& curve,
                                       const std::vector<core::Trade>& trades);

    private:
        double start_equity_;

        // --- Equity curve ---
        int snapshots_ = 0;
        std::optional<core::Timestamp> first_time_;
        core::Timestamp last_time_;
        double last_equity_ = 0.0;
        double peak_equity_ = 0.0;
        double max_drawdown_ = 0.0;

        // Welford accumulators for daily returns
        long long return_count_ = 0;
        double return_mean_ = 0.0;
        double return_m2_ = 0.0;

        // --- Trades ---
        int trades_ = 0;
        int wins_ = 0;
        int losses_ = 0;
        double gross_profit_ = 0.0;
        double gross_loss_ = 0.0;   // Negative sum
        double net_pnl_ = 0.0;
        double commission_ = 0.0;
    };

} // namespace backtester
