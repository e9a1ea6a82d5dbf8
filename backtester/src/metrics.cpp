#include "metrics.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>
#include <limits>
#include <algorithm>

namespace backtester {

    namespace {
        constexpr double kDaysPerYear = 365.25;
    }

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Start Equity: {:.2f}", start_equity);
        logger->info("End Equity: {:.2f}", end_equity);
        logger->info("Total PnL: {:.2f}", total_pnl);
        logger->info("Total Return: {:.2f}%", total_return_pct * 100.0);
        logger->info("CAGR: {:.2f}%", cagr * 100.0);
        logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct * 100.0);
        logger->info("Trading Days: {}", trading_days);
        logger->info("Trades: {} (won {}, lost {})", trade_count, winning_trades, losing_trades);
        logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Avg Win PnL: {:.2f}", avg_win_pnl);
        logger->info("Avg Loss PnL: {:.2f}", avg_loss_pnl);
        logger->info("Expectancy: {:.2f}", expectancy);
        logger->info("Daily Volatility: {:.4f}%", daily_volatility * 100.0);
        logger->info("Total Commission: {:.2f}", total_commission);
        logger->info("------------------------");
    }

    MetricsBuilder::MetricsBuilder(double start_equity)
        : start_equity_(start_equity), last_equity_(start_equity) {}

    void MetricsBuilder::onSnapshot(const PortfolioState& state) {
        const double equity = state.total_equity;

        if (snapshots_ == 0) {
            first_time_ = state.timestamp;
            peak_equity_ = equity;
        } else {
            if (last_equity_ > 1e-9) {
                double r = equity / last_equity_ - 1.0;
                ++return_count_;
                double delta = r - return_mean_;
                return_mean_ += delta / static_cast<double>(return_count_);
                return_m2_ += delta * (r - return_mean_);
            }
            peak_equity_ = std::max(peak_equity_, equity);
        }

        if (peak_equity_ > 1e-9) {
            max_drawdown_ = std::max(max_drawdown_, (peak_equity_ - equity) / peak_equity_);
        }

        last_time_ = state.timestamp;
        last_equity_ = equity;
        ++snapshots_;
    }

    void MetricsBuilder::onTrade(const core::Trade& trade) {
        ++trades_;
        net_pnl_ += trade.pnl;
        commission_ += trade.commission;
        if (trade.pnl > 0) {
            ++wins_;
            gross_profit_ += trade.pnl;
        } else if (trade.pnl < 0) {
            ++losses_;
            gross_loss_ += trade.pnl;
        }
    }

    BacktestMetrics MetricsBuilder::build() const {
        BacktestMetrics m;
        m.start_equity = start_equity_;
        m.end_equity = snapshots_ > 0 ? last_equity_ : start_equity_;
        m.total_pnl = m.end_equity - m.start_equity;
        m.total_return_pct = (start_equity_ > 1e-9) ? m.total_pnl / start_equity_ : 0.0;
        m.max_drawdown_pct = max_drawdown_;
        m.trading_days = snapshots_;

        if (first_time_ && start_equity_ > 1e-9 && m.end_equity > 0.0) {
            double years = static_cast<double>(core::utils::daysBetween(*first_time_, last_time_)) / kDaysPerYear;
            if (years > 0.0) {
                m.cagr = std::pow(m.end_equity / start_equity_, 1.0 / years) - 1.0;
            }
        }

        m.trade_count = trades_;
        m.winning_trades = wins_;
        m.losing_trades = losses_;
        m.win_rate = trades_ > 0 ? static_cast<double>(wins_) / trades_ : 0.0;
        if (std::abs(gross_loss_) > 1e-9) {
            m.profit_factor = gross_profit_ / std::abs(gross_loss_);
        } else if (gross_profit_ > 1e-9) {
            m.profit_factor = std::numeric_limits<double>::infinity();
        } else {
            m.profit_factor = 0.0;
        }
        m.avg_win_pnl = wins_ > 0 ? gross_profit_ / wins_ : 0.0;
        m.avg_loss_pnl = losses_ > 0 ? gross_loss_ / losses_ : 0.0;
        m.expectancy = trades_ > 0 ? net_pnl_ / trades_ : 0.0;
        m.daily_volatility = return_count_ > 1 ? std::sqrt(return_m2_ / static_cast<double>(return_count_ - 1)) : 0.0;
        m.total_commission = commission_;
        return m;
    }

    BacktestMetrics MetricsBuilder::compute(double start_equity,
                                            const std::vector<PortfolioState>& curve,
                                            const std::vector<core::Trade>& trades) {
        MetricsBuilder builder(start_equity);
        for (const auto& state : curve) {
            builder.onSnapshot(state);
        }
        for (const auto& trade : trades) {
            builder.onTrade(trade);
        }
        return builder.build();
    }

} // namespace backtester
