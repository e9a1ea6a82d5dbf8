#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace backtester {

    namespace {
        // Absorbs rounding in floor(E * r / rps) * rps when heat_cap == risk_per_trade
        constexpr double kRiskTolerance = 1e-9;
    }

    Portfolio::Portfolio(double initial_capital, const core::RiskConfig& risk, const CostModel& costs)
        : cash_(initial_capital), risk_(risk), costs_(costs) {
        if (initial_capital <= 0) {
            throw core::BacktestException("Initial capital must be positive.");
        }
    }

    bool Portfolio::hasPosition(const std::string& ticker) const {
        return positions_.count(ticker) > 0;
    }

    const core::Position& Portfolio::getPosition(const std::string& ticker) const {
        auto it = positions_.find(ticker);
        if (it == positions_.end()) {
            throw core::BacktestException("No open position for " + ticker);
        }
        return it->second;
    }

    core::Position& Portfolio::findPosition(const std::string& ticker) {
        auto it = positions_.find(ticker);
        if (it == positions_.end()) {
            throw core::BacktestException("No open position for " + ticker);
        }
        return it->second;
    }

    double Portfolio::getPositionsValue() const {
        double total = 0.0;
        for (const auto& pair : positions_) {
            total += static_cast<double>(pair.second.shares) * pair.second.last_price;
        }
        return total;
    }

    double Portfolio::getCurrentEquity() const {
        return cash_ + getPositionsValue();
    }

    double Portfolio::allocatedRisk() const {
        double total = 0.0;
        for (const auto& pair : positions_) {
            total += pair.second.allocatedRisk();
        }
        return total;
    }

    bool Portfolio::canAcceptRisk(double new_risk) const {
        double cap = risk_.heat_cap * getCurrentEquity();
        return allocatedRisk() + new_risk <= cap + kRiskTolerance * std::max(1.0, cap);
    }

    long long Portfolio::sizePosition(double equity, double stop_distance, double entry_price) const {
        if (!(stop_distance > 0.0) || !(entry_price > 0.0) || !(equity > 0.0)) {
            throw core::InvalidSizingException(fmt::format(
                "Cannot size position: equity {:.2f}, stop distance {:.4f}, entry {:.4f}",
                equity, stop_distance, entry_price));
        }

        long long shares = static_cast<long long>(std::floor(equity * risk_.risk_per_trade / stop_distance));
        if (risk_.max_position_pct > 0.0) {
            long long cap = static_cast<long long>(std::floor(equity * risk_.max_position_pct / entry_price));
            shares = std::min(shares, cap);
        }
        if (shares <= 0) {
            throw core::InvalidSizingException(fmt::format(
                "Position size is zero (equity {:.2f}, stop distance {:.4f}, entry {:.4f})",
                equity, stop_distance, entry_price));
        }

        double cost = static_cast<double>(shares) * entry_price + costs_.commission(shares, entry_price);
        if (cost > cash_) {
            throw core::InvalidSizingException(fmt::format(
                "Insufficient cash for {} shares: need {:.2f}, have {:.2f}", shares, cost, cash_));
        }
        return shares;
    }

    const core::Position& Portfolio::applyFill(core::Timestamp timestamp,
                                               const std::string& ticker,
                                               long long shares,
                                               double fill_price,
                                               double stop_price,
                                               double target_price) {
        auto logger = core::logging::getLogger();
        if (hasPosition(ticker)) {
            throw core::BacktestException("Position already open for " + ticker + " (no pyramiding)");
        }
        if (shares <= 0) {
            throw core::InvalidSizingException(fmt::format("Cannot open {} with {} shares", ticker, shares));
        }

        double new_risk = static_cast<double>(shares) * std::max(0.0, fill_price - stop_price);
        if (!canAcceptRisk(new_risk)) {
            throw core::RiskLimitException(fmt::format(
                "Heat cap reached: allocated {:.2f} + new {:.2f} > {:.2f}",
                allocatedRisk(), new_risk, risk_.heat_cap * getCurrentEquity()));
        }

        double commission = costs_.commission(shares, fill_price);
        double cost = static_cast<double>(shares) * fill_price + commission;
        if (cost > cash_) {
            throw core::InvalidSizingException(fmt::format(
                "Insufficient cash for {}: need {:.2f}, have {:.2f}", ticker, cost, cash_));
        }

        core::Position position;
        position.ticker = ticker;
        position.entry_time = timestamp;
        position.entry_price = fill_price;
        position.shares = shares;
        position.risk_per_share = std::max(0.01, fill_price - stop_price);
        position.initial_stop = stop_price;
        position.stop_price = stop_price;
        position.target_price = target_price;
        position.entry_commission = commission;
        position.last_price = fill_price;

        cash_ -= cost;
        auto inserted = positions_.emplace(ticker, position);

        logger->info("BUY {} {} @ {:.4f} stop {:.4f}{} on {} (comm {:.2f}, cash {:.2f})",
                     ticker, shares, fill_price, stop_price,
                     target_price > 0.0 ? fmt::format(" target {:.4f}", target_price) : std::string(),
                     core::utils::dateToString(timestamp), commission, cash_);
        return inserted.first->second;
    }

    core::Trade Portfolio::applyExit(core::Timestamp timestamp,
                                     const std::string& ticker,
                                     double exit_price,
                                     core::ExitReason reason) {
        auto logger = core::logging::getLogger();
        auto it = positions_.find(ticker);
        if (it == positions_.end()) {
            throw core::BacktestException("Cannot exit " + ticker + ": no open position");
        }
        const core::Position& pos = it->second;

        double exit_commission = costs_.commission(pos.shares, exit_price);
        double shares = static_cast<double>(pos.shares);

        core::Trade trade;
        trade.ticker = ticker;
        trade.entry_time = pos.entry_time;
        trade.exit_time = timestamp;
        trade.shares = pos.shares;
        trade.entry_price = pos.entry_price;
        trade.exit_price = exit_price;
        trade.commission = pos.entry_commission + exit_commission;
        trade.pnl = (exit_price - pos.entry_price) * shares - trade.commission;
        trade.return_pct = (pos.entry_price > 0.0) ? (exit_price - pos.entry_price) / pos.entry_price : 0.0;
        trade.reason = reason;

        cash_ += shares * exit_price - exit_commission;
        trade_log_.push_back(trade);
        positions_.erase(it);

        logger->info("SELL {} {} @ {:.4f} ({}) on {}: PnL {:.2f} ({:.2f}%), cash {:.2f}",
                     ticker, trade.shares, exit_price, core::exitReasonToString(reason),
                     core::utils::dateToString(timestamp), trade.pnl, trade.return_pct * 100.0, cash_);
        return trade;
    }

    void Portfolio::ratchetStop(const std::string& ticker, double new_stop) {
        core::Position& pos = findPosition(ticker);
        if (new_stop <= pos.stop_price) {
            return;
        }
        pos.stop_price = new_stop;
        if (pos.stop_price >= pos.entry_price) {
            pos.breakeven_set = true;
        }
        core::logging::getLogger()->debug("Stop for {} raised to {:.4f}{}", ticker, new_stop,
                                          pos.breakeven_set ? " (break-even)" : "");
    }

    void Portfolio::markPrice(const std::string& ticker, double price) {
        findPosition(ticker).last_price = price;
    }

    const PortfolioState& Portfolio::snapshot(core::Timestamp timestamp, bool risk_on) {
        if (!equity_curve_.empty()) {
            const auto& last = equity_curve_.back();
            if (last.timestamp == timestamp) {
                core::logging::getLogger()->warn("Snapshot for {} already recorded, ignoring.",
                                                 core::utils::dateToString(timestamp));
                return last;
            }
            if (timestamp < last.timestamp) {
                throw core::BacktestException(fmt::format("Snapshot for {} is earlier than the last one ({}).",
                                                          core::utils::dateToString(timestamp),
                                                          core::utils::dateToString(last.timestamp)));
            }
        }

        PortfolioState state;
        state.timestamp = timestamp;
        state.cash = cash_;
        state.positions_value = getPositionsValue();
        state.total_equity = state.cash + state.positions_value;
        state.allocated_risk = allocatedRisk();
        state.open_positions = static_cast<int>(positions_.size());
        state.risk_on = risk_on;
        equity_curve_.push_back(state);
        return equity_curve_.back();
    }

} // namespace backtester
