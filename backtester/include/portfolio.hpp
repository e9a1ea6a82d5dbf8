// backtester/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>
#include <map>

// Use short paths
#include "datatypes.hpp" // Provides core::Timestamp, core::Position, core::Trade
#include "config.hpp"
#include "cost_model.hpp"

namespace backtester {

    // --- Portfolio State Struct (for equity curve) ---
    struct PortfolioState {
        core::Timestamp timestamp;
        double cash = 0.0;
        double positions_value = 0.0; // Market value of all holdings at the mark
        double total_equity = 0.0;    // cash + positions_value
        double allocated_risk = 0.0;  // Sum of max(0, entry - stop) * shares
        int open_positions = 0;
        bool risk_on = false;         // Market gate on the signal date
    };

    // --- Portfolio Class Definition ---
    // Cash, open positions, trade log and equity snapshots of one backtest run.
    class Portfolio {
    public:
        Portfolio(double initial_capital, const core::RiskConfig& risk, const CostModel& costs);

        // --- Getters ---
        double getCash() const { return cash_; }
        bool hasPosition(const std::string& ticker) const;
        // Throws BacktestException if there is no open position for 'ticker'
        const core::Position& getPosition(const std::string& ticker) const;
        const std::map<std::string, core::Position>& getPositions() const { return positions_; }
        double getPositionsValue() const;
        // cash + positions at their last mark
        double getCurrentEquity() const;
        double allocatedRisk() const;
        const std::vector<PortfolioState>& getEquityCurve() const { return equity_curve_; }
        const std::vector<core::Trade>& getTradeLog() const { return trade_log_; }

        // --- Risk & sizing ---
        // True when allocated risk plus 'new_risk' stays within heat_cap * equity
        bool canAcceptRisk(double new_risk) const;

        // floor(equity * risk_per_trade / stop_distance), capped by max_position_pct.
        // Throws InvalidSizingException for zero shares or when cash cannot cover cost + commission.
        long long sizePosition(double equity, double stop_distance, double entry_price) const;

        // --- Modifiers ---
        // Opens a position. Throws BacktestException (already held), RiskLimitException (heat cap)
        // or InvalidSizingException (cash).
        const core::Position& applyFill(core::Timestamp timestamp,
                                        const std::string& ticker,
                                        long long shares,
                                        double fill_price,
                                        double stop_price,
                                        double target_price);

        // Closes the whole position and appends the round trip to the trade log
        core::Trade applyExit(core::Timestamp timestamp,
                              const std::string& ticker,
                              double exit_price,
                              core::ExitReason reason);

        // Raises the stop (never lowers it). Marks break-even once the stop reaches entry.
        void ratchetStop(const std::string& ticker, double new_stop);

        void markPrice(const std::string& ticker, double price);

        // Appends the state for 'timestamp'. A repeated timestamp is ignored with a warning.
        const PortfolioState& snapshot(core::Timestamp timestamp, bool risk_on = false);

    private:
        core::Position& findPosition(const std::string& ticker);

        double cash_;
        core::RiskConfig risk_;
        const CostModel& costs_;
        // Ticker -> the one open position for it
        std::map<std::string, core::Position> positions_;
        std::vector<PortfolioState> equity_curve_;
        std::vector<core::Trade> trade_log_;
    };

} // namespace backtester
