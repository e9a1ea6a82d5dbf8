#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include "cost_model.hpp"
#include <string>

namespace backtester {

    enum class FillStatus {
        Filled,
        NotTouched,  // Bar range never reached the trigger, order expires
        GapRejected  // Open too far below the trigger
    };

    struct FillResult {
        FillStatus status = FillStatus::NotTouched;
        double fill_price = 0.0; // Slipped, valid when Filled
    };

    enum class PositionAction {
        Hold,
        Exit,
        RatchetStop
    };

    // Exactly one action per position per day
    struct PositionDecision {
        PositionAction action = PositionAction::Hold;
        double price = 0.0;  // Slipped exit price, or the new stop for RatchetStop
        core::ExitReason reason = core::ExitReason::Stop;
    };

    std::string fillStatusToString(FillStatus status);

    // Daily-bar proxy for limit entries and stop/target exits
    class ExecutionSimulator {
    public:
        ExecutionSimulator(const core::RiskConfig& risk,
                           const core::ExecutionConfig& execution,
                           const CostModel& costs);

        // Gap filter first (open < trigger * (1 - gap_threshold_pct)), then low <= trigger <= high
        FillResult tryFill(const core::Order& order, const core::Candle& bar) const;

        // trigger - stop_atr_multiple * ATR, or trigger * (1 - fallback_stop_pct) when that is <= 0
        double initialStop(double trigger, double atr) const;

        // max(0.01, fill - stop)
        double riskPerShare(double fill_price, double stop_price) const;

        // 0 when target_r_multiple <= 0
        double targetPrice(double entry_price, double risk_per_share) const;

        // Stop beats target beats break-even ratchet
        PositionDecision evaluatePosition(const core::Position& position, const core::Candle& bar) const;

        // Slipped sell at the given close
        double liquidationPrice(double close) const;

    private:
        core::RiskConfig risk_;
        core::ExecutionConfig execution_;
        const CostModel& costs_;
    };

} // namespace backtester
