#include "execution_simulator.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>

namespace backtester {

    std::string fillStatusToString(FillStatus status) {
        switch (status) {
            case FillStatus::Filled:      return "FILLED";
            case FillStatus::NotTouched:  return "NOT_TOUCHED";
            case FillStatus::GapRejected: return "GAP_REJECTED";
        }
        return "UNKNOWN";
    }

    ExecutionSimulator::ExecutionSimulator(const core::RiskConfig& risk,
                                           const core::ExecutionConfig& execution,
                                           const CostModel& costs)
        : risk_(risk), execution_(execution), costs_(costs) {}

    FillResult ExecutionSimulator::tryFill(const core::Order& order, const core::Candle& bar) const {
        FillResult result;
        const double trigger = order.trigger_price;

        if (bar.open < trigger * (1.0 - execution_.gap_threshold_pct)) {
            result.status = FillStatus::GapRejected;
            core::logging::getLogger()->debug("{} order @ {:.4f} rejected on {}: open {:.4f} gapped below threshold",
                                              order.ticker, trigger, core::utils::dateToString(bar.timestamp), bar.open);
            return result;
        }
        if (bar.low <= trigger && trigger <= bar.high) {
            result.status = FillStatus::Filled;
            result.fill_price = costs_.slipBuy(trigger);
            return result;
        }
        result.status = FillStatus::NotTouched;
        return result;
    }

    double ExecutionSimulator::initialStop(double trigger, double atr) const {
        double stop = trigger - risk_.stop_atr_multiple * atr;
        if (stop <= 0.0) {
            stop = trigger * (1.0 - risk_.fallback_stop_pct);
        }
        return stop;
    }

    double ExecutionSimulator::riskPerShare(double fill_price, double stop_price) const {
        return std::max(0.01, fill_price - stop_price);
    }

    double ExecutionSimulator::targetPrice(double entry_price, double risk_per_share) const {
        if (risk_.target_r_multiple <= 0.0) {
            return 0.0;
        }
        return entry_price + risk_.target_r_multiple * risk_per_share;
    }

    PositionDecision ExecutionSimulator::evaluatePosition(const core::Position& position,
                                                          const core::Candle& bar) const {
        PositionDecision decision;

        // --- 1. Stop ---
        if (bar.low <= position.stop_price) {
            decision.action = PositionAction::Exit;
            decision.price = costs_.slipSell(std::min(bar.open, position.stop_price));
            decision.reason = position.breakeven_set ? core::ExitReason::BreakevenStop : core::ExitReason::Stop;
            return decision;
        }

        // --- 2. Target ---
        if (position.target_price > 0.0 && bar.high >= position.target_price) {
            decision.action = PositionAction::Exit;
            decision.price = costs_.slipSell(std::max(bar.open, position.target_price));
            decision.reason = core::ExitReason::Target;
            return decision;
        }

        // --- 3. Break-even ratchet ---
        if (!position.breakeven_set &&
            bar.high >= position.entry_price * (1.0 + risk_.breakeven_trigger) &&
            position.entry_price > position.stop_price) {
            decision.action = PositionAction::RatchetStop;
            decision.price = position.entry_price;
            return decision;
        }

        return decision;
    }

    double ExecutionSimulator::liquidationPrice(double close) const {
        return costs_.slipSell(close);
    }

} // namespace backtester
