#pragma once

#include "config.hpp"

namespace backtester {

    // Commission and slippage for one execution leg
    class CostModel {
    public:
        explicit CostModel(const core::CostConfig& config);

        // Zero for zero shares. PerShare and Percentage are floored at commission_min.
        double commission(long long shares, double price) const;

        // Adverse slippage: buys fill higher, sells fill lower
        double slipBuy(double price) const;
        double slipSell(double price) const;

        const core::CostConfig& config() const { return config_; }

    private:
        core::CostConfig config_;
    };

} // namespace backtester
