#include "cost_model.hpp"
#include <algorithm>

namespace backtester {

    CostModel::CostModel(const core::CostConfig& config) : config_(config) {}

    double CostModel::commission(long long shares, double price) const {
        if (shares <= 0) {
            return 0.0;
        }
        switch (config_.commission_type) {
            case core::CommissionType::Fixed:
                return config_.commission_fixed;
            case core::CommissionType::PerShare:
                return std::max(config_.commission_min,
                                static_cast<double>(shares) * config_.commission_per_share);
            case core::CommissionType::Percentage:
                return std::max(config_.commission_min,
                                static_cast<double>(shares) * price * config_.commission_pct);
        }
        return 0.0;
    }

    double CostModel::slipBuy(double price) const {
        return price * (1.0 + config_.slippage_bps / 10000.0);
    }

    double CostModel::slipSell(double price) const {
        return price * (1.0 - config_.slippage_bps / 10000.0);
    }

} // namespace backtester
