#pragma once

#include "price_store.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include <string>

namespace strategy_engine {

    // Market and sector gates for new entries.
    // Both answer "unfavorable" instead of throwing when data is missing.
    class MarketFilters {
    public:
        MarketFilters(const data::PriceStore& store, const core::FilterConfig& config);

        // Index EMA fast > EMA slow on 'date' (equality is unfavorable)
        bool isMarketFavorable(const core::Timestamp& date) const;

        // EMA of (sector ETF close / index close) on 'date' is above its value
        // sector_trend_window relative-strength points earlier
        bool isSectorFavorable(const std::string& ticker, const core::Timestamp& date) const;

    private:
        const data::PriceStore& store_;
        core::FilterConfig config_;
    };

} // namespace strategy_engine
