#include "market_filters.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>

namespace strategy_engine {

MarketFilters::MarketFilters(const data::PriceStore& store, const core::FilterConfig& config)
    : store_(store), config_(config) {}

bool MarketFilters::isMarketFavorable(const core::Timestamp& date) const {
    auto logger = core::logging::getLogger();
    try {
        const data::PriceSeries& index = store_.series(store_.indexSymbol());
        size_t idx = index.requireIndex(date);
        double fast = index.indicatorValue(data::IndicatorKind::EmaFast, idx);
        double slow = index.indicatorValue(data::IndicatorKind::EmaSlow, idx);
        bool favorable = fast > slow;
        logger->trace("Market filter {}: EMA fast {:.4f} vs slow {:.4f} -> {}",
                      core::utils::dateToString(date), fast, slow, favorable ? "risk-on" : "risk-off");
        return favorable;
    } catch (const core::DataGapException& e) {
        logger->debug("Market filter unfavorable on {}: {}", core::utils::dateToString(date), e.what());
    } catch (const core::InsufficientHistoryException& e) {
        logger->trace("Market filter unfavorable on {}: {}", core::utils::dateToString(date), e.what());
    }
    return false;
}

bool MarketFilters::isSectorFavorable(const std::string& ticker, const core::Timestamp& date) const {
    auto logger = core::logging::getLogger();
    auto sector = store_.sectorOf(ticker);
    if (!sector) {
        logger->trace("Sector filter: {} has no configured sector ETF.", ticker);
        return false;
    }
    if (!store_.hasSeries(*sector)) {
        logger->trace("Sector filter: sector ETF {} for {} is not loaded.", *sector, ticker);
        return false;
    }

    try {
        const data::RelativeStrengthSeries& rs =
            store_.relativeStrength(*sector, store_.indexSymbol(), config_.sector_rs_ema_period);
        auto idx = rs.indexOf(date);
        if (!idx) {
            throw core::DataGapException("No sector/index ratio for " + *sector + " on " + core::utils::dateToString(date));
        }
        size_t window = static_cast<size_t>(config_.sector_trend_window);
        if (*idx < window) {
            throw core::InsufficientHistoryException("Sector trend window reaches before the first ratio point.");
        }
        double current = rs.ratio_ema[*idx];
        double previous = rs.ratio_ema[*idx - window];
        if (std::isnan(current) || std::isnan(previous)) {
            throw core::InsufficientHistoryException("Sector ratio EMA still warming up for " + *sector + ".");
        }
        return current > previous;
    } catch (const core::DataGapException& e) {
        logger->debug("Sector filter unfavorable for {} on {}: {}", ticker, core::utils::dateToString(date), e.what());
    } catch (const core::InsufficientHistoryException& e) {
        logger->trace("Sector filter unfavorable for {} on {}: {}", ticker, core::utils::dateToString(date), e.what());
    }
    return false;
}

} // namespace strategy_engine
