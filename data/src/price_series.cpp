#include "price_series.hpp"
#include "ema_indicator.hpp"
#include "atr_indicator.hpp"
#include "rocp_indicator.hpp"
#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace data {

namespace {

core::TimeSeries<double> computeAligned(indicators::IIndicator& indicator,
                                        const core::TimeSeries<core::Candle>& candles) {
    indicator.calculate(candles);
    return indicators::alignToInput(indicator.getResult(), indicator.getLookback(), candles.size());
}

} // namespace

std::string indicatorKindToString(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::EmaFast:         return "EMA_FAST";
        case IndicatorKind::EmaSlow:         return "EMA_SLOW";
        case IndicatorKind::EmaTrigger:      return "EMA_TRIGGER";
        case IndicatorKind::Atr:             return "ATR";
        case IndicatorKind::Performance:     return "PERFORMANCE";
        case IndicatorKind::AvgDollarVolume: return "AVG_DOLLAR_VOLUME";
    }
    return "UNKNOWN";
}

const core::TimeSeries<double>& IndicatorSet::get(IndicatorKind kind) const {
    switch (kind) {
        case IndicatorKind::EmaFast:         return ema_fast;
        case IndicatorKind::EmaSlow:         return ema_slow;
        case IndicatorKind::EmaTrigger:      return ema_trigger;
        case IndicatorKind::Atr:             return atr;
        case IndicatorKind::Performance:     return performance;
        case IndicatorKind::AvgDollarVolume: return avg_dollar_volume;
    }
    throw core::BacktestException("Unknown indicator kind requested from IndicatorSet.");
}

PriceSeries::PriceSeries(std::string ticker, core::IndicatorSettings settings)
    : ticker_(std::move(ticker)), settings_(settings), indicator_cache_(std::make_unique<IndicatorCache>()) {}

void PriceSeries::append(const core::Candle& candle) {
    if (!candles_.empty() && !(candles_.back().timestamp < candle.timestamp)) {
        throw core::DataLoadException(fmt::format(
            "Bar for {} on {} is not after the last bar ({}).",
            ticker_, core::utils::dateToString(candle.timestamp),
            core::utils::dateToString(candles_.back().timestamp)));
    }
    candles_.push_back(candle);
    std::lock_guard<std::mutex> lock(indicator_cache_->mutex);
    indicator_cache_->values.reset();
}

std::optional<size_t> PriceSeries::indexOf(const core::Timestamp& date) const {
    auto it = std::lower_bound(candles_.begin(), candles_.end(), date,
        [](const core::Candle& c, const core::Timestamp& ts) { return c.timestamp < ts; });
    if (it == candles_.end() || it->timestamp != date) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(candles_.begin(), it));
}

size_t PriceSeries::requireIndex(const core::Timestamp& date) const {
    auto idx = indexOf(date);
    if (!idx) {
        throw core::DataGapException(fmt::format("No bar for {} on {}.", ticker_, core::utils::dateToString(date)));
    }
    return *idx;
}

const core::Candle& PriceSeries::barAt(const core::Timestamp& date) const {
    return candles_[requireIndex(date)];
}

const IndicatorSet& PriceSeries::indicators() const {
    std::lock_guard<std::mutex> lock(indicator_cache_->mutex);
    if (!indicator_cache_->values) {
        indicator_cache_->values = computeIndicators();
    }
    return *indicator_cache_->values;
}

double PriceSeries::indicatorValue(IndicatorKind kind, size_t index) const {
    const auto& values = indicators().get(kind);
    if (index >= values.size() || std::isnan(values[index])) {
        throw core::InsufficientHistoryException(fmt::format(
            "{} for {} not available at bar {} ({} bars loaded).",
            indicatorKindToString(kind), ticker_, index, candles_.size()));
    }
    return values[index];
}

std::unique_ptr<IndicatorSet> PriceSeries::computeIndicators() const {
    auto logger = core::logging::getLogger();
    auto set = std::make_unique<IndicatorSet>();

    indicators::EmaIndicator ema_fast(settings_.ema_fast_period);
    indicators::EmaIndicator ema_slow(settings_.ema_slow_period);
    indicators::EmaIndicator ema_trigger(settings_.ema_trigger_period);
    indicators::AtrIndicator atr(settings_.atr_period);
    indicators::RocpIndicator performance(settings_.performance_lookback);
    indicators::SmaIndicator dollar_volume(settings_.liquidity_window, indicators::SourceField::DollarVolume);

    set->ema_fast = computeAligned(ema_fast, candles_);
    set->ema_slow = computeAligned(ema_slow, candles_);
    set->ema_trigger = computeAligned(ema_trigger, candles_);
    set->atr = computeAligned(atr, candles_);
    set->performance = computeAligned(performance, candles_);
    set->avg_dollar_volume = computeAligned(dollar_volume, candles_);

    logger->trace("Computed indicator set for {} over {} bars.", ticker_, candles_.size());
    return set;
}

} // namespace data
