#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <mutex>

namespace data {

enum class IndicatorKind {
    EmaFast,
    EmaSlow,
    EmaTrigger,
    Atr,
    Performance,     // Trailing rate of change over performance_lookback bars
    AvgDollarVolume  // SMA of close * volume over liquidity_window bars
};

std::string indicatorKindToString(IndicatorKind kind);

// Indicator values aligned to the series' bars. Warm-up points are NaN.
struct IndicatorSet {
    core::TimeSeries<double> ema_fast;
    core::TimeSeries<double> ema_slow;
    core::TimeSeries<double> ema_trigger;
    core::TimeSeries<double> atr;
    core::TimeSeries<double> performance;
    core::TimeSeries<double> avg_dollar_volume;

    const core::TimeSeries<double>& get(IndicatorKind kind) const;
};

// Ordered daily bars of one ticker plus its lazily computed indicators.
// Const access is safe from several threads once loading is done.
class PriceSeries {
public:
    PriceSeries(std::string ticker, core::IndicatorSettings settings);

    const std::string& ticker() const { return ticker_; }

    // Dates must be strictly increasing. Invalidates the indicator cache.
    void append(const core::Candle& candle);

    size_t size() const { return candles_.size(); }
    bool empty() const { return candles_.empty(); }
    const core::TimeSeries<core::Candle>& candles() const { return candles_; }

    std::optional<size_t> indexOf(const core::Timestamp& date) const;

    // Throws DataGapException when there is no bar on 'date'
    size_t requireIndex(const core::Timestamp& date) const;
    const core::Candle& barAt(const core::Timestamp& date) const;

    // Computed on first access, then memoized until the next append
    const IndicatorSet& indicators() const;

    // Throws InsufficientHistoryException if the value is still warming up
    double indicatorValue(IndicatorKind kind, size_t index) const;

private:
    struct IndicatorCache {
        std::mutex mutex;
        std::unique_ptr<IndicatorSet> values;
    };

    std::unique_ptr<IndicatorSet> computeIndicators() const;

    std::string ticker_;
    core::IndicatorSettings settings_;
    core::TimeSeries<core::Candle> candles_;
    // Held by pointer so the series stays movable
    std::unique_ptr<IndicatorCache> indicator_cache_;
};

} // namespace data
