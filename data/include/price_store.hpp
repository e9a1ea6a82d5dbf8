#pragma once

#include "price_series.hpp"
#include "datatypes.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <tuple>
#include <optional>
#include <memory>
#include <mutex>

namespace data {

enum class SeriesRole {
    Index,
    Sector,
    Stock
};

// numerator close / denominator close on the dates both have bars
struct RelativeStrengthSeries {
    std::vector<core::Timestamp> dates;
    core::TimeSeries<double> ratio;
    core::TimeSeries<double> ratio_ema; // NaN during warm-up

    std::optional<size_t> indexOf(const core::Timestamp& date) const;
};

// Store of every series used by a run. After loading it is read-only and may be
// shared by runs on different threads.
class PriceStore {
public:
    PriceStore(std::string index_symbol, core::IndicatorSettings settings);

    // Replaces any existing bars for 'ticker'. A ticker may hold several roles.
    void addSeries(const std::string& ticker, const core::TimeSeries<core::Candle>& candles, SeriesRole role);
    void appendBar(const std::string& ticker, const core::Candle& candle);

    // ticker -> sector ETF
    void setSectorMap(std::map<std::string, std::string> sector_map);
    std::optional<std::string> sectorOf(const std::string& ticker) const;

    // Master calendar: the index symbol's trading dates
    const std::vector<core::Timestamp>& calendar() const { return calendar_; }

    // Sorted stock tickers
    std::vector<std::string> universe() const;

    bool hasSeries(const std::string& ticker) const;
    const PriceSeries& series(const std::string& ticker) const;

    const std::string& indexSymbol() const { return index_symbol_; }
    const core::IndicatorSettings& settings() const { return settings_; }

    // Memoized per (numerator, denominator, ema_period)
    const RelativeStrengthSeries& relativeStrength(const std::string& numerator,
                                                   const std::string& denominator,
                                                   int ema_period) const;

private:
    void invalidateRelativeStrength(const std::string& ticker);
    void rebuildCalendar();

    std::string index_symbol_;
    core::IndicatorSettings settings_;
    std::map<std::string, PriceSeries> series_;
    std::map<std::string, std::set<SeriesRole>> roles_;
    std::map<std::string, std::string> sector_map_;
    std::vector<core::Timestamp> calendar_;

    using RsKey = std::tuple<std::string, std::string, int>;
    struct RelativeStrengthCache {
        std::mutex mutex;
        std::map<RsKey, RelativeStrengthSeries> entries;
    };
    std::unique_ptr<RelativeStrengthCache> rs_cache_;
};

} // namespace data
