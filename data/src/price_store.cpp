#include "price_store.hpp"
#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace data {

std::optional<size_t> RelativeStrengthSeries::indexOf(const core::Timestamp& date) const {
    auto it = std::lower_bound(dates.begin(), dates.end(), date);
    if (it == dates.end() || *it != date) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(dates.begin(), it));
}

PriceStore::PriceStore(std::string index_symbol, core::IndicatorSettings settings)
    : index_symbol_(std::move(index_symbol)),
      settings_(settings),
      rs_cache_(std::make_unique<RelativeStrengthCache>()) {}

void PriceStore::addSeries(const std::string& ticker,
                           const core::TimeSeries<core::Candle>& candles,
                           SeriesRole role) {
    PriceSeries series(ticker, settings_);
    for (const auto& candle : candles) {
        series.append(candle);
    }

    series_.erase(ticker);
    series_.emplace(ticker, std::move(series));
    roles_[ticker].insert(role);
    invalidateRelativeStrength(ticker);

    if (ticker == index_symbol_) {
        rebuildCalendar();
    }
    core::logging::getLogger()->debug("PriceStore: added {} bars for {}.", candles.size(), ticker);
}

void PriceStore::appendBar(const std::string& ticker, const core::Candle& candle) {
    auto it = series_.find(ticker);
    if (it == series_.end()) {
        throw core::DataLoadException(fmt::format("Cannot append bar: no series loaded for {}.", ticker));
    }
    it->second.append(candle);
    invalidateRelativeStrength(ticker);
    if (ticker == index_symbol_) {
        calendar_.push_back(candle.timestamp);
    }
}

void PriceStore::setSectorMap(std::map<std::string, std::string> sector_map) {
    sector_map_ = std::move(sector_map);
}

std::optional<std::string> PriceStore::sectorOf(const std::string& ticker) const {
    auto it = sector_map_.find(ticker);
    if (it == sector_map_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> PriceStore::universe() const {
    std::vector<std::string> tickers;
    for (const auto& [ticker, roles] : roles_) {
        if (roles.count(SeriesRole::Stock) > 0) {
            tickers.push_back(ticker);
        }
    }
    // std::map iteration is already sorted
    return tickers;
}

bool PriceStore::hasSeries(const std::string& ticker) const {
    return series_.count(ticker) > 0;
}

const PriceSeries& PriceStore::series(const std::string& ticker) const {
    auto it = series_.find(ticker);
    if (it == series_.end()) {
        throw core::DataGapException(fmt::format("No price series loaded for {}.", ticker));
    }
    return it->second;
}

const RelativeStrengthSeries& PriceStore::relativeStrength(const std::string& numerator,
                                                           const std::string& denominator,
                                                           int ema_period) const {
    RsKey key{numerator, denominator, ema_period};
    std::lock_guard<std::mutex> lock(rs_cache_->mutex);
    auto cached = rs_cache_->entries.find(key);
    if (cached != rs_cache_->entries.end()) {
        return cached->second;
    }

    const PriceSeries& num = series(numerator);
    const PriceSeries& den = series(denominator);

    RelativeStrengthSeries rs;
    for (const auto& candle : num.candles()) {
        auto den_idx = den.indexOf(candle.timestamp);
        if (!den_idx) {
            continue;
        }
        double den_close = den.candles()[*den_idx].close;
        if (den_close <= 0.0) {
            continue;
        }
        rs.dates.push_back(candle.timestamp);
        rs.ratio.push_back(candle.close / den_close);
    }

    indicators::EmaIndicator ema(ema_period);
    ema.calculateValues(rs.ratio);
    rs.ratio_ema = indicators::alignToInput(ema.getResult(), ema.getLookback(), rs.ratio.size());

    core::logging::getLogger()->trace("Relative strength {}/{} computed over {} common dates.",
                                      numerator, denominator, rs.dates.size());
    auto inserted = rs_cache_->entries.emplace(std::move(key), std::move(rs));
    return inserted.first->second;
}

void PriceStore::invalidateRelativeStrength(const std::string& ticker) {
    std::lock_guard<std::mutex> lock(rs_cache_->mutex);
    auto& entries = rs_cache_->entries;
    for (auto it = entries.begin(); it != entries.end();) {
        if (std::get<0>(it->first) == ticker || std::get<1>(it->first) == ticker) {
            it = entries.erase(it);
        } else {
            ++it;
        }
    }
}

void PriceStore::rebuildCalendar() {
    calendar_.clear();
    auto it = series_.find(index_symbol_);
    if (it == series_.end()) {
        return;
    }
    calendar_.reserve(it->second.size());
    for (const auto& candle : it->second.candles()) {
        calendar_.push_back(candle.timestamp);
    }
}

} // namespace data
