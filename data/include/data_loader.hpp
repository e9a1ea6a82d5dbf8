#pragma once

#include "price_store.hpp"
#include "database_manager.hpp"
#include "stooq_client.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace data {

struct LoadSummary {
    size_t sectors_loaded = 0;
    size_t stocks_loaded = 0;
    std::vector<std::string> failed_symbols;
};

// Builds the PriceStore for a run: universe files, then bars from
// SQLite cache -> data_dir/<TICKER>.csv -> Stooq (if enabled).
class DataLoader {
public:
    explicit DataLoader(const core::BacktestConfig& config);

    // Throws DataLoadException if the index symbol cannot be loaded
    PriceStore load();

    // Bars of one symbol within [start, end]. Throws DataLoadException when no source has it.
    core::TimeSeries<core::Candle> loadSymbol(const std::string& ticker,
                                              core::Timestamp start,
                                              core::Timestamp end);

    const LoadSummary& summary() const { return summary_; }

    // [end_date - days, end_date], end_date defaulting to today (UTC)
    static std::pair<core::Timestamp, core::Timestamp> resolveWindow(const core::BacktestConfig& config);

private:
    core::TimeSeries<core::Candle> readFromCache(const std::string& ticker, core::Timestamp start, core::Timestamp end);
    void writeToCache(const std::string& ticker, const core::TimeSeries<core::Candle>& candles);

    const core::BacktestConfig& config_;
    std::unique_ptr<DatabaseManager> cache_;
    std::unique_ptr<StooqClient> remote_;
    LoadSummary summary_;
};

// Keep only bars whose date is on the calendar
core::TimeSeries<core::Candle> alignToCalendar(const core::TimeSeries<core::Candle>& candles,
                                               const std::vector<core::Timestamp>& calendar);

} // namespace data
