#pragma once

#include <string>
#include <vector>
#include <memory>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

// SQLite cache of raw daily bars, keyed by (ticker, date)
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Owns a raw sqlite3 handle
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    // Logs and returns false on failure
    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction
    bool saveCandles(const core::TimeSeries<core::Candle>& candles, const std::string& ticker);

    // Bars with start_time <= date <= end_time, ascending
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& ticker,
        core::Timestamp start_time,
        core::Timestamp end_time);

    // Number of cached bars for 'ticker', -1 on error
    long long countCandles(const std::string& ticker);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
