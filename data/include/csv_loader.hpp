#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>
#include <map>
#include <istream>

namespace data {
namespace csv {

    // Stooq daily CSV: Date,Open,High,Low,Close,Volume ("Data" accepted for the date column).
    // Rows that fail to parse are logged and skipped. Result is sorted by date, duplicates dropped.
    core::TimeSeries<core::Candle> parseStooqCsv(std::istream& input, const std::string& source_name);
    core::TimeSeries<core::Candle> parseStooqCsvText(const std::string& text, const std::string& source_name);

    // Throws DataLoadException if the file cannot be opened
    core::TimeSeries<core::Candle> loadStooqCsvFile(const std::string& path);

    // Single 'ticker' column; trimmed, upper-cased, de-duplicated and sorted
    std::vector<std::string> readTickerList(const std::string& path);

    // Columns 'ticker,sector_etf'
    std::map<std::string, std::string> readTickerSectorMap(const std::string& path);

    // Splits one CSV line on commas, trimming each field
    std::vector<std::string> splitLine(const std::string& line);

} // namespace csv
} // namespace data
