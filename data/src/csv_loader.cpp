#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <set>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace data {
namespace csv {

namespace {

struct ColumnIndex {
    int date = -1;
    int open = -1;
    int high = -1;
    int low = -1;
    int close = -1;
    int volume = -1;
};

int findColumn(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (core::utils::toLower(header[i]) == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<std::string> readHeader(std::istream& input, const std::string& source_name) {
    std::string line;
    while (std::getline(input, line)) {
        if (!core::utils::trim(line).empty()) {
            return splitLine(line);
        }
    }
    throw core::DataLoadException(fmt::format("CSV '{}' is empty.", source_name));
}

std::ifstream openFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::DataLoadException(fmt::format("Cannot open CSV file '{}'.", path));
    }
    return file;
}

} // namespace

std::vector<std::string> splitLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::stringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(core::utils::trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

core::TimeSeries<core::Candle> parseStooqCsv(std::istream& input, const std::string& source_name) {
    auto logger = core::logging::getLogger();
    std::vector<std::string> header = readHeader(input, source_name);

    ColumnIndex col;
    col.date = findColumn(header, "date");
    if (col.date < 0) {
        col.date = findColumn(header, "data");
    }
    col.open = findColumn(header, "open");
    col.high = findColumn(header, "high");
    col.low = findColumn(header, "low");
    col.close = findColumn(header, "close");
    col.volume = findColumn(header, "volume");

    if (col.date < 0 || col.open < 0 || col.high < 0 || col.low < 0 || col.close < 0 || col.volume < 0) {
        throw core::DataLoadException(fmt::format(
            "CSV '{}' is missing one of the columns Date,Open,High,Low,Close,Volume.", source_name));
    }
    const int max_col = std::max({col.date, col.open, col.high, col.low, col.close, col.volume});

    core::TimeSeries<core::Candle> candles;
    std::string line;
    size_t line_no = 1;
    size_t skipped = 0;
    while (std::getline(input, line)) {
        ++line_no;
        if (core::utils::trim(line).empty()) {
            continue;
        }
        std::vector<std::string> fields = splitLine(line);
        if (static_cast<int>(fields.size()) <= max_col) {
            logger->debug("{}:{}: expected at least {} fields, got {}. Skipping row.",
                          source_name, line_no, max_col + 1, fields.size());
            ++skipped;
            continue;
        }
        try {
            core::Candle candle;
            candle.timestamp = core::utils::stringToDate(fields[col.date]);
            candle.open = std::stod(fields[col.open]);
            candle.high = std::stod(fields[col.high]);
            candle.low = std::stod(fields[col.low]);
            candle.close = std::stod(fields[col.close]);
            candle.volume = static_cast<long long>(std::llround(std::stod(fields[col.volume])));
            if (!std::isfinite(candle.open) || !std::isfinite(candle.close) || candle.close <= 0.0) {
                ++skipped;
                continue;
            }
            if (!std::isfinite(candle.high) || !std::isfinite(candle.low) || candle.high < candle.low) {
                logger->debug("{}:{}: invalid high/low range in row '{}'. Skipping row.", source_name, line_no, line);
                ++skipped;
                continue;
            }
            candles.push_back(candle);
        } catch (const std::exception& e) {
            logger->debug("{}:{}: cannot parse row '{}': {}", source_name, line_no, line, e.what());
            ++skipped;
        }
    }

    std::stable_sort(candles.begin(), candles.end());
    auto last = std::unique(candles.begin(), candles.end(),
        [](const core::Candle& a, const core::Candle& b) { return a.timestamp == b.timestamp; });
    candles.erase(last, candles.end());

    if (skipped > 0) {
        logger->warn("Skipped {} unparsable rows in '{}'.", skipped, source_name);
    }
    logger->debug("Parsed {} bars from '{}'.", candles.size(), source_name);
    return candles;
}

core::TimeSeries<core::Candle> parseStooqCsvText(const std::string& text, const std::string& source_name) {
    std::istringstream input(text);
    return parseStooqCsv(input, source_name);
}

core::TimeSeries<core::Candle> loadStooqCsvFile(const std::string& path) {
    std::ifstream file = openFile(path);
    return parseStooqCsv(file, path);
}

std::vector<std::string> readTickerList(const std::string& path) {
    std::ifstream file = openFile(path);
    std::vector<std::string> header = readHeader(file, path);
    int ticker_col = findColumn(header, "ticker");
    if (ticker_col < 0) {
        throw core::DataLoadException(fmt::format("'{}' must have a 'ticker' column.", path));
    }

    std::set<std::string> tickers;
    std::string line;
    while (std::getline(file, line)) {
        std::vector<std::string> fields = splitLine(line);
        if (static_cast<int>(fields.size()) <= ticker_col) {
            continue;
        }
        std::string ticker = core::utils::toUpper(fields[ticker_col]);
        if (!ticker.empty()) {
            tickers.insert(ticker);
        }
    }
    return std::vector<std::string>(tickers.begin(), tickers.end());
}

std::map<std::string, std::string> readTickerSectorMap(const std::string& path) {
    std::ifstream file = openFile(path);
    std::vector<std::string> header = readHeader(file, path);
    int ticker_col = findColumn(header, "ticker");
    int sector_col = findColumn(header, "sector_etf");
    if (ticker_col < 0 || sector_col < 0) {
        throw core::DataLoadException(fmt::format("'{}' must have columns: ticker,sector_etf", path));
    }

    std::map<std::string, std::string> mapping;
    std::string line;
    while (std::getline(file, line)) {
        std::vector<std::string> fields = splitLine(line);
        if (static_cast<int>(fields.size()) <= std::max(ticker_col, sector_col)) {
            continue;
        }
        std::string ticker = core::utils::toUpper(fields[ticker_col]);
        std::string sector = core::utils::toUpper(fields[sector_col]);
        if (!ticker.empty() && !sector.empty()) {
            mapping[ticker] = sector;
        }
    }
    return mapping;
}

} // namespace csv
} // namespace data
