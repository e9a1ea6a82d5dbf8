#include "data_loader.hpp"
#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <filesystem>
#include <set>
#include <map>
#include <spdlog/fmt/fmt.h>

namespace data {

namespace {

// Cached series ending this close to the window edge count as complete (weekends, holidays)
constexpr long long kCacheEdgeToleranceDays = 5;

core::TimeSeries<core::Candle> clipToWindow(const core::TimeSeries<core::Candle>& candles,
                                            core::Timestamp start, core::Timestamp end) {
    core::TimeSeries<core::Candle> clipped;
    for (const auto& candle : candles) {
        if (candle.timestamp >= start && candle.timestamp <= end) {
            clipped.push_back(candle);
        }
    }
    return clipped;
}

} // namespace

core::TimeSeries<core::Candle> alignToCalendar(const core::TimeSeries<core::Candle>& candles,
                                               const std::vector<core::Timestamp>& calendar) {
    core::TimeSeries<core::Candle> aligned;
    aligned.reserve(candles.size());
    for (const auto& candle : candles) {
        if (std::binary_search(calendar.begin(), calendar.end(), candle.timestamp)) {
            aligned.push_back(candle);
        }
    }
    return aligned;
}

DataLoader::DataLoader(const core::BacktestConfig& config) : config_(config) {
    auto logger = core::logging::getLogger();
    if (!config_.data.cache_db_path.empty()) {
        std::filesystem::path db_path(config_.data.cache_db_path);
        std::error_code ec;
        if (db_path.has_parent_path()) {
            std::filesystem::create_directories(db_path.parent_path(), ec);
            if (ec) {
                logger->warn("Cannot create directory for price cache '{}': {}", config_.data.cache_db_path, ec.message());
            }
        }
        auto cache = std::make_unique<DatabaseManager>(config_.data.cache_db_path);
        if (cache->connect() && cache->initializeSchema()) {
            cache_ = std::move(cache);
        } else {
            logger->warn("Price cache '{}' unavailable, continuing without it.", config_.data.cache_db_path);
        }
    }
    if (config_.data.use_remote) {
        remote_ = std::make_unique<StooqClient>();
    }
}

std::pair<core::Timestamp, core::Timestamp> DataLoader::resolveWindow(const core::BacktestConfig& config) {
    core::Timestamp end;
    if (config.end_date.empty()) {
        end = core::utils::todayUtc();
    } else {
        try {
            end = core::utils::stringToDate(config.end_date);
        } catch (const std::runtime_error& e) {
            throw core::ConfigException(fmt::format("Invalid end_date '{}': {}", config.end_date, e.what()));
        }
    }
    return {core::utils::addDays(end, -config.days), end};
}

core::TimeSeries<core::Candle> DataLoader::readFromCache(const std::string& ticker,
                                                         core::Timestamp start, core::Timestamp end) {
    if (!cache_) {
        return {};
    }
    auto candles = cache_->queryCandles(ticker, start, end);
    if (candles.empty()) {
        return {};
    }
    bool covers_start = core::utils::daysBetween(start, candles.front().timestamp) <= kCacheEdgeToleranceDays;
    bool covers_end = core::utils::daysBetween(candles.back().timestamp, end) <= kCacheEdgeToleranceDays;
    if (!covers_start || !covers_end) {
        core::logging::getLogger()->debug("Cached bars for {} do not cover the window, refreshing.", ticker);
        return {};
    }
    return candles;
}

void DataLoader::writeToCache(const std::string& ticker, const core::TimeSeries<core::Candle>& candles) {
    if (!cache_) {
        return;
    }
    if (!cache_->saveCandles(candles, ticker)) {
        core::logging::getLogger()->warn("Failed to cache bars for {}.", ticker);
    }
}

core::TimeSeries<core::Candle> DataLoader::loadSymbol(const std::string& ticker,
                                                      core::Timestamp start,
                                                      core::Timestamp end) {
    auto logger = core::logging::getLogger();

    auto cached = readFromCache(ticker, start, end);
    if (!cached.empty()) {
        logger->debug("Loaded {} bars for {} from cache.", cached.size(), ticker);
        return cached;
    }

    core::TimeSeries<core::Candle> candles;
    std::string source;
    if (!config_.data.data_dir.empty()) {
        std::filesystem::path csv_path = std::filesystem::path(config_.data.data_dir) / (ticker + ".csv");
        if (std::filesystem::exists(csv_path)) {
            candles = csv::loadStooqCsvFile(csv_path.string());
            source = csv_path.string();
        }
    }
    if (candles.empty() && remote_) {
        try {
            candles = remote_->fetchDaily(ticker);
            source = "stooq";
        } catch (const core::ApiRequestException& e) {
            throw core::DataLoadException(fmt::format("{}: {}", ticker, e.what()));
        }
    }
    if (candles.empty()) {
        throw core::DataLoadException(fmt::format("No bars found for {} in any source.", ticker));
    }

    writeToCache(ticker, candles);
    auto clipped = clipToWindow(candles, start, end);
    logger->debug("Loaded {} bars for {} from {} ({} in window).", candles.size(), ticker, source, clipped.size());
    return clipped;
}

PriceStore DataLoader::load() {
    auto logger = core::logging::getLogger();
    summary_ = LoadSummary{};

    const auto window = resolveWindow(config_);
    const core::Timestamp start = window.first;
    const core::Timestamp end = window.second;
    logger->info("Loading data for window {} .. {}", core::utils::dateToString(start), core::utils::dateToString(end));

    std::vector<std::string> stocks = csv::readTickerList(config_.data.tickers_file);
    std::vector<std::string> sector_etfs = csv::readTickerList(config_.data.sector_etfs_file);
    std::map<std::string, std::string> sector_map = csv::readTickerSectorMap(config_.data.ticker_sector_file);

    const std::string& index_symbol = config_.index_symbol;
    if (std::find(sector_etfs.begin(), sector_etfs.end(), index_symbol) == sector_etfs.end()) {
        logger->warn("{} does not list the index symbol {}. Loading it anyway.",
                     config_.data.sector_etfs_file, index_symbol);
    }

    PriceStore store(index_symbol, config_.indicators);

    // --- Index: defines the master calendar ---
    core::TimeSeries<core::Candle> index_bars;
    try {
        index_bars = loadSymbol(index_symbol, start, end);
    } catch (const core::DataLoadException& e) {
        throw core::DataLoadException(fmt::format("Failed to load index symbol {}: {}", index_symbol, e.what()));
    }
    if (index_bars.empty()) {
        throw core::DataLoadException(fmt::format("Index symbol {} has no bars in the backtest window.", index_symbol));
    }
    store.addSeries(index_symbol, index_bars, SeriesRole::Index);
    const std::vector<core::Timestamp> calendar = store.calendar();
    logger->info("Loaded index {} rows={}", index_symbol, calendar.size());

    std::map<std::string, core::TimeSeries<core::Candle>> loaded;
    auto loadAligned = [&](const std::string& ticker) -> const core::TimeSeries<core::Candle>* {
        auto it = loaded.find(ticker);
        if (it != loaded.end()) {
            return &it->second;
        }
        try {
            auto bars = alignToCalendar(loadSymbol(ticker, start, end), calendar);
            return &loaded.emplace(ticker, std::move(bars)).first->second;
        } catch (const core::DataLoadException& e) {
            logger->warn("Skipping {}: {}", ticker, e.what());
        } catch (const core::PoosException& e) {
            logger->warn("Skipping {} after unexpected error: {}", ticker, e.what());
        }
        summary_.failed_symbols.push_back(ticker);
        return nullptr;
    };

    // --- Sector ETFs ---
    for (const auto& etf : sector_etfs) {
        if (etf == index_symbol) {
            continue;
        }
        if (const auto* bars = loadAligned(etf)) {
            store.addSeries(etf, *bars, SeriesRole::Sector);
            ++summary_.sectors_loaded;
            logger->info("Loaded ETF {} rows={}", etf, bars->size());
        }
    }

    // --- Stocks ---
    for (const auto& ticker : stocks) {
        if (ticker == index_symbol) {
            store.addSeries(ticker, index_bars, SeriesRole::Stock);
            ++summary_.stocks_loaded;
            continue;
        }
        if (const auto* bars = loadAligned(ticker)) {
            if (bars->empty()) {
                logger->warn("Stock {} has no bars on the trading calendar, skipping.", ticker);
                continue;
            }
            store.addSeries(ticker, *bars, SeriesRole::Stock);
            ++summary_.stocks_loaded;
        }
    }

    store.setSectorMap(std::move(sector_map));
    logger->info("Data loaded: {} sector ETFs, {} stocks, {} failed.",
                 summary_.sectors_loaded, summary_.stocks_loaded, summary_.failed_symbols.size());
    return store;
}

} // namespace data
