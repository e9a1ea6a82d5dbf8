#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For dateToString/stringToDate
#include <vector>
#include <stdexcept>

namespace data
{

    namespace
    {
        const char *kCreateBarsSql = R"(
            CREATE TABLE IF NOT EXISTS daily_bars (
                ticker TEXT NOT NULL,
                date TEXT NOT NULL, -- YYYY-MM-DD, sorts correctly as TEXT
                open REAL,
                high REAL,
                low REAL,
                close REAL,
                volume INTEGER,
                PRIMARY KEY (ticker, date)
            );
        )";

        const char *kSelectBarsSql = R"(
            SELECT date, open, high, low, close, volume
            FROM daily_bars
            WHERE ticker = ? AND date >= ? AND date <= ?
            ORDER BY date ASC;
        )";

        const char *kInsertBarSql = R"(
            INSERT OR IGNORE INTO daily_bars (ticker, date, open, high, low, close, volume)
            VALUES (?, ?, ?, ?, ?, ?, ?);
        )";

        const char *kCountBarsSql = "SELECT COUNT(*) FROM daily_bars WHERE ticker = ?;";

        // Prepared statement finalized on scope exit
        class Statement
        {
        public:
            Statement(sqlite3 *db, const char *sql) : db_(db)
            {
                rc_ = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
                if (rc_ != SQLITE_OK)
                {
                    core::logging::getLogger()->error("Failed to prepare SQL statement [{}]: {}", rc_, sqlite3_errmsg(db_));
                }
            }

            ~Statement()
            {
                sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
            sqlite3_stmt *get() const { return stmt_; }

            // Text is copied, callers may pass temporaries
            void bind(int index, const std::string &value)
            {
                sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
            }
            void bind(int index, double value) { sqlite3_bind_double(stmt_, index, value); }
            void bind(int index, long long value) { sqlite3_bind_int64(stmt_, index, value); }

            int step() { return sqlite3_step(stmt_); }
            int reset() { return sqlite3_reset(stmt_); }
            const char *errorMessage() const { return sqlite3_errmsg(db_); }

        private:
            sqlite3 *db_;
            sqlite3_stmt *stmt_ = nullptr;
            int rc_ = SQLITE_ERROR;
        };

        // Rolls back unless commit() succeeded
        class Transaction
        {
        public:
            explicit Transaction(DatabaseManager &db) : db_(db)
            {
                active_ = db_.executeSQL("BEGIN TRANSACTION;");
            }

            ~Transaction()
            {
                if (active_ && !db_.executeSQL("ROLLBACK;"))
                {
                    core::logging::getLogger()->error("ROLLBACK failed on the price cache.");
                }
            }

            Transaction(const Transaction &) = delete;
            Transaction &operator=(const Transaction &) = delete;

            bool active() const { return active_; }

            bool commit()
            {
                if (!active_ || !db_.executeSQL("COMMIT;"))
                {
                    return false;
                }
                active_ = false;
                return true;
            }

        private:
            DatabaseManager &db_;
            bool active_ = false;
        };

    } // namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("Price cache created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Price cache {} is already open.", database_path_);
            return true;
        }

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open price cache '{}': {}", database_path_,
                          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // The handle is allocated even when open fails
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        logger->debug("Opened price cache {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        if (sqlite3_close(db_) != SQLITE_OK)
        {
            // SQLITE_BUSY means a statement was left unfinalized
            core::logging::getLogger()->error("Error closing price cache {}: {}", database_path_, sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot execute SQL: price cache is not open.");
            return false;
        }

        logger->trace("Executing SQL: {}", sql);
        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            logger->error("SQL error [{}]: {}", rc, error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!executeSQL(kCreateBarsSql))
        {
            core::logging::getLogger()->error("Price cache schema initialization failed for {}.", database_path_);
            return false;
        }
        return true;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string &ticker,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        core::TimeSeries<core::Candle> candles;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query cached bars for {}: price cache is not open.", ticker);
            return candles;
        }

        Statement stmt(db_, kSelectBarsSql);
        if (!stmt.ok())
        {
            return candles;
        }
        stmt.bind(1, ticker);
        stmt.bind(2, core::utils::dateToString(start_time));
        stmt.bind(3, core::utils::dateToString(end_time));

        int rc;
        int row = 0;
        while ((rc = stmt.step()) == SQLITE_ROW)
        {
            ++row;
            const unsigned char *date_text = sqlite3_column_text(stmt.get(), 0);
            if (!date_text)
            {
                logger->warn("NULL date in cached bars for {} (row {}), skipping row.", ticker, row);
                continue;
            }
            core::Candle candle;
            try
            {
                candle.timestamp = core::utils::stringToDate(reinterpret_cast<const char *>(date_text));
            }
            catch (const std::runtime_error &e)
            {
                logger->warn("Bad cached date for {} (row {}): {}", ticker, row, e.what());
                continue;
            }
            candle.open = sqlite3_column_double(stmt.get(), 1);
            candle.high = sqlite3_column_double(stmt.get(), 2);
            candle.low = sqlite3_column_double(stmt.get(), 3);
            candle.close = sqlite3_column_double(stmt.get(), 4);
            candle.volume = sqlite3_column_int64(stmt.get(), 5);
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Reading cached bars for {} failed [{}]: {}", ticker, rc, stmt.errorMessage());
        }
        else
        {
            logger->trace("{} cached bars for {}.", candles.size(), ticker);
        }
        return candles;
    }

    long long DatabaseManager::countCandles(const std::string &ticker)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot count cached bars for {}: price cache is not open.", ticker);
            return -1;
        }

        Statement stmt(db_, kCountBarsSql);
        if (!stmt.ok())
        {
            return -1;
        }
        stmt.bind(1, ticker);
        if (stmt.step() != SQLITE_ROW)
        {
            return -1;
        }
        return sqlite3_column_int64(stmt.get(), 0);
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &ticker)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot cache bars for {}: price cache is not open.", ticker);
            return false;
        }
        if (candles.empty())
        {
            return true;
        }

        // Declared before the statement so the statement is finalized before ROLLBACK
        Transaction transaction(*this);
        if (!transaction.active())
        {
            logger->error("Cannot begin transaction to cache bars for {}.", ticker);
            return false;
        }

        int inserted = 0;
        {
            Statement stmt(db_, kInsertBarSql);
            if (!stmt.ok())
            {
                return false;
            }
            for (const auto &candle : candles)
            {
                stmt.bind(1, ticker);
                stmt.bind(2, core::utils::dateToString(candle.timestamp));
                stmt.bind(3, candle.open);
                stmt.bind(4, candle.high);
                stmt.bind(5, candle.low);
                stmt.bind(6, candle.close);
                stmt.bind(7, candle.volume);

                int rc = stmt.step();
                if (rc != SQLITE_DONE)
                {
                    logger->error("Insert of {} bar {} failed [{}]: {}", ticker,
                                  core::utils::dateToString(candle.timestamp), rc, stmt.errorMessage());
                    return false;
                }
                inserted += sqlite3_changes(db_);
                if (stmt.reset() != SQLITE_OK)
                {
                    logger->error("Failed to reset insert statement: {}", stmt.errorMessage());
                    return false;
                }
            }
        }

        if (!transaction.commit())
        {
            logger->error("COMMIT of cached bars for {} failed.", ticker);
            return false;
        }
        logger->debug("Cached {} new bars for {} ({} duplicates ignored).",
                      inserted, ticker, candles.size() - static_cast<size_t>(inserted));
        return true;
    }

} // namespace data
