#include "config_factory.hpp"
#include "and_condition.hpp"
#include "field_condition.hpp"
#include "common_types.hpp"
#include "logging.hpp"            // Use short path
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <string>
#include <memory>

namespace strategy_engine {

    using json = nlohmann::json; // Alias

    namespace { // Use anonymous namespace for file-local helpers

        template <typename T>
        void readKey(const json& section, const char* section_name, const char* key, T& target) {
            if (!section.contains(key) || section[key].is_null()) {
                return;
            }
            try {
                target = section[key].get<T>();
            } catch (const json::exception& e) {
                throw core::ConfigException(fmt::format("Invalid value for {}.{}: {}", section_name, key, e.what()));
            }
        }

        const json& section(const json& config, const char* name) {
            static const json empty = json::object();
            if (!config.contains(name)) {
                return empty;
            }
            const json& s = config[name];
            if (!s.is_object()) {
                throw core::ConfigException(fmt::format("Config section '{}' must be an object.", name));
            }
            return s;
        }

        const char* getEnv(const char* name) {
            const char* value = std::getenv(name);
            return (value == nullptr || value[0] == '\0') ? nullptr : value;
        }

        void overrideDouble(const char* name, double& target) {
            const char* value = getEnv(name);
            if (!value) return;
            try {
                size_t pos = 0;
                double parsed = std::stod(value, &pos);
                if (pos != std::string(value).size()) {
                    throw std::invalid_argument("trailing characters");
                }
                target = parsed;
            } catch (const std::logic_error&) {
                throw core::ConfigException(fmt::format("Environment variable {}='{}' is not a number.", name, value));
            }
            core::logging::getLogger()->debug("Config override from environment: {}={}", name, value);
        }

        void overrideInt(const char* name, int& target) {
            const char* value = getEnv(name);
            if (!value) return;
            try {
                size_t pos = 0;
                int parsed = std::stoi(value, &pos);
                if (pos != std::string(value).size()) {
                    throw std::invalid_argument("trailing characters");
                }
                target = parsed;
            } catch (const std::logic_error&) {
                throw core::ConfigException(fmt::format("Environment variable {}='{}' is not an integer.", name, value));
            }
            core::logging::getLogger()->debug("Config override from environment: {}={}", name, value);
        }

        void overrideString(const char* name, std::string& target) {
            const char* value = getEnv(name);
            if (!value) return;
            target = value;
            core::logging::getLogger()->debug("Config override from environment: {}={}", name, value);
        }

        void overrideBool(const char* name, bool& target) {
            const char* value = getEnv(name);
            if (!value) return;
            std::string lower = core::utils::toLower(core::utils::trim(value));
            if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
                target = true;
            } else if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
                target = false;
            } else {
                throw core::ConfigException(fmt::format("Environment variable {}='{}' is not a boolean.", name, value));
            }
            core::logging::getLogger()->debug("Config override from environment: {}={}", name, value);
        }

    } // end anonymous namespace

    // --- Main Factory Method ---
    core::BacktestConfig ConfigFactory::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Config must be a JSON object.");
        }
        core::BacktestConfig cfg;

        const json& bt = section(config, "backtest");
        readKey(bt, "backtest", "start_cash", cfg.start_cash);
        readKey(bt, "backtest", "days", cfg.days);
        readKey(bt, "backtest", "end_date", cfg.end_date);
        readKey(bt, "backtest", "index_symbol", cfg.index_symbol);
        cfg.index_symbol = core::utils::toUpper(core::utils::trim(cfg.index_symbol));

        const json& ind = section(config, "indicators");
        readKey(ind, "indicators", "ema_fast_period", cfg.indicators.ema_fast_period);
        readKey(ind, "indicators", "ema_slow_period", cfg.indicators.ema_slow_period);
        readKey(ind, "indicators", "ema_trigger_period", cfg.indicators.ema_trigger_period);
        readKey(ind, "indicators", "atr_period", cfg.indicators.atr_period);
        readKey(ind, "indicators", "performance_lookback", cfg.indicators.performance_lookback);
        readKey(ind, "indicators", "liquidity_window", cfg.indicators.liquidity_window);

        const json& flt = section(config, "filters");
        readKey(flt, "filters", "sector_rs_ema_period", cfg.filters.sector_rs_ema_period);
        readKey(flt, "filters", "sector_trend_window", cfg.filters.sector_trend_window);

        const json& scr = section(config, "screen");
        readKey(scr, "screen", "price_max", cfg.screen.price_max);
        readKey(scr, "screen", "perf_min", cfg.screen.perf_min);
        readKey(scr, "screen", "min_dollar_volume", cfg.screen.min_dollar_volume);
        readKey(scr, "screen", "rs_window", cfg.screen.rs_window);
        readKey(scr, "screen", "max_new_orders_per_day", cfg.screen.max_new_orders_per_day);

        const json& risk = section(config, "risk");
        readKey(risk, "risk", "risk_per_trade", cfg.risk.risk_per_trade);
        readKey(risk, "risk", "max_position_pct", cfg.risk.max_position_pct);
        readKey(risk, "risk", "heat_cap", cfg.risk.heat_cap);
        readKey(risk, "risk", "breakeven_trigger", cfg.risk.breakeven_trigger);
        readKey(risk, "risk", "stop_atr_multiple", cfg.risk.stop_atr_multiple);
        readKey(risk, "risk", "fallback_stop_pct", cfg.risk.fallback_stop_pct);
        readKey(risk, "risk", "target_r_multiple", cfg.risk.target_r_multiple);

        const json& exec = section(config, "execution");
        readKey(exec, "execution", "gap_threshold_pct", cfg.execution.gap_threshold_pct);

        const json& costs = section(config, "costs");
        std::string commission_model;
        readKey(costs, "costs", "commission_model", commission_model);
        if (!commission_model.empty()) {
            cfg.costs.commission_type = core::commissionTypeFromString(commission_model);
        }
        readKey(costs, "costs", "commission_fixed", cfg.costs.commission_fixed);
        readKey(costs, "costs", "commission_per_share", cfg.costs.commission_per_share);
        readKey(costs, "costs", "commission_pct", cfg.costs.commission_pct);
        readKey(costs, "costs", "commission_min", cfg.costs.commission_min);
        readKey(costs, "costs", "slippage_bps", cfg.costs.slippage_bps);

        const json& data = section(config, "data");
        readKey(data, "data", "tickers_file", cfg.data.tickers_file);
        readKey(data, "data", "ticker_sector_file", cfg.data.ticker_sector_file);
        readKey(data, "data", "sector_etfs_file", cfg.data.sector_etfs_file);
        readKey(data, "data", "data_dir", cfg.data.data_dir);
        readKey(data, "data", "cache_db_path", cfg.data.cache_db_path);
        readKey(data, "data", "use_remote", cfg.data.use_remote);

        const json& out = section(config, "output");
        readKey(out, "output", "output_dir", cfg.output.output_dir);
        readKey(out, "output", "write_reports", cfg.output.write_reports);

        const json& log = section(config, "logging");
        readKey(log, "logging", "console_level", cfg.logging.console_level);
        readKey(log, "logging", "file_level", cfg.logging.file_level);

        return cfg;
    }

    core::BacktestConfig ConfigFactory::loadFile(const std::string& path) {
        auto logger = core::logging::getLogger();
        std::ifstream config_file(path);
        if (!config_file.is_open()) {
            throw core::ConfigException("Cannot open config file: " + path);
        }

        json config_json;
        try {
            config_file >> config_json;
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
        logger->info("Loaded configuration from {}", path);
        return fromJson(config_json);
    }

    void ConfigFactory::applyEnvironmentOverrides(core::BacktestConfig& config) {
        overrideInt("BT_DAYS", config.days);
        overrideString("BT_END_DATE", config.end_date);
        overrideDouble("BT_START_CASH", config.start_cash);

        overrideDouble("BT_RISK_PER_TRADE", config.risk.risk_per_trade);
        overrideDouble("BT_MAX_POSITION_PCT", config.risk.max_position_pct);
        overrideDouble("BT_HEAT_CAP", config.risk.heat_cap);
        overrideDouble("BT_BREAKEVEN_TRIGGER", config.risk.breakeven_trigger);
        overrideDouble("BT_GAP_THRESHOLD", config.execution.gap_threshold_pct);

        overrideDouble("BT_SLIPPAGE_BPS", config.costs.slippage_bps);
        std::string commission_model;
        overrideString("BT_COMMISSION_MODEL", commission_model);
        if (!commission_model.empty()) {
            config.costs.commission_type = core::commissionTypeFromString(commission_model);
        }
        overrideDouble("BT_COMMISSION_PER_SHARE", config.costs.commission_per_share);
        overrideDouble("BT_COMMISSION_MIN", config.costs.commission_min);

        overrideDouble("BT_MIN_DOLLAR_VOLUME", config.screen.min_dollar_volume);
        overrideDouble("BT_PRICE_MAX", config.screen.price_max);
        overrideDouble("BT_PERF_3M_MIN", config.screen.perf_min);

        overrideString("BT_TICKERS_FILE", config.data.tickers_file);
        overrideString("BT_TICKER_SECTOR_FILE", config.data.ticker_sector_file);
        overrideString("BT_SECTOR_ETFS_FILE", config.data.sector_etfs_file);
        overrideString("BT_DATA_DIR", config.data.data_dir);
        overrideString("BT_CACHE_DB", config.data.cache_db_path);
        overrideBool("BT_USE_REMOTE", config.data.use_remote);
        overrideString("BT_OUTPUT_DIR", config.output.output_dir);
        overrideString("BT_LOG_LEVEL", config.logging.console_level);
    }

    json ConfigFactory::toJson(const core::BacktestConfig& config) {
        json j;
        j["backtest"] = {
            {"start_cash", config.start_cash},
            {"days", config.days},
            {"end_date", config.end_date},
            {"index_symbol", config.index_symbol}
        };
        j["indicators"] = {
            {"ema_fast_period", config.indicators.ema_fast_period},
            {"ema_slow_period", config.indicators.ema_slow_period},
            {"ema_trigger_period", config.indicators.ema_trigger_period},
            {"atr_period", config.indicators.atr_period},
            {"performance_lookback", config.indicators.performance_lookback},
            {"liquidity_window", config.indicators.liquidity_window}
        };
        j["filters"] = {
            {"sector_rs_ema_period", config.filters.sector_rs_ema_period},
            {"sector_trend_window", config.filters.sector_trend_window}
        };
        j["screen"] = {
            {"price_max", config.screen.price_max},
            {"perf_min", config.screen.perf_min},
            {"min_dollar_volume", config.screen.min_dollar_volume},
            {"rs_window", config.screen.rs_window},
            {"max_new_orders_per_day", config.screen.max_new_orders_per_day}
        };
        j["risk"] = {
            {"risk_per_trade", config.risk.risk_per_trade},
            {"max_position_pct", config.risk.max_position_pct},
            {"heat_cap", config.risk.heat_cap},
            {"breakeven_trigger", config.risk.breakeven_trigger},
            {"stop_atr_multiple", config.risk.stop_atr_multiple},
            {"fallback_stop_pct", config.risk.fallback_stop_pct},
            {"target_r_multiple", config.risk.target_r_multiple}
        };
        j["execution"] = {
            {"gap_threshold_pct", config.execution.gap_threshold_pct}
        };
        j["costs"] = {
            {"commission_model", core::commissionTypeToString(config.costs.commission_type)},
            {"commission_fixed", config.costs.commission_fixed},
            {"commission_per_share", config.costs.commission_per_share},
            {"commission_pct", config.costs.commission_pct},
            {"commission_min", config.costs.commission_min},
            {"slippage_bps", config.costs.slippage_bps}
        };
        j["data"] = {
            {"tickers_file", config.data.tickers_file},
            {"ticker_sector_file", config.data.ticker_sector_file},
            {"sector_etfs_file", config.data.sector_etfs_file},
            {"data_dir", config.data.data_dir},
            {"cache_db_path", config.data.cache_db_path},
            {"use_remote", config.data.use_remote}
        };
        j["output"] = {
            {"output_dir", config.output.output_dir},
            {"write_reports", config.output.write_reports}
        };
        j["logging"] = {
            {"console_level", config.logging.console_level},
            {"file_level", config.logging.file_level}
        };
        return j;
    }

    std::unique_ptr<AndCondition> ConfigFactory::createEntryScreen(const core::ScreenConfig& screen) {
        std::vector<std::unique_ptr<ICondition>> conditions;
        conditions.reserve(4);
        conditions.push_back(std::make_unique<FieldCondition>(CandidateField::Close, ComparisonOp::LT, screen.price_max));
        conditions.push_back(std::make_unique<FieldCondition>(CandidateField::Performance, ComparisonOp::GT, screen.perf_min));
        conditions.push_back(std::make_unique<FieldCondition>(CandidateField::AvgDollarVolume, ComparisonOp::GTE, screen.min_dollar_volume));
        conditions.push_back(std::make_unique<FieldCondition>(CandidateField::RelativeStrength, ComparisonOp::GT, 0.0));
        return std::make_unique<AndCondition>(std::move(conditions));
    }

} // namespace strategy_engine
