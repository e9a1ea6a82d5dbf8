#include <gtest/gtest.h>
#include "config_factory.hpp"
#include "field_condition.hpp"
#include "and_condition.hpp"
#include "common_types.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

using strategy_engine::ConfigFactory;
using json = nlohmann::json;

namespace {

    const char* const kOverrideVars[] = {
        "BT_DAYS", "BT_END_DATE", "BT_START_CASH", "BT_RISK_PER_TRADE", "BT_MAX_POSITION_PCT",
        "BT_HEAT_CAP", "BT_BREAKEVEN_TRIGGER", "BT_GAP_THRESHOLD", "BT_SLIPPAGE_BPS",
        "BT_COMMISSION_MODEL", "BT_COMMISSION_PER_SHARE", "BT_COMMISSION_MIN", "BT_MIN_DOLLAR_VOLUME",
        "BT_PRICE_MAX", "BT_PERF_3M_MIN", "BT_TICKERS_FILE", "BT_TICKER_SECTOR_FILE",
        "BT_SECTOR_ETFS_FILE", "BT_DATA_DIR", "BT_CACHE_DB", "BT_USE_REMOTE", "BT_OUTPUT_DIR",
        "BT_LOG_LEVEL"
    };

    class EnvOverrideTest : public ::testing::Test {
    protected:
        void SetUp() override { clearAll(); }
        void TearDown() override { clearAll(); }

        static void clearAll() {
            for (const char* name : kOverrideVars) {
                unsetenv(name);
            }
        }
    };

    core::Candidate makeCandidate(double close, double perf, double adv, double rs) {
        core::Candidate c;
        c.ticker = "AAA";
        c.close = close;
        c.performance = perf;
        c.avg_dollar_volume = adv;
        c.relative_strength = rs;
        return c;
    }

} // namespace

TEST(ConfigFactoryTest, EmptyJsonGivesDefaults) {
    core::BacktestConfig config = ConfigFactory::fromJson(json::object());
    EXPECT_DOUBLE_EQ(config.start_cash, 100000.0);
    EXPECT_EQ(config.days, 1095);
    EXPECT_EQ(config.index_symbol, "SPY");
    EXPECT_DOUBLE_EQ(config.risk.risk_per_trade, 0.02);
    EXPECT_DOUBLE_EQ(config.risk.heat_cap, 0.06);
    EXPECT_DOUBLE_EQ(config.risk.breakeven_trigger, 0.01);
    EXPECT_DOUBLE_EQ(config.costs.slippage_bps, 2.0);
    EXPECT_EQ(config.costs.commission_type, core::CommissionType::PerShare);
    EXPECT_DOUBLE_EQ(config.execution.gap_threshold_pct, 0.02);
    EXPECT_EQ(config.screen.max_new_orders_per_day, 3);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigFactoryTest, ReadsNestedSections) {
    json j = {
        {"backtest", {{"start_cash", 50000.0}, {"days", 365}, {"index_symbol", " qqq "}}},
        {"risk", {{"heat_cap", 0.02}, {"target_r_multiple", 3.0}}},
        {"costs", {{"commission_model", "percentage"}, {"commission_pct", 0.001}}},
        {"data", {{"use_remote", true}}}
    };
    core::BacktestConfig config = ConfigFactory::fromJson(j);
    EXPECT_DOUBLE_EQ(config.start_cash, 50000.0);
    EXPECT_EQ(config.days, 365);
    EXPECT_EQ(config.index_symbol, "QQQ");
    EXPECT_DOUBLE_EQ(config.risk.heat_cap, 0.02);
    EXPECT_DOUBLE_EQ(config.risk.target_r_multiple, 3.0);
    EXPECT_EQ(config.costs.commission_type, core::CommissionType::Percentage);
    EXPECT_TRUE(config.data.use_remote);
    // Untouched keys keep defaults
    EXPECT_DOUBLE_EQ(config.risk.risk_per_trade, 0.02);
}

TEST(ConfigFactoryTest, WrongTypesAreConfigErrors) {
    EXPECT_THROW(ConfigFactory::fromJson(json::array()), core::ConfigException);
    EXPECT_THROW(ConfigFactory::fromJson({{"risk", 5}}), core::ConfigException);
    EXPECT_THROW(ConfigFactory::fromJson({{"backtest", {{"days", "many"}}}}), core::ConfigException);
    EXPECT_THROW(ConfigFactory::fromJson({{"costs", {{"commission_model", "flat_rate"}}}}), core::ConfigException);
}

TEST(ConfigFactoryTest, JsonRoundTripKeepsValues) {
    core::BacktestConfig original;
    original.days = 200;
    original.end_date = "2024-06-28";
    original.risk.heat_cap = 0.08;
    original.costs.commission_type = core::CommissionType::Fixed;
    original.data.cache_db_path = "";

    core::BacktestConfig restored = ConfigFactory::fromJson(ConfigFactory::toJson(original));
    EXPECT_EQ(restored.days, 200);
    EXPECT_EQ(restored.end_date, "2024-06-28");
    EXPECT_DOUBLE_EQ(restored.risk.heat_cap, 0.08);
    EXPECT_EQ(restored.costs.commission_type, core::CommissionType::Fixed);
    EXPECT_EQ(restored.data.cache_db_path, "");
}

TEST(ConfigFactoryTest, LoadFile) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "poos_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"screen": {"price_max": 50.0, "rs_window": 5}})";
    }
    core::BacktestConfig config = ConfigFactory::loadFile(path.string());
    EXPECT_DOUBLE_EQ(config.screen.price_max, 50.0);
    EXPECT_EQ(config.screen.rs_window, 5);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(ConfigFactory::loadFile(path.string()), core::ConfigException);
    std::filesystem::remove(path);
    EXPECT_THROW(ConfigFactory::loadFile(path.string()), core::ConfigException);
}

TEST(ConfigValidationTest, RejectsInvalidValues) {
    core::BacktestConfig config;
    config.risk.risk_per_trade = 0.0;
    EXPECT_THROW(config.validate(), core::ConfigException);

    config = core::BacktestConfig{};
    config.risk.heat_cap = 0.01; // below risk_per_trade
    EXPECT_THROW(config.validate(), core::ConfigException);

    config = core::BacktestConfig{};
    config.days = 0;
    EXPECT_THROW(config.validate(), core::ConfigException);

    config = core::BacktestConfig{};
    config.end_date = "yesterday";
    EXPECT_THROW(config.validate(), core::ConfigException);

    config = core::BacktestConfig{};
    config.indicators.ema_fast_period = 10;
    EXPECT_THROW(config.validate(), core::ConfigException);

    config = core::BacktestConfig{};
    config.start_cash = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(config.validate(), core::ConfigException);
}

TEST_F(EnvOverrideTest, OverridesLoadedValues) {
    setenv("BT_DAYS", "500", 1);
    setenv("BT_HEAT_CAP", "0.02", 1);
    setenv("BT_COMMISSION_MODEL", "fixed", 1);
    setenv("BT_USE_REMOTE", "yes", 1);
    setenv("BT_OUTPUT_DIR", "/tmp/poos_out", 1);
    setenv("BT_PERF_3M_MIN", "0.5", 1);

    core::BacktestConfig config;
    ConfigFactory::applyEnvironmentOverrides(config);
    EXPECT_EQ(config.days, 500);
    EXPECT_DOUBLE_EQ(config.risk.heat_cap, 0.02);
    EXPECT_EQ(config.costs.commission_type, core::CommissionType::Fixed);
    EXPECT_TRUE(config.data.use_remote);
    EXPECT_EQ(config.output.output_dir, "/tmp/poos_out");
    EXPECT_DOUBLE_EQ(config.screen.perf_min, 0.5);
    // Unset variables leave values alone
    EXPECT_DOUBLE_EQ(config.costs.slippage_bps, 2.0);
}

TEST_F(EnvOverrideTest, RejectsMalformedValues) {
    core::BacktestConfig config;
    setenv("BT_DAYS", "12x", 1);
    EXPECT_THROW(ConfigFactory::applyEnvironmentOverrides(config), core::ConfigException);
    unsetenv("BT_DAYS");

    setenv("BT_SLIPPAGE_BPS", "lots", 1);
    EXPECT_THROW(ConfigFactory::applyEnvironmentOverrides(config), core::ConfigException);
    unsetenv("BT_SLIPPAGE_BPS");

    setenv("BT_USE_REMOTE", "maybe", 1);
    EXPECT_THROW(ConfigFactory::applyEnvironmentOverrides(config), core::ConfigException);
}

TEST(EntryScreenTest, AllConditionsMustHold) {
    core::ScreenConfig screen;
    auto condition = ConfigFactory::createEntryScreen(screen);

    core::Candidate good = makeCandidate(50.0, 0.8, 6e6, 0.01);
    EXPECT_TRUE(condition->evaluate({good.signal_time, &good}));

    core::Candidate expensive = makeCandidate(70.0, 0.8, 6e6, 0.01);
    EXPECT_FALSE(condition->evaluate({expensive.signal_time, &expensive}));

    core::Candidate slow = makeCandidate(50.0, 0.6, 6e6, 0.01);
    EXPECT_FALSE(condition->evaluate({slow.signal_time, &slow}));

    core::Candidate exactly_liquid = makeCandidate(50.0, 0.8, 5e6, 0.01);
    EXPECT_TRUE(condition->evaluate({exactly_liquid.signal_time, &exactly_liquid}));

    core::Candidate weak = makeCandidate(50.0, 0.8, 6e6, 0.0);
    EXPECT_FALSE(condition->evaluate({weak.signal_time, &weak}));

    EXPECT_EQ(condition->evaluate({good.signal_time, nullptr}), false);
}

TEST(EntryScreenTest, FieldConditionDescribesItself) {
    strategy_engine::FieldCondition condition(strategy_engine::CandidateField::Close,
                                              strategy_engine::ComparisonOp::LT, 70.0);
    EXPECT_NE(condition.describe().find("Close"), std::string::npos);
    EXPECT_EQ(condition.describe(), "Close < 70");
}

TEST(EntryScreenTest, EmptyAndConditionIsRejected) {
    EXPECT_THROW(strategy_engine::AndCondition(std::vector<std::unique_ptr<strategy_engine::ICondition>>{}),
                 std::invalid_argument);
}

TEST(EntryScreenTest, ReportsFirstFailingCondition) {
    auto screen = ConfigFactory::createEntryScreen(core::ScreenConfig{});
    ASSERT_EQ(screen->size(), 4u);

    core::Candidate good = makeCandidate(50.0, 0.8, 6e6, 0.01);
    EXPECT_FALSE(screen->firstFailure({good.signal_time, &good}).has_value());

    core::Candidate thin = makeCandidate(50.0, 0.8, 1e6, 0.01);
    auto failed = screen->firstFailure({thin.signal_time, &thin});
    ASSERT_TRUE(failed.has_value());
    EXPECT_NE(failed->find("AvgDollarVolume"), std::string::npos);
}

TEST(EntryScreenTest, NullConditionIsRejected) {
    std::vector<std::unique_ptr<strategy_engine::ICondition>> conditions;
    conditions.push_back(std::make_unique<strategy_engine::FieldCondition>(
        strategy_engine::CandidateField::Close, strategy_engine::ComparisonOp::LT, 70.0));
    conditions.push_back(nullptr);
    EXPECT_THROW(strategy_engine::AndCondition(std::move(conditions)), std::invalid_argument);
}

TEST(LoggingConfigTest, LevelsAreParsedAndValidated) {
    EXPECT_EQ(core::logging::parseLevel("DEBUG").value(), spdlog::level::debug);
    EXPECT_EQ(core::logging::parseLevel("warning").value(), spdlog::level::warn);
    EXPECT_EQ(core::logging::parseLevel("off").value(), spdlog::level::off);
    EXPECT_FALSE(core::logging::parseLevel("verbose").has_value());

    json j = {{"logging", {{"console_level", "trace"}, {"file_level", "info"}}}};
    core::BacktestConfig config = ConfigFactory::fromJson(j);
    EXPECT_EQ(config.logging.console_level, "trace");
    EXPECT_EQ(config.logging.file_level, "info");
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(ConfigFactory::toJson(config)["logging"]["console_level"].get<std::string>(), "trace");

    config.logging.file_level = "loud";
    EXPECT_THROW(config.validate(), core::ConfigException);
}
