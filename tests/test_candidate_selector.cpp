#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "candidate_selector.hpp"
#include "market_filters.hpp"
#include "price_store.hpp"
#include "skip_log.hpp"
#include <algorithm>

using test_helpers::day;

namespace {

    constexpr size_t kBars = 150;

    class CandidateSelectorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            config_ = test_helpers::frictionlessConfig();
        }

        data::PriceStore makeStore(bool risk_on) {
            data::PriceStore store("SPY", config_.indicators);
            store.addSeries("SPY",
                            risk_on ? test_helpers::makeTrendSeries(kBars, 400.0, 0.001)
                                    : test_helpers::makeFlatSeries(kBars, 400.0),
                            data::SeriesRole::Index);
            store.addSeries("XLK", test_helpers::makeTrendSeries(kBars, 150.0, 0.003), data::SeriesRole::Sector);
            store.addSeries("XLE", test_helpers::makeTrendSeries(kBars, 80.0, -0.003), data::SeriesRole::Sector);

            store.addSeries("AAA", test_helpers::makeTrendSeries(kBars, 10.0, 0.010), data::SeriesRole::Stock);
            store.addSeries("BBB", test_helpers::makeTrendSeries(kBars, 10.0, 0.008), data::SeriesRole::Stock);
            // Above the price ceiling
            store.addSeries("CCC", test_helpers::makeTrendSeries(kBars, 100.0, 0.010), data::SeriesRole::Stock);
            // Strong stock in a lagging sector
            store.addSeries("DDD", test_helpers::makeTrendSeries(kBars, 10.0, 0.010), data::SeriesRole::Stock);
            // Too thin to trade
            store.addSeries("EEE", test_helpers::makeTrendSeries(kBars, 10.0, 0.010, 0.995, 1000), data::SeriesRole::Stock);

            store.setSectorMap({{"AAA", "XLK"}, {"BBB", "XLK"}, {"CCC", "XLK"}, {"DDD", "XLE"}, {"EEE", "XLK"}});
            return store;
        }

        core::BacktestConfig config_;
    };

} // namespace

TEST_F(CandidateSelectorTest, RanksEligibleTickersByRelativeStrength) {
    data::PriceStore store = makeStore(true);
    strategy_engine::MarketFilters filters(store, config_.filters);
    strategy_engine::CandidateSelector selector(store, filters, config_);

    core::SkipLog skip_log;
    auto candidates = selector.selectCandidates(day(100), &skip_log);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].ticker, "AAA");
    EXPECT_EQ(candidates[1].ticker, "BBB");
    EXPECT_GT(candidates[0].relative_strength, candidates[1].relative_strength);
    EXPECT_GT(candidates[0].performance, config_.screen.perf_min);
    EXPECT_LT(candidates[0].close, config_.screen.price_max);
    EXPECT_EQ(candidates[0].signal_time, day(100));
    EXPECT_TRUE(skip_log.empty());
}

TEST_F(CandidateSelectorTest, NothingBeforePerformanceWarmUp) {
    data::PriceStore store = makeStore(true);
    strategy_engine::MarketFilters filters(store, config_.filters);
    strategy_engine::CandidateSelector selector(store, filters, config_);

    core::SkipLog skip_log;
    EXPECT_TRUE(selector.selectCandidates(day(40), &skip_log).empty());
    EXPECT_TRUE(skip_log.empty());
}

TEST_F(CandidateSelectorTest, MarketGateBlocksEverything) {
    data::PriceStore store = makeStore(false);
    strategy_engine::MarketFilters filters(store, config_.filters);
    strategy_engine::CandidateSelector selector(store, filters, config_);
    EXPECT_TRUE(selector.selectCandidates(day(100)).empty());
}

TEST_F(CandidateSelectorTest, MissingBarIsRecordedAsDataGap) {
    data::PriceStore store = makeStore(true);
    auto bars = test_helpers::makeTrendSeries(kBars, 10.0, 0.009);
    bars.erase(bars.begin() + 100);
    store.addSeries("FFF", bars, data::SeriesRole::Stock);
    store.setSectorMap({{"AAA", "XLK"}, {"BBB", "XLK"}, {"FFF", "XLK"}});

    strategy_engine::MarketFilters filters(store, config_.filters);
    strategy_engine::CandidateSelector selector(store, filters, config_);

    core::SkipLog skip_log;
    auto candidates = selector.selectCandidates(day(100), &skip_log);
    EXPECT_EQ(candidates.size(), 2u);
    ASSERT_EQ(skip_log.size(), 1u);
    EXPECT_EQ(skip_log.entries()[0].ticker, "FFF");
    EXPECT_EQ(skip_log.entries()[0].reason, core::SkipReason::DataGap);
    EXPECT_EQ(skip_log.count(core::SkipReason::DataGap), 1u);
}

TEST_F(CandidateSelectorTest, LooserScreenAdmitsMore) {
    config_.screen.price_max = 1000.0;
    config_.screen.min_dollar_volume = 0.0;
    data::PriceStore store = makeStore(true);
    strategy_engine::MarketFilters filters(store, config_.filters);
    strategy_engine::CandidateSelector selector(store, filters, config_);

    auto candidates = selector.selectCandidates(day(100));
    ASSERT_EQ(candidates.size(), 4u);
    // DDD stays gated by its sector; the slower BBB ranks last
    EXPECT_EQ(candidates.back().ticker, "BBB");
    std::vector<std::string> leaders;
    for (size_t i = 0; i < 3; ++i) {
        leaders.push_back(candidates[i].ticker);
    }
    std::sort(leaders.begin(), leaders.end());
    std::vector<std::string> expected{"AAA", "CCC", "EEE"};
    EXPECT_EQ(leaders, expected);
}

TEST_F(CandidateSelectorTest, EqualStrengthRanksHigherPerformanceFirst) {
    data::PriceStore store = makeStore(true);
    // Same path as AAA but doubled from bar 80 on: the relative strength over the
    // last bar is identical, the 3-month performance is higher.
    auto bars = test_helpers::makeTrendSeries(kBars, 10.0, 0.010);
    for (size_t i = 80; i < bars.size(); ++i) {
        bars[i].open *= 2.0;
        bars[i].high *= 2.0;
        bars[i].low *= 2.0;
        bars[i].close *= 2.0;
    }
    store.addSeries("ZZZ", bars, data::SeriesRole::Stock);
    store.setSectorMap({{"AAA", "XLK"}, {"BBB", "XLK"}, {"DDD", "XLE"}, {"ZZZ", "XLK"}});

    strategy_engine::MarketFilters filters(store, config_.filters);
    strategy_engine::CandidateSelector selector(store, filters, config_);

    auto candidates = selector.selectCandidates(day(100));
    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0].ticker, "ZZZ");
    EXPECT_EQ(candidates[1].ticker, "AAA");
    EXPECT_EQ(candidates[2].ticker, "BBB");
    EXPECT_EQ(candidates[0].relative_strength, candidates[1].relative_strength);
    EXPECT_GT(candidates[0].performance, candidates[1].performance);
}

TEST_F(CandidateSelectorTest, FullTieRanksByTicker) {
    data::PriceStore store = makeStore(true);
    store.addSeries("MMM", test_helpers::makeTrendSeries(kBars, 10.0, 0.010), data::SeriesRole::Stock);
    store.addSeries("AAB", test_helpers::makeTrendSeries(kBars, 10.0, 0.010), data::SeriesRole::Stock);
    store.setSectorMap({{"AAA", "XLK"}, {"AAB", "XLK"}, {"BBB", "XLK"}, {"DDD", "XLE"}, {"MMM", "XLK"}});

    strategy_engine::MarketFilters filters(store, config_.filters);
    strategy_engine::CandidateSelector selector(store, filters, config_);

    auto candidates = selector.selectCandidates(day(100));
    std::vector<std::string> tickers;
    for (const auto& candidate : candidates) {
        tickers.push_back(candidate.ticker);
    }
    std::vector<std::string> expected{"AAA", "AAB", "MMM", "BBB"};
    EXPECT_EQ(tickers, expected);
    EXPECT_EQ(candidates[0].relative_strength, candidates[2].relative_strength);
    EXPECT_EQ(candidates[0].performance, candidates[2].performance);
}
