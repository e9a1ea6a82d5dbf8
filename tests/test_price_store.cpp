#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "price_series.hpp"
#include "price_store.hpp"
#include "exceptions.hpp"
#include <cmath>

using test_helpers::day;
using test_helpers::makeCandle;

TEST(PriceSeriesTest, RejectsOutOfOrderBars) {
    data::PriceSeries series("AAA", core::IndicatorSettings{});
    series.append(makeCandle(day(1), 10, 10, 10, 10));
    EXPECT_THROW(series.append(makeCandle(day(1), 11, 11, 11, 11)), core::DataLoadException);
    EXPECT_THROW(series.append(makeCandle(day(0), 11, 11, 11, 11)), core::DataLoadException);
    EXPECT_EQ(series.size(), 1u);
}

TEST(PriceSeriesTest, MissingDateIsDataGap) {
    data::PriceSeries series("AAA", core::IndicatorSettings{});
    series.append(makeCandle(day(0), 10, 10, 10, 10));
    series.append(makeCandle(day(2), 10, 10, 10, 10));
    EXPECT_FALSE(series.indexOf(day(1)).has_value());
    EXPECT_THROW(series.barAt(day(1)), core::DataGapException);
    EXPECT_EQ(series.requireIndex(day(2)), 1u);
}

TEST(PriceSeriesTest, IndicatorsWarmUpThenBecomeAvailable) {
    data::PriceSeries series("AAA", core::IndicatorSettings{});
    for (const auto& c : test_helpers::makeTrendSeries(30, 10.0, 0.01)) {
        series.append(c);
    }
    EXPECT_THROW(series.indicatorValue(data::IndicatorKind::EmaTrigger, 18), core::InsufficientHistoryException);
    EXPECT_NO_THROW(series.indicatorValue(data::IndicatorKind::EmaTrigger, 19));
    EXPECT_THROW(series.indicatorValue(data::IndicatorKind::Atr, 13), core::InsufficientHistoryException);
    EXPECT_NO_THROW(series.indicatorValue(data::IndicatorKind::Atr, 14));
    // 63-bar performance needs more history than this series has
    EXPECT_THROW(series.indicatorValue(data::IndicatorKind::Performance, 29), core::InsufficientHistoryException);
    EXPECT_THROW(series.indicatorValue(data::IndicatorKind::EmaFast, 30), core::InsufficientHistoryException);
}

TEST(PriceSeriesTest, AppendInvalidatesIndicatorCache) {
    data::PriceSeries series("AAA", core::IndicatorSettings{});
    for (const auto& c : test_helpers::makeTrendSeries(25, 10.0, 0.01)) {
        series.append(c);
    }
    EXPECT_EQ(series.indicators().ema_fast.size(), 25u);
    series.append(makeCandle(day(25), 20, 21, 19, 20));
    EXPECT_EQ(series.indicators().ema_fast.size(), 26u);
    EXPECT_FALSE(std::isnan(series.indicators().ema_fast.back()));
}

TEST(PriceStoreTest, CalendarFollowsIndexSymbol) {
    data::PriceStore store("SPY", core::IndicatorSettings{});
    store.addSeries("SPY", test_helpers::makeFlatSeries(5, 400.0), data::SeriesRole::Index);
    ASSERT_EQ(store.calendar().size(), 5u);
    EXPECT_EQ(store.calendar().front(), day(0));
    store.appendBar("SPY", makeCandle(day(5), 400, 400, 400, 400));
    EXPECT_EQ(store.calendar().size(), 6u);
    EXPECT_THROW(store.appendBar("QQQ", makeCandle(day(5), 1, 1, 1, 1)), core::DataLoadException);
}

TEST(PriceStoreTest, UniverseListsStocksOnly) {
    data::PriceStore store("SPY", core::IndicatorSettings{});
    store.addSeries("SPY", test_helpers::makeFlatSeries(5, 400.0), data::SeriesRole::Index);
    store.addSeries("XLK", test_helpers::makeFlatSeries(5, 150.0), data::SeriesRole::Sector);
    store.addSeries("ZZZ", test_helpers::makeFlatSeries(5, 10.0), data::SeriesRole::Stock);
    store.addSeries("AAA", test_helpers::makeFlatSeries(5, 20.0), data::SeriesRole::Stock);

    std::vector<std::string> expected{"AAA", "ZZZ"};
    EXPECT_EQ(store.universe(), expected);
    EXPECT_TRUE(store.hasSeries("XLK"));
    EXPECT_THROW(store.series("MSFT"), core::DataGapException);
}

TEST(PriceStoreTest, SectorLookup) {
    data::PriceStore store("SPY", core::IndicatorSettings{});
    store.setSectorMap({{"AAA", "XLK"}, {"BBB", ""}});
    EXPECT_EQ(store.sectorOf("AAA").value_or(""), "XLK");
    EXPECT_FALSE(store.sectorOf("BBB").has_value());
    EXPECT_FALSE(store.sectorOf("CCC").has_value());
}

TEST(PriceStoreTest, RelativeStrengthUsesCommonDates) {
    data::PriceStore store("SPY", core::IndicatorSettings{});
    store.addSeries("SPY", test_helpers::makeFlatSeries(6, 100.0), data::SeriesRole::Index);

    core::TimeSeries<core::Candle> sector;
    for (int i : {0, 1, 3, 4, 5}) {
        sector.push_back(makeCandle(day(i), 50, 50, 50, 50 + i));
    }
    store.addSeries("XLK", sector, data::SeriesRole::Sector);

    const auto& rs = store.relativeStrength("XLK", "SPY", 2);
    ASSERT_EQ(rs.dates.size(), 5u);
    EXPECT_NEAR(rs.ratio[2], 0.53, 1e-12);
    EXPECT_FALSE(rs.indexOf(day(2)).has_value());
    EXPECT_EQ(rs.indexOf(day(3)).value_or(99), 2u);
    EXPECT_TRUE(std::isnan(rs.ratio_ema[0]));
    EXPECT_FALSE(std::isnan(rs.ratio_ema[1]));

    // Memoized until either side changes
    EXPECT_EQ(&store.relativeStrength("XLK", "SPY", 2), &rs);
    store.appendBar("XLK", makeCandle(day(6), 60, 60, 60, 60));
    store.appendBar("SPY", makeCandle(day(6), 100, 100, 100, 100));
    EXPECT_EQ(store.relativeStrength("XLK", "SPY", 2).dates.size(), 6u);
}
