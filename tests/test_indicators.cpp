#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "indicators.hpp"
#include "ema_indicator.hpp"
#include "sma_indicator.hpp"
#include "atr_indicator.hpp"
#include "rocp_indicator.hpp"
#include <cmath>
#include <stdexcept>

using test_helpers::day;
using test_helpers::makeCandle;

namespace {

    core::TimeSeries<core::Candle> closesToCandles(const std::vector<double>& closes) {
        core::TimeSeries<core::Candle> candles;
        for (size_t i = 0; i < closes.size(); ++i) {
            double c = closes[i];
            candles.push_back(makeCandle(day(static_cast<int>(i)), c, c, c, c, 100));
        }
        return candles;
    }

} // namespace

TEST(IndicatorsTest, SmaOfRisingCloses) {
    indicators::SmaIndicator sma(3);
    EXPECT_EQ(sma.getLookback(), 2);
    sma.calculate(closesToCandles({1, 2, 3, 4, 5}));
    const auto& result = sma.getResult();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_NEAR(result[0], 2.0, 1e-9);
    EXPECT_NEAR(result[1], 3.0, 1e-9);
    EXPECT_NEAR(result[2], 4.0, 1e-9);
}

TEST(IndicatorsTest, SmaOfDollarVolume) {
    core::TimeSeries<core::Candle> candles;
    for (int i = 0; i < 4; ++i) {
        candles.push_back(makeCandle(day(i), 10, 10, 10, 10, 1000 * (i + 1)));
    }
    indicators::SmaIndicator sma(2, indicators::SourceField::DollarVolume);
    sma.calculate(candles);
    const auto& result = sma.getResult();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_NEAR(result[0], 15000.0, 1e-6);
    EXPECT_NEAR(result[2], 35000.0, 1e-6);
}

TEST(IndicatorsTest, EmaOfConstantSeriesIsConstant) {
    indicators::EmaIndicator ema(5);
    EXPECT_EQ(ema.getName(), "EMA(5)");
    EXPECT_EQ(ema.getLookback(), 4);
    ema.calculate(test_helpers::makeFlatSeries(12, 100.0));
    const auto& result = ema.getResult();
    ASSERT_EQ(result.size(), 8u);
    for (double v : result) {
        EXPECT_DOUBLE_EQ(v, 100.0);
    }
}

TEST(IndicatorsTest, EmaLagsRisingSeries) {
    auto candles = test_helpers::makeTrendSeries(40, 10.0, 0.01);
    indicators::EmaIndicator fast(5);
    indicators::EmaIndicator slow(10);
    fast.calculate(candles);
    slow.calculate(candles);
    auto fast_aligned = indicators::alignToInput(fast.getResult(), fast.getLookback(), candles.size());
    auto slow_aligned = indicators::alignToInput(slow.getResult(), slow.getLookback(), candles.size());
    EXPECT_LT(fast_aligned.back(), candles.back().close);
    EXPECT_GT(fast_aligned.back(), slow_aligned.back());
}

TEST(IndicatorsTest, EmaShortInputGivesNoResults) {
    indicators::EmaIndicator ema(20);
    ema.calculate(test_helpers::makeFlatSeries(10, 50.0));
    EXPECT_TRUE(ema.getResult().empty());
}

TEST(IndicatorsTest, EmaRejectsPeriodBelowTwo) {
    EXPECT_THROW(indicators::EmaIndicator(1), std::invalid_argument);
}

TEST(IndicatorsTest, AtrOfConstantRange) {
    core::TimeSeries<core::Candle> candles;
    for (int i = 0; i < 30; ++i) {
        candles.push_back(makeCandle(day(i), 100, 101, 99, 100));
    }
    indicators::AtrIndicator atr(14);
    EXPECT_EQ(atr.getName(), "ATR(14)");
    EXPECT_EQ(atr.getLookback(), 14);
    atr.calculate(candles);
    const auto& result = atr.getResult();
    ASSERT_EQ(result.size(), 16u);
    for (double v : result) {
        EXPECT_NEAR(v, 2.0, 1e-9);
    }
}

TEST(IndicatorsTest, RocpIsFractionalChange) {
    indicators::RocpIndicator rocp(2);
    EXPECT_EQ(rocp.getLookback(), 2);
    rocp.calculate(closesToCandles({100.0, 110.0, 121.0, 133.1}));
    const auto& result = rocp.getResult();
    ASSERT_EQ(result.size(), 2u);
    EXPECT_NEAR(result[0], 0.21, 1e-9);
    EXPECT_NEAR(result[1], 0.21, 1e-9);
}

TEST(IndicatorsTest, AlignToInputPadsWarmUpWithNaN) {
    auto aligned = indicators::alignToInput({7.0, 8.0}, 3, 5);
    ASSERT_EQ(aligned.size(), 5u);
    EXPECT_TRUE(std::isnan(aligned[0]));
    EXPECT_TRUE(std::isnan(aligned[2]));
    EXPECT_DOUBLE_EQ(aligned[3], 7.0);
    EXPECT_DOUBLE_EQ(aligned[4], 8.0);
}
