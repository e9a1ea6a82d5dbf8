#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "portfolio.hpp"
#include "cost_model.hpp"
#include "exceptions.hpp"

using test_helpers::day;

namespace {

    class PortfolioTest : public ::testing::Test {
    protected:
        PortfolioTest() : config_(test_helpers::frictionlessConfig()), costs_(config_.costs) {}

        core::BacktestConfig config_;
        backtester::CostModel costs_;
    };

} // namespace

TEST_F(PortfolioTest, SizingUsesRiskAndPositionCap) {
    backtester::Portfolio portfolio(100000.0, config_.risk, costs_);
    // 2% of 100k over a 2.00 stop is 1000 shares, capped at 10% of equity / 20 = 500
    EXPECT_EQ(portfolio.sizePosition(100000.0, 2.0, 20.0), 500);

    config_.risk.max_position_pct = 0.0;
    backtester::Portfolio uncapped(100000.0, config_.risk, costs_);
    EXPECT_EQ(uncapped.sizePosition(100000.0, 2.0, 20.0), 1000);
}

TEST_F(PortfolioTest, SizingRefusesZeroSharesAndShortCash) {
    backtester::Portfolio portfolio(1000.0, config_.risk, costs_);
    EXPECT_THROW(portfolio.sizePosition(1000.0, 50.0, 60.0), core::InvalidSizingException);
    EXPECT_THROW(portfolio.sizePosition(1000.0, 0.0, 60.0), core::InvalidSizingException);

    config_.risk.max_position_pct = 0.0;
    backtester::Portfolio uncapped(1000.0, config_.risk, costs_);
    // 20 shares at 100 needs 2000 in cash
    EXPECT_THROW(uncapped.sizePosition(1000.0, 1.0, 100.0), core::InvalidSizingException);
}

TEST_F(PortfolioTest, FillAndExitUpdateCashAndTradeLog) {
    core::BacktestConfig config = config_;
    config.costs.commission_type = core::CommissionType::PerShare;
    config.costs.commission_per_share = 0.01;
    config.costs.commission_min = 1.0;
    backtester::CostModel costs(config.costs);
    backtester::Portfolio portfolio(100000.0, config.risk, costs);

    portfolio.applyFill(day(1), "AAA", 500, 20.0, 18.0, 0.0);
    EXPECT_TRUE(portfolio.hasPosition("AAA"));
    EXPECT_NEAR(portfolio.getCash(), 100000.0 - 10000.0 - 5.0, 1e-9);
    EXPECT_NEAR(portfolio.allocatedRisk(), 1000.0, 1e-9);
    EXPECT_NEAR(portfolio.getCurrentEquity(), 99995.0, 1e-9);

    core::Trade trade = portfolio.applyExit(day(3), "AAA", 22.0, core::ExitReason::Target);
    EXPECT_FALSE(portfolio.hasPosition("AAA"));
    EXPECT_NEAR(trade.commission, 10.0, 1e-9);
    EXPECT_NEAR(trade.pnl, 1000.0 - 10.0, 1e-9);
    EXPECT_NEAR(trade.return_pct, 0.1, 1e-12);
    EXPECT_EQ(trade.reason, core::ExitReason::Target);
    EXPECT_NEAR(portfolio.getCash(), 100000.0 + 990.0, 1e-9);
    ASSERT_EQ(portfolio.getTradeLog().size(), 1u);
}

TEST_F(PortfolioTest, NoPyramiding) {
    backtester::Portfolio portfolio(100000.0, config_.risk, costs_);
    portfolio.applyFill(day(1), "AAA", 100, 20.0, 18.0, 0.0);
    EXPECT_THROW(portfolio.applyFill(day(2), "AAA", 100, 21.0, 19.0, 0.0), core::BacktestException);
    EXPECT_EQ(portfolio.getPositions().size(), 1u);
}

TEST_F(PortfolioTest, HeatCapRefusesExtraRisk) {
    config_.risk.heat_cap = 0.02;
    config_.risk.max_position_pct = 0.0;
    backtester::Portfolio portfolio(100000.0, config_.risk, costs_);

    EXPECT_TRUE(portfolio.canAcceptRisk(2000.0));
    portfolio.applyFill(day(1), "AAA", 1000, 20.0, 18.0, 0.0);
    EXPECT_FALSE(portfolio.canAcceptRisk(1.0));
    EXPECT_THROW(portfolio.applyFill(day(1), "BBB", 10, 30.0, 29.0, 0.0), core::RiskLimitException);

    // Once the stop is at entry the position no longer counts against the cap
    portfolio.ratchetStop("AAA", 20.0);
    EXPECT_NEAR(portfolio.allocatedRisk(), 0.0, 1e-12);
    EXPECT_NO_THROW(portfolio.applyFill(day(2), "BBB", 10, 30.0, 29.0, 0.0));
}

TEST_F(PortfolioTest, HeatCapIsCheckedAgainstEquityAtAdmission) {
    config_.risk.heat_cap = 0.06;
    config_.risk.risk_per_trade = 0.02;
    config_.risk.max_position_pct = 0.0;
    backtester::Portfolio portfolio(100000.0, config_.risk, costs_);

    auto expectWithinCap = [&]() {
        EXPECT_LE(portfolio.allocatedRisk(),
                  config_.risk.heat_cap * portfolio.getCurrentEquity() * (1.0 + 1e-9));
    };

    // 400 shares, 2000 at risk
    long long shares = portfolio.sizePosition(portfolio.getCurrentEquity(), 5.0, 50.0);
    ASSERT_EQ(shares, 400);
    portfolio.applyFill(day(1), "AAA", shares, 50.0, 45.0, 0.0);
    expectWithinCap();

    portfolio.markPrice("AAA", 47.5);
    ASSERT_DOUBLE_EQ(portfolio.getCurrentEquity(), 99000.0);
    // 990 shares, 1980 at risk
    shares = portfolio.sizePosition(portfolio.getCurrentEquity(), 2.0, 20.0);
    ASSERT_EQ(shares, 990);
    portfolio.applyFill(day(2), "BBB", shares, 20.0, 18.0, 0.0);
    expectWithinCap();

    portfolio.markPrice("BBB", 19.0);
    ASSERT_DOUBLE_EQ(portfolio.getCurrentEquity(), 98010.0);
    // 3980 + 1960 fits 6% of the starting equity but not 6% of the current 98010
    shares = portfolio.sizePosition(portfolio.getCurrentEquity(), 1.0, 10.0);
    ASSERT_EQ(shares, 1960);
    EXPECT_LE(portfolio.allocatedRisk() + 1960.0, config_.risk.heat_cap * 100000.0);
    EXPECT_THROW(portfolio.applyFill(day(3), "CCC", shares, 10.0, 9.0, 0.0), core::RiskLimitException);
    EXPECT_FALSE(portfolio.hasPosition("CCC"));
    expectWithinCap();

    portfolio.ratchetStop("AAA", 50.0);
    portfolio.applyFill(day(3), "CCC", shares, 10.0, 9.0, 0.0);
    EXPECT_NEAR(portfolio.allocatedRisk(), 1980.0 + 1960.0, 1e-9);
    expectWithinCap();
}

TEST_F(PortfolioTest, RatchetNeverLowersStop) {
    backtester::Portfolio portfolio(100000.0, config_.risk, costs_);
    portfolio.applyFill(day(1), "AAA", 100, 20.0, 18.0, 0.0);

    portfolio.ratchetStop("AAA", 19.0);
    EXPECT_DOUBLE_EQ(portfolio.getPosition("AAA").stop_price, 19.0);
    EXPECT_FALSE(portfolio.getPosition("AAA").breakeven_set);

    portfolio.ratchetStop("AAA", 20.0);
    EXPECT_TRUE(portfolio.getPosition("AAA").breakeven_set);

    portfolio.ratchetStop("AAA", 17.0);
    EXPECT_DOUBLE_EQ(portfolio.getPosition("AAA").stop_price, 20.0);
    EXPECT_DOUBLE_EQ(portfolio.getPosition("AAA").initial_stop, 18.0);
    EXPECT_THROW(portfolio.ratchetStop("ZZZ", 1.0), core::BacktestException);
}

TEST_F(PortfolioTest, SnapshotEquityIsCashPlusMarks) {
    backtester::Portfolio portfolio(100000.0, config_.risk, costs_);
    portfolio.applyFill(day(1), "AAA", 100, 20.0, 18.0, 0.0);
    portfolio.markPrice("AAA", 25.0);

    const auto& state = portfolio.snapshot(day(1), true);
    EXPECT_NEAR(state.cash, 98000.0, 1e-9);
    EXPECT_NEAR(state.positions_value, 2500.0, 1e-9);
    EXPECT_NEAR(state.total_equity, state.cash + state.positions_value, 1e-9);
    EXPECT_EQ(state.open_positions, 1);
    EXPECT_TRUE(state.risk_on);

    // Same day again is ignored, earlier days are an error
    portfolio.snapshot(day(1));
    EXPECT_EQ(portfolio.getEquityCurve().size(), 1u);
    EXPECT_THROW(portfolio.snapshot(day(0)), core::BacktestException);
}

TEST_F(PortfolioTest, RejectsNonPositiveCapital) {
    EXPECT_THROW(backtester::Portfolio(0.0, config_.risk, costs_), core::BacktestException);
}
