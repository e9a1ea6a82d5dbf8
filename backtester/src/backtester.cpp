#include "backtester.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <spdlog/fmt/fmt.h>
#include <string>
#include <vector>

namespace backtester {

    Backtester::Backtester(const data::PriceStore& store, const core::BacktestConfig& config)
        : store_(store),
          config_(config),
          cost_model_(config_.costs),
          filters_(store_, config_.filters),
          selector_(store_, filters_, config_),
          simulator_(config_.risk, config_.execution, cost_model_)
    {
        core::logging::getLogger()->debug("Backtester initialized with capital: {:.2f}", config_.start_cash);
    }

    BacktestResult Backtester::run() {
        auto logger = core::logging::getLogger();
        const auto& calendar = store_.calendar();
        if (calendar.empty()) {
            throw core::BacktestException("Cannot run backtest: master calendar is empty.");
        }

        logger->info("========================================================");
        logger->info("Starting Backtest Run");
        logger->info("========================================================");
        logger->info("Period: {} to {} ({} trading days, {} tickers)",
                     core::utils::dateToString(calendar.front()),
                     core::utils::dateToString(calendar.back()),
                     calendar.size(), store_.universe().size());

        // Reset state for the new run
        Portfolio portfolio(config_.start_cash, config_.risk, cost_model_);
        MetricsBuilder metrics_builder(config_.start_cash);
        BacktestResult result;

        const size_t last = calendar.size() - 1;
        for (size_t i = 0; i < calendar.size(); ++i) {
            const core::Timestamp& date = calendar[i];
            const size_t trades_before = portfolio.getTradeLog().size();

            // --- 1. Exits on today's bar ---
            managePositions(portfolio, date, result.skip_log);

            // --- 2. Entries from yesterday's signals ---
            bool risk_on = false;
            if (i > 0) {
                const core::Timestamp& signal_date = calendar[i - 1];
                risk_on = filters_.isMarketFavorable(signal_date);
                if (i < last && risk_on) {
                    processEntries(portfolio, signal_date, date, result.skip_log);
                }
            }

            // --- 3. Mark to close ---
            markPositions(portfolio, date);

            // --- 4. Final bar ---
            if (i == last) {
                liquidateAll(portfolio, date);
            }

            // --- 5. Snapshot ---
            const PortfolioState& state = portfolio.snapshot(date, risk_on);
            metrics_builder.onSnapshot(state);
            const auto& trade_log = portfolio.getTradeLog();
            for (size_t t = trades_before; t < trade_log.size(); ++t) {
                metrics_builder.onTrade(trade_log[t]);
            }

            logger->trace("{} equity {:.2f} cash {:.2f} open {} risk {:.2f}",
                          core::utils::dateToString(date), state.total_equity, state.cash,
                          state.open_positions, state.allocated_risk);
        }

        if (!portfolio.getPositions().empty()) {
            throw core::BacktestException(fmt::format("{} positions still open after final liquidation.",
                                                      portfolio.getPositions().size()));
        }

        result.trades = portfolio.getTradeLog();
        result.equity_curve = portfolio.getEquityCurve();
        result.metrics = metrics_builder.build();

        logger->info("========================================================");
        logger->info("Backtest Run Completed: {} trades, {} skipped actions",
                     result.trades.size(), result.skip_log.size());
        logger->info("========================================================");
        return result;
    }

    void Backtester::managePositions(Portfolio& portfolio, const core::Timestamp& date,
                                     core::SkipLog& skip_log) const {
        auto logger = core::logging::getLogger();

        // Copy the keys: exits erase from the position map
        std::vector<std::string> tickers;
        for (const auto& pair : portfolio.getPositions()) {
            tickers.push_back(pair.first);
        }

        for (const auto& ticker : tickers) {
            const core::Position& position = portfolio.getPosition(ticker);
            if (position.entry_time >= date) {
                continue;
            }

            const core::Candle* bar = nullptr;
            try {
                bar = &store_.series(ticker).barAt(date);
            } catch (const core::DataGapException& e) {
                skip_log.record(date, ticker, core::SkipReason::DataGap, e.what());
                logger->debug("No bar for held {} on {}, holding.", ticker, core::utils::dateToString(date));
                continue;
            }

            PositionDecision decision = simulator_.evaluatePosition(position, *bar);
            switch (decision.action) {
                case PositionAction::Exit:
                    portfolio.applyExit(date, ticker, decision.price, decision.reason);
                    break;
                case PositionAction::RatchetStop:
                    portfolio.ratchetStop(ticker, decision.price);
                    break;
                case PositionAction::Hold:
                    break;
            }
        }
    }

    void Backtester::processEntries(Portfolio& portfolio,
                                    const core::Timestamp& signal_date,
                                    const core::Timestamp& date,
                                    core::SkipLog& skip_log) const {
        auto logger = core::logging::getLogger();
        std::vector<core::Candidate> candidates = selector_.selectCandidates(signal_date, &skip_log);
        if (candidates.empty()) {
            return;
        }

        int orders = 0;
        for (const auto& candidate : candidates) {
            if (orders >= config_.screen.max_new_orders_per_day) {
                break;
            }
            if (portfolio.hasPosition(candidate.ticker)) {
                logger->trace("{} already held, no new order.", candidate.ticker);
                continue;
            }
            if (placeOrder(portfolio, candidate, date, skip_log)) {
                ++orders;
            }
        }
    }

    bool Backtester::placeOrder(Portfolio& portfolio,
                                const core::Candidate& candidate,
                                const core::Timestamp& date,
                                core::SkipLog& skip_log) const {
        auto logger = core::logging::getLogger();
        const std::string& ticker = candidate.ticker;

        core::Order order;
        order.ticker = ticker;
        order.created_time = candidate.signal_time;
        order.fill_time = date;

        const core::Candle* bar = nullptr;
        try {
            const data::PriceSeries& series = store_.series(ticker);
            size_t k = series.requireIndex(candidate.signal_time);
            order.trigger_price = series.indicatorValue(data::IndicatorKind::EmaTrigger, k);
            order.atr = series.indicatorValue(data::IndicatorKind::Atr, k);
            bar = &series.barAt(date);
        } catch (const core::DataGapException& e) {
            skip_log.record(date, ticker, core::SkipReason::DataGap, e.what());
            return false;
        } catch (const core::InsufficientHistoryException& e) {
            skip_log.record(date, ticker, core::SkipReason::InsufficientHistory, e.what());
            return false;
        }

        FillResult fill = simulator_.tryFill(order, *bar);
        logger->debug("Order {} @ {:.4f} for {}: {}", ticker, order.trigger_price,
                      core::utils::dateToString(date), fillStatusToString(fill.status));
        if (fill.status != FillStatus::Filled) {
            return true;
        }

        double stop = simulator_.initialStop(order.trigger_price, order.atr);
        double rps = simulator_.riskPerShare(fill.fill_price, stop);
        try {
            long long shares = portfolio.sizePosition(portfolio.getCurrentEquity(), rps, fill.fill_price);
            double target = simulator_.targetPrice(fill.fill_price, rps);
            portfolio.applyFill(date, ticker, shares, fill.fill_price, stop, target);
        } catch (const core::InvalidSizingException& e) {
            logger->warn("Entry for {} on {} refused: {}", ticker, core::utils::dateToString(date), e.what());
            skip_log.record(date, ticker, core::SkipReason::InvalidSizing, e.what());
        } catch (const core::RiskLimitException& e) {
            logger->debug("Entry for {} on {} refused: {}", ticker, core::utils::dateToString(date), e.what());
            skip_log.record(date, ticker, core::SkipReason::RiskLimit, e.what());
        }
        return true;
    }

    void Backtester::markPositions(Portfolio& portfolio, const core::Timestamp& date) const {
        std::vector<std::string> tickers;
        for (const auto& pair : portfolio.getPositions()) {
            tickers.push_back(pair.first);
        }
        for (const auto& ticker : tickers) {
            const data::PriceSeries& series = store_.series(ticker);
            // A missing bar keeps the previous mark
            if (auto idx = series.indexOf(date)) {
                portfolio.markPrice(ticker, series.candles()[*idx].close);
            }
        }
    }

    void Backtester::liquidateAll(Portfolio& portfolio, const core::Timestamp& date) const {
        auto logger = core::logging::getLogger();
        std::vector<std::string> tickers;
        for (const auto& pair : portfolio.getPositions()) {
            tickers.push_back(pair.first);
        }
        if (!tickers.empty()) {
            logger->info("Liquidating {} open positions on {}.", tickers.size(), core::utils::dateToString(date));
        }
        for (const auto& ticker : tickers) {
            const core::Position& position = portfolio.getPosition(ticker);
            const data::PriceSeries& series = store_.series(ticker);
            double price = position.last_price;
            if (auto idx = series.indexOf(date)) {
                price = simulator_.liquidationPrice(series.candles()[*idx].close);
            } else {
                logger->warn("No final bar for {}, liquidating at last mark {:.4f}.", ticker, price);
            }
            portfolio.applyExit(date, ticker, price, core::ExitReason::EndOfData);
        }
    }

} // namespace backtester
