#pragma once

#include <string>
#include <vector>

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "config.hpp"
#include "skip_log.hpp"
#include "price_store.hpp"
#include "market_filters.hpp"
#include "candidate_selector.hpp"
#include "cost_model.hpp"
#include "execution_simulator.hpp"
#include "portfolio.hpp"
#include "metrics.hpp"

namespace backtester {

    struct BacktestResult {
        std::vector<core::Trade> trades;
        std::vector<PortfolioState> equity_curve;
        BacktestMetrics metrics;
        core::SkipLog skip_log;
    };

    // Day-by-day simulation over the store's master calendar
    class Backtester {
    public:
        // The store must outlive the backtester and is never modified by it
        Backtester(const data::PriceStore& store, const core::BacktestConfig& config);

        Backtester(const Backtester&) = delete;
        Backtester& operator=(const Backtester&) = delete;

        // Each call starts from a fresh Portfolio. Throws BacktestException
        // when the calendar is empty or an internal invariant breaks.
        BacktestResult run();

    private:
        // --- Private Helper Methods ---
        void managePositions(Portfolio& portfolio, const core::Timestamp& date, core::SkipLog& skip_log) const;
        void processEntries(Portfolio& portfolio,
                            const core::Timestamp& signal_date,
                            const core::Timestamp& date,
                            core::SkipLog& skip_log) const;
        // Returns false when the order could not be placed (skip recorded)
        bool placeOrder(Portfolio& portfolio,
                        const core::Candidate& candidate,
                        const core::Timestamp& date,
                        core::SkipLog& skip_log) const;
        void markPositions(Portfolio& portfolio, const core::Timestamp& date) const;
        void liquidateAll(Portfolio& portfolio, const core::Timestamp& date) const;

        const data::PriceStore& store_;
        core::BacktestConfig config_;
        CostModel cost_model_;
        strategy_engine::MarketFilters filters_;
        strategy_engine::CandidateSelector selector_;
        ExecutionSimulator simulator_;
    };

} // namespace backtester
