#pragma once

#include "and_condition.hpp"
#include "market_filters.hpp"
#include "price_store.hpp"
#include "config.hpp"
#include "skip_log.hpp"
#include "datatypes.hpp"
#include <vector>
#include <string>
#include <memory>
#include <optional>

namespace strategy_engine {

    class CandidateSelector {
    public:
        CandidateSelector(const data::PriceStore& store,
                          const MarketFilters& filters,
                          const core::BacktestConfig& config);

        // Eligible tickers on the signal date, strongest relative strength first
        // (ties: higher performance, then ticker). Empty when the market gate fails.
        std::vector<core::Candidate> selectCandidates(const core::Timestamp& date,
                                                      core::SkipLog* skip_log = nullptr) const;

    private:
        std::optional<core::Candidate> buildCandidate(const std::string& ticker,
                                                      const std::string& sector,
                                                      const core::Timestamp& date) const;

        const data::PriceStore& store_;
        const MarketFilters& filters_;
        core::FilterConfig filter_config_;
        core::ScreenConfig screen_config_;
        std::unique_ptr<AndCondition> entry_screen_;
    };

} // namespace strategy_engine
