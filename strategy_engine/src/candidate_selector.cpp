#include "candidate_selector.hpp"
#include "config_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>

namespace strategy_engine {

CandidateSelector::CandidateSelector(const data::PriceStore& store,
                                     const MarketFilters& filters,
                                     const core::BacktestConfig& config)
    : store_(store),
      filters_(filters),
      filter_config_(config.filters),
      screen_config_(config.screen),
      entry_screen_(ConfigFactory::createEntryScreen(config.screen))
{
    core::logging::getLogger()->debug("CandidateSelector entry screen: {}", entry_screen_->describe());
}

std::optional<core::Candidate> CandidateSelector::buildCandidate(const std::string& ticker,
                                                                 const std::string& sector,
                                                                 const core::Timestamp& date) const {
    const data::PriceSeries& series = store_.series(ticker);
    size_t idx = series.requireIndex(date); // DataGapException propagates to the caller

    core::Candidate candidate;
    candidate.ticker = ticker;
    candidate.signal_time = date;
    candidate.close = series.candles()[idx].close;
    candidate.performance = series.indicatorValue(data::IndicatorKind::Performance, idx);
    candidate.avg_dollar_volume = series.indicatorValue(data::IndicatorKind::AvgDollarVolume, idx);
    // The order needs these on the signal date as well
    series.indicatorValue(data::IndicatorKind::EmaTrigger, idx);
    series.indicatorValue(data::IndicatorKind::Atr, idx);

    const data::RelativeStrengthSeries& rs =
        store_.relativeStrength(ticker, sector, filter_config_.sector_rs_ema_period);
    auto rs_idx = rs.indexOf(date);
    if (!rs_idx) {
        throw core::DataGapException("No " + sector + " bar to compare " + ticker + " against on " +
                                     core::utils::dateToString(date));
    }
    size_t window = static_cast<size_t>(screen_config_.rs_window);
    if (*rs_idx < window) {
        throw core::InsufficientHistoryException("Not enough ratio history for relative strength of " + ticker);
    }
    double base = rs.ratio[*rs_idx - window];
    if (!(base > 0.0)) {
        return std::nullopt;
    }
    candidate.relative_strength = rs.ratio[*rs_idx] / base - 1.0;
    return candidate;
}

std::vector<core::Candidate> CandidateSelector::selectCandidates(const core::Timestamp& date,
                                                                 core::SkipLog* skip_log) const {
    auto logger = core::logging::getLogger();
    std::vector<core::Candidate> selected;

    if (!filters_.isMarketFavorable(date)) {
        logger->trace("{}: market unfavorable, no candidates.", core::utils::dateToString(date));
        return selected;
    }

    for (const auto& ticker : store_.universe()) {
        if (!filters_.isSectorFavorable(ticker, date)) {
            continue;
        }
        auto sector = store_.sectorOf(ticker);
        if (!sector) {
            continue;
        }

        std::optional<core::Candidate> candidate;
        try {
            candidate = buildCandidate(ticker, *sector, date);
        } catch (const core::DataGapException& e) {
            logger->debug("Skipping {} on {}: {}", ticker, core::utils::dateToString(date), e.what());
            if (skip_log) {
                skip_log->record(date, ticker, core::SkipReason::DataGap, e.what());
            }
            continue;
        } catch (const core::InsufficientHistoryException& e) {
            logger->trace("{} not eligible on {}: {}", ticker, core::utils::dateToString(date), e.what());
            continue;
        }
        if (!candidate) {
            continue;
        }

        CandidateSnapshot snapshot{date, &*candidate};
        if (auto failed = entry_screen_->firstFailure(snapshot)) {
            logger->trace("{} screened out on {}: fails {}", ticker, core::utils::dateToString(date), *failed);
        } else {
            logger->debug("Candidate {} on {}: close {:.2f}, perf {:.4f}, ADV {:.0f}, RS {:.4f}",
                          ticker, core::utils::dateToString(date), candidate->close, candidate->performance,
                          candidate->avg_dollar_volume, candidate->relative_strength);
            selected.push_back(*candidate);
        }
    }

    std::sort(selected.begin(), selected.end(), [](const core::Candidate& a, const core::Candidate& b) {
        if (a.relative_strength != b.relative_strength) {
            return a.relative_strength > b.relative_strength;
        }
        if (a.performance != b.performance) {
            return a.performance > b.performance;
        }
        return a.ticker < b.ticker;
    });
    return selected;
}

} // namespace strategy_engine
