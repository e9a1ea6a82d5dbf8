#include "skip_log.hpp"
#include <algorithm>

namespace core {

    std::string skipReasonToString(SkipReason reason) {
        switch (reason) {
            case SkipReason::DataGap:             return "DATA_GAP";
            case SkipReason::InsufficientHistory: return "INSUFFICIENT_HISTORY";
            case SkipReason::InvalidSizing:       return "INVALID_SIZING";
            case SkipReason::RiskLimit:           return "RISK_LIMIT";
        }
        return "UNKNOWN";
    }

    void SkipLog::record(Timestamp timestamp, const std::string& ticker, SkipReason reason, const std::string& detail) {
        entries_.push_back(SkipRecord{timestamp, ticker, reason, detail});
    }

    size_t SkipLog::count(SkipReason reason) const {
        return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
            [reason](const SkipRecord& r) { return r.reason == reason; }));
    }

    std::map<std::string, size_t> SkipLog::countsByTicker() const {
        std::map<std::string, size_t> counts;
        for (const auto& entry : entries_) {
            counts[entry.ticker]++;
        }
        return counts;
    }

} // namespace core
