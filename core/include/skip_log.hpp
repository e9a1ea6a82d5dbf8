#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>
#include <map>

namespace core {

    enum class SkipReason {
        DataGap,
        InsufficientHistory,
        InvalidSizing,
        RiskLimit
    };

    std::string skipReasonToString(SkipReason reason);

    struct SkipRecord {
        Timestamp timestamp;
        std::string ticker;
        SkipReason reason = SkipReason::DataGap;
        std::string detail;
    };

    // Per-day, per-ticker actions that degraded to "no action today"
    class SkipLog {
    public:
        void record(Timestamp timestamp, const std::string& ticker, SkipReason reason, const std::string& detail);

        const std::vector<SkipRecord>& entries() const { return entries_; }
        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        size_t count(SkipReason reason) const;
        // Ticker -> number of skipped days, for the final report
        std::map<std::string, size_t> countsByTicker() const;

    private:
        std::vector<SkipRecord> entries_;
    };

} // namespace core
