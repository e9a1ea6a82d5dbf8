#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps

namespace core {

    // Daily bars carry the UTC midnight of their trading date
    using Timestamp = std::chrono::system_clock::time_point;

    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    enum class ExitReason {
        Stop,          // Initial stop hit
        BreakevenStop, // Stop hit after being ratcheted to entry
        Target,        // Profit target hit
        EndOfData      // Forced liquidation on the final bar
    };

    // A ticker evaluated on a signal date. Rebuilt every day, never persisted.
    struct Candidate {
        std::string ticker;
        Timestamp signal_time;
        double close = 0.0;
        double performance = 0.0;        // Trailing 3-month return (0.6 == 60%)
        double avg_dollar_volume = 0.0;
        double relative_strength = 0.0;  // Change of ticker/sector ratio over the RS window
    };

    // Pending limit entry. Valid only for the bar at fill_time.
    struct Order {
        std::string ticker;
        double trigger_price = 0.0;  // EMA20 of the signal day
        double atr = 0.0;            // ATR of the signal day, used for the initial stop
        Timestamp created_time;      // Signal day
        Timestamp fill_time;         // The one bar this order may fill on
    };

    struct Position {
        std::string ticker;
        Timestamp entry_time;
        double entry_price = 0.0;    // Fill price including slippage
        long long shares = 0;
        double risk_per_share = 0.0; // entry_price - initial_stop at fill
        double initial_stop = 0.0;
        double stop_price = 0.0;
        double target_price = 0.0;   // 0 when no target is configured
        bool breakeven_set = false;
        double entry_commission = 0.0;
        double last_price = 0.0;     // Latest mark-to-market price

        // Dollars lost if the current stop is hit. Zero once the stop is at or above entry.
        double allocatedRisk() const {
            double per_share = entry_price - stop_price;
            return per_share > 0.0 ? per_share * static_cast<double>(shares) : 0.0;
        }
    };

    struct Trade {
        std::string ticker;
        Timestamp entry_time;
        Timestamp exit_time;
        long long shares = 0;
        double entry_price = 0.0;
        double exit_price = 0.0;
        double commission = 0.0;      // Total commission (entry + exit)
        double pnl = 0.0;             // Net of commission
        double return_pct = 0.0;      // Price return (exit - entry) / entry
        ExitReason reason = ExitReason::Stop;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    std::string exitReasonToString(ExitReason reason);

} // namespace core
