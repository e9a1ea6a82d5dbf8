#pragma once

#include <vector>
#include <string>
#include <memory> // For std::unique_ptr

#include "datatypes.hpp" // Provides Candidate, Timestamp

namespace strategy_engine {

    // What a screen condition sees for one ticker on one signal date
    struct CandidateSnapshot {
        core::Timestamp signal_time;
        const core::Candidate* candidate = nullptr;
    };

    // --- Condition Interface ---
    // A single logical test on a candidate (e.g., Close < 70)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        virtual bool evaluate(const CandidateSnapshot& snapshot) const = 0;
        virtual std::string describe() const = 0;
    };

} // namespace strategy_engine
