#pragma once
#include "datatypes.hpp"     // Use short path (Provides core types)
#include <string>

namespace strategy_engine {

    // Candidate attribute a screen condition reads
    enum class CandidateField {
        Close,
        Performance,
        AvgDollarVolume,
        RelativeStrength
    };

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE  // Greater Than or Equal To (>=)
    };

    std::string candidateFieldToString(CandidateField field);
    std::string comparisonOpToString(ComparisonOp op);

} // namespace strategy_engine
