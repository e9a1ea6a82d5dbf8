#pragma once

#include "interfaces.hpp" // Include the base interface
#include "common_types.hpp"
#include <string>

namespace strategy_engine {

    // --- FieldCondition Class ---
    // Compares one candidate attribute against a fixed threshold,
    // e.g. FieldCondition(CandidateField::Close, ComparisonOp::LT, 70.0) -> "Close < 70"
    class FieldCondition : public ICondition {
    public:
        FieldCondition(CandidateField field, ComparisonOp op, double value);

        virtual ~FieldCondition() override = default;

        // ICondition interface implementation
        bool evaluate(const CandidateSnapshot& snapshot) const override;
        std::string describe() const override;

        CandidateField field() const { return field_; }
        ComparisonOp op() const { return op_; }
        double value() const { return value_; }

    private:
        CandidateField field_;
        ComparisonOp op_;
        double value_;

        double get_field_value(const core::Candidate& candidate) const;
    };

} // namespace strategy_engine
