#include "field_condition.hpp"
#include "logging.hpp" // Use short path now
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

std::string candidateFieldToString(CandidateField field) {
    switch (field) {
        case CandidateField::Close:            return "Close";
        case CandidateField::Performance:      return "Performance";
        case CandidateField::AvgDollarVolume:  return "AvgDollarVolume";
        case CandidateField::RelativeStrength: return "RelativeStrength";
    }
    return "InvalidField";
}

std::string comparisonOpToString(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::GT:  return ">";
        case ComparisonOp::LT:  return "<";
        case ComparisonOp::GTE: return ">=";
    }
    return "InvalidOp";
}

FieldCondition::FieldCondition(CandidateField field, ComparisonOp op, double value)
    : field_(field), op_(op), value_(value)
{
    if (!std::isfinite(value_)) {
        throw std::invalid_argument("FieldCondition threshold must be finite.");
    }
}

double FieldCondition::get_field_value(const core::Candidate& candidate) const {
    switch (field_) {
        case CandidateField::Close:            return candidate.close;
        case CandidateField::Performance:      return candidate.performance;
        case CandidateField::AvgDollarVolume:  return candidate.avg_dollar_volume;
        case CandidateField::RelativeStrength: return candidate.relative_strength;
    }
    return std::nan("");
}

bool FieldCondition::evaluate(const CandidateSnapshot& snapshot) const {
    if (!snapshot.candidate) {
        core::logging::getLogger()->trace("FieldCondition evaluate failed: Snapshot has no candidate.");
        return false;
    }

    double lhs_value = get_field_value(*snapshot.candidate);
    if (std::isnan(lhs_value)) {
        return false;
    }

    switch (op_) {
        case ComparisonOp::GT:  return lhs_value > value_;
        case ComparisonOp::LT:  return lhs_value < value_;
        case ComparisonOp::GTE: return lhs_value >= value_;
    }
    core::logging::getLogger()->error("Invalid ComparisonOp in FieldCondition::evaluate");
    return false;
}

std::string FieldCondition::describe() const {
    return fmt::format("{} {} {}", candidateFieldToString(field_), comparisonOpToString(op_), value_);
}

} // namespace strategy_engine
