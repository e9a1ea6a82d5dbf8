#include "and_condition.hpp"
#include <stdexcept>

namespace strategy_engine {

AndCondition::AndCondition(std::vector<std::unique_ptr<ICondition>> conditions)
    : conditions_(std::move(conditions))
{
    if (conditions_.empty()) {
        throw std::invalid_argument("AndCondition needs at least one condition.");
    }
    for (size_t i = 0; i < conditions_.size(); ++i) {
        if (!conditions_[i]) {
            throw std::invalid_argument("AndCondition: condition #" + std::to_string(i) + " is null.");
        }
    }
}

bool AndCondition::evaluate(const CandidateSnapshot& snapshot) const {
    return !firstFailure(snapshot).has_value();
}

std::optional<std::string> AndCondition::firstFailure(const CandidateSnapshot& snapshot) const {
    for (const auto& condition : conditions_) {
        if (!condition->evaluate(snapshot)) {
            return condition->describe();
        }
    }
    return std::nullopt;
}

std::string AndCondition::describe() const {
    std::string text = "(";
    for (size_t i = 0; i < conditions_.size(); ++i) {
        if (i > 0) {
            text += " AND ";
        }
        text += conditions_[i]->describe();
    }
    return text + ")";
}

} // namespace strategy_engine
