#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory>
#include <optional>
#include <string>

namespace strategy_engine {

    // Conjunction of screen conditions, evaluated in order with short-circuit
    class AndCondition : public ICondition {
    public:
        // Takes ownership. Throws std::invalid_argument for an empty list or a null entry.
        explicit AndCondition(std::vector<std::unique_ptr<ICondition>> conditions);

        bool evaluate(const CandidateSnapshot& snapshot) const override;
        std::string describe() const override;

        // describe() of the first condition the snapshot fails, nullopt when all hold
        std::optional<std::string> firstFailure(const CandidateSnapshot& snapshot) const;

        size_t size() const { return conditions_.size(); }

    private:
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace strategy_engine
