#pragma once

/// @file condition_evaluator.hpp
/// @brief The single predicate evaluator behind every conditional rule.

#include <vector>

#include "nsim/foundation/random_source.hpp"
#include "nsim/game/condition_types.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::game {

class AttributeStore;

/// Evaluates conditions against one session.
///
/// Pure except for RandomCondition and ProbabilityCondition, which each
/// consume exactly one draw from the injected RandomSource. A kind that
/// is outside the vocabulary of the requested scope evaluates true.
class ConditionEvaluator {
public:
    ConditionEvaluator(const SessionState& state, const AttributeStore& attributes,
                       foundation::RandomSource& random);

    [[nodiscard]] bool evaluate(const Condition& condition, ConditionScope scope) const;

    /// AND over @p conditions in order, stopping at the first failure.
    [[nodiscard]] bool evaluateAll(const std::vector<Condition>& conditions,
                                   ConditionScope scope) const;

private:
    [[nodiscard]] bool checkAttribute(const AttributeCondition& c) const;
    [[nodiscard]] bool checkFlag(const FlagCondition& c) const;
    [[nodiscard]] bool checkTime(const TimeCondition& c) const;
    [[nodiscard]] bool checkProbability(const ProbabilityCondition& c) const;
    [[nodiscard]] bool checkCharacter(const CharacterCondition& c) const;
    [[nodiscard]] bool checkEventTriggered(const EventTriggeredCondition& c) const;

    const SessionState& state_;
    const AttributeStore& attributes_;
    foundation::RandomSource& random_;
};

}  // namespace nsim::game
