/// @file condition_evaluator.cpp
/// @brief Dispatch over condition kinds.

#include "nsim/game/condition_evaluator.hpp"

#include <algorithm>
#include <type_traits>

#include "nsim/game/attribute_store.hpp"

namespace nsim::game {

namespace {

template <typename>
inline constexpr bool kUnhandledKind = false;

}  // namespace

ConditionEvaluator::ConditionEvaluator(const SessionState& state,
                                       const AttributeStore& attributes,
                                       foundation::RandomSource& random)
    : state_(state), attributes_(attributes), random_(random) {}

bool ConditionEvaluator::evaluate(const Condition& condition, ConditionScope scope) const {
    if (!isInVocabulary(scope, condition)) {
        return true;
    }

    return std::visit([&](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, AttributeCondition>) {
            return checkAttribute(c);
        } else if constexpr (std::is_same_v<T, FlagCondition>) {
            return checkFlag(c);
        } else if constexpr (std::is_same_v<T, RandomCondition>) {
            return random_.next() < c.probability;
        } else if constexpr (std::is_same_v<T, TimeCondition>) {
            return checkTime(c);
        } else if constexpr (std::is_same_v<T, ProbabilityCondition>) {
            return checkProbability(c);
        } else if constexpr (std::is_same_v<T, EventHistoryCondition>) {
            return state_.isEventTriggered(c.eventId) == c.triggered;
        } else if constexpr (std::is_same_v<T, CharacterCondition>) {
            return checkCharacter(c);
        } else if constexpr (std::is_same_v<T, EventTriggeredCondition>) {
            return checkEventTriggered(c);
        } else if constexpr (std::is_same_v<T, CombinationCondition>) {
            return evaluateAll(c.conditions, scope);
        } else {
            static_assert(kUnhandledKind<T>, "condition kind not handled");
        }
    }, condition.kind);
}

bool ConditionEvaluator::evaluateAll(const std::vector<Condition>& conditions,
                                     ConditionScope scope) const {
    for (const auto& condition : conditions) {
        if (!evaluate(condition, scope)) {
            return false;
        }
    }
    return true;
}

bool ConditionEvaluator::checkAttribute(const AttributeCondition& c) const {
    return compareValues(attributes_.get(c.attribute), c.op, c.value);
}

bool ConditionEvaluator::checkFlag(const FlagCondition& c) const {
    auto it = state_.flags.find(c.flag);
    if (it == state_.flags.end()) {
        return false;
    }
    return it->second == c.value;
}

bool ConditionEvaluator::checkTime(const TimeCondition& c) const {
    const int day = state_.progress.day;
    const int period = state_.progress.period;

    if (c.days && std::find(c.days->begin(), c.days->end(), day) == c.days->end()) {
        return false;
    }
    if (c.periods &&
        std::find(c.periods->begin(), c.periods->end(), period) == c.periods->end()) {
        return false;
    }
    if (c.dayRange && (day < c.dayRange->min || day > c.dayRange->max)) {
        return false;
    }
    return true;
}

bool ConditionEvaluator::checkProbability(const ProbabilityCondition& c) const {
    double probability = c.baseRate;
    if (c.luckModifier) {
        const double luck = attributes_.get(attributes_.schema().luckAttribute);
        probability += (luck - 50.0) / 500.0;
    }
    return random_.next() < probability;
}

bool ConditionEvaluator::checkCharacter(const CharacterCondition& c) const {
    if (!state_.character) {
        return false;
    }
    return std::find(c.characterIds.begin(), c.characterIds.end(), state_.character->id) !=
           c.characterIds.end();
}

bool ConditionEvaluator::checkEventTriggered(const EventTriggeredCondition& c) const {
    if (!c.choiceIndex) {
        return state_.isEventTriggered(c.eventId);
    }
    return std::any_of(state_.eventHistory.begin(), state_.eventHistory.end(),
                       [&c](const EventHistoryRecord& record) {
                           return record.eventId == c.eventId &&
                                  record.choiceIndex == *c.choiceIndex;
                       });
}

}  // namespace nsim::game
