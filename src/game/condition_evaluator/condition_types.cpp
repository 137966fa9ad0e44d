/// @file condition_types.cpp
/// @brief Operator parsing and vocabulary tables for condition kinds.

#include "nsim/game/condition_types.hpp"

#include <algorithm>

namespace nsim::game {

CompareOp parseCompareOp(std::string_view text) noexcept {
    if (text == ">") return CompareOp::Greater;
    if (text == "<") return CompareOp::Less;
    if (text == "<=") return CompareOp::LessEqual;
    if (text == "==") return CompareOp::Equal;
    if (text == "!=") return CompareOp::NotEqual;
    return CompareOp::GreaterEqual;
}

std::string_view compareOpSymbol(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::Greater:      return ">";
        case CompareOp::Less:         return "<";
        case CompareOp::GreaterEqual: return ">=";
        case CompareOp::LessEqual:    return "<=";
        case CompareOp::Equal:        return "==";
        case CompareOp::NotEqual:     return "!=";
    }
    return ">=";
}

bool compareValues(double lhs, CompareOp op, double rhs) noexcept {
    switch (op) {
        case CompareOp::Greater:      return lhs > rhs;
        case CompareOp::Less:         return lhs < rhs;
        case CompareOp::GreaterEqual: return lhs >= rhs;
        case CompareOp::LessEqual:    return lhs <= rhs;
        case CompareOp::Equal:        return lhs == rhs;
        case CompareOp::NotEqual:     return lhs != rhs;
    }
    return lhs >= rhs;
}

std::string_view conditionKindName(const Condition& condition) noexcept {
    switch (condition.kind.index()) {
        case 0: return "attribute";
        case 1: return "flag";
        case 2: return "random";
        case 3: return "time";
        case 4: return "probability";
        case 5: return "event_history";
        case 6: return "character";
        case 7: return "event_triggered";
        case 8: return "combination";
        default: return "unknown";
    }
}

bool isInVocabulary(ConditionScope scope, const Condition& condition) noexcept {
    const auto& k = condition.kind;
    switch (scope) {
        case ConditionScope::Effect:
            return std::holds_alternative<AttributeCondition>(k) ||
                   std::holds_alternative<FlagCondition>(k) ||
                   std::holds_alternative<RandomCondition>(k);
        case ConditionScope::Trigger:
            return std::holds_alternative<TimeCondition>(k) ||
                   std::holds_alternative<AttributeCondition>(k) ||
                   std::holds_alternative<ProbabilityCondition>(k) ||
                   std::holds_alternative<EventHistoryCondition>(k) ||
                   std::holds_alternative<CharacterCondition>(k);
        case ConditionScope::Ending:
            return std::holds_alternative<AttributeCondition>(k) ||
                   std::holds_alternative<EventTriggeredCondition>(k) ||
                   std::holds_alternative<FlagCondition>(k) ||
                   std::holds_alternative<CombinationCondition>(k);
    }
    return false;
}

}  // namespace nsim::game
