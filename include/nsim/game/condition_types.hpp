#pragma once

/// @file condition_types.hpp
/// @brief Closed set of condition kinds shared by triggers, options,
///        effects and endings.
///
/// Each kind is its own struct; Condition wraps the variant so that a
/// CombinationCondition can nest further conditions.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace nsim::game {

/// Comparison used by attribute conditions.
enum class CompareOp : uint8_t {
    Greater,
    Less,
    GreaterEqual,
    LessEqual,
    Equal,
    NotEqual
};

/// Parse ">", "<", ">=", "<=", "==", "!="; anything else is GreaterEqual.
CompareOp parseCompareOp(std::string_view text) noexcept;

[[nodiscard]] std::string_view compareOpSymbol(CompareOp op) noexcept;

[[nodiscard]] bool compareValues(double lhs, CompareOp op, double rhs) noexcept;

/// Value stored under a session flag.
using FlagValue = std::variant<bool, double, std::string>;

struct Condition;

/// get(attribute) <op> value
struct AttributeCondition {
    std::string attribute;
    CompareOp op = CompareOp::GreaterEqual;
    double value = 0.0;
};

/// flags[flag] == value; an unset flag never matches.
struct FlagCondition {
    std::string flag;
    FlagValue value = true;
};

/// One draw < probability.
struct RandomCondition {
    double probability = 0.0;
};

/// Inclusive day range.
struct DayRange {
    int min = 1;
    int max = 1;
};

/// Calendar membership. An absent list places no restriction; a present
/// but empty list matches nothing.
struct TimeCondition {
    std::optional<std::vector<int>> days;
    std::optional<std::vector<int>> periods;
    std::optional<DayRange> dayRange;
};

/// One draw < baseRate, optionally nudged by (luck - 50) / 500.
struct ProbabilityCondition {
    double baseRate = 0.0;
    bool luckModifier = false;
};

/// Whether a once-only event has (or has not) been triggered.
struct EventHistoryCondition {
    std::string eventId;
    bool triggered = true;
};

/// The active character is one of characterIds.
struct CharacterCondition {
    std::vector<std::string> characterIds;
};

/// Once-only event triggered, or when choiceIndex is set, a history
/// record for eventId with that choice exists.
struct EventTriggeredCondition {
    std::string eventId;
    std::optional<std::size_t> choiceIndex;
};

/// AND over nested conditions; empty is true.
struct CombinationCondition {
    std::vector<Condition> conditions;
};

using ConditionKind = std::variant<AttributeCondition,
                                   FlagCondition,
                                   RandomCondition,
                                   TimeCondition,
                                   ProbabilityCondition,
                                   EventHistoryCondition,
                                   CharacterCondition,
                                   EventTriggeredCondition,
                                   CombinationCondition>;

struct Condition {
    ConditionKind kind;

    Condition() = default;

    template <typename Kind,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<Kind>, Condition>>>
    Condition(Kind&& k) : kind(std::forward<Kind>(k)) {}  // NOLINT(google-explicit-constructor)
};

/// Call sites of the evaluator; each accepts its own vocabulary of kinds.
///
/// | Scope   | Kinds                                              |
/// |---------|----------------------------------------------------|
/// | Effect  | attribute, flag, random                            |
/// | Trigger | time, attribute, probability, event_history, character |
/// | Ending  | attribute, event_triggered, flag, combination      |
enum class ConditionScope : uint8_t {
    Effect,
    Trigger,
    Ending
};

/// Content name of a condition's kind ("attribute", "event_history", ...).
[[nodiscard]] std::string_view conditionKindName(const Condition& condition) noexcept;

/// Whether @p scope interprets @p condition's kind.
[[nodiscard]] bool isInVocabulary(ConditionScope scope, const Condition& condition) noexcept;

}  // namespace nsim::game
