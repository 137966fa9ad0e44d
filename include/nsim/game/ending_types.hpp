#pragma once

/// @file ending_types.hpp
/// @brief Ending definitions and the resolved ending result.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nsim/game/attribute_types.hpp"
#include "nsim/game/condition_types.hpp"

namespace nsim::game {

enum class EndingCategory : uint8_t {
    Perfect,
    Good,
    Normal,
    Bad,
    Secret
};

[[nodiscard]] std::string_view endingCategoryName(EndingCategory category) noexcept;

/// AND-combined conditions (Ending vocabulary). Empty is satisfied.
struct ConditionGroup {
    std::vector<Condition> conditions;
};

/// Score bonus applied when its condition holds.
struct ScoreModifier {
    Condition condition;
    double value = 0.0;
};

struct EndingDefinition {
    std::string id;
    std::string title;
    std::string description;
    EndingCategory category = EndingCategory::Normal;
    int32_t priority = 0;
    std::optional<std::string> characterId;  ///< Scope; empty = any character.
    std::vector<ConditionGroup> unlockGroups; ///< OR across groups; empty = always.
    double baseScore = 0.0;
    std::vector<ScoreModifier> modifiers;
};

/// Change of the tracked attributes over the run.
struct EndingStats {
    double depositChange = 0.0;
    double weightChange = 0.0;
    double faceChange = 0.0;
    double moodChange = 0.0;
    double healthChange = 0.0;
    int64_t totalEvents = 0;
    int64_t totalChoices = 0;

    bool operator==(const EndingStats&) const = default;
};

struct EndingResult {
    std::string id;
    std::string title;
    std::string description;
    EndingCategory category = EndingCategory::Normal;
    int64_t score = 0;
    std::vector<std::string> summary;  ///< Narrative lines, in order.
    AttributeSet finalAttributes;
    EndingStats stats;
};

}  // namespace nsim::game
