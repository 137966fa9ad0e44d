#pragma once

/// @file event_types.hpp
/// @brief Narrative event and option definitions (immutable catalog data).

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nsim/game/attribute_types.hpp"
#include "nsim/game/condition_types.hpp"

namespace nsim::game {

/// Weight used when an event declares none.
constexpr int32_t kDefaultEventWeight = 100;

/// When a follow-up event becomes due, relative to the choosing turn.
enum class FollowUpDelay : uint8_t {
    Immediate,   ///< Not queued at all.
    NextPeriod,  ///< Next slot, carrying into the next day.
    NextDay      ///< Slot 0 of the following day.
};

/// Event queued by choosing an option.
struct FollowUpSpec {
    std::string eventId;
    FollowUpDelay delay = FollowUpDelay::NextPeriod;
    std::optional<double> probability;  ///< Queued only if a draw <= this.
    int32_t priority = 0;
};

enum class SpecialOutcomeKind : uint8_t {
    EndingTrigger,  ///< Resolve the ending now.
    GameOver,       ///< Run ends now; resolve the ending.
    Custom          ///< Informational marker for the caller.
};

/// Marker an option carries to end the run early or signal the caller.
struct SpecialOutcome {
    SpecialOutcomeKind kind = SpecialOutcomeKind::Custom;
    std::string tag;

    /// EndingTrigger and GameOver bypass the clock advance.
    [[nodiscard]] bool terminatesRun() const noexcept {
        return kind == SpecialOutcomeKind::EndingTrigger ||
               kind == SpecialOutcomeKind::GameOver;
    }

    bool operator==(const SpecialOutcome&) const = default;
};

struct OptionDefinition {
    std::string id;
    std::string text;
    std::vector<Effect> effects;
    std::vector<Condition> availabilityConditions;  ///< Locked when false.
    std::vector<Condition> visibilityConditions;    ///< Hidden when false.
    std::string unavailableText;
    std::vector<FollowUpSpec> followUps;
    std::optional<SpecialOutcome> specialOutcome;
    std::string feedback;
};

struct EventDefinition {
    std::string id;
    std::string title;
    std::string description;
    std::string category;
    std::vector<OptionDefinition> options;
    std::vector<Condition> triggerConditions;  ///< Trigger vocabulary, AND.
    int32_t weight = kDefaultEventWeight;
    bool onceOnly = false;
    std::vector<std::string> mutuallyExclusive;
    std::vector<std::string> prerequisites;
    std::vector<std::string> exclusiveTo;  ///< Character ids; empty = everyone.
};

/// An option as presented for the current turn.
struct OptionView {
    const OptionDefinition* option = nullptr;
    std::size_t index = 0;  ///< Index into EventDefinition::options.
    bool available = true;
    std::string unavailableReason;
};

}  // namespace nsim::game
