#pragma once

/// @file choice_processor.hpp
/// @brief Applies the consequences of the option a player picked.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nsim/foundation/game_result.hpp"
#include "nsim/foundation/random_source.hpp"
#include "nsim/game/attribute_store.hpp"
#include "nsim/game/condition_evaluator.hpp"
#include "nsim/game/event_types.hpp"
#include "nsim/game/progress_clock.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::game {

/// What a resolved choice produced.
struct ChoiceOutcome {
    std::string eventId;
    std::string optionId;
    std::size_t optionIndex = 0;
    std::vector<EffectResult> effects;
    std::optional<SpecialOutcome> specialOutcome;
    std::string feedback;
    std::vector<PendingEvent> queued;  ///< Follow-ups added by this choice.

    /// The caller skips the clock advance and resolves the ending.
    [[nodiscard]] bool endsRun() const noexcept {
        return specialOutcome && specialOutcome->terminatesRun();
    }
};

/// Resolves a choice in one step:
///   1. Apply effects
///   2. Append the history record and bump statistics
///   3. Mark once-only events triggered
///   4. Queue follow-up events
class ChoiceProcessor {
public:
    ChoiceProcessor(SessionState& state, AttributeStore& attributes,
                    const ConditionEvaluator& evaluator, const ProgressClock& clock,
                    foundation::RandomSource& random);

    /// @return NotFound with the session untouched when @p optionIndex is
    ///         out of range.
    foundation::GameResult<ChoiceOutcome> process(const EventDefinition& event,
                                                  std::size_t optionIndex);

    /// Slot a follow-up targets, or nullopt when it is not queued by delay
    /// (Immediate).
    [[nodiscard]] std::optional<PendingEvent> resolveFollowUp(const FollowUpSpec& spec) const;

    /// Add @p eventId to the triggered set; repeated calls are no-ops.
    void markTriggered(const std::string& eventId);

private:
    void recordHistory(const EventDefinition& event, std::size_t optionIndex,
                       const OptionDefinition& option);

    SessionState& state_;
    AttributeStore& attributes_;
    const ConditionEvaluator& evaluator_;
    const ProgressClock& clock_;
    foundation::RandomSource& random_;
};

}  // namespace nsim::game
