#pragma once

/// @file event_scheduler.hpp
/// @brief Chooses the event for the current turn.
///
/// Selection order for one request:
///   1. Due pending events (highest priority, earliest inserted)
///   2. Weighted random pick among eligible catalog events
///   3. The built-in quiet-moment event when nothing is eligible

#include <vector>

#include "nsim/foundation/random_source.hpp"
#include "nsim/game/condition_evaluator.hpp"
#include "nsim/game/content_catalog.hpp"
#include "nsim/game/event_types.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::game {

class EventScheduler {
public:
    EventScheduler(SessionState& state, const EventCatalog& events,
                   const ConditionEvaluator& evaluator, foundation::RandomSource& random);

    /// The event for the current turn. Always returns an event; the
    /// reference stays valid for the catalog's lifetime.
    const EventDefinition& nextEvent();

    /// Remove and resolve the best due pending entry, if any. An entry whose
    /// id is not in the catalog is consumed and yields nullptr.
    const EventDefinition* takePendingEvent();

    /// Catalog events eligible right now, in catalog order.
    /// Probability triggers consume draws.
    std::vector<const EventDefinition*> eligibleEvents() const;

    [[nodiscard]] bool isEventAvailable(const EventDefinition& event) const;

    /// Visible options with availability marked; hidden options are dropped.
    std::vector<OptionView> availableOptions(const EventDefinition& event) const;

    /// Pick by weight: draw in [0, total), subtract weights in order,
    /// the entry that brings the remainder to <= 0 wins. Entries with
    /// weight <= 0 never win; nullptr when none has a positive weight.
    /// An explicit weight of 0 is kept as 0, not replaced by the default
    /// weight, so such events only run when queued as follow-ups.
    const EventDefinition* pickWeighted(
        const std::vector<const EventDefinition*>& candidates) const;

    /// Repeatable fallback event, never tracked as once-only.
    static const EventDefinition& defaultEvent();

private:
    SessionState& state_;
    const EventCatalog& events_;
    const ConditionEvaluator& evaluator_;
    foundation::RandomSource& random_;
};

}  // namespace nsim::game
