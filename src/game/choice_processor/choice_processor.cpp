/// @file choice_processor.cpp
/// @brief ChoiceProcessor implementation.

#include "nsim/game/choice_processor.hpp"

#include <chrono>

#include "nsim/foundation/game_logger.hpp"

namespace nsim::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace

ChoiceProcessor::ChoiceProcessor(SessionState& state, AttributeStore& attributes,
                                 const ConditionEvaluator& evaluator,
                                 const ProgressClock& clock,
                                 foundation::RandomSource& random)
    : state_(state),
      attributes_(attributes),
      evaluator_(evaluator),
      clock_(clock),
      random_(random) {}

GameResult<ChoiceOutcome> ChoiceProcessor::process(const EventDefinition& event,
                                                   std::size_t optionIndex) {
    if (optionIndex >= event.options.size()) {
        return GameResult<ChoiceOutcome>::err(GameError(
            ErrorCode::NotFound,
            "option " + std::to_string(optionIndex) + " not found in event " + event.id));
    }
    const auto& option = event.options[optionIndex];

    ChoiceOutcome outcome;
    outcome.eventId = event.id;
    outcome.optionId = option.id;
    outcome.optionIndex = optionIndex;
    outcome.effects = attributes_.applyEffects(option.effects, evaluator_);

    recordHistory(event, optionIndex, option);

    if (event.onceOnly) {
        markTriggered(event.id);
    }

    for (const auto& spec : option.followUps) {
        auto pending = resolveFollowUp(spec);
        if (!pending) {
            continue;
        }
        if (spec.probability && random_.next() > *spec.probability) {
            continue;
        }
        state_.pendingEvents.push_back(*pending);
        outcome.queued.push_back(std::move(*pending));
    }

    outcome.specialOutcome = option.specialOutcome;
    outcome.feedback = option.feedback;

    LogContext ctx;
    ctx.day = state_.progress.day;
    ctx.period = state_.progress.period;
    ctx.eventId = event.id;
    ctx.extra["option"] = option.id;
    ctx.extra["effects"] = std::to_string(outcome.effects.size());
    ctx.extra["queued"] = std::to_string(outcome.queued.size());
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Debug, LogCategory::Choice, "Choice resolved", ctx);

    return GameResult<ChoiceOutcome>::ok(std::move(outcome));
}

std::optional<PendingEvent> ChoiceProcessor::resolveFollowUp(const FollowUpSpec& spec) const {
    PendingEvent pending;
    pending.eventId = spec.eventId;
    pending.priority = spec.priority;

    switch (spec.delay) {
        case FollowUpDelay::Immediate:
            // Immediate follow-ups are never queued.
            return std::nullopt;
        case FollowUpDelay::NextPeriod: {
            auto [day, period] = clock_.nextSlot();
            pending.triggerDay = day;
            pending.triggerPeriod = period;
            break;
        }
        case FollowUpDelay::NextDay:
            pending.triggerDay = clock_.day() + 1;
            pending.triggerPeriod = 0;
            break;
    }
    return pending;
}

void ChoiceProcessor::markTriggered(const std::string& eventId) {
    if (!state_.isEventTriggered(eventId)) {
        state_.triggeredOnceEvents.push_back(eventId);
    }
}

void ChoiceProcessor::recordHistory(const EventDefinition& event, std::size_t optionIndex,
                                    const OptionDefinition& option) {
    EventHistoryRecord record;
    record.eventId = event.id;
    record.day = state_.progress.day;
    record.period = state_.progress.period;
    record.choiceIndex = optionIndex;
    record.choiceId = option.id;
    record.timestamp = nowMillis();
    state_.eventHistory.push_back(std::move(record));

    ++state_.statistics.totalEvents;
    ++state_.statistics.totalChoices;
}

}  // namespace nsim::game
