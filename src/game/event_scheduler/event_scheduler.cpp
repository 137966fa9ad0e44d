/// @file event_scheduler.cpp
/// @brief EventScheduler implementation.

#include "nsim/game/event_scheduler.hpp"

#include <algorithm>

#include "nsim/foundation/game_logger.hpp"

namespace nsim::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr const char* kDefaultUnavailableReason = "Requirements not met";

bool pendingIsDue(const PendingEvent& pending, const Progress& progress) {
    if (pending.triggerDay && *pending.triggerDay != progress.day) {
        return false;
    }
    if (pending.triggerPeriod && *pending.triggerPeriod != progress.period) {
        return false;
    }
    return true;
}

Effect addEffect(const char* attribute, double value) {
    Effect effect;
    effect.attribute = attribute;
    effect.value = value;
    return effect;
}

EventDefinition buildDefaultEvent() {
    EventDefinition event;
    event.id = "default_event";
    event.title = "A Quiet Moment";
    event.description = "Nothing in particular happens. You enjoy a quiet moment.";
    event.category = "random";

    OptionDefinition relax;
    relax.id = "relax";
    relax.text = "Get some rest";
    relax.effects = {addEffect("mood", 5.0)};

    OptionDefinition exercise;
    exercise.id = "exercise";
    exercise.text = "Do some exercise";
    exercise.effects = {addEffect("health", 3.0), addEffect("weight", -0.5)};

    OptionDefinition snack;
    snack.id = "snack";
    snack.text = "Have a snack";
    snack.effects = {addEffect("mood", 3.0), addEffect("weight", 0.5)};

    event.options = {std::move(relax), std::move(exercise), std::move(snack)};
    return event;
}

}  // namespace

EventScheduler::EventScheduler(SessionState& state, const EventCatalog& events,
                               const ConditionEvaluator& evaluator,
                               foundation::RandomSource& random)
    : state_(state), events_(events), evaluator_(evaluator), random_(random) {}

const EventDefinition& EventScheduler::defaultEvent() {
    static const EventDefinition event = buildDefaultEvent();
    return event;
}

const EventDefinition& EventScheduler::nextEvent() {
    if (const auto* pending = takePendingEvent()) {
        return *pending;
    }

    auto eligible = eligibleEvents();
    if (eligible.empty()) {
        NSIM_LOG_DEBUG(LogCategory::Scheduler, "No eligible event, using the quiet moment");
        return defaultEvent();
    }

    const auto* picked = pickWeighted(eligible);
    return picked != nullptr ? *picked : defaultEvent();
}

const EventDefinition* EventScheduler::takePendingEvent() {
    auto& queue = state_.pendingEvents;

    auto best = queue.end();
    for (auto it = queue.begin(); it != queue.end(); ++it) {
        if (!pendingIsDue(*it, state_.progress)) {
            continue;
        }
        // Strictly greater keeps the earliest entry on ties.
        if (best == queue.end() || it->priority > best->priority) {
            best = it;
        }
    }
    if (best == queue.end()) {
        return nullptr;
    }

    const std::string eventId = best->eventId;
    queue.erase(best);

    LogContext ctx;
    ctx.day = state_.progress.day;
    ctx.period = state_.progress.period;
    ctx.eventId = eventId;

    const auto* event = events_.find(eventId);
    if (event == nullptr) {
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Scheduler,
            "Pending event not in catalog, dropped", ctx);
        return nullptr;
    }
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Debug, LogCategory::Scheduler, "Delivering pending event", ctx);
    return event;
}

std::vector<const EventDefinition*> EventScheduler::eligibleEvents() const {
    std::vector<const EventDefinition*> eligible;
    for (const auto& event : events_.entries()) {
        if (isEventAvailable(event)) {
            eligible.push_back(&event);
        }
    }
    return eligible;
}

bool EventScheduler::isEventAvailable(const EventDefinition& event) const {
    if (event.onceOnly && state_.isEventTriggered(event.id)) {
        return false;
    }

    if (!evaluator_.evaluateAll(event.triggerConditions, ConditionScope::Trigger)) {
        return false;
    }

    for (const auto& exclusive : event.mutuallyExclusive) {
        if (state_.isEventTriggered(exclusive)) {
            return false;
        }
    }

    for (const auto& prerequisite : event.prerequisites) {
        if (!state_.isEventTriggered(prerequisite)) {
            return false;
        }
    }

    // Without an active character there is nothing to restrict against.
    if (!event.exclusiveTo.empty() && state_.character) {
        const auto& allowed = event.exclusiveTo;
        if (std::find(allowed.begin(), allowed.end(), state_.character->id) == allowed.end()) {
            return false;
        }
    }

    return true;
}

const EventDefinition* EventScheduler::pickWeighted(
    const std::vector<const EventDefinition*>& candidates) const {
    double total = 0.0;
    const EventDefinition* last = nullptr;
    for (const auto* event : candidates) {
        if (event->weight > 0) {
            total += static_cast<double>(event->weight);
            last = event;
        }
    }
    // Zero-weight events are reachable only as follow-ups.
    if (last == nullptr) {
        return nullptr;
    }

    double remainder = random_.next() * total;
    for (const auto* event : candidates) {
        if (event->weight <= 0) {
            continue;
        }
        remainder -= static_cast<double>(event->weight);
        if (remainder <= 0.0) {
            return event;
        }
    }
    return last;
}

std::vector<OptionView> EventScheduler::availableOptions(const EventDefinition& event) const {
    std::vector<OptionView> views;
    views.reserve(event.options.size());

    for (std::size_t i = 0; i < event.options.size(); ++i) {
        const auto& option = event.options[i];
        if (!evaluator_.evaluateAll(option.visibilityConditions, ConditionScope::Effect)) {
            continue;
        }

        OptionView view;
        view.option = &option;
        view.index = i;
        if (!evaluator_.evaluateAll(option.availabilityConditions, ConditionScope::Effect)) {
            view.available = false;
            view.unavailableReason = option.unavailableText.empty()
                                         ? std::string(kDefaultUnavailableReason)
                                         : option.unavailableText;
        }

        views.push_back(std::move(view));
    }
    return views;
}

}  // namespace nsim::game
