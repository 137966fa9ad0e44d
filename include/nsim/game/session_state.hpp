#pragma once

/// @file session_state.hpp
/// @brief All mutable per-run state; also the snapshot handed to persistence.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nsim/game/attribute_types.hpp"
#include "nsim/game/condition_types.hpp"

namespace nsim::game {

struct SessionMeta {
    std::string version;
    std::optional<int64_t> startTime;     ///< ms since epoch.
    std::optional<int64_t> lastSaveTime;  ///< ms since epoch.
    int64_t playCount = 0;

    bool operator==(const SessionMeta&) const = default;
};

/// Position on the calendar. Day is 1-based, period 0-based.
struct Progress {
    int day = 1;
    int period = 0;
    int64_t totalPeriods = 0;

    bool operator==(const Progress&) const = default;
};

struct CharacterProfile {
    std::string id;
    std::string name;
    std::string title;
    AttributeSet initialAttributes;

    bool operator==(const CharacterProfile&) const = default;
};

/// Immutable log entry for one resolved choice.
struct EventHistoryRecord {
    std::string eventId;
    int day = 1;
    int period = 0;
    std::size_t choiceIndex = 0;
    std::string choiceId;
    int64_t timestamp = 0;  ///< ms since epoch.

    bool operator==(const EventHistoryRecord&) const = default;
};

/// Event scheduled for a future slot. An unset day or period matches any.
struct PendingEvent {
    std::string eventId;
    std::optional<int> triggerDay;
    std::optional<int> triggerPeriod;
    int32_t priority = 0;

    bool operator==(const PendingEvent&) const = default;
};

struct SessionStatistics {
    int64_t totalEvents = 0;
    int64_t totalChoices = 0;
    double moneySpent = 0.0;
    double moneyEarned = 0.0;
    int64_t redEnvelopesGiven = 0;
    int64_t redEnvelopesReceived = 0;
    int64_t mealsEaten = 0;
    int64_t relativesMet = 0;

    bool operator==(const SessionStatistics&) const = default;
};

using Inventory = std::map<std::string, int64_t>;
using FlagMap = std::map<std::string, FlagValue>;

/// The aggregate serialized as a snapshot:
/// {meta, progress, character, attributes, inventory, eventHistory,
///  flags, pendingEvents, triggeredOnceEvents, statistics}.
struct SessionState {
    SessionMeta meta;
    Progress progress;
    std::optional<CharacterProfile> character;
    AttributeSet attributes;
    Inventory inventory;
    std::vector<EventHistoryRecord> eventHistory;
    FlagMap flags;
    std::vector<PendingEvent> pendingEvents;       ///< Insertion order.
    std::vector<std::string> triggeredOnceEvents;  ///< Unique, first-trigger order.
    SessionStatistics statistics;

    bool operator==(const SessionState&) const = default;

    [[nodiscard]] bool isEventTriggered(const std::string& eventId) const;
};

}  // namespace nsim::game
