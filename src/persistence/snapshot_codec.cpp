/// @file snapshot_codec.cpp
/// @brief SessionState <-> YAML.

#include "nsim/persistence/snapshot_codec.hpp"

#include <optional>
#include <string>
#include <utility>

#include "nsim/content/yaml_values.hpp"

namespace nsim::persistence {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

/// Doubles must survive a round trip bit for bit.
constexpr int kDoublePrecision = 17;

// -- Encoding -----------------------------------------------------------------

void emitAttributeMap(YAML::Emitter& out, const game::AttributeSet& attributes) {
    out << YAML::BeginMap;
    for (const auto& [name, value] : attributes) {
        out << YAML::Key << name << YAML::Value << value;
    }
    out << YAML::EndMap;
}

template <typename T>
void emitOptional(YAML::Emitter& out, const char* key, const std::optional<T>& value) {
    if (value) {
        out << YAML::Key << key << YAML::Value << *value;
    }
}

// -- Decoding -----------------------------------------------------------------

std::string join(const std::string& path, const char* key) {
    return path.empty() ? std::string(key) : path + "." + key;
}

/// Field-by-field reader that keeps the first structural error.
class SnapshotReader {
public:
    /// Decode @p parent[key] into @p out when present.
    template <typename T>
    void field(const YAML::Node& parent, const char* key, T& out, const std::string& path) {
        const YAML::Node node = parent[key];
        if (!node || node.IsNull()) {
            return;
        }
        T value{};
        if (!node.IsScalar() || !YAML::convert<T>::decode(node, value)) {
            fail(join(path, key), "unexpected value");
            return;
        }
        out = std::move(value);
    }

    template <typename T>
    void field(const YAML::Node& parent, const char* key, std::optional<T>& out,
               const std::string& path) {
        const YAML::Node node = parent[key];
        if (!node || node.IsNull()) {
            return;
        }
        T value{};
        field(parent, key, value, path);
        if (ok()) {
            out = std::move(value);
        }
    }

    /// @p parent[key] as a map, or nullopt when absent or mistyped.
    std::optional<YAML::Node> map(const YAML::Node& parent, const char* key,
                                  const std::string& path) {
        return section(parent, key, path, YAML::NodeType::Map);
    }

    std::optional<YAML::Node> sequence(const YAML::Node& parent, const char* key,
                                       const std::string& path) {
        return section(parent, key, path, YAML::NodeType::Sequence);
    }

    void fail(const std::string& path, const std::string& what) {
        if (!error_) {
            error_ = GameError(ErrorCode::SnapshotInvalid, path + ": " + what, path);
        }
    }

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }

    [[nodiscard]] const GameError& error() const { return *error_; }

private:
    std::optional<YAML::Node> section(const YAML::Node& parent, const char* key,
                                      const std::string& path, YAML::NodeType::value type) {
        const YAML::Node node = parent[key];
        if (!node || node.IsNull()) {
            return std::nullopt;
        }
        if (node.Type() != type) {
            fail(join(path, key), type == YAML::NodeType::Map ? "expected a mapping"
                                                              : "expected a list");
            return std::nullopt;
        }
        return node;
    }

    std::optional<GameError> error_;
};

void readAttributeMap(SnapshotReader& reader, const std::optional<YAML::Node>& node,
                      game::AttributeSet& out, const std::string& path) {
    if (!node) {
        return;
    }
    for (auto it = node->begin(); it != node->end(); ++it) {
        double value = 0.0;
        if (!it->second.IsScalar() || !YAML::convert<double>::decode(it->second, value)) {
            reader.fail(path + "." + it->first.Scalar(), "expected a number");
            return;
        }
        out[it->first.Scalar()] = value;
    }
}

void readCharacter(SnapshotReader& reader, const YAML::Node& root, game::SessionState& state) {
    const YAML::Node node = root["character"];
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        reader.fail("character", "expected a mapping");
        return;
    }
    game::CharacterProfile profile;
    reader.field(node, "id", profile.id, "character");
    reader.field(node, "name", profile.name, "character");
    reader.field(node, "title", profile.title, "character");
    readAttributeMap(reader, reader.map(node, "initial_attributes", "character"),
                     profile.initialAttributes, "character.initial_attributes");
    state.character = std::move(profile);
}

void readHistory(SnapshotReader& reader, const YAML::Node& root, game::SessionState& state) {
    const auto history = reader.sequence(root, "event_history", "");
    if (!history) {
        return;
    }
    const YAML::Node& list = *history;
    for (std::size_t i = 0; i < list.size() && reader.ok(); ++i) {
        const auto path = "event_history[" + std::to_string(i) + "]";
        if (!list[i].IsMap()) {
            reader.fail(path, "expected a mapping");
            return;
        }
        game::EventHistoryRecord record;
        reader.field(list[i], "event_id", record.eventId, path);
        reader.field(list[i], "day", record.day, path);
        reader.field(list[i], "period", record.period, path);
        reader.field(list[i], "choice_index", record.choiceIndex, path);
        reader.field(list[i], "choice_id", record.choiceId, path);
        reader.field(list[i], "timestamp", record.timestamp, path);
        state.eventHistory.push_back(std::move(record));
    }
}

void readPending(SnapshotReader& reader, const YAML::Node& root, game::SessionState& state) {
    const auto pendingList = reader.sequence(root, "pending_events", "");
    if (!pendingList) {
        return;
    }
    const YAML::Node& list = *pendingList;
    for (std::size_t i = 0; i < list.size() && reader.ok(); ++i) {
        const auto path = "pending_events[" + std::to_string(i) + "]";
        if (!list[i].IsMap()) {
            reader.fail(path, "expected a mapping");
            return;
        }
        game::PendingEvent pending;
        reader.field(list[i], "event_id", pending.eventId, path);
        reader.field(list[i], "trigger_day", pending.triggerDay, path);
        reader.field(list[i], "trigger_period", pending.triggerPeriod, path);
        reader.field(list[i], "priority", pending.priority, path);
        state.pendingEvents.push_back(std::move(pending));
    }
}

}  // namespace

void emitSnapshot(YAML::Emitter& out, const game::SessionState& state) {
    out.SetDoublePrecision(kDoublePrecision);
    out << YAML::BeginMap;

    out << YAML::Key << "meta" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << state.meta.version;
    emitOptional(out, "start_time", state.meta.startTime);
    emitOptional(out, "last_save_time", state.meta.lastSaveTime);
    out << YAML::Key << "play_count" << YAML::Value << state.meta.playCount;
    out << YAML::EndMap;

    out << YAML::Key << "progress" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "day" << YAML::Value << state.progress.day;
    out << YAML::Key << "period" << YAML::Value << state.progress.period;
    out << YAML::Key << "total_periods" << YAML::Value << state.progress.totalPeriods;
    out << YAML::EndMap;

    if (state.character) {
        const auto& character = *state.character;
        out << YAML::Key << "character" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << YAML::DoubleQuoted << character.id;
        out << YAML::Key << "name" << YAML::Value << YAML::DoubleQuoted << character.name;
        out << YAML::Key << "title" << YAML::Value << YAML::DoubleQuoted << character.title;
        out << YAML::Key << "initial_attributes" << YAML::Value;
        emitAttributeMap(out, character.initialAttributes);
        out << YAML::EndMap;
    }

    out << YAML::Key << "attributes" << YAML::Value;
    emitAttributeMap(out, state.attributes);

    out << YAML::Key << "inventory" << YAML::Value << YAML::BeginMap;
    for (const auto& [item, count] : state.inventory) {
        out << YAML::Key << item << YAML::Value << count;
    }
    out << YAML::EndMap;

    out << YAML::Key << "event_history" << YAML::Value << YAML::BeginSeq;
    for (const auto& record : state.eventHistory) {
        out << YAML::BeginMap;
        out << YAML::Key << "event_id" << YAML::Value << YAML::DoubleQuoted << record.eventId;
        out << YAML::Key << "day" << YAML::Value << record.day;
        out << YAML::Key << "period" << YAML::Value << record.period;
        out << YAML::Key << "choice_index" << YAML::Value << record.choiceIndex;
        out << YAML::Key << "choice_id" << YAML::Value << YAML::DoubleQuoted << record.choiceId;
        out << YAML::Key << "timestamp" << YAML::Value << record.timestamp;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "flags" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, value] : state.flags) {
        out << YAML::Key << name << YAML::Value;
        content::emitFlagValue(out, value);
    }
    out << YAML::EndMap;

    out << YAML::Key << "pending_events" << YAML::Value << YAML::BeginSeq;
    for (const auto& pending : state.pendingEvents) {
        out << YAML::BeginMap;
        out << YAML::Key << "event_id" << YAML::Value << YAML::DoubleQuoted << pending.eventId;
        emitOptional(out, "trigger_day", pending.triggerDay);
        emitOptional(out, "trigger_period", pending.triggerPeriod);
        out << YAML::Key << "priority" << YAML::Value << pending.priority;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "triggered_once_events" << YAML::Value << YAML::BeginSeq;
    for (const auto& id : state.triggeredOnceEvents) {
        out << YAML::DoubleQuoted << id;
    }
    out << YAML::EndSeq;

    const auto& stats = state.statistics;
    out << YAML::Key << "statistics" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "total_events" << YAML::Value << stats.totalEvents;
    out << YAML::Key << "total_choices" << YAML::Value << stats.totalChoices;
    out << YAML::Key << "money_spent" << YAML::Value << stats.moneySpent;
    out << YAML::Key << "money_earned" << YAML::Value << stats.moneyEarned;
    out << YAML::Key << "red_envelopes_given" << YAML::Value << stats.redEnvelopesGiven;
    out << YAML::Key << "red_envelopes_received" << YAML::Value << stats.redEnvelopesReceived;
    out << YAML::Key << "meals_eaten" << YAML::Value << stats.mealsEaten;
    out << YAML::Key << "relatives_met" << YAML::Value << stats.relativesMet;
    out << YAML::EndMap;

    out << YAML::EndMap;
}

std::string encodeSnapshot(const game::SessionState& state) {
    YAML::Emitter out;
    emitSnapshot(out, state);
    return out.c_str();
}

GameResult<game::SessionState> readSnapshot(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        return GameResult<game::SessionState>::err(
            GameError(ErrorCode::SnapshotInvalid, "snapshot root must be a mapping"));
    }

    game::SessionState state;
    SnapshotReader reader;

    if (const auto meta = reader.map(root, "meta", "")) {
        reader.field(*meta, "version", state.meta.version, "meta");
        reader.field(*meta, "start_time", state.meta.startTime, "meta");
        reader.field(*meta, "last_save_time", state.meta.lastSaveTime, "meta");
        reader.field(*meta, "play_count", state.meta.playCount, "meta");
    }

    if (const auto progress = reader.map(root, "progress", "")) {
        reader.field(*progress, "day", state.progress.day, "progress");
        reader.field(*progress, "period", state.progress.period, "progress");
        reader.field(*progress, "total_periods", state.progress.totalPeriods, "progress");
    }

    readCharacter(reader, root, state);
    readAttributeMap(reader, reader.map(root, "attributes", ""), state.attributes, "attributes");

    if (const auto inventory = reader.map(root, "inventory", "")) {
        for (auto it = inventory->begin(); it != inventory->end() && reader.ok(); ++it) {
            int64_t count = 0;
            if (!it->second.IsScalar() || !YAML::convert<int64_t>::decode(it->second, count)) {
                reader.fail("inventory." + it->first.Scalar(), "expected an integer");
                break;
            }
            state.inventory[it->first.Scalar()] = count;
        }
    }

    readHistory(reader, root, state);

    if (const auto flags = reader.map(root, "flags", "")) {
        for (auto it = flags->begin(); it != flags->end() && reader.ok(); ++it) {
            auto value = content::decodeFlagValue(it->second);
            if (!value) {
                reader.fail("flags." + it->first.Scalar(), "expected a scalar");
                break;
            }
            state.flags[it->first.Scalar()] = std::move(*value);
        }
    }

    readPending(reader, root, state);

    if (const auto triggered = reader.sequence(root, "triggered_once_events", "")) {
        for (std::size_t i = 0; i < triggered->size() && reader.ok(); ++i) {
            const YAML::Node id = (*triggered)[i];
            if (!id.IsScalar()) {
                reader.fail("triggered_once_events[" + std::to_string(i) + "]",
                            "expected an event id");
                break;
            }
            state.triggeredOnceEvents.push_back(id.Scalar());
        }
    }

    if (const auto stats = reader.map(root, "statistics", "")) {
        auto& out = state.statistics;
        reader.field(*stats, "total_events", out.totalEvents, "statistics");
        reader.field(*stats, "total_choices", out.totalChoices, "statistics");
        reader.field(*stats, "money_spent", out.moneySpent, "statistics");
        reader.field(*stats, "money_earned", out.moneyEarned, "statistics");
        reader.field(*stats, "red_envelopes_given", out.redEnvelopesGiven, "statistics");
        reader.field(*stats, "red_envelopes_received", out.redEnvelopesReceived, "statistics");
        reader.field(*stats, "meals_eaten", out.mealsEaten, "statistics");
        reader.field(*stats, "relatives_met", out.relativesMet, "statistics");
    }

    if (!reader.ok()) {
        return GameResult<game::SessionState>::err(reader.error());
    }
    return GameResult<game::SessionState>::ok(std::move(state));
}

GameResult<game::SessionState> decodeSnapshot(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::ParserException& e) {
        return GameResult<game::SessionState>::err(
            GameError(ErrorCode::SnapshotInvalid, std::string("YAML parse error: ") + e.what()));
    }
    return readSnapshot(root);
}

}  // namespace nsim::persistence
