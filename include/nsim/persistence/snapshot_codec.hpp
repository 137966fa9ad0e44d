#pragma once

/// @file snapshot_codec.hpp
/// @brief YAML encoding of SessionState snapshots.
///
/// Layout (every section optional on decode):
/// @code
///   meta:        {version, start_time, last_save_time, play_count}
///   progress:    {day, period, total_periods}
///   character:   {id, name, title, initial_attributes: {name: value}}
///   attributes:  {name: value}
///   inventory:   {item: count}
///   event_history:  [{event_id, day, period, choice_index, choice_id, timestamp}]
///   flags:       {name: bool | number | "string"}
///   pending_events: [{event_id, trigger_day, trigger_period, priority}]
///   triggered_once_events: [id, ...]
///   statistics:  {total_events, total_choices, money_spent, ...}
/// @endcode

#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "nsim/foundation/game_result.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::persistence {

/// Encode @p state as a YAML document.
[[nodiscard]] std::string encodeSnapshot(const game::SessionState& state);

/// Decode a document produced by encodeSnapshot(). Missing sections and
/// fields take their defaults; structurally wrong documents yield
/// SnapshotInvalid.
foundation::GameResult<game::SessionState> decodeSnapshot(std::string_view text);

/// Emit @p state as a YAML map into an open emitter (for embedding).
void emitSnapshot(YAML::Emitter& out, const game::SessionState& state);

/// Read a snapshot map already parsed from a larger document.
foundation::GameResult<game::SessionState> readSnapshot(const YAML::Node& node);

}  // namespace nsim::persistence
