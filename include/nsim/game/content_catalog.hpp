#pragma once

/// @file content_catalog.hpp
/// @brief Id-indexed, load-once catalogs of events, endings and characters.
///
/// Catalogs are built by the content loader, then shared read-only by
/// every session of a run. Cross references (prerequisites, exclusions,
/// character scopes) stay as ids and are resolved here on demand.

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "nsim/foundation/game_result.hpp"
#include "nsim/game/ending_types.hpp"
#include "nsim/game/event_types.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::game {

/// Entries in load order with an id index.
template <typename T>
class IdCatalog {
public:
    /// Append an entry; rejects an id already present.
    foundation::GameResult<void> add(T entry) {
        if (index_.count(entry.id) > 0) {
            return foundation::GameResult<void>::err(foundation::GameError(
                foundation::ErrorCode::DuplicateId, "duplicate id: " + entry.id));
        }
        index_.emplace(entry.id, entries_.size());
        entries_.push_back(std::move(entry));
        return foundation::GameResult<void>::ok();
    }

    [[nodiscard]] const T* find(std::string_view id) const {
        auto it = index_.find(std::string(id));
        return it != index_.end() ? &entries_[it->second] : nullptr;
    }

    [[nodiscard]] bool contains(std::string_view id) const { return find(id) != nullptr; }

    [[nodiscard]] const std::vector<T>& entries() const noexcept { return entries_; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<T> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

using EventCatalog = IdCatalog<EventDefinition>;
using EndingCatalog = IdCatalog<EndingDefinition>;
using CharacterRoster = IdCatalog<CharacterProfile>;

/// Everything a run reads but never writes.
struct ContentCatalog {
    EventCatalog events;
    EndingCatalog endings;
    CharacterRoster characters;
};

}  // namespace nsim::game
