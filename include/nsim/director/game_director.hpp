#pragma once

/// @file game_director.hpp
/// @brief Turn driver: event -> options -> choice -> clock -> ending.

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "nsim/foundation/game_result.hpp"
#include "nsim/game/game_session.hpp"
#include "nsim/persistence/save_slot_store.hpp"

namespace nsim::director {

/// What one resolved choice did to the run.
struct TurnReport {
    game::ChoiceOutcome outcome;
    bool newDay = false;
    bool autoSaved = false;
    /// Event for the following turn; null once the run has finished.
    const game::EventDefinition* nextEvent = nullptr;
    std::optional<game::EndingResult> ending;

    [[nodiscard]] bool finished() const noexcept { return ending.has_value(); }
};

struct DirectorOptions {
    bool autoSave = true;
};

/// Drives one session through its turns.
///
/// The director owns nothing: the session and the optional save store
/// are borrowed and must outlive it.
///
/// Usage:
/// @code
///   GameDirector director(session, &saves);
///   auto event = director.begin();
///   while (event && !director.finished()) {
///       auto turn = director.choose(pickOption(director.options().value()));
///       if (!turn) break;
///       if (turn.value().finished()) show(*turn.value().ending);
///   }
/// @endcode
class GameDirector {
public:
    GameDirector(game::GameSession& session, persistence::SaveSlotStore* saves = nullptr,
                 DirectorOptions options = {});

    /// Produce the event for the current turn.
    /// @return RunFinished once the ending is resolved.
    foundation::GameResult<const game::EventDefinition*> begin();

    /// Visible options of the current event.
    /// @return NoActiveEvent before begin() or after the run finished.
    [[nodiscard]] foundation::GameResult<std::vector<game::OptionView>> options() const;

    /// Resolve option @p optionIndex (index into the event's option list).
    /// @return OptionUnavailable for hidden or locked options, RunFinished
    ///         after the ending, NotFound for an index past the list.
    foundation::GameResult<TurnReport> choose(std::size_t optionIndex);

    /// Save into @p slot, stamping the session's last save time.
    foundation::GameResult<void> save(std::size_t slot, std::string_view name);

    /// Restore from @p slot and produce the event for the restored turn.
    foundation::GameResult<void> load(std::size_t slot);

    [[nodiscard]] bool finished() const noexcept { return ending_.has_value(); }

    [[nodiscard]] const std::optional<game::EndingResult>& ending() const noexcept {
        return ending_;
    }

    [[nodiscard]] const game::EventDefinition* currentEvent() const noexcept { return current_; }

private:
    void resolveEnding();
    foundation::GameResult<void> saveSnapshot(std::size_t slot, std::string_view name);

    bool autoSave();

    game::GameSession& session_;
    persistence::SaveSlotStore* saves_;
    DirectorOptions options_;
    const game::EventDefinition* current_ = nullptr;
    std::optional<game::EndingResult> ending_;
};

}  // namespace nsim::director
