#pragma once

/// @file game_session.hpp
/// @brief GameSession: one run's state plus the components that act on it.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nsim/foundation/game_result.hpp"
#include "nsim/foundation/random_source.hpp"
#include "nsim/game/attribute_store.hpp"
#include "nsim/game/choice_processor.hpp"
#include "nsim/game/condition_evaluator.hpp"
#include "nsim/game/content_catalog.hpp"
#include "nsim/game/ending_resolver.hpp"
#include "nsim/game/event_scheduler.hpp"
#include "nsim/game/game_config.hpp"
#include "nsim/game/progress_clock.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::game {

/// Owns every piece of mutable per-run state.
///
/// Catalogs and the random source are borrowed and must outlive the
/// session. Components hold references into the owned state, so a
/// session is neither copyable nor movable; independent sessions may
/// coexist freely.
///
/// Example:
/// @code
///   SeededRandomSource random(42);
///   GameSession session(config, content, random);
///   session.startNewRunAs("fan_tong");
///   while (!session.isOver()) {
///       const auto& event = session.nextEvent();
///       auto outcome = session.choose(event, 0);
///       if (outcome && outcome.value().endsRun()) break;
///       session.advanceTime();
///   }
///   auto ending = session.determineEnding();
/// @endcode
class GameSession {
public:
    GameSession(GameConfig config, const ContentCatalog& content,
                foundation::RandomSource& random);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;
    GameSession(GameSession&&) = delete;
    GameSession& operator=(GameSession&&) = delete;

    /// Reset all run state and start on day 1, period 0.
    /// Without a profile (or with empty initial attributes) the built-in
    /// starting attributes are used.
    void startNewRun(std::optional<CharacterProfile> character);

    /// Start with a character from the roster; NotFound if unknown.
    foundation::GameResult<void> startNewRunAs(std::string_view characterId);

    // -- Turn operations ------------------------------------------------------

    const EventDefinition& nextEvent();

    [[nodiscard]] std::vector<OptionView> availableOptions(const EventDefinition& event) const;

    foundation::GameResult<ChoiceOutcome> choose(const EventDefinition& event,
                                                 std::size_t optionIndex);

    /// @return true if the call crossed into a new day.
    bool advanceTime();

    [[nodiscard]] bool isOver() const noexcept;

    [[nodiscard]] EndingResult determineEnding() const;

    // -- Snapshots ------------------------------------------------------------

    [[nodiscard]] SessionState serialize() const;

    void deserialize(SessionState snapshot);

    void markSaved(int64_t timestampMs);

    // -- Flags and inventory --------------------------------------------------

    void setFlag(const std::string& name, FlagValue value);

    [[nodiscard]] std::optional<FlagValue> flag(const std::string& name) const;

    [[nodiscard]] bool hasFlag(const std::string& name) const;

    /// Adjust an item count; counts never drop below zero.
    void addItem(const std::string& item, int64_t count);

    [[nodiscard]] int64_t itemCount(const std::string& item) const;

    // -- Accessors ------------------------------------------------------------

    [[nodiscard]] const SessionState& state() const noexcept { return state_; }
    [[nodiscard]] const GameConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ContentCatalog& content() const noexcept { return content_; }
    [[nodiscard]] const ProgressClock& clock() const noexcept { return clock_; }

    AttributeStore& attributes() noexcept { return attributes_; }
    [[nodiscard]] const AttributeStore& attributes() const noexcept { return attributes_; }
    [[nodiscard]] const ConditionEvaluator& evaluator() const noexcept { return evaluator_; }
    EventScheduler& scheduler() noexcept { return scheduler_; }
    ChoiceProcessor& choices() noexcept { return processor_; }
    [[nodiscard]] const EndingResolver& endings() const noexcept { return resolver_; }

    /// Starting attributes used when a profile supplies none.
    static AttributeSet fallbackAttributes();

private:
    GameConfig config_;
    const ContentCatalog& content_;
    foundation::RandomSource& random_;

    SessionState state_;
    ProgressClock clock_;
    AttributeStore attributes_;
    ConditionEvaluator evaluator_;
    EventScheduler scheduler_;
    ChoiceProcessor processor_;
    EndingResolver resolver_;
};

}  // namespace nsim::game
