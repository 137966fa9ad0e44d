/// @file game_session.cpp
/// @brief GameSession implementation.

#include "nsim/game/game_session.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "nsim/foundation/game_logger.hpp"

namespace nsim::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

GameSession::GameSession(GameConfig config, const ContentCatalog& content,
                         foundation::RandomSource& random)
    : config_(std::move(config)),
      content_(content),
      random_(random),
      clock_(state_.progress, config_.calendar),
      attributes_(state_, config_.schema, random_),
      evaluator_(state_, attributes_, random_),
      scheduler_(state_, content_.events, evaluator_, random_),
      processor_(state_, attributes_, evaluator_, clock_, random_),
      resolver_(state_, content_.endings, attributes_, evaluator_, config_.calendar) {
    state_.meta.version = config_.version;
}

AttributeSet GameSession::fallbackAttributes() {
    return {
        {"deposit", 5000.0},
        {"weight", 65.0},
        {"face", 50.0},
        {"mood", 70.0},
        {"health", 80.0},
        {"luck", 50.0},
    };
}

void GameSession::startNewRun(std::optional<CharacterProfile> character) {
    const int64_t playCount = state_.meta.playCount;

    state_ = SessionState{};
    state_.meta.version = config_.version;
    state_.meta.playCount = playCount + 1;
    state_.meta.startTime = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();

    if (character && !character->initialAttributes.empty()) {
        state_.attributes = character->initialAttributes;
    } else {
        state_.attributes = fallbackAttributes();
    }
    // Schema attributes the profile leaves out start at their defaults.
    for (const auto& [name, bounds] : config_.schema.bounds) {
        state_.attributes.try_emplace(name, bounds.defaultValue);
    }
    state_.character = std::move(character);
    attributes_.clampAll();

    LogContext ctx;
    if (state_.character) {
        ctx.characterId = state_.character->id;
    }
    ctx.extra["play_count"] = std::to_string(state_.meta.playCount);
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Core, "New run started", ctx);
}

GameResult<void> GameSession::startNewRunAs(std::string_view characterId) {
    const auto* profile = content_.characters.find(characterId);
    if (profile == nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::NotFound, "unknown character: " + std::string(characterId)));
    }
    startNewRun(std::optional<CharacterProfile>(*profile));
    return GameResult<void>::ok();
}

const EventDefinition& GameSession::nextEvent() {
    return scheduler_.nextEvent();
}

std::vector<OptionView> GameSession::availableOptions(const EventDefinition& event) const {
    return scheduler_.availableOptions(event);
}

GameResult<ChoiceOutcome> GameSession::choose(const EventDefinition& event,
                                              std::size_t optionIndex) {
    return processor_.process(event, optionIndex);
}

bool GameSession::advanceTime() {
    return clock_.advance();
}

bool GameSession::isOver() const noexcept {
    return clock_.isOver();
}

EndingResult GameSession::determineEnding() const {
    return resolver_.determineEnding();
}

SessionState GameSession::serialize() const {
    return state_;
}

void GameSession::deserialize(SessionState snapshot) {
    state_ = std::move(snapshot);
    if (state_.meta.version.empty()) {
        state_.meta.version = config_.version;
    }
}

void GameSession::markSaved(int64_t timestampMs) {
    state_.meta.lastSaveTime = timestampMs;
}

void GameSession::setFlag(const std::string& name, FlagValue value) {
    state_.flags[name] = std::move(value);
}

std::optional<FlagValue> GameSession::flag(const std::string& name) const {
    auto it = state_.flags.find(name);
    if (it == state_.flags.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool GameSession::hasFlag(const std::string& name) const {
    return state_.flags.count(name) > 0;
}

void GameSession::addItem(const std::string& item, int64_t count) {
    auto& held = state_.inventory[item];
    held = std::max<int64_t>(0, held + count);
    if (held == 0) {
        state_.inventory.erase(item);
    }
}

int64_t GameSession::itemCount(const std::string& item) const {
    auto it = state_.inventory.find(item);
    return it != state_.inventory.end() ? it->second : 0;
}

}  // namespace nsim::game
