/// @file game_director.cpp
/// @brief GameDirector implementation.

#include "nsim/director/game_director.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "nsim/foundation/game_logger.hpp"

namespace nsim::director {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

GameError runFinished() {
    return GameError(ErrorCode::RunFinished, "the run has already ended");
}

}  // namespace

GameDirector::GameDirector(game::GameSession& session, persistence::SaveSlotStore* saves,
                           DirectorOptions options)
    : session_(session), saves_(saves), options_(options) {}

GameResult<const game::EventDefinition*> GameDirector::begin() {
    if (ending_) {
        return GameResult<const game::EventDefinition*>::err(runFinished());
    }
    if (session_.isOver()) {
        resolveEnding();
        return GameResult<const game::EventDefinition*>::err(runFinished());
    }
    if (current_ == nullptr) {
        current_ = &session_.nextEvent();
    }
    return GameResult<const game::EventDefinition*>::ok(current_);
}

GameResult<std::vector<game::OptionView>> GameDirector::options() const {
    if (current_ == nullptr) {
        return GameResult<std::vector<game::OptionView>>::err(
            GameError(ErrorCode::NoActiveEvent, "no event is in progress"));
    }
    return GameResult<std::vector<game::OptionView>>::ok(session_.availableOptions(*current_));
}

GameResult<TurnReport> GameDirector::choose(std::size_t optionIndex) {
    if (ending_) {
        return GameResult<TurnReport>::err(runFinished());
    }
    if (current_ == nullptr) {
        return GameResult<TurnReport>::err(
            GameError(ErrorCode::NoActiveEvent, "no event is in progress"));
    }

    const auto& event = *current_;
    if (optionIndex < event.options.size()) {
        const auto views = session_.availableOptions(event);
        auto view = std::find_if(views.begin(), views.end(), [optionIndex](const auto& v) {
            return v.index == optionIndex;
        });
        if (view == views.end()) {
            return GameResult<TurnReport>::err(
                GameError(ErrorCode::OptionUnavailable, "option is hidden: " +
                                                            event.options[optionIndex].id));
        }
        if (!view->available) {
            return GameResult<TurnReport>::err(
                GameError(ErrorCode::OptionUnavailable, view->unavailableReason));
        }
    }

    auto outcome = session_.choose(event, optionIndex);
    if (!outcome) {
        return GameResult<TurnReport>::err(outcome.error());
    }

    TurnReport report;
    report.outcome = std::move(outcome).value();
    current_ = nullptr;

    if (report.outcome.endsRun()) {
        NSIM_LOG_INFO(LogCategory::Director,
                      "Option " + report.outcome.optionId + " ends the run early");
        resolveEnding();
        report.ending = ending_;
        return GameResult<TurnReport>::ok(std::move(report));
    }

    report.newDay = session_.advanceTime();
    if (session_.isOver()) {
        resolveEnding();
        report.ending = ending_;
        return GameResult<TurnReport>::ok(std::move(report));
    }

    if (report.newDay && options_.autoSave) {
        report.autoSaved = autoSave();
    }

    current_ = &session_.nextEvent();
    report.nextEvent = current_;
    return GameResult<TurnReport>::ok(std::move(report));
}

GameResult<void> GameDirector::save(std::size_t slot, std::string_view name) {
    if (saves_ == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::SaveFailed, "no save store is configured"));
    }
    return saveSnapshot(slot, name);
}

GameResult<void> GameDirector::load(std::size_t slot) {
    if (saves_ == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoadFailed, "no save store is configured"));
    }
    auto record = saves_->load(slot);
    if (!record) {
        return GameResult<void>::err(record.error());
    }
    session_.deserialize(std::move(record).value().state);
    ending_.reset();
    current_ = nullptr;

    if (session_.isOver()) {
        resolveEnding();
    } else {
        current_ = &session_.nextEvent();
    }
    return GameResult<void>::ok();
}

GameResult<void> GameDirector::saveSnapshot(std::size_t slot, std::string_view name) {
    // The session is stamped only once the store has accepted the write.
    const int64_t savedAt = nowMillis();
    auto snapshot = session_.serialize();
    snapshot.meta.lastSaveTime = savedAt;
    auto saved = saves_->save(slot, name, snapshot);
    if (saved) {
        session_.markSaved(savedAt);
    }
    return saved;
}

void GameDirector::resolveEnding() {
    current_ = nullptr;
    ending_ = session_.determineEnding();
}

bool GameDirector::autoSave() {
    if (saves_ == nullptr) {
        return false;
    }
    const auto slot = saves_->autoSaveSlot();
    auto saved = saveSnapshot(slot, "Auto Save");
    if (!saved) {
        LogContext ctx;
        ctx.day = session_.clock().day();
        ctx.extra["slot"] = std::to_string(slot);
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Director,
            "Auto-save failed: " + std::string(saved.error().message()), ctx);
        return false;
    }
    return true;
}

}  // namespace nsim::director
