#pragma once

/// @file progress_clock.hpp
/// @brief Day/period calendar and the clock that advances a session through it.

#include <string>
#include <utility>
#include <vector>

#include "nsim/game/session_state.hpp"

namespace nsim::game {

/// Shape of the calendar for a run.
struct Calendar {
    int totalDays = 9;
    int periodsPerDay = 3;
    std::vector<std::string> periodNames = {"Morning", "Noon", "Evening"};
    std::vector<std::string> dayNames;  ///< Optional, indexed by day - 1.
};

/// Advances Progress one period at a time.
///
/// Day 1 period 0 is the first slot. Advancing past the last period of
/// the last day moves to day totalDays + 1, at which point isOver() holds.
class ProgressClock {
public:
    ProgressClock(Progress& progress, const Calendar& calendar)
        : progress_(progress), calendar_(calendar) {}

    /// Move to the next period.
    /// @return true if the call wrapped into a new day.
    bool advance();

    [[nodiscard]] bool isOver() const noexcept;

    [[nodiscard]] int day() const noexcept { return progress_.day; }
    [[nodiscard]] int period() const noexcept { return progress_.period; }

    /// Day/period one slot after the current one.
    [[nodiscard]] std::pair<int, int> nextSlot() const noexcept;

    /// "Day 2, Noon", or the configured day name when present.
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] const Calendar& calendar() const noexcept { return calendar_; }

private:
    Progress& progress_;
    const Calendar& calendar_;
};

}  // namespace nsim::game
