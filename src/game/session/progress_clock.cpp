/// @file progress_clock.cpp
/// @brief ProgressClock implementation.

#include "nsim/game/progress_clock.hpp"

#include <utility>

namespace nsim::game {

bool ProgressClock::advance() {
    ++progress_.period;
    ++progress_.totalPeriods;

    if (progress_.period >= calendar_.periodsPerDay) {
        progress_.period = 0;
        ++progress_.day;
        return true;
    }
    return false;
}

bool ProgressClock::isOver() const noexcept {
    return progress_.day > calendar_.totalDays ||
           (progress_.day == calendar_.totalDays &&
            progress_.period >= calendar_.periodsPerDay);
}

std::pair<int, int> ProgressClock::nextSlot() const noexcept {
    int day = progress_.day;
    int period = progress_.period + 1;
    if (period >= calendar_.periodsPerDay) {
        period = 0;
        ++day;
    }
    return {day, period};
}

std::string ProgressClock::describe() const {
    std::string dayName;
    auto dayIdx = static_cast<std::size_t>(progress_.day - 1);
    if (progress_.day >= 1 && dayIdx < calendar_.dayNames.size()) {
        dayName = calendar_.dayNames[dayIdx];
    } else {
        dayName = "Day " + std::to_string(progress_.day);
    }

    auto periodIdx = static_cast<std::size_t>(progress_.period);
    if (progress_.period >= 0 && periodIdx < calendar_.periodNames.size()) {
        return dayName + ", " + calendar_.periodNames[periodIdx];
    }
    return dayName + ", Period " + std::to_string(progress_.period);
}

}  // namespace nsim::game
