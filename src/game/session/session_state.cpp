/// @file session_state.cpp
/// @brief SessionState queries.

#include "nsim/game/session_state.hpp"

#include <algorithm>

namespace nsim::game {

bool SessionState::isEventTriggered(const std::string& eventId) const {
    return std::find(triggeredOnceEvents.begin(), triggeredOnceEvents.end(), eventId) !=
           triggeredOnceEvents.end();
}

}  // namespace nsim::game
