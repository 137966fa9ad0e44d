/// @file ending_types.cpp
/// @brief Ending category names.

#include "nsim/game/ending_types.hpp"

namespace nsim::game {

std::string_view endingCategoryName(EndingCategory category) noexcept {
    switch (category) {
        case EndingCategory::Perfect: return "perfect";
        case EndingCategory::Good:    return "good";
        case EndingCategory::Normal:  return "normal";
        case EndingCategory::Bad:     return "bad";
        case EndingCategory::Secret:  return "secret";
    }
    return "normal";
}

}  // namespace nsim::game
