#pragma once

/// @file game_result.hpp
/// @brief GameResult<T>: Result specialized with GameError.

#include "nsim/core/result.hpp"
#include "nsim/foundation/game_error.hpp"

namespace nsim::foundation {

/// Result type returned by every simulation operation that can fail.
///
/// Example:
/// @code
///   GameResult<std::size_t> findSlot(std::size_t slot, std::size_t count) {
///       if (slot >= count) {
///           return GameResult<std::size_t>::err(
///               GameError(ErrorCode::SlotOutOfRange, "slot out of range"));
///       }
///       return GameResult<std::size_t>::ok(slot);
///   }
/// @endcode
template <typename T>
using GameResult = nsim::Result<T, GameError>;

}  // namespace nsim::foundation
