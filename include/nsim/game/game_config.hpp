#pragma once

/// @file game_config.hpp
/// @brief Per-run rules read from configuration: calendar and attribute schema.

#include <cstdint>
#include <optional>
#include <string>

#include "nsim/foundation/config_manager.hpp"
#include "nsim/game/attribute_types.hpp"
#include "nsim/game/progress_clock.hpp"

namespace nsim::game {

inline constexpr const char* kGameVersion = "1.0.0";

struct GameConfig {
    std::string version = kGameVersion;
    Calendar calendar;
    AttributeSchema schema = AttributeSchema::defaults();
    std::optional<uint64_t> seed;  ///< Fixed seed for reproducible runs.

    /// Reads game.*, attributes.* and random.seed; missing keys keep defaults.
    static GameConfig fromConfig(const foundation::ConfigManager& config);
};

}  // namespace nsim::game
