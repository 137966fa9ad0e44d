#pragma once

/// @file yaml_values.hpp
/// @brief Scalar conversions shared by the content loader and the snapshot codec.

#include <optional>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "nsim/game/condition_types.hpp"

namespace nsim::content {

/// Interpret a scalar as a flag value: quoted scalars are strings,
/// otherwise bool, then number, then plain string.
[[nodiscard]] std::optional<game::FlagValue> decodeFlagValue(const YAML::Node& node);

/// Emit a flag value so that decodeFlagValue() reads back the same alternative.
void emitFlagValue(YAML::Emitter& out, const game::FlagValue& value);

/// "morning" -> 0, "noon"/"afternoon" -> 1, "evening"/"night" -> 2.
[[nodiscard]] std::optional<int> periodIndexFromName(std::string_view name) noexcept;

}  // namespace nsim::content
