/// @file yaml_values.cpp
/// @brief Typed readers over yaml-cpp nodes.

#include "nsim/content/yaml_values.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace nsim::content {

std::optional<game::FlagValue> decodeFlagValue(const YAML::Node& node) {
    if (!node.IsScalar()) {
        return std::nullopt;
    }
    if (node.Tag() == "!") {
        return game::FlagValue(node.Scalar());
    }
    bool boolValue = false;
    if (YAML::convert<bool>::decode(node, boolValue)) {
        return game::FlagValue(boolValue);
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return game::FlagValue(number);
    }
    return game::FlagValue(node.Scalar());
}

void emitFlagValue(YAML::Emitter& out, const game::FlagValue& value) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                out << v;
            } else if constexpr (std::is_same_v<T, double>) {
                out << v;
            } else {
                out << YAML::DoubleQuoted << v;
            }
        },
        value);
}

std::optional<int> periodIndexFromName(std::string_view name) noexcept {
    if (name == "morning") {
        return 0;
    }
    if (name == "noon" || name == "afternoon") {
        return 1;
    }
    if (name == "evening" || name == "night") {
        return 2;
    }
    return std::nullopt;
}

}  // namespace nsim::content
