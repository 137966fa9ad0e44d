#pragma once

/// @file attribute_types.hpp
/// @brief Attribute bounds, the schema for a run, and effect records.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "nsim/game/condition_types.hpp"

namespace nsim::game {

/// Attribute name -> current value. Ordered so snapshots are stable.
using AttributeSet = std::map<std::string, double>;

/// Closed range and starting value for one attribute.
struct AttributeBounds {
    double min = 0.0;
    double max = 100.0;
    double defaultValue = 50.0;

    [[nodiscard]] double clamp(double value) const noexcept {
        return value < min ? min : (value > max ? max : value);
    }
};

/// Every bounded attribute of a run plus the attributes with special roles.
struct AttributeSchema {
    std::map<std::string, AttributeBounds> bounds;
    std::string monetaryAttribute = "deposit";
    std::string luckAttribute = "luck";

    /// deposit, weight, face, mood, health, luck.
    static AttributeSchema defaults();

    [[nodiscard]] const AttributeBounds* find(std::string_view attribute) const;
};

/// Mutation applied by an effect.
enum class EffectOperation : uint8_t {
    Add,
    Set,
    Multiply
};

/// Inclusive integer range resolved with one uniform draw.
struct ValueRange {
    int64_t min = 0;
    int64_t max = 0;
};

using EffectValue = std::variant<double, ValueRange>;

/// One attribute change attached to an option.
struct Effect {
    std::string attribute;
    EffectOperation operation = EffectOperation::Add;
    EffectValue value = 0.0;
    std::optional<Condition> condition;  ///< Effect vocabulary.
};

/// Outcome of one applied effect.
struct EffectResult {
    std::string attribute;
    double oldValue = 0.0;
    double newValue = 0.0;
    double delta = 0.0;

    bool operator==(const EffectResult&) const = default;
};

}  // namespace nsim::game
