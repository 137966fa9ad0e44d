/// @file attribute_store.cpp
/// @brief AttributeStore and the default attribute schema.

#include "nsim/game/attribute_store.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "nsim/game/condition_evaluator.hpp"

namespace nsim::game {

AttributeSchema AttributeSchema::defaults() {
    AttributeSchema schema;
    schema.bounds = {
        {"deposit", {-50000.0, 10000000.0, 0.0}},
        {"weight", {30.0, 200.0, 65.0}},
        {"face", {-100.0, 100.0, 50.0}},
        {"mood", {0.0, 100.0, 50.0}},
        {"health", {0.0, 100.0, 50.0}},
        {"luck", {0.0, 100.0, 50.0}},
    };
    return schema;
}

const AttributeBounds* AttributeSchema::find(std::string_view attribute) const {
    auto it = bounds.find(std::string(attribute));
    return it != bounds.end() ? &it->second : nullptr;
}

AttributeStore::AttributeStore(SessionState& state, const AttributeSchema& schema,
                               foundation::RandomSource& random)
    : state_(state), schema_(schema), random_(random) {}

double AttributeStore::get(std::string_view attribute) const {
    auto it = state_.attributes.find(std::string(attribute));
    return it != state_.attributes.end() ? it->second : 0.0;
}

void AttributeStore::set(std::string_view attribute, double value) {
    if (const auto* bounds = schema_.find(attribute)) {
        value = bounds->clamp(value);
    }
    state_.attributes[std::string(attribute)] = value;
}

double AttributeStore::modify(std::string_view attribute, double delta, EffectOperation op) {
    const double current = get(attribute);
    double next = current;

    switch (op) {
        case EffectOperation::Add:
            next = current + delta;
            break;
        case EffectOperation::Set:
            next = delta;
            break;
        case EffectOperation::Multiply:
            next = current * delta;
            break;
    }

    set(attribute, next);

    // Statistics track the operand, not the clamped change.
    if (attribute == schema_.monetaryAttribute) {
        if (delta < 0.0) {
            state_.statistics.moneySpent += std::abs(delta);
        } else if (delta > 0.0) {
            state_.statistics.moneyEarned += delta;
        }
    }

    return get(attribute);
}

double AttributeStore::resolveValue(const EffectValue& value) {
    if (const auto* range = std::get_if<ValueRange>(&value)) {
        return static_cast<double>(random_.uniformInt(range->min, range->max));
    }
    return std::get<double>(value);
}

std::vector<EffectResult> AttributeStore::applyEffects(const std::vector<Effect>& effects,
                                                       const ConditionEvaluator& evaluator) {
    std::vector<EffectResult> results;
    results.reserve(effects.size());

    for (const auto& effect : effects) {
        const double operand = resolveValue(effect.value);

        if (effect.condition &&
            !evaluator.evaluate(*effect.condition, ConditionScope::Effect)) {
            continue;
        }

        const double oldValue = get(effect.attribute);
        modify(effect.attribute, operand, effect.operation);
        const double newValue = get(effect.attribute);

        results.push_back({effect.attribute, oldValue, newValue, newValue - oldValue});
    }

    return results;
}

double AttributeStore::percentage(std::string_view attribute) const {
    const auto* bounds = schema_.find(attribute);
    if (bounds == nullptr) {
        return 50.0;
    }
    const double value = get(attribute);

    double pct = 0.0;
    if (attribute == schema_.monetaryAttribute) {
        const double minLog = std::log10(std::max(1.0, std::abs(bounds->min)));
        const double maxLog = std::log10(std::max(1.0, bounds->max));
        const double valueLog = std::log10(std::max(1.0, std::abs(value)));
        if (maxLog == minLog) {
            return 0.0;
        }
        pct = (valueLog - minLog) / (maxLog - minLog) * 100.0;
    } else {
        if (bounds->max == bounds->min) {
            return 0.0;
        }
        pct = (value - bounds->min) / (bounds->max - bounds->min) * 100.0;
    }
    return std::clamp(pct, 0.0, 100.0);
}

double AttributeStore::average(const std::vector<std::string>& attributes) const {
    if (attributes.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(attributes.begin(), attributes.end(), 0.0,
                                 [this](double acc, const std::string& name) {
                                     return acc + get(name);
                                 });
    return sum / static_cast<double>(attributes.size());
}

void AttributeStore::clampAll() {
    for (auto& [name, value] : state_.attributes) {
        if (const auto* bounds = schema_.find(name)) {
            value = bounds->clamp(value);
        }
    }
}

}  // namespace nsim::game
