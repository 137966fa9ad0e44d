#pragma once

/// @file attribute_store.hpp
/// @brief Bounded read/write access to a session's attributes.

#include <string>
#include <string_view>
#include <vector>

#include "nsim/foundation/random_source.hpp"
#include "nsim/game/attribute_types.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::game {

class ConditionEvaluator;

/// Reads and mutates SessionState::attributes through the schema.
///
/// Every write clamps to the attribute's bounds, so a bounded attribute
/// never leaves [min, max]. Attributes the schema does not know are
/// stored unclamped. Changes to the monetary attribute feed the
/// moneySpent/moneyEarned statistics.
class AttributeStore {
public:
    AttributeStore(SessionState& state, const AttributeSchema& schema,
                   foundation::RandomSource& random);

    /// Stored value, or 0 if absent.
    [[nodiscard]] double get(std::string_view attribute) const;

    /// Store @p value clamped to the attribute's bounds.
    void set(std::string_view attribute, double value);

    /// Apply @p op with operand @p delta, clamp, and return the stored value.
    double modify(std::string_view attribute, double delta,
                  EffectOperation op = EffectOperation::Add);

    /// Apply effects in order. Range values draw first, then the effect's
    /// condition is checked; skipped effects produce no result.
    std::vector<EffectResult> applyEffects(const std::vector<Effect>& effects,
                                           const ConditionEvaluator& evaluator);

    /// Position within bounds in [0, 100]; log scale on |value| for the
    /// monetary attribute; 50 for unbounded attributes.
    [[nodiscard]] double percentage(std::string_view attribute) const;

    /// Mean of the given attributes (face, mood, health by default).
    [[nodiscard]] double average(
        const std::vector<std::string>& attributes = {"face", "mood", "health"}) const;

    [[nodiscard]] const AttributeSet& all() const noexcept { return state_.attributes; }

    /// Clamp every bounded attribute currently stored.
    void clampAll();

    [[nodiscard]] const AttributeSchema& schema() const noexcept { return schema_; }

private:
    [[nodiscard]] double resolveValue(const EffectValue& value);

    SessionState& state_;
    const AttributeSchema& schema_;
    foundation::RandomSource& random_;
};

}  // namespace nsim::game
