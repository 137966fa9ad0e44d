#pragma once

/// @file ending_resolver.hpp
/// @brief Priority-ordered ending resolution, scoring and run summary.

#include <string>
#include <vector>

#include "nsim/game/attribute_store.hpp"
#include "nsim/game/condition_evaluator.hpp"
#include "nsim/game/content_catalog.hpp"
#include "nsim/game/ending_types.hpp"
#include "nsim/game/progress_clock.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::game {

/// Resolves which ending a finished (or aborted) run earns.
///
/// Endings scoped to another character are ignored. The rest are scanned
/// by descending priority (catalog order on ties) and the first unlocked
/// one wins. When none unlocks, the built-in default ending is used, so
/// determineEnding() always produces a result.
class EndingResolver {
public:
    EndingResolver(const SessionState& state, const EndingCatalog& endings,
                   const AttributeStore& attributes, const ConditionEvaluator& evaluator,
                   const Calendar& calendar);

    [[nodiscard]] EndingResult determineEnding() const;

    /// Ending definitions in scan order for the active character.
    [[nodiscard]] std::vector<const EndingDefinition*> candidates() const;

    /// True if any unlock group has all its conditions true, or there are
    /// no groups at all.
    [[nodiscard]] bool isUnlocked(const EndingDefinition& ending) const;

    /// base + satisfied modifiers + deposit/1000 + (face+mood+health)/2, floored.
    [[nodiscard]] int64_t calculateScore(const EndingDefinition& ending) const;

    /// Deterministic narrative lines derived from final vs. initial values.
    [[nodiscard]] std::vector<std::string> narrativeSummary() const;

    [[nodiscard]] EndingStats endingStats() const;

    [[nodiscard]] EndingResult buildResult(const EndingDefinition& ending) const;

    static const EndingDefinition& defaultEnding();

private:
    [[nodiscard]] double initialValue(const std::string& attribute, double fallback) const;

    const SessionState& state_;
    const EndingCatalog& endings_;
    const AttributeStore& attributes_;
    const ConditionEvaluator& evaluator_;
    const Calendar& calendar_;
};

}  // namespace nsim::game
