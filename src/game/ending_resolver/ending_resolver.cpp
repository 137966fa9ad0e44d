/// @file ending_resolver.cpp
/// @brief EndingResolver implementation.

#include "nsim/game/ending_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "nsim/foundation/game_logger.hpp"

namespace nsim::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

std::string oneDecimal(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

EndingDefinition buildDefaultEnding() {
    EndingDefinition ending;
    ending.id = "ordinary_spring";
    ending.title = "An Ordinary Festival";
    ending.description =
        "An ordinary holiday with its ups and downs. That is simply how life goes.";
    ending.category = EndingCategory::Normal;
    ending.priority = 0;
    ending.baseScore = 500.0;
    return ending;
}

}  // namespace

EndingResolver::EndingResolver(const SessionState& state, const EndingCatalog& endings,
                               const AttributeStore& attributes,
                               const ConditionEvaluator& evaluator, const Calendar& calendar)
    : state_(state),
      endings_(endings),
      attributes_(attributes),
      evaluator_(evaluator),
      calendar_(calendar) {}

const EndingDefinition& EndingResolver::defaultEnding() {
    static const EndingDefinition ending = buildDefaultEnding();
    return ending;
}

std::vector<const EndingDefinition*> EndingResolver::candidates() const {
    std::vector<const EndingDefinition*> result;
    for (const auto& ending : endings_.entries()) {
        if (state_.character && ending.characterId &&
            *ending.characterId != state_.character->id) {
            continue;
        }
        result.push_back(&ending);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const EndingDefinition* a, const EndingDefinition* b) {
                         return a->priority > b->priority;
                     });
    return result;
}

EndingResult EndingResolver::determineEnding() const {
    const EndingDefinition* chosen = &defaultEnding();
    for (const auto* ending : candidates()) {
        if (isUnlocked(*ending)) {
            chosen = ending;
            break;
        }
    }

    auto result = buildResult(*chosen);

    LogContext ctx;
    if (state_.character) {
        ctx.characterId = state_.character->id;
    }
    ctx.extra["ending"] = result.id;
    ctx.extra["score"] = std::to_string(result.score);
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Ending, "Ending resolved", ctx);

    return result;
}

bool EndingResolver::isUnlocked(const EndingDefinition& ending) const {
    if (ending.unlockGroups.empty()) {
        return true;
    }
    return std::any_of(ending.unlockGroups.begin(), ending.unlockGroups.end(),
                       [this](const ConditionGroup& group) {
                           return evaluator_.evaluateAll(group.conditions,
                                                         ConditionScope::Ending);
                       });
}

int64_t EndingResolver::calculateScore(const EndingDefinition& ending) const {
    double score = ending.baseScore;

    for (const auto& modifier : ending.modifiers) {
        if (evaluator_.evaluate(modifier.condition, ConditionScope::Ending)) {
            score += modifier.value;
        }
    }

    score += attributes_.get(attributes_.schema().monetaryAttribute) / 1000.0;
    score += attributes_.get("face") / 2.0;
    score += attributes_.get("mood") / 2.0;
    score += attributes_.get("health") / 2.0;

    return static_cast<int64_t>(std::floor(score));
}

double EndingResolver::initialValue(const std::string& attribute, double fallback) const {
    if (!state_.character) {
        return fallback;
    }
    const auto& initial = state_.character->initialAttributes;
    auto it = initial.find(attribute);
    return it != initial.end() ? it->second : fallback;
}

std::vector<std::string> EndingResolver::narrativeSummary() const {
    std::vector<std::string> lines;

    const std::string name = state_.character && !state_.character->name.empty()
                                 ? state_.character->name
                                 : std::string("an unknown character");
    lines.push_back("As " + name + ", you spent " + std::to_string(calendar_.totalDays) +
                    " days of the holiday.");

    const std::string& money = attributes_.schema().monetaryAttribute;
    const double depositChange = attributes_.get(money) - initialValue(money, 0.0);
    if (depositChange > 10000.0) {
        lines.emplace_back("Your wallet is fatter than before the holiday. Fortune smiled on you!");
    } else if (depositChange > 0.0) {
        lines.emplace_back("You even made a little money this holiday. Not bad!");
    } else if (depositChange < -10000.0) {
        lines.emplace_back("This holiday cost a lot. Time to plan your finances carefully.");
    } else if (depositChange < 0.0) {
        lines.emplace_back("The holiday cost a little, but it stayed under control.");
    } else {
        lines.emplace_back("Your finances stayed balanced.");
    }

    const double weightChange = attributes_.get("weight") - initialValue("weight", 65.0);
    if (weightChange > 3.0) {
        lines.push_back("Too many feasts: you gained " + oneDecimal(weightChange) + " kg.");
    } else if (weightChange < -2.0) {
        lines.push_back("You kept your weight in check and even lost " +
                        oneDecimal(std::abs(weightChange)) + " kg!");
    }

    const double mood = attributes_.get("mood");
    if (mood >= 80.0) {
        lines.emplace_back("You had a wonderful time and made lasting memories.");
    } else if (mood >= 60.0) {
        lines.emplace_back("All in all, a pleasant holiday.");
    } else if (mood < 40.0) {
        lines.emplace_back("The holiday left you tired and a little gloomy.");
    }

    const double health = attributes_.get("health");
    if (health >= 80.0) {
        lines.emplace_back("You stayed healthy and kept a regular routine.");
    } else if (health < 50.0) {
        lines.emplace_back("All the social obligations took a toll on your body.");
    }

    const double face = attributes_.get("face");
    if (face >= 80.0) {
        lines.emplace_back("Relatives and friends held you in high regard.");
    } else if (face < 30.0) {
        lines.emplace_back("Some gatherings this holiday were rather embarrassing.");
    }

    return lines;
}

EndingStats EndingResolver::endingStats() const {
    const std::string& money = attributes_.schema().monetaryAttribute;

    EndingStats stats;
    stats.depositChange = attributes_.get(money) - initialValue(money, 0.0);
    stats.weightChange = attributes_.get("weight") - initialValue("weight", 65.0);
    stats.faceChange = attributes_.get("face") - initialValue("face", 50.0);
    stats.moodChange = attributes_.get("mood") - initialValue("mood", 50.0);
    stats.healthChange = attributes_.get("health") - initialValue("health", 50.0);
    stats.totalEvents = state_.statistics.totalEvents;
    stats.totalChoices = state_.statistics.totalChoices;
    return stats;
}

EndingResult EndingResolver::buildResult(const EndingDefinition& ending) const {
    EndingResult result;
    result.id = ending.id;
    result.title = ending.title;
    result.description = ending.description;
    result.category = ending.category;
    result.score = calculateScore(ending);
    result.summary = narrativeSummary();
    result.finalAttributes = attributes_.all();
    result.stats = endingStats();
    return result;
}

}  // namespace nsim::game
