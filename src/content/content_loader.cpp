/// @file content_loader.cpp
/// @brief YAML -> catalog conversion with path-qualified validation errors.

#include "nsim/content/content_loader.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "nsim/content/yaml_values.hpp"
#include "nsim/foundation/game_logger.hpp"

namespace nsim::content {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameError invalid(const std::string& path, const std::string& what) {
    return GameError(ErrorCode::ContentInvalid, path + ": " + what, path);
}

template <typename T>
GameResult<T> fail(const std::string& path, const std::string& what) {
    return GameResult<T>::err(invalid(path, what));
}

std::string child(const std::string& path, const std::string& key) {
    return path + "." + key;
}

using TextField = std::pair<const char*, std::string*>;

std::string indexed(const std::string& path, std::size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

GameResult<double> readNumber(const YAML::Node& node, const std::string& path) {
    double value = 0.0;
    if (!node || !node.IsScalar() || !YAML::convert<double>::decode(node, value) ||
        !std::isfinite(value)) {
        return fail<double>(path, "expected a number");
    }
    return GameResult<double>::ok(value);
}

GameResult<int64_t> readInteger(const YAML::Node& node, const std::string& path) {
    auto number = readNumber(node, path);
    if (!number) {
        return GameResult<int64_t>::err(number.error());
    }
    if (std::floor(number.value()) != number.value()) {
        return fail<int64_t>(path, "expected an integer");
    }
    return GameResult<int64_t>::ok(static_cast<int64_t>(number.value()));
}

GameResult<bool> readBool(const YAML::Node& node, const std::string& path) {
    bool value = false;
    if (!node || !node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        return fail<bool>(path, "expected true or false");
    }
    return GameResult<bool>::ok(value);
}

GameResult<std::string> readString(const YAML::Node& node, const std::string& path) {
    if (!node || !node.IsScalar()) {
        return fail<std::string>(path, "expected a string");
    }
    return GameResult<std::string>::ok(node.Scalar());
}

/// Optional scalar field; @p fallback when the key is absent.
template <typename T, typename Reader>
GameResult<T> optionalField(const YAML::Node& parent, const char* key, const std::string& path,
                            T fallback, Reader reader) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return reader(node, child(path, key));
}

/// A scalar or a sequence of scalars, read as strings.
GameResult<std::vector<std::string>> readStringList(const YAML::Node& node,
                                                    const std::string& path) {
    std::vector<std::string> values;
    if (!node || node.IsNull()) {
        return GameResult<std::vector<std::string>>::ok(std::move(values));
    }
    if (node.IsScalar()) {
        values.push_back(node.Scalar());
        return GameResult<std::vector<std::string>>::ok(std::move(values));
    }
    if (!node.IsSequence()) {
        return fail<std::vector<std::string>>(path, "expected a list of strings");
    }
    for (std::size_t i = 0; i < node.size(); ++i) {
        auto value = readString(node[i], indexed(path, i));
        if (!value) {
            return GameResult<std::vector<std::string>>::err(value.error());
        }
        values.push_back(std::move(value).value());
    }
    return GameResult<std::vector<std::string>>::ok(std::move(values));
}

/// A scalar or a sequence of integers.
GameResult<std::vector<int>> readIntList(const YAML::Node& node, const std::string& path) {
    std::vector<int> values;
    if (!node) {
        return fail<std::vector<int>>(path, "expected a list of integers");
    }
    if (node.IsScalar()) {
        auto value = readInteger(node, path);
        if (!value) {
            return GameResult<std::vector<int>>::err(value.error());
        }
        values.push_back(static_cast<int>(value.value()));
        return GameResult<std::vector<int>>::ok(std::move(values));
    }
    if (!node.IsSequence()) {
        return fail<std::vector<int>>(path, "expected a list of integers");
    }
    for (std::size_t i = 0; i < node.size(); ++i) {
        auto value = readInteger(node[i], indexed(path, i));
        if (!value) {
            return GameResult<std::vector<int>>::err(value.error());
        }
        values.push_back(static_cast<int>(value.value()));
    }
    return GameResult<std::vector<int>>::ok(std::move(values));
}

/// Period indices given as numbers or names ("morning", "night", ...).
GameResult<std::vector<int>> readPeriodList(const YAML::Node& node, const std::string& path) {
    std::vector<int> periods;
    auto readOne = [&periods](const YAML::Node& item, const std::string& itemPath) {
        const std::string name = item && item.IsScalar() ? item.Scalar() : std::string();
        if (auto named = periodIndexFromName(name)) {
            periods.push_back(*named);
            return GameResult<void>::ok();
        }
        auto number = readInteger(item, itemPath);
        if (!number) {
            return GameResult<void>::err(invalid(itemPath, "expected a period index or name"));
        }
        periods.push_back(static_cast<int>(number.value()));
        return GameResult<void>::ok();
    };

    if (node.IsSequence()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            auto read = readOne(node[i], indexed(path, i));
            if (!read) {
                return GameResult<std::vector<int>>::err(read.error());
            }
        }
    } else {
        auto read = readOne(node, path);
        if (!read) {
            return GameResult<std::vector<int>>::err(read.error());
        }
    }
    return GameResult<std::vector<int>>::ok(std::move(periods));
}

GameResult<std::vector<game::Condition>> readConditionList(const YAML::Node& node,
                                                           const std::string& path) {
    std::vector<game::Condition> conditions;
    if (!node || node.IsNull()) {
        return GameResult<std::vector<game::Condition>>::ok(std::move(conditions));
    }
    if (!node.IsSequence()) {
        return fail<std::vector<game::Condition>>(path, "expected a list of conditions");
    }
    for (std::size_t i = 0; i < node.size(); ++i) {
        auto condition = ContentLoader::parseCondition(node[i], indexed(path, i));
        if (!condition) {
            return GameResult<std::vector<game::Condition>>::err(condition.error());
        }
        conditions.push_back(std::move(condition).value());
    }
    return GameResult<std::vector<game::Condition>>::ok(std::move(conditions));
}

// -- Effects ------------------------------------------------------------------

GameResult<game::EffectValue> readEffectValue(const YAML::Node& node, const std::string& path) {
    if (node && node.IsMap()) {
        auto min = readInteger(node["min"], child(path, "min"));
        if (!min) {
            return GameResult<game::EffectValue>::err(min.error());
        }
        auto max = readInteger(node["max"], child(path, "max"));
        if (!max) {
            return GameResult<game::EffectValue>::err(max.error());
        }
        return GameResult<game::EffectValue>::ok(game::ValueRange{min.value(), max.value()});
    }
    auto number = readNumber(node, path);
    if (!number) {
        return GameResult<game::EffectValue>::err(number.error());
    }
    return GameResult<game::EffectValue>::ok(number.value());
}

GameResult<game::Effect> readEffect(const YAML::Node& node, const std::string& path) {
    if (!node || !node.IsMap()) {
        return fail<game::Effect>(path, "expected an effect mapping");
    }
    if (node["type"]) {
        auto type = readString(node["type"], child(path, "type"));
        if (!type || type.value() != "attribute") {
            return fail<game::Effect>(child(path, "type"), "unknown effect type");
        }
    }

    game::Effect effect;
    auto attribute = readString(node["attribute"], child(path, "attribute"));
    if (!attribute) {
        return GameResult<game::Effect>::err(attribute.error());
    }
    effect.attribute = std::move(attribute).value();

    auto operation = optionalField<std::string>(node, "operation", path, "add", readString);
    if (!operation) {
        return GameResult<game::Effect>::err(operation.error());
    }
    if (operation.value() == "add") {
        effect.operation = game::EffectOperation::Add;
    } else if (operation.value() == "set") {
        effect.operation = game::EffectOperation::Set;
    } else if (operation.value() == "multiply") {
        effect.operation = game::EffectOperation::Multiply;
    } else {
        return fail<game::Effect>(child(path, "operation"),
                                  "unknown operation '" + operation.value() + "'");
    }

    auto value = readEffectValue(node["value"], child(path, "value"));
    if (!value) {
        return GameResult<game::Effect>::err(value.error());
    }
    effect.value = value.value();

    if (node["condition"]) {
        auto condition = ContentLoader::parseCondition(node["condition"], child(path, "condition"));
        if (!condition) {
            return GameResult<game::Effect>::err(condition.error());
        }
        effect.condition = std::move(condition).value();
    }
    return GameResult<game::Effect>::ok(std::move(effect));
}

/// Either a list of effect mappings or the shorthand `{attribute: delta}`;
/// zero deltas in the shorthand are dropped.
GameResult<std::vector<game::Effect>> readEffects(const YAML::Node& node,
                                                  const std::string& path) {
    std::vector<game::Effect> effects;
    if (!node || node.IsNull()) {
        return GameResult<std::vector<game::Effect>>::ok(std::move(effects));
    }
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto name = it->first.Scalar();
            auto delta = readNumber(it->second, child(path, name));
            if (!delta) {
                return GameResult<std::vector<game::Effect>>::err(delta.error());
            }
            if (delta.value() != 0.0) {
                game::Effect effect;
                effect.attribute = name;
                effect.value = delta.value();
                effects.push_back(std::move(effect));
            }
        }
        return GameResult<std::vector<game::Effect>>::ok(std::move(effects));
    }
    if (!node.IsSequence()) {
        return fail<std::vector<game::Effect>>(path, "expected a list of effects");
    }
    for (std::size_t i = 0; i < node.size(); ++i) {
        auto effect = readEffect(node[i], indexed(path, i));
        if (!effect) {
            return GameResult<std::vector<game::Effect>>::err(effect.error());
        }
        effects.push_back(std::move(effect).value());
    }
    return GameResult<std::vector<game::Effect>>::ok(std::move(effects));
}

// -- Options ------------------------------------------------------------------

GameResult<game::FollowUpSpec> readFollowUp(const YAML::Node& node, const std::string& path) {
    if (!node || !node.IsMap()) {
        return fail<game::FollowUpSpec>(path, "expected a follow-up mapping");
    }
    game::FollowUpSpec spec;
    auto eventId = readString(node["event_id"], child(path, "event_id"));
    if (!eventId) {
        return GameResult<game::FollowUpSpec>::err(eventId.error());
    }
    spec.eventId = std::move(eventId).value();

    auto delay = optionalField<std::string>(node, "delay", path, "next_period", readString);
    if (!delay) {
        return GameResult<game::FollowUpSpec>::err(delay.error());
    }
    if (delay.value() == "immediate") {
        spec.delay = game::FollowUpDelay::Immediate;
    } else if (delay.value() == "next_period") {
        spec.delay = game::FollowUpDelay::NextPeriod;
    } else if (delay.value() == "next_day") {
        spec.delay = game::FollowUpDelay::NextDay;
    } else {
        return fail<game::FollowUpSpec>(child(path, "delay"),
                                        "unknown delay '" + delay.value() + "'");
    }

    if (node["probability"]) {
        auto probability = readNumber(node["probability"], child(path, "probability"));
        if (!probability) {
            return GameResult<game::FollowUpSpec>::err(probability.error());
        }
        spec.probability = probability.value();
    }

    auto priority = optionalField<int64_t>(node, "priority", path, 0, readInteger);
    if (!priority) {
        return GameResult<game::FollowUpSpec>::err(priority.error());
    }
    spec.priority = static_cast<int32_t>(priority.value());
    return GameResult<game::FollowUpSpec>::ok(std::move(spec));
}

GameResult<game::SpecialOutcome> readSpecialOutcome(const YAML::Node& node,
                                                    const std::string& path) {
    game::SpecialOutcome outcome;
    std::string type;
    if (!node) {
        return fail<game::SpecialOutcome>(path, "expected a special outcome");
    }
    if (node.IsScalar()) {
        type = node.Scalar();
    } else if (node.IsMap()) {
        auto typeField = readString(node["type"], child(path, "type"));
        if (!typeField) {
            return GameResult<game::SpecialOutcome>::err(typeField.error());
        }
        type = std::move(typeField).value();
        auto tag = optionalField<std::string>(node, "tag", path, "", readString);
        if (!tag) {
            return GameResult<game::SpecialOutcome>::err(tag.error());
        }
        outcome.tag = std::move(tag).value();
    } else {
        return fail<game::SpecialOutcome>(path, "expected a special outcome");
    }

    if (type == "ending_trigger") {
        outcome.kind = game::SpecialOutcomeKind::EndingTrigger;
    } else if (type == "game_over") {
        outcome.kind = game::SpecialOutcomeKind::GameOver;
    } else if (type == "custom") {
        outcome.kind = game::SpecialOutcomeKind::Custom;
    } else {
        return fail<game::SpecialOutcome>(path, "unknown special outcome '" + type + "'");
    }
    return GameResult<game::SpecialOutcome>::ok(std::move(outcome));
}

GameResult<game::OptionDefinition> readOption(const YAML::Node& node, const std::string& path,
                                              const std::string& eventId, std::size_t index) {
    if (!node || !node.IsMap()) {
        return fail<game::OptionDefinition>(path, "expected an option mapping");
    }
    game::OptionDefinition option;

    auto id = optionalField<std::string>(node, "id", path, "", readString);
    if (!id) {
        return GameResult<game::OptionDefinition>::err(id.error());
    }
    option.id = std::move(id).value();
    if (option.id.empty()) {
        option.id = eventId + "_option_" + std::to_string(index);
        NSIM_LOG_WARN(LogCategory::Content, path + ": option without id, using " + option.id);
    }

    for (const auto& [key, target] : std::initializer_list<TextField>{
             {"text", &option.text},
             {"feedback", &option.feedback},
             {"unavailable_text", &option.unavailableText}}) {
        auto text = optionalField<std::string>(node, key, path, "", readString);
        if (!text) {
            return GameResult<game::OptionDefinition>::err(text.error());
        }
        *target = std::move(text).value();
    }

    auto effects = readEffects(node["effects"], child(path, "effects"));
    if (!effects) {
        return GameResult<game::OptionDefinition>::err(effects.error());
    }
    option.effects = std::move(effects).value();

    auto available = readConditionList(node["conditions"], child(path, "conditions"));
    if (!available) {
        return GameResult<game::OptionDefinition>::err(available.error());
    }
    option.availabilityConditions = std::move(available).value();

    auto visible = readConditionList(node["visible_if"], child(path, "visible_if"));
    if (!visible) {
        return GameResult<game::OptionDefinition>::err(visible.error());
    }
    option.visibilityConditions = std::move(visible).value();

    const YAML::Node followUps = node["follow_ups"];
    if (followUps && !followUps.IsNull()) {
        if (!followUps.IsSequence()) {
            return fail<game::OptionDefinition>(child(path, "follow_ups"), "expected a list");
        }
        for (std::size_t i = 0; i < followUps.size(); ++i) {
            auto spec = readFollowUp(followUps[i], indexed(child(path, "follow_ups"), i));
            if (!spec) {
                return GameResult<game::OptionDefinition>::err(spec.error());
            }
            option.followUps.push_back(std::move(spec).value());
        }
    }

    if (node["special_outcome"]) {
        auto outcome = readSpecialOutcome(node["special_outcome"], child(path, "special_outcome"));
        if (!outcome) {
            return GameResult<game::OptionDefinition>::err(outcome.error());
        }
        option.specialOutcome = std::move(outcome).value();
    }
    return GameResult<game::OptionDefinition>::ok(std::move(option));
}

// -- Events -------------------------------------------------------------------

GameResult<game::EventDefinition> readEvent(const YAML::Node& node, const std::string& path,
                                            std::size_t index, int32_t defaultWeight) {
    if (!node || !node.IsMap()) {
        return fail<game::EventDefinition>(path, "expected an event mapping");
    }
    game::EventDefinition event;

    auto id = optionalField<std::string>(node, "id", path, "", readString);
    if (!id) {
        return GameResult<game::EventDefinition>::err(id.error());
    }
    event.id = std::move(id).value();
    if (event.id.empty()) {
        event.id = "event_" + std::to_string(index);
        NSIM_LOG_WARN(LogCategory::Content, path + ": event without id, using " + event.id);
    }

    for (const auto& [key, target] : std::initializer_list<TextField>{
             {"title", &event.title},
             {"description", &event.description},
             {"category", &event.category}}) {
        auto text = optionalField<std::string>(node, key, path, "", readString);
        if (!text) {
            return GameResult<game::EventDefinition>::err(text.error());
        }
        *target = std::move(text).value();
    }

    auto weight = optionalField<int64_t>(node, "weight", path, defaultWeight, readInteger);
    if (!weight) {
        return GameResult<game::EventDefinition>::err(weight.error());
    }
    if (weight.value() < 0) {
        return fail<game::EventDefinition>(child(path, "weight"), "weight must not be negative");
    }
    if (weight.value() > std::numeric_limits<int32_t>::max()) {
        return fail<game::EventDefinition>(child(path, "weight"), "weight is too large");
    }
    event.weight = static_cast<int32_t>(weight.value());

    auto onceOnly = optionalField<bool>(node, "once_only", path, false, readBool);
    if (!onceOnly) {
        return GameResult<game::EventDefinition>::err(onceOnly.error());
    }
    event.onceOnly = onceOnly.value();

    using IdListField = std::pair<const char*, std::vector<std::string>*>;
    for (const auto& [key, target] : std::initializer_list<IdListField>{
             {"mutually_exclusive", &event.mutuallyExclusive},
             {"prerequisites", &event.prerequisites},
             {"exclusive_to", &event.exclusiveTo}}) {
        auto ids = readStringList(node[key], child(path, key));
        if (!ids) {
            return GameResult<game::EventDefinition>::err(ids.error());
        }
        *target = std::move(ids).value();
    }

    auto triggers = readConditionList(node["trigger_conditions"], child(path, "trigger_conditions"));
    if (!triggers) {
        return GameResult<game::EventDefinition>::err(triggers.error());
    }
    event.triggerConditions = std::move(triggers).value();

    // Scheduled-slot shorthand: `day: 3` with an optional `time_slot: evening`.
    if (node["day"]) {
        auto day = readInteger(node["day"], child(path, "day"));
        if (!day) {
            return GameResult<game::EventDefinition>::err(day.error());
        }
        game::TimeCondition slot;
        slot.days = std::vector<int>{static_cast<int>(day.value())};
        if (node["time_slot"]) {
            auto periods = readPeriodList(node["time_slot"], child(path, "time_slot"));
            if (!periods) {
                return GameResult<game::EventDefinition>::err(periods.error());
            }
            slot.periods = std::move(periods).value();
        }
        event.triggerConditions.emplace_back(std::move(slot));
    }

    const YAML::Node options = node["options"];
    if (options && !options.IsNull()) {
        if (!options.IsSequence()) {
            return fail<game::EventDefinition>(child(path, "options"), "expected a list");
        }
        for (std::size_t i = 0; i < options.size(); ++i) {
            auto option = readOption(options[i], indexed(child(path, "options"), i), event.id, i);
            if (!option) {
                return GameResult<game::EventDefinition>::err(option.error());
            }
            event.options.push_back(std::move(option).value());
        }
    }
    return GameResult<game::EventDefinition>::ok(std::move(event));
}

// -- Endings ------------------------------------------------------------------

GameResult<game::EndingCategory> readEndingCategory(const std::string& name,
                                                    const std::string& path) {
    using game::EndingCategory;
    if (name == "perfect") {
        return GameResult<EndingCategory>::ok(EndingCategory::Perfect);
    }
    if (name == "good" || name == "success") {
        return GameResult<EndingCategory>::ok(EndingCategory::Good);
    }
    if (name == "normal") {
        return GameResult<EndingCategory>::ok(EndingCategory::Normal);
    }
    if (name == "bad" || name == "failure") {
        return GameResult<EndingCategory>::ok(EndingCategory::Bad);
    }
    if (name == "secret" || name == "special" || name == "hidden") {
        return GameResult<EndingCategory>::ok(EndingCategory::Secret);
    }
    return fail<EndingCategory>(path, "unknown ending category '" + name + "'");
}

/// Unlock groups: a list of `{conditions: [...]}` or the bound shorthand
/// `{min_<attr>: x, max_<attr>: y}` forming a single group.
GameResult<std::vector<game::ConditionGroup>> readUnlockGroups(const YAML::Node& node,
                                                               const std::string& path) {
    std::vector<game::ConditionGroup> groups;
    if (!node || node.IsNull()) {
        return GameResult<std::vector<game::ConditionGroup>>::ok(std::move(groups));
    }
    if (node.IsSequence()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            const auto groupPath = indexed(path, i);
            if (!node[i].IsMap()) {
                return fail<std::vector<game::ConditionGroup>>(groupPath,
                                                               "expected a condition group");
            }
            auto conditions = readConditionList(node[i]["conditions"],
                                                child(groupPath, "conditions"));
            if (!conditions) {
                return GameResult<std::vector<game::ConditionGroup>>::err(conditions.error());
            }
            groups.push_back(game::ConditionGroup{std::move(conditions).value()});
        }
        return GameResult<std::vector<game::ConditionGroup>>::ok(std::move(groups));
    }
    if (!node || !node.IsMap()) {
        return fail<std::vector<game::ConditionGroup>>(path, "expected condition groups");
    }

    game::ConditionGroup group;
    for (auto it = node.begin(); it != node.end(); ++it) {
        const auto key = it->first.Scalar();
        const auto keyPath = child(path, key);
        game::AttributeCondition bound;
        if (key.rfind("min_", 0) == 0) {
            bound.op = game::CompareOp::GreaterEqual;
        } else if (key.rfind("max_", 0) == 0) {
            bound.op = game::CompareOp::LessEqual;
        } else {
            return fail<std::vector<game::ConditionGroup>>(keyPath, "unknown bound key");
        }
        bound.attribute = key.substr(4);
        auto value = readNumber(it->second, keyPath);
        if (!value) {
            return GameResult<std::vector<game::ConditionGroup>>::err(value.error());
        }
        bound.value = value.value();
        group.conditions.emplace_back(std::move(bound));
    }
    if (!group.conditions.empty()) {
        groups.push_back(std::move(group));
    }
    return GameResult<std::vector<game::ConditionGroup>>::ok(std::move(groups));
}

GameResult<game::EndingDefinition> readEnding(const YAML::Node& node, const std::string& path,
                                              std::size_t index) {
    if (!node || !node.IsMap()) {
        return fail<game::EndingDefinition>(path, "expected an ending mapping");
    }
    game::EndingDefinition ending;

    auto id = optionalField<std::string>(node, "id", path, "", readString);
    if (!id) {
        return GameResult<game::EndingDefinition>::err(id.error());
    }
    ending.id = std::move(id).value();
    if (ending.id.empty()) {
        ending.id = "ending_" + std::to_string(index);
        NSIM_LOG_WARN(LogCategory::Content, path + ": ending without id, using " + ending.id);
    }

    for (const auto& [key, target] : std::initializer_list<TextField>{
             {"title", &ending.title},
             {"description", &ending.description}}) {
        auto text = optionalField<std::string>(node, key, path, "", readString);
        if (!text) {
            return GameResult<game::EndingDefinition>::err(text.error());
        }
        *target = std::move(text).value();
    }

    auto categoryName = optionalField<std::string>(node, "category", path, "normal", readString);
    if (!categoryName) {
        return GameResult<game::EndingDefinition>::err(categoryName.error());
    }
    auto category = readEndingCategory(categoryName.value(), child(path, "category"));
    if (!category) {
        return GameResult<game::EndingDefinition>::err(category.error());
    }
    ending.category = category.value();

    auto priority = optionalField<int64_t>(node, "priority", path, 0, readInteger);
    if (!priority) {
        return GameResult<game::EndingDefinition>::err(priority.error());
    }
    ending.priority = static_cast<int32_t>(priority.value());

    auto characterId = optionalField<std::string>(node, "character_id", path, "", readString);
    if (!characterId) {
        return GameResult<game::EndingDefinition>::err(characterId.error());
    }
    if (!characterId.value().empty()) {
        ending.characterId = std::move(characterId).value();
    }

    auto baseScore = optionalField<double>(node, "base_score", path, 500.0, readNumber);
    if (!baseScore) {
        return GameResult<game::EndingDefinition>::err(baseScore.error());
    }
    ending.baseScore = baseScore.value();

    auto groups = readUnlockGroups(node["unlock_conditions"], child(path, "unlock_conditions"));
    if (!groups) {
        return GameResult<game::EndingDefinition>::err(groups.error());
    }
    ending.unlockGroups = std::move(groups).value();

    const YAML::Node modifiers = node["score_modifiers"];
    if (modifiers && !modifiers.IsNull()) {
        const auto listPath = child(path, "score_modifiers");
        if (!modifiers.IsSequence()) {
            return fail<game::EndingDefinition>(listPath, "expected a list");
        }
        for (std::size_t i = 0; i < modifiers.size(); ++i) {
            const auto itemPath = indexed(listPath, i);
            if (!modifiers[i].IsMap()) {
                return fail<game::EndingDefinition>(itemPath, "expected a score modifier");
            }
            auto condition = ContentLoader::parseCondition(modifiers[i]["condition"],
                                                           child(itemPath, "condition"));
            if (!condition) {
                return GameResult<game::EndingDefinition>::err(condition.error());
            }
            auto value = readNumber(modifiers[i]["value"], child(itemPath, "value"));
            if (!value) {
                return GameResult<game::EndingDefinition>::err(value.error());
            }
            ending.modifiers.push_back(
                game::ScoreModifier{std::move(condition).value(), value.value()});
        }
    }
    return GameResult<game::EndingDefinition>::ok(std::move(ending));
}

// -- Characters ---------------------------------------------------------------

GameResult<game::CharacterProfile> readCharacter(const YAML::Node& node,
                                                 const std::string& path) {
    if (!node || !node.IsMap()) {
        return fail<game::CharacterProfile>(path, "expected a character mapping");
    }
    game::CharacterProfile profile;
    auto id = readString(node["id"], child(path, "id"));
    if (!id) {
        return GameResult<game::CharacterProfile>::err(id.error());
    }
    profile.id = std::move(id).value();

    for (const auto& [key, target] : std::initializer_list<TextField>{
             {"name", &profile.name},
             {"title", &profile.title}}) {
        auto text = optionalField<std::string>(node, key, path, "", readString);
        if (!text) {
            return GameResult<game::CharacterProfile>::err(text.error());
        }
        *target = std::move(text).value();
    }

    const YAML::Node initial = node["initial_attributes"];
    if (initial && !initial.IsNull()) {
        const auto mapPath = child(path, "initial_attributes");
        if (!initial.IsMap()) {
            return fail<game::CharacterProfile>(mapPath, "expected an attribute mapping");
        }
        for (auto it = initial.begin(); it != initial.end(); ++it) {
            const auto name = it->first.Scalar();
            auto value = readNumber(it->second, child(mapPath, name));
            if (!value) {
                return GameResult<game::CharacterProfile>::err(value.error());
            }
            profile.initialAttributes[name] = value.value();
        }
    }
    return GameResult<game::CharacterProfile>::ok(std::move(profile));
}

/// The top-level list under @p key; a missing key is an empty list.
GameResult<YAML::Node> topLevelList(const YAML::Node& root, const char* key) {
    if (!root || root.IsNull()) {
        return GameResult<YAML::Node>::ok(YAML::Node(YAML::NodeType::Sequence));
    }
    if (!root.IsMap()) {
        return fail<YAML::Node>(key, "document root must be a mapping");
    }
    const YAML::Node list = root[key];
    if (!list || list.IsNull()) {
        return GameResult<YAML::Node>::ok(YAML::Node(YAML::NodeType::Sequence));
    }
    if (!list.IsSequence()) {
        return fail<YAML::Node>(key, "expected a list");
    }
    return GameResult<YAML::Node>::ok(list);
}

template <typename Reader>
GameResult<void> parseDocument(std::string_view yaml, Reader reader) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ContentInvalid, std::string("YAML parse error: ") + e.what()));
    }
    return reader(root);
}

template <typename Reader>
GameResult<void> parseFile(const std::filesystem::path& path, Reader reader) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(GameError(ErrorCode::ContentLoadFailed,
                                               "failed to open content file: " + path.string(),
                                               path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(GameError(
            ErrorCode::ContentInvalid, path.string() + ": YAML parse error: " + e.what(),
            path.string()));
    }
    auto result = reader(root);
    if (result) {
        NSIM_LOG_DEBUG(LogCategory::Content, "Loaded content file " + path.string());
    }
    return result;
}

}  // namespace

ContentLoader::ContentLoader(LoaderOptions options)
    : options_(options) {}

GameResult<game::Condition> ContentLoader::parseCondition(const YAML::Node& node,
                                                          const std::string& path) {
    if (!node || !node.IsMap()) {
        return fail<game::Condition>(path, "expected a condition mapping");
    }
    auto typeField = readString(node["type"], child(path, "type"));
    if (!typeField) {
        return GameResult<game::Condition>::err(typeField.error());
    }
    const std::string type = std::move(typeField).value();
    // Kind-specific keys may sit under `params:` or beside `type:`.
    const YAML::Node body = node["params"] && node["params"].IsMap() ? node["params"] : node;

    if (type == "attribute") {
        game::AttributeCondition condition;
        auto attribute = readString(body["attribute"], child(path, "attribute"));
        if (!attribute) {
            return GameResult<game::Condition>::err(attribute.error());
        }
        condition.attribute = std::move(attribute).value();
        auto op = optionalField<std::string>(body, "operator", path, ">=", readString);
        if (!op) {
            return GameResult<game::Condition>::err(op.error());
        }
        condition.op = game::parseCompareOp(op.value());
        auto value = readNumber(body["value"], child(path, "value"));
        if (!value) {
            return GameResult<game::Condition>::err(value.error());
        }
        condition.value = value.value();
        return GameResult<game::Condition>::ok(std::move(condition));
    }

    if (type == "flag" || type == "flag_set") {
        game::FlagCondition condition;
        auto flag = readString(body["flag"], child(path, "flag"));
        if (!flag) {
            return GameResult<game::Condition>::err(flag.error());
        }
        condition.flag = std::move(flag).value();
        if (body["value"]) {
            auto value = decodeFlagValue(body["value"]);
            if (!value) {
                return fail<game::Condition>(child(path, "value"), "expected a flag value");
            }
            condition.value = std::move(*value);
        }
        return GameResult<game::Condition>::ok(std::move(condition));
    }

    if (type == "random") {
        auto probability = readNumber(body["probability"], child(path, "probability"));
        if (!probability) {
            return GameResult<game::Condition>::err(probability.error());
        }
        return GameResult<game::Condition>::ok(game::RandomCondition{probability.value()});
    }

    if (type == "time") {
        game::TimeCondition condition;
        if (body["days"]) {
            auto days = readIntList(body["days"], child(path, "days"));
            if (!days) {
                return GameResult<game::Condition>::err(days.error());
            }
            condition.days = std::move(days).value();
        }
        if (body["periods"]) {
            auto periods = readPeriodList(body["periods"], child(path, "periods"));
            if (!periods) {
                return GameResult<game::Condition>::err(periods.error());
            }
            condition.periods = std::move(periods).value();
        }
        if (body["day_range"]) {
            const auto rangePath = child(path, "day_range");
            if (!body["day_range"].IsMap()) {
                return fail<game::Condition>(rangePath, "expected a min/max mapping");
            }
            auto min = readInteger(body["day_range"]["min"], child(rangePath, "min"));
            if (!min) {
                return GameResult<game::Condition>::err(min.error());
            }
            auto max = readInteger(body["day_range"]["max"], child(rangePath, "max"));
            if (!max) {
                return GameResult<game::Condition>::err(max.error());
            }
            condition.dayRange = game::DayRange{static_cast<int>(min.value()),
                                                static_cast<int>(max.value())};
        }
        return GameResult<game::Condition>::ok(std::move(condition));
    }

    if (type == "probability") {
        game::ProbabilityCondition condition;
        auto rate = readNumber(body["base_rate"], child(path, "base_rate"));
        if (!rate) {
            return GameResult<game::Condition>::err(rate.error());
        }
        condition.baseRate = rate.value();
        auto luck = optionalField<bool>(body, "luck_modifier", path, false, readBool);
        if (!luck) {
            return GameResult<game::Condition>::err(luck.error());
        }
        condition.luckModifier = luck.value();
        return GameResult<game::Condition>::ok(condition);
    }

    if (type == "event_history") {
        game::EventHistoryCondition condition;
        auto eventId = readString(body["event_id"], child(path, "event_id"));
        if (!eventId) {
            return GameResult<game::Condition>::err(eventId.error());
        }
        condition.eventId = std::move(eventId).value();
        auto triggered = optionalField<bool>(body, "triggered", path, true, readBool);
        if (!triggered) {
            return GameResult<game::Condition>::err(triggered.error());
        }
        condition.triggered = triggered.value();
        return GameResult<game::Condition>::ok(std::move(condition));
    }

    if (type == "character") {
        auto ids = readStringList(body["characters"], child(path, "characters"));
        if (!ids) {
            return GameResult<game::Condition>::err(ids.error());
        }
        return GameResult<game::Condition>::ok(game::CharacterCondition{std::move(ids).value()});
    }

    if (type == "event_triggered") {
        game::EventTriggeredCondition condition;
        auto eventId = readString(body["event_id"], child(path, "event_id"));
        if (!eventId) {
            return GameResult<game::Condition>::err(eventId.error());
        }
        condition.eventId = std::move(eventId).value();
        if (body["choice_index"]) {
            auto index = readInteger(body["choice_index"], child(path, "choice_index"));
            if (!index || index.value() < 0) {
                return fail<game::Condition>(child(path, "choice_index"),
                                             "expected a non-negative integer");
            }
            condition.choiceIndex = static_cast<std::size_t>(index.value());
        }
        return GameResult<game::Condition>::ok(std::move(condition));
    }

    if (type == "combination") {
        auto nested = readConditionList(body["conditions"], child(path, "conditions"));
        if (!nested) {
            return GameResult<game::Condition>::err(nested.error());
        }
        return GameResult<game::Condition>::ok(
            game::CombinationCondition{std::move(nested).value()});
    }

    return fail<game::Condition>(child(path, "type"), "unknown condition type '" + type + "'");
}

GameResult<void> ContentLoader::readEvents(const YAML::Node& root,
                                           game::EventCatalog& into) const {
    auto list = topLevelList(root, "events");
    if (!list) {
        return GameResult<void>::err(list.error());
    }
    const YAML::Node& events = list.value();
    for (std::size_t i = 0; i < events.size(); ++i) {
        auto event = readEvent(events[i], indexed("events", i), i, options_.defaultEventWeight);
        if (!event) {
            return GameResult<void>::err(event.error());
        }
        auto added = into.add(std::move(event).value());
        if (!added) {
            return added;
        }
    }
    return GameResult<void>::ok();
}

GameResult<void> ContentLoader::readEndings(const YAML::Node& root,
                                            game::EndingCatalog& into) const {
    auto list = topLevelList(root, "endings");
    if (!list) {
        return GameResult<void>::err(list.error());
    }
    const YAML::Node& endings = list.value();
    for (std::size_t i = 0; i < endings.size(); ++i) {
        auto ending = readEnding(endings[i], indexed("endings", i), i);
        if (!ending) {
            return GameResult<void>::err(ending.error());
        }
        auto added = into.add(std::move(ending).value());
        if (!added) {
            return added;
        }
    }
    return GameResult<void>::ok();
}

GameResult<void> ContentLoader::readCharacters(const YAML::Node& root,
                                               game::CharacterRoster& into) const {
    auto list = topLevelList(root, "characters");
    if (!list) {
        return GameResult<void>::err(list.error());
    }
    const YAML::Node& characters = list.value();
    for (std::size_t i = 0; i < characters.size(); ++i) {
        auto profile = readCharacter(characters[i], indexed("characters", i));
        if (!profile) {
            return GameResult<void>::err(profile.error());
        }
        auto added = into.add(std::move(profile).value());
        if (!added) {
            return added;
        }
    }
    return GameResult<void>::ok();
}

GameResult<void> ContentLoader::loadEvents(std::string_view yaml,
                                           game::EventCatalog& into) const {
    return parseDocument(yaml, [&](const YAML::Node& root) { return readEvents(root, into); });
}

GameResult<void> ContentLoader::loadEndings(std::string_view yaml,
                                            game::EndingCatalog& into) const {
    return parseDocument(yaml, [&](const YAML::Node& root) { return readEndings(root, into); });
}

GameResult<void> ContentLoader::loadCharacters(std::string_view yaml,
                                               game::CharacterRoster& into) const {
    return parseDocument(yaml,
                         [&](const YAML::Node& root) { return readCharacters(root, into); });
}

GameResult<void> ContentLoader::loadEventsFile(const std::filesystem::path& path,
                                               game::EventCatalog& into) const {
    return parseFile(path, [&](const YAML::Node& root) { return readEvents(root, into); });
}

GameResult<void> ContentLoader::loadEndingsFile(const std::filesystem::path& path,
                                                game::EndingCatalog& into) const {
    return parseFile(path, [&](const YAML::Node& root) { return readEndings(root, into); });
}

GameResult<void> ContentLoader::loadCharactersFile(const std::filesystem::path& path,
                                                   game::CharacterRoster& into) const {
    return parseFile(path, [&](const YAML::Node& root) { return readCharacters(root, into); });
}

GameResult<game::ContentCatalog> ContentLoader::loadCatalog(const ContentPaths& paths) const {
    game::ContentCatalog catalog;

    if (!paths.events.empty()) {
        auto loaded = loadEventsFile(paths.events, catalog.events);
        if (!loaded) {
            return GameResult<game::ContentCatalog>::err(loaded.error());
        }
    }
    if (!paths.endings.empty()) {
        auto loaded = loadEndingsFile(paths.endings, catalog.endings);
        if (!loaded) {
            return GameResult<game::ContentCatalog>::err(loaded.error());
        }
    }
    if (!paths.characters.empty()) {
        auto loaded = loadCharactersFile(paths.characters, catalog.characters);
        if (!loaded) {
            return GameResult<game::ContentCatalog>::err(loaded.error());
        }
    }

    NSIM_LOG_INFO(LogCategory::Content,
                  "Loaded " + std::to_string(catalog.events.size()) + " events, " +
                      std::to_string(catalog.endings.size()) + " endings, " +
                      std::to_string(catalog.characters.size()) + " characters");
    return GameResult<game::ContentCatalog>::ok(std::move(catalog));
}

}  // namespace nsim::content
