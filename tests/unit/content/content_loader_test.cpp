#include <gtest/gtest.h>

#include <string>
#include <variant>

#include <yaml-cpp/yaml.h>

#include "nsim/content/content_loader.hpp"

using namespace nsim::content;
using namespace nsim::game;
using nsim::foundation::ErrorCode;

namespace {

const std::string* errorPath(const nsim::foundation::GameError& error) {
    return error.context<std::string>();
}

}  // namespace

// ===========================================================================
// Events
// ===========================================================================

TEST(ContentLoaderTest, LoadsFullEvent) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents(R"(
events:
  - id: mahjong_invite
    title: Mahjong
    category: social
    weight: 40
    once_only: true
    mutually_exclusive: [shopping_sale]
    prerequisites: kitchen_duty
    exclusive_to: [hu_sanwan]
    trigger_conditions:
      - type: attribute
        attribute: deposit
        operator: ">"
        value: 1000
    options:
      - id: play_big
        text: Play for real money
        effects:
          - attribute: deposit
            value: {min: -500, max: 500}
          - attribute: mood
            operation: set
            value: 60
            condition: {type: flag, flag: lucky}
        follow_ups:
          - event_id: mahjong_rematch
            delay: next_day
            probability: 0.5
            priority: 5
      - id: refuse
        conditions:
          - type: attribute
            attribute: face
            value: 30
        visible_if:
          - type: character
            characters: [hu_sanwan]
        unavailable_text: Too embarrassing
        special_outcome: {type: custom, tag: shy}
)",
                                    events);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    ASSERT_EQ(events.size(), 1u);

    const auto* event = events.find("mahjong_invite");
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->title, "Mahjong");
    EXPECT_EQ(event->category, "social");
    EXPECT_EQ(event->weight, 40);
    EXPECT_TRUE(event->onceOnly);
    EXPECT_EQ(event->mutuallyExclusive, std::vector<std::string>{"shopping_sale"});
    EXPECT_EQ(event->prerequisites, std::vector<std::string>{"kitchen_duty"});
    EXPECT_EQ(event->exclusiveTo, std::vector<std::string>{"hu_sanwan"});

    ASSERT_EQ(event->triggerConditions.size(), 1u);
    const auto* trigger = std::get_if<AttributeCondition>(&event->triggerConditions[0].kind);
    ASSERT_NE(trigger, nullptr);
    EXPECT_EQ(trigger->op, CompareOp::Greater);
    EXPECT_DOUBLE_EQ(trigger->value, 1000.0);

    ASSERT_EQ(event->options.size(), 2u);
    const auto& play = event->options[0];
    ASSERT_EQ(play.effects.size(), 2u);
    const auto* range = std::get_if<ValueRange>(&play.effects[0].value);
    ASSERT_NE(range, nullptr);
    EXPECT_EQ(range->min, -500);
    EXPECT_EQ(range->max, 500);
    EXPECT_EQ(play.effects[1].operation, EffectOperation::Set);
    ASSERT_TRUE(play.effects[1].condition.has_value());
    EXPECT_EQ(conditionKindName(*play.effects[1].condition), "flag");

    ASSERT_EQ(play.followUps.size(), 1u);
    EXPECT_EQ(play.followUps[0].eventId, "mahjong_rematch");
    EXPECT_EQ(play.followUps[0].delay, FollowUpDelay::NextDay);
    ASSERT_TRUE(play.followUps[0].probability.has_value());
    EXPECT_DOUBLE_EQ(*play.followUps[0].probability, 0.5);
    EXPECT_EQ(play.followUps[0].priority, 5);

    const auto& refuse = event->options[1];
    EXPECT_EQ(refuse.availabilityConditions.size(), 1u);
    EXPECT_EQ(refuse.visibilityConditions.size(), 1u);
    EXPECT_EQ(refuse.unavailableText, "Too embarrassing");
    ASSERT_TRUE(refuse.specialOutcome.has_value());
    EXPECT_EQ(refuse.specialOutcome->kind, SpecialOutcomeKind::Custom);
    EXPECT_EQ(refuse.specialOutcome->tag, "shy");
}

TEST(ContentLoaderTest, GeneratesMissingIds) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents(R"(
events:
  - title: Anonymous
    options:
      - text: first
      - text: second
)",
                                    events);
    ASSERT_TRUE(result.hasValue());
    const auto* event = events.find("event_0");
    ASSERT_NE(event, nullptr);
    ASSERT_EQ(event->options.size(), 2u);
    EXPECT_EQ(event->options[0].id, "event_0_option_0");
    EXPECT_EQ(event->options[1].id, "event_0_option_1");
}

TEST(ContentLoaderTest, EffectMapShorthandDropsZeroDeltas) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents(R"(
events:
  - id: snack
    options:
      - id: eat
        effects: {mood: 5, weight: 0.5, health: 0}
)",
                                    events);
    ASSERT_TRUE(result.hasValue());
    const auto& effects = events.find("snack")->options[0].effects;
    ASSERT_EQ(effects.size(), 2u);
    for (const auto& effect : effects) {
        EXPECT_EQ(effect.operation, EffectOperation::Add);
        EXPECT_NE(effect.attribute, "health");
    }
}

TEST(ContentLoaderTest, DaySlotShorthandBecomesTimeTrigger) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents(R"(
events:
  - id: new_year_dinner
    day: 1
    time_slot: evening
)",
                                    events);
    ASSERT_TRUE(result.hasValue());
    const auto& triggers = events.find("new_year_dinner")->triggerConditions;
    ASSERT_EQ(triggers.size(), 1u);
    const auto* time = std::get_if<TimeCondition>(&triggers[0].kind);
    ASSERT_NE(time, nullptr);
    ASSERT_TRUE(time->days.has_value());
    EXPECT_EQ(*time->days, std::vector<int>{1});
    ASSERT_TRUE(time->periods.has_value());
    EXPECT_EQ(*time->periods, std::vector<int>{2});
    EXPECT_FALSE(time->dayRange.has_value());
}

TEST(ContentLoaderTest, DefaultWeightComesFromOptions) {
    LoaderOptions options;
    options.defaultEventWeight = 7;
    ContentLoader loader(options);
    EventCatalog events;
    ASSERT_TRUE(loader.loadEvents("events:\n  - id: plain\n", events).hasValue());
    EXPECT_EQ(events.find("plain")->weight, 7);

    ContentLoader standard;
    EventCatalog more;
    ASSERT_TRUE(standard.loadEvents("events:\n  - id: plain\n", more).hasValue());
    EXPECT_EQ(more.find("plain")->weight, kDefaultEventWeight);
}

TEST(ContentLoaderTest, EmptyDocumentsLoadNothing) {
    ContentLoader loader;
    EventCatalog events;
    EXPECT_TRUE(loader.loadEvents("", events).hasValue());
    EXPECT_TRUE(loader.loadEvents("events: ~\n", events).hasValue());
    EXPECT_TRUE(events.empty());
}

// ===========================================================================
// Validation
// ===========================================================================

TEST(ContentLoaderTest, NegativeWeightRejectedWithPath) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents("events:\n  - id: a\n  - id: b\n    weight: -3\n", events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentInvalid);
    const auto* path = errorPath(result.error());
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(*path, "events[1].weight");
}

TEST(ContentLoaderTest, OversizedWeightRejectedWithPath) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents("events:\n  - id: a\n    weight: 3000000000\n", events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentInvalid);
    ASSERT_NE(errorPath(result.error()), nullptr);
    EXPECT_EQ(*errorPath(result.error()), "events[0].weight");
    EXPECT_TRUE(events.empty());

    EventCatalog largest;
    ASSERT_TRUE(loader.loadEvents("events:\n  - id: a\n    weight: 2147483647\n", largest)
                    .hasValue());
    EXPECT_EQ(largest.find("a")->weight, 2147483647);
}

TEST(ContentLoaderTest, UnknownOperationRejected) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents(R"(
events:
  - id: a
    options:
      - id: o
        effects:
          - attribute: mood
            operation: divide
            value: 2
)",
                                    events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentInvalid);
    ASSERT_NE(errorPath(result.error()), nullptr);
    EXPECT_EQ(*errorPath(result.error()), "events[0].options[0].effects[0].operation");
    EXPECT_NE(result.error().message().find("divide"), std::string_view::npos);
}

TEST(ContentLoaderTest, NonNumericEffectValueRejected) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents(R"(
events:
  - id: a
    options:
      - id: o
        effects:
          - attribute: mood
            value: lots
)",
                                    events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*errorPath(result.error()), "events[0].options[0].effects[0].value");
}

TEST(ContentLoaderTest, UnknownDelayRejected) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents(R"(
events:
  - id: a
    options:
      - id: o
        follow_ups:
          - event_id: b
            delay: next_week
)",
                                    events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*errorPath(result.error()), "events[0].options[0].follow_ups[0].delay");
}

TEST(ContentLoaderTest, DuplicateEventIdRejected) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents("events:\n  - id: twin\n  - id: twin\n", events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DuplicateId);
    EXPECT_EQ(events.size(), 1u);
}

TEST(ContentLoaderTest, MalformedYamlIsContentInvalid) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents("events: [unclosed\n", events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentInvalid);
}

TEST(ContentLoaderTest, NonMappingRootRejected) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEvents("- id: a\n", events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentInvalid);
}

TEST(ContentLoaderTest, MissingFileIsContentLoadFailed) {
    ContentLoader loader;
    EventCatalog events;
    auto result = loader.loadEventsFile("/nonexistent/nsim/events.yaml", events);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadFailed);
}

// ===========================================================================
// Endings and characters
// ===========================================================================

TEST(ContentLoaderTest, LoadsEndingWithGroupsAndModifiers) {
    ContentLoader loader;
    EndingCatalog endings;
    auto result = loader.loadEndings(R"(
endings:
  - id: happy_family
    title: Happy family
    category: success
    priority: 80
    character_id: wu_renai
    base_score: 800
    unlock_conditions:
      - conditions:
          - {type: attribute, attribute: mood, operator: ">=", value: 80}
      - conditions:
          - {type: flag, flag: reconciled}
    score_modifiers:
      - condition: {type: event_triggered, event_id: red_envelope, choice_index: 0}
        value: 150
)",
                                     endings);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    const auto* ending = endings.find("happy_family");
    ASSERT_NE(ending, nullptr);
    EXPECT_EQ(ending->category, EndingCategory::Good);
    EXPECT_EQ(ending->priority, 80);
    ASSERT_TRUE(ending->characterId.has_value());
    EXPECT_EQ(*ending->characterId, "wu_renai");
    EXPECT_DOUBLE_EQ(ending->baseScore, 800.0);
    ASSERT_EQ(ending->unlockGroups.size(), 2u);
    ASSERT_EQ(ending->modifiers.size(), 1u);
    EXPECT_DOUBLE_EQ(ending->modifiers[0].value, 150.0);
    const auto* triggered =
        std::get_if<EventTriggeredCondition>(&ending->modifiers[0].condition.kind);
    ASSERT_NE(triggered, nullptr);
    ASSERT_TRUE(triggered->choiceIndex.has_value());
    EXPECT_EQ(*triggered->choiceIndex, 0u);
}

TEST(ContentLoaderTest, BoundShorthandFormsSingleGroup) {
    ContentLoader loader;
    EndingCatalog endings;
    auto result = loader.loadEndings(R"(
endings:
  - id: healthy_life
    unlock_conditions: {min_health: 90, max_weight: 70}
)",
                                     endings);
    ASSERT_TRUE(result.hasValue());
    const auto* ending = endings.find("healthy_life");
    ASSERT_EQ(ending->unlockGroups.size(), 1u);
    ASSERT_EQ(ending->unlockGroups[0].conditions.size(), 2u);
    for (const auto& condition : ending->unlockGroups[0].conditions) {
        const auto* bound = std::get_if<AttributeCondition>(&condition.kind);
        ASSERT_NE(bound, nullptr);
        if (bound->attribute == "health") {
            EXPECT_EQ(bound->op, CompareOp::GreaterEqual);
            EXPECT_DOUBLE_EQ(bound->value, 90.0);
        } else {
            EXPECT_EQ(bound->attribute, "weight");
            EXPECT_EQ(bound->op, CompareOp::LessEqual);
        }
    }
    EXPECT_EQ(ending->category, EndingCategory::Normal);
    EXPECT_DOUBLE_EQ(ending->baseScore, 500.0);
}

TEST(ContentLoaderTest, EndingWithoutIdGetsIndexId) {
    ContentLoader loader;
    EndingCatalog endings;
    ASSERT_TRUE(loader.loadEndings("endings:\n  - title: x\n  - title: y\n", endings).hasValue());
    EXPECT_TRUE(endings.contains("ending_0"));
    EXPECT_TRUE(endings.contains("ending_1"));
}

TEST(ContentLoaderTest, UnknownEndingCategoryRejected) {
    ContentLoader loader;
    EndingCatalog endings;
    auto result = loader.loadEndings("endings:\n  - id: a\n    category: mediocre\n", endings);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*errorPath(result.error()), "endings[0].category");
}

TEST(ContentLoaderTest, CharacterRequiresId) {
    ContentLoader loader;
    CharacterRoster roster;
    auto result = loader.loadCharacters(R"(
characters:
  - id: fan_tong
    name: Fan Tong
    initial_attributes: {deposit: 8000, weight: 90}
  - name: Nameless
)",
                                        roster);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*errorPath(result.error()), "characters[1].id");
    const auto* loaded = roster.find("fan_tong");
    ASSERT_NE(loaded, nullptr);
    EXPECT_DOUBLE_EQ(loaded->initialAttributes.at("weight"), 90.0);
}

// ===========================================================================
// Conditions
// ===========================================================================

TEST(ParseConditionTest, EachKind) {
    struct Case {
        const char* yaml;
        const char* kind;
    };
    const Case cases[] = {
        {"{type: attribute, attribute: mood, value: 10}", "attribute"},
        {"{type: flag_set, flag: met_cousin}", "flag"},
        {"{type: random, probability: 0.3}", "random"},
        {"{type: time, days: [1, 2], periods: [morning]}", "time"},
        {"{type: probability, base_rate: 0.2, luck_modifier: true}", "probability"},
        {"{type: event_history, event_id: kitchen_duty, triggered: false}", "event_history"},
        {"{type: character, characters: hu_sanwan}", "character"},
        {"{type: event_triggered, event_id: lottery_booth}", "event_triggered"},
        {"{type: combination, conditions: [{type: flag, flag: a}]}", "combination"},
    };
    for (const auto& c : cases) {
        auto parsed = ContentLoader::parseCondition(YAML::Load(c.yaml), "c");
        ASSERT_TRUE(parsed.hasValue()) << c.yaml;
        EXPECT_EQ(conditionKindName(parsed.value()), c.kind) << c.yaml;
    }
}

TEST(ParseConditionTest, ParamsBlockAndDefaults) {
    auto parsed = ContentLoader::parseCondition(
        YAML::Load("{type: attribute, params: {attribute: face, value: 40}}"), "c");
    ASSERT_TRUE(parsed.hasValue());
    const auto* attribute = std::get_if<AttributeCondition>(&parsed.value().kind);
    ASSERT_NE(attribute, nullptr);
    EXPECT_EQ(attribute->attribute, "face");
    EXPECT_EQ(attribute->op, CompareOp::GreaterEqual);

    auto history =
        ContentLoader::parseCondition(YAML::Load("{type: event_history, event_id: x}"), "c");
    ASSERT_TRUE(history.hasValue());
    EXPECT_TRUE(std::get<EventHistoryCondition>(history.value().kind).triggered);
}

TEST(ParseConditionTest, TypedFlagValue) {
    auto parsed = ContentLoader::parseCondition(
        YAML::Load("{type: flag, flag: mood_word, value: grumpy}"), "c");
    ASSERT_TRUE(parsed.hasValue());
    const auto& flag = std::get<FlagCondition>(parsed.value().kind);
    ASSERT_TRUE(std::holds_alternative<std::string>(flag.value));
    EXPECT_EQ(std::get<std::string>(flag.value), "grumpy");
}

TEST(ParseConditionTest, DayRange) {
    auto parsed = ContentLoader::parseCondition(
        YAML::Load("{type: time, day_range: {min: 3, max: 5}}"), "c");
    ASSERT_TRUE(parsed.hasValue());
    const auto& time = std::get<TimeCondition>(parsed.value().kind);
    ASSERT_TRUE(time.dayRange.has_value());
    EXPECT_EQ(time.dayRange->min, 3);
    EXPECT_EQ(time.dayRange->max, 5);
    EXPECT_FALSE(time.days.has_value());

    auto scalar = ContentLoader::parseCondition(YAML::Load("{type: time, day_range: 3}"), "c");
    ASSERT_TRUE(scalar.hasError());
    EXPECT_EQ(*errorPath(scalar.error()), "c.day_range");
}

TEST(ParseConditionTest, UnknownTypeRejected) {
    auto parsed = ContentLoader::parseCondition(YAML::Load("{type: moon_phase}"), "x.y");
    ASSERT_TRUE(parsed.hasError());
    EXPECT_EQ(parsed.error().code(), ErrorCode::ContentInvalid);
    EXPECT_EQ(*errorPath(parsed.error()), "x.y.type");
}

TEST(ParseConditionTest, NegativeChoiceIndexRejected) {
    auto parsed = ContentLoader::parseCondition(
        YAML::Load("{type: event_triggered, event_id: a, choice_index: -1}"), "c");
    ASSERT_TRUE(parsed.hasError());
    EXPECT_EQ(*errorPath(parsed.error()), "c.choice_index");
}

// ===========================================================================
// Shipped content
// ===========================================================================

TEST(ShippedContentTest, CatalogLoads) {
    ContentLoader loader;
    const std::string dir = NSIM_TEST_DATA_DIR;
    auto catalog = loader.loadCatalog(
        {dir + "/events.yaml", dir + "/endings.yaml", dir + "/characters.yaml"});
    ASSERT_TRUE(catalog.hasValue()) << catalog.error().message();

    const auto& content = catalog.value();
    EXPECT_EQ(content.characters.size(), 10u);
    EXPECT_EQ(content.endings.size(), 10u);
    EXPECT_TRUE(content.events.contains("kitchen_duty"));
    EXPECT_TRUE(content.events.contains("mahjong_rematch"));
    EXPECT_TRUE(content.endings.contains("ordinary_spring"));
    EXPECT_TRUE(content.characters.contains("hu_sanwan"));

    // Follow-up targets must resolve.
    for (const auto& event : content.events.entries()) {
        for (const auto& option : event.options) {
            for (const auto& followUp : option.followUps) {
                EXPECT_TRUE(content.events.contains(followUp.eventId))
                    << event.id << " -> " << followUp.eventId;
            }
        }
    }
}

TEST(ShippedContentTest, EmptyPathsLeaveCatalogsEmpty) {
    ContentLoader loader;
    auto catalog = loader.loadCatalog({});
    ASSERT_TRUE(catalog.hasValue());
    EXPECT_TRUE(catalog.value().events.empty());
    EXPECT_TRUE(catalog.value().endings.empty());
}
