#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "nsim/game/attribute_store.hpp"
#include "nsim/game/choice_processor.hpp"
#include "nsim/game/condition_evaluator.hpp"
#include "nsim/game/progress_clock.hpp"
#include "support/scripted_random.hpp"

using namespace nsim::game;
using nsim::foundation::ErrorCode;
using nsim::test::ScriptedRandomSource;

namespace {

Effect addTo(const std::string& attribute, double delta) {
    Effect effect;
    effect.attribute = attribute;
    effect.value = delta;
    return effect;
}

FollowUpSpec followUp(const std::string& id, FollowUpDelay delay,
                      std::optional<double> probability = std::nullopt,
                      int32_t priority = 0) {
    FollowUpSpec spec;
    spec.eventId = id;
    spec.delay = delay;
    spec.probability = probability;
    spec.priority = priority;
    return spec;
}

EventDefinition mahjongEvent() {
    EventDefinition event;
    event.id = "mahjong_invitation";

    OptionDefinition join;
    join.id = "join";
    join.text = "Take a seat";
    join.effects = {addTo("mood", 5.0), addTo("deposit", -200.0)};
    join.feedback = "The tiles clatter.";
    join.followUps = {followUp("mahjong_rematch", FollowUpDelay::NextDay, 0.5, 5)};

    OptionDefinition decline;
    decline.id = "decline";
    decline.effects = {addTo("face", -3.0)};
    decline.followUps = {followUp("kitchen_duty", FollowUpDelay::NextPeriod)};

    OptionDefinition leave;
    leave.id = "leave_town";
    leave.specialOutcome = SpecialOutcome{SpecialOutcomeKind::EndingTrigger, "leave_town"};

    event.options = {join, decline, leave};
    return event;
}

}  // namespace

class ChoiceProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        state.attributes = {{"mood", 50.0}, {"deposit", 1000.0}, {"face", 50.0}};
    }

    SessionState state;
    AttributeSchema schema = AttributeSchema::defaults();
    Calendar calendar;
    ScriptedRandomSource random;
    ProgressClock clock{state.progress, calendar};
    AttributeStore store{state, schema, random};
    ConditionEvaluator evaluator{state, store, random};
    ChoiceProcessor processor{state, store, evaluator, clock, random};
};

// =============================================================================
// process
// =============================================================================

TEST_F(ChoiceProcessorTest, AppliesEffectsAndRecordsHistory) {
    random.push(0.9);  // follow-up probability draw fails
    auto event = mahjongEvent();

    auto result = processor.process(event, 0);

    ASSERT_TRUE(result.hasValue());
    const auto& outcome = result.value();
    EXPECT_EQ(outcome.eventId, "mahjong_invitation");
    EXPECT_EQ(outcome.optionId, "join");
    EXPECT_EQ(outcome.optionIndex, 0u);
    EXPECT_EQ(outcome.feedback, "The tiles clatter.");
    ASSERT_EQ(outcome.effects.size(), 2u);
    EXPECT_DOUBLE_EQ(store.get("mood"), 55.0);
    EXPECT_DOUBLE_EQ(store.get("deposit"), 800.0);

    ASSERT_EQ(state.eventHistory.size(), 1u);
    EXPECT_EQ(state.eventHistory[0].eventId, "mahjong_invitation");
    EXPECT_EQ(state.eventHistory[0].choiceIndex, 0u);
    EXPECT_EQ(state.eventHistory[0].choiceId, "join");
    EXPECT_GT(state.eventHistory[0].timestamp, 0);
    EXPECT_EQ(state.statistics.totalEvents, 1);
    EXPECT_EQ(state.statistics.totalChoices, 1);
    EXPECT_DOUBLE_EQ(state.statistics.moneySpent, 200.0);
}

TEST_F(ChoiceProcessorTest, OutOfRangeIndexLeavesStateUntouched) {
    auto event = mahjongEvent();
    const SessionState before = state;

    auto result = processor.process(event, 3);

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(state, before);
    EXPECT_EQ(random.consumed(), 0u);
}

TEST_F(ChoiceProcessorTest, OnceOnlyEventMarkedTriggered) {
    auto event = mahjongEvent();
    event.onceOnly = true;

    ASSERT_TRUE(processor.process(event, 1).hasValue());
    ASSERT_TRUE(processor.process(event, 1).hasValue());

    ASSERT_EQ(state.triggeredOnceEvents.size(), 1u);
    EXPECT_EQ(state.triggeredOnceEvents[0], "mahjong_invitation");
}

TEST_F(ChoiceProcessorTest, RepeatableEventNotMarked) {
    auto event = mahjongEvent();
    ASSERT_TRUE(processor.process(event, 1).hasValue());
    EXPECT_TRUE(state.triggeredOnceEvents.empty());
}

TEST_F(ChoiceProcessorTest, SpecialOutcomeEndsRun) {
    auto event = mahjongEvent();
    auto result = processor.process(event, 2);

    ASSERT_TRUE(result.hasValue());
    ASSERT_TRUE(result.value().specialOutcome.has_value());
    EXPECT_EQ(result.value().specialOutcome->tag, "leave_town");
    EXPECT_TRUE(result.value().endsRun());
}

TEST(SpecialOutcomeTest, CustomDoesNotTerminate) {
    EXPECT_FALSE((SpecialOutcome{SpecialOutcomeKind::Custom, "fireworks"}).terminatesRun());
    EXPECT_TRUE((SpecialOutcome{SpecialOutcomeKind::GameOver, ""}).terminatesRun());
}

// =============================================================================
// Follow-ups
// =============================================================================

TEST_F(ChoiceProcessorTest, NextPeriodFollowUpQueued) {
    auto event = mahjongEvent();
    auto result = processor.process(event, 1);

    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(state.pendingEvents.size(), 1u);
    const auto& pending = state.pendingEvents[0];
    EXPECT_EQ(pending.eventId, "kitchen_duty");
    EXPECT_EQ(pending.triggerDay, 1);
    EXPECT_EQ(pending.triggerPeriod, 1);
    EXPECT_EQ(result.value().queued, state.pendingEvents);
}

TEST_F(ChoiceProcessorTest, NextPeriodCarriesIntoNextDay) {
    state.progress.day = 2;
    state.progress.period = 2;
    auto event = mahjongEvent();

    ASSERT_TRUE(processor.process(event, 1).hasValue());

    ASSERT_EQ(state.pendingEvents.size(), 1u);
    EXPECT_EQ(state.pendingEvents[0].triggerDay, 3);
    EXPECT_EQ(state.pendingEvents[0].triggerPeriod, 0);
}

TEST_F(ChoiceProcessorTest, NextDayFollowUpWithProbability) {
    state.progress.period = 1;
    random.push(0.5);  // draw <= 0.5 queues
    auto event = mahjongEvent();

    ASSERT_TRUE(processor.process(event, 0).hasValue());

    ASSERT_EQ(state.pendingEvents.size(), 1u);
    EXPECT_EQ(state.pendingEvents[0].eventId, "mahjong_rematch");
    EXPECT_EQ(state.pendingEvents[0].triggerDay, 2);
    EXPECT_EQ(state.pendingEvents[0].triggerPeriod, 0);
    EXPECT_EQ(state.pendingEvents[0].priority, 5);
}

TEST_F(ChoiceProcessorTest, FailedProbabilitySkipsQueue) {
    random.push(0.51);
    auto event = mahjongEvent();

    auto result = processor.process(event, 0);

    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(state.pendingEvents.empty());
    EXPECT_TRUE(result.value().queued.empty());
}

TEST_F(ChoiceProcessorTest, ImmediateFollowUpIsNotQueued) {
    EXPECT_FALSE(processor.resolveFollowUp(
        followUp("fireworks", FollowUpDelay::Immediate)).has_value());

    auto event = mahjongEvent();
    event.options[1].followUps = {followUp("fireworks", FollowUpDelay::Immediate, 1.0)};
    ASSERT_TRUE(processor.process(event, 1).hasValue());

    EXPECT_TRUE(state.pendingEvents.empty());
    EXPECT_EQ(random.consumed(), 0u);
}

TEST_F(ChoiceProcessorTest, MarkTriggeredIsIdempotent) {
    processor.markTriggered("new_year_dinner");
    processor.markTriggered("new_year_dinner");
    processor.markTriggered("temple_fair");

    EXPECT_EQ(state.triggeredOnceEvents,
              (std::vector<std::string>{"new_year_dinner", "temple_fair"}));
}
