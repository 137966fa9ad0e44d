#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "nsim/persistence/snapshot_codec.hpp"

using namespace nsim::game;
using namespace nsim::persistence;
using nsim::foundation::ErrorCode;

namespace {

SessionState midRunState() {
    SessionState state;
    state.meta.version = "1.0.0";
    state.meta.startTime = 1707523200000;
    state.meta.playCount = 3;
    state.progress = {4, 2, 11};

    CharacterProfile character;
    character.id = "hu_sanwan";
    character.name = "Hu Sanwan";
    character.title = "Mahjong regular";
    character.initialAttributes = {{"deposit", 3000.0}, {"luck", 70.0}};
    state.character = character;

    state.attributes = {{"deposit", 2750.25}, {"mood", 0.1}, {"weight", 66.5}};
    state.inventory = {{"firecracker", 12}, {"dumpling", 0}};
    state.eventHistory.push_back({"mahjong_invite", 2, 1, 0, "play_big", 1707600000000});
    state.eventHistory.push_back({"kitchen_duty", 3, 0, 1, "sneak_tasting", 1707700000000});
    state.flags = {{"lucky", true}, {"debt", 250.0}, {"nickname", std::string("true")}};
    state.pendingEvents.push_back({"mahjong_rematch", 5, std::nullopt, 5});
    state.pendingEvents.push_back({"kitchen_duty", std::nullopt, 1, 0});
    state.triggeredOnceEvents = {"new_year_morning", "mahjong_invite"};
    state.statistics.totalEvents = 9;
    state.statistics.totalChoices = 9;
    state.statistics.moneySpent = 1250.0;
    state.statistics.redEnvelopesGiven = 2;
    return state;
}

}  // namespace

TEST(SnapshotCodecTest, MidRunStateSurvivesEncodeDecode) {
    const auto state = midRunState();
    auto decoded = decodeSnapshot(encodeSnapshot(state));
    ASSERT_TRUE(decoded.hasValue()) << decoded.error().message();
    EXPECT_EQ(decoded.value(), state);
}

TEST(SnapshotCodecTest, StringFlagStaysString) {
    auto decoded = decodeSnapshot(encodeSnapshot(midRunState()));
    ASSERT_TRUE(decoded.hasValue());
    const auto& flags = decoded.value().flags;
    ASSERT_TRUE(std::holds_alternative<std::string>(flags.at("nickname")));
    EXPECT_EQ(std::get<std::string>(flags.at("nickname")), "true");
    EXPECT_TRUE(std::holds_alternative<bool>(flags.at("lucky")));
    EXPECT_TRUE(std::holds_alternative<double>(flags.at("debt")));
}

TEST(SnapshotCodecTest, MissingSectionsTakeDefaults) {
    auto decoded = decodeSnapshot("progress:\n  day: 4\n");
    ASSERT_TRUE(decoded.hasValue());
    const auto& state = decoded.value();
    EXPECT_EQ(state.progress.day, 4);
    EXPECT_EQ(state.progress.period, 0);
    EXPECT_EQ(state.meta.playCount, 0);
    EXPECT_FALSE(state.meta.startTime.has_value());
    EXPECT_FALSE(state.character.has_value());
    EXPECT_TRUE(state.attributes.empty());
    EXPECT_TRUE(state.pendingEvents.empty());
}

TEST(SnapshotCodecTest, PendingWildcardsStayUnset) {
    auto decoded = decodeSnapshot(R"(
pending_events:
  - event_id: kitchen_duty
    priority: 2
)");
    ASSERT_TRUE(decoded.hasValue());
    ASSERT_EQ(decoded.value().pendingEvents.size(), 1u);
    const auto& pending = decoded.value().pendingEvents[0];
    EXPECT_EQ(pending.eventId, "kitchen_duty");
    EXPECT_FALSE(pending.triggerDay.has_value());
    EXPECT_FALSE(pending.triggerPeriod.has_value());
    EXPECT_EQ(pending.priority, 2);
}

TEST(SnapshotCodecTest, NonMappingRootIsInvalid) {
    auto decoded = decodeSnapshot("- 1\n- 2\n");
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::SnapshotInvalid);
}

TEST(SnapshotCodecTest, MistypedSectionIsInvalid) {
    auto decoded = decodeSnapshot("progress: [1, 2]\n");
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::SnapshotInvalid);
    const auto* path = decoded.error().context<std::string>();
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(*path, "progress");
}

TEST(SnapshotCodecTest, NonNumericAttributeIsInvalid) {
    auto decoded = decodeSnapshot("attributes:\n  mood: cheerful\n");
    ASSERT_TRUE(decoded.hasError());
    const auto* path = decoded.error().context<std::string>();
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(*path, "attributes.mood");
}

TEST(SnapshotCodecTest, MalformedYamlIsInvalid) {
    auto decoded = decodeSnapshot("meta: {version: [\n");
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::SnapshotInvalid);
}
