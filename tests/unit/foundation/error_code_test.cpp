#include <gtest/gtest.h>

#include <string>

#include "nsim/foundation/error_code.hpp"
#include "nsim/foundation/game_error.hpp"

using namespace nsim::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::NotFound), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ContentInvalid), "Content");
    EXPECT_EQ(errorSubsystem(ErrorCode::DuplicateId), "Content");
    EXPECT_EQ(errorSubsystem(ErrorCode::RunFinished), "Session");
    EXPECT_EQ(errorSubsystem(ErrorCode::OptionUnavailable), "Session");
    EXPECT_EQ(errorSubsystem(ErrorCode::SnapshotInvalid), "Persistence");
    EXPECT_EQ(errorSubsystem(ErrorCode::SlotEmpty), "Persistence");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, UnmappedRangeIsUnknown) {
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x0F00)), "Unknown");
}

// --- GameError tests ---

TEST(GameErrorTest, DefaultConstruction) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(GameErrorTest, CodeAndMessage) {
    GameError err(ErrorCode::SlotOutOfRange, "slot 7 out of range");
    EXPECT_EQ(err.code(), ErrorCode::SlotOutOfRange);
    EXPECT_EQ(err.message(), "slot 7 out of range");
    EXPECT_EQ(err.subsystem(), "Persistence");
    EXPECT_FALSE(err.isSuccess());
}

TEST(GameErrorTest, WithContext) {
    GameError err(ErrorCode::ContentInvalid, "bad option",
                  std::string("events[3].options[1]"));
    EXPECT_TRUE(err.hasContext());
    const auto* path = err.context<std::string>();
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(*path, "events[3].options[1]");

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(GameErrorTest, SuccessCheck) {
    GameError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}
