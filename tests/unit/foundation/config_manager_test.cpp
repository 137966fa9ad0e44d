#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "nsim/foundation/config_manager.hpp"
#include "nsim/game/game_config.hpp"

using namespace nsim::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("nsim_config_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("nsim.yaml", R"(
game:
  total_days: 9
  version: "1.0.0"
saves:
  directory: saves
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto days = config.get<int>("game.total_days");
    ASSERT_TRUE(days.hasValue());
    EXPECT_EQ(days.value(), 9);

    auto dir = config.get<std::string>("saves.directory");
    ASSERT_TRUE(dir.hasValue());
    EXPECT_EQ(dir.value(), "saves");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("{}").hasValue());

    auto result = config.get<int>("game.total_days");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());

    auto result = config.get<int>("value");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(config.getOr<int>("value", 3), 3);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYamlFails) {
    ConfigManager config;
    auto result = config.loadFromString("game: [unterminated");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, NonMapRootFails) {
    ConfigManager config;
    auto result = config.loadFromString("- a\n- b\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SequencesStayWhole) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("game:\n  period_names: [Dawn, Dusk]\n").hasValue());

    auto names = config.get<std::vector<std::string>>("game.period_names");
    ASSERT_TRUE(names.hasValue());
    EXPECT_EQ(names.value(), (std::vector<std::string>{"Dawn", "Dusk"}));
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("saves.slots", 8);

    auto result = config.get<int>("saves.slots");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 8);
}

TEST_F(ConfigManagerTest, HasKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("saves:\n  directory: out\n").hasValue());

    EXPECT_TRUE(config.hasKey("saves.directory"));
    EXPECT_FALSE(config.hasKey("saves"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("game.total_days", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<int>("game.total_days", 5);
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "game.total_days");
}

// --- GameConfig ---

TEST_F(ConfigManagerTest, GameConfigDefaultsWhenKeysMissing) {
    ConfigManager config;
    auto cfg = nsim::game::GameConfig::fromConfig(config);

    EXPECT_EQ(cfg.version, "1.0.0");
    EXPECT_EQ(cfg.calendar.totalDays, 9);
    EXPECT_EQ(cfg.calendar.periodsPerDay, 3);
    EXPECT_FALSE(cfg.seed.has_value());
    ASSERT_NE(cfg.schema.find("deposit"), nullptr);
    EXPECT_DOUBLE_EQ(cfg.schema.find("deposit")->min, -50000.0);
    EXPECT_DOUBLE_EQ(cfg.schema.find("weight")->max, 200.0);
}

TEST_F(ConfigManagerTest, GameConfigReadsOverrides) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
game:
  total_days: 3
  periods_per_day: 2
  period_names: [Day, Night]
random:
  seed: 99
attributes:
  mood:
    min: 10
    max: 90
)").hasValue());

    auto cfg = nsim::game::GameConfig::fromConfig(config);
    EXPECT_EQ(cfg.calendar.totalDays, 3);
    EXPECT_EQ(cfg.calendar.periodsPerDay, 2);
    EXPECT_EQ(cfg.calendar.periodNames, (std::vector<std::string>{"Day", "Night"}));
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 99u);
    EXPECT_DOUBLE_EQ(cfg.schema.find("mood")->min, 10.0);
    EXPECT_DOUBLE_EQ(cfg.schema.find("mood")->max, 90.0);
}
