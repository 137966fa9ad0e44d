#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "nsim/foundation/random_source.hpp"
#include "support/scripted_random.hpp"

using namespace nsim::foundation;
using nsim::test::ScriptedRandomSource;

TEST(SeededRandomSourceTest, DrawsStayInUnitInterval) {
    SeededRandomSource random(1234);
    for (int i = 0; i < 10000; ++i) {
        double draw = random.next();
        ASSERT_GE(draw, 0.0);
        ASSERT_LT(draw, 1.0);
    }
}

TEST(SeededRandomSourceTest, SameSeedSameSequence) {
    SeededRandomSource a(42);
    SeededRandomSource b(42);
    for (int i = 0; i < 100; ++i) {
        EXPECT_DOUBLE_EQ(a.next(), b.next());
    }
    EXPECT_EQ(a.seed(), 42u);
}

TEST(SeededRandomSourceTest, DifferentSeedsDiverge) {
    SeededRandomSource a(1);
    SeededRandomSource b(2);
    std::vector<double> da;
    std::vector<double> db;
    for (int i = 0; i < 8; ++i) {
        da.push_back(a.next());
        db.push_back(b.next());
    }
    EXPECT_NE(da, db);
}

TEST(RandomSourceTest, UniformIntCoversInclusiveRange) {
    ScriptedRandomSource random{0.0, 0.999999, 0.5};
    EXPECT_EQ(random.uniformInt(10, 20), 10);
    EXPECT_EQ(random.uniformInt(10, 20), 20);
    EXPECT_EQ(random.uniformInt(10, 20), 15);
    EXPECT_EQ(random.consumed(), 3u);
}

TEST(RandomSourceTest, UniformIntSwapsReversedBounds) {
    ScriptedRandomSource random{0.0};
    EXPECT_EQ(random.uniformInt(5, -5), -5);
}

TEST(RandomSourceTest, UniformIntSeededStaysInRange) {
    SeededRandomSource random(7);
    for (int i = 0; i < 5000; ++i) {
        auto value = random.uniformInt(-3, 3);
        ASSERT_GE(value, -3);
        ASSERT_LE(value, 3);
    }
}
