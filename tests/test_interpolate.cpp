#include <gtest/gtest.h>

#include <vector>

#include "cursor.hpp"
#include "interpolate.hpp"
#include "model.hpp"

namespace {

std::vector<CursorSample> two_samples() {
    return {{0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}};
}

// ---- Empty and single-sample input ----

TEST(InterpolateTest, EmptyYieldsNothing) {
    std::vector<CursorSample> none;
    EXPECT_FALSE(interpolate_at(0.5, none).has_value());
    EXPECT_FALSE(cursor_at(0.5, none).has_value());
}

TEST(InterpolateTest, SingleSampleReturnedForAnyTime) {
    std::vector<CursorSample> one = {{2.0, 0.3, 0.7}};
    for (double t : {-5.0, 0.0, 2.0, 100.0}) {
        auto s = interpolate_at(t, one);
        ASSERT_TRUE(s.has_value());
        EXPECT_DOUBLE_EQ(s->x, 0.3);
        EXPECT_DOUBLE_EQ(s->y, 0.7);
    }
}

// ---- Linear interior ----

TEST(InterpolateTest, MidpointIsLinear) {
    auto s = interpolate_at(0.5, two_samples());
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->x, 0.5);
    EXPECT_DOUBLE_EQ(s->y, 0.5);
}

TEST(InterpolateTest, ExactAtSampleTimes) {
    std::vector<CursorSample> samples = {{0.0, 0.1, 0.2}, {0.5, 0.9, 0.4}, {2.0, 0.3, 0.3}, {3.0, 0.6, 0.8}};
    for (const auto& expected : samples) {
        auto s = interpolate_at(expected.t, samples);
        ASSERT_TRUE(s.has_value());
        EXPECT_DOUBLE_EQ(s->x, expected.x);
        EXPECT_DOUBLE_EQ(s->y, expected.y);
    }
}

TEST(InterpolateTest, PicksBracketingPairInLongSequence) {
    std::vector<CursorSample> samples;
    for (int i = 0; i <= 100; i++) samples.push_back({i * 0.1, i * 0.01, 1.0 - i * 0.01});
    auto s = interpolate_at(4.25, samples);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(s->x, 0.425, 1e-9);
    EXPECT_NEAR(s->y, 0.575, 1e-9);
}

// ---- Clamping ----

TEST(InterpolateTest, ClampsBeforeFirstSample) {
    auto s = interpolate_at(-3.0, two_samples());
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->x, 0.0);
    EXPECT_DOUBLE_EQ(s->y, 0.0);
}

TEST(InterpolateTest, ClampsAfterLastSample) {
    auto s = interpolate_at(7.0, two_samples());
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->x, 1.0);
    EXPECT_DOUBLE_EQ(s->y, 1.0);
}

TEST(InterpolateTest, WorksForClickEvents) {
    std::vector<ClickEvent> clicks = {{1.0, 0.2, 0.2, "left"}, {3.0, 0.6, 0.4, "right"}};
    auto c = interpolate_at(2.0, clicks);
    ASSERT_TRUE(c.has_value());
    EXPECT_DOUBLE_EQ(c->x, 0.4);
    EXPECT_DOUBLE_EQ(c->y, 0.3);
}

} // namespace
