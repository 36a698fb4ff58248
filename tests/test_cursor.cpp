#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "cursor.hpp"
#include "model.hpp"

namespace {

std::vector<CursorSample> ramp() {
    // x moves 0 -> 1 over one second, y stays put
    return {{0.0, 0.0, 0.5}, {1.0, 1.0, 0.5}};
}

// ---- Smoothing ----

TEST(SmoothCursorTest, EmptyTrackHasNoCursor) {
    EXPECT_FALSE(smooth_cursor(1.0, {}, CursorSpeed::Medium).has_value());
}

TEST(SmoothCursorTest, RapidIsRawPosition) {
    auto s = smooth_cursor(0.4, ramp(), CursorSpeed::Rapid);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->x, 0.4);
}

TEST(SmoothCursorTest, TrailsBehindRawWhileMoving) {
    auto raw = cursor_at(0.5, ramp());
    auto smooth = smooth_cursor(0.5, ramp(), CursorSpeed::Medium);
    ASSERT_TRUE(raw && smooth);
    EXPECT_LT(smooth->x, raw->x);
    // Medium: 0.12 of the raw value, 0.88 of the value 0.1 s earlier
    EXPECT_NEAR(smooth->x, 0.5 * 0.12 + 0.4 * 0.88, 1e-9);
    EXPECT_DOUBLE_EQ(smooth->y, 0.5);
}

TEST(SmoothCursorTest, SlowerProfilesTrailFurther) {
    auto slow = smooth_cursor(0.6, ramp(), CursorSpeed::Slow);
    auto fast = smooth_cursor(0.6, ramp(), CursorSpeed::Fast);
    ASSERT_TRUE(slow && fast);
    EXPECT_LT(slow->x, fast->x);
}

TEST(SmoothCursorTest, StationaryCursorDoesNotDrift) {
    std::vector<CursorSample> still = {{0.0, 0.3, 0.3}, {5.0, 0.3, 0.3}};
    auto s = smooth_cursor(2.0, still, CursorSpeed::Slow);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(s->x, 0.3, 1e-12);
    EXPECT_NEAR(s->y, 0.3, 1e-12);
}

// ---- Clicks ----

TEST(ClickTest, NearClickIsStrictWindow) {
    std::vector<ClickEvent> clicks = {{2.0, 0.5, 0.5, "left"}};
    EXPECT_TRUE(is_near_click(2.1, clicks, 0.2));
    EXPECT_TRUE(is_near_click(1.85, clicks, 0.2));
    EXPECT_FALSE(is_near_click(2.5, clicks, 0.2));
    EXPECT_FALSE(is_near_click(2.0, {}, 0.2));
}

TEST(ClickTest, DedupeRemovesSameRoundedTimeAndX) {
    std::vector<ClickEvent> clicks = {
        {1.0, 0.5, 0.5, "left"},
        {0.2, 0.1, 0.1, "left"},
        {1.00001, 0.50001, 0.9, "left"},  // same after rounding
        {1.0, 0.7, 0.5, "left"},          // same time, different x
    };
    dedupe_clicks(clicks);
    ASSERT_EQ(clicks.size(), 3u);
    EXPECT_DOUBLE_EQ(clicks[0].t, 0.2);
    EXPECT_DOUBLE_EQ(clicks[1].x, 0.5);
    EXPECT_DOUBLE_EQ(clicks[2].x, 0.7);
}

// ---- Camera smoother ----

class CameraSmootherTest : public ::testing::Test {
protected:
    CameraSmoother smoother;
    FollowOptions options;
    CameraState zoomed{2.0, 0.5, 0.5};
    CameraState identity;
};

TEST_F(CameraSmootherTest, FirstFrameSnapsToBlendedTarget) {
    CursorSample cursor{0.0, 1.0, 0.0};
    CameraState cam = smoother.apply(0.0, zoomed, cursor, options);
    EXPECT_DOUBLE_EQ(cam.factor, 2.0);
    EXPECT_NEAR(cam.cx, 0.5 * 0.65 + 1.0 * 0.35, 1e-12);
    EXPECT_NEAR(cam.cy, 0.5 * 0.65, 1e-12);
}

TEST_F(CameraSmootherTest, ConsecutiveFramesMoveGradually) {
    smoother.apply(0.0, zoomed, CursorSample{0.0, 0.5, 0.5}, options);
    CameraState cam = smoother.apply(1.0 / 30, zoomed, CursorSample{0.0, 1.0, 0.5}, options);
    double target = 0.5 * 0.65 + 1.0 * 0.35;
    EXPECT_GT(cam.cx, 0.5);
    EXPECT_LT(cam.cx, target);
}

TEST_F(CameraSmootherTest, ScrubSnapsInsteadOfTrailing) {
    smoother.apply(0.0, zoomed, CursorSample{0.0, 0.0, 0.5}, options);
    CameraState cam = smoother.apply(5.0, zoomed, CursorSample{0.0, 1.0, 0.5}, options);
    EXPECT_NEAR(cam.cx, 0.5 * 0.65 + 1.0 * 0.35, 1e-12);
}

TEST_F(CameraSmootherTest, ResetForcesSnap) {
    smoother.apply(0.0, zoomed, CursorSample{0.0, 0.0, 0.5}, options);
    smoother.reset();
    EXPECT_FALSE(smoother.has_last());
    CameraState cam = smoother.apply(0.01, zoomed, CursorSample{0.0, 1.0, 0.5}, options);
    EXPECT_NEAR(cam.cx, 0.5 * 0.65 + 1.0 * 0.35, 1e-12);
}

TEST_F(CameraSmootherTest, AutoZoomFollowsCursorWithoutSegments) {
    options.auto_zoom_on_cursor = true;
    options.follow_zoom_factor = 2.5;
    CameraState cam = smoother.apply(0.0, identity, CursorSample{0.0, 0.2, 0.8}, options);
    EXPECT_DOUBLE_EQ(cam.factor, 2.5);
    EXPECT_DOUBLE_EQ(cam.cx, 0.2);
    EXPECT_DOUBLE_EQ(cam.cy, 0.8);
}

TEST_F(CameraSmootherTest, NoFollowKeepsResolvedCamera) {
    options.follow_cursor = false;
    CameraState resolved{3.0, 0.1, 0.9};
    CameraState cam = smoother.apply(0.0, resolved, CursorSample{0.0, 0.7, 0.7}, options);
    EXPECT_DOUBLE_EQ(cam.factor, 3.0);
    EXPECT_DOUBLE_EQ(cam.cx, 0.1);
    EXPECT_DOUBLE_EQ(cam.cy, 0.9);
}

TEST_F(CameraSmootherTest, IdentityWithoutCursorIsUntouched) {
    CameraState cam = smoother.apply(0.0, identity, std::nullopt, options);
    EXPECT_DOUBLE_EQ(cam.factor, 1.0);
    EXPECT_DOUBLE_EQ(cam.cx, 0.5);
    EXPECT_DOUBLE_EQ(cam.cy, 0.5);
}

} // namespace
