#include <gtest/gtest.h>

#include <vector>

#include "model.hpp"
#include "zoom.hpp"

namespace {

ZoomSegment make_segment(double start, double end, double factor, double cx, double cy,
                         double ease_in = 0.0, double ease_out = 0.0) {
    ZoomSegment s;
    s.t_start = start;
    s.t_end = end;
    s.factor = factor;
    s.cx = cx;
    s.cy = cy;
    s.ease_in = ease_in;
    s.ease_out = ease_out;
    return s;
}

void expect_identity(const CameraState& cam) {
    EXPECT_DOUBLE_EQ(cam.factor, 1.0);
    EXPECT_DOUBLE_EQ(cam.cx, 0.5);
    EXPECT_DOUBLE_EQ(cam.cy, 0.5);
}

// ---- Resolver ----

TEST(ResolveCameraTest, NoSegmentsIsIdentityEverywhere) {
    std::vector<ZoomSegment> none;
    for (double t : {-1.0, 0.0, 0.5, 10.0, 1e6}) {
        expect_identity(resolve_camera(t, none, PanSpeed::Segment));
        expect_identity(resolve_camera(t, none, PanSpeed::Rapid));
    }
}

TEST(ResolveCameraTest, UnEasedSegmentHoldsInsideAndIsIdentityOutside) {
    std::vector<ZoomSegment> segs = {make_segment(2.0, 4.0, 2.5, 0.3, 0.7)};
    for (double t : {2.0, 2.5, 3.0, 3.999, 4.0}) {
        CameraState cam = resolve_camera(t, segs, PanSpeed::Segment);
        EXPECT_DOUBLE_EQ(cam.factor, 2.5) << "t=" << t;
        EXPECT_DOUBLE_EQ(cam.cx, 0.3);
        EXPECT_DOUBLE_EQ(cam.cy, 0.7);
    }
    for (double t : {0.0, 1.999, 4.001, 9.0}) {
        expect_identity(resolve_camera(t, segs, PanSpeed::Segment));
    }
}

TEST(ResolveCameraTest, LargerFactorWinsOnOverlap) {
    std::vector<ZoomSegment> segs = {
        make_segment(0.5, 2.0, 2.0, 0.2, 0.2),
        make_segment(0.8, 1.5, 3.0, 0.8, 0.6),
    };
    CameraState cam = resolve_camera(1.0, segs, PanSpeed::Segment);
    EXPECT_DOUBLE_EQ(cam.factor, 3.0);
    EXPECT_DOUBLE_EQ(cam.cx, 0.8);
    EXPECT_DOUBLE_EQ(cam.cy, 0.6);
}

TEST(ResolveCameraTest, EqualFactorsKeepFirstFound) {
    std::vector<ZoomSegment> segs = {
        make_segment(0.0, 2.0, 2.0, 0.1, 0.1),
        make_segment(0.0, 2.0, 2.0, 0.9, 0.9),
    };
    CameraState cam = resolve_camera(1.0, segs, PanSpeed::Segment);
    EXPECT_DOUBLE_EQ(cam.cx, 0.1);
    EXPECT_DOUBLE_EQ(cam.cy, 0.1);
}

TEST(ResolveCameraTest, EaseInRisesMonotonically) {
    std::vector<ZoomSegment> segs = {make_segment(2.0, 3.0, 3.0, 0.5, 0.5, 1.0, 1.0)};
    double prev = 1.0;
    for (double t = 1.0; t <= 2.0; t += 0.1) {
        double f = resolve_camera(t, segs, PanSpeed::Segment).factor;
        EXPECT_GE(f, prev - 1e-12);
        EXPECT_LE(f, 3.0);
        prev = f;
    }
    // Cubic in-out is symmetric: halfway through the ease is halfway in factor
    EXPECT_NEAR(resolve_camera(1.5, segs, PanSpeed::Segment).factor, 2.0, 1e-9);
}

TEST(ResolveCameraTest, EaseOutFallsBackToIdentity) {
    std::vector<ZoomSegment> segs = {make_segment(2.0, 3.0, 3.0, 0.5, 0.5, 1.0, 1.0)};
    EXPECT_NEAR(resolve_camera(3.5, segs, PanSpeed::Segment).factor, 2.0, 1e-9);
    EXPECT_NEAR(resolve_camera(4.0, segs, PanSpeed::Segment).factor, 1.0, 1e-9);
    expect_identity(resolve_camera(4.01, segs, PanSpeed::Segment));
}

TEST(ResolveCameraTest, PanSpeedOverridesSegmentEases) {
    // Segment has no easing, but the Slow profile eases over 1.2 s
    std::vector<ZoomSegment> segs = {make_segment(5.0, 6.0, 2.0, 0.5, 0.5, 0.0, 0.0)};
    EXPECT_DOUBLE_EQ(resolve_camera(4.5, segs, PanSpeed::Segment).factor, 1.0);
    double f = resolve_camera(4.5, segs, PanSpeed::Slow).factor;
    EXPECT_GT(f, 1.0);
    EXPECT_LT(f, 2.0);
}

// ---- Auto generation ----

TEST(AutoZoomTest, ClickAtThreeSecondsEndToEnd) {
    std::vector<ClickEvent> clicks = {{3.0, 0.25, 0.75, "left"}};
    auto segs = auto_generate_zooms(clicks, 10.0);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_NEAR(segs[0].factor, 2.2, 1e-9);
    EXPECT_LE(segs[0].t_start, 3.0);
    EXPECT_GE(segs[0].t_end, 3.0);
    EXPECT_GE(segs[0].length(), 2.0 - 1e-9);
    EXPECT_LE(segs[0].length(), 2.5 + 1e-9);

    CameraState at_click = resolve_camera(3.0, segs, PanSpeed::Medium);
    EXPECT_NEAR(at_click.factor, 2.2, 1e-9);
    EXPECT_DOUBLE_EQ(at_click.cx, 0.25);
    EXPECT_DOUBLE_EQ(at_click.cy, 0.75);
    EXPECT_DOUBLE_EQ(resolve_camera(0.0, segs, PanSpeed::Medium).factor, 1.0);
}

TEST(AutoZoomTest, ClicksInsideMinGapAreMerged) {
    std::vector<ClickEvent> clicks = {
        {1.0, 0.1, 0.1, "left"}, {1.5, 0.2, 0.2, "left"}, {3.2, 0.3, 0.3, "left"}, {6.0, 0.4, 0.4, "left"},
    };
    auto segs = auto_generate_zooms(clicks, 20.0);
    // 1.5 falls inside the first segment, 3.2 is 0.35 s after its end
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_DOUBLE_EQ(segs[0].cx, 0.1);
    EXPECT_DOUBLE_EQ(segs[1].cx, 0.4);
    EXPECT_NE(segs[0].color, segs[1].color);
}

TEST(AutoZoomTest, SegmentsStayInsideRecording) {
    std::vector<ClickEvent> clicks = {{0.05, 0.5, 0.5, "left"}, {9.5, 0.5, 0.5, "left"}};
    auto segs = auto_generate_zooms(clicks, 10.0);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_DOUBLE_EQ(segs[0].t_start, 0.0);
    EXPECT_DOUBLE_EQ(segs[1].t_end, 10.0);
}

// ---- Editing operations ----

TEST(ZoomEditTest, AddAtUsesNearestCursorSample) {
    std::vector<ZoomSegment> segs;
    std::vector<CursorSample> cursor = {{0.0, 0.1, 0.1}, {1.0, 0.6, 0.4}, {2.0, 0.9, 0.9}};
    ASSERT_TRUE(add_zoom_at(segs, 1.2, 10.0, cursor));
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_DOUBLE_EQ(segs[0].t_start, 1.2);
    EXPECT_DOUBLE_EQ(segs[0].cx, 0.6);
    EXPECT_DOUBLE_EQ(segs[0].cy, 0.4);
}

TEST(ZoomEditTest, AddAtEndOfRecordingRejected) {
    std::vector<ZoomSegment> segs;
    EXPECT_FALSE(add_zoom_at(segs, 9.95, 10.0, {}));
    EXPECT_TRUE(segs.empty());
}

TEST(ZoomEditTest, DuplicatePlacesCopyAfterOriginal) {
    std::vector<ZoomSegment> segs = {make_segment(1.0, 2.0, 3.0, 0.2, 0.3)};
    ASSERT_TRUE(duplicate_zoom(segs, 0, 10.0));
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_NEAR(segs[1].t_start, 2.1, 1e-9);
    EXPECT_NEAR(segs[1].length(), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(segs[1].factor, 3.0);
}

TEST(ZoomEditTest, DeleteOutOfRangeIsNoop) {
    std::vector<ZoomSegment> segs = {make_segment(1.0, 2.0, 2.0, 0.5, 0.5)};
    EXPECT_FALSE(delete_zoom(segs, 3));
    EXPECT_EQ(segs.size(), 1u);
    EXPECT_TRUE(delete_zoom(segs, 0));
    EXPECT_TRUE(segs.empty());
}

} // namespace
