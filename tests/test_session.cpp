#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "session.hpp"

namespace {

using json = nlohmann::json;

Session sample_session() {
    Session s;
    s.video_path = "/recordings/demo.mp4";
    s.duration = 12.5;
    s.fps = 60.0;
    s.output_width = 1280;
    s.output_height = 720;
    s.playhead = 3.25;
    s.track.cursor = {{0.0, 0.1, 0.2}, {1.0, 0.3, 0.4}};
    s.track.clicks = {{0.5, 0.3, 0.4, "right"}};

    ZoomSegment seg;
    seg.t_start = 1.0;
    seg.t_end = 3.0;
    seg.cx = 0.25;
    seg.cy = 0.75;
    seg.factor = 2.8;
    seg.ease_in = 0.2;
    seg.ease_out = 0.6;
    seg.color = "#00B894";
    seg.label = "intro";
    s.segments.push_back(seg);

    s.clips = {{0.0, 4.0, false}, {4.0, 6.0, true}, {6.0, 12.5, false}};

    s.style.padding = 64.0;
    s.style.bg_type = BackgroundType::Radial;
    s.style.bg_color = "#101010";
    s.style.cursor_style = CursorGlyph::Neon;
    s.style.cursor_scale = 1.6;
    s.style.smooth_cursor_glyph = true;
    s.style.screen_motion_blur = true;
    s.style.auto_zoom_on_cursor = true;
    s.style.cursor_speed = CursorSpeed::Rapid;
    s.style.pan_speed = PanSpeed::Segment;
    return s;
}

// ---- JSON mapping ----

TEST(SessionJsonTest, NonDefaultFieldsSurvive) {
    Session in = sample_session();
    Session out;
    ASSERT_TRUE(session_from_json(session_to_json(in), out));

    EXPECT_EQ(out.video_path, in.video_path);
    EXPECT_DOUBLE_EQ(out.duration, 12.5);
    EXPECT_DOUBLE_EQ(out.fps, 60.0);
    EXPECT_EQ(out.output_width, 1280);
    EXPECT_EQ(out.output_height, 720);
    EXPECT_DOUBLE_EQ(out.playhead, 3.25);
    EXPECT_EQ(out.track.cursor.size(), 2u);
    ASSERT_EQ(out.track.clicks.size(), 1u);
    EXPECT_EQ(out.track.clicks[0].button, "right");

    ASSERT_EQ(out.segments.size(), 1u);
    EXPECT_DOUBLE_EQ(out.segments[0].factor, 2.8);
    EXPECT_DOUBLE_EQ(out.segments[0].ease_out, 0.6);
    EXPECT_EQ(out.segments[0].label, "intro");
    EXPECT_EQ(out.segments[0].color, "#00B894");

    ASSERT_EQ(out.clips.size(), 3u);
    EXPECT_TRUE(out.clips[1].deleted);

    EXPECT_DOUBLE_EQ(out.style.padding, 64.0);
    EXPECT_EQ(out.style.bg_type, BackgroundType::Radial);
    EXPECT_EQ(out.style.bg_color, "#101010");
    EXPECT_EQ(out.style.cursor_style, CursorGlyph::Neon);
    EXPECT_DOUBLE_EQ(out.style.cursor_scale, 1.6);
    EXPECT_TRUE(out.style.smooth_cursor_glyph);
    EXPECT_TRUE(out.style.screen_motion_blur);
    EXPECT_TRUE(out.style.auto_zoom_on_cursor);
    EXPECT_EQ(out.style.cursor_speed, CursorSpeed::Rapid);
    EXPECT_EQ(out.style.pan_speed, PanSpeed::Segment);
}

TEST(SessionJsonTest, InvalidStyleValuesFallBackToDefaults) {
    json j = {
        {"padding", "wide"},
        {"bg_type", "plasma"},
        {"bg_color", "blue"},
        {"cursor_style", 3},
        {"shadow_intensity", 400},
        {"pan_speed", "fast"},
    };
    StyleConfig s = style_from_json(j);
    StyleConfig defaults;
    EXPECT_DOUBLE_EQ(s.padding, defaults.padding);
    EXPECT_EQ(s.bg_type, defaults.bg_type);
    EXPECT_EQ(s.bg_color, defaults.bg_color);
    EXPECT_EQ(s.cursor_style, defaults.cursor_style);
    EXPECT_DOUBLE_EQ(s.shadow_intensity, 100.0);
    EXPECT_EQ(s.pan_speed, PanSpeed::Fast);
}

TEST(SessionJsonTest, DegenerateSegmentsDropped) {
    json j = session_to_json(sample_session());
    j["segments"].push_back(json{{"t_start", 5.0}, {"t_end", 5.05}});
    Session out;
    ASSERT_TRUE(session_from_json(j, out));
    EXPECT_EQ(out.segments.size(), 1u);
}

TEST(SessionJsonTest, OutOfRangeOutputSizeFallsBack) {
    json j = session_to_json(sample_session());
    j["output"] = {{"width", 1e30}, {"height", 720}};
    Session out;
    ASSERT_TRUE(session_from_json(j, out));
    EXPECT_EQ(out.output_width, 1920);
    EXPECT_EQ(out.output_height, 1080);

    j["output"] = {{"width", 1280}, {"height", -4e12}};
    ASSERT_TRUE(session_from_json(j, out));
    EXPECT_EQ(out.output_width, 1920);
    EXPECT_EQ(out.output_height, 1080);

    j["output"] = {{"width", 1280.0}, {"height", 720.0}};
    ASSERT_TRUE(session_from_json(j, out));
    EXPECT_EQ(out.output_width, 1280);
    EXPECT_EQ(out.output_height, 720);
}

TEST(SessionJsonTest, NonObjectRejected) {
    Session out;
    EXPECT_FALSE(session_from_json(json::array(), out));
}

// ---- Files ----

TEST(SessionFileTest, SaveThenLoad) {
    std::string path = ::testing::TempDir() + "zoomcut_session_test.json";
    ASSERT_TRUE(save_session(path, sample_session()));
    Session out;
    ASSERT_TRUE(load_session(path, out));
    EXPECT_EQ(out.video_path, "/recordings/demo.mp4");
    EXPECT_EQ(out.clips.size(), 3u);
    std::remove(path.c_str());
}

TEST(SessionFileTest, CorruptFileFailsCleanly) {
    std::string path = ::testing::TempDir() + "zoomcut_corrupt_test.json";
    {
        std::ofstream f(path);
        f << "{\"video\": ";
    }
    Session out;
    out.video_path = "unchanged";
    EXPECT_FALSE(load_session(path, out));
    EXPECT_EQ(out.video_path, "unchanged");
    std::remove(path.c_str());
}

TEST(SessionFileTest, MissingFileFails) {
    Session out;
    EXPECT_FALSE(load_session("/nonexistent/zoomcut/session.json", out));
}

} // namespace
