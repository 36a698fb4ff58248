#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "tracker_io.hpp"

namespace {

class TrackerTest : public ::testing::Test {
protected:
    DisplayBounds bounds;  // 1920x1080 at the origin
    double start = 1000.0;
    TrackData track;
};

// ---- Single lines ----

TEST_F(TrackerTest, MoveIsNormalizedAndRebased) {
    ASSERT_TRUE(parse_tracker_line(R"({"type":"move","x":960,"y":270,"time":1002.5})", bounds, start, track));
    ASSERT_EQ(track.cursor.size(), 1u);
    EXPECT_DOUBLE_EQ(track.cursor[0].t, 2.5);
    EXPECT_DOUBLE_EQ(track.cursor[0].x, 0.5);
    EXPECT_DOUBLE_EQ(track.cursor[0].y, 0.25);
}

TEST_F(TrackerTest, ClickKeepsButton) {
    ASSERT_TRUE(parse_tracker_line(R"({"type":"click","x":0,"y":1080,"button":"right","time":1001})",
                                   bounds, start, track));
    ASSERT_EQ(track.clicks.size(), 1u);
    EXPECT_EQ(track.clicks[0].button, "right");
    EXPECT_DOUBLE_EQ(track.clicks[0].y, 1.0);
}

TEST_F(TrackerTest, ClickWithoutButtonIsLeft) {
    ASSERT_TRUE(parse_tracker_line(R"({"type":"click","x":10,"y":10,"time":1001})", bounds, start, track));
    EXPECT_EQ(track.clicks[0].button, "left");
}

TEST_F(TrackerTest, BoundsOffsetApplies) {
    DisplayBounds second{1920.0, 0.0, 1280.0, 720.0};
    ASSERT_TRUE(parse_tracker_line(R"({"type":"move","x":2560,"y":360,"time":1000})", second, start, track));
    EXPECT_DOUBLE_EQ(track.cursor[0].x, 0.5);
    EXPECT_DOUBLE_EQ(track.cursor[0].y, 0.5);
}

TEST_F(TrackerTest, MalformedLinesRejected) {
    EXPECT_FALSE(parse_tracker_line("not json", bounds, start, track));
    EXPECT_FALSE(parse_tracker_line(R"({"type":"move","x":1,"time":1001})", bounds, start, track));
    EXPECT_FALSE(parse_tracker_line(R"({"type":"move","x":"1","y":1,"time":1001})", bounds, start, track));
    EXPECT_FALSE(parse_tracker_line(R"({"type":"scroll","x":1,"y":1,"time":1001})", bounds, start, track));
    EXPECT_FALSE(parse_tracker_line(R"([1,2,3])", bounds, start, track));
    EXPECT_TRUE(track.cursor.empty());
    EXPECT_TRUE(track.clicks.empty());
}

TEST_F(TrackerTest, EventsBeforeRecordingStartRejected) {
    EXPECT_FALSE(parse_tracker_line(R"({"type":"move","x":1,"y":1,"time":999.5})", bounds, start, track));
}

// ---- Streams ----

TEST_F(TrackerTest, StreamSkipsGarbageAndKeepsGoing) {
    std::istringstream in(
        "{\"type\":\"move\",\"x\":0,\"y\":0,\"time\":1001}\n"
        "garbage {{\n"
        "\n"
        "{\"type\":\"move\",\"x\":1920,\"y\":1080,\"time\":1000.5}\n"
        "{\"type\":\"click\",\"x\":960,\"y\":540,\"time\":1002}\n"
        "{\"type\":\"click\",\"x\":960,\"y\":540,\"time\":1002}\n"
        "{\"type\":\"move\"\n");
    TrackerStats stats = read_tracker_stream(in, bounds, start, track);
    EXPECT_EQ(stats.moves, 2u);
    EXPECT_EQ(stats.clicks, 1u);
    EXPECT_EQ(stats.skipped, 2u);

    // Samples are reordered by time
    ASSERT_EQ(track.cursor.size(), 2u);
    EXPECT_DOUBLE_EQ(track.cursor[0].t, 0.5);
    EXPECT_DOUBLE_EQ(track.cursor[1].t, 1.0);
    ASSERT_EQ(track.clicks.size(), 1u);
    EXPECT_DOUBLE_EQ(track.clicks[0].t, 2.0);
}

TEST_F(TrackerTest, MissingFileFails) {
    EXPECT_FALSE(load_tracker_file("/nonexistent/zoomcut/tracker.jsonl", bounds, start, track));
}

} // namespace
