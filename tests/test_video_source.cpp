#include <gtest/gtest.h>

#include <chrono>

#include "video_source.hpp"

namespace {

constexpr double FRAME = 1.0 / 30.0;

// ---- Frame timing ----

TEST(FrameTimingTest, FrameReachesWithinHalfAFrame) {
    EXPECT_TRUE(frame_reaches(1.0, FRAME, 1.0));
    EXPECT_TRUE(frame_reaches(1.0, FRAME, 1.0 + FRAME * 0.4));
    EXPECT_FALSE(frame_reaches(1.0, FRAME, 1.0 + FRAME * 0.6));
    // Decoding overshot the target
    EXPECT_TRUE(frame_reaches(1.2, FRAME, 1.0));
}

TEST(FrameTimingTest, LastFrameCoversOnlyItsInterval) {
    EXPECT_TRUE(last_frame_covers(4.9, 0.1, 4.9));
    EXPECT_TRUE(last_frame_covers(4.9, 0.1, 4.95));
    EXPECT_FALSE(last_frame_covers(4.9, 0.1, 5.2));
    EXPECT_FALSE(last_frame_covers(4.9, 0.1, 4.8));
}

TEST(FrameTimingTest, EndOfStreamFarFromTargetIsNotCovered) {
    // Stream ran out at 2.0s while seeking to 3.5s
    EXPECT_FALSE(frame_reaches(2.0, FRAME, 3.5));
    EXPECT_FALSE(last_frame_covers(2.0, FRAME, 3.5));
}

// ---- Unopened source ----

TEST(VideoSourceTest, SeekWithoutFileFails) {
    VideoSource source;
    EXPECT_FALSE(source.seek(1.0, std::chrono::milliseconds(10)));
    Surface out;
    EXPECT_FALSE(source.draw(out));
}

TEST(VideoSourceTest, MissingFileDoesNotOpen) {
    VideoSource source;
    EXPECT_FALSE(source.open("/nonexistent/zoomcut/recording.mp4"));
    EXPECT_FALSE(source.loaded());
}

} // namespace
