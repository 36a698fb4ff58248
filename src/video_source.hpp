#pragma once

#include <chrono>
#include <cstdint>
#include <string>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
}

#include "surface.hpp"

constexpr std::chrono::milliseconds DEFAULT_SEEK_TIMEOUT{300};

// A decoded frame stands for t once it is the frame nearest to t
inline bool frame_reaches(double frame_time, double frame_dur, double t) {
    return frame_time + frame_dur * 0.5 >= t;
}

// After end of stream the last frame still covers t while t is inside its
// display interval [frame_time, frame_time + frame_dur)
inline bool last_frame_covers(double frame_time, double frame_dur, double t) {
    return t >= frame_time && t < frame_time + frame_dur;
}

// Supplies source frames to the compositor
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Positions the source at t. Returns false when the seek failed, ran past
    // the timeout or hit end of stream short of t; the last decoded frame
    // then stays current.
    virtual bool seek(double t, std::chrono::milliseconds timeout) = 0;
    // Copies the current frame at native resolution; false when none decoded yet
    virtual bool draw(Surface& out) = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
};

// Decodes a video file with libavformat/libavcodec and converts frames to RGBA
class VideoSource : public FrameSource {
public:
    VideoSource() = default;
    ~VideoSource() override { close(); }
    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;

    bool open(const std::string& path);
    void close();
    bool loaded() const { return loaded_; }

    bool seek(double t, std::chrono::milliseconds timeout) override;
    bool draw(Surface& out) override;
    int width() const override { return width_; }
    int height() const override { return height_; }

    double duration() const { return duration_; }
    double fps() const { return fps_; }
    double current_time() const { return current_time_; }
    const std::string& path() const { return path_; }

    // Decodes the next frame in stream order
    bool decode_frame();

private:
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* packet_ = nullptr;

    int video_stream_ = -1;
    int width_ = 0;
    int height_ = 0;
    double duration_ = 0.0;
    double fps_ = 30.0;
    double time_base_ = 0.0;
    int64_t stream_start_pts_ = 0;
    double current_time_ = 0.0;
    bool has_frame_ = false;
    bool loaded_ = false;
    std::string path_;
    Surface rgba_;
};

// Decodes the first frame of any file FFmpeg can read (png, jpeg, video)
bool load_still_image(const std::string& path, Surface& out);
