#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "encoder_sink.hpp"
#include "video_source.hpp"

namespace mock {

/// Frame source that fills every frame with one colour and records seeks.
class MockFrameSource : public FrameSource {
public:
    MockFrameSource(int w = 32, int h = 18) : width_(w), height_(h) {}

    bool seek(double t, std::chrono::milliseconds) override {
        seeks_.push_back(t);
        return !fail_seeks;
    }

    bool draw(Surface& out) override {
        if (out.width != width_ || out.height != height_) out.resize(width_, height_);
        fill(out, color);
        return true;
    }

    int width() const override { return width_; }
    int height() const override { return height_; }

    const std::vector<double>& seeks() const { return seeks_; }

    bool fail_seeks = false;  // simulate a seek that never completes in time
    Color color{200, 40, 40, 255};

private:
    int width_;
    int height_;
    std::vector<double> seeks_;
};

/// Sink that counts frames and can be told to fail at a chosen point.
class MockFrameSink : public FrameSink {
public:
    bool open(int w, int h, double fps) override {
        opened = true;
        width = w;
        height = h;
        this->fps = fps;
        return !fail_open;
    }

    bool write(const uint8_t* data, size_t size) override {
        if (fail_write_after >= 0 && (int)frames >= fail_write_after) return false;
        if (size != (size_t)width * height * 4 || data == nullptr) return false;
        frames++;
        return true;
    }

    SinkResult finish() override {
        finish_calls++;
        SinkResult r;
        r.exit_code = exit_code;
        r.ok = exit_code == 0;
        return r;
    }

    void discard() override { discard_calls++; }

    bool opened = false;
    int width = 0;
    int height = 0;
    double fps = 0.0;
    size_t frames = 0;
    int finish_calls = 0;
    int discard_calls = 0;

    bool fail_open = false;
    int fail_write_after = -1;
    int exit_code = 0;
};

} // namespace mock
