#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "compositor.hpp"
#include "encoder_sink.hpp"
#include "model.hpp"
#include "style.hpp"
#include "video_source.hpp"

// True when t lies inside any cut. A cut owns its start instant; the frame
// at its end belongs to the clip that follows, as in Timeline::clip_at.
bool in_cut(double t, const std::vector<CutInterval>& cuts);

// Timestamps i/fps for i in [0, ceil(duration*fps)) that survive the cuts
std::vector<double> enumerate_export_times(double duration, double fps, const std::vector<CutInterval>& cuts);

struct ExportJob {
    double duration = 0.0;
    double fps = 30.0;
    int width = 1920;
    int height = 1080;
    std::vector<ZoomSegment> segments;
    std::vector<CutInterval> cuts;
    StyleConfig style;
    TrackData track;
    const Surface* background_image = nullptr;
    std::chrono::milliseconds seek_timeout = DEFAULT_SEEK_TIMEOUT;
};

struct ExportProgress {
    size_t frames_done = 0;
    size_t total_frames = 0;
    double frames_per_second = 0.0;
    double eta_seconds = 0.0;

    float fraction() const { return total_frames ? (float)frames_done / (float)total_frames : 1.0f; }
    // "Rendering frame N/M · R fps · ETA S"
    std::string format() const;
};

struct ExportResult {
    bool ok = false;
    bool cancelled = false;
    size_t frames_written = 0;
    size_t seek_timeouts = 0;
    std::string error;
    SinkResult sink;
};

using ProgressCallback = std::function<void(const ExportProgress&)>;

// Renders every surviving frame in increasing time order and streams it into
// the sink. The sink is finished on every path, including cancel and error,
// and a cancelled or failed run discards its partial output.
ExportResult export_video(FrameSource& source, FrameSink& sink, const ExportJob& job,
                          const std::atomic<bool>& cancel, const ProgressCallback& on_progress = {});
