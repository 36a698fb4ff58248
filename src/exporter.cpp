#include "exporter.hpp"

#include <cmath>
#include <cstdio>

bool in_cut(double t, const std::vector<CutInterval>& cuts) {
    for (const auto& c : cuts) {
        if (t >= c.t_start && t < c.t_end) return true;
    }
    return false;
}

std::vector<double> enumerate_export_times(double duration, double fps, const std::vector<CutInterval>& cuts) {
    std::vector<double> times;
    if (duration <= 0.0 || fps <= 0.0) return times;
    // Tolerance keeps 0.1 * 30 (3.0000000000000004) from yielding 4 frames
    auto total = (long long)std::ceil(duration * fps - 1e-9);
    times.reserve((size_t)total);
    for (long long i = 0; i < total; i++) {
        double t = i / fps;
        if (!in_cut(t, cuts)) times.push_back(t);
    }
    return times;
}

std::string ExportProgress::format() const {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "Rendering frame %zu/%zu \xC2\xB7 %.1f fps \xC2\xB7 ETA %.0fs",
                  frames_done, total_frames, frames_per_second, eta_seconds);
    return buf;
}

ExportResult export_video(FrameSource& source, FrameSink& sink, const ExportJob& job,
                          const std::atomic<bool>& cancel, const ProgressCallback& on_progress) {
    ExportResult result;
    std::vector<double> times = enumerate_export_times(job.duration, job.fps, job.cuts);

    if (!sink.open(job.width, job.height, job.fps)) {
        result.error = "could not start the encoder";
        return result;
    }

    // Export owns its camera state; preview smoothing never leaks in
    CameraSmoother smoother;
    Surface frame(job.width, job.height);
    Surface source_frame;
    ExportProgress progress;
    progress.total_frames = times.size();
    auto started = std::chrono::steady_clock::now();

    for (double t : times) {
        if (cancel.load()) {
            result.cancelled = true;
            break;
        }

        if (!source.seek(t, job.seek_timeout)) result.seek_timeouts++;
        source.draw(source_frame);  // keeps the previous frame when nothing new decoded

        render_frame(frame, source_frame, t, job.segments, job.style, job.track, smoother, job.background_image);
        if (!sink.write(frame.pixels.data(), frame.pixels.size())) {
            result.error = "failed to write frame to the encoder";
            break;
        }
        result.frames_written++;

        progress.frames_done = result.frames_written;
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        progress.frames_per_second = elapsed > 0.0 ? progress.frames_done / elapsed : 0.0;
        progress.eta_seconds = progress.frames_per_second > 0.0
            ? (progress.total_frames - progress.frames_done) / progress.frames_per_second
            : 0.0;
        if (on_progress) on_progress(progress);
    }

    result.sink = sink.finish();
    if (result.cancelled) {
        result.error = "export cancelled";
        std::printf("EXPORT: cancelled after %zu frames\n", result.frames_written);
        sink.discard();
        return result;
    }
    if (result.error.empty() && !result.sink.ok) {
        result.error = "encoder exited with status " + std::to_string(result.sink.exit_code);
    }
    result.ok = result.error.empty();
    if (result.ok) {
        std::printf("EXPORT: wrote %zu frames (%zu slow seeks)\n", result.frames_written, result.seek_timeouts);
    } else {
        std::fprintf(stderr, "EXPORT: %s\n", result.error.c_str());
        if (!result.sink.diagnostics.empty()) std::fprintf(stderr, "%s\n", result.sink.diagnostics.c_str());
        sink.discard();
    }
    return result;
}
