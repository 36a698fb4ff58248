#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "exporter.hpp"
#include "session.hpp"
#include "timeline.hpp"
#include "tracker_io.hpp"
#include "video_source.hpp"
#include "zoom.hpp"

namespace {

std::atomic<bool> g_cancel{false};

void handle_interrupt(int) {
    g_cancel = true;
}

void print_usage(const char* argv0) {
    std::printf("Usage: %s <session.json> <output.mp4> [options]\n", argv0);
    std::printf("  --tracker <log.jsonl>   import cursor/click events (replaces session track)\n");
    std::printf("  --start <epoch>         recording start time for the tracker log\n");
    std::printf("  --bounds <x,y,w,h>      captured display area in pixels\n");
    std::printf("  --auto-zoom             generate zoom segments from clicks when none exist\n");
    std::printf("  --fps <n>               override output frame rate\n");
    std::printf("  --size <WxH>            override output size\n");
    std::printf("  --raw-fallback          write <output>.rgba if the encoder fails\n");
    std::printf("  --ffmpeg <path>         encoder executable (default: ffmpeg)\n");
}

struct Options {
    std::string session_path;
    std::string output;
    std::string tracker_path;
    std::string ffmpeg = "ffmpeg";
    double recording_start = 0.0;
    DisplayBounds bounds;
    bool auto_zoom = false;
    bool raw_fallback = false;
    double fps = 0.0;
    int width = 0;
    int height = 0;
};

bool parse_options(int argc, char** argv, Options& opts) {
    if (argc < 3) return false;
    opts.session_path = argv[1];
    opts.output = argv[2];
    for (int i = 3; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--tracker" && has_value) {
            opts.tracker_path = argv[++i];
        } else if (arg == "--start" && has_value) {
            opts.recording_start = std::strtod(argv[++i], nullptr);
        } else if (arg == "--bounds" && has_value) {
            DisplayBounds& b = opts.bounds;
            if (std::sscanf(argv[++i], "%lf,%lf,%lf,%lf", &b.x, &b.y, &b.width, &b.height) != 4) {
                std::fprintf(stderr, "Invalid --bounds, expected x,y,w,h\n");
                return false;
            }
        } else if (arg == "--auto-zoom") {
            opts.auto_zoom = true;
        } else if (arg == "--raw-fallback") {
            opts.raw_fallback = true;
        } else if (arg == "--fps" && has_value) {
            opts.fps = std::strtod(argv[++i], nullptr);
        } else if (arg == "--size" && has_value) {
            if (std::sscanf(argv[++i], "%dx%d", &opts.width, &opts.height) != 2) {
                std::fprintf(stderr, "Invalid --size, expected WxH\n");
                return false;
            }
        } else if (arg == "--ffmpeg" && has_value) {
            opts.ffmpeg = argv[++i];
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    Session session;
    if (!load_session(opts.session_path, session)) return 1;

    VideoSource source;
    if (!source.open(session.video_path)) return 1;
    if (session.duration <= 0.0) session.duration = source.duration();

    if (!opts.tracker_path.empty()) {
        TrackData track;
        if (!load_tracker_file(opts.tracker_path, opts.bounds, opts.recording_start, track)) return 1;
        session.track = std::move(track);
    }
    if (opts.auto_zoom && session.segments.empty()) {
        session.segments = auto_generate_zooms(session.track.clicks, session.duration);
        std::printf("Auto zoom: %zu segments from %zu clicks\n", session.segments.size(),
                    session.track.clicks.size());
    }

    Timeline timeline;
    if (session.clips.empty() || !timeline.assign(session.clips, session.duration)) {
        if (!session.clips.empty()) std::fprintf(stderr, "[WARN] Ignoring invalid clip list\n");
        timeline.reset(session.duration);
    }

    ExportJob job;
    job.duration = session.duration;
    job.fps = opts.fps > 0.0 ? opts.fps : session.fps;
    job.width = opts.width > 0 ? opts.width : session.output_width;
    job.height = opts.height > 0 ? opts.height : session.output_height;
    job.segments = session.segments;
    job.cuts = timeline.cuts();
    job.style = session.style;
    job.track = session.track;

    Surface background;
    if (job.style.bg_type == BackgroundType::Image && !job.style.bg_image.empty()) {
        if (load_still_image(job.style.bg_image, background)) {
            job.background_image = &background;
        } else {
            std::fprintf(stderr, "[WARN] Could not load background image %s\n", job.style.bg_image.c_str());
        }
    }

    std::signal(SIGINT, handle_interrupt);
    auto report = [](const ExportProgress& p) {
        if (p.frames_done % 30 == 0 || p.frames_done == p.total_frames) {
            std::printf("\r%s", p.format().c_str());
            std::fflush(stdout);
        }
    };

    FfmpegPipeSink sink(opts.output, opts.ffmpeg);
    ExportResult result = export_video(source, sink, job, g_cancel, report);
    std::printf("\n");
    if (result.ok) {
        std::printf("Exported %s\n", opts.output.c_str());
        return 0;
    }
    if (result.cancelled || !opts.raw_fallback) return 1;

    std::string raw_path = opts.output + ".rgba";
    std::fprintf(stderr, "[WARN] Encoder failed, writing raw frames to %s\n", raw_path.c_str());
    RawFileSink raw(raw_path);
    ExportResult fallback = export_video(source, raw, job, g_cancel, report);
    std::printf("\n");
    if (!fallback.ok) return 1;
    std::printf("Exported %s (%s)\n", raw_path.c_str(), fallback.sink.diagnostics.c_str());
    return 0;
}
