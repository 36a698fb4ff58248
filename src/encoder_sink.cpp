#include "encoder_sink.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr size_t MAX_DIAGNOSTIC_BYTES = 4096;

std::string read_log_tail(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return "";
    std::stringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();
    if (text.size() > MAX_DIAGNOSTIC_BYTES) text = text.substr(text.size() - MAX_DIAGNOSTIC_BYTES);
    return text;
}

std::string format_fps(double fps) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", fps);
    return buf;
}

} // anonymous namespace

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

void remove_partial_output(const std::string& path) {
    if (path.empty()) return;
    if (std::remove(path.c_str()) == 0) {
        std::fprintf(stderr, "EXPORT: removed partial output %s\n", path.c_str());
    } else if (errno != ENOENT) {
        std::fprintf(stderr, "[WARN] Could not remove partial output %s: %s\n", path.c_str(), std::strerror(errno));
    }
}

FfmpegPipeSink::FfmpegPipeSink(std::string output, std::string ffmpeg)
    : output_(std::move(output)), ffmpeg_(std::move(ffmpeg)) {}

FfmpegPipeSink::~FfmpegPipeSink() {
    // Never leave the encoder running
    if (pipe_) finish();
}

std::vector<std::string> FfmpegPipeSink::command_args(int width, int height, double fps) const {
    return {
        ffmpeg_, "-y",
        "-f", "rawvideo",
        "-pix_fmt", "rgba",
        "-s", std::to_string(width) + "x" + std::to_string(height),
        "-r", format_fps(fps),
        "-i", "-",
        "-c:v", "libx264",
        "-pix_fmt", "yuv420p",
        "-preset", "medium",
        "-crf", "18",
        "-movflags", "+faststart",
        output_,
    };
}

bool FfmpegPipeSink::open(int width, int height, double fps) {
    if (pipe_) return false;
    if (width <= 0 || height <= 0 || fps <= 0.0) {
        std::fprintf(stderr, "EXPORT: invalid stream format %dx%d @ %g\n", width, height, fps);
        return false;
    }

    char log_template[] = "/tmp/zoomcut-ffmpeg-XXXXXX";
    int log_fd = mkstemp(log_template);
    if (log_fd < 0) {
        std::fprintf(stderr, "EXPORT: could not create encoder log: %s\n", std::strerror(errno));
        return false;
    }
    ::close(log_fd);
    log_path_ = log_template;

    std::ostringstream cmd;
    for (const auto& arg : command_args(width, height, fps)) cmd << shell_quote(arg) << ' ';
    cmd << "2> " << shell_quote(log_path_);

    // A dead encoder must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    pipe_ = popen(cmd.str().c_str(), "w");
    if (!pipe_) {
        std::fprintf(stderr, "EXPORT: failed to start %s: %s\n", ffmpeg_.c_str(), std::strerror(errno));
        std::remove(log_path_.c_str());
        log_path_.clear();
        return false;
    }
    write_failed_ = false;
    std::printf("EXPORT: encoding %dx%d @ %g fps to %s\n", width, height, fps, output_.c_str());
    return true;
}

bool FfmpegPipeSink::write(const uint8_t* data, size_t size) {
    if (!pipe_ || write_failed_) return false;
    // fwrite blocks while the pipe is full
    size_t written = std::fwrite(data, 1, size, pipe_);
    if (written != size) {
        std::fprintf(stderr, "EXPORT: failed to write frame to encoder: %s\n", std::strerror(errno));
        write_failed_ = true;
        return false;
    }
    return true;
}

SinkResult FfmpegPipeSink::finish() {
    SinkResult result;
    if (!pipe_) {
        result.diagnostics = "encoder was not started";
        return result;
    }

    int status = pclose(pipe_);
    pipe_ = nullptr;
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    result.diagnostics = read_log_tail(log_path_);
    std::remove(log_path_.c_str());
    log_path_.clear();

    result.ok = result.exit_code == 0 && !write_failed_;
    if (!result.ok) {
        std::fprintf(stderr, "EXPORT: encoder failed (exit %d)\n", result.exit_code);
    }
    return result;
}

void FfmpegPipeSink::discard() {
    if (pipe_) finish();
    remove_partial_output(output_);
}

RawFileSink::~RawFileSink() {
    if (file_) std::fclose(file_);
}

bool RawFileSink::open(int width, int height, double fps) {
    if (file_) return false;
    file_ = std::fopen(output_.c_str(), "wb");
    if (!file_) {
        std::fprintf(stderr, "EXPORT: could not open %s: %s\n", output_.c_str(), std::strerror(errno));
        return false;
    }
    width_ = width;
    height_ = height;
    fps_ = fps;
    write_failed_ = false;
    return true;
}

bool RawFileSink::write(const uint8_t* data, size_t size) {
    if (!file_ || write_failed_) return false;
    if (std::fwrite(data, 1, size, file_) != size) {
        std::fprintf(stderr, "EXPORT: failed to write %s: %s\n", output_.c_str(), std::strerror(errno));
        write_failed_ = true;
        return false;
    }
    return true;
}

SinkResult RawFileSink::finish() {
    SinkResult result;
    if (!file_) {
        result.diagnostics = "raw output was not opened";
        return result;
    }
    bool closed = std::fclose(file_) == 0;
    file_ = nullptr;
    result.exit_code = (closed && !write_failed_) ? 0 : 1;
    result.ok = result.exit_code == 0;

    char buf[256];
    std::snprintf(buf, sizeof(buf), "raw rgba %dx%d @ %g fps", width_, height_, fps_);
    result.diagnostics = buf;
    return result;
}

void RawFileSink::discard() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    remove_partial_output(output_);
}
