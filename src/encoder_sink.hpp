#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

struct SinkResult {
    bool ok = false;
    int exit_code = -1;
    std::string diagnostics;
};

// Consumer of the raw RGBA frame stream. write() blocks while the consumer
// cannot take more data; finish() signals end-of-stream and reports the
// consumer's verdict. discard() deletes whatever a failed run left behind.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual bool open(int width, int height, double fps) = 0;
    virtual bool write(const uint8_t* data, size_t size) = 0;
    virtual SinkResult finish() = 0;
    virtual void discard() = 0;
};

// Pipes frames into an ffmpeg child process that encodes H.264 MP4.
// Exit status 0 is the only success; the child's stderr becomes the diagnostics.
class FfmpegPipeSink : public FrameSink {
public:
    explicit FfmpegPipeSink(std::string output, std::string ffmpeg = "ffmpeg");
    ~FfmpegPipeSink() override;
    FfmpegPipeSink(const FfmpegPipeSink&) = delete;
    FfmpegPipeSink& operator=(const FfmpegPipeSink&) = delete;

    bool open(int width, int height, double fps) override;
    bool write(const uint8_t* data, size_t size) override;
    SinkResult finish() override;
    void discard() override;

    // Argument list handed to the encoder, program name first
    std::vector<std::string> command_args(int width, int height, double fps) const;

private:
    std::string output_;
    std::string ffmpeg_;
    std::string log_path_;
    FILE* pipe_ = nullptr;
    bool write_failed_ = false;
};

// Writes the unencoded stream to a file; used when no encoder is available
class RawFileSink : public FrameSink {
public:
    explicit RawFileSink(std::string output) : output_(std::move(output)) {}
    ~RawFileSink() override;
    RawFileSink(const RawFileSink&) = delete;
    RawFileSink& operator=(const RawFileSink&) = delete;

    bool open(int width, int height, double fps) override;
    bool write(const uint8_t* data, size_t size) override;
    SinkResult finish() override;
    void discard() override;

private:
    std::string output_;
    FILE* file_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    double fps_ = 0.0;
    bool write_failed_ = false;
};

std::string shell_quote(const std::string& arg);

// Deletes a partially written output file, if there is one
void remove_partial_output(const std::string& path);
