#include "video_source.hpp"

#include <algorithm>
#include <cstdio>

bool VideoSource::open(const std::string& path) {
    close();
    path_ = path;

    // Ignore edit list to avoid seeking issues with videos that have non-keyframe start points
    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "ignore_editlist", "1", 0);
    int ret = avformat_open_input(&format_ctx_, path.c_str(), nullptr, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        std::fprintf(stderr, "Could not open file: %s\n", path.c_str());
        return false;
    }

    if (avformat_find_stream_info(format_ctx_, nullptr) < 0) {
        std::fprintf(stderr, "Could not find stream info\n");
        close();
        return false;
    }

    for (unsigned i = 0; i < format_ctx_->nb_streams; i++) {
        if (format_ctx_->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
            video_stream_ = (int)i;
            break;
        }
    }
    if (video_stream_ < 0) {
        std::fprintf(stderr, "No video stream found\n");
        close();
        return false;
    }

    AVStream* stream = format_ctx_->streams[video_stream_];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        std::fprintf(stderr, "Codec not found\n");
        close();
        return false;
    }
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_ || avcodec_parameters_to_context(codec_ctx_, stream->codecpar) < 0 ||
        avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
        std::fprintf(stderr, "Could not open codec\n");
        close();
        return false;
    }

    width_ = codec_ctx_->width;
    height_ = codec_ctx_->height;
    time_base_ = av_q2d(stream->time_base);
    duration_ = (stream->duration != AV_NOPTS_VALUE)
        ? (stream->duration * time_base_)
        : (format_ctx_->duration / (double)AV_TIME_BASE);
    if (duration_ < 0.0) duration_ = 0.0;
    stream_start_pts_ = (stream->start_time != AV_NOPTS_VALUE) ? stream->start_time : 0;

    AVRational rate = stream->avg_frame_rate;
    if (!rate.num || !rate.den) rate = stream->r_frame_rate;
    if (rate.num && rate.den) fps_ = av_q2d(rate);

    frame_ = av_frame_alloc();
    packet_ = av_packet_alloc();
    rgba_.resize(width_, height_);
    loaded_ = true;

    std::printf("Video: %d x %d, %.3f fps, %.3f sec\n", width_, height_, fps_, duration_);

    // Decode the first frame so draw() has something to show
    decode_frame();
    return true;
}

void VideoSource::close() {
    loaded_ = false;
    has_frame_ = false;
    if (sws_ctx_) { sws_freeContext(sws_ctx_); sws_ctx_ = nullptr; }
    if (packet_) av_packet_free(&packet_);
    if (frame_) av_frame_free(&frame_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) avformat_close_input(&format_ctx_);

    video_stream_ = -1;
    width_ = height_ = 0;
    duration_ = 0.0;
    current_time_ = 0.0;
    stream_start_pts_ = 0;
    path_.clear();
}

bool VideoSource::decode_frame() {
    if (!loaded_) return false;
    while (true) {
        int ret = avcodec_receive_frame(codec_ctx_, frame_);
        if (ret >= 0) break;
        if (ret != AVERROR(EAGAIN)) return false;

        if (av_read_frame(format_ctx_, packet_) < 0) {
            // Drain frames still buffered in the decoder
            avcodec_send_packet(codec_ctx_, nullptr);
            if (avcodec_receive_frame(codec_ctx_, frame_) >= 0) break;
            return false;
        }
        if (packet_->stream_index == video_stream_) {
            avcodec_send_packet(codec_ctx_, packet_);
        }
        av_packet_unref(packet_);
    }

    sws_ctx_ = sws_getCachedContext(sws_ctx_,
        frame_->width, frame_->height, (AVPixelFormat)frame_->format,
        width_, height_, AV_PIX_FMT_RGBA,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws_ctx_) {
        std::fprintf(stderr, "Could not create scaler for %s\n", path_.c_str());
        av_frame_unref(frame_);
        return false;
    }
    uint8_t* dst[4] = {rgba_.pixels.data(), nullptr, nullptr, nullptr};
    int dst_stride[4] = {rgba_.stride(), 0, 0, 0};
    sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, frame_->height, dst, dst_stride);

    // Use best-effort timestamp to avoid B-frame reordering issues
    int64_t ts = frame_->best_effort_timestamp;
    if (ts == AV_NOPTS_VALUE) ts = frame_->pts;
    if (ts == AV_NOPTS_VALUE) ts = stream_start_pts_;
    current_time_ = (ts - stream_start_pts_) * time_base_;
    has_frame_ = true;
    av_frame_unref(frame_);
    return true;
}

bool VideoSource::seek(double t, std::chrono::milliseconds timeout) {
    if (!loaded_) return false;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    t = std::clamp(t, 0.0, duration_);

    // Decoding forward is cheaper than a keyframe seek for small steps
    double frame_dur = fps_ > 0.0 ? 1.0 / fps_ : 1.0 / 30.0;
    bool forward = has_frame_ && t >= current_time_ && t - current_time_ < 1.0;
    if (!forward) {
        int64_t target_ts = stream_start_pts_ + (int64_t)(t / time_base_);
        if (avformat_seek_file(format_ctx_, video_stream_, INT64_MIN, target_ts, target_ts, AVSEEK_FLAG_BACKWARD) < 0) {
            std::fprintf(stderr, "[WARN] Seek to %.3f failed\n", t);
            return false;
        }
        avcodec_flush_buffers(codec_ctx_);
    }

    // Decode forward to reach the frame that covers t
    bool fresh = forward;
    while (!fresh || !frame_reaches(current_time_, frame_dur, t)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            std::fprintf(stderr, "[WARN] Seek to %.3f timed out at %.3f\n", t, current_time_);
            return false;
        }
        if (!decode_frame()) {
            // End of stream; the last frame stays current either way
            if (fresh && has_frame_ && last_frame_covers(current_time_, frame_dur, t)) return true;
            std::fprintf(stderr, "[WARN] Seek to %.3f ended at %.3f\n", t, current_time_);
            return false;
        }
        fresh = true;
    }
    return true;
}

bool VideoSource::draw(Surface& out) {
    if (!has_frame_) return false;
    out = rgba_;
    return true;
}

bool load_still_image(const std::string& path, Surface& out) {
    VideoSource source;
    if (!source.open(path)) return false;
    return source.draw(out);
}
