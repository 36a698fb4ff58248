#include "timeline.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr double PARTITION_EPS = 1e-6;

} // anonymous namespace

void Timeline::reset(double duration) {
    duration_ = std::max(0.0, duration);
    playhead_ = 0.0;
    clips_.clear();
    clips_.push_back({0.0, duration_, false});
    rebuild_cuts();
}

bool Timeline::assign(const std::vector<Clip>& clips, double duration) {
    if (clips.empty() || duration < 0.0) return false;
    if (std::abs(clips.front().start) > PARTITION_EPS) return false;
    if (std::abs(clips.back().end - duration) > PARTITION_EPS) return false;
    for (size_t i = 0; i < clips.size(); i++) {
        if (clips[i].end <= clips[i].start) return false;
        if (i > 0 && std::abs(clips[i].start - clips[i - 1].end) > PARTITION_EPS) return false;
    }
    duration_ = duration;
    clips_ = clips;
    // Close rounding gaps so the partition is exact
    clips_.front().start = 0.0;
    clips_.back().end = duration_;
    for (size_t i = 1; i < clips_.size(); i++) clips_[i].start = clips_[i - 1].end;
    playhead_ = std::clamp(playhead_, 0.0, duration_);
    rebuild_cuts();
    return true;
}

void Timeline::seek(double t) {
    playhead_ = std::clamp(t, 0.0, duration_);
}

bool Timeline::split_at(double t) {
    auto index = clip_at(t);
    if (!index) return false;
    Clip& clip = clips_[*index];
    if (t <= clip.start + SPLIT_EDGE_MARGIN || t >= clip.end - SPLIT_EDGE_MARGIN) return false;

    Clip right{t, clip.end, clip.deleted};
    clip.end = t;
    clips_.insert(clips_.begin() + (std::ptrdiff_t)*index + 1, right);
    rebuild_cuts();
    return true;
}

bool Timeline::trim_edge(size_t index, ClipEdge edge, double t) {
    if (index >= clips_.size()) return false;

    size_t left, right;
    if (edge == ClipEdge::Start) {
        if (index == 0) return false;
        left = index - 1;
        right = index;
    } else {
        if (index + 1 >= clips_.size()) return false;
        left = index;
        right = index + 1;
    }

    double lo = clips_[left].start + MIN_CLIP_LENGTH;
    double hi = clips_[right].end - MIN_CLIP_LENGTH;
    if (hi < lo) return false;

    double boundary = std::clamp(t, lo, hi);
    clips_[left].end = boundary;
    clips_[right].start = boundary;
    rebuild_cuts();
    return true;
}

bool Timeline::set_deleted(size_t index, bool deleted) {
    if (index >= clips_.size()) return false;
    clips_[index].deleted = deleted;
    rebuild_cuts();
    return true;
}

std::optional<size_t> Timeline::clip_at(double t) const {
    if (clips_.empty() || t < 0.0 || t > duration_) return std::nullopt;
    for (size_t i = 0; i < clips_.size(); i++) {
        if (t >= clips_[i].start && t < clips_[i].end) return i;
    }
    return clips_.size() - 1;  // t == duration
}

double Timeline::active_duration() const {
    double total = 0.0;
    for (const auto& c : clips_) {
        if (!c.deleted) total += c.length();
    }
    return total;
}

void Timeline::rebuild_cuts() {
    // Adjacent deleted clips keep separate intervals
    cuts_.clear();
    for (const auto& c : clips_) {
        if (c.deleted) cuts_.push_back({c.start, c.end});
    }
}

SegmentHitResult hit_test_segments(const std::vector<ZoomSegment>& segments, const TimelineScale& scale,
                                   double x, double y, double lane_top, double lane_height) {
    SegmentHitResult result;
    if (y < lane_top || y > lane_top + lane_height) return result;

    for (size_t i = 0; i < segments.size(); i++) {
        double x1 = scale.time_to_x(segments[i].t_start);
        double x2 = scale.time_to_x(segments[i].t_end);
        bool on_left = x >= x1 - HANDLE_SLACK_PX && x <= x1 + HANDLE_GRAB_PX;
        bool on_right = x >= x2 - HANDLE_GRAB_PX && x <= x2 + HANDLE_SLACK_PX;

        // Short segments: both handles overlap, take the closer edge
        if (on_left && on_right) {
            result.zone = std::abs(x - x1) < std::abs(x - x2) ? SegmentHit::LeftHandle : SegmentHit::RightHandle;
        } else if (on_left) {
            result.zone = SegmentHit::LeftHandle;
        } else if (on_right) {
            result.zone = SegmentHit::RightHandle;
        } else if (x >= x1 && x <= x2) {
            result.zone = SegmentHit::Body;
        } else {
            continue;
        }
        result.index = i;
        return result;
    }
    return result;
}

std::optional<size_t> hit_test_clip_boundary(const std::vector<Clip>& clips, const TimelineScale& scale, double x) {
    std::optional<size_t> best;
    double best_dist = HANDLE_GRAB_PX;
    for (size_t i = 0; i + 1 < clips.size(); i++) {
        double d = std::abs(x - scale.time_to_x(clips[i].end));
        if (d <= best_dist) {
            best = i;
            best_dist = d;
        }
    }
    return best;
}

double snap_time(double t, const SnapContext& ctx) {
    if (ctx.px_per_second <= 0.0) return t;
    double threshold = SNAP_THRESHOLD_PX / ctx.px_per_second;

    if (std::abs(t - ctx.playhead) <= threshold) return ctx.playhead;

    if (ctx.segments) {
        double best = t;
        double best_dist = threshold;
        bool found = false;
        for (size_t i = 0; i < ctx.segments->size(); i++) {
            if (ctx.exclude && *ctx.exclude == i) continue;
            for (double edge : {(*ctx.segments)[i].t_start, (*ctx.segments)[i].t_end}) {
                double d = std::abs(t - edge);
                if (d <= best_dist) {
                    best = edge;
                    best_dist = d;
                    found = true;
                }
            }
        }
        if (found) return best;
    }

    double grid = std::round(t / SNAP_GRID) * SNAP_GRID;
    if (std::abs(t - grid) <= threshold) return grid;
    return t;
}

std::optional<SegmentDrag> begin_segment_drag(const std::vector<ZoomSegment>& segments,
                                              const SegmentHitResult& hit, double grab_time) {
    if (hit.zone == SegmentHit::None || hit.index >= segments.size()) return std::nullopt;
    SegmentDrag drag;
    drag.index = hit.index;
    drag.zone = hit.zone;
    drag.grab_time = grab_time;
    drag.orig_start = segments[hit.index].t_start;
    drag.orig_end = segments[hit.index].t_end;
    return drag;
}

bool update_segment_drag(std::vector<ZoomSegment>& segments, const SegmentDrag& drag, double pointer_time,
                         double duration, const SnapContext& snap) {
    if (drag.index >= segments.size()) return false;
    ZoomSegment& seg = segments[drag.index];
    double dt = pointer_time - drag.grab_time;

    switch (drag.zone) {
        case SegmentHit::Body: {
            double len = std::min(drag.orig_end - drag.orig_start, duration);
            double start = drag.orig_start + dt;
            double snapped = snap_time(start, snap);
            if (snapped == start) snapped = snap_time(start + len, snap) - len;
            seg.t_start = std::clamp(snapped, 0.0, std::max(0.0, duration - len));
            seg.t_end = seg.t_start + len;
            return true;
        }
        case SegmentHit::LeftHandle: {
            double start = snap_time(drag.orig_start + dt, snap);
            seg.t_start = std::clamp(start, 0.0, std::max(0.0, drag.orig_end - MIN_SEGMENT_LENGTH));
            seg.t_end = drag.orig_end;
            return true;
        }
        case SegmentHit::RightHandle: {
            double end = snap_time(drag.orig_end + dt, snap);
            seg.t_end = std::clamp(end, std::min(duration, drag.orig_start + MIN_SEGMENT_LENGTH), duration);
            seg.t_start = drag.orig_start;
            return true;
        }
        case SegmentHit::None:
            break;
    }
    return false;
}
