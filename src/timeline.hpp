#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "model.hpp"

constexpr double SPLIT_EDGE_MARGIN = 0.05;  // no split this close to a clip edge
constexpr double MIN_CLIP_LENGTH = 0.2;
constexpr double MIN_SEGMENT_LENGTH = 0.1;

enum class ClipEdge { Start, End };

// Non-destructive edit list. The clips always partition [0, duration]:
// sorted, contiguous, first starts at 0, last ends at duration. Cuts are
// re-derived from the deleted clips after every mutation.
class Timeline {
public:
    // Single clip covering the whole recording
    void reset(double duration);
    // Replaces the clip list; rejected (timeline untouched) unless it is a
    // valid partition of [0, duration]
    bool assign(const std::vector<Clip>& clips, double duration);

    double duration() const { return duration_; }
    double playhead() const { return playhead_; }
    void seek(double t);

    // Splits the clip under t; the new right half inherits `deleted`
    bool split_at(double t);
    // Moves one clip edge and the touching edge of its neighbour. The outer
    // edges of the recording cannot move. t is clamped so both clips keep
    // MIN_CLIP_LENGTH.
    bool trim_edge(size_t index, ClipEdge edge, double t);
    bool set_deleted(size_t index, bool deleted);
    bool delete_clip(size_t index) { return set_deleted(index, true); }

    const std::vector<Clip>& clips() const { return clips_; }
    const std::vector<CutInterval>& cuts() const { return cuts_; }
    std::optional<size_t> clip_at(double t) const;
    // Length of the recording that survives export
    double active_duration() const;

    std::vector<Clip> snapshot() const { return clips_; }
    bool restore_snapshot(const std::vector<Clip>& clips) { return assign(clips, duration_); }

private:
    void rebuild_cuts();

    double duration_ = 0.0;
    double playhead_ = 0.0;
    std::vector<Clip> clips_;
    std::vector<CutInterval> cuts_;
};

// Horizontal mapping of the timeline canvas
struct TimelineScale {
    double origin_x = 0.0;
    double px_per_second = 100.0;

    double time_to_x(double t) const { return origin_x + t * px_per_second; }
    double x_to_time(double x) const { return px_per_second > 0.0 ? (x - origin_x) / px_per_second : 0.0; }
};

constexpr double HANDLE_GRAB_PX = 8.0;
constexpr double HANDLE_SLACK_PX = 6.0;   // extra grab room outside the segment edge
constexpr double SNAP_THRESHOLD_PX = 8.0;
constexpr double SNAP_GRID = 0.5;

enum class SegmentHit { None, Body, LeftHandle, RightHandle };

struct SegmentHitResult {
    SegmentHit zone = SegmentHit::None;
    size_t index = 0;
};

// Hit zones of the zoom lane spanning [lane_top, lane_top + lane_height]
SegmentHitResult hit_test_segments(const std::vector<ZoomSegment>& segments, const TimelineScale& scale,
                                   double x, double y, double lane_top, double lane_height);

// Index of the clip whose end edge lies within HANDLE_GRAB_PX of x, closest
// first. The outer edges of the recording never match.
std::optional<size_t> hit_test_clip_boundary(const std::vector<Clip>& clips, const TimelineScale& scale, double x);

struct SnapContext {
    double playhead = 0.0;
    double px_per_second = 100.0;
    const std::vector<ZoomSegment>* segments = nullptr;
    std::optional<size_t> exclude;  // the segment being dragged
};

// Snaps t to the playhead, then another segment's edge, then the 0.5 s grid,
// whichever comes first within SNAP_THRESHOLD_PX
double snap_time(double t, const SnapContext& ctx);

struct SegmentDrag {
    size_t index = 0;
    SegmentHit zone = SegmentHit::None;
    double grab_time = 0.0;
    double orig_start = 0.0;
    double orig_end = 0.0;
};

std::optional<SegmentDrag> begin_segment_drag(const std::vector<ZoomSegment>& segments,
                                              const SegmentHitResult& hit, double grab_time);
// Applies the drag for the current pointer time; keeps the segment inside
// [0, duration] and at least MIN_SEGMENT_LENGTH long
bool update_segment_drag(std::vector<ZoomSegment>& segments, const SegmentDrag& drag, double pointer_time,
                         double duration, const SnapContext& snap);
