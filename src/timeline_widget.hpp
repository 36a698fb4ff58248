#pragma once

#include <optional>
#include <vector>

#include <imgui.h>

#include "model.hpp"
#include "timeline.hpp"

struct ZoomTimelineState {
    std::optional<SegmentDrag> drag;
    std::optional<size_t> selected;  // zoom segment
    std::optional<size_t> trim_clip; // clip whose end edge is being dragged
    bool scrubbing = false;
    bool segments_changed = false;   // set for the frame a drag moved a segment
    bool trim_started = false;       // set for the frame a clip edge drag began
    bool clips_changed = false;
};

// Clip lane, zoom lane and playhead. Clicking empty space scrubs; segment
// bodies and handles drag with snapping; clip boundaries drag to trim.
// Returns true when the playhead moved.
bool ZoomTimeline(const char* label, Timeline& timeline, std::vector<ZoomSegment>& segments, const ImVec2& size,
                  ZoomTimelineState& state);
