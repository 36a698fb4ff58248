#pragma once

#include <vector>

#include "model.hpp"

// Segment colours, assigned round-robin by segment index
extern const char* const ZOOM_COLORS[8];
const char* zoom_color_for(size_t index);

// Camera at time t. Every segment whose eased interval contains t yields a
// local factor; the largest wins (first found on ties). No active segment
// gives {1, 0.5, 0.5}.
CameraState resolve_camera(double t, const std::vector<ZoomSegment>& segments, PanSpeed pan_speed);

struct AutoZoomOptions {
    double factor = 2.2;
    double segment_duration = 2.0;
    double min_gap = 1.0;      // since the previous segment's end
    double lead = 0.15;        // segment starts this long before the click
    size_t max_segments = 40;
};

std::vector<ZoomSegment> auto_generate_zooms(const std::vector<ClickEvent>& clicks, double duration,
                                             const AutoZoomOptions& options = {});

// Editor operations on the segment list. They return false and leave the
// list untouched when the edit would be degenerate.
bool add_zoom_at(std::vector<ZoomSegment>& segments, double t, double duration,
                 const std::vector<CursorSample>& cursor);
bool duplicate_zoom(std::vector<ZoomSegment>& segments, size_t index, double duration);
bool delete_zoom(std::vector<ZoomSegment>& segments, size_t index);
