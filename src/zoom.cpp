#include "zoom.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "easing.hpp"

const char* const ZOOM_COLORS[8] = {
    "#6C5CE7", "#00B894", "#E17055", "#0984E3",
    "#FDCB6E", "#E84393", "#00CEC9", "#FF7675"
};

const char* zoom_color_for(size_t index) {
    return ZOOM_COLORS[index % (sizeof(ZOOM_COLORS) / sizeof(ZOOM_COLORS[0]))];
}

CameraState resolve_camera(double t, const std::vector<ZoomSegment>& segments, PanSpeed pan_speed) {
    CameraState best;
    const PanSpeedProfile profile = pan_speed_profile(pan_speed);

    for (const auto& seg : segments) {
        double ease_in = pan_speed == PanSpeed::Segment ? seg.ease_in : profile.ease_in;
        double ease_out = pan_speed == PanSpeed::Segment ? seg.ease_out : profile.ease_out;
        ease_in = std::max(0.0, ease_in);
        ease_out = std::max(0.0, ease_out);

        double ease_in_start = seg.t_start - ease_in;
        double ease_out_end = seg.t_end + ease_out;
        if (t < ease_in_start || t > ease_out_end) continue;

        double factor = std::max(1.0, seg.factor);
        double local_factor;
        if (t < seg.t_start) {
            double p = ease_in > 0.0 ? clamp01((t - ease_in_start) / ease_in) : 1.0;
            local_factor = 1.0 + (factor - 1.0) * ease_in_out_cubic(p);
        } else if (t > seg.t_end) {
            double p = ease_out > 0.0 ? clamp01((t - seg.t_end) / ease_out) : 1.0;
            local_factor = factor - (factor - 1.0) * ease_in_out_cubic(p);
        } else {
            local_factor = factor;
        }

        if (local_factor > best.factor) {
            best.factor = local_factor;
            best.cx = seg.cx;
            best.cy = seg.cy;
        }
    }
    return best;
}

std::vector<ZoomSegment> auto_generate_zooms(const std::vector<ClickEvent>& clicks, double duration,
                                             const AutoZoomOptions& options) {
    std::vector<ZoomSegment> segments;
    double last_end = -std::numeric_limits<double>::infinity();
    for (const auto& click : clicks) {
        if (click.t - last_end < options.min_gap) continue;
        if (segments.size() >= options.max_segments) break;

        double t_start = std::clamp(click.t - options.lead, 0.0, std::max(0.0, duration));
        double t_end = std::min(duration, t_start + options.segment_duration);
        if (t_end - t_start < 0.1) continue;  // click at the very end of the recording

        ZoomSegment seg;
        seg.t_start = t_start;
        seg.t_end = t_end;
        seg.cx = clamp01(click.x);
        seg.cy = clamp01(click.y);
        seg.factor = options.factor;
        seg.color = zoom_color_for(segments.size());
        segments.push_back(seg);
        last_end = t_end;
    }
    return segments;
}

bool add_zoom_at(std::vector<ZoomSegment>& segments, double t, double duration,
                 const std::vector<CursorSample>& cursor) {
    t = std::clamp(t, 0.0, std::max(0.0, duration));
    double len = std::min(2.5, duration - t);
    if (len < 0.2) return false;

    double cx = 0.5, cy = 0.5;
    if (!cursor.empty()) {
        // Nearest sample in time
        auto it = std::lower_bound(cursor.begin(), cursor.end(), t,
                                   [](const CursorSample& s, double v) { return s.t < v; });
        if (it == cursor.end()) {
            --it;
        } else if (it != cursor.begin()) {
            auto prev = it - 1;
            if (std::abs(prev->t - t) <= std::abs(it->t - t)) it = prev;
        }
        cx = it->x;
        cy = it->y;
    }

    ZoomSegment seg;
    seg.t_start = t;
    seg.t_end = t + len;
    seg.cx = clamp01(cx);
    seg.cy = clamp01(cy);
    seg.factor = 2.2;
    seg.color = zoom_color_for(segments.size());
    segments.push_back(seg);
    return true;
}

bool duplicate_zoom(std::vector<ZoomSegment>& segments, size_t index, double duration) {
    if (index >= segments.size()) return false;
    ZoomSegment dup = segments[index];
    double len = dup.length();
    double start = std::min(dup.t_end + 0.1, duration - len);
    if (start < 0.0) return false;
    dup.t_start = start;
    dup.t_end = start + len;
    dup.color = zoom_color_for(segments.size());
    segments.push_back(dup);
    return true;
}

bool delete_zoom(std::vector<ZoomSegment>& segments, size_t index) {
    if (index >= segments.size()) return false;
    segments.erase(segments.begin() + (std::ptrdiff_t)index);
    return true;
}
