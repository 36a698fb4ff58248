#pragma once

#include <optional>
#include <vector>

#include "model.hpp"

// Raw cursor position at t (linear between samples, clamped at the ends)
std::optional<CursorSample> cursor_at(double t, const std::vector<CursorSample>& samples);

// Trailing-filter approximation: blends the raw position at t with the raw
// position `lag` seconds earlier. Rapid profiles (lag 0) return the raw value.
std::optional<CursorSample> smooth_cursor(double t, const std::vector<CursorSample>& samples, CursorSpeed speed);

// True when a click lies strictly within `window` seconds of t.
// Drives the pointer -> hand glyph switch.
bool is_near_click(double t, const std::vector<ClickEvent>& clicks, double window);

// Sorts by time and removes clicks that repeat the same rounded time and x
void dedupe_clicks(std::vector<ClickEvent>& clicks);

struct FollowOptions {
    bool follow_cursor = true;
    bool auto_zoom_on_cursor = false;
    double follow_zoom_factor = 2.0;
    CursorSpeed cursor_speed = CursorSpeed::Medium;
};

// Persistent camera smoothing carried across consecutive frame evaluations.
// One instance per preview session or export job; never shared.
class CameraSmoother {
public:
    // Time jump that counts as a scrub and forces a snap
    static constexpr double SCRUB_THRESHOLD = 0.5;
    static constexpr double MANUAL_CURSOR_BLEND = 0.35;
    static constexpr double AUTO_FOLLOW_LERP = 0.25;
    static constexpr double RECENTER_LERP = 0.1;

    // Augments the resolved camera with cursor follow and advances the state
    CameraState apply(double t, const CameraState& resolved,
                      const std::optional<CursorSample>& cursor, const FollowOptions& options);

    // Forget the previous frame; the next apply() snaps
    void reset();

    double cam_x() const { return cam_x_; }
    double cam_y() const { return cam_y_; }
    double cam_factor() const { return cam_factor_; }
    bool has_last() const { return has_last_; }

private:
    double cam_x_ = 0.5;
    double cam_y_ = 0.5;
    double cam_factor_ = 1.0;
    double last_t_ = 0.0;
    bool has_last_ = false;
};
