#include "cursor.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "easing.hpp"
#include "interpolate.hpp"

std::optional<CursorSample> cursor_at(double t, const std::vector<CursorSample>& samples) {
    return interpolate_at(t, samples);
}

std::optional<CursorSample> smooth_cursor(double t, const std::vector<CursorSample>& samples, CursorSpeed speed) {
    auto raw = interpolate_at(t, samples);
    if (!raw) return std::nullopt;

    CursorSpeedProfile profile = cursor_speed_profile(speed);
    if (profile.lag == 0.0) return raw;

    auto prior = interpolate_at(std::max(0.0, t - profile.lag), samples);
    if (!prior) return raw;

    CursorSample out;
    out.t = t;
    out.x = raw->x * profile.lerp + prior->x * (1.0 - profile.lerp);
    out.y = raw->y * profile.lerp + prior->y * (1.0 - profile.lerp);
    return out;
}

bool is_near_click(double t, const std::vector<ClickEvent>& clicks, double window) {
    for (const auto& c : clicks) {
        if (std::abs(t - c.t) < window) return true;
    }
    return false;
}

void dedupe_clicks(std::vector<ClickEvent>& clicks) {
    std::stable_sort(clicks.begin(), clicks.end(),
                     [](const ClickEvent& a, const ClickEvent& b) { return a.t < b.t; });
    std::set<std::pair<long long, long long>> seen;
    std::vector<ClickEvent> unique;
    unique.reserve(clicks.size());
    for (const auto& c : clicks) {
        auto key = std::make_pair(std::llround(c.t * 1000.0), std::llround(c.x * 10000.0));
        if (seen.insert(key).second) unique.push_back(c);
    }
    clicks = std::move(unique);
}

CameraState CameraSmoother::apply(double t, const CameraState& resolved,
                                  const std::optional<CursorSample>& cursor, const FollowOptions& options) {
    CameraState cam = resolved;
    bool scrubbed = !has_last_ || std::abs(t - last_t_) > SCRUB_THRESHOLD;

    if (options.follow_cursor && cursor) {
        if (resolved.factor <= 1.01 && options.auto_zoom_on_cursor) {
            double k = scrubbed ? 1.0 : AUTO_FOLLOW_LERP;
            cam_x_ = lerp(cam_x_, cursor->x, k);
            cam_y_ = lerp(cam_y_, cursor->y, k);
            cam.factor = std::max(1.0, options.follow_zoom_factor);
            cam.cx = cam_x_;
            cam.cy = cam_y_;
        } else if (resolved.factor > 1.01) {
            double k = scrubbed ? 1.0 : cursor_speed_profile(options.cursor_speed).lerp * MANUAL_CURSOR_BLEND;
            double target_x = resolved.cx * (1.0 - MANUAL_CURSOR_BLEND) + cursor->x * MANUAL_CURSOR_BLEND;
            double target_y = resolved.cy * (1.0 - MANUAL_CURSOR_BLEND) + cursor->y * MANUAL_CURSOR_BLEND;
            cam_x_ = lerp(cam_x_, target_x, k);
            cam_y_ = lerp(cam_y_, target_y, k);
            cam.cx = cam_x_;
            cam.cy = cam_y_;
        } else {
            double k = scrubbed ? 1.0 : RECENTER_LERP;
            cam_x_ = lerp(cam_x_, 0.5, k);
            cam_y_ = lerp(cam_y_, 0.5, k);
        }
    } else {
        cam_x_ = resolved.cx;
        cam_y_ = resolved.cy;
    }

    cam_factor_ = cam.factor;
    last_t_ = t;
    has_last_ = true;
    return cam;
}

void CameraSmoother::reset() {
    has_last_ = false;
}
