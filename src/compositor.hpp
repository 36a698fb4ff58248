#pragma once

#include <optional>
#include <vector>

#include "cursor.hpp"
#include "model.hpp"
#include "style.hpp"
#include "surface.hpp"

// Cursor trajectory and clicks of one recording, normalized and time-ordered
struct TrackData {
    std::vector<CursorSample> cursor;
    std::vector<ClickEvent> clicks;
};

// Points further than this outside the inner rectangle count as off-screen
constexpr double OFFSCREEN_MARGIN = 20.0;
constexpr double CLICK_RIPPLE_WINDOW = 0.7;
constexpr double HAND_CLICK_WINDOW = 0.2;
constexpr double BASE_CURSOR_PX = 45.0;
constexpr double MIN_CURSOR_PX = 32.0;

// Normalized source point -> output pixel through the camera, or nullopt when
// it has panned out of view
std::optional<PointF> map_to_screen(double nx, double ny, const CameraState& cam, const RectF& inner);

// Area left for the recording once padding is removed; may be empty
RectF inner_rect(int width, int height, double padding);

// Cursor glyph size in output pixels; grows with the zoom factor
double cursor_glyph_height(const StyleConfig& style, const CameraState& cam);

void draw_background(Surface& out, const StyleConfig& style, const Surface* image);

// Crops the source through the camera and scales the crop to fill `view`
bool draw_camera_view(Surface& view, const Surface& source, const CameraState& cam);

// Renders one output frame into `out` (already sized to the output
// resolution). Draw order: background, shadow, clipped source, click ripples,
// cursor in screen space, border. Screen motion blur ghosts follow the change
// of the resolved zoom only. Returns the camera actually used.
CameraState render_frame(Surface& out, const Surface& source, double t, const std::vector<ZoomSegment>& segments,
                         const StyleConfig& style, const TrackData& track, CameraSmoother& smoother,
                         const Surface* background_image = nullptr);
