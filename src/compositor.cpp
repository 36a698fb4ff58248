#include "compositor.hpp"

#include <algorithm>
#include <cmath>

#include "include/core/SkBlurTypes.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkMaskFilter.h"
#include "include/core/SkPaint.h"
#include "include/core/SkSamplingOptions.h"
#include "include/effects/SkGradientShader.h"

#include "cursor_glyph.hpp"
#include "easing.hpp"
#include "zoom.hpp"

namespace {

struct BlurSample {
    double dt;
    double alpha;
};

const BlurSample SCREEN_BLUR_SAMPLES[] = {
    {0.016, 0.55}, {0.033, 0.30}, {0.050, 0.18}, {0.066, 0.10},
};

// Oldest first so the freshest ghost lands on top
const BlurSample CURSOR_BLUR_SAMPLES[] = {
    {0.050, 0.18}, {0.033, 0.30}, {0.016, 0.55},
};

// Weighted camera change below which a sample adds no ghost
constexpr double SCREEN_BLUR_MIN_DELTA = 0.01;

const Color RIPPLE_OUTER{108, 92, 231, 255};
const Color RIPPLE_INNER{162, 155, 254, 255};

Color style_color(const std::string& text, const char* fallback) {
    Color c;
    if (parse_hex_color(text, &c)) return c;
    if (!parse_hex_color(fallback, &c)) return {0, 0, 0, 255};
    return c;
}

SkPaint solid_paint(Color c, double alpha) {
    SkPaint p;
    p.setAntiAlias(true);
    p.setColor(to_sk_color(c));
    p.setAlphaf((float)std::clamp(alpha * c.a / 255.0, 0.0, 1.0));
    return p;
}

SkPaint stroke_paint(Color c, double alpha, double line_width) {
    SkPaint p = solid_paint(c, alpha);
    p.setStyle(SkPaint::kStroke_Style);
    p.setStrokeWidth((float)line_width);
    return p;
}

void draw_view_layer(SkCanvas* canvas, Surface& layer, const Surface& source, const CameraState& cam,
                     const RectF& inner, double alpha) {
    if (alpha <= 0.0 || !draw_camera_view(layer, source, cam)) return;
    sk_sp<SkImage> image = wrap_image(layer);
    if (!image) return;
    SkPaint paint;
    paint.setAlphaf((float)std::min(1.0, alpha));
    canvas->drawImage(image, (float)std::lround(inner.x), (float)std::lround(inner.y), SkSamplingOptions(), &paint);
}

// Ghost of the camera `dt` seconds ago. Only the resolved zoom motion counts;
// the follow offset the smoother adds stays the same for every sample.
std::optional<CameraState> motion_ghost(double t, double dt, const std::vector<ZoomSegment>& segments,
                                        PanSpeed pan_speed, const CameraState& resolved, const CameraState& cam,
                                        double* delta) {
    CameraState prev = resolve_camera(std::max(0.0, t - dt), segments, pan_speed);
    *delta = std::abs(prev.factor - resolved.factor) + std::abs(prev.cx - resolved.cx) * 2.0 +
             std::abs(prev.cy - resolved.cy) * 2.0;
    if (*delta < SCREEN_BLUR_MIN_DELTA) return std::nullopt;

    CameraState ghost;
    ghost.factor = std::max(1.0, cam.factor + (prev.factor - resolved.factor));
    ghost.cx = std::clamp(cam.cx + (prev.cx - resolved.cx), 0.0, 1.0);
    ghost.cy = std::clamp(cam.cy + (prev.cy - resolved.cy), 0.0, 1.0);
    return ghost;
}

void draw_click_ripples(SkCanvas* canvas, double t, const std::vector<ClickEvent>& clicks, const CameraState& cam,
                        const RectF& inner) {
    for (const auto& click : clicks) {
        double dt = t - click.t;
        if (dt < 0.0 || dt > CLICK_RIPPLE_WINDOW) continue;
        double p = dt / CLICK_RIPPLE_WINDOW;
        auto pos = map_to_screen(click.x, click.y, cam, inner);
        if (!pos) continue;
        float x = (float)pos->x;
        float y = (float)pos->y;

        canvas->drawCircle(x, y, (float)(6.0 + 32.0 * ease_out_quart(p)),
                           stroke_paint(RIPPLE_OUTER, (1.0 - p) * 0.65, 2.5));
        if (p < 0.5) {
            canvas->drawCircle(x, y, (float)(4.0 + 14.0 * ease_out_quart(p * 2.0)),
                               stroke_paint(RIPPLE_INNER, (1.0 - p * 2.0) * 0.4, 1.5));
        }
        if (p < 0.15) {
            canvas->drawCircle(x, y, 5.0f, solid_paint(RIPPLE_OUTER, (1.0 - p / 0.15) * 0.5));
        }
    }
}

void draw_cursor(SkCanvas* canvas, double t, const StyleConfig& style, const TrackData& track,
                 const CameraState& cam, const RectF& inner) {
    auto base = style.smooth_cursor_glyph ? smooth_cursor(t, track.cursor, style.cursor_speed)
                                          : cursor_at(t, track.cursor);
    if (!base) return;
    auto pos = map_to_screen(base->x, base->y, cam, inner);
    if (!pos) return;

    GlyphKind kind = is_near_click(t, track.clicks, HAND_CLICK_WINDOW) ? GlyphKind::Hand : GlyphKind::Pointer;
    double height = cursor_glyph_height(style, cam);

    if (!style.cursor_motion_blur) {
        draw_cursor_glyph(canvas, pos->x, pos->y, height, style.cursor_style, kind, 1.0);
        return;
    }

    for (const auto& sample : CURSOR_BLUR_SAMPLES) {
        auto ghost = smooth_cursor(std::max(0.0, t - sample.dt), track.cursor, style.cursor_speed);
        if (!ghost) continue;
        auto gpos = map_to_screen(ghost->x, ghost->y, cam, inner);
        if (!gpos) continue;
        draw_cursor_glyph(canvas, gpos->x, gpos->y, height, style.cursor_style, kind, sample.alpha);
    }
    auto smoothed = smooth_cursor(t, track.cursor, style.cursor_speed);
    if (!smoothed) return;
    auto spos = map_to_screen(smoothed->x, smoothed->y, cam, inner);
    if (spos) draw_cursor_glyph(canvas, spos->x, spos->y, height, style.cursor_style, kind, 1.0);
}

} // anonymous namespace

std::optional<PointF> map_to_screen(double nx, double ny, const CameraState& cam, const RectF& inner) {
    double x, y;
    if (cam.factor > 1.005) {
        double cw = 1.0 / cam.factor;
        double ch = 1.0 / cam.factor;
        double ox = std::clamp(cam.cx - cw / 2.0, 0.0, 1.0 - cw);
        double oy = std::clamp(cam.cy - ch / 2.0, 0.0, 1.0 - ch);
        x = inner.x + ((nx - ox) / cw) * inner.w;
        y = inner.y + ((ny - oy) / ch) * inner.h;
    } else {
        x = inner.x + nx * inner.w;
        y = inner.y + ny * inner.h;
    }
    if (x < inner.x - OFFSCREEN_MARGIN || x > inner.x + inner.w + OFFSCREEN_MARGIN ||
        y < inner.y - OFFSCREEN_MARGIN || y > inner.y + inner.h + OFFSCREEN_MARGIN) {
        return std::nullopt;
    }
    return PointF{x, y};
}

RectF inner_rect(int width, int height, double padding) {
    return {padding, padding, width - padding * 2.0, height - padding * 2.0};
}

void draw_background(Surface& out, const StyleConfig& style, const Surface* image) {
    Color c1 = style_color(style.bg_color, "#13161c");
    Color c2 = style_color(style.bg_color2, "#1e222b");
    if (style.bg_type == BackgroundType::Image && image && !image->empty()) {
        // Cover: crop the image to the output aspect, then scale
        double out_aspect = (double)out.width / std::max(1, out.height);
        double img_aspect = (double)image->width / image->height;
        double sw = image->width, sh = image->height;
        if (img_aspect > out_aspect) sw = image->height * out_aspect;
        else sh = image->width / out_aspect;
        if (scale_region(*image, (image->width - sw) / 2.0, (image->height - sh) / 2.0, sw, sh, out)) return;
    }

    sk_sp<SkSurface> surface = wrap_surface(out);
    if (!surface) return;
    SkCanvas* canvas = surface->getCanvas();
    float w = (float)out.width;
    float h = (float)out.height;
    SkColor colors[2];
    SkPaint paint;
    switch (style.bg_type) {
        case BackgroundType::Gradient: {
            SkPoint pts[2] = {{0, 0}, {w, h}};
            colors[0] = to_sk_color(c1);
            colors[1] = to_sk_color(c2);
            paint.setShader(SkGradientShader::MakeLinear(pts, colors, nullptr, 2, SkTileMode::kClamp));
            break;
        }
        case BackgroundType::Radial:
            colors[0] = to_sk_color(c2);
            colors[1] = to_sk_color(c1);
            paint.setShader(SkGradientShader::MakeRadial({w / 2, h / 2}, std::max(w, h) / 1.5f, colors, nullptr, 2,
                                                         SkTileMode::kClamp));
            break;
        case BackgroundType::Solid:
        case BackgroundType::Image:
            canvas->clear(to_sk_color(c1));
            return;
    }
    canvas->drawPaint(paint);
}

bool draw_camera_view(Surface& view, const Surface& source, const CameraState& cam) {
    if (source.empty() || view.empty()) return false;
    double src_w = source.width;
    double src_h = source.height;
    if (cam.factor > 1.005) {
        double crop_w = src_w / cam.factor;
        double crop_h = src_h / cam.factor;
        double sx = std::clamp(cam.cx * src_w - crop_w / 2.0, 0.0, src_w - crop_w);
        double sy = std::clamp(cam.cy * src_h - crop_h / 2.0, 0.0, src_h - crop_h);
        return scale_region(source, sx, sy, crop_w, crop_h, view);
    }
    return scale_region(source, 0.0, 0.0, src_w, src_h, view);
}

double cursor_glyph_height(const StyleConfig& style, const CameraState& cam) {
    return std::max(MIN_CURSOR_PX, BASE_CURSOR_PX * style.cursor_scale * cam.factor);
}

CameraState render_frame(Surface& out, const Surface& source, double t, const std::vector<ZoomSegment>& segments,
                         const StyleConfig& style, const TrackData& track, CameraSmoother& smoother,
                         const Surface* background_image) {
    // 1. Background
    draw_background(out, style, background_image);

    // 2. Camera
    CameraState resolved = resolve_camera(t, segments, style.pan_speed);
    auto follow_target = smooth_cursor(t, track.cursor, style.cursor_speed);
    CameraState cam = smoother.apply(t, resolved, follow_target, style.follow_options());

    RectF inner = inner_rect(out.width, out.height, style.padding);
    if (inner.empty()) return cam;
    sk_sp<SkSurface> surface = wrap_surface(out);
    if (!surface) return cam;
    SkCanvas* canvas = surface->getCanvas();
    SkRRect frame = to_rrect(inner, style.corner_radius);

    // 3. Shadow
    if (style.shadow && style.shadow_intensity > 0.0) {
        double k = style.shadow_intensity / 100.0;
        RectF shadow_rect = inner;
        shadow_rect.y += 8.0 + 12.0 * k;
        SkPaint shadow = solid_paint({0, 0, 0, 255}, 0.75 * k);
        // Blur radius 40 + 40k, as a gaussian sigma of half that
        shadow.setMaskFilter(SkMaskFilter::MakeBlur(kNormal_SkBlurStyle, (float)((40.0 + 40.0 * k) / 2.0)));
        canvas->drawRRect(to_rrect(shadow_rect, style.corner_radius), shadow);
    }

    // 4. Clip
    canvas->save();
    canvas->clipRRect(frame, true);
    canvas->drawColor(SK_ColorBLACK);

    // 5. Source through the camera
    Surface layer((int)std::lround(inner.w), (int)std::lround(inner.h));
    draw_view_layer(canvas, layer, source, cam, inner, 1.0);
    if (style.screen_motion_blur && !segments.empty()) {
        for (const auto& sample : SCREEN_BLUR_SAMPLES) {
            double delta = 0.0;
            auto ghost = motion_ghost(t, sample.dt, segments, style.pan_speed, resolved, cam, &delta);
            if (!ghost) continue;
            draw_view_layer(canvas, layer, source, *ghost, inner, sample.alpha * std::min(1.0, delta * 4.0));
        }
    }

    // 6. Click ripples, still clipped
    if (style.click_effects) draw_click_ripples(canvas, t, track.clicks, cam, inner);
    canvas->restore();

    // 7-8. Cursor outside the clip, in screen space
    if (style.show_cursor) draw_cursor(canvas, t, style, track, cam, inner);

    // 9. Border
    canvas->drawRRect(frame, stroke_paint({255, 255, 255, 255}, 0.05, 1.0));

    return cam;
}
