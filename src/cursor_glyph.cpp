#include "cursor_glyph.hpp"

#include <algorithm>
#include <iterator>

#include "include/core/SkBlurTypes.h"
#include "include/core/SkMaskFilter.h"
#include "include/core/SkPaint.h"
#include "include/core/SkPath.h"

#include "surface.hpp"

namespace {

// Outlines in glyph units: height 1, origin at the top-left of the glyph box
const PointF POINTER_SHAPE[] = {
    {0.00, 0.00}, {0.00, 0.78}, {0.18, 0.62}, {0.31, 0.92},
    {0.42, 0.87}, {0.30, 0.58}, {0.53, 0.58},
};

const PointF HAND_SHAPE[] = {
    {0.15, 0.06}, {0.21, 0.00}, {0.27, 0.06}, {0.27, 0.40}, {0.45, 0.40},
    {0.60, 0.44}, {0.71, 0.50}, {0.72, 0.82}, {0.60, 1.00}, {0.18, 1.00},
    {0.02, 0.72}, {0.00, 0.58}, {0.07, 0.53}, {0.15, 0.62},
};

constexpr double HAND_HOTSPOT_SHIFT = 0.28;

SkPath place_shape(GlyphKind kind, double x, double y, double height) {
    const PointF* shape = kind == GlyphKind::Pointer ? POINTER_SHAPE : HAND_SHAPE;
    size_t count = kind == GlyphKind::Pointer ? std::size(POINTER_SHAPE) : std::size(HAND_SHAPE);
    double left = kind == GlyphKind::Pointer ? x : x - glyph_aspect(kind) * height * HAND_HOTSPOT_SHIFT;

    SkPath path;
    for (size_t i = 0; i < count; i++) {
        float px = (float)(left + shape[i].x * height);
        float py = (float)(y + shape[i].y * height);
        if (i == 0) path.moveTo(px, py);
        else path.lineTo(px, py);
    }
    path.close();
    return path;
}

SkPaint glyph_paint(Color c, double alpha, SkPaint::Style style, double line_width) {
    SkPaint p;
    p.setAntiAlias(true);
    p.setColor(to_sk_color(c));
    p.setAlphaf((float)std::clamp(alpha * c.a / 255.0, 0.0, 1.0));
    p.setStyle(style);
    if (style == SkPaint::kStroke_Style) {
        p.setStrokeWidth((float)line_width);
        p.setStrokeJoin(SkPaint::kRound_Join);
    }
    return p;
}

void draw_filled(SkCanvas* canvas, const SkPath& path, double height, Color fill_color, Color edge, double alpha) {
    canvas->drawPath(path, glyph_paint(fill_color, alpha, SkPaint::kFill_Style, 0.0));
    canvas->drawPath(path, glyph_paint(edge, alpha, SkPaint::kStroke_Style, std::max(1.0, height * 0.04)));
}

void draw_minimal(SkCanvas* canvas, double x, double y, double height, GlyphKind kind, double alpha) {
    float r = (float)(height * (kind == GlyphKind::Hand ? 0.22 : 0.16));
    canvas->drawCircle((float)x, (float)y, r, glyph_paint({255, 255, 255, 235}, alpha, SkPaint::kFill_Style, 0.0));
    canvas->drawCircle((float)x, (float)y, r,
                       glyph_paint({20, 20, 24, 255}, alpha, SkPaint::kStroke_Style, std::max(1.0, height * 0.035)));
}

void draw_neon(SkCanvas* canvas, const SkPath& path, double height, double alpha) {
    const Color glow{0, 229, 255, 255};
    double w = std::max(1.0, height * 0.04);
    SkPaint halo = glyph_paint(glow, alpha * 0.5, SkPaint::kStroke_Style, w * 2.5);
    halo.setMaskFilter(SkMaskFilter::MakeBlur(kNormal_SkBlurStyle, (float)(w * 1.5)));
    canvas->drawPath(path, halo);
    canvas->drawPath(path, glyph_paint({14, 16, 28, 255}, alpha * 0.9, SkPaint::kFill_Style, 0.0));
    canvas->drawPath(path, glyph_paint(glow, alpha, SkPaint::kStroke_Style, w));
}

} // anonymous namespace

double glyph_aspect(GlyphKind kind) {
    return kind == GlyphKind::Hand ? 0.72 : 0.53;
}

void draw_cursor_glyph(SkCanvas* canvas, double x, double y, double height, CursorGlyph style, GlyphKind kind,
                       double alpha) {
    if (!canvas || alpha <= 0.0 || height <= 0.0) return;
    switch (style) {
        case CursorGlyph::MacOS:
            draw_filled(canvas, place_shape(kind, x, y, height), height, {0, 0, 0, 255}, {255, 255, 255, 255}, alpha);
            break;
        case CursorGlyph::Windows:
            draw_filled(canvas, place_shape(kind, x, y, height), height, {255, 255, 255, 255}, {0, 0, 0, 255}, alpha);
            break;
        case CursorGlyph::Minimal:
            draw_minimal(canvas, x, y, height, kind, alpha);
            break;
        case CursorGlyph::Neon:
            draw_neon(canvas, place_shape(kind, x, y, height), height, alpha);
            break;
        case CursorGlyph::Outlined:
            canvas->drawPath(place_shape(kind, x, y, height),
                             glyph_paint({255, 255, 255, 255}, alpha, SkPaint::kStroke_Style,
                                         std::max(1.5, height * 0.06)));
            break;
    }
}
