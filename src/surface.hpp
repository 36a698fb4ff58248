#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "include/core/SkColor.h"
#include "include/core/SkImage.h"
#include "include/core/SkRRect.h"
#include "include/core/SkRefCnt.h"
#include "include/core/SkSurface.h"

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;
};

// Accepts "#rrggbb" and "#rrggbbaa"
bool parse_hex_color(const std::string& text, Color* out);
std::string color_to_hex(const Color& c);

inline SkColor to_sk_color(Color c) {
    return SkColorSetARGB(c.a, c.r, c.g, c.b);
}

struct PointF {
    double x = 0.0;
    double y = 0.0;
};

struct RectF {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;

    bool empty() const { return w <= 0.0 || h <= 0.0; }
};

SkRRect to_rrect(const RectF& rect, double radius);

// Tightly packed RGBA8 pixel buffer (4 bytes per pixel, row stride = width*4)
struct Surface {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    Surface() = default;
    Surface(int w, int h) { resize(w, h); }

    void resize(int w, int h) {
        width = w > 0 ? w : 0;
        height = h > 0 ? h : 0;
        pixels.assign((size_t)width * height * 4, 0);
    }
    bool empty() const { return width <= 0 || height <= 0; }
    int stride() const { return width * 4; }
    uint8_t* row(int y) { return pixels.data() + (size_t)y * stride(); }
    const uint8_t* row(int y) const { return pixels.data() + (size_t)y * stride(); }
    Color at(int x, int y) const {
        const uint8_t* p = row(y) + x * 4;
        return {p[0], p[1], p[2], p[3]};
    }
};

// Raster canvas drawing straight into the surface's pixels; nullptr when the
// surface is empty. The surface must outlive the returned object.
sk_sp<SkSurface> wrap_surface(Surface& s);
// Image view of the pixels without a copy. Only valid until `s` changes.
sk_sp<SkImage> wrap_image(const Surface& s);

void fill(Surface& s, Color c);

// Resamples the source region (sx, sy, sw, sh) into the whole of `dst`
bool scale_region(const Surface& src, double sx, double sy, double sw, double sh, Surface& dst);
