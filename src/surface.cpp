#include "surface.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "include/core/SkImageInfo.h"
#include "include/core/SkPixmap.h"

extern "C" {
#include <libswscale/swscale.h>
#include <libavutil/pixfmt.h>
}

namespace {

struct ScalerCache {
    SwsContext* ctx = nullptr;
    ~ScalerCache() {
        if (ctx) sws_freeContext(ctx);
    }
};

thread_local ScalerCache scaler_cache;

SkImageInfo rgba_info(const Surface& s) {
    return SkImageInfo::Make(s.width, s.height, kRGBA_8888_SkColorType, kPremul_SkAlphaType);
}

} // anonymous namespace

bool parse_hex_color(const std::string& text, Color* out) {
    if (text.size() != 7 && text.size() != 9) return false;
    if (text[0] != '#') return false;
    unsigned int v[4] = {0, 0, 0, 255};
    int count = (int)(text.size() - 1) / 2;
    for (int i = 0; i < count; i++) {
        unsigned int byte = 0;
        for (int k = 0; k < 2; k++) {
            char ch = text[1 + i * 2 + k];
            byte <<= 4;
            if (ch >= '0' && ch <= '9') byte |= (unsigned)(ch - '0');
            else if (ch >= 'a' && ch <= 'f') byte |= (unsigned)(ch - 'a' + 10);
            else if (ch >= 'A' && ch <= 'F') byte |= (unsigned)(ch - 'A' + 10);
            else return false;
        }
        v[i] = byte;
    }
    *out = {(uint8_t)v[0], (uint8_t)v[1], (uint8_t)v[2], (uint8_t)v[3]};
    return true;
}

std::string color_to_hex(const Color& c) {
    char buf[16];
    if (c.a == 255) {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
    } else {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", c.r, c.g, c.b, c.a);
    }
    return buf;
}

SkRRect to_rrect(const RectF& rect, double radius) {
    SkRect r = SkRect::MakeXYWH((float)rect.x, (float)rect.y, (float)rect.w, (float)rect.h);
    return SkRRect::MakeRectXY(r, (float)radius, (float)radius);
}

sk_sp<SkSurface> wrap_surface(Surface& s) {
    if (s.empty()) return nullptr;
    return SkSurfaces::WrapPixels(rgba_info(s), s.pixels.data(), (size_t)s.stride());
}

sk_sp<SkImage> wrap_image(const Surface& s) {
    if (s.empty()) return nullptr;
    SkPixmap pixmap(rgba_info(s), s.pixels.data(), (size_t)s.stride());
    return SkImages::RasterFromPixmap(pixmap, nullptr, nullptr);
}

void fill(Surface& s, Color c) {
    for (size_t i = 0; i + 3 < s.pixels.size(); i += 4) {
        s.pixels[i] = c.r;
        s.pixels[i + 1] = c.g;
        s.pixels[i + 2] = c.b;
        s.pixels[i + 3] = c.a;
    }
}

bool scale_region(const Surface& src, double sx, double sy, double sw, double sh, Surface& dst) {
    if (src.empty() || dst.empty()) return false;

    int ix = std::clamp((int)std::floor(sx), 0, src.width - 1);
    int iy = std::clamp((int)std::floor(sy), 0, src.height - 1);
    int iw = std::clamp((int)std::lround(sw), 1, src.width - ix);
    int ih = std::clamp((int)std::lround(sh), 1, src.height - iy);

    scaler_cache.ctx = sws_getCachedContext(scaler_cache.ctx,
        iw, ih, AV_PIX_FMT_RGBA,
        dst.width, dst.height, AV_PIX_FMT_RGBA,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!scaler_cache.ctx) {
        std::fprintf(stderr, "Could not create scaler %dx%d -> %dx%d\n", iw, ih, dst.width, dst.height);
        return false;
    }

    const uint8_t* src_slices[4] = {src.row(iy) + ix * 4, nullptr, nullptr, nullptr};
    const int src_strides[4] = {src.stride(), 0, 0, 0};
    uint8_t* dst_slices[4] = {dst.pixels.data(), nullptr, nullptr, nullptr};
    const int dst_strides[4] = {dst.stride(), 0, 0, 0};
    sws_scale(scaler_cache.ctx, src_slices, src_strides, 0, ih, dst_slices, dst_strides);
    return true;
}
