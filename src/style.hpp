#pragma once

#include <string>

#include "cursor.hpp"
#include "model.hpp"

enum class BackgroundType { Solid, Gradient, Radial, Image };
enum class CursorGlyph { MacOS, Windows, Minimal, Neon, Outlined };

const char* background_type_name(BackgroundType type);
bool parse_background_type(const std::string& name, BackgroundType* out);
const char* cursor_glyph_name(CursorGlyph glyph);
bool parse_cursor_glyph(const std::string& name, CursorGlyph* out);

// Every option the compositor recognizes, with its default
struct StyleConfig {
    double padding = 48.0;
    double corner_radius = 16.0;
    bool shadow = true;
    double shadow_intensity = 60.0;  // percent

    BackgroundType bg_type = BackgroundType::Gradient;
    std::string bg_color = "#13161c";
    std::string bg_color2 = "#1e222b";
    std::string bg_image;

    bool show_cursor = true;
    CursorGlyph cursor_style = CursorGlyph::MacOS;
    double cursor_scale = 1.2;
    bool smooth_cursor_glyph = false;  // draw the smoothed position instead of the raw one
    bool click_effects = true;
    bool screen_motion_blur = false;
    bool cursor_motion_blur = false;

    bool follow_cursor = true;
    bool auto_zoom_on_cursor = false;
    double follow_zoom_factor = 2.0;
    CursorSpeed cursor_speed = CursorSpeed::Medium;
    PanSpeed pan_speed = PanSpeed::Medium;

    FollowOptions follow_options() const {
        FollowOptions o;
        o.follow_cursor = follow_cursor;
        o.auto_zoom_on_cursor = auto_zoom_on_cursor;
        o.follow_zoom_factor = follow_zoom_factor;
        o.cursor_speed = cursor_speed;
        return o;
    }
};
