#include "style.hpp"

const char* background_type_name(BackgroundType type) {
    switch (type) {
        case BackgroundType::Solid:    return "solid";
        case BackgroundType::Gradient: return "gradient";
        case BackgroundType::Radial:   return "radial";
        case BackgroundType::Image:    return "image";
    }
    return "gradient";
}

bool parse_background_type(const std::string& name, BackgroundType* out) {
    if (name == "solid") *out = BackgroundType::Solid;
    else if (name == "gradient") *out = BackgroundType::Gradient;
    else if (name == "radial") *out = BackgroundType::Radial;
    else if (name == "image") *out = BackgroundType::Image;
    else return false;
    return true;
}

const char* cursor_glyph_name(CursorGlyph glyph) {
    switch (glyph) {
        case CursorGlyph::MacOS:    return "macos";
        case CursorGlyph::Windows:  return "windows";
        case CursorGlyph::Minimal:  return "minimal";
        case CursorGlyph::Neon:     return "neon";
        case CursorGlyph::Outlined: return "outlined";
    }
    return "macos";
}

bool parse_cursor_glyph(const std::string& name, CursorGlyph* out) {
    if (name == "macos") *out = CursorGlyph::MacOS;
    else if (name == "windows") *out = CursorGlyph::Windows;
    else if (name == "minimal") *out = CursorGlyph::Minimal;
    else if (name == "neon") *out = CursorGlyph::Neon;
    else if (name == "outlined") *out = CursorGlyph::Outlined;
    else return false;
    return true;
}
