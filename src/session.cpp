#include "session.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace {

constexpr double MAX_OUTPUT_DIMENSION = 16384.0;

double number_or(const json& j, const char* key, double fallback) {
    auto it = j.find(key);
    return (it != j.end() && it->is_number()) ? it->get<double>() : fallback;
}

bool bool_or(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    return (it != j.end() && it->is_boolean()) ? it->get<bool>() : fallback;
}

std::string string_or(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

// Pixel dimension, or 0 when the value is not a usable size
int dimension_or(const json& j, const char* key, int fallback) {
    double v = number_or(j, key, fallback);
    if (!std::isfinite(v) || v < 1.0 || v > MAX_OUTPUT_DIMENSION) return 0;
    return (int)v;
}

} // anonymous namespace

json style_to_json(const StyleConfig& s) {
    return {
        {"padding", s.padding},
        {"corner_radius", s.corner_radius},
        {"shadow", s.shadow},
        {"shadow_intensity", s.shadow_intensity},
        {"bg_type", background_type_name(s.bg_type)},
        {"bg_color", s.bg_color},
        {"bg_color2", s.bg_color2},
        {"bg_image", s.bg_image},
        {"show_cursor", s.show_cursor},
        {"cursor_style", cursor_glyph_name(s.cursor_style)},
        {"cursor_scale", s.cursor_scale},
        {"smooth_cursor_glyph", s.smooth_cursor_glyph},
        {"click_effects", s.click_effects},
        {"screen_motion_blur", s.screen_motion_blur},
        {"cursor_motion_blur", s.cursor_motion_blur},
        {"follow_cursor", s.follow_cursor},
        {"auto_zoom_on_cursor", s.auto_zoom_on_cursor},
        {"follow_zoom_factor", s.follow_zoom_factor},
        {"cursor_speed", cursor_speed_name(s.cursor_speed)},
        {"pan_speed", pan_speed_name(s.pan_speed)},
    };
}

StyleConfig style_from_json(const json& j) {
    StyleConfig s;
    if (!j.is_object()) return s;
    s.padding = std::max(0.0, number_or(j, "padding", s.padding));
    s.corner_radius = std::max(0.0, number_or(j, "corner_radius", s.corner_radius));
    s.shadow = bool_or(j, "shadow", s.shadow);
    s.shadow_intensity = std::clamp(number_or(j, "shadow_intensity", s.shadow_intensity), 0.0, 100.0);
    if (!parse_background_type(string_or(j, "bg_type", ""), &s.bg_type)) s.bg_type = StyleConfig{}.bg_type;
    Color unused;
    std::string c1 = string_or(j, "bg_color", s.bg_color);
    if (parse_hex_color(c1, &unused)) s.bg_color = c1;
    std::string c2 = string_or(j, "bg_color2", s.bg_color2);
    if (parse_hex_color(c2, &unused)) s.bg_color2 = c2;
    s.bg_image = string_or(j, "bg_image", s.bg_image);
    s.show_cursor = bool_or(j, "show_cursor", s.show_cursor);
    if (!parse_cursor_glyph(string_or(j, "cursor_style", ""), &s.cursor_style)) {
        s.cursor_style = StyleConfig{}.cursor_style;
    }
    s.cursor_scale = std::max(0.1, number_or(j, "cursor_scale", s.cursor_scale));
    s.smooth_cursor_glyph = bool_or(j, "smooth_cursor_glyph", s.smooth_cursor_glyph);
    s.click_effects = bool_or(j, "click_effects", s.click_effects);
    s.screen_motion_blur = bool_or(j, "screen_motion_blur", s.screen_motion_blur);
    s.cursor_motion_blur = bool_or(j, "cursor_motion_blur", s.cursor_motion_blur);
    s.follow_cursor = bool_or(j, "follow_cursor", s.follow_cursor);
    s.auto_zoom_on_cursor = bool_or(j, "auto_zoom_on_cursor", s.auto_zoom_on_cursor);
    s.follow_zoom_factor = std::max(1.0, number_or(j, "follow_zoom_factor", s.follow_zoom_factor));
    if (!parse_cursor_speed(string_or(j, "cursor_speed", ""), &s.cursor_speed)) {
        s.cursor_speed = StyleConfig{}.cursor_speed;
    }
    if (!parse_pan_speed(string_or(j, "pan_speed", ""), &s.pan_speed)) {
        s.pan_speed = StyleConfig{}.pan_speed;
    }
    return s;
}

json session_to_json(const Session& session) {
    json j;
    j["version"] = 1;
    j["video"] = session.video_path;
    j["duration"] = session.duration;
    j["fps"] = session.fps;
    j["output"] = {{"width", session.output_width}, {"height", session.output_height}};
    j["playhead"] = session.playhead;
    j["cursor"] = json::array();
    for (const auto& s : session.track.cursor) {
        j["cursor"].push_back({{"t", s.t}, {"x", s.x}, {"y", s.y}});
    }
    j["clicks"] = json::array();
    for (const auto& c : session.track.clicks) {
        j["clicks"].push_back({{"t", c.t}, {"x", c.x}, {"y", c.y}, {"button", c.button}});
    }
    j["segments"] = json::array();
    for (const auto& seg : session.segments) {
        j["segments"].push_back({
            {"t_start", seg.t_start},
            {"t_end", seg.t_end},
            {"cx", seg.cx},
            {"cy", seg.cy},
            {"factor", seg.factor},
            {"ease_in", seg.ease_in},
            {"ease_out", seg.ease_out},
            {"color", seg.color},
            {"label", seg.label}
        });
    }
    j["clips"] = json::array();
    for (const auto& clip : session.clips) {
        j["clips"].push_back({{"start", clip.start}, {"end", clip.end}, {"deleted", clip.deleted}});
    }
    j["style"] = style_to_json(session.style);
    return j;
}

bool session_from_json(const json& j, Session& session) {
    if (!j.is_object()) return false;
    Session s;
    s.video_path = string_or(j, "video", "");
    s.duration = std::max(0.0, number_or(j, "duration", 0.0));
    s.fps = number_or(j, "fps", s.fps);
    if (s.fps <= 0.0) s.fps = 30.0;
    if (j.contains("output") && j["output"].is_object()) {
        s.output_width = dimension_or(j["output"], "width", s.output_width);
        s.output_height = dimension_or(j["output"], "height", s.output_height);
    }
    if (s.output_width <= 0 || s.output_height <= 0) {
        std::fprintf(stderr, "[WARN] Invalid output size %dx%d, using 1920x1080\n", s.output_width, s.output_height);
        s.output_width = 1920;
        s.output_height = 1080;
    }
    s.playhead = std::clamp(number_or(j, "playhead", 0.0), 0.0, s.duration);

    if (j.contains("cursor") && j["cursor"].is_array()) {
        for (const auto& c : j["cursor"]) {
            if (!c.is_object()) continue;
            s.track.cursor.push_back({number_or(c, "t", 0.0), number_or(c, "x", 0.0), number_or(c, "y", 0.0)});
        }
        std::stable_sort(s.track.cursor.begin(), s.track.cursor.end(),
                         [](const CursorSample& a, const CursorSample& b) { return a.t < b.t; });
    }
    if (j.contains("clicks") && j["clicks"].is_array()) {
        for (const auto& c : j["clicks"]) {
            if (!c.is_object()) continue;
            ClickEvent click;
            click.t = number_or(c, "t", 0.0);
            click.x = number_or(c, "x", 0.0);
            click.y = number_or(c, "y", 0.0);
            click.button = string_or(c, "button", "left");
            s.track.clicks.push_back(click);
        }
        dedupe_clicks(s.track.clicks);
    }
    if (j.contains("segments") && j["segments"].is_array()) {
        for (const auto& c : j["segments"]) {
            if (!c.is_object()) continue;
            ZoomSegment seg;
            seg.t_start = number_or(c, "t_start", 0.0);
            seg.t_end = number_or(c, "t_end", 0.0);
            if (seg.t_end - seg.t_start < 0.1) continue;
            seg.cx = std::clamp(number_or(c, "cx", seg.cx), 0.0, 1.0);
            seg.cy = std::clamp(number_or(c, "cy", seg.cy), 0.0, 1.0);
            seg.factor = std::max(1.0, number_or(c, "factor", seg.factor));
            seg.ease_in = std::max(0.0, number_or(c, "ease_in", seg.ease_in));
            seg.ease_out = std::max(0.0, number_or(c, "ease_out", seg.ease_out));
            seg.color = string_or(c, "color", seg.color);
            seg.label = string_or(c, "label", "");
            s.segments.push_back(seg);
        }
    }
    if (j.contains("clips") && j["clips"].is_array()) {
        for (const auto& c : j["clips"]) {
            if (!c.is_object()) continue;
            s.clips.push_back({number_or(c, "start", 0.0), number_or(c, "end", 0.0), bool_or(c, "deleted", false)});
        }
    }
    if (j.contains("style")) s.style = style_from_json(j["style"]);

    session = std::move(s);
    return true;
}

bool save_session(const std::string& path, const Session& session) {
    std::ofstream out(path);
    if (!out) {
        std::fprintf(stderr, "Could not write session: %s\n", path.c_str());
        return false;
    }
    out << session_to_json(session).dump(2);
    return (bool)out;
}

bool load_session(const std::string& path, Session& session) {
    std::ifstream in(path);
    if (!in) {
        std::fprintf(stderr, "Could not open session: %s\n", path.c_str());
        return false;
    }
    if (in.peek() == std::ifstream::traits_type::eof()) return false;
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        std::fprintf(stderr, "Could not parse session %s: %s\n", path.c_str(), e.what());
        return false;
    }
    return session_from_json(j, session);
}

fs::path get_config_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return fs::path(home) / ".config" / "zoomcut";
}

fs::path load_last_path() {
    std::error_code ec;
    auto config_file = get_config_dir() / "last_path";
    if (fs::exists(config_file, ec)) {
        std::ifstream f(config_file);
        std::string path_str;
        std::getline(f, path_str);
        if (!path_str.empty() && fs::exists(path_str, ec)) {
            return path_str;
        }
    }
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path("/") : cwd;
}

void save_last_path(const fs::path& p) {
    std::error_code ec;
    auto config_dir = get_config_dir();
    fs::create_directories(config_dir, ec);
    if (ec) {
        std::fprintf(stderr, "[WARN] Could not create %s: %s\n", config_dir.c_str(), ec.message().c_str());
        return;
    }
    std::ofstream f(config_dir / "last_path");
    f << p.string();
}
