#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Normalized cursor position [0,1] at a time relative to recording start
struct CursorSample {
    double t = 0.0;
    double x = 0.0;
    double y = 0.0;
};

struct ClickEvent {
    double t = 0.0;
    double x = 0.0;
    double y = 0.0;
    std::string button = "left";
};

// Timed zoom target. Segments may overlap; the resolver picks one per instant.
struct ZoomSegment {
    double t_start = 0.0;
    double t_end = 0.0;
    double cx = 0.5;
    double cy = 0.5;
    double factor = 2.0;
    double ease_in = 0.4;
    double ease_out = 0.4;
    std::string color = "#6C5CE7";
    std::string label;

    double length() const { return t_end - t_start; }
};

struct CameraState {
    double factor = 1.0;
    double cx = 0.5;
    double cy = 0.5;
};

// Contiguous piece of the recording. Deletion is a tombstone so indices
// and timeline positions stay stable.
struct Clip {
    double start = 0.0;
    double end = 0.0;
    bool deleted = false;

    double length() const { return end - start; }
};

struct CutInterval {
    double t_start = 0.0;
    double t_end = 0.0;
};

enum class CursorSpeed { Slow, Medium, Fast, Rapid };
// Segment keeps each segment's own ease values; the others override them.
enum class PanSpeed { Segment, Slow, Medium, Fast, Rapid };

struct CursorSpeedProfile {
    double lag;   // seconds the smoothed position trails the raw one
    double lerp;  // blend weight of the raw position
};

struct PanSpeedProfile {
    double ease_in;
    double ease_out;
};

inline CursorSpeedProfile cursor_speed_profile(CursorSpeed speed) {
    switch (speed) {
        case CursorSpeed::Slow:   return {0.18, 0.05};
        case CursorSpeed::Fast:   return {0.05, 0.25};
        case CursorSpeed::Rapid:  return {0.00, 1.00};
        case CursorSpeed::Medium: break;
    }
    return {0.10, 0.12};
}

inline PanSpeedProfile pan_speed_profile(PanSpeed speed) {
    switch (speed) {
        case PanSpeed::Slow:  return {1.2, 1.2};
        case PanSpeed::Fast:  return {0.18, 0.18};
        case PanSpeed::Rapid: return {0.06, 0.06};
        default: break;
    }
    return {0.4, 0.4};
}

const char* cursor_speed_name(CursorSpeed speed);
const char* pan_speed_name(PanSpeed speed);
bool parse_cursor_speed(const std::string& name, CursorSpeed* out);
bool parse_pan_speed(const std::string& name, PanSpeed* out);
