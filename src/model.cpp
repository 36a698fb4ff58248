#include "model.hpp"

const char* cursor_speed_name(CursorSpeed speed) {
    switch (speed) {
        case CursorSpeed::Slow:   return "slow";
        case CursorSpeed::Medium: return "medium";
        case CursorSpeed::Fast:   return "fast";
        case CursorSpeed::Rapid:  return "rapid";
    }
    return "medium";
}

const char* pan_speed_name(PanSpeed speed) {
    switch (speed) {
        case PanSpeed::Segment: return "segment";
        case PanSpeed::Slow:    return "slow";
        case PanSpeed::Medium:  return "medium";
        case PanSpeed::Fast:    return "fast";
        case PanSpeed::Rapid:   return "rapid";
    }
    return "medium";
}

bool parse_cursor_speed(const std::string& name, CursorSpeed* out) {
    if (name == "slow") *out = CursorSpeed::Slow;
    else if (name == "medium") *out = CursorSpeed::Medium;
    else if (name == "fast") *out = CursorSpeed::Fast;
    else if (name == "rapid") *out = CursorSpeed::Rapid;
    else return false;
    return true;
}

bool parse_pan_speed(const std::string& name, PanSpeed* out) {
    if (name == "segment") *out = PanSpeed::Segment;
    else if (name == "slow") *out = PanSpeed::Slow;
    else if (name == "medium") *out = PanSpeed::Medium;
    else if (name == "fast") *out = PanSpeed::Fast;
    else if (name == "rapid") *out = PanSpeed::Rapid;
    else return false;
    return true;
}
