#pragma once

#include <cstddef>
#include <istream>
#include <string>

#include "compositor.hpp"

// Screen area the recording covered, in absolute pixels
struct DisplayBounds {
    double x = 0.0;
    double y = 0.0;
    double width = 1920.0;
    double height = 1080.0;
};

struct TrackerStats {
    size_t clicks = 0;
    size_t moves = 0;
    size_t skipped = 0;
};

// One tracker line: {"type":"click"|"move","x","y","button","time"} with
// absolute pixel coordinates and epoch seconds. Appends the normalized event
// to `out`; returns false for malformed or pre-recording lines.
bool parse_tracker_line(const std::string& line, const DisplayBounds& bounds, double recording_start,
                        TrackData& out);

// Reads every line, skipping bad ones, then orders samples and de-duplicates clicks
TrackerStats read_tracker_stream(std::istream& in, const DisplayBounds& bounds, double recording_start,
                                 TrackData& out);

bool load_tracker_file(const std::string& path, const DisplayBounds& bounds, double recording_start,
                       TrackData& out);
