#include "tracker_io.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool parse_tracker_line(const std::string& line, const DisplayBounds& bounds, double recording_start,
                        TrackData& out) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;

    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) return false;
    for (const char* key : {"x", "y", "time"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) return false;
    }

    double t = j["time"].get<double>() - recording_start;
    if (t < 0.0) return false;
    double w = bounds.width > 0.0 ? bounds.width : 1920.0;
    double h = bounds.height > 0.0 ? bounds.height : 1080.0;
    double nx = (j["x"].get<double>() - bounds.x) / w;
    double ny = (j["y"].get<double>() - bounds.y) / h;

    const std::string& kind = type->get_ref<const std::string&>();
    if (kind == "click") {
        ClickEvent click;
        click.t = t;
        click.x = nx;
        click.y = ny;
        auto button = j.find("button");
        if (button != j.end() && button->is_string()) click.button = button->get<std::string>();
        out.clicks.push_back(click);
        return true;
    }
    if (kind == "move") {
        out.cursor.push_back({t, nx, ny});
        return true;
    }
    return false;
}

TrackerStats read_tracker_stream(std::istream& in, const DisplayBounds& bounds, double recording_start,
                                 TrackData& out) {
    TrackerStats stats;
    size_t clicks_before = out.clicks.size();
    size_t moves_before = out.cursor.size();
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        if (!parse_tracker_line(line, bounds, recording_start, out)) stats.skipped++;
    }
    stats.moves = out.cursor.size() - moves_before;

    std::stable_sort(out.cursor.begin(), out.cursor.end(),
                     [](const CursorSample& a, const CursorSample& b) { return a.t < b.t; });
    dedupe_clicks(out.clicks);
    stats.clicks = out.clicks.size() >= clicks_before ? out.clicks.size() - clicks_before : 0;
    return stats;
}

bool load_tracker_file(const std::string& path, const DisplayBounds& bounds, double recording_start,
                       TrackData& out) {
    std::ifstream in(path);
    if (!in) {
        std::fprintf(stderr, "Could not open tracker log: %s\n", path.c_str());
        return false;
    }
    TrackerStats stats = read_tracker_stream(in, bounds, recording_start, out);
    std::printf("Tracker: %zu moves, %zu clicks, %zu lines skipped\n", stats.moves, stats.clicks, stats.skipped);
    return true;
}
