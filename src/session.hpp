#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "compositor.hpp"
#include "model.hpp"
#include "style.hpp"

namespace fs = std::filesystem;

// Everything needed to re-open or export one recording
struct Session {
    std::string video_path;
    double duration = 0.0;
    double fps = 30.0;
    int output_width = 1920;
    int output_height = 1080;
    double playhead = 0.0;
    TrackData track;
    std::vector<ZoomSegment> segments;
    std::vector<Clip> clips;  // empty means one clip over the whole recording
    StyleConfig style;
};

nlohmann::json style_to_json(const StyleConfig& style);
// Missing or mistyped keys keep their defaults
StyleConfig style_from_json(const nlohmann::json& j);

nlohmann::json session_to_json(const Session& session);
bool session_from_json(const nlohmann::json& j, Session& session);

bool save_session(const std::string& path, const Session& session);
bool load_session(const std::string& path, Session& session);

fs::path get_config_dir();
fs::path load_last_path();
void save_last_path(const fs::path& p);
