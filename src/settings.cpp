#include "settings.hpp"

#include "ini_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

Settings loadSettings(const std::string& path, std::string* outWarnings) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::ostringstream oss;
    oss << f.rdbuf();
    applySettingsText(oss.str(), s, outWarnings);
    return s;
}

void applySettingsText(const std::string& text, Settings& s, std::string* outWarnings) {
    std::istringstream iss(text);
    std::string line;

    std::string warnings;
    int warnCount = 0;

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        if (lineNo == 1) stripUtf8Bom(line);
        line = trim(stripIniComment(line));
        if (line.empty()) continue;

        std::string key;
        std::string val;
        if (!splitIniLine(line, key, val)) continue;

        bool ok = true;
        if (key == "window_width") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.windowWidth = std::clamp(v, 320, 7680);
        } else if (key == "window_height") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.windowHeight = std::clamp(v, 240, 4320);
        } else if (key == "vsync") {
            ok = parseBool(val, s.vsync);
        } else if (key == "start_fullscreen") {
            ok = parseBool(val, s.startFullscreen);
        } else if (key == "map_width") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.mapWidth = std::clamp(v, 1, 1000);
        } else if (key == "map_height") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.mapHeight = std::clamp(v, 1, 1000);
        } else if (key == "cell_size") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.cellSize = std::clamp(v, 4, 256);
        } else if (key == "orientation") {
            const std::string v = toLower(val);
            if (v == "pointy") s.orientation = HexOrientation::Pointy;
            else if (v == "flat") s.orientation = HexOrientation::Flat;
            else ok = false;
        } else if (key == "seed") {
            unsigned int v = 0;
            ok = parseUint32(val, v);
            if (ok) s.seed = v;
        } else if (key == "generator") {
            const std::string v = toLower(val);
            if (v == "random") s.generator = GenerationMode::Random;
            else if (v == "noise") s.generator = GenerationMode::Noise;
            else ok = false;
        } else if (key == "island") {
            ok = parseBool(val, s.island);
        } else if (key == "show_grid") {
            ok = parseBool(val, s.showGrid);
        } else if (key == "coast_map_edges") {
            ok = parseBool(val, s.coastMapEdges);
        } else if (key == "lod_square_zoom") {
            float v = 0.0f;
            ok = parseFloat(val, v);
            if (ok) s.lodSquareZoom = std::clamp(v, 0.0f, 10.0f);
        } else if (key == "lod_detail_zoom") {
            float v = 0.0f;
            ok = parseFloat(val, v);
            if (ok) s.lodDetailZoom = std::clamp(v, 0.0f, 10.0f);
        } else if (key == "lod_grid_zoom") {
            float v = 0.0f;
            ok = parseFloat(val, v);
            if (ok) s.lodGridZoom = std::clamp(v, 0.0f, 10.0f);
        } else if (key == "min_zoom") {
            float v = 0.0f;
            ok = parseFloat(val, v);
            if (ok) s.minZoom = std::clamp(v, 0.05f, 1.0f);
        } else if (key == "max_zoom") {
            float v = 0.0f;
            ok = parseFloat(val, v);
            if (ok) s.maxZoom = std::clamp(v, 1.0f, 20.0f);
        } else if (key == "terrain_config") {
            s.terrainConfig = val;
        } else if (key == "asset_dir") {
            s.assetDir = val;
        } else {
            appendWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
            continue;
        }

        if (!ok) appendWarning(warnings, lineNo, "Invalid value for " + key + ": " + val, warnCount);
    }

    if (outWarnings) *outWarnings += warnings;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# HexWorld settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart.

# Window
window_width = 1280
window_height = 800
# vsync: true/false
vsync = true
start_fullscreen = false

# World
# map_width / map_height: 1..1000 cells
map_width = 100
map_height = 80
# cell_size: hex radius in pixels at zoom 1 (4..256)
cell_size = 30
# orientation: pointy | flat
orientation = pointy
# seed: 0 picks a new seed every run
seed = 0
# generator: noise | random
generator = noise
# island: true pushes the map border toward water
island = false

# Rendering
show_grid = true
coast_map_edges = true
# Level of detail (zoom thresholds)
#   below lod_square_zoom: cells drawn as squares
#   below lod_detail_zoom: no textures or coast decoration
#   below lod_grid_zoom:   no grid outlines
lod_square_zoom = 0.35
lod_detail_zoom = 0.5
lod_grid_zoom = 0.7
min_zoom = 0.3
max_zoom = 3.0

# Data
# terrain_config: optional terrain override file (see terrain.ini.example)
terrain_config =
asset_dir = assets
)INI";

    return true;
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::ifstream in(path);
    if (!in) return false;

    std::vector<std::string> lines;
    std::string line;
    const std::string wanted = toLower(key);

    bool found = false;
    while (std::getline(in, line)) {
        std::string k;
        std::string v;
        // Strip comments for matching, but keep the original line when it doesn't match.
        if (splitIniLine(stripIniComment(line), k, v) && !k.empty() && k == wanted) {
            lines.push_back(key + " = " + value);
            found = true;
            continue;
        }
        lines.push_back(line);
    }
    in.close();

    if (!found) lines.push_back(key + " = " + value);

    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) out << "\n";
    }
    return true;
}
