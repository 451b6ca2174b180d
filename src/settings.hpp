#pragma once

#include <cstdint>
#include <string>

#include "hex_math.hpp"
#include "map_generator.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// The file is created next to the executable on first run.
struct Settings {
    // Window
    int windowWidth = 1280;
    int windowHeight = 800;
    bool vsync = true;
    bool startFullscreen = false;

    // World
    int mapWidth = 100;
    int mapHeight = 80;
    int cellSize = 30;
    HexOrientation orientation = HexOrientation::Pointy;
    uint32_t seed = 0; // 0 = pick one from the clock at startup
    GenerationMode generator = GenerationMode::Noise;
    bool island = false;

    // Rendering
    bool showGrid = true;
    bool coastMapEdges = true; // draw coastline along the map border
    float lodSquareZoom = 0.35f; // below: cells drawn as squares
    float lodDetailZoom = 0.5f;  // below: no textures / coast decoration
    float lodGridZoom = 0.7f;    // below: no grid outlines
    float minZoom = 0.3f;
    float maxZoom = 3.0f;

    // Data
    std::string terrainConfig; // optional terrain override file
    std::string assetDir = "assets";
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
// Unknown keys and unparsable values are reported in outWarnings.
Settings loadSettings(const std::string& path, std::string* outWarnings = nullptr);

// Applies key = value lines from memory on top of `s`.
void applySettingsText(const std::string& text, Settings& s, std::string* outWarnings = nullptr);

// Update (or append) a single key=value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
