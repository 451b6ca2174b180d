#pragma once

#include "common.hpp"
#include "hex_map.hpp"
#include "terrain_layers.hpp"

#include <cstdint>
#include <optional>

// Debug visualizations replace the normal passes with one flat categorical fill.
enum class DebugView : uint8_t {
    None = 0,
    Landmass,
    Height,
    Climate,
    Vegetation,
};

constexpr int DEBUG_VIEW_COUNT = 5;

const char* debugViewName(DebugView v);
DebugView nextDebugView(DebugView v);

// Fill color for `cell` under debug view `v` (#888888 for ids outside the tables).
Color debugColor(DebugView v, const TerrainModel& model, const Cell& cell);

struct LodThresholds {
    float squareZoom = 0.35f;
    float detailZoom = 0.5f;
    float gridZoom = 0.7f;
};

// Which passes run at a given zoom.
struct LodGates {
    bool hexPolygons = true; // false: cheap overlapping squares
    bool textures = true;    // decoration overlays
    bool borders = true;     // coastline decoration
    bool grid = true;        // cell outlines
};

LodGates lodGatesFor(float zoom, const LodThresholds& t);

struct RenderOptions {
    bool showGrid = true;
    bool coastMapEdges = true;
    DebugView debugView = DebugView::None;
    std::optional<HexCoord> hover;
    LodThresholds lod;
};
