#pragma once

#include "hex_map.hpp"
#include "terrain_layers.hpp"

#include <array>
#include <string>
#include <vector>

// Flat, layout-independent form of a cell: coordinates plus one value id per layer.
struct CellRecord {
    int q = 0;
    int r = 0;
    std::array<std::string, LAYER_KIND_COUNT> ids; // indexed by LayerKind
};

struct MapRecords {
    int width = 0;
    int height = 0;
    HexLayout layout;
    std::vector<CellRecord> cells;
};

MapRecords serializeMap(const HexMap& map, const TerrainModel& model);

// Rebuilds a map (composites recomputed from the layer values) and swaps it into
// `out` on success. Unknown ids and duplicate coordinates are errors.
bool deserializeMap(const MapRecords& records, const TerrainModel& model, HexMap& out,
                    std::string* outErrors = nullptr);

// Text form:
//   # hexworld map v1
//   size <width> <height> <pointy|flat> <cellSize>
//   <q> <r> <height> <climate> <vegetation>     (one line per cell)
std::string mapRecordsToText(const MapRecords& records);
bool mapRecordsFromText(const std::string& text, MapRecords& out, std::string* outErrors = nullptr);

bool writeMapText(const std::string& path, const HexMap& map, const TerrainModel& model);
bool readMapText(const std::string& path, const TerrainModel& model, HexMap& out, std::string* outErrors = nullptr);
