#pragma once

#include "camera.hpp"
#include "hex_map.hpp"
#include "map_generator.hpp"
#include "terrain_layers.hpp"

#include <string>

// Owns the terrain model and the current grid; the single entry point the app,
// the headless tool and the renderer go through.
class World {
public:
    // Validates the terrain configuration. Nothing can be generated until this succeeds.
    bool init(const TerrainConfig& cfg, std::string* outErrors = nullptr);

    // Replaces the whole grid. On failure the previous grid is kept.
    bool generate(int width, int height, float cellSize, const GenerationOptions& options,
                  std::string* outErrors = nullptr);

    bool saveMap(const std::string& path) const;
    bool loadMap(const std::string& path, std::string* outErrors = nullptr);

    // Cell containing the world-space point, or nullptr.
    const Cell* cellAt(float worldX, float worldY) const;

    bool setLayerValue(const HexCoord& h, LayerKind layer, ValueIndex value);

    // World-space rectangle spanned by the cell centers.
    ViewBounds extent() const;
    Vec2f center() const;

    const HexMap& map() const { return map_; }
    const TerrainModel& model() const { return model_; }
    const GenerationStats& lastStats() const { return stats_; }
    const GenerationOptions& lastOptions() const { return options_; }

private:
    TerrainModel model_;
    HexMap map_;
    GenerationStats stats_;
    GenerationOptions options_;
};
