#include "world.hpp"

#include "map_io.hpp"

#include <algorithm>

bool World::init(const TerrainConfig& cfg, std::string* outErrors) {
    map_ = HexMap();
    return model_.load(cfg, outErrors);
}

bool World::generate(int width, int height, float cellSize, const GenerationOptions& options,
                     std::string* outErrors) {
    GenerationStats stats;
    if (!generateMap(map_, model_, width, height, cellSize, options, &stats, outErrors)) return false;
    stats_ = stats;
    options_ = options;
    return true;
}

bool World::saveMap(const std::string& path) const {
    return writeMapText(path, map_, model_);
}

bool World::loadMap(const std::string& path, std::string* outErrors) {
    if (!readMapText(path, model_, map_, outErrors)) return false;
    stats_ = GenerationStats{};
    stats_.cells = map_.size();
    options_.orientation = map_.layout().orientation;
    return true;
}

const Cell* World::cellAt(float worldX, float worldY) const {
    if (map_.empty()) return nullptr;
    return map_.find(pixelToHex(map_.layout(), Vec2f{ worldX, worldY }));
}

bool World::setLayerValue(const HexCoord& h, LayerKind layer, ValueIndex value) {
    return map_.setLayerValue(h, layer, value, model_);
}

ViewBounds World::extent() const {
    ViewBounds b;
    bool first = true;
    for (const Cell& c : map_.cells()) {
        const Vec2f p = hexToPixel(map_.layout(), c.coord);
        if (first) {
            b = { p.x, p.y, p.x, p.y };
            first = false;
            continue;
        }
        b.left = std::min(b.left, p.x);
        b.top = std::min(b.top, p.y);
        b.right = std::max(b.right, p.x);
        b.bottom = std::max(b.bottom, p.y);
    }
    return b;
}

Vec2f World::center() const {
    const ViewBounds b = extent();
    return { (b.left + b.right) * 0.5f, (b.top + b.bottom) * 0.5f };
}
