#include "render_modes.hpp"

#include <string>


namespace {

struct IdColor {
    const char* id;
    uint32_t rgb;
};

constexpr IdColor kHeightColors[] = {
    { "deep_water", 0x1a5490 },
    { "shallow_water", 0x3498db },
    { "lowlands", 0x2ecc71 },
    { "hills", 0xf39c12 },
    { "mountains", 0xe74c3c },
};

constexpr IdColor kClimateColors[] = {
    { "hot", 0xe67e22 },
    { "moderate", 0x95a5a6 },
    { "cold", 0x3498db },
};

constexpr IdColor kVegetationColors[] = {
    { "none", 0xb8a896 },
    { "grassland", 0x7ec850 },
    { "forest", 0x228b22 },
    { "desert", 0xf4e4a6 },
    { "tundra", 0xb8d4e0 },
    { "swamp", 0x4a5d3e },
};

constexpr uint32_t kUnknownColor = 0x888888;

template <size_t N>
Color lookup(const IdColor (&table)[N], const std::string& id) {
    for (const IdColor& e : table) {
        if (id == e.id) return rgb(e.rgb);
    }
    return rgb(kUnknownColor);
}

} // namespace

const char* debugViewName(DebugView v) {
    switch (v) {
        case DebugView::None:       return "normal";
        case DebugView::Landmass:   return "landmass";
        case DebugView::Height:     return "height";
        case DebugView::Climate:    return "climate";
        case DebugView::Vegetation: return "vegetation";
        default:                    return "unknown";
    }
}

DebugView nextDebugView(DebugView v) {
    return static_cast<DebugView>((static_cast<int>(v) + 1) % DEBUG_VIEW_COUNT);
}

Color debugColor(DebugView v, const TerrainModel& model, const Cell& cell) {
    switch (v) {
        case DebugView::Landmass:
            return cell.terrain.water ? rgb(0x3498db) : rgb(0xd4c4a0);
        case DebugView::Height:
            return lookup(kHeightColors, model.idOf(LayerKind::Height, cell.layers.get(LayerKind::Height)));
        case DebugView::Climate:
            return lookup(kClimateColors, model.idOf(LayerKind::Climate, cell.layers.get(LayerKind::Climate)));
        case DebugView::Vegetation:
            return lookup(kVegetationColors, model.idOf(LayerKind::Vegetation, cell.layers.get(LayerKind::Vegetation)));
        case DebugView::None:
        default:
            return cell.terrain.color;
    }
}

LodGates lodGatesFor(float zoom, const LodThresholds& t) {
    LodGates g;
    g.hexPolygons = zoom >= t.squareZoom;
    g.textures = zoom >= t.detailZoom;
    g.borders = zoom >= t.detailZoom;
    g.grid = zoom >= t.gridZoom;
    return g;
}
