#pragma once

#include "hex_map.hpp"

#include <optional>
#include <vector>

// Coastline geometry: which edges separate water from land, how a decoration
// strip is tiled along each one, and where edges meet at a shared vertex.
// Pure math on world-space points; the renderer maps the results to the screen.

struct SharedEdge {
    Vec2f a;
    Vec2f b;
};

// The two corners hexes `a` and `b` have in common, found by comparing corner
// positions within `eps`. nullopt unless exactly two corners match (true
// neighbors always match two).
std::optional<SharedEdge> sharedEdge(const HexLayout& layout, const HexCoord& a, const HexCoord& b, float eps);

// Corner match tolerance for a layout (a small fraction of the cell size).
float sharedEdgeEpsilon(const HexLayout& layout);

struct CoastEdge {
    HexCoord land;
    HexCoord water;        // may lie off the map when mapEdge is set
    bool mapEdge = false;  // water side is the virtual neighbor beyond the map border
    SharedEdge edge;
    Vec2f landward;        // unit vector from the edge midpoint toward the land cell center
};

// Every water/land edge touching `visible`, each reported once: a pair whose
// cells are both visible is emitted from the cell with the smaller key. With
// `includeMapEdges`, land cells on the map border also get an edge toward each
// missing neighbor (off-map counts as water).
std::vector<CoastEdge> collectCoastEdges(const HexMap& map, const std::vector<const Cell*>& visible,
                                         bool includeMapEdges);

// Layout of a border image repeated along one edge.
struct EdgeTiling {
    int count = 0;          // 0 = nothing to draw
    float tileW = 0.0f;
    float tileH = 0.0f;
    float angleDeg = 0.0f;  // rotation of the edge direction a->b
    bool flipV = false;     // image top must face land
    std::vector<Vec2f> centers;
};

// Tiles an imgW x imgH image along `e` at `thickness` height. The tile count is the
// edge length over the natural tile width (rounded, at least one); both tile
// dimensions are then scaled uniformly so the tiles cover the edge exactly.
EdgeTiling tileEdge(const CoastEdge& e, float thickness, int imgW, int imgH);

// True if the border art must be flipped so its top side faces land.
bool borderFlipNeeded(const SharedEdge& edge, const Vec2f& landward);

enum class CornerKind : uint8_t {
    Narrow = 0,
    Wide,
};

constexpr float NARROW_CORNER_MAX_DEG = 100.0f;

struct CornerJoin {
    Vec2f pos;
    CornerKind kind = CornerKind::Wide;
    float size = 0.0f;         // average tile height of the contributing edges
    float rotationDeg = 0.0f;  // turns the art's "up" toward the averaged landward direction
    float maxAngleDeg = 0.0f;
    int edgeCount = 0;
};

// Largest pairwise angle (degrees) between direction vectors.
float maxPairwiseAngleDeg(const std::vector<Vec2f>& dirs);

// Groups edge endpoints by vertex and emits a join wherever two or more edges meet.
// `tileHeights` runs parallel to `edges`.
std::vector<CornerJoin> findCornerJoins(const std::vector<CoastEdge>& edges, const std::vector<float>& tileHeights,
                                        float mergeEps);
