#pragma once

#include "hex_math.hpp"
#include "terrain_layers.hpp"

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

struct Cell {
    HexCoord coord;
    LayerValues layers;
    CompositeTerrain terrain; // cached; recompute with TerrainModel::resolveComposite
};

// Collision-free over the full int32 range of q and r.
inline uint64_t hexKey(const HexCoord& h) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(h.q)) << 32) | static_cast<uint64_t>(static_cast<uint32_t>(h.r));
}

struct HexBounds {
    int minQ = 0;
    int maxQ = 0;
    int minR = 0;
    int maxR = 0;
};

// Keyed cell storage plus neighbor/border/region queries.
//
// Cells live in a dense vector (stable enumeration, cache-friendly scans) with a
// key -> slot index beside it. Pointers returned by find() are invalidated by any
// insert or remove.
class HexMap {
public:
    HexMap() = default;
    HexMap(int width, int height, const HexLayout& layout);

    int width() const { return width_; }
    int height() const { return height_; }
    const HexLayout& layout() const { return layout_; }

    // Bumped on every mutation. Values are unique across all maps in the process,
    // so a consumer that cached a revision notices when the map is replaced.
    uint64_t revision() const { return revision_; }

    // Inserts or replaces the cell at cell.coord.
    void setCell(const Cell& cell);

    Cell* find(const HexCoord& h);
    const Cell* find(const HexCoord& h) const;
    bool contains(const HexCoord& h) const { return index_.count(hexKey(h)) != 0; }
    bool remove(const HexCoord& h);
    void clear();

    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }
    const std::vector<Cell>& cells() const { return cells_; }

    std::vector<const Cell*> filter(const std::function<bool(const Cell&)>& pred) const;

    // Existing neighbors only, in canonical direction order.
    std::vector<const Cell*> neighbors(const HexCoord& h) const;

    // True if the cell exists and at least one of its six neighbors does not.
    bool isMapEdge(const HexCoord& h) const;

    // Cells with q in [minQ, maxQ] and r in [minR, maxR].
    std::vector<const Cell*> inRegion(int minQ, int maxQ, int minR, int maxR) const;

    // Existing cells within `radius` steps of `center`.
    std::vector<const Cell*> inRadius(const HexCoord& center, int radius) const;

    // Axial min/max over all cells (all zero when empty).
    HexBounds bounds() const;

    // Every adjacent pair with pred(a, b) true, each pair reported once with
    // hexKey(first) < hexKey(second).
    std::vector<std::pair<const Cell*, const Cell*>> findBorders(
        const std::function<bool(const Cell&, const Cell&)>& pred) const;

    // Changes one layer value and re-derives only that cell's composite.
    // Returns false if the cell does not exist or the value is unknown.
    bool setLayerValue(const HexCoord& h, LayerKind layer, ValueIndex value, const TerrainModel& model);

private:
    void touch();

    int width_ = 0;
    int height_ = 0;
    HexLayout layout_;
    uint64_t revision_ = 0;

    std::vector<Cell> cells_;
    std::unordered_map<uint64_t, size_t> index_;
};
