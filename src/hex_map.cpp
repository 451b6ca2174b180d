#include "hex_map.hpp"

#include <algorithm>
#include <atomic>

namespace {

uint64_t nextRevision() {
    static std::atomic<uint64_t> counter{ 0 };
    return ++counter;
}

} // namespace

HexMap::HexMap(int width, int height, const HexLayout& layout)
    : width_(std::max(0, width)), height_(std::max(0, height)), layout_(layout), revision_(nextRevision()) {
    cells_.reserve(static_cast<size_t>(width_) * static_cast<size_t>(height_));
    index_.reserve(static_cast<size_t>(width_) * static_cast<size_t>(height_));
}

void HexMap::touch() {
    revision_ = nextRevision();
}

void HexMap::setCell(const Cell& cell) {
    const uint64_t key = hexKey(cell.coord);
    auto it = index_.find(key);
    if (it != index_.end()) {
        cells_[it->second] = cell;
    } else {
        index_.emplace(key, cells_.size());
        cells_.push_back(cell);
    }
    touch();
}

Cell* HexMap::find(const HexCoord& h) {
    auto it = index_.find(hexKey(h));
    if (it == index_.end()) return nullptr;
    return &cells_[it->second];
}

const Cell* HexMap::find(const HexCoord& h) const {
    auto it = index_.find(hexKey(h));
    if (it == index_.end()) return nullptr;
    return &cells_[it->second];
}

bool HexMap::remove(const HexCoord& h) {
    auto it = index_.find(hexKey(h));
    if (it == index_.end()) return false;

    const size_t slot = it->second;
    const size_t last = cells_.size() - 1;
    if (slot != last) {
        cells_[slot] = std::move(cells_[last]);
        index_[hexKey(cells_[slot].coord)] = slot;
    }
    cells_.pop_back();
    index_.erase(it);
    touch();
    return true;
}

void HexMap::clear() {
    cells_.clear();
    index_.clear();
    touch();
}

std::vector<const Cell*> HexMap::filter(const std::function<bool(const Cell&)>& pred) const {
    std::vector<const Cell*> out;
    for (const Cell& c : cells_) {
        if (pred(c)) out.push_back(&c);
    }
    return out;
}

std::vector<const Cell*> HexMap::neighbors(const HexCoord& h) const {
    std::vector<const Cell*> out;
    out.reserve(HEX_DIRECTIONS);
    for (const HexCoord& n : hexNeighbors(h)) {
        if (const Cell* c = find(n)) out.push_back(c);
    }
    return out;
}

bool HexMap::isMapEdge(const HexCoord& h) const {
    if (!contains(h)) return false;
    for (const HexCoord& n : hexNeighbors(h)) {
        if (!contains(n)) return true;
    }
    return false;
}

std::vector<const Cell*> HexMap::inRegion(int minQ, int maxQ, int minR, int maxR) const {
    std::vector<const Cell*> out;
    for (const Cell& c : cells_) {
        if (c.coord.q >= minQ && c.coord.q <= maxQ && c.coord.r >= minR && c.coord.r <= maxR) out.push_back(&c);
    }
    return out;
}

std::vector<const Cell*> HexMap::inRadius(const HexCoord& center, int radius) const {
    std::vector<const Cell*> out;
    for (const HexCoord& h : hexRange(center, radius)) {
        if (const Cell* c = find(h)) out.push_back(c);
    }
    return out;
}

HexBounds HexMap::bounds() const {
    HexBounds b;
    if (cells_.empty()) return b;

    b.minQ = b.maxQ = cells_.front().coord.q;
    b.minR = b.maxR = cells_.front().coord.r;
    for (const Cell& c : cells_) {
        b.minQ = std::min(b.minQ, c.coord.q);
        b.maxQ = std::max(b.maxQ, c.coord.q);
        b.minR = std::min(b.minR, c.coord.r);
        b.maxR = std::max(b.maxR, c.coord.r);
    }
    return b;
}

std::vector<std::pair<const Cell*, const Cell*>> HexMap::findBorders(
    const std::function<bool(const Cell&, const Cell&)>& pred) const {
    std::vector<std::pair<const Cell*, const Cell*>> out;
    for (const Cell& a : cells_) {
        const uint64_t ka = hexKey(a.coord);
        for (const HexCoord& n : hexNeighbors(a.coord)) {
            // Each unordered pair is seen from both sides; keep only the side with the smaller key.
            if (hexKey(n) <= ka) continue;
            const Cell* b = find(n);
            if (!b) continue;
            if (pred(a, *b)) out.emplace_back(&a, b);
        }
    }
    return out;
}

bool HexMap::setLayerValue(const HexCoord& h, LayerKind layer, ValueIndex value, const TerrainModel& model) {
    Cell* c = find(h);
    if (!c) return false;
    if (!model.value(layer, value)) return false;

    c->layers.set(layer, value);
    c->terrain = model.resolveComposite(c->layers);
    touch();
    return true;
}
