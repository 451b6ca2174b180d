#include "coast_stitch.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kRadToDeg = 180.0f / kPi;

struct Vertex {
    Vec2f pos;
    std::vector<Vec2f> dirs; // away from the vertex along each edge
    Vec2f landSum;
    float heightSum = 0.0f;
};

uint64_t bucketKey(int bx, int by) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(bx)) << 32) | static_cast<uint32_t>(by);
}

class VertexGrid {
public:
    explicit VertexGrid(float cell) : cell_(cell > 1e-6f ? cell : 1e-6f) {}

    // Returns the vertex within `eps` of p, creating it if none exists.
    Vertex& at(const Vec2f& p, float eps) {
        const int bx = static_cast<int>(std::floor(p.x / cell_));
        const int by = static_cast<int>(std::floor(p.y / cell_));
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                auto it = buckets_.find(bucketKey(bx + dx, by + dy));
                if (it == buckets_.end()) continue;
                for (size_t idx : it->second) {
                    if (distance(vertices_[idx].pos, p) <= eps) return vertices_[idx];
                }
            }
        }
        buckets_[bucketKey(bx, by)].push_back(vertices_.size());
        Vertex v;
        v.pos = p;
        vertices_.push_back(v);
        return vertices_.back();
    }

    const std::vector<Vertex>& vertices() const { return vertices_; }

private:
    float cell_;
    std::vector<Vertex> vertices_;
    std::unordered_map<uint64_t, std::vector<size_t>> buckets_;
};

CoastEdge makeEdge(const HexLayout& layout, const HexCoord& land, const HexCoord& water, bool mapEdge,
                   const SharedEdge& se) {
    CoastEdge e;
    e.land = land;
    e.water = water;
    e.mapEdge = mapEdge;
    e.edge = se;
    const Vec2f mid = (se.a + se.b) * 0.5f;
    e.landward = normalized(hexToPixel(layout, land) - mid);
    return e;
}

} // namespace

float sharedEdgeEpsilon(const HexLayout& layout) {
    return std::max(0.01f * layout.size, 1e-3f);
}

std::optional<SharedEdge> sharedEdge(const HexLayout& layout, const HexCoord& a, const HexCoord& b, float eps) {
    const auto ca = hexCorners(layout, hexToPixel(layout, a));
    const auto cb = hexCorners(layout, hexToPixel(layout, b));

    std::vector<Vec2f> shared;
    for (const Vec2f& p : ca) {
        for (const Vec2f& q : cb) {
            if (distance(p, q) >= eps) continue;
            const bool dup = std::any_of(shared.begin(), shared.end(),
                                         [&](const Vec2f& s) { return distance(s, p) < eps; });
            if (!dup) shared.push_back(p);
        }
    }

    if (shared.size() != 2) return std::nullopt;
    return SharedEdge{ shared[0], shared[1] };
}

std::vector<CoastEdge> collectCoastEdges(const HexMap& map, const std::vector<const Cell*>& visible,
                                         bool includeMapEdges) {
    const HexLayout& layout = map.layout();
    const float eps = sharedEdgeEpsilon(layout);

    std::unordered_set<uint64_t> visibleKeys;
    visibleKeys.reserve(visible.size() * 2);
    for (const Cell* c : visible) visibleKeys.insert(hexKey(c->coord));

    std::vector<CoastEdge> out;
    for (const Cell* c : visible) {
        const uint64_t key = hexKey(c->coord);
        const bool water = c->terrain.water;

        for (const HexCoord& n : hexNeighbors(c->coord)) {
            const Cell* nc = map.find(n);
            if (nc) {
                if (nc->terrain.water == water) continue;
                const uint64_t nkey = hexKey(n);
                // A visible neighbor reports the pair itself when its key is smaller.
                if (visibleKeys.count(nkey) != 0 && nkey < key) continue;

                const HexCoord& land = water ? n : c->coord;
                const HexCoord& sea = water ? c->coord : n;
                if (auto se = sharedEdge(layout, land, sea, eps)) out.push_back(makeEdge(layout, land, sea, false, *se));
            } else if (includeMapEdges && !water) {
                if (auto se = sharedEdge(layout, c->coord, n, eps)) out.push_back(makeEdge(layout, c->coord, n, true, *se));
            }
        }
    }
    return out;
}

bool borderFlipNeeded(const SharedEdge& edge, const Vec2f& landward) {
    const Vec2f d = edge.b - edge.a;
    const Vec2f n{ -d.y, d.x };
    return dot(landward, n) > 0.0f;
}

EdgeTiling tileEdge(const CoastEdge& e, float thickness, int imgW, int imgH) {
    EdgeTiling t;
    const Vec2f d = e.edge.b - e.edge.a;
    const float len = length(d);
    if (len <= 1e-6f || thickness <= 0.0f || imgW <= 0 || imgH <= 0) return t;

    const float naturalW = thickness * static_cast<float>(imgW) / static_cast<float>(imgH);
    t.count = std::max(1, static_cast<int>(std::lround(len / naturalW)));
    t.tileW = len / static_cast<float>(t.count);
    t.tileH = thickness * (t.tileW / naturalW);
    t.angleDeg = std::atan2(d.y, d.x) * kRadToDeg;
    t.flipV = borderFlipNeeded(e.edge, e.landward);

    const Vec2f dir = d * (1.0f / len);
    t.centers.reserve(static_cast<size_t>(t.count));
    for (int i = 0; i < t.count; ++i) {
        t.centers.push_back(e.edge.a + dir * (t.tileW * (static_cast<float>(i) + 0.5f)));
    }
    return t;
}

float maxPairwiseAngleDeg(const std::vector<Vec2f>& dirs) {
    float best = 0.0f;
    for (size_t i = 0; i < dirs.size(); ++i) {
        for (size_t j = i + 1; j < dirs.size(); ++j) {
            const float c = clampf(dot(normalized(dirs[i]), normalized(dirs[j])), -1.0f, 1.0f);
            best = std::max(best, std::acos(c) * kRadToDeg);
        }
    }
    return best;
}

std::vector<CornerJoin> findCornerJoins(const std::vector<CoastEdge>& edges, const std::vector<float>& tileHeights,
                                        float mergeEps) {
    VertexGrid grid(mergeEps);

    for (size_t i = 0; i < edges.size(); ++i) {
        const CoastEdge& e = edges[i];
        const float h = (i < tileHeights.size()) ? tileHeights[i] : 0.0f;

        Vertex& va = grid.at(e.edge.a, mergeEps);
        va.dirs.push_back(e.edge.b - e.edge.a);
        va.landSum = va.landSum + e.landward;
        va.heightSum += h;

        Vertex& vb = grid.at(e.edge.b, mergeEps);
        vb.dirs.push_back(e.edge.a - e.edge.b);
        vb.landSum = vb.landSum + e.landward;
        vb.heightSum += h;
    }

    std::vector<CornerJoin> out;
    for (const Vertex& v : grid.vertices()) {
        if (v.dirs.size() < 2) continue;

        CornerJoin j;
        j.pos = v.pos;
        j.edgeCount = static_cast<int>(v.dirs.size());
        j.maxAngleDeg = maxPairwiseAngleDeg(v.dirs);
        j.kind = (j.maxAngleDeg < NARROW_CORNER_MAX_DEG) ? CornerKind::Narrow : CornerKind::Wide;
        j.size = v.heightSum / static_cast<float>(v.dirs.size());

        const Vec2f land = normalized(v.landSum);
        j.rotationDeg = std::atan2(land.x, -land.y) * kRadToDeg;
        out.push_back(j);
    }
    return out;
}
