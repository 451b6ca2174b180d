#include "viewport_cull.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr float kZoomEpsilon = 1e-4f;

} // namespace

CullKey makeCullKey(const HexMap& map, const Camera& cam) {
    CullKey k;
    k.camX = cam.x;
    k.camY = cam.y;
    k.zoom = cam.zoom;
    k.viewW = cam.viewportWidth();
    k.viewH = cam.viewportHeight();
    k.cellSize = map.layout().size;
    k.mapRevision = map.revision();
    return k;
}

bool cullKeyStale(const CullKey& cached, const CullKey& now) {
    if (cached.mapRevision != now.mapRevision) return true;
    if (cached.cellSize != now.cellSize) return true;
    if (cached.viewW != now.viewW || cached.viewH != now.viewH) return true;
    if (std::fabs(cached.zoom - now.zoom) > kZoomEpsilon) return true;

    // Camera offsets are in screen pixels: one cell is cellSize * zoom of them.
    const float threshold = now.cellSize * now.zoom;
    return std::fabs(now.camX - cached.camX) > threshold || std::fabs(now.camY - cached.camY) > threshold;
}

std::vector<const Cell*> collectVisibleCells(const HexMap& map, const Camera& cam, float marginWorld) {
    const ViewBounds b = cam.viewBounds();
    const float left = b.left - marginWorld;
    const float right = b.right + marginWorld;
    const float top = b.top - marginWorld;
    const float bottom = b.bottom + marginWorld;

    std::vector<const Cell*> out;
    for (const Cell& c : map.cells()) {
        const Vec2f p = hexToPixel(map.layout(), c.coord);
        if (p.x >= left && p.x <= right && p.y >= top && p.y <= bottom) out.push_back(&c);
    }
    return out;
}

float cullMarginWorld(const HexMap& map, const Camera& cam) {
    const float size = map.layout().size;
    const ViewBounds b = cam.viewBounds();
    const float edge = std::max(std::max(std::fabs(b.left), std::fabs(b.right)),
                                std::max(std::fabs(b.top), std::fabs(b.bottom)));

    // Zoom drift within kZoomEpsilon scales view edges and the pan allowance about
    // the world origin; cover the largest such move. The constant absorbs rounding.
    const float zoomLow = std::max(cam.zoom - kZoomEpsilon, kZoomEpsilon);
    const float drift = (edge + size) * kZoomEpsilon / zoomLow;
    return size * ViewportCuller::MARGIN_CELLS + drift + 0.01f;
}

const std::vector<const Cell*>& ViewportCuller::visibleCells(const HexMap& map, const Camera& cam) {
    const CullKey now = makeCullKey(map, cam);
    if (hasCache_ && !cullKeyStale(key_, now)) return cells_;

    cells_ = collectVisibleCells(map, cam, cullMarginWorld(map, cam));
    key_ = now;
    hasCache_ = true;
    ++recomputes_;
    return cells_;
}

ViewportCuller::State ViewportCuller::stateFor(const HexMap& map, const Camera& cam) const {
    if (!hasCache_) return State::Stale;
    return cullKeyStale(key_, makeCullKey(map, cam)) ? State::Stale : State::Valid;
}

void ViewportCuller::invalidate() {
    hasCache_ = false;
    cells_.clear();
}
