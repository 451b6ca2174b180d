#pragma once

#include "camera.hpp"
#include "hex_map.hpp"

#include <cstdint>
#include <vector>

// Everything the visible set depends on.
struct CullKey {
    float camX = 0.0f;
    float camY = 0.0f;
    float zoom = 1.0f;
    int viewW = 0;
    int viewH = 0;
    float cellSize = 0.0f;
    uint64_t mapRevision = 0;
};

CullKey makeCullKey(const HexMap& map, const Camera& cam);

// The one invalidation predicate. A cached set computed for `cached` may be
// reused for `now` while the camera has moved less than one cell in world units,
// the zoom is unchanged (within a small epsilon) and the viewport/map are the same.
bool cullKeyStale(const CullKey& cached, const CullKey& now);

// Linear scan: cells whose center lies inside the camera's world rectangle grown
// by `marginWorld` on every side (inclusive).
std::vector<const Cell*> collectVisibleCells(const HexMap& map, const Camera& cam, float marginWorld);

// Margin used on recompute: MARGIN_CELLS cell sizes plus slack for the zoom drift
// cullKeyStale tolerates, so no cell overlapping a still-valid view is missed.
float cullMarginWorld(const HexMap& map, const Camera& cam);

// Memoized visible set with two states: Valid (reuse) and Stale (recompute).
class ViewportCuller {
public:
    enum class State : uint8_t {
        Stale = 0,
        Valid,
    };

    // Margin in cell sizes added around the view when recomputing.
    static constexpr float MARGIN_CELLS = 2.0f;

    const std::vector<const Cell*>& visibleCells(const HexMap& map, const Camera& cam);

    // State the cache would be in for this map/camera, without recomputing.
    State stateFor(const HexMap& map, const Camera& cam) const;

    void invalidate();

    // Number of recomputations since construction (profiling, tests).
    int recomputeCount() const { return recomputes_; }

private:
    bool hasCache_ = false;
    CullKey key_;
    std::vector<const Cell*> cells_;
    int recomputes_ = 0;
};
