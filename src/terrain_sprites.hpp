#pragma once
#include "common.hpp"
#include <cstdint>
#include <vector>

struct SpritePixels {
    int w = 0;
    int h = 0;
    std::vector<Color> px; // row-major

    Color& at(int x, int y) { return px[static_cast<size_t>(y * w + x)]; }
    const Color& at(int x, int y) const { return px[static_cast<size_t>(y * w + x)]; }
};

// Procedural decoration overlays (transparent RGBA).
// The sprite covers a cell's bounding box; the renderer maps it onto the hex
// silhouette, so anything outside the hex is clipped for free.
//
// Supported range: 16..256 (values outside are clamped).
SpritePixels generateHillOverlay(int pxSize = 64);
SpritePixels generateMountainOverlay(int pxSize = 64);

// Alpha-weighted coverage in [0,1] (tests, debugging).
float spriteCoverage(const SpritePixels& s);
