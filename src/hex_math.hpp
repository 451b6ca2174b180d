#pragma once

#include "common.hpp"

#include <array>
#include <cstdint>
#include <vector>

// Pure hex coordinate math. Nothing here knows which cells exist: results may
// lie outside any map and validity is up to HexMap.
//
// Axial coordinates (q, r); the third cube coordinate is s = -q - r.

enum class HexOrientation : uint8_t {
    Pointy = 0, // corners at 30 + 60*i degrees, rows offset ("odd-r")
    Flat,       // corners at 60*i degrees, columns offset ("odd-q")
};

struct HexCoord {
    int q = 0;
    int r = 0;

    int s() const { return -q - r; }
};

inline bool operator==(const HexCoord& a, const HexCoord& b) { return a.q == b.q && a.r == b.r; }
inline bool operator!=(const HexCoord& a, const HexCoord& b) { return !(a == b); }
inline HexCoord operator+(const HexCoord& a, const HexCoord& b) { return { a.q + b.q, a.r + b.r }; }

struct OffsetCoord {
    int col = 0;
    int row = 0;
};

// Cell size (center to corner) and orientation, chosen once per grid.
struct HexLayout {
    HexOrientation orientation = HexOrientation::Pointy;
    float size = 30.0f;
};

constexpr int HEX_DIRECTIONS = 6;

// Canonical neighbor order: E, NE, NW, W, SW, SE.
const std::array<HexCoord, HEX_DIRECTIONS>& hexDirections();
HexCoord hexNeighbor(const HexCoord& h, int direction);
std::array<HexCoord, HEX_DIRECTIONS> hexNeighbors(const HexCoord& h);

Vec2f hexToPixel(const HexLayout& layout, const HexCoord& h);

// Continuous position -> fractional axial coordinates (no rounding).
void pixelToFractionalHex(const HexLayout& layout, const Vec2f& p, double& q, double& r);
// Continuous position -> the hex containing it.
HexCoord pixelToHex(const HexLayout& layout, const Vec2f& p);

// Cube rounding: snaps fractional axial coordinates to the nearest hex.
HexCoord roundHex(double q, double r);

std::array<Vec2f, 6> hexCorners(const HexLayout& layout, const Vec2f& center);

OffsetCoord axialToOffset(const HexCoord& h, HexOrientation orientation);
HexCoord offsetToAxial(const OffsetCoord& o, HexOrientation orientation);

int hexDistance(const HexCoord& a, const HexCoord& b);

// Cells at exactly `radius` steps (radius 0 -> the center only).
std::vector<HexCoord> hexRing(const HexCoord& center, int radius);
// Filled range: every cell within `radius` steps, center included.
std::vector<HexCoord> hexRange(const HexCoord& center, int radius);
// Rounded line from a to b, both ends included.
std::vector<HexCoord> hexLine(const HexCoord& a, const HexCoord& b);

// Half extents of a cell's axis-aligned bounding box.
Vec2f hexHalfExtents(const HexLayout& layout);
