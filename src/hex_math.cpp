#include "hex_math.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace {

constexpr double kSqrt3 = 1.7320508075688772;
constexpr double kPi = 3.14159265358979323846;

// Floor division by two that also rounds negative odd values down.
inline int floorHalf(int v) {
    return (v - (v & 1)) / 2;
}

} // namespace

const std::array<HexCoord, HEX_DIRECTIONS>& hexDirections() {
    static const std::array<HexCoord, HEX_DIRECTIONS> dirs = { {
        { +1,  0 }, // E
        { +1, -1 }, // NE
        {  0, -1 }, // NW
        { -1,  0 }, // W
        { -1, +1 }, // SW
        {  0, +1 }, // SE
    } };
    return dirs;
}

HexCoord hexNeighbor(const HexCoord& h, int direction) {
    const int d = ((direction % HEX_DIRECTIONS) + HEX_DIRECTIONS) % HEX_DIRECTIONS;
    return h + hexDirections()[static_cast<size_t>(d)];
}

std::array<HexCoord, HEX_DIRECTIONS> hexNeighbors(const HexCoord& h) {
    std::array<HexCoord, HEX_DIRECTIONS> out{};
    for (int i = 0; i < HEX_DIRECTIONS; ++i) out[static_cast<size_t>(i)] = hexNeighbor(h, i);
    return out;
}

Vec2f hexToPixel(const HexLayout& layout, const HexCoord& h) {
    const double size = layout.size;
    double x = 0.0;
    double y = 0.0;
    if (layout.orientation == HexOrientation::Pointy) {
        x = size * (kSqrt3 * h.q + kSqrt3 / 2.0 * h.r);
        y = size * (1.5 * h.r);
    } else {
        x = size * (1.5 * h.q);
        y = size * (kSqrt3 / 2.0 * h.q + kSqrt3 * h.r);
    }
    return { static_cast<float>(x), static_cast<float>(y) };
}

void pixelToFractionalHex(const HexLayout& layout, const Vec2f& p, double& q, double& r) {
    const double size = layout.size > 0.0f ? layout.size : 1.0;
    const double x = p.x;
    const double y = p.y;
    if (layout.orientation == HexOrientation::Pointy) {
        q = (kSqrt3 / 3.0 * x - 1.0 / 3.0 * y) / size;
        r = (2.0 / 3.0 * y) / size;
    } else {
        q = (2.0 / 3.0 * x) / size;
        r = (-1.0 / 3.0 * x + kSqrt3 / 3.0 * y) / size;
    }
}

HexCoord pixelToHex(const HexLayout& layout, const Vec2f& p) {
    double q = 0.0;
    double r = 0.0;
    pixelToFractionalHex(layout, p, q, r);
    return roundHex(q, r);
}

HexCoord roundHex(double q, double r) {
    const double s = -q - r;

    double rq = std::round(q);
    double rr = std::round(r);
    const double rs = std::round(s);

    const double qDiff = std::abs(rq - q);
    const double rDiff = std::abs(rr - r);
    const double sDiff = std::abs(rs - s);

    // Recompute whichever coordinate carried the largest rounding error.
    if (qDiff > rDiff && qDiff > sDiff) {
        rq = -rr - rs;
    } else if (rDiff > sDiff) {
        rr = -rq - rs;
    }

    return { static_cast<int>(rq), static_cast<int>(rr) };
}

std::array<Vec2f, 6> hexCorners(const HexLayout& layout, const Vec2f& center) {
    std::array<Vec2f, 6> out{};
    const double startDeg = (layout.orientation == HexOrientation::Pointy) ? 30.0 : 0.0;
    for (int i = 0; i < 6; ++i) {
        const double a = (kPi / 180.0) * (60.0 * i + startDeg);
        out[static_cast<size_t>(i)] = {
            static_cast<float>(center.x + layout.size * std::cos(a)),
            static_cast<float>(center.y + layout.size * std::sin(a)),
        };
    }
    return out;
}

OffsetCoord axialToOffset(const HexCoord& h, HexOrientation orientation) {
    if (orientation == HexOrientation::Pointy) {
        return { h.q + floorHalf(h.r), h.r };
    }
    return { h.q, h.r + floorHalf(h.q) };
}

HexCoord offsetToAxial(const OffsetCoord& o, HexOrientation orientation) {
    if (orientation == HexOrientation::Pointy) {
        return { o.col - floorHalf(o.row), o.row };
    }
    return { o.col, o.row - floorHalf(o.col) };
}

int hexDistance(const HexCoord& a, const HexCoord& b) {
    return (std::abs(a.q - b.q) + std::abs(a.r - b.r) + std::abs(a.s() - b.s())) / 2;
}

std::vector<HexCoord> hexRing(const HexCoord& center, int radius) {
    std::vector<HexCoord> out;
    if (radius < 0) return out;
    if (radius == 0) {
        out.push_back(center);
        return out;
    }

    out.reserve(static_cast<size_t>(6 * radius));
    const auto& dirs = hexDirections();

    // Start `radius` steps to the SW, then walk each of the six sides.
    HexCoord h = { center.q + dirs[4].q * radius, center.r + dirs[4].r * radius };
    for (int side = 0; side < 6; ++side) {
        for (int step = 0; step < radius; ++step) {
            out.push_back(h);
            h = h + dirs[static_cast<size_t>(side)];
        }
    }
    return out;
}

std::vector<HexCoord> hexRange(const HexCoord& center, int radius) {
    std::vector<HexCoord> out;
    if (radius < 0) return out;
    out.reserve(static_cast<size_t>(3 * radius * (radius + 1) + 1));
    for (int dq = -radius; dq <= radius; ++dq) {
        const int r1 = std::max(-radius, -dq - radius);
        const int r2 = std::min(radius, -dq + radius);
        for (int dr = r1; dr <= r2; ++dr) {
            out.push_back({ center.q + dq, center.r + dr });
        }
    }
    return out;
}

std::vector<HexCoord> hexLine(const HexCoord& a, const HexCoord& b) {
    const int n = hexDistance(a, b);
    std::vector<HexCoord> out;
    out.reserve(static_cast<size_t>(n + 1));
    // Nudge off exact corners so ties round consistently.
    const double eq = 1e-6;
    const double er = 2e-6;
    for (int i = 0; i <= n; ++i) {
        const double t = (n == 0) ? 0.0 : static_cast<double>(i) / static_cast<double>(n);
        const double q = (a.q + eq) * (1.0 - t) + (b.q + eq) * t;
        const double r = (a.r + er) * (1.0 - t) + (b.r + er) * t;
        out.push_back(roundHex(q, r));
    }
    return out;
}

Vec2f hexHalfExtents(const HexLayout& layout) {
    const float s = layout.size;
    const float halfShort = static_cast<float>(kSqrt3 / 2.0) * s;
    if (layout.orientation == HexOrientation::Pointy) return { halfShort, s };
    return { s, halfShort };
}
