#include "terrain_sprites.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr float kPi = 3.14159265358979323846f;

SpritePixels makeSprite(int w, int h, Color fill) {
    SpritePixels s;
    s.w = w; s.h = h;
    s.px.assign(static_cast<size_t>(w * h), fill);
    return s;
}

// Keeps the stronger of the existing and new alpha; overlays are single-color ink.
void inkPx(SpritePixels& s, int x, int y, Color c) {
    if (x < 0 || y < 0 || x >= s.w || y >= s.h) return;
    Color& dst = s.at(x, y);
    if (dst.a < c.a) dst = c;
}

void stamp(SpritePixels& s, float cx, float cy, float r, Color c) {
    const int x0 = static_cast<int>(std::floor(cx - r));
    const int x1 = static_cast<int>(std::ceil(cx + r));
    const int y0 = static_cast<int>(std::floor(cy - r));
    const int y1 = static_cast<int>(std::ceil(cy + r));
    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            const float dx = (static_cast<float>(x) + 0.5f) - cx;
            const float dy = (static_cast<float>(y) + 0.5f) - cy;
            if (dx * dx + dy * dy <= r * r) inkPx(s, x, y, c);
        }
    }
}

void thickLine(SpritePixels& s, float x0, float y0, float x1, float y1, float width, Color c) {
    const float len = std::sqrt((x1 - x0) * (x1 - x0) + (y1 - y0) * (y1 - y0));
    const int steps = std::max(1, static_cast<int>(std::ceil(len * 2.0f)));
    for (int i = 0; i <= steps; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(steps);
        stamp(s, x0 + (x1 - x0) * t, y0 + (y1 - y0) * t, width * 0.5f, c);
    }
}

// Upper half of a circle (a rolling hill silhouette).
void hillArc(SpritePixels& s, float cx, float cy, float r, float width, Color c) {
    const int steps = std::max(8, static_cast<int>(std::ceil(r * kPi * 2.0f)));
    for (int i = 0; i <= steps; ++i) {
        const float a = kPi + kPi * static_cast<float>(i) / static_cast<float>(steps);
        stamp(s, cx + std::cos(a) * r, cy + std::sin(a) * r, width * 0.5f, c);
    }
}

bool insideTriangle(float px, float py, float ax, float ay, float bx, float by, float cx, float cy) {
    const float d1 = (px - bx) * (ay - by) - (ax - bx) * (py - by);
    const float d2 = (px - cx) * (by - cy) - (bx - cx) * (py - cy);
    const float d3 = (px - ax) * (cy - ay) - (cx - ax) * (py - ay);
    const bool hasNeg = (d1 < 0) || (d2 < 0) || (d3 < 0);
    const bool hasPos = (d1 > 0) || (d2 > 0) || (d3 > 0);
    return !(hasNeg && hasPos);
}

void fillTriangle(SpritePixels& s, float ax, float ay, float bx, float by, float cx, float cy, Color c) {
    const int x0 = std::max(0, static_cast<int>(std::floor(std::min({ ax, bx, cx }))));
    const int x1 = std::min(s.w - 1, static_cast<int>(std::ceil(std::max({ ax, bx, cx }))));
    const int y0 = std::max(0, static_cast<int>(std::floor(std::min({ ay, by, cy }))));
    const int y1 = std::min(s.h - 1, static_cast<int>(std::ceil(std::max({ ay, by, cy }))));
    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            if (insideTriangle(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f, ax, ay, bx, by, cx, cy)) {
                inkPx(s, x, y, c);
            }
        }
    }
}

} // namespace

SpritePixels generateHillOverlay(int pxSize) {
    const int n = std::clamp(pxSize, 16, 256);
    SpritePixels s = makeSprite(n, n, { 0, 0, 0, 0 });

    const float radius = static_cast<float>(n) * 0.5f;
    const float center = radius;
    const float arcR = radius * 0.35f;
    const float spacing = radius * 0.5f;
    const float width = std::max(1.0f, radius * 0.05f);
    const Color ink{ 0, 0, 0, 51 };

    // Two staggered rows of three hills.
    for (int row = 0; row < 2; ++row) {
        const float y = center + (row == 0 ? -0.3f : 0.3f) * radius;
        const float offset = (row == 0) ? 0.0f : spacing * 0.5f;
        for (int i = 0; i < 3; ++i) {
            const float x = center - spacing + static_cast<float>(i) * spacing + offset;
            hillArc(s, x, y, arcR, width, ink);
        }
    }
    return s;
}

SpritePixels generateMountainOverlay(int pxSize) {
    const int n = std::clamp(pxSize, 16, 256);
    SpritePixels s = makeSprite(n, n, { 0, 0, 0, 0 });

    const float radius = static_cast<float>(n) * 0.5f;
    const float peak = radius * 0.4f;
    const float width = std::max(1.0f, radius * 0.05f);
    const Color fill{ 0, 0, 0, 25 };
    const Color ink{ 0, 0, 0, 76 };

    const float pos[3][2] = {
        { 0.0f, -peak * 0.3f },
        { -peak * 0.6f, peak * 0.4f },
        { peak * 0.6f, peak * 0.4f },
    };

    for (const auto& p : pos) {
        const float cx = radius + p[0];
        const float cy = radius + p[1];
        const float lx = cx - peak * 0.4f, ly = cy + peak * 0.5f;
        const float tx = cx,               ty = cy - peak * 0.5f;
        const float rx = cx + peak * 0.4f, ry = cy + peak * 0.5f;

        fillTriangle(s, lx, ly, tx, ty, rx, ry, fill);
        thickLine(s, lx, ly, tx, ty, width, ink);
        thickLine(s, tx, ty, rx, ry, width, ink);
        thickLine(s, rx, ry, lx, ly, width, ink);
    }
    return s;
}

float spriteCoverage(const SpritePixels& s) {
    if (s.px.empty()) return 0.0f;
    double sum = 0.0;
    for (const Color& c : s.px) sum += static_cast<double>(c.a) / 255.0;
    return static_cast<float>(sum / static_cast<double>(s.px.size()));
}
