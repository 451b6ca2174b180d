#pragma once
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

// Continuous world/screen-space point. Hex geometry, camera math and the
// coastline stitcher all work in this type so SDL's float APIs take it directly.
struct Vec2f {
    float x = 0.0f;
    float y = 0.0f;
};

inline Vec2f operator+(const Vec2f& a, const Vec2f& b) { return { a.x + b.x, a.y + b.y }; }
inline Vec2f operator-(const Vec2f& a, const Vec2f& b) { return { a.x - b.x, a.y - b.y }; }
inline Vec2f operator*(const Vec2f& a, float s) { return { a.x * s, a.y * s }; }

inline float dot(const Vec2f& a, const Vec2f& b) { return a.x * b.x + a.y * b.y; }
inline float length(const Vec2f& v) { return std::sqrt(v.x * v.x + v.y * v.y); }
inline float distance(const Vec2f& a, const Vec2f& b) { return length(a - b); }

inline Vec2f normalized(const Vec2f& v) {
    const float len = length(v);
    if (len <= 1e-6f) return { 0.0f, 0.0f };
    return { v.x / len, v.y / len };
}

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}
inline bool operator!=(const Color& a, const Color& b) { return !(a == b); }

inline Color rgb(uint32_t hex) {
    return { static_cast<uint8_t>((hex >> 16) & 0xFFu),
             static_cast<uint8_t>((hex >> 8) & 0xFFu),
             static_cast<uint8_t>(hex & 0xFFu),
             255 };
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline float clampf(float v, float lo, float hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

// Accepts "rrggbb", "#rrggbb", "0xrrggbb" or "r,g,b". Returns false on anything else.
bool parseColor(const std::string& text, Color& out);

// Lowercase "rrggbb" (no prefix), the form the INI files use.
std::string colorToHex(const Color& c);
