#pragma once

#include "common.hpp"

struct ViewBounds {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
};

// 2D pan/zoom camera. (x, y) is a screen-space offset in pixels; the world origin
// sits at the viewport center when the offset is zero.
class Camera {
public:
    float x = 0.0f;
    float y = 0.0f;
    float zoom = 1.0f;
    float minZoom = 0.3f;
    float maxZoom = 3.0f;

    void setViewportSize(int w, int h);
    int viewportWidth() const { return viewW_; }
    int viewportHeight() const { return viewH_; }

    void pan(float dx, float dy);
    void setZoom(float z);
    // Multiplies the zoom, keeping the world point under (screenX, screenY) fixed.
    void zoomBy(float factor, float screenX, float screenY);
    // Same, around the viewport center.
    void zoomBy(float factor);
    void reset();
    // Puts a world point at the viewport center.
    void centerOn(const Vec2f& world);
    // World point currently at the viewport center.
    Vec2f center() const;

    Vec2f screenToWorld(float sx, float sy) const;
    Vec2f worldToScreen(float wx, float wy) const;

    ViewBounds viewBounds() const;
    bool isVisible(const Vec2f& world, float margin = 0.0f) const;

private:
    int viewW_ = 0;
    int viewH_ = 0;
};
