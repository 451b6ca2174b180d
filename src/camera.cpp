#include "camera.hpp"

void Camera::setViewportSize(int w, int h) {
    viewW_ = w < 0 ? 0 : w;
    viewH_ = h < 0 ? 0 : h;
}

void Camera::pan(float dx, float dy) {
    x += dx;
    y += dy;
}

void Camera::setZoom(float z) {
    zoom = clampf(z, minZoom, maxZoom);
}

void Camera::zoomBy(float factor, float screenX, float screenY) {
    const Vec2f before = screenToWorld(screenX, screenY);
    setZoom(zoom * factor);
    const Vec2f after = screenToWorld(screenX, screenY);

    x += (after.x - before.x) * zoom;
    y += (after.y - before.y) * zoom;
}

void Camera::zoomBy(float factor) {
    zoomBy(factor, static_cast<float>(viewW_) * 0.5f, static_cast<float>(viewH_) * 0.5f);
}

void Camera::reset() {
    x = 0.0f;
    y = 0.0f;
    zoom = clampf(1.0f, minZoom, maxZoom);
}

void Camera::centerOn(const Vec2f& world) {
    x = -world.x * zoom;
    y = -world.y * zoom;
}

Vec2f Camera::center() const {
    return { -x / zoom, -y / zoom };
}

Vec2f Camera::screenToWorld(float sx, float sy) const {
    return { (sx - static_cast<float>(viewW_) * 0.5f - x) / zoom,
             (sy - static_cast<float>(viewH_) * 0.5f - y) / zoom };
}

Vec2f Camera::worldToScreen(float wx, float wy) const {
    return { wx * zoom + static_cast<float>(viewW_) * 0.5f + x,
             wy * zoom + static_cast<float>(viewH_) * 0.5f + y };
}

ViewBounds Camera::viewBounds() const {
    const Vec2f tl = screenToWorld(0.0f, 0.0f);
    const Vec2f br = screenToWorld(static_cast<float>(viewW_), static_cast<float>(viewH_));
    return { tl.x, tl.y, br.x, br.y };
}

bool Camera::isVisible(const Vec2f& world, float margin) const {
    const ViewBounds b = viewBounds();
    return world.x >= b.left - margin && world.x <= b.right + margin &&
           world.y >= b.top - margin && world.y <= b.bottom + margin;
}
