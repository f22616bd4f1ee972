#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace pictura {

using Vec2 = glm::vec2;

// Straight (unpremultiplied) 8-bit color
struct Rgba {
    uint8_t r = 0, g = 0, b = 0, a = 0;

    bool operator==(const Rgba&) const = default;
};

// Axis-aligned rectangle in pixel space, right and bottom exclusive
struct Rect {
    float left = 0, right = 0, top = 0, bottom = 0;

    Rect() = default;
    Rect(float l, float r, float t, float b) : left(l), right(r), top(t), bottom(b) {}

    static Rect empty() { return Rect(0, 0, 0, 0); }

    float width() const { return right - left; }
    float height() const { return bottom - top; }
    bool isEmpty() const { return right <= left || bottom <= top; }

    void intersectRect(const Rect& o) {
        left = std::max(left, o.left);
        right = std::min(right, o.right);
        top = std::max(top, o.top);
        bottom = std::min(bottom, o.bottom);
        if (isEmpty()) {
            *this = empty();
        }
    }

    void unionRect(const Rect& o) {
        if (o.isEmpty()) return;
        if (isEmpty()) {
            *this = o;
            return;
        }
        left = std::min(left, o.left);
        right = std::max(right, o.right);
        top = std::min(top, o.top);
        bottom = std::max(bottom, o.bottom);
    }

    void unionCircle(Vec2 center, float radius) {
        unionRect(Rect(center.x - radius, center.x + radius,
                       center.y - radius, center.y + radius));
    }

    bool containsPoint(Vec2 p) const {
        return p.x >= left && p.x < right && p.y >= top && p.y < bottom;
    }

    // Smallest integer rect that covers every pixel touched by this one
    Rect integerBounds() const {
        if (isEmpty()) return empty();
        return Rect(std::floor(left), std::ceil(right), std::floor(top), std::ceil(bottom));
    }

    bool operator==(const Rect&) const = default;
};

} // namespace pictura
