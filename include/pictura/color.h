#pragma once

#include <pictura/types.h>
#include <glm/glm.hpp>
#include <cmath>

namespace pictura {
namespace color {

inline float toUnit(uint8_t v) { return static_cast<float>(v) / 255.0f; }

inline uint8_t toByte(float v) {
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

// Straight 8-bit -> premultiplied float
inline glm::vec4 premultiply(Rgba c) {
    float a = toUnit(c.a);
    return glm::vec4(toUnit(c.r) * a, toUnit(c.g) * a, toUnit(c.b) * a, a);
}

// Premultiplied 8-bit -> straight 8-bit
inline Rgba unpremultiply(Rgba p) {
    if (p.a == 0) return Rgba{0, 0, 0, 0};
    if (p.a == 255) return p;
    float a = toUnit(p.a);
    return Rgba{toByte(toUnit(p.r) / a), toByte(toUnit(p.g) / a), toByte(toUnit(p.b) / a), p.a};
}

inline Rgba toBytes(const glm::vec4& premul) {
    return Rgba{toByte(premul.r), toByte(premul.g), toByte(premul.b), toByte(premul.a)};
}

inline glm::vec4 toFloat(Rgba premul) {
    return glm::vec4(toUnit(premul.r), toUnit(premul.g), toUnit(premul.b), toUnit(premul.a));
}

// Source-over of two straight colors, src on top of dst
inline Rgba blend(Rgba dst, Rgba src) {
    glm::vec4 d = premultiply(dst);
    glm::vec4 s = premultiply(src);
    return unpremultiply(toBytes(s + d * (1.0f - s.a)));
}

} // namespace color
} // namespace pictura
