#pragma once

#include <pictura/types.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace pictura {

struct BrushImage;

enum class PrimitiveKind : uint32_t {
    Dab = 0,
    Rect = 1,
    Gradient = 2,
};

// One coverage primitive accumulated into a rasterizer mask. The layout
// matches the WGSL `Prim` struct used by the GPU rasterizers.
//
//   Dab:      shape = (cx, cy, radius, softness in pixels)
//   Rect:     shape = (left, top, right, bottom)
//   Gradient: shape = (x0, y0, x1, y1)
//   style  = (alpha, kind, texture index or -1, 0)
//   bounds = (x0, y0, x1, y1) pixel area the primitive may touch
struct MaskPrimitive {
    glm::vec4 shape{0.0f};
    glm::vec4 style{0.0f};
    glm::vec4 bounds{0.0f};

    static MaskPrimitive dab(Vec2 center, float radius, float softness, float alpha, int texture);
    static MaskPrimitive rect(const Rect& r, float alpha);
    static MaskPrimitive gradient(Vec2 p0, Vec2 p1, float alpha, const Rect& area);

    PrimitiveKind kind() const { return static_cast<PrimitiveKind>(static_cast<uint32_t>(style.y)); }
    int texture() const { return static_cast<int>(style.z); }
    Rect area() const { return Rect(bounds.x, bounds.z, bounds.y, bounds.w); }
};

static_assert(sizeof(MaskPrimitive) == 48, "MaskPrimitive must match the WGSL Prim layout");

/**
 * Coverage of one primitive at a pixel center.
 *
 * @param p Pixel center in bitmap coordinates
 * @param texture Brush image for textured dabs, may be null
 * @return Value in [0, 1]
 */
float primitiveValue(const MaskPrimitive& prim, Vec2 p, const BrushImage* texture);

// Mask accumulation shared by every rasterizer: a <- a + (1 - a) * v
inline float accumulate(float a, float v) { return a + (1.0f - a) * v; }

// WGSL for `struct Prim` and `fn primitiveValue(prim: Prim, p: vec2f) -> f32`.
// Expects a `brushTex: texture_2d<f32>` binding and `u.brushTexSize: vec2f`.
std::string maskPrimitiveWgsl();

} // namespace pictura
