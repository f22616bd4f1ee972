#include <pictura/mask-primitive.h>
#include <pictura/brush-textures.h>
#include <algorithm>
#include <cmath>

namespace pictura {

MaskPrimitive MaskPrimitive::dab(Vec2 center, float radius, float softness, float alpha, int texture) {
    MaskPrimitive prim;
    float softPx = std::max(softness * radius, 1.0f);
    prim.shape = glm::vec4(center.x, center.y, radius, softPx);
    prim.style = glm::vec4(alpha, static_cast<float>(PrimitiveKind::Dab),
                           static_cast<float>(texture), 0.0f);
    float reach = radius + 1.0f;
    prim.bounds = glm::vec4(std::floor(center.x - reach), std::floor(center.y - reach),
                            std::ceil(center.x + reach), std::ceil(center.y + reach));
    return prim;
}

MaskPrimitive MaskPrimitive::rect(const Rect& r, float alpha) {
    MaskPrimitive prim;
    prim.shape = glm::vec4(r.left, r.top, r.right, r.bottom);
    prim.style = glm::vec4(alpha, static_cast<float>(PrimitiveKind::Rect), -1.0f, 0.0f);
    Rect b = r.integerBounds();
    prim.bounds = glm::vec4(b.left, b.top, b.right, b.bottom);
    return prim;
}

MaskPrimitive MaskPrimitive::gradient(Vec2 p0, Vec2 p1, float alpha, const Rect& area) {
    MaskPrimitive prim;
    prim.shape = glm::vec4(p0.x, p0.y, p1.x, p1.y);
    prim.style = glm::vec4(alpha, static_cast<float>(PrimitiveKind::Gradient), -1.0f, 0.0f);
    Rect b = area.integerBounds();
    prim.bounds = glm::vec4(b.left, b.top, b.right, b.bottom);
    return prim;
}

float primitiveValue(const MaskPrimitive& prim, Vec2 p, const BrushImage* texture) {
    float alpha = prim.style.x;
    switch (prim.kind()) {
        case PrimitiveKind::Dab: {
            Vec2 c(prim.shape.x, prim.shape.y);
            float r = prim.shape.z;
            if (prim.texture() >= 0 && texture) {
                Vec2 uv = (p - (c - Vec2(r))) / (2.0f * r);
                if (uv.x < 0.0f || uv.y < 0.0f || uv.x > 1.0f || uv.y > 1.0f) return 0.0f;
                return sampleBrushImage(*texture, uv) * alpha;
            }
            float d = glm::distance(p, c);
            return std::clamp((r - d) / std::max(prim.shape.w, 1.0f), 0.0f, 1.0f) * alpha;
        }
        case PrimitiveKind::Rect: {
            bool inside = p.x >= prim.shape.x && p.x < prim.shape.z &&
                          p.y >= prim.shape.y && p.y < prim.shape.w;
            return inside ? alpha : 0.0f;
        }
        case PrimitiveKind::Gradient: {
            Vec2 p0(prim.shape.x, prim.shape.y);
            Vec2 axis = Vec2(prim.shape.z, prim.shape.w) - p0;
            float len2 = glm::dot(axis, axis);
            if (len2 <= 0.0f) return alpha;
            float t = glm::dot(p - p0, axis) / len2;
            return std::clamp(1.0f - t, 0.0f, 1.0f) * alpha;
        }
    }
    return 0.0f;
}

std::string maskPrimitiveWgsl() {
    return R"(
struct Prim {
    shape: vec4f,
    style: vec4f,
    bounds: vec4f,
}

fn brushSample(uv: vec2f) -> f32 {
    let size = vec2i(u.brushTexSize);
    let t = uv * u.brushTexSize - vec2f(0.5);
    let f0 = floor(t);
    let f = t - f0;
    let i0 = vec2i(f0);
    let p0 = clamp(i0, vec2i(0), size - vec2i(1));
    let p1 = clamp(i0 + vec2i(1), vec2i(0), size - vec2i(1));
    let a = textureLoad(brushTex, vec2i(p0.x, p0.y), 0).r;
    let b = textureLoad(brushTex, vec2i(p1.x, p0.y), 0).r;
    let c = textureLoad(brushTex, vec2i(p0.x, p1.y), 0).r;
    let d = textureLoad(brushTex, vec2i(p1.x, p1.y), 0).r;
    let top = a * (1.0 - f.x) + b * f.x;
    let bottom = c * (1.0 - f.x) + d * f.x;
    return top * (1.0 - f.y) + bottom * f.y;
}

fn primitiveValue(prim: Prim, p: vec2f) -> f32 {
    let kind = u32(prim.style.y);
    let alpha = prim.style.x;
    if (kind == 0u) {
        let c = prim.shape.xy;
        let r = prim.shape.z;
        if (prim.style.z >= 0.0) {
            let uv = (p - (c - vec2f(r))) / (2.0 * r);
            if (any(uv < vec2f(0.0)) || any(uv > vec2f(1.0))) {
                return 0.0;
            }
            return brushSample(uv) * alpha;
        }
        let d = distance(p, c);
        return clamp((r - d) / max(prim.shape.w, 1.0), 0.0, 1.0) * alpha;
    }
    if (kind == 1u) {
        let inside = p.x >= prim.shape.x && p.x < prim.shape.z &&
                     p.y >= prim.shape.y && p.y < prim.shape.w;
        return select(0.0, alpha, inside);
    }
    let axis = prim.shape.zw - prim.shape.xy;
    let len2 = dot(axis, axis);
    if (len2 <= 0.0) {
        return alpha;
    }
    let t = dot(p - prim.shape.xy, axis) / len2;
    return clamp(1.0 - t, 0.0, 1.0) * alpha;
}
)";
}

} // namespace pictura
