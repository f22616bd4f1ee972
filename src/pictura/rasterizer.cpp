#include <pictura/rasterizer.h>
#include <pictura/picture-event.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace pictura {

namespace {

// Tolerance covers half float and 16-bit fixed point storage
constexpr float SANITY_TOLERANCE = 4.0f / 255.0f;

} // namespace

Rasterizer::Rasterizer(uint32_t width, uint32_t height)
    : _width(width), _height(height), _clip(0, static_cast<float>(width), 0, static_cast<float>(height)) {}

Result<void> Rasterizer::clear() {
    _drawEvent = nullptr;
    _progress = DrawProgress{};
    return clearMask();
}

void Rasterizer::setClip(const Rect& rect) {
    Rect clip = rect.integerBounds();
    clip.intersectRect(fullRect());
    _clip = clip;
}

Result<void> Rasterizer::beginEvent(const PictureEvent* ev) {
    if (auto res = clear(); !res) {
        return res;
    }
    _drawEvent = ev;
    return Ok();
}

Result<void> Rasterizer::drawEvent(const PictureEvent& ev, std::optional<size_t> untilCoord) {
    return ev.updateTo(*this, untilCoord);
}

Result<void> Rasterizer::drawPrimitives(const std::vector<MaskPrimitive>& prims, int textureIndex) {
    if (prims.empty() || _clip.isEmpty()) {
        return Ok();
    }
    if (textureIndex >= 0 && !hasBrushTexture(textureIndex)) {
        ywarn("Rasterizer: brush texture {} missing, drawing round dabs", textureIndex);
        std::vector<MaskPrimitive> plain = prims;
        for (auto& prim : plain) {
            prim.style.z = -1.0f;
        }
        return accumulatePrimitives(plain, -1);
    }
    return accumulatePrimitives(prims, textureIndex);
}

Result<bool> Rasterizer::checkSanity() {
    if (_width == 0 || _height == 0) {
        return Ok(true);
    }
    if (auto res = clear(); !res) {
        return Err<bool>("Sanity check: clear failed", res);
    }
    setClip(fullRect());

    float w = static_cast<float>(_width);
    float h = static_cast<float>(_height);
    std::vector<MaskPrimitive> prims = {
        MaskPrimitive::rect(Rect(0, std::ceil(w * 0.5f), 0, std::ceil(h * 0.5f)), 0.5f),
        MaskPrimitive::dab(Vec2(w * 0.5f, h * 0.5f), std::max(std::min(w, h) * 0.4f, 1.0f), 0.5f, 0.75f, -1),
    };
    if (auto res = drawPrimitives(prims, -1); !res) {
        return Err<bool>("Sanity check: draw failed", res);
    }

    const int probes[][2] = {
        {0, 0},
        {static_cast<int>(_width) / 2, static_cast<int>(_height) / 2},
        {static_cast<int>(_width) - 1, static_cast<int>(_height) - 1},
        {static_cast<int>(_width) / 4, static_cast<int>(_height) / 2},
    };
    bool ok = true;
    for (const auto& probe : probes) {
        Vec2 center(probe[0] + 0.5f, probe[1] + 0.5f);
        float expected = 0.0f;
        for (const auto& prim : prims) {
            expected = pictura::accumulate(expected, primitiveValue(prim, center, nullptr));
        }
        auto actual = getPixel(probe[0], probe[1]);
        if (!actual) {
            return Err<bool>("Sanity check: readback failed", actual);
        }
        if (std::fabs(*actual - expected) > SANITY_TOLERANCE) {
            ywarn("Sanity check: pixel ({}, {}) is {:.4f}, expected {:.4f}",
                  probe[0], probe[1], *actual, expected);
            ok = false;
        }
    }

    if (auto res = clear(); !res) {
        return Err<bool>("Sanity check: clear failed", res);
    }
    return Ok(ok);
}

} // namespace pictura
