#pragma once

#include <pictura/blend-mode.h>
#include <pictura/mask-primitive.h>
#include <pictura/result.hpp>
#include <pictura/surface.h>
#include <pictura/types.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace pictura {

class PictureEvent;

// Accumulation precision of a rasterizer mask
enum class RasterizerFormat {
    Float,    // floating point texture or array
    Fixed16,  // 16-bit fixed point packed into two 8-bit channels
};

// Resume point of a partially drawn event
struct DrawProgress {
    size_t coordIndex = 0;
    float carry = 0.0f;  // distance walked since the last dab
    bool started = false;
};

/**
 * Rasterizer turns one event into a single channel coverage mask.
 *
 * The mask accumulates primitives as a <- a + (1 - a) * v, so any split of
 * an event into partial draws produces the same mask as one full draw.
 * Every implementation must produce the same mask within tolerance.
 */
class Rasterizer {
public:
    using Ptr = std::shared_ptr<Rasterizer>;

    virtual ~Rasterizer() = default;

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    virtual RasterizerFormat format() const = 0;

    // Clear the whole mask and forget the event being drawn
    Result<void> clear();

    // Restrict drawing to rect, clamped to the mask
    void setClip(const Rect& rect);
    const Rect& clip() const { return _clip; }
    Rect fullRect() const { return Rect(0, static_cast<float>(_width), 0, static_cast<float>(_height)); }

    // Draw ev, continuing from an earlier partial draw of the same event
    Result<void> drawEvent(const PictureEvent& ev, std::optional<size_t> untilCoord = std::nullopt);

    // Identity of the event whose partial state the mask holds
    const PictureEvent* drawingEvent() const { return _drawEvent; }
    Result<void> beginEvent(const PictureEvent* ev);

    // Drop the drawn event's identity; the next beginEvent clears the mask
    void forgetEvent() {
        _drawEvent = nullptr;
        _progress = DrawProgress{};
    }
    DrawProgress& progress() { return _progress; }

    /**
     * Accumulate primitives inside the clip.
     *
     * @param prims Primitives in bitmap coordinates
     * @param textureIndex Brush texture used by textured dabs, -1 for none
     */
    Result<void> drawPrimitives(const std::vector<MaskPrimitive>& prims, int textureIndex);

    /**
     * Blend color through the mask into target inside clip.
     *
     * @param target Surface of the same backend
     * @param color Straight color, alpha ignored
     * @param opacity Multiplies the mask
     */
    virtual Result<void> drawWithColor(Surface& target, Rgba color, float opacity,
                                       BlendMode mode, const Rect& clip) = 0;

    // Mask value at one pixel
    virtual Result<float> getPixel(int x, int y) = 0;

    /**
     * Draw a known pattern and compare it against the reference math.
     * Run once right after construction.
     *
     * @return false if the backend produced wrong values
     */
    Result<bool> checkSanity();

    virtual void free() = 0;

protected:
    Rasterizer(uint32_t width, uint32_t height);

    virtual Result<void> clearMask() = 0;
    virtual Result<void> accumulatePrimitives(const std::vector<MaskPrimitive>& prims, int textureIndex) = 0;
    virtual bool hasBrushTexture(int index) const = 0;

    uint32_t _width;
    uint32_t _height;
    Rect _clip;

private:
    const PictureEvent* _drawEvent = nullptr;
    DrawProgress _progress;
};

} // namespace pictura
