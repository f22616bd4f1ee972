#pragma once

#include <pictura/result.hpp>
#include <pictura/types.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace pictura {

/**
 * Surface is the pixel store of one buffer, snapshot or display image.
 *
 * Pixels are premultiplied RGBA8. CpuSurface keeps them in memory,
 * GpuSurface in a pair of ping-ponged textures. A surface is released
 * through free(); calling it again is a no-op.
 */
class Surface {
public:
    using Ptr = std::shared_ptr<Surface>;

    virtual ~Surface() = default;

    virtual uint32_t width() const = 0;
    virtual uint32_t height() const = 0;

    // Fill with a straight color
    virtual Result<void> clear(Rgba color) = 0;

    // Replace contents with another surface of the same backend and size
    virtual Result<void> copyFrom(const Surface& src) = 0;

    // Source-over src scaled by opacity
    virtual Result<void> drawOver(const Surface& src, float opacity) = 0;

    // Premultiplied RGBA8, top row first, width * 4 bytes per row
    virtual Result<std::vector<uint8_t>> readPixels() = 0;

    // Premultiplied pixel, coordinates clamped into the surface
    virtual Result<Rgba> pixel(int x, int y) = 0;

    virtual void free() = 0;
};

} // namespace pictura
