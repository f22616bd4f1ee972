#pragma once

#include <pictura/blend-mode.h>
#include <pictura/rasterizer.h>
#include <pictura/result.hpp>
#include <pictura/surface.h>
#include <pictura/types.h>
#include <memory>
#include <optional>
#include <vector>

namespace pictura {

// One visible buffer in bottom to top order
struct CompositeLayer {
    Surface* surface = nullptr;
    bool hasAlpha = true;
};

// In-progress event blended into one layer before that layer is composited
struct LiveOverlay {
    size_t layer = 0;  // index into the layer list
    Rasterizer* rasterizer = nullptr;
    Rgba color;
    float opacity = 1.0f;
    BlendMode mode = BlendMode::Normal;
    Rect clip;
};

/**
 * Compositor blends the visible buffer stack into the display surface.
 */
class Compositor {
public:
    using Ptr = std::shared_ptr<Compositor>;

    virtual ~Compositor() = default;

    /**
     * Replace the display contents with the source-over composite of layers.
     *
     * @param layers Visible buffers, bottom first
     * @param overlay Live event drawn into one of the layers, if any
     */
    virtual Result<void> composite(const std::vector<CompositeLayer>& layers,
                                   const std::optional<LiveOverlay>& overlay) = 0;

    virtual Surface& display() = 0;

    // Number of compositing programs built so far
    virtual size_t programCount() const { return 0; }

    virtual void free() = 0;
};

} // namespace pictura
