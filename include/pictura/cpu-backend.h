#pragma once

#include <pictura/brush-textures.h>
#include <pictura/compositor.h>
#include <pictura/rasterizer.h>
#include <pictura/surface.h>
#include <memory>
#include <vector>

namespace pictura {

//=============================================================================
// CpuSurface - premultiplied RGBA8 pixels in memory
//=============================================================================

class CpuSurface : public Surface {
public:
    using Ptr = std::shared_ptr<CpuSurface>;

    static Ptr create(uint32_t width, uint32_t height);

    uint32_t width() const override { return _width; }
    uint32_t height() const override { return _height; }

    Result<void> clear(Rgba color) override;
    Result<void> copyFrom(const Surface& src) override;
    Result<void> drawOver(const Surface& src, float opacity) override;
    Result<std::vector<uint8_t>> readPixels() override;
    Result<Rgba> pixel(int x, int y) override;
    void free() override;

    uint8_t* data() { return _pixels.data(); }
    const uint8_t* data() const { return _pixels.data(); }

    Rgba at(uint32_t x, uint32_t y) const {
        const uint8_t* p = &_pixels[(static_cast<size_t>(y) * _width + x) * 4];
        return Rgba{p[0], p[1], p[2], p[3]};
    }
    void set(uint32_t x, uint32_t y, Rgba c) {
        uint8_t* p = &_pixels[(static_cast<size_t>(y) * _width + x) * 4];
        p[0] = c.r;
        p[1] = c.g;
        p[2] = c.b;
        p[3] = c.a;
    }

private:
    CpuSurface(uint32_t width, uint32_t height);

    uint32_t _width;
    uint32_t _height;
    std::vector<uint8_t> _pixels;
};

//=============================================================================
// CpuRasterizer - float coverage mask
//=============================================================================

class CpuRasterizer : public Rasterizer {
public:
    using Ptr = std::shared_ptr<CpuRasterizer>;

    static Ptr create(uint32_t width, uint32_t height,
                      std::shared_ptr<const std::vector<BrushImage>> brushImages);

    RasterizerFormat format() const override { return RasterizerFormat::Float; }

    Result<void> drawWithColor(Surface& target, Rgba color, float opacity,
                               BlendMode mode, const Rect& clip) override;
    Result<float> getPixel(int x, int y) override;
    void free() override;

    float maskAt(uint32_t x, uint32_t y) const { return _mask[static_cast<size_t>(y) * _width + x]; }

protected:
    Result<void> clearMask() override;
    Result<void> accumulatePrimitives(const std::vector<MaskPrimitive>& prims, int textureIndex) override;
    bool hasBrushTexture(int index) const override;

private:
    CpuRasterizer(uint32_t width, uint32_t height,
                  std::shared_ptr<const std::vector<BrushImage>> brushImages);

    std::vector<float> _mask;
    std::shared_ptr<const std::vector<BrushImage>> _brushImages;
};

//=============================================================================
// CpuCompositor
//=============================================================================

class CpuCompositor : public Compositor {
public:
    using Ptr = std::shared_ptr<CpuCompositor>;

    static Ptr create(uint32_t width, uint32_t height);

    Result<void> composite(const std::vector<CompositeLayer>& layers,
                           const std::optional<LiveOverlay>& overlay) override;
    Surface& display() override { return *_display; }
    void free() override;

private:
    explicit CpuCompositor(CpuSurface::Ptr display);

    CpuSurface::Ptr _display;
};

} // namespace pictura
