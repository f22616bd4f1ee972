#pragma once

#include <pictura/backend.h>
#include <pictura/brush-textures.h>
#include <pictura/compositor.h>
#include <pictura/gpu-context.h>
#include <pictura/gpu-state-manager.h>
#include <pictura/rasterizer.h>
#include <pictura/surface.h>
#include <webgpu/webgpu.h>
#include <memory>
#include <string>
#include <vector>

namespace pictura {

// WGSL `fn decodeMask(m: vec4f) -> f32` for masks stored in format
std::string maskDecodeWgsl(RasterizerFormat format);

//=============================================================================
// GpuSurface - premultiplied RGBA8 texture pair
//
// Passes that read and write the surface render from front into back and
// then swap, so a pass never samples its own render target.
//=============================================================================

class GpuSurface : public Surface {
public:
    using Ptr = std::shared_ptr<GpuSurface>;

    static Result<Ptr> create(GpuContext::Ptr ctx, GpuAllocator::OwnerId owner,
                              uint32_t width, uint32_t height, const std::string& label);

    ~GpuSurface() override;

    uint32_t width() const override { return _width; }
    uint32_t height() const override { return _height; }

    Result<void> clear(Rgba color) override;
    Result<void> copyFrom(const Surface& src) override;
    Result<void> drawOver(const Surface& src, float opacity) override;
    Result<std::vector<uint8_t>> readPixels() override;
    Result<Rgba> pixel(int x, int y) override;
    void free() override;

    WGPUTexture front() const { return _front; }
    WGPUTexture back() const { return _back; }

    // Make back match front, ready for a scissored pass
    Result<void> prepareBack();
    void swap() { std::swap(_front, _back); }

private:
    GpuSurface(GpuContext::Ptr ctx, uint32_t width, uint32_t height);

    Result<void> init(GpuAllocator::OwnerId owner, const std::string& label) noexcept;

    GpuContext::Ptr _ctx;
    uint32_t _width;
    uint32_t _height;
    WGPUTexture _front = nullptr;
    WGPUTexture _back = nullptr;
};

//=============================================================================
// GpuBrushTextures - brush images uploaded as r8unorm textures
//=============================================================================

class GpuBrushTextures {
public:
    using Ptr = std::shared_ptr<GpuBrushTextures>;

    static Result<Ptr> create(GpuContext::Ptr ctx, GpuAllocator::OwnerId owner,
                              const std::vector<BrushImage>& images);

    bool has(int index) const;

    // Texture for index, or a 1x1 placeholder when the draw is not textured
    WGPUTexture texture(int index) const;
    glm::vec2 size(int index) const;

private:
    GpuBrushTextures() = default;

    std::vector<WGPUTexture> _textures;
    std::vector<glm::vec2> _sizes;
    WGPUTexture _placeholder = nullptr;
};

//=============================================================================
// GpuRasterizer - common part of the GPU mask rasterizers
//=============================================================================

class GpuRasterizer : public Rasterizer {
public:
    ~GpuRasterizer() override;

    Result<void> drawWithColor(Surface& target, Rgba color, float opacity,
                               BlendMode mode, const Rect& clip) override;
    Result<float> getPixel(int x, int y) override;
    void free() override;

    // Texture holding the finished mask
    virtual WGPUTexture maskTexture() const = 0;

protected:
    GpuRasterizer(GpuContext::Ptr ctx, GpuBrushTextures::Ptr brushTextures,
                  uint32_t width, uint32_t height);

    bool hasBrushTexture(int index) const override;
    virtual void releaseTextures() = 0;

    GpuContext::Ptr _ctx;
    GpuBrushTextures::Ptr _brushTextures;
    GpuAllocator::OwnerId _owner = 0;
    bool _freed = false;
};

// Single r16float mask; primitives are instanced quads blended with
// (One, OneMinusSrc), which is exactly a <- v + a * (1 - v)
class GpuFloatRasterizer : public GpuRasterizer {
public:
    static Result<Rasterizer::Ptr> create(GpuContext::Ptr ctx, GpuBrushTextures::Ptr brushTextures,
                                          uint32_t width, uint32_t height);

    RasterizerFormat format() const override { return RasterizerFormat::Float; }
    WGPUTexture maskTexture() const override { return _mask; }

protected:
    Result<void> clearMask() override;
    Result<void> accumulatePrimitives(const std::vector<MaskPrimitive>& prims, int textureIndex) override;
    void releaseTextures() override;

private:
    using GpuRasterizer::GpuRasterizer;

    Result<void> init() noexcept;

    WGPUTexture _mask = nullptr;
};

// rgba8unorm ping-pong pair; each batch reads the previous mask and writes
// the accumulated 16-bit value into the other texture
class GpuDoubleBufferedRasterizer : public GpuRasterizer {
public:
    static Result<Rasterizer::Ptr> create(GpuContext::Ptr ctx, GpuBrushTextures::Ptr brushTextures,
                                          uint32_t width, uint32_t height);

    RasterizerFormat format() const override { return RasterizerFormat::Fixed16; }
    WGPUTexture maskTexture() const override { return _front; }

protected:
    Result<void> clearMask() override;
    Result<void> accumulatePrimitives(const std::vector<MaskPrimitive>& prims, int textureIndex) override;
    void releaseTextures() override;

private:
    using GpuRasterizer::GpuRasterizer;

    Result<void> init() noexcept;

    WGPUTexture _front = nullptr;
    WGPUTexture _back = nullptr;
};

//=============================================================================
// GpuCompositor - generated compositing programs, cached by stack shape
//=============================================================================

class GpuCompositor : public Compositor {
public:
    using Ptr = std::shared_ptr<GpuCompositor>;

    static Result<Ptr> create(GpuContext::Ptr ctx, GpuAllocator::OwnerId owner,
                              uint32_t width, uint32_t height, int maxLayersPerPass);

    Result<void> composite(const std::vector<CompositeLayer>& layers,
                           const std::optional<LiveOverlay>& overlay) override;
    Surface& display() override { return *_display; }
    size_t programCount() const override { return _programKeys.size(); }
    void free() override;

    GpuSurface& displaySurface() { return *_display; }

private:
    GpuCompositor(GpuContext::Ptr ctx, GpuSurface::Ptr display, int maxLayersPerPass);

    struct PassShape {
        std::vector<bool> hasAlpha;
        int overlayLayer = -1;
        BlendMode overlayMode = BlendMode::Normal;
        RasterizerFormat maskFormat = RasterizerFormat::Float;
        bool readsPrevious = false;
    };

    static std::string programKey(const PassShape& shape);
    static std::string fragmentSource(const PassShape& shape);
    static std::vector<UniformDecl> uniforms(const PassShape& shape);

    GpuContext::Ptr _ctx;
    GpuSurface::Ptr _display;
    int _maxLayersPerPass;
    std::vector<std::string> _programKeys;
};

} // namespace pictura
