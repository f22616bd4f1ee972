#include <pictura/gpu-backend.h>
#include <pictura/blend-mode.h>
#include <pictura/color.h>
#include <pictura/mask-primitive.h>
#include <ytrace/ytrace.hpp>
#include <glm/gtc/packing.hpp>
#include <algorithm>
#include <cstring>

namespace pictura {

namespace {

// Primitives evaluated per fixed point pass; bounds the fragment loop
constexpr size_t MAX_PRIMS_PER_PASS = 256;

constexpr WGPUTextureFormat SURFACE_FORMAT = WGPUTextureFormat_RGBA8Unorm;
constexpr WGPUTextureFormat FLOAT_MASK_FORMAT = WGPUTextureFormat_R16Float;
constexpr WGPUTextureFormat FIXED_MASK_FORMAT = WGPUTextureFormat_RGBA8Unorm;

const char* PRIM_VERTEX_SOURCE = R"(
struct PrimOut {
    @builtin(position) pos: vec4f,
    @location(0) @interpolate(flat) index: u32,
}

@vertex
fn vs_main(@builtin(vertex_index) vi: u32, @builtin(instance_index) ii: u32) -> PrimOut {
    var corners = array<vec2f, 6>(
        vec2f(0.0, 0.0), vec2f(1.0, 0.0), vec2f(0.0, 1.0),
        vec2f(0.0, 1.0), vec2f(1.0, 0.0), vec2f(1.0, 1.0));
    let b = prims[ii].bounds;
    let p = mix(b.xy, b.zw, corners[vi]);
    var out: PrimOut;
    out.pos = vec4f(p.x / u.targetSize.x * 2.0 - 1.0, 1.0 - p.y / u.targetSize.y * 2.0, 0.0, 1.0);
    out.index = ii;
    return out;
}
)";

const char* FLOAT_RASTER_FRAGMENT = R"(
@fragment
fn fs_main(in: PrimOut) -> @location(0) vec4f {
    let v = primitiveValue(prims[in.index], in.pos.xy);
    return vec4f(v, 0.0, 0.0, v);
}
)";

const char* FIXED_RASTER_FRAGMENT = R"(
fn encodeMask(a: f32) -> vec4f {
    let q = round(clamp(a, 0.0, 1.0) * 65535.0);
    let hi = floor(q / 256.0);
    let lo = q - hi * 256.0;
    return vec4f(hi / 255.0, lo / 255.0, 0.0, 1.0);
}

@fragment
fn fs_main(in: FullscreenOut) -> @location(0) vec4f {
    let p = in.pos.xy;
    var a = decodeMask(textureLoad(prevMask, vec2i(p), 0));
    for (var i = 0; i < u.primCount; i++) {
        let prim = prims[i];
        if (p.x < prim.bounds.x || p.x >= prim.bounds.z || p.y < prim.bounds.y || p.y >= prim.bounds.w) {
            continue;
        }
        a = a + (1.0 - a) * primitiveValue(prim, p);
    }
    return encodeMask(a);
}
)";

const char* DRAW_WITH_COLOR_FRAGMENT = R"(
@fragment
fn fs_main(in: FullscreenOut) -> @location(0) vec4f {
    let p = vec2i(in.pos.xy);
    let d = textureLoad(dst, p, 0);
    let s = decodeMask(textureLoad(mask, p, 0)) * u.color.a;
    return blendMask(d, u.color.rgb, s);
}
)";

const char* DRAW_OVER_FRAGMENT = R"(
@fragment
fn fs_main(in: FullscreenOut) -> @location(0) vec4f {
    let p = vec2i(in.pos.xy);
    let s = textureLoad(src, p, 0) * u.opacity;
    let d = textureLoad(dst, p, 0);
    return s + d * (1.0 - s.a);
}
)";

const char* formatTag(RasterizerFormat format) {
    return format == RasterizerFormat::Float ? "float" : "fixed";
}

std::vector<UniformDecl> rasterUniforms(bool fixed) {
    std::vector<UniformDecl> decls;
    if (fixed) {
        decls.push_back({"primCount", UniformType::Int, ""});
    }
    decls.push_back({"brushTexSize", UniformType::Vec2, ""});
    if (fixed) {
        decls.push_back({"prevMask", UniformType::Texture, ""});
    }
    decls.push_back({"brushTex", UniformType::Texture, ""});
    decls.push_back({"prims", UniformType::Storage, "Prim"});
    return decls;
}

} // namespace

std::string maskDecodeWgsl(RasterizerFormat format) {
    if (format == RasterizerFormat::Float) {
        return "fn decodeMask(m: vec4f) -> f32 {\n    return clamp(m.r, 0.0, 1.0);\n}\n";
    }
    return "fn decodeMask(m: vec4f) -> f32 {\n"
           "    return (round(m.r * 255.0) * 256.0 + round(m.g * 255.0)) / 65535.0;\n"
           "}\n";
}

//=============================================================================
// GpuSurface
//=============================================================================

GpuSurface::GpuSurface(GpuContext::Ptr ctx, uint32_t width, uint32_t height)
    : _ctx(std::move(ctx)), _width(width), _height(height) {}

GpuSurface::~GpuSurface() {
    free();
}

Result<GpuSurface::Ptr> GpuSurface::create(GpuContext::Ptr ctx, GpuAllocator::OwnerId owner,
                                           uint32_t width, uint32_t height, const std::string& label) {
    if (!ctx) {
        return Err<Ptr>("GpuSurface: null context", Error::Code::GpuFailure);
    }
    auto surface = Ptr(new GpuSurface(std::move(ctx), width, height));
    if (auto res = surface->init(owner, label); !res) {
        return Err<Ptr>("Failed to create GPU surface " + label, res);
    }
    return Ok(surface);
}

Result<void> GpuSurface::init(GpuAllocator::OwnerId owner, const std::string& label) noexcept {
    auto& sm = _ctx->stateManager();
    _front = sm.createTexture(owner, label + " a", _width, _height, SURFACE_FORMAT);
    _back = sm.createTexture(owner, label + " b", _width, _height, SURFACE_FORMAT);
    if (!_front || !_back) {
        free();
        return Err("texture allocation failed", Error::Code::GpuFailure);
    }
    return clear(Rgba{0, 0, 0, 0});
}

Result<void> GpuSurface::prepareBack() {
    return _ctx->stateManager().copyTexture(_front, _back);
}

Result<void> GpuSurface::clear(Rgba c) {
    // Quantize like the CPU path so both start from identical bytes
    Rgba premul = color::toBytes(color::premultiply(c));
    return _ctx->stateManager().clearTexture(_front, color::toFloat(premul));
}

Result<void> GpuSurface::copyFrom(const Surface& src) {
    auto other = dynamic_cast<const GpuSurface*>(&src);
    if (!other) {
        return Err("GpuSurface::copyFrom: source is not a GPU surface");
    }
    return _ctx->stateManager().copyTexture(other->_front, _front);
}

Result<void> GpuSurface::drawOver(const Surface& src, float opacity) {
    auto other = dynamic_cast<const GpuSurface*>(&src);
    if (!other) {
        return Err("GpuSurface::drawOver: source is not a GPU surface");
    }
    auto& sm = _ctx->stateManager();
    auto prog = sm.program("surface-draw-over", GpuStateManager::fullscreenVertexSource(),
                           DRAW_OVER_FRAGMENT,
                           {{"opacity", UniformType::Float, ""},
                            {"src", UniformType::Texture, ""},
                            {"dst", UniformType::Texture, ""}},
                           SURFACE_FORMAT);
    if (!prog) {
        return Err("GpuSurface::drawOver", prog);
    }
    UniformValues values = {
        {"opacity", std::clamp(opacity, 0.0f, 1.0f)},
        {"src", other->_front},
        {"dst", _front},
    };
    Rect full(0, static_cast<float>(_width), 0, static_cast<float>(_height));
    if (auto res = sm.draw(**prog, values, _back, full); !res) {
        return res;
    }
    swap();
    return Ok();
}

Result<std::vector<uint8_t>> GpuSurface::readPixels() {
    return _ctx->stateManager().readPixels(_front, 0, 0, _width, _height);
}

Result<Rgba> GpuSurface::pixel(int x, int y) {
    x = std::clamp(x, 0, static_cast<int>(_width) - 1);
    y = std::clamp(y, 0, static_cast<int>(_height) - 1);
    auto bytes = _ctx->stateManager().readPixels(_front, static_cast<uint32_t>(x),
                                                 static_cast<uint32_t>(y), 1, 1);
    if (!bytes) {
        return Err<Rgba>("GpuSurface::pixel", bytes);
    }
    const auto& b = *bytes;
    return Ok(Rgba{b[0], b[1], b[2], b[3]});
}

void GpuSurface::free() {
    if (!_ctx) return;
    _ctx->allocator().releaseTexture(_front);
    _ctx->allocator().releaseTexture(_back);
    _front = nullptr;
    _back = nullptr;
    _ctx.reset();
}

//=============================================================================
// GpuBrushTextures
//=============================================================================

Result<GpuBrushTextures::Ptr> GpuBrushTextures::create(GpuContext::Ptr ctx, GpuAllocator::OwnerId owner,
                                                       const std::vector<BrushImage>& images) {
    auto textures = Ptr(new GpuBrushTextures());
    auto& sm = ctx->stateManager();

    textures->_placeholder = sm.createTexture(owner, "brush placeholder", 1, 1, WGPUTextureFormat_R8Unorm);
    if (!textures->_placeholder) {
        return Err<Ptr>("GpuBrushTextures: placeholder allocation failed", Error::Code::GpuFailure);
    }
    const uint8_t zero = 0;
    if (auto res = sm.writeTexture(textures->_placeholder, &zero, 1, 1, 1); !res) {
        return Err<Ptr>("GpuBrushTextures: placeholder upload failed", res);
    }

    for (size_t i = 0; i < images.size(); i++) {
        const auto& image = images[i];
        WGPUTexture texture = nullptr;
        if (image.valid()) {
            texture = sm.createTexture(owner, "brush " + std::to_string(i), image.width, image.height,
                                       WGPUTextureFormat_R8Unorm);
            if (!texture) {
                return Err<Ptr>("GpuBrushTextures: allocation failed for brush " + std::to_string(i),
                                Error::Code::GpuFailure);
            }
            if (auto res = sm.writeTexture(texture, image.pixels.data(), image.width, image.height, 1); !res) {
                return Err<Ptr>("GpuBrushTextures: upload failed", res);
            }
        }
        textures->_textures.push_back(texture);
        textures->_sizes.emplace_back(static_cast<float>(image.width), static_cast<float>(image.height));
    }
    ydebug("GpuBrushTextures: uploaded {} brush textures", images.size());
    return Ok(textures);
}

bool GpuBrushTextures::has(int index) const {
    return index >= 0 && static_cast<size_t>(index) < _textures.size() && _textures[index];
}

WGPUTexture GpuBrushTextures::texture(int index) const {
    return has(index) ? _textures[index] : _placeholder;
}

glm::vec2 GpuBrushTextures::size(int index) const {
    return has(index) ? _sizes[index] : glm::vec2(1.0f);
}

//=============================================================================
// GpuRasterizer
//=============================================================================

GpuRasterizer::GpuRasterizer(GpuContext::Ptr ctx, GpuBrushTextures::Ptr brushTextures,
                             uint32_t width, uint32_t height)
    : Rasterizer(width, height), _ctx(std::move(ctx)), _brushTextures(std::move(brushTextures)) {
    _owner = _ctx->allocator().newOwner("rasterizer " + std::to_string(width) + "x" + std::to_string(height));
}

GpuRasterizer::~GpuRasterizer() {
    if (!_freed && _ctx) {
        _ctx->allocator().releaseOwner(_owner);
    }
}

bool GpuRasterizer::hasBrushTexture(int index) const {
    return _brushTextures && _brushTextures->has(index);
}

void GpuRasterizer::free() {
    if (_freed) return;
    _freed = true;
    releaseTextures();
    _ctx->allocator().releaseOwner(_owner);
}

Result<void> GpuRasterizer::drawWithColor(Surface& target, Rgba c, float opacity,
                                          BlendMode mode, const Rect& clip) {
    auto surface = dynamic_cast<GpuSurface*>(&target);
    if (!surface) {
        return Err("GpuRasterizer::drawWithColor: target is not a GPU surface");
    }
    Rect area = clip.integerBounds();
    area.intersectRect(fullRect());
    if (area.isEmpty()) {
        return Ok();
    }

    auto& sm = _ctx->stateManager();
    std::string key = std::string("draw-with-color:") + blendModeName(mode) + ":" + formatTag(format());
    auto prog = sm.program(key, GpuStateManager::fullscreenVertexSource(),
                           maskDecodeWgsl(format()) + blendMaskWgsl(mode) + DRAW_WITH_COLOR_FRAGMENT,
                           {{"color", UniformType::Vec4, ""},
                            {"mask", UniformType::Texture, ""},
                            {"dst", UniformType::Texture, ""}},
                           SURFACE_FORMAT);
    if (!prog) {
        return Err("GpuRasterizer::drawWithColor", prog);
    }

    if (auto res = surface->prepareBack(); !res) {
        return res;
    }
    UniformValues values = {
        {"color", glm::vec4(color::toUnit(c.r), color::toUnit(c.g), color::toUnit(c.b), opacity)},
        {"mask", maskTexture()},
        {"dst", surface->front()},
    };
    if (auto res = sm.draw(**prog, values, surface->back(), area); !res) {
        return res;
    }
    surface->swap();
    return Ok();
}

Result<float> GpuRasterizer::getPixel(int x, int y) {
    if (x < 0 || y < 0 || x >= static_cast<int>(_width) || y >= static_cast<int>(_height)) {
        return Err<float>("GpuRasterizer::getPixel: out of bounds", Error::Code::InvalidIndex);
    }
    auto bytes = _ctx->stateManager().readPixels(maskTexture(), static_cast<uint32_t>(x),
                                                 static_cast<uint32_t>(y), 1, 1);
    if (!bytes) {
        return Err<float>("GpuRasterizer::getPixel", bytes);
    }
    const auto& b = *bytes;
    if (format() == RasterizerFormat::Float) {
        uint16_t half = 0;
        std::memcpy(&half, b.data(), sizeof(half));
        return Ok(glm::unpackHalf1x16(half));
    }
    return Ok((static_cast<float>(b[0]) * 256.0f + static_cast<float>(b[1])) / 65535.0f);
}

//=============================================================================
// GpuFloatRasterizer
//=============================================================================

Result<Rasterizer::Ptr> GpuFloatRasterizer::create(GpuContext::Ptr ctx, GpuBrushTextures::Ptr brushTextures,
                                                   uint32_t width, uint32_t height) {
    auto rasterizer = std::shared_ptr<GpuFloatRasterizer>(
        new GpuFloatRasterizer(std::move(ctx), std::move(brushTextures), width, height));
    if (auto res = rasterizer->init(); !res) {
        rasterizer->free();
        return Err<Rasterizer::Ptr>("Failed to create float rasterizer", res);
    }
    return Ok(Rasterizer::Ptr(rasterizer));
}

Result<void> GpuFloatRasterizer::init() noexcept {
    _mask = _ctx->stateManager().createTexture(_owner, "float mask", _width, _height, FLOAT_MASK_FORMAT);
    if (!_mask) {
        return Err("mask allocation failed", Error::Code::GpuFailure);
    }
    return clearMask();
}

void GpuFloatRasterizer::releaseTextures() {
    _ctx->allocator().releaseTexture(_mask);
    _mask = nullptr;
}

Result<void> GpuFloatRasterizer::clearMask() {
    return _ctx->stateManager().clearTexture(_mask, glm::vec4(0.0f));
}

Result<void> GpuFloatRasterizer::accumulatePrimitives(const std::vector<MaskPrimitive>& prims, int textureIndex) {
    auto& sm = _ctx->stateManager();
    auto prog = sm.program("raster-float", PRIM_VERTEX_SOURCE,
                           maskPrimitiveWgsl() + FLOAT_RASTER_FRAGMENT,
                           rasterUniforms(false), FLOAT_MASK_FORMAT, PipelineBlend::Accumulate);
    if (!prog) {
        return Err("GpuFloatRasterizer::accumulatePrimitives", prog);
    }
    UniformValues values = {
        {"brushTexSize", _brushTextures->size(textureIndex)},
        {"brushTex", _brushTextures->texture(textureIndex)},
        {"prims", StorageData{prims.data(), prims.size() * sizeof(MaskPrimitive)}},
    };
    return sm.draw(**prog, values, _mask, _clip, 6, static_cast<uint32_t>(prims.size()));
}

//=============================================================================
// GpuDoubleBufferedRasterizer
//=============================================================================

Result<Rasterizer::Ptr> GpuDoubleBufferedRasterizer::create(GpuContext::Ptr ctx,
                                                            GpuBrushTextures::Ptr brushTextures,
                                                            uint32_t width, uint32_t height) {
    auto rasterizer = std::shared_ptr<GpuDoubleBufferedRasterizer>(
        new GpuDoubleBufferedRasterizer(std::move(ctx), std::move(brushTextures), width, height));
    if (auto res = rasterizer->init(); !res) {
        rasterizer->free();
        return Err<Rasterizer::Ptr>("Failed to create double buffered rasterizer", res);
    }
    return Ok(Rasterizer::Ptr(rasterizer));
}

Result<void> GpuDoubleBufferedRasterizer::init() noexcept {
    auto& sm = _ctx->stateManager();
    _front = sm.createTexture(_owner, "fixed mask a", _width, _height, FIXED_MASK_FORMAT);
    _back = sm.createTexture(_owner, "fixed mask b", _width, _height, FIXED_MASK_FORMAT);
    if (!_front || !_back) {
        return Err("mask allocation failed", Error::Code::GpuFailure);
    }
    return clearMask();
}

void GpuDoubleBufferedRasterizer::releaseTextures() {
    _ctx->allocator().releaseTexture(_front);
    _ctx->allocator().releaseTexture(_back);
    _front = nullptr;
    _back = nullptr;
}

Result<void> GpuDoubleBufferedRasterizer::clearMask() {
    auto& sm = _ctx->stateManager();
    if (auto res = sm.clearTexture(_front, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f)); !res) {
        return res;
    }
    return sm.clearTexture(_back, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
}

Result<void> GpuDoubleBufferedRasterizer::accumulatePrimitives(const std::vector<MaskPrimitive>& prims,
                                                              int textureIndex) {
    auto& sm = _ctx->stateManager();
    auto prog = sm.program("raster-fixed", GpuStateManager::fullscreenVertexSource(),
                           maskPrimitiveWgsl() + maskDecodeWgsl(RasterizerFormat::Fixed16) +
                               FIXED_RASTER_FRAGMENT,
                           rasterUniforms(true), FIXED_MASK_FORMAT);
    if (!prog) {
        return Err("GpuDoubleBufferedRasterizer::accumulatePrimitives", prog);
    }

    for (size_t start = 0; start < prims.size(); start += MAX_PRIMS_PER_PASS) {
        size_t count = std::min(MAX_PRIMS_PER_PASS, prims.size() - start);
        Rect area;
        for (size_t i = start; i < start + count; i++) {
            area.unionRect(prims[i].area());
        }
        area.intersectRect(_clip);
        if (area.isEmpty()) continue;

        if (auto res = sm.copyTexture(_front, _back); !res) {
            return res;
        }
        UniformValues values = {
            {"primCount", static_cast<int32_t>(count)},
            {"brushTexSize", _brushTextures->size(textureIndex)},
            {"prevMask", _front},
            {"brushTex", _brushTextures->texture(textureIndex)},
            {"prims", StorageData{prims.data() + start, count * sizeof(MaskPrimitive)}},
        };
        if (auto res = sm.draw(**prog, values, _back, area); !res) {
            return res;
        }
        std::swap(_front, _back);
    }
    return Ok();
}

//=============================================================================
// GpuCompositor
//=============================================================================

GpuCompositor::GpuCompositor(GpuContext::Ptr ctx, GpuSurface::Ptr display, int maxLayersPerPass)
    : _ctx(std::move(ctx)), _display(std::move(display)), _maxLayersPerPass(maxLayersPerPass) {}

Result<GpuCompositor::Ptr> GpuCompositor::create(GpuContext::Ptr ctx, GpuAllocator::OwnerId owner,
                                                 uint32_t width, uint32_t height, int maxLayersPerPass) {
    auto display = GpuSurface::create(ctx, owner, width, height, "display");
    if (!display) {
        return Err<Ptr>("Failed to create compositor", display);
    }
    return Ok(Ptr(new GpuCompositor(std::move(ctx), *display, std::max(maxLayersPerPass, 1))));
}

void GpuCompositor::free() {
    if (_display) {
        _display->free();
    }
}

std::string GpuCompositor::programKey(const PassShape& shape) {
    std::string key = "composite:";
    for (bool alpha : shape.hasAlpha) {
        key += alpha ? 'a' : 'o';
    }
    if (shape.overlayLayer >= 0) {
        key += ":overlay=" + std::to_string(shape.overlayLayer) + ":" + blendModeName(shape.overlayMode) +
               ":" + formatTag(shape.maskFormat);
    }
    if (shape.readsPrevious) {
        key += ":prev";
    }
    return key;
}

std::vector<UniformDecl> GpuCompositor::uniforms(const PassShape& shape) {
    std::vector<UniformDecl> decls;
    if (shape.overlayLayer >= 0) {
        decls.push_back({"overlayClip", UniformType::Vec4, ""});
        decls.push_back({"overlayColor", UniformType::Vec4, ""});
        decls.push_back({"overlayMask", UniformType::Texture, ""});
    }
    if (shape.readsPrevious) {
        decls.push_back({"prev", UniformType::Texture, ""});
    }
    for (size_t i = 0; i < shape.hasAlpha.size(); i++) {
        decls.push_back({"layer" + std::to_string(i), UniformType::Texture, ""});
    }
    return decls;
}

std::string GpuCompositor::fragmentSource(const PassShape& shape) {
    std::string src;
    if (shape.overlayLayer >= 0) {
        src += maskDecodeWgsl(shape.maskFormat);
        src += blendMaskWgsl(shape.overlayMode);
    }
    src += "\n@fragment\nfn fs_main(in: FullscreenOut) -> @location(0) vec4f {\n";
    src += "    let p = vec2i(in.pos.xy);\n";
    src += shape.readsPrevious ? "    var acc = textureLoad(prev, p, 0);\n" : "    var acc = vec4f(0.0);\n";
    src += "    var l = vec4f(0.0);\n";
    for (size_t i = 0; i < shape.hasAlpha.size(); i++) {
        src += "    l = textureLoad(layer" + std::to_string(i) + ", p, 0);\n";
        if (!shape.hasAlpha[i]) {
            src += "    l.a = 1.0;\n";
        }
        if (static_cast<int>(i) == shape.overlayLayer) {
            src += "    if (in.pos.x >= u.overlayClip.x && in.pos.x < u.overlayClip.z &&\n"
                   "        in.pos.y >= u.overlayClip.y && in.pos.y < u.overlayClip.w) {\n"
                   "        let s = decodeMask(textureLoad(overlayMask, p, 0)) * u.overlayColor.a;\n"
                   "        l = blendMask(l, u.overlayColor.rgb, s);\n"
                   "    }\n";
        }
        src += "    acc = l + acc * (1.0 - l.a);\n";
    }
    src += "    return acc;\n}\n";
    return src;
}

Result<void> GpuCompositor::composite(const std::vector<CompositeLayer>& layers,
                                      const std::optional<LiveOverlay>& overlay) {
    auto& sm = _ctx->stateManager();
    if (layers.empty()) {
        return sm.clearTexture(_display->front(), glm::vec4(0.0f));
    }

    const GpuRasterizer* overlayRasterizer = nullptr;
    if (overlay && overlay->layer < layers.size()) {
        overlayRasterizer = dynamic_cast<const GpuRasterizer*>(overlay->rasterizer);
        if (!overlayRasterizer) {
            return Err("GpuCompositor: overlay rasterizer is not a GPU rasterizer");
        }
    }

    Rect full(0, static_cast<float>(_display->width()), 0, static_cast<float>(_display->height()));
    size_t passSize = static_cast<size_t>(_maxLayersPerPass);
    for (size_t start = 0; start < layers.size(); start += passSize) {
        size_t count = std::min(passSize, layers.size() - start);

        PassShape shape;
        shape.readsPrevious = start > 0;
        UniformValues values;
        for (size_t i = 0; i < count; i++) {
            const auto& layer = layers[start + i];
            auto surface = dynamic_cast<const GpuSurface*>(layer.surface);
            if (!surface) {
                return Err("GpuCompositor: layer is not a GPU surface");
            }
            shape.hasAlpha.push_back(layer.hasAlpha);
            values["layer" + std::to_string(i)] = surface->front();
        }
        if (overlayRasterizer && overlay->layer >= start && overlay->layer < start + count) {
            shape.overlayLayer = static_cast<int>(overlay->layer - start);
            shape.overlayMode = overlay->mode;
            shape.maskFormat = overlayRasterizer->format();
            Rect clip = overlay->clip.integerBounds();
            clip.intersectRect(full);
            values["overlayClip"] = glm::vec4(clip.left, clip.top, clip.right, clip.bottom);
            values["overlayColor"] = glm::vec4(color::toUnit(overlay->color.r), color::toUnit(overlay->color.g),
                                               color::toUnit(overlay->color.b), overlay->opacity);
            values["overlayMask"] = overlayRasterizer->maskTexture();
        }
        if (shape.readsPrevious) {
            values["prev"] = _display->front();
        }

        std::string key = programKey(shape);
        auto prog = sm.program(key, GpuStateManager::fullscreenVertexSource(), fragmentSource(shape),
                               uniforms(shape), SURFACE_FORMAT);
        if (!prog) {
            return Err("GpuCompositor: program " + key, prog);
        }
        if (std::find(_programKeys.begin(), _programKeys.end(), key) == _programKeys.end()) {
            _programKeys.push_back(key);
        }
        if (auto res = sm.draw(**prog, values, _display->back(), full); !res) {
            return res;
        }
        _display->swap();
    }
    return Ok();
}

//=============================================================================
// GpuRenderBackend
//=============================================================================

namespace {

class GpuRenderBackend : public RenderBackend {
public:
    GpuRenderBackend(BackendMode mode, uint32_t width, uint32_t height, GpuContext::Ptr ctx,
                     GpuAllocator::OwnerId owner)
        : RenderBackend(width, height), _mode(mode), _ctx(std::move(ctx)), _owner(owner) {}

    ~GpuRenderBackend() override {
        free();
    }

    Result<void> init(const BackendEnvironment& env) {
        static const std::vector<BrushImage> noImages;
        auto brushTextures = GpuBrushTextures::create(_ctx, _owner, env.brushImages ? *env.brushImages : noImages);
        if (!brushTextures) {
            return Err("brush textures", brushTextures);
        }
        _brushTextures = *brushTextures;

        auto compositor = GpuCompositor::create(_ctx, _owner, _width, _height, env.maxLayersPerPass);
        if (!compositor) {
            return Err("compositor", compositor);
        }
        _compositor = *compositor;
        return Ok();
    }

    BackendMode mode() const override { return _mode; }

    Result<Rasterizer::Ptr> createRasterizer() override {
        if (_mode == BackendMode::GpuNoFloat) {
            return GpuDoubleBufferedRasterizer::create(_ctx, _brushTextures, _width, _height);
        }
        return GpuFloatRasterizer::create(_ctx, _brushTextures, _width, _height);
    }

    Result<Surface::Ptr> createSurface(const std::string& label) override {
        auto surface = GpuSurface::create(_ctx, _owner, _width, _height, label);
        if (!surface) {
            return Err<Surface::Ptr>("GpuRenderBackend::createSurface", surface);
        }
        return Ok(Surface::Ptr(*surface));
    }

    Compositor& compositor() override { return *_compositor; }

    PictureElements pictureElements() override {
        PictureElements elements;
        elements.mode = _mode;
        elements.width = _width;
        elements.height = _height;
        elements.texture = _compositor->displaySurface().front();
        return elements;
    }

    void free() override {
        if (!_ctx) return;
        if (_compositor) {
            _compositor->free();
        }
        _ctx->allocator().releaseOwner(_owner);
        _ctx.reset();
    }

private:
    BackendMode _mode;
    GpuContext::Ptr _ctx;
    GpuAllocator::OwnerId _owner;
    GpuBrushTextures::Ptr _brushTextures;
    GpuCompositor::Ptr _compositor;
};

// Self test plus a check that the device reported no validation errors
Result<void> runSanityCheck(RenderBackend& backend, GpuContext& ctx) {
    uint32_t errorsBefore = ctx.errorCount();
    if (auto res = checkBackendSanity(backend); !res) {
        return res;
    }
    if (ctx.errorCount() != errorsBefore) {
        return Err("device reported errors during the self test", Error::Code::SanityCheckFailed);
    }
    return Ok();
}

} // namespace

Result<RenderBackend::Ptr> createGpuBackend(BackendMode mode, uint32_t width, uint32_t height,
                                            const BackendEnvironment& env) {
    using Ptr = RenderBackend::Ptr;

    GpuContext::Ptr ctx = env.gpuContext;
    if (!ctx) {
        auto shared = GpuContext::shared();
        if (!shared) {
            return Err<Ptr>("GPU backend unavailable", Error::Code::BackendUnavailable, shared);
        }
        ctx = *shared;
    }

    std::string ownerName = std::string(backendModeName(mode)) + " backend " +
                            std::to_string(width) + "x" + std::to_string(height);
    auto owner = ctx->allocator().newOwner(ownerName);
    auto backend = std::make_shared<GpuRenderBackend>(mode, width, height, ctx, owner);
    if (auto res = backend->init(env); !res) {
        return Err<Ptr>("GPU backend setup failed", Error::Code::BackendUnavailable, res);
    }

    if (auto res = runSanityCheck(*backend, *ctx); !res) {
        if (res.error().code() == Error::Code::SanityCheckFailed) {
            BackendCapabilities::recordGpuSanityFailure();
        }
        return Err<Ptr>(std::string(backendModeName(mode)) + " backend rejected", res);
    }

    yinfo("GpuRenderBackend: {} {}x{} ready", backendModeName(mode), width, height);
    return Ok(Ptr(backend));
}

} // namespace pictura
