#include <pictura/cpu-backend.h>
#include <pictura/backend.h>
#include <pictura/color.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace pictura {

//=============================================================================
// CpuSurface
//=============================================================================

CpuSurface::CpuSurface(uint32_t width, uint32_t height)
    : _width(width), _height(height), _pixels(static_cast<size_t>(width) * height * 4, 0) {}

CpuSurface::Ptr CpuSurface::create(uint32_t width, uint32_t height) {
    return Ptr(new CpuSurface(width, height));
}

Result<void> CpuSurface::clear(Rgba color) {
    Rgba premul = color::toBytes(color::premultiply(color));
    for (size_t i = 0; i + 3 < _pixels.size(); i += 4) {
        _pixels[i + 0] = premul.r;
        _pixels[i + 1] = premul.g;
        _pixels[i + 2] = premul.b;
        _pixels[i + 3] = premul.a;
    }
    return Ok();
}

Result<void> CpuSurface::copyFrom(const Surface& src) {
    auto other = dynamic_cast<const CpuSurface*>(&src);
    if (!other) {
        return Err("CpuSurface::copyFrom: source is not a CPU surface");
    }
    if (other->_width != _width || other->_height != _height) {
        return Err("CpuSurface::copyFrom: size mismatch");
    }
    _pixels = other->_pixels;
    return Ok();
}

Result<void> CpuSurface::drawOver(const Surface& src, float opacity) {
    auto other = dynamic_cast<const CpuSurface*>(&src);
    if (!other) {
        return Err("CpuSurface::drawOver: source is not a CPU surface");
    }
    if (other->_width != _width || other->_height != _height) {
        return Err("CpuSurface::drawOver: size mismatch");
    }
    opacity = std::clamp(opacity, 0.0f, 1.0f);
    for (uint32_t y = 0; y < _height; y++) {
        for (uint32_t x = 0; x < _width; x++) {
            glm::vec4 s = color::toFloat(other->at(x, y)) * opacity;
            if (s.a <= 0.0f) continue;
            glm::vec4 d = color::toFloat(at(x, y));
            set(x, y, color::toBytes(s + d * (1.0f - s.a)));
        }
    }
    return Ok();
}

Result<std::vector<uint8_t>> CpuSurface::readPixels() {
    return Ok(std::vector<uint8_t>(_pixels));
}

Result<Rgba> CpuSurface::pixel(int x, int y) {
    if (_width == 0 || _height == 0) {
        return Err<Rgba>("CpuSurface::pixel: empty surface", Error::Code::InvalidIndex);
    }
    x = std::clamp(x, 0, static_cast<int>(_width) - 1);
    y = std::clamp(y, 0, static_cast<int>(_height) - 1);
    return Ok(at(static_cast<uint32_t>(x), static_cast<uint32_t>(y)));
}

void CpuSurface::free() {
    _pixels.clear();
    _pixels.shrink_to_fit();
    _width = 0;
    _height = 0;
}

//=============================================================================
// CpuRasterizer
//=============================================================================

CpuRasterizer::CpuRasterizer(uint32_t width, uint32_t height,
                             std::shared_ptr<const std::vector<BrushImage>> brushImages)
    : Rasterizer(width, height),
      _mask(static_cast<size_t>(width) * height, 0.0f),
      _brushImages(std::move(brushImages)) {}

CpuRasterizer::Ptr CpuRasterizer::create(uint32_t width, uint32_t height,
                                         std::shared_ptr<const std::vector<BrushImage>> brushImages) {
    return Ptr(new CpuRasterizer(width, height, std::move(brushImages)));
}

Result<void> CpuRasterizer::clearMask() {
    std::fill(_mask.begin(), _mask.end(), 0.0f);
    return Ok();
}

bool CpuRasterizer::hasBrushTexture(int index) const {
    return _brushImages && index >= 0 && static_cast<size_t>(index) < _brushImages->size() &&
           (*_brushImages)[index].valid();
}

Result<void> CpuRasterizer::accumulatePrimitives(const std::vector<MaskPrimitive>& prims, int textureIndex) {
    const BrushImage* texture = textureIndex >= 0 ? &(*_brushImages)[textureIndex] : nullptr;
    for (const auto& prim : prims) {
        Rect area = prim.area();
        area.intersectRect(_clip);
        if (area.isEmpty()) continue;

        uint32_t x0 = static_cast<uint32_t>(area.left);
        uint32_t x1 = static_cast<uint32_t>(area.right);
        uint32_t y0 = static_cast<uint32_t>(area.top);
        uint32_t y1 = static_cast<uint32_t>(area.bottom);
        for (uint32_t y = y0; y < y1; y++) {
            float* row = &_mask[static_cast<size_t>(y) * _width];
            for (uint32_t x = x0; x < x1; x++) {
                float v = primitiveValue(prim, Vec2(x + 0.5f, y + 0.5f), texture);
                if (v > 0.0f) {
                    row[x] = pictura::accumulate(row[x], v);
                }
            }
        }
    }
    return Ok();
}

Result<void> CpuRasterizer::drawWithColor(Surface& target, Rgba color, float opacity,
                                          BlendMode mode, const Rect& clip) {
    auto surface = dynamic_cast<CpuSurface*>(&target);
    if (!surface) {
        return Err("CpuRasterizer::drawWithColor: target is not a CPU surface");
    }
    Rect area = clip.integerBounds();
    area.intersectRect(fullRect());
    area.intersectRect(Rect(0, static_cast<float>(surface->width()), 0, static_cast<float>(surface->height())));
    if (area.isEmpty()) {
        return Ok();
    }

    glm::vec3 rgb(color::toUnit(color.r), color::toUnit(color.g), color::toUnit(color.b));
    for (uint32_t y = static_cast<uint32_t>(area.top); y < static_cast<uint32_t>(area.bottom); y++) {
        for (uint32_t x = static_cast<uint32_t>(area.left); x < static_cast<uint32_t>(area.right); x++) {
            float s = maskAt(x, y) * opacity;
            if (s <= 0.0f) continue;
            glm::vec4 d = color::toFloat(surface->at(x, y));
            surface->set(x, y, color::toBytes(blendMask(d, rgb, s, mode)));
        }
    }
    return Ok();
}

Result<float> CpuRasterizer::getPixel(int x, int y) {
    if (x < 0 || y < 0 || x >= static_cast<int>(_width) || y >= static_cast<int>(_height)) {
        return Err<float>("CpuRasterizer::getPixel: out of bounds", Error::Code::InvalidIndex);
    }
    return Ok(maskAt(static_cast<uint32_t>(x), static_cast<uint32_t>(y)));
}

void CpuRasterizer::free() {
    _mask.clear();
    _mask.shrink_to_fit();
    _width = 0;
    _height = 0;
    _clip = Rect::empty();
}

//=============================================================================
// CpuCompositor
//=============================================================================

CpuCompositor::CpuCompositor(CpuSurface::Ptr display) : _display(std::move(display)) {}

CpuCompositor::Ptr CpuCompositor::create(uint32_t width, uint32_t height) {
    return Ptr(new CpuCompositor(CpuSurface::create(width, height)));
}

Result<void> CpuCompositor::composite(const std::vector<CompositeLayer>& layers,
                                      const std::optional<LiveOverlay>& overlay) {
    std::vector<const CpuSurface*> surfaces;
    surfaces.reserve(layers.size());
    for (const auto& layer : layers) {
        auto surface = dynamic_cast<const CpuSurface*>(layer.surface);
        if (!surface) {
            return Err("CpuCompositor: layer is not a CPU surface");
        }
        if (surface->width() != _display->width() || surface->height() != _display->height()) {
            return Err("CpuCompositor: layer size mismatch");
        }
        surfaces.push_back(surface);
    }

    const CpuRasterizer* overlayMask = nullptr;
    Rect overlayClip;
    glm::vec3 overlayColor(0.0f);
    if (overlay && overlay->layer < layers.size()) {
        overlayMask = dynamic_cast<const CpuRasterizer*>(overlay->rasterizer);
        if (!overlayMask) {
            return Err("CpuCompositor: overlay rasterizer is not a CPU rasterizer");
        }
        overlayClip = overlay->clip.integerBounds();
        overlayClip.intersectRect(overlayMask->fullRect());
        overlayColor = glm::vec3(color::toUnit(overlay->color.r), color::toUnit(overlay->color.g),
                                 color::toUnit(overlay->color.b));
    }

    uint32_t width = _display->width();
    uint32_t height = _display->height();
    for (uint32_t y = 0; y < height; y++) {
        for (uint32_t x = 0; x < width; x++) {
            glm::vec4 acc(0.0f);
            for (size_t i = 0; i < surfaces.size(); i++) {
                glm::vec4 l = color::toFloat(surfaces[i]->at(x, y));
                if (!layers[i].hasAlpha) {
                    l.a = 1.0f;
                }
                if (overlayMask && i == overlay->layer &&
                    overlayClip.containsPoint(Vec2(x + 0.5f, y + 0.5f))) {
                    float s = overlayMask->maskAt(x, y) * overlay->opacity;
                    if (s > 0.0f) {
                        l = blendMask(l, overlayColor, s, overlay->mode);
                    }
                }
                acc = l + acc * (1.0f - l.a);
            }
            _display->set(x, y, color::toBytes(acc));
        }
    }
    return Ok();
}

void CpuCompositor::free() {
    if (_display) {
        _display->free();
    }
}

//=============================================================================
// CpuRenderBackend
//=============================================================================

namespace {

class CpuRenderBackend : public RenderBackend {
public:
    CpuRenderBackend(uint32_t width, uint32_t height, std::shared_ptr<const std::vector<BrushImage>> brushImages)
        : RenderBackend(width, height),
          _brushImages(std::move(brushImages)),
          _compositor(CpuCompositor::create(width, height)) {}

    BackendMode mode() const override { return BackendMode::Cpu; }

    Result<Rasterizer::Ptr> createRasterizer() override {
        return Ok(Rasterizer::Ptr(CpuRasterizer::create(_width, _height, _brushImages)));
    }

    Result<Surface::Ptr> createSurface(const std::string& /*label*/) override {
        return Ok(Surface::Ptr(CpuSurface::create(_width, _height)));
    }

    Compositor& compositor() override { return *_compositor; }

    PictureElements pictureElements() override {
        auto& display = static_cast<CpuSurface&>(_compositor->display());
        PictureElements elements;
        elements.mode = BackendMode::Cpu;
        elements.width = _width;
        elements.height = _height;
        elements.pixels = display.data();
        return elements;
    }

    void free() override {
        if (_compositor) {
            _compositor->free();
        }
    }

private:
    std::shared_ptr<const std::vector<BrushImage>> _brushImages;
    CpuCompositor::Ptr _compositor;
};

} // namespace

Result<RenderBackend::Ptr> createCpuBackend(uint32_t width, uint32_t height, const BackendEnvironment& env) {
    ydebug("CpuRenderBackend: {}x{}", width, height);
    return Ok(RenderBackend::Ptr(std::make_shared<CpuRenderBackend>(width, height, env.brushImages)));
}

} // namespace pictura
