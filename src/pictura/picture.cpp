#include <pictura/picture.h>
#include <pictura/color.h>
#include <pictura/config.h>
#include <pictura/serialization.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace pictura {

//=============================================================================
// PictureOptions
//=============================================================================

PictureOptions PictureOptions::fromConfig(const Config& config) {
    PictureOptions options;
    options.buffer.undoStateInterval = static_cast<size_t>(
        std::max(config.get<int>(Config::KEY_PICTURE_UNDO_STATE_INTERVAL, 16), 1));
    options.buffer.maxUndoStates = static_cast<size_t>(
        std::max(config.get<int>(Config::KEY_PICTURE_MAX_UNDO_STATES, 5), 0));
    options.maxLayersPerPass = std::max(config.get<int>(Config::KEY_GPU_MAX_LAYERS_PER_PASS, 12), 1);
    options.simultaneousStrokes = std::max(config.get<int>(Config::KEY_ANIMATION_SIMULTANEOUS_STROKES, 1), 1);
    options.animationSpeed = std::clamp(config.get<float>(Config::KEY_ANIMATION_SPEED, 0.05f), 0.001f, 1.0f);
    return options;
}

std::vector<BackendMode> PictureOptions::modesFromConfig(const Config& config) {
    std::vector<BackendMode> modes;
    for (const auto& name : config.getList(Config::KEY_PICTURE_MODES)) {
        if (auto mode = backendModeFromName(name)) {
            modes.push_back(*mode);
        } else {
            ywarn("Config: unknown backend mode '{}'", name);
        }
    }
    if (modes.empty()) {
        modes = defaultBackendModes();
    }
    return modes;
}

//=============================================================================
// Construction
//=============================================================================

Picture::Picture(int id, int width, int height, float bitmapScale, RenderBackend::Ptr backend,
                 int currentBufferAttachment, const PictureOptions& options)
    : _id(id)
    , _width(width)
    , _height(height)
    , _bitmapScale(bitmapScale)
    , _backend(std::move(backend))
    , _options(options)
    , _currentBufferAttachment(currentBufferAttachment)
    , _frameScheduler(options.frameScheduler) {}

Picture::~Picture() {
    if (animating()) {
        _animationPhase = AnimationPhase::Idle;
        _animation.release();
    }
    for (auto& buffer : _buffers) {
        buffer->free();
    }
    _buffers.clear();
    if (_currentBufferRasterizer) _currentBufferRasterizer->free();
    if (_genericRasterizer) _genericRasterizer->free();
    if (_backend) _backend->free();
}

Result<Picture::Ptr> Picture::create(int id, int width, int height, float bitmapScale,
                                     const std::vector<BackendMode>& modesToTry,
                                     int currentBufferAttachment, const PictureOptions& options) {
    if (width <= 0 || height <= 0 || !(bitmapScale > 0.0f)) {
        return Err<Ptr>("Picture: invalid size " + std::to_string(width) + "x" + std::to_string(height),
                        Error::Code::InvalidIndex);
    }
    double scaledWidth = std::floor(static_cast<double>(width) * bitmapScale);
    double scaledHeight = std::floor(static_cast<double>(height) * bitmapScale);
    if (!(scaledWidth >= 1.0 && scaledHeight >= 1.0) || scaledWidth > MAX_BITMAP_DIMENSION ||
        scaledHeight > MAX_BITMAP_DIMENSION || scaledWidth * scaledHeight > static_cast<double>(MAX_BITMAP_PIXELS)) {
        return Err<Ptr>("Picture: " + std::to_string(width) + "x" + std::to_string(height) + " at scale " +
                        std::to_string(bitmapScale) + " gives an empty or oversized bitmap",
                        Error::Code::InvalidIndex);
    }
    auto bitmapWidth = static_cast<uint32_t>(scaledWidth);
    auto bitmapHeight = static_cast<uint32_t>(scaledHeight);

    BackendEnvironment env;
    env.gpuContext = options.gpuContext;
    env.brushImages = options.brushTextures;
    env.maxLayersPerPass = options.maxLayersPerPass;

    std::string failures;
    for (BackendMode mode : modesToTry) {
        auto backend = RenderBackend::create(mode, bitmapWidth, bitmapHeight, env);
        if (!backend) {
            yinfo("Picture {}: {} backend unavailable: {}", id, backendModeName(mode), error_msg(backend));
            failures += std::string(failures.empty() ? "" : "; ") + backendModeName(mode);
            continue;
        }
        auto picture = Ptr(new Picture(id, width, height, bitmapScale, *backend, currentBufferAttachment, options));
        if (auto res = picture->init(); !res) {
            ywarn("Picture {}: {} backend failed to initialize: {}", id, backendModeName(mode), error_msg(res));
            failures += std::string(failures.empty() ? "" : "; ") + backendModeName(mode);
            continue;
        }
        yinfo("Picture {}: {}x{} at scale {} using {} backend", id, width, height, bitmapScale,
              backendModeName(mode));
        return Ok(picture);
    }
    return Err<Ptr>("Picture " + std::to_string(id) + ": no backend could be created (" + failures + ")",
                    Error::Code::BackendUnavailable);
}

Result<void> Picture::init() noexcept {
    auto current = _backend->createRasterizer();
    if (!current) {
        return Err("current buffer rasterizer", current);
    }
    _currentBufferRasterizer = *current;
    _currentBufferRasterizer->setClip(bitmapRect());

    auto generic = _backend->createRasterizer();
    if (!generic) {
        return Err("generic rasterizer", generic);
    }
    _genericRasterizer = *generic;

    if (!_frameScheduler) {
        _frameScheduler = ManualFrameScheduler::create();
    }
    return Ok();
}

Rect Picture::bitmapRect() const {
    return Rect(0, static_cast<float>(bitmapWidth()), 0, static_cast<float>(bitmapHeight()));
}

//=============================================================================
// Buffers
//=============================================================================

Result<PictureBuffer::Ptr> Picture::createBuffer(int id, Rgba clearColor, bool hasUndoStates, bool hasAlpha) {
    auto buffer = PictureBuffer::create(_backend, id, clearColor, hasUndoStates, hasAlpha, _options.buffer);
    if (!buffer) {
        return buffer;
    }
    (*buffer)->setMergeResolver([this](int bufferId) { return committedSurface(bufferId); });
    return buffer;
}

Result<PictureBuffer*> Picture::addBuffer(int id, Rgba clearColor, bool hasUndoStates, bool hasAlpha) {
    auto buffer = createBuffer(id, clearColor, hasUndoStates, hasAlpha);
    if (!buffer) {
        return Err<PictureBuffer*>("Picture::addBuffer", buffer);
    }
    _buffers.push_back(*buffer);
    ydebug("Picture {}: added buffer {} ({} total)", _id, id, _buffers.size());
    return Ok(_buffers.back().get());
}

Result<void> Picture::removeBuffer(size_t index) {
    if (index >= _buffers.size()) {
        return Err("Picture::removeBuffer: index " + std::to_string(index) + " out of range",
                   Error::Code::InvalidIndex);
    }
    stopAnimating();
    auto buffer = _buffers[index];
    _buffers.erase(_buffers.begin() + static_cast<std::ptrdiff_t>(index));
    buffer->free();

    int removed = static_cast<int>(index);
    if (_currentBufferAttachment == removed) {
        _currentBufferAttachment = -1;
    } else if (_currentBufferAttachment > removed) {
        _currentBufferAttachment--;
    }
    return Ok();
}

Result<void> Picture::moveBuffer(size_t fromPosition, size_t toPosition) {
    if (fromPosition >= _buffers.size() || toPosition >= _buffers.size()) {
        return Err("Picture::moveBuffer: position out of range", Error::Code::InvalidIndex);
    }
    if (fromPosition == toPosition) {
        return Ok();
    }
    stopAnimating();
    auto buffer = _buffers[fromPosition];
    _buffers.erase(_buffers.begin() + static_cast<std::ptrdiff_t>(fromPosition));
    _buffers.insert(_buffers.begin() + static_cast<std::ptrdiff_t>(toPosition), buffer);

    int from = static_cast<int>(fromPosition);
    int to = static_cast<int>(toPosition);
    int& attachment = _currentBufferAttachment;
    if (attachment == from) {
        attachment = to;
    } else if (from < attachment && attachment <= to) {
        attachment--;
    } else if (to <= attachment && attachment < from) {
        attachment++;
    }
    return Ok();
}

int Picture::findBufferIndex(int id) const {
    for (size_t i = 0; i < _buffers.size(); i++) {
        if (_buffers[i]->id() == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

Result<size_t> Picture::bufferIndexOf(const PictureBuffer& buffer) const {
    for (size_t i = 0; i < _buffers.size(); i++) {
        if (_buffers[i].get() == &buffer) {
            return Ok(i);
        }
    }
    return Err<size_t>("buffer " + std::to_string(buffer.id()) + " does not belong to picture " +
                       std::to_string(_id), Error::Code::InvalidIndex);
}

Surface* Picture::committedSurface(int bufferId) {
    int index = findBufferIndex(bufferId);
    return index >= 0 ? &_buffers[index]->surface() : nullptr;
}

bool Picture::isMerged(size_t index, const std::vector<PictureBuffer::Ptr>& buffers) const {
    int id = _buffers[index]->id();
    for (size_t j = 0; j < buffers.size(); j++) {
        if (j != index && buffers[j]->mergesBuffer(id)) {
            return true;
        }
    }
    return false;
}

Result<void> Picture::setCurrentBufferAttachment(int attachment) {
    _currentBufferAttachment = attachment;
    // Draw the live event if it was set while nothing was attached
    if (liveAttachment() && _currentBufferRasterizer->drawingEvent() != _currentEvent.get()) {
        if (auto res = drawCurrentEvent(); !res) {
            return Err("Picture::setCurrentBufferAttachment", res);
        }
    }
    return Ok();
}

bool Picture::liveAttachment() const {
    return _currentEvent && _currentEvent->isRasterEvent() && _currentBufferAttachment >= 0 &&
           static_cast<size_t>(_currentBufferAttachment) < _buffers.size();
}

BlendMode Picture::currentBufferMode() const {
    if (!_currentEvent) {
        return BlendMode::Normal;
    }
    BlendMode mode = _currentEvent->mode();
    // Erasing an opaque layer has no visible effect; preview it as normal paint
    if (mode == BlendMode::Eraser && liveAttachment() && !_buffers[_currentBufferAttachment]->hasAlpha()) {
        return BlendMode::Normal;
    }
    return mode;
}

void Picture::setBufferVisible(PictureBuffer& buffer, bool visible) {
    if (auto index = bufferIndexOf(buffer); !index) {
        ywarn("Picture {}: {}", _id, error_msg(index));
        return;
    }
    buffer.setVisible(visible);
}

//=============================================================================
// Events
//=============================================================================

Result<void> Picture::pushEvent(PictureBuffer& target, PictureEvent::Ptr ev) {
    if (!ev) {
        return Err("Picture::pushEvent: null event");
    }
    ev->setDisplayScale(_bitmapScale);
    return transferEvent(target, std::move(ev));
}

Result<void> Picture::insertEvent(PictureBuffer& target, PictureEvent::Ptr ev) {
    if (auto index = bufferIndexOf(target); !index) {
        return Err("Picture::insertEvent", index);
    }
    if (!ev) {
        return Err("Picture::insertEvent: null event");
    }
    ev->setDisplayScale(_bitmapScale);
    return target.insertEvent(std::move(ev), *_genericRasterizer);
}

Result<void> Picture::transferEvent(PictureBuffer& target, PictureEvent::Ptr ev) {
    if (auto index = bufferIndexOf(target); !index) {
        return Err("Picture::transferEvent", index);
    }
    if (!ev) {
        return Err("Picture::transferEvent: null event");
    }
    // The live rasterizer already holds most of the event being committed
    if (_currentBufferRasterizer->drawingEvent() == ev.get()) {
        return target.pushEvent(std::move(ev), *_currentBufferRasterizer);
    }
    _genericRasterizer->forgetEvent();
    return target.pushEvent(std::move(ev), *_genericRasterizer);
}

Result<PictureEvent::Ptr> Picture::undoLatest(int sid) {
    int undoBuffer = -1;
    int undoIndex = -1;
    int latestId = 0;
    for (size_t i = 0; i < _buffers.size(); i++) {
        int candidate = _buffers[i]->findLatest(sid);
        if (candidate < 0) continue;
        int sessionEventId = _buffers[i]->events()[candidate]->sessionEventId();
        if (undoBuffer < 0 || sessionEventId > latestId) {
            undoBuffer = static_cast<int>(i);
            undoIndex = candidate;
            latestId = sessionEventId;
        }
    }
    if (undoBuffer < 0) {
        return Ok(PictureEvent::Ptr());
    }
    ydebug("Picture {}: undo latest of session {} -> event {} in buffer {}", _id, sid, latestId,
           _buffers[undoBuffer]->id());
    return _buffers[undoBuffer]->undoEventIndex(static_cast<size_t>(undoIndex), *_genericRasterizer);
}

Result<bool> Picture::undoEventSessionId(int sid, int sessionEventId) {
    for (size_t j = _buffers.size(); j-- > 0;) {
        int i = _buffers[j]->eventIndexBySessionId(sid, sessionEventId);
        if (i < 0) continue;
        if (auto res = _buffers[j]->undoEventIndex(static_cast<size_t>(i), *_genericRasterizer); !res) {
            return Err<bool>("Picture::undoEventSessionId", res);
        }
        return Ok(true);
    }
    return Ok(false);
}

Result<bool> Picture::redoEventSessionId(int sid, int sessionEventId) {
    for (size_t j = _buffers.size(); j-- > 0;) {
        int i = _buffers[j]->eventIndexBySessionId(sid, sessionEventId);
        if (i < 0) continue;
        if (auto res = _buffers[j]->redoEventIndex(static_cast<size_t>(i), *_genericRasterizer); !res) {
            return Err<bool>("Picture::redoEventSessionId", res);
        }
        return Ok(true);
    }
    return Ok(false);
}

Result<bool> Picture::removeEventSessionId(int sid, int sessionEventId) {
    for (size_t j = _buffers.size(); j-- > 0;) {
        int i = _buffers[j]->eventIndexBySessionId(sid, sessionEventId);
        if (i < 0) continue;
        if (auto res = _buffers[j]->removeEventIndex(static_cast<size_t>(i), *_genericRasterizer); !res) {
            return Err<bool>("Picture::removeEventSessionId", res);
        }
        return Ok(true);
    }
    return Ok(false);
}

Result<void> Picture::moveEvent(PictureBuffer& target, PictureBuffer& source, PictureEvent::Ptr ev) {
    if (auto index = bufferIndexOf(source); !index) {
        return Err("Picture::moveEvent", index);
    }
    if (!ev) {
        return Err("Picture::moveEvent: null event");
    }
    int eventIndex = source.eventIndexBySessionId(ev->sid(), ev->sessionEventId());
    if (eventIndex >= 0) {
        if (auto res = source.removeEventIndex(static_cast<size_t>(eventIndex), *_genericRasterizer); !res) {
            return Err("Picture::moveEvent", res);
        }
    }
    return transferEvent(target, std::move(ev));
}

Result<void> Picture::setCurrentBuffer(PictureEvent::Ptr ev) {
    _currentEvent = std::move(ev);
    if (!liveAttachment()) {
        return Ok();
    }
    if (auto res = drawCurrentEvent(); !res) {
        return Err("Picture::setCurrentBuffer", res);
    }
    return Ok();
}

Result<void> Picture::drawCurrentEvent() {
    _currentEvent->setDisplayScale(_bitmapScale);
    _currentBufferRasterizer->setClip(bitmapRect());
    return _currentEvent->updateTo(*_currentBufferRasterizer);
}

//=============================================================================
// Output
//=============================================================================

Result<void> Picture::display() {
    if (animating()) {
        return Ok();
    }
    std::vector<CompositeLayer> layers;
    std::optional<LiveOverlay> overlay;
    for (size_t i = 0; i < _buffers.size(); i++) {
        auto& buffer = *_buffers[i];
        if (!buffer.visible() || isMerged(i, _buffers)) continue;

        if (static_cast<int>(i) == _currentBufferAttachment && _currentEvent && _currentEvent->isRasterEvent()) {
            const auto& raster = static_cast<const RasterEvent&>(*_currentEvent);
            LiveOverlay live;
            live.layer = layers.size();
            live.rasterizer = _currentBufferRasterizer.get();
            live.color = raster.color();
            live.opacity = raster.opacity();
            live.mode = currentBufferMode();
            live.clip = bitmapRect();
            overlay = live;
        }
        layers.push_back({&buffer.surface(), buffer.hasAlpha()});
    }
    if (auto res = _backend->compositor().composite(layers, overlay); !res) {
        return Err("Picture " + std::to_string(_id) + ": display failed", res);
    }
    return Ok();
}

Result<std::vector<uint8_t>> Picture::toPixels() {
    if (auto res = display(); !res) {
        return Err<std::vector<uint8_t>>("Picture::toPixels", res);
    }
    auto pixels = _backend->compositor().display().readPixels();
    if (!pixels) {
        return Err<std::vector<uint8_t>>("Picture::toPixels", pixels);
    }
    auto& data = *pixels;
    for (size_t i = 0; i + 3 < data.size(); i += 4) {
        Rgba c = color::unpremultiply(Rgba{data[i], data[i + 1], data[i + 2], data[i + 3]});
        data[i] = c.r;
        data[i + 1] = c.g;
        data[i + 2] = c.b;
        data[i + 3] = c.a;
    }
    return pixels;
}

Result<Rgba> Picture::getPixelRGBA(Vec2 coords) {
    if (auto res = display(); !res) {
        return Err<Rgba>("Picture::getPixelRGBA", res);
    }
    auto p = _backend->compositor().display().pixel(static_cast<int>(std::floor(coords.x)),
                                                    static_cast<int>(std::floor(coords.y)));
    if (!p) {
        return Err<Rgba>("Picture::getPixelRGBA", p);
    }
    return Ok(color::unpremultiply(*p));
}

Result<std::vector<PictureBuffer::Blame>> Picture::blamePixel(Vec2 coords) {
    std::vector<PictureBuffer::Blame> blame;
    for (size_t j = _buffers.size(); j-- > 0;) {
        if (_buffers[j]->eventCount() == 0) continue;
        auto bufferBlame = _buffers[j]->blamePixel(coords, *_genericRasterizer);
        if (!bufferBlame) {
            return Err<std::vector<PictureBuffer::Blame>>("Picture::blamePixel", bufferBlame);
        }
        blame.insert(blame.end(), bufferBlame->begin(), bufferBlame->end());
    }
    return Ok(blame);
}

std::string Picture::serialize() const {
    return serializePicture(*this);
}

Result<ParsedPicture> Picture::parse(int id, std::string_view serialization, float bitmapScale,
                                     const std::vector<BackendMode>& modesToTry,
                                     int currentBufferAttachment, const PictureOptions& options) {
    return parsePicture(id, serialization, bitmapScale, modesToTry, currentBufferAttachment, options);
}

} // namespace pictura
