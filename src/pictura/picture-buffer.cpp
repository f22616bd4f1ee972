#include <pictura/picture-buffer.h>
#include <pictura/color.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace pictura {

PictureBuffer::PictureBuffer(RenderBackend::Ptr backend, int id, Rgba clearColor, bool hasUndoStates,
                             bool hasAlpha, const Options& options)
    : _backend(std::move(backend))
    , _id(id)
    , _clearColor(clearColor)
    , _hasUndoStates(hasUndoStates)
    , _hasAlpha(hasAlpha)
    , _options(options) {
    _options.undoStateInterval = std::max<size_t>(_options.undoStateInterval, 1);
}

PictureBuffer::~PictureBuffer() {
    free();
}

Result<PictureBuffer::Ptr> PictureBuffer::create(RenderBackend::Ptr backend, int id, Rgba clearColor,
                                                 bool hasUndoStates, bool hasAlpha, const Options& options) {
    if (!backend) {
        return Err<Ptr>("PictureBuffer: null backend");
    }
    auto buffer = Ptr(new PictureBuffer(std::move(backend), id, clearColor, hasUndoStates, hasAlpha, options));
    if (auto res = buffer->init(); !res) {
        return Err<Ptr>("Failed to create buffer " + std::to_string(id), res);
    }
    return Ok(buffer);
}

Result<void> PictureBuffer::init() noexcept {
    auto surface = _backend->createSurface("buffer " + std::to_string(_id));
    if (!surface) {
        return Err("surface", surface);
    }
    _surface = *surface;
    return _surface->clear(effectiveClearColor());
}

void PictureBuffer::free() {
    if (_freed) return;
    _freed = true;
    for (auto& state : _undoStates) {
        state.surface->free();
    }
    _undoStates.clear();
    if (_staging) {
        _staging->free();
        _staging.reset();
    }
    if (_surface) {
        _surface->free();
    }
}

Rgba PictureBuffer::effectiveClearColor() const {
    Rgba c = _clearColor;
    if (!_hasAlpha) {
        c.a = 255;
    }
    return c;
}

//=============================================================================
// Drawing
//=============================================================================

Result<void> PictureBuffer::applyMerge(const BufferMergeEvent& ev, Surface& target) {
    for (int bufferId : ev.mergedBufferIds()) {
        Surface* source = _mergeResolver ? _mergeResolver(bufferId) : nullptr;
        if (!source) {
            ywarn("PictureBuffer {}: merged buffer {} not found", _id, bufferId);
            continue;
        }
        if (auto res = target.drawOver(*source, ev.opacity()); !res) {
            return Err("merge of buffer " + std::to_string(bufferId), res);
        }
    }
    return Ok();
}

Result<void> PictureBuffer::applyEvent(const PictureEvent& ev, Surface& target, Rasterizer& rasterizer,
                                       bool resume) {
    if (ev.kind() == EventKind::BufferMerge) {
        return applyMerge(static_cast<const BufferMergeEvent&>(ev), target);
    }
    if (!ev.isRasterEvent()) {
        return Ok();
    }
    const auto& raster = static_cast<const RasterEvent&>(ev);

    Rect clip = ev.boundingBox().integerBounds();
    clip.intersectRect(rasterizer.fullRect());
    if (clip.isEmpty()) {
        return Ok();
    }

    if (!resume || rasterizer.drawingEvent() != &ev) {
        rasterizer.setClip(clip);
        if (auto res = rasterizer.beginEvent(&ev); !res) {
            return res;
        }
    }
    if (auto res = rasterizer.drawEvent(ev); !res) {
        return res;
    }

    Rgba c = raster.color();
    BlendMode mode = ev.mode();
    // Erasing an opaque layer paints its clear color instead
    if (mode == BlendMode::Eraser && !_hasAlpha) {
        mode = BlendMode::Normal;
        c = _clearColor;
    }
    return rasterizer.drawWithColor(target, c, raster.opacity(), mode, clip);
}

Result<void> PictureBuffer::pushEvent(PictureEvent::Ptr ev, Rasterizer& rasterizer) {
    if (!ev) {
        return Err("PictureBuffer::pushEvent: null event");
    }
    _events.push_back(ev);
    if (!ev->undone()) {
        if (auto res = applyEvent(*ev, *_surface, rasterizer, true); !res) {
            _events.pop_back();
            return Err("PictureBuffer " + std::to_string(_id) + ": push failed", res);
        }
    }
    if (_hasUndoStates && _events.size() % _options.undoStateInterval == 0) {
        if (auto res = saveUndoState(_events.size(), *_surface); !res) {
            ywarn("PictureBuffer {}: {}", _id, error_msg(res));
        }
    }
    return Ok();
}

Result<void> PictureBuffer::insertEvent(PictureEvent::Ptr ev, Rasterizer& rasterizer) {
    if (!ev) {
        return Err("PictureBuffer::insertEvent: null event");
    }
    size_t index = std::min(_insertionPoint, _events.size());
    _events.insert(_events.begin() + static_cast<std::ptrdiff_t>(index), ev);
    if (auto res = rasterizeFrom(index, rasterizer); !res) {
        _events.erase(_events.begin() + static_cast<std::ptrdiff_t>(index));
        return Err("PictureBuffer " + std::to_string(_id) + ": insert failed", res);
    }
    _insertionPoint = index + 1;
    return Ok();
}

int PictureBuffer::findLatest(int sid) const {
    int latest = -1;
    for (size_t i = 0; i < _events.size(); i++) {
        const auto& ev = _events[i];
        if (ev->sid() != sid || ev->undone()) continue;
        if (latest < 0 || ev->sessionEventId() > _events[latest]->sessionEventId()) {
            latest = static_cast<int>(i);
        }
    }
    return latest;
}

int PictureBuffer::eventIndexBySessionId(int sid, int sessionEventId) const {
    for (size_t i = 0; i < _events.size(); i++) {
        if (_events[i]->sid() == sid && _events[i]->sessionEventId() == sessionEventId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

Result<PictureEvent::Ptr> PictureBuffer::undoEventIndex(size_t index, Rasterizer& rasterizer) {
    if (index >= _events.size()) {
        return Err<PictureEvent::Ptr>("undoEventIndex: index out of range", Error::Code::InvalidIndex);
    }
    auto ev = _events[index];
    if (ev->undone()) {
        return Ok(ev);
    }
    ev->setUndone(true);
    if (auto res = rasterizeFrom(index, rasterizer); !res) {
        ev->setUndone(false);
        return Err<PictureEvent::Ptr>("PictureBuffer " + std::to_string(_id) + ": undo failed", res);
    }
    return Ok(ev);
}

Result<PictureEvent::Ptr> PictureBuffer::redoEventIndex(size_t index, Rasterizer& rasterizer) {
    if (index >= _events.size()) {
        return Err<PictureEvent::Ptr>("redoEventIndex: index out of range", Error::Code::InvalidIndex);
    }
    auto ev = _events[index];
    if (!ev->undone()) {
        return Ok(ev);
    }
    ev->setUndone(false);
    if (auto res = rasterizeFrom(index, rasterizer); !res) {
        ev->setUndone(true);
        return Err<PictureEvent::Ptr>("PictureBuffer " + std::to_string(_id) + ": redo failed", res);
    }
    return Ok(ev);
}

Result<PictureEvent::Ptr> PictureBuffer::removeEventIndex(size_t index, Rasterizer& rasterizer) {
    if (index >= _events.size()) {
        return Err<PictureEvent::Ptr>("removeEventIndex: index out of range", Error::Code::InvalidIndex);
    }
    auto ev = _events[index];
    _events.erase(_events.begin() + static_cast<std::ptrdiff_t>(index));
    if (auto res = rasterizeFrom(index, rasterizer); !res) {
        _events.insert(_events.begin() + static_cast<std::ptrdiff_t>(index), ev);
        return Err<PictureEvent::Ptr>("PictureBuffer " + std::to_string(_id) + ": remove failed", res);
    }
    if (index < _insertionPoint) {
        _insertionPoint--;
    }
    return Ok(ev);
}

Result<void> PictureBuffer::rasterizeAll(Rasterizer& rasterizer) {
    return rasterizeFrom(0, rasterizer);
}

Result<void> PictureBuffer::rasterizeFrom(size_t changed, Rasterizer& rasterizer) {
    dropUndoStatesAfter(changed);

    if (!_staging) {
        auto staging = _backend->createSurface("buffer " + std::to_string(_id) + " staging");
        if (!staging) {
            return Err("staging surface", staging);
        }
        _staging = *staging;
    }

    size_t start = 0;
    if (const UndoState* base = latestUndoState(changed)) {
        if (auto res = _staging->copyFrom(*base->surface); !res) {
            return res;
        }
        start = base->index;
    } else if (auto res = _staging->clear(effectiveClearColor()); !res) {
        return res;
    }
    ydebug("PictureBuffer {}: replaying events {}..{}", _id, start, _events.size());

    for (size_t i = start; i < _events.size(); i++) {
        const auto& ev = _events[i];
        if (!ev->undone()) {
            if (auto res = applyEvent(*ev, *_staging, rasterizer, false); !res) {
                dropUndoStatesAfter(changed);
                return Err("replay of event " + std::to_string(i), res);
            }
        }
        size_t replayed = i + 1;
        if (_hasUndoStates && replayed % _options.undoStateInterval == 0 &&
            (_undoStates.empty() || _undoStates.back().index < replayed)) {
            if (auto res = saveUndoState(replayed, *_staging); !res) {
                ywarn("PictureBuffer {}: {}", _id, error_msg(res));
            }
        }
    }

    // The mask of the last replayed event must not be resumed by a later push
    rasterizer.forgetEvent();
    std::swap(_surface, _staging);
    return Ok();
}

//=============================================================================
// Undo states
//=============================================================================

void PictureBuffer::dropUndoStatesAfter(size_t index) {
    while (!_undoStates.empty() && _undoStates.back().index > index) {
        _undoStates.back().surface->free();
        _undoStates.pop_back();
    }
}

const PictureBuffer::UndoState* PictureBuffer::latestUndoState(size_t index) const {
    for (auto it = _undoStates.rbegin(); it != _undoStates.rend(); ++it) {
        if (it->index <= index) {
            return &*it;
        }
    }
    return nullptr;
}

Result<void> PictureBuffer::saveUndoState(size_t index, const Surface& source) {
    if (_options.maxUndoStates == 0) {
        return Ok();
    }
    Surface::Ptr snapshot;
    if (_undoStates.size() >= _options.maxUndoStates) {
        // Reuse the oldest snapshot's storage
        snapshot = _undoStates.front().surface;
        _undoStates.erase(_undoStates.begin());
    } else {
        auto created = _backend->createSurface("buffer " + std::to_string(_id) + " undo state");
        if (!created) {
            return Err("undo state surface", created);
        }
        snapshot = *created;
    }
    if (auto res = snapshot->copyFrom(source); !res) {
        snapshot->free();
        return Err("undo state copy", res);
    }
    _undoStates.push_back({index, snapshot});
    ytrace("PictureBuffer {}: undo state at {} ({} kept)", _id, index, _undoStates.size());
    return Ok();
}

//=============================================================================
// Introspection
//=============================================================================

bool PictureBuffer::mergesBuffer(int bufferId) const {
    for (const auto& ev : _events) {
        if (ev->undone() || ev->kind() != EventKind::BufferMerge) continue;
        if (static_cast<const BufferMergeEvent&>(*ev).merges(bufferId)) {
            return true;
        }
    }
    return false;
}

Result<std::vector<PictureBuffer::Blame>> PictureBuffer::blamePixel(Vec2 coords, Rasterizer& rasterizer) {
    std::vector<Blame> blame;
    int x = static_cast<int>(std::floor(coords.x));
    int y = static_cast<int>(std::floor(coords.y));
    Vec2 center(x + 0.5f, y + 0.5f);
    Rect pixel(static_cast<float>(x), static_cast<float>(x + 1), static_cast<float>(y), static_cast<float>(y + 1));
    if (!rasterizer.fullRect().containsPoint(center)) {
        return Ok(blame);
    }

    for (auto it = _events.rbegin(); it != _events.rend(); ++it) {
        const auto& ev = *it;
        if (ev->undone() || !ev->boundingBox().containsPoint(center)) continue;

        float alpha = 0.0f;
        if (ev->kind() == EventKind::BufferMerge) {
            const auto& merge = static_cast<const BufferMergeEvent&>(*ev);
            float remaining = 1.0f;
            for (int bufferId : merge.mergedBufferIds()) {
                Surface* source = _mergeResolver ? _mergeResolver(bufferId) : nullptr;
                if (!source) continue;
                auto p = source->pixel(x, y);
                if (!p) {
                    return Err<std::vector<Blame>>("blamePixel", p);
                }
                remaining *= 1.0f - color::toUnit(p->a) * merge.opacity();
            }
            alpha = 1.0f - remaining;
        } else if (ev->isRasterEvent()) {
            rasterizer.setClip(pixel);
            if (auto res = rasterizer.beginEvent(ev.get()); !res) {
                return Err<std::vector<Blame>>("blamePixel", res);
            }
            if (auto res = rasterizer.drawEvent(*ev); !res) {
                return Err<std::vector<Blame>>("blamePixel", res);
            }
            auto value = rasterizer.getPixel(x, y);
            if (!value) {
                return Err<std::vector<Blame>>("blamePixel", value);
            }
            alpha = *value * static_cast<const RasterEvent&>(*ev).opacity();
        }
        if (alpha > 0.0f) {
            blame.push_back({ev, std::min(alpha, 1.0f)});
        }
    }
    rasterizer.forgetEvent();
    return Ok(blame);
}

Result<Rgba> PictureBuffer::getPixelRGBA(Vec2 coords) {
    auto p = _surface->pixel(static_cast<int>(std::floor(coords.x)), static_cast<int>(std::floor(coords.y)));
    if (!p) {
        return Err<Rgba>("PictureBuffer::getPixelRGBA", p);
    }
    return Ok(color::unpremultiply(*p));
}

} // namespace pictura
