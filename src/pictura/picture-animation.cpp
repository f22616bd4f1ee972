#include <pictura/picture.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace pictura {

//=============================================================================
// Picture animation
//=============================================================================

bool Picture::animate(int simultaneousStrokes, float speed, std::function<void()> onFinished) {
    if (simultaneousStrokes < 1 || !(speed > 0.0f) || speed > 1.0f) {
        ywarn("Picture {}: invalid animation arguments strokes={} speed={}", _id, simultaneousStrokes, speed);
        return false;
    }
    if (animating()) {
        return true;
    }
    _animationPhase = AnimationPhase::Animating;
    uint64_t generation = ++_animationGeneration;
    std::weak_ptr<Picture> weakSelf = weak_from_this();

    _animation = AnimationState();
    _animation.generation = generation;
    _animation.speed = speed;
    _animation.onFinished = std::move(onFinished);

    if (_buffers.empty()) {
        _frameScheduler->requestFrame([weakSelf, generation]() {
            auto self = weakSelf.lock();
            if (!self || !self->animating() || self->_animationGeneration != generation) return;
            self->_animationPhase = AnimationPhase::Idle;
            auto callback = std::move(self->_animation.onFinished);
            self->_animation = AnimationState();
            if (callback) callback();
        });
        return true;
    }

    for (const auto& source : _buffers) {
        _animation.totalEvents += source->eventCount();
        auto buffer = PictureBuffer::create(_backend, -1, source->clearColor(), false, source->hasAlpha(),
                                            _options.buffer);
        if (!buffer) {
            yerror("Picture {}: cannot create animation buffer: {}", _id, error_msg(buffer));
            _animation.release();
            _animationPhase = AnimationPhase::Idle;
            return false;
        }
        // Merges during playback read the animated copies, not the committed buffers
        (*buffer)->setMergeResolver([this](int bufferId) -> Surface* {
            int index = findBufferIndex(bufferId);
            if (index < 0 || static_cast<size_t>(index) >= _animation.buffers.size()) return nullptr;
            return &_animation.buffers[index]->surface();
        });
        _animation.buffers.push_back(*buffer);
    }
    _animation.previews.resize(_animation.buffers.size());

    size_t strokes = std::min(static_cast<size_t>(simultaneousStrokes), _animation.totalEvents);
    for (size_t i = 0; i < strokes; i++) {
        auto rasterizer = _backend->createRasterizer();
        if (!rasterizer) {
            yerror("Picture {}: cannot create animation rasterizer: {}", _id, error_msg(rasterizer));
            _animation.release();
            _animationPhase = AnimationPhase::Idle;
            return false;
        }
        (*rasterizer)->setClip(bitmapRect());
        AnimationStroke stroke = nextAnimationStroke(_animation, _buffers);
        stroke.rasterizer = *rasterizer;
        _animation.strokes.push_back(std::move(stroke));
    }
    ydebug("Picture {}: animating {} events with {} strokes at speed {}", _id, _animation.totalEvents,
           strokes, speed);

    _frameScheduler->requestFrame([weakSelf, generation]() {
        if (auto self = weakSelf.lock()) self->animationFrame(generation);
    });
    return true;
}

void Picture::animationFrame(uint64_t generation) {
    if (!animating() || generation != _animationGeneration) {
        return;
    }
    auto& state = _animation;
    size_t strokeCount = state.strokes.size();
    size_t finished = 0;
    float posForStroke = state.position;
    state.position += state.speed;

    for (auto& stroke : state.strokes) {
        posForStroke -= 1.0f / static_cast<float>(strokeCount);
        if (stroke.eventIndex >= state.totalEvents) {
            if (stroke.rasterizer) {
                stroke.rasterizer->free();
                stroke.rasterizer.reset();
            }
            finished++;
            continue;
        }
        if (posForStroke <= 0.0f) {
            continue;
        }
        auto target = animationTarget(_buffers, stroke.eventIndex);
        if (!target) {
            stroke.eventIndex = state.totalEvents;
            continue;
        }
        float untilPos = std::fmod(posForStroke, 1.0f) + state.speed;
        if (untilPos > 1.0f) {
            auto& buffer = *state.buffers[target->bufferIndex];
            if (auto res = buffer.pushEvent(target->event, *stroke.rasterizer); !res) {
                ywarn("Picture {}: animation push failed: {}", _id, error_msg(res));
            }
            Rasterizer::Ptr rasterizer = std::move(stroke.rasterizer);
            stroke = nextAnimationStroke(state, _buffers);
            stroke.rasterizer = std::move(rasterizer);
            if (auto res = stroke.rasterizer->clear(); !res) {
                ywarn("Picture {}: animation rasterizer clear failed: {}", _id, error_msg(res));
            }
            stroke.rasterizer->setClip(bitmapRect());
        } else {
            size_t untilCoord = animationCutoff(target->event->coordCount(), untilPos);
            if (auto res = target->event->updateTo(*stroke.rasterizer, untilCoord); !res) {
                ywarn("Picture {}: animation draw failed: {}", _id, error_msg(res));
            }
        }
    }

    if (finished != strokeCount) {
        if (auto res = displayAnimation(); !res) {
            ywarn("Picture {}: {}", _id, error_msg(res));
        }
        std::weak_ptr<Picture> weakSelf = weak_from_this();
        _frameScheduler->requestFrame([weakSelf, generation]() {
            if (auto self = weakSelf.lock()) self->animationFrame(generation);
        });
        return;
    }

    auto callback = std::move(state.onFinished);
    stopAnimating();
    if (callback) callback();
}

void Picture::stopAnimating() {
    if (!animating()) {
        return;
    }
    _animationPhase = AnimationPhase::Idle;
    _animation.release();
    _animation = AnimationState();
    if (auto res = display(); !res) {
        ywarn("Picture {}: {}", _id, error_msg(res));
    }
}

Result<void> Picture::displayAnimation() {
    auto& state = _animation;

    // Strokes draw in bottom to top event order, starting from the oldest one
    size_t offset = 0;
    for (size_t i = 0; i < state.strokes.size(); i++) {
        if (state.strokes[i].eventIndex < state.strokes[offset].eventIndex) {
            offset = i;
        }
    }

    std::vector<CompositeLayer> layers;
    for (size_t i = 0; i < state.buffers.size(); i++) {
        if (!_buffers[i]->visible() || isMerged(i, _buffers)) continue;
        Surface* layer = &state.buffers[i]->surface();

        for (size_t j = 0; j < state.strokes.size(); j++) {
            auto& stroke = state.strokes[(j + offset) % state.strokes.size()];
            if (stroke.eventIndex >= state.totalEvents || stroke.bufferIndex != i || !stroke.rasterizer) continue;
            auto target = animationTarget(_buffers, stroke.eventIndex);
            if (!target || !target->event->isRasterEvent() || target->event->mode() == BlendMode::Eraser) continue;
            if (stroke.rasterizer->drawingEvent() != target->event.get()) continue;

            auto& preview = state.previews[i];
            if (layer != preview.get()) {
                if (!preview) {
                    auto surface = _backend->createSurface("animation-preview");
                    if (!surface) {
                        return Err("Picture::displayAnimation", surface);
                    }
                    preview = *surface;
                }
                if (auto res = preview->copyFrom(*layer); !res) {
                    return Err("Picture::displayAnimation", res);
                }
                layer = preview.get();
            }
            const auto& raster = static_cast<const RasterEvent&>(*target->event);
            if (auto res = stroke.rasterizer->drawWithColor(*preview, raster.color(), raster.opacity(),
                                                            raster.mode(), bitmapRect());
                !res) {
                return Err("Picture::displayAnimation", res);
            }
        }
        layers.push_back({layer, state.buffers[i]->hasAlpha()});
    }
    return _backend->compositor().composite(layers, std::nullopt);
}

} // namespace pictura
