#include <pictura/animation.h>
#include <ytrace/ytrace.hpp>
#include <cmath>

namespace pictura {

//=============================================================================
// ManualFrameScheduler
//=============================================================================

void ManualFrameScheduler::requestFrame(Callback callback) {
    _pending.push_back(std::move(callback));
}

bool ManualFrameScheduler::runFrame() {
    if (_pending.empty()) {
        return false;
    }
    // Callbacks requested while running belong to the next frame
    std::deque<Callback> frame;
    frame.swap(_pending);
    for (auto& callback : frame) {
        if (callback) {
            callback();
        }
    }
    return true;
}

size_t ManualFrameScheduler::runUntilIdle(size_t maxFrames) {
    size_t frames = 0;
    while (frames < maxFrames && runFrame()) {
        frames++;
    }
    if (frames == maxFrames && !_pending.empty()) {
        ywarn("ManualFrameScheduler: stopped after {} frames with {} pending", frames, _pending.size());
    }
    return frames;
}

//=============================================================================
// AnimationState
//=============================================================================

void AnimationState::release() {
    for (auto& stroke : strokes) {
        if (stroke.rasterizer) {
            stroke.rasterizer->free();
            stroke.rasterizer.reset();
        }
    }
    strokes.clear();
    for (auto& preview : previews) {
        if (preview) {
            preview->free();
        }
    }
    previews.clear();
    for (auto& buffer : buffers) {
        buffer->free();
    }
    buffers.clear();
}

std::optional<AnimationTarget> animationTarget(const std::vector<PictureBuffer::Ptr>& buffers, size_t index) {
    for (size_t i = 0; i < buffers.size(); i++) {
        const auto& events = buffers[i]->events();
        if (index < events.size()) {
            return AnimationTarget{events[index], i};
        }
        index -= events.size();
    }
    return std::nullopt;
}

AnimationStroke nextAnimationStroke(AnimationState& state, const std::vector<PictureBuffer::Ptr>& buffers) {
    AnimationStroke stroke;
    size_t index = state.nextEvent;
    while (index < state.totalEvents) {
        auto target = animationTarget(buffers, index);
        if (!target) {
            index = state.totalEvents;
            break;
        }
        if (!target->event->undone()) {
            stroke.bufferIndex = target->bufferIndex;
            break;
        }
        index++;
    }
    stroke.eventIndex = index;
    state.nextEvent = std::min(index + 1, state.totalEvents);
    return stroke;
}

size_t animationCutoff(size_t coordCount, float untilPos) {
    float until = static_cast<float>(coordCount) * untilPos;
    return static_cast<size_t>(std::ceil(until / 3.0f)) * 3;
}

} // namespace pictura
