#pragma once

#include <pictura/picture-buffer.h>
#include <pictura/picture-event.h>
#include <pictura/rasterizer.h>
#include <pictura/surface.h>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace pictura {

//=============================================================================
// Frame scheduling
//=============================================================================

/**
 * Host provided "run this on the next frame" primitive.
 *
 * Callbacks run on the thread that owns the Picture, never from inside
 * requestFrame itself.
 */
class FrameScheduler {
public:
    using Ptr = std::shared_ptr<FrameScheduler>;
    using Callback = std::function<void()>;

    virtual ~FrameScheduler() = default;

    virtual void requestFrame(Callback callback) = 0;
};

// Queue of frame callbacks pumped explicitly by the host or a test
class ManualFrameScheduler : public FrameScheduler {
public:
    using Ptr = std::shared_ptr<ManualFrameScheduler>;

    static Ptr create() { return std::make_shared<ManualFrameScheduler>(); }

    void requestFrame(Callback callback) override;

    size_t pendingFrames() const { return _pending.size(); }

    // Run the callbacks queued before this call; false when none were queued
    bool runFrame();

    // Run frames until the queue stays empty or maxFrames ran
    size_t runUntilIdle(size_t maxFrames = 1000000);

private:
    std::deque<Callback> _pending;
};

//=============================================================================
// Animation state
//=============================================================================

enum class AnimationPhase {
    Idle,
    Animating,
};

// One of the simultaneously animated strokes
struct AnimationStroke {
    Rasterizer::Ptr rasterizer;  // null once the stroke ran out of events
    size_t eventIndex = 0;       // flattened bottom to top index
    size_t bufferIndex = 0;
};

// Event at a flattened index, with the index of its buffer
struct AnimationTarget {
    PictureEvent::Ptr event;
    size_t bufferIndex = 0;
};

struct AnimationState {
    uint64_t generation = 0;
    float position = 0.0f;
    float speed = 0.05f;
    size_t totalEvents = 0;
    size_t nextEvent = 0;  // next flattened index to hand out
    std::vector<PictureBuffer::Ptr> buffers;
    std::vector<Surface::Ptr> previews;  // buffer plus live strokes, lazily made
    std::vector<AnimationStroke> strokes;
    std::function<void()> onFinished;

    // Release every rasterizer and surface; safe to call more than once
    void release();
};

// Locate a flattened bottom to top event index in a buffer stack
std::optional<AnimationTarget> animationTarget(const std::vector<PictureBuffer::Ptr>& buffers, size_t index);

// Claim the next event that is not undone, or totalEvents when none is left
AnimationStroke nextAnimationStroke(AnimationState& state, const std::vector<PictureBuffer::Ptr>& buffers);

// Coordinate cutoff for a stroke drawn up to fraction untilPos
size_t animationCutoff(size_t coordCount, float untilPos);

} // namespace pictura
