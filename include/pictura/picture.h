#pragma once

#include <pictura/animation.h>
#include <pictura/backend.h>
#include <pictura/brush-textures.h>
#include <pictura/picture-buffer.h>
#include <pictura/picture-event.h>
#include <pictura/rasterizer.h>
#include <pictura/result.hpp>
#include <pictura/types.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pictura {

class Config;
class GpuContext;
class Picture;

struct PictureOptions {
    PictureBuffer::Options buffer;
    int maxLayersPerPass = 12;
    int simultaneousStrokes = 1;
    float animationSpeed = 0.05f;

    std::shared_ptr<const std::vector<BrushImage>> brushTextures;

    // Frame source for animate(); a ManualFrameScheduler is made when null
    FrameScheduler::Ptr frameScheduler;

    // Device to render with; the process wide context when null
    std::shared_ptr<GpuContext> gpuContext;

    static PictureOptions fromConfig(const Config& config);

    // picture/modes as backend modes; unknown names are skipped
    static std::vector<BackendMode> modesFromConfig(const Config& config);
};

struct ParsedPicture {
    std::shared_ptr<Picture> picture;
    std::vector<std::string> metadata;  // "metadata" line and everything after it
};

/**
 * Picture is an editable document: an ordered stack of buffers plus the
 * event currently being drawn.
 *
 * Mutations take effect on the buffers immediately; call display() to
 * refresh the composited image. All calls happen on one thread.
 */
class Picture : public std::enable_shared_from_this<Picture> {
public:
    using Ptr = std::shared_ptr<Picture>;

    /**
     * Create a picture with the first backend mode that constructs and
     * passes its sanity check.
     *
     * @param bitmapScale Rasterization scale applied to every pushed event
     * @param currentBufferAttachment Buffer index the live event draws into, -1 for none
     */
    static Result<Ptr> create(int id, int width, int height, float bitmapScale,
                              const std::vector<BackendMode>& modesToTry,
                              int currentBufferAttachment,
                              const PictureOptions& options = PictureOptions());

    // Build a picture from serialize() output; see serialization.h
    static Result<ParsedPicture> parse(int id, std::string_view serialization, float bitmapScale,
                                       const std::vector<BackendMode>& modesToTry,
                                       int currentBufferAttachment,
                                       const PictureOptions& options = PictureOptions());

    ~Picture();

    // Non-copyable
    Picture(const Picture&) = delete;
    Picture& operator=(const Picture&) = delete;

    int id() const { return _id; }
    BackendMode mode() const { return _backend->mode(); }
    bool usesGpu() const { return _backend->usesGpu(); }

    int width() const { return _width; }
    int height() const { return _height; }
    int bitmapWidth() const { return static_cast<int>(_backend->width()); }
    int bitmapHeight() const { return static_cast<int>(_backend->height()); }
    float bitmapScale() const { return _bitmapScale; }
    Rect bitmapRect() const;

    // Milliseconds parse() spent building this picture
    double generationTime() const { return _generationTime; }
    void setGenerationTime(double ms) { _generationTime = ms; }

    //=========================================================================
    // Buffers
    //=========================================================================

    // Add a buffer on top of the stack
    Result<PictureBuffer*> addBuffer(int id, Rgba clearColor, bool hasUndoStates, bool hasAlpha);
    Result<void> removeBuffer(size_t index);

    // The current buffer stays attached to the moved buffer
    Result<void> moveBuffer(size_t fromPosition, size_t toPosition);

    size_t bufferCount() const { return _buffers.size(); }
    PictureBuffer& buffer(size_t index) { return *_buffers[index]; }
    const PictureBuffer& buffer(size_t index) const { return *_buffers[index]; }
    int findBufferIndex(int id) const;

    // Re-targets the live event; it previews with the new buffer's alpha
    Result<void> setCurrentBufferAttachment(int attachment);
    int currentBufferAttachment() const { return _currentBufferAttachment; }

    void setBufferVisible(PictureBuffer& buffer, bool visible);

    //=========================================================================
    // Events
    //=========================================================================

    // Apply the bitmap scale to ev and draw it on top of target
    Result<void> pushEvent(PictureBuffer& target, PictureEvent::Ptr ev);

    // Apply the bitmap scale to ev and insert it at target's insertion point
    Result<void> insertEvent(PictureBuffer& target, PictureEvent::Ptr ev);

    // Push an event that already carries the bitmap scale
    Result<void> transferEvent(PictureBuffer& target, PictureEvent::Ptr ev);

    // Undo sid's newest event across all buffers; null when there is none
    Result<PictureEvent::Ptr> undoLatest(int sid);

    // false when no buffer holds the event
    Result<bool> undoEventSessionId(int sid, int sessionEventId);
    Result<bool> redoEventSessionId(int sid, int sessionEventId);
    Result<bool> removeEventSessionId(int sid, int sessionEventId);

    // Remove ev from source if it is there, then push it to target
    Result<void> moveEvent(PictureBuffer& target, PictureBuffer& source, PictureEvent::Ptr ev);

    /**
     * Set the event the user is drawing, or clear it with null. Call again
     * after extending the event to draw the new part.
     */
    Result<void> setCurrentBuffer(PictureEvent::Ptr ev);
    const PictureEvent::Ptr& currentEvent() const { return _currentEvent; }

    // Mode the live event previews with, eraser shown as normal on an opaque attachment
    BlendMode currentBufferMode() const;

    //=========================================================================
    // Output
    //=========================================================================

    // Composite the visible buffers; no-op while animating
    Result<void> display();

    PictureElements pictureElements() { return _backend->pictureElements(); }

    // Display, then read the image as unpremultiplied RGBA8 rows
    Result<std::vector<uint8_t>> toPixels();

    // Display, then read one unpremultiplied pixel in bitmap coordinates
    Result<Rgba> getPixelRGBA(Vec2 coords);

    // Events touching a pixel, topmost buffer and newest event first
    Result<std::vector<PictureBuffer::Blame>> blamePixel(Vec2 coords);

    std::string serialize() const;

    // Number of compositing programs the backend has built
    size_t compositingProgramCount() const { return _backend->compositor().programCount(); }

    //=========================================================================
    // Animation
    //=========================================================================

    bool supportsAnimation() const { return true; }

    /**
     * Replay the picture from its first event.
     *
     * @param simultaneousStrokes Events drawn at the same time, at least 1
     * @param speed Fraction of an event drawn per frame, in (0, 1]
     * @param onFinished Called once after the last event finished
     * @return false if arguments are invalid, true if started or already running
     */
    bool animate(int simultaneousStrokes, float speed, std::function<void()> onFinished = {});

    // Cancel the animation, release its resources and display
    void stopAnimating();

    bool animating() const { return _animationPhase == AnimationPhase::Animating; }
    FrameScheduler& frameScheduler() { return *_frameScheduler; }

private:
    Picture(int id, int width, int height, float bitmapScale, RenderBackend::Ptr backend,
            int currentBufferAttachment, const PictureOptions& options);

    Result<void> init() noexcept;

    Result<PictureBuffer::Ptr> createBuffer(int id, Rgba clearColor, bool hasUndoStates, bool hasAlpha);
    Result<size_t> bufferIndexOf(const PictureBuffer& buffer) const;
    Surface* committedSurface(int bufferId);
    bool isMerged(size_t index, const std::vector<PictureBuffer::Ptr>& buffers) const;
    bool liveAttachment() const;
    Result<void> drawCurrentEvent();

    void animationFrame(uint64_t generation);
    Result<void> displayAnimation();

    int _id;
    int _width;
    int _height;
    float _bitmapScale;
    RenderBackend::Ptr _backend;
    PictureOptions _options;
    double _generationTime = 0.0;

    std::vector<PictureBuffer::Ptr> _buffers;
    int _currentBufferAttachment;
    PictureEvent::Ptr _currentEvent;

    // Live event's rasterizer, and the one every other draw goes through
    Rasterizer::Ptr _currentBufferRasterizer;
    Rasterizer::Ptr _genericRasterizer;

    FrameScheduler::Ptr _frameScheduler;
    AnimationPhase _animationPhase = AnimationPhase::Idle;
    AnimationState _animation;
    uint64_t _animationGeneration = 0;
};

} // namespace pictura
