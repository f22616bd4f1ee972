#pragma once

#include <pictura/backend.h>
#include <pictura/picture-event.h>
#include <pictura/rasterizer.h>
#include <pictura/result.hpp>
#include <pictura/surface.h>
#include <pictura/types.h>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace pictura {

/**
 * PictureBuffer is one layer: an ordered list of events and the surface
 * holding the replay of every event that is not undone.
 *
 * pushEvent draws only the new event. Every other mutation (insert, undo,
 * redo, remove) re-rasterizes from the newest undo state at or before the
 * first changed event, or from the clear color. Re-rasterization renders
 * into a staging surface which replaces the committed surface only when
 * every event applied; on failure the event list is restored too.
 */
class PictureBuffer {
public:
    using Ptr = std::shared_ptr<PictureBuffer>;

    // Committed surface of a buffer by id, null when unknown
    using MergeResolver = std::function<Surface*(int bufferId)>;

    struct Options {
        size_t undoStateInterval = 16;  // committed events between snapshots
        size_t maxUndoStates = 5;
    };

    struct Blame {
        PictureEvent::Ptr event;
        float alpha = 0.0f;
    };

    static Result<Ptr> create(RenderBackend::Ptr backend, int id, Rgba clearColor,
                              bool hasUndoStates, bool hasAlpha, const Options& options);

    ~PictureBuffer();

    // Non-copyable
    PictureBuffer(const PictureBuffer&) = delete;
    PictureBuffer& operator=(const PictureBuffer&) = delete;

    int id() const { return _id; }
    Rgba clearColor() const { return _clearColor; }
    bool hasAlpha() const { return _hasAlpha; }
    bool hasUndoStates() const { return _hasUndoStates; }

    bool visible() const { return _visible; }
    void setVisible(bool visible) { _visible = visible; }

    size_t insertionPoint() const { return _insertionPoint; }
    void setInsertionPoint(size_t index) { _insertionPoint = index; }

    const std::vector<PictureEvent::Ptr>& events() const { return _events; }
    size_t eventCount() const { return _events.size(); }

    Surface& surface() { return *_surface; }
    const Surface& surface() const { return *_surface; }

    void setMergeResolver(MergeResolver resolver) { _mergeResolver = std::move(resolver); }

    /**
     * Append ev and draw it over the committed surface. Continues the
     * rasterizer's partial draw when it is already drawing ev.
     */
    Result<void> pushEvent(PictureEvent::Ptr ev, Rasterizer& rasterizer);

    // Insert ev at the insertion point, advance it and re-rasterize
    Result<void> insertEvent(PictureEvent::Ptr ev, Rasterizer& rasterizer);

    // Index of sid's not undone event with the highest sessionEventId, or -1
    int findLatest(int sid) const;

    // Index of the event with this identity, or -1
    int eventIndexBySessionId(int sid, int sessionEventId) const;

    Result<PictureEvent::Ptr> undoEventIndex(size_t index, Rasterizer& rasterizer);
    Result<PictureEvent::Ptr> redoEventIndex(size_t index, Rasterizer& rasterizer);
    Result<PictureEvent::Ptr> removeEventIndex(size_t index, Rasterizer& rasterizer);

    // Replay every event from the clear color
    Result<void> rasterizeAll(Rasterizer& rasterizer);

    /**
     * Events touching one pixel, newest first.
     *
     * @param coords Pixel in bitmap coordinates
     * @return Pairs of event and the alpha it contributes at that pixel
     */
    Result<std::vector<Blame>> blamePixel(Vec2 coords, Rasterizer& rasterizer);

    // Committed pixel, unpremultiplied
    Result<Rgba> getPixelRGBA(Vec2 coords);

    // Events this buffer merges while the merge is not undone
    bool mergesBuffer(int bufferId) const;

    size_t undoStateCount() const { return _undoStates.size(); }

    // Release every surface; safe to call more than once
    void free();

private:
    PictureBuffer(RenderBackend::Ptr backend, int id, Rgba clearColor, bool hasUndoStates,
                  bool hasAlpha, const Options& options);

    Result<void> init() noexcept;

    struct UndoState {
        size_t index;  // number of events replayed into surface
        Surface::Ptr surface;
    };

    Rgba effectiveClearColor() const;
    Result<void> applyEvent(const PictureEvent& ev, Surface& target, Rasterizer& rasterizer, bool resume);
    Result<void> applyMerge(const BufferMergeEvent& ev, Surface& target);
    Result<void> rasterizeFrom(size_t changed, Rasterizer& rasterizer);

    void dropUndoStatesAfter(size_t index);
    const UndoState* latestUndoState(size_t index) const;
    Result<void> saveUndoState(size_t index, const Surface& source);

    RenderBackend::Ptr _backend;
    int _id;
    Rgba _clearColor;
    bool _hasUndoStates;
    bool _hasAlpha;
    bool _visible = true;
    Options _options;
    size_t _insertionPoint = 0;

    std::vector<PictureEvent::Ptr> _events;
    Surface::Ptr _surface;
    Surface::Ptr _staging;
    std::vector<UndoState> _undoStates;
    MergeResolver _mergeResolver;
    bool _freed = false;
};

} // namespace pictura
