#pragma once

#include <pictura/blend-mode.h>
#include <pictura/result.hpp>
#include <pictura/types.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pictura {

class Rasterizer;

enum class EventKind {
    Brush,
    Scatter,
    Fill,
    Gradient,
    BufferMerge,
};

/**
 * PictureEvent is one user drawing action.
 *
 * Identity is (sid, sessionEventId). Payload coordinates are kept in
 * picture space; the display scale set by the owning Picture is applied
 * when the event is rasterized, so serialization always writes picture
 * space values.
 */
class PictureEvent {
public:
    using Ptr = std::shared_ptr<PictureEvent>;

    virtual ~PictureEvent() = default;

    // Non-copyable
    PictureEvent(const PictureEvent&) = delete;
    PictureEvent& operator=(const PictureEvent&) = delete;

    int sid() const { return _sid; }
    int sessionEventId() const { return _sessionEventId; }
    bool undone() const { return _undone; }
    void setUndone(bool undone) { _undone = undone; }
    BlendMode mode() const { return _mode; }

    float displayScale() const { return _displayScale; }
    void setDisplayScale(float scale) { _displayScale = scale; }

    virtual EventKind kind() const = 0;
    virtual bool isRasterEvent() const { return false; }

    // One token line, kind tag first
    virtual std::string serialize() const = 0;

    // Area the event may touch, in bitmap pixels
    virtual Rect boundingBox() const = 0;

    // Number of coordinate values; partial draws count in these
    virtual size_t coordCount() const { return 0; }

    /**
     * Draw into the rasterizer mask. Continues an earlier partial draw when
     * the rasterizer is already drawing this event, otherwise starts over.
     *
     * @param untilCoord Coordinate cutoff, rounded up to whole triples
     */
    virtual Result<void> updateTo(Rasterizer& rasterizer,
                                  std::optional<size_t> untilCoord = std::nullopt) const = 0;

    static Result<Ptr> parse(const std::vector<std::string_view>& tokens);

protected:
    PictureEvent(int sid, int sessionEventId, bool undone, BlendMode mode);

    std::string serializeHeader(const char* tag) const;

    int _sid;
    int _sessionEventId;
    bool _undone;
    BlendMode _mode;
    float _displayScale = 1.0f;
};

//=============================================================================
// RasterEvent - events drawn through a rasterizer mask with a solid color
//=============================================================================

class RasterEvent : public PictureEvent {
public:
    using Ptr = std::shared_ptr<RasterEvent>;

    bool isRasterEvent() const override { return true; }

    Rgba color() const { return _color; }
    float opacity() const { return _opacity; }

    // Brush texture this event samples, -1 for none
    virtual int textureIndex() const { return -1; }

protected:
    RasterEvent(int sid, int sessionEventId, bool undone, Rgba color, float opacity, BlendMode mode);

    Rgba _color;
    float _opacity;
};

//=============================================================================
// BrushEvent - dabs stamped along a polyline of (x, y, pressure) triples
//=============================================================================

class BrushEvent : public RasterEvent {
public:
    using Ptr = std::shared_ptr<BrushEvent>;

    static Ptr create(int sid, int sessionEventId, bool undone, Rgba color,
                      float flow, float opacity, float radius, float softness,
                      BlendMode mode, int textureId = 0);

    EventKind kind() const override { return EventKind::Brush; }
    std::string serialize() const override;
    Rect boundingBox() const override;
    size_t coordCount() const override { return _coords.size(); }
    Result<void> updateTo(Rasterizer& rasterizer, std::optional<size_t> untilCoord) const override;
    int textureIndex() const override { return _textureId > 0 ? _textureId - 1 : -1; }

    // Extend a stroke that is still being drawn
    void pushCoordTriplet(float x, float y, float pressure);

    const std::vector<float>& coords() const { return _coords; }
    float flow() const { return _flow; }
    float radius() const { return _radius; }
    float softness() const { return _softness; }
    int textureId() const { return _textureId; }

    // Distance between dabs for a dab of the given radius, in bitmap pixels
    static float dabSpacing(float radius);

protected:
    BrushEvent(int sid, int sessionEventId, bool undone, Rgba color, float flow, float opacity,
               float radius, float softness, BlendMode mode, int textureId);

    std::string serializeWithTag(const char* tag) const;
    Vec2 pointAt(size_t triple) const;
    float radiusAt(size_t triple) const;
    size_t cutoff(std::optional<size_t> untilCoord) const;

    float _flow;
    float _radius;
    float _softness;
    int _textureId;
    std::vector<float> _coords;
};

//=============================================================================
// ScatterEvent - one dab per triple, no interpolation between points
//=============================================================================

class ScatterEvent : public BrushEvent {
public:
    using Ptr = std::shared_ptr<ScatterEvent>;

    static Ptr create(int sid, int sessionEventId, bool undone, Rgba color,
                      float flow, float opacity, float radius, float softness,
                      BlendMode mode, int textureId = 0);

    EventKind kind() const override { return EventKind::Scatter; }
    std::string serialize() const override;
    Result<void> updateTo(Rasterizer& rasterizer, std::optional<size_t> untilCoord) const override;

private:
    using BrushEvent::BrushEvent;
};

//=============================================================================
// FillEvent - solid rectangle
//=============================================================================

class FillEvent : public RasterEvent {
public:
    using Ptr = std::shared_ptr<FillEvent>;

    static Ptr create(int sid, int sessionEventId, bool undone, Rgba color,
                      float opacity, BlendMode mode, const Rect& rect);

    EventKind kind() const override { return EventKind::Fill; }
    std::string serialize() const override;
    Rect boundingBox() const override;
    Result<void> updateTo(Rasterizer& rasterizer, std::optional<size_t> untilCoord) const override;

    const Rect& rect() const { return _rect; }

private:
    FillEvent(int sid, int sessionEventId, bool undone, Rgba color, float opacity,
              BlendMode mode, const Rect& rect);

    Rect _rect;
};

//=============================================================================
// GradientEvent - linear ramp from full coverage at p0 to none at p1
//=============================================================================

class GradientEvent : public RasterEvent {
public:
    using Ptr = std::shared_ptr<GradientEvent>;

    static Ptr create(int sid, int sessionEventId, bool undone, Rgba color,
                      float opacity, BlendMode mode, Vec2 p0, Vec2 p1);

    EventKind kind() const override { return EventKind::Gradient; }
    std::string serialize() const override;
    Rect boundingBox() const override;
    Result<void> updateTo(Rasterizer& rasterizer, std::optional<size_t> untilCoord) const override;

    Vec2 p0() const { return _p0; }
    Vec2 p1() const { return _p1; }

private:
    GradientEvent(int sid, int sessionEventId, bool undone, Rgba color, float opacity,
                  BlendMode mode, Vec2 p0, Vec2 p1);

    Vec2 _p0;
    Vec2 _p1;
};

//=============================================================================
// BufferMergeEvent - composites other buffers into the owning buffer
//=============================================================================

class BufferMergeEvent : public PictureEvent {
public:
    using Ptr = std::shared_ptr<BufferMergeEvent>;

    static Ptr create(int sid, int sessionEventId, bool undone, float opacity,
                      std::vector<int> mergedBufferIds);

    EventKind kind() const override { return EventKind::BufferMerge; }
    std::string serialize() const override;
    Rect boundingBox() const override;
    Result<void> updateTo(Rasterizer& rasterizer, std::optional<size_t> untilCoord) const override;

    float opacity() const { return _opacity; }
    const std::vector<int>& mergedBufferIds() const { return _mergedBufferIds; }
    bool merges(int bufferId) const;

private:
    BufferMergeEvent(int sid, int sessionEventId, bool undone, float opacity,
                     std::vector<int> mergedBufferIds);

    float _opacity;
    std::vector<int> _mergedBufferIds;
};

// Shortest text that reads back as the same float within 6 significant digits
std::string formatFloat(float value);

} // namespace pictura
