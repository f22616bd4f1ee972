#include <pictura/picture-event.h>
#include <pictura/mask-primitive.h>
#include <pictura/rasterizer.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace pictura {

namespace {

// Events that cover the whole bitmap report this before clipping
const Rect UNBOUNDED(-1.0e7f, 1.0e7f, -1.0e7f, 1.0e7f);

// Minimum distance between dabs, bitmap pixels
constexpr float MIN_DAB_SPACING = 0.5f;
constexpr float DAB_SPACING_RATIO = 0.15f;

// Upper bound on dabs stamped for one stroke segment
constexpr size_t MAX_DABS_PER_SEGMENT = 1 << 18;

// Textured dabs cover a square, round ones a circle
constexpr float TEXTURED_DAB_EXTENT = 1.4143f;

Result<PictureEvent::Ptr> malformed(const std::string& what) {
    return Err<PictureEvent::Ptr>("Malformed event line: " + what, Error::Code::MalformedSerialization);
}

bool parseInt(std::string_view token, int& out) {
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc() && ptr == token.data() + token.size();
}

// Rejects inf and nan, which from_chars accepts
bool parseFloat(std::string_view token, float& out) {
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc() && ptr == token.data() + token.size() && std::isfinite(out);
}

/**
 * Clip the segment a -> b against rect.
 *
 * @param len Length of the segment
 * @param t0 Distance from a where the segment enters rect
 * @param t1 Distance from a where it leaves
 * @return false if the segment misses rect
 */
bool clipSegment(Vec2 a, Vec2 b, double len, const Rect& rect, double& t0, double& t1) {
    double dx = (static_cast<double>(b.x) - a.x) / len;
    double dy = (static_cast<double>(b.y) - a.y) / len;
    t0 = 0.0;
    t1 = len;
    // Keeps the part where p * t <= q
    auto edge = [&](double p, double q) {
        if (p == 0.0) return q >= 0.0;
        double r = q / p;
        if (p < 0.0) {
            if (r > t1) return false;
            t0 = std::max(t0, r);
        } else {
            if (r < t0) return false;
            t1 = std::min(t1, r);
        }
        return true;
    };
    return edge(-dx, static_cast<double>(a.x) - rect.left) &&
           edge(dx, static_cast<double>(rect.right) - a.x) &&
           edge(-dy, static_cast<double>(a.y) - rect.top) &&
           edge(dy, static_cast<double>(rect.bottom) - a.y) &&
           t0 <= t1;
}

// Area where a dab of radius r can still touch the bitmap
Rect dabReach(const Rect& bitmap, float radius, bool textured) {
    float pad = radius * (textured ? TEXTURED_DAB_EXTENT : 1.0f) + 2.0f;
    return Rect(bitmap.left - pad, bitmap.right + pad, bitmap.top - pad, bitmap.bottom + pad);
}

bool parseFlag(std::string_view token, bool& out) {
    if (token == "1") {
        out = true;
        return true;
    }
    if (token == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parseColorComponent(std::string_view token, uint8_t& out) {
    int v = 0;
    if (!parseInt(token, v) || v < 0 || v > 255) return false;
    out = static_cast<uint8_t>(v);
    return true;
}

struct Header {
    int sid = 0;
    int sessionEventId = 0;
    bool undone = false;
};

bool parseHeader(const std::vector<std::string_view>& tokens, Header& header) {
    return tokens.size() >= 4 &&
           parseInt(tokens[1], header.sid) &&
           parseInt(tokens[2], header.sessionEventId) &&
           parseFlag(tokens[3], header.undone);
}

bool parseMode(std::string_view token, BlendMode& mode) {
    int id = 0;
    if (!parseInt(token, id)) return false;
    auto parsed = blendModeFromId(id);
    if (!parsed) return false;
    mode = *parsed;
    return true;
}

Result<PictureEvent::Ptr> parseBrushLike(const std::vector<std::string_view>& tokens, bool scatter) {
    Header h;
    Rgba color{0, 0, 0, 255};
    float flow = 0, opacity = 0, radius = 0, softness = 0;
    BlendMode mode = BlendMode::Normal;
    int textureId = 0;
    if (tokens.size() < 13 || (tokens.size() - 13) % 3 != 0 ||
        !parseHeader(tokens, h) ||
        !parseColorComponent(tokens[4], color.r) ||
        !parseColorComponent(tokens[5], color.g) ||
        !parseColorComponent(tokens[6], color.b) ||
        !parseFloat(tokens[7], flow) ||
        !parseFloat(tokens[8], opacity) ||
        !parseFloat(tokens[9], radius) ||
        !parseFloat(tokens[10], softness) ||
        !parseMode(tokens[11], mode) ||
        !parseInt(tokens[12], textureId)) {
        return malformed(std::string(tokens[0]));
    }
    BrushEvent::Ptr ev = scatter
        ? BrushEvent::Ptr(ScatterEvent::create(h.sid, h.sessionEventId, h.undone, color, flow, opacity, radius, softness, mode, textureId))
        : BrushEvent::create(h.sid, h.sessionEventId, h.undone, color, flow, opacity, radius, softness, mode, textureId);
    for (size_t i = 13; i < tokens.size(); i += 3) {
        float x = 0, y = 0, p = 0;
        if (!parseFloat(tokens[i], x) || !parseFloat(tokens[i + 1], y) || !parseFloat(tokens[i + 2], p)) {
            return malformed(std::string(tokens[0]) + " coordinates");
        }
        ev->pushCoordTriplet(x, y, p);
    }
    return Ok(PictureEvent::Ptr(ev));
}

Result<PictureEvent::Ptr> parseFill(const std::vector<std::string_view>& tokens) {
    Header h;
    Rgba color{0, 0, 0, 255};
    float opacity = 0;
    BlendMode mode = BlendMode::Normal;
    Rect rect;
    if (tokens.size() != 13 ||
        !parseHeader(tokens, h) ||
        !parseColorComponent(tokens[4], color.r) ||
        !parseColorComponent(tokens[5], color.g) ||
        !parseColorComponent(tokens[6], color.b) ||
        !parseFloat(tokens[7], opacity) ||
        !parseMode(tokens[8], mode) ||
        !parseFloat(tokens[9], rect.left) ||
        !parseFloat(tokens[10], rect.right) ||
        !parseFloat(tokens[11], rect.top) ||
        !parseFloat(tokens[12], rect.bottom)) {
        return malformed("fill");
    }
    return Ok(PictureEvent::Ptr(FillEvent::create(h.sid, h.sessionEventId, h.undone, color, opacity, mode, rect)));
}

Result<PictureEvent::Ptr> parseGradient(const std::vector<std::string_view>& tokens) {
    Header h;
    Rgba color{0, 0, 0, 255};
    float opacity = 0;
    BlendMode mode = BlendMode::Normal;
    Vec2 p0(0.0f), p1(0.0f);
    if (tokens.size() != 13 ||
        !parseHeader(tokens, h) ||
        !parseColorComponent(tokens[4], color.r) ||
        !parseColorComponent(tokens[5], color.g) ||
        !parseColorComponent(tokens[6], color.b) ||
        !parseFloat(tokens[7], opacity) ||
        !parseMode(tokens[8], mode) ||
        !parseFloat(tokens[9], p0.x) ||
        !parseFloat(tokens[10], p0.y) ||
        !parseFloat(tokens[11], p1.x) ||
        !parseFloat(tokens[12], p1.y)) {
        return malformed("gradient");
    }
    return Ok(PictureEvent::Ptr(GradientEvent::create(h.sid, h.sessionEventId, h.undone, color, opacity, mode, p0, p1)));
}

Result<PictureEvent::Ptr> parseBufferMerge(const std::vector<std::string_view>& tokens) {
    Header h;
    float opacity = 0;
    if (tokens.size() < 5 || !parseHeader(tokens, h) || !parseFloat(tokens[4], opacity)) {
        return malformed("bufferMerge");
    }
    std::vector<int> ids;
    for (size_t i = 5; i < tokens.size(); ++i) {
        int id = 0;
        if (!parseInt(tokens[i], id)) {
            return malformed("bufferMerge buffer id");
        }
        ids.push_back(id);
    }
    return Ok(PictureEvent::Ptr(BufferMergeEvent::create(h.sid, h.sessionEventId, h.undone, opacity, std::move(ids))));
}

} // namespace

std::string formatFloat(float value) {
    std::ostringstream ss;
    ss << std::setprecision(6) << value;
    return ss.str();
}

//=============================================================================
// PictureEvent
//=============================================================================

PictureEvent::PictureEvent(int sid, int sessionEventId, bool undone, BlendMode mode)
    : _sid(sid), _sessionEventId(sessionEventId), _undone(undone), _mode(mode) {}

std::string PictureEvent::serializeHeader(const char* tag) const {
    return std::string(tag) + " " + std::to_string(_sid) + " " +
           std::to_string(_sessionEventId) + " " + (_undone ? "1" : "0");
}

Result<PictureEvent::Ptr> PictureEvent::parse(const std::vector<std::string_view>& tokens) {
    if (tokens.empty()) {
        return malformed("empty line");
    }
    const auto& tag = tokens[0];
    if (tag == "brush") return parseBrushLike(tokens, false);
    if (tag == "scatter") return parseBrushLike(tokens, true);
    if (tag == "fill") return parseFill(tokens);
    if (tag == "gradient") return parseGradient(tokens);
    if (tag == "bufferMerge") return parseBufferMerge(tokens);
    return malformed("unknown event kind '" + std::string(tag) + "'");
}

RasterEvent::RasterEvent(int sid, int sessionEventId, bool undone, Rgba color, float opacity, BlendMode mode)
    : PictureEvent(sid, sessionEventId, undone, mode), _color{color.r, color.g, color.b, 255}, _opacity(opacity) {}

//=============================================================================
// BrushEvent
//=============================================================================

BrushEvent::BrushEvent(int sid, int sessionEventId, bool undone, Rgba color, float flow, float opacity,
                       float radius, float softness, BlendMode mode, int textureId)
    : RasterEvent(sid, sessionEventId, undone, color, opacity, mode)
    , _flow(flow)
    , _radius(radius)
    , _softness(softness)
    , _textureId(textureId) {}

BrushEvent::Ptr BrushEvent::create(int sid, int sessionEventId, bool undone, Rgba color,
                                   float flow, float opacity, float radius, float softness,
                                   BlendMode mode, int textureId) {
    return Ptr(new BrushEvent(sid, sessionEventId, undone, color, flow, opacity, radius, softness, mode, textureId));
}

void BrushEvent::pushCoordTriplet(float x, float y, float pressure) {
    _coords.push_back(x);
    _coords.push_back(y);
    _coords.push_back(pressure);
}

float BrushEvent::dabSpacing(float radius) {
    return std::max(DAB_SPACING_RATIO * radius, MIN_DAB_SPACING);
}

Vec2 BrushEvent::pointAt(size_t triple) const {
    return Vec2(_coords[triple * 3], _coords[triple * 3 + 1]) * _displayScale;
}

float BrushEvent::radiusAt(size_t triple) const {
    return _radius * _coords[triple * 3 + 2] * _displayScale;
}

size_t BrushEvent::cutoff(std::optional<size_t> untilCoord) const {
    if (!untilCoord) return _coords.size();
    size_t rounded = (*untilCoord + 2) / 3 * 3;
    return std::min(rounded, _coords.size());
}

std::string BrushEvent::serializeWithTag(const char* tag) const {
    std::string line = serializeHeader(tag);
    line += " " + std::to_string(_color.r) + " " + std::to_string(_color.g) + " " + std::to_string(_color.b);
    line += " " + formatFloat(_flow) + " " + formatFloat(_opacity) + " " + formatFloat(_radius) +
            " " + formatFloat(_softness);
    line += " " + std::to_string(static_cast<int>(_mode)) + " " + std::to_string(_textureId);
    for (float c : _coords) {
        line += " " + formatFloat(c);
    }
    return line;
}

std::string BrushEvent::serialize() const {
    return serializeWithTag("brush");
}

Rect BrushEvent::boundingBox() const {
    Rect box = Rect::empty();
    float extent = _textureId > 0 ? TEXTURED_DAB_EXTENT : 1.0f;
    for (size_t i = 0; i + 2 < _coords.size(); i += 3) {
        box.unionCircle(pointAt(i / 3), radiusAt(i / 3) * extent + 2.0f);
    }
    return box;
}

Result<void> BrushEvent::updateTo(Rasterizer& rasterizer, std::optional<size_t> untilCoord) const {
    if (rasterizer.drawingEvent() != this) {
        if (auto res = rasterizer.beginEvent(this); !res) {
            return res;
        }
    }
    DrawProgress& state = rasterizer.progress();
    size_t end = cutoff(untilCoord);
    int texture = textureIndex();
    std::vector<MaskPrimitive> prims;
    Rect bitmap = rasterizer.fullRect();
    auto stamp = [&](Vec2 p, float radius) {
        if (radius > 0.0f && std::isfinite(radius) && dabReach(bitmap, radius, texture >= 0).containsPoint(p)) {
            prims.push_back(MaskPrimitive::dab(p, radius, _softness, _flow, texture));
        }
    };

    if (!state.started && end >= 3) {
        stamp(pointAt(0), radiusAt(0));
        state.started = true;
        state.coordIndex = 3;
        state.carry = 0.0f;
    }
    while (state.coordIndex + 3 <= end) {
        size_t triple = state.coordIndex / 3;
        Vec2 a = pointAt(triple - 1);
        Vec2 b = pointAt(triple);
        double ra = radiusAt(triple - 1);
        double rb = radiusAt(triple);
        double len = glm::distance(glm::dvec2(a), glm::dvec2(b));
        double travelled = state.carry;
        double t0 = 0.0, t1 = 0.0;
        if (!std::isfinite(len) || !std::isfinite(ra) || !std::isfinite(rb)) {
            travelled = 0.0;
        } else if (len > 0.0 &&
                   !clipSegment(a, b, len, dabReach(bitmap, static_cast<float>(std::max(ra, rb)), texture >= 0), t0, t1)) {
            travelled += len;
        } else if (len > 0.0) {
            // Spacing restarts where the segment enters the reachable area
            if (t0 > 0.0) travelled = 0.0;
            double t = t0;
            size_t dabs = 0;
            while (true) {
                double need = std::max(dabSpacing(static_cast<float>(ra + (rb - ra) * (t / len))) - travelled, 0.0);
                if (t + need > t1) {
                    travelled += len - t;
                    break;
                }
                if (++dabs > MAX_DABS_PER_SEGMENT) {
                    ywarn("BrushEvent {}/{}: segment needs more than {} dabs, truncated", _sid, _sessionEventId,
                          MAX_DABS_PER_SEGMENT);
                    travelled = 0.0;
                    break;
                }
                t += need;
                travelled = 0.0;
                double f = t / len;
                glm::dvec2 p = glm::dvec2(a) + (glm::dvec2(b) - glm::dvec2(a)) * f;
                stamp(Vec2(p), static_cast<float>(ra + (rb - ra) * f));
            }
        }
        state.carry = static_cast<float>(std::min(travelled, 1.0e6));
        state.coordIndex += 3;
    }
    return rasterizer.drawPrimitives(prims, texture);
}

//=============================================================================
// ScatterEvent
//=============================================================================

ScatterEvent::Ptr ScatterEvent::create(int sid, int sessionEventId, bool undone, Rgba color,
                                       float flow, float opacity, float radius, float softness,
                                       BlendMode mode, int textureId) {
    return Ptr(new ScatterEvent(sid, sessionEventId, undone, color, flow, opacity, radius, softness, mode, textureId));
}

std::string ScatterEvent::serialize() const {
    return serializeWithTag("scatter");
}

Result<void> ScatterEvent::updateTo(Rasterizer& rasterizer, std::optional<size_t> untilCoord) const {
    if (rasterizer.drawingEvent() != this) {
        if (auto res = rasterizer.beginEvent(this); !res) {
            return res;
        }
    }
    DrawProgress& state = rasterizer.progress();
    size_t end = cutoff(untilCoord);
    int texture = textureIndex();
    std::vector<MaskPrimitive> prims;
    Rect bitmap = rasterizer.fullRect();
    for (; state.coordIndex + 3 <= end; state.coordIndex += 3) {
        float radius = radiusAt(state.coordIndex / 3);
        Vec2 p = pointAt(state.coordIndex / 3);
        if (radius > 0.0f && std::isfinite(radius) && dabReach(bitmap, radius, texture >= 0).containsPoint(p)) {
            prims.push_back(MaskPrimitive::dab(p, radius, _softness, _flow, texture));
        }
    }
    state.started = true;
    return rasterizer.drawPrimitives(prims, texture);
}

//=============================================================================
// FillEvent
//=============================================================================

FillEvent::FillEvent(int sid, int sessionEventId, bool undone, Rgba color, float opacity,
                     BlendMode mode, const Rect& rect)
    : RasterEvent(sid, sessionEventId, undone, color, opacity, mode), _rect(rect) {}

FillEvent::Ptr FillEvent::create(int sid, int sessionEventId, bool undone, Rgba color,
                                 float opacity, BlendMode mode, const Rect& rect) {
    return Ptr(new FillEvent(sid, sessionEventId, undone, color, opacity, mode, rect));
}

std::string FillEvent::serialize() const {
    std::string line = serializeHeader("fill");
    line += " " + std::to_string(_color.r) + " " + std::to_string(_color.g) + " " + std::to_string(_color.b);
    line += " " + formatFloat(_opacity) + " " + std::to_string(static_cast<int>(_mode));
    line += " " + formatFloat(_rect.left) + " " + formatFloat(_rect.right) +
            " " + formatFloat(_rect.top) + " " + formatFloat(_rect.bottom);
    return line;
}

Rect FillEvent::boundingBox() const {
    return Rect(_rect.left * _displayScale, _rect.right * _displayScale,
                _rect.top * _displayScale, _rect.bottom * _displayScale);
}

Result<void> FillEvent::updateTo(Rasterizer& rasterizer, std::optional<size_t>) const {
    if (rasterizer.drawingEvent() != this) {
        if (auto res = rasterizer.beginEvent(this); !res) {
            return res;
        }
    }
    DrawProgress& state = rasterizer.progress();
    if (state.started) {
        return Ok();
    }
    state.started = true;
    return rasterizer.drawPrimitives({MaskPrimitive::rect(boundingBox(), 1.0f)}, -1);
}

//=============================================================================
// GradientEvent
//=============================================================================

GradientEvent::GradientEvent(int sid, int sessionEventId, bool undone, Rgba color, float opacity,
                             BlendMode mode, Vec2 p0, Vec2 p1)
    : RasterEvent(sid, sessionEventId, undone, color, opacity, mode), _p0(p0), _p1(p1) {}

GradientEvent::Ptr GradientEvent::create(int sid, int sessionEventId, bool undone, Rgba color,
                                         float opacity, BlendMode mode, Vec2 p0, Vec2 p1) {
    return Ptr(new GradientEvent(sid, sessionEventId, undone, color, opacity, mode, p0, p1));
}

std::string GradientEvent::serialize() const {
    std::string line = serializeHeader("gradient");
    line += " " + std::to_string(_color.r) + " " + std::to_string(_color.g) + " " + std::to_string(_color.b);
    line += " " + formatFloat(_opacity) + " " + std::to_string(static_cast<int>(_mode));
    line += " " + formatFloat(_p0.x) + " " + formatFloat(_p0.y) +
            " " + formatFloat(_p1.x) + " " + formatFloat(_p1.y);
    return line;
}

Rect GradientEvent::boundingBox() const {
    return UNBOUNDED;
}

Result<void> GradientEvent::updateTo(Rasterizer& rasterizer, std::optional<size_t>) const {
    if (rasterizer.drawingEvent() != this) {
        if (auto res = rasterizer.beginEvent(this); !res) {
            return res;
        }
    }
    DrawProgress& state = rasterizer.progress();
    if (state.started) {
        return Ok();
    }
    state.started = true;
    auto prim = MaskPrimitive::gradient(_p0 * _displayScale, _p1 * _displayScale, 1.0f, rasterizer.fullRect());
    return rasterizer.drawPrimitives({prim}, -1);
}

//=============================================================================
// BufferMergeEvent
//=============================================================================

BufferMergeEvent::BufferMergeEvent(int sid, int sessionEventId, bool undone, float opacity,
                                   std::vector<int> mergedBufferIds)
    : PictureEvent(sid, sessionEventId, undone, BlendMode::Normal)
    , _opacity(opacity)
    , _mergedBufferIds(std::move(mergedBufferIds)) {}

BufferMergeEvent::Ptr BufferMergeEvent::create(int sid, int sessionEventId, bool undone, float opacity,
                                               std::vector<int> mergedBufferIds) {
    return Ptr(new BufferMergeEvent(sid, sessionEventId, undone, opacity, std::move(mergedBufferIds)));
}

std::string BufferMergeEvent::serialize() const {
    std::string line = serializeHeader("bufferMerge");
    line += " " + formatFloat(_opacity);
    for (int id : _mergedBufferIds) {
        line += " " + std::to_string(id);
    }
    return line;
}

Rect BufferMergeEvent::boundingBox() const {
    return UNBOUNDED;
}

Result<void> BufferMergeEvent::updateTo(Rasterizer&, std::optional<size_t>) const {
    // Merges are applied by the owning buffer from committed surfaces
    return Ok();
}

bool BufferMergeEvent::merges(int bufferId) const {
    return std::find(_mergedBufferIds.begin(), _mergedBufferIds.end(), bufferId) != _mergedBufferIds.end();
}

} // namespace pictura
