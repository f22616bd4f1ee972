#pragma once

#include <pictura/backend.h>
#include <pictura/picture.h>
#include <pictura/picture-event.h>
#include <cstdlib>
#include <memory>
#include <vector>

namespace pictura::test {

inline const Rgba WHITE{255, 255, 255, 255};
inline const Rgba BLACK{0, 0, 0, 255};
inline const Rgba RED{255, 0, 0, 255};
inline const Rgba BLUE{0, 0, 255, 255};
inline const Rgba TRANSPARENT{0, 0, 0, 0};

// CPU picture with a manual frame scheduler; null if creation failed
inline Picture::Ptr makeCpuPicture(int width, int height, float scale = 1.0f, int attachment = -1,
                                   PictureOptions options = PictureOptions()) {
    if (!options.frameScheduler) {
        options.frameScheduler = ManualFrameScheduler::create();
    }
    auto res = Picture::create(0, width, height, scale, {BackendMode::Cpu}, attachment, options);
    return res ? *res : nullptr;
}

inline RenderBackend::Ptr makeCpuBackend(uint32_t width, uint32_t height) {
    auto res = RenderBackend::create(BackendMode::Cpu, width, height, BackendEnvironment());
    return res ? *res : nullptr;
}

inline PictureEvent::Ptr fill(int sid, int eid, Rgba color, const Rect& rect, float opacity = 1.0f,
                              BlendMode mode = BlendMode::Normal) {
    return FillEvent::create(sid, eid, false, color, opacity, mode, rect);
}

inline BrushEvent::Ptr stroke(int sid, int eid, Rgba color, std::vector<float> coords, float radius = 2.0f) {
    auto ev = BrushEvent::create(sid, eid, false, color, 1.0f, 1.0f, radius, 0.5f, BlendMode::Normal);
    for (size_t i = 0; i + 2 < coords.size(); i += 3) {
        ev->pushCoordTriplet(coords[i], coords[i + 1], coords[i + 2]);
    }
    return ev;
}

inline bool near(Rgba a, Rgba b, int tolerance = 1) {
    return std::abs(int(a.r) - int(b.r)) <= tolerance && std::abs(int(a.g) - int(b.g)) <= tolerance &&
           std::abs(int(a.b) - int(b.b)) <= tolerance && std::abs(int(a.a) - int(b.a)) <= tolerance;
}

inline Rgba pixelAt(Picture& picture, float x, float y) {
    auto res = picture.getPixelRGBA(Vec2(x, y));
    return res ? *res : Rgba{1, 2, 3, 4};
}

} // namespace pictura::test
