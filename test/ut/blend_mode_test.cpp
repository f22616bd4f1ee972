//=============================================================================
// Blend Mode Tests
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <pictura/blend-mode.h>
#include <pictura/color.h>
#include <cmath>

using namespace boost::ut;
using namespace pictura;

namespace {

bool close(const glm::vec4& a, const glm::vec4& b, float eps = 1e-5f) {
    return std::fabs(a.r - b.r) < eps && std::fabs(a.g - b.g) < eps &&
           std::fabs(a.b - b.b) < eps && std::fabs(a.a - b.a) < eps;
}

} // namespace

suite blend_mode_tests = [] {
    "names and ids round trip"_test = [] {
        for (int id = 0; id < BLEND_MODE_COUNT; id++) {
            auto mode = blendModeFromId(id);
            expect(mode.has_value());
            expect(blendModeFromName(blendModeName(*mode)) == mode);
        }
        expect(!blendModeFromId(BLEND_MODE_COUNT).has_value());
        expect(!blendModeFromId(-1).has_value());
        expect(!blendModeFromName("dissolve").has_value());
        expect(blendModeFromName("lineardodge") == BlendMode::LinearDodge);
    };

    "normal is source over"_test = [] {
        glm::vec4 dst(0.2f, 0.4f, 0.6f, 1.0f);
        glm::vec3 c(1.0f, 0.0f, 0.0f);
        glm::vec4 out = blendMask(dst, c, 0.25f, BlendMode::Normal);
        expect(close(out, glm::vec4(0.25f + 0.2f * 0.75f, 0.4f * 0.75f, 0.6f * 0.75f, 1.0f)));
    };

    "normal over transparent yields coverage alpha"_test = [] {
        glm::vec4 out = blendMask(glm::vec4(0.0f), glm::vec3(0.0f, 1.0f, 0.0f), 0.5f, BlendMode::Normal);
        expect(close(out, glm::vec4(0.0f, 0.5f, 0.0f, 0.5f)));
    };

    "eraser scales every channel"_test = [] {
        glm::vec4 dst(0.5f, 0.5f, 0.5f, 1.0f);
        glm::vec4 out = blendMask(dst, glm::vec3(1.0f), 0.5f, BlendMode::Eraser);
        expect(close(out, glm::vec4(0.25f, 0.25f, 0.25f, 0.5f)));
    };

    "zero coverage leaves destination unchanged"_test = [] {
        glm::vec4 dst(0.1f, 0.2f, 0.3f, 0.5f);
        for (int id = 0; id < BLEND_MODE_COUNT; id++) {
            auto mode = static_cast<BlendMode>(id);
            expect(close(blendMask(dst, glm::vec3(0.9f, 0.1f, 0.4f), 0.0f, mode), dst)) << blendModeName(mode);
        }
    };

    "multiply over opaque destination"_test = [] {
        glm::vec4 dst(0.5f, 1.0f, 0.0f, 1.0f);
        glm::vec4 out = blendMask(dst, glm::vec3(0.5f, 0.5f, 0.5f), 1.0f, BlendMode::Multiply);
        expect(close(out, glm::vec4(0.25f, 0.5f, 0.0f, 1.0f)));
    };

    "separable mode over transparent destination acts like normal"_test = [] {
        glm::vec3 c(0.3f, 0.6f, 0.9f);
        glm::vec4 normal = blendMask(glm::vec4(0.0f), c, 0.7f, BlendMode::Normal);
        glm::vec4 screen = blendMask(glm::vec4(0.0f), c, 0.7f, BlendMode::Screen);
        expect(close(normal, screen));
    };

    "wgsl is generated for every mode"_test = [] {
        for (int id = 0; id < BLEND_MODE_COUNT; id++) {
            auto src = blendMaskWgsl(static_cast<BlendMode>(id));
            expect(src.find("fn blendMask") != std::string::npos);
        }
    };

    "color helpers"_test = [] {
        expect(color::unpremultiply(Rgba{64, 0, 0, 128}) == Rgba{128, 0, 0, 128});
        expect(color::unpremultiply(Rgba{10, 20, 30, 0}) == Rgba{0, 0, 0, 0});
        expect(color::blend(Rgba{255, 255, 255, 255}, Rgba{0, 0, 0, 255}) == Rgba{0, 0, 0, 255});
        expect(color::toByte(1.5f) == 255_u);
        expect(color::toByte(-0.1f) == 0_u);
    };
};
