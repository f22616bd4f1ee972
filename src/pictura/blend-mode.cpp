#include <pictura/blend-mode.h>
#include <algorithm>
#include <array>
#include <cmath>

namespace pictura {

namespace {

struct ModeInfo {
    BlendMode mode;
    const char* name;
    // WGSL expression of B(cb, cs), empty for the non separable modes
    const char* wgsl;
};

constexpr std::array<ModeInfo, BLEND_MODE_COUNT> MODES = {{
    {BlendMode::Normal, "normal", ""},
    {BlendMode::Eraser, "eraser", ""},
    {BlendMode::Multiply, "multiply", "cb * cs"},
    {BlendMode::Screen, "screen", "cb + cs - cb * cs"},
    {BlendMode::Overlay, "overlay",
     "select(cs + (2.0 * cb - 1.0) - cs * (2.0 * cb - 1.0), 2.0 * cs * cb, cb <= vec3f(0.5))"},
    {BlendMode::Darken, "darken", "min(cb, cs)"},
    {BlendMode::Lighten, "lighten", "max(cb, cs)"},
    {BlendMode::Difference, "difference", "abs(cb - cs)"},
    {BlendMode::Exclusion, "exclusion", "cb + cs - 2.0 * cb * cs"},
    {BlendMode::HardLight, "hardlight",
     "select(cb + (2.0 * cs - 1.0) - cb * (2.0 * cs - 1.0), 2.0 * cs * cb, cs <= vec3f(0.5))"},
    {BlendMode::LinearDodge, "lineardodge", "min(cb + cs, vec3f(1.0))"},
    {BlendMode::LinearBurn, "linearburn", "max(cb + cs - 1.0, vec3f(0.0))"},
}};

float screen(float cb, float cs) { return cb + cs - cb * cs; }

float separable(BlendMode mode, float cb, float cs) {
    switch (mode) {
        case BlendMode::Multiply: return cb * cs;
        case BlendMode::Screen: return screen(cb, cs);
        case BlendMode::Overlay:
            return cb <= 0.5f ? 2.0f * cs * cb : screen(cs, 2.0f * cb - 1.0f);
        case BlendMode::Darken: return std::min(cb, cs);
        case BlendMode::Lighten: return std::max(cb, cs);
        case BlendMode::Difference: return std::fabs(cb - cs);
        case BlendMode::Exclusion: return cb + cs - 2.0f * cb * cs;
        case BlendMode::HardLight:
            return cs <= 0.5f ? 2.0f * cs * cb : screen(cb, 2.0f * cs - 1.0f);
        case BlendMode::LinearDodge: return std::min(cb + cs, 1.0f);
        case BlendMode::LinearBurn: return std::max(cb + cs - 1.0f, 0.0f);
        default: return cs;
    }
}

} // namespace

const char* blendModeName(BlendMode mode) {
    int id = static_cast<int>(mode);
    if (id < 0 || id >= BLEND_MODE_COUNT) return "unknown";
    return MODES[id].name;
}

std::optional<BlendMode> blendModeFromName(std::string_view name) {
    for (const auto& info : MODES) {
        if (name == info.name) return info.mode;
    }
    return std::nullopt;
}

std::optional<BlendMode> blendModeFromId(int id) {
    if (id < 0 || id >= BLEND_MODE_COUNT) return std::nullopt;
    return static_cast<BlendMode>(id);
}

glm::vec4 blendMask(const glm::vec4& dst, const glm::vec3& color, float s, BlendMode mode) {
    s = std::clamp(s, 0.0f, 1.0f);
    if (mode == BlendMode::Eraser) {
        return dst * (1.0f - s);
    }
    float outA = s + dst.a * (1.0f - s);
    if (mode == BlendMode::Normal) {
        return glm::vec4(glm::vec3(color) * s + glm::vec3(dst) * (1.0f - s), outA);
    }
    glm::vec4 out(0.0f, 0.0f, 0.0f, outA);
    for (int i = 0; i < 3; ++i) {
        float cb = dst.a > 0.0f ? dst[i] / dst.a : 0.0f;
        float b = separable(mode, cb, color[i]);
        out[i] = s * (1.0f - dst.a) * color[i] + s * dst.a * b + (1.0f - s) * dst[i];
    }
    return out;
}

std::string blendMaskWgsl(BlendMode mode) {
    std::string src = "fn blendMask(d: vec4f, c: vec3f, sIn: f32) -> vec4f {\n"
                      "    let s = clamp(sIn, 0.0, 1.0);\n";
    if (mode == BlendMode::Eraser) {
        src += "    return d * (1.0 - s);\n";
    } else if (mode == BlendMode::Normal) {
        src += "    return vec4f(c * s + d.rgb * (1.0 - s), s + d.a * (1.0 - s));\n";
    } else {
        int id = static_cast<int>(mode);
        const char* expr = (id >= 0 && id < BLEND_MODE_COUNT) ? MODES[id].wgsl : "cs";
        src += "    let cs = c;\n"
               "    let cb = select(vec3f(0.0), d.rgb / d.a, d.a > 0.0);\n"
               "    let b = ";
        src += expr;
        src += ";\n"
               "    let rgb = s * (1.0 - d.a) * cs + s * d.a * b + (1.0 - s) * d.rgb;\n"
               "    return vec4f(rgb, s + d.a * (1.0 - s));\n";
    }
    src += "}\n";
    return src;
}

} // namespace pictura
