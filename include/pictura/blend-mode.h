#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace pictura {

// Numeric values are part of the serialization format
enum class BlendMode : int {
    Normal = 0,
    Eraser = 1,
    Multiply = 2,
    Screen = 3,
    Overlay = 4,
    Darken = 5,
    Lighten = 6,
    Difference = 7,
    Exclusion = 8,
    HardLight = 9,
    LinearDodge = 10,
    LinearBurn = 11,
};

constexpr int BLEND_MODE_COUNT = 12;

const char* blendModeName(BlendMode mode);
std::optional<BlendMode> blendModeFromName(std::string_view name);
std::optional<BlendMode> blendModeFromId(int id);

/**
 * Blend a solid color through a coverage value into a premultiplied
 * destination pixel.
 *
 * @param dst Premultiplied destination
 * @param color Straight source color (0..1)
 * @param s Source alpha, mask coverage times opacity
 * @return Premultiplied result
 */
glm::vec4 blendMask(const glm::vec4& dst, const glm::vec3& color, float s, BlendMode mode);

// WGSL definition of `fn blendMask(d: vec4f, c: vec3f, s: f32) -> vec4f`
// computing the same function as the C++ blendMask for one fixed mode.
std::string blendMaskWgsl(BlendMode mode);

} // namespace pictura
