#pragma once

#include <pictura/result.hpp>
#include <pictura/types.h>
#include <cstdint>
#include <string>
#include <vector>

namespace pictura {

// Single channel coverage image used to shape textured dabs
struct BrushImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    bool valid() const { return width > 0 && height > 0 && pixels.size() == width * height; }
};

// Decode an image file with stb_image, reducing it to one grey channel
Result<BrushImage> loadBrushImage(const std::string& path);
Result<BrushImage> decodeBrushImage(const uint8_t* data, size_t size);

// Bilinear sample with clamp to edge, uv in [0, 1]
float sampleBrushImage(const BrushImage& image, Vec2 uv);

} // namespace pictura
