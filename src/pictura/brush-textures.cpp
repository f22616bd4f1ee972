#include <pictura/brush-textures.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace pictura {

namespace {

Result<BrushImage> fromStb(unsigned char* data, int width, int height, const std::string& what) {
    if (!data) {
        return Err<BrushImage>("Failed to decode brush image " + what + ": " +
                               stbi_failure_reason(), Error::Code::Io);
    }
    BrushImage image;
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.pixels.resize(image.width * image.height);
    std::memcpy(image.pixels.data(), data, image.pixels.size());
    stbi_image_free(data);
    ydebug("Brush image {}: {}x{}", what, width, height);
    return Ok(std::move(image));
}

} // namespace

Result<BrushImage> loadBrushImage(const std::string& path) {
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 1);
    return fromStb(data, width, height, path);
}

Result<BrushImage> decodeBrushImage(const uint8_t* bytes, size_t size) {
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes, static_cast<int>(size),
                                                &width, &height, &channels, 1);
    return fromStb(data, width, height, "(memory)");
}

float sampleBrushImage(const BrushImage& image, Vec2 uv) {
    if (!image.valid()) return 1.0f;
    int w = static_cast<int>(image.width);
    int h = static_cast<int>(image.height);
    float tx = uv.x * static_cast<float>(w) - 0.5f;
    float ty = uv.y * static_cast<float>(h) - 0.5f;
    float fx0 = std::floor(tx);
    float fy0 = std::floor(ty);
    float fx = tx - fx0;
    float fy = ty - fy0;
    int x0 = std::clamp(static_cast<int>(fx0), 0, w - 1);
    int x1 = std::clamp(static_cast<int>(fx0) + 1, 0, w - 1);
    int y0 = std::clamp(static_cast<int>(fy0), 0, h - 1);
    int y1 = std::clamp(static_cast<int>(fy0) + 1, 0, h - 1);
    auto at = [&](int x, int y) {
        return static_cast<float>(image.pixels[static_cast<size_t>(y) * w + x]) / 255.0f;
    };
    float top = at(x0, y0) * (1.0f - fx) + at(x1, y0) * fx;
    float bottom = at(x0, y1) * (1.0f - fx) + at(x1, y1) * fx;
    return top * (1.0f - fy) + bottom * fy;
}

} // namespace pictura
