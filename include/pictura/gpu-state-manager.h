#pragma once

#include <pictura/gpu-allocator.h>
#include <pictura/result.hpp>
#include <pictura/types.h>
#include <glm/glm.hpp>
#include <webgpu/webgpu.h>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pictura {

enum class UniformType {
    Float,
    Int,
    Vec2,
    Vec4,
    Texture,  // texture_2d<f32>, read with textureLoad
    Storage,  // read-only storage array
};

struct UniformDecl {
    std::string name;
    UniformType type;
    std::string element;  // WGSL element type of a Storage array
};

enum class PipelineBlend {
    Replace,
    Accumulate,  // dst = src + dst * (1 - src), per channel
};

// Raw bytes for a Storage binding, copied at draw time
struct StorageData {
    const void* data = nullptr;
    size_t size = 0;
};

using UniformValue = std::variant<float, int32_t, glm::vec2, glm::vec4, WGPUTexture, StorageData>;
using UniformValues = std::map<std::string, UniformValue>;

/**
 * Compiled render pipeline plus the layout of its inputs.
 *
 * Uniform scalars and vectors live in one `u` struct at binding 0. Every
 * program also gets `u.targetSize: vec2f`, filled in by draw().
 */
class GpuProgram {
public:
    using Ptr = std::shared_ptr<GpuProgram>;

    const std::string& key() const { return _key; }

private:
    friend class GpuStateManager;

    struct Slot {
        UniformType type;
        uint32_t offset = 0;   // byte offset inside u, scalars and vectors
        uint32_t binding = 0;  // bind group slot, textures and storage
        WGPUBuffer storage = nullptr;
        uint64_t storageSize = 0;
    };

    std::string _key;
    WGPURenderPipeline _pipeline = nullptr;
    WGPUBindGroupLayout _bindGroupLayout = nullptr;
    WGPUBuffer _uniformBuffer = nullptr;
    uint32_t _uniformSize = 0;
    uint32_t _targetSizeOffset = 0;
    std::map<std::string, Slot> _slots;
};

/**
 * GpuStateManager builds and caches pipelines and performs the handful of
 * GPU operations the backends need: draw, copy, clear and read back.
 *
 * No state carries over between calls. Each draw writes its uniforms,
 * records one render pass into the given target with the given scissor
 * and submits it.
 */
class GpuStateManager {
public:
    GpuStateManager(WGPUDevice device, WGPUQueue queue, GpuAllocator& allocator);
    ~GpuStateManager();

    // Non-copyable
    GpuStateManager(const GpuStateManager&) = delete;
    GpuStateManager& operator=(const GpuStateManager&) = delete;

    /**
     * Get or build the program for key.
     *
     * @param vertexSource WGSL with `fn vs_main`
     * @param fragmentSource WGSL with `fn fs_main`
     * @param uniforms Inputs declared for both stages
     */
    Result<GpuProgram*> program(const std::string& key,
                                const std::string& vertexSource,
                                const std::string& fragmentSource,
                                const std::vector<UniformDecl>& uniforms,
                                WGPUTextureFormat targetFormat,
                                PipelineBlend blend = PipelineBlend::Replace);

    GpuProgram* findProgram(const std::string& key);
    size_t programCount() const { return _programs.size(); }

    /**
     * Render into target restricted to scissor.
     *
     * @param scissor Pixel rect, clamped to the target; empty draws nothing
     */
    Result<void> draw(GpuProgram& program, const UniformValues& values,
                      WGPUTexture target, const Rect& scissor,
                      uint32_t vertexCount = 6, uint32_t instanceCount = 1);

    Result<void> copyTexture(WGPUTexture src, WGPUTexture dst);
    Result<void> clearTexture(WGPUTexture target, const glm::vec4& value);

    // Rows packed tightly, bytesPerPixel of the texture format per pixel
    Result<std::vector<uint8_t>> readPixels(WGPUTexture texture, uint32_t x, uint32_t y,
                                            uint32_t width, uint32_t height);

    // Create a texture owned by owner with the usages every backend texture needs
    WGPUTexture createTexture(GpuAllocator::OwnerId owner, const std::string& label,
                              uint32_t width, uint32_t height, WGPUTextureFormat format);
    Result<void> writeTexture(WGPUTexture texture, const uint8_t* data, uint32_t width,
                              uint32_t height, uint32_t bytesPerPixel);

    // Two triangles covering the target, `@location(0) uv` in [0, 1]
    static std::string fullscreenVertexSource();

    // WGSL declarations generated for a uniform list
    static std::string declarations(const std::vector<UniformDecl>& uniforms);

private:
    WGPUShaderModule compileShader(const std::string& label, const std::string& source);

    WGPUDevice _device;
    WGPUQueue _queue;
    GpuAllocator& _allocator;
    GpuAllocator::OwnerId _owner;
    std::map<std::string, std::unique_ptr<GpuProgram>> _programs;
};

} // namespace pictura
