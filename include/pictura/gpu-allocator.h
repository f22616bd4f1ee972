#pragma once

#include <pictura/wgpu-compat.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pictura {

/**
 * GpuAllocator is an arena of device buffers and textures grouped by owner.
 *
 * Each backend, rasterizer and the state manager takes an owner id and
 * creates its resources under it. releaseOwner() destroys whatever the
 * owner still holds, so a construction failure halfway through or a
 * surface that was never freed does not leak device memory.
 */
class GpuAllocator {
public:
    using OwnerId = uint32_t;

    explicit GpuAllocator(WGPUDevice device);
    ~GpuAllocator();

    // Non-copyable
    GpuAllocator(const GpuAllocator&) = delete;
    GpuAllocator& operator=(const GpuAllocator&) = delete;

    OwnerId newOwner(const std::string& name);
    void releaseOwner(OwnerId owner);

    // Null on failure; the label of desc names the resource in logs
    WGPUBuffer createBuffer(OwnerId owner, const WGPUBufferDescriptor& desc);
    WGPUTexture createTexture(OwnerId owner, const WGPUTextureDescriptor& desc);

    // No-op for null or already released handles
    void releaseBuffer(WGPUBuffer buffer);
    void releaseTexture(WGPUTexture texture);

    size_t liveCount() const;
    size_t liveCount(OwnerId owner) const;
    uint64_t liveBytes() const { return _liveBytes; }

    static uint32_t bytesPerPixel(WGPUTextureFormat format);

private:
    struct Resource {
        void* handle;  // WGPUBuffer or WGPUTexture
        bool isTexture;
        uint64_t size;
        std::string label;
    };

    struct Owner {
        std::string name;
        std::vector<Resource> resources;
    };

    void track(OwnerId owner, Resource resource);
    bool release(void* handle);
    static void destroy(const Resource& resource);

    WGPUDevice _device;
    std::map<OwnerId, Owner> _owners;
    OwnerId _nextOwner = 1;
    uint64_t _liveBytes = 0;
};

} // namespace pictura
