#include <pictura/gpu-allocator.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace pictura {

namespace {

std::string labelOf(WGPUStringView label) {
    if (!label.data) return "(unnamed)";
    if (label.length == WGPU_STRLEN) return std::string(label.data);
    return std::string(label.data, label.length);
}

} // namespace

GpuAllocator::GpuAllocator(WGPUDevice device)
    : _device(device) {}

GpuAllocator::~GpuAllocator() {
    for (auto& [id, owner] : _owners) {
        if (!owner.resources.empty()) {
            ywarn("GpuAllocator: owner '{}' still holds {} resources at shutdown", owner.name,
                  owner.resources.size());
        }
        for (const auto& resource : owner.resources) {
            destroy(resource);
        }
    }
    _owners.clear();
}

GpuAllocator::OwnerId GpuAllocator::newOwner(const std::string& name) {
    OwnerId id = _nextOwner++;
    _owners[id].name = name;
    ytrace("GpuAllocator: owner {} '{}'", id, name);
    return id;
}

void GpuAllocator::releaseOwner(OwnerId owner) {
    auto it = _owners.find(owner);
    if (it == _owners.end()) {
        return;
    }
    uint64_t bytes = 0;
    for (const auto& resource : it->second.resources) {
        bytes += resource.size;
        destroy(resource);
    }
    _liveBytes -= bytes;
    ydebug("GpuAllocator: released '{}', {} resources, {} bytes ({} bytes live)", it->second.name,
           it->second.resources.size(), bytes, _liveBytes);
    _owners.erase(it);
}

void GpuAllocator::track(OwnerId owner, Resource resource) {
    auto it = _owners.find(owner);
    if (it == _owners.end()) {
        ywarn("GpuAllocator: '{}' created for unknown owner {}", resource.label, owner);
        it = _owners.emplace(owner, Owner{"unknown", {}}).first;
    }
    _liveBytes += resource.size;
    ytrace("GPU [+] {} '{}' {} bytes ({} bytes live)", resource.isTexture ? "texture" : "buffer",
           resource.label, resource.size, _liveBytes);
    it->second.resources.push_back(std::move(resource));
}

bool GpuAllocator::release(void* handle) {
    for (auto& [id, owner] : _owners) {
        auto& list = owner.resources;
        auto it = std::find_if(list.begin(), list.end(), [handle](const Resource& r) { return r.handle == handle; });
        if (it == list.end()) continue;
        _liveBytes -= it->size;
        ytrace("GPU [-] {} '{}' {} bytes ({} bytes live)", it->isTexture ? "texture" : "buffer", it->label,
               it->size, _liveBytes);
        destroy(*it);
        list.erase(it);
        return true;
    }
    return false;
}

void GpuAllocator::destroy(const Resource& resource) {
    if (resource.isTexture) {
        auto texture = static_cast<WGPUTexture>(resource.handle);
        wgpuTextureDestroy(texture);
        wgpuTextureRelease(texture);
    } else {
        auto buffer = static_cast<WGPUBuffer>(resource.handle);
        wgpuBufferDestroy(buffer);
        wgpuBufferRelease(buffer);
    }
}

WGPUBuffer GpuAllocator::createBuffer(OwnerId owner, const WGPUBufferDescriptor& desc) {
    WGPUBuffer buffer = wgpuDeviceCreateBuffer(_device, &desc);
    if (!buffer) {
        yerror("GpuAllocator: failed to create buffer '{}'", labelOf(desc.label));
        return nullptr;
    }
    track(owner, {buffer, false, desc.size, labelOf(desc.label)});
    return buffer;
}

WGPUTexture GpuAllocator::createTexture(OwnerId owner, const WGPUTextureDescriptor& desc) {
    WGPUTexture texture = wgpuDeviceCreateTexture(_device, &desc);
    if (!texture) {
        yerror("GpuAllocator: failed to create texture '{}' {}x{}", labelOf(desc.label), desc.size.width,
               desc.size.height);
        return nullptr;
    }
    uint64_t size = static_cast<uint64_t>(desc.size.width) * desc.size.height * desc.size.depthOrArrayLayers *
                    bytesPerPixel(desc.format);
    track(owner, {texture, true, size, labelOf(desc.label)});
    return texture;
}

void GpuAllocator::releaseBuffer(WGPUBuffer buffer) {
    // Untracked handles were already destroyed with their owner
    if (buffer) release(buffer);
}

void GpuAllocator::releaseTexture(WGPUTexture texture) {
    if (texture) release(texture);
}

size_t GpuAllocator::liveCount() const {
    size_t count = 0;
    for (const auto& [id, owner] : _owners) {
        count += owner.resources.size();
    }
    return count;
}

size_t GpuAllocator::liveCount(OwnerId owner) const {
    auto it = _owners.find(owner);
    return it == _owners.end() ? 0 : it->second.resources.size();
}

uint32_t GpuAllocator::bytesPerPixel(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_R8Unorm:
            return 1;
        case WGPUTextureFormat_R16Float:
        case WGPUTextureFormat_RG8Unorm:
            return 2;
        case WGPUTextureFormat_RGBA8Unorm:
        case WGPUTextureFormat_BGRA8Unorm:
        case WGPUTextureFormat_R32Float:
            return 4;
        case WGPUTextureFormat_RGBA16Float:
            return 8;
        default:
            ywarn("GpuAllocator: unexpected texture format {}, assuming 4 bytes per pixel",
                  static_cast<int>(format));
            return 4;
    }
}

} // namespace pictura
