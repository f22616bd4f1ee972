#pragma once

#include <pictura/gpu-allocator.h>
#include <pictura/result.hpp>
#include <webgpu/webgpu.h>
#include <atomic>
#include <memory>

namespace pictura {

class GpuStateManager;

/**
 * Headless WebGPU device shared by every GPU backed Picture.
 *
 * Pictures never hold global GPU state between calls (viewport, scissor
 * and target are passed with every draw), so several Pictures may share
 * one context.
 */
class GpuContext {
public:
    using Ptr = std::shared_ptr<GpuContext>;

    static Result<Ptr> create() noexcept;

    // Process wide context, created on first use and kept while referenced
    static Result<Ptr> shared() noexcept;

    ~GpuContext();

    // Non-copyable
    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    WGPUDevice device() const noexcept { return _device; }
    WGPUQueue queue() const noexcept { return _queue; }

    GpuAllocator& allocator() { return *_allocator; }
    GpuStateManager& stateManager() { return *_stateManager; }

    // Block until all submitted work has finished
    Result<void> waitIdle();

    // Validation errors reported by the device since creation
    uint32_t errorCount() const { return _errorCount.load(); }

private:
    GpuContext() = default;

    Result<void> init() noexcept;

    WGPUInstance _instance = nullptr;
    WGPUAdapter _adapter = nullptr;
    WGPUDevice _device = nullptr;
    WGPUQueue _queue = nullptr;

    std::unique_ptr<GpuAllocator> _allocator;
    std::unique_ptr<GpuStateManager> _stateManager;
    std::atomic<uint32_t> _errorCount{0};
};

} // namespace pictura
