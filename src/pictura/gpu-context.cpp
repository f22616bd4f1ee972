#include <pictura/gpu-context.h>
#include <pictura/gpu-state-manager.h>
#include <pictura/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <cstring>
#include <mutex>
#include <string>

namespace pictura {

namespace {

// Callbacks normally fire during the request; bound the wait otherwise
constexpr int REQUEST_POLL_LIMIT = 10000;

std::mutex s_sharedMutex;
std::weak_ptr<GpuContext> s_shared;

} // namespace

Result<GpuContext::Ptr> GpuContext::create() noexcept {
    auto ctx = Ptr(new GpuContext());
    if (auto res = ctx->init(); !res) {
        return Err<Ptr>("Failed to create GPU context", Error::Code::BackendUnavailable, res);
    }
    return Ok(ctx);
}

Result<GpuContext::Ptr> GpuContext::shared() noexcept {
    std::lock_guard<std::mutex> lock(s_sharedMutex);
    if (auto ctx = s_shared.lock()) {
        return Ok(ctx);
    }
    auto ctx = create();
    if (!ctx) {
        return ctx;
    }
    s_shared = *ctx;
    return ctx;
}

GpuContext::~GpuContext() {
    _stateManager.reset();
    _allocator.reset();
    if (_queue) wgpuQueueRelease(_queue);
    if (_device) wgpuDeviceRelease(_device);
    if (_adapter) wgpuAdapterRelease(_adapter);
    if (_instance) wgpuInstanceRelease(_instance);
}

Result<void> GpuContext::init() noexcept {
    WGPUInstanceDescriptor instanceDesc = {};
    _instance = wgpuCreateInstance(&instanceDesc);
    if (!_instance) {
        return Err("Could not create WebGPU instance", Error::Code::BackendUnavailable);
    }

    struct AdapterRequest {
        WGPUAdapter adapter = nullptr;
        bool done = false;
    } adapterRequest;

    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;
    WGPURequestAdapterCallbackInfo adapterCbInfo = {};
    adapterCbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCbInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter a, WGPUStringView message,
                                void* ud, void*) {
        auto* req = static_cast<AdapterRequest*>(ud);
        if (status == WGPURequestAdapterStatus_Success) {
            req->adapter = a;
        } else if (message.data) {
            ywarn("GpuContext: adapter request failed: {}",
                  std::string(message.data, message.length == WGPU_STRLEN ? std::strlen(message.data)
                                                                          : message.length));
        }
        req->done = true;
    };
    adapterCbInfo.userdata1 = &adapterRequest;
    wgpuInstanceRequestAdapter(_instance, &adapterOpts, adapterCbInfo);
    for (int i = 0; !adapterRequest.done && i < REQUEST_POLL_LIMIT; i++) {
        wgpuInstanceProcessEvents(_instance);
    }
    _adapter = adapterRequest.adapter;
    if (!_adapter) {
        return Err("No WebGPU adapter available", Error::Code::BackendUnavailable);
    }

    struct DeviceRequest {
        WGPUDevice device = nullptr;
        bool done = false;
    } deviceRequest;

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = WGPU_STR("pictura device");
    deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const*, WGPUErrorType type,
                                                         WGPUStringView message, void* ud, void*) {
        auto* count = static_cast<std::atomic<uint32_t>*>(ud);
        count->fetch_add(1);
        std::string text = message.data
            ? std::string(message.data, message.length == WGPU_STRLEN ? std::strlen(message.data) : message.length)
            : std::string();
        yerror("GpuContext: device error {}: {}", static_cast<int>(type), text);
    };
    deviceDesc.uncapturedErrorCallbackInfo.userdata1 = &_errorCount;

    WGPURequestDeviceCallbackInfo deviceCbInfo = {};
    deviceCbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCbInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice d, WGPUStringView, void* ud, void*) {
        auto* req = static_cast<DeviceRequest*>(ud);
        if (status == WGPURequestDeviceStatus_Success) {
            req->device = d;
        }
        req->done = true;
    };
    deviceCbInfo.userdata1 = &deviceRequest;
    wgpuAdapterRequestDevice(_adapter, &deviceDesc, deviceCbInfo);
    for (int i = 0; !deviceRequest.done && i < REQUEST_POLL_LIMIT; i++) {
        wgpuInstanceProcessEvents(_instance);
    }
    _device = deviceRequest.device;
    if (!_device) {
        return Err("Could not create WebGPU device", Error::Code::BackendUnavailable);
    }

    _queue = wgpuDeviceGetQueue(_device);
    _allocator = std::make_unique<GpuAllocator>(_device);
    _stateManager = std::make_unique<GpuStateManager>(_device, _queue, *_allocator);

    yinfo("GpuContext: headless device ready");
    return Ok();
}

Result<void> GpuContext::waitIdle() {
    std::atomic<bool> done{false};
    WGPUQueueWorkDoneCallbackInfo cbInfo = {};
    cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    cbInfo.callback = [](WGPUQueueWorkDoneStatus, WGPUStringView, void* ud, void*) {
        *static_cast<std::atomic<bool>*>(ud) = true;
    };
    cbInfo.userdata1 = &done;
    wgpuQueueOnSubmittedWorkDone(_queue, cbInfo);
    while (!done) WGPU_DEVICE_TICK(_device);
    return Ok();
}

} // namespace pictura
