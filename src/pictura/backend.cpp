#include <pictura/backend.h>
#include <ytrace/ytrace.hpp>
#include <atomic>

namespace pictura {

namespace {

std::atomic<bool> s_gpuSanityFailed{false};

} // namespace

const char* backendModeName(BackendMode mode) {
    switch (mode) {
        case BackendMode::Gpu: return "gpu";
        case BackendMode::GpuNoFloat: return "gpu-no-float";
        case BackendMode::Cpu: return "cpu";
    }
    return "unknown";
}

std::optional<BackendMode> backendModeFromName(std::string_view name) {
    if (name == "gpu") return BackendMode::Gpu;
    if (name == "gpu-no-float") return BackendMode::GpuNoFloat;
    if (name == "cpu") return BackendMode::Cpu;
    return std::nullopt;
}

std::vector<BackendMode> defaultBackendModes() {
    return {BackendMode::Gpu, BackendMode::GpuNoFloat, BackendMode::Cpu};
}

bool BackendCapabilities::hasFailedGpuSanity() {
    return s_gpuSanityFailed.load();
}

void BackendCapabilities::recordGpuSanityFailure() {
    if (!s_gpuSanityFailed.exchange(true)) {
        ywarn("GPU sanity check failed, GPU backends disabled for this process");
    }
}

void BackendCapabilities::resetForTesting() {
    s_gpuSanityFailed.store(false);
}

Result<void> checkBackendSanity(RenderBackend& backend) {
    auto rasterizer = backend.createRasterizer();
    if (!rasterizer) {
        return Err("sanity rasterizer", Error::Code::BackendUnavailable, rasterizer);
    }
    auto ok = (*rasterizer)->checkSanity();
    (*rasterizer)->free();
    if (!ok) {
        return Err("sanity check", Error::Code::SanityCheckFailed, ok);
    }
    if (!*ok) {
        return Err("rasterizer produced wrong values", Error::Code::SanityCheckFailed);
    }
    return Ok();
}

Result<RenderBackend::Ptr> RenderBackend::create(BackendMode mode, uint32_t width, uint32_t height,
                                                 const BackendEnvironment& env) {
    if (width == 0 || height == 0) {
        return Err<Ptr>("RenderBackend: picture size must be positive", Error::Code::InvalidIndex);
    }
    if (width > MAX_BITMAP_DIMENSION || height > MAX_BITMAP_DIMENSION ||
        static_cast<uint64_t>(width) * height > MAX_BITMAP_PIXELS) {
        return Err<Ptr>("RenderBackend: bitmap " + std::to_string(width) + "x" + std::to_string(height) +
                        " exceeds the size limit", Error::Code::InvalidIndex);
    }
    if (mode == BackendMode::Cpu) {
        auto backend = createCpuBackend(width, height, env);
        if (!backend) {
            return backend;
        }
        if (auto res = checkBackendSanity(**backend); !res) {
            return Err<Ptr>("cpu backend rejected", res);
        }
        return backend;
    }
    if (BackendCapabilities::hasFailedGpuSanity()) {
        return Err<Ptr>("RenderBackend: GPU disabled by an earlier sanity failure",
                        Error::Code::SanityCheckFailed);
    }
    return createGpuBackend(mode, width, height, env);
}

} // namespace pictura
