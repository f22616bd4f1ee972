#pragma once

#include <pictura/brush-textures.h>
#include <pictura/compositor.h>
#include <pictura/rasterizer.h>
#include <pictura/result.hpp>
#include <pictura/surface.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pictura {

class GpuContext;

enum class BackendMode {
    Gpu,         // float accumulation rasterizer
    GpuNoFloat,  // ping-ponged 16-bit fixed point rasterizer
    Cpu,         // software rasterizer and compositor
};

const char* backendModeName(BackendMode mode);
std::optional<BackendMode> backendModeFromName(std::string_view name);
std::vector<BackendMode> defaultBackendModes();

// Largest bitmap a backend accepts, per side and in total
constexpr uint32_t MAX_BITMAP_DIMENSION = 16384;
constexpr uint64_t MAX_BITMAP_PIXELS = uint64_t(1) << 26;

/**
 * Process wide record of GPU sanity failures.
 *
 * Set on the first failed sanity check and read by every later GPU backend
 * construction, which then fails fast. Only tests reset it.
 */
class BackendCapabilities {
public:
    static bool hasFailedGpuSanity();
    static void recordGpuSanityFailure();
    static void resetForTesting();
};

// What the host mounts to show a picture
struct PictureElements {
    BackendMode mode = BackendMode::Cpu;
    uint32_t width = 0;
    uint32_t height = 0;
    WGPUTexture texture = nullptr;    // GPU backends
    const uint8_t* pixels = nullptr;  // CPU backend, premultiplied RGBA8
};

struct BackendEnvironment {
    std::shared_ptr<GpuContext> gpuContext;
    std::shared_ptr<const std::vector<BrushImage>> brushImages;
    int maxLayersPerPass = 12;
};

/**
 * RenderBackend creates the rasterizers, surfaces and compositor of one
 * backend mode. A Picture selects its backend once at construction.
 */
class RenderBackend {
public:
    using Ptr = std::shared_ptr<RenderBackend>;

    /**
     * @return the backend, or BackendUnavailable / SanityCheckFailed errors
     *         that let the caller try the next mode
     */
    static Result<Ptr> create(BackendMode mode, uint32_t width, uint32_t height,
                              const BackendEnvironment& env);

    virtual ~RenderBackend() = default;

    virtual BackendMode mode() const = 0;
    bool usesGpu() const { return mode() != BackendMode::Cpu; }

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    virtual Result<Rasterizer::Ptr> createRasterizer() = 0;
    virtual Result<Surface::Ptr> createSurface(const std::string& label) = 0;

    virtual Compositor& compositor() = 0;
    virtual PictureElements pictureElements() = 0;

    virtual void free() = 0;

protected:
    RenderBackend(uint32_t width, uint32_t height) : _width(width), _height(height) {}

    uint32_t _width;
    uint32_t _height;
};

// Run a fresh rasterizer's self test; SanityCheckFailed when it draws wrong values
Result<void> checkBackendSanity(RenderBackend& backend);

Result<RenderBackend::Ptr> createCpuBackend(uint32_t width, uint32_t height, const BackendEnvironment& env);
Result<RenderBackend::Ptr> createGpuBackend(BackendMode mode, uint32_t width, uint32_t height,
                                            const BackendEnvironment& env);

} // namespace pictura
