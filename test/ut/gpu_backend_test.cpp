//=============================================================================
// GPU Backend Tests
//
// GPU rasterizers and compositor against the CPU backend. Skipped when no
// WebGPU adapter is available.
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "harness/picture_harness.h"
#include <pictura/gpu-context.h>
#include <ytrace/ytrace.hpp>
#include <cstdlib>

using namespace boost::ut;
using namespace pictura;
using namespace pictura::test;

namespace {

constexpr int GPU_TOLERANCE = 5;

GpuContext::Ptr gpuContextOrSkip() {
    auto ctx = GpuContext::shared();
    if (!ctx) {
        ywarn("GPU tests skipped: {}", error_msg(ctx));
        return nullptr;
    }
    return *ctx;
}

Picture::Ptr makePicture(BackendMode mode, GpuContext::Ptr ctx, int maxLayersPerPass = 12, int attachment = -1) {
    PictureOptions options;
    options.gpuContext = std::move(ctx);
    options.maxLayersPerPass = maxLayersPerPass;
    options.frameScheduler = ManualFrameScheduler::create();
    auto res = Picture::create(0, 24, 24, 1.0f, {mode}, attachment, options);
    if (!res) {
        ywarn("{} picture unavailable: {}", backendModeName(mode), error_msg(res));
        return nullptr;
    }
    return *res;
}

// Same edits on every picture
void paint(Picture& picture, int layers) {
    (void)picture.addBuffer(0, WHITE, true, false);
    (void)picture.pushEvent(picture.buffer(0), stroke(1, 1, RED, {2, 3, 1, 20, 18, 0.4f, 6, 21, 1}, 3.0f));
    for (int i = 1; i < layers; i++) {
        (void)picture.addBuffer(i, TRANSPARENT, false, true);
        Rgba c{static_cast<uint8_t>(40 * i), static_cast<uint8_t>(200 - 30 * i), 90, 255};
        auto mode = static_cast<BlendMode>((i * 5) % BLEND_MODE_COUNT);
        (void)picture.pushEvent(picture.buffer(i), fill(i, 1, c, Rect(float(i), float(i + 12), 2, 22), 0.6f, mode));
        (void)picture.pushEvent(picture.buffer(i), GradientEvent::create(i, 2, false, BLUE, 0.5f, BlendMode::Normal,
                                                                           Vec2(0, float(i)), Vec2(24, 24)));
    }
}

int maxDifference(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) return 256;
    int diff = 0;
    for (size_t i = 0; i < a.size(); i++) {
        diff = std::max(diff, std::abs(int(a[i]) - int(b[i])));
    }
    return diff;
}

} // namespace

suite gpu_backend_tests = [] {
    "gpu rasterizers pass the sanity check"_test = [] {
        auto ctx = gpuContextOrSkip();
        if (!ctx) return;
        BackendCapabilities::resetForTesting();
        for (BackendMode mode : {BackendMode::Gpu, BackendMode::GpuNoFloat}) {
            BackendEnvironment env;
            env.gpuContext = ctx;
            auto backend = RenderBackend::create(mode, 16, 16, env);
            if (!backend) {
                ywarn("{} backend unavailable: {}", backendModeName(mode), error_msg(backend));
                continue;
            }
            expect(checkBackendSanity(**backend).has_value()) << backendModeName(mode);
            (*backend)->free();
        }
    };

    "gpu output matches the cpu backend"_test = [] {
        auto ctx = gpuContextOrSkip();
        if (!ctx) return;
        auto cpu = makeCpuPicture(24, 24);
        expect((cpu != nullptr) >> fatal);
        paint(*cpu, 4);
        auto expected = *cpu->toPixels();

        for (BackendMode mode : {BackendMode::Gpu, BackendMode::GpuNoFloat}) {
            auto gpu = makePicture(mode, ctx);
            if (!gpu) continue;
            paint(*gpu, 4);
            auto pixels = gpu->toPixels();
            expect(pixels.has_value() >> fatal);
            int diff = maxDifference(*pixels, expected);
            expect(diff <= GPU_TOLERANCE) << backendModeName(mode) << "differs by" << diff;
        }
    };

    "multi pass compositing matches a single pass"_test = [] {
        auto ctx = gpuContextOrSkip();
        if (!ctx) return;
        auto single = makePicture(BackendMode::Gpu, ctx, 12);
        auto chunked = makePicture(BackendMode::Gpu, ctx, 2);
        if (!single || !chunked) return;
        paint(*single, 7);
        paint(*chunked, 7);
        auto a = single->toPixels();
        auto b = chunked->toPixels();
        expect((a.has_value() && b.has_value()) >> fatal);
        expect(maxDifference(*a, *b) <= GPU_TOLERANCE);
    };

    "compositing programs are cached by stack shape"_test = [] {
        auto ctx = gpuContextOrSkip();
        if (!ctx) return;
        auto picture = makePicture(BackendMode::Gpu, ctx);
        if (!picture) return;
        paint(*picture, 3);
        expect(picture->display().has_value());
        size_t programs = picture->compositingProgramCount();
        expect(programs >= 1_u);
        expect(picture->display().has_value());
        expect(picture->compositingProgramCount() == programs);

        picture->setBufferVisible(picture->buffer(1), false);
        expect(picture->display().has_value());
        expect(picture->compositingProgramCount() == programs + 1);
    };

    "live overlay matches the cpu backend"_test = [] {
        auto ctx = gpuContextOrSkip();
        if (!ctx) return;
        auto cpu = makeCpuPicture(24, 24, 1.0f, 1);
        auto gpu = makePicture(BackendMode::Gpu, ctx, 12, 1);
        expect((cpu != nullptr) >> fatal);
        if (!gpu) return;
        for (auto* picture : {cpu.get(), gpu.get()}) {
            paint(*picture, 2);
            auto ev = stroke(9, 1, BLUE, {4, 20, 1, 20, 4, 1}, 4.0f);
            expect(picture->setCurrentBuffer(ev).has_value());
        }
        auto a = cpu->toPixels();
        auto b = gpu->toPixels();
        expect((a.has_value() && b.has_value()) >> fatal);
        expect(maxDifference(*a, *b) <= GPU_TOLERANCE);
    };

    "gpu animation ends on the committed image"_test = [] {
        auto ctx = gpuContextOrSkip();
        if (!ctx) return;
        auto scheduler = ManualFrameScheduler::create();
        PictureOptions options;
        options.gpuContext = ctx;
        options.frameScheduler = scheduler;
        auto res = Picture::create(0, 24, 24, 1.0f, {BackendMode::GpuNoFloat}, -1, options);
        if (!res) return;
        auto picture = *res;
        paint(*picture, 3);
        auto before = picture->toPixels();
        bool finished = false;
        expect(picture->animate(2, 0.25f, [&] { finished = true; }));
        scheduler->runUntilIdle();
        expect(finished);
        auto after = picture->toPixels();
        expect((before.has_value() && after.has_value()) >> fatal);
        expect(*before == *after);
    };

    "destroying a picture releases its device resources"_test = [] {
        auto ctx = gpuContextOrSkip();
        if (!ctx) return;
        auto cycle = [&ctx]() {
            auto picture = makePicture(BackendMode::GpuNoFloat, ctx, 12, 0);
            if (!picture) return false;
            paint(*picture, 3);
            (void)picture->setCurrentBuffer(stroke(9, 1, BLUE, {4, 20, 1, 20, 4, 1}, 4.0f));
            return picture->toPixels().has_value();
        };
        // The first round fills the shared program cache
        if (!cycle()) return;
        size_t live = ctx->allocator().liveCount();
        expect(cycle());
        expect(ctx->allocator().liveCount() == live);
    };
};
