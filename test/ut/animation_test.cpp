//=============================================================================
// Animation Tests
//
// Frame scheduling, stroke hand-out and full playback on the CPU backend
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "harness/picture_harness.h"
#include <pictura/animation.h>

using namespace boost::ut;
using namespace pictura;
using namespace pictura::test;

namespace {

struct AnimatedPicture {
    ManualFrameScheduler::Ptr scheduler = ManualFrameScheduler::create();
    Picture::Ptr picture;

    AnimatedPicture() {
        PictureOptions options;
        options.frameScheduler = scheduler;
        picture = makeCpuPicture(16, 16, 1.0f, -1, options);
        auto& bottom = **picture->addBuffer(0, WHITE, false, false);
        auto& top = **picture->addBuffer(1, TRANSPARENT, false, true);
        (void)picture->pushEvent(bottom, fill(1, 1, RED, Rect(0, 8, 0, 16)));
        (void)picture->pushEvent(bottom, stroke(1, 2, BLACK, {2, 2, 1, 14, 14, 1}));
        auto undone = fill(1, 3, BLUE, Rect(0, 16, 0, 16));
        undone->setUndone(true);
        (void)picture->pushEvent(bottom, undone);
        (void)picture->pushEvent(top, stroke(2, 1, BLUE, {14, 2, 1, 2, 14, 0.5f}, 3.0f));
    }
};

} // namespace

suite animation_tests = [] {
    "manual scheduler runs one frame at a time"_test = [] {
        auto scheduler = ManualFrameScheduler::create();
        int runs = 0;
        scheduler->requestFrame([&] {
            runs++;
            scheduler->requestFrame([&] { runs++; });
        });
        expect(scheduler->pendingFrames() == 1_u);
        expect(scheduler->runFrame());
        expect(runs == 1_i);
        expect(scheduler->pendingFrames() == 1_u);
        expect(scheduler->runUntilIdle() == 1_u);
        expect(runs == 2_i);
        expect(!scheduler->runFrame());
    };

    "cutoff rounds up to whole triples"_test = [] {
        expect(animationCutoff(12, 0.0f) == 0_u);
        expect(animationCutoff(12, 0.1f) == 3_u);
        expect(animationCutoff(12, 0.5f) == 6_u);
        expect(animationCutoff(12, 0.51f) == 9_u);
        expect(animationCutoff(12, 1.0f) == 12_u);
        expect(animationCutoff(0, 0.7f) == 0_u);
    };

    "strokes skip undone events"_test = [] {
        std::vector<PictureBuffer::Ptr> buffers;
        AnimationState state;
        auto backend = makeCpuBackend(4, 4);
        auto first = *PictureBuffer::create(backend, 0, WHITE, false, false, {});
        auto second = *PictureBuffer::create(backend, 1, WHITE, false, false, {});
        auto r = *backend->createRasterizer();
        auto undone = fill(1, 1, RED, Rect(0, 1, 0, 1));
        undone->setUndone(true);
        expect(first->pushEvent(undone, *r).has_value());
        expect(first->pushEvent(fill(1, 2, RED, Rect(0, 1, 0, 1)), *r).has_value());
        expect(second->pushEvent(fill(1, 3, RED, Rect(0, 1, 0, 1)), *r).has_value());
        buffers = {first, second};
        state.totalEvents = 3;

        auto target = animationTarget(buffers, 2);
        expect(target.has_value() >> fatal);
        expect(target->bufferIndex == 1_u);
        expect(!animationTarget(buffers, 3).has_value());

        auto s1 = nextAnimationStroke(state, buffers);
        expect(s1.eventIndex == 1_u);
        expect(s1.bufferIndex == 0_u);
        auto s2 = nextAnimationStroke(state, buffers);
        expect(s2.eventIndex == 2_u);
        expect(s2.bufferIndex == 1_u);
        auto s3 = nextAnimationStroke(state, buffers);
        expect(s3.eventIndex == 3_u);
        expect(state.nextEvent == 3_u);
    };

    "playback ends on the committed image"_test = [] {
        for (int strokes : {1, 2, 5}) {
            AnimatedPicture a;
            auto before = a.picture->toPixels();
            expect(before.has_value() >> fatal);

            int finished = 0;
            expect(a.picture->animate(strokes, 0.2f, [&] { finished++; }));
            expect(a.picture->animating());
            expect(a.picture->animate(strokes, 0.2f));

            a.scheduler->runUntilIdle();
            expect(finished == 1_i) << "strokes" << strokes;
            expect(!a.picture->animating());

            auto after = a.picture->toPixels();
            expect(after.has_value() >> fatal);
            expect(*before == *after);
        }
    };

    "display is frozen while animating"_test = [] {
        AnimatedPicture a;
        expect(a.picture->animate(1, 0.05f));
        a.scheduler->runFrame();
        a.scheduler->runFrame();
        expect(a.picture->display().has_value());
        expect(a.picture->animating());
        a.picture->stopAnimating();
        expect(!a.picture->animating());
        expect(pixelAt(*a.picture, 1, 8) == RED);
    };

    "stop inside a frame and from the finish callback is safe"_test = [] {
        AnimatedPicture a;
        expect(a.picture->animate(2, 0.5f, [&] { a.picture->stopAnimating(); }));
        a.scheduler->runUntilIdle();
        expect(!a.picture->animating());

        AnimatedPicture b;
        expect(b.picture->animate(1, 0.1f));
        b.scheduler->requestFrame([&] { b.picture->stopAnimating(); });
        b.scheduler->runUntilIdle();
        expect(!b.picture->animating());
        b.picture->stopAnimating();
    };

    "restart after stop ignores stale frames"_test = [] {
        AnimatedPicture a;
        int finished = 0;
        expect(a.picture->animate(1, 0.3f, [&] { finished++; }));
        a.scheduler->runFrame();
        a.picture->stopAnimating();
        expect(a.picture->animate(1, 0.3f, [&] { finished += 10; }));
        a.scheduler->runUntilIdle();
        expect(finished == 10_i);
    };

    "empty picture finishes on the next frame"_test = [] {
        auto scheduler = ManualFrameScheduler::create();
        PictureOptions options;
        options.frameScheduler = scheduler;
        auto picture = makeCpuPicture(4, 4, 1.0f, -1, options);
        expect((picture != nullptr) >> fatal);
        bool finished = false;
        expect(picture->animate(1, 0.5f, [&] { finished = true; }));
        expect(!finished);
        scheduler->runUntilIdle();
        expect(finished);
        expect(!picture->animating());
    };

    "invalid arguments do not start"_test = [] {
        AnimatedPicture a;
        expect(!a.picture->animate(0, 0.1f));
        expect(!a.picture->animate(1, 0.0f));
        expect(!a.picture->animate(1, 1.5f));
        expect(!a.picture->animating());
        expect(a.picture->supportsAnimation());
    };

    "picture outliving its scheduler frames is not required"_test = [] {
        auto scheduler = ManualFrameScheduler::create();
        {
            PictureOptions options;
            options.frameScheduler = scheduler;
            auto picture = makeCpuPicture(4, 4, 1.0f, -1, options);
            auto& buffer = **picture->addBuffer(0, WHITE, false, false);
            expect(picture->pushEvent(buffer, fill(1, 1, RED, Rect(0, 4, 0, 4))).has_value());
            expect(picture->animate(1, 0.1f));
        }
        scheduler->runUntilIdle();
        expect(scheduler->pendingFrames() == 0_u);
    };
};
