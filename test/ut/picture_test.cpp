//=============================================================================
// Picture Tests
//
// Buffer stack, session undo/redo, live event overlay and compositing
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "harness/picture_harness.h"
#include <tuple>

using namespace boost::ut;
using namespace pictura;
using namespace pictura::test;

suite picture_tests = [] {
    "fill then undo on a 4x4 picture"_test = [] {
        auto picture = makeCpuPicture(4, 4);
        expect((picture != nullptr) >> fatal);
        auto buffer = picture->addBuffer(0, WHITE, false, false);
        expect(buffer.has_value() >> fatal);

        expect(picture->pushEvent(**buffer, fill(7, 1, BLACK, Rect(0, 4, 0, 4))).has_value());
        expect(pixelAt(*picture, 0, 0) == BLACK);

        auto undone = picture->undoLatest(7);
        expect(undone.has_value() >> fatal);
        expect((*undone != nullptr) >> fatal);
        expect((*undone)->sessionEventId() == 1_i);
        expect(pixelAt(*picture, 0, 0) == WHITE);
    };

    "undoLatest picks the highest session event id across buffers"_test = [] {
        auto picture = makeCpuPicture(4, 4);
        expect((picture != nullptr) >> fatal);
        auto& a = **picture->addBuffer(0, WHITE, false, false);
        auto& b = **picture->addBuffer(1, TRANSPARENT, false, true);

        expect(picture->pushEvent(a, fill(1, 3, BLACK, Rect(0, 1, 0, 1))).has_value());
        expect(picture->pushEvent(b, fill(1, 5, BLACK, Rect(0, 1, 0, 1))).has_value());
        auto undoneFour = fill(1, 4, BLACK, Rect(0, 1, 0, 1));
        undoneFour->setUndone(true);
        expect(picture->pushEvent(b, undoneFour).has_value());

        auto undone = picture->undoLatest(1);
        expect(undone.has_value() >> fatal);
        expect((*undone)->sessionEventId() == 5_i);
        expect(b.events()[0]->undone());
        expect(!a.events()[0]->undone());

        auto next = picture->undoLatest(1);
        expect(next.has_value() >> fatal);
        expect((*next)->sessionEventId() == 3_i);

        auto none = picture->undoLatest(1);
        expect(none.has_value() && *none == nullptr);
    };

    "session undo redo and remove"_test = [] {
        auto picture = makeCpuPicture(4, 4);
        expect((picture != nullptr) >> fatal);
        auto& buffer = **picture->addBuffer(0, WHITE, false, false);
        expect(picture->pushEvent(buffer, fill(2, 1, RED, Rect(0, 4, 0, 4))).has_value());

        expect(*picture->undoEventSessionId(2, 1));
        expect(pixelAt(*picture, 1, 1) == WHITE);
        expect(*picture->redoEventSessionId(2, 1));
        expect(pixelAt(*picture, 1, 1) == RED);

        expect(!*picture->undoEventSessionId(2, 99));
        expect(!*picture->redoEventSessionId(3, 1));

        expect(*picture->removeEventSessionId(2, 1));
        expect(buffer.eventCount() == 0_u);
        expect(pixelAt(*picture, 1, 1) == WHITE);

        // Removing again finds nothing and changes nothing
        auto again = picture->removeEventSessionId(2, 1);
        expect(again.has_value() && !*again);
        expect(pixelAt(*picture, 1, 1) == WHITE);
    };

    "session lookups search the topmost buffer first"_test = [] {
        auto picture = makeCpuPicture(4, 4);
        expect((picture != nullptr) >> fatal);
        auto& bottom = **picture->addBuffer(0, WHITE, false, false);
        auto& top = **picture->addBuffer(1, TRANSPARENT, false, true);
        expect(picture->pushEvent(bottom, fill(1, 1, RED, Rect(0, 4, 0, 4))).has_value());
        expect(picture->pushEvent(top, fill(1, 1, BLUE, Rect(0, 4, 0, 4))).has_value());

        expect(*picture->undoEventSessionId(1, 1));
        expect(top.events()[0]->undone());
        expect(!bottom.events()[0]->undone());
    };

    "moveBuffer keeps the attachment on the same buffer"_test = [] {
        auto picture = makeCpuPicture(4, 4, 1.0f, 1);
        expect((picture != nullptr) >> fatal);
        for (int id = 0; id < 4; id++) {
            expect(picture->addBuffer(id, WHITE, false, true).has_value());
        }
        expect(picture->moveBuffer(1, 3).has_value());
        expect(picture->buffer(3).id() == 1_i);
        expect(picture->currentBufferAttachment() == 3_i);

        expect(picture->moveBuffer(0, 3).has_value());
        expect(picture->currentBufferAttachment() == 2_i);

        expect(picture->moveBuffer(3, 0).has_value());
        expect(picture->currentBufferAttachment() == 3_i);
        expect(picture->buffer(3).id() == 1_i);

        auto bad = picture->moveBuffer(0, 4);
        expect(!bad.has_value());
        if (!bad) expect(bad.error().code() == Error::Code::InvalidIndex);
        expect(picture->buffer(3).id() == 1_i);
    };

    "removeBuffer keeps the attachment or detaches it"_test = [] {
        auto picture = makeCpuPicture(4, 4, 1.0f, 2);
        expect((picture != nullptr) >> fatal);
        for (int id = 0; id < 3; id++) {
            expect(picture->addBuffer(id, WHITE, false, true).has_value());
        }
        expect(picture->removeBuffer(0).has_value());
        expect(picture->currentBufferAttachment() == 1_i);
        expect(picture->findBufferIndex(2) == 1_i);
        expect(picture->findBufferIndex(0) == -1_i);

        expect(picture->removeBuffer(1).has_value());
        expect(picture->currentBufferAttachment() == -1_i);
        expect(!picture->removeBuffer(5).has_value());
    };

    "live event is shown without being committed"_test = [] {
        auto picture = makeCpuPicture(8, 8, 1.0f, 0);
        expect((picture != nullptr) >> fatal);
        auto& buffer = **picture->addBuffer(0, WHITE, false, false);

        auto ev = stroke(1, 1, BLACK, {1, 4, 1});
        expect(picture->setCurrentBuffer(ev).has_value());
        ev->pushCoordTriplet(6, 4, 1);
        expect(picture->setCurrentBuffer(ev).has_value());

        expect(pixelAt(*picture, 4, 4).r < 128_u);
        expect(*buffer.getPixelRGBA(Vec2(4, 4)) == WHITE);

        expect(picture->pushEvent(buffer, ev).has_value());
        expect(picture->setCurrentBuffer(nullptr).has_value());
        expect(buffer.getPixelRGBA(Vec2(4, 4))->r < 128_u);
        expect(near(pixelAt(*picture, 4, 4), *buffer.getPixelRGBA(Vec2(4, 4))));
    };

    "committing the live event matches a fresh push"_test = [] {
        auto live = makeCpuPicture(16, 16, 1.0f, 0);
        auto fresh = makeCpuPicture(16, 16, 1.0f, 0);
        expect((live != nullptr && fresh != nullptr) >> fatal);
        auto& liveBuffer = **live->addBuffer(0, WHITE, false, false);
        auto& freshBuffer = **fresh->addBuffer(0, WHITE, false, false);

        auto ev = stroke(1, 1, RED, {2, 2, 1, 8, 5, 0.7f}, 3.0f);
        expect(live->setCurrentBuffer(ev).has_value());
        ev->pushCoordTriplet(13, 12, 1.0f);
        expect(live->setCurrentBuffer(ev).has_value());
        expect(live->pushEvent(liveBuffer, ev).has_value());

        auto copy = stroke(1, 1, RED, {2, 2, 1, 8, 5, 0.7f, 13, 12, 1.0f}, 3.0f);
        expect(fresh->pushEvent(freshBuffer, copy).has_value());

        auto a = *liveBuffer.surface().readPixels();
        auto b = *freshBuffer.surface().readPixels();
        expect(a == b);
    };

    "eraser on an opaque attachment previews as normal"_test = [] {
        auto picture = makeCpuPicture(4, 4, 1.0f, 0);
        expect((picture != nullptr) >> fatal);
        expect(picture->addBuffer(0, WHITE, false, false).has_value());
        auto ev = FillEvent::create(1, 1, false, BLACK, 1.0f, BlendMode::Eraser, Rect(0, 4, 0, 4));
        expect(picture->setCurrentBuffer(ev).has_value());
        expect(picture->currentBufferMode() == BlendMode::Normal);
        expect(ev->mode() == BlendMode::Eraser);
    };

    "eraser preview follows the alpha of the attached buffer"_test = [] {
        auto picture = makeCpuPicture(4, 4, 1.0f, 0);
        expect((picture != nullptr) >> fatal);
        expect(picture->addBuffer(0, WHITE, false, false).has_value());
        auto& top = **picture->addBuffer(1, TRANSPARENT, false, true);
        expect(picture->pushEvent(top, fill(1, 1, RED, Rect(0, 4, 0, 4))).has_value());

        auto ev = FillEvent::create(1, 2, false, BLACK, 1.0f, BlendMode::Eraser, Rect(0, 4, 0, 4));
        expect(picture->setCurrentBuffer(ev).has_value());
        expect(picture->currentBufferMode() == BlendMode::Normal);
        expect(pixelAt(*picture, 1, 1) == RED);

        expect(picture->setCurrentBufferAttachment(1).has_value());
        expect(picture->currentBufferMode() == BlendMode::Eraser);
        expect(near(pixelAt(*picture, 1, 1), WHITE));

        expect(picture->setCurrentBufferAttachment(0).has_value());
        expect(picture->currentBufferMode() == BlendMode::Normal);
        expect(pixelAt(*picture, 1, 1) == RED);

        expect(picture->setCurrentBufferAttachment(-1).has_value());
        expect(picture->currentBufferMode() == BlendMode::Eraser);
    };

    "attaching after setting the live event draws it"_test = [] {
        auto picture = makeCpuPicture(8, 8);
        expect((picture != nullptr) >> fatal);
        auto& buffer = **picture->addBuffer(0, WHITE, false, false);
        auto ev = stroke(1, 1, BLACK, {1, 4, 1, 6, 4, 1});
        expect(picture->setCurrentBuffer(ev).has_value());
        expect(pixelAt(*picture, 4, 4) == WHITE);

        expect(picture->setCurrentBufferAttachment(0).has_value());
        expect(pixelAt(*picture, 4, 4).r < 128_u);
        expect(*buffer.getPixelRGBA(Vec2(4, 4)) == WHITE);
    };

    "hidden and merged buffers are not composited"_test = [] {
        auto picture = makeCpuPicture(4, 4);
        expect((picture != nullptr) >> fatal);
        auto& bottom = **picture->addBuffer(0, WHITE, false, false);
        auto& top = **picture->addBuffer(1, TRANSPARENT, false, true);
        expect(picture->pushEvent(top, fill(1, 1, RED, Rect(0, 2, 0, 4))).has_value());
        expect(pixelAt(*picture, 0, 0) == RED);

        picture->setBufferVisible(top, false);
        expect(pixelAt(*picture, 0, 0) == WHITE);
        picture->setBufferVisible(top, true);

        expect(picture->pushEvent(bottom, BufferMergeEvent::create(1, 2, false, 0.5f, {1})).has_value());
        Rgba merged = pixelAt(*picture, 0, 0);
        expect(near(merged, Rgba{255, 128, 128, 255}));
        expect(near(*bottom.getPixelRGBA(Vec2(0, 0)), merged));
    };

    "bitmap scale applies to pushed events"_test = [] {
        auto picture = makeCpuPicture(4, 4, 2.0f);
        expect((picture != nullptr) >> fatal);
        expect(picture->bitmapWidth() == 8_i);
        expect(picture->bitmapHeight() == 8_i);
        auto& buffer = **picture->addBuffer(0, WHITE, false, false);
        expect(picture->pushEvent(buffer, fill(1, 1, BLACK, Rect(0, 2, 0, 2))).has_value());
        expect(pixelAt(*picture, 3, 3) == BLACK);
        expect(pixelAt(*picture, 4, 4) == WHITE);
    };

    "moveEvent transfers ownership"_test = [] {
        auto picture = makeCpuPicture(4, 4);
        expect((picture != nullptr) >> fatal);
        auto& a = **picture->addBuffer(0, WHITE, false, false);
        auto& b = **picture->addBuffer(1, TRANSPARENT, false, true);
        auto ev = fill(1, 1, BLUE, Rect(0, 4, 0, 4));
        expect(picture->pushEvent(a, ev).has_value());
        expect(picture->moveEvent(b, a, ev).has_value());
        expect(a.eventCount() == 0_u);
        expect(b.eventCount() == 1_u);
        expect(*a.getPixelRGBA(Vec2(1, 1)) == WHITE);
        expect(*b.getPixelRGBA(Vec2(1, 1)) == BLUE);
    };

    "blame walks buffers from the top"_test = [] {
        auto picture = makeCpuPicture(4, 4);
        expect((picture != nullptr) >> fatal);
        auto& a = **picture->addBuffer(0, WHITE, false, false);
        auto& b = **picture->addBuffer(1, TRANSPARENT, false, true);
        expect(picture->pushEvent(a, fill(1, 1, RED, Rect(0, 4, 0, 4))).has_value());
        expect(picture->pushEvent(b, fill(2, 1, BLUE, Rect(0, 4, 0, 4), 0.25f)).has_value());
        auto blame = picture->blamePixel(Vec2(2, 2));
        expect(blame.has_value() >> fatal);
        expect((blame->size() == 2_u) >> fatal);
        expect((*blame)[0].event->sid() == 2_i);
        expect((*blame)[0].alpha == 0.25_f);
        expect((*blame)[1].event->sid() == 1_i);
    };

    "events from another picture's buffer are rejected"_test = [] {
        auto one = makeCpuPicture(4, 4);
        auto two = makeCpuPicture(4, 4);
        expect((one != nullptr && two != nullptr) >> fatal);
        auto& foreign = **two->addBuffer(0, WHITE, false, false);
        auto res = one->pushEvent(foreign, fill(1, 1, BLACK, Rect(0, 4, 0, 4)));
        expect(!res.has_value());
        if (!res) expect(res.error().code() == Error::Code::InvalidIndex);
    };

    "creation fails without a usable backend"_test = [] {
        auto none = Picture::create(0, 4, 4, 1.0f, {}, -1);
        expect(!none.has_value());
        if (!none) expect(none.error().code() == Error::Code::BackendUnavailable);

        auto empty = Picture::create(0, 0, 4, 1.0f, {BackendMode::Cpu}, -1);
        expect(!empty.has_value());
    };

    "oversized pictures are refused before allocating"_test = [] {
        for (auto [width, height, scale] : {std::tuple{100000, 4, 1.0f}, std::tuple{16384, 16384, 1.0f},
                                            std::tuple{4, 4, 1.0e30f}, std::tuple{4, 4, 1.0e-9f}}) {
            auto res = Picture::create(0, width, height, scale, {BackendMode::Cpu}, -1);
            expect(!res.has_value()) << width << "x" << height << "at" << scale;
            if (!res) expect(res.error().code() == Error::Code::InvalidIndex) << res.error().message();
        }

        auto backend = RenderBackend::create(BackendMode::Cpu, 20000, 1, BackendEnvironment());
        expect(!backend.has_value());
        if (!backend) expect(backend.error().code() == Error::Code::InvalidIndex);
    };

    "toPixels returns straight rgba rows"_test = [] {
        auto picture = makeCpuPicture(2, 2);
        expect((picture != nullptr) >> fatal);
        auto& buffer = **picture->addBuffer(0, TRANSPARENT, false, true);
        expect(picture->pushEvent(buffer, fill(1, 1, RED, Rect(0, 1, 0, 1), 0.5f)).has_value());
        auto pixels = picture->toPixels();
        expect(pixels.has_value() >> fatal);
        expect(pixels->size() == 16_u);
        expect((*pixels)[0] == 255_u);
        expect((*pixels)[3] == 128_u);
        expect((*pixels)[7] == 0_u);
    };
};
