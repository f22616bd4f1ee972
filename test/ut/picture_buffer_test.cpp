//=============================================================================
// Picture Buffer Tests
//
// Event list mutations, re-rasterization and undo snapshots on the CPU backend
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "harness/picture_harness.h"
#include <pictura/picture-buffer.h>

using namespace boost::ut;
using namespace pictura;
using namespace pictura::test;

namespace {

struct BufferFixture {
    RenderBackend::Ptr backend;
    Rasterizer::Ptr rasterizer;
    PictureBuffer::Ptr buffer;

    explicit BufferFixture(bool hasAlpha = false, PictureBuffer::Options options = PictureBuffer::Options()) {
        backend = makeCpuBackend(8, 8);
        rasterizer = *backend->createRasterizer();
        buffer = *PictureBuffer::create(backend, 1, WHITE, true, hasAlpha, options);
    }

    Rgba pixel(float x, float y) {
        auto res = buffer->getPixelRGBA(Vec2(x, y));
        return res ? *res : Rgba{1, 2, 3, 4};
    }
};

} // namespace

suite picture_buffer_tests = [] {
    "new buffer is filled with its clear color"_test = [] {
        BufferFixture f;
        expect(f.pixel(0, 0) == WHITE);
        expect(f.pixel(7, 7) == WHITE);
        expect(f.buffer->eventCount() == 0_u);
    };

    "buffer without alpha keeps an opaque clear color"_test = [] {
        auto backend = makeCpuBackend(4, 4);
        auto buffer = *PictureBuffer::create(backend, 1, Rgba{10, 20, 30, 0}, false, false, {});
        expect(*buffer->getPixelRGBA(Vec2(1, 1)) == Rgba{10, 20, 30, 255});
    };

    "push draws the event"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 1, BLACK, Rect(0, 4, 0, 8)), *f.rasterizer).has_value());
        expect(f.pixel(1, 1) == BLACK);
        expect(f.pixel(5, 1) == WHITE);
    };

    "pushed undone event is kept but not drawn"_test = [] {
        BufferFixture f;
        auto ev = fill(1, 1, BLACK, Rect(0, 8, 0, 8));
        ev->setUndone(true);
        expect(f.buffer->pushEvent(ev, *f.rasterizer).has_value());
        expect(f.buffer->eventCount() == 1_u);
        expect(f.pixel(1, 1) == WHITE);
    };

    "undo and redo re-rasterize"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 1, BLACK, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        expect(f.buffer->pushEvent(fill(1, 2, RED, Rect(0, 4, 0, 8)), *f.rasterizer).has_value());

        auto undone = f.buffer->undoEventIndex(0, *f.rasterizer);
        expect(undone.has_value() >> fatal);
        expect((*undone)->undone());
        expect(f.pixel(6, 1) == WHITE);
        expect(f.pixel(1, 1) == RED);

        expect(f.buffer->redoEventIndex(0, *f.rasterizer).has_value());
        expect(f.pixel(6, 1) == BLACK);
        expect(f.pixel(1, 1) == RED);
    };

    "undo of an undone event is a no-op"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 1, BLACK, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        expect(f.buffer->undoEventIndex(0, *f.rasterizer).has_value());
        auto again = f.buffer->undoEventIndex(0, *f.rasterizer);
        expect(again.has_value());
        expect(f.pixel(1, 1) == WHITE);
    };

    "out of range indices are rejected"_test = [] {
        BufferFixture f;
        for (auto res : {f.buffer->undoEventIndex(0, *f.rasterizer), f.buffer->redoEventIndex(3, *f.rasterizer),
                         f.buffer->removeEventIndex(1, *f.rasterizer)}) {
            expect(!res.has_value());
            if (!res) expect(res.error().code() == Error::Code::InvalidIndex);
        }
    };

    "remove drops the event and adjusts the insertion point"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 1, BLACK, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        expect(f.buffer->pushEvent(fill(1, 2, RED, Rect(0, 4, 0, 8)), *f.rasterizer).has_value());
        f.buffer->setInsertionPoint(2);
        auto removed = f.buffer->removeEventIndex(0, *f.rasterizer);
        expect(removed.has_value() >> fatal);
        expect((*removed)->sessionEventId() == 1_i);
        expect(f.buffer->eventCount() == 1_u);
        expect(f.buffer->insertionPoint() == 1_u);
        expect(f.pixel(6, 1) == WHITE);
    };

    "insert places the event under later ones"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 1, RED, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        f.buffer->setInsertionPoint(0);
        expect(f.buffer->insertEvent(fill(2, 1, BLACK, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        expect(f.buffer->eventCount() == 2_u);
        expect(f.buffer->events()[0]->sid() == 2_i);
        expect(f.buffer->insertionPoint() == 1_u);
        expect(f.pixel(3, 3) == RED);
    };

    "insertion point past the end appends"_test = [] {
        BufferFixture f;
        f.buffer->setInsertionPoint(10);
        expect(f.buffer->insertEvent(fill(1, 1, RED, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        expect(f.buffer->insertionPoint() == 1_u);
        expect(f.pixel(3, 3) == RED);
    };

    "findLatest skips undone events"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 4, BLACK, Rect(0, 1, 0, 1)), *f.rasterizer).has_value());
        expect(f.buffer->pushEvent(fill(1, 7, BLACK, Rect(0, 1, 0, 1)), *f.rasterizer).has_value());
        expect(f.buffer->pushEvent(fill(2, 9, BLACK, Rect(0, 1, 0, 1)), *f.rasterizer).has_value());
        expect(f.buffer->findLatest(1) == 1_i);
        expect(f.buffer->undoEventIndex(1, *f.rasterizer).has_value());
        expect(f.buffer->findLatest(1) == 0_i);
        expect(f.buffer->findLatest(3) == -1_i);
        expect(f.buffer->eventIndexBySessionId(2, 9) == 2_i);
        expect(f.buffer->eventIndexBySessionId(2, 8) == -1_i);
    };

    "undo snapshots are bounded and replay matches full replay"_test = [] {
        PictureBuffer::Options options;
        options.undoStateInterval = 2;
        options.maxUndoStates = 2;
        BufferFixture f(false, options);
        for (int i = 0; i < 8; i++) {
            Rgba c{static_cast<uint8_t>(30 * i), 0, 0, 255};
            expect(f.buffer->pushEvent(fill(1, i + 1, c, Rect(float(i), float(i + 1), 0, 8)), *f.rasterizer).has_value());
        }
        expect(f.buffer->undoStateCount() == 2_u);

        expect(f.buffer->undoEventIndex(6, *f.rasterizer).has_value());
        expect(f.pixel(6, 0) == WHITE);
        expect(f.pixel(5, 0) == Rgba{150, 0, 0, 255});
        expect(f.pixel(7, 0) == Rgba{210, 0, 0, 255});

        expect(f.buffer->undoEventIndex(1, *f.rasterizer).has_value());
        expect(f.pixel(1, 0) == WHITE);
        expect(f.pixel(0, 0) == Rgba{0, 0, 0, 255});
        expect(f.pixel(7, 0) == Rgba{210, 0, 0, 255});
    };

    "eraser on an opaque buffer paints the clear color"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 1, BLACK, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        expect(f.buffer->pushEvent(fill(1, 2, RED, Rect(0, 4, 0, 8), 1.0f, BlendMode::Eraser), *f.rasterizer).has_value());
        expect(f.pixel(1, 1) == WHITE);
        expect(f.pixel(5, 1) == BLACK);
    };

    "eraser on a transparent buffer clears alpha"_test = [] {
        auto backend = makeCpuBackend(4, 4);
        auto r = *backend->createRasterizer();
        auto buffer = *PictureBuffer::create(backend, 1, TRANSPARENT, false, true, {});
        expect(buffer->pushEvent(fill(1, 1, BLACK, Rect(0, 4, 0, 4)), *r).has_value());
        expect(buffer->pushEvent(fill(1, 2, BLACK, Rect(0, 2, 0, 4), 1.0f, BlendMode::Eraser), *r).has_value());
        expect(buffer->getPixelRGBA(Vec2(0, 0))->a == 0_u);
        expect(buffer->getPixelRGBA(Vec2(3, 0))->a == 255_u);
    };

    "blame reports events touching a pixel newest first"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 1, BLACK, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        expect(f.buffer->pushEvent(fill(1, 2, RED, Rect(0, 4, 0, 8), 0.5f), *f.rasterizer).has_value());
        expect(f.buffer->pushEvent(fill(1, 3, BLUE, Rect(6, 8, 0, 8)), *f.rasterizer).has_value());

        auto blame = f.buffer->blamePixel(Vec2(1.5f, 1.5f), *f.rasterizer);
        expect(blame.has_value() >> fatal);
        expect((blame->size() == 2_u) >> fatal);
        expect((*blame)[0].event->sessionEventId() == 2_i);
        expect((*blame)[0].alpha == 0.5_f);
        expect((*blame)[1].event->sessionEventId() == 1_i);
        expect((*blame)[1].alpha == 1.0_f);
        expect(f.rasterizer->drawingEvent() == nullptr);
    };

    "blame outside the bitmap is empty"_test = [] {
        BufferFixture f;
        expect(f.buffer->pushEvent(fill(1, 1, BLACK, Rect(0, 8, 0, 8)), *f.rasterizer).has_value());
        auto blame = f.buffer->blamePixel(Vec2(-3, 2), *f.rasterizer);
        expect(blame.has_value() && blame->empty());
    };

    "merge composites the resolved buffer"_test = [] {
        auto backend = makeCpuBackend(4, 4);
        auto r = *backend->createRasterizer();
        auto bottom = *PictureBuffer::create(backend, 1, WHITE, false, false, {});
        auto top = *PictureBuffer::create(backend, 2, TRANSPARENT, false, true, {});
        bottom->setMergeResolver([&](int id) -> Surface* { return id == 2 ? &top->surface() : nullptr; });

        expect(top->pushEvent(fill(1, 1, RED, Rect(0, 2, 0, 4)), *r).has_value());
        expect(bottom->pushEvent(BufferMergeEvent::create(1, 2, false, 1.0f, {2}), *r).has_value());
        expect(bottom->mergesBuffer(2));
        expect(!bottom->mergesBuffer(3));
        expect(*bottom->getPixelRGBA(Vec2(0, 0)) == RED);
        expect(*bottom->getPixelRGBA(Vec2(3, 0)) == WHITE);

        auto blame = bottom->blamePixel(Vec2(0, 0), *r);
        expect(blame.has_value() && blame->size() == 1u);

        expect(bottom->undoEventIndex(0, *r).has_value());
        expect(!bottom->mergesBuffer(2));
        expect(*bottom->getPixelRGBA(Vec2(0, 0)) == WHITE);
    };

    "free is idempotent"_test = [] {
        BufferFixture f;
        f.buffer->free();
        f.buffer->free();
        expect(true);
    };
};
