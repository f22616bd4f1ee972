//=============================================================================
// Serialization Tests
//
// Picture text form: header, buffer blocks, event lines, metadata trailer
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "harness/picture_harness.h"
#include <pictura/serialization.h>
#include <string>

using namespace boost::ut;
using namespace pictura;
using namespace pictura::test;

namespace {

const std::string SAMPLE =
    "picture 6 4\n"
    "buffer 0 255 255 255 255 1 0 1\n"
    "fill 1 1 0 255 0 0 1 0 0 3 0 4\n"
    "brush 1 2 1 0 0 255 1 1 2 0.5 0 0 1 1 1 5 3 0.5\n"
    "buffer 3 0 0 0 0 0 1 0\n"
    "scatter 2 1 0 0 255 0 0.5 1 1 0.5 0 0 4 2 1\n"
    "bufferMerge 1 3 0 0.75 0";

Result<ParsedPicture> parseCpu(const std::string& text, float scale = 1.0f) {
    PictureOptions options;
    options.frameScheduler = ManualFrameScheduler::create();
    return Picture::parse(0, text, scale, {BackendMode::Cpu}, -1, options);
}

} // namespace

suite serialization_tests = [] {
    "lines and tokens"_test = [] {
        auto lines = splitLines("a\r\nb\n\nc");
        expect((lines.size() == 4_u) >> fatal);
        expect(lines[0] == "a");
        expect(lines[1] == "b");
        expect(lines[2].empty());
        expect(lines[3] == "c");

        auto tokens = splitTokens("fill  1 2 ");
        expect((tokens.size() == 3_u) >> fatal);
        expect(tokens[0] == "fill");
        expect(tokens[2] == "2");
    };

    "parse builds buffers and events"_test = [] {
        auto parsed = parseCpu(SAMPLE);
        expect(parsed.has_value() >> fatal) << (parsed ? "" : parsed.error().message());
        auto& picture = *parsed->picture;
        expect(picture.width() == 6_i);
        expect(picture.height() == 4_i);
        expect((picture.bufferCount() == 2_u) >> fatal);

        const auto& first = picture.buffer(0);
        expect(first.id() == 0_i);
        expect(first.hasUndoStates());
        expect(!first.hasAlpha());
        expect(first.insertionPoint() == 1_u);
        expect(first.eventCount() == 2_u);
        expect(first.events()[1]->undone());

        const auto& second = picture.buffer(1);
        expect(second.id() == 3_i);
        expect(second.clearColor() == TRANSPARENT);
        expect(second.hasAlpha());
        expect(second.eventCount() == 2_u);
        expect(parsed->metadata.empty());
        expect(picture.generationTime() >= 0.0);
    };

    "serialize reproduces the parsed text"_test = [] {
        auto parsed = parseCpu(SAMPLE);
        expect(parsed.has_value() >> fatal);
        expect(parsed->picture->serialize() == SAMPLE);
    };

    "serialize then parse keeps the image"_test = [] {
        auto parsed = parseCpu(SAMPLE);
        expect(parsed.has_value() >> fatal);
        auto again = parseCpu(parsed->picture->serialize());
        expect(again.has_value() >> fatal);
        auto a = parsed->picture->toPixels();
        auto b = again->picture->toPixels();
        expect((a.has_value() && b.has_value()) >> fatal);
        expect(*a == *b);
    };

    "serialization stays in picture space under bitmap scale"_test = [] {
        auto parsed = parseCpu(SAMPLE, 2.0f);
        expect(parsed.has_value() >> fatal);
        expect(parsed->picture->bitmapWidth() == 12_i);
        expect(parsed->picture->serialize() == SAMPLE);
    };

    "metadata lines are returned verbatim"_test = [] {
        auto parsed = parseCpu("picture 2 2\r\nbuffer 0 255 255 255 255 0 0 0\r\nmetadata\r\ntitle sky\r\n");
        expect(parsed.has_value() >> fatal);
        expect((parsed->metadata.size() == 3_u) >> fatal);
        expect(parsed->metadata[0] == "metadata");
        expect(parsed->metadata[1] == "title sky");
        expect(parsed->metadata[2].empty());
        expect(parsed->picture->bufferCount() == 1_u);
    };

    "empty picture round trips"_test = [] {
        auto picture = makeCpuPicture(3, 5);
        expect((picture != nullptr) >> fatal);
        expect(picture->serialize() == "picture 3 5");
        auto parsed = parseCpu("picture 3 5");
        expect(parsed.has_value() && parsed->picture->bufferCount() == 0u);
    };

    "malformed input yields no picture"_test = [] {
        for (const std::string text : {
                 "",
                 "image 4 4",
                 "picture 4",
                 "picture four 4",
                 "picture 4 4\nfill 1 1 0 0 0 0 1 0 0 1 0 1",
                 "picture 4 4\nbuffer 0 255 255 255",
                 "picture 4 4\nbuffer 0 255 255 255 255 2 0 0",
                 "picture 4 4\nbuffer 0 255 255 255 255 0 0 0\nfill 1 1 0 0 0",
             }) {
            auto parsed = parseCpu(text);
            expect(!parsed.has_value()) << "accepted:" << text;
            if (!parsed) {
                expect(parsed.error().code() == Error::Code::MalformedSerialization) << parsed.error().message();
            }
        }
    };

    "non-finite event fields are malformed"_test = [] {
        auto parsed = parseCpu("picture 4 4\nbuffer 0 255 255 255 255 0 0 1\n"
                               "brush 1 1 0 0 0 0 1 1 2 0.5 0 0 1 1 1 inf 1 1");
        expect(!parsed.has_value());
        if (!parsed) expect(parsed.error().code() == Error::Code::MalformedSerialization) << parsed.error().message();
    };

    "a stroke running far off the canvas draws its visible part"_test = [] {
        auto parsed = parseCpu("picture 16 16\nbuffer 0 255 255 255 255 0 0 1\n"
                               "brush 1 1 0 0 0 0 1 1 2 0.5 0 0 2 8 1 1e+09 8 1");
        expect(parsed.has_value() >> fatal) << (parsed ? "" : parsed.error().message());
        auto& picture = *parsed->picture;
        expect(near(pixelAt(picture, 12, 8), BLACK, 8));
        expect(near(pixelAt(picture, 12, 2), WHITE));
        expect(picture.serialize().ends_with("2 8 1 1e+09 8 1"));
    };

    "failing backend creation is reported"_test = [] {
        auto parsed = Picture::parse(0, "picture 4 4", 1.0f, {}, -1);
        expect(!parsed.has_value());
        if (!parsed) expect(parsed.error().code() == Error::Code::BackendUnavailable);
    };
};
