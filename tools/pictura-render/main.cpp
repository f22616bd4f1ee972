// pictura-render: Rasterize a serialized picture into a PNG
//
// Usage:
//   pictura-render drawing.pic -o drawing.png
//   pictura-render drawing.pic --mode cpu --scale 2 --blame 10,12
//   pictura-render drawing.pic --animate --strokes 3 --speed 0.1

#include <pictura/brush-textures.h>
#include <pictura/config.h>
#include <pictura/picture.h>

#include <ytrace/ytrace.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <args.hxx>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace pictura;

//=============================================================================
// Helpers
//=============================================================================

static const char* kindName(EventKind kind) {
    switch (kind) {
        case EventKind::Brush: return "brush";
        case EventKind::Scatter: return "scatter";
        case EventKind::Fill: return "fill";
        case EventKind::Gradient: return "gradient";
        case EventKind::BufferMerge: return "bufferMerge";
    }
    return "unknown";
}

// "x,y" in bitmap pixels
static bool parsePoint(const std::string& text, Vec2& out) {
    float x = 0, y = 0;
    char trailing = 0;
    if (std::sscanf(text.c_str(), "%f,%f%c", &x, &y, &trailing) != 2) {
        return false;
    }
    out = Vec2(x, y);
    return true;
}

static void setupLogging(const std::string& level, const std::string& logFile) {
    std::shared_ptr<spdlog::logger> logger;
    if (!logFile.empty()) {
        logger = spdlog::basic_logger_mt("pictura-render", logFile, true);
    } else {
        logger = spdlog::stderr_color_mt("pictura-render");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::flush_on(spdlog::level::info);
}

static Result<std::string> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::string>("failed to open " + path, Error::Code::Io);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return Ok(ss.str());
}

//=============================================================================
// Main
//=============================================================================

int main(int argc, char** argv) {
    args::ArgumentParser parser("pictura-render - Rasterize a serialized picture into a PNG");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> outputFlag(parser, "PNG", "Output PNG file", {'o', "output"}, "out.png");
    args::ValueFlagList<std::string> modeFlag(parser, "MODE", "Backend mode to try (gpu, gpu-no-float, cpu)", {"mode"});
    args::ValueFlag<float> scaleFlag(parser, "SCALE", "Bitmap scale", {"scale"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "Config file", {"config"});
    args::ValueFlagList<std::string> brushFlag(parser, "IMAGE", "Brush texture image, in texture id order", {"brush"});
    args::ValueFlag<std::string> blameFlag(parser, "X,Y", "Print the events touching a pixel", {"blame"});
    args::ValueFlag<std::string> pixelFlag(parser, "X,Y", "Print the color of a pixel", {"pixel"});
    args::Flag animateFlag(parser, "animate", "Play the drawing animation before writing", {"animate"});
    args::ValueFlag<int> strokesFlag(parser, "N", "Simultaneous animation strokes", {"strokes"});
    args::ValueFlag<float> speedFlag(parser, "SPEED", "Animation speed per frame", {"speed"});
    args::ValueFlag<std::string> logLevelFlag(parser, "LEVEL", "Log level", {"log-level"});
    args::ValueFlag<std::string> logFileFlag(parser, "FILE", "Log to file instead of stderr", {"log-file"});
    args::Positional<std::string> inputFile(parser, "file", "Serialized picture");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    if (!inputFile) {
        std::cerr << "Error: no input file\n" << parser;
        return 1;
    }

    // Command line values override the config file
    YAML::Node overrides(YAML::NodeType::Map);
    if (modeFlag) {
        YAML::Node modes(YAML::NodeType::Sequence);
        for (const auto& mode : args::get(modeFlag)) modes.push_back(mode);
        overrides["picture"]["modes"] = modes;
    }
    if (scaleFlag) overrides["picture"]["bitmap-scale"] = args::get(scaleFlag);
    if (strokesFlag) overrides["animation"]["simultaneous-strokes"] = args::get(strokesFlag);
    if (speedFlag) overrides["animation"]["speed"] = args::get(speedFlag);
    if (logLevelFlag) overrides["log"]["level"] = args::get(logLevelFlag);

    auto configResult = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!configResult) {
        std::cerr << "Error: " << error_msg(configResult) << "\n";
        return 1;
    }
    auto config = *configResult;

    setupLogging(config->get<std::string>(Config::KEY_LOG_LEVEL, "info"),
                 logFileFlag ? args::get(logFileFlag) : "");

    auto options = PictureOptions::fromConfig(*config);
    auto modes = PictureOptions::modesFromConfig(*config);
    float scale = config->get<float>(Config::KEY_PICTURE_BITMAP_SCALE, 1.0f);
    auto scheduler = ManualFrameScheduler::create();
    options.frameScheduler = scheduler;

    if (brushFlag) {
        auto images = std::make_shared<std::vector<BrushImage>>();
        for (const auto& path : args::get(brushFlag)) {
            auto image = loadBrushImage(path);
            if (!image) {
                std::cerr << "Error: " << error_msg(image) << "\n";
                return 1;
            }
            images->push_back(std::move(*image));
        }
        options.brushTextures = images;
    }

    auto text = readFile(args::get(inputFile));
    if (!text) {
        std::cerr << "Error: " << error_msg(text) << "\n";
        return 1;
    }

    auto parsed = Picture::parse(0, *text, scale, modes, -1, options);
    if (!parsed) {
        std::cerr << "Error: " << error_msg(parsed) << "\n";
        return 1;
    }
    auto picture = parsed->picture;
    yinfo("pictura-render: {}x{} picture, {} buffers, {} backend, parsed in {:.1f} ms",
          picture->width(), picture->height(), picture->bufferCount(), backendModeName(picture->mode()),
          picture->generationTime());

    if (animateFlag) {
        bool finished = false;
        if (!picture->animate(options.simultaneousStrokes, options.animationSpeed, [&finished]() { finished = true; })) {
            std::cerr << "Error: animation could not start\n";
            return 1;
        }
        size_t frames = scheduler->runUntilIdle();
        yinfo("pictura-render: animation ran {} frames", frames);
        if (!finished) {
            std::cerr << "Error: animation did not finish\n";
            return 1;
        }
    }

    auto pixels = picture->toPixels();
    if (!pixels) {
        std::cerr << "Error: " << error_msg(pixels) << "\n";
        return 1;
    }
    std::string outPath = args::get(outputFlag);
    int w = picture->bitmapWidth();
    int h = picture->bitmapHeight();
    if (!stbi_write_png(outPath.c_str(), w, h, 4, pixels->data(), w * 4)) {
        std::cerr << "Error: failed to write " << outPath << "\n";
        return 1;
    }
    yinfo("pictura-render: wrote {}x{} image to {}", w, h, outPath);

    if (pixelFlag) {
        Vec2 p;
        if (!parsePoint(args::get(pixelFlag), p)) {
            std::cerr << "Error: --pixel expects X,Y\n";
            return 1;
        }
        auto c = picture->getPixelRGBA(p);
        if (!c) {
            std::cerr << "Error: " << error_msg(c) << "\n";
            return 1;
        }
        std::cout << "pixel " << p.x << "," << p.y << ": " << int(c->r) << " " << int(c->g) << " "
                  << int(c->b) << " " << int(c->a) << "\n";
    }

    if (blameFlag) {
        Vec2 p;
        if (!parsePoint(args::get(blameFlag), p)) {
            std::cerr << "Error: --blame expects X,Y\n";
            return 1;
        }
        auto blame = picture->blamePixel(p);
        if (!blame) {
            std::cerr << "Error: " << error_msg(blame) << "\n";
            return 1;
        }
        for (const auto& entry : *blame) {
            std::cout << kindName(entry.event->kind()) << " sid=" << entry.event->sid()
                      << " eid=" << entry.event->sessionEventId() << " alpha=" << entry.alpha << "\n";
        }
    }

    for (size_t i = 1; i < parsed->metadata.size(); i++) {
        ydebug("metadata: {}", parsed->metadata[i]);
    }
    return 0;
}
