//=============================================================================
// Config Tests
//
// Defaults, file, environment and command line layering
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <pictura/config.h>
#include <pictura/picture.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace boost::ut;
using namespace pictura;

namespace {

std::filesystem::path writeTempConfig(const std::string& name, const std::string& yaml) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << yaml;
    return path;
}

} // namespace

suite config_tests = [] {
    "defaults are present"_test = [] {
        auto config = Config::create(writeTempConfig("pictura-empty.yaml", "").string());
        expect(config.has_value() >> fatal);
        expect((*config)->get<int>(Config::KEY_PICTURE_UNDO_STATE_INTERVAL, 0) == 16_i);
        expect((*config)->get<int>(Config::KEY_PICTURE_MAX_UNDO_STATES, 0) == 5_i);
        expect((*config)->get<int>(Config::KEY_GPU_MAX_LAYERS_PER_PASS, 0) == 12_i);
        expect((*config)->get<std::string>(Config::KEY_LOG_LEVEL, "") == std::string("info"));
        auto modes = (*config)->getList(Config::KEY_PICTURE_MODES);
        expect((modes.size() == 3_u) >> fatal);
        expect(modes[2] == std::string("cpu"));
    };

    "file values override defaults"_test = [] {
        auto path = writeTempConfig("pictura-file.yaml",
                                    "picture:\n  bitmap-scale: 2.5\n  modes: [cpu]\nanimation:\n  speed: 0.2\n");
        auto config = Config::create(path.string());
        expect(config.has_value() >> fatal);
        expect((*config)->loadedPath() == path.string());
        expect((*config)->get<float>(Config::KEY_PICTURE_BITMAP_SCALE, 1.0f) == 2.5_f);
        expect((*config)->get<int>(Config::KEY_PICTURE_UNDO_STATE_INTERVAL, 0) == 16_i);

        auto options = PictureOptions::fromConfig(**config);
        expect(options.animationSpeed == 0.2_f);
        auto modes = PictureOptions::modesFromConfig(**config);
        expect((modes.size() == 1_u) >> fatal);
        expect(modes[0] == BackendMode::Cpu);
    };

    "command line overrides win"_test = [] {
        auto path = writeTempConfig("pictura-cmd.yaml", "animation:\n  simultaneous-strokes: 3\n");
        YAML::Node overrides;
        overrides["animation"]["simultaneous-strokes"] = 7;
        auto config = Config::create(path.string(), overrides);
        expect(config.has_value() >> fatal);
        expect((*config)->get<int>(Config::KEY_ANIMATION_SIMULTANEOUS_STROKES, 0) == 7_i);
    };

    "environment overrides apply"_test = [] {
        ::setenv("PICTURA_PICTURE_MAX_UNDO_STATES", "9", 1);
        ::setenv("PICTURA_PICTURE_MODES", "gpu-no-float,cpu", 1);
        auto config = Config::create(writeTempConfig("pictura-env.yaml", "").string());
        ::unsetenv("PICTURA_PICTURE_MAX_UNDO_STATES");
        ::unsetenv("PICTURA_PICTURE_MODES");
        expect(config.has_value() >> fatal);
        expect((*config)->get<int>(Config::KEY_PICTURE_MAX_UNDO_STATES, 0) == 9_i);
        auto modes = PictureOptions::modesFromConfig(**config);
        expect((modes.size() == 2_u) >> fatal);
        expect(modes[0] == BackendMode::GpuNoFloat);
    };

    "missing explicit file is an error"_test = [] {
        auto config = Config::create("/nonexistent/pictura.yaml");
        expect(!config.has_value());
    };

    "malformed yaml is an error"_test = [] {
        auto config = Config::create(writeTempConfig("pictura-bad.yaml", "picture: [unclosed\n").string());
        expect(!config.has_value());
    };

    "missing keys and wrong types fall back"_test = [] {
        auto config = Config::create(writeTempConfig("pictura-types.yaml", "picture:\n  bitmap-scale: big\n").string());
        expect(config.has_value() >> fatal);
        expect(!(*config)->get<float>(Config::KEY_PICTURE_BITMAP_SCALE).has_value());
        expect((*config)->get<float>(Config::KEY_PICTURE_BITMAP_SCALE, 1.5f) == 1.5_f);
        expect(!(*config)->has("picture/nothing/here"));
        expect((*config)->has(Config::KEY_PICTURE_MODES));
    };

    "unknown modes are skipped"_test = [] {
        YAML::Node overrides;
        overrides["picture"]["modes"] = "vulkan,cpu";
        auto config = Config::create(writeTempConfig("pictura-modes.yaml", "").string(), overrides);
        expect(config.has_value() >> fatal);
        auto modes = PictureOptions::modesFromConfig(**config);
        expect((modes.size() == 1_u) >> fatal);
        expect(modes[0] == BackendMode::Cpu);
    };

    "env var names"_test = [] {
        expect(Config::pathToEnvVar("picture/bitmap-scale") == std::string("PICTURA_PICTURE_BITMAP_SCALE"));
        expect(Config::pathToEnvVar("gpu/max-layers-per-pass") == std::string("PICTURA_GPU_MAX_LAYERS_PER_PASS"));
    };
};
