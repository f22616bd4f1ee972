#pragma once

#include <pictura/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pictura {

/**
 * Layered configuration: built-in defaults, then an optional YAML file,
 * then PICTURA_* environment variables, then command line overrides.
 *
 * Keys are slash separated paths such as "picture/bitmap-scale".
 */
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    /**
     * @param configPath YAML file; empty means the XDG location if it exists
     * @param cmdOverrides Map merged over everything else
     */
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Value at path, nullopt if missing or not convertible
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // Sequence at path; a scalar is split on commas
    std::vector<std::string> getList(const std::string& path) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // Path of the file actually loaded, empty when none was
    const std::string& loadedPath() const { return _loadedPath; }

    static std::filesystem::path getXDGConfigPath();

    // "picture/bitmap-scale" -> "PICTURA_PICTURE_BITMAP_SCALE"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "PICTURA_";

    static constexpr const char* KEY_PICTURE_MODES = "picture/modes";
    static constexpr const char* KEY_PICTURE_BITMAP_SCALE = "picture/bitmap-scale";
    static constexpr const char* KEY_PICTURE_UNDO_STATE_INTERVAL = "picture/undo-state-interval";
    static constexpr const char* KEY_PICTURE_MAX_UNDO_STATES = "picture/max-undo-states";
    static constexpr const char* KEY_ANIMATION_SIMULTANEOUS_STROKES = "animation/simultaneous-strokes";
    static constexpr const char* KEY_ANIMATION_SPEED = "animation/speed";
    static constexpr const char* KEY_GPU_MAX_LAYERS_PER_PASS = "gpu/max-layers-per-pass";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static std::vector<std::string> splitPath(const std::string& path);
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace pictura
