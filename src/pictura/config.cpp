#include <pictura/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace pictura {

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(config);
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            if (std::filesystem::exists(xdgPath)) {
                effectivePath = xdgPath.string();
            }
        }
        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicitly requested file must load
                if (!_configPath.empty()) {
                    return res;
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                _loadedPath = effectivePath;
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides(_config, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err(std::string("Config: ") + e.what());
    }
    return Ok();
}

void Config::loadDefaults() {
    YAML::Node modes(YAML::NodeType::Sequence);
    modes.push_back("gpu");
    modes.push_back("gpu-no-float");
    modes.push_back("cpu");
    _config["picture"]["modes"] = modes;
    _config["picture"]["bitmap-scale"] = 1.0;
    _config["picture"]["undo-state-interval"] = 16;
    _config["picture"]["max-undo-states"] = 5;

    _config["animation"]["simultaneous-strokes"] = 1;
    _config["animation"]["speed"] = 0.05;

    _config["gpu"]["max-layers-per-pass"] = 12;

    _config["log"]["level"] = "info";
}

Result<void> Config::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err("Cannot open config file: " + path, Error::Code::Io);
    }
    try {
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && !fileConfig.IsNull()) {
            if (!fileConfig.IsMap()) {
                return Err("Config file " + path + " is not a map");
            }
            mergeNodes(_config, fileConfig);
        }
    } catch (const YAML::Exception& e) {
        return Err("YAML parse error in " + path + ": " + e.what());
    }
    return Ok();
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string path = prefix.empty() ? key : prefix + "/" + key;
        YAML::Node child = it->second;

        if (child.IsMap()) {
            applyEnvOverrides(child, path);
            continue;
        }

        std::string envVar = pathToEnvVar(path);
        const char* val = std::getenv(envVar.c_str());
        if (!val) continue;

        if (child.IsSequence()) {
            YAML::Node list(YAML::NodeType::Sequence);
            std::istringstream ss(val);
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (!item.empty()) list.push_back(item);
            }
            node[key] = list;
        } else {
            node[key] = std::string(val);
        }
        ydebug("Config override from env: {}={}", envVar, val);
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::vector<std::string> Config::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

YAML::Node Config::getNode(const std::string& path) const {
    // Const lookups so a missing key is never inserted into the tree
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        YAML::Node next = std::as_const(current)[part];
        if (!next) {
            return YAML::Node();
        }
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::vector<std::string> Config::getList(const std::string& path) const {
    std::vector<std::string> result;
    YAML::Node node = getNode(path);
    if (!node) {
        return result;
    }
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    } else if (node.IsScalar()) {
        std::istringstream ss(node.as<std::string>());
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) result.push_back(item);
        }
    }
    return result;
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') {
            envVar += '_';
        } else {
            envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "pictura" / "config.yaml";
}

} // namespace pictura
