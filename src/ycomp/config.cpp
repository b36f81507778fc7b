#include <ycomp/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifndef CMAKE_SOURCE_DIR
#define CMAKE_SOURCE_DIR "."
#endif

namespace ycomp {

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Merge source into target, recursing into maps; scalars and lists replace.
static void mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& val = it->second;
        YAML::Node existing = target[key];
        if (val.IsMap() && existing.IsMap()) {
            mergeNodes(existing, val);
        } else {
            target[key] = YAML::Clone(val);
        }
    }
}

static void collectLeafPaths(const YAML::Node& node, const std::string& prefix,
                             std::vector<std::string>& out) {
    if (!node.IsMap()) return;
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string full = prefix.empty() ? key : prefix + "." + key;
        if (it->second.IsMap()) {
            collectLeafPaths(it->second, full, out);
        } else {
            out.push_back(full);
        }
    }
}

// ─── ConfigImpl ──────────────────────────────────────────────────────────────

class ConfigImpl : public Config {
public:
    ConfigImpl(std::string configPath, YAML::Node cmdOverrides) noexcept
        : _configPath(std::move(configPath)), _cmdOverrides(std::move(cmdOverrides)) {
        loadDefaults();
    }

    ~ConfigImpl() override = default;

    Result<void> init() noexcept {
        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicit path that fails to load is an error, the XDG one is optional
                if (!_configPath.empty()) {
                    return Err<void>("Failed to load config " + effectivePath, res);
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides();

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
        return Ok();
    }


protected:
    YAML::Node getNode(const std::string& path) const override {
        const YAML::Node& rootNode = _config;
        YAML::Node node;
        node.reset(rootNode);
        for (const auto& part : splitPath(path)) {
            if (!node.IsMap()) return YAML::Node();
            const YAML::Node& current = node;
            YAML::Node child = current[part];
            if (!child) return YAML::Node();
            node.reset(child);
        }
        return node;
    }

private:
    void loadDefaults() {
        _config["atlas"]["initial-size"] = 128;
        _config["atlas"]["padding"] = 1;
        _config["instances"]["initial-capacity"] = 16;
        _config["text"]["atlas-texel-budget"] = 8192u * 8192u;
        _config["picking"]["alpha-threshold"] = 0.5;
        _config["picking"]["blocking-poll"] = true;
        _config["shaders"]["dir"] = std::string(CMAKE_SOURCE_DIR "/src/ycomp/shaders");
    }

    Result<void> loadFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        try {
            YAML::Node fileConfig = YAML::Load(file);
            if (fileConfig && fileConfig.IsMap()) {
                mergeNodes(_config, fileConfig);
            }
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err<void>("YAML parse error: " + std::string(e.what()));
        }
    }

    void setNode(const std::string& path, const std::string& value) {
        auto parts = splitPath(path);
        if (parts.empty()) return;
        YAML::Node node;
        node.reset(_config);
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            YAML::Node child = node[parts[i]];
            node.reset(child);
        }
        node[parts.back()] = value;
    }

    void applyEnvOverrides() {
        std::vector<std::string> paths;
        collectLeafPaths(_config, "", paths);
        // Keys without a default still accept an environment override
        paths.emplace_back(KEY_ATLAS_MAX_SIZE);

        for (const auto& path : paths) {
            std::string envVar = pathToEnvVar(path);
            const char* val = std::getenv(envVar.c_str());
            if (!val) continue;
            // Stored as a scalar string; yaml-cpp converts on get<T>()
            std::string s(val);
            if (path == KEY_PICKING_BLOCKING_POLL) {
                if (s == "1") s = "true";
                else if (s == "0") s = "false";
            }
            setNode(path, s);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }

    std::string _configPath;
    YAML::Node _cmdOverrides;
    YAML::Node _config;
};

// ─── Config ──────────────────────────────────────────────────────────────────

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto impl = std::make_shared<ConfigImpl>(configPath, cmdOverrides);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(impl));
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else if (const char* home = std::getenv("HOME")) {
        configDir = std::filesystem::path(home) / ".config";
    } else {
        configDir = "/tmp";
    }
    return configDir / "ycomp" / "config.yaml";
}

} // namespace ycomp
