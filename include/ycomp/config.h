#pragma once

#include <ycomp/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ycomp {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Loads defaults, then the YAML file (explicit path or XDG location),
    // then YCOMP_* environment variables, then cmdOverrides.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    virtual ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "atlas.initial-size").
    // Returns nullopt if the key is missing or does not convert to T.
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    static std::filesystem::path getXDGConfigPath();

    // "atlas.initial-size" -> "YCOMP_ATLAS_INITIAL_SIZE"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "YCOMP_";

    static constexpr const char* KEY_ATLAS_INITIAL_SIZE = "atlas.initial-size";
    static constexpr const char* KEY_ATLAS_PADDING = "atlas.padding";
    static constexpr const char* KEY_ATLAS_MAX_SIZE = "atlas.max-size";
    static constexpr const char* KEY_INSTANCES_INITIAL_CAPACITY = "instances.initial-capacity";
    static constexpr const char* KEY_TEXT_ATLAS_TEXEL_BUDGET = "text.atlas-texel-budget";
    static constexpr const char* KEY_PICKING_ALPHA_THRESHOLD = "picking.alpha-threshold";
    static constexpr const char* KEY_PICKING_BLOCKING_POLL = "picking.blocking-poll";
    static constexpr const char* KEY_SHADERS_DIR = "shaders.dir";

protected:
    Config() = default;

    virtual YAML::Node getNode(const std::string& path) const = 0;
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

} // namespace ycomp
