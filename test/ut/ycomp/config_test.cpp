//=============================================================================
// Config Unit Tests
//
// Layering order: defaults, YAML file, YCOMP_* environment, overrides.
// XDG_CONFIG_HOME points at a scratch directory so a developer's own
// config file never leaks into the results.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <ycomp/config.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace boost::ut;
using namespace ycomp;

namespace {

std::filesystem::path scratchDir() {
    auto dir = std::filesystem::temp_directory_path() / "ycomp-config-test";
    std::filesystem::create_directories(dir);
    setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    return dir;
}

std::string writeFile(const std::string& name, const std::string& content) {
    auto path = scratchDir() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

suite config_defaults = [] {
    "defaults are present without a file"_test = [] {
        scratchDir();
        auto config = Config::create();
        expect(config.has_value()) << error_msg(config);
        auto& c = **config;
        expect(c.get<uint32_t>(Config::KEY_ATLAS_INITIAL_SIZE, 0) == 128_u);
        expect(c.get<uint32_t>(Config::KEY_ATLAS_PADDING, 0) == 1_u);
        expect(c.get<uint32_t>(Config::KEY_INSTANCES_INITIAL_CAPACITY, 0) == 16_u);
        expect(c.get<float>(Config::KEY_PICKING_ALPHA_THRESHOLD, 0.0f) == 0.5_f);
        expect(c.get<bool>(Config::KEY_PICKING_BLOCKING_POLL, false));
        expect(!c.has(Config::KEY_ATLAS_MAX_SIZE)) << "device limit is the default";
    };

    "missing key falls back to the given default"_test = [] {
        scratchDir();
        auto config = *Config::create();
        expect(!config->get<int>("no.such.key").has_value());
        expect(config->get<int>("no.such.key", 42) == 42_i);
    };

    "wrong type reads as missing"_test = [] {
        auto path = writeFile("wrong-type.yaml", "atlas:\n  padding: lots\n");
        auto config = *Config::create(path);
        expect(!config->get<uint32_t>(Config::KEY_ATLAS_PADDING).has_value());
    };
};

suite config_layers = [] {
    "file values replace defaults key by key"_test = [] {
        auto path = writeFile("file.yaml", "atlas:\n  initial-size: 256\n  max-size: 1024\n");
        auto config = *Config::create(path);
        expect(config->get<uint32_t>(Config::KEY_ATLAS_INITIAL_SIZE, 0) == 256_u);
        expect(config->get<uint32_t>(Config::KEY_ATLAS_MAX_SIZE, 0) == 1024_u);
        expect(config->get<uint32_t>(Config::KEY_ATLAS_PADDING, 0) == 1_u) << "sibling default kept";
    };

    "explicit path that does not exist is an error"_test = [] {
        scratchDir();
        expect(!Config::create("/nonexistent/ycomp/config.yaml").has_value());
    };

    "malformed yaml is an error"_test = [] {
        auto path = writeFile("broken.yaml", "atlas: [unclosed\n");
        expect(!Config::create(path).has_value());
    };

    "environment overrides the file"_test = [] {
        auto path = writeFile("env.yaml", "instances:\n  initial-capacity: 8\n");
        setenv("YCOMP_INSTANCES_INITIAL_CAPACITY", "64", 1);
        setenv("YCOMP_PICKING_BLOCKING_POLL", "0", 1);
        setenv("YCOMP_ATLAS_MAX_SIZE", "2048", 1);
        auto config = *Config::create(path);
        unsetenv("YCOMP_INSTANCES_INITIAL_CAPACITY");
        unsetenv("YCOMP_PICKING_BLOCKING_POLL");
        unsetenv("YCOMP_ATLAS_MAX_SIZE");

        expect(config->get<uint32_t>(Config::KEY_INSTANCES_INITIAL_CAPACITY, 0) == 64_u);
        expect(!config->get<bool>(Config::KEY_PICKING_BLOCKING_POLL, true));
        expect(config->get<uint32_t>(Config::KEY_ATLAS_MAX_SIZE, 0) == 2048_u);
    };

    "command overrides win over everything"_test = [] {
        scratchDir();
        setenv("YCOMP_ATLAS_PADDING", "3", 1);
        YAML::Node overrides;
        overrides["atlas"]["padding"] = 5;
        auto config = *Config::create("", overrides);
        unsetenv("YCOMP_ATLAS_PADDING");
        expect(config->get<uint32_t>(Config::KEY_ATLAS_PADDING, 0) == 5_u);
    };

    "XDG location is picked up when no path is given"_test = [] {
        auto dir = scratchDir();
        std::filesystem::create_directories(dir / "ycomp");
        {
            std::ofstream out(dir / "ycomp" / "config.yaml");
            out << "picking:\n  alpha-threshold: 0.25\n";
        }
        auto config = *Config::create();
        std::filesystem::remove(dir / "ycomp" / "config.yaml");
        expect(config->get<float>(Config::KEY_PICKING_ALPHA_THRESHOLD, 0.0f) == 0.25_f);
    };
};

suite config_env_names = [] {
    "dotted paths map to upper-case variables"_test = [] {
        expect(Config::pathToEnvVar("atlas.initial-size") == std::string("YCOMP_ATLAS_INITIAL_SIZE"));
        expect(Config::pathToEnvVar("shaders.dir") == std::string("YCOMP_SHADERS_DIR"));
    };
};
