#include "demo-window.h"

#include <ycomp/compositor.h>
#include <ycomp/config.h>
#include <ycomp/image.h>
#include <ytrace/ytrace.hpp>

#include <GLFW/glfw3.h>
#include <args.hxx>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace ycomp;

namespace {

enum class DemoSprite { Tile, TileHover, Badge, Spinner };
enum class DemoFont { Label };

using DemoCompositor = Compositor<DemoSprite, DemoFont>;
using DemoArea = DemoCompositor::Area;

constexpr uint32_t GRID_COLS = 6;
constexpr uint32_t GRID_ROWS = 4;
constexpr double ANIMATION_STEP_SECONDS = 0.12;

//=============================================================================
// Procedural sprites
//=============================================================================

Image roundedTile(uint32_t size, uint32_t rgba, uint32_t border) {
    Image img = Image::filled(size, size, rgba);
    const float r = static_cast<float>(size) * 0.2f;
    const float s = static_cast<float>(size);
    for (uint32_t y = 0; y < size; ++y) {
        for (uint32_t x = 0; x < size; ++x) {
            float fx = static_cast<float>(x) + 0.5f;
            float fy = static_cast<float>(y) + 0.5f;
            float cx = std::clamp(fx, r, s - r);
            float cy = std::clamp(fy, r, s - r);
            float d = std::hypot(fx - cx, fy - cy);
            uint8_t* px = &img.pixels[(static_cast<size_t>(y) * size + x) * 4];
            if (d > r) {
                px[3] = 0;  // transparent corner, not pickable
            } else if (d > r - 2.0f || x < 2 || y < 2 || x + 2 >= size || y + 2 >= size) {
                px[0] = static_cast<uint8_t>(border >> 24);
                px[1] = static_cast<uint8_t>(border >> 16);
                px[2] = static_cast<uint8_t>(border >> 8);
            }
        }
    }
    return img;
}

Image disc(uint32_t size, uint32_t rgba) {
    Image img = Image::filled(size, size, rgba);
    const float c = static_cast<float>(size) * 0.5f;
    for (uint32_t y = 0; y < size; ++y) {
        for (uint32_t x = 0; x < size; ++x) {
            float d = std::hypot(static_cast<float>(x) + 0.5f - c, static_cast<float>(y) + 0.5f - c);
            if (d > c) img.pixels[(static_cast<size_t>(y) * size + x) * 4 + 3] = 0;
        }
    }
    return img;
}

// Horizontal sheet of square frames: a dot orbiting the center
Image spinnerSheet(uint32_t frameSize, uint32_t frames) {
    Image sheet = Image::filled(frameSize * frames, frameSize, 0x00000000u);
    const float c = static_cast<float>(frameSize) * 0.5f;
    const float orbit = c * 0.6f;
    const float dot = c * 0.3f;
    for (uint32_t f = 0; f < frames; ++f) {
        float angle = 6.2831853f * static_cast<float>(f) / static_cast<float>(frames);
        float dx = c + orbit * std::cos(angle);
        float dy = c + orbit * std::sin(angle);
        for (uint32_t y = 0; y < frameSize; ++y) {
            for (uint32_t x = 0; x < frameSize; ++x) {
                float d = std::hypot(static_cast<float>(x) + 0.5f - dx, static_cast<float>(y) + 0.5f - dy);
                if (d <= dot) {
                    uint8_t* px = &sheet.pixels[(static_cast<size_t>(y) * sheet.width + f * frameSize + x) * 4];
                    px[0] = 0xF0;
                    px[1] = 0xC0;
                    px[2] = 0x30;
                    px[3] = 0xFF;
                }
            }
        }
    }
    return sheet;
}

Result<std::vector<uint8_t>> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Err<std::vector<uint8_t>>("Cannot open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return Ok(std::move(bytes));
}

//=============================================================================
// DemoApp
//=============================================================================

class DemoApp {
public:
    Result<void> init(int argc, char* argv[]);
    Result<void> run();

private:
    Result<void> parseArgs(int argc, char* argv[]);
    Result<void> buildCompositor();
    Result<void> populate();
    void layoutGrid();
    void updateHover();
    void onKey(int key);

    Config::Ptr _config;
    std::string _fontPath;
    std::string _dumpDir = "ycomp-dump";
    uint32_t _initialWidth = 1024;
    uint32_t _initialHeight = 768;

    demo::DemoWindow::Ptr _window;
    DemoCompositor::Ptr _compositor;
    bool _hasFont = false;

    std::vector<UiAreaHandle> _tiles;
    UiAreaHandle _spinner;
    std::optional<UiAreaHandle> _lastHovered;
    bool _resized = false;
    uint32_t _extraBadges = 0;
};

Result<void> DemoApp::parseArgs(int argc, char* argv[]) {
    args::ArgumentParser parser("ycomp-demo - retained-mode sprite and text compositor");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<std::string> fontPathArg(parser, "font", "Path to TTF font for labels",
                                             {'f', "font"});
    args::ValueFlag<uint32_t> widthArg(parser, "width", "Window width in pixels", {'W', "width"});
    args::ValueFlag<uint32_t> heightArg(parser, "height", "Window height in pixels",
                                        {'H', "height"});
    args::ValueFlag<std::string> dumpDirArg(parser, "dir", "Directory for atlas SVG dumps (key D)",
                                            {"dump-dir"});
    args::Flag nonBlockingFlag(parser, "non-blocking-poll",
                               "Do not wait for the previous pick readback", {"non-blocking-poll"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return Err<void>("Help requested");
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return Err<void>(std::string("Parse error: ") + e.what());
    }

    YAML::Node cmdOverrides;
    if (nonBlockingFlag) {
        cmdOverrides["picking"]["blocking-poll"] = false;
    }

    std::string configPath = configFile ? args::get(configFile) : "";
    auto configResult = Config::create(configPath, cmdOverrides);
    if (!configResult) {
        return Err<void>("Failed to create config", configResult);
    }
    _config = *configResult;

    _fontPath = fontPathArg ? args::get(fontPathArg) : "";
    if (dumpDirArg) _dumpDir = args::get(dumpDirArg);
    _initialWidth = widthArg ? args::get(widthArg) : 1024;
    _initialHeight = heightArg ? args::get(heightArg) : 768;
    if (_initialWidth == 0) _initialWidth = 1024;
    if (_initialHeight == 0) _initialHeight = 768;
    return Ok();
}

Result<void> DemoApp::init(int argc, char* argv[]) {
    if (auto res = parseArgs(argc, argv); !res) return res;

    auto window = demo::DemoWindow::create("ycomp-demo", _initialWidth, _initialHeight);
    if (!window) return Err<void>("init", window);
    _window = std::move(*window);

    if (auto res = buildCompositor(); !res) return res;
    if (auto res = populate(); !res) return res;

    glfwSetWindowUserPointer(_window->window(), this);
    glfwSetCursorPosCallback(_window->window(), [](GLFWwindow* w, double x, double y) {
        auto* app = static_cast<DemoApp*>(glfwGetWindowUserPointer(w));
        if (app && app->_compositor) {
            app->_compositor->updateCursorPosition(static_cast<float>(x), static_cast<float>(y));
        }
    });
    glfwSetFramebufferSizeCallback(_window->window(), [](GLFWwindow* w, int width, int height) {
        auto* app = static_cast<DemoApp*>(glfwGetWindowUserPointer(w));
        if (app && width > 0 && height > 0) {
            app->_window->resize(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
            app->_resized = true;
        }
    });
    glfwSetKeyCallback(_window->window(), [](GLFWwindow* w, int key, int, int action, int) {
        auto* app = static_cast<DemoApp*>(glfwGetWindowUserPointer(w));
        if (app && action == GLFW_PRESS) app->onKey(key);
    });
    return Ok();
}

Result<void> DemoApp::buildCompositor() {
    CompositorBuilder<DemoSprite, DemoFont> builder;

    if (auto res = builder.addInanimateSprite(DemoSprite::Tile,
                                              roundedTile(96, 0x3070C0FFu, 0xA0C8FFFFu));
        !res) {
        return res;
    }
    if (auto res = builder.addInanimateSprite(DemoSprite::TileHover,
                                              roundedTile(96, 0xC05030FFu, 0xFFD0A0FFu));
        !res) {
        return res;
    }
    if (auto res = builder.addAnimatedSprite(DemoSprite::Spinner, spinnerSheet(64, 8)); !res) {
        return res;
    }

    if (!_fontPath.empty()) {
        auto bytes = readFile(_fontPath);
        if (!bytes) return Err<void>("Failed to read font", bytes);
        if (auto res = builder.addFont(DemoFont::Label, std::move(*bytes)); !res) {
            return Err<void>("Failed to load font " + _fontPath, res);
        }
        _hasFont = true;
    } else {
        ywarn("No --font given, tiles are drawn without labels");
    }

    auto compositor = builder.build(_window->gpuContext(), _window->width(), _window->height(),
                                    _config);
    if (!compositor) return Err<void>("Failed to build compositor", compositor);
    _compositor = *compositor;
    _compositor->setClearColor(WGPUColor{0.08, 0.08, 0.1, 1.0});

    // Registered after build to exercise incremental atlas growth
    return _compositor->addSprite(DemoSprite::Badge, disc(40, 0x40C060FFu));
}

Result<void> DemoApp::populate() {
    for (uint32_t i = 0; i < GRID_COLS * GRID_ROWS; ++i) {
        DemoArea area;
        area.z = ZLevel::Second;
        area.sprite = DemoSprite::Tile;
        if (_hasFont) {
            area.text = AreaText<DemoFont>{"Tile " + std::to_string(i + 1), DemoFont::Label, 18};
        }
        auto handle = _compositor->addArea(std::move(area));
        if (!handle) return Err<void>("populate", handle);
        _tiles.push_back(*handle);
    }

    DemoArea spinner;
    spinner.z = ZLevel::Fourth;
    spinner.sprite = DemoSprite::Spinner;
    auto handle = _compositor->addArea(spinner);
    if (!handle) return Err<void>("populate", handle);
    _spinner = *handle;

    if (_hasFont) {
        DemoArea banner;
        banner.z = ZLevel::First;
        banner.text = AreaText<DemoFont>{"Hover a tile. D dumps atlases, B adds a badge, "
                                         "Delete removes the hovered tile.",
                                         DemoFont::Label, 16};
        if (auto res = _compositor->addArea(banner); !res) return Err<void>("populate", res);
    }

    layoutGrid();
    return Ok();
}

void DemoApp::layoutGrid() {
    const float w = static_cast<float>(_window->width());
    const float h = static_cast<float>(_window->height());
    const float margin = 24.0f;
    const float cellW = (w - 2 * margin) / GRID_COLS;
    const float cellH = (h - 2 * margin - 48.0f) / GRID_ROWS;

    for (size_t i = 0; i < _tiles.size(); ++i) {
        DemoArea* a = _compositor->areaMut(_tiles[i]);
        if (!a) continue;
        float col = static_cast<float>(i % GRID_COLS);
        float row = static_cast<float>(i / GRID_COLS);
        a->xMin = margin + col * cellW + 4.0f;
        a->xMax = margin + (col + 1) * cellW - 4.0f;
        a->yMin = margin + 48.0f + row * cellH + 4.0f;
        a->yMax = margin + 48.0f + (row + 1) * cellH - 4.0f;
    }

    if (DemoArea* s = _compositor->areaMut(_spinner)) {
        s->xMin = w - margin - 40.0f;
        s->xMax = w - margin;
        s->yMin = margin;
        s->yMax = margin + 40.0f;
    }
}

void DemoApp::updateHover() {
    auto hovered = _compositor->currentlyHovered();
    if (hovered == _lastHovered) return;

    auto setSprite = [this](UiAreaHandle h, DemoSprite sprite) {
        const DemoArea* current = _compositor->area(h);
        if (!current || !current->sprite) return;
        if (*current->sprite != DemoSprite::Tile && *current->sprite != DemoSprite::TileHover) return;
        _compositor->areaMut(h)->sprite = sprite;
    };
    if (_lastHovered) setSprite(*_lastHovered, DemoSprite::Tile);
    if (hovered) {
        setSprite(*hovered, DemoSprite::TileHover);
        ydebug("hovering area {}", hovered->id);
    }
    _lastHovered = hovered;
}

void DemoApp::onKey(int key) {
    switch (key) {
        case GLFW_KEY_D:
            if (auto res = _compositor->dumpAtlasesSvg(_dumpDir); !res) {
                yerror("Atlas dump failed: {}", error_msg(res));
            } else {
                const auto& core = _compositor->core();
                yinfo("Atlases written to {} ({} areas, {} sprite layer(s), text {})",
                      _dumpDir, _compositor->areaCount(), core.spriteAtlas().layerCount(),
                      core.hasText() ? "on" : "off");
            }
            break;
        case GLFW_KEY_B: {
            DemoArea badge;
            badge.z = ZLevel::Third;
            badge.sprite = DemoSprite::Badge;
            float x = 30.0f + 48.0f * static_cast<float>(_extraBadges++ % 16);
            badge.xMin = x;
            badge.xMax = x + 40.0f;
            badge.yMin = 30.0f;
            badge.yMax = 70.0f;
            if (auto res = _compositor->addArea(badge); !res) {
                yerror("Adding badge failed: {}", error_msg(res));
            }
            break;
        }
        case GLFW_KEY_DELETE:
            if (auto h = _compositor->currentlyHovered()) {
                _compositor->removeArea(*h);
                _tiles.erase(std::remove(_tiles.begin(), _tiles.end(), *h), _tiles.end());
                if (h == _lastHovered) _lastHovered.reset();
            }
            break;
        case GLFW_KEY_ESCAPE:
            glfwSetWindowShouldClose(_window->window(), GLFW_TRUE);
            break;
        default:
            break;
    }
}

Result<void> DemoApp::run() {
    double lastStep = glfwGetTime();
    uint32_t frame = 0;

    while (!glfwWindowShouldClose(_window->window())) {
        glfwPollEvents();

        if (_resized) {
            _resized = false;
            if (auto res = _compositor->resize(_window->width(), _window->height()); !res) {
                return Err<void>("resize", res);
            }
            layoutGrid();
        }

        double now = glfwGetTime();
        if (now - lastStep >= ANIMATION_STEP_SECONDS) {
            lastStep = now;
            _compositor->setAnimationFrame(++frame);
        }

        updateHover();

        auto view = _window->beginFrame();
        if (!view) {
            ywarn("Skipping frame: {}", error_msg(view));
            continue;
        }

        auto commands = _compositor->render(*view);
        if (!commands) return Err<void>("render", commands);
        _window->submit(*commands);

        if (auto res = _compositor->postRender(); !res) return Err<void>("postRender", res);
        _window->present();
    }
    return Ok();
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    DemoApp app;
    if (auto res = app.init(argc, argv); !res) {
        if (res.error().message() == "Help requested") return 0;
        yerror("ycomp-demo: {}", error_msg(res));
        return 1;
    }
    if (auto res = app.run(); !res) {
        yerror("ycomp-demo: {}", error_msg(res));
        return 1;
    }
    return 0;
}
