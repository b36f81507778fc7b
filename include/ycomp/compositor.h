#pragma once

#include <ycomp/area-store.h>
#include <ycomp/compositor-core.h>
#include <ycomp/config.h>
#include <ycomp/font/raster-font.h>
#include <ycomp/gpu-context.h>
#include <ycomp/image.h>
#include <ycomp/result.hpp>
#include <ycomp/sprite-atlas.h>
#include <ycomp/types.h>
#include <ytrace/ytrace.hpp>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ycomp {

//=============================================================================
// Host-facing area record
//=============================================================================

template<typename FontId>
struct AreaText {
    std::string text;  // UTF-8
    FontId font;
    uint16_t size = 16;
};

// Pixel rectangle, origin top-left, Y down
template<typename SpriteId, typename FontId>
struct UiArea {
    float xMin = 0.0f;
    float xMax = 0.0f;
    float yMin = 0.0f;
    float yMax = 0.0f;
    ZLevel z = ZLevel::First;
    std::optional<SpriteId> sprite;
    std::optional<AreaText<FontId>> text;
    bool enabled = true;
};

template<typename SpriteId, typename FontId>
class CompositorBuilder;

//=============================================================================
// Compositor
//=============================================================================

/**
 * Compositor maps host sprite/font ids onto a CompositorCore and owns the
 * area store.
 *
 * Frame protocol (single thread):
 *   updateCursorPosition() / areaMut() / addArea() / removeArea() any time,
 *   then render(target), submit the returned command buffers, postRender().
 * currentlyHovered() reflects the pick issued one or more frames earlier.
 * When render() fails on an area, that area and every later dirty one stay
 * queued for the next render().
 */
template<typename SpriteId, typename FontId>
class Compositor {
public:
    using Ptr = std::shared_ptr<Compositor>;
    using Area = UiArea<SpriteId, FontId>;

    Compositor(CompositorCore::Ptr core,
               std::unordered_map<SpriteId, uint32_t> spriteKeys,
               std::unordered_map<FontId, uint32_t> fontKeys)
        : _core(std::move(core))
        , _spriteKeys(std::move(spriteKeys))
        , _fontKeys(std::move(fontKeys)) {}

    Result<UiAreaHandle> addArea(Area area) { return _store.add(std::move(area)); }

    // Marks the area dirty even if the caller only reads
    Area* areaMut(UiAreaHandle handle) { return _store.areaMut(handle); }
    const Area* area(UiAreaHandle handle) const { return _store.area(handle); }

    void removeArea(UiAreaHandle handle) { _store.remove(handle); }

    // Removes every area at the next render; sprites and fonts stay registered
    void clear() { _store.clear(); }

    size_t areaCount() const { return _store.size(); }

    Result<void> addSprite(const SpriteId& id, Image image) {
        auto frames = SpriteFrames::inanimate(std::move(image));
        if (!frames) return Err<void>("addSprite", frames);
        return registerSprite(id, std::move(*frames));
    }

    Result<void> addAnimatedSprite(const SpriteId& id, const Image& sheet,
                                   std::optional<uint32_t> frameWidth = std::nullopt) {
        auto frames = SpriteFrames::animated(sheet, frameWidth);
        if (!frames) return Err<void>("addAnimatedSprite", frames);
        return registerSprite(id, std::move(*frames));
    }

    Result<std::vector<WGPUCommandBuffer>> render(WGPUTextureView target) {
        using Out = std::vector<WGPUCommandBuffer>;
        _core->pollPicks();

        auto removals = _store.takeRemovals();
        if (auto res = _core->applyRemovals(removals); !res) {
            return Err<Out>("render: applying removals", res);
        }

        auto dirty = _store.takeDirty();
        if (!removals.empty() || !dirty.empty()) _textStale = true;
        for (auto it = dirty.begin(); it != dirty.end(); ++it) {
            const Area* a = _store.area(*it);
            if (!a) continue;  // removed in this same frame
            auto desc = toDesc(*it, *a);
            if (!desc) {
                _store.requeueDirty(it, dirty.end());
                return Err<Out>("render", desc);
            }
            if (auto res = _core->syncArea(*it, *desc); !res) {
                _store.requeueDirty(it, dirty.end());
                return Err<Out>("render: syncing area " + std::to_string(it->id), res);
            }
        }

        if (_textStale) {
            if (auto res = rebuildText(); !res) return Err<Out>("render: text", res);
            _textStale = false;
        }

        return _core->record(target);
    }

    // Call after submitting the buffers returned by render()
    Result<void> postRender() { return _core->postRender(); }

    Result<void> resize(uint32_t width, uint32_t height) { return _core->resize(width, height); }

    void updateCursorPosition(float x, float y) { _core->setPointer(x, y); }

    std::optional<UiAreaHandle> currentlyHovered() const {
        auto hovered = _core->hovered();
        // The pick may predate a removal
        if (hovered && !_store.contains(*hovered)) return std::nullopt;
        return hovered;
    }

    void setAnimationFrame(uint32_t frame) { _core->setAnimationFrame(frame); }
    uint32_t animationFrame() const { return _core->animationFrame(); }

    void setClearColor(std::optional<WGPUColor> color) { _core->setClearColor(color); }

    Result<void> dumpAtlasesSvg(const std::string& directory) const {
        return _core->dumpAtlasesSvg(directory);
    }

    const CompositorCore& core() const { return *_core; }

private:
    Result<void> registerSprite(const SpriteId& id, SpriteFrames frames) {
        if (_spriteKeys.count(id)) {
            return Err<void>("sprite id is already registered");
        }
        auto key = _core->addSprite(std::move(frames));
        if (!key) return Err<void>("sprite registration failed", key);
        _spriteKeys.emplace(id, *key);
        return Ok();
    }

    Result<AreaDesc> toDesc(UiAreaHandle handle, const Area& a) const {
        AreaDesc desc;
        desc.xMin = a.xMin;
        desc.xMax = a.xMax;
        desc.yMin = a.yMin;
        desc.yMax = a.yMax;
        desc.z = a.z;
        desc.enabled = a.enabled;
        if (a.sprite) {
            auto it = _spriteKeys.find(*a.sprite);
            if (it == _spriteKeys.end()) {
                return Err<AreaDesc>("area " + std::to_string(handle.id) +
                                     " references an unregistered sprite id");
            }
            desc.spriteKey = it->second;
        }
        if (a.text) {
            auto it = _fontKeys.find(a.text->font);
            if (it == _fontKeys.end()) {
                return Err<AreaDesc>("area " + std::to_string(handle.id) +
                                     " references an unregistered font id");
            }
            desc.text = TextDesc{a.text->text, it->second, a.text->size};
        }
        return Ok(std::move(desc));
    }

    Result<void> rebuildText() {
        std::vector<UiAreaHandle> handles;
        std::vector<AreaDesc> descs;
        std::optional<Error> failure;
        _store.forEach([&](UiAreaHandle handle, const Area& a) {
            if (failure || !a.enabled || !a.text) return;
            auto desc = toDesc(handle, a);
            if (!desc) {
                failure = desc.error();
                return;
            }
            handles.push_back(handle);
            descs.push_back(std::move(*desc));
        });
        if (failure) return Err<void>("text rebuild", *failure);

        std::vector<TextArea> areas;
        areas.reserve(descs.size());
        for (size_t i = 0; i < descs.size(); ++i) {
            areas.push_back({handles[i], &descs[i]});
        }
        return _core->rebuildText(std::move(areas));
    }

    CompositorCore::Ptr _core;
    AreaStore<Area> _store;
    std::unordered_map<SpriteId, uint32_t> _spriteKeys;
    std::unordered_map<FontId, uint32_t> _fontKeys;
    bool _textStale = false;
};

//=============================================================================
// CompositorBuilder
//=============================================================================

/**
 * Collects sprites and fonts before the GPU side exists. Registration
 * errors (duplicate id, zero-area image, bad frame width, unparseable font)
 * are reported here; build() packs the atlas and creates the pipelines.
 */
template<typename SpriteId, typename FontId>
class CompositorBuilder {
public:
    using CompositorT = Compositor<SpriteId, FontId>;

    Result<void> addFont(const FontId& id, std::vector<uint8_t> bytes) {
        if (_fontKeys.count(id)) {
            return Err<void>("font id is already registered");
        }
        auto key = static_cast<uint32_t>(_fonts.size());
        auto font = font::RasterFont::create(std::move(bytes), "font-" + std::to_string(key));
        if (!font) return Err<void>("addFont", font);
        _fonts.push_back(*font);
        _fontKeys.emplace(id, key);
        return Ok();
    }

    Result<void> addInanimateSprite(const SpriteId& id, Image image) {
        if (_spriteKeys.count(id)) {
            return Err<void>("sprite id is already registered");
        }
        auto frames = SpriteFrames::inanimate(std::move(image));
        if (!frames) return Err<void>("addInanimateSprite", frames);
        addFrames(id, std::move(*frames));
        return Ok();
    }

    // frameWidth defaults to the sheet height (square frames)
    Result<void> addAnimatedSprite(const SpriteId& id, const Image& sheet,
                                   std::optional<uint32_t> frameWidth = std::nullopt) {
        if (_spriteKeys.count(id)) {
            return Err<void>("sprite id is already registered");
        }
        auto frames = SpriteFrames::animated(sheet, frameWidth);
        if (!frames) return Err<void>("addAnimatedSprite", frames);
        addFrames(id, std::move(*frames));
        return Ok();
    }

    size_t spriteCount() const { return _sprites.size(); }
    size_t fontCount() const { return _fonts.size(); }
    bool hasSprite(const SpriteId& id) const { return _spriteKeys.count(id) > 0; }

    // Hands the registered sprites and fonts to the compositor; the builder is
    // empty afterwards
    Result<typename CompositorT::Ptr> build(const GPUContext& gpu, uint32_t width, uint32_t height,
                                            Config::Ptr config = nullptr) {
        using Out = typename CompositorT::Ptr;

        auto settings = CompositorSettings::fromConfig(config.get(), gpu);
        if (!settings) return Err<Out>("build: configuration", settings);

        ydebug("CompositorBuilder: building with {} sprites, {} fonts",
               _sprites.size(), _fonts.size());
        auto core = CompositorCore::create(gpu, width, height, std::move(*settings),
                                           std::move(_sprites), std::move(_fonts));
        _sprites.clear();
        _fonts.clear();
        if (!core) {
            _spriteKeys.clear();
            _fontKeys.clear();
            return Err<Out>("build", core);
        }

        auto compositor = std::make_shared<CompositorT>(*core, std::move(_spriteKeys),
                                                        std::move(_fontKeys));
        _spriteKeys.clear();
        _fontKeys.clear();
        return Ok(std::move(compositor));
    }

private:
    void addFrames(const SpriteId& id, SpriteFrames frames) {
        _spriteKeys.emplace(id, static_cast<uint32_t>(_sprites.size()));
        _sprites.push_back(std::move(frames));
    }

    std::vector<SpriteFrames> _sprites;
    std::vector<font::RasterFont::Ptr> _fonts;
    std::unordered_map<SpriteId, uint32_t> _spriteKeys;
    std::unordered_map<FontId, uint32_t> _fontKeys;
};

} // namespace ycomp
