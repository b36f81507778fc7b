#include <ycomp/sprite-atlas.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace ycomp {

// =============================================================================
// SpriteFrames
// =============================================================================

Result<SpriteFrames> SpriteFrames::inanimate(Image image) {
    if (image.empty()) {
        return Err<SpriteFrames>("sprite image has zero area");
    }
    SpriteFrames out;
    out.frames.push_back(std::move(image));
    return Ok(std::move(out));
}

Result<SpriteFrames> SpriteFrames::animated(const Image& sheet, std::optional<uint32_t> frameWidth) {
    if (sheet.empty()) {
        return Err<SpriteFrames>("sprite sheet has zero area");
    }
    uint32_t fw = frameWidth.value_or(sheet.height);
    if (fw == 0 || fw > sheet.width || sheet.width % fw != 0) {
        return Err<SpriteFrames>("sprite sheet width " + std::to_string(sheet.width) +
                                 " is not a multiple of frame width " + std::to_string(fw));
    }
    SpriteFrames out;
    uint32_t count = sheet.width / fw;
    out.frames.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        out.frames.push_back(sheet.crop(i * fw, 0, fw, sheet.height));
    }
    return Ok(std::move(out));
}

void AtlasChange::markDirty(uint32_t layer) {
    if (std::find(dirtyLayers.begin(), dirtyLayers.end(), layer) == dirtyLayers.end()) {
        dirtyLayers.push_back(layer);
    }
}

// =============================================================================
// Factory
// =============================================================================

Result<SpriteAtlas::Ptr> SpriteAtlas::create(Config config, std::vector<SpriteFrames> sprites) noexcept {
    if (config.maxSize == 0) {
        return Err<Ptr>("SpriteAtlas: max texture size is zero");
    }
    auto atlas = Ptr(new SpriteAtlas(config));
    if (auto res = atlas->pack(std::move(sprites)); !res) {
        return Err<Ptr>("Failed to pack sprite atlas", res);
    }
    return Ok(std::move(atlas));
}

SpriteAtlas::SpriteAtlas(Config config)
    : _config(config) {
    _config.initialSize = std::min(nextPowerOfTwo(std::max(config.initialSize, 1u)), growthCap());
    _currentSize = _config.initialSize;
}

uint32_t SpriteAtlas::nextPowerOfTwo(uint32_t v) {
    if (v <= 1) return 1;
    --v;
    v |= v >> 1;
    v |= v >> 2;
    v |= v >> 4;
    v |= v >> 8;
    v |= v >> 16;
    return v + 1;
}

uint32_t SpriteAtlas::growthCap() const {
    return std::min(_config.maxSize, ATLAS_ABSOLUTE_MAX_SIZE);
}

uint32_t SpriteAtlas::newLayerSize(uint32_t paddedW, uint32_t paddedH) const {
    uint32_t want = std::max({_currentSize, paddedW, paddedH});
    return std::min(nextPowerOfTwo(want), growthCap());
}

Result<void> SpriteAtlas::checkFits(const Image& frame) const {
    uint32_t pad = 2 * _config.padding;
    if (frame.width + pad > growthCap() || frame.height + pad > growthCap()) {
        return Err<void>("sprite too large for atlas: " + std::to_string(frame.width) + "x" +
                         std::to_string(frame.height) + " exceeds max texture dimension " +
                         std::to_string(growthCap()));
    }
    return Ok();
}

void SpriteAtlas::place(FrameRef ref, uint32_t layer, const AtlasRect& rect) {
    _sprites[ref.sprite].placements[ref.frame] = {layer, rect};
    _layers[layer].frames.push_back(ref);
}

// =============================================================================
// Offline pack
// =============================================================================

Result<void> SpriteAtlas::pack(std::vector<SpriteFrames> sprites) {
    std::vector<FrameRef> order;
    _sprites.reserve(sprites.size());
    for (auto& sprite : sprites) {
        if (sprite.frames.empty()) {
            return Err<void>("sprite " + std::to_string(_sprites.size()) + " has no frames");
        }
        uint32_t key = static_cast<uint32_t>(_sprites.size());
        for (uint32_t f = 0; f < sprite.frames.size(); ++f) {
            if (auto res = checkFits(sprite.frames[f]); !res) {
                return Err<void>("sprite " + std::to_string(key), res);
            }
            order.push_back({key, f});
        }
        StoredSprite stored;
        stored.placements.resize(sprite.frames.size());
        stored.frames = std::move(sprite.frames);
        _sprites.push_back(std::move(stored));
    }

    // Largest first; stable so equal areas keep registration order
    std::stable_sort(order.begin(), order.end(), [this](const FrameRef& a, const FrameRef& b) {
        return _sprites[a.sprite].frames[a.frame].area() > _sprites[b.sprite].frames[b.frame].area();
    });

    for (const auto& ref : order) {
        if (auto res = packFrame(ref); !res) {
            return res;
        }
    }

    yinfo("SpriteAtlas: packed {} sprites ({} frames) into {} layer(s), texture size {}",
          _sprites.size(), order.size(), _layers.size(), textureSize());
    return Ok();
}

Result<void> SpriteAtlas::packFrame(FrameRef ref) {
    const Image& img = _sprites[ref.sprite].frames[ref.frame];
    uint32_t w = img.width + 2 * _config.padding;
    uint32_t h = img.height + 2 * _config.padding;

    for (uint32_t i = 0; i < _layers.size(); ++i) {
        if (auto rect = _layers[i].allocator.allocate(w, h)) {
            place(ref, i, *rect);
            return Ok();
        }
    }

    // Grow the most recent layer in place; earlier placements stay put
    if (!_layers.empty()) {
        uint32_t last = static_cast<uint32_t>(_layers.size() - 1);
        auto& allocator = _layers[last].allocator;
        while (allocator.size() * 2 <= growthCap()) {
            uint32_t newSize = allocator.size() * 2;
            allocator.grow(newSize);
            _currentSize = std::max(_currentSize, newSize);
            ydebug("SpriteAtlas: grew layer {} to {}", last, newSize);
            if (auto rect = allocator.allocate(w, h)) {
                place(ref, last, *rect);
                return Ok();
            }
        }
    }

    uint32_t size = newLayerSize(w, h);
    if (size < std::max(w, h)) {
        return Err<void>("sprite too large for atlas");
    }
    _layers.push_back(Layer{ShelfAllocator(size), {}});
    _currentSize = std::max(_currentSize, size);
    uint32_t layer = static_cast<uint32_t>(_layers.size() - 1);
    ydebug("SpriteAtlas: opened layer {} ({}x{})", layer, size, size);

    auto rect = _layers.back().allocator.allocate(w, h);
    if (!rect) {
        yerror("SpriteAtlas: {}x{} does not fit a fresh {}x{} layer", w, h, size, size);
        return Err<void>("frame does not fit a fresh atlas layer");
    }
    place(ref, layer, *rect);
    return Ok();
}

// =============================================================================
// Incremental path
// =============================================================================

Result<AtlasChange> SpriteAtlas::addSprite(SpriteFrames sprite) {
    if (sprite.frames.empty()) {
        return Err<AtlasChange>("addSprite: sprite has no frames");
    }
    // Check every frame before touching any allocator
    for (const auto& frame : sprite.frames) {
        if (frame.empty()) {
            return Err<AtlasChange>("addSprite: frame has zero area");
        }
        if (auto res = checkFits(frame); !res) {
            return Err<AtlasChange>("addSprite", res);
        }
    }

    // Snapshot so a failed add leaves the atlas exactly as it was
    std::vector<Layer> savedLayers = _layers;
    std::vector<std::vector<FramePlacement>> savedPlacements;
    savedPlacements.reserve(_sprites.size());
    for (const auto& s : _sprites) savedPlacements.push_back(s.placements);
    const uint32_t savedCurrentSize = _currentSize;

    uint32_t key = static_cast<uint32_t>(_sprites.size());
    StoredSprite stored;
    stored.placements.resize(sprite.frames.size());
    stored.frames = std::move(sprite.frames);
    _sprites.push_back(std::move(stored));

    auto change = placeSprite(key);
    if (!change) {
        _sprites.pop_back();
        for (size_t i = 0; i < _sprites.size(); ++i) {
            _sprites[i].placements = std::move(savedPlacements[i]);
        }
        _layers = std::move(savedLayers);
        _currentSize = savedCurrentSize;
        return Err<AtlasChange>("addSprite", change);
    }
    ydebug("SpriteAtlas: added sprite {} ({} frames), {} layer(s)",
           key, _sprites[key].frames.size(), _layers.size());
    return change;
}

Result<AtlasChange> SpriteAtlas::placeSprite(uint32_t key) {
    AtlasChange change;
    uint32_t previousTextureSize = textureSize();

    for (uint32_t f = 0; f < _sprites[key].frames.size(); ++f) {
        const Image& img = _sprites[key].frames[f];
        uint32_t w = img.width + 2 * _config.padding;
        uint32_t h = img.height + 2 * _config.padding;

        while (true) {
            if (_layers.empty()) {
                _layers.push_back(Layer{ShelfAllocator(newLayerSize(w, h)), {}});
                change.layerAppended = true;
            }

            uint32_t last = static_cast<uint32_t>(_layers.size() - 1);
            if (auto rect = _layers[last].allocator.allocate(w, h)) {
                place({key, f}, last, *rect);
                change.markDirty(last);
                break;
            }

            uint32_t size = _layers[last].allocator.size();
            if (size * 2 <= growthCap() && rebuildLayer(last, size * 2)) {
                change.markDirty(last);
                continue;
            }

            // At the maximum size, or the shelves do not replay into the doubled edge
            uint32_t fresh = newLayerSize(w, h);
            if (fresh < std::max(w, h)) {
                return Err<AtlasChange>("sprite too large for atlas");
            }
            _layers.push_back(Layer{ShelfAllocator(fresh), {}});
            _currentSize = std::max(_currentSize, fresh);
            change.layerAppended = true;
            yinfo("SpriteAtlas: layer {} is full at {}x{}, appended layer {}",
                  last, size, size, _layers.size() - 1);
        }
    }

    change.textureResized = change.layerAppended || textureSize() != previousTextureSize;
    return Ok(std::move(change));
}

// Re-places everything the layer held, in the order it was first placed,
// into a fresh allocator of newSize. Nothing changes unless every frame fits.
bool SpriteAtlas::rebuildLayer(uint32_t layer, uint32_t newSize) {
    ShelfAllocator allocator(newSize);
    std::vector<AtlasRect> rects;
    rects.reserve(_layers[layer].frames.size());
    for (const auto& ref : _layers[layer].frames) {
        const auto& placement = _sprites[ref.sprite].placements[ref.frame];
        auto rect = allocator.allocate(placement.rect.width, placement.rect.height);
        if (!rect) {
            ywarn("SpriteAtlas: layer {} does not repack at {}x{} (sprite {} frame {})",
                  layer, newSize, newSize, ref.sprite, ref.frame);
            return false;
        }
        rects.push_back(*rect);
    }

    const auto& frames = _layers[layer].frames;
    for (size_t i = 0; i < frames.size(); ++i) {
        _sprites[frames[i].sprite].placements[frames[i].frame].rect = rects[i];
    }
    _layers[layer].allocator = std::move(allocator);
    _currentSize = std::max(_currentSize, newSize);
    yinfo("SpriteAtlas: rebuilt layer {} at {}x{} ({} frames relocated)",
          layer, newSize, newSize, frames.size());
    return true;
}

// =============================================================================
// Queries
// =============================================================================

uint32_t SpriteAtlas::frameCount(uint32_t sprite) const {
    return sprite < _sprites.size() ? static_cast<uint32_t>(_sprites[sprite].frames.size()) : 0;
}

uint32_t SpriteAtlas::layerSize(uint32_t layer) const {
    return layer < _layers.size() ? _layers[layer].allocator.size() : 0;
}

uint32_t SpriteAtlas::textureSize() const {
    uint32_t size = 0;
    for (const auto& layer : _layers) {
        size = std::max(size, layer.allocator.size());
    }
    return size;
}

uint32_t SpriteAtlas::homeLayer(uint32_t sprite) const {
    if (sprite >= _sprites.size() || _sprites[sprite].placements.empty()) return 0;
    return _sprites[sprite].placements.front().layer;
}

std::optional<FramePlacement> SpriteAtlas::placement(uint32_t sprite, uint32_t frame) const {
    if (sprite >= _sprites.size() || frame >= _sprites[sprite].placements.size()) {
        return std::nullopt;
    }
    return _sprites[sprite].placements[frame];
}

std::vector<SpriteRange> SpriteAtlas::offsetTable() const {
    std::vector<SpriteRange> table;
    table.reserve(_sprites.size());
    uint32_t offset = 0;
    for (const auto& sprite : _sprites) {
        uint32_t count = static_cast<uint32_t>(sprite.frames.size());
        table.push_back({offset, count});
        offset += count;
    }
    return table;
}

std::vector<AtlasAllocation> SpriteAtlas::allocationTable() const {
    std::vector<AtlasAllocation> table;
    const float size = static_cast<float>(std::max(textureSize(), 1u));
    const uint32_t pad = _config.padding;
    for (const auto& sprite : _sprites) {
        for (const auto& p : sprite.placements) {
            float x0 = static_cast<float>(p.rect.x + pad);
            float y0 = static_cast<float>(p.rect.y + pad);
            float x1 = static_cast<float>(p.rect.x + p.rect.width - pad);
            float y1 = static_cast<float>(p.rect.y + p.rect.height - pad);
            table.push_back({x0 / size, x1 / size, y0 / size, y1 / size, p.layer});
        }
    }
    return table;
}

void SpriteAtlas::forEachFrameOnLayer(
        uint32_t layer, const std::function<void(const Image&, const AtlasRect&)>& fn) const {
    if (layer >= _layers.size()) return;
    const uint32_t pad = _config.padding;
    for (const auto& ref : _layers[layer].frames) {
        const auto& p = _sprites[ref.sprite].placements[ref.frame];
        const Image& img = _sprites[ref.sprite].frames[ref.frame];
        fn(img, AtlasRect{p.rect.x + pad, p.rect.y + pad, img.width, img.height});
    }
}

std::string SpriteAtlas::dumpSvg(uint32_t layer) const {
    if (layer >= _layers.size()) return {};
    return _layers[layer].allocator.dumpSvg();
}

} // namespace ycomp
