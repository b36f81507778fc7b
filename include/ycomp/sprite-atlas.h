#pragma once

#include <ycomp/image.h>
#include <ycomp/result.hpp>
#include <ycomp/shelf-allocator.h>
#include <ycomp/types.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ycomp {

// Largest layer edge regardless of what the device reports
constexpr uint32_t ATLAS_ABSOLUTE_MAX_SIZE = 65536;

// Frames of one registered sprite; a single frame for inanimate sprites
struct SpriteFrames {
    std::vector<Image> frames;

    static Result<SpriteFrames> inanimate(Image image);

    // Slices a horizontal sheet into frames of frameWidth (default: sheet height)
    static Result<SpriteFrames> animated(const Image& sheet, std::optional<uint32_t> frameWidth);
};

struct FramePlacement {
    uint32_t layer = 0;
    AtlasRect rect;  // padded rectangle handed out by the allocator
};

// What an incremental add did to the atlas, so the GPU side can catch up
struct AtlasChange {
    bool textureResized = false;  // texture array size or layer count changed
    bool layerAppended = false;
    std::vector<uint32_t> dirtyLayers;

    void markDirty(uint32_t layer);
};

struct SpriteAtlasConfig {
    uint32_t initialSize = 128;
    uint32_t padding = 1;
    uint32_t maxSize = 8192;  // device maxTextureDimension2D (or lower)
};

/**
 * SpriteAtlas owns the CPU side of the sprite atlas: one ShelfAllocator per
 * square layer and the retained frame images.
 *
 * Sprites are addressed by a dense key (registration order). Each frame maps
 * to one entry of the allocation table; offsetTable() tells the shader where
 * a sprite's frames start.
 *
 * Two packing paths:
 *  - create(): offline pack, largest frames first. A frame goes into the first
 *    layer with room, else the last layer is grown in place, else a new layer
 *    is opened.
 *  - addSprite(): incremental. Frames go into the last layer; when it is full
 *    the layer is rebuilt from scratch at double size from the retained
 *    images. Once it is at the maximum size, or its frames do not repack
 *    into the doubled edge, a new layer is appended. A failed add leaves the
 *    atlas unchanged.
 */
class SpriteAtlas {
public:
    using Config = SpriteAtlasConfig;
    using Ptr = std::shared_ptr<SpriteAtlas>;

    static Result<Ptr> create(Config config, std::vector<SpriteFrames> sprites) noexcept;

    ~SpriteAtlas() = default;

    SpriteAtlas(const SpriteAtlas&) = delete;
    SpriteAtlas& operator=(const SpriteAtlas&) = delete;

    // The new sprite's key is spriteCount() - 1 after success
    Result<AtlasChange> addSprite(SpriteFrames sprite);

    uint32_t spriteCount() const { return static_cast<uint32_t>(_sprites.size()); }
    uint32_t frameCount(uint32_t sprite) const;
    uint32_t layerCount() const { return static_cast<uint32_t>(_layers.size()); }
    uint32_t layerSize(uint32_t layer) const;

    // Edge of the texture array: the largest layer
    uint32_t textureSize() const;

    // Layer of the sprite's first frame; instance pools are keyed by it
    uint32_t homeLayer(uint32_t sprite) const;

    std::optional<FramePlacement> placement(uint32_t sprite, uint32_t frame) const;

    std::vector<SpriteRange> offsetTable() const;
    std::vector<AtlasAllocation> allocationTable() const;

    // Calls fn(image, innerRect) for every frame stored on the layer
    void forEachFrameOnLayer(uint32_t layer,
                             const std::function<void(const Image&, const AtlasRect&)>& fn) const;

    std::string dumpSvg(uint32_t layer) const;

    const Config& config() const { return _config; }

    static uint32_t nextPowerOfTwo(uint32_t v);

private:
    explicit SpriteAtlas(Config config);

    struct FrameRef {
        uint32_t sprite;
        uint32_t frame;
    };

    struct Layer {
        ShelfAllocator allocator;
        std::vector<FrameRef> frames;  // in placement order
    };

    struct StoredSprite {
        std::vector<Image> frames;
        std::vector<FramePlacement> placements;
    };

    Result<void> pack(std::vector<SpriteFrames> sprites);
    Result<void> checkFits(const Image& frame) const;
    Result<void> packFrame(FrameRef ref);
    Result<AtlasChange> placeSprite(uint32_t key);
    bool rebuildLayer(uint32_t layer, uint32_t newSize);
    uint32_t newLayerSize(uint32_t paddedW, uint32_t paddedH) const;
    uint32_t growthCap() const;
    void place(FrameRef ref, uint32_t layer, const AtlasRect& rect);

    Config _config;
    uint32_t _currentSize;
    std::vector<Layer> _layers;
    std::vector<StoredSprite> _sprites;
};

} // namespace ycomp
