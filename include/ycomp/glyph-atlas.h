#pragma once

#include <ycomp/font/raster-font.h>
#include <ycomp/result.hpp>
#include <ycomp/shelf-allocator.h>
#include <ycomp/types.h>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ycomp {

struct GlyphKey {
    uint32_t font = 0;
    uint16_t size = 0;
    uint32_t codepoint = 0;

    bool operator==(const GlyphKey& o) const {
        return font == o.font && size == o.size && codepoint == o.codepoint;
    }
};

struct GlyphKeyHash {
    size_t operator()(const GlyphKey& k) const noexcept {
        uint64_t packed = (static_cast<uint64_t>(k.font) << 48) ^
                          (static_cast<uint64_t>(k.size) << 32) ^ k.codepoint;
        return std::hash<uint64_t>{}(packed);
    }
};

struct GlyphEntry {
    bool visible = false;
    uint32_t layer = 0;
    AtlasRect rect;          // inner rectangle, no padding
    int32_t bearingX = 0;
    int32_t bearingY = 0;

    static GlyphEntry invisible() { return {}; }
};

// Coverage waiting to be written into the glyph texture
struct GlyphUpload {
    uint32_t layer;
    AtlasRect rect;
    std::vector<uint8_t> coverage;
};

struct GlyphAtlasConfig {
    uint64_t texelBudget = 8192ull * 8192ull;
    uint32_t maxTextureDimension = 8192;
    uint32_t padding = 1;
};

/**
 * GlyphAtlas caches rasterized glyphs in fixed R8 layers.
 *
 * The layer edge is min(device max, 16384) and the layer count follows from
 * the texel budget; both are fixed at construction. Running out of room is a
 * capacity error, there is no eviction.
 */
class GlyphAtlas {
public:
    using Config = GlyphAtlasConfig;

    static constexpr uint32_t MAX_LAYER_SIZE = 16384;

    explicit GlyphAtlas(Config config);

    // Cached lookup; rasterizes on first use. The pointer stays valid for
    // the atlas lifetime.
    Result<const GlyphEntry*> get(const GlyphKey& key, font::RasterFont& font);

    uint32_t layerSize() const { return _layerSize; }
    uint32_t layerCount() const { return static_cast<uint32_t>(_layers.size()); }
    size_t cachedCount() const { return _entries.size(); }

    std::vector<GlyphUpload> takeUploads();

    std::string dumpSvg(uint32_t layer) const;

private:
    Config _config;
    uint32_t _layerSize;
    std::vector<ShelfAllocator> _layers;
    std::unordered_map<GlyphKey, GlyphEntry, GlyphKeyHash> _entries;
    std::vector<GlyphUpload> _uploads;
};

} // namespace ycomp
