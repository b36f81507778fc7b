#include <ycomp/glyph-atlas.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace ycomp {

GlyphAtlas::GlyphAtlas(Config config)
    : _config(config)
    , _layerSize(std::max(1u, std::min(config.maxTextureDimension, MAX_LAYER_SIZE))) {
    uint64_t layerArea = static_cast<uint64_t>(_layerSize) * _layerSize;
    uint64_t budget = std::max<uint64_t>(config.texelBudget, 1);
    auto count = static_cast<uint32_t>((budget + layerArea - 1) / layerArea);
    _layers.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        _layers.emplace_back(_layerSize);
    }
    yinfo("GlyphAtlas: {} layer(s) of {}x{} for a budget of {} texels",
          count, _layerSize, _layerSize, budget);
}

Result<const GlyphEntry*> GlyphAtlas::get(const GlyphKey& key, font::RasterFont& font) {
    auto it = _entries.find(key);
    if (it != _entries.end()) {
        return Ok(static_cast<const GlyphEntry*>(&it->second));
    }

    auto bitmap = font.rasterize(key.codepoint, key.size);
    if (!bitmap) {
        return Err<const GlyphEntry*>("GlyphAtlas: rasterization failed", bitmap);
    }

    const auto& m = bitmap->metrics;
    if (m.width == 0 || m.height == 0) {
        auto inserted = _entries.emplace(key, GlyphEntry::invisible()).first;
        return Ok(static_cast<const GlyphEntry*>(&inserted->second));
    }

    const uint32_t pad = _config.padding;
    std::optional<AtlasRect> rect;
    uint32_t layer = 0;
    for (; layer < _layers.size(); ++layer) {
        rect = _layers[layer].allocate(m.width + 2 * pad, m.height + 2 * pad);
        if (rect) break;
    }
    if (!rect) {
        yerror("GlyphAtlas: no room for U+{:04X} at size {} ({}x{}), {} glyphs cached",
               key.codepoint, key.size, m.width, m.height, _entries.size());
        return Err<const GlyphEntry*>("glyph atlas overflow");
    }

    GlyphEntry entry;
    entry.visible = true;
    entry.layer = layer;
    entry.rect = {rect->x + pad, rect->y + pad, m.width, m.height};
    entry.bearingX = m.bearingX;
    entry.bearingY = m.bearingY;

    _uploads.push_back({layer, entry.rect, std::move(bitmap->coverage)});

    ydebug("GlyphAtlas: cached U+{:04X} font={} size={} at layer {} ({},{})",
           key.codepoint, key.font, key.size, layer, entry.rect.x, entry.rect.y);

    auto inserted = _entries.emplace(key, entry).first;
    return Ok(static_cast<const GlyphEntry*>(&inserted->second));
}

std::vector<GlyphUpload> GlyphAtlas::takeUploads() {
    std::vector<GlyphUpload> out;
    out.swap(_uploads);
    return out;
}

std::string GlyphAtlas::dumpSvg(uint32_t layer) const {
    if (layer >= _layers.size()) return {};
    return _layers[layer].dumpSvg();
}

} // namespace ycomp
