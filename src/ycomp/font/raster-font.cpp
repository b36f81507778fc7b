#include <ycomp/font/raster-font.h>
#include <ycomp/font/freetype.h>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cstring>
#include <unordered_map>

namespace ycomp::font {

class FreeTypeRasterFont : public RasterFont {
public:
    FreeTypeRasterFont(std::vector<uint8_t> data, std::string name)
        : _data(std::move(data)), _name(std::move(name)) {}

    ~FreeTypeRasterFont() override {
        if (_face) FT_Done_Face(_face);
    }

    Result<void> init() {
        if (_data.empty()) {
            return Err("RasterFont: empty font data");
        }
        FT_Library lib = ftLibrary();
        if (!lib) {
            return Err("RasterFont: FreeType is not available");
        }
        FT_Error err = FT_New_Memory_Face(lib, _data.data(),
                                          static_cast<FT_Long>(_data.size()), 0, &_face);
        if (err) {
            return Err("RasterFont: FreeType error " + std::to_string(err));
        }
        if (!FT_IS_SCALABLE(_face)) {
            return Err("RasterFont: '" + _name + "' is not a scalable font");
        }
        yinfo("RasterFont: loaded '{}' ({} glyphs)", _name, _face->num_glyphs);
        return Ok();
    }

    const std::string& name() const override { return _name; }

    float advance(uint32_t codepoint, uint16_t pixelSize) override {
        uint64_t key = (static_cast<uint64_t>(pixelSize) << 32) | codepoint;
        auto it = _advanceCache.find(key);
        if (it != _advanceCache.end()) {
            return it->second;
        }

        float adv = pixelSize * 0.5f;  // fallback
        if (setSize(pixelSize)) {
            FT_UInt glyphIndex = FT_Get_Char_Index(_face, codepoint);
            if (FT_Load_Glyph(_face, glyphIndex, FT_LOAD_DEFAULT) == 0) {
                adv = _face->glyph->advance.x / 64.0f;
            }
        }
        _advanceCache[key] = adv;
        return adv;
    }

    LineMetrics lineMetrics(uint16_t pixelSize) override {
        LineMetrics m;
        if (!setSize(pixelSize)) {
            m.ascent = pixelSize * 0.8f;
            m.descent = pixelSize * 0.2f;
            return m;
        }
        const auto& sm = _face->size->metrics;
        m.ascent = sm.ascender / 64.0f;
        m.descent = -sm.descender / 64.0f;
        m.lineGap = std::max(0.0f, sm.height / 64.0f - (m.ascent + m.descent));
        return m;
    }

    Result<GlyphBitmap> rasterize(uint32_t codepoint, uint16_t pixelSize) override {
        if (!setSize(pixelSize)) {
            return Err<GlyphBitmap>("RasterFont: cannot set pixel size " + std::to_string(pixelSize));
        }
        FT_UInt glyphIndex = FT_Get_Char_Index(_face, codepoint);
        if (FT_Error err = FT_Load_Glyph(_face, glyphIndex, FT_LOAD_RENDER); err) {
            return Err<GlyphBitmap>("RasterFont: FT_Load_Glyph failed for U+" +
                                    std::to_string(codepoint) + " error " + std::to_string(err));
        }

        const FT_GlyphSlot slot = _face->glyph;
        const FT_Bitmap& bmp = slot->bitmap;

        GlyphBitmap out;
        out.metrics.advance = slot->advance.x / 64.0f;
        out.metrics.bearingX = slot->bitmap_left;
        out.metrics.bearingY = slot->bitmap_top;
        out.metrics.width = bmp.width;
        out.metrics.height = bmp.rows;

        if (bmp.width == 0 || bmp.rows == 0) {
            return Ok(std::move(out));
        }
        if (bmp.pixel_mode != FT_PIXEL_MODE_GRAY) {
            return Err<GlyphBitmap>("RasterFont: unsupported bitmap pixel mode " +
                                    std::to_string(bmp.pixel_mode));
        }

        out.coverage.resize(static_cast<size_t>(bmp.width) * bmp.rows);
        for (unsigned row = 0; row < bmp.rows; ++row) {
            const uint8_t* src = bmp.pitch >= 0
                ? bmp.buffer + row * bmp.pitch
                : bmp.buffer + (bmp.rows - 1 - row) * static_cast<unsigned>(-bmp.pitch);
            std::memcpy(out.coverage.data() + static_cast<size_t>(row) * bmp.width, src, bmp.width);
        }
        return Ok(std::move(out));
    }

private:
    bool setSize(uint16_t pixelSize) {
        if (!_face || pixelSize == 0) return false;
        if (_currentSize == pixelSize) return true;
        if (FT_Set_Pixel_Sizes(_face, 0, pixelSize) != 0) return false;
        _currentSize = pixelSize;
        return true;
    }

    std::vector<uint8_t> _data;
    std::string _name;
    FT_Face _face = nullptr;
    uint16_t _currentSize = 0;
    std::unordered_map<uint64_t, float> _advanceCache;
};

Result<RasterFont::Ptr> RasterFont::create(std::vector<uint8_t> data, const std::string& name) noexcept {
    auto impl = std::make_shared<FreeTypeRasterFont>(std::move(data), name);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("RasterFont creation failed", res);
    }
    return Ok(std::move(impl));
}

} // namespace ycomp::font
