#pragma once

#include <ycomp/font/raster-font.h>
#include <cstdint>
#include <string>
#include <vector>

namespace ycomp {

struct TextBox {
    float xMin = 0.0f;
    float yMin = 0.0f;
    float xMax = 0.0f;
    float yMax = 0.0f;

    float width() const { return xMax - xMin; }
    float height() const { return yMax - yMin; }
};

// Pen position of one glyph: x of the origin, y of the baseline (Y down)
struct PositionedGlyph {
    uint32_t codepoint;
    float x;
    float baseline;
};

/**
 * Lays a UTF-8 string out inside a box.
 *
 * Lines wrap at the last space that keeps them inside the box width; a word
 * wider than the box is broken between glyphs, '\n' always breaks. Each line
 * is centered horizontally and the block of lines is centered vertically.
 * Spaces are not emitted.
 */
class TextLayout {
public:
    static std::vector<PositionedGlyph> layout(font::RasterFont& font,
                                               const std::string& text,
                                               uint16_t pixelSize,
                                               const TextBox& box);

    static std::vector<uint32_t> decodeUtf8(const std::string& text);
};

} // namespace ycomp
