#pragma once

#include <ycomp/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ycomp::font {

struct GlyphMetrics {
    float advance = 0.0f;   // pixels
    int32_t bearingX = 0;   // left edge relative to the pen
    int32_t bearingY = 0;   // top edge above the baseline
    uint32_t width = 0;
    uint32_t height = 0;
};

// 8-bit coverage, width * height bytes, rows top to bottom
struct GlyphBitmap {
    GlyphMetrics metrics;
    std::vector<uint8_t> coverage;
};

struct LineMetrics {
    float ascent = 0.0f;
    float descent = 0.0f;   // positive, below the baseline
    float lineGap = 0.0f;

    float lineHeight() const { return ascent + descent + lineGap; }
};

/// RasterFont - one font face, rasterized at pixel sizes on demand.
/// No GPU dependencies; the glyph atlas owns the GPU side.
class RasterFont {
public:
    using Ptr = std::shared_ptr<RasterFont>;

    /// Create from raw TTF/OTF data (FreeType).
    static Result<Ptr> create(std::vector<uint8_t> data, const std::string& name) noexcept;

    virtual ~RasterFont() = default;

    virtual const std::string& name() const = 0;

    virtual float advance(uint32_t codepoint, uint16_t pixelSize) = 0;
    virtual LineMetrics lineMetrics(uint16_t pixelSize) = 0;

    /// Rendered coverage; an empty bitmap (zero width or height) for blanks.
    virtual Result<GlyphBitmap> rasterize(uint32_t codepoint, uint16_t pixelSize) = 0;

protected:
    RasterFont() = default;
};

} // namespace ycomp::font
