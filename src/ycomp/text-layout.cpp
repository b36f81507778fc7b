#include <ycomp/text-layout.h>

namespace ycomp {

namespace {

struct LaidGlyph {
    uint32_t codepoint;
    float advance;
};

struct Line {
    std::vector<LaidGlyph> glyphs;
};

bool isSpace(uint32_t cp) { return cp == ' ' || cp == '\t'; }

float lineWidth(const Line& line) {
    // Trailing spaces do not count towards centering
    size_t end = line.glyphs.size();
    while (end > 0 && isSpace(line.glyphs[end - 1].codepoint)) --end;
    float w = 0.0f;
    for (size_t i = 0; i < end; ++i) w += line.glyphs[i].advance;
    return w;
}

float fullWidth(const Line& line) {
    float w = 0.0f;
    for (const auto& g : line.glyphs) w += g.advance;
    return w;
}

} // namespace

std::vector<uint32_t> TextLayout::decodeUtf8(const std::string& text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());

    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
    const uint8_t* end = ptr + text.size();

    while (ptr < end) {
        uint32_t cp = 0;
        size_t extra = 0;
        if ((*ptr & 0x80) == 0) {
            cp = *ptr;
        } else if ((*ptr & 0xE0) == 0xC0) {
            cp = *ptr & 0x1F;
            extra = 1;
        } else if ((*ptr & 0xF0) == 0xE0) {
            cp = *ptr & 0x0F;
            extra = 2;
        } else if ((*ptr & 0xF8) == 0xF0) {
            cp = *ptr & 0x07;
            extra = 3;
        } else {
            ptr++;  // stray continuation or invalid lead byte
            continue;
        }

        size_t read = 0;
        while (read < extra && ptr + 1 + read < end && (ptr[1 + read] & 0xC0) == 0x80) {
            cp = (cp << 6) | (ptr[1 + read] & 0x3F);
            ++read;
        }
        if (read < extra) {
            // Truncated or interrupted sequence: drop the lead byte, the
            // continuation bytes read so far are skipped as strays
            ptr++;
            continue;
        }
        ptr += extra + 1;
        out.push_back(cp);
    }
    return out;
}

std::vector<PositionedGlyph> TextLayout::layout(font::RasterFont& font,
                                                const std::string& text,
                                                uint16_t pixelSize,
                                                const TextBox& box) {
    std::vector<PositionedGlyph> out;
    if (text.empty() || pixelSize == 0) return out;

    const float maxWidth = box.width();
    std::vector<Line> lines(1);

    for (uint32_t cp : decodeUtf8(text)) {
        if (cp == '\n') {
            lines.emplace_back();
            continue;
        }
        if (cp == '\r') continue;

        float adv = font.advance(cp, pixelSize);
        Line& line = lines.back();

        if (!isSpace(cp) && !line.glyphs.empty() && fullWidth(line) + adv > maxWidth) {
            // Wrap at the last space, or between glyphs when the word has none
            size_t split = line.glyphs.size();
            for (size_t i = line.glyphs.size(); i > 0; --i) {
                if (isSpace(line.glyphs[i - 1].codepoint)) {
                    split = i - 1;
                    break;
                }
            }
            Line next;
            if (split < line.glyphs.size()) {
                next.glyphs.assign(line.glyphs.begin() + split + 1, line.glyphs.end());
                line.glyphs.erase(line.glyphs.begin() + split, line.glyphs.end());
            }
            lines.push_back(std::move(next));
        }
        lines.back().glyphs.push_back({cp, adv});
    }

    const font::LineMetrics lm = font.lineMetrics(pixelSize);
    const float lineHeight = lm.lineHeight();
    const float blockHeight = lineHeight * static_cast<float>(lines.size());
    const float top = box.yMin + (box.height() - blockHeight) * 0.5f;

    for (size_t i = 0; i < lines.size(); ++i) {
        const Line& line = lines[i];
        float x = box.xMin + (maxWidth - lineWidth(line)) * 0.5f;
        float baseline = top + lineHeight * static_cast<float>(i) + lm.ascent;
        for (const auto& g : line.glyphs) {
            if (!isSpace(g.codepoint)) {
                out.push_back({g.codepoint, x, baseline});
            }
            x += g.advance;
        }
    }
    return out;
}

} // namespace ycomp
