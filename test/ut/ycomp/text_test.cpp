//=============================================================================
// Text Unit Tests
//
// Glyph cache, line layout and the glyph instance batcher. MockFont advances
// every glyph by half the pixel size, so positions are easy to predict:
// at size 16 a glyph is 8 wide, the line 16 high with the baseline at 12.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include "mocks.h"
#include <ycomp/glyph-atlas.h>
#include <ycomp/text-layout.h>
#include <ycomp/text-renderer.h>

#include <memory>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace ycomp;
using ycomp::test::MockFont;

namespace {

GlyphAtlas::Config tinyGlyphAtlas(uint32_t edge, uint64_t budget) {
    GlyphAtlas::Config cfg;
    cfg.maxTextureDimension = edge;
    cfg.texelBudget = budget;
    cfg.padding = 1;
    return cfg;
}

AreaDesc textArea(std::string text, ZLevel z = ZLevel::First, uint32_t font = 0) {
    AreaDesc desc;
    desc.xMin = 0.0f;
    desc.yMin = 0.0f;
    desc.xMax = 100.0f;
    desc.yMax = 50.0f;
    desc.z = z;
    desc.text = TextDesc{std::move(text), font, 16};
    return desc;
}

} // namespace

//=============================================================================
// GlyphAtlas
//=============================================================================

suite glyph_atlas_tests = [] {
    "layer count follows the texel budget"_test = [] {
        GlyphAtlas atlas(tinyGlyphAtlas(16, 16 * 16 * 2 + 1));
        expect(atlas.layerSize() == 16_u);
        expect(atlas.layerCount() == 3_u);
    };

    "layer edge is capped"_test = [] {
        GlyphAtlas atlas(tinyGlyphAtlas(20000, 1024));
        expect(atlas.layerSize() == 16384_u);
        expect(atlas.layerCount() == 1_u);
    };

    "blank glyphs are cached as invisible"_test = [] {
        GlyphAtlas atlas(tinyGlyphAtlas(64, 64 * 64));
        MockFont font;
        auto entry = atlas.get({0, 16, ' '}, font);
        expect(entry.has_value());
        expect(!(*entry)->visible);
        expect(atlas.takeUploads().empty());
        expect(atlas.cachedCount() == 1_u);
    };

    "second lookup hits the cache"_test = [] {
        GlyphAtlas atlas(tinyGlyphAtlas(64, 64 * 64));
        MockFont font;
        auto first = atlas.get({0, 16, 'A'}, font);
        auto second = atlas.get({0, 16, 'A'}, font);
        expect(first.has_value() && second.has_value());
        expect(*first == *second);
        expect(font.rasterized == 1_u);

        auto uploads = atlas.takeUploads();
        expect(uploads.size() == 1_u);
        expect(uploads[0].coverage.size() == 96_u);
        expect(atlas.takeUploads().empty()) << "uploads are handed out once";
    };

    "entry holds the unpadded rectangle and bearings"_test = [] {
        GlyphAtlas atlas(tinyGlyphAtlas(64, 64 * 64));
        MockFont font;
        const GlyphEntry* e = *atlas.get({0, 16, 'A'}, font);
        expect(e->visible);
        expect(e->rect == AtlasRect{1, 1, 8, 12});
        expect(e->bearingY == 12_i);
    };

    "size and font are part of the key"_test = [] {
        GlyphAtlas atlas(tinyGlyphAtlas(64, 64 * 64));
        MockFont font;
        atlas.get({0, 16, 'A'}, font);
        atlas.get({0, 8, 'A'}, font);
        atlas.get({1, 16, 'A'}, font);
        expect(font.rasterized == 3_u);
        expect(atlas.cachedCount() == 3_u);
    };

    "full layer spills into the next one"_test = [] {
        GlyphAtlas atlas(tinyGlyphAtlas(16, 16 * 16 * 2));
        MockFont font;
        auto a = atlas.get({0, 16, 'A'}, font);
        auto b = atlas.get({0, 16, 'B'}, font);
        expect(a.has_value() && b.has_value());
        expect((*a)->layer == 0_u);
        expect((*b)->layer == 1_u);
    };

    "overflow is an error"_test = [] {
        GlyphAtlas atlas(tinyGlyphAtlas(16, 16 * 16));
        MockFont font;
        expect(atlas.get({0, 16, 'A'}, font).has_value());
        auto overflow = atlas.get({0, 16, 'B'}, font);
        expect(!overflow.has_value());
        expect(overflow.error().message() == "glyph atlas overflow");
        expect(atlas.cachedCount() == 1_u);
    };
};

//=============================================================================
// TextLayout
//=============================================================================

suite text_layout_tests = [] {
    "single line is centered in the box"_test = [] {
        MockFont font;
        auto glyphs = TextLayout::layout(font, "AB", 16, TextBox{0, 0, 100, 50});
        expect(glyphs.size() == 2_u);
        expect(glyphs[0].x == 42.0_f);
        expect(glyphs[1].x == 50.0_f);
        expect(glyphs[0].baseline == 29.0_f);
    };

    "box offset moves the text"_test = [] {
        MockFont font;
        auto glyphs = TextLayout::layout(font, "AB", 16, TextBox{10, 20, 110, 70});
        expect(glyphs[0].x == 52.0_f);
        expect(glyphs[0].baseline == 49.0_f);
    };

    "lines wrap at the last space"_test = [] {
        MockFont font;
        auto glyphs = TextLayout::layout(font, "aa bb", 16, TextBox{0, 0, 30, 64});
        expect(glyphs.size() == 4_u) << "the space is not emitted";
        expect(glyphs[0].x == 7.0_f);
        expect(glyphs[0].baseline == 28.0_f);
        expect(glyphs[2].codepoint == uint32_t('b'));
        expect(glyphs[2].x == 7.0_f);
        expect(glyphs[2].baseline == 44.0_f);
    };

    "word wider than the box breaks between glyphs"_test = [] {
        MockFont font;
        auto glyphs = TextLayout::layout(font, "abcdef", 16, TextBox{0, 0, 20, 100});
        expect(glyphs.size() == 6_u);
        expect(glyphs[2].x == 2.0_f) << "c starts the second line";
        expect(glyphs[4].baseline - glyphs[2].baseline == 16.0_f);
    };

    "newline always breaks"_test = [] {
        MockFont font;
        auto glyphs = TextLayout::layout(font, "a\nb", 16, TextBox{0, 0, 1000, 100});
        expect(glyphs.size() == 2_u);
        expect(glyphs[1].baseline - glyphs[0].baseline == 16.0_f);
        expect(glyphs[0].x == glyphs[1].x);
    };

    "trailing spaces do not shift centering"_test = [] {
        MockFont font;
        auto plain = TextLayout::layout(font, "AB", 16, TextBox{0, 0, 100, 50});
        auto padded = TextLayout::layout(font, "AB  ", 16, TextBox{0, 0, 100, 50});
        expect(plain[0].x == padded[0].x);
    };

    "empty text or zero size lays out nothing"_test = [] {
        MockFont font;
        expect(TextLayout::layout(font, "", 16, TextBox{0, 0, 100, 50}).empty());
        expect(TextLayout::layout(font, "abc", 0, TextBox{0, 0, 100, 50}).empty());
    };

    "utf8 decoding"_test = [] {
        auto cps = TextLayout::decodeUtf8("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
        expect(cps.size() == 4_u);
        expect(cps[0] == 0x61u);
        expect(cps[1] == 0xE9u);
        expect(cps[2] == 0x20ACu);
        expect(cps[3] == 0x1F600u);
    };

    "stray continuation bytes are skipped"_test = [] {
        auto cps = TextLayout::decodeUtf8("a\x80z");
        expect(cps.size() == 2_u);
        expect(cps[1] == uint32_t('z'));
    };

    "sequence cut off at the end is dropped"_test = [] {
        auto cps = TextLayout::decodeUtf8("ab\xE2\x82");
        expect(cps.size() == 2_u);
        expect(cps[1] == uint32_t('b'));
        expect(TextLayout::decodeUtf8("\xF0\x9F\x98").empty());
        expect(TextLayout::decodeUtf8("\xC3").empty());
    };

    "interrupted sequence does not swallow the next character"_test = [] {
        auto cps = TextLayout::decodeUtf8("\xE2\x82" "z");
        expect(cps.size() == 1_u);
        expect(cps[0] == uint32_t('z'));
    };
};

//=============================================================================
// TextBatcher
//=============================================================================

suite text_batcher_tests = [] {
    "glyph quads come from layout and the atlas entry"_test = [] {
        auto font = std::make_shared<MockFont>();
        TextBatcher batcher(tinyGlyphAtlas(64, 64 * 64), {font});
        AreaDesc desc = textArea("AB", ZLevel::Second);

        expect(batcher.rebuild({{UiAreaHandle{7}, &desc}}).has_value());
        const auto& glyphs = batcher.instances(ZLevel::Second);
        expect(glyphs.size() == 2_u);
        expect(batcher.instances(ZLevel::First).empty());

        const GlyphInstance& g = glyphs[0];
        expect(g.x0 == 42.0_f);
        expect(g.y0 == 17.0_f);
        expect(g.x1 == 50.0_f);
        expect(g.y1 == 29.0_f);
        expect(g.u0 == (1.0f / 64.0f));
        expect(g.v1 == (13.0f / 64.0f));
        expect(g.areaId == 7_u);
        expect(g.layer == 0_u);
    };

    "areas are batched in handle order"_test = [] {
        auto font = std::make_shared<MockFont>();
        TextBatcher batcher(tinyGlyphAtlas(64, 64 * 64), {font});
        AreaDesc a = textArea("A");
        AreaDesc b = textArea("B");

        expect(batcher.rebuild({{UiAreaHandle{5}, &a}, {UiAreaHandle{2}, &b}}).has_value());
        const auto& glyphs = batcher.instances(ZLevel::First);
        expect(glyphs.size() == 2_u);
        expect(glyphs[0].areaId == 2_u);
        expect(glyphs[1].areaId == 5_u);
    };

    "disabled and textless areas are skipped"_test = [] {
        auto font = std::make_shared<MockFont>();
        TextBatcher batcher(tinyGlyphAtlas(64, 64 * 64), {font});
        AreaDesc disabled = textArea("A");
        disabled.enabled = false;
        AreaDesc textless = textArea("A");
        textless.text.reset();

        expect(batcher.rebuild({{UiAreaHandle{1}, &disabled}, {UiAreaHandle{2}, &textless}})
                   .has_value());
        expect(batcher.instances(ZLevel::First).empty());
    };

    "rebuild replaces the previous batch"_test = [] {
        auto font = std::make_shared<MockFont>();
        TextBatcher batcher(tinyGlyphAtlas(64, 64 * 64), {font});
        AreaDesc desc = textArea("ABC");
        batcher.rebuild({{UiAreaHandle{1}, &desc}});
        desc.text->text = "A";
        expect(batcher.rebuild({{UiAreaHandle{1}, &desc}}).has_value());
        expect(batcher.instances(ZLevel::First).size() == 1_u);
        expect(font->rasterized == 3_u) << "A came from the cache";
    };

    "unknown font index is an error"_test = [] {
        auto font = std::make_shared<MockFont>();
        TextBatcher batcher(tinyGlyphAtlas(64, 64 * 64), {font});
        AreaDesc desc = textArea("A", ZLevel::First, 3);
        expect(!batcher.rebuild({{UiAreaHandle{1}, &desc}}).has_value());
    };

    "glyph atlas overflow propagates"_test = [] {
        auto font = std::make_shared<MockFont>();
        TextBatcher batcher(tinyGlyphAtlas(16, 16 * 16), {font});
        AreaDesc desc = textArea("AB");
        auto res = batcher.rebuild({{UiAreaHandle{1}, &desc}});
        expect(!res.has_value());
        expect(res.error().to_string().find("glyph atlas overflow") != std::string::npos);
    };
};
