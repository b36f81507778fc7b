//=============================================================================
// Sprite Atlas Unit Tests
//
// Shelf packing, offline atlas construction, incremental growth and the
// tables the sprite shader reads.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <ycomp/image.h>
#include <ycomp/shelf-allocator.h>
#include <ycomp/sprite-atlas.h>

#include <utility>
#include <vector>

using namespace boost::ut;
using namespace ycomp;

namespace {

std::vector<SpriteFrames> squares(std::initializer_list<uint32_t> edges) {
    std::vector<SpriteFrames> out;
    for (uint32_t e : edges) {
        out.push_back(*SpriteFrames::inanimate(Image::filled(e, e, 0xFFFFFFFFu)));
    }
    return out;
}

SpriteFrames square(uint32_t edge) {
    return *SpriteFrames::inanimate(Image::filled(edge, edge, 0xFF0000FFu));
}

SpriteAtlas::Config smallConfig(uint32_t initial, uint32_t max) {
    SpriteAtlas::Config cfg;
    cfg.initialSize = initial;
    cfg.maxSize = max;
    cfg.padding = 1;
    return cfg;
}

} // namespace

//=============================================================================
// ShelfAllocator
//=============================================================================

suite shelf_allocator_tests = [] {
    "first rectangle opens a shelf at the origin"_test = [] {
        ShelfAllocator alloc(100);
        auto r = alloc.allocate(30, 20);
        expect(r.has_value());
        expect(r->x == 0_u && r->y == 0_u);
        expect(r->width == 30_u && r->height == 20_u);
    };

    "shorter rectangle shares an existing shelf"_test = [] {
        ShelfAllocator alloc(100);
        alloc.allocate(30, 20);
        auto r = alloc.allocate(30, 10);
        expect(r->x == 30_u && r->y == 0_u);
    };

    "taller rectangle opens a shelf below"_test = [] {
        ShelfAllocator alloc(100);
        alloc.allocate(30, 20);
        auto r = alloc.allocate(50, 25);
        expect(r->x == 0_u && r->y == 20_u);
    };

    "best fit picks the shelf wasting the least height"_test = [] {
        ShelfAllocator alloc(100);
        alloc.allocate(10, 30);
        alloc.allocate(10, 12);
        auto r = alloc.allocate(5, 10);
        expect(r->y == 30_u) << "the 12 high shelf wastes 2, the 30 high one 20";
        expect(r->x == 10_u);
    };

    "zero-sized and oversized requests fail"_test = [] {
        ShelfAllocator alloc(100);
        expect(!alloc.allocate(0, 5).has_value());
        expect(!alloc.allocate(5, 0).has_value());
        expect(!alloc.allocate(101, 1).has_value());
        expect(alloc.isEmpty());
    };

    "full region refuses"_test = [] {
        ShelfAllocator alloc(10);
        expect(alloc.allocate(10, 10).has_value());
        expect(!alloc.allocate(1, 1).has_value());
    };

    "grow keeps placements and adds room"_test = [] {
        ShelfAllocator alloc(10);
        auto first = alloc.allocate(10, 10);
        alloc.grow(20);
        expect(alloc.size() == 20_u);
        auto second = alloc.allocate(10, 10);
        expect(second.has_value());
        expect(second->x == 10_u && second->y == 0_u) << "existing shelf got wider";
        expect(alloc.allocations()[0] == *first);

        alloc.grow(5);
        expect(alloc.size() == 20_u) << "never shrinks";
    };

    "same request sequence gives the same layout"_test = [] {
        ShelfAllocator a(64), b(64);
        const uint32_t sizes[][2] = {{10, 7}, {3, 12}, {20, 7}, {9, 9}, {30, 4}, {11, 12}};
        for (const auto& s : sizes) {
            auto ra = a.allocate(s[0], s[1]);
            auto rb = b.allocate(s[0], s[1]);
            expect(ra.has_value() == rb.has_value());
            if (ra && rb) expect(*ra == *rb);
        }
        expect(a.usedArea() == b.usedArea());
    };

    "svg dump lists every allocation"_test = [] {
        ShelfAllocator alloc(32);
        alloc.allocate(8, 8);
        alloc.allocate(8, 8);
        auto svg = alloc.dumpSvg();
        expect(svg.find("<svg") == 0_u);
        expect(svg.find(">0</text>") != std::string::npos);
        expect(svg.find(">1</text>") != std::string::npos);
    };
};

//=============================================================================
// SpriteFrames
//=============================================================================

suite sprite_frames_tests = [] {
    "inanimate image with zero area is rejected"_test = [] {
        expect(!SpriteFrames::inanimate(Image{}).has_value());
        expect(!SpriteFrames::inanimate(Image::filled(0, 4, 0)).has_value());
    };

    "sheet slices into square frames by default"_test = [] {
        auto sheet = Image::filled(30, 10, 0x000000FFu);
        sheet.blit(Image::filled(10, 10, 0x00FF00FFu), 10, 0);
        auto frames = SpriteFrames::animated(sheet, std::nullopt);
        expect(frames.has_value());
        expect(frames->frames.size() == 3_u);
        expect(frames->frames[1].width == 10_u);
        expect(frames->frames[1].pixels[1] == 255_u) << "middle frame is green";
        expect(frames->frames[0].pixels[1] == 0_u);
    };

    "explicit frame width"_test = [] {
        auto frames = SpriteFrames::animated(Image::filled(24, 10, 0), 8u);
        expect(frames.has_value());
        expect(frames->frames.size() == 3_u);
    };

    "frame width must divide the sheet"_test = [] {
        auto sheet = Image::filled(30, 10, 0);
        expect(!SpriteFrames::animated(sheet, 7u).has_value());
        expect(!SpriteFrames::animated(sheet, 0u).has_value());
        expect(!SpriteFrames::animated(sheet, 40u).has_value());
        expect(!SpriteFrames::animated(Image{}, std::nullopt).has_value());
    };

    "raw pixels must match the dimensions"_test = [] {
        expect(!Image::fromRgba8(2, 2, std::vector<uint8_t>(15)).has_value());
        expect(Image::fromRgba8(2, 2, std::vector<uint8_t>(16)).has_value());
    };
};

//=============================================================================
// SpriteAtlas - offline pack
//=============================================================================

suite sprite_atlas_pack = [] {
    "empty atlas has no layers"_test = [] {
        auto atlas = SpriteAtlas::create(smallConfig(128, 1024), {});
        expect(atlas.has_value());
        expect((*atlas)->layerCount() == 0_u);
        expect((*atlas)->textureSize() == 0_u);
        expect((*atlas)->offsetTable().empty());
    };

    "single sprite lands at the origin with padding"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(128, 1024), squares({10}));
        expect(atlas->layerCount() == 1_u);
        expect(atlas->textureSize() == 128_u);
        auto p = atlas->placement(0, 0);
        expect(p.has_value());
        expect(p->rect == AtlasRect{0, 0, 12, 12});

        auto table = atlas->allocationTable();
        expect(table.size() == 1_u);
        expect(table[0].xMin == (1.0f / 128.0f));
        expect(table[0].xMax == (11.0f / 128.0f));
        expect(table[0].atlasIndex == 0_u);
    };

    "largest frames are placed first"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(128, 1024), squares({4, 20}));
        expect(atlas->placement(1, 0)->rect.x == 0_u);
        expect(atlas->placement(0, 0)->rect.x == 22_u);
    };

    "last layer grows in place"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(16, 64), squares({14, 14}));
        expect(atlas->layerCount() == 1_u);
        expect(atlas->layerSize(0) == 32_u);
        expect(atlas->placement(0, 0)->rect == AtlasRect{0, 0, 16, 16});
        expect(atlas->placement(1, 0)->rect == AtlasRect{16, 0, 16, 16});
    };

    "new layer opens at the maximum size"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(16, 16), squares({14, 14}));
        expect(atlas->layerCount() == 2_u);
        expect(atlas->homeLayer(0) == 0_u);
        expect(atlas->homeLayer(1) == 1_u);
        expect(atlas->allocationTable()[1].atlasIndex == 1_u);
    };

    "frame larger than the device limit is an error"_test = [] {
        expect(!SpriteAtlas::create(smallConfig(16, 16), squares({15})).has_value());
        expect(!SpriteAtlas::create(smallConfig(16, 0), squares({4})).has_value());
    };

    "packing is deterministic"_test = [] {
        auto a = *SpriteAtlas::create(smallConfig(32, 256), squares({7, 30, 12, 12, 50, 3, 9}));
        auto b = *SpriteAtlas::create(smallConfig(32, 256), squares({7, 30, 12, 12, 50, 3, 9}));
        expect(a->layerCount() == b->layerCount());
        for (uint32_t s = 0; s < a->spriteCount(); ++s) {
            expect(a->placement(s, 0)->rect == b->placement(s, 0)->rect);
            expect(a->placement(s, 0)->layer == b->placement(s, 0)->layer);
        }
    };

    "offset table points at each sprite's frames"_test = [] {
        std::vector<SpriteFrames> sprites;
        sprites.push_back(square(4));
        sprites.push_back(*SpriteFrames::animated(Image::filled(12, 4, 0), std::nullopt));
        sprites.push_back(square(6));
        auto atlas = *SpriteAtlas::create(smallConfig(64, 256), std::move(sprites));

        auto offsets = atlas->offsetTable();
        expect(offsets.size() == 3_u);
        expect(offsets[0].offset == 0_u && offsets[0].count == 1_u);
        expect(offsets[1].offset == 1_u && offsets[1].count == 3_u);
        expect(offsets[2].offset == 4_u && offsets[2].count == 1_u);
        expect(atlas->allocationTable().size() == 5_u);
        expect(atlas->frameCount(1) == 3_u);
    };

    "frames on a layer report their unpadded rectangle"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(64, 256), squares({10}));
        uint32_t seen = 0;
        atlas->forEachFrameOnLayer(0, [&](const Image& img, const AtlasRect& rect) {
            ++seen;
            expect(rect == AtlasRect{1, 1, 10, 10});
            expect(img.width == 10_u);
        });
        expect(seen == 1_u);
    };
};

//=============================================================================
// SpriteAtlas - incremental adds
//=============================================================================

suite sprite_atlas_incremental = [] {
    "first add appends a layer"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(16, 64), {});
        auto change = atlas->addSprite(square(14));
        expect(change.has_value());
        expect(change->layerAppended);
        expect(change->textureResized);
        expect(change->dirtyLayers == std::vector<uint32_t>{0});
        expect(atlas->spriteCount() == 1_u);
    };

    "full layer is rebuilt at double size"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(16, 64), {});
        atlas->addSprite(square(14));
        auto change = atlas->addSprite(square(14));
        expect(change.has_value());
        expect(!change->layerAppended);
        expect(change->textureResized) << "16 -> 32";
        expect(atlas->layerSize(0) == 32_u);
        expect(atlas->placement(1, 0)->rect == AtlasRect{16, 0, 16, 16});

        auto third = atlas->addSprite(square(14));
        expect(!third->textureResized);
        expect(third->dirtyLayers == std::vector<uint32_t>{0});
        expect(atlas->placement(2, 0)->rect == AtlasRect{0, 16, 16, 16});
    };

    "rebuild relocates earlier frames"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(16, 64), {});
        for (int i = 0; i < 4; ++i) atlas->addSprite(square(14));
        expect(atlas->placement(2, 0)->rect == AtlasRect{0, 16, 16, 16});

        auto change = atlas->addSprite(square(14));
        expect(change->textureResized);
        expect(atlas->layerSize(0) == 64_u);
        expect(atlas->placement(2, 0)->rect == AtlasRect{32, 0, 16, 16})
            << "re-placed in first-placement order on the wider shelf";
        expect(atlas->placement(4, 0)->rect == AtlasRect{0, 16, 16, 16});
    };

    "layer at the maximum size spills into a new layer"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(16, 64), {});
        for (int i = 0; i < 16; ++i) {
            auto change = atlas->addSprite(square(14));
            expect(change.has_value());
            expect(!change->layerAppended || i == 0);
        }
        expect(atlas->layerCount() == 1_u);

        auto change = atlas->addSprite(square(14));
        expect(change->layerAppended);
        expect(atlas->layerCount() == 2_u);
        expect(atlas->homeLayer(16) == 1_u);
        expect(atlas->layerSize(1) == 64_u);
    };

    "layer that does not repack at double size spills into a new layer"_test = [] {
        SpriteAtlas::Config cfg = smallConfig(64, 128);
        cfg.padding = 0;
        auto atlas = *SpriteAtlas::create(cfg, {});

        const std::vector<std::pair<uint32_t, uint32_t>> sizes = {
            {8, 37}, {12, 37}, {29, 11}, {1, 21}, {8, 14}, {33, 1}, {37, 20}, {2, 7},
            {11, 10}, {2, 18}, {31, 3}, {12, 6}, {19, 3}, {1, 30}, {2, 34}, {7, 1},
        };
        for (const auto& [w, h] : sizes) {
            expect(atlas->addSprite(*SpriteFrames::inanimate(Image::filled(w, h, 0xFFFFFFFFu)))
                       .has_value());
        }
        expect(atlas->layerCount() == 1_u);
        expect(atlas->layerSize(0) == 64_u);

        std::vector<AtlasRect> before;
        for (uint32_t s = 0; s < atlas->spriteCount(); ++s) {
            before.push_back(atlas->placement(s, 0)->rect);
        }

        auto change = atlas->addSprite(square(60));
        expect(change.has_value()) << error_msg(change);
        expect(change->layerAppended);
        expect(atlas->spriteCount() == 17_u);
        expect(atlas->layerCount() == 2_u);
        expect(atlas->homeLayer(16) == 1_u);
        expect(atlas->offsetTable().size() == 17_u);

        for (uint32_t s = 0; s < 16; ++s) {
            expect(atlas->placement(s, 0)->rect == before[s]) << "sprite" << s << "moved";
        }
        for (uint32_t s = 0; s < atlas->spriteCount(); ++s) {
            auto p = *atlas->placement(s, 0);
            uint32_t edge = atlas->layerSize(p.layer);
            expect(p.rect.x + p.rect.width <= edge && p.rect.y + p.rect.height <= edge)
                << "sprite" << s << "outside its layer";
        }
    };

    "oversized sprite leaves the atlas untouched"_test = [] {
        auto atlas = *SpriteAtlas::create(smallConfig(16, 16), {});
        expect(!atlas->addSprite(square(15)).has_value());
        expect(atlas->spriteCount() == 0_u);
        expect(atlas->layerCount() == 0_u);
    };
};

suite sprite_atlas_helpers = [] {
    "next power of two"_test = [] {
        expect(SpriteAtlas::nextPowerOfTwo(0) == 1_u);
        expect(SpriteAtlas::nextPowerOfTwo(1) == 1_u);
        expect(SpriteAtlas::nextPowerOfTwo(3) == 4_u);
        expect(SpriteAtlas::nextPowerOfTwo(64) == 64_u);
        expect(SpriteAtlas::nextPowerOfTwo(65) == 128_u);
    };

    "dirty layers are recorded once"_test = [] {
        AtlasChange change;
        change.markDirty(2);
        change.markDirty(2);
        change.markDirty(0);
        expect(change.dirtyLayers == std::vector<uint32_t>{2, 0});
    };
};
