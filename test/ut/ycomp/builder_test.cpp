//=============================================================================
// CompositorBuilder Unit Tests
//
// Registration-time validation. Building needs a GPU device and is covered
// by the demo instead.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <ycomp/compositor.h>

#include <string>
#include <vector>

using namespace boost::ut;
using namespace ycomp;

namespace {

enum class Icon { Play, Stop, Spinner };
enum class Face { Body };

} // namespace

suite builder_sprites = [] {
    "duplicate sprite id is rejected"_test = [] {
        CompositorBuilder<std::string, std::string> builder;
        expect(builder.addInanimateSprite("a", Image::filled(4, 4, 0xFFFFFFFFu)).has_value());
        auto dup = builder.addInanimateSprite("a", Image::filled(8, 8, 0xFFFFFFFFu));
        expect(!dup.has_value());
        expect(dup.error().message() == "sprite id is already registered");
        expect(builder.spriteCount() == 1_u);
    };

    "duplicate id across sprite kinds is rejected"_test = [] {
        CompositorBuilder<Icon, Face> builder;
        expect(builder.addInanimateSprite(Icon::Play, Image::filled(4, 4, 0)).has_value());
        expect(!builder.addAnimatedSprite(Icon::Play, Image::filled(8, 4, 0)).has_value());
        expect(builder.hasSprite(Icon::Play));
        expect(!builder.hasSprite(Icon::Stop));
    };

    "zero-area image is rejected"_test = [] {
        CompositorBuilder<Icon, Face> builder;
        expect(!builder.addInanimateSprite(Icon::Stop, Image{}).has_value());
        expect(!builder.hasSprite(Icon::Stop)) << "failed registration leaves no trace";
    };

    "animated sheet needs a dividing frame width"_test = [] {
        CompositorBuilder<Icon, Face> builder;
        expect(!builder.addAnimatedSprite(Icon::Spinner, Image::filled(30, 10, 0), 7u).has_value());
        expect(builder.addAnimatedSprite(Icon::Spinner, Image::filled(30, 10, 0)).has_value());
        expect(builder.spriteCount() == 1_u);
    };
};

suite builder_fonts = [] {
    "font bytes that are not a font are rejected"_test = [] {
        CompositorBuilder<Icon, Face> builder;
        std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', ' ', 'f', 'o', 'n', 't'};
        expect(!builder.addFont(Face::Body, garbage).has_value());
        expect(!builder.addFont(Face::Body, {}).has_value());
        expect(builder.fontCount() == 0_u);
    };
};
