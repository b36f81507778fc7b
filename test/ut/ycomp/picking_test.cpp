//=============================================================================
// Cursor Picking Unit Tests
//
// The CPU halves of picking: the callback-to-frame channel, pointer change
// tracking and the texel clamp. The GPU readback itself needs a device.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <ycomp/cursor-picker.h>

#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace boost::ut;
using namespace ycomp;

suite pick_channel_tests = [] {
    "empty channel yields nothing"_test = [] {
        PickChannel channel;
        expect(!channel.drainLatest().has_value());
    };

    "latest id wins and the channel empties"_test = [] {
        PickChannel channel;
        channel.send(3);
        channel.send(0);
        channel.send(9);
        auto latest = channel.drainLatest();
        expect(latest.has_value());
        expect(*latest == 9_u);
        expect(!channel.drainLatest().has_value());
    };

    "sends from another thread arrive"_test = [] {
        PickChannel channel;
        std::thread sender([&channel] {
            for (uint32_t i = 1; i <= 100; ++i) channel.send(i);
        });
        sender.join();
        expect(channel.drainLatest() == std::optional<uint32_t>(100));
    };
};

suite pointer_state_tests = [] {
    "no position until the first set"_test = [] {
        PointerState p;
        expect(!p.hasPosition());
        expect(!p.takeChanged());
        p.markChanged();
        expect(!p.takeChanged()) << "nothing to re-send without a position";
    };

    "set reports a change once"_test = [] {
        PointerState p;
        p.set(10.5f, 4.0f);
        expect(p.hasPosition());
        expect(p.takeChanged());
        expect(!p.takeChanged());
        expect(p.x() == 10.5_f);
    };

    "same position is not a change"_test = [] {
        PointerState p;
        p.set(1.0f, 2.0f);
        p.takeChanged();
        p.set(1.0f, 2.0f);
        expect(!p.takeChanged());
        p.set(1.0f, 3.0f);
        expect(p.takeChanged());
    };

    "markChanged forces a re-send"_test = [] {
        PointerState p;
        p.set(1.0f, 2.0f);
        p.takeChanged();
        p.markChanged();
        expect(p.takeChanged());
    };
};

suite clamp_to_target_tests = [] {
    "inside positions floor to the texel"_test = [] {
        auto t = clampToTarget(10.7f, 3.2f, 100, 50);
        expect(t.x == 10_u);
        expect(t.y == 3_u);
    };

    "negative and NaN clamp to zero"_test = [] {
        auto t = clampToTarget(-5.0f, std::numeric_limits<float>::quiet_NaN(), 100, 50);
        expect(t.x == 0_u);
        expect(t.y == 0_u);
    };

    "beyond the edge clamps to the last texel"_test = [] {
        auto t = clampToTarget(100.0f, 1e9f, 100, 50);
        expect(t.x == 99_u);
        expect(t.y == 49_u);
    };

    "zero extent maps to zero"_test = [] {
        auto t = clampToTarget(5.0f, 5.0f, 0, 0);
        expect(t.x == 0_u);
        expect(t.y == 0_u);
    };
};
