//=============================================================================
// Compositor Unit Tests
//
// Frame orchestration of Compositor::render over a recording core: removal
// before sync, id resolution, text rebuild triggers, hover filtering and
// recovery after a failed frame.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <ycomp/compositor.h>

#include "mocks.h"

#include <memory>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace ycomp;
using namespace ycomp::test;

namespace {

using TestCompositor = Compositor<std::string, std::string>;
using TestArea = TestCompositor::Area;

struct Fixture {
    std::shared_ptr<MockCompositorCore> core = std::make_shared<MockCompositorCore>(2, 1);
    TestCompositor compositor{core, {{"tile", 0}, {"badge", 1}}, {{"body", 0}}};

    Result<std::vector<WGPUCommandBuffer>> frame() {
        core->events.clear();
        return compositor.render(nullptr);
    }
};

TestArea spriteArea(const std::string& sprite, ZLevel z = ZLevel::First) {
    TestArea a;
    a.xMax = 10.0f;
    a.yMax = 10.0f;
    a.z = z;
    a.sprite = sprite;
    return a;
}

TestArea textArea(const std::string& text) {
    TestArea a;
    a.xMax = 100.0f;
    a.yMax = 20.0f;
    a.text = AreaText<std::string>{text, "body", 16};
    return a;
}

} // namespace

suite compositor_frame_order = [] {
    "removals are applied before dirty areas"_test = [] {
        Fixture f;
        auto a = *f.compositor.addArea(spriteArea("tile"));
        auto b = *f.compositor.addArea(spriteArea("badge"));
        expect(f.frame().has_value());

        f.compositor.removeArea(a);
        f.compositor.areaMut(b)->z = ZLevel::Second;
        expect(f.frame().has_value());

        const auto& ev = f.core->events;
        auto removed = std::find(ev.begin(), ev.end(), "remove:" + std::to_string(a.id));
        auto synced = std::find(ev.begin(), ev.end(), "sync:" + std::to_string(b.id));
        expect(removed != ev.end() && synced != ev.end());
        expect(removed < synced);
        expect(ev.back() == "record");
        expect(f.core->lastDesc[b.id].z == ZLevel::Second);
    };

    "area removed in the same frame is never synced"_test = [] {
        Fixture f;
        auto a = *f.compositor.addArea(spriteArea("tile"));
        f.compositor.areaMut(a)->xMax = 20.0f;
        f.compositor.removeArea(a);
        expect(f.frame().has_value());

        expect(f.core->count("remove:" + std::to_string(a.id)) == 1_u);
        expect(f.core->count("sync:" + std::to_string(a.id)) == 0_u);
        expect(f.compositor.area(a) == nullptr);
    };

    "dirty areas are synced once each in handle order"_test = [] {
        Fixture f;
        auto a = *f.compositor.addArea(spriteArea("tile"));
        auto b = *f.compositor.addArea(spriteArea("badge"));
        f.compositor.areaMut(b);
        f.compositor.areaMut(a);
        expect(f.frame().has_value());

        std::vector<std::string> syncs;
        for (const auto& e : f.core->events) {
            if (e.rfind("sync:", 0) == 0) syncs.push_back(e);
        }
        expect(syncs == std::vector<std::string>{"sync:" + std::to_string(a.id),
                                                 "sync:" + std::to_string(b.id)});
    };

    "disabled area is handed over for eviction"_test = [] {
        Fixture f;
        auto a = *f.compositor.addArea(spriteArea("tile"));
        expect(f.frame().has_value());
        f.compositor.areaMut(a)->enabled = false;
        expect(f.frame().has_value());
        expect(f.core->count("evict:" + std::to_string(a.id)) == 1_u);
    };

    "host ids resolve to dense keys"_test = [] {
        Fixture f;
        auto a = *f.compositor.addArea(spriteArea("badge"));
        auto t = *f.compositor.addArea(textArea("hi"));
        expect(f.frame().has_value());
        expect(f.core->lastDesc[a.id].spriteKey == std::optional<uint32_t>(1u));
        expect(f.core->lastDesc[t.id].text.has_value());
        expect(f.core->lastDesc[t.id].text->fontKey == 0_u);
        expect(!f.core->lastDesc[t.id].spriteKey.has_value());
    };
};

suite compositor_text_rebuild = [] {
    "text is rebuilt only when something changed"_test = [] {
        Fixture f;
        f.compositor.addArea(textArea("one"));
        f.compositor.addArea(spriteArea("tile"));
        expect(f.frame().has_value());
        expect(f.core->count("text:1") == 1_u) << "only the text-bearing area is laid out";

        expect(f.frame().has_value());
        expect(f.core->count("text:1") == 0_u) << "idle frame";
        expect(f.core->events == std::vector<std::string>{"record"});
    };

    "removal alone triggers a rebuild"_test = [] {
        Fixture f;
        auto t = *f.compositor.addArea(textArea("one"));
        f.compositor.addArea(textArea("two"));
        expect(f.frame().has_value());

        f.compositor.removeArea(t);
        expect(f.frame().has_value());
        expect(f.core->count("text:1") == 1_u);
    };

    "failed rebuild is retried on the next frame"_test = [] {
        Fixture f;
        f.compositor.addArea(textArea("one"));
        f.core->failText = true;
        expect(!f.frame().has_value());

        f.core->failText = false;
        expect(f.frame().has_value());
        expect(f.core->count("text:1") == 1_u) << "no new change, still rebuilt";

        expect(f.frame().has_value());
        expect(f.core->count("text:1") == 0_u);
    };
};

suite compositor_errors = [] {
    "unknown sprite id fails the frame"_test = [] {
        Fixture f;
        f.compositor.addArea(spriteArea("missing"));
        auto res = f.frame();
        expect(!res.has_value());
        expect(res.error().to_string().find("unregistered sprite id") != std::string::npos);
    };

    "unknown font id fails the frame"_test = [] {
        Fixture f;
        auto a = textArea("x");
        a.text->font = "serif";
        f.compositor.addArea(std::move(a));
        auto res = f.frame();
        expect(!res.has_value());
        expect(res.error().to_string().find("unregistered font id") != std::string::npos);
    };

    "areas after a failing one stay queued"_test = [] {
        Fixture f;
        auto bad = *f.compositor.addArea(spriteArea("missing"));
        auto good = *f.compositor.addArea(spriteArea("tile"));

        expect(!f.frame().has_value());
        expect(f.core->count("sync:" + std::to_string(good.id)) == 0_u);

        expect(!f.frame().has_value()) << "the bad area is still pending";

        f.compositor.areaMut(bad)->sprite = "badge";
        expect(f.frame().has_value());
        expect(f.core->count("sync:" + std::to_string(bad.id)) == 1_u);
        expect(f.core->count("sync:" + std::to_string(good.id)) == 1_u);

        expect(f.frame().has_value());
        expect(f.core->events == std::vector<std::string>{"record"}) << "nothing left over";
    };

    "failed core sync keeps the area queued"_test = [] {
        Fixture f;
        auto a = *f.compositor.addArea(spriteArea("tile"));
        auto b = *f.compositor.addArea(spriteArea("tile"));
        f.core->failSyncOf = a;
        expect(!f.frame().has_value());

        f.core->failSyncOf.reset();
        expect(f.frame().has_value());
        expect(f.core->count("sync:" + std::to_string(a.id)) == 1_u);
        expect(f.core->count("sync:" + std::to_string(b.id)) == 1_u);
    };

    "queued area removed before the retry is dropped"_test = [] {
        Fixture f;
        auto bad = *f.compositor.addArea(spriteArea("missing"));
        expect(!f.frame().has_value());

        f.compositor.removeArea(bad);
        expect(f.frame().has_value());
        expect(f.core->count("remove:" + std::to_string(bad.id)) == 1_u);
    };
};

suite compositor_hover = [] {
    "hovered handle is reported while the area lives"_test = [] {
        Fixture f;
        auto a = *f.compositor.addArea(spriteArea("tile"));
        expect(f.frame().has_value());
        f.core->hoveredHandle = a;
        expect(f.compositor.currentlyHovered() == std::optional<UiAreaHandle>(a));
    };

    "pick that predates a removal is filtered"_test = [] {
        Fixture f;
        auto a = *f.compositor.addArea(spriteArea("tile"));
        expect(f.frame().has_value());
        f.core->hoveredHandle = a;

        f.compositor.removeArea(a);
        expect(f.frame().has_value());
        expect(!f.compositor.currentlyHovered().has_value());
    };

    "nothing under the pointer"_test = [] {
        Fixture f;
        expect(f.frame().has_value());
        expect(!f.compositor.currentlyHovered().has_value());
        expect(f.core->polls == 1_u);
    };
};
