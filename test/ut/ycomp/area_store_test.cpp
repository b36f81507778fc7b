//=============================================================================
// AreaStore Unit Tests
//
// Handle issuance, dirty marking through areaMut(), removal queue semantics.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <ycomp/area-store.h>

#include <string>

using namespace boost::ut;
using namespace ycomp;

namespace {

struct TestArea {
    int value = 0;
    std::string tag;
};

} // namespace

suite area_store_handles = [] {
    "handles start at one and increase"_test = [] {
        AreaStore<TestArea> store;
        auto a = store.add({1, "a"});
        auto b = store.add({2, "b"});
        auto c = store.add({3, "c"});
        expect(a.has_value() && b.has_value() && c.has_value());
        expect(a->id == 1_u);
        expect(b->id == 2_u);
        expect(c->id == 3_u);
        expect(a->isValid());
        expect(!UiAreaHandle::none().isValid());
    };

    "handles are never reused after removal"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({1, "a"});
        store.remove(a);
        store.takeRemovals();
        auto b = *store.add({2, "b"});
        expect(b.id > a.id) << "a removed handle must not come back";
        expect(store.area(a) == nullptr);
    };

    "area lookup has no side effect"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({7, "seven"});
        store.takeDirty();
        const TestArea* ro = store.area(a);
        expect(ro != nullptr);
        expect(ro->value == 7_i);
        expect(store.dirty().empty()) << "area() must not mark dirty";
    };

    "unknown handles return nullptr"_test = [] {
        AreaStore<TestArea> store;
        expect(store.area(UiAreaHandle{42}) == nullptr);
        expect(store.areaMut(UiAreaHandle{42}) == nullptr);
        expect(store.dirty().empty());
    };
};

suite area_store_dirty = [] {
    "add marks the new handle dirty"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({});
        expect(store.dirty().size() == 1_u);
        expect(store.dirty()[0] == a);
    };

    "areaMut marks dirty even without a write"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({});
        store.takeDirty();
        expect(store.areaMut(a) != nullptr);
        expect(store.dirty().size() == 1_u);
        expect(store.dirty()[0] == a);
    };

    "dirty set holds each handle once and sorted"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({});
        auto b = *store.add({});
        auto c = *store.add({});
        store.takeDirty();

        store.areaMut(c);
        store.areaMut(a);
        store.areaMut(c);
        store.areaMut(b);
        store.areaMut(a);

        auto dirty = store.takeDirty();
        expect(dirty.size() == 3_u);
        expect(dirty[0] == a);
        expect(dirty[1] == b);
        expect(dirty[2] == c);
        expect(store.dirty().empty()) << "takeDirty empties the set";
    };

    "requeued handles return in order without removed ones"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({});
        auto b = *store.add({});
        auto c = *store.add({});
        auto dirty = store.takeDirty();

        store.remove(b);
        store.takeRemovals();
        store.areaMut(c);
        store.requeueDirty(dirty.begin(), dirty.end());

        auto again = store.takeDirty();
        expect(again.size() == 2_u);
        expect(again[0] == a);
        expect(again[1] == c) << "already dirty, kept once";
    };
};

suite area_store_removal = [] {
    "remove is deferred until takeRemovals"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({5, "five"});
        store.remove(a);
        expect(store.contains(a)) << "record stays until the sync pass";
        expect(store.hasPendingChanges());

        auto removed = store.takeRemovals();
        expect(removed.size() == 1_u);
        expect(removed[0] == a);
        expect(!store.contains(a));
        expect(store.size() == 0_u);
    };

    "removal queue is deduplicated"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({});
        store.remove(a);
        store.remove(a);
        store.remove(a);
        expect(store.pendingRemovals().size() == 1_u);
    };

    "removing an unknown handle is ignored"_test = [] {
        AreaStore<TestArea> store;
        store.remove(UiAreaHandle{99});
        expect(store.pendingRemovals().empty());
    };

    "clear queues every area"_test = [] {
        AreaStore<TestArea> store;
        auto a = *store.add({});
        auto b = *store.add({});
        store.remove(b);
        store.clear();
        auto removed = store.takeRemovals();
        expect(removed.size() == 2_u);
        expect(std::find(removed.begin(), removed.end(), a) != removed.end());
        expect(std::find(removed.begin(), removed.end(), b) != removed.end());
        expect(store.size() == 0_u);
    };

    "forEach visits live records"_test = [] {
        AreaStore<TestArea> store;
        store.add({1, "x"});
        store.add({2, "y"});
        int sum = 0;
        store.forEach([&](UiAreaHandle, const TestArea& area) { sum += area.value; });
        expect(sum == 3_i);
    };
};
