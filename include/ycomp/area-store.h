#pragma once

#include <ycomp/result.hpp>
#include <ycomp/types.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <unordered_map>
#include <vector>

namespace ycomp {

/**
 * AreaStore owns area records and the bookkeeping the per-frame sync needs.
 *
 * Handles are issued from 1 upwards and never reused. Every access through
 * areaMut() marks the handle dirty, whether or not the caller writes.
 * remove() only queues the handle; the record disappears when the sync pass
 * calls takeRemovals().
 */
template<typename AreaT>
class AreaStore {
public:
    Result<UiAreaHandle> add(AreaT area) {
        if (_nextId == std::numeric_limits<uint32_t>::max()) {
            return Err<UiAreaHandle>("AreaStore: area handles exhausted");
        }
        UiAreaHandle handle{_nextId++};
        _areas.emplace(handle, std::move(area));
        markDirty(handle);
        ydebug("AreaStore: added area {}", handle.id);
        return Ok(handle);
    }

    AreaT* areaMut(UiAreaHandle handle) {
        auto it = _areas.find(handle);
        if (it == _areas.end()) return nullptr;
        markDirty(handle);
        return &it->second;
    }

    const AreaT* area(UiAreaHandle handle) const {
        auto it = _areas.find(handle);
        return it == _areas.end() ? nullptr : &it->second;
    }

    bool contains(UiAreaHandle handle) const { return _areas.count(handle) > 0; }

    void remove(UiAreaHandle handle) {
        if (!contains(handle)) {
            ywarn("AreaStore: remove of unknown area {}", handle.id);
            return;
        }
        if (std::find(_removals.begin(), _removals.end(), handle) == _removals.end()) {
            _removals.push_back(handle);
        }
    }

    // Queues every live area for removal
    void clear() {
        for (const auto& [handle, area] : _areas) {
            if (std::find(_removals.begin(), _removals.end(), handle) == _removals.end()) {
                _removals.push_back(handle);
            }
        }
        std::sort(_removals.begin(), _removals.end());
    }

    // Deletes the queued records and hands the queue to the caller
    std::vector<UiAreaHandle> takeRemovals() {
        std::vector<UiAreaHandle> out;
        out.swap(_removals);
        for (const auto& handle : out) {
            _areas.erase(handle);
        }
        return out;
    }

    // Handle-ordered, each handle once
    std::vector<UiAreaHandle> takeDirty() {
        std::vector<UiAreaHandle> out;
        out.swap(_dirty);
        return out;
    }

    // Puts handles back into the dirty set after a sync pass gave up on them.
    // Handles removed in the meantime are dropped.
    template<typename It>
    void requeueDirty(It begin, It end) {
        for (; begin != end; ++begin) {
            if (contains(*begin)) markDirty(*begin);
        }
    }

    bool hasPendingChanges() const { return !_dirty.empty() || !_removals.empty(); }
    const std::vector<UiAreaHandle>& dirty() const { return _dirty; }
    const std::vector<UiAreaHandle>& pendingRemovals() const { return _removals; }

    size_t size() const { return _areas.size(); }

    template<typename F>
    void forEach(F&& fn) const {
        for (const auto& [handle, area] : _areas) {
            fn(handle, area);
        }
    }

private:
    void markDirty(UiAreaHandle handle) {
        auto it = std::lower_bound(_dirty.begin(), _dirty.end(), handle);
        if (it == _dirty.end() || *it != handle) {
            _dirty.insert(it, handle);
        }
    }

    std::unordered_map<UiAreaHandle, AreaT> _areas;
    std::vector<UiAreaHandle> _dirty;
    std::vector<UiAreaHandle> _removals;
    uint32_t _nextId = 1;
};

} // namespace ycomp
