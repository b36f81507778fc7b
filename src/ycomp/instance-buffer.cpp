#include <ycomp/instance-buffer.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace ycomp {

// =============================================================================
// WebGPU backend
// =============================================================================

class WebGpuInstanceBufferBackend : public InstanceBufferBackend {
public:
    WebGpuInstanceBufferBackend(GpuAllocator::Ptr allocator, WGPUQueue queue) noexcept
        : _allocator(std::move(allocator)), _queue(queue) {}

    Result<void> init() noexcept {
        if (!_allocator || !_queue) {
            return Err<void>("instance backend needs an allocator and a queue");
        }
        return Ok();
    }

    Result<WGPUBuffer> createBuffer(const std::string& label, uint64_t size) override {
        WGPUBufferDescriptor desc = {};
        desc.label = YCOMP_WGPU_STR(label.c_str());
        desc.size = size;
        desc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
        desc.mappedAtCreation = false;
        WGPUBuffer buffer = _allocator->createBuffer(desc);
        if (!buffer) {
            return Err<WGPUBuffer>("failed to create instance buffer '" + label + "'");
        }
        return Ok(buffer);
    }

    void writeBuffer(WGPUBuffer buffer, uint64_t offset, const void* data, uint64_t size) override {
        wgpuQueueWriteBuffer(_queue, buffer, offset, data, size);
    }

    void releaseBuffer(WGPUBuffer buffer) override {
        _allocator->releaseBuffer(buffer);
    }

private:
    GpuAllocator::Ptr _allocator;
    WGPUQueue _queue;
};

Result<InstanceBufferBackend::Ptr> InstanceBufferBackend::createWebGpu(GpuAllocator::Ptr allocator,
                                                                       WGPUQueue queue) noexcept {
    auto backend = std::make_shared<WebGpuInstanceBufferBackend>(std::move(allocator), queue);
    if (auto res = backend->init(); !res) {
        return Err<Ptr>("Failed to initialize instance buffer backend", res);
    }
    return Ok(std::move(backend));
}

// =============================================================================
// InstanceSynchronizer
// =============================================================================

InstanceSynchronizer::InstanceSynchronizer(InstanceBufferBackend::Ptr backend, uint32_t layerCount,
                                           uint32_t initialCapacity)
    : _backend(std::move(backend))
    , _layerCount(std::max(layerCount, 1u))
    , _initialCapacity(std::max(initialCapacity, 1u)) {
    for (auto& pool : _pools) {
        pool.resize(_layerCount);
    }
}

InstanceSynchronizer::~InstanceSynchronizer() {
    clear();
}

void InstanceSynchronizer::addLayer() {
    ++_layerCount;
    for (auto& pool : _pools) {
        pool.emplace_back();
    }
    ydebug("InstanceSynchronizer: pools extended to {} layers", _layerCount);
}

void InstanceSynchronizer::clear() {
    for (auto& pool : _pools) {
        for (auto& buf : pool) {
            if (buf && buf->buffer) {
                _backend->releaseBuffer(buf->buffer);
            }
            buf.reset();
        }
    }
    _residency.clear();
}

const InstanceBuffer* InstanceSynchronizer::buffer(ZLevel z, uint32_t layer) const {
    const auto& pool = _pools[zIndex(z)];
    return layer < pool.size() ? pool[layer].get() : nullptr;
}

InstanceBuffer* InstanceSynchronizer::bufferMut(const PoolKey& key) {
    auto& pool = _pools[zIndex(key.z)];
    return key.layer < pool.size() ? pool[key.layer].get() : nullptr;
}

std::optional<Residency> InstanceSynchronizer::residency(UiAreaHandle handle) const {
    auto it = _residency.find(handle);
    if (it == _residency.end()) return std::nullopt;
    return it->second;
}

Result<void> InstanceSynchronizer::remove(UiAreaHandle handle) {
    if (_residency.count(handle) == 0) {
        return Ok();
    }
    return evict(handle);
}

Result<void> InstanceSynchronizer::update(UiAreaHandle handle,
                                          const std::optional<InstancePlacement>& placement) {
    auto it = _residency.find(handle);

    if (!placement) {
        return it == _residency.end() ? Ok() : evict(handle);
    }

    if (placement->key.layer >= _layerCount) {
        return Err<void>("area " + std::to_string(handle.id) + " targets atlas layer " +
                         std::to_string(placement->key.layer) + " of " +
                         std::to_string(_layerCount));
    }

    if (it != _residency.end() && it->second.key != placement->key) {
        if (auto res = evict(handle); !res) {
            return res;
        }
        it = _residency.end();
    }

    if (it == _residency.end()) {
        return append(handle, placement->key, placement->instance);
    }

    // Same buffer: overwrite in place, skipping the upload when nothing changed
    InstanceBuffer* buf = bufferMut(it->second.key);
    uint32_t slot = it->second.slot;
    if (!buf || slot >= buf->size() || buf->order[slot] != handle) {
        yerror("InstanceSynchronizer: residency of area {} does not match its buffer", handle.id);
        return Err<void>("instance residency out of sync");
    }
    if (!(buf->staging[slot] == placement->instance)) {
        buf->staging[slot] = placement->instance;
        writeSlot(*buf, slot);
    }
    return Ok();
}

// Swap-remove: the last occupant moves into the freed slot.
Result<void> InstanceSynchronizer::evict(UiAreaHandle handle) {
    auto it = _residency.find(handle);
    if (it == _residency.end()) {
        return Ok();
    }
    const Residency res = it->second;
    InstanceBuffer* buf = bufferMut(res.key);
    if (!buf || res.slot >= buf->size() || buf->order[res.slot] != handle) {
        yerror("InstanceSynchronizer: area {} recorded at z={} layer={} slot={} is not there",
               handle.id, zLevelName(res.key.z), res.key.layer, res.slot);
        return Err<void>("instance residency out of sync");
    }

    _residency.erase(it);
    uint32_t last = buf->size() - 1;

    if (last == 0) {
        _backend->releaseBuffer(buf->buffer);
        _pools[zIndex(res.key.z)][res.key.layer].reset();
        ydebug("InstanceSynchronizer: area {} was the sole occupant, buffer z={} layer={} dropped",
               handle.id, zLevelName(res.key.z), res.key.layer);
        return Ok();
    }

    if (res.slot != last) {
        UiAreaHandle moved = buf->order[last];
        buf->staging[res.slot] = buf->staging[last];
        buf->order[res.slot] = moved;
        auto movedIt = _residency.find(moved);
        if (movedIt == _residency.end()) {
            yerror("InstanceSynchronizer: occupant {} of slot {} has no residency", moved.id, last);
            return Err<void>("instance residency out of sync");
        }
        movedIt->second.slot = res.slot;
        writeSlot(*buf, res.slot);
        ydebug("InstanceSynchronizer: area {} moved from slot {} to {}", moved.id, last, res.slot);
    }

    buf->staging.pop_back();
    buf->order.pop_back();
    return Ok();
}

Result<void> InstanceSynchronizer::append(UiAreaHandle handle, const PoolKey& key,
                                          const AreaInstance& instance) {
    if (_residency.count(handle) > 0) {
        yerror("InstanceSynchronizer: area {} is already resident", handle.id);
        return Err<void>("area resident in more than one slot");
    }

    auto& owner = _pools[zIndex(key.z)][key.layer];
    if (!owner) {
        owner = std::make_unique<InstanceBuffer>();
    }
    InstanceBuffer& buf = *owner;

    if (auto res = reserve(buf, key, buf.size() + 1); !res) {
        if (buf.size() == 0) owner.reset();
        return res;
    }

    uint32_t slot = buf.size();
    buf.staging.push_back(instance);
    buf.order.push_back(handle);
    _residency[handle] = {key, slot};
    writeSlot(buf, slot);
    return Ok();
}

Result<void> InstanceSynchronizer::reserve(InstanceBuffer& buf, const PoolKey& key, uint32_t needed) {
    if (buf.buffer && needed <= buf.capacity) {
        return Ok();
    }

    uint32_t capacity = buf.capacity == 0 ? _initialCapacity : buf.capacity;
    while (capacity < needed) {
        capacity *= 2;
    }

    std::string label = "ycomp instances z=" + std::string(zLevelName(key.z)) +
                        " layer=" + std::to_string(key.layer);
    auto created = _backend->createBuffer(label, static_cast<uint64_t>(capacity) * sizeof(AreaInstance));
    if (!created) {
        return Err<void>("instance buffer growth failed", created);
    }

    if (buf.buffer) {
        // Re-upload everything into the larger buffer
        if (!buf.staging.empty()) {
            _backend->writeBuffer(*created, 0, buf.staging.data(),
                                  buf.staging.size() * sizeof(AreaInstance));
        }
        _backend->releaseBuffer(buf.buffer);
        ydebug("InstanceSynchronizer: {} grew {} -> {}", label, buf.capacity, capacity);
    }

    buf.buffer = *created;
    buf.capacity = capacity;
    return Ok();
}

void InstanceSynchronizer::writeSlot(InstanceBuffer& buf, uint32_t slot) {
    _backend->writeBuffer(buf.buffer, static_cast<uint64_t>(slot) * sizeof(AreaInstance),
                          &buf.staging[slot], sizeof(AreaInstance));
}

Result<void> InstanceSynchronizer::validate() const {
    size_t total = 0;
    for (auto z : ALL_Z_LEVELS) {
        const auto& pool = _pools[zIndex(z)];
        for (uint32_t layer = 0; layer < pool.size(); ++layer) {
            const InstanceBuffer* buf = pool[layer].get();
            if (!buf) continue;
            if (buf->order.empty()) {
                return Err<void>("empty instance buffer kept alive");
            }
            if (buf->order.size() != buf->staging.size() || buf->size() > buf->capacity) {
                return Err<void>("instance buffer shadow arrays disagree");
            }
            for (uint32_t slot = 0; slot < buf->size(); ++slot) {
                UiAreaHandle h = buf->order[slot];
                auto it = _residency.find(h);
                if (it == _residency.end() || it->second.key != PoolKey{z, layer} ||
                    it->second.slot != slot) {
                    return Err<void>("slot " + std::to_string(slot) + " of z=" + zLevelName(z) +
                                     " layer=" + std::to_string(layer) +
                                     " does not match residency of area " + std::to_string(h.id));
                }
                if (buf->staging[slot].areaId != h.id) {
                    return Err<void>("staged instance carries the wrong area id");
                }
            }
            total += buf->size();
        }
    }
    if (total != _residency.size()) {
        return Err<void>("residency records areas that are in no buffer");
    }
    return Ok();
}

} // namespace ycomp
