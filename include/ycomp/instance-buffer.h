#pragma once

#include <ycomp/gpu-allocator.h>
#include <ycomp/result.hpp>
#include <ycomp/types.h>
#include <webgpu/webgpu.h>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ycomp {

//=============================================================================
// Backend: where instance bytes go. WebGPU in production, a byte array in tests.
//=============================================================================

class InstanceBufferBackend {
public:
    using Ptr = std::shared_ptr<InstanceBufferBackend>;

    // Vertex | CopyDst buffers through the GpuAllocator, written with wgpuQueueWriteBuffer
    static Result<Ptr> createWebGpu(GpuAllocator::Ptr allocator, WGPUQueue queue) noexcept;

    virtual ~InstanceBufferBackend() = default;

    virtual Result<WGPUBuffer> createBuffer(const std::string& label, uint64_t size) = 0;
    virtual void writeBuffer(WGPUBuffer buffer, uint64_t offset, const void* data, uint64_t size) = 0;
    virtual void releaseBuffer(WGPUBuffer buffer) = 0;
};

//=============================================================================
// Instance pools
//=============================================================================

// Which buffer an area lives in: its z level and the atlas layer of its sprite
struct PoolKey {
    ZLevel z = ZLevel::First;
    uint32_t layer = 0;

    bool operator==(const PoolKey& o) const { return z == o.z && layer == o.layer; }
    bool operator!=(const PoolKey& o) const { return !(*this == o); }
};

struct Residency {
    PoolKey key;
    uint32_t slot = 0;
};

struct InstancePlacement {
    PoolKey key;
    AreaInstance instance;
};

// One GPU buffer plus its CPU shadow. order[i] is the area drawn from slot i.
struct InstanceBuffer {
    WGPUBuffer buffer = nullptr;
    uint32_t capacity = 0;
    std::vector<AreaInstance> staging;
    std::vector<UiAreaHandle> order;

    uint32_t size() const { return static_cast<uint32_t>(order.size()); }
};

/**
 * InstanceSynchronizer keeps the per-(z level, atlas layer) instance buffers
 * in step with area changes.
 *
 * Slots are dense: removing an area moves the last occupant into the hole and
 * patches that occupant's recorded slot, so every buffer is drawn with one
 * instanced call over [0, size). Capacity doubles on overflow and a buffer is
 * released once its last occupant leaves.
 *
 * Residency is kept in a flat map keyed by handle; buffers store handles, so
 * patching a moved neighbour is a single map lookup.
 */
class InstanceSynchronizer {
public:
    static constexpr uint32_t DEFAULT_INITIAL_CAPACITY = 16;

    InstanceSynchronizer(InstanceBufferBackend::Ptr backend, uint32_t layerCount,
                         uint32_t initialCapacity = DEFAULT_INITIAL_CAPACITY);
    ~InstanceSynchronizer();

    InstanceSynchronizer(const InstanceSynchronizer&) = delete;
    InstanceSynchronizer& operator=(const InstanceSynchronizer&) = delete;

    // Extends every z pool with an empty slot for a new atlas layer
    void addLayer();
    uint32_t layerCount() const { return _layerCount; }

    // Applies a removal; areas that were never resident are ignored
    Result<void> remove(UiAreaHandle handle);

    // Applies a dirty area. nullopt evicts (disabled or no payload).
    Result<void> update(UiAreaHandle handle, const std::optional<InstancePlacement>& placement);

    // Drops every buffer and all residency
    void clear();

    const InstanceBuffer* buffer(ZLevel z, uint32_t layer) const;
    std::optional<Residency> residency(UiAreaHandle handle) const;
    size_t residentCount() const { return _residency.size(); }

    // Full cross-check of order, staging and residency
    Result<void> validate() const;

private:
    InstanceBuffer* bufferMut(const PoolKey& key);
    Result<void> evict(UiAreaHandle handle);
    Result<void> append(UiAreaHandle handle, const PoolKey& key, const AreaInstance& instance);
    Result<void> reserve(InstanceBuffer& buf, const PoolKey& key, uint32_t needed);
    void writeSlot(InstanceBuffer& buf, uint32_t slot);

    InstanceBufferBackend::Ptr _backend;
    uint32_t _layerCount;
    uint32_t _initialCapacity;
    std::array<std::vector<std::unique_ptr<InstanceBuffer>>, Z_LEVEL_COUNT> _pools;
    std::unordered_map<UiAreaHandle, Residency> _residency;
};

} // namespace ycomp
