#pragma once

#include <ycomp/gpu-allocator.h>
#include <ycomp/gpu-context.h>
#include <ycomp/result.hpp>
#include <ycomp/sprite-atlas.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>

namespace ycomp {

/**
 * GPU mirror of a SpriteAtlas: an RGBA8 2D-array texture (one slice per
 * layer, edge = largest layer) plus the offset and allocation tables as
 * storage buffers.
 *
 * The texture is recreated when the array edge or layer count changes;
 * otherwise only the layers an AtlasChange marks dirty are re-uploaded.
 * Table buffers are rewritten on every refresh and grow when needed.
 */
class AtlasTexture {
public:
    using Ptr = std::unique_ptr<AtlasTexture>;

    static Result<Ptr> create(const GPUContext& gpu, GpuAllocator::Ptr allocator,
                              const SpriteAtlas& atlas) noexcept;

    ~AtlasTexture();

    AtlasTexture(const AtlasTexture&) = delete;
    AtlasTexture& operator=(const AtlasTexture&) = delete;

    Result<void> refresh(const SpriteAtlas& atlas, const AtlasChange& change);

    WGPUTextureView view() const { return _view; }
    WGPUBuffer offsetsBuffer() const { return _offsets.buffer; }
    uint64_t offsetsSize() const { return _offsets.size; }
    WGPUBuffer allocationsBuffer() const { return _allocations.buffer; }
    uint64_t allocationsSize() const { return _allocations.size; }

    // True once after the view or a table buffer was replaced; bind groups
    // referencing them must be recreated
    bool takeBindingsChanged() {
        bool c = _bindingsChanged;
        _bindingsChanged = false;
        return c;
    }

    uint32_t edge() const { return _edge; }
    uint32_t layers() const { return _layers; }

private:
    AtlasTexture(const GPUContext& gpu, GpuAllocator::Ptr allocator);

    struct TableBuffer {
        WGPUBuffer buffer = nullptr;
        uint64_t capacity = 0;
        uint64_t size = 0;
    };

    Result<void> createTexture(uint32_t edge, uint32_t layers);
    void releaseTexture();
    void uploadLayer(const SpriteAtlas& atlas, uint32_t layer);
    Result<void> writeTable(TableBuffer& table, const char* label, const void* data,
                            uint64_t bytes, uint64_t minBytes);
    Result<void> writeTables(const SpriteAtlas& atlas);

    GPUContext _gpu;
    GpuAllocator::Ptr _allocator;

    WGPUTexture _texture = nullptr;
    WGPUTextureView _view = nullptr;
    uint32_t _edge = 0;
    uint32_t _layers = 0;

    TableBuffer _offsets;
    TableBuffer _allocations;
    bool _bindingsChanged = true;
};

} // namespace ycomp
