#include "atlas-texture.h"
#include "gpu-util.h"
#include <ycomp/wgpu-compat.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>

namespace ycomp {

Result<AtlasTexture::Ptr> AtlasTexture::create(const GPUContext& gpu, GpuAllocator::Ptr allocator,
                                               const SpriteAtlas& atlas) noexcept {
    if (!gpu.device || !gpu.queue) return Err<Ptr>("AtlasTexture: GPUContext not initialized");
    if (!allocator) return Err<Ptr>("AtlasTexture: allocator is required");

    auto tex = Ptr(new AtlasTexture(gpu, std::move(allocator)));

    AtlasChange initial;
    initial.textureResized = true;
    if (auto res = tex->refresh(atlas, initial); !res) {
        return Err<Ptr>("Failed to upload sprite atlas", res);
    }
    return Ok(std::move(tex));
}

AtlasTexture::AtlasTexture(const GPUContext& gpu, GpuAllocator::Ptr allocator)
    : _gpu(gpu), _allocator(std::move(allocator)) {}

AtlasTexture::~AtlasTexture() {
    releaseTexture();
    if (_offsets.buffer) _allocator->releaseBuffer(_offsets.buffer);
    if (_allocations.buffer) _allocator->releaseBuffer(_allocations.buffer);
}

Result<void> AtlasTexture::createTexture(uint32_t edge, uint32_t layers) {
    WGPUTextureDescriptor texDesc = {};
    texDesc.label = YCOMP_WGPU_STR("ycomp-sprite-atlas");
    texDesc.size = {edge, edge, layers};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_RGBA8Unorm;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
    _texture = _allocator->createTexture(texDesc);
    if (!_texture) return Err<void>("AtlasTexture: failed to create texture array");

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = WGPUTextureFormat_RGBA8Unorm;
    viewDesc.dimension = WGPUTextureViewDimension_2DArray;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = layers;
    viewDesc.aspect = WGPUTextureAspect_All;
    _view = wgpuTextureCreateView(_texture, &viewDesc);
    if (!_view) return Err<void>("AtlasTexture: failed to create texture view");

    _edge = edge;
    _layers = layers;
    _bindingsChanged = true;
    return Ok();
}

void AtlasTexture::releaseTexture() {
    if (_view) {
        wgpuTextureViewRelease(_view);
        _view = nullptr;
    }
    if (_texture) {
        _allocator->releaseTexture(_texture);
        _texture = nullptr;
    }
}

void AtlasTexture::uploadLayer(const SpriteAtlas& atlas, uint32_t layer) {
    uint32_t frames = 0;
    atlas.forEachFrameOnLayer(layer, [&](const Image& img, const AtlasRect& rect) {
        WGPUTexelCopyTextureInfo dst = {};
        dst.texture = _texture;
        dst.mipLevel = 0;
        dst.origin = {rect.x, rect.y, layer};
        dst.aspect = WGPUTextureAspect_All;

        WGPUTexelCopyBufferLayout layout = {};
        layout.offset = 0;
        layout.bytesPerRow = img.rowBytes();
        layout.rowsPerImage = img.height;

        WGPUExtent3D extent = {img.width, img.height, 1};
        wgpuQueueWriteTexture(_gpu.queue, &dst, img.pixels.data(), img.pixels.size(),
                              &layout, &extent);
        ++frames;
    });
    ydebug("AtlasTexture: uploaded layer {} ({} frames)", layer, frames);
}

Result<void> AtlasTexture::writeTable(TableBuffer& table, const char* label, const void* data,
                                      uint64_t bytes, uint64_t minBytes) {
    uint64_t needed = std::max(bytes, minBytes);
    if (needed > table.capacity) {
        uint64_t capacity = std::max<uint64_t>(table.capacity, minBytes);
        while (capacity < needed) capacity *= 2;

        auto desc = gpu::bufferDesc(label, capacity,
                                    WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst);
        WGPUBuffer buffer = _allocator->createBuffer(desc);
        if (!buffer) return Err<void>(std::string("AtlasTexture: failed to create ") + label);
        if (table.buffer) _allocator->releaseBuffer(table.buffer);
        table.buffer = buffer;
        table.capacity = desc.size;
        _bindingsChanged = true;
    }
    if (bytes > 0) {
        wgpuQueueWriteBuffer(_gpu.queue, table.buffer, 0, data, bytes);
    }
    if (table.size != needed) _bindingsChanged = true;
    table.size = needed;
    return Ok();
}

Result<void> AtlasTexture::writeTables(const SpriteAtlas& atlas) {
    auto offsets = atlas.offsetTable();
    auto allocations = atlas.allocationTable();

    // A runtime-sized storage array binds at least one element
    if (auto res = writeTable(_offsets, "ycomp-sprite-offsets", offsets.data(),
                              offsets.size() * sizeof(SpriteRange), 2 * sizeof(SpriteRange));
        !res) {
        return res;
    }
    return writeTable(_allocations, "ycomp-sprite-allocations", allocations.data(),
                      allocations.size() * sizeof(AtlasAllocation), sizeof(AtlasAllocation));
}

Result<void> AtlasTexture::refresh(const SpriteAtlas& atlas, const AtlasChange& change) {
    const uint32_t edge = std::max(atlas.textureSize(), 1u);
    const uint32_t layers = std::max(atlas.layerCount(), 1u);

    if (change.textureResized || !_texture || edge != _edge || layers != _layers) {
        releaseTexture();
        if (auto res = createTexture(edge, layers); !res) return res;
        for (uint32_t l = 0; l < atlas.layerCount(); ++l) {
            uploadLayer(atlas, l);
        }
        yinfo("AtlasTexture: {}x{} with {} layer(s)", edge, edge, layers);
    } else {
        for (uint32_t l : change.dirtyLayers) {
            uploadLayer(atlas, l);
        }
    }
    return writeTables(atlas);
}

} // namespace ycomp
