#include <ycomp/gpu-allocator.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <vector>

namespace ycomp {

GpuAllocator::GpuAllocator(WGPUDevice device)
    : _device(device) {}

std::string GpuAllocator::labelToString(WGPUStringView label) {
    if (!label.data) return "(unnamed)";
    if (label.length == WGPU_STRLEN) return std::string(label.data);
    return std::string(label.data, label.length);
}

void GpuAllocator::track(const void* handle, Allocation alloc) {
    _totalBytes += alloc.size;
    _peakBytes = std::max(_peakBytes, _totalBytes);
    _allocations.emplace(handle, std::move(alloc));
}

void GpuAllocator::untrack(const void* handle, AllocType type) {
    auto it = _allocations.find(handle);
    if (it == _allocations.end() || it->second.type != type) {
        ywarn("GpuAllocator: release of untracked {}",
              type == AllocType::Buffer ? "buffer" : "texture");
        return;
    }
    _totalBytes -= it->second.size;
    ydebug("GPU [-] {} '{}': {} bytes, total {:.2f} MB",
           type == AllocType::Buffer ? "buffer" : "texture",
           it->second.name, it->second.size, _totalBytes / (1024.0 * 1024.0));
    _allocations.erase(it);
}

WGPUBuffer GpuAllocator::createBuffer(const WGPUBufferDescriptor& desc) {
    std::string name = labelToString(desc.label);

    WGPUBuffer buffer = wgpuDeviceCreateBuffer(_device, &desc);
    if (!buffer) {
        yerror("GpuAllocator: failed to create buffer '{}' ({} bytes)", name, desc.size);
        return nullptr;
    }

    ydebug("GPU [+] buffer '{}': {} bytes, total {:.2f} MB",
           name, desc.size, (_totalBytes + desc.size) / (1024.0 * 1024.0));
    track(buffer, {std::move(name), desc.size, AllocType::Buffer});
    return buffer;
}

void GpuAllocator::releaseBuffer(WGPUBuffer buffer) {
    if (!buffer) return;
    untrack(buffer, AllocType::Buffer);
    wgpuBufferRelease(buffer);
}

WGPUTexture GpuAllocator::createTexture(const WGPUTextureDescriptor& desc) {
    std::string name = labelToString(desc.label);

    WGPUTexture texture = wgpuDeviceCreateTexture(_device, &desc);
    if (!texture) {
        yerror("GpuAllocator: failed to create texture '{}' {}x{}x{}", name,
               desc.size.width, desc.size.height, desc.size.depthOrArrayLayers);
        return nullptr;
    }

    uint64_t size = static_cast<uint64_t>(desc.size.width)
                  * desc.size.height
                  * desc.size.depthOrArrayLayers
                  * bytesPerPixel(desc.format);

    yinfo("GPU [+] texture '{}': {}x{}x{} = {:.2f} MB, total {:.2f} MB",
          name, desc.size.width, desc.size.height, desc.size.depthOrArrayLayers,
          size / (1024.0 * 1024.0), (_totalBytes + size) / (1024.0 * 1024.0));
    track(texture, {std::move(name), size, AllocType::Texture});
    return texture;
}

void GpuAllocator::releaseTexture(WGPUTexture texture) {
    if (!texture) return;
    untrack(texture, AllocType::Texture);
    wgpuTextureRelease(texture);
}

GpuAllocator::Usage GpuAllocator::usage() const {
    Usage u;
    for (const auto& [handle, alloc] : _allocations) {
        (alloc.type == AllocType::Buffer ? u.bufferBytes : u.textureBytes) += alloc.size;
    }
    u.peakBytes = _peakBytes;
    return u;
}

void GpuAllocator::dumpAllocations() const {
    yinfo("=== GPU Allocations ({} resources, {:.2f} MB, peak {:.2f} MB) ===",
          _allocations.size(), _totalBytes / (1024.0 * 1024.0),
          _peakBytes / (1024.0 * 1024.0));

    std::vector<const Allocation*> sorted;
    sorted.reserve(_allocations.size());
    for (const auto& [handle, alloc] : _allocations) sorted.push_back(&alloc);
    std::sort(sorted.begin(), sorted.end(),
              [](const Allocation* a, const Allocation* b) { return a->size > b->size; });

    for (const Allocation* a : sorted) {
        yinfo("  {:>8} {:>10} bytes  {}",
              a->type == AllocType::Buffer ? "buffer" : "texture", a->size, a->name);
    }
}

uint32_t GpuAllocator::bytesPerPixel(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_R8Unorm:
        case WGPUTextureFormat_R8Uint:
            return 1;
        case WGPUTextureFormat_RGBA8Unorm:
        case WGPUTextureFormat_RGBA8UnormSrgb:
        case WGPUTextureFormat_BGRA8Unorm:
        case WGPUTextureFormat_BGRA8UnormSrgb:
        case WGPUTextureFormat_R32Uint:
        case WGPUTextureFormat_R32Float:
            return 4;
        case WGPUTextureFormat_RGBA16Float:
            return 8;
        case WGPUTextureFormat_RGBA32Float:
            return 16;
        default:
            ywarn("GpuAllocator: unknown texture format {}, assuming 4 bpp",
                  static_cast<int>(format));
            return 4;
    }
}

} // namespace ycomp
