#pragma once

#include <ycomp/wgpu-compat.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace ycomp {

// Tracks every buffer and texture the compositor creates so growth
// (atlas doubling, instance buffer doubling) shows up in the log.
class GpuAllocator {
public:
    using Ptr = std::shared_ptr<GpuAllocator>;

    explicit GpuAllocator(WGPUDevice device);
    ~GpuAllocator() = default;

    GpuAllocator(const GpuAllocator&) = delete;
    GpuAllocator& operator=(const GpuAllocator&) = delete;

    // Name taken from desc.label
    WGPUBuffer createBuffer(const WGPUBufferDescriptor& desc);
    void releaseBuffer(WGPUBuffer buffer);

    WGPUTexture createTexture(const WGPUTextureDescriptor& desc);
    void releaseTexture(WGPUTexture texture);

    // Live bytes split by kind; atlas growth shows up in textureBytes,
    // instance and table doubling in bufferBytes
    struct Usage {
        uint64_t bufferBytes = 0;
        uint64_t textureBytes = 0;
        uint64_t peakBytes = 0;
    };
    Usage usage() const;

    // Log all live allocations, largest first
    void dumpAllocations() const;

    static uint32_t bytesPerPixel(WGPUTextureFormat format);

private:
    enum class AllocType { Buffer, Texture };

    struct Allocation {
        std::string name;
        uint64_t size;
        AllocType type;
    };

    void track(const void* handle, Allocation alloc);
    void untrack(const void* handle, AllocType type);

    static std::string labelToString(WGPUStringView label);

    WGPUDevice _device;
    std::unordered_map<const void*, Allocation> _allocations;
    uint64_t _totalBytes = 0;
    uint64_t _peakBytes = 0;
};

} // namespace ycomp
