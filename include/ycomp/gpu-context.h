#pragma once

#include <webgpu/webgpu.h>
#include <cstdint>

namespace ycomp {

// Low-level GPU context supplied by the host - pure WebGPU handles.
// The compositor never creates or presents surfaces itself.
struct GPUContext {
    WGPUDevice device = nullptr;
    WGPUQueue queue = nullptr;
    WGPUTextureFormat surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    uint32_t maxTextureDimension2D = 8192;
};

} // namespace ycomp
