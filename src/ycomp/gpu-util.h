#pragma once

#include <ycomp/result.hpp>
#include <ycomp/wgpu-compat.h>
#include <webgpu/webgpu.h>
#include <string>

namespace ycomp::gpu {

// Reads <dir>/<file> into a string
Result<std::string> loadShaderSource(const std::string& dir, const std::string& file);

// Compiles WGSL inside a validation error scope so compile errors surface here
Result<WGPUShaderModule> createShaderModule(WGPUDevice device, const std::string& label,
                                            const std::string& source);

// Push before creating a pipeline, pop after; returns the captured error, if any
void pushValidationScope(WGPUDevice device);
Result<void> popValidationScope(WGPUDevice device, const std::string& what);

// Instanced unit-quad pipeline: slot 0 is the quad corner (float32x2),
// slot 1 the per-instance record described by instanceAttributes.
struct QuadPipelineDesc {
    std::string label;
    WGPUShaderModule module = nullptr;
    WGPUPipelineLayout layout = nullptr;
    const WGPUVertexAttribute* instanceAttributes = nullptr;
    size_t instanceAttributeCount = 0;
    uint64_t instanceStride = 0;
    WGPUTextureFormat targetFormat = WGPUTextureFormat_Undefined;
    bool alphaBlend = false;
};

Result<WGPURenderPipeline> createQuadPipeline(WGPUDevice device, const QuadPipelineDesc& desc);

// Descriptor rounded up to a multiple of 4 bytes, at least 16
WGPUBufferDescriptor bufferDesc(const char* label, uint64_t size, WGPUBufferUsage usage);

} // namespace ycomp::gpu
