#include "gpu-util.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace ycomp::gpu {

Result<std::string> loadShaderSource(const std::string& dir, const std::string& file) {
    std::string path = dir + "/" + file;
    std::ifstream in(path);
    if (!in.is_open()) {
        return Err<std::string>("Failed to open shader file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string source = ss.str();
    if (source.empty()) {
        return Err<std::string>("Shader file is empty: " + path);
    }
    ydebug("Loaded shader {} ({} bytes)", path, source.size());
    return Ok(std::move(source));
}

void pushValidationScope(WGPUDevice device) {
    wgpuDevicePushErrorScope(device, WGPUErrorFilter_Validation);
}

Result<void> popValidationScope(WGPUDevice device, const std::string& what) {
    bool hadError = false;
    std::string errorMsg;
    WGPUPopErrorScopeCallbackInfo popInfo = {};
    popInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    popInfo.callback = [](WGPUPopErrorScopeStatus, WGPUErrorType type,
                          WGPUStringView message, void* ud1, void* ud2) {
        if (type != WGPUErrorType_NoError) {
            *static_cast<bool*>(ud1) = true;
            auto* msg = static_cast<std::string*>(ud2);
            if (message.data && message.length > 0)
                *msg = std::string(message.data, message.length);
            else
                *msg = "Unknown validation error";
        }
    };
    popInfo.userdata1 = &hadError;
    popInfo.userdata2 = &errorMsg;
    wgpuDevicePopErrorScope(device, popInfo);
    YCOMP_DEVICE_TICK(device);  // flush callback so the error is detected

    if (hadError) {
        yerror("{}: {}", what, errorMsg);
        return Err<void>(what + ": " + errorMsg);
    }
    return Ok();
}

Result<WGPUShaderModule> createShaderModule(WGPUDevice device, const std::string& label,
                                            const std::string& source) {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = gpu::stringView(source);

    WGPUShaderModuleDescriptor smDesc = {};
    smDesc.label = gpu::stringView(label);
    smDesc.nextInChain = &wgslDesc.chain;

    pushValidationScope(device);
    WGPUShaderModule module = wgpuDeviceCreateShaderModule(device, &smDesc);
    if (auto res = popValidationScope(device, "shader compilation of " + label); !res) {
        if (module) wgpuShaderModuleRelease(module);
        return Err<WGPUShaderModule>("Shader compilation failed", res);
    }
    if (!module) {
        return Err<WGPUShaderModule>("Failed to create shader module " + label);
    }
    return Ok(module);
}

Result<WGPURenderPipeline> createQuadPipeline(WGPUDevice device, const QuadPipelineDesc& desc) {
    WGPUVertexAttribute quadAttr = {};
    quadAttr.format = WGPUVertexFormat_Float32x2;
    quadAttr.offset = 0;
    quadAttr.shaderLocation = 0;

    WGPUVertexBufferLayout buffers[2] = {};
    buffers[0].arrayStride = 2 * sizeof(float);
    buffers[0].stepMode = WGPUVertexStepMode_Vertex;
    buffers[0].attributeCount = 1;
    buffers[0].attributes = &quadAttr;

    buffers[1].arrayStride = desc.instanceStride;
    buffers[1].stepMode = WGPUVertexStepMode_Instance;
    buffers[1].attributeCount = desc.instanceAttributeCount;
    buffers[1].attributes = desc.instanceAttributes;

    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = desc.targetFormat;
    colorTarget.blend = desc.alphaBlend ? &blendState : nullptr;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = desc.module;
    fragmentState.entryPoint = YCOMP_WGPU_STR("fs_main");
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor rpDesc = {};
    rpDesc.label = YCOMP_WGPU_STR(desc.label.c_str());
    rpDesc.layout = desc.layout;
    rpDesc.vertex.module = desc.module;
    rpDesc.vertex.entryPoint = YCOMP_WGPU_STR("vs_main");
    rpDesc.vertex.bufferCount = 2;
    rpDesc.vertex.buffers = buffers;
    rpDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    rpDesc.primitive.frontFace = WGPUFrontFace_CCW;
    rpDesc.primitive.cullMode = WGPUCullMode_None;
    rpDesc.fragment = &fragmentState;
    rpDesc.multisample.count = 1;
    rpDesc.multisample.mask = ~0u;

    pushValidationScope(device);
    WGPURenderPipeline pipeline = wgpuDeviceCreateRenderPipeline(device, &rpDesc);
    if (auto res = popValidationScope(device, "pipeline creation of " + desc.label); !res) {
        if (pipeline) wgpuRenderPipelineRelease(pipeline);
        return Err<WGPURenderPipeline>("Render pipeline creation failed", res);
    }
    if (!pipeline) {
        return Err<WGPURenderPipeline>("Failed to create render pipeline " + desc.label);
    }
    return Ok(pipeline);
}

WGPUBufferDescriptor bufferDesc(const char* label, uint64_t size, WGPUBufferUsage usage) {
    WGPUBufferDescriptor desc = {};
    desc.label = YCOMP_WGPU_STR(label);
    // WebGPU requires sizes to be a multiple of 4
    desc.size = std::max<uint64_t>((size + 3) & ~uint64_t(3), 16);
    desc.usage = usage;
    desc.mappedAtCreation = false;
    return desc;
}

} // namespace ycomp::gpu
