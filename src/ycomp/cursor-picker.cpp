#include <ycomp/cursor-picker.h>
#include <ycomp/wgpu-compat.h>
#include "gpu-util.h"
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstring>

namespace ycomp {

PickTexel clampToTarget(float x, float y, uint32_t width, uint32_t height) {
    auto clampAxis = [](float v, uint32_t extent) -> uint32_t {
        if (extent == 0 || !(v > 0.0f)) return 0;  // also catches NaN
        float maxV = static_cast<float>(extent - 1);
        return static_cast<uint32_t>(std::min(std::floor(v), maxV));
    };
    return {clampAxis(x, width), clampAxis(y, height)};
}

namespace {

// Must match CursorUniform in cursor_picking_compute.wgsl
struct CursorUniform {
    uint32_t x;
    uint32_t y;
    uint32_t _pad[2];
};

// State the map callback touches. Owned by the picker, which waits for a
// pending map before it goes away.
struct MapState {
    PickChannel channel;
    std::atomic<bool> pending{false};
    WGPUBuffer staging = nullptr;
};

} // namespace

class CursorPickerImpl : public CursorPicker {
public:
    CursorPickerImpl(const GPUContext& gpu, GpuAllocator::Ptr allocator, CursorPickerConfig config)
        : _gpu(gpu), _allocator(std::move(allocator)), _config(std::move(config)) {}

    ~CursorPickerImpl() override;

    Result<void> init() noexcept;

    Result<void> resize(uint32_t width, uint32_t height) override;
    void setPointer(float x, float y) override { _pointer.set(x, y); }
    WGPUTextureView targetView() const override { return _targetView; }
    void recordReadback(WGPUCommandEncoder encoder) override;
    Result<void> requestReadback() override;
    void poll() override;
    std::optional<UiAreaHandle> hovered() const override { return _hovered; }

private:
    Result<void> createTarget();
    void releaseTarget();
    Result<void> createComputePipeline();
    Result<void> createBindGroup();
    void writeCursorUniform();

    GPUContext _gpu;
    GpuAllocator::Ptr _allocator;
    CursorPickerConfig _config;

    WGPUTexture _target = nullptr;
    WGPUTextureView _targetView = nullptr;

    WGPUBuffer _cursorBuffer = nullptr;
    WGPUBuffer _resultBuffer = nullptr;
    WGPUBindGroupLayout _bindGroupLayout = nullptr;
    WGPUPipelineLayout _pipelineLayout = nullptr;
    WGPUComputePipeline _pipeline = nullptr;
    WGPUBindGroup _bindGroup = nullptr;

    std::shared_ptr<MapState> _map = std::make_shared<MapState>();
    PointerState _pointer;
    bool _recorded = false;
    std::optional<UiAreaHandle> _hovered;
};

CursorPickerImpl::~CursorPickerImpl() {
    // The callback writes into _map; it must have fired before teardown
    while (_map->pending.load()) {
        YCOMP_DEVICE_TICK(_gpu.device);
    }
    if (_bindGroup) wgpuBindGroupRelease(_bindGroup);
    if (_pipeline) wgpuComputePipelineRelease(_pipeline);
    if (_pipelineLayout) wgpuPipelineLayoutRelease(_pipelineLayout);
    if (_bindGroupLayout) wgpuBindGroupLayoutRelease(_bindGroupLayout);
    if (_cursorBuffer) _allocator->releaseBuffer(_cursorBuffer);
    if (_resultBuffer) _allocator->releaseBuffer(_resultBuffer);
    if (_map->staging) _allocator->releaseBuffer(_map->staging);
    releaseTarget();
}

Result<void> CursorPickerImpl::init() noexcept {
    if (!_gpu.device || !_gpu.queue)
        return Err<void>("CursorPicker: GPUContext not initialized");
    if (_config.width == 0 || _config.height == 0)
        return Err<void>("CursorPicker: target size must be nonzero");

    auto cursorDesc = gpu::bufferDesc("ycomp-pick-cursor", sizeof(CursorUniform),
                                      WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst);
    _cursorBuffer = _allocator->createBuffer(cursorDesc);

    auto resultDesc = gpu::bufferDesc("ycomp-pick-result", sizeof(uint32_t),
                                      WGPUBufferUsage_Storage | WGPUBufferUsage_CopySrc);
    _resultBuffer = _allocator->createBuffer(resultDesc);

    // Exactly 4 bytes: the mapped range is the picked id
    WGPUBufferDescriptor stagingDesc = {};
    stagingDesc.label = YCOMP_WGPU_STR("ycomp-pick-staging");
    stagingDesc.size = sizeof(uint32_t);
    stagingDesc.usage = WGPUBufferUsage_MapRead | WGPUBufferUsage_CopyDst;
    _map->staging = _allocator->createBuffer(stagingDesc);

    if (!_cursorBuffer || !_resultBuffer || !_map->staging)
        return Err<void>("CursorPicker: failed to create buffers");

    writeCursorUniform();

    if (auto res = createTarget(); !res) return res;
    if (auto res = createComputePipeline(); !res) return res;
    if (auto res = createBindGroup(); !res) return res;

    yinfo("CursorPicker: {}x{} id target, {} poll", _config.width, _config.height,
          _config.blockingPoll ? "blocking" : "non-blocking");
    return Ok();
}

Result<void> CursorPickerImpl::createTarget() {
    WGPUTextureDescriptor texDesc = {};
    texDesc.label = YCOMP_WGPU_STR("ycomp-pick-target");
    texDesc.size = {_config.width, _config.height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_R32Uint;
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;
    _target = _allocator->createTexture(texDesc);
    if (!_target) return Err<void>("CursorPicker: failed to create id target");

    _targetView = wgpuTextureCreateView(_target, nullptr);
    if (!_targetView) return Err<void>("CursorPicker: failed to create id target view");
    return Ok();
}

void CursorPickerImpl::releaseTarget() {
    if (_targetView) {
        wgpuTextureViewRelease(_targetView);
        _targetView = nullptr;
    }
    if (_target) {
        _allocator->releaseTexture(_target);
        _target = nullptr;
    }
}

Result<void> CursorPickerImpl::createComputePipeline() {
    WGPUDevice device = _gpu.device;

    WGPUBindGroupLayoutEntry entries[3] = {};

    // @binding(0): id target
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Compute;
    entries[0].texture.sampleType = WGPUTextureSampleType_Uint;
    entries[0].texture.viewDimension = WGPUTextureViewDimension_2D;

    // @binding(1): cursor position
    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Compute;
    entries[1].buffer.type = WGPUBufferBindingType_Uniform;
    entries[1].buffer.minBindingSize = sizeof(CursorUniform);

    // @binding(2): picked id
    entries[2].binding = 2;
    entries[2].visibility = WGPUShaderStage_Compute;
    entries[2].buffer.type = WGPUBufferBindingType_Storage;
    entries[2].buffer.minBindingSize = sizeof(uint32_t);

    WGPUBindGroupLayoutDescriptor bglDesc = {};
    bglDesc.label = YCOMP_WGPU_STR("ycomp-pick-compute-layout");
    bglDesc.entryCount = 3;
    bglDesc.entries = entries;
    _bindGroupLayout = wgpuDeviceCreateBindGroupLayout(device, &bglDesc);
    if (!_bindGroupLayout) return Err<void>("CursorPicker: failed to create bind group layout");

    WGPUPipelineLayoutDescriptor plDesc = {};
    plDesc.label = YCOMP_WGPU_STR("ycomp-pick-compute-pipeline-layout");
    plDesc.bindGroupLayoutCount = 1;
    plDesc.bindGroupLayouts = &_bindGroupLayout;
    _pipelineLayout = wgpuDeviceCreatePipelineLayout(device, &plDesc);
    if (!_pipelineLayout) return Err<void>("CursorPicker: failed to create pipeline layout");

    auto sourceRes = gpu::loadShaderSource(_config.shaderDir, "cursor_picking_compute.wgsl");
    if (!sourceRes) return Err<void>("CursorPicker: missing shader", sourceRes);

    auto moduleRes = gpu::createShaderModule(device, "ycomp-pick-compute", *sourceRes);
    if (!moduleRes) return Err<void>("CursorPicker: shader module failed", moduleRes);
    WGPUShaderModule module = *moduleRes;

    WGPUComputePipelineDescriptor cpDesc = {};
    cpDesc.label = YCOMP_WGPU_STR("ycomp-pick-compute");
    cpDesc.layout = _pipelineLayout;
    cpDesc.compute.module = module;
    cpDesc.compute.entryPoint = YCOMP_WGPU_STR("main");

    gpu::pushValidationScope(device);
    _pipeline = wgpuDeviceCreateComputePipeline(device, &cpDesc);
    auto scopeRes = gpu::popValidationScope(device, "compute pipeline creation");
    wgpuShaderModuleRelease(module);
    if (!scopeRes) return Err<void>("CursorPicker: compute pipeline failed", scopeRes);
    if (!_pipeline) return Err<void>("CursorPicker: failed to create compute pipeline");
    return Ok();
}

Result<void> CursorPickerImpl::createBindGroup() {
    if (_bindGroup) {
        wgpuBindGroupRelease(_bindGroup);
        _bindGroup = nullptr;
    }

    WGPUBindGroupEntry bgEntries[3] = {};
    bgEntries[0].binding = 0;
    bgEntries[0].textureView = _targetView;
    bgEntries[1].binding = 1;
    bgEntries[1].buffer = _cursorBuffer;
    bgEntries[1].size = sizeof(CursorUniform);
    bgEntries[2].binding = 2;
    bgEntries[2].buffer = _resultBuffer;
    bgEntries[2].size = sizeof(uint32_t);

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.label = YCOMP_WGPU_STR("ycomp-pick-compute-bind-group");
    bgDesc.layout = _bindGroupLayout;
    bgDesc.entryCount = 3;
    bgDesc.entries = bgEntries;
    _bindGroup = wgpuDeviceCreateBindGroup(_gpu.device, &bgDesc);
    if (!_bindGroup) return Err<void>("CursorPicker: failed to create bind group");
    return Ok();
}

Result<void> CursorPickerImpl::resize(uint32_t width, uint32_t height) {
    if (width == _config.width && height == _config.height) return Ok();

    releaseTarget();
    _config.width = width;
    _config.height = height;
    if (auto res = createTarget(); !res) return res;
    if (auto res = createBindGroup(); !res) return res;

    // Same pointer, new clamp bounds
    _pointer.markChanged();
    ydebug("CursorPicker: id target resized to {}x{}", width, height);
    return Ok();
}

void CursorPickerImpl::writeCursorUniform() {
    PickTexel texel = clampToTarget(_pointer.x(), _pointer.y(), _config.width, _config.height);
    CursorUniform uniform = {texel.x, texel.y, {0, 0}};
    wgpuQueueWriteBuffer(_gpu.queue, _cursorBuffer, 0, &uniform, sizeof(uniform));
}

void CursorPickerImpl::recordReadback(WGPUCommandEncoder encoder) {
    _recorded = false;
    if (_map->pending.load()) {
        // Non-blocking mode: the staging buffer is still mapped or in flight
        return;
    }
    // Nothing to pick before the host reports a pointer position
    if (!_pointer.hasPosition()) return;

    if (_pointer.takeChanged()) writeCursorUniform();

    WGPUComputePassDescriptor passDesc = {};
    passDesc.label = YCOMP_WGPU_STR("ycomp-pick-compute-pass");
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
    wgpuComputePassEncoderSetPipeline(pass, _pipeline);
    wgpuComputePassEncoderSetBindGroup(pass, 0, _bindGroup, 0, nullptr);
    wgpuComputePassEncoderDispatchWorkgroups(pass, 1, 1, 1);
    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);

    wgpuCommandEncoderCopyBufferToBuffer(encoder, _resultBuffer, 0, _map->staging, 0,
                                         sizeof(uint32_t));
    _recorded = true;
}

Result<void> CursorPickerImpl::requestReadback() {
    if (!_recorded) return Ok();
    _recorded = false;

    if (_map->pending.exchange(true)) {
        return Err<void>("CursorPicker: readback requested while a map is pending");
    }

    WGPUBufferMapCallbackInfo mapCb = {};
    mapCb.mode = WGPUCallbackMode_AllowSpontaneous;
    mapCb.callback = [](WGPUMapAsyncStatus status, WGPUStringView message, void* ud1, void*) {
        auto* state = static_cast<MapState*>(ud1);
        if (status == WGPUMapAsyncStatus_Success) {
            const void* data = wgpuBufferGetConstMappedRange(state->staging, 0, sizeof(uint32_t));
            uint32_t id = 0;
            if (data) std::memcpy(&id, data, sizeof(id));
            wgpuBufferUnmap(state->staging);
            state->channel.send(id);
        } else {
            std::string msg = message.data ? std::string(message.data, message.length) : "";
            ywarn("CursorPicker: pick readback map failed ({}): {}",
                  static_cast<int>(status), msg);
        }
        state->pending.store(false);
    };
    mapCb.userdata1 = _map.get();
    wgpuBufferMapAsync(_map->staging, WGPUMapMode_Read, 0, sizeof(uint32_t), mapCb);
    return Ok();
}

void CursorPickerImpl::poll() {
    if (_config.blockingPoll) {
        while (_map->pending.load()) {
            YCOMP_DEVICE_TICK(_gpu.device);
        }
    } else {
        YCOMP_DEVICE_TICK(_gpu.device);
    }

    if (auto latest = _map->channel.drainLatest()) {
        if (*latest == 0) {
            _hovered.reset();
        } else {
            _hovered = UiAreaHandle{*latest};
        }
    }
}

Result<CursorPicker::Ptr> CursorPicker::create(const GPUContext& gpu, GpuAllocator::Ptr allocator,
                                               CursorPickerConfig config) noexcept {
    if (!allocator) return Err<Ptr>("CursorPicker: allocator is required");
    auto impl = std::make_shared<CursorPickerImpl>(gpu, std::move(allocator), std::move(config));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to init CursorPicker", res);
    }
    return Ok(std::move(impl));
}

} // namespace ycomp
