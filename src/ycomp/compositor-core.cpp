#include <ycomp/compositor-core.h>
#include <ycomp/cursor-picker.h>
#include <ycomp/gpu-allocator.h>
#include <ycomp/wgpu-compat.h>
#include "atlas-texture.h"
#include "gpu-util.h"
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>

#ifndef CMAKE_SOURCE_DIR
#define CMAKE_SOURCE_DIR "."
#endif

namespace ycomp {

// GPU uniform buffer layout - must match FrameUniforms in every shader
struct FrameUniforms {
    float windowWidth;
    float windowHeight;
    uint32_t currentFrame;
    float alphaThreshold;
};
static_assert(sizeof(FrameUniforms) == 16, "FrameUniforms must match the WGSL layout");

//=============================================================================
// CompositorSettings
//=============================================================================

Result<CompositorSettings> CompositorSettings::fromConfig(const Config* config,
                                                          const GPUContext& gpu) {
    CompositorSettings s;
    const uint32_t deviceMax = gpu.maxTextureDimension2D;
    if (deviceMax == 0) {
        return Err<CompositorSettings>("GPUContext reports a zero max texture dimension");
    }
    s.atlas.maxSize = deviceMax;
    s.shaderDir = CMAKE_SOURCE_DIR "/src/ycomp/shaders";

    if (!config) return Ok(std::move(s));

    s.atlas.initialSize = config->get<uint32_t>(Config::KEY_ATLAS_INITIAL_SIZE, s.atlas.initialSize);
    s.atlas.padding = config->get<uint32_t>(Config::KEY_ATLAS_PADDING, s.atlas.padding);
    if (auto maxSize = config->get<uint32_t>(Config::KEY_ATLAS_MAX_SIZE)) {
        if (*maxSize == 0) {
            return Err<CompositorSettings>(std::string(Config::KEY_ATLAS_MAX_SIZE) + " must be nonzero");
        }
        s.atlas.maxSize = std::min(*maxSize, deviceMax);
    }
    s.initialInstanceCapacity =
        config->get<uint32_t>(Config::KEY_INSTANCES_INITIAL_CAPACITY, s.initialInstanceCapacity);
    s.glyphTexelBudget = config->get<uint64_t>(Config::KEY_TEXT_ATLAS_TEXEL_BUDGET, s.glyphTexelBudget);
    s.alphaThreshold = config->get<float>(Config::KEY_PICKING_ALPHA_THRESHOLD, s.alphaThreshold);
    s.blockingPoll = config->get<bool>(Config::KEY_PICKING_BLOCKING_POLL, s.blockingPoll);
    s.shaderDir = config->get<std::string>(Config::KEY_SHADERS_DIR, s.shaderDir);

    if (s.initialInstanceCapacity == 0) {
        return Err<CompositorSettings>(std::string(Config::KEY_INSTANCES_INITIAL_CAPACITY) +
                                       " must be nonzero");
    }
    if (s.glyphTexelBudget == 0) {
        return Err<CompositorSettings>(std::string(Config::KEY_TEXT_ATLAS_TEXEL_BUDGET) +
                                       " must be nonzero");
    }
    return Ok(std::move(s));
}

//=============================================================================
// CompositorCoreImpl
//=============================================================================

class CompositorCoreImpl : public CompositorCore {
public:
    CompositorCoreImpl(const GPUContext& gpu, uint32_t width, uint32_t height,
                       CompositorSettings settings)
        : _gpu(gpu), _width(width), _height(height), _settings(std::move(settings)) {}

    ~CompositorCoreImpl() override;

    Result<void> init(std::vector<SpriteFrames> sprites,
                      std::vector<font::RasterFont::Ptr> fonts) noexcept;

    void pollPicks() override { _picker->poll(); }
    Result<void> applyRemovals(const std::vector<UiAreaHandle>& handles) override;
    Result<void> syncArea(UiAreaHandle handle, const AreaDesc& desc) override;
    Result<void> rebuildText(std::vector<TextArea> areas) override;
    bool hasText() const override { return _text != nullptr; }
    Result<std::vector<WGPUCommandBuffer>> record(WGPUTextureView target) override;
    Result<void> postRender() override { return _picker->requestReadback(); }

    Result<uint32_t> addSprite(SpriteFrames frames) override;

    Result<void> resize(uint32_t width, uint32_t height) override;
    void setPointer(float x, float y) override { _picker->setPointer(x, y); }
    std::optional<UiAreaHandle> hovered() const override { return _picker->hovered(); }

    void setAnimationFrame(uint32_t frame) override { _frame = frame; }
    uint32_t animationFrame() const override { return _frame; }

    void setClearColor(std::optional<WGPUColor> color) override { _clearColor = color; }

    Result<void> dumpAtlasesSvg(const std::string& directory) const override;

    const SpriteAtlas& spriteAtlas() const override { return *_atlas; }
    const InstanceSynchronizer& instances() const override { return *_sync; }
    uint32_t fontCount() const override { return _fontCount; }

private:
    Result<void> createSharedBuffers();
    Result<void> createSpritePipelines();
    Result<void> updateSpriteBindGroup();
    void writeUniforms();
    void drawSprites(WGPURenderPassEncoder pass, ZLevel z, WGPURenderPipeline pipeline);
    void drawScene(WGPURenderPassEncoder pass, bool picking);

    GPUContext _gpu;
    uint32_t _width;
    uint32_t _height;
    CompositorSettings _settings;
    uint32_t _frame = 0;
    uint32_t _fontCount = 0;
    std::optional<WGPUColor> _clearColor = WGPUColor{0.0, 0.0, 0.0, 1.0};

    GpuAllocator::Ptr _allocator;
    InstanceBufferBackend::Ptr _backend;
    SpriteAtlas::Ptr _atlas;
    AtlasTexture::Ptr _atlasTexture;
    std::unique_ptr<InstanceSynchronizer> _sync;
    TextRenderer::Ptr _text;
    CursorPicker::Ptr _picker;

    WGPUBuffer _uniformBuffer = nullptr;
    WGPUBuffer _quadVertices = nullptr;
    WGPUBuffer _quadIndices = nullptr;
    WGPUSampler _spriteSampler = nullptr;
    WGPUBindGroupLayout _spriteBindGroupLayout = nullptr;
    WGPUPipelineLayout _spritePipelineLayout = nullptr;
    WGPUBindGroup _spriteBindGroup = nullptr;
    WGPURenderPipeline _spritePipeline = nullptr;
    WGPURenderPipeline _spritePickingPipeline = nullptr;
};

CompositorCoreImpl::~CompositorCoreImpl() {
    // Objects holding buffers from the allocator go first
    _picker.reset();
    _text.reset();
    _sync.reset();
    _atlasTexture.reset();

    if (_spriteBindGroup) wgpuBindGroupRelease(_spriteBindGroup);
    if (_spritePipeline) wgpuRenderPipelineRelease(_spritePipeline);
    if (_spritePickingPipeline) wgpuRenderPipelineRelease(_spritePickingPipeline);
    if (_spritePipelineLayout) wgpuPipelineLayoutRelease(_spritePipelineLayout);
    if (_spriteBindGroupLayout) wgpuBindGroupLayoutRelease(_spriteBindGroupLayout);
    if (_spriteSampler) wgpuSamplerRelease(_spriteSampler);
    if (_allocator) {
        if (_uniformBuffer) _allocator->releaseBuffer(_uniformBuffer);
        if (_quadVertices) _allocator->releaseBuffer(_quadVertices);
        if (_quadIndices) _allocator->releaseBuffer(_quadIndices);
    }
}

Result<void> CompositorCoreImpl::init(std::vector<SpriteFrames> sprites,
                                      std::vector<font::RasterFont::Ptr> fonts) noexcept {
    if (!_gpu.device || !_gpu.queue) {
        return Err<void>("CompositorCore: GPUContext not initialized");
    }
    if (_width == 0 || _height == 0) {
        return Err<void>("CompositorCore: window size must be nonzero");
    }

    _allocator = std::make_shared<GpuAllocator>(_gpu.device);

    auto atlasRes = SpriteAtlas::create(_settings.atlas, std::move(sprites));
    if (!atlasRes) return Err<void>("CompositorCore: sprite atlas", atlasRes);
    _atlas = *atlasRes;

    auto texRes = AtlasTexture::create(_gpu, _allocator, *_atlas);
    if (!texRes) return Err<void>("CompositorCore: atlas texture", texRes);
    _atlasTexture = std::move(*texRes);

    auto backendRes = InstanceBufferBackend::createWebGpu(_allocator, _gpu.queue);
    if (!backendRes) return Err<void>("CompositorCore: instance backend", backendRes);
    _backend = *backendRes;
    _sync = std::make_unique<InstanceSynchronizer>(_backend, _atlas->layerCount(),
                                                   _settings.initialInstanceCapacity);

    if (auto res = createSharedBuffers(); !res) return res;
    if (auto res = createSpritePipelines(); !res) return res;
    if (auto res = updateSpriteBindGroup(); !res) return res;

    _fontCount = static_cast<uint32_t>(fonts.size());
    if (!fonts.empty()) {
        TextRendererResources resources;
        resources.frameUniforms = _uniformBuffer;
        resources.frameUniformsSize = sizeof(FrameUniforms);
        resources.quadVertices = _quadVertices;
        resources.quadIndices = _quadIndices;
        resources.shaderDir = _settings.shaderDir;

        GlyphAtlas::Config glyphConfig;
        glyphConfig.texelBudget = _settings.glyphTexelBudget;
        glyphConfig.maxTextureDimension = _gpu.maxTextureDimension2D;

        auto textRes = TextRenderer::create(_gpu, _allocator, _backend, std::move(resources),
                                            glyphConfig, std::move(fonts));
        if (!textRes) return Err<void>("CompositorCore: text renderer", textRes);
        _text = *textRes;
    }

    CursorPickerConfig pickerConfig;
    pickerConfig.width = _width;
    pickerConfig.height = _height;
    pickerConfig.blockingPoll = _settings.blockingPoll;
    pickerConfig.shaderDir = _settings.shaderDir;
    auto pickerRes = CursorPicker::create(_gpu, _allocator, pickerConfig);
    if (!pickerRes) return Err<void>("CompositorCore: cursor picker", pickerRes);
    _picker = *pickerRes;

    writeUniforms();

    yinfo("CompositorCore: {}x{}, {} sprites in {} atlas layer(s), {} font(s)",
          _width, _height, _atlas->spriteCount(), _atlas->layerCount(), _fontCount);
    _allocator->dumpAllocations();
    return Ok();
}

Result<void> CompositorCoreImpl::createSharedBuffers() {
    auto ubDesc = gpu::bufferDesc("ycomp-frame-uniforms", sizeof(FrameUniforms),
                                  WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst);
    _uniformBuffer = _allocator->createBuffer(ubDesc);
    if (!_uniformBuffer) return Err<void>("CompositorCore: failed to create uniform buffer");

    // Unit quad, expanded to the instance rectangle in the vertex shader
    const float corners[8] = {0.0f, 0.0f, 1.0f, 0.0f, 1.0f, 1.0f, 0.0f, 1.0f};
    auto vbDesc = gpu::bufferDesc("ycomp-quad-vertices", sizeof(corners),
                                  WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst);
    _quadVertices = _allocator->createBuffer(vbDesc);
    if (!_quadVertices) return Err<void>("CompositorCore: failed to create quad vertex buffer");
    wgpuQueueWriteBuffer(_gpu.queue, _quadVertices, 0, corners, sizeof(corners));

    const uint16_t indices[6] = {0, 1, 2, 0, 2, 3};
    auto ibDesc = gpu::bufferDesc("ycomp-quad-indices", sizeof(indices),
                                  WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst);
    _quadIndices = _allocator->createBuffer(ibDesc);
    if (!_quadIndices) return Err<void>("CompositorCore: failed to create quad index buffer");
    wgpuQueueWriteBuffer(_gpu.queue, _quadIndices, 0, indices, sizeof(indices));
    return Ok();
}

Result<void> CompositorCoreImpl::createSpritePipelines() {
    WGPUDevice device = _gpu.device;

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Nearest;
    samplerDesc.minFilter = WGPUFilterMode_Nearest;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 1.0f;
    samplerDesc.maxAnisotropy = 1;
    _spriteSampler = wgpuDeviceCreateSampler(device, &samplerDesc);
    if (!_spriteSampler) return Err<void>("CompositorCore: failed to create sprite sampler");

    WGPUBindGroupLayoutEntry entries[5] = {};

    // @binding(0): frame uniforms
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    entries[0].buffer.type = WGPUBufferBindingType_Uniform;
    entries[0].buffer.minBindingSize = sizeof(FrameUniforms);

    // @binding(1): sprite atlas array
    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Fragment;
    entries[1].texture.sampleType = WGPUTextureSampleType_Float;
    entries[1].texture.viewDimension = WGPUTextureViewDimension_2DArray;

    // @binding(2): nearest sampler
    entries[2].binding = 2;
    entries[2].visibility = WGPUShaderStage_Fragment;
    entries[2].sampler.type = WGPUSamplerBindingType_Filtering;

    // @binding(3): sprite offsets
    entries[3].binding = 3;
    entries[3].visibility = WGPUShaderStage_Vertex;
    entries[3].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;

    // @binding(4): frame allocations
    entries[4].binding = 4;
    entries[4].visibility = WGPUShaderStage_Vertex;
    entries[4].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;

    WGPUBindGroupLayoutDescriptor bglDesc = {};
    bglDesc.label = YCOMP_WGPU_STR("ycomp-sprite-bind-group-layout");
    bglDesc.entryCount = 5;
    bglDesc.entries = entries;
    _spriteBindGroupLayout = wgpuDeviceCreateBindGroupLayout(device, &bglDesc);
    if (!_spriteBindGroupLayout) return Err<void>("CompositorCore: failed to create bind group layout");

    WGPUPipelineLayoutDescriptor plDesc = {};
    plDesc.label = YCOMP_WGPU_STR("ycomp-sprite-pipeline-layout");
    plDesc.bindGroupLayoutCount = 1;
    plDesc.bindGroupLayouts = &_spriteBindGroupLayout;
    _spritePipelineLayout = wgpuDeviceCreatePipelineLayout(device, &plDesc);
    if (!_spritePipelineLayout) return Err<void>("CompositorCore: failed to create pipeline layout");

    WGPUVertexAttribute areaAttrs[3] = {};
    areaAttrs[0].format = WGPUVertexFormat_Float32x4;
    areaAttrs[0].offset = offsetof(AreaInstance, xMin);
    areaAttrs[0].shaderLocation = 1;
    areaAttrs[1].format = WGPUVertexFormat_Uint32;
    areaAttrs[1].offset = offsetof(AreaInstance, spriteIndex);
    areaAttrs[1].shaderLocation = 2;
    areaAttrs[2].format = WGPUVertexFormat_Uint32;
    areaAttrs[2].offset = offsetof(AreaInstance, areaId);
    areaAttrs[2].shaderLocation = 3;

    struct Variant {
        const char* label;
        const char* file;
        WGPUTextureFormat format;
        bool blend;
        WGPURenderPipeline* out;
    };
    const Variant variants[2] = {
        {"ycomp-sprites", "render.wgsl", _gpu.surfaceFormat, true, &_spritePipeline},
        {"ycomp-sprites-picking", "cursor_picking_render.wgsl", WGPUTextureFormat_R32Uint, false,
         &_spritePickingPipeline},
    };

    for (const auto& v : variants) {
        auto sourceRes = gpu::loadShaderSource(_settings.shaderDir, v.file);
        if (!sourceRes) return Err<void>("CompositorCore: missing shader", sourceRes);

        auto moduleRes = gpu::createShaderModule(device, v.label, *sourceRes);
        if (!moduleRes) return Err<void>("CompositorCore: shader module failed", moduleRes);
        WGPUShaderModule module = *moduleRes;

        gpu::QuadPipelineDesc desc;
        desc.label = v.label;
        desc.module = module;
        desc.layout = _spritePipelineLayout;
        desc.instanceAttributes = areaAttrs;
        desc.instanceAttributeCount = 3;
        desc.instanceStride = sizeof(AreaInstance);
        desc.targetFormat = v.format;
        desc.alphaBlend = v.blend;
        auto pipelineRes = gpu::createQuadPipeline(device, desc);
        wgpuShaderModuleRelease(module);
        if (!pipelineRes) return Err<void>("CompositorCore: pipeline failed", pipelineRes);
        *v.out = *pipelineRes;
    }
    yinfo("CompositorCore: sprite pipelines created from {}", _settings.shaderDir);
    return Ok();
}

Result<void> CompositorCoreImpl::updateSpriteBindGroup() {
    if (!_atlasTexture->takeBindingsChanged() && _spriteBindGroup) return Ok();

    if (_spriteBindGroup) {
        wgpuBindGroupRelease(_spriteBindGroup);
        _spriteBindGroup = nullptr;
    }

    WGPUBindGroupEntry bgEntries[5] = {};
    bgEntries[0].binding = 0;
    bgEntries[0].buffer = _uniformBuffer;
    bgEntries[0].size = sizeof(FrameUniforms);
    bgEntries[1].binding = 1;
    bgEntries[1].textureView = _atlasTexture->view();
    bgEntries[2].binding = 2;
    bgEntries[2].sampler = _spriteSampler;
    bgEntries[3].binding = 3;
    bgEntries[3].buffer = _atlasTexture->offsetsBuffer();
    bgEntries[3].size = _atlasTexture->offsetsSize();
    bgEntries[4].binding = 4;
    bgEntries[4].buffer = _atlasTexture->allocationsBuffer();
    bgEntries[4].size = _atlasTexture->allocationsSize();

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.label = YCOMP_WGPU_STR("ycomp-sprite-bind-group");
    bgDesc.layout = _spriteBindGroupLayout;
    bgDesc.entryCount = 5;
    bgDesc.entries = bgEntries;
    _spriteBindGroup = wgpuDeviceCreateBindGroup(_gpu.device, &bgDesc);
    if (!_spriteBindGroup) return Err<void>("CompositorCore: failed to create sprite bind group");
    return Ok();
}

void CompositorCoreImpl::writeUniforms() {
    FrameUniforms uniforms = {};
    uniforms.windowWidth = static_cast<float>(_width);
    uniforms.windowHeight = static_cast<float>(_height);
    uniforms.currentFrame = _frame;
    uniforms.alphaThreshold = _settings.alphaThreshold;
    wgpuQueueWriteBuffer(_gpu.queue, _uniformBuffer, 0, &uniforms, sizeof(uniforms));
}

//-----------------------------------------------------------------------------
// Synchronization
//-----------------------------------------------------------------------------

Result<void> CompositorCoreImpl::applyRemovals(const std::vector<UiAreaHandle>& handles) {
    for (const auto& handle : handles) {
        if (auto res = _sync->remove(handle); !res) {
            return Err<void>("CompositorCore: removal of area " + std::to_string(handle.id), res);
        }
    }
    return Ok();
}

Result<void> CompositorCoreImpl::syncArea(UiAreaHandle handle, const AreaDesc& desc) {
    if (!desc.enabled || !desc.hasPayload()) {
        return _sync->update(handle, std::nullopt);
    }

    if (desc.spriteKey && *desc.spriteKey >= _atlas->spriteCount()) {
        return Err<void>("area " + std::to_string(handle.id) + " references sprite key " +
                         std::to_string(*desc.spriteKey) + " which is not registered");
    }
    if (desc.text && desc.text->fontKey >= _fontCount) {
        return Err<void>("area " + std::to_string(handle.id) + " references font key " +
                         std::to_string(desc.text->fontKey) + " which is not registered");
    }

    InstancePlacement placement;
    placement.key.z = desc.z;
    placement.key.layer = desc.spriteKey ? _atlas->homeLayer(*desc.spriteKey) : 0;
    placement.instance = {};
    placement.instance.xMin = desc.xMin;
    placement.instance.yMin = desc.yMin;
    placement.instance.xMax = desc.xMax;
    placement.instance.yMax = desc.yMax;
    placement.instance.spriteIndex = desc.spriteKey.value_or(NO_SPRITE);
    placement.instance.areaId = handle.id;
    return _sync->update(handle, placement);
}

Result<void> CompositorCoreImpl::rebuildText(std::vector<TextArea> areas) {
    if (!_text) {
        for (const auto& area : areas) {
            if (area.desc->enabled && area.desc->text) {
                return Err<void>("area " + std::to_string(area.handle.id) +
                                 " carries text but no font is registered");
            }
        }
        return Ok();
    }
    return _text->rebuild(std::move(areas));
}

Result<uint32_t> CompositorCoreImpl::addSprite(SpriteFrames frames) {
    auto changeRes = _atlas->addSprite(std::move(frames));
    if (!changeRes) return Err<uint32_t>("CompositorCore: addSprite", changeRes);
    const AtlasChange& change = *changeRes;

    if (auto res = _atlasTexture->refresh(*_atlas, change); !res) {
        return Err<uint32_t>("CompositorCore: atlas upload after addSprite", res);
    }
    while (_sync->layerCount() < _atlas->layerCount()) {
        _sync->addLayer();
    }
    if (change.textureResized) {
        auto usage = _allocator->usage();
        yinfo("CompositorCore: atlas now {}x{}x{}, textures {:.2f} MB, buffers {:.2f} MB",
              _atlas->textureSize(), _atlas->textureSize(), _atlas->layerCount(),
              usage.textureBytes / (1024.0 * 1024.0), usage.bufferBytes / (1024.0 * 1024.0));
    }
    if (auto res = updateSpriteBindGroup(); !res) {
        return Err<uint32_t>("CompositorCore: bind group after addSprite", res);
    }
    return Ok(_atlas->spriteCount() - 1);
}

Result<void> CompositorCoreImpl::resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        ywarn("CompositorCore: ignoring resize to {}x{}", width, height);
        return Ok();
    }
    if (width == _width && height == _height) return Ok();

    if (auto res = _picker->resize(width, height); !res) {
        return Err<void>("CompositorCore: resize", res);
    }
    _width = width;
    _height = height;
    ydebug("CompositorCore: resized to {}x{}", width, height);
    return Ok();
}

//-----------------------------------------------------------------------------
// Recording
//-----------------------------------------------------------------------------

void CompositorCoreImpl::drawSprites(WGPURenderPassEncoder pass, ZLevel z,
                                     WGPURenderPipeline pipeline) {
    bool bound = false;
    for (uint32_t layer = 0; layer < _sync->layerCount(); ++layer) {
        const InstanceBuffer* buf = _sync->buffer(z, layer);
        if (!buf || buf->size() == 0 || !buf->buffer) continue;

        if (!bound) {
            wgpuRenderPassEncoderSetPipeline(pass, pipeline);
            wgpuRenderPassEncoderSetBindGroup(pass, 0, _spriteBindGroup, 0, nullptr);
            wgpuRenderPassEncoderSetVertexBuffer(pass, 0, _quadVertices, 0, WGPU_WHOLE_SIZE);
            wgpuRenderPassEncoderSetIndexBuffer(pass, _quadIndices, WGPUIndexFormat_Uint16,
                                                0, WGPU_WHOLE_SIZE);
            bound = true;
        }
        wgpuRenderPassEncoderSetVertexBuffer(pass, 1, buf->buffer, 0,
                                             uint64_t(buf->size()) * sizeof(AreaInstance));
        wgpuRenderPassEncoderDrawIndexed(pass, 6, buf->size(), 0, 0, 0);
    }
}

void CompositorCoreImpl::drawScene(WGPURenderPassEncoder pass, bool picking) {
    WGPURenderPipeline spritePipeline = picking ? _spritePickingPipeline : _spritePipeline;
    for (ZLevel z : ALL_Z_LEVELS) {
        drawSprites(pass, z, spritePipeline);
        if (_text) {
            if (picking) {
                _text->drawPicking(pass, z);
            } else {
                _text->draw(pass, z);
            }
        }
    }
}

Result<std::vector<WGPUCommandBuffer>> CompositorCoreImpl::record(WGPUTextureView target) {
    if (!target) return Err<std::vector<WGPUCommandBuffer>>("CompositorCore: null render target");

    writeUniforms();
    if (auto res = updateSpriteBindGroup(); !res) {
        return Err<std::vector<WGPUCommandBuffer>>("CompositorCore: record", res);
    }

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = YCOMP_WGPU_STR("ycomp-frame");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_gpu.device, &encoderDesc);
    if (!encoder) {
        return Err<std::vector<WGPUCommandBuffer>>("CompositorCore: failed to create command encoder");
    }

    // Visible pass
    {
        WGPURenderPassColorAttachment colorAttachment = {};
        colorAttachment.view = target;
        colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
        colorAttachment.loadOp = _clearColor ? WGPULoadOp_Clear : WGPULoadOp_Load;
        colorAttachment.storeOp = WGPUStoreOp_Store;
        if (_clearColor) colorAttachment.clearValue = *_clearColor;

        WGPURenderPassDescriptor passDesc = {};
        passDesc.label = YCOMP_WGPU_STR("ycomp-visible-pass");
        passDesc.colorAttachmentCount = 1;
        passDesc.colorAttachments = &colorAttachment;

        WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
        drawScene(pass, false);
        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);
    }

    // Id pass: same geometry, area handles into the R32Uint target, 0 = nothing
    {
        WGPURenderPassColorAttachment colorAttachment = {};
        colorAttachment.view = _picker->targetView();
        colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
        colorAttachment.loadOp = WGPULoadOp_Clear;
        colorAttachment.storeOp = WGPUStoreOp_Store;
        colorAttachment.clearValue = gpu::transparentBlack();

        WGPURenderPassDescriptor passDesc = {};
        passDesc.label = YCOMP_WGPU_STR("ycomp-picking-pass");
        passDesc.colorAttachmentCount = 1;
        passDesc.colorAttachments = &colorAttachment;

        WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
        drawScene(pass, true);
        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);
    }

    _picker->recordReadback(encoder);

    WGPUCommandBufferDescriptor cmdDesc = {};
    cmdDesc.label = YCOMP_WGPU_STR("ycomp-frame-commands");
    WGPUCommandBuffer cmd = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuCommandEncoderRelease(encoder);
    if (!cmd) {
        return Err<std::vector<WGPUCommandBuffer>>("CompositorCore: failed to finish command buffer");
    }
    return Ok(std::vector<WGPUCommandBuffer>{cmd});
}

//-----------------------------------------------------------------------------
// Debug
//-----------------------------------------------------------------------------

Result<void> CompositorCoreImpl::dumpAtlasesSvg(const std::string& directory) const {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return Err<void>("Failed to create dump directory " + directory + ": " + ec.message());
    }

    auto writeFile = [](const std::filesystem::path& path, const std::string& svg) -> Result<void> {
        std::ofstream out(path);
        if (!out.is_open()) {
            return Err<void>("Failed to open " + path.string() + " for writing");
        }
        out << svg;
        if (!out) return Err<void>("Failed to write " + path.string());
        return Ok();
    };

    const std::filesystem::path dir(directory);
    for (uint32_t i = 0; i < _atlas->layerCount(); ++i) {
        auto path = dir / ("ycomp_atlas_" + std::to_string(i) + ".svg");
        if (auto res = writeFile(path, _atlas->dumpSvg(i)); !res) return res;
    }
    if (_text) {
        const auto& glyphs = _text->atlas();
        for (uint32_t i = 0; i < glyphs.layerCount(); ++i) {
            auto path = dir / ("ycomp_glyph_atlas_" + std::to_string(i) + ".svg");
            if (auto res = writeFile(path, glyphs.dumpSvg(i)); !res) return res;
        }
    }
    yinfo("CompositorCore: dumped {} sprite layer(s) to {}", _atlas->layerCount(), directory);
    return Ok();
}

//=============================================================================
// Factory
//=============================================================================

Result<CompositorCore::Ptr> CompositorCore::create(const GPUContext& gpu,
                                                   uint32_t width, uint32_t height,
                                                   CompositorSettings settings,
                                                   std::vector<SpriteFrames> sprites,
                                                   std::vector<font::RasterFont::Ptr> fonts) noexcept {
    auto impl = std::make_shared<CompositorCoreImpl>(gpu, width, height, std::move(settings));
    if (auto res = impl->init(std::move(sprites), std::move(fonts)); !res) {
        return Err<Ptr>("Failed to init CompositorCore", res);
    }
    return Ok(std::move(impl));
}

} // namespace ycomp
