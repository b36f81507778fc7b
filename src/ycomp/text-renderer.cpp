#include <ycomp/text-renderer.h>
#include <ycomp/text-layout.h>
#include <ycomp/wgpu-compat.h>
#include "gpu-util.h"
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cstddef>

namespace ycomp {

//=============================================================================
// TextBatcher
//=============================================================================

TextBatcher::TextBatcher(GlyphAtlas::Config atlasConfig, std::vector<font::RasterFont::Ptr> fonts)
    : _atlas(atlasConfig), _fonts(std::move(fonts)) {}

Result<void> TextBatcher::rebuild(std::vector<TextArea> areas) {
    for (auto& list : _instances) list.clear();

    // Handle order keeps the instance streams stable between rebuilds
    std::sort(areas.begin(), areas.end(),
              [](const TextArea& a, const TextArea& b) { return a.handle < b.handle; });

    const float layerSize = static_cast<float>(_atlas.layerSize());

    for (const auto& area : areas) {
        const AreaDesc& desc = *area.desc;
        if (!desc.enabled || !desc.text) continue;

        const TextDesc& text = *desc.text;
        if (text.fontKey >= _fonts.size()) {
            return Err<void>("Text of area " + std::to_string(area.handle.id) +
                             " references unregistered font index " +
                             std::to_string(text.fontKey));
        }
        auto& font = *_fonts[text.fontKey];

        TextBox box{desc.xMin, desc.yMin, desc.xMax, desc.yMax};
        auto& out = _instances[zIndex(desc.z)];

        for (const auto& pg : TextLayout::layout(font, text.text, text.size, box)) {
            GlyphKey key{text.fontKey, text.size, pg.codepoint};
            auto entryRes = _atlas.get(key, font);
            if (!entryRes) {
                return Err<void>("Failed to place glyph for area " + std::to_string(area.handle.id),
                                 entryRes);
            }
            const GlyphEntry& entry = **entryRes;
            if (!entry.visible) continue;

            GlyphInstance gi = {};
            gi.x0 = pg.x + static_cast<float>(entry.bearingX);
            gi.y0 = pg.baseline - static_cast<float>(entry.bearingY);
            gi.x1 = gi.x0 + static_cast<float>(entry.rect.width);
            gi.y1 = gi.y0 + static_cast<float>(entry.rect.height);
            gi.u0 = static_cast<float>(entry.rect.x) / layerSize;
            gi.v0 = static_cast<float>(entry.rect.y) / layerSize;
            gi.u1 = static_cast<float>(entry.rect.x + entry.rect.width) / layerSize;
            gi.v1 = static_cast<float>(entry.rect.y + entry.rect.height) / layerSize;
            gi.layer = entry.layer;
            gi.areaId = area.handle.id;
            out.push_back(gi);
        }
    }
    return Ok();
}

//=============================================================================
// TextRendererImpl
//=============================================================================

namespace {

struct GlyphStream {
    WGPUBuffer buffer = nullptr;
    uint32_t capacity = 0;
    uint32_t count = 0;
};

} // namespace

class TextRendererImpl : public TextRenderer {
public:
    TextRendererImpl(const GPUContext& gpu, GpuAllocator::Ptr allocator,
                     InstanceBufferBackend::Ptr backend, TextRendererResources resources,
                     GlyphAtlas::Config atlasConfig, std::vector<font::RasterFont::Ptr> fonts)
        : _gpu(gpu)
        , _allocator(std::move(allocator))
        , _backend(std::move(backend))
        , _resources(std::move(resources))
        , _batcher(atlasConfig, std::move(fonts)) {}

    ~TextRendererImpl() override;

    Result<void> init() noexcept;

    Result<void> rebuild(std::vector<TextArea> areas) override;

    void draw(WGPURenderPassEncoder pass, ZLevel z) override {
        drawWith(pass, z, _renderPipeline);
    }
    void drawPicking(WGPURenderPassEncoder pass, ZLevel z) override {
        drawWith(pass, z, _pickingPipeline);
    }

    const GlyphAtlas& atlas() const override { return _batcher.atlas(); }

private:
    Result<void> createTexture();
    Result<void> createPipelines();
    void uploadGlyphs();
    Result<void> writeStream(ZLevel z);
    void drawWith(WGPURenderPassEncoder pass, ZLevel z, WGPURenderPipeline pipeline);

    GPUContext _gpu;
    GpuAllocator::Ptr _allocator;
    InstanceBufferBackend::Ptr _backend;
    TextRendererResources _resources;
    TextBatcher _batcher;

    WGPUTexture _texture = nullptr;
    WGPUTextureView _textureView = nullptr;
    WGPUSampler _sampler = nullptr;
    WGPUBindGroupLayout _bindGroupLayout = nullptr;
    WGPUPipelineLayout _pipelineLayout = nullptr;
    WGPUBindGroup _bindGroup = nullptr;
    WGPURenderPipeline _renderPipeline = nullptr;
    WGPURenderPipeline _pickingPipeline = nullptr;

    std::array<GlyphStream, Z_LEVEL_COUNT> _streams;
};

TextRendererImpl::~TextRendererImpl() {
    for (auto& stream : _streams) {
        if (stream.buffer) _backend->releaseBuffer(stream.buffer);
    }
    if (_bindGroup) wgpuBindGroupRelease(_bindGroup);
    if (_renderPipeline) wgpuRenderPipelineRelease(_renderPipeline);
    if (_pickingPipeline) wgpuRenderPipelineRelease(_pickingPipeline);
    if (_pipelineLayout) wgpuPipelineLayoutRelease(_pipelineLayout);
    if (_bindGroupLayout) wgpuBindGroupLayoutRelease(_bindGroupLayout);
    if (_sampler) wgpuSamplerRelease(_sampler);
    if (_textureView) wgpuTextureViewRelease(_textureView);
    if (_texture) _allocator->releaseTexture(_texture);
}

Result<void> TextRendererImpl::init() noexcept {
    if (!_gpu.device || !_gpu.queue)
        return Err<void>("TextRenderer: GPUContext not initialized");

    if (auto res = createTexture(); !res) return res;
    if (auto res = createPipelines(); !res) return res;

    WGPUBindGroupEntry bgEntries[3] = {};
    bgEntries[0].binding = 0;
    bgEntries[0].buffer = _resources.frameUniforms;
    bgEntries[0].size = _resources.frameUniformsSize;
    bgEntries[1].binding = 1;
    bgEntries[1].textureView = _textureView;
    bgEntries[2].binding = 2;
    bgEntries[2].sampler = _sampler;

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.label = YCOMP_WGPU_STR("ycomp-text-bind-group");
    bgDesc.layout = _bindGroupLayout;
    bgDesc.entryCount = 3;
    bgDesc.entries = bgEntries;
    _bindGroup = wgpuDeviceCreateBindGroup(_gpu.device, &bgDesc);
    if (!_bindGroup) return Err<void>("TextRenderer: failed to create bind group");

    yinfo("TextRenderer: glyph atlas {} layers of {}x{}",
          _batcher.atlas().layerCount(), _batcher.atlas().layerSize(),
          _batcher.atlas().layerSize());
    return Ok();
}

Result<void> TextRendererImpl::createTexture() {
    const auto& atlas = _batcher.atlas();

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = YCOMP_WGPU_STR("ycomp-glyph-atlas");
    texDesc.size = {atlas.layerSize(), atlas.layerSize(), atlas.layerCount()};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_R8Unorm;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
    _texture = _allocator->createTexture(texDesc);
    if (!_texture) return Err<void>("TextRenderer: failed to create glyph texture");

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = WGPUTextureFormat_R8Unorm;
    viewDesc.dimension = WGPUTextureViewDimension_2DArray;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = atlas.layerCount();
    viewDesc.aspect = WGPUTextureAspect_All;
    _textureView = wgpuTextureCreateView(_texture, &viewDesc);
    if (!_textureView) return Err<void>("TextRenderer: failed to create glyph texture view");

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Linear;
    samplerDesc.minFilter = WGPUFilterMode_Linear;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 1.0f;
    samplerDesc.maxAnisotropy = 1;
    _sampler = wgpuDeviceCreateSampler(_gpu.device, &samplerDesc);
    if (!_sampler) return Err<void>("TextRenderer: failed to create sampler");
    return Ok();
}

Result<void> TextRendererImpl::createPipelines() {
    WGPUDevice device = _gpu.device;

    // @binding(0): frame uniforms
    WGPUBindGroupLayoutEntry entries[3] = {};
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    entries[0].buffer.type = WGPUBufferBindingType_Uniform;
    entries[0].buffer.minBindingSize = _resources.frameUniformsSize;

    // @binding(1): glyph coverage array
    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Fragment;
    entries[1].texture.sampleType = WGPUTextureSampleType_Float;
    entries[1].texture.viewDimension = WGPUTextureViewDimension_2DArray;

    // @binding(2): glyph sampler
    entries[2].binding = 2;
    entries[2].visibility = WGPUShaderStage_Fragment;
    entries[2].sampler.type = WGPUSamplerBindingType_Filtering;

    WGPUBindGroupLayoutDescriptor bglDesc = {};
    bglDesc.label = YCOMP_WGPU_STR("ycomp-text-bind-group-layout");
    bglDesc.entryCount = 3;
    bglDesc.entries = entries;
    _bindGroupLayout = wgpuDeviceCreateBindGroupLayout(device, &bglDesc);
    if (!_bindGroupLayout) return Err<void>("TextRenderer: failed to create bind group layout");

    WGPUPipelineLayoutDescriptor plDesc = {};
    plDesc.label = YCOMP_WGPU_STR("ycomp-text-pipeline-layout");
    plDesc.bindGroupLayoutCount = 1;
    plDesc.bindGroupLayouts = &_bindGroupLayout;
    _pipelineLayout = wgpuDeviceCreatePipelineLayout(device, &plDesc);
    if (!_pipelineLayout) return Err<void>("TextRenderer: failed to create pipeline layout");

    WGPUVertexAttribute glyphAttrs[4] = {};
    glyphAttrs[0].format = WGPUVertexFormat_Float32x4;
    glyphAttrs[0].offset = offsetof(GlyphInstance, x0);
    glyphAttrs[0].shaderLocation = 1;
    glyphAttrs[1].format = WGPUVertexFormat_Float32x4;
    glyphAttrs[1].offset = offsetof(GlyphInstance, u0);
    glyphAttrs[1].shaderLocation = 2;
    glyphAttrs[2].format = WGPUVertexFormat_Uint32;
    glyphAttrs[2].offset = offsetof(GlyphInstance, layer);
    glyphAttrs[2].shaderLocation = 3;
    glyphAttrs[3].format = WGPUVertexFormat_Uint32;
    glyphAttrs[3].offset = offsetof(GlyphInstance, areaId);
    glyphAttrs[3].shaderLocation = 4;

    struct Variant {
        const char* label;
        const char* file;
        WGPUTextureFormat format;
        bool blend;
        WGPURenderPipeline* out;
    };
    const Variant variants[2] = {
        {"ycomp-text", "text_render.wgsl", _gpu.surfaceFormat, true, &_renderPipeline},
        {"ycomp-text-picking", "cursor_picking_text.wgsl", WGPUTextureFormat_R32Uint, false,
         &_pickingPipeline},
    };

    for (const auto& v : variants) {
        auto sourceRes = gpu::loadShaderSource(_resources.shaderDir, v.file);
        if (!sourceRes) return Err<void>("TextRenderer: missing shader", sourceRes);

        auto moduleRes = gpu::createShaderModule(device, v.label, *sourceRes);
        if (!moduleRes) return Err<void>("TextRenderer: shader module failed", moduleRes);
        WGPUShaderModule module = *moduleRes;

        gpu::QuadPipelineDesc desc;
        desc.label = v.label;
        desc.module = module;
        desc.layout = _pipelineLayout;
        desc.instanceAttributes = glyphAttrs;
        desc.instanceAttributeCount = 4;
        desc.instanceStride = sizeof(GlyphInstance);
        desc.targetFormat = v.format;
        desc.alphaBlend = v.blend;
        auto pipelineRes = gpu::createQuadPipeline(device, desc);
        wgpuShaderModuleRelease(module);
        if (!pipelineRes) return Err<void>("TextRenderer: pipeline failed", pipelineRes);
        *v.out = *pipelineRes;
    }
    return Ok();
}

Result<void> TextRendererImpl::rebuild(std::vector<TextArea> areas) {
    if (auto res = _batcher.rebuild(std::move(areas)); !res) return res;

    uploadGlyphs();
    for (ZLevel z : ALL_Z_LEVELS) {
        if (auto res = writeStream(z); !res) return res;
    }
    return Ok();
}

void TextRendererImpl::uploadGlyphs() {
    auto uploads = _batcher.atlas().takeUploads();
    for (const auto& up : uploads) {
        WGPUTexelCopyTextureInfo dst = {};
        dst.texture = _texture;
        dst.mipLevel = 0;
        dst.origin = {up.rect.x, up.rect.y, up.layer};
        dst.aspect = WGPUTextureAspect_All;

        WGPUTexelCopyBufferLayout layout = {};
        layout.offset = 0;
        layout.bytesPerRow = up.rect.width;
        layout.rowsPerImage = up.rect.height;

        WGPUExtent3D extent = {up.rect.width, up.rect.height, 1};
        wgpuQueueWriteTexture(_gpu.queue, &dst, up.coverage.data(), up.coverage.size(),
                              &layout, &extent);
    }
    if (!uploads.empty()) ydebug("TextRenderer: uploaded {} glyphs", uploads.size());
}

Result<void> TextRendererImpl::writeStream(ZLevel z) {
    const auto& instances = _batcher.instances(z);
    GlyphStream& stream = _streams[zIndex(z)];
    const uint32_t needed = static_cast<uint32_t>(instances.size());

    if (needed > stream.capacity) {
        uint32_t newCapacity = std::max<uint32_t>(stream.capacity, 64);
        while (newCapacity < needed) newCapacity *= 2;

        std::string label = std::string("ycomp-text-instances-") + zLevelName(z);
        auto bufRes = _backend->createBuffer(label, uint64_t(newCapacity) * sizeof(GlyphInstance));
        if (!bufRes) return Err<void>("TextRenderer: failed to grow " + label, bufRes);
        if (stream.buffer) _backend->releaseBuffer(stream.buffer);
        stream.buffer = *bufRes;
        stream.capacity = newCapacity;
        ydebug("TextRenderer: {} grown to {} glyphs", label, newCapacity);
    }

    if (needed > 0) {
        _backend->writeBuffer(stream.buffer, 0, instances.data(),
                              uint64_t(needed) * sizeof(GlyphInstance));
    }
    stream.count = needed;
    return Ok();
}

void TextRendererImpl::drawWith(WGPURenderPassEncoder pass, ZLevel z, WGPURenderPipeline pipeline) {
    const GlyphStream& stream = _streams[zIndex(z)];
    if (stream.count == 0 || !stream.buffer) return;

    wgpuRenderPassEncoderSetPipeline(pass, pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, _bindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 0, _resources.quadVertices, 0, WGPU_WHOLE_SIZE);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 1, stream.buffer, 0,
                                         uint64_t(stream.count) * sizeof(GlyphInstance));
    wgpuRenderPassEncoderSetIndexBuffer(pass, _resources.quadIndices, WGPUIndexFormat_Uint16,
                                        0, WGPU_WHOLE_SIZE);
    wgpuRenderPassEncoderDrawIndexed(pass, 6, stream.count, 0, 0, 0);
}

//=============================================================================
// Factory
//=============================================================================

Result<TextRenderer::Ptr> TextRenderer::create(const GPUContext& gpu,
                                               GpuAllocator::Ptr allocator,
                                               InstanceBufferBackend::Ptr backend,
                                               TextRendererResources resources,
                                               GlyphAtlas::Config atlasConfig,
                                               std::vector<font::RasterFont::Ptr> fonts) noexcept {
    if (!allocator || !backend) {
        return Err<Ptr>("TextRenderer: allocator and backend are required");
    }
    auto impl = std::make_shared<TextRendererImpl>(gpu, std::move(allocator), std::move(backend),
                                                   std::move(resources), atlasConfig,
                                                   std::move(fonts));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to init TextRenderer", res);
    }
    return Ok(std::move(impl));
}

} // namespace ycomp
