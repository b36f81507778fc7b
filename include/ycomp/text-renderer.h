#pragma once

#include <ycomp/font/raster-font.h>
#include <ycomp/glyph-atlas.h>
#include <ycomp/gpu-allocator.h>
#include <ycomp/gpu-context.h>
#include <ycomp/instance-buffer.h>
#include <ycomp/result.hpp>
#include <ycomp/types.h>
#include <webgpu/webgpu.h>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace ycomp {

struct TextArea {
    UiAreaHandle handle;
    const AreaDesc* desc;
};

// CPU half of text rendering: layout plus glyph lookup into per-z instances.
class TextBatcher {
public:
    TextBatcher(GlyphAtlas::Config atlasConfig, std::vector<font::RasterFont::Ptr> fonts);

    // Relays out every given area from scratch. Areas that are disabled or
    // carry no text are skipped.
    Result<void> rebuild(std::vector<TextArea> areas);

    const std::vector<GlyphInstance>& instances(ZLevel z) const { return _instances[zIndex(z)]; }
    GlyphAtlas& atlas() { return _atlas; }
    const GlyphAtlas& atlas() const { return _atlas; }
    uint32_t fontCount() const { return static_cast<uint32_t>(_fonts.size()); }

private:
    GlyphAtlas _atlas;
    std::vector<font::RasterFont::Ptr> _fonts;
    std::array<std::vector<GlyphInstance>, Z_LEVEL_COUNT> _instances;
};

// Shared GPU objects the text pipelines bind
struct TextRendererResources {
    WGPUBuffer frameUniforms = nullptr;
    uint64_t frameUniformsSize = 0;
    WGPUBuffer quadVertices = nullptr;
    WGPUBuffer quadIndices = nullptr;
    std::string shaderDir;
};

/**
 * TextRenderer owns the glyph texture array, the per-z glyph instance
 * buffers and the text render/picking pipelines. Buffers are rewritten in
 * full on every rebuild.
 */
class TextRenderer {
public:
    using Ptr = std::shared_ptr<TextRenderer>;

    static Result<Ptr> create(const GPUContext& gpu,
                              GpuAllocator::Ptr allocator,
                              InstanceBufferBackend::Ptr backend,
                              TextRendererResources resources,
                              GlyphAtlas::Config atlasConfig,
                              std::vector<font::RasterFont::Ptr> fonts) noexcept;

    virtual ~TextRenderer() = default;

    virtual Result<void> rebuild(std::vector<TextArea> areas) = 0;

    virtual void draw(WGPURenderPassEncoder pass, ZLevel z) = 0;
    virtual void drawPicking(WGPURenderPassEncoder pass, ZLevel z) = 0;

    virtual const GlyphAtlas& atlas() const = 0;

protected:
    TextRenderer() = default;
};

} // namespace ycomp
