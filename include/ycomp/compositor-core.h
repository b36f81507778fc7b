#pragma once

#include <ycomp/config.h>
#include <ycomp/font/raster-font.h>
#include <ycomp/gpu-context.h>
#include <ycomp/instance-buffer.h>
#include <ycomp/result.hpp>
#include <ycomp/sprite-atlas.h>
#include <ycomp/text-renderer.h>
#include <ycomp/types.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ycomp {

// Tunables read once at build time
struct CompositorSettings {
    SpriteAtlas::Config atlas;
    uint32_t initialInstanceCapacity = InstanceSynchronizer::DEFAULT_INITIAL_CAPACITY;
    uint64_t glyphTexelBudget = GlyphAtlasConfig{}.texelBudget;
    float alphaThreshold = 0.5f;
    bool blockingPoll = true;
    std::string shaderDir;

    // Reads every key of Config; atlas.max-size is clamped to the device limit.
    // A null config yields the defaults.
    static Result<CompositorSettings> fromConfig(const Config* config, const GPUContext& gpu);
};

/**
 * CompositorCore is the non-template GPU half of a compositor. It works on
 * dense keys (sprite index in registration order, font index) and type-erased
 * AreaDesc records; the templated Compositor maps host ids onto it.
 *
 * One frame:
 *   pollPicks() -> applyRemovals() -> syncArea() per dirty handle
 *   -> rebuildText() if anything changed -> record() -> host submits
 *   -> postRender()
 */
class CompositorCore {
public:
    using Ptr = std::shared_ptr<CompositorCore>;

    static Result<Ptr> create(const GPUContext& gpu,
                              uint32_t width, uint32_t height,
                              CompositorSettings settings,
                              std::vector<SpriteFrames> sprites,
                              std::vector<font::RasterFont::Ptr> fonts) noexcept;

    virtual ~CompositorCore() = default;

    // Frame protocol
    virtual void pollPicks() = 0;
    virtual Result<void> applyRemovals(const std::vector<UiAreaHandle>& handles) = 0;
    virtual Result<void> syncArea(UiAreaHandle handle, const AreaDesc& desc) = 0;
    virtual Result<void> rebuildText(std::vector<TextArea> areas) = 0;
    virtual bool hasText() const = 0;
    virtual Result<std::vector<WGPUCommandBuffer>> record(WGPUTextureView target) = 0;
    virtual Result<void> postRender() = 0;

    // Incremental sprite registration; returns the new sprite key
    virtual Result<uint32_t> addSprite(SpriteFrames frames) = 0;

    virtual Result<void> resize(uint32_t width, uint32_t height) = 0;
    virtual void setPointer(float x, float y) = 0;
    virtual std::optional<UiAreaHandle> hovered() const = 0;

    virtual void setAnimationFrame(uint32_t frame) = 0;
    virtual uint32_t animationFrame() const = 0;

    // nullopt keeps the target's previous contents
    virtual void setClearColor(std::optional<WGPUColor> color) = 0;

    virtual Result<void> dumpAtlasesSvg(const std::string& directory) const = 0;

    virtual const SpriteAtlas& spriteAtlas() const = 0;
    virtual const InstanceSynchronizer& instances() const = 0;
    virtual uint32_t fontCount() const = 0;

protected:
    CompositorCore() = default;
};

} // namespace ycomp
