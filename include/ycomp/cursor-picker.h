#pragma once

#include <ycomp/gpu-allocator.h>
#include <ycomp/gpu-context.h>
#include <ycomp/result.hpp>
#include <ycomp/types.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ycomp {

//=============================================================================
// PickChannel - map callback (driver thread) to frame thread
//=============================================================================

class PickChannel {
public:
    // Never blocks beyond the queue lock
    void send(uint32_t id) {
        std::lock_guard<std::mutex> lock(_mutex);
        _queue.push_back(id);
    }

    // Empties the channel and returns the most recent id, if any arrived
    std::optional<uint32_t> drainLatest() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_queue.empty()) return std::nullopt;
        uint32_t latest = _queue.back();
        _queue.clear();
        return latest;
    }

private:
    std::mutex _mutex;
    std::deque<uint32_t> _queue;
};

//=============================================================================
// PointerState - latest position wins
//=============================================================================

class PointerState {
public:
    void set(float x, float y) {
        if (_hasPosition && x == _x && y == _y) return;
        _x = x;
        _y = y;
        _hasPosition = true;
        _changed = true;
    }

    // True once after every change
    bool takeChanged() {
        bool c = _changed;
        _changed = false;
        return c;
    }

    void markChanged() { _changed = _hasPosition; }

    bool hasPosition() const { return _hasPosition; }
    float x() const { return _x; }
    float y() const { return _y; }

private:
    float _x = 0.0f;
    float _y = 0.0f;
    bool _hasPosition = false;
    bool _changed = false;
};

// Texel under the pointer, clamped to the target
struct PickTexel {
    uint32_t x;
    uint32_t y;
};

PickTexel clampToTarget(float x, float y, uint32_t width, uint32_t height);

//=============================================================================
// CursorPicker
//=============================================================================

struct CursorPickerConfig {
    uint32_t width = 0;
    uint32_t height = 0;
    bool blockingPoll = true;
    std::string shaderDir;
};

/**
 * CursorPicker owns the R32Uint id target and the compute readback.
 *
 * Per frame: poll() at the start of render, the render passes draw into
 * targetView(), recordReadback() adds the compute and copy, and
 * requestReadback() maps the staging buffer after submission. The map
 * callback pushes the id through a PickChannel, so results arrive at least
 * one frame late.
 */
class CursorPicker {
public:
    using Ptr = std::shared_ptr<CursorPicker>;

    static Result<Ptr> create(const GPUContext& gpu, GpuAllocator::Ptr allocator,
                              CursorPickerConfig config) noexcept;

    virtual ~CursorPicker() = default;

    // Recreates the id target; zero sizes are rejected by the caller
    virtual Result<void> resize(uint32_t width, uint32_t height) = 0;

    virtual void setPointer(float x, float y) = 0;

    virtual WGPUTextureView targetView() const = 0;

    // Compute dispatch plus copy into the staging buffer. Skipped while the
    // previous map is still pending (non-blocking mode only).
    virtual void recordReadback(WGPUCommandEncoder encoder) = 0;

    // Maps the staging buffer if this frame recorded a readback
    virtual Result<void> requestReadback() = 0;

    // Waits for (or ticks towards) the previous map, drains the channel and
    // updates hovered()
    virtual void poll() = 0;

    virtual std::optional<UiAreaHandle> hovered() const = 0;

protected:
    CursorPicker() = default;
};

} // namespace ycomp
