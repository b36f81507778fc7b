#pragma once

#include <ycomp/gpu-context.h>
#include <ycomp/result.hpp>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct GLFWwindow;

namespace ycomp::demo {

// GLFW window plus the WebGPU device and surface the compositor renders into.
// The compositor itself only ever sees gpuContext() and the per-frame view.
class DemoWindow {
public:
    using Ptr = std::unique_ptr<DemoWindow>;

    static Result<Ptr> create(const std::string& title, uint32_t width, uint32_t height) noexcept;

    ~DemoWindow();

    DemoWindow(const DemoWindow&) = delete;
    DemoWindow& operator=(const DemoWindow&) = delete;

    GLFWwindow* window() const { return _window; }
    const GPUContext& gpuContext() const { return _gpu; }
    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    void resize(uint32_t width, uint32_t height) noexcept;

    // Acquires the surface texture for this frame
    Result<WGPUTextureView> beginFrame() noexcept;
    void submit(const std::vector<WGPUCommandBuffer>& commands) noexcept;
    void present() noexcept;

private:
    DemoWindow(uint32_t width, uint32_t height) : _width(width), _height(height) {}

    Result<void> init(const std::string& title) noexcept;
    Result<void> initWebGPU() noexcept;
    void configureSurface() noexcept;

    GLFWwindow* _window = nullptr;
    uint32_t _width;
    uint32_t _height;

    WGPUInstance _instance = nullptr;
    WGPUSurface _surface = nullptr;
    WGPUAdapter _adapter = nullptr;
    WGPUDevice _device = nullptr;
    WGPUQueue _queue = nullptr;
    WGPUTextureFormat _surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    GPUContext _gpu;

    WGPUTexture _currentTexture = nullptr;
    WGPUTextureView _currentView = nullptr;
};

} // namespace ycomp::demo
